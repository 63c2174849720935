//  media.hpp -- dimensions of some well-known media
//  Copyright (C) 2026  SEIKO EPSON CORPORATION
//
//  License: GPL-3.0+
//  Author : EPSON AVASYS CORPORATION
//
//  This file is part of the 'scanflow' package.
//  This package is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License or, at
//  your option, any later version.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//  You ought to have received a copy of the GNU General Public License
//  along with this package.  If not, see <http://www.gnu.org/licenses/>.

#ifndef scanflow_media_hpp_
#define scanflow_media_hpp_

#include <boost/optional.hpp>

#include "settings.hpp"

namespace scanflow {

//! Properties of some well-known media
/*! Dimensions are in inches.  Scan area extents in pixels follow by
 *  multiplying with the resolution.
 */
class media
{
public:
  media (double width, double height);

  double width () const;
  double height () const;

  //! Pixel count across at \a dpi, truncated towards zero
  int width (int dpi) const;
  //! Pixel count down at \a dpi, truncated towards zero
  int height (int dpi) const;

  //! Finds the fixed dimensions for \a p
  /*! Returns nothing for paper_size::custom, which does not imply any
   *  particular extent.
   */
  static boost::optional< media > lookup (paper_size p);

private:
  double width_;
  double height_;
};

}       // namespace scanflow

#endif  /* scanflow_media_hpp_ */
