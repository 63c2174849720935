//  pnm.hpp -- portable anymap raster headers
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

#ifndef scanflow_pnm_hpp_
#define scanflow_pnm_hpp_

#include <cstddef>

#include <boost/optional.hpp>

#include "octet.hpp"

namespace scanflow {

//! Binary PBM, PGM and PPM images
/*! Drivers transfer images in this format.  It is lossless, trivial
 *  to produce and all image geometry is in a short text header.
 */
namespace pnm {

struct info
{
  int width;
  int height;
  int components;               //!< 1 for PBM and PGM, 3 for PPM
  int depth;                    //!< bits per component, 1 or 8
  std::size_t offset;           //!< octets up to the first pixel

  std::size_t octets_per_line () const;
  std::size_t octets_per_image () const;
};

//! Reads the header of a binary P4, P5 or P6 image
/*! Returns nothing when \a data does not start with such a header or
 *  holds fewer pixel octets than the header announces.
 */
boost::optional< info > parse (const octets& data);

//! Creates a binary image from raw pixel data
/*! \throws std::logic_error for unsupported \a components and \a depth
 *          combinations or when \a pixels has the wrong size
 */
octets encode (int width, int height, int components, int depth,
               const octets& pixels);

}       // namespace pnm
}       // namespace scanflow

#endif  /* scanflow_pnm_hpp_ */
