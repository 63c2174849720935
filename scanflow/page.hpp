//  page.hpp -- captured pages
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

#ifndef scanflow_page_hpp_
#define scanflow_page_hpp_

#include <string>

#include <boost/date_time/posix_time/ptime.hpp>
#include <boost/optional.hpp>
#include <boost/uuid/uuid.hpp>

#include "octet.hpp"
#include "recognition.hpp"

namespace scanflow {

//! A single captured image and everything learned about it since
/*! Pages start out with the encoded image as transferred from the
 *  device.  Post-processing may replace the image, add a thumbnail,
 *  set crop bounds or attach recognized text.  A page's number is
 *  its 1-based position in the document holding it.
 */
class page
{
public:
  typedef boost::uuids::uuid id_type;

  //! Creates a page for \a image, captured at \a resolution
  /*! Pixel dimensions are taken from the image header if it has one
   *  that is understood.  Otherwise they are zero.
   */
  page (const octets& image, int resolution);

  const id_type& id () const;
  const boost::posix_time::ptime& scanned_at () const;

  const octets& image () const;
  //! Replaces the image, e.g. with an enhanced version
  void image (const octets& image);

  const boost::optional< octets >& thumbnail () const;
  void thumbnail (const octets& image);

  int number () const;
  void number (int n);

  int width () const;
  int height () const;
  int resolution () const;

  //! Returns the clockwise rotation, one of 0, 90, 180 or 270
  int rotation () const;
  //! Adds \a degrees of clockwise rotation
  /*! Negative values rotate counter-clockwise.
   *  \throws std::invalid_argument unless a multiple of 90
   */
  void rotate (int degrees);

  const boost::optional< rectangle >& crop () const;
  void crop (const rectangle& bounds);
  void reset_crop ();

  bool enhanced () const;
  void enhanced (bool flag);

  const boost::optional< std::string >& text () const;
  const boost::optional< recognition >& recognized () const;
  //! Attaches a recognition result, setting text() along the way
  void recognized (const recognition& result);

private:
  id_type                  id_;
  boost::posix_time::ptime scanned_at_;

  octets                   image_;
  boost::optional< octets > thumbnail_;

  int number_;
  int width_;
  int height_;
  int resolution_;
  int rotation_;

  boost::optional< rectangle > crop_;
  bool enhanced_;

  boost::optional< std::string > text_;
  boost::optional< recognition > recognized_;
};

std::string to_string (const page::id_type& id);

}       // namespace scanflow

#endif  /* scanflow_page_hpp_ */
