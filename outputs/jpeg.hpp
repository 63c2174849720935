//  jpeg.hpp -- JPEG export, one file per page
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

#ifndef outputs_jpeg_hpp_
#define outputs_jpeg_hpp_

#include <scanflow/services.hpp>

#include <cstddef>
#include <cstdio>

#include <jpeglib.h>

namespace scanflow {
namespace _out_ {

//! Compresses page images with the JPEG library
/*! Bi-level images are expanded to grayscale as JPEG has no notion
 *  of a one bit per pixel image.
 */
class jpeg_exporter
  : public exporter
{
public:
  explicit jpeg_exporter (int quality = default_quality);

  std::string extension () const;
  bool multi_page () const;

  std::vector< octets > encode (const document& doc);

  //! Compresses a single PNM \a image scanned at \a resolution dpi
  /*! The resolution ends up in the JFIF header.  A non-positive
   *  value leaves the density unspecified.
   */
  octets compress (const octets& image, int resolution = 0);

  static const int default_quality = 75;

private:
  int quality_;
};

}       // namespace _out_
}       // namespace scanflow

#endif  /* outputs_jpeg_hpp_ */
