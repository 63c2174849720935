//  png.hpp -- compress page images with libpng
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
#ifndef outputs_png_hpp_
#define outputs_png_hpp_

#include <scanflow/services.hpp>

#include <string>

namespace scanflow {
namespace _out_ {

//! Writes every page to a PNG image of its own
/*! Bi-level pages stay one bit per pixel.  The resolution a page was
 *  scanned at is recorded as its physical pixel size.
 */
class png_exporter
  : public exporter
{
public:
  std::string extension () const;
  bool multi_page () const;

  std::vector< octets > encode (const document& doc);

  //! Compresses a single PNM \a image scanned at \a resolution dpi
  octets compress (const octets& image, int resolution = 0);
};

}       // namespace _out_
}       // namespace scanflow

#endif  /* outputs_png_hpp_ */
