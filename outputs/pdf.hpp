//  pdf.hpp -- put a document's pages in a PDF file
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
#ifndef outputs_pdf_hpp_
#define outputs_pdf_hpp_

#include <scanflow/services.hpp>

#include <string>

#include "jpeg.hpp"

namespace scanflow {
namespace _out_ {

//! Writes all pages of a document to a single PDF file
/*! Each image gets a page of its own, sized to the image at the
 *  resolution it was scanned at.  Color and grayscale images are
 *  embedded as JPEG, bi-level ones as is.  Pages with recognized
 *  text get an invisible text layer on top of the image so that
 *  viewers can search and select it.  The document name becomes
 *  the PDF title.
 */
class pdf_exporter
  : public exporter
{
public:
  explicit pdf_exporter (int quality = jpeg_exporter::default_quality);

  std::string extension () const;
  bool multi_page () const;

  std::vector< octets > encode (const document& doc);

  //! Point size used for text without word positions
  static const int text_size = 10;

private:
  jpeg_exporter jpeg_;
};

}       // namespace _out_
}       // namespace scanflow

#endif  /* outputs_pdf_hpp_ */
