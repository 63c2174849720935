//  writer.hpp -- assemble PDF files in memory
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
#ifndef outputs_pdf_writer_hpp_
#define outputs_pdf_writer_hpp_

#include <map>
#include <string>

#include <scanflow/octet.hpp>

#include "object.hpp"

namespace scanflow {
namespace _out_ {
namespace _pdf_ {

//! Lays out the basic file structure of a PDF file [p 90]
/*! Object numbers are handed out by allocate() so that objects can
 *  refer to each other before they are written.  Every allocated
 *  number has to be written before the trailer() finishes the file.
 *  Objects end up in the file in the order they are written.
 */
class writer
{
public:
  writer ();

  object_number allocate ();

  //! Starts the file with the header [p 92]
  /*! \throws std::logic_error if anything was written already
   */
  void header ();

  //! Writes \a obj as indirect object \a n [p 63]
  /*! \throws std::logic_error if \a n was not allocated or written
   *          before
   */
  void write (object_number n, const object& obj);

  //! Writes a stream object [p 60]
  /*! The \c Length entry of \a dict is taken care of.
   */
  void write (object_number n, dictionary dict, const octets& data);
  void write (object_number n, dictionary dict, const std::string& data);

  //! Finishes the file with the cross-reference table and trailer
  /*! The \c Size entry of \a dict is taken care of.
   *  \throws std::logic_error when allocated objects were not written
   */
  void trailer (dictionary dict);

  const octets& data () const;

private:
  void begin (object_number n);
  void append (const std::string& s);

  octets data_;
  object_number next_;
  std::map< object_number, std::size_t > xref_;
};

}       // namespace _pdf_
}       // namespace _out_
}       // namespace scanflow

#endif  /* outputs_pdf_writer_hpp_ */
