//  object.hpp -- PDF object values
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
#ifndef outputs_pdf_object_hpp_
#define outputs_pdf_object_hpp_

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace scanflow {
namespace _out_ {
namespace _pdf_ {

//! Number of an indirect object, handed out by a writer
typedef std::size_t object_number;

class array;
class dictionary;

//! A direct PDF object, kept in the form it is written in [p 51]
/*! Arrays and dictionaries are assembled separately and turn into
 *  an object once complete.  References to indirect objects are
 *  objects too, see reference().
 */
class object
{
public:
  //! Creates the null object
  object ();

  explicit object (int i);
  explicit object (double d);

  object (const array& a);
  object (const dictionary& d);

  //! Creates a name object, \a s is given without the leading slash
  static object name (const std::string& s);

  //! Creates a string object holding \a octets as is
  static object literal (const std::string& octets);

  //! Creates a text string from UTF-8 encoded \a s [p 158]
  /*! ASCII text is written as is, anything else as UTF-16BE.
   */
  static object text (const std::string& s);

  static object boolean (bool b);

  //! Refers to indirect object \a n [p 64]
  static object reference (object_number n);

  const std::string& str () const;

private:
  std::string repr_;
};

std::ostream& operator<< (std::ostream& os, const object& o);

//! An ordered collection of objects [p 58]
class array
{
public:
  array& add (const object& o);

  std::size_t size () const;
  bool empty () const;

  std::string str () const;

private:
  std::vector< object > items_;
};

//! Key/value pairs, written in the order they were first set [p 59]
class dictionary
{
public:
  //! Sets \a key to \a value, replacing any earlier value
  dictionary& set (const std::string& key, const object& value);

  bool has (const std::string& key) const;

  std::size_t size () const;

  std::string str () const;

private:
  typedef std::pair< std::string, object > entry;

  std::vector< entry > entries_;
};

//! Converts UTF-8 encoded \a s to WinAnsi, replacing what won't fit
/*! Characters outside Latin-1 become a question mark.
 */
std::string to_win_ansi (const std::string& s);

}       // namespace _pdf_
}       // namespace _out_
}       // namespace scanflow

#endif  /* outputs_pdf_object_hpp_ */
