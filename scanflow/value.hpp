//  value.hpp -- generic device property values
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

#ifndef scanflow_value_hpp_
#define scanflow_value_hpp_

#include <iosfwd>
#include <string>
#include <typeinfo>

#include <boost/operators.hpp>
#include <boost/variant.hpp>

#include "memory.hpp"

namespace scanflow {

//! Generic device property values
/*! Hardware layers report property values as integers (resolutions,
 *  bit masks, offsets) or as strings (names, identifiers).  A %value
 *  holds either of these or nothing at all.
 *
 *  Conversion to a bounded type that the %value does not hold throws
 *  \c boost::bad_get.
 */
class value
  : private boost::equality_comparable< value >
{
public:
  typedef shared_ptr< value > ptr;
  typedef int integer;

  //! Support for undefined values
  class none
    : private boost::equality_comparable< none >
  {
  public:
    bool operator== (const none&) const;
  };

  //! Creates an undefined value
  value ();

  value (const integer& i);
  value (const std::string& s);
  value (const char *str);

  operator integer () const;
  operator std::string () const;

  bool is_integer () const;
  bool is_string () const;
  bool is_none () const;

  bool operator== (const value& val) const;
  const std::type_info& type () const;

  friend
  std::ostream& operator<< (std::ostream& os, const value& val);

private:
  typedef boost::variant< none, integer, std::string > impl_type;

  impl_type value_;
};

std::ostream& operator<< (std::ostream& os, const value::none&);

}       // namespace scanflow

#endif  /* scanflow_value_hpp_ */
