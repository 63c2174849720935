//  object.cpp -- PDF object values
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include "object.hpp"

#include <scanflow/format.hpp>

#include <cmath>
#include <limits>

namespace scanflow {
namespace _out_ {
namespace _pdf_ {

namespace {

typedef unsigned long code_point;

const code_point replacement = 0xfffd;

//! Splits UTF-8 encoded \a s into code points
/*! Malformed sequences each yield a single replacement character.
 */
std::vector< code_point >
decode (const std::string& s)
{
  std::vector< code_point > rv;
  std::string::size_type i = 0;

  while (i < s.size ())
    {
      unsigned char c = s[i];
      int trailing = 0;
      code_point cp = 0;

      if      (c < 0x80)           { cp = c; }
      else if (0xc0 == (c & 0xe0)) { cp = c & 0x1f; trailing = 1; }
      else if (0xe0 == (c & 0xf0)) { cp = c & 0x0f; trailing = 2; }
      else if (0xf0 == (c & 0xf8)) { cp = c & 0x07; trailing = 3; }
      else
        {
          rv.push_back (replacement);
          ++i;
          continue;
        }

      ++i;
      bool ok = true;
      for (int n = 0; n < trailing; ++n, ++i)
        {
          if (i >= s.size ()
              || 0x80 != (static_cast< unsigned char > (s[i]) & 0xc0))
            {
              ok = false;
              break;
            }
          cp = (cp << 6) | (static_cast< unsigned char > (s[i]) & 0x3f);
        }
      rv.push_back (ok ? cp : replacement);
    }
  return rv;
}

void
append_utf16 (std::string& hex, code_point cp)
{
  if (0xffff < cp)
    {
      cp -= 0x10000;
      append_utf16 (hex, 0xd800 + (cp >> 10));
      append_utf16 (hex, 0xdc00 + (cp & 0x3ff));
      return;
    }
  hex += (format ("%04X") % cp).str ();
}

}       // namespace

object::object ()
  : repr_("null")
{}

object::object (int i)
  : repr_((format ("%1%") % i).str ())
{}

//! Writes whole numbers without a fractional part
object::object (double d)
{
  double whole;

  if (0 == std::modf (d, &whole)
      && std::fabs (whole) < std::numeric_limits< int >::max ())
    {
      repr_ = (format ("%1%") % int (whole)).str ();
      return;
    }

  repr_ = (format ("%.2f") % d).str ();
  std::string::size_type last = repr_.find_last_not_of ('0');
  if ('.' == repr_[last]) --last;
  repr_.erase (last + 1);
}

object::object (const array& a)
  : repr_(a.str ())
{}

object::object (const dictionary& d)
  : repr_(d.str ())
{}

object
object::name (const std::string& s)
{
  object rv;
  rv.repr_ = "/" + s;
  return rv;
}

object
object::literal (const std::string& octets)
{
  object rv;
  rv.repr_ = "(";
  for (std::string::const_iterator it = octets.begin ();
       octets.end () != it; ++it)
    {
      unsigned char c = *it;

      if ('(' == c || ')' == c || '\\' == c)
        {
          rv.repr_ += '\\';
          rv.repr_ += c;
        }
      else if (c < 0x20 || 0x7e < c)
        {
          rv.repr_ += (format ("\\%03o") % int (c)).str ();
        }
      else
        {
          rv.repr_ += c;
        }
    }
  rv.repr_ += ")";
  return rv;
}

object
object::text (const std::string& s)
{
  std::string::const_iterator it = s.begin ();
  while (s.end () != it && !(0x80 & static_cast< unsigned char > (*it)))
    ++it;

  if (s.end () == it)
    return literal (s);

  std::vector< code_point > cps (decode (s));
  object rv;
  rv.repr_ = "<FEFF";
  for (std::vector< code_point >::const_iterator cp = cps.begin ();
       cps.end () != cp; ++cp)
    {
      append_utf16 (rv.repr_, *cp);
    }
  rv.repr_ += ">";
  return rv;
}

object
object::boolean (bool b)
{
  object rv;
  rv.repr_ = (b ? "true" : "false");
  return rv;
}

object
object::reference (object_number n)
{
  object rv;
  rv.repr_ = (format ("%1% 0 R") % n).str ();
  return rv;
}

const std::string&
object::str () const
{
  return repr_;
}

std::ostream&
operator<< (std::ostream& os, const object& o)
{
  return os << o.str ();
}

array&
array::add (const object& o)
{
  items_.push_back (o);
  return *this;
}

std::size_t
array::size () const
{
  return items_.size ();
}

bool
array::empty () const
{
  return items_.empty ();
}

std::string
array::str () const
{
  std::string rv ("[");
  for (std::vector< object >::const_iterator it = items_.begin ();
       items_.end () != it; ++it)
    {
      if (items_.begin () != it) rv += " ";
      rv += it->str ();
    }
  return rv + "]";
}

dictionary&
dictionary::set (const std::string& key, const object& value)
{
  for (std::vector< entry >::iterator it = entries_.begin ();
       entries_.end () != it; ++it)
    {
      if (key == it->first)
        {
          it->second = value;
          return *this;
        }
    }
  entries_.push_back (entry (key, value));
  return *this;
}

bool
dictionary::has (const std::string& key) const
{
  for (std::vector< entry >::const_iterator it = entries_.begin ();
       entries_.end () != it; ++it)
    {
      if (key == it->first) return true;
    }
  return false;
}

std::size_t
dictionary::size () const
{
  return entries_.size ();
}

std::string
dictionary::str () const
{
  std::string rv ("<<");
  for (std::vector< entry >::const_iterator it = entries_.begin ();
       entries_.end () != it; ++it)
    {
      rv += " /" + it->first + " " + it->second.str ();
    }
  return rv + " >>";
}

std::string
to_win_ansi (const std::string& s)
{
  std::vector< code_point > cps (decode (s));
  std::string rv;

  rv.reserve (cps.size ());
  for (std::vector< code_point >::const_iterator it = cps.begin ();
       cps.end () != it; ++it)
    {
      // WinAnsi differs from Latin-1 only in the 0x80..0x9f block
      bool fits = (*it < 0x80 || (0xa0 <= *it && *it <= 0xff));
      rv += (fits ? char (*it) : '?');
    }
  return rv;
}

}       // namespace _pdf_
}       // namespace _out_
}       // namespace scanflow
