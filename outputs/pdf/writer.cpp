//  writer.cpp -- assemble PDF files in memory
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

#include "writer.hpp"

#include <scanflow/format.hpp>

#include <boost/throw_exception.hpp>

#include <stdexcept>

namespace scanflow {
namespace _out_ {
namespace _pdf_ {

using std::logic_error;

writer::writer ()
  : next_(1)
{}

object_number
writer::allocate ()
{
  return next_++;
}

void
writer::header ()
{
  if (!data_.empty ())
    BOOST_THROW_EXCEPTION
      (logic_error ("PDF header must come first"));

  append ("%PDF-1.4\n");
  // binary octets mark the file as such for transfer programs
  append ("%\xe2\xe3\xcf\xd3\n");
}

void
writer::write (object_number n, const object& obj)
{
  begin (n);
  append (obj.str ());
  append ("\nendobj\n");
}

void
writer::write (object_number n, dictionary dict, const octets& data)
{
  dict.set ("Length", object (int (data.size ())));

  begin (n);
  append (dict.str ());
  append ("\nstream\n");
  data_.insert (data_.end (), data.begin (), data.end ());
  append ("\nendstream\nendobj\n");
}

void
writer::write (object_number n, dictionary dict, const std::string& data)
{
  write (n, dict, octets (data.begin (), data.end ()));
}

void
writer::trailer (dictionary dict)
{
  if (xref_.size () + 1 != next_)
    BOOST_THROW_EXCEPTION
      (logic_error ((format ("%1% PDF object(s) allocated but not written")
                     % (next_ - 1 - xref_.size ())).str ()));

  std::size_t startxref = data_.size ();

  // entries are exactly twenty octets each [p 94]
  append ((format ("xref\n0 %1%\n") % next_).str ());
  append ("0000000000 65535 f \n");
  for (std::map< object_number, std::size_t >::const_iterator
         it = xref_.begin (); xref_.end () != it; ++it)
    {
      append ((format ("%010d 00000 n \n") % it->second).str ());
    }

  dict.set ("Size", object (int (next_)));

  append ("trailer\n");
  append (dict.str ());
  append ((format ("\nstartxref\n%1%\n%%%%EOF\n") % startxref).str ());
}

const octets&
writer::data () const
{
  return data_;
}

void
writer::begin (object_number n)
{
  if (0 == n || next_ <= n)
    BOOST_THROW_EXCEPTION
      (logic_error ((format ("PDF object %1% was not allocated") % n).str ()));
  if (xref_.count (n))
    BOOST_THROW_EXCEPTION
      (logic_error ((format ("PDF object %1% written twice") % n).str ()));

  xref_[n] = data_.size ();
  append ((format ("%1% 0 obj\n") % n).str ());
}

void
writer::append (const std::string& s)
{
  data_.insert (data_.end (), s.begin (), s.end ());
}

}       // namespace _pdf_
}       // namespace _out_
}       // namespace scanflow
