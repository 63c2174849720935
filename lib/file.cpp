//  file.cpp -- file names and whole file I/O
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

#include "scanflow/file.hpp"

#include "scanflow/format.hpp"
#include "scanflow/log.hpp"
#include "scanflow/regex.hpp"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/scoped_array.hpp>
#include <boost/throw_exception.hpp>

#include <cstdio>
#include <ios>
#include <iterator>

namespace fs = boost::filesystem;

using std::ios_base;

namespace scanflow {

path_generator::path_generator ()
  : offset_(0)
{}

path_generator::path_generator (const std::string& pattern, unsigned first)
  : offset_(first)
{
  fs::path p (pattern);
  parent_ = p.parent_path ().string ();         // don't touch this

  std::string filename = p.filename ().string ();

  regex re ("(([^%]|%%)*)%0*([0-9]*)i(([^%]|%%)*)");
  smatch m;

  if (regex_match (filename, m, re))
    {
      format_ = filename;
      if (m.str (3).length ())  // make sure we use zero padding
        {
          format_ = m.str (1) + "%0" + m.str (3) + "i" + m.str (4);
        }
    }
  else
    {
      *this = path_generator ();
    }
}

path_generator::operator bool () const
{
  return 0 < format_.size ();
}

std::string
path_generator::operator() ()
{
  return at (offset_++);
}

std::string
path_generator::at (unsigned n) const
{
  using boost::scoped_array;

  int sz = snprintf (NULL, 0, format_.c_str (), n);

  scoped_array< char > buf (new char[sz + 1]);

  snprintf (buf.get (), sz + 1, format_.c_str (), n);

  return (fs::path (parent_) / buf.get ()).string ();
}

octets
read_file (const std::string& filename)
{
  fs::ifstream file (filename, ios_base::binary | ios_base::in);

  if (!file)
    BOOST_THROW_EXCEPTION
      (ios_base::failure ((format ("cannot open %1%") % filename).str ()));

  octets rv ((std::istreambuf_iterator< char > (file)),
             std::istreambuf_iterator< char > ());

  if (file.bad ())
    BOOST_THROW_EXCEPTION
      (ios_base::failure ((format ("error reading %1%") % filename).str ()));

  log::trace ("read %1% octets from %2%") % rv.size () % filename;
  return rv;
}

void
write_file (const std::string& filename, const octets& data)
{
  fs::ofstream file (filename, (ios_base::binary | ios_base::out
                                | ios_base::trunc));

  if (file)
    file.write (reinterpret_cast< const char * > (data.data ()),
                data.size ());

  if (!file)
    BOOST_THROW_EXCEPTION
      (ios_base::failure ((format ("cannot write %1%") % filename).str ()));

  log::trace ("wrote %1% octets to %2%") % data.size () % filename;
}

}       // namespace scanflow
