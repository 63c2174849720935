//  services.cpp -- interfaces to image processing, OCR, export and upload services
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

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

#include "scanflow/file.hpp"
#include "scanflow/format.hpp"
#include "scanflow/log.hpp"
#include "scanflow/services.hpp"

namespace fs = boost::filesystem;

namespace scanflow {

namespace {

//! Returns \a p unless taken, else the first free "stem (n).ext"
fs::path
unused (const fs::path& p)
{
  if (!fs::exists (p)) return p;

  fs::path q;
  int n = 0;
  do
    {
      q = p.parent_path () / ((format ("%1% (%2%)%3%")
                               % p.stem ().string ()
                               % ++n
                               % p.extension ().string ()).str ());
    }
  while (fs::exists (q));

  return q;
}

}       // namespace

image_processor::~image_processor () {}
recognizer::~recognizer () {}
exporter::~exporter () {}
uploader::~uploader () {}

std::vector< std::string >
save (exporter& exp, const document& doc, const std::string& pattern)
{
  std::vector< std::string > rv;
  std::vector< octets > data (exp.encode (doc));

  fs::path p (pattern);
  if (p.extension ().empty ())
    p += "." + exp.extension ();

  path_generator gen (p.string ());
  if (!gen && 1 < data.size ())
    {
      fs::path q (p.parent_path ()
                  / (p.stem ().string () + "-%i" + p.extension ().string ()));
      gen = path_generator (q.string ());
    }

  for (std::vector< octets >::size_type i = 0; i < data.size (); ++i)
    {
      std::string name (unused (gen ? gen () : p.string ()).string ());

      write_file (name, data[i]);
      rv.push_back (name);
    }

  log::brief ("saved %1% as %2% file(s)") % doc.name () % rv.size ();
  return rv;
}

}       // namespace scanflow
