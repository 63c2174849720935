//  pnm.cpp -- PNM export, one file per page
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

#include "pnm.hpp"

#include <scanflow/format.hpp>
#include <scanflow/pnm.hpp>

#include <boost/throw_exception.hpp>

#include <stdexcept>

namespace scanflow {
namespace _out_ {

using std::runtime_error;

std::string
pnm_exporter::extension () const
{
  return "pnm";
}

bool
pnm_exporter::multi_page () const
{
  return false;
}

std::vector< octets >
pnm_exporter::encode (const document& doc)
{
  std::vector< octets > rv;

  for (document::const_iterator it = doc.begin (); doc.end () != it; ++it)
    {
      if (!pnm::parse (it->image ()))
        BOOST_THROW_EXCEPTION
          (runtime_error ((format ("page %1% is not a PNM image")
                           % it->number ()).str ()));
      rv.push_back (it->image ());
    }
  return rv;
}

}       // namespace _out_
}       // namespace scanflow
