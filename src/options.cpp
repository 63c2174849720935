//  options.cpp -- command line options shared by all programs
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

#include "options.hpp"

#include "../drivers/factory.hpp"

#include <scanflow/format.hpp>
#include <scanflow/i18n.hpp>
#include <scanflow/log.hpp>
#include <scanflow/preferences.hpp>

#include <sstream>

#ifndef SCANFLOW_VERSION
#define SCANFLOW_VERSION "unknown"
#endif

namespace po = boost::program_options;

namespace scanflow {

void
add_driver_options (po::options_description& desc)
{
  std::string types;
  std::vector< std::string > known (_drv_::types ());
  for (std::vector< std::string >::size_type i = 0; i < known.size (); ++i)
    {
      if (i) types += ", ";
      types += known[i];
    }

  desc.add_options ()
    ("driver", po::value< std::string > ()->default_value (known.front ()),
     (format (_("driver to use, one of %1%")) % types).str ().c_str ())
    ("devices", po::value< std::string > (),
     _("device description file for the file driver"))
    ("log-level", po::value< log::priority > (),
     _("log messages up to this priority, e.g. error or trace"))
    ;
}

driver::ptr
create_driver (const po::variables_map& vm)
{
  std::string arg;
  if (vm.count ("devices")) arg = vm["devices"].as< std::string > ();

  return _drv_::create (vm["driver"].as< std::string > (), arg);
}

void
apply_log_options (const po::variables_map& vm)
{
  preferences::apply_environment ();

  if (vm.count ("log-level"))
    log::threshold = vm["log-level"].as< log::priority > ();
}

std::string
version (const std::string& program)
{
  std::stringstream ss;

  ss << program << " (scanflow) " << SCANFLOW_VERSION << "\n"
     << "Copyright (C) 2026  SEIKO EPSON CORPORATION\n"
     << "License: GPL-3.0+\n";

  return ss.str ();
}

}       // namespace scanflow
