//  list.cpp -- list available image acquisition devices
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

#include <cstdlib>

#include <exception>
#include <iostream>

#include <boost/program_options.hpp>

#include <scanflow/i18n.hpp>
#include <scanflow/monitor.hpp>

#include "options.hpp"

namespace po = boost::program_options;

int
main (int argc, char *argv[])
{
  using namespace scanflow;

  try
    {
      po::options_description opts (_("Options"));
      opts.add_options ()
        ("help", _("display this help and exit"))
        ("version", _("output version information and exit"))
        ("brief", _("only list device identifiers"))
        ;
      add_driver_options (opts);

      po::variables_map vm;
      po::store (po::parse_command_line (argc, argv, opts), vm);
      po::notify (vm);

      if (vm.count ("help"))
        {
          std::cout << _("list available image acquisition devices")
                    << "\n\n" << opts;
          return EXIT_SUCCESS;
        }
      if (vm.count ("version"))
        {
          std::cout << version ("scanflow-list");
          return EXIT_SUCCESS;
        }

      apply_log_options (vm);

      monitor mon (create_driver (vm));
      monitor::container_type devs (mon.devices ());

      for (monitor::container_type::const_iterator it = devs.begin ();
           devs.end () != it; ++it)
        {
          if (vm.count ("brief"))
            std::cout << it->udi () << "\n";
          else
            std::cout << *it << "\n";
        }

      if (devs.empty ())
        std::cerr << _("No scanners found.") << "\n";
    }
  catch (std::exception& e)
    {
      std::cerr << e.what () << "\n";
      return EXIT_FAILURE;
    }

  exit (EXIT_SUCCESS);
}
