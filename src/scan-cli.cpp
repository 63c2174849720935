//  scan-cli.cpp -- scan single or multiple pages from the command line
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

#include <csignal>
#include <cstdlib>

#include <exception>
#include <iostream>

#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>

#include <scanflow/acquisition.hpp>
#include <scanflow/format.hpp>
#include <scanflow/i18n.hpp>
#include <scanflow/log.hpp>
#include <scanflow/preferences.hpp>
#include <scanflow/services.hpp>

#include "../outputs/factory.hpp"
#include "options.hpp"

namespace fs = boost::filesystem;
namespace po = boost::program_options;

using namespace scanflow;

namespace {

//! Lets the signal handler get at the running session
acquisition *session = NULL;

void
request_cancellation (int)
{
  if (session) session->cancel ();
}

void
show_progress (const progress& p)
{
  std::cerr << "\r" << p << "          " << std::flush;
  if (100 <= p.percent ()) std::cerr << "\n";
}

void
show_status (const std::string& message)
{
  log::brief ("%1%") % message;
}

//! Adapts the preferred settings to what \a dev can do
settings
fit (const settings& preferred, const device& dev)
{
  settings rv (preferred.clone ());

  rv.resolution (dev.closest_resolution (rv.resolution ()));

  if (scan_source::automatic == rv.source () || !dev.supports (rv.source ()))
    rv.source (dev.default_source ());
  if (!dev.supports_duplex ())
    rv.duplex (false);

  return rv;
}

}       // namespace

int
main (int argc, char *argv[])
{
  try
    {
      std::string config_file (preferences::default_path ());
      std::string udi;
      std::string output;

      po::options_description opts (_("Options"));
      opts.add_options ()
        ("help", _("display this help and exit"))
        ("version", _("output version information and exit"))
        ("config", po::value< std::string > (&config_file)
         ->default_value (config_file),
         _("preferences file to use"))
        ("save-config", _("store the effective settings as preferences"))
        ("device", po::value< std::string > (&udi),
         _("image acquisition device to use, the default device otherwise"))
        ("multiple", _("scan from the document feeder until it is empty"))
        ("output", po::value< std::string > (&output),
         _("output file name, with an optional %i page number formatter"))
        ("format", po::value< std::string > (),
         _("export format: pdf, pnm, png, jpeg or tiff"))
        ;

      po::options_description scan_opts (_("Scan options"));
      scan_opts.add_options ()
        ("resolution", po::value< int > (), _("resolution in dpi"))
        ("mode", po::value< color_mode > (),
         _("color, grayscale or black-and-white"))
        ("paper", po::value< paper_size > (),
         _("letter, legal, a4, a5 or custom"))
        ("source", po::value< scan_source > (),
         _("auto, flatbed, feeder, duplex, film, feeder-front"
           " or feeder-back"))
        ("duplex", po::value< bool > (), _("scan both sides of each sheet"))
        ("brightness", po::value< int > (), _("brightness offset"))
        ("contrast", po::value< int > (), _("contrast offset"))
        ("feeder-delay", po::value< int > (),
         _("milliseconds to wait for the feeder to advance"))
        ;

      add_driver_options (opts);
      opts.add (scan_opts);

      po::variables_map vm;
      po::store (po::parse_command_line (argc, argv, opts), vm);
      po::notify (vm);

      if (vm.count ("help"))
        {
          std::cout << _("scan single or multiple pages") << "\n\n" << opts;
          return EXIT_SUCCESS;
        }
      if (vm.count ("version"))
        {
          std::cout << version ("scanflow-scan");
          return EXIT_SUCCESS;
        }

      apply_log_options (vm);

      preferences prefs (preferences::load (config_file));
      settings& s (prefs.scan ());

      if (vm.count ("resolution")) s.resolution (vm["resolution"].as< int > ());
      if (vm.count ("mode"))       s.mode (vm["mode"].as< color_mode > ());
      if (vm.count ("paper"))      s.paper (vm["paper"].as< paper_size > ());
      if (vm.count ("source"))     s.source (vm["source"].as< scan_source > ());
      if (vm.count ("duplex"))     s.duplex (vm["duplex"].as< bool > ());
      if (vm.count ("brightness")) s.brightness (vm["brightness"].as< int > ());
      if (vm.count ("contrast"))   s.contrast (vm["contrast"].as< int > ());
      if (vm.count ("format"))
        prefs.export_format (vm["format"].as< std::string > ());

      if (vm.count ("save-config"))
        prefs.save (config_file);

      exporter::ptr exp (_out_::create (prefs.export_format ()));

      acquisition acq (create_driver (vm));

      if (vm.count ("feeder-delay"))
        acq.engine ().feeder_delay
          (chrono::milliseconds (vm["feeder-delay"].as< int > ()));

      acq.connect_progress (&show_progress);
      acq.connect_status (&show_status);

      acq.refresh ();
      if (!udi.empty () && !acq.select (udi))
        {
          std::cerr << (format (_("Scanner device not found: %1%")) % udi)
                    << "\n";
          return EXIT_FAILURE;
        }
      if (!acq.selected ())
        {
          std::cerr << acq.status () << "\n";
          return EXIT_FAILURE;
        }

      acq.scan_settings () = fit (s, *acq.selected ());

      session = &acq;
      std::signal (SIGINT , request_cancellation);
      std::signal (SIGTERM, request_cancellation);

      if (vm.count ("multiple"))
        acq.scan_many ();
      else
        acq.scan ();

      std::signal (SIGINT , SIG_DFL);
      std::signal (SIGTERM, SIG_DFL);
      session = NULL;

      if (acq.current ().empty ())
        {
          std::cerr << acq.status () << "\n";
          return EXIT_FAILURE;
        }

      if (output.empty ())
        output = (fs::path (prefs.export_directory ())
                  / prefs.export_pattern ()).string ();

      std::vector< std::string > files (save (*exp, acq.current (), output));
      for (std::vector< std::string >::const_iterator it = files.begin ();
           files.end () != it; ++it)
        {
          std::cout << *it << "\n";
        }
    }
  catch (std::exception& e)
    {
      session = NULL;
      std::cerr << e.what () << "\n";
      return EXIT_FAILURE;
    }

  exit (EXIT_SUCCESS);
}
