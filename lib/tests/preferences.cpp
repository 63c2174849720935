//  preferences.cpp -- unit tests for persistent user preferences
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

#include <string>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/test/unit_test.hpp>

#include "scanflow/log.hpp"
#include "scanflow/preferences.hpp"
#include "scanflow/test/tools.hpp"

using namespace scanflow;
namespace fs = boost::filesystem;

namespace {

void
write (const std::string& path, const std::string& content)
{
  fs::ofstream ofs (path);
  ofs << content;
}

//! Restores the log threshold that was in effect at construction
struct threshold_guard
{
  threshold_guard () : saved (log::threshold) {}
  ~threshold_guard () { log::threshold = saved; }

  log::priority saved;
};

}       // namespace

BOOST_AUTO_TEST_CASE (defaults)
{
  test::environment home ("HOME", "/home/tester");
  preferences prefs;

  BOOST_CHECK_EQ ("/home/tester", prefs.export_directory ());
  BOOST_CHECK_EQ ("pnm", prefs.export_format ());
  BOOST_CHECK_EQ ("scan-%i", prefs.export_pattern ());
  BOOST_CHECK_EQ (300, prefs.scan ().resolution ());
}

BOOST_AUTO_TEST_CASE (missing_file)
{
  test::temporary_directory dir;
  preferences prefs (preferences::load (dir / "nowhere.conf"));

  BOOST_CHECK_EQ (300, prefs.scan ().resolution ());
  BOOST_CHECK_EQ ("pnm", prefs.export_format ());
}

BOOST_AUTO_TEST_CASE (partial_file)
{
  test::temporary_directory dir;
  write (dir / "scanflow.conf",
         "[scan]\n"
         "resolution = 600\n"
         "color-mode = black-and-white\n"
         "source = feeder-back\n"
         "duplex = true\n"
         "future-option = 42\n"
         "[export]\n"
         "format = tiff\n");

  preferences prefs (preferences::load (dir / "scanflow.conf"));

  BOOST_CHECK_EQ (600, prefs.scan ().resolution ());
  BOOST_CHECK (color_mode::black_and_white == prefs.scan ().mode ());
  BOOST_CHECK (scan_source::feeder_back == prefs.scan ().source ());
  BOOST_CHECK (prefs.scan ().duplex ());
  BOOST_CHECK (paper_size::letter == prefs.scan ().paper ());
  BOOST_CHECK_EQ ("tiff", prefs.export_format ());
  BOOST_CHECK_EQ ("scan-%i", prefs.export_pattern ());
}

BOOST_AUTO_TEST_CASE (malformed_file)
{
  test::temporary_directory dir;
  write (dir / "scanflow.conf",
         "[scan]\n"
         "resolution = lots\n");

  preferences prefs (preferences::load (dir / "scanflow.conf"));

  BOOST_CHECK_EQ (300, prefs.scan ().resolution ());
}

BOOST_AUTO_TEST_CASE (unknown_mode_name)
{
  test::temporary_directory dir;
  write (dir / "scanflow.conf",
         "[scan]\n"
         "color-mode = sepia\n");

  preferences prefs (preferences::load (dir / "scanflow.conf"));

  BOOST_CHECK (color_mode::color == prefs.scan ().mode ());
}

BOOST_AUTO_TEST_CASE (save_and_load)
{
  test::temporary_directory dir;
  std::string path (dir / "sub/dir/scanflow.conf");

  preferences prefs;
  prefs.scan ()
    .resolution (150)
    .mode (color_mode::grayscale)
    .paper (paper_size::a4)
    .source (scan_source::duplex)
    .duplex (true)
    .brightness (-25)
    .contrast (40)
    .auto_crop (false)
    .auto_ocr (false)
    .ocr_language ("fra");
  prefs.export_directory ("/srv/scans")
    .export_format ("jpeg")
    .export_pattern ("receipt-%3i");

  prefs.save (path);
  BOOST_REQUIRE (fs::exists (path));

  preferences back (preferences::load (path));
  const settings& s (back.scan ());

  BOOST_CHECK_EQ (150, s.resolution ());
  BOOST_CHECK (color_mode::grayscale == s.mode ());
  BOOST_CHECK (paper_size::a4 == s.paper ());
  BOOST_CHECK (scan_source::duplex == s.source ());
  BOOST_CHECK (s.duplex ());
  BOOST_CHECK_EQ (-25, s.brightness ());
  BOOST_CHECK_EQ (40, s.contrast ());
  BOOST_CHECK (!s.auto_crop ());
  BOOST_CHECK (s.auto_enhance ());
  BOOST_CHECK (!s.auto_ocr ());
  BOOST_CHECK_EQ ("fra", s.ocr_language ());
  BOOST_CHECK_EQ ("/srv/scans", back.export_directory ());
  BOOST_CHECK_EQ ("jpeg", back.export_format ());
  BOOST_CHECK_EQ ("receipt-%3i", back.export_pattern ());
}

BOOST_AUTO_TEST_CASE (save_to_unwritable_location)
{
  test::temporary_directory dir;
  write (dir / "file", "not a directory");

  preferences prefs;
  BOOST_CHECK_THROW (prefs.save (dir / "file/scanflow.conf"),
                     std::exception);
}

BOOST_AUTO_TEST_CASE (xdg_location)
{
  test::environment xdg ("XDG_CONFIG_HOME", "/tmp/xdg");

  BOOST_CHECK_EQ ("/tmp/xdg/scanflow/scanflow.conf",
                  preferences::default_path ());
}

BOOST_AUTO_TEST_CASE (home_location)
{
  test::environment xdg ("XDG_CONFIG_HOME", "");
  test::environment home ("HOME", "/home/tester");

  BOOST_CHECK_EQ ("/home/tester/.config/scanflow/scanflow.conf",
                  preferences::default_path ());
}

BOOST_AUTO_TEST_CASE (log_level_from_environment)
{
  threshold_guard guard;
  test::environment level ("SCANFLOW_LOG_LEVEL", "debug");

  log::threshold = log::ERROR;
  preferences::apply_environment ();

  BOOST_CHECK_EQ (log::DEBUG, log::threshold);
}

BOOST_AUTO_TEST_CASE (unknown_log_level)
{
  threshold_guard guard;
  test::environment level ("SCANFLOW_LOG_LEVEL", "chatty");

  log::threshold = log::BRIEF;
  preferences::apply_environment ();

  BOOST_CHECK_EQ (log::BRIEF, log::threshold);
}

BOOST_AUTO_TEST_CASE (choices)
{
  BOOST_CHECK (!preferences::ocr_languages ().empty ());
  BOOST_CHECK_EQ ("eng", preferences::ocr_languages ().front ().first);
  BOOST_CHECK (!preferences::resolutions ().empty ());
}

#include "scanflow/test/runner.ipp"
