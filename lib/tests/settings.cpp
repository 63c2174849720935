//  settings.cpp -- unit tests for scan settings, media sizes and device descriptions
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

#include <sstream>
#include <string>

#include <boost/assign/list_of.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/test/unit_test.hpp>

#include "scanflow/device.hpp"
#include "scanflow/media.hpp"
#include "scanflow/property.hpp"
#include "scanflow/settings.hpp"
#include "scanflow/test/tools.hpp"

using namespace scanflow;
using boost::assign::list_of;
using boost::lexical_cast;

namespace {

device
make_device (const device::source_list& sources,
             const device::resolution_list& dpi)
{
  return device ("test:0", "Test", "ACME", device_class::flatbed,
                 true, false, false, 1200, sources, dpi);
}

}       // namespace

BOOST_AUTO_TEST_SUITE (settings_defaults);

BOOST_AUTO_TEST_CASE (values)
{
  settings s;

  BOOST_CHECK_EQ (300, s.resolution ());
  BOOST_CHECK (color_mode::color == s.mode ());
  BOOST_CHECK (paper_size::letter == s.paper ());
  BOOST_CHECK (scan_source::automatic == s.source ());
  BOOST_CHECK (!s.duplex ());
  BOOST_CHECK_EQ (0, s.brightness ());
  BOOST_CHECK_EQ (0, s.contrast ());
  BOOST_CHECK (s.auto_crop ());
  BOOST_CHECK (s.auto_enhance ());
  BOOST_CHECK (s.auto_ocr ());
  BOOST_CHECK_EQ ("eng", s.ocr_language ());
}

BOOST_AUTO_TEST_CASE (clone_is_independent)
{
  settings s;
  settings t (s.clone ());

  t.resolution (600).mode (color_mode::grayscale);

  BOOST_CHECK_EQ (300, s.resolution ());
  BOOST_CHECK (color_mode::color == s.mode ());
  BOOST_CHECK_EQ (600, t.resolution ());
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_SUITE (names);

BOOST_AUTO_TEST_CASE (output)
{
  BOOST_CHECK_EQ ("black-and-white",
                  lexical_cast< std::string > (color_mode::black_and_white));
  BOOST_CHECK_EQ ("feeder-front",
                  lexical_cast< std::string > (scan_source::feeder_front));
  BOOST_CHECK_EQ ("a4", lexical_cast< std::string > (paper_size::a4));
  BOOST_CHECK_EQ ("duplex-adf",
                  lexical_cast< std::string > (device_class::duplex_adf));
}

BOOST_AUTO_TEST_CASE (input_ignores_case)
{
  BOOST_CHECK (scan_source::duplex
               == lexical_cast< scan_source > ("Duplex"));
  BOOST_CHECK (color_mode::grayscale
               == lexical_cast< color_mode > ("GRAYSCALE"));
  BOOST_CHECK (paper_size::legal == lexical_cast< paper_size > ("legal"));
}

BOOST_AUTO_TEST_CASE (unknown_name)
{
  BOOST_CHECK_THROW (lexical_cast< scan_source > ("tray"),
                     boost::bad_lexical_cast);

  std::istringstream is ("sepia");
  color_mode m (color_mode::color);
  is >> m;
  BOOST_CHECK (is.fail ());
  BOOST_CHECK (color_mode::color == m);
}

BOOST_AUTO_TEST_CASE (labels)
{
  BOOST_CHECK_EQ ("Duplex (2-sided)", display_name (scan_source::duplex));
  BOOST_CHECK_EQ ("Flatbed", display_name (scan_source::flatbed));
  BOOST_CHECK (!description (scan_source::film).empty ());
}

BOOST_AUTO_TEST_CASE (feeder_sources)
{
  BOOST_CHECK (is_feeder (scan_source::feeder));
  BOOST_CHECK (is_feeder (scan_source::duplex));
  BOOST_CHECK (is_feeder (scan_source::feeder_back));
  BOOST_CHECK (!is_feeder (scan_source::flatbed));
  BOOST_CHECK (!is_feeder (scan_source::automatic));
  BOOST_CHECK (!is_feeder (scan_source::film));
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_SUITE (device_properties);

BOOST_AUTO_TEST_CASE (handling_selection)
{
  using namespace property::handling;

  BOOST_CHECK_EQ (automatic, handling_select (scan_source::automatic, false));
  BOOST_CHECK_EQ (flatbed, handling_select (scan_source::flatbed, true));
  BOOST_CHECK_EQ (flatbed, handling_select (scan_source::film, false));
  BOOST_CHECK_EQ (feeder, handling_select (scan_source::feeder, false));
  BOOST_CHECK_EQ (feeder | duplex,
                  handling_select (scan_source::feeder, true));
  BOOST_CHECK_EQ (feeder | duplex,
                  handling_select (scan_source::duplex, false));
  BOOST_CHECK_EQ (feeder | front_only,
                  handling_select (scan_source::feeder_front, false));
  BOOST_CHECK_EQ (feeder | back_only,
                  handling_select (scan_source::feeder_back, false));
}

BOOST_AUTO_TEST_CASE (image_types)
{
  using namespace property;

  BOOST_CHECK_EQ (image_intent::color,
                  image_type (color_mode::color).first);
  BOOST_CHECK_EQ (pixel_type::color,
                  image_type (color_mode::color).second);
  BOOST_CHECK_EQ (image_intent::grayscale,
                  image_type (color_mode::grayscale).first);
  BOOST_CHECK_EQ (pixel_type::grayscale,
                  image_type (color_mode::grayscale).second);
  BOOST_CHECK_EQ (image_intent::text,
                  image_type (color_mode::black_and_white).first);
  BOOST_CHECK_EQ (pixel_type::black_and_white,
                  image_type (color_mode::black_and_white).second);
}

BOOST_AUTO_TEST_CASE (names_for_logging)
{
  BOOST_CHECK_EQ ("x-resolution", property::name_of (property::x_resolution));
  BOOST_CHECK_EQ ("handling-status",
                  property::name_of (property::handling_status));
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_SUITE (paper);

BOOST_AUTO_TEST_CASE (letter_at_300_dpi)
{
  boost::optional< media > m (media::lookup (paper_size::letter));

  BOOST_REQUIRE (m);
  BOOST_CHECK_EQ (2550, m->width (300));
  BOOST_CHECK_EQ (3300, m->height (300));
}

BOOST_AUTO_TEST_CASE (legal_is_longer)
{
  boost::optional< media > letter (media::lookup (paper_size::letter));
  boost::optional< media > legal (media::lookup (paper_size::legal));

  BOOST_REQUIRE (letter && legal);
  BOOST_CHECK_EQ (letter->width (150), legal->width (150));
  BOOST_CHECK_EQ (2100, legal->height (150));
}

BOOST_AUTO_TEST_CASE (custom_has_no_extent)
{
  BOOST_CHECK (!media::lookup (paper_size::custom));
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_SUITE (devices);

BOOST_AUTO_TEST_CASE (closest_resolution)
{
  device dev (make_device (list_of (scan_source::flatbed),
                           list_of (150)(300)(600)));

  BOOST_CHECK_EQ (300, dev.closest_resolution (300));
  BOOST_CHECK_EQ (150, dev.closest_resolution (75));
  BOOST_CHECK_EQ (600, dev.closest_resolution (2400));
  BOOST_CHECK_EQ (300, dev.closest_resolution (400));
}

BOOST_AUTO_TEST_CASE (ties_go_to_the_lower_resolution)
{
  device dev (make_device (list_of (scan_source::flatbed),
                           list_of (600)(200)(400)));

  BOOST_CHECK_EQ (200, dev.closest_resolution (300));
  BOOST_CHECK_EQ (400, dev.closest_resolution (500));
}

BOOST_AUTO_TEST_CASE (no_resolutions_keeps_request)
{
  device dev (make_device (list_of (scan_source::flatbed),
                           device::resolution_list ()));

  BOOST_CHECK_EQ (333, dev.closest_resolution (333));
}

BOOST_AUTO_TEST_CASE (default_source_comes_first)
{
  device dev (make_device (list_of (scan_source::feeder)
                           (scan_source::duplex),
                           list_of (300)));

  BOOST_CHECK (scan_source::feeder == dev.default_source ());
  BOOST_CHECK (dev.supports (scan_source::duplex));
  BOOST_CHECK (!dev.supports (scan_source::flatbed));
}

BOOST_AUTO_TEST_CASE (empty_sources_mean_flatbed)
{
  device dev (make_device (device::source_list (), list_of (300)));

  BOOST_REQUIRE_EQ (1u, dev.sources ().size ());
  BOOST_CHECK (scan_source::flatbed == dev.default_source ());
}

BOOST_AUTO_TEST_CASE (equality_by_udi)
{
  device a (make_device (list_of (scan_source::flatbed), list_of (300)));
  device b ("test:1", "Test", "ACME", device_class::flatbed,
            true, false, false, 1200,
            list_of (scan_source::flatbed),
            list_of (int (300)));

  BOOST_CHECK (a == a);
  BOOST_CHECK (a != b);
}

BOOST_AUTO_TEST_SUITE_END ();

#include "scanflow/test/runner.ipp"
