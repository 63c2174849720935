//  value.cpp -- unit tests for property values and their constraints
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
#include <vector>

#include <boost/test/unit_test.hpp>
#include <boost/variant/get.hpp>

#include "scanflow/choices.hpp"
#include "scanflow/range.hpp"
#include "scanflow/value.hpp"

using namespace scanflow;

BOOST_AUTO_TEST_CASE (default_value_is_none)
{
  value v;

  BOOST_CHECK (v.is_none ());
  BOOST_CHECK (!v.is_integer ());
  BOOST_CHECK (!v.is_string ());
}

BOOST_AUTO_TEST_CASE (integer_value)
{
  value v (300);

  BOOST_CHECK (v.is_integer ());
  BOOST_CHECK_EQUAL (300, value::integer (v));
  BOOST_CHECK_THROW (static_cast< std::string > (v), boost::bad_get);
}

BOOST_AUTO_TEST_CASE (string_value)
{
  value v ("ACME");

  BOOST_CHECK (v.is_string ());
  BOOST_CHECK_EQUAL ("ACME", static_cast< std::string > (v));
  BOOST_CHECK_THROW (static_cast< value::integer > (v), boost::bad_get);
}

BOOST_AUTO_TEST_CASE (equality_needs_same_type)
{
  BOOST_CHECK (value (1) == value (1));
  BOOST_CHECK (value (1) != value (2));
  BOOST_CHECK (value (1) != value ("1"));
  BOOST_CHECK (value () == value ());
}

BOOST_AUTO_TEST_CASE (range_contains)
{
  range r (50, 1200);

  BOOST_CHECK (r.contains (50));
  BOOST_CHECK (r.contains (1200));
  BOOST_CHECK (!r.contains (49));
  BOOST_CHECK (!r.contains (1201));
}

BOOST_AUTO_TEST_CASE (range_steps)
{
  range r (50, 1200, 100);

  BOOST_CHECK (r.contains (150));
  BOOST_CHECK (!r.contains (200));
  BOOST_CHECK (r.contains (1150));
  BOOST_CHECK (r.contains (1200));
}

BOOST_AUTO_TEST_CASE (range_allows_integers_only)
{
  range r (75, 600);

  BOOST_CHECK (r.allows (value (300)));
  BOOST_CHECK (!r.allows (value ("300")));
  BOOST_CHECK (!r.allows (value ()));
}

BOOST_AUTO_TEST_CASE (range_adjusts_to_fallback)
{
  range r (75, 600);

  BOOST_CHECK_EQUAL (value (75), r.fallback ());

  r.fallback (300);
  BOOST_CHECK_EQUAL (value (150), r.adjust (value (150)));
  BOOST_CHECK_EQUAL (value (300), r.adjust (value (1200)));
  BOOST_CHECK_EQUAL (value (300), r.adjust (value ("high")));
}

BOOST_AUTO_TEST_CASE (range_rejects_bad_fallback)
{
  range r (75, 600, 75);

  BOOST_CHECK_THROW (r.fallback (1200), constraint::violation);
  BOOST_CHECK_THROW (r.fallback (100), constraint::violation);
  BOOST_CHECK_EQUAL (value (75), r.fallback ());
}

BOOST_AUTO_TEST_CASE (range_rejects_contradictions)
{
  BOOST_CHECK_THROW (range (600, 75), constraint::violation);
  BOOST_CHECK_THROW (range (75, 600, 0), constraint::violation);
  BOOST_CHECK_THROW (range (75, 600, -25), constraint::violation);
  BOOST_CHECK_NO_THROW (range (300, 300));
}

BOOST_AUTO_TEST_CASE (choices_keep_order)
{
  choices c (value (150));
  c.add (300).add (600).add (300);

  BOOST_REQUIRE_EQUAL (3u, c.size ());
  BOOST_CHECK_EQUAL (value (150), *c.begin ());
  BOOST_CHECK_EQUAL (value (600), *(c.end () - 1));
  BOOST_CHECK_EQUAL (value (150), c.fallback ());
  BOOST_CHECK_EQUAL (value (300), c.adjust (value (300)));
  BOOST_CHECK_EQUAL (value (150), c.adjust (value (999)));
}

BOOST_AUTO_TEST_CASE (choices_from_sequence)
{
  std::vector< value::integer > dpi;
  dpi.push_back (200);
  dpi.push_back (400);

  choices c (dpi.begin (), dpi.end ());

  BOOST_CHECK_EQUAL (2u, c.size ());
  BOOST_CHECK (c.allows (value (400)));
  BOOST_CHECK (!c.allows (value ("400")));
  BOOST_CHECK_THROW (choices (dpi.end (), dpi.end ()),
                     constraint::violation);
}

BOOST_AUTO_TEST_CASE (choices_fallback_must_be_listed)
{
  choices c (value ("auto"));
  c.add (150);

  BOOST_CHECK_THROW (c.fallback (200), constraint::violation);
  c.fallback (150);
  BOOST_CHECK_EQUAL (value (150), c.adjust (value ("manual")));
  BOOST_CHECK_EQUAL (2u, c.size ());
}

#include "scanflow/test/runner.ipp"
