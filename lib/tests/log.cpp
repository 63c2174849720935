//  log.cpp -- unit tests for the log API implementation
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

#include <algorithm>
#include <list>
#include <sstream>
#include <string>

#include <boost/test/parameterized_test.hpp>
#include <boost/test/unit_test.hpp>

#include "scanflow/log.hpp"

using namespace scanflow;

struct fixture
{
  std::ostringstream s;
  std::streambuf *buf;

  //!  Ensure something gets logged
  fixture ()
  {
    log::threshold = log::BRIEF;
    log::matching  = log::ALL;

    buf = log::basic_logger<char>::os_.rdbuf (s.rdbuf ());
  }
  ~fixture ()
  {
    log::basic_logger<char>::os_.rdbuf (buf);
    log::threshold = log::ERROR;
    log::matching  = log::ALL;
  }
};

BOOST_FIXTURE_TEST_CASE (format_overflow, fixture)
{
  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (log::message (log::FATAL, "%1%") % 1 % 2,
                         boost::io::too_many_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (log::message (log::FATAL, "%1%") % 1 % 2);
    }
}

BOOST_FIXTURE_TEST_CASE (format_underflow, fixture)
{
  log::message fmt (log::FATAL, "%1% %2%");

  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (s << fmt % 1, boost::io::too_few_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (s << fmt % 1);
    }
}

BOOST_FIXTURE_TEST_CASE (quiet_named_ctor_overflow, fixture)
{
  BOOST_REQUIRE (log::threshold < log::TRACE);

  if (log::arg_count_checking)
    {
      BOOST_CHECK_THROW (s << log::trace ("%1%") % 1 % 2,
                         boost::io::too_many_args);
    }
  else
    {
      BOOST_CHECK_NO_THROW (s << log::trace ("%1%") % 1 % 2);
    }
}

BOOST_FIXTURE_TEST_CASE (message_contents, fixture)
{
  log::brief ("found %1% device(s)") % 3;

  BOOST_CHECK (std::string::npos != s.str ().find ("found 3 device(s)"));
}

BOOST_FIXTURE_TEST_CASE (category_mismatch_is_quiet, fixture)
{
  log::matching = log::DISCOVERY;

  log::brief (log::SESSION, "session %1%") % 1;
  BOOST_CHECK (s.str ().empty ());

  log::brief (log::DISCOVERY, "discovery %1%") % 1;
  BOOST_CHECK (!s.str ().empty ());
}

BOOST_AUTO_TEST_CASE (priority_names)
{
  std::istringstream iss ("Trace");
  log::priority p = log::FATAL;

  BOOST_CHECK (iss >> p);
  BOOST_CHECK_EQUAL (log::TRACE, p);

  std::ostringstream oss;
  oss << log::DEBUG;
  BOOST_CHECK_EQUAL ("debug", oss.str ());
}

BOOST_AUTO_TEST_CASE (unknown_priority_name)
{
  std::istringstream iss ("chatty");
  log::priority p = log::FATAL;

  BOOST_CHECK (!(iss >> p));
  BOOST_CHECK_EQUAL (log::FATAL, p);
}

template <typename fmtT>
void
verbosity (log::priority level)
{
  log::threshold = level;
  log::matching  = log::ALL;

  // construct an empty message format of a certain length
  std::string str;
  const int length = 5;
  str.resize (length);

  fmtT fmt (str);

  std::ostringstream s;
  std::streambuf *buf = log::basic_logger<char>::os_.rdbuf (s.rdbuf ());

  // Make sure all messages are out of scope by the time we start
  // checking things.
  {
    log::fatal (fmt);
    log::alert (fmt);
    log::error (fmt);
    log::brief (fmt);
    log::trace (fmt);
    log::debug (fmt);
  }

  // This assumes that the message format does not add any char()
  // into the string it generates.
  int expect = length * (level + 1);
  std::string msg = s.str ();
  int result = std::count (msg.begin (), msg.end (), char ());

  BOOST_CHECK_EQUAL (expect, result);

  log::basic_logger<char>::os_.rdbuf (buf);
  log::threshold = log::ERROR;
}

bool
init_test_runner ()
{
  namespace but = ::boost::unit_test;

  std::list<log::priority> levels;
  levels.push_back (log::FATAL);
  levels.push_back (log::TRACE);
  levels.push_back (log::ERROR);
  levels.push_back (log::DEBUG);
  levels.push_back (log::ALERT);
  levels.push_back (log::BRIEF);

  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE ((verbosity<std::string>),
                                 levels.begin (), levels.end ()));
  but::framework::master_test_suite ()
    .add (BOOST_PARAM_TEST_CASE ((verbosity<boost::format>),
                                 levels.begin (), levels.end ()));

  return true;
}

#include "scanflow/test/runner.ipp"
