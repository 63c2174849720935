//  test/runner.ipp -- test runner main() implementation
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

#ifndef scanflow_test_runner_ipp_
#define scanflow_test_runner_ipp_

/*! \file
 *  Boost.Test can generate a test runner's \c ::main function but
 *  scanflow's test harness wants module and suite names that match
 *  the source tree layout.  This file implements a custom version.
 *
 *  Include this file at the \e end of each test runner implementation
 *  and define \c SCANFLOW_TEST_MODULE and \c SCANFLOW_TEST_SUITE on
 *  the compiler's command-line.  The build files take care of that.
 */

#include <boost/test/unit_test.hpp>

#include <string>

// This is defined in <boost/test/parameterized_test.hpp>.  When that
// file is included before this one, users need to implement their own
// init_test_runner().

#ifndef BOOST_PARAM_TEST_CASE
bool
init_test_runner ()
{
  return true;
}
#endif  /* BOOST_PARAM_TEST_CASE */

//! Run a test runner
/*! This \c ::main "template" deals with module name initialization
 *  and calls an init_test_runner().  When parameterized test suites
 *  are used init_test_runner() needs to be provided by the user but
 *  a no-op stub will be provided otherwise.
 */
int
main (int argc, char *argv[])
{
  namespace but = boost::unit_test;

  std::string test_module = SCANFLOW_TEST_MODULE;
  test_module += "::";
  test_module += SCANFLOW_TEST_SUITE;

  but::framework::master_test_suite ().p_name.value = test_module;

  return but::unit_test_main (init_test_runner, argc, argv);
}

#endif /* scanflow_test_runner_ipp_ */
