//  runner.ipp -- test runner main() implementation
//  Copyright (C) 2026  usbtrack developers
//
//  License: GPL-3.0+
//
//  This file is part of the 'usbtrack' package.
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

#ifndef usbtrack_test_runner_ipp_
#define usbtrack_test_runner_ipp_

/*! \file
 *  Boost.Test provides a mechanism to have a test runner's \c ::main
 *  function generated automatically.  Our test runners, however, want
 *  their master test suite named after the module and suite they test
 *  so, this file implements a custom version.
 *
 *  Include this file at the \e end of each test runner implementation
 *  and define \c USBTRACK_TEST_MODULE and \c USBTRACK_TEST_SUITE on the
 *  compiler's command-line when doing so.  The build system takes care
 *  of that.
 */

#include <string>

#include <boost/test/unit_test.hpp>

bool
init_test_runner ()
{
  return true;
}

//! Run a test runner
/*! This \c ::main "template" deals with module name initialization
 *  and hands the registered test cases to Boost.Test.
 */
int
main (int argc, char *argv[])
{
  namespace but = boost::unit_test;

  std::string test_module = USBTRACK_TEST_MODULE;
  test_module += "::";
  test_module += USBTRACK_TEST_SUITE;

  but::framework::master_test_suite ().p_name.value = test_module;

  return but::unit_test_main (init_test_runner, argc, argv);
}

#endif /* usbtrack_test_runner_ipp_ */
