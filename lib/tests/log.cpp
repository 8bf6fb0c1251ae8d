//  log.cpp -- unit tests for the log API implementation
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

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/test/unit_test.hpp>

#include "usbtrack/log.hpp"

using namespace usbtrack;

struct fixture
{
  std::ostringstream s;
  std::streambuf *buf;
  log::priority  threshold;
  log::category  matching;

  //!  Ensure something gets logged
  fixture ()
    : threshold (log::threshold)
    , matching (log::matching)
  {
    log::threshold = log::BRIEF;
    log::matching  = log::ALL;

    buf = log::os_.rdbuf (s.rdbuf ());
  }
  ~fixture ()
  {
    log::os_.rdbuf (buf);
    log::threshold = threshold;
    log::matching  = matching;
  }
};

BOOST_FIXTURE_TEST_CASE (format_overflow, fixture)
{
  BOOST_CHECK_THROW (log::message (log::FATAL, log::ALL, "%1%") % 1 % 2,
                     boost::io::too_many_args);
}

BOOST_FIXTURE_TEST_CASE (format_underflow, fixture)
{
  { log::alert ("%1% and %2%") % "this"; }

  BOOST_CHECK_NE (std::string::npos, s.str ().find ("this and %2%"));
}

BOOST_FIXTURE_TEST_CASE (noisy_message, fixture)
{
  { log::brief ("%1% was plugged in") % "1d6b:0002"; }

  BOOST_CHECK_NE (std::string::npos,
                  s.str ().find ("[brief]: 1d6b:0002 was plugged in\n"));
}

BOOST_FIXTURE_TEST_CASE (quiet_message, fixture)
{
  { log::trace ("%1%") % 1; }

  BOOST_CHECK (s.str ().empty ());
}

BOOST_FIXTURE_TEST_CASE (quiet_overflow_does_not_throw, fixture)
{
  BOOST_REQUIRE (log::threshold < log::DEBUG);

  BOOST_CHECK_NO_THROW (log::debug ("%1%") % 1 % 2);
}

BOOST_FIXTURE_TEST_CASE (category_matching, fixture)
{
  log::matching = log::UDEV;

  { log::brief (log::HOTPLUG, "hotplug"); }
  BOOST_CHECK (s.str ().empty ());

  { log::brief (log::UDEV, "udev"); }
  BOOST_CHECK_NE (std::string::npos, s.str ().find ("udev"));
}

BOOST_FIXTURE_TEST_CASE (streamed_message_outputs_once, fixture)
{
  std::ostringstream os;

  {
    log::message msg (log::ERROR, log::ALL, "once");
    os << msg;
  }

  BOOST_CHECK_NE (std::string::npos, os.str ().find ("once"));
  BOOST_CHECK (s.str ().empty ());
}

BOOST_AUTO_TEST_CASE (priority_names)
{
  BOOST_CHECK_EQUAL (log::FATAL, log::to_priority ("fatal"));
  BOOST_CHECK_EQUAL (log::BRIEF, log::to_priority ("brief"));
  BOOST_CHECK_EQUAL (log::DEBUG, log::to_priority ("debug"));
  BOOST_CHECK_EQUAL ("trace", log::to_string (log::TRACE));

  BOOST_CHECK_THROW (log::to_priority ("chatty"), std::invalid_argument);
}

#include "usbtrack/test/runner.ipp"
