//  log.cpp -- formatted messages based on priority and category
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

#include <iostream>
#include <sstream>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "usbtrack/log.hpp"

namespace usbtrack {

log::priority log::threshold (log::ERROR);
log::category log::matching  (log::ALL);
std::ostream& log::os_ (std::clog);

namespace {

const char *names[] = {
  "fatal",
  "alert",
  "error",
  "brief",
  "trace",
  "debug",
};

const int name_count = sizeof (names) / sizeof (*names);

}       // namespace

log::message::message ()
  : level_(DEBUG), dumped_(false)
{}

log::message::message (priority level, int cat, const std::string& fmt)
  : level_(level), dumped_(false)
{
  if (make_noise (level, cat))
    {
      timestamp_ = boost::posix_time::microsec_clock::local_time ();
      fmt_ = boost::format (fmt);
      fmt_->exceptions (boost::io::all_error_bits
                        ^ boost::io::too_few_args_bit);
    }
}

//! Take over \a m's output responsibility
log::message::message (const message& m)
  : timestamp_(m.timestamp_), fmt_(m.fmt_)
  , level_(m.level_), dumped_(m.dumped_)
{
  m.dumped_ = true;
}

log::message::~message ()
{
  if (dumped_ || !fmt_) return;

  int i = fmt_->expected_args () - fmt_->remaining_args ();
  while (0 < fmt_->remaining_args ())
    {
      std::ostringstream os;
      os << "%" << ++i << "%";
      *fmt_ % os.str ();
    }
  os_ << *this;
}

log::message::operator std::string () const
{
  std::string rv;

  if (fmt_)
    {
      std::ostringstream os;
      os << *timestamp_ << " [" << to_string (level_) << "]: "
         << fmt_->str () << "\n";
      rv = os.str ();
    }
  dumped_ = true;
  return rv;
}

log::priority
log::to_priority (const std::string& name)
{
  for (int i = 0; i < name_count; ++i)
    {
      if (name == names[i]) return static_cast< priority > (i);
    }
  BOOST_THROW_EXCEPTION
    (std::invalid_argument ("unknown log priority: " + name));
}

std::string
log::to_string (priority level)
{
  if (0 <= level && level < name_count) return names[level];
  return "?";
}

std::ostream&
operator<< (std::ostream& os, const log::message& msg)
{
  os << std::string (msg);
  return os;
}

}       // namespace usbtrack
