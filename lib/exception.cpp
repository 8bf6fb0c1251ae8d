//  exception.cpp -- device tracking error conditions
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

#include <cstring>

#include "usbtrack/exception.hpp"

using std::string;

namespace usbtrack {

system_error::system_error ()
  : std::runtime_error ("")
  , ec_(no_error)
  , native_(0)
{}

system_error::system_error (error_code ec, const string& message)
  : std::runtime_error (message)
  , ec_(ec)
  , native_(0)
{}

system_error::system_error (error_code ec, const char *message)
  : std::runtime_error (message)
  , ec_(ec)
  , native_(0)
{}

system_error
system_error::from_errno (int ec, const string& context)
{
  system_error rv (io_error, context + ": " + strerror (ec));
  rv.native_ = ec;
  return rv;
}

const system_error::error_code&
system_error::code () const
{
  return ec_;
}

int
system_error::native () const
{
  return native_;
}

}       // namespace usbtrack
