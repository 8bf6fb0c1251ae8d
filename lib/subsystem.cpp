//  subsystem.cpp -- raw device subsystem client interface
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

#include "usbtrack/subsystem.hpp"

namespace usbtrack {

raw_device::~raw_device ()
{}

raw_event::raw_event (action_type action, const locator& where)
  : action (action), where (where)
{}

raw_event::action_type
raw_event::to_action (const std::string& name)
{
  if ("add"    == name) return add;
  if ("remove" == name) return remove;
  if ("change" == name) return change;

  return unknown;
}

monitor_socket::~monitor_socket ()
{}

subsystem::~subsystem ()
{}

}       // namespace usbtrack
