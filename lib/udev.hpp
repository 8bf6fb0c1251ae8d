//  udev.hpp -- OO wrapper around bits and pieces of the libudev API
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

#ifndef usbtrack_udev_hpp_
#define usbtrack_udev_hpp_

extern "C" {                    // needed until libudev-150
#include <libudev.h>
}

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "usbtrack/memory.hpp"
#include "usbtrack/subsystem.hpp"

namespace udev_ {

using usbtrack::locator;
using usbtrack::raw_event;
using usbtrack::shared_ptr;

//! Handle to udev config file content, needed by all udev API calls
typedef shared_ptr< struct udev > context;

class device
  : public usbtrack::raw_device
{
public:
  //! Take ownership of a reference to \a dev
  device (const context& ctx, struct udev_device *dev);
  ~device ();

  locator syspath () const;
  bool has_attribute (const std::string& name) const;
  boost::optional< std::string > attribute (const std::string& name) const;
  ptr parent () const;

private:
  context ctx_;
  struct udev_device *dev_;
};

class monitor
  : public usbtrack::monitor_socket
{
public:
  monitor (const context& ctx, const std::string& subsystem);
  ~monitor ();

  int native_handle () const;
  boost::optional< raw_event > next_event ();
  bool at_end () const;

private:
  context ctx_;
  struct udev_monitor *mon_;
};

class subsystem
  : public usbtrack::subsystem
{
public:
  subsystem ();

  std::vector< locator > enumerate (const std::string& name) const;
  usbtrack::monitor_socket::ptr open_monitor (const std::string& name) const;
  usbtrack::raw_device::ptr device_from_locator (const locator& path) const;

private:
  context ctx_;
};

}       // namespace udev_

#endif  /* usbtrack_udev_hpp_ */
