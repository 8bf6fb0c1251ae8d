//  udev.cpp -- OO wrapper around bits and pieces of the libudev API
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

#include <cerrno>

#include <sys/socket.h>
#include <sys/types.h>

#include <boost/throw_exception.hpp>

#include "usbtrack/exception.hpp"
#include "usbtrack/log.hpp"

#include "udev.hpp"

using usbtrack::log;
using usbtrack::system_error;

namespace udev_ {

namespace {

void
release_ctx (struct udev *ctx)
{
  udev_unref (ctx);
}

context
acquire_ctx ()
{
  errno = 0;
  struct udev *ctx = udev_new ();
  if (!ctx)
    {
      // Looking at the udev_new() implementation, it returns NULL
      // when it fails to allocate memory for a struct udev object
      // or when it cannot fopen() the udev configuration file but
      // there is *no* way we can reliably determine what exactly
      // went wrong.
      int ec = (errno ? errno : ENOMEM);
      log::error (log::UDEV, "cannot initialize libudev");
      BOOST_THROW_EXCEPTION (system_error::from_errno (ec, "udev_new"));
    }
  return context (ctx, release_ctx);
}

}       // namespace

device::device (const context& ctx, struct udev_device *dev)
  : ctx_(ctx)
  , dev_(dev)
{}

device::~device ()
{
  udev_device_unref (dev_);
}

locator
device::syspath () const
{
  return udev_device_get_syspath (dev_);
}

bool
device::has_attribute (const std::string& name) const
{
  struct udev_list_entry *entry;

  udev_list_entry_foreach
    (entry, udev_device_get_sysattr_list_entry (dev_))
    {
      if (name == udev_list_entry_get_name (entry)) return true;
    }
  return false;
}

boost::optional< std::string >
device::attribute (const std::string& name) const
{
  const char *rv = udev_device_get_sysattr_value (dev_, name.c_str ());

  if (!rv) return boost::none;
  return std::string (rv);
}

usbtrack::raw_device::ptr
device::parent () const
{
  // The parent is owned by dev_, we need a reference of our own
  struct udev_device *p = udev_device_get_parent (dev_);

  if (!p) return ptr ();
  return ptr (new device (ctx_, udev_device_ref (p)));
}

monitor::monitor (const context& ctx, const std::string& subsystem)
  : ctx_(ctx)
  , mon_(udev_monitor_new_from_netlink (ctx_.get (), "udev"))
{
  if (!mon_)
    BOOST_THROW_EXCEPTION
      (system_error::from_errno (errno ? errno : ENOMEM,
                                 "udev_monitor_new_from_netlink"));

  int rv = udev_monitor_filter_add_match_subsystem_devtype
    (mon_, subsystem.c_str (), nullptr);
  if (0 <= rv) rv = udev_monitor_enable_receiving (mon_);
  if (0 > rv)
    {
      udev_monitor_unref (mon_);
      log::error (log::UDEV, "cannot monitor %1% devices") % subsystem;
      BOOST_THROW_EXCEPTION
        (system_error::from_errno (-rv, "udev_monitor_enable_receiving"));
    }
}

monitor::~monitor ()
{
  udev_monitor_unref (mon_);
}

int
monitor::native_handle () const
{
  return udev_monitor_get_fd (mon_);
}

boost::optional< raw_event >
monitor::next_event ()
{
  struct udev_device *dev = udev_monitor_receive_device (mon_);

  if (!dev) return boost::none;

  const char *action = udev_device_get_action (dev);
  raw_event rv (raw_event::to_action (action ? action : ""),
                udev_device_get_syspath (dev));

  log::debug (log::UDEV, "got %1% event on %2%")
    % (action ? action : "unknown") % rv.where;

  udev_device_unref (dev);
  return rv;
}

bool
monitor::at_end () const
{
  char c;
  ssize_t rv = recv (native_handle (), &c, sizeof (c),
                     MSG_PEEK | MSG_DONTWAIT);

  if (0 == rv) return true;
  if (0 < rv) return false;

  if (EAGAIN == errno || EWOULDBLOCK == errno || EINTR == errno)
    return false;

  BOOST_THROW_EXCEPTION (system_error::from_errno (errno, "recv"));
}

subsystem::subsystem ()
  : ctx_(acquire_ctx ())
{}

std::vector< locator >
subsystem::enumerate (const std::string& name) const
{
  std::vector< locator > rv;

  struct udev_enumerate *it = udev_enumerate_new (ctx_.get ());
  if (!it)
    BOOST_THROW_EXCEPTION
      (system_error::from_errno (ENOMEM, "udev_enumerate_new"));

  udev_enumerate_add_match_subsystem (it, name.c_str ());

  int ec = udev_enumerate_scan_devices (it);
  if (0 > ec)
    {
      udev_enumerate_unref (it);
      log::error (log::UDEV, "cannot scan %1% devices") % name;
      BOOST_THROW_EXCEPTION
        (system_error::from_errno (-ec, "udev_enumerate_scan_devices"));
    }

  struct udev_list_entry *entry;
  udev_list_entry_foreach (entry, udev_enumerate_get_list_entry (it))
    {
      rv.push_back (udev_list_entry_get_name (entry));
    }
  udev_enumerate_unref (it);

  return rv;
}

usbtrack::monitor_socket::ptr
subsystem::open_monitor (const std::string& name) const
{
  return usbtrack::monitor_socket::ptr (new monitor (ctx_, name));
}

usbtrack::raw_device::ptr
subsystem::device_from_locator (const locator& path) const
{
  struct udev_device *dev
    = udev_device_new_from_syspath (ctx_.get (), path.c_str ());

  if (!dev)
    {
      log::debug (log::UDEV, "no device at %1%") % path;
      return usbtrack::raw_device::ptr ();
    }
  return usbtrack::raw_device::ptr (new device (ctx_, dev));
}

}       // namespace udev_

namespace usbtrack {

subsystem::ptr
subsystem::create ()
{
  return subsystem::ptr (new udev_::subsystem ());
}

}       // namespace usbtrack
