//  context.cpp -- stable view of the USB devices on a host
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

#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "usbtrack/attribute.hpp"
#include "usbtrack/exception.hpp"
#include "usbtrack/hotplug-monitor.hpp"
#include "usbtrack/log.hpp"

#include "context.ipp"

namespace usbtrack {

const std::string context::impl::subsystem_name ("usb");

context::impl::impl (subsystem::ptr backend)
  : backend_(backend)
{
  if (!backend_)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("no device subsystem given"));
}

void
context::impl::scan ()
{
  std::vector< locator > paths (backend_->enumerate (subsystem_name));
  std::vector< locator >::const_iterator it;

  for (it = paths.begin (); paths.end () != it; ++it)
    {
      add_device (*it);
    }
}

boost::optional< device_id >
context::impl::add_device (const locator& where)
{
  raw_device::ptr dev (backend_->device_from_locator (where));

  if (!dev)
    {
      log::debug (log::HOTPLUG, "cannot open %1%") % where;
      return boost::none;
    }
  if (!dev->has_attribute ("idVendor"))
    {
      log::debug (log::HOTPLUG, "not a USB device: %1%") % where;
      return boost::none;
    }

  device_id id (registry_.append (where,
                                  resolve_hex16 (dev, "idVendor"),
                                  resolve_hex16 (dev, "idProduct")));

  log::trace (log::HOTPLUG, "registered %1% as %2%") % where % id;

  return id;
}

boost::optional< device_id >
context::impl::remove_device_by_locator (const locator& where)
{
  boost::optional< device_id > id (registry_.tombstone (where));

  if (id)
    log::trace (log::HOTPLUG, "%1% at %2% is gone") % *id % where;

  return id;
}

boost::optional< device_id >
context::impl::resolve_locator (const locator& where) const
{
  return registry_.find (where);
}

std::string
context::impl::lookup_string (const device_id& id, const std::string& name)
{
  const locator& where (registry_.where (id));

  raw_device::ptr dev (backend_->device_from_locator (where));
  boost::optional< std::string > rv;

  if (dev) rv = resolve_string (dev, name);
  if (!rv)
    {
      log::brief (log::HOTPLUG, "no %1% for %2% at %3%, dropping it")
        % name % id % where;

      registry_.tombstone (id);
      BOOST_THROW_EXCEPTION
        (system_error (system_error::not_connected,
                       "the specified device is not connected"));
    }
  return *rv;
}

context::context ()
  : pimpl_(make_shared< impl > (subsystem::create ()))
{
  pimpl_->scan ();
}

context::context (subsystem::ptr backend)
  : pimpl_(make_shared< impl > (backend))
{
  pimpl_->scan ();
}

shared_ptr< hotplug_monitor >
context::monitor (reactor::ptr r) const
{
  if (!r) r = make_shared< select_reactor > ();

  monitor_socket::ptr sock
    (pimpl_->backend_->open_monitor (impl::subsystem_name));

  return shared_ptr< hotplug_monitor >
    (new hotplug_monitor (pimpl_, sock, r));
}

bool
context::is_connected (const device_id& id) const
{
  return pimpl_->registry_.is_connected (id);
}

boost::optional< uint16_t >
context::vendor_id (const device_id& id) const
{
  if (!pimpl_->registry_.is_valid (id)) return boost::none;

  return pimpl_->registry_.at (id).vendor_id;
}

boost::optional< uint16_t >
context::product_id (const device_id& id) const
{
  if (!pimpl_->registry_.is_valid (id)) return boost::none;

  return pimpl_->registry_.at (id).product_id;
}

std::string
context::manufacturer_string (const device_id& id) const
{
  return pimpl_->lookup_string (id, "manufacturer");
}

std::string
context::product_string (const device_id& id) const
{
  return pimpl_->lookup_string (id, "product");
}

std::vector< device_id >
context::devices () const
{
  return pimpl_->registry_.ids ();
}

std::vector< device_id >
context::connected_devices () const
{
  std::vector< device_id > all (devices ());
  std::vector< device_id > rv;
  std::vector< device_id >::const_iterator it;

  for (it = all.begin (); all.end () != it; ++it)
    {
      if (is_connected (*it)) rv.push_back (*it);
    }
  return rv;
}

}       // namespace usbtrack
