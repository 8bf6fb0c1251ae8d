//  context.hpp -- stable view of the USB devices on a host
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

#ifndef usbtrack_context_hpp_
#define usbtrack_context_hpp_

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "cstdint.hpp"
#include "device-id.hpp"
#include "memory.hpp"
#include "reactor.hpp"
#include "subsystem.hpp"

namespace usbtrack {

class hotplug_monitor;

//! Identifier based view of the USB devices seen by the process
/*! A context scans the \c usb subsystem once, when it is created, and
 *  issues an identifier for every USB device found.  Identifiers for
 *  devices plugged in later are issued by a hotplug_monitor created
 *  with monitor().  Identifiers stay valid for the lifetime of the
 *  context, also after their device has been unplugged.
 *
 *  Vendor and product IDs are remembered when a device is first seen
 *  and can be queried after the device is gone.  Manufacturer and
 *  product strings are read from the device each time they are asked
 *  for.  When that fails, the device is considered gone.
 *
 *  Contexts are cheap to copy.  Copies share their state.  Even the
 *  \c const member functions may update that state.  A context and
 *  its monitors must therefore be used from a single thread.
 */
class context
{
public:
  class impl;

  //! Scan the USB devices known to udev
  /*! Throws a system_error with an io_error code if udev cannot be
   *  used.
   */
  context ();

  //! Scan the USB devices known to the \a backend
  explicit context (subsystem::ptr backend);

  //! Start tracking hotplug events
  /*! The monitor waits for events with the help of a reactor.  If no
   *  reactor \a r is given, a select_reactor is used.
   */
  shared_ptr< hotplug_monitor >
  monitor (reactor::ptr r = reactor::ptr ()) const;

  bool is_connected (const device_id& id) const;

  //! Vendor ID as seen when the device was added, if known
  boost::optional< uint16_t > vendor_id (const device_id& id) const;
  //! Product ID as seen when the device was added, if known
  boost::optional< uint16_t > product_id (const device_id& id) const;

  //! Read the device's manufacturer string
  /*! Throws a system_error with an invalid_id code for identifiers
   *  that were never issued and one with a not_connected code if the
   *  device is gone.
   */
  std::string manufacturer_string (const device_id& id) const;
  //! Read the device's product string
  /*! Fails the same way as manufacturer_string().
   */
  std::string product_string (const device_id& id) const;

  //! All identifiers issued so far, in issuance order
  std::vector< device_id > devices () const;
  //! Identifiers of the devices that are still connected
  std::vector< device_id > connected_devices () const;

private:
  shared_ptr< impl > pimpl_;
};

}       // namespace usbtrack

#endif  /* usbtrack_context_hpp_ */
