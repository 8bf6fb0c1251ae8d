//  subsystem.hpp -- raw device subsystem client interface
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

#ifndef usbtrack_subsystem_hpp_
#define usbtrack_subsystem_hpp_

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "memory.hpp"

namespace usbtrack {

//! OS specific path identifying a device node, a sysfs path on Linux
typedef std::string locator;

//! A device node as reported by the device subsystem
class raw_device
{
public:
  typedef shared_ptr< raw_device > ptr;

  virtual ~raw_device ();

  virtual locator syspath () const = 0;

  //! Whether the node itself advertises an attribute called \a name
  virtual bool has_attribute (const std::string& name) const = 0;

  //! The node's own value for attribute \a name
  /*! Returns nothing if the node does not have the attribute or its
   *  value cannot be read.  Parent nodes are never consulted.
   */
  virtual boost::optional< std::string >
  attribute (const std::string& name) const = 0;

  //! The next node up the device tree, null at the root
  virtual ptr parent () const = 0;
};

//! A notification as it comes off the monitor socket
struct raw_event
{
  enum action_type {
    add,
    remove,
    change,
    unknown,
  };

  raw_event (action_type action, const locator& where);

  //! Map the subsystem's action \a name onto an action_type
  static action_type to_action (const std::string& name);

  action_type action;
  locator     where;
};

//! Live feed of raw device events
class monitor_socket
{
public:
  typedef shared_ptr< monitor_socket > ptr;

  virtual ~monitor_socket ();

  //! File descriptor that becomes readable when events are pending
  virtual int native_handle () const = 0;

  //! Read a single event, if any is available
  /*! Never blocks.  Returns nothing when no complete event could be
   *  read.
   */
  virtual boost::optional< raw_event > next_event () = 0;

  //! Whether the feed has been closed by the other end
  virtual bool at_end () const = 0;
};

//! Client of the OS device subsystem
/*! This is the only part of the package that talks to the OS about
 *  devices.  The default implementation, returned by create(), is
 *  backed by libudev.
 */
class subsystem
{
public:
  typedef shared_ptr< subsystem > ptr;

  //! Connect to the OS device subsystem
  /*! Throws a system_error with an io_error code if that fails.
   */
  static ptr create ();

  virtual ~subsystem ();

  //! Locators of all devices currently present in subsystem \a name
  virtual std::vector< locator >
  enumerate (const std::string& name) const = 0;

  //! Start listening for events of devices in subsystem \a name
  virtual monitor_socket::ptr
  open_monitor (const std::string& name) const = 0;

  //! Obtain the device at \a path, null if there is no such device
  virtual raw_device::ptr
  device_from_locator (const locator& path) const = 0;
};

}       // namespace usbtrack

#endif  /* usbtrack_subsystem_hpp_ */
