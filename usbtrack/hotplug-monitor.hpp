//  hotplug-monitor.hpp -- reconcile device events with identifiers
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

#ifndef usbtrack_hotplug_monitor_hpp_
#define usbtrack_hotplug_monitor_hpp_

#include <boost/optional.hpp>

#include "context.hpp"
#include "event.hpp"
#include "memory.hpp"
#include "reactor.hpp"
#include "subsystem.hpp"

namespace usbtrack {

//! Outcome of a single hotplug_monitor::poll()
class poll_result
{
public:
  enum state_type {
    pending,                    //!< no event yet, wait and try again
    item,                       //!< an event is available
    end,                        //!< no more events will ever come
  };

  static poll_result none ();
  static poll_result value (const event& ev);
  static poll_result finished ();

  state_type state () const;

  bool is_pending () const;
  bool is_item () const;
  bool is_end () const;

  //! The event of an item result
  /*! Throws std::logic_error for any other result.
   */
  const event& get () const;

private:
  explicit poll_result (state_type state);

  state_type state_;
  boost::optional< event > event_;
};

//! Turns raw device notifications into add and remove events
/*! Each poll() takes at most one raw notification off the device
 *  subsystem's feed and matches it against the context's devices.
 *  Plugging in a USB device yields an add event with a freshly issued
 *  identifier.  Unplugging a known device yields a remove event with
 *  the identifier it had all along.  Everything else is dropped and
 *  polling carries on with the next notification.
 *
 *  A monitor refers to its context without keeping it alive.  Polling
 *  after the context is gone is a programming error.
 */
class hotplug_monitor
{
public:
  typedef shared_ptr< hotplug_monitor > ptr;

  ~hotplug_monitor ();

  //! Get the next event, if one is available
  /*! Never blocks.  Throws a system_error with an io_error code when
   *  the feed fails.  The monitor is finished after that and every
   *  subsequent poll() reports the end.
   */
  poll_result poll ();

  //! Block until the feed may have something for poll()
  /*! See reactor::wait() for the meaning of \a timeout_ms.
   */
  bool wait (int timeout_ms = -1);

private:
  friend class context;

  enum disposition {
    yield_add,
    yield_remove,
    suppress,
  };

  hotplug_monitor (weak_ptr< context::impl > ctx,
                   monitor_socket::ptr socket, reactor::ptr r);

  hotplug_monitor (const hotplug_monitor&);
  hotplug_monitor& operator= (const hotplug_monitor&);

  poll_result poll_(const shared_ptr< context::impl >& ctx);

  weak_ptr< context::impl > ctx_;
  monitor_socket::ptr socket_;
  reactor::ptr        reactor_;
  bool closed_;
};

}       // namespace usbtrack

#endif  /* usbtrack_hotplug_monitor_hpp_ */
