//  hotplug-monitor.cpp -- reconcile device events with identifiers
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

#include "usbtrack/exception.hpp"
#include "usbtrack/hotplug-monitor.hpp"
#include "usbtrack/log.hpp"

#include "context.ipp"

namespace usbtrack {

poll_result::poll_result (state_type state)
  : state_(state)
{}

poll_result
poll_result::none ()
{
  return poll_result (pending);
}

poll_result
poll_result::value (const event& ev)
{
  poll_result rv (item);
  rv.event_ = ev;
  return rv;
}

poll_result
poll_result::finished ()
{
  return poll_result (end);
}

poll_result::state_type
poll_result::state () const
{
  return state_;
}

bool
poll_result::is_pending () const
{
  return pending == state_;
}

bool
poll_result::is_item () const
{
  return item == state_;
}

bool
poll_result::is_end () const
{
  return end == state_;
}

const event&
poll_result::get () const
{
  if (!event_)
    BOOST_THROW_EXCEPTION
      (std::logic_error ("poll result does not hold an event"));

  return *event_;
}

hotplug_monitor::hotplug_monitor (weak_ptr< context::impl > ctx,
                                  monitor_socket::ptr socket,
                                  reactor::ptr r)
  : ctx_(ctx)
  , socket_(socket)
  , reactor_(r)
  , closed_(false)
{}

hotplug_monitor::~hotplug_monitor ()
{
  reactor_->disarm (socket_->native_handle ());
}

poll_result
hotplug_monitor::poll ()
{
  if (closed_) return poll_result::finished ();

  shared_ptr< context::impl > ctx (ctx_.lock ());
  if (!ctx)
    BOOST_THROW_EXCEPTION
      (std::logic_error ("hotplug monitor outlived its context"));

  try
    {
      return poll_(ctx);
    }
  catch (const system_error& e)
    {
      log::error (log::HOTPLUG, "hotplug monitor failed: %1%") % e.what ();
      closed_ = true;
      throw;
    }
}

bool
hotplug_monitor::wait (int timeout_ms)
{
  if (closed_) return true;

  reactor_->arm (socket_->native_handle ());
  return reactor_->wait (timeout_ms);
}

poll_result
hotplug_monitor::poll_(const shared_ptr< context::impl >& ctx)
{
  const int fd = socket_->native_handle ();

  while (true)
    {
      reactor_->arm (fd);
      if (!reactor_->is_readable (fd)) return poll_result::none ();

      boost::optional< raw_event > raw (socket_->next_event ());
      if (!raw)
        {
          if (!socket_->at_end ()) return poll_result::none ();

          log::brief (log::HOTPLUG, "device event feed has ended");
          closed_ = true;
          return poll_result::finished ();
        }

      disposition what = suppress;
      boost::optional< device_id > id;

      switch (raw->action)
        {
        case raw_event::add:
          id = ctx->add_device (raw->where);
          what = (id ? yield_add : suppress);
          break;
        case raw_event::remove:
          id = ctx->remove_device_by_locator (raw->where);
          what = (id ? yield_remove : suppress);
          break;
        case raw_event::change:
        case raw_event::unknown:
          what = suppress;
          break;
        }

      switch (what)
        {
        case yield_add:
          return poll_result::value (event (event::add, *id));
        case yield_remove:
          return poll_result::value (event (event::remove, *id));
        case suppress:
          log::debug (log::HOTPLUG, "ignoring event on %1%") % raw->where;
          break;
        }
    }
}

}       // namespace usbtrack
