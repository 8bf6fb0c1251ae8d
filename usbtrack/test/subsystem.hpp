//  subsystem.hpp -- in-memory device subsystem for testing purposes
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

#ifndef usbtrack_test_subsystem_hpp_
#define usbtrack_test_subsystem_hpp_

#include <cerrno>
#include <deque>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <boost/optional.hpp>
#include <boost/throw_exception.hpp>

#include "usbtrack/exception.hpp"
#include "usbtrack/memory.hpp"
#include "usbtrack/reactor.hpp"
#include "usbtrack/subsystem.hpp"

namespace usbtrack {
namespace test {

//! Device node with a fixed set of attributes
class fake_device
  : public raw_device
{
public:
  typedef shared_ptr< fake_device > ptr;

  fake_device (const locator& path, ptr parent = ptr ())
    : path_(path), parent_(parent)
  {}

  locator syspath () const { return path_; }

  bool has_attribute (const std::string& name) const
  {
    return attrs_.count (name) || unreadable_.count (name);
  }

  boost::optional< std::string >
  attribute (const std::string& name) const
  {
    std::map< std::string, std::string >::const_iterator it
      = attrs_.find (name);

    if (attrs_.end () == it) return boost::none;
    return it->second;
  }

  raw_device::ptr parent () const { return parent_; }

  fake_device& set (const std::string& name, const std::string& value)
  {
    attrs_[name] = value;
    return *this;
  }

  //! Advertise attribute \a name without a readable value
  fake_device& set_unreadable (const std::string& name)
  {
    attrs_.erase (name);
    unreadable_.insert (name);
    return *this;
  }

private:
  locator path_;
  ptr     parent_;
  std::map< std::string, std::string > attrs_;
  std::set< std::string > unreadable_;
};

//! Event feed backed by a pipe
/*! Every queued event puts a byte in the pipe so the read end becomes
 *  readable just like a real monitor socket would.
 */
class fake_monitor_socket
  : public monitor_socket
{
public:
  typedef shared_ptr< fake_monitor_socket > ptr;

  fake_monitor_socket ()
    : closed_(false)
  {
    if (0 != pipe (fds_))
      BOOST_THROW_EXCEPTION (system_error::from_errno (errno, "pipe"));

    fcntl (fds_[0], F_SETFL, O_NONBLOCK);
  }

  ~fake_monitor_socket ()
  {
    ::close (fds_[0]);
    ::close (fds_[1]);
  }

  int native_handle () const { return fds_[0]; }

  boost::optional< raw_event > next_event ()
  {
    char c;
    if (1 != ::read (fds_[0], &c, 1)) return boost::none;
    if (events_.empty ()) return boost::none;

    raw_event ev (events_.front ());
    events_.pop_front ();
    return ev;
  }

  bool at_end () const { return closed_ && events_.empty (); }

  void push (raw_event::action_type action, const locator& where)
  {
    events_.push_back (raw_event (action, where));
    notify_();
  }

  //! Wake up the reader without queueing an event
  void spurious_wakeup () { notify_(); }

  //! End the feed
  void close ()
  {
    closed_ = true;
    notify_();
  }

private:
  void notify_()
  {
    char c = 0;
    if (1 != ::write (fds_[1], &c, 1))
      BOOST_THROW_EXCEPTION (system_error::from_errno (errno, "write"));
  }

  int  fds_[2];
  bool closed_;
  std::deque< raw_event > events_;
};

//! Device tree and event feed kept in memory
class fake_subsystem
  : public subsystem
{
public:
  typedef shared_ptr< fake_subsystem > ptr;

  //! Add a node to the tree, listing it when enumerating if \a listed
  fake_device::ptr
  add (const locator& path, fake_device::ptr parent = fake_device::ptr (),
       bool listed = true)
  {
    fake_device::ptr dev (make_shared< fake_device > (path, parent));

    devices_[path] = dev;
    if (listed) listed_.push_back (path);
    return dev;
  }

  //! Take a node out of the tree
  void unplug (const locator& path)
  {
    devices_.erase (path);
  }

  std::vector< locator >
  enumerate (const std::string& name) const
  {
    enumerated_ = name;
    return listed_;
  }

  monitor_socket::ptr
  open_monitor (const std::string& name) const
  {
    monitored_ = name;
    socket_ = make_shared< fake_monitor_socket > ();
    return socket_;
  }

  raw_device::ptr
  device_from_locator (const locator& path) const
  {
    std::map< locator, fake_device::ptr >::const_iterator it
      = devices_.find (path);

    if (devices_.end () == it) return raw_device::ptr ();
    return it->second;
  }

  //! The feed handed out by the last open_monitor() call
  fake_monitor_socket::ptr socket () const { return socket_; }

  mutable std::string enumerated_;
  mutable std::string monitored_;

private:
  std::map< locator, fake_device::ptr > devices_;
  std::vector< locator > listed_;
  mutable fake_monitor_socket::ptr socket_;
};

//! Reactor whose every operation fails
class failing_reactor
  : public reactor
{
public:
  failing_reactor (int ec = EBADF) : ec_(ec) {}

  void arm (int)
  {
    BOOST_THROW_EXCEPTION (system_error::from_errno (ec_, "arm"));
  }
  void disarm (int) {}
  bool is_readable (int)
  {
    BOOST_THROW_EXCEPTION (system_error::from_errno (ec_, "is_readable"));
  }
  bool wait (int)
  {
    BOOST_THROW_EXCEPTION (system_error::from_errno (ec_, "wait"));
  }

private:
  int ec_;
};

} // namespace test
} // namespace usbtrack

#endif /* usbtrack_test_subsystem_hpp_ */
