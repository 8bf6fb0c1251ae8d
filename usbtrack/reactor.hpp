//  reactor.hpp -- readiness notification for event sources
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

#ifndef usbtrack_reactor_hpp_
#define usbtrack_reactor_hpp_

#include <set>

#include "memory.hpp"

namespace usbtrack {

//! Tells when file descriptors have data to read
/*! A hotplug monitor registers its socket with a reactor and asks it
 *  whether anything is waiting before it tries to read.  Applications
 *  that run their own event loop can supply a reactor of their own.
 */
class reactor
{
public:
  typedef shared_ptr< reactor > ptr;

  virtual ~reactor ();

  //! Start watching \a fd
  /*! Arming an already armed descriptor has no effect.  Throws a
   *  system_error with an io_error code if \a fd cannot be watched.
   */
  virtual void arm (int fd) = 0;

  //! Stop watching \a fd
  virtual void disarm (int fd) = 0;

  //! Whether an armed \a fd can be read without blocking
  /*! Never blocks.  Throws std::logic_error if \a fd is not armed.
   */
  virtual bool is_readable (int fd) = 0;

  //! Block until an armed descriptor becomes readable
  /*! Waits at most \a timeout_ms milliseconds, indefinitely if it is
   *  negative.  Returns whether a descriptor became readable.
   */
  virtual bool wait (int timeout_ms = -1) = 0;
};

//! Reactor based on pselect(2)
class select_reactor
  : public reactor
{
public:
  void arm (int fd);
  void disarm (int fd);
  bool is_readable (int fd);
  bool wait (int timeout_ms = -1);

private:
  std::set< int > fds_;
};

}       // namespace usbtrack

#endif  /* usbtrack_reactor_hpp_ */
