//  reactor.cpp -- readiness notification for event sources
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
#include <stdexcept>

#include <fcntl.h>
#include <sys/select.h>

#include <boost/throw_exception.hpp>

#include "usbtrack/exception.hpp"
#include "usbtrack/reactor.hpp"

namespace usbtrack {

namespace {

//! Check the descriptors in \a r_fds for readability, updating it in place
/*! A null \a timeout blocks.  Returns the number of readable
 *  descriptors, zero if pselect() was interrupted by a signal.
 */
int
select_readable (fd_set& r_fds, int fd_max, const struct timespec *timeout)
{
  int fds = pselect (fd_max + 1, &r_fds, nullptr, nullptr,
                     timeout, nullptr);

  if (-1 == fds && EINTR == errno)
    return 0;
  if (-1 == fds)
    BOOST_THROW_EXCEPTION (system_error::from_errno (errno, "pselect"));

  return fds;
}

}       // namespace

reactor::~reactor ()
{}

void
select_reactor::arm (int fd)
{
  if (0 > fd || FD_SETSIZE <= fd || -1 == fcntl (fd, F_GETFD))
    BOOST_THROW_EXCEPTION (system_error::from_errno (EBADF, "arm"));

  fds_.insert (fd);
}

void
select_reactor::disarm (int fd)
{
  fds_.erase (fd);
}

bool
select_reactor::is_readable (int fd)
{
  if (!fds_.count (fd))
    BOOST_THROW_EXCEPTION
      (std::logic_error ("file descriptor is not armed"));

  fd_set r_fds;
  FD_ZERO (&r_fds);
  FD_SET (fd, &r_fds);

  struct timespec nonblocking = { 0, 0 };
  return (0 < select_readable (r_fds, fd, &nonblocking)
          && FD_ISSET (fd, &r_fds));
}

bool
select_reactor::wait (int timeout_ms)
{
  int fd_max = -1;
  fd_set r_fds;

  FD_ZERO (&r_fds);
  for (std::set< int >::const_iterator it = fds_.begin ();
       fds_.end () != it; ++it)
    {
      FD_SET (*it, &r_fds);
      if (fd_max < *it) fd_max = *it;
    }

  if (0 > timeout_ms)
    return 0 < select_readable (r_fds, fd_max, nullptr);

  struct timespec timeout = { timeout_ms / 1000,
                              (timeout_ms % 1000) * 1000000L };
  return 0 < select_readable (r_fds, fd_max, &timeout);
}

}       // namespace usbtrack
