//  log.hpp -- formatted messages based on priority and category
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

#ifndef usbtrack_log_hpp_
#define usbtrack_log_hpp_

#include <ostream>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>

namespace usbtrack {

class log
{
public:
  typedef enum {
    FATAL,                      //!<  famous last words
    ALERT,                      //!<  outside intervention required
    ERROR,                      //!<  something went wrong
    BRIEF,                      //!<  short informational notes
    TRACE,                      //!<  more chattery feedback
    DEBUG                       //!<  the gory details
  } priority;

  typedef enum {
    NOTHING = 0,
    UDEV    = 1 << 0,           //!<  device subsystem backend
    HOTPLUG = 1 << 1,           //!<  event reconciliation
    ALL     = ~0
  } category;

  //!  The priority at and above which messages may be logged
  static priority threshold;
  //!  The category specification for which messages will be logged
  static category matching;
  //!  Where messages end up, std::clog unless redirected
  static std::ostream& os_;

  static bool make_noise (priority level, int cat = ALL)
  {
    return (threshold >= level && (matching & cat));
  }

  //!  Formatted, self-outputting log messages
  /*!  Modeled after boost::format.  Arguments are fed with operator%()
   *   and the message outputs itself when it goes out of scope.  If
   *   the message's priority or category does not make any noise, no
   *   formatting work is done at all.
   *
   *   Feeding too many arguments throws boost::io::too_many_args.
   *   Missing arguments are replaced by their %N% placeholders.
   */
  class message
  {
  public:
    message ();
    message (priority level, int cat, const std::string& fmt);
    message (const message& m);
    ~message ();

    template <typename T> message& operator% (const T& t)
    {
      if (fmt_) *fmt_ % t;
      return *this;
    }

    operator std::string () const;

  private:
    message& operator= (const message&);

    boost::optional< boost::posix_time::ptime > timestamp_;
    boost::optional< boost::format >            fmt_;
    priority     level_;
    mutable bool dumped_;
  };

  //  Convenience define to cut down on copy-and-paste
#define expand_named_ctors(ctor,level)                          \
  static message                                                \
  ctor (const std::string& fmt)                                 \
  { return message (level, ALL, fmt); }                         \
  static message                                                \
  ctor (category cat, const std::string& fmt)                   \
  { return message (level, cat, fmt); }                         \
  /**/

  expand_named_ctors (fatal, FATAL);
  expand_named_ctors (alert, ALERT);
  expand_named_ctors (error, ERROR);
  expand_named_ctors (brief, BRIEF);
  expand_named_ctors (trace, TRACE);
  expand_named_ctors (debug, DEBUG);

#undef expand_named_ctors

  //!  Map a priority \a name such as "brief" to its value
  /*!  Throws std::invalid_argument for unknown names.
   */
  static priority to_priority (const std::string& name);

  static std::string to_string (priority level);
};

//! Outputs a formatted log message to a stream
std::ostream&
operator<< (std::ostream& os, const log::message& msg);

}       // namespace usbtrack

#endif  /* usbtrack_log_hpp_ */
