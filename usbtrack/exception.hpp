//  exception.hpp -- device tracking error conditions
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

#ifndef usbtrack_exception_hpp_
#define usbtrack_exception_hpp_

#include <stdexcept>
#include <string>

namespace usbtrack {

//! Device tracking error conditions
/*! Callers need to tell an identifier that was never issued from one
 *  whose device has gone away, and both of these from failures of the
 *  underlying device subsystem.  The code() tells them apart.  For an
 *  io_error, native() has the \c errno value that caused it.
 */
class system_error
  : public std::runtime_error
{
public:
  enum error_code {
    no_error = 0,

    invalid_id,                 //!< identifier was never issued
    not_connected,              //!< device is (no longer) connected
    io_error,                   //!< device subsystem I/O failure

    unknown_error               // keep this last
  };

  system_error ();
  system_error (error_code ec, const std::string& message);
  system_error (error_code ec, const char *message);

  //! Create an io_error for an \c errno value \a ec
  static system_error from_errno (int ec, const std::string& context);

  const error_code& code () const;
  int native () const;

private:
  error_code ec_;
  int        native_;
};

}       // namespace usbtrack

#endif  /* usbtrack_exception_hpp_ */
