//  run-time.hpp -- information about the current program invocation
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

#ifndef usbtrack_run_time_hpp_
#define usbtrack_run_time_hpp_

#include <map>
#include <string>
#include <vector>

#include <boost/program_options/variables_map.hpp>

namespace usbtrack {

//! Singleton for access to a program's run-time information
/*! The run_time singleton provides access to
 *
 *  - command-line arguments, including the program name
 *  - values of program specific environment variables
 *
 *  and takes care of the options every command understands.  At the
 *  moment that is \c --help, \c --version and \c --log-level.  The
 *  latter may also be set with the \c USBTRACK_LOG_LEVEL environment
 *  variable.  The command-line takes precedence.
 */
class run_time
{
public:
  //! An implementation dependent forward iterable container
  typedef std::vector< std::string > sequence_type;
  typedef boost::program_options::variable_value value_type;
  typedef std::map< std::string, value_type >::size_type size_type;

  //! Initialise program run-time environmental information
  /*! A program's \c main() should create a run_time instance using
   *  this constructor, passing all the command-line arguments that
   *  are available.  The constructor will \e not modify any of the
   *  information passed and silently ignore anything it does not
   *  recognise.
   *
   *  This constructor can only be used once.  Any additional use will
   *  throw a std::logic_error exception.  Use the default run_time()
   *  constructor instead.
   */
  run_time (int argc, const char *const argv[]);

  //! Get access to run-time environmental information
  /*! Use of this constructor before an initialising multi-argument
   *  constructor will result in a std::logic_error exception.
   */
  run_time ();

  //! Retrieve the canonical program name
  std::string
  program () const;

  //! Obtain the command used in the command-line invocation
  /*! If no command was entered on the command-line, an empty string
   *  will be returned.
   */
  std::string
  command () const;

  //! Unprocessed command-line arguments
  const sequence_type&
  arguments () const;

  //! Number of times an \a option was encountered
  size_type
  count (const std::string& option) const;

  const value_type&
  operator[] (const std::string& option) const;

  std::string
  help (const std::string& summary = std::string ()) const;

  std::string
  version (const std::string& legalese   = std::string (),
           const std::string& disclaimer = std::string ()) const;

  class impl;
};

} // namespace usbtrack

#endif /* usbtrack_run_time_hpp_ */
