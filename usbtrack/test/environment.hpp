//  environment.hpp -- sanitize environment variables for testing
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

#ifndef usbtrack_test_environment_hpp_
#define usbtrack_test_environment_hpp_

#include <cstdlib>

#include <map>
#include <set>
#include <string>
#include <vector>

extern "C" {
extern char **environ;
}

namespace usbtrack {
namespace test {

//! Sanitize environment variables for testing purposes
/*! When running tests one needs to be able to control the state of
 *  their execution environment.  There is little point in testing
 *  those parts of the software that depend on the value of package
 *  specific environment variables if there is no way to define a
 *  clean slate.  This fixture does precisely that.  Moreover, the
 *  fixture even restores the environment's state to what it was at
 *  the point the fixture was instantiated.
 *
 *  The fixture's API purposely mimicks the POSIX C APIs to get and
 *  set environment variables but is defined in terms of standard \c
 *  string objects.
 */
class environment
{
public:
  //! Create a "clean" environment
  /*! All package specific environment variable will be removed.
   */
  environment ()
  {
    clearenv_(PACKAGE_ENV_VAR_PREFIX);
  }

  //! Restore the original environment
  ~environment ()
  {
    env_var_set::const_iterator it;
    for (it = vars_set_.begin (); vars_set_.end () != it; ++it)
      {
        ::unsetenv (it->c_str ());
      }

    env_var_map::const_iterator jt;
    for (jt = mod_vars_.begin (); mod_vars_.end () != jt; ++jt)
      {
        ::setenv (jt->first.c_str (), jt->second.c_str (), 1);
      }
  }

  //! Get a pointer to the value of an %environment \a variable
  const char *
  getenv (const std::string& variable) const
  {
    return ::getenv (variable.c_str ());
  }

  //! Set an %environment \a variable to a \a value
  int
  setenv (const std::string& variable, const std::string& value)
  {
    maybe_save_current_(variable);
    vars_set_.insert (variable);

    return ::setenv (variable.c_str (), value.c_str (), 1);
  }

  //! Remove a \a variable from the %environment
  int
  unsetenv (const std::string& variable)
  {
    maybe_save_current_(variable);

    return ::unsetenv (variable.c_str ());
  }

protected:
  typedef std::map< std::string, std::string > env_var_map;
  typedef std::set< std::string > env_var_set;

  //! Remove all variables whose name starts with \a prefix
  void
  clearenv_(const std::string& prefix)
  {
    std::vector< std::string > names;

    for (char **p = environ; p && *p; ++p)
      {
        std::string var (*p);
        std::string::size_type eq = var.find ('=');

        if (0 == var.find (prefix) && std::string::npos != eq)
          names.push_back (var.substr (0, eq));
      }

    std::vector< std::string >::const_iterator it;
    for (it = names.begin (); names.end () != it; ++it)
      {
        unsetenv (*it);
      }
  }

  void
  maybe_save_current_(const std::string& variable)
  {
    const char *env_var (getenv (variable));

    if (env_var && !mod_vars_.count (variable))
      mod_vars_[variable] = env_var;
  }

  env_var_map mod_vars_;
  env_var_set vars_set_;
};

} // namespace test
} // namespace usbtrack

#endif /* usbtrack_test_environment_hpp_ */
