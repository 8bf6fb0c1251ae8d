//  context.ipp -- shared state behind the device context
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

#ifndef usbtrack_context_ipp_
#define usbtrack_context_ipp_

#include <string>

#include <boost/optional.hpp>

#include "usbtrack/context.hpp"
#include "usbtrack/registry.hpp"

namespace usbtrack {

//! Everything a context and its hotplug monitors share
/*! This is the only place where the registry gets modified.
 */
class context::impl
{
public:
  impl (subsystem::ptr backend);

  //! Register every device currently present
  void scan ();

  //! Register the device at \a where if it is a USB device
  /*! Only nodes that carry an \c idVendor attribute themselves are
   *  accepted.  Interface nodes, which inherit it, are not.
   */
  boost::optional< device_id > add_device (const locator& where);

  //! Mark the device at \a where as disconnected
  boost::optional< device_id >
  remove_device_by_locator (const locator& where);

  boost::optional< device_id >
  resolve_locator (const locator& where) const;

  //! Live lookup of a string attribute called \a name
  std::string lookup_string (const device_id& id, const std::string& name);

  static const std::string subsystem_name;

  subsystem::ptr backend_;
  registry       registry_;
};

}       // namespace usbtrack

#endif  /* usbtrack_context_ipp_ */
