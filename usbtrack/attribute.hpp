//  attribute.hpp -- device attribute lookup with inheritance
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

#ifndef usbtrack_attribute_hpp_
#define usbtrack_attribute_hpp_

#include <string>

#include <boost/optional.hpp>

#include "cstdint.hpp"
#include "subsystem.hpp"

namespace usbtrack {

//! Find an attribute's value by \a name for a given \a device
/*! If the \a device does not advertise the attribute, its parent will
 *  be queried and so on until the root of the device hierarchy.  The
 *  search stops at the first node that advertises the attribute, even
 *  if its value cannot be read.
 *
 *  A USB interface, for example, does not carry \c idVendor itself.
 *  The attribute lives on the USB device node that owns it.
 */
boost::optional< std::string >
resolve_attribute (const raw_device::ptr& device, const std::string& name);

//! Find an attribute and parse it as a 16-bit hexadecimal number
/*! Values that are not entirely made of hex digits, or that do not
 *  fit 16 bits, are treated as if the attribute were absent.
 */
boost::optional< uint16_t >
resolve_hex16 (const raw_device::ptr& device, const std::string& name);

//! Find an attribute and return it if it is valid UTF-8
boost::optional< std::string >
resolve_string (const raw_device::ptr& device, const std::string& name);

}       // namespace usbtrack

#endif  /* usbtrack_attribute_hpp_ */
