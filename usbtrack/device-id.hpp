//  device-id.hpp -- stable identifiers for USB devices
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

#ifndef usbtrack_device_id_hpp_
#define usbtrack_device_id_hpp_

#include <cstddef>
#include <functional>
#include <ostream>

#include <boost/operators.hpp>

#include "cstdint.hpp"

namespace usbtrack {

//! Stable handle for a physical device that has been seen
/*! Identifiers are issued by the context, once per device that gets
 *  plugged in, in a dense sequence starting at zero.  They are never
 *  reused and stay valid after the device goes away.  Ask the context
 *  whether the device is still connected.
 */
class device_id
  : boost::totally_ordered< device_id >
{
public:
  typedef uint32_t value_type;

  explicit device_id (value_type index = 0);

  //! Position in the context's registry
  value_type index () const;

  bool operator== (const device_id& rhs) const;
  bool operator<  (const device_id& rhs) const;

private:
  value_type index_;
};

std::size_t hash_value (const device_id& id);

std::ostream&
operator<< (std::ostream& os, const device_id& id);

}       // namespace usbtrack

namespace std {

template<>
struct hash< usbtrack::device_id >
{
  std::size_t operator() (const usbtrack::device_id& id) const
  {
    return usbtrack::hash_value (id);
  }
};

}       // namespace std

#endif  /* usbtrack_device_id_hpp_ */
