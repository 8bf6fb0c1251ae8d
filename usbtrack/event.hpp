//  event.hpp -- hotplug events
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

#ifndef usbtrack_event_hpp_
#define usbtrack_event_hpp_

#include <cstddef>
#include <functional>
#include <ostream>

#include <boost/operators.hpp>

#include "device-id.hpp"

namespace usbtrack {

//! A device was plugged in or removed
class event
  : boost::equality_comparable< event >
{
public:
  enum type_code {
    add,
    remove,
  };

  event (type_code type, const device_id& id);

  type_code type () const;
  const device_id& id () const;

  bool operator== (const event& rhs) const;

private:
  type_code type_;
  device_id id_;
};

std::size_t hash_value (const event& ev);

std::ostream&
operator<< (std::ostream& os, const event& ev);

}       // namespace usbtrack

namespace std {

template<>
struct hash< usbtrack::event >
{
  std::size_t operator() (const usbtrack::event& ev) const
  {
    return usbtrack::hash_value (ev);
  }
};

}       // namespace std

#endif  /* usbtrack_event_hpp_ */
