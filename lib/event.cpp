//  event.cpp -- stable identifiers and hotplug events
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

#include <boost/functional/hash.hpp>

#include "usbtrack/device-id.hpp"
#include "usbtrack/event.hpp"

namespace usbtrack {

device_id::device_id (value_type index)
  : index_(index)
{}

device_id::value_type
device_id::index () const
{
  return index_;
}

bool
device_id::operator== (const device_id& rhs) const
{
  return index_ == rhs.index_;
}

bool
device_id::operator< (const device_id& rhs) const
{
  return index_ < rhs.index_;
}

std::size_t
hash_value (const device_id& id)
{
  return boost::hash_value (id.index ());
}

std::ostream&
operator<< (std::ostream& os, const device_id& id)
{
  return os << "#" << id.index ();
}

event::event (type_code type, const device_id& id)
  : type_(type), id_(id)
{}

event::type_code
event::type () const
{
  return type_;
}

const device_id&
event::id () const
{
  return id_;
}

bool
event::operator== (const event& rhs) const
{
  return (type_ == rhs.type_ && id_ == rhs.id_);
}

std::size_t
hash_value (const event& ev)
{
  std::size_t seed = 0;

  boost::hash_combine (seed, static_cast< int > (ev.type ()));
  boost::hash_combine (seed, ev.id ());
  return seed;
}

std::ostream&
operator<< (std::ostream& os, const event& ev)
{
  return os << (event::add == ev.type () ? "add" : "remove")
            << "(" << ev.id () << ")";
}

}       // namespace usbtrack
