//  registry.cpp -- append-only table of device identities
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

#include <limits>
#include <stdexcept>

#include <boost/throw_exception.hpp>

#include "usbtrack/exception.hpp"
#include "usbtrack/registry.hpp"

namespace usbtrack {

device_id
registry::append (const locator& where,
                  const boost::optional< uint16_t >& vendor_id,
                  const boost::optional< uint16_t >& product_id)
{
  if (std::numeric_limits< device_id::value_type >::max () <= size ())
    BOOST_THROW_EXCEPTION
      (std::length_error ("device identifiers exhausted"));

  entry e;
  e.where      = where;
  e.vendor_id  = vendor_id;
  e.product_id = product_id;

  entries_.push_back (e);

  return device_id (entries_.size () - 1);
}

boost::optional< device_id >
registry::tombstone (const locator& where)
{
  boost::optional< device_id > id (find (where));

  if (id) entries_[id->index ()].where = boost::none;

  return id;
}

void
registry::tombstone (const device_id& id)
{
  if (!is_valid (id))
    BOOST_THROW_EXCEPTION
      (system_error (system_error::invalid_id,
                     "an invalid device was specified"));

  entries_[id.index ()].where = boost::none;
}

boost::optional< device_id >
registry::find (const locator& where) const
{
  for (size_type i = 0; i < entries_.size (); ++i)
    {
      if (entries_[i].where && *entries_[i].where == where)
        return device_id (i);
    }
  return boost::none;
}

bool
registry::is_valid (const device_id& id) const
{
  return id.index () < entries_.size ();
}

bool
registry::is_connected (const device_id& id) const
{
  return (is_valid (id) && entries_[id.index ()].where);
}

const registry::entry&
registry::at (const device_id& id) const
{
  if (!is_valid (id))
    BOOST_THROW_EXCEPTION
      (system_error (system_error::invalid_id,
                     "an invalid device was specified"));

  return entries_[id.index ()];
}

const locator&
registry::where (const device_id& id) const
{
  const entry& e (at (id));

  if (!e.where)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::not_connected,
                     "the specified device is not connected"));

  return *e.where;
}

registry::size_type
registry::size () const
{
  return entries_.size ();
}

std::vector< device_id >
registry::ids () const
{
  std::vector< device_id > rv;

  rv.reserve (entries_.size ());
  for (size_type i = 0; i < entries_.size (); ++i)
    {
      rv.push_back (device_id (i));
    }
  return rv;
}

}       // namespace usbtrack
