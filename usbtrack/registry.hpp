//  registry.hpp -- append-only table of device identities
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

#ifndef usbtrack_registry_hpp_
#define usbtrack_registry_hpp_

#include <vector>

#include <boost/optional.hpp>

#include "cstdint.hpp"
#include "device-id.hpp"
#include "subsystem.hpp"

namespace usbtrack {

//! Maps stable identifiers onto device locators
/*! The registry is an append-only table.  An identifier is the index
 *  of its entry.  Entries are never removed.  When a device goes away
 *  its entry is tombstoned instead: the locator is cleared while the
 *  identifier and any cached metadata remain.
 *
 *  Lookups by locator scan the table linearly.
 *
 *  The registry does no locking.  It has a single writer, the context
 *  that owns it.
 */
class registry
{
public:
  struct entry
  {
    boost::optional< locator >  where;
    boost::optional< uint16_t > vendor_id;
    boost::optional< uint16_t > product_id;
  };

  typedef std::vector< entry > container_type;
  typedef container_type::size_type size_type;

  //! Add an entry for a connected device and return its identifier
  device_id append (const locator& where,
                    const boost::optional< uint16_t >& vendor_id,
                    const boost::optional< uint16_t >& product_id);

  //! Tombstone the first connected entry at \a where
  /*! Returns the entry's identifier or nothing if no connected entry
   *  matches.
   */
  boost::optional< device_id > tombstone (const locator& where);

  //! Tombstone the entry for \a id
  /*! Throws a system_error if \a id was never issued.  Tombstoning an
   *  already disconnected entry is harmless.
   */
  void tombstone (const device_id& id);

  //! Find the connected entry at \a where without modifying anything
  boost::optional< device_id > find (const locator& where) const;

  bool is_valid (const device_id& id) const;
  bool is_connected (const device_id& id) const;

  //! Access the entry for \a id, throwing invalid_id if there is none
  const entry& at (const device_id& id) const;

  //! Locator of a connected \a id
  /*! Throws a system_error with invalid_id or not_connected code.
   */
  const locator& where (const device_id& id) const;

  size_type size () const;

  //! All identifiers issued so far, in issuance order
  std::vector< device_id > ids () const;

private:
  container_type entries_;
};

}       // namespace usbtrack

#endif  /* usbtrack_registry_hpp_ */
