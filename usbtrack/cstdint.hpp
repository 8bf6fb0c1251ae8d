//  cstdint.hpp -- fixed width integral types
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

#ifndef usbtrack_cstdint_hpp_
#define usbtrack_cstdint_hpp_

/*! \file
 *  \brief Inject fixed width integral types into the \c usbtrack
 *         namespace
 *
 *  USB vendor and product IDs are 16-bit quantities and identifiers
 *  are 32-bit indices.  Code in the \c usbtrack namespace uses these
 *  types unqualified, whether they come from the standard library or
 *  from Boost.
 */

#if __cplusplus >= 201103L && !WITH_INCLUDED_BOOST

#include <cstdint>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/cstdint.hpp>
#define NAMESPACE boost

#endif

namespace usbtrack {

using NAMESPACE::uint16_t;
using NAMESPACE::uint32_t;

}       // namespace usbtrack

#undef NAMESPACE

#endif  /* usbtrack_cstdint_hpp_ */
