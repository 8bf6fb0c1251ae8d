//  memory.hpp -- managed memory pointers
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

#ifndef usbtrack_memory_hpp_
#define usbtrack_memory_hpp_

/*! \file
 *  \brief Inject managed memory pointers into the \c usbtrack namespace
 *
 *  Device handles, monitor sockets and the context state are shared
 *  between the objects that use them.  This header lets the code say
 *  \c shared_ptr without caring which implementation provides it.
 */

#if __cplusplus >= 201103L && !WITH_INCLUDED_BOOST

#include <memory>
#define NAMESPACE std

#else   /* emulate C++11 */

#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#define NAMESPACE boost

#endif

namespace usbtrack {

using NAMESPACE::dynamic_pointer_cast;
using NAMESPACE::make_shared;
using NAMESPACE::shared_ptr;
using NAMESPACE::weak_ptr;

}       // namespace usbtrack

#undef NAMESPACE

#endif  /* usbtrack_memory_hpp_ */
