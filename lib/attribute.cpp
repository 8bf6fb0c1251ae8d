//  attribute.cpp -- device attribute lookup with inheritance
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

#include <cctype>
#include <sstream>

#include "usbtrack/attribute.hpp"

namespace usbtrack {

namespace {

//! Parse all of \a s as a hexadecimal number that fits 16 bits
bool
parse_hex16 (const std::string& s, uint16_t& value)
{
  if (s.empty ()) return false;

  // stream extraction would skip whitespace and accept a sign
  for (std::string::size_type i = 0; i < s.size (); ++i)
    {
      if (!isxdigit (static_cast< unsigned char > (s[i]))) return false;
    }

  std::stringstream ss (s);
  unsigned long rv;

  ss >> std::hex >> rv;
  if (ss.fail () || !ss.eof () || 0xffff < rv) return false;

  value = rv;
  return true;
}

//! Strict UTF-8 check, rejecting overlong forms and surrogates
bool
is_utf8 (const std::string& s)
{
  std::string::size_type i = 0;

  while (i < s.size ())
    {
      unsigned char c = s[i];
      int  n = 0;
      unsigned long cp = 0;

      /**/ if (c < 0x80)           { ++i; continue; }
      else if (0xc2 <= c && c < 0xe0) { n = 1; cp = c & 0x1f; }
      else if (0xe0 <= c && c < 0xf0) { n = 2; cp = c & 0x0f; }
      else if (0xf0 <= c && c < 0xf5) { n = 3; cp = c & 0x07; }
      else return false;

      if (s.size () - i <= std::string::size_type (n)) return false;

      for (int k = 1; k <= n; ++k)
        {
          unsigned char cc = s[i + k];
          if (0x80 != (cc & 0xc0)) return false;
          cp = (cp << 6) | (cc & 0x3f);
        }

      if (2 == n && cp < 0x800) return false;
      if (3 == n && (cp < 0x10000 || 0x10ffff < cp)) return false;
      if (0xd800 <= cp && cp <= 0xdfff) return false;

      i += n + 1;
    }
  return true;
}

}       // namespace

boost::optional< std::string >
resolve_attribute (const raw_device::ptr& device, const std::string& name)
{
  raw_device::ptr p (device);

  while (p && !p->has_attribute (name))
    {
      p = p->parent ();
    }
  if (!p) return boost::none;

  return p->attribute (name);
}

boost::optional< uint16_t >
resolve_hex16 (const raw_device::ptr& device, const std::string& name)
{
  boost::optional< std::string > s (resolve_attribute (device, name));
  uint16_t value;

  if (!s || !parse_hex16 (*s, value)) return boost::none;

  return value;
}

boost::optional< std::string >
resolve_string (const raw_device::ptr& device, const std::string& name)
{
  boost::optional< std::string > s (resolve_attribute (device, name));

  if (!s || !is_utf8 (*s)) return boost::none;

  return s;
}

}       // namespace usbtrack
