//  attribute.cpp -- unit tests for device attribute lookup
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

#include <string>

#include <boost/test/unit_test.hpp>

#include "usbtrack/attribute.hpp"
#include "usbtrack/test/subsystem.hpp"

using namespace usbtrack;
using usbtrack::test::fake_device;

namespace {

//! A USB device with a chain of interface-like nodes below it
struct fixture
{
  fake_device::ptr root;
  fake_device::ptr leaf;

  fixture ()
  {
    root = make_shared< fake_device > ("/sys/devices/pci0000:00/usb1");
    root->set ("idVendor", "1d6b")
      .set ("idProduct", "0002")
      .set ("manufacturer", "Linux Foundation");

    fake_device::ptr p (root);
    for (int i = 1; i <= 5; ++i)
      {
        p = make_shared< fake_device >
          (p->syspath () + "/" + std::string (1, '0' + i), p);
      }
    leaf = p;
  }
};

}       // namespace

BOOST_FIXTURE_TEST_SUITE (resolution, fixture)

BOOST_AUTO_TEST_CASE (own_attribute)
{
  BOOST_CHECK_EQUAL ("1d6b", *resolve_attribute (root, "idVendor"));
}

BOOST_AUTO_TEST_CASE (inherited_from_five_levels_up)
{
  boost::optional< std::string > v (resolve_attribute (leaf, "idVendor"));

  BOOST_REQUIRE (v);
  BOOST_CHECK_EQUAL ("1d6b", *v);
}

BOOST_AUTO_TEST_CASE (nearest_node_wins)
{
  dynamic_pointer_cast< fake_device > (leaf->parent ())
    ->set ("idVendor", "04b8");

  BOOST_CHECK_EQUAL ("04b8", *resolve_attribute (leaf, "idVendor"));
}

BOOST_AUTO_TEST_CASE (absent_everywhere)
{
  BOOST_CHECK (!resolve_attribute (leaf, "serial"));
}

BOOST_AUTO_TEST_CASE (null_device)
{
  BOOST_CHECK (!resolve_attribute (raw_device::ptr (), "idVendor"));
}

BOOST_AUTO_TEST_CASE (unreadable_value_stops_the_walk)
{
  leaf->set_unreadable ("manufacturer");

  BOOST_CHECK (!resolve_attribute (leaf, "manufacturer"));
  BOOST_CHECK (!resolve_string (leaf, "manufacturer"));
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_FIXTURE_TEST_SUITE (hex16, fixture)

BOOST_AUTO_TEST_CASE (vendor_id)
{
  boost::optional< uint16_t > v (resolve_hex16 (leaf, "idVendor"));

  BOOST_REQUIRE (v);
  BOOST_CHECK_EQUAL (7531, *v);
}

BOOST_AUTO_TEST_CASE (case_insensitive)
{
  root->set ("idVendor", "04B8");

  BOOST_CHECK_EQUAL (0x04b8, *resolve_hex16 (root, "idVendor"));
}

BOOST_AUTO_TEST_CASE (leading_zeros)
{
  root->set ("idProduct", "00000002");

  BOOST_CHECK_EQUAL (2, *resolve_hex16 (root, "idProduct"));
}

BOOST_AUTO_TEST_CASE (malformed_values)
{
  root->set ("a", "").set ("b", "xyz").set ("c", "1d6b\n")
    .set ("d", "10000").set ("e", "0x1d6b").set ("f", "-1");

  BOOST_CHECK (!resolve_hex16 (root, "a"));
  BOOST_CHECK (!resolve_hex16 (root, "b"));
  BOOST_CHECK (!resolve_hex16 (root, "c"));
  BOOST_CHECK (!resolve_hex16 (root, "d"));
  BOOST_CHECK (!resolve_hex16 (root, "e"));
  BOOST_CHECK (!resolve_hex16 (root, "f"));
}

BOOST_AUTO_TEST_CASE (whole_value_is_consumed)
{
  root->set ("a", " 1d6b").set ("b", "+1d6b").set ("c", "1d6b 0002")
    .set ("d", "ffffffffffffffffffffffffffff").set ("e", "ffff");

  BOOST_CHECK (!resolve_hex16 (root, "a"));
  BOOST_CHECK (!resolve_hex16 (root, "b"));
  BOOST_CHECK (!resolve_hex16 (root, "c"));
  BOOST_CHECK (!resolve_hex16 (root, "d"));
  BOOST_CHECK_EQUAL (0xffff, *resolve_hex16 (root, "e"));
}

BOOST_AUTO_TEST_CASE (absent)
{
  BOOST_CHECK (!resolve_hex16 (leaf, "bcdDevice"));
}

BOOST_AUTO_TEST_SUITE_END ()

BOOST_FIXTURE_TEST_SUITE (strings, fixture)

BOOST_AUTO_TEST_CASE (inherited_string)
{
  BOOST_CHECK_EQUAL ("Linux Foundation", *resolve_string (leaf, "manufacturer"));
}

BOOST_AUTO_TEST_CASE (multibyte_utf8)
{
  root->set ("product", "Sch\xc3\xa4rfe \xe2\x82\xac \xf0\x9f\x96\xa8");

  BOOST_CHECK (resolve_string (leaf, "product"));
}

BOOST_AUTO_TEST_CASE (invalid_utf8)
{
  root->set ("a", "\xff").set ("b", "\xc3").set ("c", "\xc0\xaf")
    .set ("d", "\xed\xa0\x80").set ("e", "\xf4\x90\x80\x80");

  BOOST_CHECK (!resolve_string (root, "a"));
  BOOST_CHECK (!resolve_string (root, "b"));
  BOOST_CHECK (!resolve_string (root, "c"));
  BOOST_CHECK (!resolve_string (root, "d"));
  BOOST_CHECK (!resolve_string (root, "e"));
}

BOOST_AUTO_TEST_SUITE_END ()

#include "usbtrack/test/runner.ipp"
