//  list.cpp -- USB devices currently connected
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

#include <cstdlib>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include <usbtrack/context.hpp>
#include <usbtrack/exception.hpp>
#include <usbtrack/log.hpp>
#include <usbtrack/run-time.hpp>

int
main (int argc, char *argv[])
{
  using usbtrack::log;

  try
    {
      usbtrack::run_time rt (argc, argv);

      if (rt.count ("help"))
        {
          std::cout << rt.help ("list connected USB devices");
          return EXIT_SUCCESS;
        }
      if (rt.count ("version"))
        {
          std::cout << rt.version ();
          return EXIT_SUCCESS;
        }

      usbtrack::context ctx;

      std::vector< usbtrack::device_id > ids (ctx.connected_devices ());
      std::vector< usbtrack::device_id >::const_iterator it;

      for (it = ids.begin (); ids.end () != it; ++it)
        {
          try
            {
              std::string manufacturer (ctx.manufacturer_string (*it));
              std::string product (ctx.product_string (*it));

              boost::optional< usbtrack::uint16_t > vid (ctx.vendor_id (*it));
              boost::optional< usbtrack::uint16_t > pid (ctx.product_id (*it));

              std::cout << boost::format ("%1%:%2% %3% %4%\n")
                % (vid ? (boost::format ("%04x") % *vid).str () : "????")
                % (pid ? (boost::format ("%04x") % *pid).str () : "????")
                % manufacturer
                % product;
            }
          catch (const usbtrack::system_error& e)
            {
              if (usbtrack::system_error::not_connected != e.code ())
                throw;

              log::brief ("skipping %1%: %2%") % *it % e.what ();
            }
        }
    }
  catch (std::exception& e)
    {
      std::cerr << e.what () << "\n";
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
