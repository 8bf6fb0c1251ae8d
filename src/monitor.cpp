//  monitor.cpp -- report USB devices as they come and go
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

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include <usbtrack/context.hpp>
#include <usbtrack/hotplug-monitor.hpp>
#include <usbtrack/log.hpp>
#include <usbtrack/run-time.hpp>

namespace po = boost::program_options;

int
main (int argc, char *argv[])
{
  using usbtrack::log;

  try
    {
      usbtrack::run_time rt (argc, argv);

      unsigned int count = 0;

      po::options_description cmd_opts ("Utility options");
      cmd_opts
        .add_options ()
        ("count", po::value< unsigned int > (&count),
         "exit after this many events, zero means never")
        ;

      if (rt.count ("help"))
        {
          std::cout << rt.help ("report USB devices as they come and go")
                    << "\n" << cmd_opts;
          return EXIT_SUCCESS;
        }
      if (rt.count ("version"))
        {
          std::cout << rt.version ();
          return EXIT_SUCCESS;
        }

      po::variables_map cmd_vm;
      po::store (po::command_line_parser (rt.arguments ())
                 .options (cmd_opts)
                 .run (), cmd_vm);
      po::notify (cmd_vm);

      usbtrack::context ctx;
      usbtrack::hotplug_monitor::ptr mon (ctx.monitor ());

      unsigned int seen = 0;

      while (!count || seen < count)
        {
          usbtrack::poll_result r (mon->poll ());

          if (r.is_end ())
            {
              log::brief ("no more device events");
              break;
            }
          if (r.is_pending ())
            {
              mon->wait ();
              continue;
            }

          const usbtrack::event& ev (r.get ());

          boost::optional< usbtrack::uint16_t > vid (ctx.vendor_id (ev.id ()));
          boost::optional< usbtrack::uint16_t > pid (ctx.product_id (ev.id ()));

          std::cout << boost::format ("%1%:%2% %3%")
            % (vid ? (boost::format ("%04x") % *vid).str () : "????")
            % (pid ? (boost::format ("%04x") % *pid).str () : "????")
            % (usbtrack::event::add == ev.type ()
               ? "was plugged in"
               : "was unplugged")
            << std::endl;
          ++seen;
        }
    }
  catch (std::exception& e)
    {
      std::cerr << e.what () << "\n";
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
