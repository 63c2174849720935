//  scanner.cpp -- single page and document feeder scan sessions
//  Copyright (C) 2026  SEIKO EPSON CORPORATION
//
//  License: GPL-3.0+
//  Author : EPSON AVASYS CORPORATION
//
//  This file is part of the 'scanflow' package.
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

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <exception>
#include <utility>

#include <boost/throw_exception.hpp>

#include "scanflow/format.hpp"
#include "scanflow/i18n.hpp"
#include "scanflow/log.hpp"
#include "scanflow/media.hpp"
#include "scanflow/property.hpp"
#include "scanflow/scanner.hpp"

namespace scanflow {

namespace {

//! Sets a property without letting a misbehaving driver get to us
bool
set (connexion& cnx, property::id pid, const value& v)
{
  bool rv = false;
  try
    {
      rv = cnx.set (pid, v);
    }
  catch (const std::exception& e)
    {
      log::debug (log::DRIVER, "setting %1%: %2%")
        % property::name_of (pid)
        % e.what ();
    }

  if (!rv)
    log::trace (log::SESSION, "%1% rejected value %2%")
      % property::name_of (pid)
      % v;

  return rv;
}

void
notify (const progress::sink& sink, const progress& p)
{
  log::trace (log::SESSION, "%1%") % p;
  if (sink) sink (p);
}

}       // namespace

scanner::scanner (driver::ptr drv)
  : driver_(drv)
  , delay_(100)
{}

page
scanner::scan_single (const device& dev, const settings& s,
                      const progress::sink& sink,
                      const cancellation& token) const
{
  const boost::optional< int > total (1);

  if (token.requested ())
    BOOST_THROW_EXCEPTION
      (system_error (system_error::cancelled, _("Scan cancelled")));

  connexion::ptr cnx (connect (dev));

  notify (sink, progress (1, total, 0, _("Preparing scan...")));

  select_source (*cnx, s.source (), s.duplex ());
  configure (*cnx, s);

  if (token.requested ())
    BOOST_THROW_EXCEPTION
      (system_error (system_error::cancelled, _("Scan cancelled")));

  notify (sink, progress (1, total, 20, _("Scanning...")));

  octets image (transfer (cnx));

  notify (sink, progress (1, total, 80, _("Processing image...")));

  page rv (image, s.resolution ());
  rv.number (1);

  notify (sink, progress (1, total, 100, _("Complete")));

  return rv;
}

scanner::page_list
scanner::scan_many (const device& dev, const settings& s,
                    const progress::sink& sink,
                    const cancellation& token) const
{
  page_list rv;

  scan_source src (s.source ());
  if (scan_source::automatic == src || scan_source::flatbed == src)
    {
      src = (s.duplex () ? scan_source::duplex : scan_source::feeder);
      log::brief (log::SESSION, "using %1% instead of %2% for multi-page scan")
        % src % s.source ();
    }

  connexion::ptr cnx (connect (dev));
  select_source (*cnx, src, s.duplex ());

  while (!token.requested () && feeder_ready (*cnx))
    {
      int n = rv.size () + 1;

      notify (sink, progress (n, boost::none, 0,
                              (format (_("Scanning page %1%...")) % n).str ()));

      configure (*cnx, s);

      notify (sink, progress (n, boost::none, 20,
                              (format (_("Transferring page %1%...")) % n).str ()));

      octets image;
      try
        {
          image = transfer (cnx);
        }
      catch (const system_error& e)
        {
          if (system_error::media_out == e.code ())
            {
              log::brief (log::SESSION, "feeder empty after %1% page(s)")
                % rv.size ();
              break;
            }
          if (rv.empty ()) throw;

          log::error ("scan of page %1% failed: %2%") % n % e.what ();
          BOOST_THROW_EXCEPTION (partial_scan (e, rv));
        }

      rv.push_back (page (image, s.resolution ()));
      rv.back ().number (n);

      notify (sink, progress (n, boost::none, 100,
                              (format (_("Page %1% scanned")) % n).str ()));

      this_thread::sleep_for (delay_);
    }

  if (token.requested ())
    log::brief (log::SESSION, "scan cancelled after %1% page(s)") % rv.size ();

  return rv;
}

void
scanner::feeder_delay (const chrono::milliseconds& delay)
{
  delay_ = delay;
}

const chrono::milliseconds&
scanner::feeder_delay () const
{
  return delay_;
}

void
scanner::configure (connexion& cnx, const settings& s)
{
  using namespace property;

  set (cnx, x_resolution, s.resolution ());
  set (cnx, y_resolution, s.resolution ());

  std::pair< value::integer, value::integer > type (image_type (s.mode ()));
  set (cnx, intent, type.first);
  set (cnx, data_type, type.second);

  if (0 != s.brightness ()) set (cnx, brightness, s.brightness ());
  if (0 != s.contrast ())   set (cnx, contrast, s.contrast ());

  set (cnx, x_start, 0);
  set (cnx, y_start, 0);

  boost::optional< media > size (media::lookup (s.paper ()));
  if (size)
    {
      set (cnx, x_extent, size->width (s.resolution ()));
      set (cnx, y_extent, size->height (s.resolution ()));
    }
}

bool
scanner::select_source (connexion& cnx, scan_source src, bool duplex)
{
  value::integer select (handling_select (src, duplex));

  if (set (cnx, property::handling_select, select)) return true;

  log::brief (log::SESSION, "cannot select %1%, using device default") % src;
  return false;
}

bool
scanner::feeder_ready (connexion& cnx)
{
  boost::optional< value > status;
  try
    {
      status = cnx.get (property::handling_status);
    }
  catch (const std::exception& e)
    {
      log::debug (log::DRIVER, "reading %1%: %2%")
        % property::name_of (property::handling_status)
        % e.what ();
    }

  if (!status || !status->is_integer ()) return false;

  return (value::integer (*status) & property::status::feeder_ready);
}

connexion::ptr
scanner::connect (const device& dev) const
{
  driver::container_type entries (driver_->enumerate ());

  driver::container_type::const_iterator it = entries.begin ();
  while (entries.end () != it && it->udi () != dev.udi ()) ++it;

  if (entries.end () == it)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::device_not_found,
                     (format (_("Scanner device not found: %1%"))
                      % dev.udi ()).str ()));

  log::brief (log::SESSION, "connecting to %1%") % dev.udi ();
  return driver_->connect (dev.udi ());
}

octets
scanner::transfer (const connexion::ptr& cnx) const
{
  if (!cnx)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::not_connected,
                     _("Not connected to a scanner device.")));

  return cnx->transfer (transfer_format);
}

partial_scan::partial_scan (const system_error& cause,
                            const scanner::page_list& pages)
  : system_error (cause.code (), cause.what ())
  , pages_(make_shared< scanner::page_list > (pages))
{}

const scanner::page_list&
partial_scan::pages () const
{
  return *pages_;
}

}       // namespace scanflow
