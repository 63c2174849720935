//  monitor.cpp -- device discovery and capability probing
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

#include <algorithm>
#include <exception>

#include <boost/assign/list_of.hpp>

#include "scanflow/choices.hpp"
#include "scanflow/exception.hpp"
#include "scanflow/log.hpp"
#include "scanflow/monitor.hpp"
#include "scanflow/range.hpp"

namespace scanflow {

const int monitor::fallback_max_resolution;

namespace {

const std::string unknown_name ("Unknown Scanner");
const std::string unknown_manufacturer ("Unknown");

//! Reads a property without letting a misbehaving driver get to us
boost::optional< value >
get (const connexion::ptr& cnx, property::id pid)
{
  try
    {
      return cnx->get (pid);
    }
  catch (const std::exception& e)
    {
      log::debug (log::DISCOVERY, "reading %1%: %2%")
        % property::name_of (pid)
        % e.what ();
    }
  return boost::none;
}

std::string
text (const boost::optional< value >& v, const std::string& fallback)
{
  if (v && v->is_string ()) return *v;
  return fallback;
}

}       // namespace

monitor::monitor (driver::ptr drv)
  : driver_(drv)
{}

monitor::container_type
monitor::devices () const
{
  container_type rv;
  driver::container_type entries (driver_->enumerate ());

  for (driver::container_type::const_iterator it = entries.begin ();
       entries.end () != it; ++it)
    {
      if (!is_scanner (*it))
        {
          log::trace (log::DISCOVERY, "skipping %1%: not a scanner") % it->udi ();
          continue;
        }
      rv.push_back (inspect (*it));
    }

  return rv;
}

boost::optional< device >
monitor::default_device () const
{
  container_type devs (devices ());

  if (devs.empty ()) return boost::none;
  return devs.front ();
}

device
monitor::inspect (const driver::entry& e) const
{
  std::string name (text (e.get (property::name), unknown_name));
  std::string manufacturer (text (e.get (property::manufacturer),
                                  unknown_manufacturer));

  device_class kind (device_class::flatbed);
  bool adf (false);
  bool duplex (false);
  int max_resolution (fallback_max_resolution);
  device::source_list sources;
  device::resolution_list dpi (fallback_resolutions ());

  connexion::ptr cnx;
  try
    {
      cnx = driver_->connect (e.udi ());
    }
  catch (const std::exception& ex)
    {
      log::brief (log::DISCOVERY, "cannot inspect %1%: %2%") % e.udi () % ex.what ();
    }

  if (cnx)
    {
      boost::optional< value > caps (get (cnx, property::handling_capabilities));

      if (caps && caps->is_integer ())
        {
          capabilities c (decode (*caps));

          kind    = c.kind;
          adf     = c.feeder;
          duplex  = c.duplex;
          sources = c.sources;
        }
      else
        {
          log::trace (log::DISCOVERY, "%1%: no document handling information")
            % e.udi ();
        }

      constraint::ptr limits;
      try
        {
          limits = cnx->limits (property::x_resolution);
        }
      catch (const std::exception& ex)
        {
          log::debug (log::DISCOVERY, "%1%: resolution limits: %2%")
            % e.udi ()
            % ex.what ();
        }

      device::resolution_list supported (resolutions (limits));
      if (!supported.empty ())
        {
          dpi = supported;
          max_resolution = *std::max_element (dpi.begin (), dpi.end ());
        }
      else
        {
          boost::optional< value > current (get (cnx, property::x_resolution));
          if (current && current->is_integer ())
            max_resolution = std::max< int > (*current,
                                              fallback_max_resolution);
        }
    }

  if (sources.empty ())
    sources.push_back (scan_source::flatbed);

  log::trace (log::DISCOVERY, "inspected %1%: %2%, %3% source(s), max %4% dpi")
    % e.udi ()
    % kind
    % sources.size ()
    % max_resolution;

  return device (e.udi (), name, manufacturer, kind,
                 true, adf, duplex, max_resolution, sources, dpi);
}

void
monitor::poll ()
{
  std::set< std::string > present;
  driver::container_type entries (driver_->enumerate ());

  for (driver::container_type::const_iterator it = entries.begin ();
       entries.end () != it; ++it)
    {
      if (is_scanner (*it)) present.insert (it->udi ());
    }

  std::set< std::string >::const_iterator it;
  for (it = present.begin (); present.end () != it; ++it)
    {
      if (!known_.count (*it))
        {
          log::brief ("device arrived: %1%") % *it;
          arrival_(*it);
        }
    }
  for (it = known_.begin (); known_.end () != it; ++it)
    {
      if (!present.count (*it))
        {
          log::brief ("device departed: %1%") % *it;
          departure_(*it);
        }
    }
  known_.swap (present);
}

connection
monitor::connect_arrival (const update_signal::slot_type& slot)
{
  return arrival_.connect (slot);
}

connection
monitor::connect_departure (const update_signal::slot_type& slot)
{
  return departure_.connect (slot);
}

monitor::capabilities
monitor::decode (value::integer mask)
{
  using namespace property;

  capabilities rv;

  rv.flatbed = mask & capability::flatbed;
  rv.feeder  = mask & capability::feeder;
  rv.duplex  = mask & capability::duplex;
  rv.film    = mask & capability::film;
  rv.kind    = device_class::flatbed;

  if (rv.flatbed)
    rv.sources.push_back (scan_source::flatbed);
  if (rv.feeder)
    {
      rv.sources.push_back (scan_source::feeder);
    }
  if (rv.duplex)
    {
      // a duplex unit is part of a feeder, whether reported or not
      if (!rv.feeder) rv.sources.push_back (scan_source::feeder);
      rv.feeder = true;
      rv.sources.push_back (scan_source::duplex);
      rv.sources.push_back (scan_source::feeder_front);
      rv.sources.push_back (scan_source::feeder_back);
      rv.kind = device_class::duplex_adf;
    }
  else if (rv.feeder)
    {
      rv.kind = device_class::adf;
    }
  if (rv.film)
    rv.sources.push_back (scan_source::film);

  if (rv.feeder && rv.flatbed)
    rv.kind = device_class::multifunction;

  if (rv.sources.empty ())
    rv.sources.push_back (scan_source::flatbed);

  return rv;
}

device::resolution_list
monitor::resolutions (const constraint::ptr& c)
{
  device::resolution_list rv;

  if (range::ptr r = dynamic_pointer_cast< range > (c))
    {
      const device::resolution_list& candidates (candidate_resolutions ());
      for (device::resolution_list::const_iterator it = candidates.begin ();
           candidates.end () != it; ++it)
        {
          if (r->contains (*it))
            rv.push_back (*it);
        }
    }
  else if (choices::ptr s = dynamic_pointer_cast< choices > (c))
    {
      for (choices::const_iterator it = s->begin (); s->end () != it; ++it)
        {
          if (it->is_integer ()) rv.push_back (*it);
        }
    }

  return rv;
}

const device::resolution_list&
monitor::candidate_resolutions ()
{
  static const device::resolution_list rv = boost::assign::list_of
    (75)(100)(150)(200)(300)(400)(600)(1200)(2400)(4800)
    .convert_to_container< device::resolution_list > ();
  return rv;
}

const device::resolution_list&
monitor::fallback_resolutions ()
{
  static const device::resolution_list rv = boost::assign::list_of
    (75)(100)(150)(200)(300)(600)
    .convert_to_container< device::resolution_list > ();
  return rv;
}

bool
monitor::is_scanner (const driver::entry& e) const
{
  boost::optional< value > type (e.get (property::device_type));

  return (!type || !type->is_integer ()
          || property::scanner_device == value::integer (*type));
}

}       // namespace scanflow
