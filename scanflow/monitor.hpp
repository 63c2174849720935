//  monitor.hpp -- device discovery and capability probing
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

#ifndef scanflow_monitor_hpp_
#define scanflow_monitor_hpp_

#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "device.hpp"
#include "driver.hpp"
#include "signal.hpp"

namespace scanflow {

//! Check up on the available scanner devices
/*! The monitor asks a driver which devices are attached and inspects
 *  each of them for its capabilities.  Nothing is cached: every call
 *  to devices() goes to the hardware again.
 *
 *  Probing is tolerant of failure on a per device, per property basis.
 *  Anything that cannot be determined falls back to what every device
 *  is assumed to support: flatbed scans at the fallback_resolutions().
 *  Only a driver that cannot enumerate at all makes devices() throw.
 */
class monitor
{
public:
  typedef std::vector< device > container_type;
  typedef signal< void (const std::string&) > update_signal;

  //! Decoded document handling capabilities
  struct capabilities
  {
    bool flatbed;
    bool feeder;
    bool duplex;
    bool film;

    device_class        kind;
    device::source_list sources;
  };

  explicit monitor (driver::ptr drv);

  //! Enumerates and inspects all attached scanner devices
  /*! \throws system_error if the hardware layer is unavailable
   */
  container_type devices () const;

  //! Returns the first device, if there is one
  boost::optional< device > default_device () const;

  //! Inspects the device behind enumeration \a e
  device inspect (const driver::entry& e) const;

  //! Re-enumerates and signals devices that came or went
  /*! The first call after construction signals the arrival of every
   *  attached device.
   */
  void poll ();

  connection connect_arrival (const update_signal::slot_type& slot);
  connection connect_departure (const update_signal::slot_type& slot);

  static capabilities decode (value::integer mask);

  //! Resolutions permitted by constraint \a c
  /*! A range yields those candidate_resolutions() that lie on one of
   *  its steps, choices yield their integer values.  Anything else
   *  yields an empty list.
   */
  static device::resolution_list resolutions (const constraint::ptr& c);

  static const device::resolution_list& candidate_resolutions ();
  static const device::resolution_list& fallback_resolutions ();

  static const int fallback_max_resolution = 600;

private:
  bool is_scanner (const driver::entry& e) const;

  driver::ptr driver_;

  std::set< std::string > known_;
  update_signal arrival_;
  update_signal departure_;
};

}       // namespace scanflow

#endif  /* scanflow_monitor_hpp_ */
