//  driver.hpp -- devices accessed through SANE backends
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

#ifndef drivers_sane_driver_hpp_
#define drivers_sane_driver_hpp_

#include <map>
#include <vector>
#include <string>

#include <sane/sane.h>

#include <scanflow/driver.hpp>

namespace scanflow {
namespace _drv_ {
namespace sane {

//! Gateway to the devices of the installed SANE backends
/*! The SANE library is initialised for as long as a driver instance
 *  exists.  Only a single instance should be created.
 */
class driver
  : public scanflow::driver
{
public:
  driver ();
  ~driver ();

  container_type enumerate ();
  connexion::ptr connect (const std::string& udi);
};

//! Maps the property model onto SANE's well-known options
/*! Geometry properties are in pixels at the current resolution and
 *  converted to the millimetres that most backends use.  Source and
 *  mode selection use the option values that the backends commonly
 *  report, e.g. "ADF Duplex" or "Lineart".
 */
class connexion
  : public scanflow::connexion
{
public:
  connexion (SANE_Handle handle, const std::string& udi);
  ~connexion ();

  boost::optional< value > get (property::id pid);
  bool set (property::id pid, const value& v);
  constraint::ptr limits (property::id pid);
  octets transfer (const std::string& format);

private:
  typedef std::map< std::string, SANE_Int > option_map;

  const SANE_Option_Descriptor * descriptor (const std::string& name,
                                             SANE_Int& index) const;

  boost::optional< value > get_option (const std::string& name) const;
  bool set_option (const std::string& name, const value& v);
  bool set_string (const std::string& name,
                   const std::vector< std::string >& candidates);

  value::integer capabilities () const;
  value::integer resolution () const;
  bool set_geometry (property::id pid, const value& v);

  SANE_Handle    handle_;
  option_map     options_;
  property::map  values_;
  bool           feeder_empty_;
};

}       // namespace sane
}       // namespace _drv_
}       // namespace scanflow

#endif  /* drivers_sane_driver_hpp_ */
