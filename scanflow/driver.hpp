//  driver.hpp -- hardware driver abstraction
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

#ifndef scanflow_driver_hpp_
#define scanflow_driver_hpp_

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "constraint.hpp"
#include "memory.hpp"
#include "octet.hpp"
#include "property.hpp"

namespace scanflow {

//! A live session with a single device
/*! Property access is best-effort.  Properties that a device does not
 *  know are reported as absent and rejected writes as \c false.  Only
 *  transfer() throws for conditions that are not programming errors.
 *
 *  Implementations need not be reentrant.  A connexion is used by a
 *  single scan session at a time.
 */
class connexion
{
public:
  typedef shared_ptr< connexion > ptr;

  virtual ~connexion ();

  //! Returns the current value of property \a pid, if any
  virtual boost::optional< value > get (property::id pid) = 0;

  //! Tries to set property \a pid to \a v
  /*! \return \c false if the device rejected the value
   */
  virtual bool set (property::id pid, const value& v) = 0;

  //! Returns the constraint on property \a pid, or a null pointer
  virtual constraint::ptr limits (property::id pid) = 0;

  //! Acquires a single image encoded as \a format
  /*! \throws system_error with code system_error::media_out when the
   *          document feeder has no more items
   *  \throws system_error with code system_error::transfer_failure
   *          for all other problems
   */
  virtual octets transfer (const std::string& format) = 0;
};

//! Gateway to the devices that a driver knows about
class driver
{
public:
  typedef shared_ptr< driver > ptr;

  //! What enumeration tells about a device before connecting to it
  class entry
  {
  public:
    entry (const std::string& udi);

    const std::string& udi () const;

    boost::optional< value > get (property::id pid) const;
    entry& set (property::id pid, const value& v);

  private:
    std::string   udi_;
    property::map properties_;
  };

  typedef std::vector< entry > container_type;

  virtual ~driver ();

  //! Lists the devices currently attached, in driver order
  /*! \throws system_error with code system_error::hardware_unavailable
   *          if the driver's subsystem is not available at all
   */
  virtual container_type enumerate () = 0;

  //! Opens a session with the device identified by \a udi
  /*! \throws system_error with code system_error::device_not_found
   *          if \a udi does not match any attached device
   */
  virtual connexion::ptr connect (const std::string& udi) = 0;
};

}       // namespace scanflow

#endif  /* scanflow_driver_hpp_ */
