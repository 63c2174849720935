//  property.hpp -- device property identities and well-known values
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

#ifndef scanflow_property_hpp_
#define scanflow_property_hpp_

#include <map>
#include <string>
#include <utility>

#include "settings.hpp"
#include "value.hpp"

namespace scanflow {

//! Typed property identities of the hardware abstraction
/*! The numeric identities are those of the imaging device property
 *  sets that scanner drivers commonly expose.  Drivers that talk to
 *  hardware with other conventions map onto these.
 */
namespace property {

  typedef int id;
  typedef std::map< id, value > map;

  //  Device identity, readable without opening a session
  const id device_id    = 2;
  const id manufacturer = 3;
  const id device_type  = 5;
  const id name         = 7;

  //  Document handling
  const id handling_capabilities = 3086;
  const id handling_status       = 3087;
  const id handling_select       = 3088;

  //  Per image acquisition
  const id data_type    = 4103;
  const id intent       = 6146;
  const id x_resolution = 6147;
  const id y_resolution = 6148;
  const id x_start      = 6149;
  const id y_start      = 6150;
  const id x_extent     = 6151;
  const id y_extent     = 6152;
  const id brightness   = 6154;
  const id contrast     = 6155;

  //! Value of device_type for image scanners
  const value::integer scanner_device = 1;

  //! Bits of handling_capabilities
  namespace capability {
    const value::integer flatbed = 0x01;
    const value::integer feeder  = 0x02;
    const value::integer duplex  = 0x04;
    const value::integer film    = 0x10;
  }

  //! Bits of handling_status
  namespace status {
    const value::integer feeder_ready = 0x02;
  }

  //! Bits of handling_select
  namespace handling {
    const value::integer feeder     = 0x0001;
    const value::integer flatbed    = 0x0002;
    const value::integer duplex     = 0x0004;
    const value::integer front_only = 0x0020;
    const value::integer back_only  = 0x0040;
    const value::integer automatic  = 0x8000;
  }

  //! Values of intent
  namespace image_intent {
    const value::integer color     = 1;
    const value::integer grayscale = 2;
    const value::integer text      = 4;
  }

  //! Values of data_type
  namespace pixel_type {
    const value::integer black_and_white = 0;
    const value::integer grayscale       = 2;
    const value::integer color           = 3;
  }

  //! Short name of a property for log messages
  std::string name_of (id pid);

}       // namespace property

//! Intent and data type pair that produces images in mode \a m
std::pair< value::integer, value::integer > image_type (color_mode m);

//! Document handling select value for \a s
/*! A \a duplex flag only has an effect for a plain feeder source.
 */
value::integer handling_select (scan_source s, bool duplex);

//! MIME type of the lossless raster format used for transfers
extern const std::string transfer_format;

}       // namespace scanflow

#endif  /* scanflow_property_hpp_ */
