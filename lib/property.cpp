//  property.cpp -- device property identities and well-known values
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

#include <stdexcept>

#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>

#include "scanflow/property.hpp"

namespace scanflow {

const std::string transfer_format ("image/x-portable-anymap");

namespace property {

std::string
name_of (id pid)
{
  switch (pid)
    {
    case device_id:             return "device-id";
    case manufacturer:          return "manufacturer";
    case device_type:           return "device-type";
    case name:                  return "name";
    case handling_capabilities: return "handling-capabilities";
    case handling_status:       return "handling-status";
    case handling_select:       return "handling-select";
    case data_type:             return "data-type";
    case intent:                return "intent";
    case x_resolution:          return "x-resolution";
    case y_resolution:          return "y-resolution";
    case x_start:               return "x-start";
    case y_start:               return "y-start";
    case x_extent:              return "x-extent";
    case y_extent:              return "y-extent";
    case brightness:            return "brightness";
    case contrast:              return "contrast";
    }
  return boost::lexical_cast< std::string > (pid);
}

}       // namespace property

std::pair< value::integer, value::integer >
image_type (color_mode m)
{
  using namespace property;

  switch (m)
    {
    case color_mode::color:
      return std::make_pair (image_intent::color, pixel_type::color);
    case color_mode::grayscale:
      return std::make_pair (image_intent::grayscale, pixel_type::grayscale);
    case color_mode::black_and_white:
      return std::make_pair (image_intent::text, pixel_type::black_and_white);
    }
  BOOST_THROW_EXCEPTION
    (std::logic_error ("unknown color mode"));
}

value::integer
handling_select (scan_source s, bool duplex)
{
  using namespace property;

  switch (s)
    {
    case scan_source::automatic:
      return handling::automatic;
    case scan_source::flatbed:
    case scan_source::film:
      return handling::flatbed;
    case scan_source::feeder:
      return (duplex
              ? handling::feeder | handling::duplex
              : handling::feeder);
    case scan_source::duplex:
      return handling::feeder | handling::duplex;
    case scan_source::feeder_front:
      return handling::feeder | handling::front_only;
    case scan_source::feeder_back:
      return handling::feeder | handling::back_only;
    }
  BOOST_THROW_EXCEPTION
    (std::logic_error ("unknown scan source"));
}

}       // namespace scanflow
