//  device.cpp -- scanner devices as discovered by capability probing
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
#include <cstdlib>
#include <ostream>

#include "scanflow/device.hpp"

namespace scanflow {

std::ostream&
operator<< (std::ostream& os, const device_class& c)
{
  switch (c)
    {
    case device_class::unknown:       return os << "unknown";
    case device_class::flatbed:       return os << "flatbed";
    case device_class::adf:           return os << "adf";
    case device_class::duplex_adf:    return os << "duplex-adf";
    case device_class::multifunction: return os << "multifunction";
    }
  return os << static_cast< int > (c);
}

device::device (const std::string& udi,
                const std::string& name,
                const std::string& manufacturer,
                device_class kind,
                bool supports_color,
                bool supports_adf,
                bool supports_duplex,
                int max_resolution,
                const source_list& sources,
                const resolution_list& resolutions)
  : udi_(udi)
  , name_(name)
  , manufacturer_(manufacturer)
  , kind_(kind)
  , color_(supports_color)
  , adf_(supports_adf)
  , duplex_(supports_duplex)
  , max_resolution_(max_resolution)
  , sources_(sources)
  , resolutions_(resolutions)
{
  if (sources_.empty ())
    sources_.push_back (scan_source::flatbed);
}

const std::string&
device::udi () const
{
  return udi_;
}

const std::string&
device::name () const
{
  return name_;
}

const std::string&
device::manufacturer () const
{
  return manufacturer_;
}

device_class
device::kind () const
{
  return kind_;
}

bool
device::supports_color () const
{
  return color_;
}

bool
device::supports_adf () const
{
  return adf_;
}

bool
device::supports_duplex () const
{
  return duplex_;
}

int
device::max_resolution () const
{
  return max_resolution_;
}

const device::source_list&
device::sources () const
{
  return sources_;
}

const device::resolution_list&
device::resolutions () const
{
  return resolutions_;
}

scan_source
device::default_source () const
{
  return sources_.front ();
}

bool
device::supports (scan_source s) const
{
  return (sources_.end ()
          != std::find (sources_.begin (), sources_.end (), s));
}

int
device::closest_resolution (int dpi) const
{
  if (resolutions_.empty ()) return dpi;

  int rv = resolutions_.front ();
  for (resolution_list::const_iterator it = resolutions_.begin ();
       resolutions_.end () != it; ++it)
    {
      int d_it = std::abs (*it - dpi);
      int d_rv = std::abs (rv - dpi);

      if (d_it < d_rv || (d_it == d_rv && *it < rv))
        rv = *it;
    }
  return rv;
}

bool
device::operator== (const device& dev) const
{
  return udi_ == dev.udi_;
}

bool
device::operator!= (const device& dev) const
{
  return !(*this == dev);
}

std::ostream&
operator<< (std::ostream& os, const device& dev)
{
  os << dev.udi () << "\n"
     << "  " << dev.manufacturer () << " " << dev.name ()
     << " (" << dev.kind () << ")\n";

  os << "  sources    :";
  for (device::source_list::const_iterator it = dev.sources ().begin ();
       dev.sources ().end () != it; ++it)
    {
      os << " " << *it;
    }
  os << "\n";

  os << "  resolutions:";
  for (device::resolution_list::const_iterator
         it = dev.resolutions ().begin ();
       dev.resolutions ().end () != it; ++it)
    {
      os << " " << *it;
    }
  os << " (max " << dev.max_resolution () << ")\n";

  return os;
}

}       // namespace scanflow
