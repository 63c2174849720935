//  driver.cpp -- hardware driver abstraction
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

#include "scanflow/driver.hpp"

namespace scanflow {

connexion::~connexion ()
{}

driver::~driver ()
{}

driver::entry::entry (const std::string& udi)
  : udi_(udi)
{
  properties_[property::device_id] = udi;
}

const std::string&
driver::entry::udi () const
{
  return udi_;
}

boost::optional< value >
driver::entry::get (property::id pid) const
{
  property::map::const_iterator it = properties_.find (pid);

  if (properties_.end () == it) return boost::none;
  return it->second;
}

driver::entry&
driver::entry::set (property::id pid, const value& v)
{
  properties_[pid] = v;
  return *this;
}

}       // namespace scanflow
