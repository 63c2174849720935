//  constraint.cpp -- what a device accepts for a property
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

#include <boost/throw_exception.hpp>

#include "scanflow/constraint.hpp"

namespace scanflow {

constraint::constraint (const value& fallback)
  : fallback_(fallback)
{}

constraint::~constraint ()
{}

const value&
constraint::adjust (const value& v) const
{
  return (allows (v) ? v : fallback_);
}

const value&
constraint::fallback () const
{
  return fallback_;
}

void
constraint::fallback (const value& v)
{
  if (!allows (v))
    BOOST_THROW_EXCEPTION
      (violation ("fallback value is not allowed"));

  fallback_ = v;
}

constraint::violation::violation (const std::string& what)
  : std::logic_error (what)
{}

}       // namespace scanflow
