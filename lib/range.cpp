//  range.cpp -- integer property limits
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

#include "scanflow/format.hpp"
#include "scanflow/range.hpp"

namespace scanflow {

range::range (value::integer lower, value::integer upper,
              value::integer step)
  : constraint (value (lower))
  , lower_(lower)
  , upper_(upper)
  , step_(step)
{
  if (upper_ < lower_)
    BOOST_THROW_EXCEPTION
      (violation ((format ("empty range %1%..%2%")
                   % lower_ % upper_).str ()));
  if (0 >= step_)
    BOOST_THROW_EXCEPTION
      (violation ((format ("step %1% is not positive") % step_).str ()));
}

bool
range::allows (const value& v) const
{
  return v.is_integer () && contains (value::integer (v));
}

bool
range::contains (value::integer i) const
{
  if (i < lower_ || upper_ < i) return false;

  return (upper_ == i || 0 == (i - lower_) % step_);
}

}       // namespace scanflow
