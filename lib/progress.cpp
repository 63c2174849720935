//  progress.cpp -- scan progress snapshots
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

#include <ostream>

#include "scanflow/format.hpp"
#include "scanflow/progress.hpp"

namespace scanflow {

progress::progress (int page, const boost::optional< int >& total,
                    double percent, const std::string& status)
  : page_(page)
  , total_(total)
  , percent_(percent)
  , status_(status)
{}

int
progress::page () const
{
  return page_;
}

const boost::optional< int >&
progress::total () const
{
  return total_;
}

double
progress::percent () const
{
  return percent_;
}

const std::string&
progress::status () const
{
  return status_;
}

std::ostream&
operator<< (std::ostream& os, const progress& p)
{
  if (p.total ())
    os << format ("[%1%/%2%] %3$3.0f%% %4%")
      % p.page () % *p.total () % p.percent () % p.status ();
  else
    os << format ("[%1%] %2$3.0f%% %3%")
      % p.page () % p.percent () % p.status ();
  return os;
}

}       // namespace scanflow
