//  log.cpp -- log message defaults and priority names
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

#include <iostream>
#include <string>

#include <boost/algorithm/string/case_conv.hpp>

#include "scanflow/log.hpp"

namespace scanflow {

log::priority log::threshold = log::ERROR;
log::category log::matching  = log::ALL;

template<>
std::ostream& log::basic_logger<char>::os_ = std::clog;

namespace {

const char *names[] = {
  "fatal", "alert", "error", "brief", "trace", "debug",
};

}       // namespace

std::istream&
operator>> (std::istream& is, log::priority& p)
{
  std::string name;
  is >> name;
  boost::algorithm::to_lower (name);

  for (int i = log::FATAL; i <= log::DEBUG; ++i)
    {
      if (name == names[i])
        {
          p = log::priority (i);
          return is;
        }
    }
  is.setstate (std::ios_base::failbit);
  return is;
}

std::ostream&
operator<< (std::ostream& os, const log::priority& p)
{
  if (log::FATAL <= p && p <= log::DEBUG)
    return os << names[p];
  return os << int (p);
}

}       // namespace scanflow
