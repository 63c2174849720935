//  exception.cpp -- device related error conditions
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

#include "scanflow/exception.hpp"

using std::string;

namespace scanflow {

system_error::system_error ()
  : std::runtime_error ("")
  , ec_(no_error)
{}

system_error::system_error (error_code ec, const string& message)
  : std::runtime_error (message)
  , ec_(ec)
{}

system_error::system_error (error_code ec, const char *message)
  : std::runtime_error (message)
  , ec_(ec)
{}

const system_error::error_code&
system_error::code () const
{
  return ec_;
}

std::ostream&
operator<< (std::ostream& os, const system_error::error_code& ec)
{
  switch (ec)
    {
    case system_error::no_error:             return os << "no error";
    case system_error::hardware_unavailable: return os << "hardware unavailable";
    case system_error::device_not_found:     return os << "device not found";
    case system_error::not_connected:        return os << "not connected";
    case system_error::property_rejected:    return os << "property rejected";
    case system_error::media_out:            return os << "media out";
    case system_error::cancelled:            return os << "cancelled";
    case system_error::transfer_failure:     return os << "transfer failure";
    case system_error::unknown_error:        return os << "unknown error";
    }
  return os << "error " << int (ec);
}

}       // namespace scanflow
