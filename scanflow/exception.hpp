//  exception.hpp -- device related error conditions
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

#ifndef scanflow_exception_hpp_
#define scanflow_exception_hpp_

#include <iosfwd>
#include <stdexcept>
#include <string>

namespace scanflow {

//! Device related error conditions
/*! Inspired by C++11's std::system_error.  The error codes double as
 *  the classification callers use to decide whether a condition ends
 *  an operation, ends a feeder loop or is merely worth a log message.
 */
class system_error
  : public std::runtime_error
{
public:
  enum error_code {
    no_error = 0,

    hardware_unavailable,       //!< driver subsystem missing entirely
    device_not_found,           //!< device id no longer enumerated
    not_connected,              //!< I/O attempted without a session
    property_rejected,          //!< device refused a property value
    media_out,                  //!< no more items in the feeder
    cancelled,                  //!< user requested cancellation
    transfer_failure,           //!< any other driver error on transfer

    unknown_error               // keep this last
  };

  system_error ();
  system_error (error_code ec, const std::string& message);
  system_error (error_code ec, const char *message);

  const error_code& code () const;

private:
  error_code ec_;
};

std::ostream& operator<< (std::ostream& os,
                          const system_error::error_code& ec);

}       // namespace scanflow

#endif  /* scanflow_exception_hpp_ */
