//  thread.hpp -- threads and durations in the scanflow namespace
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

#ifndef scanflow_thread_hpp_
#define scanflow_thread_hpp_

/*! \file
 *  \brief Inject the standard \c thread class and time durations
 *
 *  Feeder loops wait between pages and sessions may run on a worker
 *  thread.  Code in the \c scanflow namespace uses the names below
 *  for that.
 */

#include <chrono>
#include <thread>

namespace scanflow {

using std::thread;
namespace this_thread = std::this_thread;
namespace chrono = std::chrono;

}       // namespace scanflow

#endif  /* scanflow_thread_hpp_ */
