//  options.hpp -- command line options shared by all programs
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

#ifndef src_options_hpp_
#define src_options_hpp_

#include <scanflow/driver.hpp>

#include <boost/program_options.hpp>

#include <string>

namespace scanflow {

//! Adds options to select and set up a driver to \a desc
void add_driver_options (boost::program_options::options_description& desc);

//! Creates the driver selected by the options in \a vm
driver::ptr create_driver (const boost::program_options::variables_map& vm);

//! Applies logging related options in \a vm
void apply_log_options (const boost::program_options::variables_map& vm);

std::string version (const std::string& program);

}       // namespace scanflow

#endif  /* src_options_hpp_ */
