//  format.hpp -- Boost.Format with argument count access
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

#ifndef scanflow_format_hpp_
#define scanflow_format_hpp_

#ifdef BOOST_FORMAT_HPP
#error "Include this file before <boost/format.hpp> is included."
#endif

//  The logging code checks message argument counts.  That needs the
//  otherwise private parts of boost::basic_format.

#ifndef BOOST_NO_MEMBER_TEMPLATE_FRIENDS
#define BOOST_NO_MEMBER_TEMPLATE_FRIENDS
#endif

#include <boost/format.hpp>

namespace scanflow {

using boost::format;

}       // namespace scanflow

#endif  /* scanflow_format_hpp_ */
