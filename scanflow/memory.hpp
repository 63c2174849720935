//  memory.hpp -- managed memory pointers in the scanflow namespace
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

#ifndef scanflow_memory_hpp_
#define scanflow_memory_hpp_

/*! \file
 *  \brief Inject the C++11 managed memory pointers
 *
 *  We want to use \c shared_ptr and friends as if they were part of
 *  the \c scanflow namespace.
 */

#include <memory>

namespace scanflow {

using std::dynamic_pointer_cast;
using std::static_pointer_cast;
using std::make_shared;
using std::shared_ptr;
using std::weak_ptr;

}       // namespace scanflow

#endif  /* scanflow_memory_hpp_ */
