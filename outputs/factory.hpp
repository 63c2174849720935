//  factory.hpp -- export engines by name
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

#ifndef outputs_factory_hpp_
#define outputs_factory_hpp_

#include <scanflow/services.hpp>

#include <string>
#include <vector>

namespace scanflow {
namespace _out_ {

//! Creates the exporter for \a type, e.g. \c "jpeg"
/*! \throws std::invalid_argument for unknown or unavailable types
 */
exporter::ptr create (const std::string& type);

//! Lists the types create() knows about
std::vector< std::string > types ();

}       // namespace _out_
}       // namespace scanflow

#endif  /* outputs_factory_hpp_ */
