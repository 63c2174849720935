//  factory.cpp -- hardware drivers by name
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

#include "factory.hpp"
#include "file/driver.hpp"
#if HAVE_SANE
#include "sane/driver.hpp"
#endif

#include <scanflow/format.hpp>
#include <scanflow/log.hpp>

#include <boost/throw_exception.hpp>

#include <stdexcept>

namespace scanflow {
namespace _drv_ {

driver::ptr
create (const std::string& type, const std::string& arg)
{
  log::trace (log::DRIVER, "creating %1% driver") % type;

  if ("file" == type)
    {
      if (arg.empty ())
        BOOST_THROW_EXCEPTION
          (std::invalid_argument ("file driver needs a device description"));
      return make_shared< file::driver > (arg);
    }
#if HAVE_SANE
  if ("sane" == type)
    return make_shared< sane::driver > ();
#endif

  BOOST_THROW_EXCEPTION
    (std::invalid_argument ((format ("unsupported driver: %1%")
                             % type).str ()));
}

std::vector< std::string >
types ()
{
  std::vector< std::string > rv;

#if HAVE_SANE
  rv.push_back ("sane");
#endif
  rv.push_back ("file");

  return rv;
}

}       // namespace _drv_
}       // namespace scanflow
