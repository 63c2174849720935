//  factory.cpp -- export engines by name
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
#include "jpeg.hpp"
#include "pdf.hpp"
#include "pnm.hpp"
#if HAVE_LIBPNG
#include "png.hpp"
#endif
#if HAVE_LIBTIFF
#include "tiff.hpp"
#endif

#include <scanflow/format.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/throw_exception.hpp>

#include <stdexcept>

namespace scanflow {
namespace _out_ {

exporter::ptr
create (const std::string& type)
{
  std::string t (boost::algorithm::to_lower_copy (type));

  if ("pnm" == t)
    return make_shared< pnm_exporter > ();
  if ("jpeg" == t || "jpg" == t)
    return make_shared< jpeg_exporter > ();
  if ("pdf" == t)
    return make_shared< pdf_exporter > ();
#if HAVE_LIBPNG
  if ("png" == t)
    return make_shared< png_exporter > ();
#endif
#if HAVE_LIBTIFF
  if ("tiff" == t || "tif" == t)
    return make_shared< tiff_exporter > ();
#endif

  BOOST_THROW_EXCEPTION
    (std::invalid_argument ((format ("unsupported export format: %1%")
                             % type).str ()));
}

std::vector< std::string >
types ()
{
  std::vector< std::string > rv;

  rv.push_back ("pnm");
  rv.push_back ("jpeg");
  rv.push_back ("pdf");
#if HAVE_LIBPNG
  rv.push_back ("png");
#endif
#if HAVE_LIBTIFF
  rv.push_back ("tiff");
#endif

  return rv;
}

}       // namespace _out_
}       // namespace scanflow
