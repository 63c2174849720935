//  pnm.cpp -- portable anymap raster headers
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

#include <cctype>
#include <climits>
#include <stdexcept>
#include <string>

#include <boost/throw_exception.hpp>

#include "scanflow/format.hpp"
#include "scanflow/pnm.hpp"

namespace scanflow {
namespace pnm {

namespace {

//! Skips white space and comments, then reads a decimal number
/*! Numbers that do not fit an \c int are not accepted.
 */
bool
next_number (const octets& data, std::size_t& pos, int& n)
{
  while (pos < data.size ())
    {
      if ('#' == data[pos])
        {
          while (pos < data.size () && '\n' != data[pos]) ++pos;
        }
      else if (std::isspace (data[pos]))
        {
          ++pos;
        }
      else break;
    }

  if (pos >= data.size () || !std::isdigit (data[pos])) return false;

  n = 0;
  while (pos < data.size () && std::isdigit (data[pos]))
    {
      int digit = data[pos] - '0';
      if (n > (INT_MAX - digit) / 10) return false;
      n = 10 * n + digit;
      ++pos;
    }
  return true;
}

}       // namespace

std::size_t
info::octets_per_line () const
{
  if (1 == depth) return (width + 7) / 8;
  return std::size_t (width) * components;
}

std::size_t
info::octets_per_image () const
{
  return octets_per_line () * height;
}

boost::optional< info >
parse (const octets& data)
{
  if (data.size () < 3 || 'P' != data[0]) return boost::none;

  info rv;
  switch (data[1])
    {
    case '4': rv.components = 1; rv.depth = 1; break;
    case '5': rv.components = 1; rv.depth = 8; break;
    case '6': rv.components = 3; rv.depth = 8; break;
    default: return boost::none;
    }

  std::size_t pos = 2;
  if (!next_number (data, pos, rv.width))  return boost::none;
  if (!next_number (data, pos, rv.height)) return boost::none;
  if (0 >= rv.width || 0 >= rv.height)     return boost::none;
  if (8 == rv.depth)
    {
      int maxval;
      if (!next_number (data, pos, maxval)) return boost::none;
      if (255 != maxval) return boost::none;
    }

  // exactly one white space character separates header and pixels
  if (pos >= data.size () || !std::isspace (data[pos])) return boost::none;
  rv.offset = pos + 1;

  if (data.size () < rv.offset + rv.octets_per_image ()) return boost::none;

  return rv;
}

octets
encode (int width, int height, int components, int depth,
        const octets& pixels)
{
  format fmt;

  if (8 == depth) {
    if (3 == components) {
      fmt = format ("P6 %1% %2% 255\n");
    } else if (1 == components) {
      fmt = format ("P5 %1% %2% 255\n");
    }
  } else if (1 == depth && 1 == components) {
    fmt = format ("P4 %1% %2%\n");
  }

  if (0 == fmt.size ()) {
    BOOST_THROW_EXCEPTION
      (std::logic_error ((format ("cannot encode images with %1% pixel"
                                  " components each using a bit depth"
                                  " of %2%")
                          % components
                          % depth).str ()));
  }

  info geometry;
  geometry.width = width;
  geometry.height = height;
  geometry.components = components;
  geometry.depth = depth;

  if (pixels.size () != geometry.octets_per_image ())
    BOOST_THROW_EXCEPTION
      (std::logic_error ("pixel data does not match image size"));

  std::string header = (fmt % width % height).str ();

  octets rv (header.begin (), header.end ());
  rv.insert (rv.end (), pixels.begin (), pixels.end ());
  return rv;
}

}       // namespace pnm
}       // namespace scanflow
