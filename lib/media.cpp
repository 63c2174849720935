//  media.cpp -- dimensions of some well-known media
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

#include <map>

#include <boost/assign/list_of.hpp>

#include "scanflow/media.hpp"

namespace scanflow {

namespace {

  const double inches = 1.0;

  typedef std::map< paper_size, media > dictionary;

  const dictionary&
  known_sizes ()
  {
    static const dictionary dict = boost::assign::map_list_of
      (paper_size::letter, media (8.50 * inches, 11.00 * inches))
      (paper_size::legal , media (8.50 * inches, 14.00 * inches))
      (paper_size::a4    , media (8.27 * inches, 11.69 * inches))
      (paper_size::a5    , media (5.83 * inches,  8.27 * inches))
      .convert_to_container< dictionary > ();
    return dict;
  }
}       // namespace

media::media (double width, double height)
  : width_(width)
  , height_(height)
{}

double
media::width () const
{
  return width_;
}

double
media::height () const
{
  return height_;
}

int
media::width (int dpi) const
{
  return static_cast< int > (width_ * dpi);
}

int
media::height (int dpi) const
{
  return static_cast< int > (height_ * dpi);
}

boost::optional< media >
media::lookup (paper_size p)
{
  dictionary::const_iterator it = known_sizes ().find (p);

  if (known_sizes ().end () == it) return boost::none;
  return it->second;
}

}       // namespace scanflow
