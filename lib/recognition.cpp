//  recognition.cpp -- text recognition results
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

#include "scanflow/recognition.hpp"

namespace scanflow {

rectangle::rectangle (int x, int y, int width, int height)
  : x (x), y (y), width (width), height (height)
{}

bool
rectangle::operator== (const rectangle& r) const
{
  return (x == r.x && y == r.y
          && width == r.width && height == r.height);
}

bool
rectangle::operator!= (const rectangle& r) const
{
  return !(*this == r);
}

recognition::recognition ()
  : confidence (0.0)
{}

}       // namespace scanflow
