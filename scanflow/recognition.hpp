//  recognition.hpp -- text recognition results
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

#ifndef scanflow_recognition_hpp_
#define scanflow_recognition_hpp_

#include <string>
#include <vector>

namespace scanflow {

//! Axis aligned area in image pixel coordinates
struct rectangle
{
  int x;
  int y;
  int width;
  int height;

  rectangle (int x = 0, int y = 0, int width = 0, int height = 0);

  bool operator== (const rectangle& r) const;
  bool operator!= (const rectangle& r) const;
};

//! What a text recognizer found on a page
struct recognition
{
  struct word
  {
    std::string text;
    rectangle   bounds;
    double      confidence;
  };

  struct block
  {
    std::string         text;
    rectangle           bounds;
    std::vector< word > words;
  };

  std::string          text;
  double               confidence;
  std::vector< word >  words;
  std::vector< block > blocks;

  recognition ();
};

}       // namespace scanflow

#endif  /* scanflow_recognition_hpp_ */
