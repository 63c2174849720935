//  page.cpp -- captured pages
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

#include <stdexcept>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/throw_exception.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "scanflow/page.hpp"
#include "scanflow/pnm.hpp"

namespace scanflow {

using boost::posix_time::microsec_clock;

page::page (const octets& image, int resolution)
  : id_(boost::uuids::random_generator () ())
  , scanned_at_(microsec_clock::universal_time ())
  , number_(0)
  , width_(0)
  , height_(0)
  , resolution_(resolution)
  , rotation_(0)
  , enhanced_(false)
{
  this->image (image);
}

const page::id_type&
page::id () const
{
  return id_;
}

const boost::posix_time::ptime&
page::scanned_at () const
{
  return scanned_at_;
}

const octets&
page::image () const
{
  return image_;
}

void
page::image (const octets& image)
{
  image_ = image;

  boost::optional< pnm::info > info = pnm::parse (image_);
  width_  = (info ? info->width  : 0);
  height_ = (info ? info->height : 0);
}

const boost::optional< octets >&
page::thumbnail () const
{
  return thumbnail_;
}

void
page::thumbnail (const octets& image)
{
  thumbnail_ = image;
}

int
page::number () const
{
  return number_;
}

void
page::number (int n)
{
  number_ = n;
}

int
page::width () const
{
  return width_;
}

int
page::height () const
{
  return height_;
}

int
page::resolution () const
{
  return resolution_;
}

int
page::rotation () const
{
  return rotation_;
}

void
page::rotate (int degrees)
{
  if (0 != degrees % 90)
    BOOST_THROW_EXCEPTION
      (std::invalid_argument ("rotation must be a multiple of 90 degrees"));

  rotation_ = ((rotation_ + degrees) % 360 + 360) % 360;
}

const boost::optional< rectangle >&
page::crop () const
{
  return crop_;
}

void
page::crop (const rectangle& bounds)
{
  crop_ = bounds;
}

void
page::reset_crop ()
{
  crop_ = boost::none;
}

bool
page::enhanced () const
{
  return enhanced_;
}

void
page::enhanced (bool flag)
{
  enhanced_ = flag;
}

const boost::optional< std::string >&
page::text () const
{
  return text_;
}

const boost::optional< recognition >&
page::recognized () const
{
  return recognized_;
}

void
page::recognized (const recognition& result)
{
  recognized_ = result;
  text_ = result.text;
}

std::string
to_string (const page::id_type& id)
{
  return boost::uuids::to_string (id);
}

}       // namespace scanflow
