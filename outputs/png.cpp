//  png.cpp -- compress page images with libpng
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

#include "png.hpp"

#include <scanflow/log.hpp>
#include <scanflow/pnm.hpp>

#include <boost/throw_exception.hpp>

#include <stdexcept>

#include <png.h>

namespace scanflow {
namespace _out_ {

using std::runtime_error;

namespace {

//! Owns the library's write state and collects its output
struct compression
{
  compression ();
  ~compression ();

  png_structp png_;
  png_infop   info_;
  octets      result_;

  static void error_ (png_structp png, png_const_charp msg);
  static void warning_ (png_structp png, png_const_charp msg);

  static void write_ (png_structp png, png_bytep data, png_size_t n);
  static void flush_ (png_structp png);
};

compression::compression ()
  : png_(png_create_write_struct (PNG_LIBPNG_VER_STRING, this,
                                  &compression::error_,
                                  &compression::warning_))
  , info_(NULL)
{
  if (!png_)
    BOOST_THROW_EXCEPTION (runtime_error ("cannot create PNG compressor"));

  info_ = png_create_info_struct (png_);
  if (!info_)
    {
      png_destroy_write_struct (&png_, NULL);
      BOOST_THROW_EXCEPTION (runtime_error ("cannot create PNG header"));
    }

  png_set_write_fn (png_, this, &compression::write_, &compression::flush_);
}

compression::~compression ()
{
  png_destroy_write_struct (&png_, &info_);
}

//! Must not return to the library
void
compression::error_ (png_structp, png_const_charp msg)
{
  log::fatal (msg);

  BOOST_THROW_EXCEPTION (runtime_error (msg));
}

void
compression::warning_ (png_structp, png_const_charp msg)
{
  log::error (msg);
}

void
compression::write_ (png_structp png, png_bytep data, png_size_t n)
{
  compression *self = static_cast< compression * > (png_get_io_ptr (png));

  self->result_.insert (self->result_.end (), data, data + n);
}

void
compression::flush_ (png_structp)
{}

}       // namespace

std::string
png_exporter::extension () const
{
  return "png";
}

bool
png_exporter::multi_page () const
{
  return false;
}

std::vector< octets >
png_exporter::encode (const document& doc)
{
  std::vector< octets > rv;

  for (document::const_iterator it = doc.begin (); doc.end () != it; ++it)
    {
      rv.push_back (compress (it->image (), it->resolution ()));
      log::trace ("page %1%: %2% octets of PNG data")
        % it->number () % rv.back ().size ();
    }
  return rv;
}

octets
png_exporter::compress (const octets& image, int resolution)
{
  boost::optional< pnm::info > info (pnm::parse (image));

  if (!info)
    BOOST_THROW_EXCEPTION (runtime_error ("not a PNM image"));

  compression c;

  png_set_IHDR (c.png_, c.info_, info->width, info->height, info->depth,
                (3 == info->components
                 ? PNG_COLOR_TYPE_RGB
                 : PNG_COLOR_TYPE_GRAY),
                PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
                PNG_FILTER_TYPE_DEFAULT);

  if (0 < resolution)
    {
      png_uint_32 ppm = resolution / 0.0254 + 0.5;   // pixels per meter
      png_set_pHYs (c.png_, c.info_, ppm, ppm, PNG_RESOLUTION_METER);
    }

  png_write_info (c.png_, c.info_);

  if (1 == info->depth)         // PBM sets bits for black
    png_set_invert_mono (c.png_);

  const octet *data = image.data () + info->offset;
  for (int row = 0; row < info->height; ++row)
    {
      png_write_row (c.png_, const_cast< png_bytep >
                     (data + row * info->octets_per_line ()));
    }

  png_write_end (c.png_, c.info_);

  return c.result_;
}

}       // namespace _out_
}       // namespace scanflow
