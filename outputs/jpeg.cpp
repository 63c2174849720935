//  jpeg.cpp -- JPEG export, one file per page
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

#include "jpeg.hpp"

#include <scanflow/format.hpp>
#include <scanflow/log.hpp>
#include <scanflow/pnm.hpp>

#include <boost/static_assert.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <stdexcept>

namespace scanflow {
namespace _out_ {

using std::runtime_error;

const int jpeg_exporter::default_quality;

namespace {

const std::size_t buffer_size = 8192;

//! State shared with the JPEG library's C callbacks
/*! A pointer to an instance is kept in the compressor's client_data
 *  so the static member functions can get back to it.
 */
struct compression
{
  compression ();
  ~compression ();

  struct jpeg_compress_struct cinfo_;
  struct jpeg_error_mgr       jerr_;
  struct jpeg_destination_mgr dmgr_;

  JOCTET jbuf_[buffer_size];
  octets result_;

  static void error_exit_(j_common_ptr cinfo);
  static void output_message_(j_common_ptr cinfo);

  static void    init_destination_(j_compress_ptr cinfo);
  static boolean empty_output_buffer_(j_compress_ptr cinfo);
  static void    term_destination_(j_compress_ptr cinfo);
};

compression::compression ()
{
  BOOST_STATIC_ASSERT ((sizeof (JOCTET) == sizeof (octet)));

  // Set up the error handler before the compressor is created so
  // that failures during creation end up with us.
  cinfo_.err = jpeg_std_error (&jerr_);
  jerr_.error_exit     = &compression::error_exit_;
  jerr_.output_message = &compression::output_message_;

  jpeg_create_compress (&cinfo_);
  cinfo_.client_data = this;

  dmgr_.init_destination    = &compression::init_destination_;
  dmgr_.empty_output_buffer = &compression::empty_output_buffer_;
  dmgr_.term_destination    = &compression::term_destination_;

  cinfo_.dest = &dmgr_;
}

compression::~compression ()
{
  jpeg_destroy_compress (&cinfo_);
}

void
compression::error_exit_(j_common_ptr cinfo)
{
  char msg[JMSG_LENGTH_MAX];

  cinfo->err->format_message (cinfo, msg);
  jpeg_abort (cinfo);

  log::fatal (msg);

  BOOST_THROW_EXCEPTION (runtime_error (msg));
}

void
compression::output_message_(j_common_ptr cinfo)
{
  char msg[JMSG_LENGTH_MAX];

  cinfo->err->format_message (cinfo, msg);

  log::error (msg);
}

void
compression::init_destination_(j_compress_ptr cinfo)
{
  compression *self = static_cast< compression * > (cinfo->client_data);

  self->dmgr_.next_output_byte = self->jbuf_;
  self->dmgr_.free_in_buffer   = buffer_size;
}

/*! The JPEG library wants the whole buffer flushed here, regardless
 *  of the current values of \c next_output_byte and \c free_in_buffer.
 */
boolean
compression::empty_output_buffer_(j_compress_ptr cinfo)
{
  compression *self = static_cast< compression * > (cinfo->client_data);

  self->result_.insert (self->result_.end (),
                        self->jbuf_, self->jbuf_ + buffer_size);

  self->dmgr_.next_output_byte = self->jbuf_;
  self->dmgr_.free_in_buffer   = buffer_size;

  return true;
}

void
compression::term_destination_(j_compress_ptr cinfo)
{
  compression *self = static_cast< compression * > (cinfo->client_data);

  std::size_t count = buffer_size - self->dmgr_.free_in_buffer;
  self->result_.insert (self->result_.end (),
                        self->jbuf_, self->jbuf_ + count);
}

}       // namespace

jpeg_exporter::jpeg_exporter (int quality)
  : quality_(quality)
{}

std::string
jpeg_exporter::extension () const
{
  return "jpg";
}

bool
jpeg_exporter::multi_page () const
{
  return false;
}

std::vector< octets >
jpeg_exporter::encode (const document& doc)
{
  std::vector< octets > rv;

  for (document::const_iterator it = doc.begin (); doc.end () != it; ++it)
    {
      rv.push_back (compress (it->image (), it->resolution ()));
      log::trace ("page %1%: %2% octets of JPEG data")
        % it->number () % rv.back ().size ();
    }
  return rv;
}

octets
jpeg_exporter::compress (const octets& image, int resolution)
{
  boost::optional< pnm::info > info (pnm::parse (image));

  if (!info)
    BOOST_THROW_EXCEPTION (runtime_error ("not a PNM image"));

  compression c;

  c.cinfo_.image_width      = info->width;
  c.cinfo_.image_height     = info->height;
  c.cinfo_.input_components = info->components;
  c.cinfo_.in_color_space   = (3 == info->components
                               ? JCS_RGB
                               : JCS_GRAYSCALE);

  jpeg_set_defaults (&c.cinfo_);
  jpeg_set_quality  (&c.cinfo_, quality_, true);

  if (0 < resolution && resolution <= 0xffff)
    {
      c.cinfo_.density_unit = 1;    // dots per inch
      c.cinfo_.X_density = resolution;
      c.cinfo_.Y_density = resolution;
    }

  jpeg_start_compress (&c.cinfo_, true);

  octets line (info->width * info->components);
  const octet *data = image.data () + info->offset;

  while (c.cinfo_.next_scanline < c.cinfo_.image_height)
    {
      const octet *src = data + (c.cinfo_.next_scanline
                                 * info->octets_per_line ());

      if (1 == info->depth)     // set bits are black
        {
          for (int x = 0; x < info->width; ++x)
            {
              bool black = src[x / 8] & (0x80 >> (x % 8));
              line[x] = (black ? 0x00 : 0xff);
            }
        }
      else
        {
          std::copy (src, src + line.size (), line.begin ());
        }

      JSAMPROW row = line.data ();
      jpeg_write_scanlines (&c.cinfo_, &row, 1);
    }

  jpeg_finish_compress (&c.cinfo_);

  return c.result_;
}

}       // namespace _out_
}       // namespace scanflow
