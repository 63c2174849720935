//  tiff.cpp -- multi-page TIFF export
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

#include "tiff.hpp"

#include <scanflow/format.hpp>
#include <scanflow/log.hpp>
#include <scanflow/pnm.hpp>

#include <boost/scoped_array.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ios>
#include <stdexcept>

#include <tiffio.h>

namespace scanflow {
namespace _out_ {

using std::ios_base;
using std::runtime_error;

std::string tiff_exporter::err_msg = std::string ();

namespace {

// The TIFF library only allows for library-wide handlers.  Messages
// are forwarded to scanflow::log.  Errors are also stored in the
// class-wide tiff_exporter::err_msg so that a more intelligible
// exception can be thrown.  Clear it before calling the TIFF API.

using boost::scoped_array;

void
handle_error (const char *module, const char *fmt, va_list ap)
{
  va_list aq;
  va_copy (aq, ap);
  int sz = vsnprintf (NULL, 0, fmt, aq);
  va_end (aq);

  scoped_array< char > buf (new char[sz + 1]);

  vsnprintf (buf.get (), sz + 1, fmt, ap);
  log::fatal ("%1%: %2%") % (module ? module : "tiff") % buf.get ();

  tiff_exporter::err_msg = buf.get ();
}

void
handle_warning (const char *module, const char *fmt, va_list ap)
{
  va_list aq;
  va_copy (aq, ap);
  int sz = vsnprintf (NULL, 0, fmt, aq);
  va_end (aq);

  scoped_array< char > buf (new char[sz + 1]);

  vsnprintf (buf.get (), sz + 1, fmt, ap);
  log::alert ("%1%: %2%") % (module ? module : "tiff") % buf.get ();
}

//! Growable in-memory file for TIFFClientOpen()
struct memory_file
{
  octets data;
  toff_t pos;

  memory_file () : pos (0) {}

  static tsize_t
  read (thandle_t h, tdata_t buf, tsize_t n)
  {
    memory_file *self = static_cast< memory_file * > (h);

    if (self->data.size () <= self->pos) return 0;

    tsize_t count = std::min< toff_t > (n, self->data.size () - self->pos);
    std::memcpy (buf, self->data.data () + self->pos, count);
    self->pos += count;
    return count;
  }

  static tsize_t
  write (thandle_t h, tdata_t buf, tsize_t n)
  {
    memory_file *self = static_cast< memory_file * > (h);

    if (self->data.size () < self->pos + n)
      self->data.resize (self->pos + n);

    std::memcpy (self->data.data () + self->pos, buf, n);
    self->pos += n;
    return n;
  }

  static toff_t
  seek (thandle_t h, toff_t off, int whence)
  {
    memory_file *self = static_cast< memory_file * > (h);

    switch (whence)
      {
      case SEEK_SET: self->pos = off; break;
      case SEEK_CUR: self->pos += off; break;
      case SEEK_END: self->pos = self->data.size () + off; break;
      default:
        return toff_t (-1);
      }
    return self->pos;
  }

  static int
  close (thandle_t)
  {
    return 0;
  }

  static toff_t
  size (thandle_t h)
  {
    return static_cast< memory_file * > (h)->data.size ();
  }

  static int
  map (thandle_t, tdata_t *, toff_t *)
  {
    return 0;
  }

  static void
  unmap (thandle_t, tdata_t, toff_t)
  {}
};

void
write_image (TIFF *tiff, const page& p, int page_count)
{
  boost::optional< pnm::info > info (pnm::parse (p.image ()));

  if (!info)
    BOOST_THROW_EXCEPTION
      (runtime_error ((format ("page %1% is not a PNM image")
                       % p.number ()).str ()));

  TIFFSetField (tiff, TIFFTAG_SUBFILETYPE, FILETYPE_PAGE);
  TIFFSetField (tiff, TIFFTAG_PAGENUMBER, p.number () - 1, page_count);

  TIFFSetField (tiff, TIFFTAG_SAMPLESPERPIXEL, info->components);
  TIFFSetField (tiff, TIFFTAG_BITSPERSAMPLE, info->depth);

  if (3 == info->components)
    {
      TIFFSetField (tiff, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
      TIFFSetField (tiff, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    }
  else if (1 == info->depth)    // PBM uses set bits for black
    {
      TIFFSetField (tiff, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISWHITE);
      TIFFSetField (tiff, TIFFTAG_COMPRESSION, COMPRESSION_CCITTFAX4);
    }
  else
    {
      TIFFSetField (tiff, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISBLACK);
    }

  TIFFSetField (tiff, TIFFTAG_IMAGEWIDTH , info->width);
  TIFFSetField (tiff, TIFFTAG_IMAGELENGTH, info->height);
  TIFFSetField (tiff, TIFFTAG_ROWSPERSTRIP, info->height);

  if (0 < p.resolution ())
    {
      float dpi = p.resolution ();
      TIFFSetField (tiff, TIFFTAG_RESOLUTIONUNIT, RESUNIT_INCH);
      TIFFSetField (tiff, TIFFTAG_XRESOLUTION, dpi);
      TIFFSetField (tiff, TIFFTAG_YRESOLUTION, dpi);
    }

  octets line (info->octets_per_line ());
  const octet *data = p.image ().data () + info->offset;

  for (int row = 0; row < info->height; ++row)
    {
      // TIFFWriteScanline() is not const-correct
      const octet *src = data + row * info->octets_per_line ();
      std::copy (src, src + line.size (), line.begin ());

      tiff_exporter::err_msg.clear ();
      if (1 != TIFFWriteScanline (tiff, line.data (), row, 1))
        BOOST_THROW_EXCEPTION (ios_base::failure (tiff_exporter::err_msg));
    }

  tiff_exporter::err_msg.clear ();
  if (!TIFFWriteDirectory (tiff))
    BOOST_THROW_EXCEPTION (ios_base::failure (tiff_exporter::err_msg));
}

}       // namespace

tiff_exporter::tiff_exporter ()
{
  TIFFSetErrorHandler (handle_error);
  TIFFSetWarningHandler (handle_warning);
}

std::string
tiff_exporter::extension () const
{
  return "tiff";
}

bool
tiff_exporter::multi_page () const
{
  return true;
}

std::vector< octets >
tiff_exporter::encode (const document& doc)
{
  if (doc.empty ())
    BOOST_THROW_EXCEPTION
      (runtime_error ("document has no pages to export"));

  memory_file file;

  err_msg.clear ();
  TIFF *tiff = TIFFClientOpen (doc.name ().c_str (), "w",
                               static_cast< thandle_t > (&file),
                               &memory_file::read, &memory_file::write,
                               &memory_file::seek, &memory_file::close,
                               &memory_file::size,
                               &memory_file::map, &memory_file::unmap);
  if (!tiff)
    BOOST_THROW_EXCEPTION (ios_base::failure (err_msg));

  try
    {
      for (document::const_iterator it = doc.begin ();
           doc.end () != it; ++it)
        {
          write_image (tiff, *it, doc.size ());
        }
    }
  catch (...)
    {
      TIFFClose (tiff);
      throw;
    }
  TIFFClose (tiff);

  log::trace ("%1%: %2% page(s), %3% octets of TIFF data")
    % doc.name () % doc.size () % file.data.size ();

  return std::vector< octets > (1, file.data);
}

}       // namespace _out_
}       // namespace scanflow
