//  pdf.cpp -- put a document's pages in a PDF file
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

#include "pdf.hpp"
#include "pdf/object.hpp"
#include "pdf/writer.hpp"

#include <scanflow/format.hpp>
#include <scanflow/log.hpp>
#include <scanflow/pnm.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace scanflow {
namespace _out_ {

using _pdf_::array;
using _pdf_::dictionary;
using _pdf_::object;
using _pdf_::object_number;
using std::runtime_error;

const int pdf_exporter::text_size;

namespace {

const double points_per_inch = 72.0;

//! Maps image pixels onto PDF's default user space [p 199]
/*! User space units are 1/72 inch and its y axis points up whereas
 *  image rows are counted from the top.
 */
struct geometry
{
  geometry (const pnm::info& info, int resolution)
    : dpi_(0 < resolution ? resolution : points_per_inch)
    , rows_(info.height)
    , width (length (info.width))
    , height (length (info.height))
  {}

  double length (int pixels) const { return pixels * points_per_inch / dpi_; }
  double x (int column) const { return length (column); }
  double y (int row) const { return length (rows_ - row); }

private:
  double dpi_;
  int rows_;

public:
  const double width;
  const double height;
};

std::string
num (double d)
{
  return object (d).str ();
}

//! Lays invisible text over the image, where the words were found
/*! Without word positions the text is written line by line from the
 *  top left corner.  Rendering mode 3 neither fills nor strokes the
 *  glyphs [p 402].
 */
std::string
text_layer (const recognition& r, const geometry& g)
{
  std::ostringstream os;

  os << "BT\n3 Tr\n";
  if (!r.words.empty ())
    {
      for (std::vector< recognition::word >::const_iterator
             it = r.words.begin (); r.words.end () != it; ++it)
        {
          const rectangle& b (it->bounds);
          std::string s (_pdf_::to_win_ansi (it->text));

          if (s.empty () || 0 >= b.width || 0 >= b.height) continue;

          // stretch the glyphs to cover the word's box, assuming an
          // average advance of half the font size
          double size = g.length (b.height);
          double stretch = 100 * g.length (b.width) / (0.5 * size * s.size ());

          os << "/F1 " << num (size) << " Tf\n"
             << num (stretch) << " Tz\n"
             << "1 0 0 1 " << num (g.x (b.x)) << " "
             << num (g.y (b.y + b.height)) << " Tm\n"
             << object::literal (s) << " Tj\n";
        }
    }
  else
    {
      os << "/F1 " << pdf_exporter::text_size << " Tf\n"
         << num (1.2 * pdf_exporter::text_size) << " TL\n"
         << "1 0 0 1 0 " << num (g.height) << " Tm\n";

      std::istringstream lines (r.text);
      std::string line;
      while (std::getline (lines, line))
        {
          os << object::literal (_pdf_::to_win_ansi (line)) << " '\n";
        }
    }
  os << "ET\n";

  return os.str ();
}

bool
has_text (const page& p)
{
  return (p.recognized ()
          && (!p.recognized ()->words.empty ()
              || !p.recognized ()->text.empty ()));
}

//! Formats \a t as a PDF date [p 160]
std::string
date (const boost::posix_time::ptime& t)
{
  std::string s (boost::posix_time::to_iso_string (t));

  s.erase (std::remove (s.begin (), s.end (), 'T'), s.end ());
  return "D:" + s.substr (0, 14);
}

}       // namespace

pdf_exporter::pdf_exporter (int quality)
  : jpeg_(quality)
{}

std::string
pdf_exporter::extension () const
{
  return "pdf";
}

bool
pdf_exporter::multi_page () const
{
  return true;
}

std::vector< octets >
pdf_exporter::encode (const document& doc)
{
  if (doc.empty ())
    BOOST_THROW_EXCEPTION
      (runtime_error ("document has no pages to export"));

  _pdf_::writer w;
  w.header ();

  object_number info    = w.allocate ();
  object_number catalog = w.allocate ();
  object_number pages   = w.allocate ();
  object_number font    = 0;

  array kids;

  for (document::const_iterator it = doc.begin (); doc.end () != it; ++it)
    {
      boost::optional< pnm::info > hdr (pnm::parse (it->image ()));
      if (!hdr)
        BOOST_THROW_EXCEPTION
          (runtime_error ((format ("page %1%: not a PNM image")
                           % it->number ()).str ()));

      geometry g (*hdr, it->resolution ());
      bool text (has_text (*it));

      if (text && !font) font = w.allocate ();

      object_number pg       = w.allocate ();
      object_number contents = w.allocate ();
      object_number image    = w.allocate ();

      kids.add (object::reference (pg));

      dictionary xobjects;
      xobjects.set ("Im1", object::reference (image));

      array procset;
      procset.add (object::name ("PDF"))
        .add (object::name (3 == hdr->components ? "ImageC" : "ImageB"));

      dictionary resources;
      resources.set ("XObject", xobjects);
      if (text)
        {
          dictionary fonts;
          fonts.set ("F1", object::reference (font));
          resources.set ("Font", fonts);
          procset.add (object::name ("Text"));
        }
      resources.set ("ProcSet", procset);

      array mbox;
      mbox.add (object (0)).add (object (0))
        .add (object (g.width)).add (object (g.height));

      dictionary d;
      d.set ("Type", object::name ("Page"))
        .set ("Parent", object::reference (pages))
        .set ("Resources", resources)
        .set ("MediaBox", mbox)
        .set ("Contents", object::reference (contents));

      if (it->crop ())
        {
          const rectangle& c (*it->crop ());
          array cbox;
          cbox.add (object (g.x (c.x)))
            .add (object (g.y (c.y + c.height)))
            .add (object (g.x (c.x + c.width)))
            .add (object (g.y (c.y)));
          d.set ("CropBox", cbox);
        }
      if (it->rotation ())
        d.set ("Rotate", object (it->rotation ()));

      w.write (pg, d);

      std::string ops ("q\n" + num (g.width) + " 0 0 " + num (g.height)
                       + " 0 0 cm\n/Im1 Do\nQ\n");
      if (text)
        ops += text_layer (*it->recognized (), g);
      w.write (contents, dictionary (), ops);

      dictionary img;
      img.set ("Type", object::name ("XObject"))
        .set ("Subtype", object::name ("Image"))
        .set ("Width", object (hdr->width))
        .set ("Height", object (hdr->height));

      if (1 == hdr->depth)      // set bits are black
        {
          array decode;
          decode.add (object (1)).add (object (0));
          img.set ("ColorSpace", object::name ("DeviceGray"))
            .set ("BitsPerComponent", object (1))
            .set ("Decode", decode);

          octets::const_iterator pixels (it->image ().begin () + hdr->offset);
          w.write (image, img,
                   octets (pixels, pixels + hdr->octets_per_image ()));
        }
      else
        {
          img.set ("ColorSpace", object::name (3 == hdr->components
                                               ? "DeviceRGB"
                                               : "DeviceGray"))
            .set ("BitsPerComponent", object (8))
            .set ("Filter", object::name ("DCTDecode"));

          w.write (image, img,
                   jpeg_.compress (it->image (), it->resolution ()));
        }
    }

  dictionary d;
  d.set ("Type", object::name ("Pages"))
    .set ("Kids", kids)
    .set ("Count", object (int (kids.size ())));
  w.write (pages, d);

  d = dictionary ();
  d.set ("Type", object::name ("Catalog"))
    .set ("Pages", object::reference (pages));
  w.write (catalog, d);

  d = dictionary ();
  d.set ("Title", object::text (doc.name ()))
    .set ("Producer", object::literal ("scanflow"))
    .set ("Creator", object::literal ("scanflow"));
  if (!doc.created ().is_special ())
    d.set ("CreationDate", object::literal (date (doc.created ())));
  w.write (info, d);

  if (font)
    {
      d = dictionary ();
      d.set ("Type", object::name ("Font"))
        .set ("Subtype", object::name ("Type1"))
        .set ("BaseFont", object::name ("Helvetica"))
        .set ("Encoding", object::name ("WinAnsiEncoding"));
      w.write (font, d);
    }

  d = dictionary ();
  d.set ("Root", object::reference (catalog))
    .set ("Info", object::reference (info));
  w.trailer (d);

  log::trace ("%1%: %2% page(s), %3% octets of PDF data")
    % doc.name () % doc.size () % w.data ().size ();

  return std::vector< octets > (1, w.data ());
}

}       // namespace _out_
}       // namespace scanflow
