//  exporters.cpp -- unit tests for document exporters
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

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include "scanflow/document.hpp"
#include "scanflow/file.hpp"
#include "scanflow/pnm.hpp"
#include "scanflow/services.hpp"
#include "scanflow/test/tools.hpp"

#include "../factory.hpp"
#include "../jpeg.hpp"
#include "../pdf.hpp"
#include "../pdf/object.hpp"
#include "../pdf/writer.hpp"
#include "../pnm.hpp"
#if HAVE_LIBPNG
#include "../png.hpp"
#endif
#if HAVE_LIBTIFF
#include "../tiff.hpp"
#endif

using namespace scanflow;
namespace fs = boost::filesystem;

namespace {

document
make_document (std::size_t pages)
{
  document doc;
  for (std::size_t i = 0; i < pages; ++i)
    {
      doc.add (page (pnm::encode (16, 8, 3, 8, octets (16 * 8 * 3, 0x20 * i)),
                     300));
    }
  return doc;
}

bool
is_jpeg (const octets& data)
{
  return (4 <= data.size ()
          && 0xff == data[0] && 0xd8 == data[1]
          && 0xff == data[data.size () - 2] && 0xd9 == data[data.size () - 1]);
}

std::string
text_of (const octets& data)
{
  return std::string (data.begin (), data.end ());
}

bool
contains (const octets& data, const std::string& s)
{
  return std::string::npos != text_of (data).find (s);
}

document
one_page (const octets& image, int resolution = 300)
{
  document doc;
  doc.add (page (image, resolution));
  return doc;
}

recognition
words (const std::string& text, const rectangle& bounds)
{
  recognition rv;
  recognition::word w;

  w.text = text;
  w.bounds = bounds;
  w.confidence = 0.9;

  rv.text = text;
  rv.words.push_back (w);
  return rv;
}

//! Density in the JFIF APP0 segment that follows the SOI marker
struct jfif_density
{
  int unit;
  int x;
  int y;
};

jfif_density
density_of (const octets& data)
{
  BOOST_REQUIRE_LE (18u, data.size ());
  BOOST_REQUIRE_EQ (0xff, data[2]);
  BOOST_REQUIRE_EQ (0xe0, data[3]);
  BOOST_REQUIRE_EQ ("JFIF", std::string (data.begin () + 6,
                                          data.begin () + 10));

  jfif_density rv;
  rv.unit = data[13];
  rv.x = (data[14] << 8) | data[15];
  rv.y = (data[16] << 8) | data[17];
  return rv;
}

}       // namespace

BOOST_AUTO_TEST_SUITE (pnm_output);

BOOST_AUTO_TEST_CASE (one_file_per_page)
{
  document doc (make_document (3));
  _out_::pnm_exporter exp;

  std::vector< octets > files (exp.encode (doc));

  BOOST_CHECK_EQ ("pnm", exp.extension ());
  BOOST_CHECK (!exp.multi_page ());
  BOOST_REQUIRE_EQ (3u, files.size ());
  BOOST_CHECK (doc[1].image () == files[1]);
}

BOOST_AUTO_TEST_CASE (rejects_foreign_images)
{
  document doc;
  doc.add (page (octets (10, 0xff), 300));

  _out_::pnm_exporter exp;
  BOOST_CHECK_THROW (exp.encode (doc), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_SUITE (jpeg_output);

BOOST_AUTO_TEST_CASE (color)
{
  _out_::jpeg_exporter exp;
  std::vector< octets > files (exp.encode (make_document (2)));

  BOOST_CHECK_EQ ("jpg", exp.extension ());
  BOOST_REQUIRE_EQ (2u, files.size ());
  BOOST_CHECK (is_jpeg (files[0]));
  BOOST_CHECK (is_jpeg (files[1]));
}

BOOST_AUTO_TEST_CASE (grayscale)
{
  _out_::jpeg_exporter exp (90);

  BOOST_CHECK (is_jpeg (exp.compress (pnm::encode (7, 5, 1, 8,
                                                   octets (35, 0x80)))));
}

BOOST_AUTO_TEST_CASE (bilevel)
{
  _out_::jpeg_exporter exp;

  BOOST_CHECK (is_jpeg (exp.compress (pnm::encode (12, 3, 1, 1,
                                                   octets (2 * 3, 0xa5)))));
}

BOOST_AUTO_TEST_CASE (density_from_page_resolution)
{
  document doc;
  doc.add (page (pnm::encode (4, 4, 3, 8, octets (4 * 4 * 3, 0x7f)), 300));

  _out_::jpeg_exporter exp;
  std::vector< octets > files (exp.encode (doc));

  BOOST_REQUIRE_EQ (1u, files.size ());
  jfif_density d (density_of (files[0]));

  BOOST_CHECK_EQ (1, d.unit);
  BOOST_CHECK_EQ (300, d.x);
  BOOST_CHECK_EQ (300, d.y);
}

BOOST_AUTO_TEST_CASE (density_per_page)
{
  document doc;
  doc.add (page (pnm::encode (2, 2, 1, 8, octets (4, 0x10)), 150));
  doc.add (page (pnm::encode (2, 2, 1, 8, octets (4, 0x10)), 600));

  _out_::jpeg_exporter exp;
  std::vector< octets > files (exp.encode (doc));

  BOOST_REQUIRE_EQ (2u, files.size ());
  BOOST_CHECK_EQ (150, density_of (files[0]).x);
  BOOST_CHECK_EQ (600, density_of (files[1]).y);
}

BOOST_AUTO_TEST_CASE (not_an_image)
{
  _out_::jpeg_exporter exp;

  BOOST_CHECK_THROW (exp.compress (octets (64, 0x00)), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END ();

#if HAVE_LIBTIFF
BOOST_AUTO_TEST_SUITE (tiff_output);

BOOST_AUTO_TEST_CASE (single_file)
{
  _out_::tiff_exporter exp;
  std::vector< octets > files (exp.encode (make_document (3)));

  BOOST_CHECK (exp.multi_page ());
  BOOST_REQUIRE_EQ (1u, files.size ());
  BOOST_REQUIRE_LE (4u, files[0].size ());
  BOOST_CHECK ((   'I' == files[0][0] && 'I' == files[0][1])
               || ('M' == files[0][0] && 'M' == files[0][1]));
}

BOOST_AUTO_TEST_CASE (bilevel)
{
  document doc;
  doc.add (page (pnm::encode (20, 4, 1, 1, octets (3 * 4, 0x0f)), 200));

  _out_::tiff_exporter exp;
  BOOST_CHECK_EQ (1u, exp.encode (doc).size ());
}

BOOST_AUTO_TEST_CASE (empty_document)
{
  _out_::tiff_exporter exp;

  BOOST_CHECK_THROW (exp.encode (document ()), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END ();
#endif  /* HAVE_LIBTIFF */

BOOST_AUTO_TEST_SUITE (pdf_objects);

using namespace _out_::_pdf_;

BOOST_AUTO_TEST_CASE (numbers)
{
  BOOST_CHECK_EQ ("144", object (144.0).str ());
  BOOST_CHECK_EQ ("-3", object (-3).str ());
  BOOST_CHECK_EQ ("0.5", object (0.5).str ());
  BOOST_CHECK_EQ ("1.25", object (1.25).str ());
  BOOST_CHECK_EQ ("0.67", object (2.0 / 3).str ());
}

BOOST_AUTO_TEST_CASE (literals_are_escaped)
{
  BOOST_CHECK_EQ ("(a\\(b\\)\\\\)", object::literal ("a(b)\\").str ());
  BOOST_CHECK_EQ ("(\\012)", object::literal ("\n").str ());
}

BOOST_AUTO_TEST_CASE (text_strings)
{
  BOOST_CHECK_EQ ("(Receipts)", object::text ("Receipts").str ());
  BOOST_CHECK_EQ ("<FEFF00430061006600E9>",
                  object::text ("Caf\xc3\xa9").str ());
  BOOST_CHECK_EQ ("<FEFFD83DDCC4>",
                  object::text ("\xf0\x9f\x93\x84").str ());
}

BOOST_AUTO_TEST_CASE (win_ansi)
{
  BOOST_CHECK_EQ ("Caf\xe9 ?", to_win_ansi ("Caf\xc3\xa9 \xe2\x82\xac"));
  BOOST_CHECK_EQ ("??", to_win_ansi ("\xff\xc3"));
}

BOOST_AUTO_TEST_CASE (composites)
{
  array a;
  a.add (object (0)).add (object::name ("Fit")).add (object::reference (4));

  dictionary d;
  d.set ("A", object (1)).set ("B", a).set ("A", object (2));

  BOOST_CHECK_EQ (2u, d.size ());
  BOOST_CHECK (d.has ("B"));
  BOOST_CHECK (!d.has ("C"));
  BOOST_CHECK_EQ ("<< /A 2 /B [0 /Fit 4 0 R] >>", d.str ());
  BOOST_CHECK_EQ ("null", object ().str ());
}

BOOST_AUTO_TEST_CASE (unwritten_objects)
{
  writer w;
  w.header ();

  object_number n = w.allocate ();
  w.allocate ();
  w.write (n, object (1));

  BOOST_CHECK_THROW (w.trailer (dictionary ()), std::logic_error);
}

BOOST_AUTO_TEST_CASE (misuse)
{
  writer w;
  w.header ();

  object_number n = w.allocate ();
  w.write (n, object (1));

  BOOST_CHECK_THROW (w.write (n, object (2)), std::logic_error);
  BOOST_CHECK_THROW (w.write (n + 1, object (2)), std::logic_error);
  BOOST_CHECK_THROW (w.header (), std::logic_error);
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_SUITE (pdf_output);

BOOST_AUTO_TEST_CASE (one_file_for_all_pages)
{
  _out_::pdf_exporter exp;
  std::vector< octets > files (exp.encode (make_document (3)));

  BOOST_CHECK_EQ ("pdf", exp.extension ());
  BOOST_CHECK (exp.multi_page ());
  BOOST_REQUIRE_EQ (1u, files.size ());

  std::string pdf (text_of (files[0]));
  BOOST_CHECK_EQ (0u, pdf.find ("%PDF-1.4\n"));
  BOOST_CHECK_EQ (pdf.size () - 6, pdf.rfind ("%%EOF\n"));
  BOOST_CHECK (contains (files[0], "/Count 3"));
  BOOST_CHECK (contains (files[0], "/Filter /DCTDecode"));
  BOOST_CHECK (contains (files[0], "/ColorSpace /DeviceRGB"));
}

BOOST_AUTO_TEST_CASE (cross_reference_table)
{
  _out_::pdf_exporter exp;
  std::string pdf (text_of (exp.encode (make_document (2))[0]));

  std::string::size_type pos = pdf.rfind ("startxref\n");
  BOOST_REQUIRE (std::string::npos != pos);
  std::size_t xref = std::atol (pdf.c_str () + pos + 10);

  BOOST_REQUIRE_EQ ("xref\n0 ", pdf.substr (xref, 7));

  std::istringstream table (pdf.substr (xref + 5));
  std::size_t first, count;
  table >> first >> count;
  BOOST_CHECK_EQ (0u, first);
  BOOST_REQUIRE_LT (1u, count);

  std::string line;
  std::getline (table, line);
  std::getline (table, line);
  BOOST_CHECK_EQ ("0000000000 65535 f ", line);

  for (std::size_t n = 1; n < count; ++n)
    {
      std::getline (table, line);
      BOOST_REQUIRE_EQ (19u, line.size ());

      std::size_t offset = std::atol (line.c_str ());
      std::ostringstream head;
      head << n << " 0 obj\n";
      BOOST_CHECK_EQ (head.str (), pdf.substr (offset, head.str ().size ()));
    }
}

BOOST_AUTO_TEST_CASE (page_size_from_resolution)
{
  _out_::pdf_exporter exp;
  octets image (pnm::encode (600, 300, 1, 8, octets (600 * 300, 0x80)));

  std::vector< octets > files (exp.encode (one_page (image, 300)));

  BOOST_CHECK (contains (files[0], "/MediaBox [0 0 144 72]"));
  BOOST_CHECK (contains (files[0], "/ColorSpace /DeviceGray"));
  BOOST_CHECK (contains (files[0], "/Width 600 /Height 300"));
}

BOOST_AUTO_TEST_CASE (rotation_and_crop)
{
  document doc (one_page (pnm::encode (600, 300, 1, 8,
                                       octets (600 * 300, 0x80))));
  doc[0].rotate (90);
  doc[0].crop (rectangle (0, 0, 300, 150));

  _out_::pdf_exporter exp;
  std::vector< octets > files (exp.encode (doc));

  BOOST_CHECK (contains (files[0], "/Rotate 90"));
  BOOST_CHECK (contains (files[0], "/CropBox [0 36 72 72]"));
}

BOOST_AUTO_TEST_CASE (bilevel_pages_kept_as_is)
{
  _out_::pdf_exporter exp;
  octets image (pnm::encode (16, 2, 1, 1, octets (2 * 2, 0xf0)));

  std::vector< octets > files (exp.encode (one_page (image)));

  BOOST_CHECK (contains (files[0], "/BitsPerComponent 1"));
  BOOST_CHECK (contains (files[0], "/Decode [1 0]"));
  BOOST_CHECK (!contains (files[0], "DCTDecode"));
  BOOST_CHECK (contains (files[0], "/Length 4 >>\nstream\n\xf0\xf0\xf0\xf0"
                                   "\nendstream"));
}

BOOST_AUTO_TEST_CASE (title_from_document_name)
{
  document doc (make_document (1));
  doc.name ("Invoice (March)");

  _out_::pdf_exporter exp;
  std::vector< octets > files (exp.encode (doc));

  BOOST_CHECK (contains (files[0], "/Title (Invoice \\(March\\))"));
  BOOST_CHECK (contains (files[0], "/CreationDate (D:"));
}

BOOST_AUTO_TEST_CASE (invisible_text_layer)
{
  document doc (make_document (1));
  doc[0].recognized (words ("Hello", rectangle (0, 0, 100, 20)));

  _out_::pdf_exporter exp;
  std::vector< octets > files (exp.encode (doc));

  BOOST_CHECK (contains (files[0], "BT\n3 Tr\n"));
  BOOST_CHECK (contains (files[0], "(Hello) Tj"));
  BOOST_CHECK (contains (files[0], "/BaseFont /Helvetica"));
  BOOST_CHECK (contains (files[0], "/ProcSet [/PDF /ImageC /Text]"));
}

BOOST_AUTO_TEST_CASE (text_without_word_positions)
{
  document doc (make_document (1));
  recognition r;
  r.text = "line one\nline two";
  doc[0].recognized (r);

  _out_::pdf_exporter exp;
  std::vector< octets > files (exp.encode (doc));

  BOOST_CHECK (contains (files[0], "(line one) '\n(line two) '\n"));
}

BOOST_AUTO_TEST_CASE (no_text_layer_without_recognition)
{
  _out_::pdf_exporter exp;
  std::vector< octets > files (exp.encode (make_document (2)));

  BOOST_CHECK (!contains (files[0], "3 Tr"));
  BOOST_CHECK (!contains (files[0], "/Font"));
}

BOOST_AUTO_TEST_CASE (empty_document)
{
  _out_::pdf_exporter exp;

  BOOST_CHECK_THROW (exp.encode (document ()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE (rejects_foreign_images)
{
  _out_::pdf_exporter exp;

  BOOST_CHECK_THROW (exp.encode (one_page (octets (10, 0xff))),
                     std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END ();

#if HAVE_LIBPNG
BOOST_AUTO_TEST_SUITE (png_output);

BOOST_AUTO_TEST_CASE (one_file_per_page)
{
  _out_::png_exporter exp;
  std::vector< octets > files (exp.encode (make_document (2)));

  BOOST_CHECK_EQ ("png", exp.extension ());
  BOOST_CHECK (!exp.multi_page ());
  BOOST_REQUIRE_EQ (2u, files.size ());
  BOOST_CHECK_EQ ("\x89PNG\r\n\x1a\n", text_of (files[0]).substr (0, 8));

  // IHDR is the first chunk: bit depth then color type
  BOOST_CHECK_EQ (8, files[0][24]);
  BOOST_CHECK_EQ (2, files[0][25]);
}

BOOST_AUTO_TEST_CASE (bilevel)
{
  _out_::png_exporter exp;
  octets png (exp.compress (pnm::encode (12, 3, 1, 1, octets (2 * 3, 0xa5))));

  BOOST_CHECK_EQ (1, png[24]);
  BOOST_CHECK_EQ (0, png[25]);
}

BOOST_AUTO_TEST_CASE (physical_pixel_size)
{
  _out_::png_exporter exp;
  std::vector< octets > files (exp.encode (make_document (1)));

  std::string png (text_of (files[0]));
  std::string::size_type pos = png.find ("pHYs");
  BOOST_REQUIRE (std::string::npos != pos);

  const octets& d (files[0]);
  unsigned long x = ((d[pos + 4] << 24) | (d[pos + 5] << 16)
                     | (d[pos + 6] << 8) | d[pos + 7]);
  BOOST_CHECK_EQ (11811u, x);   // 300 dpi
  BOOST_CHECK_EQ (1, d[pos + 12]);
}

BOOST_AUTO_TEST_CASE (not_an_image)
{
  _out_::png_exporter exp;

  BOOST_CHECK_THROW (exp.compress (octets (64, 0x00)), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END ();
#endif  /* HAVE_LIBPNG */

BOOST_AUTO_TEST_SUITE (creation);

BOOST_AUTO_TEST_CASE (known_types)
{
  BOOST_CHECK_EQ ("pnm", _out_::create ("pnm")->extension ());
  BOOST_CHECK_EQ ("jpg", _out_::create ("JPEG")->extension ());
  BOOST_CHECK_EQ ("jpg", _out_::create ("jpg")->extension ());
  BOOST_CHECK_EQ ("pdf", _out_::create ("PDF")->extension ());
#if HAVE_LIBPNG
  BOOST_CHECK_EQ ("png", _out_::create ("png")->extension ());
#endif
}

BOOST_AUTO_TEST_CASE (unknown_type)
{
  BOOST_CHECK_THROW (_out_::create ("bmp"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE (listed_types_can_be_created)
{
  std::vector< std::string > types (_out_::types ());

  BOOST_CHECK (!types.empty ());
  for (std::vector< std::string >::const_iterator it = types.begin ();
       types.end () != it; ++it)
    {
      BOOST_CHECK (_out_::create (*it));
    }
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_SUITE (saving);

BOOST_AUTO_TEST_CASE (numbered_files)
{
  test::temporary_directory dir;
  _out_::pnm_exporter exp;

  std::vector< std::string > names
    (save (exp, make_document (2), dir / "scan-%i"));

  BOOST_REQUIRE_EQ (2u, names.size ());
  BOOST_CHECK_EQ (dir / "scan-1.pnm", names[0]);
  BOOST_CHECK_EQ (dir / "scan-2.pnm", names[1]);
  BOOST_CHECK (fs::exists (names[1]));
}

BOOST_AUTO_TEST_CASE (counter_is_added)
{
  test::temporary_directory dir;
  _out_::pnm_exporter exp;

  std::vector< std::string > names
    (save (exp, make_document (2), dir / "receipt.pnm"));

  BOOST_REQUIRE_EQ (2u, names.size ());
  BOOST_CHECK_EQ (dir / "receipt-1.pnm", names[0]);
  BOOST_CHECK_EQ (dir / "receipt-2.pnm", names[1]);
}

BOOST_AUTO_TEST_CASE (single_page_keeps_name)
{
  test::temporary_directory dir;
  _out_::jpeg_exporter exp;

  std::vector< std::string > names
    (save (exp, make_document (1), dir / "photo"));

  BOOST_REQUIRE_EQ (1u, names.size ());
  BOOST_CHECK_EQ (dir / "photo.jpg", names[0]);
  BOOST_CHECK (is_jpeg (read_file (names[0])));
}

BOOST_AUTO_TEST_CASE (existing_files_are_kept)
{
  test::temporary_directory dir;
  octets precious (3, 'x');
  write_file (dir / "report.pdf", precious);
  write_file (dir / "report (1).pdf", precious);

  _out_::pdf_exporter exp;
  std::vector< std::string > names
    (save (exp, make_document (2), dir / "report"));

  BOOST_REQUIRE_EQ (1u, names.size ());
  BOOST_CHECK_EQ (dir / "report (2).pdf", names[0]);
  BOOST_CHECK (precious == read_file (dir / "report.pdf"));
  BOOST_CHECK (precious == read_file (dir / "report (1).pdf"));
  BOOST_CHECK (contains (read_file (names[0]), "%PDF-"));
}

BOOST_AUTO_TEST_CASE (taken_page_numbers_are_skipped)
{
  test::temporary_directory dir;
  write_file (dir / "scan-2.pnm", octets (1, 'x'));

  _out_::pnm_exporter exp;
  std::vector< std::string > names
    (save (exp, make_document (2), dir / "scan-%i"));

  BOOST_REQUIRE_EQ (2u, names.size ());
  BOOST_CHECK_EQ (dir / "scan-1.pnm", names[0]);
  BOOST_CHECK_EQ (dir / "scan-2 (1).pnm", names[1]);
  BOOST_CHECK_EQ (1u, read_file (dir / "scan-2.pnm").size ());
}

BOOST_AUTO_TEST_SUITE_END ();

#include "scanflow/test/runner.ipp"
