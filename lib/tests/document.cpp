//  document.cpp -- unit tests for pages, documents and PNM headers
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
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "scanflow/document.hpp"
#include "scanflow/page.hpp"
#include "scanflow/pnm.hpp"
#include "scanflow/test/tools.hpp"

using namespace scanflow;

namespace {

octets
gray (int width, int height)
{
  return pnm::encode (width, height, 1, 8,
                      octets (width * height, 0x40));
}

octets
from (const std::string& s)
{
  return octets (s.begin (), s.end ());
}

//! Checks that pages are numbered 1..N in document order
void
check_numbering (const document& doc)
{
  for (document::size_type i = 0; i < doc.size (); ++i)
    {
      BOOST_CHECK_EQ (int (i + 1), doc[i].number ());
    }
}

//! Creates a document with \a n pages and remembers their ids
document
filled (std::size_t n, std::vector< page::id_type >& ids)
{
  document doc;
  ids.clear ();
  for (std::size_t i = 0; i < n; ++i)
    {
      page p (gray (2, 2), 300);
      ids.push_back (p.id ());
      doc.add (p);
    }
  return doc;
}

}       // namespace

BOOST_AUTO_TEST_SUITE (pnm_headers);

BOOST_AUTO_TEST_CASE (color)
{
  octets data (pnm::encode (4, 2, 3, 8, octets (4 * 2 * 3, 0)));
  boost::optional< pnm::info > hdr (pnm::parse (data));

  BOOST_REQUIRE (hdr);
  BOOST_CHECK_EQ (4, hdr->width);
  BOOST_CHECK_EQ (2, hdr->height);
  BOOST_CHECK_EQ (3, hdr->components);
  BOOST_CHECK_EQ (8, hdr->depth);
  BOOST_CHECK_EQ (12u, hdr->octets_per_line ());
  BOOST_CHECK_EQ (data.size (), hdr->offset + hdr->octets_per_image ());
}

BOOST_AUTO_TEST_CASE (bilevel_lines_are_padded)
{
  octets data (pnm::encode (10, 3, 1, 1, octets (2 * 3, 0xff)));
  boost::optional< pnm::info > hdr (pnm::parse (data));

  BOOST_REQUIRE (hdr);
  BOOST_CHECK_EQ (1, hdr->depth);
  BOOST_CHECK_EQ (2u, hdr->octets_per_line ());
}

BOOST_AUTO_TEST_CASE (comments_in_header)
{
  octets data (from ("P5\n# made by hand\n2 1\n255\n"));
  data.push_back (0x00);
  data.push_back (0xff);

  boost::optional< pnm::info > hdr (pnm::parse (data));

  BOOST_REQUIRE (hdr);
  BOOST_CHECK_EQ (2, hdr->width);
  BOOST_CHECK_EQ (1, hdr->height);
}

BOOST_AUTO_TEST_CASE (rejects)
{
  BOOST_CHECK (!pnm::parse (octets ()));
  BOOST_CHECK (!pnm::parse (from ("P3 1 1 255\n0 0 0")));
  BOOST_CHECK (!pnm::parse (from ("P5 1 1 65535\n\x01\x02")));
  BOOST_CHECK (!pnm::parse (from ("P6 2 2 255\nshort")));
  BOOST_CHECK (!pnm::parse (from ("\xff\xd8\xff\xe0")));
}

BOOST_AUTO_TEST_CASE (rejects_oversized_numbers)
{
  std::string header ("P5 4294967297 1 255\n");
  octets data (from (header));
  data.push_back (0);

  BOOST_CHECK (!pnm::parse (data));
  BOOST_CHECK (!pnm::parse (from ("P4 99999999999999999999 1\n")));
}

BOOST_AUTO_TEST_CASE (rejects_empty_geometry)
{
  BOOST_CHECK (!pnm::parse (from ("P5 0 1 255\n")));
  BOOST_CHECK (!pnm::parse (from ("P6 1 0 255\n")));
}

BOOST_AUTO_TEST_CASE (encode_checks_size)
{
  BOOST_CHECK_THROW (pnm::encode (2, 2, 3, 8, octets (5)),
                     std::logic_error);
  BOOST_CHECK_THROW (pnm::encode (2, 2, 3, 16, octets (24)),
                     std::logic_error);
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_SUITE (pages);

BOOST_AUTO_TEST_CASE (geometry_from_image)
{
  page p (gray (5, 7), 150);

  BOOST_CHECK_EQ (5, p.width ());
  BOOST_CHECK_EQ (7, p.height ());
  BOOST_CHECK_EQ (150, p.resolution ());
  BOOST_CHECK_EQ (0, p.number ());
  BOOST_CHECK (!p.enhanced ());
  BOOST_CHECK (!p.thumbnail ());
  BOOST_CHECK (!p.text ());
}

BOOST_AUTO_TEST_CASE (unknown_image_format)
{
  page p (from ("not an image"), 300);

  BOOST_CHECK_EQ (0, p.width ());
  BOOST_CHECK_EQ (0, p.height ());
}

BOOST_AUTO_TEST_CASE (ids_are_unique)
{
  page p (gray (1, 1), 300);
  page q (gray (1, 1), 300);

  BOOST_CHECK (p.id () != q.id ());
  BOOST_CHECK_EQ (36u, to_string (p.id ()).size ());
}

BOOST_AUTO_TEST_CASE (rotation)
{
  page p (gray (1, 1), 300);

  p.rotate (90);
  BOOST_CHECK_EQ (90, p.rotation ());
  p.rotate (270);
  BOOST_CHECK_EQ (0, p.rotation ());
  p.rotate (-90);
  BOOST_CHECK_EQ (270, p.rotation ());
  p.rotate (720);
  BOOST_CHECK_EQ (270, p.rotation ());
}

BOOST_AUTO_TEST_CASE (rotation_by_odd_angle)
{
  page p (gray (1, 1), 300);

  BOOST_CHECK_THROW (p.rotate (45), std::invalid_argument);
  BOOST_CHECK_EQ (0, p.rotation ());
}

BOOST_AUTO_TEST_CASE (crop)
{
  page p (gray (10, 10), 300);
  rectangle r (1, 2, 3, 4);

  p.crop (r);
  BOOST_REQUIRE (p.crop ());
  BOOST_CHECK (r == *p.crop ());

  p.reset_crop ();
  BOOST_CHECK (!p.crop ());
}

BOOST_AUTO_TEST_CASE (recognition_sets_text)
{
  page p (gray (1, 1), 300);
  recognition r;
  r.text = "Hello";
  r.confidence = 0.9;

  p.recognized (r);

  BOOST_REQUIRE (p.text ());
  BOOST_CHECK_EQ ("Hello", *p.text ());
  BOOST_REQUIRE (p.recognized ());
  BOOST_CHECK_EQ (0.9, p.recognized ()->confidence);
}

BOOST_AUTO_TEST_SUITE_END ();

BOOST_AUTO_TEST_SUITE (documents);

BOOST_AUTO_TEST_CASE (defaults)
{
  document doc;

  BOOST_CHECK (doc.empty ());
  BOOST_CHECK_EQ (document::default_name, doc.name ());
  BOOST_CHECK (doc.created () <= doc.modified ());
}

BOOST_AUTO_TEST_CASE (add_numbers_pages)
{
  std::vector< page::id_type > ids;
  document doc (filled (3, ids));

  BOOST_REQUIRE_EQ (3u, doc.size ());
  check_numbering (doc);
  BOOST_CHECK (ids[1] == doc[1].id ());
}

BOOST_AUTO_TEST_CASE (add_touches)
{
  document doc;
  boost::posix_time::ptime before (doc.modified ());

  doc.add (page (gray (1, 1), 300));
  BOOST_CHECK (before <= doc.modified ());
}

BOOST_AUTO_TEST_CASE (reorder_forward)
{
  std::vector< page::id_type > ids;
  document doc (filled (4, ids));

  doc.reorder (0, 2);

  BOOST_CHECK (ids[1] == doc[0].id ());
  BOOST_CHECK (ids[2] == doc[1].id ());
  BOOST_CHECK (ids[0] == doc[2].id ());
  BOOST_CHECK (ids[3] == doc[3].id ());
  check_numbering (doc);
}

BOOST_AUTO_TEST_CASE (reorder_backward)
{
  std::vector< page::id_type > ids;
  document doc (filled (4, ids));

  doc.reorder (3, 1);

  BOOST_CHECK (ids[0] == doc[0].id ());
  BOOST_CHECK (ids[3] == doc[1].id ());
  BOOST_CHECK (ids[1] == doc[2].id ());
  BOOST_CHECK (ids[2] == doc[3].id ());
  check_numbering (doc);
}

BOOST_AUTO_TEST_CASE (reorder_out_of_range)
{
  std::vector< page::id_type > ids;
  document doc (filled (2, ids));

  doc.reorder (0, 2);
  doc.reorder (5, 0);
  doc.reorder (1, 1);

  BOOST_CHECK (ids[0] == doc[0].id ());
  BOOST_CHECK (ids[1] == doc[1].id ());
}

BOOST_AUTO_TEST_CASE (every_move_keeps_numbering)
{
  for (std::size_t n = 1; n <= 5; ++n)
    for (std::size_t src = 0; src < n; ++src)
      for (std::size_t dst = 0; dst < n; ++dst)
        {
          std::vector< page::id_type > ids;
          document doc (filled (n, ids));

          doc.reorder (src, dst);

          BOOST_CHECK_EQ (n, doc.size ());
          BOOST_CHECK (ids[src] == doc[dst].id ());
          check_numbering (doc);
        }
}

BOOST_AUTO_TEST_CASE (remove_renumbers)
{
  std::vector< page::id_type > ids;
  document doc (filled (3, ids));

  doc.remove (ids[0]);

  BOOST_REQUIRE_EQ (2u, doc.size ());
  BOOST_CHECK (ids[1] == doc[0].id ());
  check_numbering (doc);
}

BOOST_AUTO_TEST_CASE (remove_unknown_page)
{
  std::vector< page::id_type > ids;
  document doc (filled (2, ids));

  doc.remove (page (gray (1, 1), 300));

  BOOST_CHECK_EQ (2u, doc.size ());
}

BOOST_AUTO_TEST_CASE (find_by_id)
{
  std::vector< page::id_type > ids;
  document doc (filled (3, ids));

  document::iterator it = doc.find (ids[2]);
  BOOST_REQUIRE (doc.end () != it);
  BOOST_CHECK_EQ (3, it->number ());

  page stranger (gray (1, 1), 300);
  BOOST_CHECK (doc.end () == doc.find (stranger.id ()));
}

BOOST_AUTO_TEST_CASE (clear)
{
  std::vector< page::id_type > ids;
  document doc (filled (3, ids));

  doc.clear ();
  BOOST_CHECK (doc.empty ());
}

BOOST_AUTO_TEST_SUITE_END ();

#include "scanflow/test/runner.ipp"
