//  settings.cpp -- scan parameters and their textual names
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

#include <istream>
#include <ostream>
#include <utility>

#include <boost/algorithm/string/case_conv.hpp>

#include "scanflow/i18n.hpp"
#include "scanflow/settings.hpp"

namespace scanflow {

namespace {

template< typename E >
struct named
{
  E           key;
  const char *name;
};

const named< color_mode > mode_names[] = {
  { color_mode::color          , "color"           },
  { color_mode::grayscale      , "grayscale"       },
  { color_mode::black_and_white, "black-and-white" },
};

const named< paper_size > paper_names[] = {
  { paper_size::letter, "letter" },
  { paper_size::legal , "legal"  },
  { paper_size::a4    , "a4"     },
  { paper_size::a5    , "a5"     },
  { paper_size::custom, "custom" },
};

const named< scan_source > source_names[] = {
  { scan_source::automatic   , "auto"         },
  { scan_source::flatbed     , "flatbed"      },
  { scan_source::feeder      , "feeder"       },
  { scan_source::duplex      , "duplex"       },
  { scan_source::film        , "film"         },
  { scan_source::feeder_front, "feeder-front" },
  { scan_source::feeder_back , "feeder-back"  },
};

template< typename E, std::size_t N >
std::ostream&
put (std::ostream& os, const named< E > (&table)[N], const E& e)
{
  for (std::size_t i = 0; i < N; ++i)
    {
      if (table[i].key == e) return os << table[i].name;
    }
  return os << static_cast< int > (e);
}

template< typename E, std::size_t N >
std::istream&
get (std::istream& is, const named< E > (&table)[N], E& e)
{
  std::string name;
  if (!(is >> name)) return is;

  boost::algorithm::to_lower (name);
  for (std::size_t i = 0; i < N; ++i)
    {
      if (name == table[i].name)
        {
          e = table[i].key;
          return is;
        }
    }
  is.setstate (std::ios_base::failbit);
  return is;
}

}       // namespace

bool
is_feeder (scan_source s)
{
  return (scan_source::feeder == s
          || scan_source::duplex == s
          || scan_source::feeder_front == s
          || scan_source::feeder_back == s);
}

std::string
display_name (scan_source s)
{
  switch (s)
    {
    case scan_source::automatic   : return _("Auto");
    case scan_source::flatbed     : return _("Flatbed");
    case scan_source::feeder      : return _("Document Feeder");
    case scan_source::duplex      : return _("Duplex (2-sided)");
    case scan_source::film        : return _("Film/Transparency");
    case scan_source::feeder_front: return _("Feeder (Front only)");
    case scan_source::feeder_back : return _("Feeder (Back only)");
    }
  return std::string ();
}

std::string
description (scan_source s)
{
  switch (s)
    {
    case scan_source::automatic:
      return _("Automatically select the best available source");
    case scan_source::flatbed:
      return _("Scan from the flatbed glass");
    case scan_source::feeder:
      return _("Scan from the automatic document feeder");
    case scan_source::duplex:
      return _("Scan both sides of pages from the document feeder");
    case scan_source::film:
      return _("Scan film negatives or transparencies");
    case scan_source::feeder_front:
      return _("Scan only the front side of pages");
    case scan_source::feeder_back:
      return _("Scan only the back side of pages");
    }
  return std::string ();
}

std::ostream&
operator<< (std::ostream& os, const color_mode& m)
{
  return put (os, mode_names, m);
}

std::ostream&
operator<< (std::ostream& os, const paper_size& p)
{
  return put (os, paper_names, p);
}

std::ostream&
operator<< (std::ostream& os, const scan_source& s)
{
  return put (os, source_names, s);
}

std::istream&
operator>> (std::istream& is, color_mode& m)
{
  return get (is, mode_names, m);
}

std::istream&
operator>> (std::istream& is, paper_size& p)
{
  return get (is, paper_names, p);
}

std::istream&
operator>> (std::istream& is, scan_source& s)
{
  return get (is, source_names, s);
}

settings::settings ()
  : resolution_(300)
  , mode_(color_mode::color)
  , paper_(paper_size::letter)
  , source_(scan_source::automatic)
  , duplex_(false)
  , brightness_(0)
  , contrast_(0)
  , auto_crop_(true)
  , auto_enhance_(true)
  , auto_ocr_(true)
  , ocr_language_("eng")
{}

settings
settings::clone () const
{
  return settings (*this);
}

int
settings::resolution () const
{
  return resolution_;
}

color_mode
settings::mode () const
{
  return mode_;
}

paper_size
settings::paper () const
{
  return paper_;
}

scan_source
settings::source () const
{
  return source_;
}

bool
settings::duplex () const
{
  return duplex_;
}

int
settings::brightness () const
{
  return brightness_;
}

int
settings::contrast () const
{
  return contrast_;
}

bool
settings::auto_crop () const
{
  return auto_crop_;
}

bool
settings::auto_enhance () const
{
  return auto_enhance_;
}

bool
settings::auto_ocr () const
{
  return auto_ocr_;
}

const std::string&
settings::ocr_language () const
{
  return ocr_language_;
}

settings&
settings::resolution (int dpi)
{
  resolution_ = dpi;
  return *this;
}

settings&
settings::mode (color_mode m)
{
  mode_ = m;
  return *this;
}

settings&
settings::paper (paper_size p)
{
  paper_ = p;
  return *this;
}

settings&
settings::source (scan_source s)
{
  source_ = s;
  return *this;
}

settings&
settings::duplex (bool flag)
{
  duplex_ = flag;
  return *this;
}

settings&
settings::brightness (int offset)
{
  brightness_ = offset;
  return *this;
}

settings&
settings::contrast (int offset)
{
  contrast_ = offset;
  return *this;
}

settings&
settings::auto_crop (bool flag)
{
  auto_crop_ = flag;
  return *this;
}

settings&
settings::auto_enhance (bool flag)
{
  auto_enhance_ = flag;
  return *this;
}

settings&
settings::auto_ocr (bool flag)
{
  auto_ocr_ = flag;
  return *this;
}

settings&
settings::ocr_language (const std::string& code)
{
  ocr_language_ = code;
  return *this;
}

}       // namespace scanflow
