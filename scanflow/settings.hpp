//  settings.hpp -- scan parameters and their textual names
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

#ifndef scanflow_settings_hpp_
#define scanflow_settings_hpp_

#include <iosfwd>
#include <string>

namespace scanflow {

enum class color_mode
{
  color,
  grayscale,
  black_and_white,
};

enum class paper_size
{
  letter,
  legal,
  a4,
  a5,
  custom,
};

//! Where on the device the media to scan comes from
enum class scan_source
{
  automatic,
  flatbed,
  feeder,
  duplex,
  film,
  feeder_front,
  feeder_back,
};

//! Tells whether \a s takes media from the document feeder
bool is_feeder (scan_source s);

//! Human readable label for \a s, suitable for menus
std::string display_name (scan_source s);
//! One sentence explanation of what \a s does
std::string description (scan_source s);

//  Stream operators use the names accepted on the command-line and
//  in preferences files, e.g. "black-and-white" or "feeder-front".

std::ostream& operator<< (std::ostream& os, const color_mode& m);
std::ostream& operator<< (std::ostream& os, const paper_size& p);
std::ostream& operator<< (std::ostream& os, const scan_source& s);

std::istream& operator>> (std::istream& is, color_mode& m);
std::istream& operator>> (std::istream& is, paper_size& p);
std::istream& operator>> (std::istream& is, scan_source& s);

//! All parameters of a single scan request
/*! Settings are plain values.  Nothing is validated here: anything
 *  the device cannot honor is dealt with when the settings are put
 *  to use.  Brightness and contrast offsets of zero mean that the
 *  device's own defaults apply.
 *
 *  The auto_crop(), auto_enhance(), auto_ocr() and ocr_language()
 *  hints are meant for post-processing and are not looked at by the
 *  scanner itself.
 */
class settings
{
public:
  settings ();

  //! Returns an independent copy
  settings clone () const;

  int resolution () const;
  color_mode mode () const;
  paper_size paper () const;
  scan_source source () const;
  bool duplex () const;
  int brightness () const;
  int contrast () const;

  bool auto_crop () const;
  bool auto_enhance () const;
  bool auto_ocr () const;
  const std::string& ocr_language () const;

  settings& resolution (int dpi);
  settings& mode (color_mode m);
  settings& paper (paper_size p);
  settings& source (scan_source s);
  settings& duplex (bool flag);
  settings& brightness (int offset);
  settings& contrast (int offset);

  settings& auto_crop (bool flag);
  settings& auto_enhance (bool flag);
  settings& auto_ocr (bool flag);
  settings& ocr_language (const std::string& code);

private:
  int         resolution_;
  color_mode  mode_;
  paper_size  paper_;
  scan_source source_;
  bool        duplex_;
  int         brightness_;
  int         contrast_;

  bool        auto_crop_;
  bool        auto_enhance_;
  bool        auto_ocr_;
  std::string ocr_language_;
};

}       // namespace scanflow

#endif  /* scanflow_settings_hpp_ */
