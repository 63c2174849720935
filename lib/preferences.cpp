//  preferences.cpp -- persisted scan defaults and application preferences
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
#include <ios>
#include <sstream>

#include <boost/assign/list_of.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/program_options.hpp>
#include <boost/throw_exception.hpp>

#include "scanflow/format.hpp"
#include "scanflow/log.hpp"
#include "scanflow/preferences.hpp"

namespace fs = boost::filesystem;
namespace po = boost::program_options;

using std::ios_base;

namespace scanflow {

namespace {

po::options_description
schema ()
{
  po::options_description rv;

  rv.add_options ()
    ("scan.resolution"  , po::value< int > ())
    ("scan.color-mode"  , po::value< color_mode > ())
    ("scan.paper-size"  , po::value< paper_size > ())
    ("scan.source"      , po::value< scan_source > ())
    ("scan.duplex"      , po::value< bool > ())
    ("scan.brightness"  , po::value< int > ())
    ("scan.contrast"    , po::value< int > ())
    ("scan.auto-crop"   , po::value< bool > ())
    ("scan.auto-enhance", po::value< bool > ())
    ("scan.auto-ocr"    , po::value< bool > ())
    ("scan.ocr-language", po::value< std::string > ())
    ("export.directory" , po::value< std::string > ())
    ("export.format"    , po::value< std::string > ())
    ("export.pattern"   , po::value< std::string > ())
    ;

  return rv;
}

template< typename T >
bool
lookup (const po::variables_map& vm, const char *key, T& t)
{
  po::variables_map::const_iterator it = vm.find (key);

  if (vm.end () == it) return false;

  t = it->second.as< T > ();
  return true;
}

std::string
home_directory ()
{
  const char *home = std::getenv ("HOME");
  return (home ? home : ".");
}

}       // namespace

preferences::preferences ()
  : export_directory_(home_directory ())
  , export_format_("pnm")
  , export_pattern_("scan-%i")
{}

settings&
preferences::scan ()
{
  return scan_;
}

const settings&
preferences::scan () const
{
  return scan_;
}

const std::string&
preferences::export_directory () const
{
  return export_directory_;
}

const std::string&
preferences::export_format () const
{
  return export_format_;
}

const std::string&
preferences::export_pattern () const
{
  return export_pattern_;
}

preferences&
preferences::export_directory (const std::string& dir)
{
  export_directory_ = dir;
  return *this;
}

preferences&
preferences::export_format (const std::string& type)
{
  export_format_ = type;
  return *this;
}

preferences&
preferences::export_pattern (const std::string& pattern)
{
  export_pattern_ = pattern;
  return *this;
}

preferences
preferences::load (const std::string& path)
{
  preferences rv;

  if (!fs::exists (path))
    {
      log::brief ("%1% not found, using defaults") % path;
      return rv;
    }

  po::variables_map vm;
  try
    {
      fs::ifstream ifs (path);
      if (!ifs)
        BOOST_THROW_EXCEPTION
          (ios_base::failure ((format ("cannot open %1%") % path).str ()));

      po::store (po::parse_config_file (ifs, schema (), true), vm);
      po::notify (vm);
    }
  catch (const std::exception& e)
    {
      log::error ("%1%: %2%, using defaults") % path % e.what ();
      return rv;
    }

  int i;
  bool b;
  std::string s;
  color_mode m;
  paper_size p;
  scan_source src;

  if (lookup (vm, "scan.resolution"  , i))   rv.scan_.resolution (i);
  if (lookup (vm, "scan.color-mode"  , m))   rv.scan_.mode (m);
  if (lookup (vm, "scan.paper-size"  , p))   rv.scan_.paper (p);
  if (lookup (vm, "scan.source"      , src)) rv.scan_.source (src);
  if (lookup (vm, "scan.duplex"      , b))   rv.scan_.duplex (b);
  if (lookup (vm, "scan.brightness"  , i))   rv.scan_.brightness (i);
  if (lookup (vm, "scan.contrast"    , i))   rv.scan_.contrast (i);
  if (lookup (vm, "scan.auto-crop"   , b))   rv.scan_.auto_crop (b);
  if (lookup (vm, "scan.auto-enhance", b))   rv.scan_.auto_enhance (b);
  if (lookup (vm, "scan.auto-ocr"    , b))   rv.scan_.auto_ocr (b);
  if (lookup (vm, "scan.ocr-language", s))   rv.scan_.ocr_language (s);

  if (lookup (vm, "export.directory", s)) rv.export_directory_ = s;
  if (lookup (vm, "export.format"   , s)) rv.export_format_ = s;
  if (lookup (vm, "export.pattern"  , s)) rv.export_pattern_ = s;

  log::trace ("preferences loaded from %1%") % path;
  return rv;
}

void
preferences::save (const std::string& path) const
{
  fs::path parent (fs::path (path).parent_path ());
  if (!parent.empty ()) fs::create_directories (parent);

  fs::ofstream ofs (path);

  ofs << std::boolalpha
      << "[scan]\n"
      << "resolution = "   << scan_.resolution ()   << "\n"
      << "color-mode = "   << scan_.mode ()         << "\n"
      << "paper-size = "   << scan_.paper ()        << "\n"
      << "source = "       << scan_.source ()       << "\n"
      << "duplex = "       << scan_.duplex ()       << "\n"
      << "brightness = "   << scan_.brightness ()   << "\n"
      << "contrast = "     << scan_.contrast ()     << "\n"
      << "auto-crop = "    << scan_.auto_crop ()    << "\n"
      << "auto-enhance = " << scan_.auto_enhance () << "\n"
      << "auto-ocr = "     << scan_.auto_ocr ()     << "\n"
      << "ocr-language = " << scan_.ocr_language () << "\n"
      << "\n"
      << "[export]\n"
      << "directory = "    << export_directory_     << "\n"
      << "format = "       << export_format_        << "\n"
      << "pattern = "      << export_pattern_       << "\n";

  ofs.close ();
  if (!ofs)
    BOOST_THROW_EXCEPTION
      (ios_base::failure ((format ("cannot write %1%") % path).str ()));

  log::trace ("preferences saved to %1%") % path;
}

std::string
preferences::default_path ()
{
  fs::path dir;

  const char *xdg = std::getenv ("XDG_CONFIG_HOME");
  if (xdg && *xdg)
    dir = xdg;
  else
    dir = fs::path (home_directory ()) / ".config";

  return (dir / "scanflow" / "scanflow.conf").string ();
}

void
preferences::apply_environment ()
{
  const char *level = std::getenv ("SCANFLOW_LOG_LEVEL");
  if (!level || !*level) return;

  std::istringstream iss (level);
  log::priority p;

  if (iss >> p)
    log::threshold = p;
  else
    log::error ("SCANFLOW_LOG_LEVEL: unknown priority '%1%'") % level;
}

const std::vector< preferences::language >&
preferences::ocr_languages ()
{
  static const std::vector< language > rv = boost::assign::list_of< language >
    ("eng", "English")
    ("fra", "French")
    ("deu", "German")
    ("spa", "Spanish")
    ("ita", "Italian")
    ("por", "Portuguese")
    ("nld", "Dutch")
    ("pol", "Polish")
    ("rus", "Russian")
    ("chi_sim", "Chinese (Simplified)")
    ("chi_tra", "Chinese (Traditional)")
    ("jpn", "Japanese")
    ("kor", "Korean")
    ("ara", "Arabic")
    .convert_to_container< std::vector< language > > ();
  return rv;
}

const std::vector< int >&
preferences::resolutions ()
{
  static const std::vector< int > rv = boost::assign::list_of
    (75)(100)(150)(200)(300)(400)(600)(1200)
    .convert_to_container< std::vector< int > > ();
  return rv;
}

}       // namespace scanflow
