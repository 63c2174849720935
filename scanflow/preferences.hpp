//  preferences.hpp -- persisted scan defaults and application preferences
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

#ifndef scanflow_preferences_hpp_
#define scanflow_preferences_hpp_

#include <string>
#include <utility>
#include <vector>

#include "settings.hpp"

namespace scanflow {

//! What is remembered from one run to the next
/*! Preferences are stored in an INI style file:
 *
 *  \code
 *  [scan]
 *  resolution = 300
 *  color-mode = grayscale
 *  auto-ocr = false
 *
 *  [export]
 *  directory = /home/me/Documents
 *  format = jpeg
 *  pattern = scan-%i
 *  \endcode
 *
 *  Keys that are not present keep their default values.
 */
class preferences
{
public:
  typedef std::pair< std::string, std::string > language;

  preferences ();

  settings& scan ();
  const settings& scan () const;

  const std::string& export_directory () const;
  const std::string& export_format () const;
  //! File name pattern with an optional \c %i page number formatter
  const std::string& export_pattern () const;

  preferences& export_directory (const std::string& dir);
  preferences& export_format (const std::string& type);
  preferences& export_pattern (const std::string& pattern);

  //! Reads preferences from \a path
  /*! A file that does not exist yields the defaults.  So does a file
   *  that cannot be parsed, after logging what was wrong with it.
   */
  static preferences load (const std::string& path);

  //! Writes all preferences to \a path
  /*! Missing parent directories are created.
   *  \throws std::ios_base::failure if the file cannot be written
   */
  void save (const std::string& path) const;

  //! Location of the user's preferences file
  /*! Follows the XDG base directory conventions, i.e. uses
   *  \c $XDG_CONFIG_HOME/scanflow/scanflow.conf or falls back to
   *  \c $HOME/.config/scanflow/scanflow.conf.
   */
  static std::string default_path ();

  //! Sets the log threshold from \c SCANFLOW_LOG_LEVEL, if set
  static void apply_environment ();

  //! OCR languages offered to the user, as code and name pairs
  static const std::vector< language >& ocr_languages ();

  //! Resolutions offered to the user
  static const std::vector< int >& resolutions ();

private:
  settings    scan_;
  std::string export_directory_;
  std::string export_format_;
  std::string export_pattern_;
};

}       // namespace scanflow

#endif  /* scanflow_preferences_hpp_ */
