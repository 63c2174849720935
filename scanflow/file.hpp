//  file.hpp -- file names and whole file I/O
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

#ifndef scanflow_file_hpp_
#define scanflow_file_hpp_

#include <string>

#include "octet.hpp"

namespace scanflow {

//!  Create path names following a simple pattern
class path_generator
{
public:
  //!  Default constructor
  /*!  A default path_generator instance evaluates to \c false in a
   *   Boolean context.  Its operator() member function should never
   *   be invoked.
   */
  path_generator ();

  //!  Creates a \c %i formatter \a pattern based instance
  /*!  The formatter may be a simple \c %i or contain a field width
   *   specifier, similar to the printf() version.  Fields are always
   *   zero filled.  Numbering starts at \a first.
   *
   *   If \a pattern does not contain a \c %i formatter, a default
   *   constructed instance will be created.
   */
  explicit path_generator (const std::string& pattern, unsigned first = 1);

  operator bool () const;

  //!  Returns the next path name in the sequence
  std::string operator() ();

  //!  Returns the path name \a n in the sequence without advancing
  std::string at (unsigned n) const;

private:
  std::string parent_;
  std::string format_;
  unsigned    offset_;
};

//!  Reads all of \a filename
/*!  \throws std::ios_base::failure if the file cannot be read
 */
octets read_file (const std::string& filename);

//!  Replaces the contents of \a filename with \a data
/*!  \throws std::ios_base::failure if the file cannot be written
 */
void write_file (const std::string& filename, const octets& data);

}       // namespace scanflow

#endif  /* scanflow_file_hpp_ */
