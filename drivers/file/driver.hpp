//  driver.hpp -- devices backed by image files
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

#ifndef drivers_file_driver_hpp_
#define drivers_file_driver_hpp_

#include <iosfwd>
#include <string>
#include <vector>

#include <scanflow/driver.hpp>
#include <scanflow/file.hpp>

namespace scanflow {
namespace _drv_ {
namespace file {

//! Everything a device description file says about one device
struct description
{
  description ();

  std::string udi;
  std::string name;
  std::string vendor;
  value::integer type;          //!< property::scanner_device by default
  value::integer capabilities;  //!< property::capability bits

  //! Discrete resolutions, used unless empty
  std::vector< value::integer > resolutions;
  //! Resolution range, used when no discrete resolutions are given
  value::integer lower;
  value::integer upper;
  value::integer step;

  //! Path name pattern of the images to hand out, see path_generator
  std::string images;
};

//! Hands out image files as if they came off a scanner
/*! Devices are described in an INI style file, one section per
 *  device:
 *
 *  \code
 *  [devices.demo]
 *  udi = file:demo
 *  name = Demo Scanner
 *  vendor = ACME
 *  capabilities = 7
 *  resolutions = 75 150 300 600
 *  images = pages/page-%02i.pnm
 *  \endcode
 *
 *  A \c resolution-range key, e.g. \c 50..1200, may be used instead
 *  of \c resolutions, optionally with a \c resolution-step key.
 *  Relative image patterns are taken relative to the location of the
 *  description file.  The file is re-read on every enumeration so
 *  devices can be added and removed by editing it.
 *
 *  Flatbed scans always return the first image.  Feeder scans work
 *  through the images in sequence and run out of media when the next
 *  image does not exist.
 */
class driver
  : public scanflow::driver
{
public:
  explicit driver (const std::string& filename);

  container_type enumerate ();
  connexion::ptr connect (const std::string& udi);

  //! Parses device descriptions from \a istr
  /*! Malformed lines and incomplete sections are logged and skipped.
   */
  static std::vector< description > read (std::istream& istr);

private:
  std::vector< description > descriptions () const;

  std::string filename_;
};

//! Session with a single file backed device
class connexion
  : public scanflow::connexion
{
public:
  explicit connexion (const description& desc);

  boost::optional< value > get (property::id pid);
  bool set (property::id pid, const value& v);
  constraint::ptr limits (property::id pid);
  octets transfer (const std::string& format);

private:
  bool feeding () const;
  std::string next_image () const;

  description    desc_;
  property::map  values_;
  path_generator images_;
  unsigned       index_;
};

}       // namespace file
}       // namespace _drv_
}       // namespace scanflow

#endif  /* drivers_file_driver_hpp_ */
