//  device.hpp -- scanner devices as discovered by capability probing
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

#ifndef scanflow_device_hpp_
#define scanflow_device_hpp_

#include <iosfwd>
#include <string>
#include <vector>

#include "settings.hpp"

namespace scanflow {

enum class device_class
{
  unknown,
  flatbed,
  adf,
  duplex_adf,
  multifunction,
};

std::ostream& operator<< (std::ostream& os, const device_class& c);

//! What a scanner device is and what it can do
/*! Device objects are snapshots.  They are created from scratch every
 *  time the hardware is enumerated and never change afterwards.  The
 *  list of sources is never empty and its first entry is the source
 *  to use by default.
 */
class device
{
public:
  typedef std::vector< scan_source > source_list;
  typedef std::vector< int > resolution_list;

  //! Creates a device description
  /*! An empty \a sources list is replaced by a flatbed only list.
   */
  device (const std::string& udi,
          const std::string& name,
          const std::string& manufacturer,
          device_class kind,
          bool supports_color,
          bool supports_adf,
          bool supports_duplex,
          int max_resolution,
          const source_list& sources,
          const resolution_list& resolutions);

  const std::string& udi () const;
  const std::string& name () const;
  const std::string& manufacturer () const;
  device_class kind () const;

  bool supports_color () const;
  bool supports_adf () const;
  bool supports_duplex () const;

  int max_resolution () const;
  const source_list& sources () const;
  const resolution_list& resolutions () const;

  scan_source default_source () const;
  bool supports (scan_source s) const;

  //! Picks the supported resolution nearest to \a dpi
  /*! Ties go to the lower resolution.  Returns \a dpi itself if the
   *  device does not list any resolutions.
   */
  int closest_resolution (int dpi) const;

  bool operator== (const device& dev) const;
  bool operator!= (const device& dev) const;

private:
  std::string     udi_;
  std::string     name_;
  std::string     manufacturer_;
  device_class    kind_;
  bool            color_;
  bool            adf_;
  bool            duplex_;
  int             max_resolution_;
  source_list     sources_;
  resolution_list resolutions_;
};

std::ostream& operator<< (std::ostream& os, const device& dev);

}       // namespace scanflow

#endif  /* scanflow_device_hpp_ */
