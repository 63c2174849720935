//  scanner.hpp -- single page and document feeder scan sessions
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

#ifndef scanflow_scanner_hpp_
#define scanflow_scanner_hpp_

#include <string>
#include <vector>

#include "cancellation.hpp"
#include "device.hpp"
#include "driver.hpp"
#include "exception.hpp"
#include "page.hpp"
#include "progress.hpp"
#include "settings.hpp"
#include "thread.hpp"

namespace scanflow {

//! Runs scan sessions against the devices of a driver
/*! Every scan connects to its device afresh, so a device that went
 *  away after it was listed is detected as such.  The session owns
 *  its connexion for the duration of the call and never shares it.
 *
 *  Property configuration is best-effort.  Values a device rejects
 *  are logged and otherwise ignored.
 */
class scanner
{
public:
  typedef std::vector< page > page_list;

  explicit scanner (driver::ptr drv);

  //! Acquires exactly one page from the source in \a s
  /*! The returned page is numbered 1.
   *
   *  \throws system_error with code system_error::device_not_found
   *          if \a dev is no longer attached
   *  \throws system_error with code system_error::cancelled if the
   *          \a token was cancelled before the transfer started
   *  \throws system_error for transfer problems, including a feeder
   *          that turned out to be empty
   */
  page scan_single (const device& dev, const settings& s,
                    const progress::sink& sink = progress::sink (),
                    const cancellation& token = cancellation ()) const;

  //! Acquires pages from the document feeder until it runs empty
  /*! Auto and flatbed sources are replaced by the feeder, or by the
   *  duplex unit when \a s asks for duplex scanning.  The feeder is
   *  checked before each page.  Pages are numbered 1..N in the order
   *  they were captured.
   *
   *  Cancellation is looked at once per page, before anything is sent
   *  to the device for that page.  A cancelled scan returns the pages
   *  captured up to that point.
   *
   *  \throws system_error with code system_error::device_not_found
   *          if \a dev is no longer attached
   *  \throws system_error for a transfer problem on the first page
   *  \throws partial_scan for a transfer problem on any later page
   */
  page_list scan_many (const device& dev, const settings& s,
                       const progress::sink& sink = progress::sink (),
                       const cancellation& token = cancellation ()) const;

  //! Sets the time given to the feeder to advance to the next sheet
  void feeder_delay (const chrono::milliseconds& delay);
  const chrono::milliseconds& feeder_delay () const;

  //! Applies all acquisition parameters in \a s to \a cnx
  static void configure (connexion& cnx, const settings& s);

  //! Selects where the media comes from, as far as \a cnx lets us
  /*! \return \c false if the device would not have it
   */
  static bool select_source (connexion& cnx, scan_source src, bool duplex);

  //! Tells whether the feeder has another sheet ready
  /*! Devices that do not report a status are taken to be empty.
   */
  static bool feeder_ready (connexion& cnx);

private:
  connexion::ptr connect (const device& dev) const;
  octets transfer (const connexion::ptr& cnx) const;

  driver::ptr driver_;
  chrono::milliseconds delay_;
};

//! Transfer failure after some pages had already been captured
/*! The pages are handed back so that nothing scanned so far is lost.
 */
class partial_scan
  : public system_error
{
public:
  partial_scan (const system_error& cause,
                const scanner::page_list& pages);

  const scanner::page_list& pages () const;

private:
  shared_ptr< scanner::page_list > pages_;
};

}       // namespace scanflow

#endif  /* scanflow_scanner_hpp_ */
