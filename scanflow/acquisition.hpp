//  acquisition.hpp -- scan sessions for an interactive front-end
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

#ifndef scanflow_acquisition_hpp_
#define scanflow_acquisition_hpp_

#include <csignal>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "cancellation.hpp"
#include "device.hpp"
#include "document.hpp"
#include "monitor.hpp"
#include "progress.hpp"
#include "scanner.hpp"
#include "services.hpp"
#include "settings.hpp"
#include "signal.hpp"

namespace scanflow {

//! Keeps track of devices, settings and the document being built
/*! An acquisition ties device discovery, scan sessions and the
 *  optional post-processing services together.  Front-ends drive it
 *  and listen to its progress and status signals.
 *
 *  Only cancel() may be called while a scan is in progress, from any
 *  thread or from a signal handler.  Everything else is meant to be
 *  called from a single thread.
 */
class acquisition
{
public:
  typedef signal< void (const progress&) > progress_signal;
  typedef signal< void (const std::string&) > status_signal;

  explicit acquisition (driver::ptr drv);

  //! Looks for devices again
  /*! The current selection is kept if the device is still there.
   *  Otherwise the first device found is selected.
   */
  void refresh ();

  const monitor::container_type& devices () const;

  //! Makes the device with \a udi the one to scan with
  /*! The settings are adjusted to the device: 300 dpi or the closest
   *  supported resolution, duplex if the device has it and its
   *  default source.
   *
   *  \return \c false if no such device is known
   */
  bool select (const std::string& udi);
  const boost::optional< device >& selected () const;

  settings& scan_settings ();
  const settings& scan_settings () const;

  //! Changes the source, turning duplex on for the duplex unit
  void source (scan_source s);

  //! Scans a single page and appends it to the document
  /*! \return \c true if a page was added
   */
  bool scan ();

  //! Scans from the document feeder until it runs empty
  /*! Pages captured before a failure or cancellation are kept.
   *
   *  \return the number of pages added
   */
  std::size_t scan_many ();

  void cancel () const;
  //! Tells whether a scan is under way, safe to call from any thread
  bool scanning () const;

  document& current ();
  const document& current () const;

  //! Removes all pages from the current document
  void clear ();
  //! Replaces the current document with an empty one
  void renew ();

  const std::string& status () const;

  void attach (const image_processor::ptr& processor);
  void attach (const recognizer::ptr& ocr);

  //! Exports the current document and uploads the result to \a folder
  /*! \return the locations reported by \a up, one per file
   */
  std::vector< std::string > upload (exporter& exp, uploader& up,
                                     const std::string& folder);

  //! Gives access to session parameters such as the feeder delay
  scanner& engine ();

  connection connect_progress (const progress_signal::slot_type& slot);
  connection connect_status (const status_signal::slot_type& slot);

  //! Largest side of the thumbnails that are made for new pages
  static const int thumbnail_size = 256;

private:
  void post_process (page& p);
  void update (const std::string& message);
  void publish (const progress& p);

  monitor monitor_;
  scanner scanner_;

  monitor::container_type devices_;
  boost::optional< device > selected_;
  settings settings_;
  document document_;

  image_processor::ptr processor_;
  recognizer::ptr ocr_;

  cancellation token_;
  volatile std::sig_atomic_t scanning_;
  std::string status_;

  progress_signal progress_;
  status_signal status_signal_;
};

}       // namespace scanflow

#endif  /* scanflow_acquisition_hpp_ */
