//  acquisition.cpp -- scan sessions for an interactive front-end
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

#include <algorithm>
#include <exception>

#include "scanflow/acquisition.hpp"
#include "scanflow/format.hpp"
#include "scanflow/functional.hpp"
#include "scanflow/i18n.hpp"
#include "scanflow/log.hpp"

namespace scanflow {

const int acquisition::thumbnail_size;

namespace {

//! Flags a scan as in progress for as long as it is in scope
class busy
{
public:
  explicit busy (volatile std::sig_atomic_t& flag)
    : flag_(flag)
  {
    flag_ = true;
  }
  ~busy () { flag_ = false; }

private:
  volatile std::sig_atomic_t& flag_;
};

}       // namespace

acquisition::acquisition (driver::ptr drv)
  : monitor_(drv)
  , scanner_(drv)
  , scanning_(false)
  , status_(_("Ready"))
{}

void
acquisition::refresh ()
{
  update (_("Searching for scanners..."));

  try
    {
      devices_ = monitor_.devices ();
    }
  catch (const std::exception& e)
    {
      log::error ("device enumeration failed: %1%") % e.what ();
      devices_.clear ();
      selected_ = boost::none;
      update ((format (_("Error: %1%")) % e.what ()).str ());
      return;
    }

  if (selected_
      && devices_.end () == std::find (devices_.begin (), devices_.end (),
                                       *selected_))
    {
      log::brief ("%1% is gone") % selected_->udi ();
      selected_ = boost::none;
    }
  if (!selected_ && !devices_.empty ())
    select (devices_.front ().udi ());

  if (devices_.empty ())
    update (_("No scanners found. Please connect a scanner and click"
              " Refresh."));
  else
    update ((format (_("Found %1% scanner(s)")) % devices_.size ()).str ());
}

const monitor::container_type&
acquisition::devices () const
{
  return devices_;
}

bool
acquisition::select (const std::string& udi)
{
  monitor::container_type::const_iterator it = devices_.begin ();
  while (devices_.end () != it && it->udi () != udi) ++it;

  if (devices_.end () == it)
    {
      log::error ("cannot select %1%: no such device") % udi;
      return false;
    }

  selected_ = *it;

  const device::resolution_list& dpi (it->resolutions ());
  if (dpi.empty ()
      || dpi.end () != std::find (dpi.begin (), dpi.end (), 300))
    settings_.resolution (300);
  else
    settings_.resolution (it->closest_resolution (300));

  settings_.duplex (it->supports_duplex ());
  settings_.source (it->default_source ());

  log::brief ("selected %1%: %2% dpi, %3%")
    % udi % settings_.resolution () % settings_.source ();

  return true;
}

const boost::optional< device >&
acquisition::selected () const
{
  return selected_;
}

settings&
acquisition::scan_settings ()
{
  return settings_;
}

const settings&
acquisition::scan_settings () const
{
  return settings_;
}

void
acquisition::source (scan_source s)
{
  settings_.source (s);
  if (scan_source::duplex == s)
    settings_.duplex (true);
}

bool
acquisition::scan ()
{
  if (!selected_ || scanning_) return false;

  busy guard (scanning_);
  token_.reset ();
  update (_("Scanning..."));

  try
    {
      page p (scanner_.scan_single (*selected_, settings_,
                                    bind (&acquisition::publish, this,
                                          placeholders::_1),
                                    token_));
      post_process (p);
      document_.add (p);
    }
  catch (const system_error& e)
    {
      if (system_error::cancelled == e.code ())
        update (_("Scan cancelled"));
      else
        update ((format (_("Scan failed: %1%")) % e.what ()).str ());
      return false;
    }
  catch (const std::exception& e)
    {
      log::error ("scan failed: %1%") % e.what ();
      update ((format (_("Scan failed: %1%")) % e.what ()).str ());
      return false;
    }

  update (_("Scan complete"));
  return true;
}

std::size_t
acquisition::scan_many ()
{
  if (!selected_ || scanning_) return 0;

  busy guard (scanning_);
  token_.reset ();
  update (_("Scanning..."));

  scanner::page_list pages;
  std::string failure;

  try
    {
      pages = scanner_.scan_many (*selected_, settings_,
                                  bind (&acquisition::publish, this,
                                        placeholders::_1),
                                  token_);
    }
  catch (const partial_scan& e)
    {
      pages = e.pages ();
      failure = e.what ();
    }
  catch (const std::exception& e)
    {
      log::error ("scan failed: %1%") % e.what ();
      failure = e.what ();
    }

  for (scanner::page_list::iterator it = pages.begin ();
       pages.end () != it; ++it)
    {
      post_process (*it);
      document_.add (*it);
    }

  if (!failure.empty ())
    update ((format (_("Scan failed: %1%")) % failure).str ());
  else if (token_.requested ())
    update (_("Scan cancelled"));
  else
    update ((format (_("Scanned %1% page(s)")) % pages.size ()).str ());

  return pages.size ();
}

void
acquisition::cancel () const
{
  token_.request ();
}

bool
acquisition::scanning () const
{
  return scanning_;
}

document&
acquisition::current ()
{
  return document_;
}

const document&
acquisition::current () const
{
  return document_;
}

void
acquisition::clear ()
{
  document_.clear ();
  update (_("Document cleared"));
}

void
acquisition::renew ()
{
  document_ = document ();
  update (_("New document created"));
}

const std::string&
acquisition::status () const
{
  return status_;
}

void
acquisition::attach (const image_processor::ptr& processor)
{
  processor_ = processor;
}

void
acquisition::attach (const recognizer::ptr& ocr)
{
  ocr_ = ocr;
}

std::vector< std::string >
acquisition::upload (exporter& exp, uploader& up, const std::string& folder)
{
  std::vector< std::string > rv;
  std::vector< octets > files (exp.encode (document_));

  for (std::vector< octets >::size_type i = 0; i < files.size (); ++i)
    {
      std::string name (document_.name ());
      if (1 < files.size ())
        name += (format ("-%1%") % (i + 1)).str ();
      name += "." + exp.extension ();

      rv.push_back (up.upload (folder, name, files[i], token_));
      log::brief ("uploaded %1% to %2%") % name % rv.back ();
    }

  return rv;
}

scanner&
acquisition::engine ()
{
  return scanner_;
}

connection
acquisition::connect_progress (const progress_signal::slot_type& slot)
{
  return progress_.connect (slot);
}

connection
acquisition::connect_status (const status_signal::slot_type& slot)
{
  return status_signal_.connect (slot);
}

//! Applies the post-processing hints of the current settings
/*! Collaborator failures are logged.  The page is kept regardless.
 */
void
acquisition::post_process (page& p)
{
  if (processor_)
    {
      try
        {
          if (settings_.auto_crop ())
            {
              boost::optional< rectangle > bounds
                (processor_->detect_edges (p.image (), token_));
              if (bounds) p.crop (*bounds);
            }
          if (settings_.auto_enhance ())
            {
              p.image (processor_->enhance (p.image (), token_));
              p.enhanced (true);
            }
          p.thumbnail (processor_->thumbnail (p.image (), thumbnail_size));
        }
      catch (const std::exception& e)
        {
          log::error ("processing page %1%: %2%") % p.number () % e.what ();
        }
    }

  if (ocr_ && settings_.auto_ocr ())
    {
      try
        {
          p.recognized (ocr_->recognize (p.image (),
                                         settings_.ocr_language (),
                                         token_));
        }
      catch (const std::exception& e)
        {
          log::error ("recognizing page %1%: %2%") % p.number () % e.what ();
        }
    }
}

void
acquisition::update (const std::string& message)
{
  status_ = message;
  log::brief (log::SESSION, "%1%") % message;
  status_signal_(status_);
}

void
acquisition::publish (const progress& p)
{
  progress_(p);
}

}       // namespace scanflow
