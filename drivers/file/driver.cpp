//  driver.cpp -- devices backed by image files
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

#include "driver.hpp"

#include <scanflow/choices.hpp>
#include <scanflow/exception.hpp>
#include <scanflow/format.hpp>
#include <scanflow/i18n.hpp>
#include <scanflow/log.hpp>
#include <scanflow/pnm.hpp>
#include <scanflow/range.hpp>
#include <scanflow/regex.hpp>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>

namespace fs = boost::filesystem;

namespace scanflow {
namespace _drv_ {
namespace file {

namespace {

value::integer
to_integer (const std::string& s)
{
  char *end = NULL;
  long rv = std::strtol (s.c_str (), &end, 0);

  if (s.empty () || *end)
    BOOST_THROW_EXCEPTION (boost::bad_lexical_cast ());

  return rv;
}

bool
accepts (const constraint::ptr& c, const value& v)
{
  return !c || c->allows (v);
}

}       // namespace

description::description ()
  : type (property::scanner_device)
  , capabilities (property::capability::flatbed)
  , lower (0)
  , upper (0)
  , step (1)
{}

driver::driver (const std::string& filename)
  : filename_(filename)
{}

driver::container_type
driver::enumerate ()
{
  container_type rv;
  std::vector< description > devs (descriptions ());

  for (std::vector< description >::const_iterator it = devs.begin ();
       devs.end () != it; ++it)
    {
      entry e (it->udi);

      e.set (property::device_type, it->type);
      if (!it->name.empty ())   e.set (property::name, it->name);
      if (!it->vendor.empty ()) e.set (property::manufacturer, it->vendor);

      rv.push_back (e);
    }

  log::trace (log::DRIVER, "%1%: %2% device(s)") % filename_ % rv.size ();
  return rv;
}

connexion::ptr
driver::connect (const std::string& udi)
{
  std::vector< description > devs (descriptions ());

  std::vector< description >::const_iterator it = devs.begin ();
  while (devs.end () != it && it->udi != udi) ++it;

  if (devs.end () == it)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::device_not_found,
                     (format (_("Scanner device not found: %1%"))
                      % udi).str ()));

  return make_shared< connexion > (*it);
}

std::vector< description >
driver::read (std::istream& istr)
{
  std::vector< description > rv;

  const std::string key ("[[:alpha:]][-[:alnum:]]*"
                         "(\\.[[:alpha:]][-[:alnum:]]*)*");

  const regex section ("[[:blank:]]*"
                       "\\[(" + key + ")\\]"
                       "[[:blank:]]*");

  const regex key_val ("[[:blank:]]*"
                       "(" + key + ")"
                       "[[:blank:]]*"
                       "="
                       "[[:blank:]]*"
                       "(.*[^[:blank:]])"
                       "[[:blank:]]*");

  const regex blank ("[[:blank:]]*");

  std::string common_prefix;
  std::map< std::string, std::string > kv;

  std::string line;
  size_t line_no (0);

  while (getline (istr, line))
    {
      ++line_no;

      if (line.empty ()
          || '#' == line[0]
          || ';' == line[0]
          || regex_match (line, blank))
        continue;

      smatch m;
      if (regex_match (line, m, section))
        {
          common_prefix = m[1];
          continue;
        }
      if (regex_match (line, m, key_val))
        {
          std::string key (common_prefix);
          if (!key.empty ()) key += ".";
          key += m[1];

          // Keep "uninteresting" keys out of kv
          if (0 != key.find ("devices.")) continue;

          if (!kv.insert (make_pair (key, m[3])).second)
            {
              log::error ("duplicate key:%1%:%2%") % line_no % line;
            }

          continue;
        }

      log::error ("parse error:%1%:%2%") % line_no % line;
    }

  // first collect the udi attribute prefixes

  const regex attr_key ("(" + key + ")\\.([[:alpha:]][-[:alnum:]]*)");

  std::map< std::string, std::string >::const_iterator it;
  std::set< std::string > dev;

  for (it = kv.begin (); kv.end () != it; ++it)
    {
      smatch m;
      if (regex_match (it->first, m, attr_key))
        {
          if (m[3] == "udi") dev.insert (m[1]);
        }
      else
        {
          log::error ("internal error:%1%:%2%") % it->first % it->second;
        }
    }

  // for each udi attribute prefix create a description with all the
  // configured attributes set

  const regex range_spec ("([0-9]+)[[:blank:]]*\\.\\.[[:blank:]]*([0-9]+)");

  std::set< std::string >::const_iterator jt;
  for (jt = dev.begin (); dev.end () != jt; ++jt)
    {
      description d;
      d.udi = kv[*jt + ".udi"];

      try
        {
          it = kv.find (*jt + ".name");
          if (kv.end () != it) d.name = it->second;

          it = kv.find (*jt + ".vendor");
          if (kv.end () != it) d.vendor = it->second;

          it = kv.find (*jt + ".type");
          if (kv.end () != it) d.type = to_integer (it->second);

          it = kv.find (*jt + ".capabilities");
          if (kv.end () != it) d.capabilities = to_integer (it->second);

          it = kv.find (*jt + ".resolutions");
          if (kv.end () != it)
            {
              std::vector< std::string > dpi;
              boost::algorithm::split (dpi, it->second,
                                       boost::algorithm::is_any_of (" \t,"),
                                       boost::algorithm::token_compress_on);
              for (std::vector< std::string >::const_iterator kt = dpi.begin ();
                   dpi.end () != kt; ++kt)
                {
                  if (!kt->empty ())
                    d.resolutions.push_back (to_integer (*kt));
                }
            }

          it = kv.find (*jt + ".resolution-range");
          if (kv.end () != it)
            {
              smatch m;
              if (!regex_match (it->second, m, range_spec))
                BOOST_THROW_EXCEPTION (boost::bad_lexical_cast ());

              d.lower = to_integer (m[1]);
              d.upper = to_integer (m[2]);
              if (d.upper < d.lower)
                BOOST_THROW_EXCEPTION (boost::bad_lexical_cast ());
            }

          it = kv.find (*jt + ".resolution-step");
          if (kv.end () != it) d.step = to_integer (it->second);
          if (0 >= d.step)
            BOOST_THROW_EXCEPTION (boost::bad_lexical_cast ());

          it = kv.find (*jt + ".images");
          if (kv.end () != it) d.images = it->second;
        }
      catch (const boost::bad_lexical_cast&)
        {
          log::error ("%1%: invalid numeric attribute, skipping") % d.udi;
          continue;
        }

      if (d.images.empty ())
        {
          log::error ("%1%: no images configured, skipping") % d.udi;
          continue;
        }

      rv.push_back (d);
    }

  return rv;
}

std::vector< description >
driver::descriptions () const
{
  fs::ifstream ifs (filename_);

  if (!ifs)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::hardware_unavailable,
                     (format (_("Cannot read device descriptions from %1%"))
                      % filename_).str ()));

  std::vector< description > rv (read (ifs));

  fs::path base (fs::path (filename_).parent_path ());
  for (std::vector< description >::iterator it = rv.begin ();
       rv.end () != it; ++it)
    {
      fs::path p (it->images);
      if (p.is_relative () && !base.empty ())
        it->images = (base / p).string ();
    }

  return rv;
}

connexion::connexion (const description& desc)
  : desc_(desc)
  , images_(desc.images)
  , index_(1)
{
  using namespace property;

  values_[device_id]             = desc_.udi;
  values_[device_type]           = desc_.type;
  values_[handling_capabilities] = desc_.capabilities;

  if (!desc_.name.empty ())   values_[name] = desc_.name;
  if (!desc_.vendor.empty ()) values_[manufacturer] = desc_.vendor;

  values_[property::handling_select] = (desc_.capabilities & capability::flatbed
                              ? handling::flatbed
                              : handling::feeder);

  constraint::ptr dpi (limits (x_resolution));
  value res (dpi ? dpi->adjust (value (300)) : value (300));

  values_[x_resolution] = res;
  values_[y_resolution] = res;
  values_[intent]       = image_intent::color;
  values_[data_type]    = pixel_type::color;
  values_[brightness]   = 0;
  values_[contrast]     = 0;
  values_[x_start]      = 0;
  values_[y_start]      = 0;

  log::brief (log::DRIVER, "opened %1% (%2%)") % desc_.udi % desc_.images;
}

boost::optional< value >
connexion::get (property::id pid)
{
  using namespace property;

  if (handling_status == pid)
    {
      if (!(desc_.capabilities & (capability::feeder | capability::duplex)))
        return boost::none;

      value::integer s = 0;
      if (feeding () && fs::exists (next_image ()))
        s |= status::feeder_ready;
      return value (s);
    }

  property::map::const_iterator it = values_.find (pid);
  if (values_.end () == it) return boost::none;
  return it->second;
}

bool
connexion::set (property::id pid, const value& v)
{
  using namespace property;

  switch (pid)
    {
    case device_id:
    case manufacturer:
    case device_type:
    case name:
    case handling_capabilities:
    case handling_status:
      return false;
    default:
      break;
    }

  if (property::handling_select == pid)
    {
      if (!v.is_integer ()) return false;

      value::integer sel = v;
      value::integer caps = desc_.capabilities;

      if ((sel & handling::flatbed) && !(caps & capability::flatbed))
        return false;
      if ((sel & handling::feeder)
          && !(caps & (capability::feeder | capability::duplex)))
        return false;
      if ((sel & handling::duplex) && !(caps & capability::duplex))
        return false;
    }
  else if (!accepts (limits (pid), v))
    {
      return false;
    }

  values_[pid] = v;
  return true;
}

constraint::ptr
connexion::limits (property::id pid)
{
  using namespace property;

  if (x_resolution == pid || y_resolution == pid)
    {
      if (!desc_.resolutions.empty ())
        {
          return make_shared< choices > (desc_.resolutions.begin (),
                                         desc_.resolutions.end ());
        }
      if (0 < desc_.upper)
        {
          return make_shared< range > (desc_.lower, desc_.upper,
                                       desc_.step);
        }
      return constraint::ptr ();
    }

  if (brightness == pid || contrast == pid)
    {
      range::ptr r = make_shared< range > (-100, 100);
      r->fallback (0);
      return r;
    }

  if (intent == pid)
    {
      choices::ptr c = make_shared< choices > (image_intent::color);
      c->add (image_intent::grayscale).add (image_intent::text);
      return c;
    }

  if (data_type == pid)
    {
      choices::ptr c = make_shared< choices > (pixel_type::black_and_white);
      c->add (pixel_type::grayscale).add (pixel_type::color);
      c->fallback (pixel_type::color);
      return c;
    }

  return constraint::ptr ();
}

octets
connexion::transfer (const std::string& format)
{
  if (transfer_format != format)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::transfer_failure,
                     (scanflow::format (_("Unsupported image format: %1%"))
                      % format).str ()));

  std::string filename (feeding ()
                        ? next_image ()
                        : (images_ ? images_.at (1) : desc_.images));

  if (feeding () && !fs::exists (filename))
    BOOST_THROW_EXCEPTION
      (system_error (system_error::media_out,
                     _("No more pages in the document feeder")));

  octets rv;
  try
    {
      rv = read_file (filename);
    }
  catch (const std::exception& e)
    {
      log::error (log::DRIVER, "%1%") % e.what ();
      BOOST_THROW_EXCEPTION
        (system_error (system_error::transfer_failure, e.what ()));
    }

  if (!pnm::parse (rv))
    BOOST_THROW_EXCEPTION
      (system_error (system_error::transfer_failure,
                     (scanflow::format (_("%1% is not a PNM image"))
                      % filename).str ()));

  if (feeding ()) ++index_;

  log::trace (log::DRIVER, "transferred %1%") % filename;
  return rv;
}

bool
connexion::feeding () const
{
  property::map::const_iterator it = values_.find (property::handling_select);

  return (values_.end () != it && it->second.is_integer ()
          && (value::integer (it->second) & property::handling::feeder));
}

std::string
connexion::next_image () const
{
  if (!images_) return (1 == index_ ? desc_.images : std::string ());
  return images_.at (index_);
}

}       // namespace file
}       // namespace _drv_
}       // namespace scanflow
