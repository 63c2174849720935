//  driver.cpp -- devices accessed through SANE backends
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

#include <sane/saneopts.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/assign/list_of.hpp>
#include <boost/scoped_array.hpp>
#include <boost/throw_exception.hpp>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <vector>

namespace scanflow {
namespace _drv_ {
namespace sane {

using boost::algorithm::icontains;
using boost::algorithm::iequals;
using boost::assign::list_of;

namespace {

const double mm_per_inch = 25.4;

typedef std::vector< std::string > strings;

//! Converts pixels at \a dpi to the \a unit an option is in
double
to_unit (SANE_Unit unit, value::integer px, value::integer dpi)
{
  if (SANE_UNIT_MM == unit && 0 < dpi)
    return px * mm_per_inch / dpi;
  return px;
}

value::integer
from_word (SANE_Value_Type type, SANE_Word w)
{
  return (SANE_TYPE_FIXED == type
          ? value::integer (std::floor (SANE_UNFIX (w) + 0.5))
          : value::integer (w));
}

system_error
failure (system_error::error_code ec, const char *what, SANE_Status status)
{
  std::string msg ((format ("%1%: %2%") % what % sane_strstatus (status))
                   .str ());
  log::error (log::DRIVER, msg);
  return system_error (ec, msg);
}

}       // namespace

driver::driver ()
{
  SANE_Int version_code;
  SANE_Status status = sane_init (&version_code, NULL);

  if (SANE_STATUS_GOOD != status)
    BOOST_THROW_EXCEPTION
      (failure (system_error::hardware_unavailable,
                _("Unable to initialize SANE backend"), status));

  log::brief (log::DRIVER, "SANE version %1%.%2%.%3%")
    % SANE_VERSION_MAJOR (version_code)
    % SANE_VERSION_MINOR (version_code)
    % SANE_VERSION_BUILD (version_code);
}

driver::~driver ()
{
  sane_exit ();
}

driver::container_type
driver::enumerate ()
{
  container_type rv;
  const SANE_Device **device_list = NULL;

  SANE_Status status = sane_get_devices (&device_list, SANE_FALSE);
  if (SANE_STATUS_GOOD != status)
    BOOST_THROW_EXCEPTION
      (failure (system_error::hardware_unavailable,
                _("Unable to get SANE devices"), status));

  for (int i = 0; device_list[i]; ++i)
    {
      const SANE_Device *dev = device_list[i];
      entry e (dev->name);

      if (dev->model)  e.set (property::name, std::string (dev->model));
      if (dev->vendor) e.set (property::manufacturer,
                              std::string (dev->vendor));

      log::trace (log::DRIVER, "found %1% (%2%)")
        % dev->name % (dev->type ? dev->type : "unknown type");
      rv.push_back (e);
    }

  return rv;
}

connexion::ptr
driver::connect (const std::string& udi)
{
  SANE_Handle handle = NULL;
  SANE_Status status = sane_open (udi.c_str (), &handle);

  if (SANE_STATUS_GOOD != status)
    BOOST_THROW_EXCEPTION
      (failure (system_error::device_not_found,
                (format (_("Scanner device not found: %1%")) % udi)
                .str ().c_str (), status));

  return make_shared< connexion > (handle, udi);
}

connexion::connexion (SANE_Handle handle, const std::string& udi)
  : handle_(handle)
  , feeder_empty_(false)
{
  const SANE_Option_Descriptor *opt;
  for (SANE_Int i = 1; (opt = sane_get_option_descriptor (handle_, i)); ++i)
    {
      if (opt->name && SANE_TYPE_GROUP != opt->type)
        options_[opt->name] = i;
    }

  values_[property::device_id] = udi;
  values_[property::intent] = property::image_intent::color;

  log::brief (log::DRIVER, "opened %1%, %2% options") % udi % options_.size ();
}

connexion::~connexion ()
{
  sane_cancel (handle_);
  sane_close (handle_);
}

boost::optional< value >
connexion::get (property::id pid)
{
  using namespace property;

  switch (pid)
    {
    case handling_capabilities:
      return value (capabilities ());
    case handling_status:
      if (!(capabilities () & (capability::feeder | capability::duplex)))
        return boost::none;
      return value (feeder_empty_ ? 0 : status::feeder_ready);
    case x_resolution:
      {
        boost::optional< value > v (get_option (SANE_NAME_SCAN_X_RESOLUTION));
        return (v ? v : get_option (SANE_NAME_SCAN_RESOLUTION));
      }
    case y_resolution:
      {
        boost::optional< value > v (get_option (SANE_NAME_SCAN_Y_RESOLUTION));
        return (v ? v : get_option (SANE_NAME_SCAN_RESOLUTION));
      }
    case brightness:
      return get_option (SANE_NAME_BRIGHTNESS);
    case contrast:
      return get_option (SANE_NAME_CONTRAST);
    default:
      break;
    }

  property::map::const_iterator it = values_.find (pid);
  if (values_.end () == it) return boost::none;
  return it->second;
}

bool
connexion::set (property::id pid, const value& v)
{
  using namespace property;

  if (!v.is_integer ()) return false;

  value::integer i = v;
  bool rv = false;

  switch (pid)
    {
    case property::handling_select:
      if (i & handling::duplex)
        rv = set_string (SANE_NAME_SCAN_SOURCE,
                         list_of< std::string > ("ADF Duplex") ("Duplex"));
      else if (i & handling::front_only)
        rv = set_string (SANE_NAME_SCAN_SOURCE, list_of< std::string > ("ADF Front"));
      else if (i & handling::back_only)
        rv = set_string (SANE_NAME_SCAN_SOURCE, list_of< std::string > ("ADF Back"));
      else if (i & handling::feeder)
        rv = set_string (SANE_NAME_SCAN_SOURCE,
                         list_of< std::string > ("ADF") ("Automatic Document Feeder")
                         ("ADF Front"));
      else if (i & handling::flatbed)
        rv = set_string (SANE_NAME_SCAN_SOURCE,
                         list_of< std::string > ("Flatbed") ("Normal"));
      else if (i & handling::automatic)
        rv = set_string (SANE_NAME_SCAN_SOURCE, list_of< std::string > ("Auto"));
      if (rv) feeder_empty_ = false;
      break;
    case data_type:
      if (pixel_type::color == i)
        rv = set_string (SANE_NAME_SCAN_MODE,
                         list_of< std::string > (SANE_VALUE_SCAN_MODE_COLOR));
      else if (pixel_type::grayscale == i)
        rv = set_string (SANE_NAME_SCAN_MODE,
                         list_of< std::string > (SANE_VALUE_SCAN_MODE_GRAY) ("Grayscale"));
      else if (pixel_type::black_and_white == i)
        rv = set_string (SANE_NAME_SCAN_MODE,
                         list_of< std::string > (SANE_VALUE_SCAN_MODE_LINEART)
                         ("Binary") ("Black & White"));
      break;
    case intent:
      rv = true;                // SANE has no equivalent
      break;
    case x_resolution:
      rv = (set_option (SANE_NAME_SCAN_X_RESOLUTION, v)
            || set_option (SANE_NAME_SCAN_RESOLUTION, v));
      break;
    case y_resolution:
      rv = (set_option (SANE_NAME_SCAN_Y_RESOLUTION, v)
            || resolution () == i);
      break;
    case brightness:
      rv = set_option (SANE_NAME_BRIGHTNESS, v);
      break;
    case contrast:
      rv = set_option (SANE_NAME_CONTRAST, v);
      break;
    case x_start:
    case y_start:
    case x_extent:
    case y_extent:
      rv = set_geometry (pid, v);
      break;
    default:
      break;
    }

  if (rv) values_[pid] = v;
  return rv;
}

constraint::ptr
connexion::limits (property::id pid)
{
  std::string name;

  switch (pid)
    {
    case property::x_resolution:
    case property::y_resolution:
      name = SANE_NAME_SCAN_RESOLUTION; break;
    case property::brightness:
      name = SANE_NAME_BRIGHTNESS; break;
    case property::contrast:
      name = SANE_NAME_CONTRAST; break;
    default:
      return constraint::ptr ();
    }

  SANE_Int index;
  const SANE_Option_Descriptor *opt = descriptor (name, index);

  if (!opt || !(SANE_TYPE_INT == opt->type || SANE_TYPE_FIXED == opt->type))
    return constraint::ptr ();

  if (SANE_CONSTRAINT_RANGE == opt->constraint_type)
    {
      const SANE_Range *r = opt->constraint.range;
      value::integer lo = from_word (opt->type, r->min);
      value::integer hi = from_word (opt->type, r->max);
      value::integer step = (r->quant ? from_word (opt->type, r->quant) : 0);

      if (hi < lo)
        {
          log::error ("%1%: empty range %2%..%3% ignored") % name % lo % hi;
          return constraint::ptr ();
        }
      return make_shared< range > (lo, hi, (0 < step ? step : 1));
    }
  if (SANE_CONSTRAINT_WORD_LIST == opt->constraint_type)
    {
      const SANE_Word *w = opt->constraint.word_list;
      std::vector< value::integer > words;

      for (SANE_Word i = 1; i <= w[0]; ++i)
        words.push_back (from_word (opt->type, w[i]));
      if (!words.empty ())
        return make_shared< choices > (words.begin (), words.end ());
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

  SANE_Status status = sane_start (handle_);

  if (SANE_STATUS_NO_DOCS == status)
    {
      feeder_empty_ = true;
      sane_cancel (handle_);
      BOOST_THROW_EXCEPTION
        (system_error (system_error::media_out,
                       _("No more pages in the document feeder")));
    }
  if (SANE_STATUS_GOOD != status)
    {
      sane_cancel (handle_);
      BOOST_THROW_EXCEPTION
        (failure (system_error::transfer_failure,
                  _("Unable to start scan"), status));
    }

  SANE_Parameters p;
  status = sane_get_parameters (handle_, &p);
  if (SANE_STATUS_GOOD != status)
    {
      sane_cancel (handle_);
      BOOST_THROW_EXCEPTION
        (failure (system_error::transfer_failure,
                  _("Error communicating with scanner"), status));
    }

  log::trace (log::DRIVER, "frame %1%, %2%x%3% pixels, depth %4%")
    % p.format % p.pixels_per_line % p.lines % p.depth;

  if (!(SANE_FRAME_GRAY == p.format || SANE_FRAME_RGB == p.format)
      || !p.last_frame
      || !(1 == p.depth || 8 == p.depth || 16 == p.depth)
      || (1 == p.depth && SANE_FRAME_RGB == p.format))
    {
      sane_cancel (handle_);
      BOOST_THROW_EXCEPTION
        (system_error (system_error::transfer_failure,
                       _("Unsupported image data from scanner")));
    }

  octets data;
  const SANE_Int chunk = 32 * 1024;
  boost::scoped_array< SANE_Byte > buf (new SANE_Byte[chunk]);

  SANE_Int n = 0;
  while (SANE_STATUS_GOOD == (status = sane_read (handle_, buf.get (),
                                                  chunk, &n)))
    {
      data.insert (data.end (), buf.get (), buf.get () + n);
    }

  if (SANE_STATUS_EOF != status)
    {
      sane_cancel (handle_);
      if (SANE_STATUS_NO_DOCS == status)
        {
          feeder_empty_ = true;
          BOOST_THROW_EXCEPTION
            (system_error (system_error::media_out,
                           _("No more pages in the document feeder")));
        }
      BOOST_THROW_EXCEPTION
        (failure (system_error::transfer_failure,
                  _("Unable to read frame from device"), status));
    }

  if (0 >= p.bytes_per_line)
    BOOST_THROW_EXCEPTION
      (system_error (system_error::transfer_failure,
                     _("Unsupported image data from scanner")));

  int comps  = (SANE_FRAME_RGB == p.format ? 3 : 1);
  int width  = p.pixels_per_line;
  int height = (0 < p.lines ? p.lines : data.size () / p.bytes_per_line);
  int depth  = (1 == p.depth ? 1 : 8);

  if (data.size () < std::size_t (height) * p.bytes_per_line)
    {
      log::error (log::DRIVER, "short image: %1% of %2% lines")
        % (data.size () / p.bytes_per_line) % height;
      height = data.size () / p.bytes_per_line;
    }

  std::size_t line = (1 == depth ? (width + 7) / 8 : width * comps);
  octets pixels (line * height);

  for (int y = 0; y < height; ++y)
    {
      const octet *src = data.data () + y * p.bytes_per_line;
      octet *dst = pixels.data () + y * line;

      if (16 == p.depth)        // keep the most significant byte
        {
          for (std::size_t x = 0; x < line; ++x)
            {
              uint16_t w;
              std::memcpy (&w, src + 2 * x, sizeof (w));
              dst[x] = w >> 8;
            }
        }
      else
        {
          std::memcpy (dst, src, line);
        }
    }

  return pnm::encode (width, height, comps, depth, pixels);
}

const SANE_Option_Descriptor *
connexion::descriptor (const std::string& name, SANE_Int& index) const
{
  option_map::const_iterator it = options_.find (name);

  if (options_.end () == it) return NULL;

  index = it->second;
  const SANE_Option_Descriptor *rv = sane_get_option_descriptor (handle_,
                                                                 index);
  if (rv && (rv->cap & SANE_CAP_INACTIVE)) return NULL;
  return rv;
}

boost::optional< value >
connexion::get_option (const std::string& name) const
{
  SANE_Int index;
  const SANE_Option_Descriptor *opt = descriptor (name, index);

  if (!opt) return boost::none;

  if (SANE_TYPE_STRING == opt->type)
    {
      boost::scoped_array< char > buf (new char[opt->size + 1]);
      if (SANE_STATUS_GOOD != sane_control_option (handle_, index,
                                                   SANE_ACTION_GET_VALUE,
                                                   buf.get (), NULL))
        return boost::none;
      buf[opt->size] = '\0';
      return value (std::string (buf.get ()));
    }

  if (SANE_TYPE_INT != opt->type && SANE_TYPE_FIXED != opt->type)
    return boost::none;
  if (sizeof (SANE_Word) != std::size_t (opt->size))
    return boost::none;

  SANE_Word w;
  if (SANE_STATUS_GOOD != sane_control_option (handle_, index,
                                               SANE_ACTION_GET_VALUE,
                                               &w, NULL))
    return boost::none;

  return value (from_word (opt->type, w));
}

bool
connexion::set_option (const std::string& name, const value& v)
{
  SANE_Int index;
  const SANE_Option_Descriptor *opt = descriptor (name, index);

  if (!opt || !SANE_OPTION_IS_SETTABLE (opt->cap)) return false;

  SANE_Word w;
  if (SANE_TYPE_INT == opt->type)
    w = value::integer (v);
  else if (SANE_TYPE_FIXED == opt->type)
    w = SANE_FIX (double (value::integer (v)));
  else
    return false;

  SANE_Status status = sane_control_option (handle_, index,
                                            SANE_ACTION_SET_VALUE,
                                            &w, NULL);
  log::debug (log::DRIVER, "%1% = %2%: %3%")
    % name % v % sane_strstatus (status);

  return SANE_STATUS_GOOD == status;
}

bool
connexion::set_string (const std::string& name, const strings& candidates)
{
  SANE_Int index;
  const SANE_Option_Descriptor *opt = descriptor (name, index);

  if (!opt || SANE_TYPE_STRING != opt->type
      || SANE_CONSTRAINT_STRING_LIST != opt->constraint_type
      || !SANE_OPTION_IS_SETTABLE (opt->cap))
    return false;

  for (strings::const_iterator it = candidates.begin ();
       candidates.end () != it; ++it)
    {
      for (const SANE_String_Const *s = opt->constraint.string_list;
           *s; ++s)
        {
          if (!iequals (*it, *s)) continue;

          boost::scoped_array< char > buf (new char[opt->size]);
          std::strncpy (buf.get (), *s, opt->size - 1);
          buf[opt->size - 1] = '\0';

          SANE_Status status = sane_control_option (handle_, index,
                                                    SANE_ACTION_SET_VALUE,
                                                    buf.get (), NULL);
          log::debug (log::DRIVER, "%1% = %2%: %3%")
            % name % *s % sane_strstatus (status);

          return SANE_STATUS_GOOD == status;
        }
    }
  return false;
}

value::integer
connexion::capabilities () const
{
  using namespace property;

  SANE_Int index;
  const SANE_Option_Descriptor *opt = descriptor (SANE_NAME_SCAN_SOURCE,
                                                  index);

  if (!opt || SANE_CONSTRAINT_STRING_LIST != opt->constraint_type)
    return capability::flatbed;

  value::integer rv = 0;
  for (const SANE_String_Const *s = opt->constraint.string_list; *s; ++s)
    {
      std::string src (*s);

      if (icontains (src, "flatbed") || iequals (src, "normal"))
        rv |= capability::flatbed;
      if (icontains (src, "adf") || icontains (src, "feeder"))
        rv |= capability::feeder;
      if (icontains (src, "duplex"))
        rv |= capability::duplex;
      if (icontains (src, "transparen") || icontains (src, "film")
          || icontains (src, "negative"))
        rv |= capability::film;
    }

  return (rv ? rv : capability::flatbed);
}

value::integer
connexion::resolution () const
{
  boost::optional< value > v (get_option (SANE_NAME_SCAN_RESOLUTION));

  return (v && v->is_integer () ? value::integer (*v) : 0);
}

//! Applies pixel based geometry to the scan area options
/*! The top-left corner is set from the start properties and the
 *  bottom-right one from start plus extent.
 */
bool
connexion::set_geometry (property::id pid, const value& v)
{
  using namespace property;

  values_[pid] = v;

  bool horizontal = (x_start == pid || x_extent == pid);
  id start  = (horizontal ? x_start  : y_start);
  id extent = (horizontal ? x_extent : y_extent);
  const char *tl = (horizontal ? SANE_NAME_SCAN_TL_X : SANE_NAME_SCAN_TL_Y);
  const char *br = (horizontal ? SANE_NAME_SCAN_BR_X : SANE_NAME_SCAN_BR_Y);

  value::integer dpi = resolution ();
  value::integer origin = 0;
  if (values_.count (start) && values_[start].is_integer ())
    origin = values_[start];

  SANE_Int index;
  const SANE_Option_Descriptor *opt = descriptor (tl, index);
  if (!opt) return false;

  bool rv = set_option (tl, value::integer (std::floor (to_unit (opt->unit,
                                                                 origin,
                                                                 dpi))));

  if (values_.count (extent) && values_[extent].is_integer ())
    {
      value::integer size = values_[extent];
      opt = descriptor (br, index);
      rv = (opt
            && set_option (br, value::integer
                           (std::ceil (to_unit (opt->unit, origin + size,
                                                dpi))))
            && rv);
    }

  return rv;
}

}       // namespace sane
}       // namespace _drv_
}       // namespace scanflow
