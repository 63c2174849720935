//  i18n.hpp -- C++ wrappers for libintl.h functionality
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

#ifndef scanflow_i18n_hpp_
#define scanflow_i18n_hpp_

/*! \file
 *  \brief Message catalog lookup for user visible text
 *
 *  This header file honours the \c ENABLE_NLS preprocessor macro.
 *  Define it to a \c true value before including this file to enable
 *  national language support.  By default \c ENABLE_NLS evaluates to
 *  \c false and messages are returned untranslated.
 *
 *  The common markup keywords _() and N_() are supported.
 */

#include <libintl.h>

#include <string>

#ifndef ENABLE_NLS
#define ENABLE_NLS 0
#endif

#ifndef DEFAULT_TEXT_DOMAIN
#define DEFAULT_TEXT_DOMAIN "scanflow"
#endif

namespace scanflow {

inline
const char *
gettext (const char *msgid)
{
  return (ENABLE_NLS
          ? ::dgettext (DEFAULT_TEXT_DOMAIN, msgid)
          : msgid);
}

inline
std::string
gettext (const std::string& msgid)
{
  return gettext (msgid.c_str ());
}

inline
const char *
ngettext (const char *msgid, const char *msgid_plural,
          unsigned long int n)
{
  return (ENABLE_NLS
          ? ::dngettext (DEFAULT_TEXT_DOMAIN, msgid, msgid_plural, n)
          : (1 == n
             ? msgid
             : msgid_plural));
}

}       // namespace scanflow

#define _(msgid)  scanflow::gettext (msgid)
#define N_(msgid) msgid

#endif  /* scanflow_i18n_hpp_ */
