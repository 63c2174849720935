//  constraint.hpp -- what a device accepts for a property
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
#ifndef scanflow_constraint_hpp_
#define scanflow_constraint_hpp_

#include <stdexcept>
#include <string>

#include "memory.hpp"
#include "value.hpp"

namespace scanflow {

//! Values a device accepts for one of its properties
/*! Drivers hand these out through connexion::limits() so that callers
 *  can find out what to offer before they try a set().  Every
 *  %constraint has a fallback, the value a device settles on when it
 *  is asked for something it does not allow.  The fallback is always
 *  allowed itself.
 */
class constraint
{
public:
  typedef shared_ptr< constraint > ptr;

  virtual ~constraint ();

  //! Tells whether a device takes \a v as is
  virtual bool allows (const value& v) const = 0;

  //! Returns \a v when allowed, the fallback() otherwise
  const value& adjust (const value& v) const;

  const value& fallback () const;

  //! Makes \a v the value to settle on
  /*! \throws violation if \a v is not allowed
   */
  void fallback (const value& v);

  //! Signals limits that contradict themselves
  class violation : public std::logic_error
  {
  public:
    explicit violation (const std::string& what);
  };

protected:
  explicit constraint (const value& fallback);

private:
  value fallback_;
};

}       // namespace scanflow

#endif  /* scanflow_constraint_hpp_ */
