//  range.hpp -- integer property limits
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
#ifndef scanflow_range_hpp_
#define scanflow_range_hpp_

#include "constraint.hpp"

namespace scanflow {

//! Integers from lower() through upper() in multiples of step()
/*! Steps are counted from lower().  A step of one, the default,
 *  allows every integer in between.  Both bounds are always allowed,
 *  even when the distance between them is not a whole number of
 *  steps, which is how scanners report e.g. 50 through 1200 dpi in
 *  steps of 100.  The fallback starts out as lower().
 */
class range
  : public constraint
{
public:
  typedef shared_ptr< range > ptr;

  /*! \throws violation if \a upper is below \a lower or \a step is
   *          not positive
   */
  range (value::integer lower, value::integer upper,
         value::integer step = 1);

  bool allows (const value& v) const;

  //! Tells whether integer \a i lies on one of the steps
  bool contains (value::integer i) const;

  value::integer lower () const { return lower_; }
  value::integer upper () const { return upper_; }
  value::integer step () const { return step_; }

private:
  value::integer lower_;
  value::integer upper_;
  value::integer step_;
};

}       // namespace scanflow

#endif  /* scanflow_range_hpp_ */
