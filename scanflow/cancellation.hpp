//  cancellation.hpp -- cooperative cancellation of long running operations
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

#ifndef scanflow_cancellation_hpp_
#define scanflow_cancellation_hpp_

#include <csignal>

#include "memory.hpp"

namespace scanflow {

//! A flag shared by everyone holding a copy
/*! Operations poll requested() at points where they can stop cleanly.
 *  Nothing is interrupted forcibly.
 *
 *  The request() member function only stores to a \c sig_atomic_t
 *  and may be called from a signal handler.
 */
class cancellation
{
public:
  cancellation ();

  void request () const;
  bool requested () const;

  //! Clears a request so the token can be used again
  void reset () const;

private:
  shared_ptr< volatile std::sig_atomic_t > flag_;
};

}       // namespace scanflow

#endif  /* scanflow_cancellation_hpp_ */
