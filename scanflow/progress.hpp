//  progress.hpp -- scan progress snapshots
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

#ifndef scanflow_progress_hpp_
#define scanflow_progress_hpp_

#include <functional>
#include <iosfwd>
#include <string>

#include <boost/optional.hpp>

namespace scanflow {

//! Where a scan is at
/*! An immutable snapshot.  Feeder scans do not know how many pages
 *  there will be, so total() is only set for single page scans.
 */
class progress
{
public:
  //! Receives snapshots in the order they were produced
  typedef std::function< void (const progress&) > sink;

  progress (int page, const boost::optional< int >& total,
            double percent, const std::string& status);

  int page () const;
  const boost::optional< int >& total () const;
  double percent () const;
  const std::string& status () const;

private:
  int                    page_;
  boost::optional< int > total_;
  double                 percent_;
  std::string            status_;
};

std::ostream& operator<< (std::ostream& os, const progress& p);

}       // namespace scanflow

#endif  /* scanflow_progress_hpp_ */
