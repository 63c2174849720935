//  choices.hpp -- enumerated property limits
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
#ifndef scanflow_choices_hpp_
#define scanflow_choices_hpp_

#include <vector>

#include <boost/throw_exception.hpp>

#include "constraint.hpp"

namespace scanflow {

//! A fixed list of values to pick from
/*! The list keeps the order in which its values were added and holds
 *  each of them only once.  Its first value is the initial fallback.
 */
class choices
  : public constraint
{
  typedef std::vector< value > container_type;

public:
  typedef shared_ptr< choices > ptr;
  typedef container_type::const_iterator const_iterator;
  typedef container_type::size_type size_type;

  explicit choices (const value& first);

  //! Lists the values in [\a first, \a last)
  /*! \throws violation if the sequence is empty
   */
  template< typename ForwardIterator >
  choices (ForwardIterator first, ForwardIterator last)
    : constraint (first != last ? value (*first) : value ())
  {
    if (first == last)
      BOOST_THROW_EXCEPTION (violation ("nothing to choose from"));

    for (; last != first; ++first) add (value (*first));
  }

  //! Appends \a v unless already listed
  choices& add (const value& v);

  bool allows (const value& v) const;

  const_iterator begin () const { return values_.begin (); }
  const_iterator end () const { return values_.end (); }
  size_type size () const { return values_.size (); }

private:
  container_type values_;
};

}       // namespace scanflow

#endif  /* scanflow_choices_hpp_ */
