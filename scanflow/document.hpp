//  document.hpp -- ordered collections of captured pages
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

#ifndef scanflow_document_hpp_
#define scanflow_document_hpp_

#include <string>
#include <vector>

#include <boost/date_time/posix_time/ptime.hpp>
#include <boost/uuid/uuid.hpp>

#include "page.hpp"

namespace scanflow {

//! An ordered, numbered sequence of pages
/*! After every mutation, the page at position \c i carries number
 *  \c i+1 and modified() reflects the time of that mutation.
 *
 *  Documents are not thread-safe.  They are meant to be changed by
 *  the one party orchestrating a scan session only.
 */
class document
{
  typedef std::vector< page > container_type;

public:
  typedef container_type::size_type size_type;
  typedef container_type::iterator iterator;
  typedef container_type::const_iterator const_iterator;

  explicit document (const std::string& name = default_name);

  const boost::uuids::uuid& id () const;
  const std::string& name () const;
  void name (const std::string& name);

  const boost::posix_time::ptime& created () const;
  const boost::posix_time::ptime& modified () const;

  //! Appends \a p, numbering it after the current last page
  void add (const page& p);

  //! Moves the page at index \a from to index \a to
  /*! Out of range or equal indices leave the document untouched.
   */
  void reorder (size_type from, size_type to);

  //! Removes the page with the same id as \a p, if present
  void remove (const page& p);
  void remove (const page::id_type& id);

  void clear ();

  size_type size () const;
  bool empty () const;

  page& operator[] (size_type i);
  const page& operator[] (size_type i) const;

  iterator find (const page::id_type& id);
  const_iterator find (const page::id_type& id) const;

  iterator begin ();
  iterator end ();
  const_iterator begin () const;
  const_iterator end () const;

  static const std::string default_name;

private:
  void renumber ();
  void touch ();

  boost::uuids::uuid       id_;
  std::string              name_;
  boost::posix_time::ptime created_;
  boost::posix_time::ptime modified_;
  container_type           pages_;
};

}       // namespace scanflow

#endif  /* scanflow_document_hpp_ */
