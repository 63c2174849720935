//  document.cpp -- ordered collections of captured pages
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

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/uuid/random_generator.hpp>

#include "scanflow/document.hpp"

namespace scanflow {

using boost::posix_time::microsec_clock;

const std::string document::default_name ("Scanned Document");

namespace {

struct same_id
{
  const page::id_type& id_;

  same_id (const page::id_type& id) : id_(id) {}
  bool operator() (const page& p) const { return id_ == p.id (); }
};

}       // namespace

document::document (const std::string& name)
  : id_(boost::uuids::random_generator () ())
  , name_(name)
  , created_(microsec_clock::universal_time ())
  , modified_(created_)
{}

const boost::uuids::uuid&
document::id () const
{
  return id_;
}

const std::string&
document::name () const
{
  return name_;
}

void
document::name (const std::string& name)
{
  name_ = name;
  touch ();
}

const boost::posix_time::ptime&
document::created () const
{
  return created_;
}

const boost::posix_time::ptime&
document::modified () const
{
  return modified_;
}

void
document::add (const page& p)
{
  pages_.push_back (p);
  pages_.back ().number (pages_.size ());
  touch ();
}

void
document::reorder (size_type from, size_type to)
{
  if (from >= size () || to >= size () || from == to) return;

  if (from < to)
    std::rotate (pages_.begin () + from, pages_.begin () + from + 1,
                 pages_.begin () + to + 1);
  else
    std::rotate (pages_.begin () + to, pages_.begin () + from,
                 pages_.begin () + from + 1);

  renumber ();
  touch ();
}

void
document::remove (const page& p)
{
  remove (p.id ());
}

void
document::remove (const page::id_type& id)
{
  iterator it = find (id);

  if (end () == it) return;

  pages_.erase (it);
  renumber ();
  touch ();
}

void
document::clear ()
{
  pages_.clear ();
  touch ();
}

document::size_type
document::size () const
{
  return pages_.size ();
}

bool
document::empty () const
{
  return pages_.empty ();
}

page&
document::operator[] (size_type i)
{
  return pages_[i];
}

const page&
document::operator[] (size_type i) const
{
  return pages_[i];
}

document::iterator
document::find (const page::id_type& id)
{
  return std::find_if (pages_.begin (), pages_.end (), same_id (id));
}

document::const_iterator
document::find (const page::id_type& id) const
{
  return std::find_if (pages_.begin (), pages_.end (), same_id (id));
}

document::iterator
document::begin ()
{
  return pages_.begin ();
}

document::iterator
document::end ()
{
  return pages_.end ();
}

document::const_iterator
document::begin () const
{
  return pages_.begin ();
}

document::const_iterator
document::end () const
{
  return pages_.end ();
}

void
document::renumber ()
{
  for (size_type i = 0; i < pages_.size (); ++i)
    pages_[i].number (i + 1);
}

void
document::touch ()
{
  modified_ = microsec_clock::universal_time ();
}

}       // namespace scanflow
