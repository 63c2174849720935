//  services.hpp -- interfaces to image processing, OCR, export and upload services
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

#ifndef scanflow_services_hpp_
#define scanflow_services_hpp_

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "cancellation.hpp"
#include "document.hpp"
#include "memory.hpp"
#include "octet.hpp"
#include "recognition.hpp"

namespace scanflow {

//! Image manipulation performed on captured pages
/*! Implementations accept and return images in the transfer format.
 */
class image_processor
{
public:
  typedef shared_ptr< image_processor > ptr;

  virtual ~image_processor ();

  //! Locates the document's edges in \a image
  /*! Returns nothing if no sensible bounds could be found.
   */
  virtual boost::optional< rectangle >
  detect_edges (const octets& image, const cancellation& token) = 0;

  virtual octets enhance (const octets& image, const cancellation& token) = 0;

  //! Rotates clockwise by a multiple of 90 \a degrees
  virtual octets rotate (const octets& image, int degrees) = 0;

  virtual octets crop (const octets& image, const rectangle& bounds) = 0;

  //! Scales \a image down so neither side exceeds \a max_size
  virtual octets thumbnail (const octets& image, int max_size) = 0;
};

//! Optical character recognition
class recognizer
{
public:
  typedef shared_ptr< recognizer > ptr;

  virtual ~recognizer ();

  //! Reads the text in \a image
  /*! The \a language is an ISO 639-2 code such as \c "eng".
   */
  virtual recognition recognize (const octets& image,
                                 const std::string& language,
                                 const cancellation& token) = 0;
};

//! Turns documents into file contents
/*! Single page formats produce one buffer per page, in page order.
 *  Multi-page formats produce a single buffer for the whole document.
 */
class exporter
{
public:
  typedef shared_ptr< exporter > ptr;

  virtual ~exporter ();

  //! File name extension, without the leading dot
  virtual std::string extension () const = 0;

  virtual bool multi_page () const = 0;

  //! \throws std::runtime_error if an image cannot be converted
  virtual std::vector< octets > encode (const document& doc) = 0;
};

//! Puts files somewhere off the machine
class uploader
{
public:
  typedef shared_ptr< uploader > ptr;

  virtual ~uploader ();

  //! Stores \a data as \a name in \a folder
  /*! \return a location by which the upload can be retrieved
   */
  virtual std::string upload (const std::string& folder,
                              const std::string& name,
                              const octets& data,
                              const cancellation& token) = 0;
};

//! Writes \a doc to files named after \a pattern
/*! The \a pattern is a path name that may contain a \c %i formatter
 *  for the page number.  Without one, pages are numbered by inserting
 *  \c -%i before the extension for single page formats.  The file
 *  name extension of \a exp is appended when \a pattern has none.
 *  Existing files are left alone: a name that is taken gets a
 *  \c " (n)" suffix before its extension, using the smallest free n.
 *
 *  \return the names of the files written
 */
std::vector< std::string >
save (exporter& exp, const document& doc, const std::string& pattern);

}       // namespace scanflow

#endif  /* scanflow_services_hpp_ */
