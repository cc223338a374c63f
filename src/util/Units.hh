/* Copyright (C) 2026 fvprep Authors
 *
 * This file is part of fvprep.
 *
 * fvprep is free software; you can redistribute it and/or modify it under the
 * terms of the GNU General Public License as published by the Free Software
 * Foundation; either version 3 of the License, or (at your option) any later
 * version.
 *
 * fvprep is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License
 * along with fvprep; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 */

#ifndef FVPREP_UNITS_H
#define FVPREP_UNITS_H

#include <string>
#include <memory>

namespace fvprep {

//! UDUNITS-2 unit database, units, converters and time stamp encoding.
namespace units {

//! A calendar date and a time of day (Gregorian after 1582-10-15, Julian before).
struct DateTime {
  int year, month, day, hour, minute;
  double second;
};

//! A unit database read from an XML file.
class System {
public:
  typedef std::shared_ptr<System> Ptr;

  //! Reads the UDUNITS-2 default database if `xml_path` is empty.
  explicit System(const std::string &xml_path = "");
  ~System();
private:
  friend class Unit;

  struct Database;
  std::unique_ptr<Database> m_database;

  System(const System &) = delete;
  System& operator=(const System &) = delete;
};

//! A parsed unit specification.
/*!
 * A unit refers to the database used to parse it, so it holds a pointer to its System. Copies
 * share the underlying UDUNITS-2 object, which is never modified.
 */
class Unit {
public:
  Unit(System::Ptr system, const std::string &spec);

  const std::string& spec() const;

  bool is_convertible(const Unit &other) const;

  //! Decode a time `T` in this unit ("<time unit> since <date>") to a date.
  DateTime date(double T) const;

  //! Encode `date` as a time in this unit.
  double time(const DateTime &date) const;
private:
  friend class Converter;

  struct Handle;
  std::shared_ptr<const Handle> m_handle;
};

//! Conversion between two compatible units. Throws RuntimeError if they are not compatible.
class Converter {
public:
  Converter(const Unit &from, const Unit &to);
  Converter(System::Ptr system, const std::string &from, const std::string &to);

  double convert(double value) const;

  //! Convert `length` values in place.
  void convert_doubles(double *data, size_t length) const;
private:
  struct Handle;
  std::shared_ptr<const Handle> m_handle;
};

} // end of namespace units
} // end of namespace fvprep

#endif /* FVPREP_UNITS_H */
