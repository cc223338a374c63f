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

#include "fvprep/util/Units.hh"

#include <udunits2.h>

#include "fvprep/util/error_handling.hh"

namespace fvprep {
namespace units {

// ut_encode_time() returns seconds since this reference time
static const char *encoded_time_units = "seconds since 2001-01-01 00:00:00";

struct System::Database {
  explicit Database(const std::string &xml_path)
    : system(nullptr) {
    // UDUNITS-2 reports problems on stderr unless told otherwise
    ut_set_error_message_handler(ut_ignore);

    system = ut_read_xml(xml_path.empty() ? nullptr : xml_path.c_str());

    if (system == nullptr) {
      throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                          "failed to read the UDUNITS-2 database%s%s (status: %d)",
                                          xml_path.empty() ? "" : " from ",
                                          xml_path.c_str(), (int)ut_get_status());
    }
  }

  ~Database() {
    ut_free_system(system);
  }

  ut_system *system;
};

System::System(const std::string &xml_path)
  : m_database(new Database(xml_path)) {
  // empty
}

System::~System() {
  // empty
}

struct Unit::Handle {
  Handle(System::Ptr s, const std::string &str, ut_unit *u)
    : system(s), spec(str), unit(u) {
    // empty
  }

  ~Handle() {
    ut_free(unit);
  }

  System::Ptr system;
  std::string spec;
  ut_unit *unit;
};

Unit::Unit(System::Ptr system, const std::string &spec) {
  ut_unit *unit = ut_parse(system->m_database->system, spec.c_str(), UT_ASCII);

  if (unit == nullptr) {
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                  "unknown or invalid unit specification '%s'", spec.c_str());
  }

  m_handle = std::make_shared<const Handle>(system, spec, unit);
}

const std::string& Unit::spec() const {
  return m_handle->spec;
}

bool Unit::is_convertible(const Unit &other) const {
  return ut_are_convertible(m_handle->unit, other.m_handle->unit) != 0;
}

DateTime Unit::date(double T) const {
  Unit encoded(m_handle->system, encoded_time_units);

  double t = 0.0;
  try {
    t = Converter(*this, encoded).convert(T);
  } catch (RuntimeError &e) {
    e.add_context("decoding time %f (%s)", T, m_handle->spec.c_str());
    throw;
  }

  DateTime result;
  double resolution = 0.0;
  ut_decode_time(t, &result.year, &result.month, &result.day,
                 &result.hour, &result.minute, &result.second, &resolution);

  return result;
}

double Unit::time(const DateTime &d) const {
  Unit encoded(m_handle->system, encoded_time_units);

  double t = ut_encode_time(d.year, d.month, d.day, d.hour, d.minute, d.second);

  try {
    return Converter(encoded, *this).convert(t);
  } catch (RuntimeError &e) {
    e.add_context("encoding %04d-%02d-%02d %02d:%02d:%09.6f as '%s'",
                  d.year, d.month, d.day, d.hour, d.minute, d.second,
                  m_handle->spec.c_str());
    throw;
  }
}

struct Converter::Handle {
  explicit Handle(cv_converter *c)
    : converter(c) {
    // empty
  }

  ~Handle() {
    cv_free(converter);
  }

  cv_converter *converter;
};

Converter::Converter(const Unit &from, const Unit &to) {
  if (not from.is_convertible(to)) {
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION, "cannot convert '%s' to '%s'",
                                  from.spec().c_str(), to.spec().c_str());
  }

  cv_converter *c = ut_get_converter(from.m_handle->unit, to.m_handle->unit);
  if (c == nullptr) {
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                  "UDUNITS-2 failed to create a converter from '%s' to '%s'"
                                  " (status: %d)",
                                  from.spec().c_str(), to.spec().c_str(), (int)ut_get_status());
  }

  m_handle = std::make_shared<const Handle>(c);
}

Converter::Converter(System::Ptr system, const std::string &from, const std::string &to)
  : Converter(Unit(system, from), Unit(system, to)) {
  // empty
}

double Converter::convert(double value) const {
  return cv_convert_double(m_handle->converter, value);
}

void Converter::convert_doubles(double *data, size_t length) const {
  cv_convert_doubles(m_handle->converter, data, length, data);
}

} // end of namespace units
} // end of namespace fvprep
