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

#ifndef FVPREP_CALENDAR_H
#define FVPREP_CALENDAR_H

#include <string>

#include "fvprep/util/Units.hh"

namespace fvprep {

//! Calendar dates on the Modified Julian Day time axis.
/*!
 * Times are stored as seconds since 1858-11-17 00:00:00 UTC (the MJD epoch). Dates are decoded
 * and encoded by UDUNITS-2, so they follow the Gregorian calendar.
 */
namespace calendar {

//! UDUNITS-2 specification of the internal time axis.
extern const char *internal_time_units;

//! Units of the MJD time axis written to forcing files.
extern const char *mjd_time_units;

//! Number of characters in a formatted time stamp, "YYYY-MM-DDTHH:MM:SS.ffffff".
static const int date_string_length = 26;

//! A time stamp broken down to microseconds.
struct DateTime {
  DateTime();
  DateTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0,
           int microsecond = 0);

  int year, month, day, hour, minute, second, microsecond;
};

bool operator==(const DateTime &a, const DateTime &b);

//! Convert seconds since the MJD epoch to a date, rounding to the nearest microsecond.
DateTime date(units::System::Ptr system, double mjd_seconds);

//! Convert a date to seconds since the MJD epoch.
double time(units::System::Ptr system, const DateTime &date);

//! Format seconds since the MJD epoch as "YYYY-MM-DDTHH:MM:SS.ffffff".
std::string format_iso(units::System::Ptr system, double mjd_seconds);

//! Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS.ffffff".
double parse_iso(units::System::Ptr system, const std::string &date_string);

//! Calendar names from the CF Conventions document (except 366_day).
bool is_valid_calendar_name(const std::string &name);

//! True for calendars that agree with the proleptic Gregorian one after 1582.
bool is_gregorian(const std::string &name);

} // end of namespace calendar
} // end of namespace fvprep

#endif /* FVPREP_CALENDAR_H */
