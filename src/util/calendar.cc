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

#include <cmath>
#include <cstring>
#include <cctype>

#include "fvprep/util/calendar.hh"
#include "fvprep/util/error_handling.hh"
#include "fvprep/util/fvprep_utilities.hh"

namespace fvprep {
namespace calendar {

const char *internal_time_units = "seconds since 1858-11-17 00:00:00";
const char *mjd_time_units = "days since 1858-11-17 00:00:00";

static const long long microseconds_per_day = 86400LL * 1000000LL;

DateTime::DateTime()
  : year(1858), month(11), day(17), hour(0), minute(0), second(0), microsecond(0) {
  // empty
}

DateTime::DateTime(int Y, int M, int D, int h, int m, int s, int us)
  : year(Y), month(M), day(D), hour(h), minute(m), second(s), microsecond(us) {
  // empty
}

bool operator==(const DateTime &a, const DateTime &b) {
  return (a.year == b.year and a.month == b.month and a.day == b.day and
          a.hour == b.hour and a.minute == b.minute and a.second == b.second and
          a.microsecond == b.microsecond);
}

DateTime date(units::System::Ptr system, double mjd_seconds) {
  long long us = std::llround(mjd_seconds * 1e6);

  // split into whole days and the time of day so that UDUNITS-2 only decodes midnights
  long long days     = us / microseconds_per_day;
  long long us_of_day = us % microseconds_per_day;
  if (us_of_day < 0) {
    us_of_day += microseconds_per_day;
    days -= 1;
  }

  units::DateTime midnight = units::Unit(system, internal_time_units).date(days * 86400.0);

  long long seconds_of_day = us_of_day / 1000000LL;

  return DateTime(midnight.year, midnight.month, midnight.day,
                  (int)(seconds_of_day / 3600),
                  (int)((seconds_of_day % 3600) / 60),
                  (int)(seconds_of_day % 60),
                  (int)(us_of_day % 1000000LL));
}

double time(units::System::Ptr system, const DateTime &d) {
  units::DateTime midnight = {d.year, d.month, d.day, 0, 0, 0.0};

  double t = units::Unit(system, internal_time_units).time(midnight);

  return t + (d.hour * 3600.0 + d.minute * 60.0 + d.second) + d.microsecond * 1e-6;
}

std::string format_iso(units::System::Ptr system, double mjd_seconds) {
  DateTime d = date(system, mjd_seconds);

  return fvprep::printf("%04d-%02d-%02dT%02d:%02d:%02d.%06d",
                        d.year, d.month, d.day, d.hour, d.minute, d.second, d.microsecond);
}

static bool is_digit(char c) {
  return isdigit((unsigned char)c) != 0;
}

//! Parse a fixed-width unsigned integer field from `input` starting at `position`.
static bool parse_field(const std::string &input, size_t &position, size_t width, int &result) {
  if (position + width > input.size()) {
    return false;
  }

  result = 0;
  for (size_t k = 0; k < width; ++k) {
    char c = input[position + k];
    if (not is_digit(c)) {
      return false;
    }
    result = 10 * result + (c - '0');
  }
  position += width;
  return true;
}

static bool expect(const std::string &input, size_t &position, const char *separators) {
  if (position >= input.size() or strchr(separators, input[position]) == NULL) {
    return false;
  }
  position += 1;
  return true;
}

//! True if UDUNITS-2 decodes the midnight of `d` back to the same day.
static bool is_valid_day(units::System::Ptr system, const DateTime &d) {
  if (d.month < 1 or d.month > 12 or d.day < 1 or d.day > 31) {
    return false;
  }

  DateTime decoded = date(system, time(system, DateTime(d.year, d.month, d.day)));

  return decoded.year == d.year and decoded.month == d.month and decoded.day == d.day;
}

double parse_iso(units::System::Ptr system, const std::string &date_string) {
  std::string input = string_strip(date_string);

  DateTime result(0, 1, 1);
  size_t p = 0;

  bool success = (parse_field(input, p, 4, result.year) and
                  expect(input, p, "-") and
                  parse_field(input, p, 2, result.month) and
                  expect(input, p, "-") and
                  parse_field(input, p, 2, result.day));

  if (success and p < input.size()) {
    success = (expect(input, p, "T ") and
               parse_field(input, p, 2, result.hour) and
               expect(input, p, ":") and
               parse_field(input, p, 2, result.minute) and
               expect(input, p, ":") and
               parse_field(input, p, 2, result.second));

    if (success and p < input.size()) {
      success = expect(input, p, ".");

      // up to six digits of fractional seconds
      int scale = 100000;
      while (success and p < input.size() and scale > 0) {
        if (not is_digit(input[p])) {
          success = false;
          break;
        }
        result.microsecond += (input[p] - '0') * scale;
        scale /= 10;
        p += 1;
      }
      success = success and p == input.size();
    }
  }

  if (not success or not is_valid_day(system, result) or
      result.hour > 23 or result.minute > 59 or result.second > 59) {
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                  "invalid date: '%s' (expected YYYY-MM-DDTHH:MM:SS.ffffff)",
                                  date_string.c_str());
  }

  return time(system, result);
}

bool is_valid_calendar_name(const std::string &name) {
  return member(name, {"standard", "gregorian", "proleptic_gregorian",
                       "noleap", "365_day", "julian", "360_day"});
}

bool is_gregorian(const std::string &name) {
  return member(name, {"standard", "gregorian", "proleptic_gregorian"});
}

} // end of namespace calendar
} // end of namespace fvprep
