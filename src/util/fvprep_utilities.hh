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

#ifndef FVPREP_UTILITIES_H
#define FVPREP_UTILITIES_H

#include <string>
#include <vector>
#include <set>
#include <cstdarg>

#include <mpi.h>

namespace fvprep {

// Utilities that do not expose PETSc's or NetCDF's API.

//! Remove leading and trailing whitespace.
std::string string_strip(const std::string &input);

//! Returns true if `str` starts with `prefix` and false otherwise.
bool starts_with(const std::string &str, const std::string &prefix);

//! Concatenate `strings`, inserting `separator` between elements.
std::string join(const std::vector<std::string> &strings, const std::string &separator);

//! Transform a `separator`-separated list (a string) into a vector of strings.
std::vector<std::string> split(const std::string &input, char separator);

//! Transform a `separator`-separated list (a string) into a set of strings.
std::set<std::string> set_split(const std::string &input, char separator);

//! Checks if a set of strings contains the given string.
bool member(const std::string &string, const std::set<std::string> &set);

//! Broadcast a string from `root` to all ranks of `comm`.
void broadcast(MPI_Comm comm, int root, std::string &string);

//! Broadcast an array of doubles (resizing it on receiving ranks).
void broadcast(MPI_Comm comm, int root, std::vector<double> &values);

//! Formats `arguments` using a printf-style `format` string.
std::string vformat(const char *format, va_list arguments);

std::string printf(const char *format, ...) __attribute__((format(printf, 1, 2)));

long int parse_integer(const std::string &input);

} // end of namespace fvprep

#endif /* FVPREP_UTILITIES_H */
