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

#include "fvprep_utilities.hh"

#include <cstdlib>
#include <cstdio>

#include "error_handling.hh"

namespace fvprep {

std::string string_strip(const std::string &input) {
  const char *whitespace = " \t\n\r\f\v";

  size_t begin = input.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = input.find_last_not_of(whitespace);

  return input.substr(begin, end - begin + 1);
}

bool starts_with(const std::string &str, const std::string &prefix) {
  return str.compare(0, prefix.size(), prefix) == 0;
}

std::string join(const std::vector<std::string> &strings, const std::string &separator) {
  std::string result;
  for (size_t k = 0; k < strings.size(); ++k) {
    result += (k > 0 ? separator : "") + strings[k];
  }
  return result;
}

std::vector<std::string> split(const std::string &input, char separator) {
  std::vector<std::string> result;

  size_t start = 0;
  while (start <= input.size()) {
    size_t end = input.find(separator, start);
    if (end == std::string::npos) {
      end = input.size();
    }
    if (end > start) {
      result.push_back(input.substr(start, end - start));
    }
    start = end + 1;
  }
  return result;
}

std::set<std::string> set_split(const std::string &input, char separator) {
  std::vector<std::string> tokens = split(input, separator);
  return std::set<std::string>(tokens.begin(), tokens.end());
}

bool member(const std::string &string, const std::set<std::string> &set) {
  return set.count(string) > 0;
}

void broadcast(MPI_Comm comm, int root, std::string &string) {
  unsigned int length = string.size();
  MPI_Bcast(&length, 1, MPI_UNSIGNED, root, comm);

  string.resize(length);
  if (length > 0) {
    MPI_Bcast(&string[0], length, MPI_CHAR, root, comm);
  }
}

void broadcast(MPI_Comm comm, int root, std::vector<double> &values) {
  unsigned int length = values.size();
  MPI_Bcast(&length, 1, MPI_UNSIGNED, root, comm);

  values.resize(length);
  if (length > 0) {
    MPI_Bcast(values.data(), length, MPI_DOUBLE, root, comm);
  }
}

std::string vformat(const char *format, va_list arguments) {
  va_list copy;
  va_copy(copy, arguments);
  int length = vsnprintf(nullptr, 0, format, copy);
  va_end(copy);

  if (length <= 0) {
    return "";
  }

  std::vector<char> text(length + 1);
  vsnprintf(text.data(), text.size(), format, arguments);

  return std::string(text.data(), length);
}

std::string printf(const char *format, ...) {
  va_list arguments;
  va_start(arguments, format);
  std::string result = vformat(format, arguments);
  va_end(arguments);

  return result;
}

long int parse_integer(const std::string &input) {
  char *end = nullptr;
  long int result = strtol(input.c_str(), &end, 10);

  if (input.empty() or *end != '\0') {
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                  "'%s' is not an integer", input.c_str());
  }
  return result;
}

} // end of namespace fvprep
