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

#ifndef FVPREP_OPTIONS_H
#define FVPREP_OPTIONS_H

#include <string>
#include <vector>

namespace fvprep {

class Logger;

//! Handles `-version`, `-usage` and `-help` and checks that `required` options are present.
/*!
 * Returns true if `program` should stop (after printing the version or the usage message, or if a
 * required option is missing).
 */
bool check_command_line(const Logger &log,
                        const std::string &program,
                        const std::vector<std::string> &required,
                        const std::string &usage);

//! Command-line options stored in the PETSc options database.
namespace options {

template<typename T>
class Option {
public:
  Option()
    : m_value(), m_given(false) {
    // empty
  }

  //! True if the option was given on the command line.
  bool is_set() const {
    return m_given;
  }

  const T& value() const {
    return m_value;
  }

  operator T() const {
    return m_value;
  }

  const T* operator->() const {
    return &m_value;
  }
protected:
  T m_value;
  bool m_given;
};

enum EmptyArgument {EMPTY_OK, ARGUMENT_REQUIRED};

class String : public Option<std::string> {
public:
  String(const std::string &option,
         const std::string &description);
  String(const std::string &option,
         const std::string &description,
         const std::string &default_value,
         EmptyArgument empty = ARGUMENT_REQUIRED);
};

//! A string option that has to be one of comma-separated `choices`.
class Keyword : public Option<std::string> {
public:
  Keyword(const std::string &option,
          const std::string &description,
          const std::string &choices,
          const std::string &default_value);
};

class Integer : public Option<int> {
public:
  Integer(const std::string &option,
          const std::string &description,
          int default_value);
};

//! A flag: "-option", "-option on" and "-option true" set it, "-option off" clears it.
bool Bool(const std::string &option,
          const std::string &description);

} // end of namespace options

} // end of namespace fvprep

#endif /* FVPREP_OPTIONS_H */
