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

#include <climits>
#include <vector>

#include <petscsys.h>

#include "fvprep_options.hh"
#include "fvprep_utilities.hh"
#include "error_handling.hh"
#include "Logger.hh"

#ifndef FVPREP_VERSION
#define FVPREP_VERSION "unknown"
#endif

namespace fvprep {

namespace {

const size_t max_argument_length = 32768;

struct Argument {
  bool given;
  std::string text;
};

Argument lookup(const std::string &option) {
  std::vector<char> buffer(max_argument_length, '\0');
  PetscBool given = PETSC_FALSE;

  PetscErrorCode ierr = PetscOptionsGetString(nullptr, nullptr, option.c_str(),
                                              buffer.data(), buffer.size(), &given);
  FVPREP_CHK(ierr, "PetscOptionsGetString");

  Argument result;
  result.given = (given == PETSC_TRUE);
  result.text = buffer.data();
  return result;
}

void print_usage(const Logger &log, const std::string &program, const std::string &usage) {
  log.message(1, "Usage of %s:\n", program.c_str());
  log.message(1, usage);
  log.message(1,
              "Use 'mpiexec -n N %s ...' to run on N MPI processes.\n"
              "'%s -help' lists all fvprep and PETSc options.\n",
              program.c_str(), program.c_str());
}

} // end of anonymous namespace

bool check_command_line(const Logger &log,
                        const std::string &program,
                        const std::vector<std::string> &required,
                        const std::string &usage) {
  log.message(2, "%s (fvprep %s)\n", program.c_str(), FVPREP_VERSION);

  if (options::Bool("-version", "print the version and stop")) {
    return true;
  }

  if (options::Bool("-usage", "print usage and stop")) {
    print_usage(log, program, usage);
    return true;
  }

  std::vector<std::string> missing;
  for (const auto &name : required) {
    if (not options::String(name, "required option", "", options::EMPTY_OK).is_set()) {
      missing.push_back(name);
    }
  }

  if (not missing.empty()) {
    log.error("FVPREP ERROR: missing required option(s) %s\n\n", join(missing, ", ").c_str());
    print_usage(log, program, usage);
    return true;
  }

  if (options::Bool("-help", "print help")) {
    print_usage(log, program, usage);
  }

  return false;
}

namespace options {

String::String(const std::string &option,
               const std::string &description)
  : String(option, description, "", ARGUMENT_REQUIRED) {
  // empty
}

String::String(const std::string &option,
               const std::string &description,
               const std::string &default_value,
               EmptyArgument empty) {
  Argument argument = lookup(option);

  if (not argument.given) {
    m_value = default_value;
    return;
  }

  if (argument.text.empty() and empty == ARGUMENT_REQUIRED) {
    throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                        "option %s (%s) requires an argument",
                                        option.c_str(), description.c_str());
  }

  m_value = argument.text;
  m_given = true;
}

Keyword::Keyword(const std::string &option,
                 const std::string &description,
                 const std::string &choices,
                 const std::string &default_value) {
  if (choices.empty()) {
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                  "option %s has no valid arguments", option.c_str());
  }

  String input(option, description, default_value);

  m_value = input.value();
  m_given = input.is_set();

  if (m_given and not member(m_value, set_split(choices, ','))) {
    throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                        "invalid %s argument '%s' (valid arguments: %s)",
                                        option.c_str(), m_value.c_str(), choices.c_str());
  }
}

Integer::Integer(const std::string &option,
                 const std::string &description,
                 int default_value) {
  String input(option, description);

  if (not input.is_set()) {
    m_value = default_value;
    return;
  }

  long int number = 0;
  try {
    number = parse_integer(input);
  } catch (RuntimeError &e) {
    throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                        "invalid %s argument '%s' (%s)",
                                        option.c_str(), input->c_str(), e.what());
  }

  if (number < INT_MIN or number > INT_MAX) {
    throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                        "%s argument %ld is out of range",
                                        option.c_str(), number);
  }

  m_value = static_cast<int>(number);
  m_given = true;
}

bool Bool(const std::string &option,
          const std::string &description) {
  String input(option, description, "", EMPTY_OK);

  if (not input.is_set()) {
    return false;
  }

  if (member(input, {"", "on", "true", "yes", "1"})) {
    return true;
  }

  if (member(input, {"off", "false", "no", "0"})) {
    return false;
  }

  throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                      "invalid %s argument '%s' (use on or off)",
                                      option.c_str(), input->c_str());
}

} // end of namespace options
} // end of namespace fvprep
