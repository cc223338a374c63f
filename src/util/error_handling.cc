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

#include <cstdarg>

#include <petscsys.h>

#include "error_handling.hh"
#include "fvprep_utilities.hh"

namespace fvprep {

namespace {

//! Starts each line of `text` after the first with `margin`.
std::string indent(const std::string &text, const std::string &margin) {
  std::string result;
  for (char c : text) {
    result += c;
    if (c == '\n') {
      result += margin;
    }
  }
  return result;
}

} // end of anonymous namespace

ErrorLocation::ErrorLocation(const char *file, int line)
  : filename(file), line_number(line) {
  // empty
}

RuntimeError::RuntimeError(const ErrorLocation &location, const std::string &message)
  : std::runtime_error(message), m_location(location) {
  // empty
}

RuntimeError RuntimeError::formatted(const ErrorLocation &location, const char format[], ...) {
  va_list arguments;
  va_start(arguments, format);
  std::string message = vformat(format, arguments);
  va_end(arguments);

  return RuntimeError(location, message);
}

void RuntimeError::add_context(const std::string &message) {
  m_context.push_back(message);
}

void RuntimeError::add_context(const char format[], ...) {
  va_list arguments;
  va_start(arguments, format);
  m_context.push_back(vformat(format, arguments));
  va_end(arguments);
}

const std::vector<std::string>& RuntimeError::context() const {
  return m_context;
}

const ErrorLocation& RuntimeError::location() const {
  return m_location;
}

const char* RuntimeError::category() const {
  return "FVPREP ERROR";
}

void RuntimeError::report(MPI_Comm com) const {
  std::string prefix = std::string(category()) + ": ";
  std::string margin(prefix.size(), ' ');

  std::string text = prefix + indent(what(), margin) + "\n";

  for (const auto &c : m_context) {
    text += margin + "while " + indent(c, margin + "      ") + "\n";
  }

  if (m_location.filename != nullptr) {
    text += margin + fvprep::printf("(thrown at %s:%d)\n",
                                    m_location.filename, m_location.line_number);
  }

  PetscErrorCode ierr = PetscPrintf(com, "%s", text.c_str());
  CHKERRCONTINUE(ierr);
}

ConfigurationError::ConfigurationError(const ErrorLocation &location, const std::string &message)
  : RuntimeError(location, message) {
  // empty
}

ConfigurationError ConfigurationError::formatted(const ErrorLocation &location,
                                                 const char format[], ...) {
  va_list arguments;
  va_start(arguments, format);
  std::string message = vformat(format, arguments);
  va_end(arguments);

  return ConfigurationError(location, message);
}

const char* ConfigurationError::category() const {
  return "FVPREP CONFIGURATION ERROR";
}

DataSourceError::DataSourceError(const ErrorLocation &location,
                                 const std::vector<std::string> &filenames,
                                 const std::string &message)
  : RuntimeError(location, message), m_filenames(filenames) {
  // empty
}

DataSourceError DataSourceError::formatted(const ErrorLocation &location,
                                           const std::string &filename,
                                           const char format[], ...) {
  va_list arguments;
  va_start(arguments, format);
  std::string message = vformat(format, arguments);
  va_end(arguments);

  return DataSourceError(location, {filename}, message);
}

const std::vector<std::string>& DataSourceError::filenames() const {
  return m_filenames;
}

const char* DataSourceError::category() const {
  return "FVPREP DATA SOURCE ERROR";
}

SchemaError::SchemaError(const ErrorLocation &location, const std::string &message)
  : RuntimeError(location, message) {
  // empty
}

SchemaError SchemaError::formatted(const ErrorLocation &location, const char format[], ...) {
  va_list arguments;
  va_start(arguments, format);
  std::string message = vformat(format, arguments);
  va_end(arguments);

  return SchemaError(location, message);
}

const char* SchemaError::category() const {
  return "FVPREP SCHEMA ERROR";
}

InterpolationError::InterpolationError(const ErrorLocation &location, const std::string &message)
  : RuntimeError(location, message) {
  // empty
}

InterpolationError InterpolationError::formatted(const ErrorLocation &location,
                                                 const char format[], ...) {
  va_list arguments;
  va_start(arguments, format);
  std::string message = vformat(format, arguments);
  va_end(arguments);

  return InterpolationError(location, message);
}

const char* InterpolationError::category() const {
  return "FVPREP INTERPOLATION ERROR";
}

void handle_fatal_errors(MPI_Comm com) {
  PetscErrorCode ierr = 0;
  try {
    throw;
  } catch (RuntimeError &e) {
    e.report(com);
  } catch (std::exception &e) {
    ierr = PetscPrintf(PETSC_COMM_SELF, "FVPREP ERROR: %s (standard library exception)\n",
                       e.what());
    CHKERRCONTINUE(ierr);
  } catch (...) {
    ierr = PetscPrintf(PETSC_COMM_SELF, "FVPREP ERROR: unknown exception\n");
    CHKERRCONTINUE(ierr);
  }
}

void check_c_call(int errcode, int success,
                  const char* function_name, const char *file, int line) {
  if (errcode == success) {
    return;
  }

  throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                "%s returned %d (%s:%d)",
                                function_name, errcode, file, line);
}

void check_petsc_call(int errcode,
                      const char* function_name, const char *file, int line) {
  if (errcode != 0) {
    // prints PETSc's description of the error
    CHKERRCONTINUE(errcode);
  }
  check_c_call(errcode, 0, function_name, file, line);
}

ParallelSection::ParallelSection(MPI_Comm com)
  : m_com(com), m_failed(false) {
  // empty
}

void ParallelSection::failed() {
  int rank = 0;
  MPI_Comm_rank(m_com, &rank);

  PetscErrorCode ierr = PetscFPrintf(PETSC_COMM_SELF, PETSC_STDERR,
                                     "FVPREP ERROR: rank %d failed:\n", rank);
  CHKERRCONTINUE(ierr);

  handle_fatal_errors(PETSC_COMM_SELF);

  m_failed = true;
}

void ParallelSection::check() {
  int ok = m_failed ? 0 : 1;
  int all_ok = 0;

  int err = MPI_Allreduce(&ok, &all_ok, 1, MPI_INT, MPI_LAND, m_com);
  FVPREP_C_CHK(err, MPI_SUCCESS, "MPI_Allreduce");

  if (all_ok == 0) {
    throw RuntimeError(FVPREP_ERROR_LOCATION,
                       "failure on one or more ranks (see messages above)");
  }
}

} // end of namespace fvprep
