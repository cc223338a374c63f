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

#include "Logger.hh"
#include "fvprep_options.hh"
#include "fvprep_utilities.hh"
#include "error_handling.hh"

namespace fvprep {

Logger::Logger(MPI_Comm com, int threshold)
  : m_com(com), m_threshold(threshold) {
  // empty
}

void Logger::message(int level, const char format[], ...) const {
  if (level > m_threshold) {
    return;
  }

  va_list arguments;
  va_start(arguments, format);
  std::string text = vformat(format, arguments);
  va_end(arguments);

  emit(OUTPUT, text);
}

void Logger::message(int level, const std::string &text) const {
  if (level <= m_threshold) {
    emit(OUTPUT, text);
  }
}

void Logger::error(const char format[], ...) const {
  va_list arguments;
  va_start(arguments, format);
  std::string text = vformat(format, arguments);
  va_end(arguments);

  emit(ERRORS, text);
}

int Logger::threshold() const {
  return m_threshold;
}

void Logger::set_threshold(int threshold) {
  m_threshold = threshold;
}

void Logger::emit(Channel channel, const std::string &text) const {
  FILE *stream = channel == ERRORS ? PETSC_STDERR : PETSC_STDOUT;
  PetscErrorCode ierr = PetscFPrintf(m_com, stream, "%s", text.c_str());
  FVPREP_CHK(ierr, "PetscFPrintf");
}

StringLogger::StringLogger(MPI_Comm com, int threshold)
  : Logger(com, threshold) {
  // empty
}

void StringLogger::emit(Channel channel, const std::string &text) const {
  (void) channel;
  m_text += text;
}

std::string StringLogger::get() const {
  return m_text;
}

void StringLogger::reset() {
  m_text.clear();
}

Logger::Ptr logger_from_options(MPI_Comm com) {
  options::Integer verbosity("-verbose", "verbosity level (1: quiet, 3: show progress)", 2);

  return Logger::Ptr(new Logger(com, verbosity));
}

} // end of namespace fvprep
