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

#ifndef FVPREP_LOGGER_H
#define FVPREP_LOGGER_H

#include <string>
#include <memory>

#include <mpi.h>                // MPI_Comm

namespace fvprep {

//! Progress and diagnostic messages of fvprep tools.
/**
 * A message has a verbosity level: it is shown if the level does not exceed the threshold of
 * the logger (1: only essential output, 2: the default, 3: per-file progress). Errors are
 * shown regardless of the threshold.
 *
 * Text is printed once, by rank 0 of the communicator. Derived classes override emit() to send it
 * elsewhere.
 */
class Logger {
public:
  typedef std::shared_ptr<Logger> Ptr;

  Logger(MPI_Comm com, int threshold);
  virtual ~Logger() = default;

  void message(int level, const char format[], ...) const __attribute__((format(printf, 3, 4)));
  void message(int level, const std::string &text) const;

  void error(const char format[], ...) const __attribute__((format(printf, 2, 3)));

  int threshold() const;
  void set_threshold(int threshold);
protected:
  enum Channel {OUTPUT, ERRORS};

  virtual void emit(Channel channel, const std::string &text) const;
private:
  MPI_Comm m_com;
  int m_threshold;
};

//! Keeps all messages (including errors) in memory.
class StringLogger : public Logger {
public:
  StringLogger(MPI_Comm com, int threshold);

  std::string get() const;
  void reset();
protected:
  void emit(Channel channel, const std::string &text) const;
private:
  mutable std::string m_text;
};

//! Creates a logger using the threshold set by `-verbose` (default: 2).
Logger::Ptr logger_from_options(MPI_Comm com);

} // end of namespace fvprep

#endif /* FVPREP_LOGGER_H */
