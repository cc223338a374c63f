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

#ifndef FVPREP_ERROR_HANDLING_H
#define FVPREP_ERROR_HANDLING_H

#include <mpi.h>                // MPI_Comm
#include <stdexcept>
#include <string>
#include <vector>

namespace fvprep {

//! Source code location of an error. Recorded in debugging builds only.
struct ErrorLocation {
  ErrorLocation(const char *file = nullptr, int line = 0);

  const char *filename;
  int line_number;
};

#if FVPREP_DEBUG==1
#define FVPREP_ERROR_LOCATION fvprep::ErrorLocation(__FILE__, __LINE__)
#else
#define FVPREP_ERROR_LOCATION fvprep::ErrorLocation()
#endif

//! Base class of fvprep errors.
/*!
 * `what()` returns the message only. Code higher up the call stack adds a description of what it
 * was doing using add_context() and re-throws; report() prints all of it.
 */
class RuntimeError : public std::runtime_error {
public:
  RuntimeError(const ErrorLocation &location, const std::string &message);

  static RuntimeError formatted(const ErrorLocation &location, const char format[], ...)
    __attribute__((format(printf, 2, 3)));

  void add_context(const std::string &message);
  void add_context(const char format[], ...) __attribute__((format(printf, 2, 3)));

  //! Context messages, innermost first.
  const std::vector<std::string>& context() const;

  const ErrorLocation& location() const;

  //! Prefix of the report.
  virtual const char* category() const;

  //! Print the message, the context and the location (if known) on rank 0 of `com`.
  void report(MPI_Comm com) const;
private:
  ErrorLocation m_location;
  std::vector<std::string> m_context;
};

//! Invalid run configuration: missing input directories, bad option values.
class ConfigurationError : public RuntimeError {
public:
  ConfigurationError(const ErrorLocation &location, const std::string &message);

  static ConfigurationError formatted(const ErrorLocation &location, const char format[], ...)
    __attribute__((format(printf, 2, 3)));

  const char* category() const;
};

//! An input file that cannot be read or does not contain what we need.
class DataSourceError : public RuntimeError {
public:
  DataSourceError(const ErrorLocation &location,
                  const std::vector<std::string> &filenames,
                  const std::string &message);

  static DataSourceError formatted(const ErrorLocation &location,
                                   const std::string &filename,
                                   const char format[], ...) __attribute__((format(printf, 3, 4)));

  //! Files responsible for this error.
  const std::vector<std::string>& filenames() const;

  const char* category() const;
private:
  std::vector<std::string> m_filenames;
};

//! Misuse of the output schema (undeclared dimensions, wrong sizes, writing a closed file).
class SchemaError : public RuntimeError {
public:
  SchemaError(const ErrorLocation &location, const std::string &message);

  static SchemaError formatted(const ErrorLocation &location, const char format[], ...)
    __attribute__((format(printf, 2, 3)));

  const char* category() const;
};

//! Degenerate coordinate grids.
class InterpolationError : public RuntimeError {
public:
  InterpolationError(const ErrorLocation &location, const std::string &message);

  static InterpolationError formatted(const ErrorLocation &location, const char format[], ...)
    __attribute__((format(printf, 2, 3)));

  const char* category() const;
};

//! Turns a failure on some ranks of a communicator into an exception on all of them.
/*!
 * Usage:
 *
 *     ParallelSection section(com);
 *     try {
 *       // code that may fail on some ranks
 *     } catch (...) {
 *       section.failed();
 *     }
 *     section.check();
 */
class ParallelSection {
public:
  explicit ParallelSection(MPI_Comm com);

  //! Report the current exception and mark this rank as failed. Call from a `catch (...)` block.
  void failed();

  //! Collective. Throws on all ranks if failed() was called on any of them.
  void check();
private:
  MPI_Comm m_com;
  bool m_failed;
};

//! Print a description of the current exception. Call from a `catch (...)` block.
void handle_fatal_errors(MPI_Comm com);

void check_c_call(int errcode, int success, const char* function_name,
                  const char *file, int line);

void check_petsc_call(int errcode, const char* function_name,
                      const char *file, int line);

#define FVPREP_C_CHK(errcode,success,name) do { fvprep::check_c_call(errcode, success, name, __FILE__, __LINE__); } while (0)
#define FVPREP_CHK(errcode,name) do { fvprep::check_petsc_call(errcode, name, __FILE__, __LINE__); } while (0)

} // end of namespace fvprep

#endif /* FVPREP_ERROR_HANDLING_H */
