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

#ifndef FVPREP_FORCINGFILE_H
#define FVPREP_FORCINGFILE_H

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <mpi.h>

#include "fvprep/util/io/IO_Flags.hh"

namespace fvprep {

//! A set of NetCDF attributes: strings and (typed) lists of numbers.
class Attributes {
public:
  struct Numbers {
    std::vector<double> values;
    io::Type type;
  };

  Attributes& set_string(const std::string &name, const std::string &value);
  Attributes& set_number(const std::string &name, double value,
                         io::Type type = io::FVPREP_DOUBLE);
  Attributes& set_numbers(const std::string &name, const std::vector<double> &values,
                          io::Type type = io::FVPREP_DOUBLE);

  const std::map<std::string, std::string>& strings() const;
  const std::map<std::string, Numbers>& numbers() const;
private:
  std::map<std::string, std::string> m_strings;
  std::map<std::string, Numbers> m_numbers;
};

//! Ordered list of (name, length) pairs. Length io::FVPREP_UNLIMITED (0) means "unlimited".
typedef std::vector<std::pair<std::string, unsigned int> > Dimensions;

struct ForcingFileOptions {
  ForcingFileOptions();

  io::Backend backend;
  //! io::FVPREP_READWRITE_CLOBBER or io::FVPREP_READWRITE_NOCLOBBER
  io::Mode mode;
  //! deflate level, 0 to 9 (NetCDF-4 only)
  int compression_level;
};

//! \brief Writes a dimensioned, attributed, multi-variable forcing file.
/*!
 * The constructor creates the file, declares all dimensions and writes global attributes. After
 * that the file accepts variables: each add_variable() call defines, describes and writes one
 * variable. close() flushes and releases the file; the destructor closes a file that is still
 * open, including when an exception is propagating.
 *
 * Using a dimension that was not declared, providing the wrong number of values, defining a
 * variable twice and adding variables to a closed file are reported as SchemaError before the
 * file is modified.
 *
 * All ranks of the communicator have to take part in every call; only the data on rank 0 are
 * written.
 */
class ForcingFile {
public:
  enum State {DEFINING, POPULATING, CLOSED};

  ForcingFile(MPI_Comm com, const std::string &filename,
              const Dimensions &dimensions,
              const Attributes &global_attributes,
              const ForcingFileOptions &options = ForcingFileOptions());
  ~ForcingFile();

  //! Add a numeric variable. The length of the unlimited dimension is inferred from `data`.
  void add_variable(const std::string &name,
                    const std::vector<double> &data,
                    const std::vector<std::string> &dimensions,
                    const Attributes &attributes,
                    io::Type type = io::FVPREP_FLOAT);

  //! Same as above, using a numpy-style format code ("f4", "f8", "i4", ...).
  void add_variable(const std::string &name,
                    const std::vector<double> &data,
                    const std::vector<std::string> &dimensions,
                    const Attributes &attributes,
                    const std::string &format);

  //! Add a character variable holding one fixed-width string per record.
  /*!
   * The last dimension is the string length; shorter strings are padded with '\0', longer ones
   * are truncated.
   */
  void add_text_variable(const std::string &name,
                         const std::vector<std::string> &data,
                         const std::vector<std::string> &dimensions,
                         const Attributes &attributes);

  void close();

  State state() const;

  std::string filename() const;

  //! Names of variables added so far, in the order they were added.
  const std::vector<std::string>& variables() const;
private:
  struct Impl;
  Impl *m_impl;

  std::vector<unsigned int> check_variable(const std::string &name,
                                           size_t data_size,
                                           const std::vector<std::string> &dimensions) const;
  void define_variable(const std::string &name, io::Type type,
                       const std::vector<std::string> &dimensions,
                       const Attributes &attributes);

  // disable copying and assignments
  ForcingFile(const ForcingFile &other);
  ForcingFile & operator=(const ForcingFile &);
};

} // end of namespace fvprep

#endif /* FVPREP_FORCINGFILE_H */
