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

#ifndef FVPREP_FILE_H
#define FVPREP_FILE_H

#include <memory>
#include <vector>
#include <string>
#include <mpi.h>

#include "fvprep/util/io/IO_Flags.hh"

namespace fvprep {

//! \brief A NetCDF file accessed by rank 0 of a communicator.
/*!
 * All methods are collective. Rank 0 makes NetCDF-C calls; the status of each call and any data
 * read are broadcast, so all ranks see the same results and throw the same exceptions.
 *
 * Variables and attributes are addressed by name; "NC_GLOBAL" refers to global attributes. The
 * file switches between define and data modes as needed. An open file is closed by the
 * destructor.
 */
class File {
public:
  File(MPI_Comm com, const std::string &filename, io::Backend backend, io::Mode mode);
  ~File();

  void close();

  //! Name of the file; empty once the file is closed.
  std::string name() const;

  void define_dimension(const std::string &name, size_t length) const;

  //! Length of a dimension or zero if it does not exist.
  unsigned int dimension_length(const std::string &name) const;

  //! Names of the dimensions of a variable.
  std::vector<std::string> dimensions(const std::string &variable_name) const;

  //! Name of the unlimited dimension or an empty string.
  std::string unlimited_dimension() const;

  void define_variable(const std::string &name, io::Type type,
                       const std::vector<std::string> &dimensions) const;

  bool find_variable(const std::string &name) const;

  io::Type variable_type(const std::string &name) const;

  //! Read a hyperslab into `output` on all ranks.
  void read_variable(const std::string &name,
                     const std::vector<unsigned int> &start,
                     const std::vector<unsigned int> &count,
                     double *output) const;

  //! Write a hyperslab. Only `input` on rank 0 is used.
  void write_variable(const std::string &name,
                      const std::vector<unsigned int> &start,
                      const std::vector<unsigned int> &count,
                      const double *input) const;

  void read_text_variable(const std::string &name,
                          const std::vector<unsigned int> &start,
                          const std::vector<unsigned int> &count,
                          char *output) const;

  void write_text_variable(const std::string &name,
                           const std::vector<unsigned int> &start,
                           const std::vector<unsigned int> &count,
                           const char *input) const;

  //! Deflate level (0 to 9) of variables defined after this call. NetCDF-4 only.
  void set_compression_level(int level) const;

  //! Type of an attribute or io::FVPREP_NAT if it is not present.
  io::Type attribute_type(const std::string &variable_name, const std::string &name) const;

  void write_attribute(const std::string &variable_name, const std::string &name,
                       io::Type type, const std::vector<double> &values) const;

  void write_attribute(const std::string &variable_name, const std::string &name,
                       const std::string &value) const;

  //! Numeric attribute; empty if it is not present.
  std::vector<double> read_double_attribute(const std::string &variable_name,
                                            const std::string &name) const;

  //! Text attribute; empty if it is not present.
  std::string read_text_attribute(const std::string &variable_name,
                                  const std::string &name) const;
private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;

  File(const File &other);
  File & operator=(const File &);
};

} // end of namespace fvprep

#endif /* FVPREP_FILE_H */
