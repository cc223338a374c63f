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

#include "fvprep/util/io/File.hh"

// netcdf.h defines its own MPI_Comm and MPI_Info unless MPI_INCLUDED is set
#ifndef MPI_INCLUDED
#define MPI_INCLUDED 1
#endif
#include <netcdf.h>

#include <algorithm>
#include <functional>
#include <map>

#include "fvprep/util/error_handling.hh"
#include "fvprep/util/fvprep_utilities.hh"

namespace fvprep {

namespace io {

Type string_to_type(const std::string &format) {
  static const std::map<std::string, Type> types = {
    {"i1", FVPREP_BYTE},
    {"c",  FVPREP_CHAR},
    {"S1", FVPREP_CHAR},
    {"i2", FVPREP_SHORT},
    {"i4", FVPREP_INT},
    {"f4", FVPREP_FLOAT},
    {"f8", FVPREP_DOUBLE}
  };

  auto it = types.find(format);
  if (it == types.end()) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "unknown variable format: '%s'"
                                 " (expected one of f4, f8, i4, i2, i1, c)",
                                 format.c_str());
  }
  return it->second;
}

Backend string_to_backend(const std::string &backend) {
  if (backend == "netcdf3") {
    return FVPREP_NETCDF3;
  }

  if (backend == "netcdf4_serial") {
    return FVPREP_NETCDF4_SERIAL;
  }

  throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                      "unknown or unsupported I/O backend: %s"
                                      " (expected netcdf3 or netcdf4_serial)",
                                      backend.c_str());
}

} // end of namespace io

namespace {

// free space left in NetCDF-3 headers when leaving define mode
const size_t header_padding = 200 * 1024;

io::Type to_type(int type) {
  if (type == NC_STRING) {
    return io::FVPREP_CHAR;
  }

  if (type >= NC_BYTE and type <= NC_DOUBLE) {
    return static_cast<io::Type>(type);
  }

  return io::FVPREP_NAT;
}

int get_vara(int ncid, int varid, const size_t *start, const size_t *count, double *output) {
  return nc_get_vara_double(ncid, varid, start, count, output);
}

int get_vara(int ncid, int varid, const size_t *start, const size_t *count, char *output) {
  return nc_get_vara_text(ncid, varid, start, count, output);
}

int put_vara(int ncid, int varid, const size_t *start, const size_t *count, const double *input) {
  return nc_put_vara_double(ncid, varid, start, count, input);
}

int put_vara(int ncid, int varid, const size_t *start, const size_t *count, const char *input) {
  return nc_put_vara_text(ncid, varid, start, count, input);
}

MPI_Datatype mpi_type(const double *) {
  return MPI_DOUBLE;
}

MPI_Datatype mpi_type(const char *) {
  return MPI_CHAR;
}

} // end of anonymous namespace

struct File::Impl {
  explicit Impl(MPI_Comm c)
    : com(c), rank(0), ncid(-1), define_mode(false), netcdf4(false), compression_level(0) {
    MPI_Comm_rank(com, &rank);
  }

  //! Call `operation` on rank 0 and throw on all ranks if it returns a NetCDF error code.
  void run(const std::function<int()> &operation) const {
    int status = NC_NOERR;

    if (rank == 0) {
      status = operation();
    }

    MPI_Bcast(&status, 1, MPI_INT, 0, com);

    if (status != NC_NOERR) {
      throw RuntimeError(FVPREP_ERROR_LOCATION, nc_strerror(status));
    }
  }

  void enter_define_mode() {
    if (not define_mode) {
      const int id = ncid;
      run([id]() { return nc_redef(id); });
      define_mode = true;
    }
  }

  void enter_data_mode() {
    if (define_mode) {
      const int id = ncid;
      run([id]() { return nc__enddef(id, header_padding, 4, 0, 4); });
      define_mode = false;
    }
  }

  //! Find a variable (rank 0 only). "NC_GLOBAL" selects global attributes.
  int find(const std::string &variable_name, int &varid) const {
    if (variable_name == "NC_GLOBAL") {
      varid = NC_GLOBAL;
      return NC_NOERR;
    }
    return nc_inq_varid(ncid, variable_name.c_str(), &varid);
  }

  template <typename T>
  void read(const std::string &variable_name,
            const std::vector<unsigned int> &start,
            const std::vector<unsigned int> &count,
            T *output) {
    check_hyperslab(start, count);
    enter_data_mode();

    run([&]() -> int {
        int varid = -1;
        int status = find(variable_name, varid);
        if (status != NC_NOERR) {
          return status;
        }
        std::vector<size_t> s(start.begin(), start.end()), c(count.begin(), count.end());
        return get_vara(ncid, varid, s.data(), c.data(), output);
      });

    size_t size = 1;
    for (auto n : count) {
      size *= n;
    }
    MPI_Bcast(output, static_cast<int>(size), mpi_type(output), 0, com);
  }

  template <typename T>
  void write(const std::string &variable_name,
             const std::vector<unsigned int> &start,
             const std::vector<unsigned int> &count,
             const T *input) {
    check_hyperslab(start, count);
    enter_data_mode();

    run([&]() -> int {
        int varid = -1;
        int status = find(variable_name, varid);
        if (status != NC_NOERR) {
          return status;
        }
        std::vector<size_t> s(start.begin(), start.end()), c(count.begin(), count.end());
        return put_vara(ncid, varid, s.data(), c.data(), input);
      });
  }

  static void check_hyperslab(const std::vector<unsigned int> &start,
                              const std::vector<unsigned int> &count) {
    if (start.size() != count.size()) {
      throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                    "start has %d elements but count has %d",
                                    (int)start.size(), (int)count.size());
    }
  }

  MPI_Comm com;
  int rank;
  // NetCDF ID of the open file; only used on rank 0
  int ncid;
  // empty if the file is closed
  std::string filename;
  bool define_mode;
  bool netcdf4;
  int compression_level;
};

File::File(MPI_Comm com, const std::string &filename, io::Backend backend, io::Mode mode)
  : m_impl(new Impl(com)) {
  try {
    if (filename.empty()) {
      throw RuntimeError(FVPREP_ERROR_LOCATION, "cannot open a file: the file name is empty");
    }

    int &ncid = m_impl->ncid;

    if (mode == io::FVPREP_READONLY) {
      m_impl->run([&]() { return nc_open(filename.c_str(), NC_NOWRITE, &ncid); });
      m_impl->define_mode = false;
    } else if (mode == io::FVPREP_READWRITE_CLOBBER or mode == io::FVPREP_READWRITE_NOCLOBBER) {
      m_impl->netcdf4 = (backend == io::FVPREP_NETCDF4_SERIAL);

      int flags = m_impl->netcdf4 ? NC_NETCDF4 : NC_64BIT_OFFSET;
      flags |= (mode == io::FVPREP_READWRITE_CLOBBER) ? NC_CLOBBER : NC_NOCLOBBER;

      m_impl->run([&]() -> int {
          int status = nc_create(filename.c_str(), flags, &ncid);
          if (status != NC_NOERR) {
            return status;
          }

          // every value is written explicitly
          int old_mode = 0;
          status = nc_set_fill(ncid, NC_NOFILL, &old_mode);
          if (status != NC_NOERR) {
            nc_close(ncid);
          }
          return status;
        });
      m_impl->define_mode = true;
    } else {
      throw RuntimeError::formatted(FVPREP_ERROR_LOCATION, "invalid file mode: %d", (int)mode);
    }

    m_impl->filename = filename;
  } catch (RuntimeError &e) {
    e.add_context("opening or creating '%s'", filename.c_str());
    throw;
  }
}

File::~File() {
  if (not m_impl->filename.empty()) {
    try {
      close();
    } catch (...) {
      handle_fatal_errors(MPI_COMM_SELF);
    }
  }
}

void File::close() {
  std::string filename = m_impl->filename;
  const int ncid = m_impl->ncid;

  m_impl->filename.clear();
  m_impl->ncid = -1;

  try {
    m_impl->run([ncid]() { return nc_close(ncid); });
  } catch (RuntimeError &e) {
    e.add_context("closing '%s'", filename.c_str());
    throw;
  }
}

std::string File::name() const {
  return m_impl->filename;
}

void File::define_dimension(const std::string &name, size_t length) const {
  try {
    m_impl->enter_define_mode();

    const int ncid = m_impl->ncid;
    m_impl->run([&]() -> int {
        int dimid = -1;
        return nc_def_dim(ncid, name.c_str(), length, &dimid);
      });
  } catch (RuntimeError &e) {
    e.add_context("defining dimension '%s' in '%s'", name.c_str(), this->name().c_str());
    throw;
  }
}

unsigned int File::dimension_length(const std::string &name) const {
  unsigned int result = 0;

  try {
    const int ncid = m_impl->ncid;
    m_impl->run([&]() -> int {
        int dimid = -1;
        if (nc_inq_dimid(ncid, name.c_str(), &dimid) != NC_NOERR) {
          // no such dimension
          return NC_NOERR;
        }
        size_t length = 0;
        int status = nc_inq_dimlen(ncid, dimid, &length);
        result = static_cast<unsigned int>(length);
        return status;
      });
  } catch (RuntimeError &e) {
    e.add_context("getting the length of dimension '%s' in '%s'",
                  name.c_str(), this->name().c_str());
    throw;
  }

  MPI_Bcast(&result, 1, MPI_UNSIGNED, 0, m_impl->com);

  return result;
}

std::vector<std::string> File::dimensions(const std::string &variable_name) const {
  // '/' cannot appear in NetCDF names
  std::string names;

  try {
    const int ncid = m_impl->ncid;
    m_impl->run([&]() -> int {
        int varid = -1, ndims = 0;
        int status = nc_inq_varid(ncid, variable_name.c_str(), &varid);
        if (status == NC_NOERR) {
          status = nc_inq_varndims(ncid, varid, &ndims);
        }
        if (status != NC_NOERR or ndims == 0) {
          return status;
        }

        std::vector<int> dimids(ndims);
        status = nc_inq_vardimid(ncid, varid, dimids.data());

        std::vector<std::string> result;
        for (int k = 0; k < ndims and status == NC_NOERR; ++k) {
          char name[NC_MAX_NAME + 1] = {0};
          status = nc_inq_dimname(ncid, dimids[k], name);
          result.push_back(name);
        }
        names = join(result, "/");

        return status;
      });
  } catch (RuntimeError &e) {
    e.add_context("getting dimensions of variable '%s' in '%s'",
                  variable_name.c_str(), name().c_str());
    throw;
  }

  broadcast(m_impl->com, 0, names);

  if (names.empty()) {
    return {};
  }
  return split(names, '/');
}

std::string File::unlimited_dimension() const {
  std::string result;

  try {
    const int ncid = m_impl->ncid;
    m_impl->run([&]() -> int {
        int dimid = -1;
        int status = nc_inq_unlimdim(ncid, &dimid);
        // dimid is -1 if there is no unlimited dimension
        if (status != NC_NOERR or dimid < 0) {
          return status;
        }
        char name[NC_MAX_NAME + 1] = {0};
        status = nc_inq_dimname(ncid, dimid, name);
        result = name;
        return status;
      });
  } catch (RuntimeError &e) {
    e.add_context("finding the unlimited dimension in '%s'", name().c_str());
    throw;
  }

  broadcast(m_impl->com, 0, result);

  return result;
}

void File::define_variable(const std::string &name, io::Type type,
                           const std::vector<std::string> &dimensions) const {
  try {
    m_impl->enter_define_mode();

    const int ncid = m_impl->ncid;
    const int level = m_impl->netcdf4 ? m_impl->compression_level : 0;

    m_impl->run([&]() -> int {
        std::vector<int> dimids;
        for (const auto &d : dimensions) {
          int dimid = -1;
          int status = nc_inq_dimid(ncid, d.c_str(), &dimid);
          if (status != NC_NOERR) {
            return status;
          }
          dimids.push_back(dimid);
        }

        int varid = -1;
        int status = nc_def_var(ncid, name.c_str(), static_cast<nc_type>(type),
                                static_cast<int>(dimids.size()), dimids.data(), &varid);

        if (status == NC_NOERR and level > 0 and not dimids.empty()) {
          status = nc_def_var_deflate(ncid, varid, 0, 1, level);
          // NetCDF built without compression support
          if (status == NC_EINVAL) {
            status = NC_NOERR;
          }
        }
        return status;
      });
  } catch (RuntimeError &e) {
    e.add_context("defining variable '%s' in '%s'", name.c_str(), this->name().c_str());
    throw;
  }
}

bool File::find_variable(const std::string &name) const {
  int found = 0;

  if (m_impl->rank == 0) {
    int varid = -1;
    found = nc_inq_varid(m_impl->ncid, name.c_str(), &varid) == NC_NOERR ? 1 : 0;
  }
  MPI_Bcast(&found, 1, MPI_INT, 0, m_impl->com);

  return found == 1;
}

io::Type File::variable_type(const std::string &name) const {
  int type = NC_NAT;

  try {
    const int ncid = m_impl->ncid;
    m_impl->run([&]() -> int {
        int varid = -1;
        int status = nc_inq_varid(ncid, name.c_str(), &varid);
        if (status != NC_NOERR) {
          return status;
        }
        nc_type result = NC_NAT;
        status = nc_inq_vartype(ncid, varid, &result);
        type = result;
        return status;
      });
  } catch (RuntimeError &e) {
    e.add_context("getting the type of variable '%s' in '%s'", name.c_str(),
                  this->name().c_str());
    throw;
  }

  MPI_Bcast(&type, 1, MPI_INT, 0, m_impl->com);

  return to_type(type);
}

void File::read_variable(const std::string &name,
                         const std::vector<unsigned int> &start,
                         const std::vector<unsigned int> &count,
                         double *output) const {
  try {
    m_impl->read(name, start, count, output);
  } catch (RuntimeError &e) {
    e.add_context("reading variable '%s' from '%s'", name.c_str(), this->name().c_str());
    throw;
  }
}

void File::write_variable(const std::string &name,
                          const std::vector<unsigned int> &start,
                          const std::vector<unsigned int> &count,
                          const double *input) const {
  try {
    m_impl->write(name, start, count, input);
  } catch (RuntimeError &e) {
    e.add_context("writing variable '%s' to '%s'", name.c_str(), this->name().c_str());
    throw;
  }
}

void File::read_text_variable(const std::string &name,
                              const std::vector<unsigned int> &start,
                              const std::vector<unsigned int> &count,
                              char *output) const {
  try {
    m_impl->read(name, start, count, output);
  } catch (RuntimeError &e) {
    e.add_context("reading character variable '%s' from '%s'", name.c_str(),
                  this->name().c_str());
    throw;
  }
}

void File::write_text_variable(const std::string &name,
                               const std::vector<unsigned int> &start,
                               const std::vector<unsigned int> &count,
                               const char *input) const {
  try {
    m_impl->write(name, start, count, input);
  } catch (RuntimeError &e) {
    e.add_context("writing character variable '%s' to '%s'", name.c_str(),
                  this->name().c_str());
    throw;
  }
}

void File::set_compression_level(int level) const {
  m_impl->compression_level = std::min(std::max(level, 0), 9);
}

io::Type File::attribute_type(const std::string &variable_name, const std::string &name) const {
  int type = NC_NAT;

  try {
    m_impl->run([&]() -> int {
        int varid = -1;
        int status = m_impl->find(variable_name, varid);
        if (status != NC_NOERR) {
          return status;
        }
        nc_type result = NC_NAT;
        status = nc_inq_atttype(m_impl->ncid, varid, name.c_str(), &result);
        if (status == NC_ENOTATT) {
          return NC_NOERR;
        }
        type = result;
        return status;
      });
  } catch (RuntimeError &e) {
    e.add_context("getting the type of '%s:%s' in '%s'", variable_name.c_str(), name.c_str(),
                  this->name().c_str());
    throw;
  }

  MPI_Bcast(&type, 1, MPI_INT, 0, m_impl->com);

  return to_type(type);
}

void File::write_attribute(const std::string &variable_name, const std::string &name,
                           io::Type type, const std::vector<double> &values) const {
  try {
    m_impl->enter_define_mode();

    m_impl->run([&]() -> int {
        int varid = -1;
        int status = m_impl->find(variable_name, varid);
        if (status != NC_NOERR) {
          return status;
        }
        return nc_put_att_double(m_impl->ncid, varid, name.c_str(), static_cast<nc_type>(type),
                                 values.size(), values.data());
      });
  } catch (RuntimeError &e) {
    e.add_context("writing '%s:%s' to '%s'", variable_name.c_str(), name.c_str(),
                  this->name().c_str());
    throw;
  }
}

void File::write_attribute(const std::string &variable_name, const std::string &name,
                           const std::string &value) const {
  try {
    m_impl->enter_define_mode();

    m_impl->run([&]() -> int {
        int varid = -1;
        int status = m_impl->find(variable_name, varid);
        if (status != NC_NOERR) {
          return status;
        }
        return nc_put_att_text(m_impl->ncid, varid, name.c_str(), value.size(), value.c_str());
      });
  } catch (RuntimeError &e) {
    e.add_context("writing '%s:%s' to '%s'", variable_name.c_str(), name.c_str(),
                  this->name().c_str());
    throw;
  }
}

std::vector<double> File::read_double_attribute(const std::string &variable_name,
                                                const std::string &name) const {
  std::vector<double> result;

  try {
    if (attribute_type(variable_name, name) == io::FVPREP_CHAR) {
      throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                    "'%s:%s' is text ('%s'); expected one or more numbers",
                                    variable_name.c_str(), name.c_str(),
                                    read_text_attribute(variable_name, name).c_str());
    }

    m_impl->run([&]() -> int {
        int varid = -1;
        int status = m_impl->find(variable_name, varid);
        if (status != NC_NOERR) {
          return status;
        }

        size_t length = 0;
        status = nc_inq_attlen(m_impl->ncid, varid, name.c_str(), &length);
        if (status == NC_ENOTATT) {
          return NC_NOERR;
        }
        if (status != NC_NOERR) {
          return status;
        }

        result.resize(length);
        return nc_get_att_double(m_impl->ncid, varid, name.c_str(), result.data());
      });
  } catch (RuntimeError &e) {
    e.add_context("reading '%s:%s' from '%s'", variable_name.c_str(), name.c_str(),
                  this->name().c_str());
    throw;
  }

  broadcast(m_impl->com, 0, result);

  return result;
}

std::string File::read_text_attribute(const std::string &variable_name,
                                      const std::string &name) const {
  std::string result;

  try {
    auto type = attribute_type(variable_name, name);
    if (type != io::FVPREP_NAT and type != io::FVPREP_CHAR) {
      throw RuntimeError::formatted(FVPREP_ERROR_LOCATION, "'%s:%s' is not text",
                                    variable_name.c_str(), name.c_str());
    }

    m_impl->run([&]() -> int {
        const int ncid = m_impl->ncid;

        int varid = -1;
        int status = m_impl->find(variable_name, varid);
        if (status != NC_NOERR) {
          return status;
        }

        nc_type att_type = NC_NAT;
        size_t length = 0;
        status = nc_inq_att(ncid, varid, name.c_str(), &att_type, &length);
        if (status == NC_ENOTATT) {
          return NC_NOERR;
        }
        if (status != NC_NOERR) {
          return status;
        }

        if (att_type == NC_STRING) {
          // string arrays are joined using commas
          std::vector<char*> strings(length, nullptr);
          status = nc_get_att_string(ncid, varid, name.c_str(), strings.data());
          if (status != NC_NOERR) {
            return status;
          }
          std::vector<std::string> parts;
          for (auto s : strings) {
            parts.push_back(s != nullptr ? s : "");
          }
          result = join(parts, ",");
          return nc_free_string(length, strings.data());
        }

        std::vector<char> buffer(length + 1, '\0');
        status = nc_get_att_text(ncid, varid, name.c_str(), buffer.data());
        result = buffer.data();
        return status;
      });
  } catch (RuntimeError &e) {
    e.add_context("reading '%s:%s' from '%s'", variable_name.c_str(), name.c_str(),
                  this->name().c_str());
    throw;
  }

  broadcast(m_impl->com, 0, result);

  return result;
}

} // end of namespace fvprep
