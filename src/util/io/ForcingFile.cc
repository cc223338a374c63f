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

#include <memory>
#include <algorithm>
#include <set>

#include "fvprep/util/io/ForcingFile.hh"
#include "fvprep/util/io/File.hh"
#include "fvprep/util/error_handling.hh"
#include "fvprep/util/fvprep_utilities.hh"

namespace fvprep {

Attributes& Attributes::set_string(const std::string &name, const std::string &value) {
  m_strings[name] = value;
  m_numbers.erase(name);
  return *this;
}

Attributes& Attributes::set_number(const std::string &name, double value, io::Type type) {
  return set_numbers(name, {value}, type);
}

Attributes& Attributes::set_numbers(const std::string &name, const std::vector<double> &values,
                                    io::Type type) {
  Numbers n;
  n.values = values;
  n.type   = type;

  m_numbers[name] = n;
  m_strings.erase(name);
  return *this;
}

const std::map<std::string, std::string>& Attributes::strings() const {
  return m_strings;
}

const std::map<std::string, Attributes::Numbers>& Attributes::numbers() const {
  return m_numbers;
}

ForcingFileOptions::ForcingFileOptions()
  : backend(io::FVPREP_NETCDF4_SERIAL),
    mode(io::FVPREP_READWRITE_CLOBBER),
    compression_level(7) {
  // empty
}

struct ForcingFile::Impl {
  Impl()
    : state(DEFINING), records(-1) {
    // empty
  }

  std::unique_ptr<File> file;
  std::string filename;
  State state;
  Dimensions dimensions;
  std::vector<std::string> variables;
  //! number of records along the unlimited dimension; -1 if not known yet
  int records;
};

static void write_attributes(const File &file, const std::string &variable_name,
                             const Attributes &attributes) {
  for (const auto &s : attributes.strings()) {
    file.write_attribute(variable_name, s.first, s.second);
  }

  for (const auto &n : attributes.numbers()) {
    file.write_attribute(variable_name, n.first, n.second.type, n.second.values);
  }
}

ForcingFile::ForcingFile(MPI_Comm com, const std::string &filename,
                         const Dimensions &dimensions,
                         const Attributes &global_attributes,
                         const ForcingFileOptions &options)
  : m_impl(new Impl) {

  try {
    if (filename.empty()) {
      throw ConfigurationError(FVPREP_ERROR_LOCATION, "output file name is empty");
    }

    if (options.mode != io::FVPREP_READWRITE_CLOBBER and
        options.mode != io::FVPREP_READWRITE_NOCLOBBER) {
      throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                          "invalid mode for a new forcing file: %d",
                                          (int)options.mode);
    }

    // check for duplicate dimension names before creating the file
    {
      std::set<std::string> names;
      int n_unlimited = 0;
      for (const auto &d : dimensions) {
        if (member(d.first, names)) {
          throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                       "dimension '%s' is declared twice", d.first.c_str());
        }
        names.insert(d.first);
        n_unlimited += (d.second == io::FVPREP_UNLIMITED) ? 1 : 0;
      }

      if (n_unlimited > 1 and options.backend == io::FVPREP_NETCDF3) {
        throw SchemaError(FVPREP_ERROR_LOCATION,
                          "NetCDF-3 files support only one unlimited dimension");
      }
    }

    m_impl->filename   = filename;
    m_impl->dimensions = dimensions;

    m_impl->file.reset(new File(com, filename, options.backend, options.mode));
    m_impl->file->set_compression_level(options.compression_level);

    for (const auto &d : dimensions) {
      m_impl->file->define_dimension(d.first, d.second);
    }

    write_attributes(*m_impl->file, "NC_GLOBAL", global_attributes);
  } catch (RuntimeError &e) {
    e.add_context("creating forcing file '%s'", filename.c_str());
    delete m_impl;
    throw;
  } catch (...) {
    delete m_impl;
    throw;
  }
}

ForcingFile::~ForcingFile() {
  // File's destructor closes the file if it is still open
  delete m_impl;
}

ForcingFile::State ForcingFile::state() const {
  return m_impl->state;
}

std::string ForcingFile::filename() const {
  return m_impl->filename;
}

const std::vector<std::string>& ForcingFile::variables() const {
  return m_impl->variables;
}

/*!
 * Validates a variable against the declared schema and returns the `count` array to use when
 * writing it.
 */
std::vector<unsigned int> ForcingFile::check_variable(const std::string &name,
                                                      size_t data_size,
                                                      const std::vector<std::string> &dimensions) const {
  if (m_impl->state == CLOSED) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "cannot add variable '%s': the file is closed",
                                 name.c_str());
  }

  if (std::find(m_impl->variables.begin(), m_impl->variables.end(), name) !=
      m_impl->variables.end()) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "variable '%s' was already added", name.c_str());
  }

  std::vector<unsigned int> count;
  int unlimited_index = -1;
  size_t fixed_size = 1;

  for (const auto &d : dimensions) {
    auto it = std::find_if(m_impl->dimensions.begin(), m_impl->dimensions.end(),
                           [&d](const std::pair<std::string, unsigned int> &p) {
                             return p.first == d;
                           });

    if (it == m_impl->dimensions.end()) {
      throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                   "variable '%s' uses dimension '%s', which was not declared",
                                   name.c_str(), d.c_str());
    }

    if (it->second == io::FVPREP_UNLIMITED) {
      if (unlimited_index >= 0) {
        throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                     "variable '%s' uses more than one unlimited dimension",
                                     name.c_str());
      }
      unlimited_index = count.size();
      count.push_back(0);
    } else {
      fixed_size *= it->second;
      count.push_back(it->second);
    }
  }

  if (unlimited_index < 0) {
    if (data_size != fixed_size) {
      throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                   "variable '%s' has %d values, expected %d (dimensions: %s)",
                                   name.c_str(), (int)data_size, (int)fixed_size,
                                   join(dimensions, ", ").c_str());
    }
    return count;
  }

  if ((fixed_size == 0 and data_size != 0) or
      (fixed_size > 0 and data_size % fixed_size != 0)) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "variable '%s' has %d values, which is not a multiple of"
                                 " the record size %d (dimensions: %s)",
                                 name.c_str(), (int)data_size, (int)fixed_size,
                                 join(dimensions, ", ").c_str());
  }

  int records = fixed_size > 0 ? (int)(data_size / fixed_size) : 0;

  if (m_impl->records >= 0 and records != m_impl->records) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "variable '%s' has %d records, but other variables have %d",
                                 name.c_str(), records, m_impl->records);
  }

  count[unlimited_index] = records;

  return count;
}

void ForcingFile::define_variable(const std::string &name, io::Type type,
                                  const std::vector<std::string> &dimensions,
                                  const Attributes &attributes) {
  m_impl->state = POPULATING;

  m_impl->file->define_variable(name, type, dimensions);
  write_attributes(*m_impl->file, name, attributes);
}

//! Returns true if `count` describes an empty hyperslab.
static bool empty(const std::vector<unsigned int> &count) {
  return std::find(count.begin(), count.end(), 0U) != count.end();
}

//! Record the number of records written if `dimensions` contain the unlimited one.
static int n_records(const Dimensions &declared,
                     const std::vector<std::string> &dimensions,
                     const std::vector<unsigned int> &count,
                     int current) {
  for (size_t k = 0; k < dimensions.size(); ++k) {
    for (const auto &d : declared) {
      if (d.first == dimensions[k] and d.second == io::FVPREP_UNLIMITED) {
        return count[k];
      }
    }
  }
  return current;
}

void ForcingFile::add_variable(const std::string &name,
                               const std::vector<double> &data,
                               const std::vector<std::string> &dimensions,
                               const Attributes &attributes,
                               io::Type type) {
  if (type == io::FVPREP_CHAR or type == io::FVPREP_NAT) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "variable '%s': use add_text_variable() for character data",
                                 name.c_str());
  }

  auto count = check_variable(name, data.size(), dimensions);

  try {
    define_variable(name, type, dimensions, attributes);

    if (not empty(count)) {
      std::vector<unsigned int> start(count.size(), 0);
      m_impl->file->write_variable(name, start, count, data.data());
    }
  } catch (RuntimeError &e) {
    e.add_context("adding variable '%s' to '%s'", name.c_str(), m_impl->filename.c_str());
    throw;
  }

  m_impl->records = n_records(m_impl->dimensions, dimensions, count, m_impl->records);
  m_impl->variables.push_back(name);
}

void ForcingFile::add_variable(const std::string &name,
                               const std::vector<double> &data,
                               const std::vector<std::string> &dimensions,
                               const Attributes &attributes,
                               const std::string &format) {
  add_variable(name, data, dimensions, attributes, io::string_to_type(format));
}

void ForcingFile::add_text_variable(const std::string &name,
                                    const std::vector<std::string> &data,
                                    const std::vector<std::string> &dimensions,
                                    const Attributes &attributes) {
  if (dimensions.empty()) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "text variable '%s' needs a string length dimension",
                                 name.c_str());
  }

  unsigned int string_length = 0;
  for (const auto &d : m_impl->dimensions) {
    if (d.first == dimensions.back()) {
      string_length = d.second;
    }
  }

  if (string_length == 0) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "text variable '%s': the last dimension ('%s') has to be"
                                 " declared and have a fixed length",
                                 name.c_str(), dimensions.back().c_str());
  }

  auto count = check_variable(name, data.size() * string_length, dimensions);

  std::vector<char> buffer(data.size() * string_length, '\0');
  for (size_t k = 0; k < data.size(); ++k) {
    size_t N = std::min(data[k].size(), (size_t)string_length);
    std::copy(data[k].begin(), data[k].begin() + N, buffer.begin() + k * string_length);
  }

  try {
    define_variable(name, io::FVPREP_CHAR, dimensions, attributes);

    if (not empty(count)) {
      std::vector<unsigned int> start(count.size(), 0);
      m_impl->file->write_text_variable(name, start, count, buffer.data());
    }
  } catch (RuntimeError &e) {
    e.add_context("adding variable '%s' to '%s'", name.c_str(), m_impl->filename.c_str());
    throw;
  }

  m_impl->records = n_records(m_impl->dimensions, dimensions, count, m_impl->records);
  m_impl->variables.push_back(name);
}

void ForcingFile::close() {
  if (m_impl->state == CLOSED) {
    return;
  }

  m_impl->file->close();
  m_impl->state = CLOSED;
}

} // end of namespace fvprep
