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

#include <cmath>                // NAN

#include "fvprep/sst/SSTSnapshot.hh"
#include "fvprep/util/io/File.hh"
#include "fvprep/util/io/IO_Flags.hh"
#include "fvprep/util/calendar.hh"
#include "fvprep/util/error_handling.hh"
#include "fvprep/util/fvprep_utilities.hh"

namespace fvprep {
namespace sst {

namespace {

void check_variable(const File &file, const std::string &variable_name) {
  if (not file.find_variable(variable_name)) {
    throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                     "variable '%s' is missing", variable_name.c_str());
  }
}

//! Read a 1D coordinate variable. Sets `dimension` to the name of its dimension.
std::vector<double> read_axis(const File &file, const std::string &variable_name,
                              std::string &dimension) {
  check_variable(file, variable_name);

  auto dims = file.dimensions(variable_name);
  if (dims.size() != 1) {
    throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                     "coordinate variable '%s' has %d dimensions (expected 1)",
                                     variable_name.c_str(), (int)dims.size());
  }
  dimension = dims[0];

  unsigned int length = file.dimension_length(dimension);

  std::vector<double> result(length);
  if (length > 0) {
    file.read_variable(variable_name, {0}, {length}, result.data());
  }
  return result;
}

/*!
 * Read a field stored with dimensions `x_dim` and `y_dim` (in any order) and any number of
 * dimensions of length 1. The result uses the `x` fastest layout: `result[j * nx + i]`.
 */
std::vector<double> read_field(const File &file, const std::string &variable_name,
                               const std::string &x_dim, unsigned int nx,
                               const std::string &y_dim, unsigned int ny) {
  check_variable(file, variable_name);

  auto dims = file.dimensions(variable_name);

  std::vector<unsigned int> start(dims.size(), 0), count(dims.size(), 1);
  int x_index = -1, y_index = -1;

  for (size_t k = 0; k < dims.size(); ++k) {
    if (dims[k] == x_dim) {
      x_index  = k;
      count[k] = nx;
    } else if (dims[k] == y_dim) {
      y_index  = k;
      count[k] = ny;
    } else if (file.dimension_length(dims[k]) != 1) {
      throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                       "variable '%s': dimension '%s' has length %d (expected 1)",
                                       variable_name.c_str(), dims[k].c_str(),
                                       (int)file.dimension_length(dims[k]));
    }
  }

  if (x_index < 0 or y_index < 0) {
    throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                     "variable '%s' has dimensions (%s); expected '%s' and '%s'"
                                     " plus dimensions of length 1",
                                     variable_name.c_str(), join(dims, ", ").c_str(),
                                     x_dim.c_str(), y_dim.c_str());
  }

  std::vector<double> buffer(nx * ny);
  file.read_variable(variable_name, start, count, buffer.data());

  if (y_index < x_index) {
    // x varies fastest already
    return buffer;
  }

  std::vector<double> result(nx * ny);
  for (unsigned int i = 0; i < nx; ++i) {
    for (unsigned int j = 0; j < ny; ++j) {
      result[j * nx + i] = buffer[i * ny + j];
    }
  }
  return result;
}

//! Replace fill values with NaN and apply `scale_factor` and `add_offset`.
void unpack(const File &file, const std::string &variable_name, std::vector<double> &data) {
  std::vector<double> missing;
  for (const auto &name : {"_FillValue", "missing_value"}) {
    if (file.attribute_type(variable_name, name) != io::FVPREP_NAT) {
      auto values = file.read_double_attribute(variable_name, name);
      missing.insert(missing.end(), values.begin(), values.end());
    }
  }

  double scale_factor = 1.0, add_offset = 0.0;
  if (file.attribute_type(variable_name, "scale_factor") != io::FVPREP_NAT) {
    auto values = file.read_double_attribute(variable_name, "scale_factor");
    if (values.size() != 1) {
      throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                       "%s:scale_factor has to be a scalar",
                                       variable_name.c_str());
    }
    scale_factor = values[0];
  }
  if (file.attribute_type(variable_name, "add_offset") != io::FVPREP_NAT) {
    auto values = file.read_double_attribute(variable_name, "add_offset");
    if (values.size() != 1) {
      throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                       "%s:add_offset has to be a scalar",
                                       variable_name.c_str());
    }
    add_offset = values[0];
  }

  for (auto &x : data) {
    bool is_missing = false;
    for (auto m : missing) {
      if (x == m) {
        is_missing = true;
        break;
      }
    }

    x = is_missing ? NAN : x * scale_factor + add_offset;
  }
}

//! Read `time` and convert to seconds since the MJD epoch.
std::vector<double> read_times(const File &file, units::System::Ptr unit_system) {
  std::string dimension;
  auto result = read_axis(file, "time", dimension);

  if (result.empty()) {
    throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                     "the time axis is empty");
  }

  auto time_units = file.read_text_attribute("time", "units");
  if (time_units.empty()) {
    throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                     "time:units is missing");
  }

  auto calendar_name = string_strip(file.read_text_attribute("time", "calendar"));
  if (not calendar_name.empty()) {
    if (not calendar::is_valid_calendar_name(calendar_name)) {
      throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                       "unknown calendar '%s'", calendar_name.c_str());
    }

    if (not calendar::is_gregorian(calendar_name)) {
      throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, file.name(),
                                       "unsupported calendar '%s' (only Gregorian calendars"
                                       " are supported)", calendar_name.c_str());
    }
  }

  units::Converter(unit_system, time_units, calendar::internal_time_units)
    .convert_doubles(result.data(), result.size());

  return result;
}

} // end of anonymous namespace

Snapshot read_snapshot(const std::string &filename,
                       const std::vector<double> &lon,
                       const std::vector<double> &lat,
                       InterpolationType type,
                       units::System::Ptr unit_system) {
  try {
    File file(MPI_COMM_SELF, filename, io::FVPREP_GUESS, io::FVPREP_READONLY);

    std::string x_dim, y_dim;
    auto x = read_axis(file, "lon", x_dim);
    auto y = read_axis(file, "lat", y_dim);

    if (x_dim == y_dim) {
      throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, filename,
                                       "'lon' and 'lat' use the same dimension ('%s')",
                                       x_dim.c_str());
    }

    // check coordinate axes before reading fields
    GridInterpolation interp(type, x, y, lon, lat);

    auto sst = read_field(file, "analysed_sst", x_dim, x.size(), y_dim, y.size());
    unpack(file, "analysed_sst", sst);

    auto mask = read_field(file, "mask", x_dim, x.size(), y_dim, y.size());

    for (size_t k = 0; k < sst.size(); ++k) {
      if (mask[k] != 1.0) {
        sst[k] = NAN;
      } else {
        sst[k] -= kelvin_offset;
      }
    }

    Snapshot result;
    result.times  = read_times(file, unit_system);
    result.values = interp.interpolate(sst);

    return result;
  } catch (InterpolationError &e) {
    e.add_context("interpolating SST from '%s'", filename.c_str());
    throw;
  } catch (DataSourceError &e) {
    e.add_context("reading SST from '%s'", filename.c_str());
    throw;
  } catch (RuntimeError &e) {
    DataSourceError error(FVPREP_ERROR_LOCATION, {filename}, e.what());
    for (const auto &message : e.context()) {
      error.add_context(message);
    }
    error.add_context("reading SST from '%s'", filename.c_str());
    throw error;
  }
}

} // end of namespace sst
} // end of namespace fvprep
