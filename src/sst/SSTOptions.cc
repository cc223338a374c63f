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

#include "fvprep/sst/SSTOptions.hh"
#include "fvprep/util/fvprep_options.hh"
#include "fvprep/util/io/File.hh"
#include "fvprep/util/io/IO_Flags.hh"
#include "fvprep/util/error_handling.hh"

namespace fvprep {
namespace sst {

SSTOptions::SSTOptions()
  : year(0),
    serial(false),
    pool_size(0),
    interpolation(NEAREST),
    output("sstgrd.nc") {
  // empty
}

SSTOptions sst_options_from_command_line() {
  SSTOptions result;

  options::String sst_dir("-sst_dir",
                          "Root directory of SST snapshots (one sub-directory per year)");
  if (not sst_dir.is_set()) {
    throw ConfigurationError(FVPREP_ERROR_LOCATION, "option -sst_dir is required");
  }
  result.sst_dir = sst_dir.value();

  options::Integer year("-sst_year", "Year to process", 0);
  if (not year.is_set()) {
    throw ConfigurationError(FVPREP_ERROR_LOCATION, "option -sst_year is required");
  }
  result.year = year.value();

  result.serial = options::Bool("-sst_serial",
                                "Process SST files one at a time on every rank");

  result.pool_size = options::Integer("-sst_pool_size",
                                      "Number of worker ranks (0 means all ranks)",
                                      result.pool_size).value();

  options::Keyword interpolation("-sst_interpolation",
                                 "Method used to interpolate SST to mesh nodes",
                                 "nearest,linear", "nearest");
  result.interpolation = string_to_interpolation_type(interpolation.value());

  result.output = options::String("-o", "Name of the SST forcing file", result.output).value();

  options::Keyword format("-o_format", "Format of the SST forcing file",
                          "netcdf3,netcdf4_serial", "netcdf4_serial");
  result.output_options.backend = io::string_to_backend(format.value());

  options::Integer level("-o_compression_level", "Compression level (0-9, NetCDF-4 only)",
                         result.output_options.compression_level);
  if (level.value() < 0 or level.value() > 9) {
    throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                        "invalid -o_compression_level argument: %d"
                                        " (has to be between 0 and 9)", level.value());
  }
  result.output_options.compression_level = level.value();

  result.mesh = options::String("-mesh", "SMS (.2dm) mesh file", "").value();

  return result;
}

} // end of namespace sst
} // end of namespace fvprep
