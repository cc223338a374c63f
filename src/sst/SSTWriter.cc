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

#include "fvprep/sst/SSTWriter.hh"
#include "fvprep/mesh/Domain.hh"
#include "fvprep/util/Logger.hh"
#include "fvprep/util/calendar.hh"
#include "fvprep/util/error_handling.hh"

namespace fvprep {
namespace sst {

static void check_series(const Domain &domain, const SSTSeries &series) {
  if (domain.n_nodes() == 0 or domain.n_elements() == 0) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "the mesh has to have nodes and elements (got %d and %d)",
                                 (int)domain.n_nodes(), (int)domain.n_elements());
  }

  if (series.times.empty()) {
    throw SchemaError(FVPREP_ERROR_LOCATION, "SST series is empty");
  }

  if (series.values.size() != series.times.size()) {
    throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                 "SST series has %d time stamps and %d fields",
                                 (int)series.times.size(), (int)series.values.size());
  }

  for (size_t k = 0; k < series.values.size(); ++k) {
    if (series.values[k].size() != domain.n_nodes()) {
      throw SchemaError::formatted(FVPREP_ERROR_LOCATION,
                                   "SST field %d has %d values but the mesh has %d nodes",
                                   (int)k, (int)series.values[k].size(), (int)domain.n_nodes());
    }
  }
}

static void write(MPI_Comm com, const std::string &filename,
                  const Domain &domain, const SSTSeries &series,
                  units::System::Ptr unit_system,
                  const ForcingFileOptions &options) {
  check_series(domain, series);

  Attributes global;
  global
    .set_number("year", calendar::date(unit_system, series.times[0]).year, io::FVPREP_INT)
    .set_string("title", "FVCOM SST 1km merged product File")
    .set_string("institution", "Plymouth Marine Laboratory")
    .set_string("source", "FVCOM grid (unstructured) surface forcing")
    .set_string("history", "File created using fvprep")
    .set_string("references", "http://fvcom.smast.umassd.edu, http://codfish.smast.umassd.edu")
    .set_string("Conventions", "CF-1.0")
    .set_string("CoordinateProjection", "init=WGS84");

  Dimensions dims = {{"nele", domain.n_elements()},
                     {"node", domain.n_nodes()},
                     {"time", io::FVPREP_UNLIMITED},
                     {"DateStrLen", calendar::date_string_length},
                     {"three", 3}};

  ForcingFile sstgrd(com, filename, dims, global, options);

  sstgrd.add_variable("lon", domain.lon(), {"node"},
                      Attributes()
                      .set_string("long_name", "nodel longitude")
                      .set_string("units", "degrees_east"));

  sstgrd.add_variable("lat", domain.lat(), {"node"},
                      Attributes()
                      .set_string("long_name", "nodel latitude")
                      .set_string("units", "degrees_north"));

  std::vector<double> mjd(series.times.size());
  std::vector<std::string> times(series.times.size());
  for (size_t k = 0; k < series.times.size(); ++k) {
    mjd[k]   = series.times[k] / 86400.0;
    times[k] = calendar::format_iso(unit_system, series.times[k]);
  }

  sstgrd.add_variable("time", mjd, {"time"},
                      Attributes()
                      .set_string("units", calendar::mjd_time_units)
                      .set_string("delta_t", "0000-00-00 01:00:00")
                      .set_string("format", "modified julian day (MJD)")
                      .set_string("time_zone", "UTC"),
                      io::FVPREP_DOUBLE);

  sstgrd.add_text_variable("Times", times, {"time", "DateStrLen"},
                           Attributes()
                           .set_string("long_name", "Calendar Date")
                           .set_string("format", "String: Calendar Time")
                           .set_string("time_zone", "UTC"));

  std::vector<double> sst;
  sst.reserve(series.values.size() * domain.n_nodes());
  for (const auto &field : series.values) {
    sst.insert(sst.end(), field.begin(), field.end());
  }

  sstgrd.add_variable("sst", sst, {"time", "node"},
                      Attributes()
                      .set_string("long_name", "sea surface Temperature")
                      .set_string("units", "Celsius Degree")
                      .set_string("grid", "fvcom_grid")
                      .set_string("type", "data"));

  sstgrd.close();
}

void write_sstgrd(MPI_Comm com, const std::string &filename,
                  const Domain &domain, const SSTSeries &series,
                  units::System::Ptr unit_system,
                  const ForcingFileOptions &options) {
  try {
    write(com, filename, domain, series, unit_system, options);
  } catch (RuntimeError &e) {
    e.add_context("writing SST forcing to '%s'", filename.c_str());
    throw;
  }
}

void write_sstgrd(MPI_Comm com, const std::string &filename,
                  const Domain &domain, const SSTSeries &series,
                  units::System::Ptr unit_system,
                  const ForcingFileOptions &options, const Logger &log) {
  log.message(2, "* Writing %d SST fields to '%s'...\n",
              (int)series.times.size(), filename.c_str());

  write_sstgrd(com, filename, domain, series, unit_system, options);

  log.message(2, "  done.\n");
}

} // end of namespace sst
} // end of namespace fvprep
