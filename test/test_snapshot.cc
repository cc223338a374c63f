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

#include "catch2/catch.hpp"

#include <cmath>
#include <memory>

#include "fvprep/sst/SSTSnapshot.hh"
#include "fvprep/util/error_handling.hh"

#include "test_helpers.hh"

using namespace fvprep;
using sst::read_snapshot;
using testing::mjd;
using testing::unit_system;

TEST_CASE("Reading SST snapshots", "[snapshot]") {
  testing::TemporaryDirectory tmp(MPI_COMM_WORLD);

  auto spec = testing::regular_sst(4, 3, 300.0, mjd(2006, 3, 1));

  std::vector<double>
    lon = {0.0, 1.2, 2.6, -5.0, 3.0},
    lat = {0.0, 0.9, 1.4, 1.0, 7.0};

  // values at nearest grid points, in Celsius
  std::vector<double> expected = {26.85, 37.85, 39.85, 36.85, 49.85};

  auto check = [&](const sst::Snapshot &snapshot) {
    REQUIRE(snapshot.values.size() == expected.size());
    for (size_t k = 0; k < expected.size(); ++k) {
      REQUIRE(snapshot.values[k] == Approx(expected[k]).margin(1e-4));
    }
    REQUIRE(snapshot.times.size() == 1);
    REQUIRE(snapshot.times[0] == Approx(mjd(2006, 3, 1)).margin(1e-3));
  };

  SECTION("plain") {
    auto filename = tmp.file("plain.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);
    check(read_snapshot(filename, lon, lat, NEAREST, unit_system()));
  }

  SECTION("packed") {
    spec.packed = true;
    auto filename = tmp.file("packed.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

    auto snapshot = read_snapshot(filename, lon, lat, NEAREST, unit_system());
    for (size_t k = 0; k < expected.size(); ++k) {
      REQUIRE(snapshot.values[k] == Approx(expected[k]).margin(1e-3));
    }
  }

  SECTION("stored as (time, lon, lat)") {
    spec.lat_first = false;
    auto filename = tmp.file("lon_first.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);
    check(read_snapshot(filename, lon, lat, NEAREST, unit_system()));
  }

  SECTION("decreasing latitude") {
    testing::SSTFile flipped = spec;
    flipped.lat = {2.0, 1.0, 0.0};
    flipped.sst.clear();
    for (int j = 2; j >= 0; --j) {
      for (int i = 0; i < 4; ++i) {
        flipped.sst.push_back(300.0 + i + 10.0 * j);
      }
    }

    auto filename = tmp.file("flipped.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, flipped);
    check(read_snapshot(filename, lon, lat, NEAREST, unit_system()));
  }

  SECTION("time in days since a different reference date") {
    spec.time_units = "days since 2006-01-01";
    spec.calendar   = "gregorian";
    spec.time       = 59.5;
    auto filename = tmp.file("days.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

    auto snapshot = read_snapshot(filename, lon, lat, NEAREST, unit_system());
    REQUIRE(snapshot.times[0] == Approx(mjd(2006, 3, 1, 12)).margin(1e-3));
  }

  SECTION("bilinear interpolation") {
    auto filename = tmp.file("linear.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

    auto snapshot = read_snapshot(filename, {0.5, 3.0}, {0.5, 2.0}, LINEAR, unit_system());
    REQUIRE(snapshot.values[0] == Approx(26.85 + 5.5).margin(1e-4));
    REQUIRE(snapshot.values[1] == Approx(26.85 + 23.0).margin(1e-4));
  }
}

TEST_CASE("Missing SST values", "[snapshot]") {
  testing::TemporaryDirectory tmp(MPI_COMM_WORLD);

  auto spec = testing::regular_sst(4, 3, 300.0, mjd(2006, 3, 1));

  std::vector<double> lon = {1.0, 2.0, 0.0}, lat = {1.0, 1.0, 0.0};

  SECTION("masked cells") {
    spec.mask.assign(12, 1.0);
    spec.mask[1 * 4 + 1] = 2.0; // land

    auto filename = tmp.file("mask.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

    auto snapshot = read_snapshot(filename, lon, lat, NEAREST, unit_system());
    REQUIRE(std::isnan(snapshot.values[0]));
    REQUIRE(snapshot.values[1] == Approx(26.85 + 12.0).margin(1e-4));
    REQUIRE(snapshot.values[2] == Approx(26.85).margin(1e-4));
  }

  SECTION("fill values") {
    for (auto packed : {false, true}) {
      spec.packed = packed;
      spec.sst[1 * 4 + 1] = NAN;

      auto filename = tmp.file(packed ? "fill_packed.nc" : "fill.nc");
      testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

      auto snapshot = read_snapshot(filename, lon, lat, NEAREST, unit_system());
      REQUIRE(std::isnan(snapshot.values[0]));
      REQUIRE_FALSE(std::isnan(snapshot.values[1]));
    }
  }
}

TEST_CASE("Invalid SST files", "[snapshot]") {
  testing::TemporaryDirectory tmp(MPI_COMM_WORLD);

  auto spec = testing::regular_sst(4, 3, 300.0, mjd(2006, 3, 1));
  std::vector<double> lon = {1.0}, lat = {1.0};

  SECTION("missing file") {
    auto filename = tmp.file("missing.nc");
    try {
      read_snapshot(filename, lon, lat, NEAREST, unit_system());
      FAIL("expected a DataSourceError");
    } catch (DataSourceError &e) {
      REQUIRE(e.filenames() == std::vector<std::string>({filename}));
    }
  }

  SECTION("not a NetCDF file") {
    auto filename = tmp.make_text_file("text.nc", "analysed_sst = 300\n");
    REQUIRE_THROWS_AS(read_snapshot(filename, lon, lat, NEAREST, unit_system()),
                      DataSourceError);
  }

  SECTION("missing variable") {
    spec.with_mask = false;
    auto filename = tmp.file("no_mask.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

    try {
      read_snapshot(filename, lon, lat, NEAREST, unit_system());
      FAIL("expected a DataSourceError");
    } catch (DataSourceError &e) {
      REQUIRE(e.filenames() == std::vector<std::string>({filename}));
      REQUIRE(std::string(e.what()).find("'mask'") != std::string::npos);
    }
  }

  SECTION("unsupported calendar") {
    spec.calendar = "noleap";
    auto filename = tmp.file("noleap.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

    REQUIRE_THROWS_AS(read_snapshot(filename, lon, lat, NEAREST, unit_system()),
                      DataSourceError);
  }

  SECTION("unknown calendar") {
    spec.calendar = "lunar";
    auto filename = tmp.file("lunar.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

    REQUIRE_THROWS_AS(read_snapshot(filename, lon, lat, NEAREST, unit_system()),
                      DataSourceError);
  }

  SECTION("invalid time units") {
    spec.time_units = "kelvin";
    auto filename = tmp.file("units.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

    REQUIRE_THROWS_AS(read_snapshot(filename, lon, lat, NEAREST, unit_system()),
                      DataSourceError);
  }

  SECTION("non-monotonic longitude") {
    spec.lon = {0.0, 1.0, 1.0, 2.0};
    auto filename = tmp.file("lon.nc");
    testing::write_sst_file(MPI_COMM_WORLD, filename, spec);

    REQUIRE_THROWS_AS(read_snapshot(filename, lon, lat, NEAREST, unit_system()),
                      InterpolationError);
  }
}
