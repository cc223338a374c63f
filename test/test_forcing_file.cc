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

#include "fvprep/util/io/ForcingFile.hh"
#include "fvprep/util/io/File.hh"
#include "fvprep/util/io/IO_Flags.hh"
#include "fvprep/util/error_handling.hh"

#include "test_helpers.hh"

using namespace fvprep;

static Dimensions test_dimensions() {
  return {{"node", 3}, {"time", io::FVPREP_UNLIMITED}, {"DateStrLen", 8}};
}

static Attributes test_global_attributes() {
  Attributes result;
  result
    .set_string("title", "test file")
    .set_number("year", 2006, io::FVPREP_INT);
  return result;
}

static std::vector<double> read_all(const File &file, const std::string &name) {
  auto dims = file.dimensions(name);

  std::vector<unsigned int> start(dims.size(), 0), count;
  size_t size = 1;
  for (const auto &d : dims) {
    count.push_back(file.dimension_length(d));
    size *= count.back();
  }

  std::vector<double> result(size);
  file.read_variable(name, start, count, result.data());
  return result;
}

TEST_CASE("Writing a forcing file", "[forcing_file]") {
  testing::TemporaryDirectory tmp(MPI_COMM_WORLD);

  for (auto backend : {io::FVPREP_NETCDF3, io::FVPREP_NETCDF4_SERIAL}) {
    auto filename = tmp.file(backend == io::FVPREP_NETCDF3 ? "nc3.nc" : "nc4.nc");

    ForcingFileOptions options;
    options.backend = backend;

    {
      ForcingFile output(MPI_COMM_WORLD, filename, test_dimensions(),
                         test_global_attributes(), options);

      REQUIRE(output.state() == ForcingFile::DEFINING);
      REQUIRE(output.filename() == filename);

      output.add_variable("lon", {-4.0, -4.5, -5.0}, {"node"},
                          Attributes().set_string("units", "degrees_east"));
      REQUIRE(output.state() == ForcingFile::POPULATING);

      output.add_variable("time", {1.0, 2.0}, {"time"},
                          Attributes().set_string("units", "days"), "f8");

      output.add_variable("sst", {1.0, 2.0, 3.0, 4.0, 5.0, NAN}, {"time", "node"},
                          Attributes()
                          .set_string("units", "Celsius Degree")
                          .set_numbers("valid_range", {-2.0, 40.0}, io::FVPREP_FLOAT));

      output.add_variable("counter", {7.0}, {}, Attributes(), io::FVPREP_INT);

      output.add_text_variable("Times", {"2006-01-01T12", "06"}, {"time", "DateStrLen"},
                               Attributes().set_string("time_zone", "UTC"));

      REQUIRE(output.variables() ==
              std::vector<std::string>({"lon", "time", "sst", "counter", "Times"}));

      output.close();
      REQUIRE(output.state() == ForcingFile::CLOSED);
    }

    File file(MPI_COMM_WORLD, filename, io::FVPREP_GUESS, io::FVPREP_READONLY);

    REQUIRE(file.dimension_length("node") == 3);
    REQUIRE(file.dimension_length("time") == 2);
    REQUIRE(file.dimension_length("DateStrLen") == 8);
    REQUIRE(file.unlimited_dimension() == "time");

    REQUIRE(file.read_text_attribute("NC_GLOBAL", "title") == "test file");
    REQUIRE(file.read_double_attribute("NC_GLOBAL", "year") == std::vector<double>({2006.0}));
    REQUIRE(file.attribute_type("NC_GLOBAL", "year") == io::FVPREP_INT);

    REQUIRE(file.variable_type("lon") == io::FVPREP_FLOAT);
    REQUIRE(file.variable_type("time") == io::FVPREP_DOUBLE);
    REQUIRE(file.variable_type("counter") == io::FVPREP_INT);
    REQUIRE(file.variable_type("Times") == io::FVPREP_CHAR);

    REQUIRE(file.dimensions("sst") == std::vector<std::string>({"time", "node"}));

    REQUIRE(read_all(file, "lon") == std::vector<double>({-4.0, -4.5, -5.0}));
    REQUIRE(read_all(file, "time") == std::vector<double>({1.0, 2.0}));
    REQUIRE(read_all(file, "counter") == std::vector<double>({7.0}));

    auto sst = read_all(file, "sst");
    REQUIRE(sst.size() == 6);
    REQUIRE(sst[4] == 5.0);
    REQUIRE(std::isnan(sst[5]));

    REQUIRE(file.read_text_attribute("sst", "units") == "Celsius Degree");
    REQUIRE(file.read_double_attribute("sst", "valid_range") ==
            std::vector<double>({-2.0, 40.0}));

    std::vector<char> times(16);
    file.read_text_variable("Times", {0, 0}, {2, 8}, times.data());
    // truncated to 8 characters
    REQUIRE(std::string(times.data(), 8) == "2006-01-");
    // padded with zeros
    REQUIRE(std::string(times.data() + 8) == "06");
  }
}

TEST_CASE("Forcing file schema errors", "[forcing_file]") {
  testing::TemporaryDirectory tmp(MPI_COMM_WORLD);

  ForcingFile output(MPI_COMM_WORLD, tmp.file("schema.nc"), test_dimensions(),
                     test_global_attributes());

  SECTION("undeclared dimension") {
    REQUIRE_THROWS_AS(output.add_variable("lon", {1.0, 2.0, 3.0}, {"nele"}, Attributes()),
                      SchemaError);
    REQUIRE(output.variables().empty());
  }

  SECTION("wrong number of values") {
    REQUIRE_THROWS_AS(output.add_variable("lon", {1.0, 2.0}, {"node"}, Attributes()),
                      SchemaError);
    REQUIRE_THROWS_AS(output.add_variable("sst", {1.0, 2.0, 3.0, 4.0}, {"time", "node"},
                                          Attributes()),
                      SchemaError);
    REQUIRE_THROWS_AS(output.add_variable("scalar", {1.0, 2.0}, {}, Attributes()),
                      SchemaError);
  }

  SECTION("inconsistent number of records") {
    output.add_variable("time", {1.0, 2.0}, {"time"}, Attributes());
    REQUIRE_THROWS_AS(output.add_variable("sst", {1.0, 2.0, 3.0}, {"time", "node"},
                                          Attributes()),
                      SchemaError);
  }

  SECTION("duplicate variable") {
    output.add_variable("lon", {1.0, 2.0, 3.0}, {"node"}, Attributes());
    REQUIRE_THROWS_AS(output.add_variable("lon", {1.0, 2.0, 3.0}, {"node"}, Attributes()),
                      SchemaError);
  }

  SECTION("adding variables after close()") {
    output.close();
    REQUIRE_THROWS_AS(output.add_variable("lon", {1.0, 2.0, 3.0}, {"node"}, Attributes()),
                      SchemaError);
    REQUIRE_THROWS_AS(output.add_text_variable("Times", {"a"}, {"time", "DateStrLen"},
                                               Attributes()),
                      SchemaError);
  }

  SECTION("invalid format codes") {
    REQUIRE_THROWS_AS(output.add_variable("lon", {1.0, 2.0, 3.0}, {"node"}, Attributes(), "f16"),
                      SchemaError);
    REQUIRE_THROWS_AS(output.add_variable("lon", {1.0, 2.0, 3.0}, {"node"}, Attributes(), "c"),
                      SchemaError);
  }

  SECTION("text variables need a fixed-length last dimension") {
    REQUIRE_THROWS_AS(output.add_text_variable("Times", {"a"}, {"time"}, Attributes()),
                      SchemaError);
    REQUIRE_THROWS_AS(output.add_text_variable("Times", {"a"}, {}, Attributes()),
                      SchemaError);
  }
}

TEST_CASE("Format codes", "[forcing_file]") {
  REQUIRE(io::string_to_type("f4") == io::FVPREP_FLOAT);
  REQUIRE(io::string_to_type("f8") == io::FVPREP_DOUBLE);
  REQUIRE(io::string_to_type("i4") == io::FVPREP_INT);
  REQUIRE(io::string_to_type("i2") == io::FVPREP_SHORT);
  REQUIRE(io::string_to_type("i1") == io::FVPREP_BYTE);
  REQUIRE(io::string_to_type("c") == io::FVPREP_CHAR);
  REQUIRE_THROWS_AS(io::string_to_type("u8"), SchemaError);

  REQUIRE(io::string_to_backend("netcdf3") == io::FVPREP_NETCDF3);
  REQUIRE(io::string_to_backend("netcdf4_serial") == io::FVPREP_NETCDF4_SERIAL);
  REQUIRE_THROWS_AS(io::string_to_backend("hdf5"), ConfigurationError);
}

TEST_CASE("Creating forcing files", "[forcing_file]") {
  testing::TemporaryDirectory tmp(MPI_COMM_WORLD);

  SECTION("an existing file is kept unless clobbering is requested") {
    auto filename = tmp.make_text_file("existing.nc", "not a NetCDF file");

    ForcingFileOptions options;
    options.mode = io::FVPREP_READWRITE_NOCLOBBER;

    REQUIRE_THROWS_AS(ForcingFile(MPI_COMM_WORLD, filename, test_dimensions(),
                                  test_global_attributes(), options),
                      RuntimeError);

    options.mode = io::FVPREP_READWRITE_CLOBBER;
    REQUIRE_NOTHROW(ForcingFile(MPI_COMM_WORLD, filename, test_dimensions(),
                                test_global_attributes(), options));
  }

  SECTION("invalid arguments") {
    REQUIRE_THROWS_AS(ForcingFile(MPI_COMM_WORLD, "", test_dimensions(),
                                  test_global_attributes()),
                      ConfigurationError);

    ForcingFileOptions options;
    options.mode = io::FVPREP_READONLY;
    REQUIRE_THROWS_AS(ForcingFile(MPI_COMM_WORLD, tmp.file("a.nc"), test_dimensions(),
                                  test_global_attributes(), options),
                      ConfigurationError);

    REQUIRE_THROWS_AS(ForcingFile(MPI_COMM_WORLD, tmp.file("b.nc"),
                                  {{"node", 3}, {"node", 4}},
                                  test_global_attributes()),
                      SchemaError);
  }

  SECTION("the destructor closes the file") {
    auto filename = tmp.file("unfinished.nc");
    try {
      ForcingFile output(MPI_COMM_WORLD, filename, test_dimensions(), test_global_attributes());
      output.add_variable("lon", {1.0, 2.0, 3.0}, {"node"}, Attributes());
      output.add_variable("lat", {1.0}, {"node"}, Attributes());
      FAIL("expected a SchemaError");
    } catch (SchemaError &e) {
      // the file is closed and can be read
      File file(MPI_COMM_WORLD, filename, io::FVPREP_GUESS, io::FVPREP_READONLY);
      REQUIRE(file.find_variable("lon"));
      REQUIRE_FALSE(file.find_variable("lat"));
    }
  }
}
