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

#include <map>

#include <petscsys.h>

#include "fvprep/sst/SSTOptions.hh"
#include "fvprep/util/Logger.hh"
#include "fvprep/util/fvprep_options.hh"
#include "fvprep/util/error_handling.hh"

using namespace fvprep;

namespace {

typedef std::map<std::string, std::string> Arguments;

//! Sets command-line options in the PETSc database; removes them when destroyed.
class CommandLine {
public:
  CommandLine(const Arguments &options)
    : m_options(options) {
    for (const auto &o : m_options) {
      PetscErrorCode ierr = PetscOptionsSetValue(NULL, o.first.c_str(),
                                                 o.second.empty() ? NULL : o.second.c_str());
      FVPREP_CHK(ierr, "PetscOptionsSetValue");
    }
  }

  ~CommandLine() {
    for (const auto &o : m_options) {
      PetscErrorCode ierr = PetscOptionsClearValue(NULL, o.first.c_str());
      CHKERRCONTINUE(ierr);
    }
  }
private:
  Arguments m_options;
};

} // end of anonymous namespace

TEST_CASE("SST options: defaults", "[options]") {
  CommandLine command_line(Arguments{{"-sst_dir", "/data/sst"}, {"-sst_year", "2006"}});

  auto options = sst::sst_options_from_command_line();

  REQUIRE(options.sst_dir == "/data/sst");
  REQUIRE(options.year == 2006);
  REQUIRE_FALSE(options.serial);
  REQUIRE(options.pool_size == 0);
  REQUIRE(options.interpolation == NEAREST);
  REQUIRE(options.output == "sstgrd.nc");
  REQUIRE(options.output_options.backend == io::FVPREP_NETCDF4_SERIAL);
  REQUIRE(options.output_options.mode == io::FVPREP_READWRITE_CLOBBER);
  REQUIRE(options.output_options.compression_level == 7);
  REQUIRE(options.mesh.empty());
}

TEST_CASE("SST options: all settings", "[options]") {
  CommandLine command_line(Arguments{{"-sst_dir", "/data/sst"},
                            {"-sst_year", "1999"},
                            {"-sst_serial", ""},
                            {"-sst_pool_size", "4"},
                            {"-sst_interpolation", "linear"},
                            {"-o", "sst_1999.nc"},
                            {"-o_format", "netcdf3"},
                            {"-o_compression_level", "0"},
                            {"-mesh", "tamar.2dm"}});

  auto options = sst::sst_options_from_command_line();

  REQUIRE(options.year == 1999);
  REQUIRE(options.serial);
  REQUIRE(options.pool_size == 4);
  REQUIRE(options.interpolation == LINEAR);
  REQUIRE(options.output == "sst_1999.nc");
  REQUIRE(options.output_options.backend == io::FVPREP_NETCDF3);
  REQUIRE(options.output_options.compression_level == 0);
  REQUIRE(options.mesh == "tamar.2dm");
}

TEST_CASE("SST options: invalid settings", "[options]") {
  SECTION("missing -sst_dir") {
    CommandLine command_line(Arguments{{"-sst_year", "2006"}});
    REQUIRE_THROWS_AS(sst::sst_options_from_command_line(), ConfigurationError);
  }

  SECTION("missing -sst_year") {
    CommandLine command_line(Arguments{{"-sst_dir", "/data/sst"}});
    REQUIRE_THROWS_AS(sst::sst_options_from_command_line(), ConfigurationError);
  }

  SECTION("year is not a number") {
    CommandLine command_line(Arguments{{"-sst_dir", "/data/sst"}, {"-sst_year", "MMVI"}});
    REQUIRE_THROWS_AS(sst::sst_options_from_command_line(), ConfigurationError);
  }

  SECTION("unknown interpolation method") {
    CommandLine command_line(Arguments{{"-sst_dir", "/data/sst"}, {"-sst_year", "2006"},
                              {"-sst_interpolation", "cubic"}});
    REQUIRE_THROWS_AS(sst::sst_options_from_command_line(), ConfigurationError);
  }

  SECTION("unknown output format") {
    CommandLine command_line(Arguments{{"-sst_dir", "/data/sst"}, {"-sst_year", "2006"},
                              {"-o_format", "grib"}});
    REQUIRE_THROWS_AS(sst::sst_options_from_command_line(), ConfigurationError);
  }

  SECTION("compression level out of range") {
    CommandLine command_line(Arguments{{"-sst_dir", "/data/sst"}, {"-sst_year", "2006"},
                              {"-o_compression_level", "12"}});
    REQUIRE_THROWS_AS(sst::sst_options_from_command_line(), ConfigurationError);
  }

  SECTION("invalid boolean") {
    CommandLine command_line(Arguments{{"-sst_dir", "/data/sst"}, {"-sst_year", "2006"},
                              {"-sst_serial", "maybe"}});
    REQUIRE_THROWS_AS(sst::sst_options_from_command_line(), ConfigurationError);
  }
}

TEST_CASE("Option types", "[options]") {
  CommandLine command_line(Arguments{{"-name", "sst"},
                            {"-flag", ""},
                            {"-switch", "off"},
                            {"-count", "12"},
                            {"-empty", ""}});

  REQUIRE(options::String("-name", "a string").value() == "sst");
  REQUIRE_FALSE(options::String("-unknown", "a string", "default").is_set());
  REQUIRE(options::String("-unknown", "a string", "default").value() == "default");
  REQUIRE(options::String("-empty", "a string", "", options::EMPTY_OK).is_set());
  REQUIRE_THROWS_AS(options::String("-empty", "a string"), ConfigurationError);

  REQUIRE(options::Bool("-flag", "a flag"));
  REQUIRE_FALSE(options::Bool("-switch", "a flag"));
  REQUIRE_FALSE(options::Bool("-unknown", "a flag"));

  options::Integer count("-count", "a number", 1);
  REQUIRE(count.is_set());
  REQUIRE(count.value() == 12);
  REQUIRE(options::Integer("-unknown", "a number", 1).value() == 1);

  REQUIRE(options::Keyword("-name", "a keyword", "sst,sss", "sss").value() == "sst");
  REQUIRE_THROWS_AS(options::Keyword("-name", "a keyword", "u,v", "u"), ConfigurationError);
  REQUIRE_THROWS_AS(options::Keyword("-name", "a keyword", "", "u"), RuntimeError);
}

TEST_CASE("Integer options have to fit in an int", "[options]") {
  CommandLine command_line(Arguments{{"-count", "99999999999"}});

  REQUIRE_THROWS_AS(options::Integer("-count", "a number", 1), ConfigurationError);
}

TEST_CASE("Usage, version and required options", "[options]") {
  StringLogger log(MPI_COMM_WORLD, 2);
  const std::string usage = "  fvprep_test -input FILE\n";

  SECTION("all required options are present") {
    CommandLine command_line(Arguments{{"-input", "sst.nc"}});

    REQUIRE_FALSE(check_command_line(log, "fvprep_test", {"-input"}, usage));
    REQUIRE(log.get().find("fvprep_test (fvprep ") == 0);
    REQUIRE(log.get().find("Usage") == std::string::npos);
  }

  SECTION("missing required options") {
    CommandLine command_line(Arguments{{"-input", ""}});

    REQUIRE(check_command_line(log, "fvprep_test", {"-input", "-mesh", "-o"}, usage));
    REQUIRE(log.get().find("missing required option(s) -mesh, -o") != std::string::npos);
    REQUIRE(log.get().find(usage) != std::string::npos);
  }

  SECTION("-version") {
    CommandLine command_line(Arguments{{"-version", ""}});

    REQUIRE(check_command_line(log, "fvprep_test", {"-input"}, usage));
    REQUIRE(log.get().find("missing") == std::string::npos);
  }

  SECTION("-usage") {
    CommandLine command_line(Arguments{{"-usage", ""}});

    REQUIRE(check_command_line(log, "fvprep_test", {}, usage));
    REQUIRE(log.get().find("Usage of fvprep_test:\n" + usage) != std::string::npos);
  }
}
