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

static char help[] =
  "Interpolates satellite SST snapshots to the nodes of an unstructured mesh and\n"
  "writes an FVCOM SST data assimilation file.\n";

#include <memory>
#include <petscsys.h>           // PETSC_COMM_WORLD

#include "fvprep/mesh/Domain.hh"
#include "fvprep/sst/SSTBatch.hh"
#include "fvprep/sst/SSTOptions.hh"
#include "fvprep/util/Logger.hh"
#include "fvprep/util/Units.hh"
#include "fvprep/util/error_handling.hh"
#include "fvprep/util/fvprep_options.hh"
#include "fvprep/util/petscwrappers/PetscInitializer.hh"

using namespace fvprep;

int main(int argc, char *argv[]) {

  MPI_Comm com = MPI_COMM_WORLD;
  petsc::Initializer petsc(argc, argv, help);

  com = PETSC_COMM_WORLD;

  int exit_code = 0;
  try {
    auto log = logger_from_options(com);

    std::string usage =
      "  fvprep_sst -mesh MESH.2dm -sst_dir DIR -sst_year YEAR [-o OUTPUT.nc] [OTHER OPTIONS]\n"
      "where:\n"
      "  -mesh                  SMS mesh (spherical coordinates)\n"
      "  -sst_dir               directory containing one sub-directory of SST files per year\n"
      "  -sst_year              year to process\n"
      "  -o                     output file name (default: sstgrd.nc)\n"
      "  -o_format              netcdf3 or netcdf4_serial (default)\n"
      "  -o_compression_level   compression level, 0 to 9 (default: 7)\n"
      "  -sst_serial            process all files on every rank\n"
      "  -sst_pool_size         number of worker ranks (default: all)\n"
      "  -sst_interpolation     nearest (default) or linear\n"
      "notes:\n"
      "  * options -mesh, -sst_dir and -sst_year are required\n"
      "  * SST files of the previous and the next year have to be present\n";
    {
      bool done = check_command_line(*log, "fvprep_sst",
                                     {"-mesh", "-sst_dir", "-sst_year"}, usage);
      if (done) {
        return 0;
      }
    }

    auto options = sst::sst_options_from_command_line();

    std::shared_ptr<const Domain> mesh = read_sms_mesh(com, options.mesh);

    log->message(2, "* Read a mesh with %d nodes and %d elements from '%s'\n",
                 (int)mesh->n_nodes(), (int)mesh->n_elements(), options.mesh.c_str());

    auto sys = std::make_shared<units::System>();

    sst::SSTBatch batch(com, mesh, options, *log, sys);

    batch.collect_files(options.sst_dir, options.year);
    batch.interpolate();
    batch.align();
    batch.write(options.output, options.output_options);

    log->message(2, "... done\n");
  }
  catch (...) {
    handle_fatal_errors(com);
    exit_code = 1;
  }

  return exit_code;
}
