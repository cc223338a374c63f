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

#ifndef FVPREP_SSTWRITER_H
#define FVPREP_SSTWRITER_H

#include <string>
#include <vector>

#include <mpi.h>

#include "fvprep/util/Units.hh"
#include "fvprep/util/io/ForcingFile.hh"

namespace fvprep {

class Domain;
class Logger;

namespace sst {

//! Time series of SST fields on mesh nodes.
struct SSTSeries {
  //! Time stamps, in seconds since the MJD epoch.
  std::vector<double> times;
  //! `values[k][n]` is the temperature (degrees Celsius) at node `n` and time `times[k]`.
  std::vector<std::vector<double> > values;
};

//! \brief Write an FVCOM SST data assimilation ("sstgrd") file.
/*!
 * Writes node coordinates, the MJD time axis, calendar time stamps and SST on mesh nodes.
 *
 * Throws SchemaError if the number of fields does not match the number of time stamps or if a
 * field does not have one value per mesh node.
 *
 * `unit_system` is used to convert time stamps to calendar dates.
 */
void write_sstgrd(MPI_Comm com, const std::string &filename,
                  const Domain &domain, const SSTSeries &series,
                  units::System::Ptr unit_system,
                  const ForcingFileOptions &options = ForcingFileOptions());

void write_sstgrd(MPI_Comm com, const std::string &filename,
                  const Domain &domain, const SSTSeries &series,
                  units::System::Ptr unit_system,
                  const ForcingFileOptions &options, const Logger &log);

} // end of namespace sst
} // end of namespace fvprep

#endif /* FVPREP_SSTWRITER_H */
