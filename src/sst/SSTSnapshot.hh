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

#ifndef FVPREP_SSTSNAPSHOT_H
#define FVPREP_SSTSNAPSHOT_H

#include <string>
#include <vector>

#include "fvprep/util/Units.hh"
#include "fvprep/util/interpolation.hh"

namespace fvprep {
namespace sst {

//! Sea surface temperature from one source file, interpolated to mesh nodes.
struct Snapshot {
  //! Time stamps from the file, in seconds since the MJD epoch.
  std::vector<double> times;
  //! Temperature at mesh nodes, in degrees Celsius; NaN where the source is masked.
  std::vector<double> values;
};

//! \brief Read one gridded SST file and interpolate it to the points (`lon[k]`, `lat[k]`).
/*!
 * The file has to contain
 *
 * - `analysed_sst` (Kelvin, optionally packed using `scale_factor` and `add_offset`),
 * - `mask` (1 marks valid cells),
 * - 1D coordinate variables `lon` and `lat`,
 * - `time` with a `units` attribute.
 *
 * `analysed_sst` and `mask` may have any number of extra dimensions of length 1 (usually
 * `time`).
 *
 * The file is opened on MPI_COMM_SELF, so this function can be called by any one rank.
 *
 * Throws DataSourceError naming the file if it cannot be read or does not have the structure
 * described above and InterpolationError if the `lon` or `lat` axis cannot be used for
 * interpolation.
 */
Snapshot read_snapshot(const std::string &filename,
                       const std::vector<double> &lon,
                       const std::vector<double> &lat,
                       InterpolationType type,
                       units::System::Ptr unit_system);

//! Offset between 0 degrees Celsius and 0 Kelvin.
static const double kelvin_offset = 273.15;

} // end of namespace sst
} // end of namespace fvprep

#endif /* FVPREP_SSTSNAPSHOT_H */
