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

#ifndef FVPREP_SSTBATCH_H
#define FVPREP_SSTBATCH_H

#include <memory>
#include <string>
#include <vector>

#include <mpi.h>

#include "fvprep/sst/SSTOptions.hh"
#include "fvprep/sst/SSTWriter.hh"
#include "fvprep/util/Units.hh"

namespace fvprep {

class Domain;
class Logger;

namespace sst {

//! Midday convention: snapshots stamped at midnight are used at 12:00.
static const double midday_offset = 12.0 * 3600.0;

//! Sorted list of regular files in `directory`, skipping hidden ones. Returns full paths.
/*!
 * Throws ConfigurationError if `directory` does not exist or cannot be read.
 */
std::vector<std::string> list_directory(const std::string &directory);

//! \brief SST assimilation over one year, from file discovery to the forcing file.
/*!
 * An SSTBatch goes through these states:
 *
 * - COLLECTING_FILES: waiting for collect_files(),
 * - INTERPOLATING: waiting for interpolate(),
 * - ALIGNING: waiting for align(),
 * - WRITING: waiting for write(),
 * - CLOSED: the forcing file was written.
 *
 * Calling an operation in a different state is an error. An operation that fails moves the
 * batch to FAILED; results computed before the failure stay available through results().
 *
 * All ranks of the communicator have to make the same calls.
 */
class SSTBatch {
public:
  enum State {COLLECTING_FILES, INTERPOLATING, ALIGNING, WRITING, CLOSED, FAILED};

  //! Interpolated SST from one file.
  struct Result {
    //! position of the file in files()
    unsigned int index;
    std::string filename;
    //! time stamps read from the file (seconds since the MJD epoch)
    std::vector<double> times;
    std::vector<double> values;
  };

  SSTBatch(MPI_Comm com, std::shared_ptr<const Domain> domain,
           const SSTOptions &options, const Logger &log,
           units::System::Ptr unit_system);
  ~SSTBatch();

  //! \brief Build the list of files: the last file of `year - 1`, all files of `year` and the
  //! first file of `year + 1`.
  /*!
   * Throws ConfigurationError if a year directory is missing or if a neighboring year has no
   * files and DataSourceError if `year` has no files.
   */
  const std::vector<std::string>& collect_files(const std::string &sst_dir, int year);

  //! Interpolate all files to mesh nodes, serially or using a pool of worker ranks.
  /*!
   * Throws DataSourceError listing every file that could not be processed.
   */
  void interpolate();

  //! Build the time series, shifting each snapshot to the middle of its day.
  const SSTSeries& align();

  //! Write the forcing file.
  void write(const std::string &filename, const ForcingFileOptions &options);

  State state() const;

  const std::vector<std::string>& files() const;

  //! Results in the order of files(). Contains successfully processed files only.
  const std::vector<Result>& results() const;

  const SSTSeries& series() const;
private:
  struct Impl;
  Impl *m_impl;

  void expect(State state, const char *operation) const;
  void interpolate_serial(std::vector<Result> &results,
                          std::vector<std::string> &failures);
  void interpolate_parallel(std::vector<Result> &results,
                            std::vector<std::string> &failures);

  // disable copying and assignments
  SSTBatch(const SSTBatch &other);
  SSTBatch & operator=(const SSTBatch &);
};

//! \brief Interpolate SST snapshots of `year` (plus one snapshot on either side) to mesh nodes.
/*!
 * Returns one field per file, with time stamps moved to midday.
 */
SSTSeries interp_sst_assimilation(MPI_Comm com, std::shared_ptr<const Domain> domain,
                                  const std::string &sst_dir, int year,
                                  const SSTOptions &options, const Logger &log);

} // end of namespace sst
} // end of namespace fvprep

#endif /* FVPREP_SSTBATCH_H */
