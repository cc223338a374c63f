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

#ifndef FVPREP_SSTOPTIONS_H
#define FVPREP_SSTOPTIONS_H

#include <string>

#include "fvprep/util/interpolation.hh"
#include "fvprep/util/io/ForcingFile.hh"

namespace fvprep {
namespace sst {

//! Settings of an SST assimilation run.
struct SSTOptions {
  SSTOptions();

  //! root directory containing one sub-directory per year
  std::string sst_dir;
  //! target year
  int year;
  //! process all files on every rank instead of using a worker pool
  bool serial;
  //! number of worker ranks; zero or negative means "all ranks"
  int pool_size;
  InterpolationType interpolation;

  //! name of the SST forcing file
  std::string output;
  ForcingFileOptions output_options;

  //! SMS mesh file; empty if not set
  std::string mesh;
};

//! Process `-sst_dir`, `-sst_year`, `-sst_serial`, `-sst_pool_size`, `-sst_interpolation`,
//! `-o`, `-o_format`, `-o_compression_level` and `-mesh`.
/*!
 * Throws ConfigurationError if `-sst_dir` or `-sst_year` is missing or an option value is
 * invalid.
 */
SSTOptions sst_options_from_command_line();

} // end of namespace sst
} // end of namespace fvprep

#endif /* FVPREP_SSTOPTIONS_H */
