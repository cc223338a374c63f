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

#ifndef FVPREP_IO_FLAGS_H
#define FVPREP_IO_FLAGS_H

#include <string>

namespace fvprep {

namespace io {

//! Variable and attribute types. Values match the corresponding `nc_type` constants.
enum Type : int {
  FVPREP_NAT    = 0,            // missing or unsupported
  FVPREP_BYTE   = 1,
  FVPREP_CHAR   = 2,
  FVPREP_SHORT  = 3,
  FVPREP_INT    = 4,
  FVPREP_FLOAT  = 5,
  FVPREP_DOUBLE = 6
};

//! Convert a numpy-style format code ("f4", "f8", "i4", "i2", "i1", "c") to a Type.
Type string_to_type(const std::string &format);

//! On-disk format of a file.
enum Backend : int {
  //! use whatever the file contains (reading only; creates NetCDF-3 files)
  FVPREP_GUESS,
  //! NetCDF-3 with 64-bit offsets
  FVPREP_NETCDF3,
  //! NetCDF-4 (HDF5), written by one rank
  FVPREP_NETCDF4_SERIAL
};

//! Convert "netcdf3" or "netcdf4_serial" to a Backend.
Backend string_to_backend(const std::string &backend);

// Values do not match NetCDF flags, so passing a Mode to NetCDF directly is easy to spot.
enum Mode : int {
  //! open an existing file for reading
  FVPREP_READONLY = 7,
  //! create a file, replacing an existing one
  FVPREP_READWRITE_CLOBBER = 9,
  //! create a file, failing if it exists
  FVPREP_READWRITE_NOCLOBBER = 10
};

//! Dimension length meaning "unlimited" (same as NC_UNLIMITED).
enum Dim_Length : int { FVPREP_UNLIMITED = 0 };

} // namespace io

} // end of namespace fvprep

#endif /* FVPREP_IO_FLAGS_H */
