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

#ifndef FVPREP_PETSCINITIALIZER_H
#define FVPREP_PETSCINITIALIZER_H

namespace fvprep {
namespace petsc {

//! Sets up PETSc (and MPI) for the lifetime of this object.
/*!
 * Does nothing if PETSc was set up by the caller. In that case PETSc is not finalized by the
 * destructor either.
 */
class Initializer {
public:
  Initializer(int argc, char **argv, const char *help);
  ~Initializer();
private:
  bool m_owner;
  Initializer(const Initializer &);
  Initializer & operator=(const Initializer &);
};

} // end of namespace petsc
} // end of namespace fvprep

#endif /* FVPREP_PETSCINITIALIZER_H */
