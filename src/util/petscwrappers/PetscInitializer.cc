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

#include "fvprep/util/petscwrappers/PetscInitializer.hh"

#include <petscsys.h>

#include "fvprep/util/error_handling.hh"

namespace fvprep {
namespace petsc {

Initializer::Initializer(int argc, char **argv, const char *help)
  : m_owner(false) {

  PetscBool ready = PETSC_FALSE;
  PetscErrorCode ierr = PetscInitialized(&ready);
  FVPREP_CHK(ierr, "PetscInitialized");

  if (ready == PETSC_TRUE) {
    return;
  }

  ierr = PetscInitialize(&argc, &argv, nullptr, help);
  FVPREP_CHK(ierr, "PetscInitialize");
  m_owner = true;
}

Initializer::~Initializer() {
  if (not m_owner) {
    return;
  }

  // errors cannot be reported at this point
  PetscErrorCode ierr = PetscFinalize();
  CHKERRCONTINUE(ierr);
}

} // end of namespace petsc
} // end of namespace fvprep
