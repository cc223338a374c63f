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

#ifndef FVPREP_DOMAIN_H
#define FVPREP_DOMAIN_H

#include <memory>
#include <string>
#include <vector>

#include <mpi.h>

namespace fvprep {

//! \brief Geometry of an unstructured (triangular) mesh.
/*!
 * A Domain is immutable. Node coordinates are longitudes and latitudes in degrees; every rank
 * holds a complete copy.
 */
class Domain {
public:
  virtual ~Domain();

  typedef std::shared_ptr<Domain> Ptr;
  typedef std::shared_ptr<const Domain> ConstPtr;

  //! Node longitudes, in degrees east.
  const std::vector<double>& lon() const;
  //! Node latitudes, in degrees north.
  const std::vector<double>& lat() const;

  unsigned int n_nodes() const;
  unsigned int n_elements() const;
protected:
  virtual const std::vector<double>& lon_impl() const = 0;
  virtual const std::vector<double>& lat_impl() const = 0;
  virtual unsigned int n_elements_impl() const = 0;
};

//! A Domain stored in memory: node coordinates and element connectivity.
class MeshDomain : public Domain {
public:
  /*!
   * `triangles` lists 0-based node indexes, three per element.
   */
  MeshDomain(const std::vector<double> &lon,
             const std::vector<double> &lat,
             const std::vector<int> &triangles);
  virtual ~MeshDomain();

  //! Element connectivity (three 0-based node indexes per element).
  const std::vector<int>& triangles() const;
protected:
  const std::vector<double>& lon_impl() const;
  const std::vector<double>& lat_impl() const;
  unsigned int n_elements_impl() const;
private:
  std::vector<double> m_lon, m_lat;
  std::vector<int> m_triangles;
};

//! \brief Read a mesh in the SMS `.2dm` format (spherical coordinates).
/*!
 * Uses `ND id lon lat depth` and `E3T id n1 n2 n3 material` records; other records
 * (`MESH2D`, `MESHNAME`, nodestrings, ...) are ignored. Node ids have to be 1, 2, ..., N in any
 * order.
 *
 * Rank 0 reads the file; the mesh is broadcast to all ranks of `com`.
 */
std::shared_ptr<MeshDomain> read_sms_mesh(MPI_Comm com, const std::string &filename);

} // end of namespace fvprep

#endif /* FVPREP_DOMAIN_H */
