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

#include <fstream>
#include <sstream>
#include <map>

#include "fvprep/mesh/Domain.hh"
#include "fvprep/util/error_handling.hh"
#include "fvprep/util/fvprep_utilities.hh"

namespace fvprep {

Domain::~Domain() {
  // empty
}

const std::vector<double>& Domain::lon() const {
  return lon_impl();
}

const std::vector<double>& Domain::lat() const {
  return lat_impl();
}

unsigned int Domain::n_nodes() const {
  return lon_impl().size();
}

unsigned int Domain::n_elements() const {
  return n_elements_impl();
}

MeshDomain::MeshDomain(const std::vector<double> &lon,
                       const std::vector<double> &lat,
                       const std::vector<int> &triangles)
  : m_lon(lon), m_lat(lat), m_triangles(triangles) {

  if (m_lon.size() != m_lat.size()) {
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                  "mesh: got %d longitudes and %d latitudes",
                                  (int)m_lon.size(), (int)m_lat.size());
  }

  if (m_triangles.size() % 3 != 0) {
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                  "mesh: connectivity has %d entries (not a multiple of 3)",
                                  (int)m_triangles.size());
  }

  const int N = m_lon.size();
  for (size_t k = 0; k < m_triangles.size(); ++k) {
    if (m_triangles[k] < 0 or m_triangles[k] >= N) {
      throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                    "mesh: element %d refers to node %d (valid range: 0-%d)",
                                    (int)(k / 3), m_triangles[k], N - 1);
    }
  }
}

MeshDomain::~MeshDomain() {
  // empty
}

const std::vector<int>& MeshDomain::triangles() const {
  return m_triangles;
}

const std::vector<double>& MeshDomain::lon_impl() const {
  return m_lon;
}

const std::vector<double>& MeshDomain::lat_impl() const {
  return m_lat;
}

unsigned int MeshDomain::n_elements_impl() const {
  return m_triangles.size() / 3;
}

namespace {

enum ReadStatus {READ_OK = 0, READ_CONFIGURATION_ERROR = 1, READ_DATA_ERROR = 2};

struct SMSMesh {
  std::vector<double> lon, lat;
  std::vector<int> triangles;
};

//! Parse a `.2dm` file. Called on one rank only.
SMSMesh parse_sms_mesh(const std::string &filename) {
  std::ifstream input(filename.c_str());
  if (not input.good()) {
    throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                        "cannot open mesh file '%s'", filename.c_str());
  }

  // node id -> (lon, lat)
  std::map<int, std::pair<double, double> > nodes;
  // 1-based node ids, three per element
  std::vector<int> elements;

  std::string line;
  int line_number = 0;
  while (std::getline(input, line)) {
    line_number += 1;

    std::istringstream record(line);
    std::string card;
    record >> card;

    if (card == "ND") {
      int id = 0;
      double x = 0.0, y = 0.0;
      if (not (record >> id >> x >> y)) {
        throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, filename,
                                         "%s:%d: invalid node record '%s'",
                                         filename.c_str(), line_number, line.c_str());
      }
      if (nodes.find(id) != nodes.end()) {
        throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, filename,
                                         "%s:%d: node %d is defined twice",
                                         filename.c_str(), line_number, id);
      }
      nodes[id] = std::make_pair(x, y);
    } else if (card == "E3T") {
      int id = 0, n[3] = {0, 0, 0};
      if (not (record >> id >> n[0] >> n[1] >> n[2])) {
        throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, filename,
                                         "%s:%d: invalid element record '%s'",
                                         filename.c_str(), line_number, line.c_str());
      }
      elements.insert(elements.end(), n, n + 3);
    } else if (card == "E4Q" or card == "E6T" or card == "E8Q" or card == "E9Q") {
      throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, filename,
                                       "%s:%d: unsupported element type '%s'"
                                       " (only triangles are supported)",
                                       filename.c_str(), line_number, card.c_str());
    }
  }

  if (nodes.empty()) {
    throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, filename,
                                     "mesh file '%s' contains no nodes", filename.c_str());
  }

  SMSMesh result;

  // std::map is sorted, so ids are contiguous iff the last one is equal to the size
  if (nodes.begin()->first != 1 or nodes.rbegin()->first != (int)nodes.size()) {
    throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, filename,
                                     "mesh file '%s': node ids are not 1, 2, ..., %d",
                                     filename.c_str(), (int)nodes.size());
  }

  for (const auto &n : nodes) {
    result.lon.push_back(n.second.first);
    result.lat.push_back(n.second.second);
  }

  for (auto id : elements) {
    if (id < 1 or id > (int)nodes.size()) {
      throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, filename,
                                       "mesh file '%s': an element refers to node %d,"
                                       " which does not exist",
                                       filename.c_str(), id);
    }
    result.triangles.push_back(id - 1);
  }

  return result;
}

} // end of anonymous namespace

std::shared_ptr<MeshDomain> read_sms_mesh(MPI_Comm com, const std::string &filename) {
  int rank = 0;
  MPI_Comm_rank(com, &rank);

  SMSMesh mesh;
  int status = READ_OK;
  std::string message;

  if (rank == 0) {
    try {
      mesh = parse_sms_mesh(filename);
    } catch (ConfigurationError &e) {
      status  = READ_CONFIGURATION_ERROR;
      message = e.what();
    } catch (RuntimeError &e) {
      status  = READ_DATA_ERROR;
      message = e.what();
    }
  }

  MPI_Bcast(&status, 1, MPI_INT, 0, com);
  broadcast(com, 0, message);

  if (status == READ_CONFIGURATION_ERROR) {
    throw ConfigurationError(FVPREP_ERROR_LOCATION, message);
  }

  if (status == READ_DATA_ERROR) {
    throw DataSourceError(FVPREP_ERROR_LOCATION, {filename}, message);
  }

  broadcast(com, 0, mesh.lon);
  broadcast(com, 0, mesh.lat);

  unsigned int n_triangles = mesh.triangles.size();
  MPI_Bcast(&n_triangles, 1, MPI_UNSIGNED, 0, com);
  mesh.triangles.resize(n_triangles);
  if (n_triangles > 0) {
    MPI_Bcast(mesh.triangles.data(), n_triangles, MPI_INT, 0, com);
  }

  return std::make_shared<MeshDomain>(mesh.lon, mesh.lat, mesh.triangles);
}

} // end of namespace fvprep
