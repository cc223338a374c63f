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

#include <algorithm>
#include <gsl/gsl_interp.h>

#include "fvprep/util/interpolation.hh"
#include "fvprep/util/error_handling.hh"

namespace fvprep {

InterpolationType string_to_interpolation_type(const std::string &name) {
  if (name == "linear") {
    return LINEAR;
  }
  if (name == "nearest") {
    return NEAREST;
  }
  throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                      "invalid interpolation method: '%s'"
                                      " (expected 'linear' or 'nearest')", name.c_str());
}

AxisInterpolation::AxisInterpolation(InterpolationType type,
                                     const std::vector<double> &input,
                                     const std::vector<double> &output) {
  const size_t N = input.size();

  if (N == 0) {
    throw InterpolationError(FVPREP_ERROR_LOCATION,
                             "an input grid for interpolation cannot be empty");
  }

  // weights are computed using an increasing copy of the grid
  const bool reversed = N > 1 and input[0] > input[1];
  std::vector<double> grid(input);
  if (reversed) {
    std::reverse(grid.begin(), grid.end());
  }

  for (size_t i = 0; i + 1 < N; ++i) {
    if (not (grid[i] < grid[i + 1])) {
      throw InterpolationError(FVPREP_ERROR_LOCATION,
                               "an input grid for interpolation has to be strictly monotonic");
    }
  }

  m_left.resize(output.size());
  m_right.resize(output.size());
  m_weight.resize(output.size());

  for (size_t k = 0; k < output.size(); ++k) {
    const double x = output[k];

    size_t L = 0, R = 0;
    double w = 0.0;

    if (N > 1 and x > grid[0]) {
      // grid[L] <= x < grid[L + 1] for L in [0, N - 2]
      L = gsl_interp_bsearch(grid.data(), x, 0, N - 1);
      R = L + 1;

      if (x < grid[R]) {
        w = (x - grid[L]) / (grid[R] - grid[L]);
      } else {
        L = R;
      }
    }

    if (type == NEAREST) {
      if (w > 0.5) {
        L = R;
      } else {
        R = L;
      }
      w = 0.0;
    }

    if (reversed) {
      L = N - 1 - L;
      R = N - 1 - R;
    }

    m_left[k]   = L;
    m_right[k]  = R;
    m_weight[k] = w;
  }
}

size_t AxisInterpolation::size() const {
  return m_weight.size();
}

int AxisInterpolation::left(size_t k) const {
  return m_left[k];
}

int AxisInterpolation::right(size_t k) const {
  return m_right[k];
}

double AxisInterpolation::weight(size_t k) const {
  return m_weight[k];
}

std::vector<double> AxisInterpolation::interpolate(const std::vector<double> &values) const {
  std::vector<double> result(size());

  for (size_t k = 0; k < result.size(); ++k) {
    const double
      a = values[m_left[k]],
      b = values[m_right[k]];
    result[k] = m_weight[k] > 0.0 ? a + m_weight[k] * (b - a) : a;
  }

  return result;
}

static AxisInterpolation axis(InterpolationType type, const char *name,
                              const std::vector<double> &input,
                              const std::vector<double> &output) {
  try {
    return AxisInterpolation(type, input, output);
  } catch (RuntimeError &e) {
    e.add_context("computing interpolation weights along the %s axis", name);
    throw;
  }
}

GridInterpolation::GridInterpolation(InterpolationType type,
                                     const std::vector<double> &x,
                                     const std::vector<double> &y,
                                     const std::vector<double> &output_x,
                                     const std::vector<double> &output_y)
  : m_type(type),
    m_nx(x.size()),
    m_ny(y.size()),
    m_x(axis(type, "x", x, output_x)),
    m_y(axis(type, "y", y, output_y)) {

  if (output_x.size() != output_y.size()) {
    throw InterpolationError::formatted(FVPREP_ERROR_LOCATION,
                                        "output point coordinate arrays have different lengths"
                                        " (%d and %d)",
                                        (int)output_x.size(), (int)output_y.size());
  }
}

size_t GridInterpolation::input_size() const {
  return m_nx * m_ny;
}

size_t GridInterpolation::output_size() const {
  return m_x.size();
}

std::vector<double> GridInterpolation::interpolate(const std::vector<double> &field) const {
  if (field.size() != input_size()) {
    throw InterpolationError::formatted(FVPREP_ERROR_LOCATION,
                                        "field has %d values, expected %d",
                                        (int)field.size(), (int)input_size());
  }

  std::vector<double> result(output_size());

  interpolate(field.data(), result.data());

  return result;
}

void GridInterpolation::interpolate(const double *field, double *output) const {
  const size_t N = output_size();

  if (m_type == NEAREST) {
    for (size_t k = 0; k < N; ++k) {
      output[k] = field[m_y.left(k) * m_nx + m_x.left(k)];
    }
    return;
  }

  for (size_t k = 0; k < N; ++k) {
    const int
      i[2] = {m_x.left(k), m_x.right(k)},
      j[2] = {m_y.left(k), m_y.right(k)};
    const double
      wx[2] = {1.0 - m_x.weight(k), m_x.weight(k)},
      wy[2] = {1.0 - m_y.weight(k), m_y.weight(k)};

    // corners with zero weight are skipped: a missing value there does not matter
    double sum = 0.0;
    for (int a = 0; a < 2; ++a) {
      for (int b = 0; b < 2; ++b) {
        const double w = wx[a] * wy[b];
        if (w > 0.0) {
          sum += w * field[j[b] * m_nx + i[a]];
        }
      }
    }
    output[k] = sum;
  }
}

} // end of namespace fvprep
