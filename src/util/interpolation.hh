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

#ifndef FVPREP_INTERPOLATION_H
#define FVPREP_INTERPOLATION_H

#include <vector>
#include <string>

namespace fvprep {

enum InterpolationType {LINEAR, NEAREST};

//! Convert "linear" or "nearest" to an InterpolationType.
InterpolationType string_to_interpolation_type(const std::string &name);

//! Interpolation along one axis from a fixed input grid to fixed output coordinates.
/*!
 * The value at output point `k` is
 *
 *     values[left(k)] + weight(k) * (values[right(k)] - values[left(k)])
 *
 * The input grid has to be strictly monotonic (increasing or decreasing). Output points outside
 * of it get the value at the closest end of the grid.
 *
 * With NEAREST, `left(k) == right(k)` and the weight is zero. A point half-way between two grid
 * points goes to the one with the smaller coordinate.
 */
class AxisInterpolation {
public:
  AxisInterpolation(InterpolationType type,
                    const std::vector<double> &input,
                    const std::vector<double> &output);

  //! Number of output points.
  size_t size() const;

  int left(size_t k) const;
  int right(size_t k) const;
  double weight(size_t k) const;

  std::vector<double> interpolate(const std::vector<double> &values) const;
private:
  std::vector<int> m_left, m_right;
  std::vector<double> m_weight;
};

//! Interpolation from a regular (x, y) grid to a set of scattered points.
/*!
 * Input fields are stored with `x` varying fastest: `field[j * x.size() + i]` is the value at
 * `(x[i], y[j])`.
 *
 * In the NEAREST case each output point copies exactly one input value, so a missing (NaN) input
 * value affects only the points for which it is the closest one. In the LINEAR case a NaN
 * contaminates every point that has a non-zero weight for it.
 */
class GridInterpolation {
public:
  GridInterpolation(InterpolationType type,
                    const std::vector<double> &x,
                    const std::vector<double> &y,
                    const std::vector<double> &output_x,
                    const std::vector<double> &output_y);

  std::vector<double> interpolate(const std::vector<double> &field) const;
  void interpolate(const double *field, double *output) const;

  //! Number of values expected in an input field.
  size_t input_size() const;
  //! Number of output points.
  size_t output_size() const;
private:
  InterpolationType m_type;
  size_t m_nx, m_ny;
  AxisInterpolation m_x, m_y;
};

} // end of namespace fvprep

#endif /* FVPREP_INTERPOLATION_H */
