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

#include "catch2/catch.hpp"

#include <cmath>

#include "fvprep/util/interpolation.hh"
#include "fvprep/util/error_handling.hh"

using namespace fvprep;

TEST_CASE("1D linear interpolation", "[interpolation]") {
  std::vector<double> x = {0.0, 1.0, 2.0};
  std::vector<double> y = {0.0, 10.0, 30.0};

  AxisInterpolation I(LINEAR, x, {-1.0, 0.25, 1.5, 2.0, 5.0});

  auto result = I.interpolate(y);

  REQUIRE(result[0] == 0.0);    // constant extrapolation on the left
  REQUIRE(result[1] == Approx(2.5));
  REQUIRE(result[2] == Approx(20.0));
  REQUIRE(result[3] == 30.0);
  REQUIRE(result[4] == 30.0);   // constant extrapolation on the right
}

TEST_CASE("1D nearest neighbor interpolation", "[interpolation]") {
  std::vector<double> x = {0.0, 1.0, 2.0};

  AxisInterpolation I(NEAREST, x, {0.4, 0.5, 0.6, 1.5, 2.7, -3.0});

  auto result = I.interpolate({10.0, 20.0, 30.0});

  REQUIRE(result == std::vector<double>({10.0, 10.0, 20.0, 20.0, 30.0, 10.0}));

  for (size_t k = 0; k < I.size(); ++k) {
    REQUIRE(I.left(k) == I.right(k));
    REQUIRE(I.weight(k) == 0.0);
  }
}

TEST_CASE("1D interpolation on a decreasing grid", "[interpolation]") {
  std::vector<double> x = {2.0, 1.0, 0.0};
  std::vector<double> values = {30.0, 10.0, 0.0};

  AxisInterpolation linear(LINEAR, x, {0.25, 1.5, 3.0, -1.0});
  auto result = linear.interpolate(values);
  REQUIRE(result[0] == Approx(2.5));
  REQUIRE(result[1] == Approx(20.0));
  REQUIRE(result[2] == 30.0);
  REQUIRE(result[3] == 0.0);

  // ties go to the smaller coordinate
  AxisInterpolation nearest(NEAREST, x, {0.5, 1.5});
  REQUIRE(nearest.interpolate(values) == std::vector<double>({0.0, 10.0}));
}

TEST_CASE("Degenerate input grids", "[interpolation]") {
  REQUIRE_THROWS_AS(AxisInterpolation(NEAREST, {}, {1.0}), InterpolationError);
  REQUIRE_THROWS_AS(AxisInterpolation(NEAREST, {0.0, 2.0, 1.0}, {1.0}), InterpolationError);
  REQUIRE_THROWS_AS(AxisInterpolation(NEAREST, {2.0, 0.0, 1.0}, {1.0}), InterpolationError);
  REQUIRE_THROWS_AS(AxisInterpolation(LINEAR, {0.0, 0.0}, {1.0}), InterpolationError);
  REQUIRE_THROWS_AS(AxisInterpolation(LINEAR, {0.0, NAN}, {1.0}), InterpolationError);

  // a single grid point is allowed
  AxisInterpolation I(NEAREST, {5.0}, {-1.0, 7.0});
  REQUIRE(I.interpolate({3.0}) == std::vector<double>({3.0, 3.0}));
}

TEST_CASE("Interpolation method names", "[interpolation]") {
  REQUIRE(string_to_interpolation_type("nearest") == NEAREST);
  REQUIRE(string_to_interpolation_type("linear") == LINEAR);
  REQUIRE_THROWS_AS(string_to_interpolation_type("cubic"), ConfigurationError);
}

// field[j * nx + i] = 10 * j + i
static std::vector<double> test_field(int nx, int ny) {
  std::vector<double> result;
  for (int j = 0; j < ny; ++j) {
    for (int i = 0; i < nx; ++i) {
      result.push_back(10.0 * j + i);
    }
  }
  return result;
}

TEST_CASE("2D nearest neighbor interpolation", "[interpolation]") {
  std::vector<double> x = {0.0, 1.0, 2.0, 3.0};
  std::vector<double> y = {0.0, 1.0, 2.0};

  auto field = test_field(x.size(), y.size());

  SECTION("points on and between grid points") {
    GridInterpolation I(NEAREST, x, y, {0.0, 1.2, 2.6, 3.0}, {0.0, 0.9, 1.4, 2.0});

    REQUIRE(I.input_size() == 12);
    REQUIRE(I.output_size() == 4);
    REQUIRE(I.interpolate(field) == std::vector<double>({0.0, 11.0, 13.0, 23.0}));
  }

  SECTION("ties go to the smaller coordinate") {
    GridInterpolation I(NEAREST, x, y, {0.5, 2.5}, {1.5, 0.5});

    REQUIRE(I.interpolate(field) == std::vector<double>({10.0, 2.0}));
  }

  SECTION("points outside the grid use the closest grid point") {
    GridInterpolation I(NEAREST, x, y, {-10.0, 10.0, 1.0}, {1.0, -5.0, 50.0});

    REQUIRE(I.interpolate(field) == std::vector<double>({10.0, 3.0, 21.0}));
  }

  SECTION("a missing value affects only the points closest to it") {
    field[1 * 4 + 1] = NAN;     // (x, y) = (1, 1)

    GridInterpolation I(NEAREST, x, y, {1.0, 1.4, 1.6, 1.0}, {1.0, 1.4, 1.0, 0.4});

    auto result = I.interpolate(field);
    REQUIRE(std::isnan(result[0]));
    REQUIRE(std::isnan(result[1]));
    REQUIRE(result[2] == 12.0);
    REQUIRE(result[3] == 1.0);
  }
}

TEST_CASE("2D interpolation with a decreasing axis", "[interpolation]") {
  std::vector<double> x = {0.0, 1.0, 2.0};
  std::vector<double> y = {2.0, 1.0, 0.0};   // decreasing, as in many satellite products

  auto field = test_field(x.size(), y.size()); // field(x, y) = i + 10 * j, j indexes `y`

  SECTION("nearest") {
    GridInterpolation I(NEAREST, x, y, {0.0, 2.0, 1.0}, {2.0, 0.2, 0.5});

    // y = 2 is j = 0, y = 0.2 is closest to j = 2, y = 0.5 is a tie: use y = 0 (j = 2)
    REQUIRE(I.interpolate(field) == std::vector<double>({0.0, 22.0, 21.0}));
  }

  SECTION("linear") {
    GridInterpolation I(LINEAR, x, y, {0.5}, {1.5});

    // average of (0, 1), (1, 1), (0, 2), (1, 2)  => j = 1, 0
    REQUIRE(I.interpolate(field)[0] == Approx((10.0 + 11.0 + 0.0 + 1.0) / 4.0));
  }
}

TEST_CASE("2D linear interpolation", "[interpolation]") {
  std::vector<double> x = {0.0, 1.0, 2.0};
  std::vector<double> y = {0.0, 1.0};

  auto field = test_field(x.size(), y.size());

  GridInterpolation I(LINEAR, x, y, {0.5, 2.0, 1.0}, {0.5, 1.0, 0.0});

  auto result = I.interpolate(field);
  REQUIRE(result[0] == Approx(5.5));
  REQUIRE(result[1] == Approx(12.0));
  REQUIRE(result[2] == Approx(1.0));

  SECTION("missing values at unused corners are ignored") {
    field[0] = NAN;             // (0, 0)
    REQUIRE(I.interpolate(field)[2] == Approx(1.0));
    REQUIRE(std::isnan(I.interpolate(field)[0]));
  }
}

TEST_CASE("2D interpolation errors", "[interpolation]") {
  std::vector<double> x = {0.0, 1.0}, y = {0.0, 1.0};

  REQUIRE_THROWS_AS(GridInterpolation(NEAREST, x, y, {0.0, 1.0}, {0.0}), InterpolationError);
  REQUIRE_THROWS_AS(GridInterpolation(NEAREST, {}, y, {0.0}, {0.0}), InterpolationError);
  REQUIRE_THROWS_AS(GridInterpolation(NEAREST, x, {0.0, 1.0, 0.5}, {0.0}, {0.0}),
                    InterpolationError);

  GridInterpolation I(NEAREST, x, y, {0.0}, {0.0});
  REQUIRE_THROWS_AS(I.interpolate(std::vector<double>(3, 0.0)), InterpolationError);

  try {
    GridInterpolation(LINEAR, x, {1.0, 1.0}, {0.0}, {0.0});
    FAIL("expected an InterpolationError");
  } catch (InterpolationError &e) {
    REQUIRE(e.context().size() == 1);
    REQUIRE(e.context()[0] == "computing interpolation weights along the y axis");
  }
}
