// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <bezkit/core/api-build_test_p.h>
#if defined(BK_TEST)

#include <bezkit/core/geometry.h>
#include <bezkit/geometry/commons_p.h>

// BKGeometry - Tests
// ==================

namespace bk::Tests {

TEST(bk_geometry, point_operators) {
  BKPoint a(1, 2);
  BKPoint b(4, 8);

  EXPECT_EQ(-a, BKPoint(-1, -2));
  EXPECT_EQ(a + 1.0, BKPoint(2, 3));
  EXPECT_EQ(a - 1.0, BKPoint(0, 1));
  EXPECT_EQ(a * 2.0, BKPoint(2, 4));
  EXPECT_EQ(b / 2.0, BKPoint(2, 4));
  EXPECT_EQ(3.0 * a, BKPoint(3, 6));

  EXPECT_EQ(a + b, BKPoint(5, 10));
  EXPECT_EQ(b - a, BKPoint(3, 6));
  EXPECT_EQ(a * b, BKPoint(4, 16));
  EXPECT_EQ(b / a, BKPoint(4, 4));

  BKPoint c = a;
  c += b;
  EXPECT_EQ(c, BKPoint(5, 10));
  c -= a;
  EXPECT_EQ(c, b);
  c *= 0.5;
  EXPECT_EQ(c, BKPoint(2, 4));
  c /= 2.0;
  EXPECT_EQ(c, BKPoint(1, 2));

  EXPECT_EQ(a.coord(BK_AXIS_X), 1.0);
  EXPECT_EQ(a.coord(BK_AXIS_Y), 2.0);

  c.reset();
  EXPECT_EQ(c, BKPoint(0, 0));
  EXPECT_NE(c, a);
}

TEST(bk_geometry, box) {
  BKBox box(0, 10, 20, 30);

  EXPECT_EQ(box, BKBox(0, 10, 20, 30));
  EXPECT_NE(box, BKBox(0, 10, 20, 31));

  EXPECT_TRUE(box.contains(BKPoint(0, 10)));
  EXPECT_TRUE(box.contains(BKPoint(20, 30)));
  EXPECT_TRUE(box.contains(BKPoint(5, 15)));
  EXPECT_FALSE(box.contains(BKPoint(-1, 15)));
  EXPECT_FALSE(box.contains(BKPoint(5, 31)));

  EXPECT_TRUE(Geometry::is_valid(box));
  EXPECT_FALSE(Geometry::is_valid(BKBox(1, 0, 0, 0)));

  Geometry::bound(box, BKPoint(-5, 40));
  EXPECT_EQ(box, BKBox(-5, 10, 20, 40));

  box.reset();
  EXPECT_EQ(box, BKBox(0, 0, 0, 0));
}

TEST(bk_geometry, valid_axis) {
  EXPECT_TRUE(Geometry::is_valid_axis(BK_AXIS_X));
  EXPECT_TRUE(Geometry::is_valid_axis(BK_AXIS_Y));
  EXPECT_FALSE(Geometry::is_valid_axis(2u));
}

TEST(bk_geometry, points_bounds) {
  const BKPoint points[4] = { BKPoint(3, -1), BKPoint(-2, 4), BKPoint(7, 2), BKPoint(0, 0) };
  BKBox box;

  EXPECT_SUCCESS(bk_calc_points_bounds(points, BK_ARRAY_SIZE(points), &box));
  EXPECT_EQ(box, BKBox(-2, -1, 7, 4));

  EXPECT_SUCCESS(bk_calc_points_bounds(points, 1, &box));
  EXPECT_EQ(box, BKBox(3, -1, 3, -1));

  // No points - no bounds, the output is left untouched.
  box.reset(1, 2, 3, 4);
  EXPECT_FAILURE(BK_ERROR_INVALID_GEOMETRY, bk_calc_points_bounds(points, 0, &box));
  EXPECT_EQ(box, BKBox(1, 2, 3, 4));

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_points_bounds(nullptr, 4, &box));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_points_bounds(points, 4, nullptr));
}

} // {bk::Tests}

#endif // BK_TEST
