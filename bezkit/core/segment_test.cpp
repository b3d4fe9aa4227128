// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <bezkit/core/api-build_test_p.h>
#if defined(BK_TEST)

#include <bezkit/core/segment.h>

// BKSegment - Tests
// =================

namespace bk::Tests {

static const BKPoint test_line[2] = { BKPoint(0, 0), BKPoint(100, 100) };
static const BKPoint test_quad[3] = { BKPoint(0, 0), BKPoint(50, 100), BKPoint(100, 0) };
static const BKPoint test_cubic[4] = { BKPoint(0, 0), BKPoint(25, 100), BKPoint(75, 100), BKPoint(100, 0) };

static void expect_point_near(const BKPoint& a, const BKPoint& b) {
  EXPECT_NEAR(a.x, b.x, 1e-9);
  EXPECT_NEAR(a.y, b.y, 1e-9);
}

TEST(bk_segment, vertex_count) {
  EXPECT_EQ(bk_segment_vertex_count(BK_SEGMENT_TYPE_NONE), 0u);
  EXPECT_EQ(bk_segment_vertex_count(BK_SEGMENT_TYPE_LINE), 2u);
  EXPECT_EQ(bk_segment_vertex_count(BK_SEGMENT_TYPE_QUAD), 3u);
  EXPECT_EQ(bk_segment_vertex_count(BK_SEGMENT_TYPE_CUBIC), 4u);
  EXPECT_EQ(bk_segment_vertex_count(BKSegmentType(7)), 0u);
}

TEST(bk_segment, calc_parameters) {
  BKQuadParameters qp;
  EXPECT_SUCCESS(bk_calc_quad_parameters(test_quad, &qp));
  EXPECT_EQ(qp.a, BKPoint(0, -200));
  EXPECT_EQ(qp.b, BKPoint(100, 200));
  EXPECT_EQ(qp.c, BKPoint(0, 0));

  BKCubicParameters cp;
  EXPECT_SUCCESS(bk_calc_cubic_parameters(test_cubic, &cp));
  EXPECT_EQ(cp.a, BKPoint(-50, 0));
  EXPECT_EQ(cp.b, BKPoint(75, -300));
  EXPECT_EQ(cp.c, BKPoint(75, 300));
  EXPECT_EQ(cp.d, BKPoint(0, 0));

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_quad_parameters(nullptr, &qp));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_quad_parameters(test_quad, nullptr));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_cubic_parameters(nullptr, &cp));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_cubic_parameters(test_cubic, nullptr));
}

TEST(bk_segment, calc_bounds) {
  BKBox box;

  EXPECT_SUCCESS(bk_calc_quad_bounds(test_quad, &box));
  EXPECT_EQ(box, BKBox(0, 0, 100, 50));

  EXPECT_SUCCESS(bk_calc_cubic_bounds(test_cubic, &box));
  EXPECT_EQ(box, BKBox(0, 0, 100, 75));

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_quad_bounds(nullptr, &box));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_quad_bounds(test_quad, nullptr));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_cubic_bounds(nullptr, &box));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_calc_cubic_bounds(test_cubic, nullptr));
}

TEST(bk_segment, split_line) {
  BKSegmentSplit split;

  EXPECT_SUCCESS(bk_split_line(test_line, 50, BK_AXIS_Y, &split));
  ASSERT_EQ(split.size, 2u);
  EXPECT_EQ(split[0], BKSegment::line(BKPoint(0, 0), BKPoint(50, 50)));
  EXPECT_EQ(split[1], BKSegment::line(BKPoint(50, 50), BKPoint(100, 100)));

  // Unused vertices of the produced segments are zero.
  for (const BKSegment& segment : split) {
    EXPECT_EQ(segment.vtx[2], BKPoint(0, 0));
    EXPECT_EQ(segment.vtx[3], BKPoint(0, 0));
  }

  EXPECT_SUCCESS(bk_split_line(test_line, 100, BK_AXIS_Y, &split));
  ASSERT_EQ(split.size, 1u);
  EXPECT_EQ(split[0], BKSegment::line(test_line[0], test_line[1]));
}

TEST(bk_segment, split_quad) {
  BKSegmentSplit split;

  EXPECT_SUCCESS(bk_split_quad(test_quad, 50, BK_AXIS_X, &split));
  ASSERT_EQ(split.size, 2u);
  EXPECT_EQ(split[0], BKSegment::quad(BKPoint(0, 0), BKPoint(25, 50), BKPoint(50, 50)));
  EXPECT_EQ(split[1], BKSegment::quad(BKPoint(50, 50), BKPoint(75, 50), BKPoint(100, 0)));
  EXPECT_EQ(split[0].vtx[3], BKPoint(0, 0));

  EXPECT_SUCCESS(bk_split_quad(test_quad, 50, BK_AXIS_Y, &split));
  ASSERT_EQ(split.size, 3u);
  EXPECT_EQ(split[1], BKSegment::quad(BKPoint(50, 50), BKPoint(50, 50), BKPoint(50, 50)));

  EXPECT_SUCCESS(bk_split_quad(test_quad, 150, BK_AXIS_X, &split));
  ASSERT_EQ(split.size, 1u);
  EXPECT_EQ(split[0], BKSegment::quad(test_quad[0], test_quad[1], test_quad[2]));
}

TEST(bk_segment, split_cubic) {
  BKSegmentSplit split;

  EXPECT_SUCCESS(bk_split_cubic(test_cubic, 50, BK_AXIS_X, &split));
  ASSERT_EQ(split.size, 2u);
  EXPECT_EQ(split[0].type, BK_SEGMENT_TYPE_CUBIC);
  EXPECT_EQ(split[0].first(), test_cubic[0]);
  EXPECT_NEAR(split[0].last().x, 50.0, 1e-9);
  EXPECT_NEAR(split[0].last().y, 75.0, 1e-9);
  expect_point_near(split[0].last(), split[1].first());

  const BKPoint wavy[4] = { BKPoint(0, 0), BKPoint(150, 33), BKPoint(-50, 66), BKPoint(100, 100) };
  EXPECT_SUCCESS(bk_split_cubic(wavy, 50, BK_AXIS_X, &split));
  ASSERT_EQ(split.size, size_t(BK_RUNTIME_MAX_SPLIT_COUNT));

  for (size_t i = 1; i < split.size; i++) {
    expect_point_near(split[i - 1].last(), split[i].first());
    EXPECT_NEAR(split[i].first().x, 50.0, 1e-9);
  }
}

TEST(bk_segment, split_invalid_arguments) {
  BKSegmentSplit split;
  split.reset();

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_split_line(nullptr, 0, BK_AXIS_X, &split));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_split_line(test_line, 0, BK_AXIS_X, nullptr));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_split_line(test_line, 0, BKAxis(2), &split));

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_split_quad(nullptr, 0, BK_AXIS_X, &split));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_split_quad(test_quad, 0, BK_AXIS_Y, nullptr));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_split_quad(test_quad, 0, BKAxis(2), &split));

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_split_cubic(nullptr, 0, BK_AXIS_X, &split));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_split_cubic(test_cubic, 0, BK_AXIS_Y, nullptr));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_split_cubic(test_cubic, 0, BKAxis(2), &split));

  // Failed calls don't touch the output.
  EXPECT_TRUE(split.is_empty());
}

#if defined(BK_BUILD_DEBUG)
TEST(bk_segment_death, split_index_out_of_range) {
  BKSegmentSplit split;
  split.reset();
  EXPECT_DEATH((void)split[0], "ASSERTION FAILURE");

  EXPECT_SUCCESS(bk_split_line(test_line, 50, BK_AXIS_Y, &split));
  ASSERT_EQ(split.size, 2u);
  EXPECT_DEATH((void)split[2], "ASSERTION FAILURE");
}
#endif

TEST(bk_segment, init) {
  BKSegment segment;

  EXPECT_SUCCESS(bk_segment_init_line(&segment, test_line));
  EXPECT_EQ(segment.type, BK_SEGMENT_TYPE_LINE);
  EXPECT_EQ(segment.vertex_count(), 2u);
  EXPECT_EQ(segment.last(), test_line[1]);
  EXPECT_EQ(segment.vtx[2], BKPoint(0, 0));

  EXPECT_SUCCESS(bk_segment_init_quad(&segment, test_quad));
  EXPECT_EQ(segment.type, BK_SEGMENT_TYPE_QUAD);
  EXPECT_EQ(segment.last(), test_quad[2]);
  EXPECT_EQ(segment.vtx[3], BKPoint(0, 0));

  EXPECT_SUCCESS(bk_segment_init_cubic(&segment, test_cubic));
  EXPECT_EQ(segment.type, BK_SEGMENT_TYPE_CUBIC);
  EXPECT_EQ(segment.last(), test_cubic[3]);

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_segment_init_line(nullptr, test_line));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_segment_init_quad(&segment, nullptr));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_segment_init_cubic(&segment, nullptr));
}

TEST(bk_segment, equals_ignores_unused_vertices) {
  BKSegment a = BKSegment::quad(test_quad[0], test_quad[1], test_quad[2]);
  BKSegment b;
  b.reset(BK_SEGMENT_TYPE_QUAD, test_quad[0], test_quad[1], test_quad[2], BKPoint(7, 7));

  EXPECT_EQ(a, b);

  b.type = BK_SEGMENT_TYPE_CUBIC;
  EXPECT_NE(a, b);
}

TEST(bk_segment, tagged_bounds) {
  BKBox box;

  EXPECT_SUCCESS(BKSegment::line(BKPoint(10, 20), BKPoint(-5, 40)).bounds(&box));
  EXPECT_EQ(box, BKBox(-5, 20, 10, 40));

  EXPECT_SUCCESS(BKSegment::quad(test_quad[0], test_quad[1], test_quad[2]).bounds(&box));
  EXPECT_EQ(box, BKBox(0, 0, 100, 50));

  EXPECT_SUCCESS(BKSegment::cubic(test_cubic[0], test_cubic[1], test_cubic[2], test_cubic[3]).bounds(&box));
  EXPECT_EQ(box, BKBox(0, 0, 100, 75));

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, BKSegment::line(test_line[0], test_line[1]).bounds(nullptr));
}

TEST(bk_segment, tagged_split_matches_direct_split) {
  BKSegmentSplit direct;
  BKSegmentSplit tagged;

  EXPECT_SUCCESS(bk_split_line(test_line, 25, BK_AXIS_X, &direct));
  EXPECT_SUCCESS(BKSegment::line(test_line[0], test_line[1]).split(25, BK_AXIS_X, &tagged));
  ASSERT_EQ(direct.size, tagged.size);
  for (size_t i = 0; i < direct.size; i++)
    EXPECT_EQ(direct[i], tagged[i]);

  EXPECT_SUCCESS(bk_split_quad(test_quad, 25, BK_AXIS_Y, &direct));
  EXPECT_SUCCESS(BKSegment::quad(test_quad[0], test_quad[1], test_quad[2]).split(25, BK_AXIS_Y, &tagged));
  ASSERT_EQ(direct.size, tagged.size);
  for (size_t i = 0; i < direct.size; i++)
    EXPECT_EQ(direct[i], tagged[i]);

  EXPECT_SUCCESS(bk_split_cubic(test_cubic, 40, BK_AXIS_Y, &direct));
  EXPECT_SUCCESS(BKSegment::cubic(test_cubic[0], test_cubic[1], test_cubic[2], test_cubic[3]).split(40, BK_AXIS_Y, &tagged));
  ASSERT_EQ(direct.size, tagged.size);
  for (size_t i = 0; i < direct.size; i++)
    EXPECT_EQ(direct[i], tagged[i]);
}

TEST(bk_segment, point_at) {
  BKSegment segment = BKSegment::cubic(test_cubic[0], test_cubic[1], test_cubic[2], test_cubic[3]);
  BKPoint p;

  EXPECT_SUCCESS(segment.point_at(0.0, &p));
  EXPECT_EQ(p, test_cubic[0]);

  EXPECT_SUCCESS(segment.point_at(0.5, &p));
  EXPECT_EQ(p, BKPoint(50, 75));

  EXPECT_SUCCESS(segment.point_at(1.0, &p));
  EXPECT_EQ(p, test_cubic[3]);

  segment = BKSegment::quad(test_quad[0], test_quad[1], test_quad[2]);
  EXPECT_SUCCESS(segment.point_at(0.5, &p));
  EXPECT_EQ(p, BKPoint(50, 50));

  segment = BKSegment::line(test_line[0], test_line[1]);
  EXPECT_SUCCESS(segment.point_at(0.25, &p));
  EXPECT_EQ(p, BKPoint(25, 25));

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, segment.point_at(0.5, nullptr));
}

TEST(bk_segment, invalid_type) {
  BKSegment segment;
  BKSegmentSplit split;
  BKBox box;
  BKPoint p;

  segment.reset();
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, segment.bounds(&box));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, segment.split(0, BK_AXIS_X, &split));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, segment.point_at(0, &p));

  segment.type = BKSegmentType(7);
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, segment.bounds(&box));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, segment.split(0, BK_AXIS_X, &split));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, segment.point_at(0, &p));

  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_segment_bounds(nullptr, &box));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_segment_split(nullptr, 0, BK_AXIS_X, &split));
  EXPECT_FAILURE(BK_ERROR_INVALID_VALUE, bk_segment_point_at(nullptr, 0, &p));
}

} // {bk::Tests}

#endif // BK_TEST
