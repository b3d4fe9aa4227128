// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <bezkit/core/api-build_p.h>
#include <bezkit/core/segment.h>
#include <bezkit/core/trace_p.h>
#include <bezkit/geometry/bezier_p.h>

namespace bk {
namespace SegmentInternal {

using Geometry::Line;
using Geometry::Quad;
using Geometry::Cubic;

// bk::Segment - Internals
// =======================

static constexpr uint32_t vertex_count_table[BK_SEGMENT_TYPE_MAX_VALUE + 1] = { 0, 2, 3, 4 };

static BK_INLINE void init_segment(BKSegment* self, BKSegmentType type, const BKPoint* vtx, uint32_t n) noexcept {
  self->type = type;
  for (uint32_t i = 0; i < n; i++)
    self->vtx[i] = vtx[i];
  for (uint32_t i = n; i < BK_ARRAY_SIZE(self->vtx); i++)
    self->vtx[i].reset();
}

template<typename Curve, size_t N>
static BK_INLINE void store_split(BKSegmentSplit* out, BKSegmentType type, const FixedArray<Curve, N>& pieces) noexcept {
  static_assert(N <= BK_RUNTIME_MAX_SPLIT_COUNT, "Split result must fit BKSegmentSplit");

  for (size_t i = 0; i < pieces.size(); i++)
    init_segment(&out->data[i], type, pieces[i].vtx, Curve::kVertexCount);
  out->size = pieces.size();
}

static BK_INLINE BKResult check_split_args(const BKPoint* vtx, BKAxis axis, BKSegmentSplit* out) noexcept {
  if (BK_UNLIKELY(!vtx || !out || !Geometry::is_valid_axis(axis)))
    return bk_make_error(BK_ERROR_INVALID_VALUE);
  return BK_SUCCESS;
}

static BK_INLINE BKResult check_segment(const BKSegment* self) noexcept {
  if (BK_UNLIKELY(!self || uint32_t(self->type) > BK_SEGMENT_TYPE_MAX_VALUE || self->type == BK_SEGMENT_TYPE_NONE))
    return bk_make_error(BK_ERROR_INVALID_VALUE);
  return BK_SUCCESS;
}

} // {SegmentInternal}
} // {bk}

using namespace bk::SegmentInternal;

// bk::Segment - API - Parameters
// ==============================

BK_API_IMPL BKResult bk_calc_quad_parameters(const BKPoint quad[3], BKQuadParameters* out) noexcept {
  if (BK_UNLIKELY(!quad || !out))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  bk::Geometry::QuadCoefficients coef = bk::Geometry::coefficients_of(Quad<BKPoint>(quad));
  out->a = coef.a;
  out->b = coef.b;
  out->c = coef.c;
  return BK_SUCCESS;
}

BK_API_IMPL BKResult bk_calc_cubic_parameters(const BKPoint cubic[4], BKCubicParameters* out) noexcept {
  if (BK_UNLIKELY(!cubic || !out))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  bk::Geometry::CubicCoefficients coef = bk::Geometry::coefficients_of(Cubic<BKPoint>(cubic));
  out->a = coef.a;
  out->b = coef.b;
  out->c = coef.c;
  out->d = coef.d;
  return BK_SUCCESS;
}

// bk::Segment - API - Bounds
// ==========================

BK_API_IMPL BKResult bk_calc_quad_bounds(const BKPoint quad[3], BKBox* box_out) noexcept {
  if (BK_UNLIKELY(!quad || !box_out))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  *box_out = bk::Geometry::bounds_of(Quad<BKPoint>(quad));
  return BK_SUCCESS;
}

BK_API_IMPL BKResult bk_calc_cubic_bounds(const BKPoint cubic[4], BKBox* box_out) noexcept {
  if (BK_UNLIKELY(!cubic || !box_out))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  *box_out = bk::Geometry::bounds_of(Cubic<BKPoint>(cubic));
  return BK_SUCCESS;
}

// bk::Segment - API - Split
// =========================

BK_API_IMPL BKResult bk_split_line(const BKPoint line[2], double where, BKAxis axis, BKSegmentSplit* out) noexcept {
  BK_PROPAGATE(check_split_args(line, axis, out));

  bk::FixedArray<Line<BKPoint>, Line<BKPoint>::kMaxSplitCount> pieces;
  bk::Geometry::split_at_coordinate(Line<BKPoint>(line), where, axis, pieces, BKSplitTrace());

  store_split(out, BK_SEGMENT_TYPE_LINE, pieces);
  return BK_SUCCESS;
}

BK_API_IMPL BKResult bk_split_quad(const BKPoint quad[3], double where, BKAxis axis, BKSegmentSplit* out) noexcept {
  BK_PROPAGATE(check_split_args(quad, axis, out));

  bk::FixedArray<Quad<BKPoint>, Quad<BKPoint>::kMaxSplitCount> pieces;
  bk::Geometry::split_at_coordinate(Quad<BKPoint>(quad), where, axis, pieces, BKSplitTrace());

  store_split(out, BK_SEGMENT_TYPE_QUAD, pieces);
  return BK_SUCCESS;
}

BK_API_IMPL BKResult bk_split_cubic(const BKPoint cubic[4], double where, BKAxis axis, BKSegmentSplit* out) noexcept {
  BK_PROPAGATE(check_split_args(cubic, axis, out));

  bk::FixedArray<Cubic<BKPoint>, Cubic<BKPoint>::kMaxSplitCount> pieces;
  bk::Geometry::split_at_coordinate(Cubic<BKPoint>(cubic), where, axis, pieces, BKSplitTrace());

  store_split(out, BK_SEGMENT_TYPE_CUBIC, pieces);
  return BK_SUCCESS;
}

// bk::Segment - API - Tagged Segment
// ==================================

BK_API_IMPL uint32_t bk_segment_vertex_count(BKSegmentType type) noexcept {
  if (BK_UNLIKELY(uint32_t(type) > BK_SEGMENT_TYPE_MAX_VALUE))
    return 0;
  return vertex_count_table[type];
}

BK_API_IMPL BKResult bk_segment_init_line(BKSegment* self, const BKPoint line[2]) noexcept {
  if (BK_UNLIKELY(!self || !line))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  init_segment(self, BK_SEGMENT_TYPE_LINE, line, 2);
  return BK_SUCCESS;
}

BK_API_IMPL BKResult bk_segment_init_quad(BKSegment* self, const BKPoint quad[3]) noexcept {
  if (BK_UNLIKELY(!self || !quad))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  init_segment(self, BK_SEGMENT_TYPE_QUAD, quad, 3);
  return BK_SUCCESS;
}

BK_API_IMPL BKResult bk_segment_init_cubic(BKSegment* self, const BKPoint cubic[4]) noexcept {
  if (BK_UNLIKELY(!self || !cubic))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  init_segment(self, BK_SEGMENT_TYPE_CUBIC, cubic, 4);
  return BK_SUCCESS;
}

BK_API_IMPL BKResult bk_segment_bounds(const BKSegment* self, BKBox* box_out) noexcept {
  BK_PROPAGATE(check_segment(self));

  switch (self->type) {
    case BK_SEGMENT_TYPE_LINE:
      if (BK_UNLIKELY(!box_out))
        return bk_make_error(BK_ERROR_INVALID_VALUE);

      *box_out = bk::Geometry::bounds_of(Line<BKPoint>(self->vtx));
      return BK_SUCCESS;

    case BK_SEGMENT_TYPE_QUAD:
      return bk_calc_quad_bounds(self->vtx, box_out);

    case BK_SEGMENT_TYPE_CUBIC:
      return bk_calc_cubic_bounds(self->vtx, box_out);

    default:
      BK_NOT_REACHED();
  }
}

BK_API_IMPL BKResult bk_segment_split(const BKSegment* self, double where, BKAxis axis, BKSegmentSplit* out) noexcept {
  BK_PROPAGATE(check_segment(self));

  switch (self->type) {
    case BK_SEGMENT_TYPE_LINE:
      return bk_split_line(self->vtx, where, axis, out);

    case BK_SEGMENT_TYPE_QUAD:
      return bk_split_quad(self->vtx, where, axis, out);

    case BK_SEGMENT_TYPE_CUBIC:
      return bk_split_cubic(self->vtx, where, axis, out);

    default:
      BK_NOT_REACHED();
  }
}

BK_API_IMPL BKResult bk_segment_point_at(const BKSegment* self, double t, BKPoint* out) noexcept {
  BK_PROPAGATE(check_segment(self));

  if (BK_UNLIKELY(!out))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  switch (self->type) {
    case BK_SEGMENT_TYPE_LINE:
      *out = bk::Geometry::evaluate(Line<BKPoint>(self->vtx), t);
      return BK_SUCCESS;

    case BK_SEGMENT_TYPE_QUAD:
      *out = bk::Geometry::evaluate(Quad<BKPoint>(self->vtx), t);
      return BK_SUCCESS;

    case BK_SEGMENT_TYPE_CUBIC:
      *out = bk::Geometry::evaluate(Cubic<BKPoint>(self->vtx), t);
      return BK_SUCCESS;

    default:
      BK_NOT_REACHED();
  }
}
