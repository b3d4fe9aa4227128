// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_CORE_SEGMENT_H_INCLUDED
#define BEZKIT_CORE_SEGMENT_H_INCLUDED

#include <bezkit/core/geometry.h>
#include <bezkit/core/runtime.h>

//! \addtogroup bk_geometry
//! \{

//! \name BKSegment - Constants
//! \{

//! Segment type.
BK_DEFINE_ENUM(BKSegmentType) {
  //! No segment (not initialized).
  BK_SEGMENT_TYPE_NONE = 0,
  //! Line segment (start and end point).
  BK_SEGMENT_TYPE_LINE = 1,
  //! Quadratic Bezier segment (start point, control point, and end point).
  BK_SEGMENT_TYPE_QUAD = 2,
  //! Cubic Bezier segment (start point, two control points, and end point).
  BK_SEGMENT_TYPE_CUBIC = 3,

  //! Maximum value of `BKSegmentType`.
  BK_SEGMENT_TYPE_MAX_VALUE = 3

  BK_FORCE_ENUM_UINT32(BK_SEGMENT_TYPE)
};

//! \}

//! \}

//! \addtogroup bk_c_api
//! \{

//! \name BKSegment - C API
//!
//! Split functions cut a segment at a coordinate `where` of the given `axis`. Parameters of the cut are taken from
//! the half-open range [0, 1), so a segment that ends exactly at `where` is not split. A split that finds no
//! parameter stores the original segment as the only piece. Repeated parameters are kept, which means that a curve
//! that only touches `where` produces a degenerate piece that collapses into a single point.
//!
//! \{

BK_BEGIN_C_DECLS

BK_API BKResult BK_CDECL bk_calc_quad_parameters(const BKPoint quad[3], BKQuadParameters* out) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_calc_cubic_parameters(const BKPoint cubic[4], BKCubicParameters* out) BK_NOEXCEPT_C;

BK_API BKResult BK_CDECL bk_calc_quad_bounds(const BKPoint quad[3], BKBox* box_out) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_calc_cubic_bounds(const BKPoint cubic[4], BKBox* box_out) BK_NOEXCEPT_C;

BK_API BKResult BK_CDECL bk_split_line(const BKPoint line[2], double where, BKAxis axis, BKSegmentSplit* out) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_split_quad(const BKPoint quad[3], double where, BKAxis axis, BKSegmentSplit* out) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_split_cubic(const BKPoint cubic[4], double where, BKAxis axis, BKSegmentSplit* out) BK_NOEXCEPT_C;

BK_API uint32_t BK_CDECL bk_segment_vertex_count(BKSegmentType type) BK_NOEXCEPT_C;

BK_API BKResult BK_CDECL bk_segment_init_line(BKSegment* self, const BKPoint line[2]) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_segment_init_quad(BKSegment* self, const BKPoint quad[3]) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_segment_init_cubic(BKSegment* self, const BKPoint cubic[4]) BK_NOEXCEPT_C;

BK_API BKResult BK_CDECL bk_segment_bounds(const BKSegment* self, BKBox* box_out) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_segment_split(const BKSegment* self, double where, BKAxis axis, BKSegmentSplit* out) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_segment_point_at(const BKSegment* self, double t, BKPoint* out) BK_NOEXCEPT_C;

BK_END_C_DECLS

//! \}
//! \}

//! \addtogroup bk_geometry
//! \{

//! \name BKSegment - Structs
//! \{

//! Power basis coefficients of a quadratic curve, `B(t) = a*t^2 + b*t + c`.
struct BKQuadParameters {
  BKPoint a;
  BKPoint b;
  BKPoint c;
};

//! Power basis coefficients of a cubic curve, `B(t) = a*t^3 + b*t^2 + c*t + d`.
struct BKCubicParameters {
  BKPoint a;
  BKPoint b;
  BKPoint c;
  BKPoint d;
};

//! Line, quadratic, or cubic segment.
//!
//! Vertices that are not used by the segment `type` are zero.
struct BKSegment {
  //! Segment type, see \ref BKSegmentType.
  BKSegmentType type;
  //! Segment vertices.
  BKPoint vtx[4];

#ifdef __cplusplus
  //! \name Construction & Destruction
  //! \{

  BK_INLINE_NODEBUG BKSegment() noexcept = default;
  BK_INLINE_NODEBUG BKSegment(const BKSegment&) noexcept = default;

  [[nodiscard]]
  static BK_INLINE_NODEBUG BKSegment line(const BKPoint& p0, const BKPoint& p1) noexcept {
    BKSegment s;
    s.reset(BK_SEGMENT_TYPE_LINE, p0, p1, BKPoint(0, 0), BKPoint(0, 0));
    return s;
  }

  [[nodiscard]]
  static BK_INLINE_NODEBUG BKSegment quad(const BKPoint& p0, const BKPoint& p1, const BKPoint& p2) noexcept {
    BKSegment s;
    s.reset(BK_SEGMENT_TYPE_QUAD, p0, p1, p2, BKPoint(0, 0));
    return s;
  }

  [[nodiscard]]
  static BK_INLINE_NODEBUG BKSegment cubic(const BKPoint& p0, const BKPoint& p1, const BKPoint& p2, const BKPoint& p3) noexcept {
    BKSegment s;
    s.reset(BK_SEGMENT_TYPE_CUBIC, p0, p1, p2, p3);
    return s;
  }

  //! \}

  //! \name Overloaded Operators
  //! \{

  BK_INLINE_NODEBUG BKSegment& operator=(const BKSegment& other) noexcept = default;

  [[nodiscard]]
  BK_INLINE_NODEBUG bool operator==(const BKSegment& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  BK_INLINE_NODEBUG bool operator!=(const BKSegment& other) const noexcept { return !equals(other); }

  //! \}

  //! \name Common Functionality
  //! \{

  BK_INLINE_NODEBUG void reset() noexcept { reset(BK_SEGMENT_TYPE_NONE, BKPoint(0, 0), BKPoint(0, 0), BKPoint(0, 0), BKPoint(0, 0)); }

  BK_INLINE_NODEBUG void reset(BKSegmentType type_value, const BKPoint& p0, const BKPoint& p1, const BKPoint& p2, const BKPoint& p3) noexcept {
    type = type_value;
    vtx[0] = p0;
    vtx[1] = p1;
    vtx[2] = p2;
    vtx[3] = p3;
  }

  //! Tests whether two segments have the same type and the same vertices.
  [[nodiscard]]
  BK_INLINE bool equals(const BKSegment& other) const noexcept {
    if (type != other.type)
      return false;

    uint32_t n = vertex_count();
    for (uint32_t i = 0; i < n; i++)
      if (vtx[i] != other.vtx[i])
        return false;
    return true;
  }

  //! \}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  BK_INLINE_NODEBUG uint32_t vertex_count() const noexcept { return bk_segment_vertex_count(type); }

  [[nodiscard]]
  BK_INLINE_NODEBUG const BKPoint& first() const noexcept { return vtx[0]; }

  [[nodiscard]]
  BK_INLINE_NODEBUG const BKPoint& last() const noexcept { return vtx[vertex_count() - 1u]; }

  //! \}

  //! \name Geometry
  //! \{

  BK_INLINE_NODEBUG BKResult bounds(BKBox* box_out) const noexcept { return bk_segment_bounds(this, box_out); }
  BK_INLINE_NODEBUG BKResult split(double where, BKAxis axis, BKSegmentSplit* out) const noexcept { return bk_segment_split(this, where, axis, out); }
  BK_INLINE_NODEBUG BKResult point_at(double t, BKPoint* out) const noexcept { return bk_segment_point_at(this, t, out); }

  //! \}
#endif
};

//! Result of a split operation - up to `BK_RUNTIME_MAX_SPLIT_COUNT` segments ordered by curve parameter.
struct BKSegmentSplit {
  //! Number of segments in `data`.
  size_t size;
  //! Segments produced by the split.
  BKSegment data[BK_RUNTIME_MAX_SPLIT_COUNT];

#ifdef __cplusplus
  BK_INLINE_NODEBUG void reset() noexcept { size = 0; }

  [[nodiscard]]
  BK_INLINE_NODEBUG bool is_empty() const noexcept { return size == 0; }

  [[nodiscard]]
  BK_INLINE const BKSegment& operator[](size_t index) const noexcept {
    BK_ASSERT(index < size);
    return data[index];
  }

  [[nodiscard]]
  BK_INLINE_NODEBUG const BKSegment* begin() const noexcept { return data; }

  [[nodiscard]]
  BK_INLINE_NODEBUG const BKSegment* end() const noexcept { return data + size; }
#endif
};

//! \}
//! \}

#endif // BEZKIT_CORE_SEGMENT_H_INCLUDED
