// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_GEOMETRY_COMMONS_P_H_INCLUDED
#define BEZKIT_GEOMETRY_COMMONS_P_H_INCLUDED

#include <bezkit/core/geometry.h>
#include <bezkit/support/math_p.h>

//! \cond INTERNAL
//! \addtogroup bk_geometry
//! \{

namespace bk::Geometry {

//! \name Validity Checks
//! \{

static BK_INLINE_NODEBUG bool is_valid_axis(uint32_t axis) noexcept { return axis <= BK_AXIS_MAX_VALUE; }

static BK_INLINE bool is_valid(const BKBox& box) noexcept { return BKInternal::bool_and(box.x0 <= box.x1, box.y0 <= box.y1); }

//! \}

//! \name Box Operations
//! \{

static BK_INLINE void bound(BKBox& box, const BKPoint& p) noexcept {
  box.reset(bk_min(box.x0, p.x), bk_min(box.y0, p.y),
            bk_max(box.x1, p.x), bk_max(box.y1, p.y));
}

//! Returns a bounding box of `n` points, `n` must be greater than zero.
static BK_INLINE BKBox bounds_of(const BKPoint* points, size_t n) noexcept {
  BK_ASSERT(n > 0);

  BKBox box(points[0].x, points[0].y, points[0].x, points[0].y);
  for (size_t i = 1; i < n; i++)
    bound(box, points[i]);
  return box;
}

//! \}

} // {bk::Geometry}

//! \}
//! \endcond

#endif // BEZKIT_GEOMETRY_COMMONS_P_H_INCLUDED
