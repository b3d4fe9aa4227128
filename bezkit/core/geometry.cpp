// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <bezkit/core/api-build_p.h>
#include <bezkit/core/geometry.h>
#include <bezkit/geometry/commons_p.h>

// BKGeometry - API - Bounds
// =========================

BK_API_IMPL BKResult bk_calc_points_bounds(const BKPoint* points, size_t n, BKBox* box_out) noexcept {
  if (BK_UNLIKELY(!box_out))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  if (BK_UNLIKELY(!n))
    return bk_make_error(BK_ERROR_INVALID_GEOMETRY);

  if (BK_UNLIKELY(!points))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  *box_out = bk::Geometry::bounds_of(points, n);
  return BK_SUCCESS;
}
