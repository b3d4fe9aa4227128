// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_CORE_GEOMETRY_H_INCLUDED
#define BEZKIT_CORE_GEOMETRY_H_INCLUDED

#include <bezkit/core/api.h>

//! \addtogroup bk_geometry
//! \{

//! Coordinate axis.
//!
//! Used by split operations to select which coordinate of a point is compared against a threshold. Splitting at
//! `BK_AXIS_Y` means that the threshold is a y coordinate, thus the curve is cut by a horizontal line.
BK_DEFINE_ENUM(BKAxis) {
  //! X axis (split by a vertical line).
  BK_AXIS_X = 0,
  //! Y axis (split by a horizontal line).
  BK_AXIS_Y = 1,

  //! Maximum value of `BKAxis`.
  BK_AXIS_MAX_VALUE = 1

  BK_FORCE_ENUM_UINT32(BK_AXIS)
};

//! Point specified as [x, y] using `double` as a storage type.
struct BKPoint {
  double x;
  double y;

#ifdef __cplusplus
  BK_INLINE_NODEBUG BKPoint() noexcept = default;
  BK_INLINE_CONSTEXPR BKPoint(const BKPoint&) noexcept = default;

  BK_INLINE_CONSTEXPR BKPoint(double x, double y) noexcept
    : x(x),
      y(y) {}

  BK_INLINE_NODEBUG BKPoint& operator=(const BKPoint& other) noexcept = default;

  [[nodiscard]]
  BK_INLINE_NODEBUG bool operator==(const BKPoint& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  BK_INLINE_NODEBUG bool operator!=(const BKPoint& other) const noexcept { return !equals(other); }

  //! Returns the coordinate that belongs to the given `axis`.
  [[nodiscard]]
  BK_INLINE_CONSTEXPR double coord(BKAxis axis) const noexcept { return axis == BK_AXIS_X ? x : y; }

  BK_INLINE_NODEBUG void reset() noexcept { reset(0, 0); }
  BK_INLINE_NODEBUG void reset(const BKPoint& other) noexcept { reset(other.x, other.y); }
  BK_INLINE_NODEBUG void reset(double x_value, double y_value) noexcept {
    x = x_value;
    y = y_value;
  }

  [[nodiscard]]
  BK_INLINE_NODEBUG bool equals(const BKPoint& other) const noexcept {
    return BKInternal::bool_and(bk_equals(x, other.x), bk_equals(y, other.y));
  }
#endif
};

//! Box specified as [x0, y0, x1, y1] using `double` as a storage type.
//!
//! Bounding boxes calculated by Bezkit always have `x0 <= x1` and `y0 <= y1`.
struct BKBox {
  double x0;
  double y0;
  double x1;
  double y1;

#ifdef __cplusplus
  BK_INLINE_NODEBUG BKBox() noexcept = default;
  BK_INLINE_CONSTEXPR BKBox(const BKBox&) noexcept = default;

  BK_INLINE_CONSTEXPR BKBox(double x0, double y0, double x1, double y1) noexcept
    : x0(x0),
      y0(y0),
      x1(x1),
      y1(y1) {}

  BK_INLINE_NODEBUG BKBox& operator=(const BKBox& other) noexcept = default;

  [[nodiscard]]
  BK_INLINE_NODEBUG bool operator==(const BKBox& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  BK_INLINE_NODEBUG bool operator!=(const BKBox& other) const noexcept { return !equals(other); }

  BK_INLINE_NODEBUG void reset() noexcept { reset(0.0, 0.0, 0.0, 0.0); }
  BK_INLINE_NODEBUG void reset(const BKBox& other) noexcept { reset(other.x0, other.y0, other.x1, other.y1); }
  BK_INLINE_NODEBUG void reset(double x0_value, double y0_value, double x1_value, double y1_value) noexcept {
    x0 = x0_value;
    y0 = y0_value;
    x1 = x1_value;
    y1 = y1_value;
  }

  [[nodiscard]]
  BK_INLINE_NODEBUG bool equals(const BKBox& other) const noexcept {
    return BKInternal::bool_and(bk_equals(x0, other.x0),
                                bk_equals(y0, other.y0),
                                bk_equals(x1, other.x1),
                                bk_equals(y1, other.y1));
  }

  [[nodiscard]]
  BK_INLINE_NODEBUG bool contains(const BKPoint& pt) const noexcept {
    return BKInternal::bool_and(pt.x >= x0, pt.y >= y0, pt.x <= x1, pt.y <= y1);
  }
#endif
};

//! \}

//! \addtogroup bk_c_api
//! \{

BK_BEGIN_C_DECLS

//! Calculates a bounding box of `n` points and stores it to `box_out`.
//!
//! Returns `BK_ERROR_INVALID_GEOMETRY` if `n` is zero, in which case `box_out` is not modified.
BK_API BKResult BK_CDECL bk_calc_points_bounds(const BKPoint* points, size_t n, BKBox* box_out) BK_NOEXCEPT_C;

BK_END_C_DECLS

//! \}

#ifdef __cplusplus

//! \name Point & Box Operators
//! \{

static BK_INLINE_CONSTEXPR BKPoint operator-(const BKPoint& a) noexcept { return BKPoint(-a.x, -a.y); }

static BK_INLINE_CONSTEXPR BKPoint operator+(const BKPoint& a, double b) noexcept { return BKPoint(a.x + b, a.y + b); }
static BK_INLINE_CONSTEXPR BKPoint operator-(const BKPoint& a, double b) noexcept { return BKPoint(a.x - b, a.y - b); }
static BK_INLINE_CONSTEXPR BKPoint operator*(const BKPoint& a, double b) noexcept { return BKPoint(a.x * b, a.y * b); }
static BK_INLINE_CONSTEXPR BKPoint operator/(const BKPoint& a, double b) noexcept { return BKPoint(a.x / b, a.y / b); }

static BK_INLINE_CONSTEXPR BKPoint operator*(double a, const BKPoint& b) noexcept { return BKPoint(a * b.x, a * b.y); }

static BK_INLINE_CONSTEXPR BKPoint operator+(const BKPoint& a, const BKPoint& b) noexcept { return BKPoint(a.x + b.x, a.y + b.y); }
static BK_INLINE_CONSTEXPR BKPoint operator-(const BKPoint& a, const BKPoint& b) noexcept { return BKPoint(a.x - b.x, a.y - b.y); }
static BK_INLINE_CONSTEXPR BKPoint operator*(const BKPoint& a, const BKPoint& b) noexcept { return BKPoint(a.x * b.x, a.y * b.y); }
static BK_INLINE_CONSTEXPR BKPoint operator/(const BKPoint& a, const BKPoint& b) noexcept { return BKPoint(a.x / b.x, a.y / b.y); }

static BK_INLINE_NODEBUG BKPoint& operator+=(BKPoint& a, const BKPoint& b) noexcept { a.reset(a.x + b.x, a.y + b.y); return a; }
static BK_INLINE_NODEBUG BKPoint& operator-=(BKPoint& a, const BKPoint& b) noexcept { a.reset(a.x - b.x, a.y - b.y); return a; }
static BK_INLINE_NODEBUG BKPoint& operator*=(BKPoint& a, double b) noexcept { a.reset(a.x * b, a.y * b); return a; }
static BK_INLINE_NODEBUG BKPoint& operator/=(BKPoint& a, double b) noexcept { a.reset(a.x / b, a.y / b); return a; }

//! \}

#endif

#endif // BEZKIT_CORE_GEOMETRY_H_INCLUDED
