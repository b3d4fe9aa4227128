// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_GEOMETRY_BEZIER_P_H_INCLUDED
#define BEZKIT_GEOMETRY_BEZIER_P_H_INCLUDED

#include <bezkit/core/trace_p.h>
#include <bezkit/geometry/commons_p.h>
#include <bezkit/support/fixedarray_p.h>
#include <bezkit/support/math_p.h>

//! \cond INTERNAL
//! \addtogroup bk_geometry
//! \{

namespace bk::Geometry {

//! \name Line Operations
//!
//! Line Formulas
//! -------------
//!
//! Line Coefficients:
//!
//! ```
//! A = p1 - p0
//! B = p0
//! ```
//!
//! Line Evaluation at `t`:
//!
//! ```
//! V = A*t + B
//! ```
//!
//! \{

template<typename T>
struct Line {
  //! Number of vertices including both start point and end point.
  static constexpr inline uint32_t kVertexCount = 2u;

  //! Maximum number of pieces produced by a split at a coordinate.
  static constexpr inline uint32_t kMaxSplitCount = 2u;

  //! Vertex type.
  using Vertex = T;

  //! \note Not initialized by default to make it possible to use Line in temporary arrays.
  Vertex vtx[kVertexCount];

  BK_INLINE_NODEBUG Line() noexcept = default;

  BK_INLINE_NODEBUG explicit Line(const Vertex* arr) noexcept
    : vtx{arr[0], arr[1]} {}

  BK_INLINE_NODEBUG Line(const Vertex& p0, const Vertex& p1) noexcept
    : vtx{p0, p1} {}

  BK_INLINE_NODEBUG Vertex& operator[](size_t i) noexcept {
    BK_ASSERT(i < kVertexCount);
    return vtx[i];
  }

  BK_INLINE_NODEBUG const Vertex& operator[](size_t i) const noexcept {
    BK_ASSERT(i < kVertexCount);
    return vtx[i];
  }
};

//! Coefficients of a line that can be used to evaluate a line at `t`.
struct LineCoefficients {
  BKPoint a, b;
};

static BK_INLINE LineCoefficients coefficients_of(const Line<BKPoint>& curve) noexcept {
  return LineCoefficients{curve[1] - curve[0], curve[0]};
}

static BK_INLINE BKPoint evaluate(const LineCoefficients& coef, double t) noexcept {
  return coef.a * t + coef.b;
}

static BK_INLINE BKPoint evaluate(const Line<BKPoint>& curve, double t) noexcept {
  return evaluate(coefficients_of(curve), t);
}

static BK_INLINE BKBox bounds_of(const Line<BKPoint>& curve) noexcept {
  return bounds_of(curve.vtx, Line<BKPoint>::kVertexCount);
}

//! \}

//! \name Quadratic Bezier Curve Operations
//!
//! Quadratic Bezier Curve Formulas
//! -------------------------------
//!
//! Quad Coefficients:
//!
//! ```
//! C = p0
//! B = 2*(p1 - C)
//! A = p2 - C - B
//! ```
//!
//! Quad Evaluation at `t`:
//!
//! ```
//! V = A*t^2 + B*t + C => t(A*t + B) + C
//! ```
//!
//! \{

template<typename T>
struct Quad {
  //! Number of vertices including both start point, control point, and end point.
  static constexpr inline uint32_t kVertexCount = 3u;

  //! Maximum number of pieces produced by a split at a coordinate.
  static constexpr inline uint32_t kMaxSplitCount = 3u;

  //! Vertex type.
  using Vertex = T;

  //! Curve data as array (not pointing to vertices elsewhere).
  //!
  //! \note Not initialized by default to make it possible to use Quad in temporary arrays.
  Vertex vtx[kVertexCount];

  BK_INLINE_NODEBUG Quad() noexcept = default;

  BK_INLINE_NODEBUG explicit Quad(const Vertex* arr) noexcept
    : vtx{arr[0], arr[1], arr[2]} {}

  BK_INLINE_NODEBUG Quad(const Vertex& p0, const Vertex& p1, const Vertex& p2) noexcept
    : vtx{p0, p1, p2} {}

  BK_INLINE_NODEBUG Quad(double x0, double y0, double x1, double y1, double x2, double y2) noexcept
    : vtx{BKPoint(x0, y0), BKPoint(x1, y1), BKPoint(x2, y2)} {}

  BK_INLINE_NODEBUG Vertex& operator[](size_t i) noexcept {
    BK_ASSERT(i < kVertexCount);
    return vtx[i];
  }

  BK_INLINE_NODEBUG const Vertex& operator[](size_t i) const noexcept {
    BK_ASSERT(i < kVertexCount);
    return vtx[i];
  }
};

//! Coefficients of a quadratic curve that can be used to evaluate quad curve at `t`.
struct QuadCoefficients {
  BKPoint a, b, c;
};

static BK_INLINE QuadCoefficients coefficients_of(const Quad<BKPoint>& curve) noexcept {
  BKPoint c = curve[0];
  BKPoint b = 2.0 * (curve[1] - c);
  return QuadCoefficients{curve[2] - c - b, b, c};
}

static BK_INLINE BKPoint evaluate(const QuadCoefficients& coef, double t) noexcept {
  return (coef.a * t + coef.b) * t + coef.c;
}

static BK_INLINE BKPoint evaluate(const Quad<BKPoint>& curve, double t) noexcept {
  return evaluate(coefficients_of(curve), t);
}

//! Calculates a tight bounding box of a quadratic curve.
//!
//! The derivative `2A*t + B` has a single root per axis. Roots within [0, 1) are evaluated and bounded together
//! with both end points.
static BK_INLINE BKBox bounds_of(const Quad<BKPoint>& curve) noexcept {
  QuadCoefficients coef = coefficients_of(curve);
  BKPoint da = coef.a * 2.0;

  FixedArray<BKPoint, 4> points;

  if (da.x != 0.0) {
    double t = -coef.b.x / da.x;
    if (Math::is_unit_interval_open_end(t))
      points.append(evaluate(coef, t));
  }

  if (da.y != 0.0) {
    double t = -coef.b.y / da.y;
    if (Math::is_unit_interval_open_end(t))
      points.append(evaluate(coef, t));
  }

  points.append(curve[0]);
  points.append(curve[2]);
  return bounds_of(points.data(), points.size());
}

//! Returns a quadratic curve that covers the parameter range [t1, t2] of a curve described by `coef`.
static BK_INLINE Quad<BKPoint> reparameterize(const QuadCoefficients& coef, double t1, double t2) noexcept {
  double delta = t2 - t1;

  BKPoint a1 = coef.a * Math::square(delta);
  BKPoint b1 = (2.0 * coef.a * t1 + coef.b) * delta;
  BKPoint c1 = coef.a * Math::square(t1) + coef.b * t1 + coef.c;

  return Quad<BKPoint>(c1, b1 * 0.5 + c1, a1 + b1 + c1);
}

//! \}

//! \name Cubic Bezier Curve Operations
//!
//! Cubic Bezier Curve Formulas
//! ---------------------------
//!
//! Cubic Coefficients:
//!
//! ```
//! D = p0
//! C = 3*(p1 - D)
//! B = 3*(p2 - p1) - C
//! A = p3 - D - C - B
//! ```
//!
//! Cubic Evaluation at `t`:
//!
//! ```
//! V = A*t^3 + B*t^2 + C*t + D => t(t(A*t + B) + C) + D
//! ```
//!
//! \{

template<typename T>
struct Cubic {
  //! Number of vertices including both start point, control points, and end point.
  static constexpr inline uint32_t kVertexCount = 4u;

  //! Maximum number of pieces produced by a split at a coordinate.
  static constexpr inline uint32_t kMaxSplitCount = 4u;

  //! Vertex type.
  using Vertex = T;

  //! Curve data as array (not pointing to vertices elsewhere).
  //!
  //! \note Not initialized by default to make it possible to use Cubic in temporary arrays.
  Vertex vtx[kVertexCount];

  BK_INLINE_NODEBUG Cubic() noexcept = default;

  BK_INLINE_NODEBUG explicit Cubic(const Vertex* arr) noexcept
    : vtx{arr[0], arr[1], arr[2], arr[3]} {}

  BK_INLINE_NODEBUG Cubic(const Vertex& p0, const Vertex& p1, const Vertex& p2, const Vertex& p3) noexcept
    : vtx{p0, p1, p2, p3} {}

  BK_INLINE_NODEBUG Cubic(double x0, double y0, double x1, double y1, double x2, double y2, double x3, double y3) noexcept
    : vtx{BKPoint(x0, y0), BKPoint(x1, y1), BKPoint(x2, y2), BKPoint(x3, y3)} {}

  BK_INLINE_NODEBUG Vertex& operator[](size_t i) noexcept {
    BK_ASSERT(i < kVertexCount);
    return vtx[i];
  }

  BK_INLINE_NODEBUG const Vertex& operator[](size_t i) const noexcept {
    BK_ASSERT(i < kVertexCount);
    return vtx[i];
  }
};

//! Coefficients of a cubic curve that can be used to evaluate cubic curve at `t`.
struct CubicCoefficients {
  BKPoint a, b, c, d;
};

static BK_INLINE CubicCoefficients coefficients_of(const Cubic<BKPoint>& curve) noexcept {
  BKPoint d = curve[0];
  BKPoint c = 3.0 * (curve[1] - d);
  BKPoint b = 3.0 * (curve[2] - curve[1]) - c;
  return CubicCoefficients{curve[3] - d - c - b, b, c, d};
}

static BK_INLINE BKPoint evaluate(const CubicCoefficients& coef, double t) noexcept {
  return ((coef.a * t + coef.b) * t + coef.c) * t + coef.d;
}

static BK_INLINE BKPoint evaluate(const Cubic<BKPoint>& curve, double t) noexcept {
  return evaluate(coefficients_of(curve), t);
}

//! Calculates a tight bounding box of a cubic curve.
//!
//! Extrema are roots of the derivative `3A*t^2 + 2B*t + C`, which has up to two roots per axis. Roots of both axes
//! within [0, 1) are evaluated and bounded together with both end points.
static BK_INLINE BKBox bounds_of(const Cubic<BKPoint>& curve) noexcept {
  CubicCoefficients coef = coefficients_of(curve);
  BKPoint da = coef.a * 3.0;
  BKPoint db = coef.b * 2.0;

  FixedArray<BKPoint, 6> points;
  double roots[2];

  size_t n = Math::solve_quadratic(roots, da.x, db.x, coef.c.x);
  for (size_t i = 0; i < n; i++)
    if (Math::is_unit_interval_open_end(roots[i]))
      points.append(evaluate(coef, roots[i]));

  n = Math::solve_quadratic(roots, da.y, db.y, coef.c.y);
  for (size_t i = 0; i < n; i++)
    if (Math::is_unit_interval_open_end(roots[i]))
      points.append(evaluate(coef, roots[i]));

  points.append(curve[0]);
  points.append(curve[3]);
  return bounds_of(points.data(), points.size());
}

//! Returns a cubic curve that covers the parameter range [t1, t2] of a curve described by `coef`.
static BK_INLINE Cubic<BKPoint> reparameterize(const CubicCoefficients& coef, double t1, double t2) noexcept {
  double delta = t2 - t1;

  BKPoint a1 = coef.a * Math::cube(delta);
  BKPoint b1 = (3.0 * coef.a * t1 + coef.b) * Math::square(delta);
  BKPoint c1 = (2.0 * coef.b * t1 + coef.c + 3.0 * coef.a * Math::square(t1)) * delta;
  BKPoint d1 = coef.a * Math::cube(t1) + coef.b * Math::square(t1) + coef.c * t1 + coef.d;

  BKPoint p1 = c1 / 3.0 + d1;
  BKPoint p2 = (b1 + c1) / 3.0 + p1;
  return Cubic<BKPoint>(d1, p1, p2, a1 + d1 + c1 + b1);
}

//! \}

//! \name Splitting at Coordinate
//!
//! Splitting finds parameters `t` at which the `axis` coordinate of a curve equals `where`. Parameters within
//! [0, 1) are sorted and bracketed by 0 and 1, each consecutive pair then describes one output piece. Repeated
//! roots are kept, thus a curve that touches the split line produces a degenerate (single point) piece. Pieces
//! concatenated in parameter order reconstruct the original curve.
//!
//! \{

//! Split parameters - 0, up to 3 roots, and 1.
using SplitParameters = FixedArray<double, 5>;

//! Filters `roots` to [0, 1), sorts them, and brackets them by 0 and 1. Returns the number of accepted roots.
template<typename Trace>
static BK_INLINE size_t bracket_split_parameters(SplitParameters& ts, const double* roots, size_t n, Trace& trace) noexcept {
  ts.clear();
  ts.append(0.0);

  for (size_t i = 0; i < n; i++) {
    double t = roots[i];
    bool accepted = Math::is_unit_interval_open_end(t);

    trace.root(t, accepted);
    if (accepted)
      ts.insert_sorted(t, 1);
  }

  size_t accepted_count = ts.size() - 1u;
  ts.append(1.0);
  return accepted_count;
}

//! Splits a line at the given `axis` coordinate `where`.
template<typename Trace = BKDummyTrace>
static BK_INLINE void split_at_coordinate(
  const Line<BKPoint>& curve,
  double where, BKAxis axis,
  FixedArray<Line<BKPoint>, Line<BKPoint>::kMaxSplitCount>& out,
  Trace trace = Trace()) noexcept {

  out.clear();
  trace.split("line", axis, where);

  LineCoefficients coef = coefficients_of(curve);
  double a = coef.a.coord(axis);

  if (a == 0.0) {
    trace.parallel();
    out.append(curve);
    return;
  }

  double t = (where - coef.b.coord(axis)) / a;
  bool accepted = Math::is_unit_interval_open_end(t);

  trace.root(t, accepted);
  if (!accepted) {
    out.append(curve);
    return;
  }

  BKPoint mid = evaluate(coef, t);
  out.append(Line<BKPoint>(curve[0], mid));
  out.append(Line<BKPoint>(mid, curve[1]));
}

//! Splits a quadratic curve at the given `axis` coordinate `where`.
template<typename Trace = BKDummyTrace>
static BK_INLINE void split_at_coordinate(
  const Quad<BKPoint>& curve,
  double where, BKAxis axis,
  FixedArray<Quad<BKPoint>, Quad<BKPoint>::kMaxSplitCount>& out,
  Trace trace = Trace()) noexcept {

  out.clear();
  trace.split("quad", axis, where);

  QuadCoefficients coef = coefficients_of(curve);

  double roots[2];
  size_t n = Math::solve_quadratic(roots, coef.a.coord(axis), coef.b.coord(axis), coef.c.coord(axis) - where);

  SplitParameters ts;
  if (!bracket_split_parameters(ts, roots, n, trace)) {
    out.append(curve);
    return;
  }

  for (size_t i = 0; i + 1 < ts.size(); i++)
    out.append(reparameterize(coef, ts[i], ts[i + 1]));
}

//! Splits a cubic curve at the given `axis` coordinate `where`.
template<typename Trace = BKDummyTrace>
static BK_INLINE void split_at_coordinate(
  const Cubic<BKPoint>& curve,
  double where, BKAxis axis,
  FixedArray<Cubic<BKPoint>, Cubic<BKPoint>::kMaxSplitCount>& out,
  Trace trace = Trace()) noexcept {

  out.clear();
  trace.split("cubic", axis, where);

  CubicCoefficients coef = coefficients_of(curve);

  double roots[3];
  size_t n = Math::solve_cubic(roots, coef.a.coord(axis), coef.b.coord(axis), coef.c.coord(axis), coef.d.coord(axis) - where);

  SplitParameters ts;
  if (!bracket_split_parameters(ts, roots, n, trace)) {
    out.append(curve);
    return;
  }

  for (size_t i = 0; i + 1 < ts.size(); i++)
    out.append(reparameterize(coef, ts[i], ts[i + 1]));
}

//! \}

} // {bk::Geometry}

//! \}
//! \endcond

#endif // BEZKIT_GEOMETRY_BEZIER_P_H_INCLUDED
