// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_CORE_POLYNOMIAL_H_INCLUDED
#define BEZKIT_CORE_POLYNOMIAL_H_INCLUDED

#include <bezkit/core/api.h>

//! \addtogroup bk_c_api
//! \{

//! \name BKPolynomial - C API
//!
//! Closed-form solvers of quadratic and cubic equations with real coefficients. Only real roots are reported, they
//! are neither sorted nor deduplicated - a double root is reported twice by the quadratic solver.
//!
//! \{

BK_BEGIN_C_DECLS

//! Solves `a*x^2 + b*x + c = 0` and stores up to 2 real roots to `roots_out` and their count to `count_out`.
//!
//! A non-equation (`a == 0 && b == 0`) and an equation with complex roots have no roots, which is not an error.
BK_API BKResult BK_CDECL bk_solve_quadratic(double roots_out[2], size_t* count_out, double a, double b, double c) BK_NOEXCEPT_C;

//! Solves `a*x^3 + b*x^2 + c*x + d = 0` and stores up to 3 real roots to `roots_out` and their count to `count_out`.
//!
//! If `|a| < 1e-6` the equation is solved as a quadratic `b*x^2 + c*x + d = 0`.
BK_API BKResult BK_CDECL bk_solve_cubic(double roots_out[3], size_t* count_out, double a, double b, double c, double d) BK_NOEXCEPT_C;

BK_END_C_DECLS

//! \}
//! \}

//! \addtogroup bk_geometry
//! \{

#ifdef __cplusplus
//! Polynomial solvers (wraps C API).
namespace BKPolynomial {

static BK_INLINE_NODEBUG BKResult solve_quadratic(double roots_out[2], size_t* count_out, double a, double b, double c) noexcept {
  return bk_solve_quadratic(roots_out, count_out, a, b, c);
}

static BK_INLINE_NODEBUG BKResult solve_cubic(double roots_out[3], size_t* count_out, double a, double b, double c, double d) noexcept {
  return bk_solve_cubic(roots_out, count_out, a, b, c, d);
}

} // {BKPolynomial}
#endif

//! \}

#endif // BEZKIT_CORE_POLYNOMIAL_H_INCLUDED
