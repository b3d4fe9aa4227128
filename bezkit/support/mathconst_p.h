// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_SUPPORT_MATHCONST_P_H_INCLUDED
#define BEZKIT_SUPPORT_MATHCONST_P_H_INCLUDED

#include <bezkit/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup bk_support
//! \{

namespace bk {
namespace Math {

//! \name Math Constants
//! \{

static constexpr double kPI_MUL_2      = 6.28318530717958647692;  //!< pi * 2.
static constexpr double kPI_MUL_4      = 12.5663706143591729538;  //!< pi * 4.

//! Magnitude of the leading coefficient under which a cubic equation is solved as a quadratic one.
//!
//! The trigonometric and Cardano formulas divide by the leading coefficient, thus values close to zero produce
//! roots that are not reliable. A quadratic built from the remaining coefficients is a better approximation.
static constexpr double kCUBIC_EPSILON = 1e-6;

//! \}

} // {Math}
} // {bk}

//! \}
//! \endcond

#endif // BEZKIT_SUPPORT_MATHCONST_P_H_INCLUDED
