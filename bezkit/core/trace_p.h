// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_CORE_TRACE_P_H_INCLUDED
#define BEZKIT_CORE_TRACE_P_H_INCLUDED

#include <bezkit/core/api-internal_p.h>
#include <bezkit/core/geometry.h>

//! \cond INTERNAL
//! \addtogroup bk_internal
//! \{

// Split Traces
// ============
//
// Split operations report what they do through a trace passed as a template parameter. The trace receives the
// requested cut first and then every candidate parameter together with the decision made about it:
//
//   Split quad at y=25
//     Root t=0.14644660940672621 accepted
//     Root t=0.85355339059327373 accepted

//! Split trace that does nothing, used by default.
class BKDummyTrace {
public:
  BK_INLINE_NODEBUG void split(const char*, BKAxis, double) noexcept {}
  BK_INLINE_NODEBUG void root(double, bool) noexcept {}
  BK_INLINE_NODEBUG void parallel() noexcept {}
};

//! Split trace that writes to the runtime message sink.
class BKDebugTrace {
public:
  //! Traces a split of a `kind` segment ("line", "quad", or "cubic") at `axis` coordinate `where`.
  BK_HIDDEN void split(const char* kind, BKAxis axis, double where) noexcept;
  //! Traces a candidate parameter `t` and whether it produces a cut.
  BK_HIDDEN void root(double t, bool accepted) noexcept;
  //! Traces a line that never crosses the split line (the split coordinate doesn't change along it).
  BK_HIDDEN void parallel() noexcept;
};

//! Trace used by the split C API, see `BK_TRACE_SPLIT`.
#if defined(BK_TRACE_SPLIT)
typedef BKDebugTrace BKSplitTrace;
#else
typedef BKDummyTrace BKSplitTrace;
#endif

//! \}
//! \endcond

#endif // BEZKIT_CORE_TRACE_P_H_INCLUDED
