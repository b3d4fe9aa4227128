// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <bezkit/core/api-build_p.h>
#include <bezkit/core/runtime.h>
#include <bezkit/core/trace_p.h>

// BKDebugTrace - Split
// ====================

void BKDebugTrace::split(const char* kind, BKAxis axis, double where) noexcept {
  bk_runtime_message_fmt("Split %s at %c=%.17g\n", kind, axis == BK_AXIS_X ? 'x' : 'y', where);
}

void BKDebugTrace::root(double t, bool accepted) noexcept {
  bk_runtime_message_fmt("  Root t=%.17g %s\n", t, accepted ? "accepted" : "rejected");
}

void BKDebugTrace::parallel() noexcept {
  bk_runtime_message_out("  Line is parallel to the split line\n");
}
