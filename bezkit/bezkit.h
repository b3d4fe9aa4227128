// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// SPDX-License-Identifier: Zlib
// Official GitHub Repository: https://github.com/bezkit/bezkit
//
// Copyright (c) 2024-2026 The Bezkit Authors
//
// This software is provided 'as-is', without any express or implied
// warranty. In no event will the authors be held liable for any damages
// arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose,
// including commercial applications, and to alter it and redistribute it
// freely, subject to the following restrictions:
//
// 1. The origin of this software must not be misrepresented; you must not
//    claim that you wrote the original software. If you use this software
//    in a product, an acknowledgment in the product documentation would be
//    appreciated but is not required.
// 2. Altered source versions must be plainly marked as such, and must not be
//    misrepresented as being the original software.
// 3. This notice may not be removed or altered from any source distribution.

// ----------------------------------------------------------------------------
// This is a public header file designed to be used by Bezkit users. It
// includes all the necessary files required to use Bezkit library from both
// C and C++ and it's the only header that is guaranteed to always be provided.
//
// Never include directly header files placed in "bezkit/" directory. Headers
// that end with "_p" suffix are private and should never be included - they
// are not part of the public API and they are not installed.
// ----------------------------------------------------------------------------

#ifndef BEZKIT_H_INCLUDED
#define BEZKIT_H_INCLUDED

#if defined(_MSC_VER)
  #pragma warning(push)
  #pragma warning(disable: 4201) // Nameless struct/union.
#endif

#include <bezkit/core/api.h>
#include <bezkit/core/geometry.h>
#include <bezkit/core/polynomial.h>
#include <bezkit/core/runtime.h>
#include <bezkit/core/segment.h>

#if defined(_MSC_VER)
  #pragma warning(pop)
#endif

#endif // BEZKIT_H_INCLUDED
