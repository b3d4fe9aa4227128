// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_SUPPORT_FIXEDARRAY_P_H_INCLUDED
#define BEZKIT_SUPPORT_FIXEDARRAY_P_H_INCLUDED

#include <bezkit/core/api-internal_p.h>

//! \cond INTERNAL
//! \addtogroup bk_internal
//! \{

namespace bk {

//! Stack storage of at most `N` items - split parameters, extrema evaluated by bounds, and split pieces.
//!
//! `T` must be trivially copyable, items are never constructed or destroyed, only assigned.
template<typename T, size_t N>
class FixedArray {
public:
  static_assert(std::is_trivially_copyable_v<T>, "FixedArray only stores trivially copyable items");

  T _data[N];
  size_t _size = 0;

  BK_INLINE const T& operator[](size_t index) const noexcept {
    BK_ASSERT(index < _size);
    return _data[index];
  }

  BK_INLINE T& operator[](size_t index) noexcept {
    BK_ASSERT(index < _size);
    return _data[index];
  }

  BK_INLINE_NODEBUG size_t size() const noexcept { return _size; }
  BK_INLINE_NODEBUG const T* data() const noexcept { return _data; }

  BK_INLINE_NODEBUG void clear() noexcept { _size = 0; }

  BK_INLINE void append(const T& item) noexcept {
    BK_ASSERT(_size < N);
    _data[_size++] = item;
  }

  //! Inserts `item` before all items greater than it, starting at index `first`. Equal items keep their order.
  BK_INLINE void insert_sorted(const T& item, size_t first = 0) noexcept {
    BK_ASSERT(_size < N);

    size_t i = _size++;
    while (i > first && item < _data[i - 1u]) {
      _data[i] = _data[i - 1u];
      i--;
    }
    _data[i] = item;
  }
};

} // {bk}

//! \}
//! \endcond

#endif // BEZKIT_SUPPORT_FIXEDARRAY_P_H_INCLUDED
