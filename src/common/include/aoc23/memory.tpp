#pragma once

#include "aoc23/memory.hpp"  // Enable IDE syntax highlighting.

#include <cassert>
#include <cstdlib>
#include <new>

namespace aoc23 {

  template <class T, size_t Alignment>
  T * aligned_allocator<T, Alignment>::allocate(size_type n) {
    size_t const size = padded_size(n);
    assert(size % Alignment == 0);

    void * ptr = std::aligned_alloc(Alignment, size);
    if (!ptr) {
      throw std::bad_alloc();
    }
    return static_cast<T *>(ptr);
  }

  template <class T, size_t Alignment>
  void aligned_allocator<T, Alignment>::deallocate(T * ptr, size_type) noexcept {
    std::free(ptr);
  }

}  // namespace aoc23
