#pragma once

#include <cstddef>
#include <type_traits>

namespace aoc23 {

  /** @brief STL allocator which aligns every allocation to `Alignment` bytes.
   *
   * The allocated size is rounded up to a multiple of the alignment, plus one extra block of
   * `Alignment` bytes. A vector load starting at any element of the container therefore never
   * touches memory outside of the allocation.
   */
  template <class T, size_t Alignment>
  struct aligned_allocator {
   public:
    static_assert((Alignment & (Alignment - 1)) == 0, "Alignment must be power of 2");
    static_assert(Alignment >= alignof(T), "Alignment must be at least alignof(T)");

    using value_type = T;
    using size_type = size_t;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;
    using is_always_equal = std::true_type;

    static constexpr size_t alignment = Alignment;

    template <typename U>
    struct rebind {
      using other = aligned_allocator<U, Alignment>;
    };

    aligned_allocator() = default;

    template <class U>
      requires(!std::is_same_v<T, U>)
    aligned_allocator(aligned_allocator<U, Alignment> const &) noexcept {}

    T * allocate(size_type n);
    void deallocate(T * ptr, size_type) noexcept;

    /// @brief Number of bytes actually reserved when allocating `n` elements.
    static constexpr size_t padded_size(size_type n) noexcept {
      size_t const size = (n * sizeof(T) + (Alignment - 1)) / Alignment * Alignment;
      return size + Alignment;
    }
  };

  template <class T, class U, size_t AlignmentLhs, size_t AlignmentRhs>
  constexpr bool operator==(aligned_allocator<T, AlignmentLhs> const &,
                            aligned_allocator<U, AlignmentRhs> const &) noexcept {
    return AlignmentLhs == AlignmentRhs;
  }

}  // namespace aoc23

#include "aoc23/memory.tpp"
