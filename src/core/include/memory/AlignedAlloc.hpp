#pragma once
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <new>

/**
 * @file AlignedAlloc.hpp
 * @ingroup memory
 * @brief Aligned host allocation for field storage.
 *
 * Provides \c aligned_malloc(bytes, alignment) and \c aligned_free(ptr) plus
 * \c make_shared_buffer<T>(n), the shared, zero-initialized block every Field view
 * points into. Blocks are 64-byte aligned (cache line / SIMD width).
 */

namespace gridflow::memory
{

inline constexpr std::size_t HW_ALIGN = 64;

inline void* aligned_malloc(std::size_t bytes, std::size_t alignment = HW_ALIGN)
{
#if defined(_MSC_VER)
    void* p = _aligned_malloc(bytes, alignment);
    if (!p)
        throw std::bad_alloc{};
    return p;
#else
    // std::aligned_alloc requires size multiple of alignment
    if (alignment == 0 || (alignment & (alignment - 1)) != 0)
        alignment = HW_ALIGN;
    std::size_t padded = ((bytes + alignment - 1) / alignment) * alignment;
    if (padded == 0)
        padded = alignment;
    void* p = std::aligned_alloc(alignment, padded);
    if (!p)
        throw std::bad_alloc{};
    return p;
#endif
}

inline void aligned_free(void* p) noexcept
{
#if defined(_MSC_VER)
    _aligned_free(p);
#else
    std::free(p);
#endif
}

// Shared block of n value-initialized T. T must be trivially destructible.
template <class T> std::shared_ptr<T> make_shared_buffer(std::size_t n)
{
    auto* p = static_cast<T*>(aligned_malloc(n * sizeof(T)));
    for (std::size_t i = 0; i < n; ++i)
        ::new (static_cast<void*>(p + i)) T{};
    return std::shared_ptr<T>(p, [](T* q) { aligned_free(q); });
}

} // namespace gridflow::memory
