#pragma once
#include <cstddef>
#include <span>
#include <vector>

/**
 * @file Layout.hpp
 * @brief Strided N-d indexing shared by every Field view.
 *
 * Storage is first-axis-fastest (the 3-D rule ``(k*ny + j)*nx + i`` generalized to N
 * axes). A view carries its own extents, element strides and base offset, so slices,
 * axis shifts and broadcasts never move data.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto L = layout::Strided::packed({4, 3});   // strides {1, 4}
 *   std::size_t p = L({2, 1});                  // 2 + 1*4 = 6
 * @endrst
 */

namespace gridflow::layout
{

struct Strided
{
    std::vector<int> extents;
    std::vector<std::ptrdiff_t> strides; // in elements
    std::ptrdiff_t offset{0};

    static Strided packed(std::vector<int> e)
    {
        Strided L;
        L.strides.resize(e.size());
        std::ptrdiff_t s = 1;
        for (std::size_t a = 0; a < e.size(); ++a)
        {
            L.strides[a] = s;
            s *= e[a];
        }
        L.extents = std::move(e);
        return L;
    }

    std::size_t rank() const noexcept { return extents.size(); }

    std::size_t volume() const noexcept
    {
        std::size_t n = 1;
        for (int e : extents)
            n *= static_cast<std::size_t>(e);
        return n;
    }

    // 0-based local index -> linear element position
    inline std::ptrdiff_t operator()(std::span<const int> local) const noexcept
    {
        std::ptrdiff_t p = offset;
        for (std::size_t a = 0; a < local.size(); ++a)
            p += static_cast<std::ptrdiff_t>(local[a]) * strides[a];
        return p;
    }
};

// Odometer over [0, extents) with axis 0 fastest. Returns false after the last index.
inline bool next_index(std::vector<int>& idx, std::span<const int> extents) noexcept
{
    for (std::size_t a = 0; a < idx.size(); ++a)
    {
        if (++idx[a] < extents[a])
            return true;
        idx[a] = 0;
    }
    return false;
}

} // namespace gridflow::layout
