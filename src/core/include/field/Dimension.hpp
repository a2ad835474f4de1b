#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file Dimension.hpp
 * @brief Named, kinded logical axis tags.
 *
 * @details
 * A :cpp:class:`Dimension` identifies an axis of a Field by name and kind. Two dimensions
 * are equal iff both match. ``Local`` dimensions denote a neighbor slot (e.g. the second
 * axis produced by an ``E2C`` gather), not a mesh axis.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   const Dimension Cell{"Cell"};
 *   const Dimension K{"K", DimensionKind::Vertical};
 *   const Dimension E2CDim{"E2C", DimensionKind::Local};
 * @endrst
 */

namespace gridflow::field
{

enum class DimensionKind
{
    Horizontal,
    Vertical,
    Local
};

class Dimension
{
  public:
    Dimension() = default;
    explicit Dimension(std::string name, DimensionKind kind = DimensionKind::Horizontal)
        : name_(std::move(name)), kind_(kind)
    {
    }

    const std::string& name() const noexcept { return name_; }
    DimensionKind kind() const noexcept { return kind_; }
    bool is_local() const noexcept { return kind_ == DimensionKind::Local; }

    friend bool operator==(const Dimension& a, const Dimension& b) noexcept
    {
        return a.kind_ == b.kind_ && a.name_ == b.name_;
    }
    friend bool operator!=(const Dimension& a, const Dimension& b) noexcept { return !(a == b); }

  private:
    std::string name_;
    DimensionKind kind_ = DimensionKind::Horizontal;
};

using Dims = std::vector<Dimension>;

const char* to_string(DimensionKind k) noexcept;
std::string to_string(const Dimension& d);
std::string to_string(std::span<const Dimension> dims); // "(Cell, K)"

std::ostream& operator<<(std::ostream& os, const Dimension& d);

// First axis equal to d, if any.
inline std::optional<std::size_t> axis_index(std::span<const Dimension> dims, const Dimension& d)
{
    for (std::size_t i = 0; i < dims.size(); ++i)
        if (dims[i] == d)
            return i;
    return std::nullopt;
}

inline bool contains(std::span<const Dimension> dims, const Dimension& d)
{
    return axis_index(dims, d).has_value();
}

// true iff every element of sub appears in super
inline bool is_subset(std::span<const Dimension> sub, std::span<const Dimension> super)
{
    for (const auto& d : sub)
        if (!contains(super, d))
            return false;
    return true;
}

bool has_duplicates(std::span<const Dimension> dims);

// Order-preserving union: a, then the entries of b not already present.
Dims merge_dims(std::span<const Dimension> a, std::span<const Dimension> b);

} // namespace gridflow::field

template <> struct std::hash<gridflow::field::Dimension>
{
    std::size_t operator()(const gridflow::field::Dimension& d) const noexcept
    {
        return std::hash<std::string>{}(d.name()) * 31u + static_cast<std::size_t>(d.kind());
    }
};
