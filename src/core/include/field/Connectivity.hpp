#pragma once
#include "field/Dimension.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @file Connectivity.hpp
 * @brief Neighbor tables and the named offsets that consume them.
 *
 * @details
 * A :cpp:class:`Connectivity` links the ``source`` axis of a field (the elements being
 * read, e.g. ``Cell``) to a ``target`` axis (the elements of the result, e.g. ``Edge``).
 * Row ``r`` of the table lists, for target element ``r`` (1-based), up to
 * ``max_neighbors`` 1-based source indices. :cpp:var:`kNoNeighbor` (0) marks an empty
 * slot; negative entries are illegal.
 *
 * A :cpp:class:`FieldOffset` names a connectivity (or a plain axis) in the active
 * offset provider. ``offset[i]`` selects neighbor slot ``i``.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   const FieldOffset E2C{"E2C", Cell, {Edge, E2CDim}};
 *   Connectivity e2c(table, Cell, Edge, 2);   // table: 12 rows x 2 slots
 *   auto per_edge = cell_values(E2C[1]);       // Field over (Edge)
 *   auto both     = cell_values(E2C);          // Field over (Edge, E2CDim)
 * @endrst
 */

namespace gridflow::field
{

inline constexpr std::int32_t kNoNeighbor = 0;

class Connectivity
{
  public:
    using Table = std::vector<std::vector<std::int32_t>>;

    // Rows must all be max_neighbors wide.
    Connectivity(const Table& table, Dimension source, Dimension target, int max_neighbors);

    const Dimension& source() const noexcept { return source_; }
    const Dimension& target() const noexcept { return target_; }
    int max_neighbors() const noexcept { return max_neighbors_; }
    int rows() const noexcept { return rows_; }

    // row, slot are 1-based
    std::int32_t at(int row, int slot) const
    {
        return data_[static_cast<std::size_t>(row - 1) * static_cast<std::size_t>(max_neighbors_) +
                     static_cast<std::size_t>(slot - 1)];
    }

  private:
    std::vector<std::int32_t> data_; // row-major rows x max_neighbors
    Dimension source_;
    Dimension target_;
    int max_neighbors_{0};
    int rows_{0};
};

struct NeighborSlot;

class FieldOffset
{
  public:
    // Every target after the first must be a Local dimension.
    FieldOffset(std::string name, Dimension source, Dims target);
    FieldOffset(std::string name, Dimension source, Dimension target)
        : FieldOffset(std::move(name), std::move(source), Dims{std::move(target)})
    {
    }

    const std::string& name() const noexcept { return name_; }
    const Dimension& source() const noexcept { return source_; }
    const Dims& target() const noexcept { return target_; }

    NeighborSlot operator[](int slot) const;

  private:
    std::string name_;
    Dimension source_;
    Dims target_;
};

// A FieldOffset restricted to one neighbor slot (1-based).
struct NeighborSlot
{
    FieldOffset offset;
    int slot;
};

inline NeighborSlot FieldOffset::operator[](int slot) const
{
    return NeighborSlot{*this, slot};
}

} // namespace gridflow::field
