#pragma once
#include "field/Connectivity.hpp"
#include "field/Field.hpp"
#include "master/Errors.hpp"
#include "master/OffsetProvider.hpp"
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

/**
 * @file Transform.hpp
 * @brief Neighbor transforms: axis shift and connectivity gather.
 *
 * @details
 * ``field(offset)`` resolves ``offset.name()`` in the offset provider:
 *
 * - a **Dimension** shifts that axis: its origin grows by the slot (1 without a slot).
 *   Fields without that axis are returned unchanged. Storage is shared.
 * - a **Connectivity** gathers: the source axis is replaced by the offset's targets
 *   (``(Edge, E2CDim)`` for the full table, ``(Edge)`` for one slot). Empty slots yield
 *   ``T{}``. Every table entry is validated before the result is allocated.
 *
 * Cost of a gather is O(size(result)); the input is never aliased.
 */

namespace gridflow::field
{

template <class T> Field<T> shift_axis(const Field<T>& f, const Dimension& axis, int by)
{
    const auto ax = axis_index(f.dims(), axis);
    if (!ax)
        return f;
    return f.with_origin(*ax, f.origin()[*ax] + by);
}

template <class T>
Field<T> gather(const Field<T>& f, const FieldOffset& off, const Connectivity& conn,
                std::optional<int> slot)
{
    if (conn.source() != off.source() || conn.target() != off.target().front())
        throw ConnectivityError("Source or target dimensions of Connectivity " + off.name() +
                                " (" + to_string(conn.source()) + "->" +
                                to_string(conn.target()) + ") do not match the offset (" +
                                to_string(off.source()) + "->" + to_string(off.target()) + ")");
    const auto ax = axis_index(f.dims(), off.source());
    if (!ax)
        throw ShapeError("Field over " + to_string(f.dims()) + " has no axis " +
                         to_string(off.source()) + " for offset " + off.name());
    if (slot && (*slot < 1 || *slot > conn.max_neighbors()))
        throw IndexError("Neighbor slot " + std::to_string(*slot) + " of " + off.name() +
                         " out of range 1:" + std::to_string(conn.max_neighbors()));
    if (!slot && off.target().size() != 2)
        throw ShapeError("Offset " + off.name() +
                         " needs exactly one local target dimension for a full gather");

    const int s_lo = slot ? *slot : 1;
    const int s_hi = slot ? *slot : conn.max_neighbors();
    const AxisRange src = f.range(*ax);
    for (int r = 1; r <= conn.rows(); ++r)
        for (int s = s_lo; s <= s_hi; ++s)
        {
            const auto v = conn.at(r, s);
            if (v == kNoNeighbor)
                continue;
            if (v < 0)
                throw ConnectivityError("Illegal index " + std::to_string(v) +
                                        " in Connectivity " + off.name() + " at row " +
                                        std::to_string(r));
            if (!src.contains(v))
                throw IndexError("Indices of Connectivity " + off.name() +
                                 " are out of range for the called field: " +
                                 std::to_string(v) + " not in " + std::to_string(src.lo) + ":" +
                                 std::to_string(src.hi));
        }

    // result layout: axes before, new target axes, axes after
    const std::size_t n_new = slot ? 1 : 2;
    Dims dims;
    std::vector<int> ext;
    FieldOptions opt;
    for (std::size_t a = 0; a < f.rank(); ++a)
    {
        if (a == *ax)
        {
            dims.push_back(off.target()[0]);
            ext.push_back(conn.rows());
            if (!slot)
            {
                dims.push_back(off.target()[1]);
                ext.push_back(conn.max_neighbors());
            }
            continue;
        }
        dims.push_back(f.dims()[a]);
        ext.push_back(f.extents()[a]);
        opt.origin.emplace_back(f.dims()[a], f.origin()[a]);
    }
    if (has_duplicates(dims))
        throw ShapeError("Gather via " + off.name() + " would produce duplicate dims " +
                         to_string(dims));

    Field<T> out(dims, ext, opt);
    if (out.size() == 0)
        return out;

    std::vector<int> o(out.rank(), 0);
    std::vector<int> fi(f.rank(), 0);
    do
    {
        for (std::size_t a = 0; a < *ax; ++a)
            fi[a] = o[a];
        for (std::size_t a = *ax + 1; a < f.rank(); ++a)
            fi[a] = o[a + n_new - 1];
        const int row = o[*ax] + 1;
        const int s = slot ? *slot : o[*ax + 1] + 1;
        const auto v = conn.at(row, s);
        if (v == kNoNeighbor)
        {
            out.local(o) = T{};
            continue;
        }
        fi[*ax] = v - src.lo;
        out.local(o) = f.local(fi);
    } while (layout::next_index(o, out.extents()));
    return out;
}

template <class T>
Field<T> transform(const Field<T>& f, const master::OffsetProvider& provider,
                   const FieldOffset& off, std::optional<int> slot)
{
    const auto& entry = provider.at(off.name());
    return std::visit(
        [&](const auto& e) -> Field<T>
        {
            using E = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<E, Dimension>)
                return shift_axis(f, e, slot.value_or(1));
            else
                return gather(f, off, e, slot);
        },
        entry);
}

template <class T> Field<T> Field<T>::operator()(const FieldOffset& off) const
{
    return transform(*this, master::require_offset_provider(), off, std::nullopt);
}

template <class T> Field<T> Field<T>::operator()(const NeighborSlot& s) const
{
    return transform(*this, master::require_offset_provider(), s.offset, s.slot);
}

} // namespace gridflow::field
