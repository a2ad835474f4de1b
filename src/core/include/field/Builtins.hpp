#pragma once
#include "field/Field.hpp"
#include "field/Ops.hpp"
#include "master/Errors.hpp"
#include <algorithm>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

/**
 * @file Builtins.hpp
 * @brief Axis reductions, ``where`` and ``broadcast``.
 *
 * @details
 * ``neighbor_sum``, ``max_over`` and ``min_over`` collapse the first axis equal to
 * ``axis``; the remaining axes keep their order, extents and origins.
 *
 * ``where(mask, a, b)`` selects elementwise; Field and scalar branches are aligned with
 * the mask like any other elementwise op. ``std::tuple`` branches recurse position by
 * position and must have the same arity. The dynamic (:cpp:class:`Value`) form lives in
 * ``field/Value.hpp``.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto edge_sum = neighbor_sum(cell_values(E2C), E2CDim);   // Field over (Edge)
 *   auto clipped  = where(greater(a, 0.0), a, 0.0);
 *   auto both     = where(mask, std::tuple{a, b}, std::tuple{b, a});
 * @endrst
 */

namespace gridflow::field
{

namespace detail
{

template <class T, class Op>
Field<T> reduce_over(const Field<T>& f, const Dimension& axis, bool allow_empty, Op op,
                     const char* what)
{
    const auto ax = axis_index(f.dims(), axis);
    if (!ax)
        throw ShapeError(std::string(what) + ": field over " + to_string(f.dims()) +
                         " has no axis " + to_string(axis));
    const int m = f.extents()[*ax];
    if (m == 0 && !allow_empty)
        throw ShapeError(std::string(what) + ": axis " + to_string(axis) + " is empty");

    Dims dims;
    std::vector<int> ext;
    FieldOptions opt;
    for (std::size_t a = 0; a < f.rank(); ++a)
    {
        if (a == *ax)
            continue;
        dims.push_back(f.dims()[a]);
        ext.push_back(f.extents()[a]);
        opt.origin.emplace_back(f.dims()[a], f.origin()[a]);
    }
    for (const auto& d : f.broadcast_dims())
        if (d != axis)
            opt.broadcast_dims.push_back(d);

    Field<T> out(dims, ext, opt);
    if (out.size() == 0)
        return out;

    std::vector<int> o(out.rank(), 0);
    std::vector<int> fi(f.rank(), 0);
    do
    {
        for (std::size_t a = 0; a < out.rank(); ++a)
            fi[a < *ax ? a : a + 1] = o[a];
        T acc{};
        for (int k = 0; k < m; ++k)
        {
            fi[*ax] = k;
            acc = (k == 0) ? f.local(fi) : op(acc, f.local(fi));
        }
        out.local(o) = acc;
    } while (layout::next_index(o, out.extents()));
    return out;
}

} // namespace detail

template <class T> Field<T> neighbor_sum(const Field<T>& f, const Dimension& axis)
{
    return detail::reduce_over(f, axis, true, [](T a, T b) { return static_cast<T>(a + b); },
                               "neighbor_sum");
}

template <class T> Field<T> max_over(const Field<T>& f, const Dimension& axis)
{
    return detail::reduce_over(f, axis, false, [](T a, T b) { return std::max(a, b); },
                               "max_over");
}

template <class T> Field<T> min_over(const Field<T>& f, const Dimension& axis)
{
    return detail::reduce_over(f, axis, false, [](T a, T b) { return std::min(a, b); },
                               "min_over");
}

template <class T> Field<T> broadcast(const Field<T>& f, Dims dims)
{
    return f.broadcast_to(std::move(dims));
}

template <class S>
    requires std::is_arithmetic_v<S>
Field<S> broadcast(S v, Dims dims)
{
    return Field<S>::scalar(v, std::move(dims));
}

template <FieldOrScalar A, FieldOrScalar B>
auto where(const Field<bool>& mask, const A& a, const B& b)
{
    using R = common_t<A, B>;
    return zip_map<R>([](bool m, R x, R y) { return m ? x : y; }, mask, as_field(a),
                      as_field(b));
}

template <class... A, class... B>
auto where(const Field<bool>& mask, const std::tuple<A...>& a, const std::tuple<B...>& b)
{
    static_assert(sizeof...(A) == sizeof...(B), "where: tuple branches differ in length");
    return [&]<std::size_t... I>(std::index_sequence<I...>)
    { return std::make_tuple(where(mask, std::get<I>(a), std::get<I>(b))...); }(
               std::index_sequence_for<A...>{});
}

} // namespace gridflow::field
