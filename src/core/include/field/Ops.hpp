#pragma once
#include "field/Field.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file Ops.hpp
 * @brief Elementwise Field arithmetic with dimension-aware broadcasting.
 *
 * @details
 * Operands are aligned **by dimension and by external index**: the result spans the
 * union of the operand dims (first-seen order) and, on every axis, the intersection of
 * the operand ranges. Operands lacking an axis are broadcast along it; scalars are
 * rank-0 Fields. So ``a + a(Koff[1])`` pairs ``a[k]`` with ``a[k-1]`` over the overlap.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto c = a + 2.0 * b;                                 // Field<double>
 *   auto m = greater(a, 0.0);                             // Field<bool>
 *   auto s = map(a, [](double x) { return std::sin(x); });
 * @endrst
 */

namespace gridflow::field
{

template <class X> struct is_field : std::false_type
{
};
template <class T> struct is_field<Field<T>> : std::true_type
{
};
template <class X> inline constexpr bool is_field_v = is_field<std::decay_t<X>>::value;

template <class X>
concept FieldOrScalar = is_field_v<X> || std::is_arithmetic_v<std::decay_t<X>>;

template <class X> struct element
{
    using type = std::decay_t<X>;
};
template <class T> struct element<Field<T>>
{
    using type = T;
};
template <class X> using element_t = typename element<std::decay_t<X>>::type;

template <class X> auto as_field(const X& x)
{
    if constexpr (is_field_v<X>)
        return x;
    else
        return Field<std::decay_t<X>>::scalar(x);
}

namespace detail
{

struct Plan
{
    Dims dims;
    Dims broadcast_dims;
    std::vector<AxisRange> ranges;
};

template <class... Ts> Plan plan_for(const Field<Ts>&... fs)
{
    Plan P;
    auto add_dims = [&](const auto& f)
    {
        P.dims = merge_dims(P.dims, f.dims());
        P.broadcast_dims = merge_dims(P.broadcast_dims, f.broadcast_dims());
    };
    (add_dims(fs), ...);
    P.broadcast_dims = merge_dims(P.broadcast_dims, P.dims);

    P.ranges.assign(P.dims.size(), AxisRange{});
    std::vector<bool> seen(P.dims.size(), false);
    auto clip = [&](const auto& f)
    {
        for (std::size_t a = 0; a < f.rank(); ++a)
        {
            const std::size_t ra = *axis_index(P.dims, f.dims()[a]);
            const AxisRange r = f.range(a);
            if (!seen[ra])
            {
                P.ranges[ra] = r;
                seen[ra] = true;
                continue;
            }
            P.ranges[ra].lo = std::max(P.ranges[ra].lo, r.lo);
            P.ranges[ra].hi = std::min(P.ranges[ra].hi, r.hi);
            if (P.ranges[ra].hi < P.ranges[ra].lo)
                P.ranges[ra].hi = P.ranges[ra].lo - 1; // empty overlap
        }
    };
    (clip(fs), ...);
    return P;
}

// Reads one operand at a result index.
template <class T> class Reader
{
  public:
    Reader(const Field<T>& f, const Plan& P)
        : f_(f), axis_(f.rank()), shift_(f.rank()), idx_(f.rank())
    {
        for (std::size_t a = 0; a < f.rank(); ++a)
        {
            axis_[a] = *axis_index(P.dims, f.dims()[a]);
            shift_[a] = P.ranges[axis_[a]].lo - f.range(a).lo;
        }
    }

    T operator()(const std::vector<int>& o)
    {
        for (std::size_t a = 0; a < axis_.size(); ++a)
            idx_[a] = o[axis_[a]] + shift_[a];
        return f_.local(idx_);
    }

  private:
    const Field<T>& f_;
    std::vector<std::size_t> axis_;
    std::vector<int> shift_;
    std::vector<int> idx_;
};

} // namespace detail

// result[i] = fn(fs[i]...) over the aligned domain
template <class R, class F, class... Ts> Field<R> zip_map(F&& fn, const Field<Ts>&... fs)
{
    const detail::Plan P = detail::plan_for(fs...);
    FieldOptions opt{P.broadcast_dims, {}};
    std::vector<int> ext(P.dims.size());
    for (std::size_t a = 0; a < P.dims.size(); ++a)
    {
        ext[a] = P.ranges[a].size();
        opt.origin.emplace_back(P.dims[a], P.ranges[a].lo - kIndexBase);
    }
    Field<R> out(P.dims, ext, opt);
    if (out.size() == 0)
        return out;

    auto readers = std::make_tuple(detail::Reader<Ts>(fs, P)...);
    std::vector<int> o(out.rank(), 0);
    do
        out.local(o) = std::apply([&](auto&... r) { return static_cast<R>(fn(r(o)...)); }, readers);
    while (layout::next_index(o, out.extents()));
    return out;
}

template <class T, class F> auto map(const Field<T>& f, F&& fn)
{
    using R = std::decay_t<std::invoke_result_t<F&, T>>;
    return zip_map<R>(std::forward<F>(fn), f);
}

template <FieldOrScalar A, FieldOrScalar B, class Op> auto binary(const A& a, const B& b, Op op)
{
    using R = std::decay_t<std::invoke_result_t<Op&, element_t<A>, element_t<B>>>;
    return zip_map<R>(op, as_field(a), as_field(b));
}

template <class A, class B> using common_t = std::common_type_t<element_t<A>, element_t<B>>;

// Field ⊕ Field, Field ⊕ scalar, scalar ⊕ Field
template <FieldOrScalar A, FieldOrScalar B>
    requires(is_field_v<A> || is_field_v<B>)
auto operator+(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x + y; });
}
template <FieldOrScalar A, FieldOrScalar B>
    requires(is_field_v<A> || is_field_v<B>)
auto operator-(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x - y; });
}
template <FieldOrScalar A, FieldOrScalar B>
    requires(is_field_v<A> || is_field_v<B>)
auto operator*(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x * y; });
}
template <FieldOrScalar A, FieldOrScalar B>
    requires(is_field_v<A> || is_field_v<B>)
auto operator/(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x / y; });
}

template <class T> Field<T> operator-(const Field<T>& f)
{
    return map(f, [](T x) { return static_cast<T>(-x); });
}

// Comparisons and logic produce Field<bool>.
template <FieldOrScalar A, FieldOrScalar B> Field<bool> greater(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x > y; });
}
template <FieldOrScalar A, FieldOrScalar B> Field<bool> less(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x < y; });
}
template <FieldOrScalar A, FieldOrScalar B> Field<bool> greater_equal(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x >= y; });
}
template <FieldOrScalar A, FieldOrScalar B> Field<bool> less_equal(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x <= y; });
}
template <FieldOrScalar A, FieldOrScalar B> Field<bool> equal(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x == y; });
}
template <FieldOrScalar A, FieldOrScalar B> Field<bool> not_equal(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return x != y; });
}
template <FieldOrScalar A, FieldOrScalar B> Field<bool> logical_and(const A& a, const B& b)
{
    return binary(a, b, [](bool x, bool y) { return x && y; });
}
template <FieldOrScalar A, FieldOrScalar B> Field<bool> logical_or(const A& a, const B& b)
{
    return binary(a, b, [](bool x, bool y) { return x || y; });
}
template <class T> Field<bool> logical_not(const Field<T>& f)
{
    return map(f, [](T x) { return !static_cast<bool>(x); });
}

// Elementwise min/max of two operands (not the axis reductions, see Builtins.hpp).
template <FieldOrScalar A, FieldOrScalar B> auto minimum(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return std::min(x, y); });
}
template <FieldOrScalar A, FieldOrScalar B> auto maximum(const A& a, const B& b)
{
    return binary(a, b, [](common_t<A, B> x, common_t<A, B> y) { return std::max(x, y); });
}

} // namespace gridflow::field
