#pragma once
#include "field/Builtins.hpp"
#include "field/Field.hpp"
#include "master/Errors.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file Value.hpp
 * @brief Tagged union {Scalar, Field, Tuple-of-Value} used at dynamic boundaries.
 *
 * @details
 * Typed code works with ``Field<T>`` and ``std::tuple``. Backends, the interpreter and
 * the runtime form of ``where`` work with :cpp:class:`Value`, which carries one of three
 * element types (``bool`` < ``int64`` < ``double``, promoted in that order).
 *
 * A Value built from a Field **shares** its storage, so a backend writing into an ``out``
 * Value writes into the caller's Field.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   Value out = to_value(std::tuple{u, v});          // aliases u and v
 *   copy_into(out, computed);                        // validates everything, then copies
 *   auto uv = from_value<std::tuple<Field<double>, Field<double>>>(computed);
 * @endrst
 */

namespace gridflow::field
{

using Scalar = std::variant<bool, std::int64_t, double>;
using AnyField = std::variant<Field<bool>, Field<std::int64_t>, Field<double>>;

enum class ElementKind
{
    Bool = 0,
    Int64 = 1,
    Float64 = 2
};

class Value
{
  public:
    using Tuple = std::vector<Value>;

    Value() : node_(Scalar{0.0}) {}
    Value(double v) : node_(Scalar{v}) {}
    Value(std::int64_t v) : node_(Scalar{v}) {}
    Value(int v) : node_(Scalar{static_cast<std::int64_t>(v)}) {}
    Value(bool v) : node_(Scalar{v}) {}
    Value(Scalar s) : node_(std::move(s)) {}
    Value(Field<double> f) : node_(AnyField{std::move(f)}) {}
    Value(Field<std::int64_t> f) : node_(AnyField{std::move(f)}) {}
    Value(Field<bool> f) : node_(AnyField{std::move(f)}) {}
    Value(AnyField f) : node_(std::move(f)) {}
    Value(Tuple t) : node_(std::move(t)) {}

    bool is_scalar() const noexcept { return std::holds_alternative<Scalar>(node_); }
    bool is_field() const noexcept { return std::holds_alternative<AnyField>(node_); }
    bool is_tuple() const noexcept { return std::holds_alternative<Tuple>(node_); }

    const Scalar& scalar() const;
    const AnyField& field() const;
    const Tuple& tuple() const;

    // Element kind of a scalar or field leaf.
    ElementKind element_kind() const;

    // "Float64 Field with dimensions (Cell)", "Int64 scalar", "tuple of 2"
    std::string describe() const;

  private:
    std::variant<Scalar, AnyField, Tuple> node_;
};

// Leaf (scalar or field) as Field<T>; scalars become rank-0 fields.
template <class T> Field<T> leaf_as(const Value& v)
{
    if (v.is_scalar())
        return std::visit([](auto s) { return Field<T>::scalar(static_cast<T>(s)); }, v.scalar());
    return std::visit(
        [](const auto& f) -> Field<T>
        {
            using F = typename std::decay_t<decltype(f)>::value_type;
            if constexpr (std::is_same_v<F, T>)
                return f;
            else
                return f.template astype<T>();
        },
        v.field());
}

template <class T> T scalar_as(const Value& v)
{
    return std::visit([](auto s) { return static_cast<T>(s); }, v.scalar());
}

// Runtime where: recursive walk over congruent tuple structure (TupleShapeError otherwise).
Value where(const Value& mask, const Value& a, const Value& b);

// Writes source into target (a Field or a tuple of Fields). The whole structure is
// validated before any element is written.
void copy_into(const Value& target, const Value& source);

// ---- typed <-> Value conversions ---------------------------------------------------------

template <class X> struct is_std_tuple : std::false_type
{
};
template <class... Xs> struct is_std_tuple<std::tuple<Xs...>> : std::true_type
{
};

template <class X> Value to_value(const X& x)
{
    if constexpr (std::is_same_v<X, Value>)
        return x;
    else if constexpr (std::is_same_v<X, bool>)
        return Value(x);
    else if constexpr (std::is_integral_v<X>)
        return Value(static_cast<std::int64_t>(x));
    else if constexpr (std::is_floating_point_v<X>)
        return Value(static_cast<double>(x));
    else if constexpr (is_field_v<X>)
    {
        using T = typename X::value_type;
        if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t> ||
                      std::is_same_v<T, double>)
            return Value(x);
        else if constexpr (std::is_integral_v<T>)
            return Value(x.template astype<std::int64_t>());
        else
            return Value(x.template astype<double>());
    }
    else
    {
        static_assert(is_std_tuple<X>::value, "to_value: unsupported type");
        return std::apply([](const auto&... e) { return Value(Value::Tuple{to_value(e)...}); },
                          x);
    }
}

template <class X> X from_value(const Value& v)
{
    if constexpr (std::is_same_v<X, Value>)
        return v;
    else if constexpr (std::is_arithmetic_v<X>)
    {
        if (!v.is_scalar())
            throw ShapeError("expected a scalar, got " + v.describe());
        return scalar_as<X>(v);
    }
    else if constexpr (is_field_v<X>)
    {
        if (v.is_tuple())
            throw ShapeError("expected a field, got " + v.describe());
        return leaf_as<typename X::value_type>(v);
    }
    else
    {
        static_assert(is_std_tuple<X>::value, "from_value: unsupported type");
        constexpr std::size_t N = std::tuple_size_v<X>;
        if (!v.is_tuple() || v.tuple().size() != N)
            throw TupleShapeError("expected a tuple of " + std::to_string(N) + ", got " +
                                  v.describe());
        return [&]<std::size_t... I>(std::index_sequence<I...>)
        { return X{from_value<std::tuple_element_t<I, X>>(v.tuple()[I])...}; }(
                   std::make_index_sequence<N>{});
    }
}

} // namespace gridflow::field
