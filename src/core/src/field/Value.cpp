#include "field/Value.hpp"
#include <algorithm>
#include <sstream>

namespace gridflow::field
{

const Scalar& Value::scalar() const
{
    if (!is_scalar())
        throw ShapeError("expected a scalar, got " + describe());
    return std::get<Scalar>(node_);
}

const AnyField& Value::field() const
{
    if (!is_field())
        throw ShapeError("expected a field, got " + describe());
    return std::get<AnyField>(node_);
}

const Value::Tuple& Value::tuple() const
{
    if (!is_tuple())
        throw TupleShapeError("expected a tuple, got " + describe());
    return std::get<Tuple>(node_);
}

ElementKind Value::element_kind() const
{
    if (is_scalar())
        return static_cast<ElementKind>(std::get<Scalar>(node_).index());
    if (is_field())
        return static_cast<ElementKind>(std::get<AnyField>(node_).index());
    throw TupleShapeError("a tuple has no element kind");
}

std::string Value::describe() const
{
    if (is_tuple())
        return "tuple of " + std::to_string(std::get<Tuple>(node_).size());
    if (is_scalar())
        return std::visit(
            [](auto s)
            { return std::string(element_type_name<decltype(s)>()) + " scalar"; },
            std::get<Scalar>(node_));
    std::ostringstream os;
    std::visit([&](const auto& f) { os << f; }, std::get<AnyField>(node_));
    return os.str();
}

namespace
{

Value select(const Field<bool>& mask, const Value& a, const Value& b)
{
    if (a.is_tuple() || b.is_tuple())
    {
        if (!a.is_tuple() || !b.is_tuple() || a.tuple().size() != b.tuple().size())
            throw TupleShapeError("where: branches have different tuple structure (" +
                                  a.describe() + " vs " + b.describe() + ")");
        Value::Tuple out;
        out.reserve(a.tuple().size());
        for (std::size_t i = 0; i < a.tuple().size(); ++i)
            out.push_back(select(mask, a.tuple()[i], b.tuple()[i]));
        return Value(std::move(out));
    }

    const auto kind = std::max(a.element_kind(), b.element_kind());
    switch (kind)
    {
    case ElementKind::Bool:
        return Value(where(mask, leaf_as<bool>(a), leaf_as<bool>(b)));
    case ElementKind::Int64:
        return Value(where(mask, leaf_as<std::int64_t>(a), leaf_as<std::int64_t>(b)));
    case ElementKind::Float64:
        break;
    }
    return Value(where(mask, leaf_as<double>(a), leaf_as<double>(b)));
}

void check_copy(const Value& target, const Value& source)
{
    if (target.is_tuple() || source.is_tuple())
    {
        if (!target.is_tuple() || !source.is_tuple() ||
            target.tuple().size() != source.tuple().size())
            throw ShapeError("out " + target.describe() + " does not match result " +
                             source.describe());
        for (std::size_t i = 0; i < target.tuple().size(); ++i)
            check_copy(target.tuple()[i], source.tuple()[i]);
        return;
    }
    if (!target.is_field())
        throw ShapeError("out must be a field or a tuple of fields, got " + target.describe());
    if (source.is_scalar())
        return; // broadcast fill
    std::visit(
        [](const auto& t, const auto& s)
        {
            if (t.dims() != s.dims() || t.extents() != s.extents())
                throw ShapeError("out field over " + to_string(t.dims()) +
                                 " does not match result over " + to_string(s.dims()));
        },
        target.field(), source.field());
}

void do_copy(const Value& target, const Value& source)
{
    if (target.is_tuple())
    {
        for (std::size_t i = 0; i < target.tuple().size(); ++i)
            do_copy(target.tuple()[i], source.tuple()[i]);
        return;
    }
    std::visit(
        [&](auto t)
        {
            using T = typename decltype(t)::value_type;
            if (source.is_scalar())
            {
                const T v = scalar_as<T>(source);
                if (t.size() == 0)
                    return;
                std::vector<int> idx(t.rank(), 0);
                do
                    t.local(idx) = v;
                while (layout::next_index(idx, t.extents()));
                return;
            }
            std::visit([&](const auto& s) { copy_field(t, s); }, source.field());
        },
        target.field());
}

} // namespace

Value where(const Value& mask, const Value& a, const Value& b)
{
    if (mask.is_tuple() || mask.element_kind() != ElementKind::Bool)
        throw ShapeError("where: mask must be boolean, got " + mask.describe());
    return select(leaf_as<bool>(mask), a, b);
}

void copy_into(const Value& target, const Value& source)
{
    check_copy(target, source);
    do_copy(target, source);
}

} // namespace gridflow::field
