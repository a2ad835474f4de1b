#include "lang/Interpreter.hpp"
#include "field/Builtins.hpp"
#include "field/Ops.hpp"
#include "field/Transform.hpp"
#include "lang/Closure.hpp"
#include "master/Errors.hpp"
#include "master/Log.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <span>
#include <type_traits>

namespace gridflow::lang
{

using field::ElementKind;
using field::Value;
using master::OffsetProvider;
using master::plugin::OperatorDescriptor;

namespace
{

constexpr int kMaxDepth = 64;

// ---- dynamic arithmetic ------------------------------------------------------------------

template <class T, class Op> Value binary_as(const Value& a, const Value& b, Op op)
{
    if (a.is_scalar() && b.is_scalar())
        return Value(op(field::scalar_as<T>(a), field::scalar_as<T>(b)));
    return Value(field::binary(field::leaf_as<T>(a), field::leaf_as<T>(b), op));
}

// Evaluates at the promoted element kind of both operands.
template <class Op> Value promoted(const Value& a, const Value& b, Op op)
{
    switch (std::max(a.element_kind(), b.element_kind()))
    {
    case ElementKind::Bool:
        return binary_as<bool>(a, b, op);
    case ElementKind::Int64:
        return binary_as<std::int64_t>(a, b, op);
    case ElementKind::Float64:
        break;
    }
    return binary_as<double>(a, b, op);
}

template <class T, class F> Value unary_as(const Value& a, F fn)
{
    if (a.is_scalar())
        return Value(fn(field::scalar_as<T>(a)));
    return Value(field::map(field::leaf_as<T>(a), fn));
}

template <class F> Value unary_same(const Value& a, F fn)
{
    switch (a.element_kind())
    {
    case ElementKind::Bool:
        return unary_as<bool>(a, fn);
    case ElementKind::Int64:
        return unary_as<std::int64_t>(a, fn);
    case ElementKind::Float64:
        break;
    }
    return unary_as<double>(a, fn);
}

Value apply_unary(const std::string& op, const Value& a)
{
    if (op == "-" || op == "neg")
        return unary_same(a, [](auto x) { return static_cast<decltype(x)>(-x); });
    if (op == "not")
        return unary_same(a, [](auto x) { return !static_cast<bool>(x); });
    if (op == "abs")
        return unary_same(a,
                          [](auto x)
                          {
                              if constexpr (std::is_same_v<decltype(x), bool>)
                                  return x;
                              else
                                  return static_cast<decltype(x)>(x < 0 ? -x : x);
                          });
    if (op == "sin")
        return unary_as<double>(a, [](double x) { return std::sin(x); });
    if (op == "cos")
        return unary_as<double>(a, [](double x) { return std::cos(x); });
    if (op == "tan")
        return unary_as<double>(a, [](double x) { return std::tan(x); });
    if (op == "exp")
        return unary_as<double>(a, [](double x) { return std::exp(x); });
    if (op == "log")
        return unary_as<double>(a, [](double x) { return std::log(x); });
    if (op == "sqrt")
        return unary_as<double>(a, [](double x) { return std::sqrt(x); });
    throw EvalError("'" + op + "' does not take one argument");
}

// Integral kinds divide truncating; a zero divisor or INT64_MIN / -1 is an error.
template <class T> T checked_divide(T x, T y)
{
    if constexpr (std::is_integral_v<T>)
    {
        if (y == T{})
            throw EvalError("integer division by zero");
        if constexpr (std::is_signed_v<T>)
            if (x == std::numeric_limits<T>::min() && y == T{-1})
                throw EvalError("integer division overflows " + std::to_string(x) + " / -1");
    }
    return static_cast<T>(x / y);
}

Value apply_binary(const std::string& op, const Value& a, const Value& b)
{
    if (op == "+")
        return promoted(a, b, [](auto x, auto y) { return static_cast<decltype(x)>(x + y); });
    if (op == "-")
        return promoted(a, b, [](auto x, auto y) { return static_cast<decltype(x)>(x - y); });
    if (op == "*")
        return promoted(a, b, [](auto x, auto y) { return static_cast<decltype(x)>(x * y); });
    if (op == "/")
        return promoted(a, b, [](auto x, auto y) { return checked_divide(x, y); });
    if (op == "min")
        return promoted(a, b, [](auto x, auto y) { return std::min(x, y); });
    if (op == "max")
        return promoted(a, b, [](auto x, auto y) { return std::max(x, y); });
    if (op == ">")
        return promoted(a, b, [](auto x, auto y) { return x > y; });
    if (op == "<")
        return promoted(a, b, [](auto x, auto y) { return x < y; });
    if (op == ">=")
        return promoted(a, b, [](auto x, auto y) { return x >= y; });
    if (op == "<=")
        return promoted(a, b, [](auto x, auto y) { return x <= y; });
    if (op == "==")
        return promoted(a, b, [](auto x, auto y) { return x == y; });
    if (op == "!=")
        return promoted(a, b, [](auto x, auto y) { return x != y; });
    if (op == "and")
        return binary_as<bool>(a, b, [](bool x, bool y) { return x && y; });
    if (op == "or")
        return binary_as<bool>(a, b, [](bool x, bool y) { return x || y; });
    throw EvalError("'" + op + "' does not take two arguments");
}

// ---- evaluation of one operator body -----------------------------------------------------

class Frame
{
  public:
    using CallOperator =
        std::function<Value(const OperatorDescriptor&, const std::vector<Value>&)>;

    Frame(const OperatorDescriptor& op, const OffsetProvider& provider, CallOperator call,
          bool trace)
        : op_(op), provider_(provider), call_(std::move(call)), trace_(trace)
    {
    }

    void bind_params(const std::vector<Param>& params, const std::vector<Value>& args)
    {
        if (params.size() != args.size())
            throw EvalError(op_.name + ": expected " + std::to_string(params.size()) +
                            " argument(s), got " + std::to_string(args.size()));
        for (std::size_t i = 0; i < params.size(); ++i)
        {
            check_param(params[i], args[i]);
            locals_.insert_or_assign(params[i].name, args[i]);
        }
    }

    Value run(const std::vector<Expr>& body)
    {
        if (body.empty())
            throw EvalError(op_.name + ": empty body");
        Value last;
        for (const auto& form : body)
        {
            last = eval(form);
            if (returned_)
                break;
        }
        return last;
    }

  private:
    [[noreturn]] void fail(const Expr& at, const std::string& what) const
    {
        throw EvalError(op_.name + ", line " + std::to_string(at.line) + ": " + what);
    }

    void check_param(const Param& p, const Value& v) const
    {
        const bool want_field = (p.type == "Field");
        const bool want_scalar = (p.type == "Float64" || p.type == "Int64" || p.type == "Bool");
        if ((want_field && !v.is_field()) || (want_scalar && !v.is_scalar()))
            throw EvalError(op_.name + ": parameter " + p.name + " is declared " + p.type +
                            ", got " + v.describe());
    }

    const Binding* captured(const std::string& name) const
    {
        auto it = op_.captured.find(name);
        return it == op_.captured.end() ? nullptr : &it->second;
    }

    Value lookup(const Expr& e) const
    {
        if (auto it = locals_.find(e.symbol); it != locals_.end())
            return it->second;
        const Binding* b = captured(e.symbol);
        if (!b)
            fail(e, "unknown name '" + e.symbol + "'");
        if (const auto* v = std::get_if<Value>(b))
            return *v;
        fail(e, "'" + e.symbol + "' is not a value");
    }

    const field::Dimension& dimension_arg(const Expr& e) const
    {
        const Binding* b = e.is_symbol() ? captured(e.symbol) : nullptr;
        const auto* d = b ? std::get_if<field::Dimension>(b) : nullptr;
        if (!d)
            fail(e, e.to_string() + " is not a dimension");
        return *d;
    }

    const field::FieldOffset& offset_arg(const Expr& e) const
    {
        const Binding* b = e.is_symbol() ? captured(e.symbol) : nullptr;
        const auto* o = b ? std::get_if<field::FieldOffset>(b) : nullptr;
        if (!o)
            fail(e, e.to_string() + " is not a field offset");
        return *o;
    }

    Value eval(const Expr& e)
    {
        switch (e.kind)
        {
        case Expr::Kind::Number:
            return e.integral ? Value(e.integer) : Value(e.number);
        case Expr::Kind::Bool:
            return Value(e.boolean);
        case Expr::Kind::Symbol:
            return lookup(e);
        case Expr::Kind::List:
            break;
        }
        if (e.items.empty())
            fail(e, "empty form");
        const Expr& head = e.items.front();
        if (!head.is_symbol())
            fail(e, head.to_string() + " is not callable");
        const std::span<const Expr> rest(e.items.data() + 1, e.items.size() - 1);
        const std::string& name = head.symbol;

        if (name == "=")
            return assign(e, rest);
        if (name == "tuple")
        {
            Value::Tuple t;
            for (const auto& x : rest)
                t.push_back(eval(x));
            return Value(std::move(t));
        }
        if (name == "return")
        {
            if (rest.size() != 1)
                fail(e, "return takes one expression");
            Value v = eval(rest[0]);
            returned_ = true;
            return v;
        }
        if (locals_.count(name))
            return shift(e, locals_.at(name), rest);
        if (math_primitives().count(name))
            return primitive(e, name, rest);

        const Binding* b = captured(name);
        if (!b)
            fail(e, "unknown name '" + name + "'");
        if (const auto* v = std::get_if<Value>(b))
            return shift(e, *v, rest);
        if (const auto* bi = std::get_if<Builtin>(b))
            return builtin(e, *bi, rest);
        if (const auto* ref = std::get_if<OperatorRef>(b))
        {
            if (!*ref)
                fail(e, "operator '" + name + "' is null");
            std::vector<Value> args;
            for (const auto& x : rest)
                args.push_back(eval(x));
            return call_(**ref, args);
        }
        fail(e, "'" + name + "' is not callable");
    }

    Value assign(const Expr& e, std::span<const Expr> rest)
    {
        if (rest.size() != 2)
            fail(e, "assignment takes a target and an expression");
        Value v = eval(rest[1]);
        bind(rest[0], v);
        return v;
    }

    void bind(const Expr& target, const Value& v)
    {
        if (target.is_symbol())
        {
            locals_.insert_or_assign(target.symbol, v);
            return;
        }
        if (!target.is_list())
            fail(target, "cannot assign to " + target.to_string());
        if (!v.is_tuple() || v.tuple().size() != target.items.size())
            throw TupleShapeError(op_.name + ", line " + std::to_string(target.line) +
                                  ": cannot unpack " + v.describe() + " into " +
                                  target.to_string());
        for (std::size_t i = 0; i < target.items.size(); ++i)
            bind(target.items[i], v.tuple()[i]);
    }

    Value shift(const Expr& e, const Value& v, std::span<const Expr> rest)
    {
        if (rest.empty() || rest.size() > 2)
            fail(e, "a shift takes an offset and an optional neighbor slot");
        if (!v.is_field())
            fail(e, "cannot shift " + v.describe());
        const auto& off = offset_arg(rest[0]);
        std::optional<int> slot;
        if (rest.size() == 2)
        {
            const Value s = eval(rest[1]);
            if (!s.is_scalar() || s.element_kind() != ElementKind::Int64)
                fail(e, "neighbor slot must be an integer, got " + s.describe());
            slot = static_cast<int>(field::scalar_as<std::int64_t>(s));
        }
        return std::visit([&](const auto& f)
                          { return Value(field::transform(f, provider_, off, slot)); },
                          v.field());
    }

    Value primitive(const Expr& e, const std::string& name, std::span<const Expr> rest)
    {
        std::vector<Value> args;
        for (const auto& x : rest)
            args.push_back(eval(x));
        for (const auto& a : args)
            if (a.is_tuple())
                fail(e, "'" + name + "' does not accept " + a.describe());
        if (args.size() == 1)
            return apply_unary(name, args[0]);
        if (args.size() == 2)
            return apply_binary(name, args[0], args[1]);
        fail(e, "'" + name + "' takes one or two arguments, got " + std::to_string(args.size()));
    }

    Value builtin(const Expr& e, Builtin b, std::span<const Expr> rest)
    {
        if (trace_)
            LOGI("[interp] %s: %s at line %d\n", op_.name.c_str(), to_string(b), e.line);
        switch (b)
        {
        case Builtin::NeighborSum:
        case Builtin::MaxOver:
        case Builtin::MinOver:
        {
            if (rest.size() != 2)
                fail(e, std::string(to_string(b)) + " takes a field and a dimension");
            const Value x = eval(rest[0]);
            if (!x.is_field())
                fail(e, std::string(to_string(b)) + " needs a field, got " + x.describe());
            const auto& axis = dimension_arg(rest[1]);
            return std::visit(
                [&](const auto& f) -> Value
                {
                    if (b == Builtin::NeighborSum)
                        return Value(field::neighbor_sum(f, axis));
                    if (b == Builtin::MaxOver)
                        return Value(field::max_over(f, axis));
                    return Value(field::min_over(f, axis));
                },
                x.field());
        }
        case Builtin::Where:
        {
            if (rest.size() != 3)
                fail(e, "where takes a mask and two branches");
            const Value mask = eval(rest[0]);
            const Value a = eval(rest[1]);
            const Value c = eval(rest[2]);
            return field::where(mask, a, c);
        }
        case Builtin::Broadcast:
            break;
        }

        if (rest.size() != 2)
            fail(e, "broadcast takes a value and a dimension list");
        const Value x = eval(rest[0]);
        field::Dims dims;
        if (rest[1].is_list())
            for (const auto& d : rest[1].items)
                dims.push_back(dimension_arg(d));
        else
            dims.push_back(dimension_arg(rest[1]));
        if (x.is_scalar())
            return std::visit([&](auto s) { return Value(field::broadcast(s, dims)); },
                              x.scalar());
        if (x.is_field())
            return std::visit([&](const auto& f) { return Value(field::broadcast(f, dims)); },
                              x.field());
        fail(e, "cannot broadcast " + x.describe());
    }

    const OperatorDescriptor& op_;
    const OffsetProvider& provider_;
    CallOperator call_;
    bool trace_;
    std::unordered_map<std::string, Value> locals_;
    bool returned_ = false;
};

} // namespace

InterpreterBackend::InterpreterBackend(const master::plugin::KV& params)
{
    if (auto it = params.find("trace"); it != params.end())
        trace_ = (it->second == "true" || it->second == "1");
}

const Source& InterpreterBackend::prepare(const OperatorDescriptor& op)
{
    if (auto it = cache_.find(op.name); it != cache_.end())
        return *it->second;

    if (!op.source)
        throw BackendError("Operator " + op.name +
                           " has no source form; the interpreter cannot run it");
    for (const auto& n : free_names(*op.source))
        if (!op.captured.count(n))
            throw EvalError(op.name + ": '" + n + "' is referenced but was not captured");

    LOGD("[interp] prepared %s (%zu params, %zu forms)\n", op.name.c_str(),
         op.source->params.size(), op.source->body.size());
    return *cache_.emplace(op.name, op.source).first->second;
}

Value InterpreterBackend::run(const OperatorDescriptor& op, const std::vector<Value>& args,
                              const OffsetProvider& offset_provider, int depth)
{
    if (depth > kMaxDepth)
        throw EvalError(op.name + ": operator calls nested deeper than " +
                        std::to_string(kMaxDepth));
    const Source& src = prepare(op);
    if (trace_)
        LOGI("[interp] %s(%zu args) depth=%d\n", op.name.c_str(), args.size(), depth);

    Frame frame(
        op, offset_provider,
        [&](const OperatorDescriptor& callee, const std::vector<Value>& a)
        { return run(callee, a, offset_provider, depth + 1); },
        trace_);
    frame.bind_params(src.params, args);
    return frame.run(src.body);
}

std::optional<Value> InterpreterBackend::execute(const OperatorDescriptor& op,
                                                 const std::vector<Value>& args, const Value* out,
                                                 const OffsetProvider& offset_provider)
{
    Value result = run(op, args, offset_provider, 0);
    if (!out)
        return result;
    field::copy_into(*out, result);
    return std::nullopt;
}

} // namespace gridflow::lang
