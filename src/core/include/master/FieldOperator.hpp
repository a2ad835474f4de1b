#pragma once
#include "field/Value.hpp"
#include "lang/Closure.hpp"
#include "lang/Environment.hpp"
#include "lang/Source.hpp"
#include "master/Backend.hpp"
#include "master/Errors.hpp"
#include "master/Log.hpp"
#include "master/OffsetProvider.hpp"
#include "master/plugin/Backend.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file FieldOperator.hpp
 * @brief Operator values and the invocation controller.
 *
 * @details
 * A :cpp:class:`FieldOperator` pairs a C++ callable (the body) with an immutable
 * :cpp:struct:`plugin::OperatorDescriptor`. How a call behaves depends on whether an
 * offset-provider context is already active on the calling thread:
 *
 * **Outermost** (no context):
 *  - ``out`` is required (:cpp:class:`gridflow::ContextError` otherwise);
 *  - the provider (empty when omitted) is activated for the whole call;
 *  - the selected backend computes the full result, which is validated against ``out``
 *    and only then copied into it;
 *  - the context is released on every exit path; nothing is returned.
 *
 * **Nested** (context active): passing ``out`` or ``offset_provider`` is a
 * :cpp:class:`gridflow::ContextError`; the result is returned by value.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto add  = make_field_operator("add", [](const Field<double>& a, const Field<double>& b)
 *                                          { return a + b; });
 *   auto edge = make_field_operator("edge", [&](const Field<double>& c)
 *                                           { return add(c(E2C[1]), c(E2C[2])); });
 *
 *   Field<double> out({Edge}, {12});
 *   edge.call(into(out, provider), cell_values);                 // embedded
 *   edge.call(into(out, provider, runtime.backend("interpreter")), cell_values);
 * @endrst
 */

namespace gridflow::master
{

struct NoOut
{
};

template <class Out = NoOut> struct Invocation
{
    Out* out = nullptr;
    const OffsetProvider* offset_provider = nullptr;
    Backend backend{};
};

template <class Out>
Invocation<Out> into(Out& out, const OffsetProvider& offset_provider, Backend backend = {})
{
    return Invocation<Out>{&out, &offset_provider, std::move(backend)};
}

template <class Out> Invocation<Out> into(Out& out, Backend backend = {})
{
    return Invocation<Out>{&out, nullptr, std::move(backend)};
}

namespace detail
{

// Copies a validated Value back into out when to_value(out) had to convert (and
// therefore did not alias) the caller's storage.
template <class Out> void sync_back(Out& out, const field::Value& v)
{
    if constexpr (field::is_field_v<Out>)
    {
        using T = typename Out::value_type;
        const field::Field<T> f = field::leaf_as<T>(v);
        if (!f.shares_storage_with(out))
            field::copy_field(out, f);
    }
    else if constexpr (field::is_std_tuple<Out>::value)
    {
        [&]<std::size_t... I>(std::index_sequence<I...>)
        { (sync_back(std::get<I>(out), v.tuple()[I]), ...); }(
            std::make_index_sequence<std::tuple_size_v<Out>>{});
    }
}

template <class Out, class R> void copy_result(Out& out, const R& result)
{
    if constexpr (field::is_field_v<Out> && field::is_field_v<R>)
    {
        field::copy_field(out, result);
    }
    else
    {
        const field::Value target = field::to_value(out);
        field::copy_into(target, field::to_value(result));
        sync_back(out, target);
    }
}

} // namespace detail

template <class F> class FieldOperator
{
  public:
    FieldOperator(F body, std::shared_ptr<const plugin::OperatorDescriptor> desc)
        : body_(std::move(body)), desc_(std::move(desc))
    {
    }

    const std::string& name() const noexcept { return desc_->name; }
    const plugin::OperatorDescriptor& descriptor() const noexcept { return *desc_; }

    // For binding this operator into another operator's environment.
    lang::OperatorRef ref() const { return desc_; }

    template <class Out, class... Args>
    auto call(const Invocation<Out>& inv, const Args&... args) const
        -> std::optional<std::invoke_result_t<const F&, const Args&...>>
    {
        using R = std::invoke_result_t<const F&, const Args&...>;
        static_assert(!std::is_void_v<R>, "operator bodies must return a value");

        if (!active_offset_provider())
        {
            outermost(inv, args...);
            return std::nullopt;
        }
        return nested<R>(inv, args...);
    }

    // Nested-call shorthand; outside an operator this fails for the missing out.
    template <class... Args> auto operator()(const Args&... args) const
    {
        return *call(Invocation<>{}, args...);
    }

  private:
    template <class Out, class... Args>
    void outermost(const Invocation<Out>& inv, const Args&... args) const
    {
        if constexpr (std::is_same_v<Out, NoOut>)
        {
            throw ContextError("Must provide an out field to the outermost call of " + name());
        }
        else
        {
            if (!inv.out)
                throw ContextError("Must provide an out field to the outermost call of " +
                                   name());
            static const OffsetProvider kNoOffsets;
            const OffsetProvider& provider = inv.offset_provider ? *inv.offset_provider
                                                                 : kNoOffsets;
            OffsetProviderScope scope(provider);
            LOGD("[op] %s: outermost call, backend=%s\n", name().c_str(),
                 inv.backend.name().c_str());

            if (inv.backend.kind() == Backend::Kind::Embedded)
            {
                const auto result = body_(args...);
                detail::copy_result(*inv.out, result);
                return;
            }

            const field::Value target = field::to_value(*inv.out);
            auto r = inv.backend.impl()->execute(*desc_, {field::to_value(args)...}, &target,
                                                 provider);
            if (r)
                field::copy_into(target, *r);
            detail::sync_back(*inv.out, target);
        }
    }

    template <class R, class Out, class... Args>
    R nested(const Invocation<Out>& inv, const Args&... args) const
    {
        if (inv.out || inv.offset_provider)
            throw ContextError("out and offset_provider can only be passed to the outermost "
                               "operator call (" +
                               name() + " was called from inside an operator)");
        if (inv.backend.kind() == Backend::Kind::Embedded)
            return body_(args...);

        auto r = inv.backend.impl()->execute(*desc_, {field::to_value(args)...}, nullptr,
                                             require_offset_provider());
        if (!r)
            throw BackendError("Backend " + inv.backend.name() + " returned no value for " +
                               "nested call of " + name());
        return field::from_value<R>(*r);
    }

    F body_;
    std::shared_ptr<const plugin::OperatorDescriptor> desc_;
};

// Operator without a source form; it can only run on the embedded backend.
template <class F> FieldOperator<F> make_field_operator(std::string name, F body)
{
    auto desc = std::make_shared<plugin::OperatorDescriptor>();
    desc->name = std::move(name);
    return FieldOperator<F>(std::move(body), std::move(desc));
}

// Operator with a source form: parses it and captures what it references from @p env
// (builtins are always visible). Throws ParseError / ClosureError.
template <class F>
FieldOperator<F> make_field_operator(std::string name, F body, std::string_view source,
                                     const lang::Environment& env)
{
    auto src = std::make_shared<lang::Source>(lang::parse_operator(source));
    if (src->name != name)
        throw ParseError("source form defines '" + src->name + "', expected '" + name + "'");

    auto desc = std::make_shared<plugin::OperatorDescriptor>();
    desc->name = std::move(name);
    desc->captured = lang::extract_closure_vars(*src, lang::with_builtins(env));
    desc->source = std::move(src);
    return FieldOperator<F>(std::move(body), std::move(desc));
}

} // namespace gridflow::master
