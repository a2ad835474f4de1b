#include "lang/Environment.hpp"
#include "master/Errors.hpp"
#include <type_traits>

namespace gridflow::lang
{

const char* to_string(Builtin b) noexcept
{
    switch (b)
    {
    case Builtin::NeighborSum:
        return "neighbor_sum";
    case Builtin::MaxOver:
        return "max_over";
    case Builtin::MinOver:
        return "min_over";
    case Builtin::Where:
        return "where";
    case Builtin::Broadcast:
        return "broadcast";
    }
    return "?";
}

const Environment& builtin_environment()
{
    static const Environment env{
        {"neighbor_sum", Builtin::NeighborSum}, {"max_over", Builtin::MaxOver},
        {"min_over", Builtin::MinOver},         {"where", Builtin::Where},
        {"broadcast", Builtin::Broadcast},
    };
    return env;
}

Environment with_builtins(const Environment& env)
{
    Environment out = env;
    for (const auto& [name, b] : builtin_environment())
        out.emplace(name, b);
    return out;
}

const std::unordered_set<std::string>& math_primitives()
{
    static const std::unordered_set<std::string> ops{
        "+",   "-",   "*",    "/",   "neg", "sin", "cos", "tan", "exp", "log", "sqrt",
        "abs", ">",   "<",    ">=",  "<=",  "==",  "!=",  "and", "or",  "not", "min",
        "max",
    };
    return ops;
}

bool is_syntax_word(std::string_view name) noexcept
{
    return name == "=" || name == "tuple" || name == "return" || name == "field_operator";
}

master::OffsetProvider make_offset_provider(const Environment& entries)
{
    master::OffsetProvider op;
    for (const auto& [name, binding] : entries)
    {
        std::visit(
            [&, &name = name](const auto& b)
            {
                using B = std::decay_t<decltype(b)>;
                if constexpr (std::is_same_v<B, field::Connectivity> ||
                              std::is_same_v<B, field::Dimension>)
                    op.add(name, b);
                else
                    throw OffsetProviderError("The entry '" + name +
                                              "' is not supported within an offset provider");
            },
            binding);
    }
    return op;
}

} // namespace gridflow::lang
