#include "lang/Closure.hpp"
#include "master/Errors.hpp"
#include "master/Log.hpp"

namespace gridflow::lang
{

namespace
{

void collect_targets(const Expr& target, std::set<std::string>& out)
{
    if (target.is_symbol())
    {
        out.insert(target.symbol);
        return;
    }
    if (target.is_list())
        for (const auto& t : target.items)
            collect_targets(t, out);
}

void collect_locals(const Expr& e, std::set<std::string>& out)
{
    if (!e.is_list() || e.items.empty())
        return;
    if (e.items[0].is_symbol("=") && e.items.size() == 3)
        collect_targets(e.items[1], out);
    for (const auto& item : e.items)
        collect_locals(item, out);
}

void collect_free(const Expr& e, const std::set<std::string>& locals, std::set<std::string>& out)
{
    switch (e.kind)
    {
    case Expr::Kind::Number:
    case Expr::Kind::Bool:
        return;
    case Expr::Kind::Symbol:
        if (!locals.count(e.symbol) && !math_primitives().count(e.symbol) &&
            !is_syntax_word(e.symbol))
            out.insert(e.symbol);
        return;
    case Expr::Kind::List:
        break;
    }
    // the target of an assignment is a binding, not a reference
    const bool assign = !e.items.empty() && e.items[0].is_symbol("=") && e.items.size() == 3;
    for (std::size_t i = 0; i < e.items.size(); ++i)
    {
        if (assign && i == 1)
            continue;
        collect_free(e.items[i], locals, out);
    }
}

} // namespace

std::set<std::string> local_names(const Source& src)
{
    std::set<std::string> locals;
    for (const auto& p : src.params)
        locals.insert(p.name);
    for (const auto& e : src.body)
        collect_locals(e, locals);
    return locals;
}

std::set<std::string> free_names(const Source& src)
{
    const auto locals = local_names(src);
    std::set<std::string> names;
    for (const auto& e : src.body)
        collect_free(e, locals, names);
    return names;
}

Environment extract_closure_vars(const Source& src, const Environment& env)
{
    for (const auto& p : src.params)
        if (!p.annotated())
            throw ClosureError("Field operator parameters must be type annotated: '" + p.name +
                               "' of " + src.name);

    std::set<std::string> names = free_names(src);
    for (const auto& p : src.params)
        for (const auto& d : p.dims)
        {
            auto it = env.find(d);
            if (it != env.end() && std::holds_alternative<field::Dimension>(it->second))
                names.insert(d);
        }

    Environment captured;
    for (const auto& n : names)
    {
        auto it = env.find(n);
        if (it == env.end())
            throw ClosureError("Operator " + src.name + " references '" + n +
                               "', which is not defined in its environment");
        captured.emplace(n, it->second);
    }
    LOGD("[closure] %s: %zu captured name(s)\n", src.name.c_str(), captured.size());
    return captured;
}

} // namespace gridflow::lang
