#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file Source.hpp
 * @brief Parsed source form of a field operator.
 *
 * @details
 * Operator bodies are written in a small S-expression language so that closure
 * extraction and the interpreter backend can work on a real syntax tree instead of
 * on text. The grammar is deliberately tiny:
 *
 * @rst
 * .. code-block:: lisp
 *
 *   ; comment to end of line
 *   (field_operator edge_avg ((x Field Cell K) (w Float64))
 *     (= (l r) (tuple (x E2C 1) (x E2C 2)))   ; tuple unpacking
 *     (return (* w (+ l r))))
 *
 * - ``(name Type Dim...)`` is a parameter annotation; a bare ``name`` is accepted by
 *   the reader and rejected later by closure extraction.
 * - ``(= target expr)`` binds a local, ``(= (a b) expr)`` unpacks a tuple.
 * - ``(f args...)`` calls a primitive, a builtin or another operator; when ``f`` is a
 *   field, ``(f OFF)`` / ``(f OFF slot)`` applies a shift.
 * - The value of the last form (or of ``return``) is the result.
 * @endrst
 */

namespace gridflow::lang
{

struct Expr
{
    enum class Kind
    {
        Symbol,
        Number,
        Bool,
        List
    };

    Kind kind = Kind::List;
    std::string symbol;
    double number = 0.0;
    std::int64_t integer = 0;
    bool integral = false; // number literal without '.' or exponent
    bool boolean = false;
    std::vector<Expr> items;
    int line = 1;

    bool is_symbol() const noexcept { return kind == Kind::Symbol; }
    bool is_symbol(std::string_view s) const noexcept
    {
        return kind == Kind::Symbol && symbol == s;
    }
    bool is_list() const noexcept { return kind == Kind::List; }

    // "(+ a 1)" style rendering, used in error messages
    std::string to_string() const;
};

struct Param
{
    std::string name;
    std::string type; // empty when not annotated
    std::vector<std::string> dims;
    int line = 1;

    bool annotated() const noexcept { return !type.empty(); }
};

struct Source
{
    std::string name;
    std::vector<Param> params;
    std::vector<Expr> body;
    std::string text;
};

// Reads every top-level form of @p text. Throws ParseError.
std::vector<Expr> read_forms(std::string_view text);

// Reads exactly one form.
Expr read_expr(std::string_view text);

// Parses "(field_operator name (params...) body...)". Throws ParseError.
Source parse_operator(std::string_view text);

} // namespace gridflow::lang
