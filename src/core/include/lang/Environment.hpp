#pragma once
#include "field/Connectivity.hpp"
#include "field/Dimension.hpp"
#include "field/Value.hpp"
#include "master/OffsetProvider.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>

/**
 * @file Environment.hpp
 * @brief Name -> value bindings visible to an operator's source form.
 *
 * @details
 * An :cpp:type:`Environment` is what the user's code has in scope when an operator is
 * defined: dimensions, offsets, connectivities, constant values, the builtins and
 * other operators. Closure extraction picks the subset an operator actually uses;
 * that subset travels with the operator descriptor to external backends.
 */

namespace gridflow::master::plugin
{
struct OperatorDescriptor;
}

namespace gridflow::lang
{

enum class Builtin
{
    NeighborSum,
    MaxOver,
    MinOver,
    Where,
    Broadcast
};

const char* to_string(Builtin b) noexcept;

using OperatorRef = std::shared_ptr<const master::plugin::OperatorDescriptor>;

using Binding = std::variant<field::Dimension, field::FieldOffset, field::Connectivity,
                             field::Value, Builtin, OperatorRef>;

using Environment = std::unordered_map<std::string, Binding>;

// neighbor_sum, max_over, min_over, where, broadcast
const Environment& builtin_environment();

// Copy of @p env with the builtins added (user bindings win on name clashes).
Environment with_builtins(const Environment& env);

// Arithmetic primitives and math functions; never captured.
const std::unordered_set<std::string>& math_primitives();

// Syntax words of the source language (=, tuple, return, field_operator).
bool is_syntax_word(std::string_view name) noexcept;

// Offset provider made of the Connectivity and Dimension entries of @p entries.
// Any other binding kind is an OffsetProviderError.
master::OffsetProvider make_offset_provider(const Environment& entries);

} // namespace gridflow::lang
