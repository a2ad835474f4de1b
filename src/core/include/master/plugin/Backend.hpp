#pragma once
#include "field/Value.hpp"
#include "lang/Environment.hpp"
#include "lang/Source.hpp"
#include "master/OffsetProvider.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file Backend.hpp
 * @brief Contract between the operator controller and external execution backends.
 *
 * @details
 * An external backend receives everything it needs to run an operator without the
 * C++ body: the :cpp:struct:`OperatorDescriptor` (name, parsed source form, captured
 * names), the arguments as :cpp:class:`gridflow::field::Value`, the ``out`` target and
 * the active offset provider. It must produce the same observable result as the
 * embedded path.
 *
 * - Outermost call: ``out`` is non-null. The backend either writes the result into
 *   ``*out`` itself and returns ``std::nullopt``, or returns the result and lets the
 *   controller copy it.
 * - Nested call: ``out`` is null and the result must be returned.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   struct Echo final : IBackend {
 *     std::string name() const override { return "echo"; }
 *     std::optional<field::Value> execute(const OperatorDescriptor&,
 *                                         const std::vector<field::Value>& args,
 *                                         const field::Value*, const OffsetProvider&) override
 *     { return args.front(); }
 *   };
 * @endrst
 */

namespace gridflow::master::plugin
{

// Free-form backend parameters (strings on both sides), straight from the YAML config.
using KV = std::unordered_map<std::string, std::string>;

struct OperatorDescriptor
{
    std::string name;
    std::shared_ptr<const lang::Source> source; // null when built without source text
    lang::Environment captured;
};

struct IBackend
{
    virtual ~IBackend() = default;
    virtual std::string name() const = 0;

    virtual std::optional<field::Value> execute(const OperatorDescriptor& op,
                                                const std::vector<field::Value>& args,
                                                const field::Value* out,
                                                const OffsetProvider& offset_provider) = 0;
};

} // namespace gridflow::master::plugin
