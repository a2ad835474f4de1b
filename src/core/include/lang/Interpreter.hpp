#pragma once
#include "field/Value.hpp"
#include "lang/Environment.hpp"
#include "lang/Source.hpp"
#include "master/OffsetProvider.hpp"
#include "master/plugin/Backend.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file Interpreter.hpp
 * @brief Builtin external backend that evaluates an operator's source form.
 *
 * @details
 * The interpreter sees only what crosses the :cpp:struct:`plugin::IBackend` boundary:
 * the parsed source, the captured names, the argument values and the offset provider
 * it is handed. It never looks at the thread's active context. Operators called from
 * the body are evaluated recursively from their own descriptors.
 *
 * Each operator is prepared once (free names checked against the captured map) and
 * cached under its name.
 *
 * Parameters (``KV``):
 *
 * - ``trace``: ``"true"`` logs every evaluated call at INFO level.
 */

namespace gridflow::lang
{

class InterpreterBackend final : public master::plugin::IBackend
{
  public:
    explicit InterpreterBackend(const master::plugin::KV& params = {});

    std::string name() const override { return "interpreter"; }

    std::optional<field::Value> execute(const master::plugin::OperatorDescriptor& op,
                                        const std::vector<field::Value>& args,
                                        const field::Value* out,
                                        const master::OffsetProvider& offset_provider) override;

    // Number of operators prepared so far.
    std::size_t prepared_count() const noexcept { return cache_.size(); }

  private:
    const Source& prepare(const master::plugin::OperatorDescriptor& op);

    field::Value run(const master::plugin::OperatorDescriptor& op,
                     const std::vector<field::Value>& args,
                     const master::OffsetProvider& offset_provider, int depth);

    std::unordered_map<std::string, std::shared_ptr<const Source>> cache_;
    bool trace_ = false;
};

} // namespace gridflow::lang
