#pragma once
#include "master/plugin/Backend.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file Registry.hpp
 * @brief Runtime factory registry for external execution backends.
 *
 * @details
 * Shared libraries register factories under string keys using the exported function
 * :cpp:func:`gridflow_backend_register_v1`. The application resolves keys (e.g., from
 * YAML) and constructs the selected backends.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   extern "C" bool gridflow_backend_register_v1(Registry* R) {
 *     R->add_backend("my_jit", [](const KV& kv){ return std::make_shared<MyJit>(kv); });
 *     return true;
 *   }
 * @endrst
 */

namespace gridflow::master::plugin
{

class Registry
{
  public:
    using CreateBackend = std::function<std::shared_ptr<IBackend>(const KV&)>;

    void add_backend(std::string key, CreateBackend f) { backends_[std::move(key)] = std::move(f); }

    // Throws BackendError for unknown keys.
    std::shared_ptr<IBackend> make_backend(const std::string& key, const KV&) const;

    bool contains(const std::string& key) const { return backends_.count(key) != 0; }
    std::vector<std::string> keys() const;

  private:
    std::unordered_map<std::string, CreateBackend> backends_;
};

// Plugin entry point
using RegisterFn = bool (*)(Registry*);
inline constexpr const char* kRegisterSymbol = "gridflow_backend_register_v1";

} // namespace gridflow::master::plugin
