#pragma once
#include "master/Backend.hpp"
#include "master/PluginHost.hpp"
#include "master/io/ConfigYAML.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

/**
 * @file Runtime.hpp
 * @brief Application façade that wires logging, backend plugins and backend selection.
 *
 * @details
 * Typical usage:
 *
 * @rst
 * .. code-block:: cpp
 *
 *   gridflow::master::Runtime rt(load_config_from_yaml("gridflow.yml"));
 *   rt.load_plugin_library("libgridflow_jit.so");
 *
 *   auto be = rt.backend("interpreter");           // or rt.default_backend()
 *   op.call(into(out, offsets, be), a, b);
 * @endrst
 *
 * External backends are created once per key and shared by every call that selects
 * them, so their per-operator caches survive across calls.
 */

namespace gridflow::master
{

class Runtime
{
  public:
    explicit Runtime(RuntimeConfig cfg = {});

    const RuntimeConfig& config() const noexcept { return cfg_; }

    // Plugins
    void load_plugin_library(const std::filesystem::path& lib) { plugins_.load_library(lib); }
    const PluginHost& plugins() const noexcept { return plugins_; }

    // "embedded" or a registered key; throws BackendError for unknown keys.
    Backend backend(const std::string& key);
    // Resolved at construction; a bad backend.default key fails there.
    Backend default_backend() const { return default_; }

  private:
    RuntimeConfig cfg_;
    PluginHost plugins_;
    std::unordered_map<std::string, Backend> backends_;
    Backend default_ = Backend::embedded();
};

} // namespace gridflow::master
