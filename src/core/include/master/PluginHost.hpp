#pragma once
#include "master/plugin/Registry.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

/**
 * @file PluginHost.hpp
 * @brief Loader for backend shared libraries and registry owner.
 *
 * @details
 * The host owns OS handles (``dlopen``/``LoadLibrary``) and builds backends from the
 * registered factories. A builtin **interpreter** backend is installed so the external
 * path can run without any plugin.
 *
 * @warning On Linux the application must link with ``dl`` to resolve ELF loader calls.
 */

namespace gridflow::master
{

class PluginHost
{
  public:
    PluginHost();
    ~PluginHost();
    PluginHost(const PluginHost&) = delete;
    PluginHost& operator=(const PluginHost&) = delete;
    PluginHost(PluginHost&&) noexcept;
    PluginHost& operator=(PluginHost&&) noexcept;

    void load_library(const std::filesystem::path& lib);
    std::shared_ptr<plugin::IBackend> make_backend(const std::string& key,
                                                   const plugin::KV& cfg) const;

    const plugin::Registry& registry() const noexcept { return reg_; }

  private:
    plugin::Registry reg_;
    std::vector<void*> handles_;
};

} // namespace gridflow::master
