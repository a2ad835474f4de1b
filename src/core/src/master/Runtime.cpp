#include "master/Runtime.hpp"
#include "master/Errors.hpp"
#include "master/Log.hpp"
#include <utility>

namespace gridflow::master
{

Runtime::Runtime(RuntimeConfig cfg) : cfg_(std::move(cfg))
{
    logx::init({.level = logx::level_from_string(cfg_.log.level),
                .rank0_only = cfg_.log.rank0_only});
    for (const auto& lib : cfg_.plugin_libs)
        plugins_.load_library(lib);
    default_ = backend(cfg_.default_backend);
}

Backend Runtime::backend(const std::string& key)
{
    if (key == "embedded")
        return Backend::embedded();
    if (auto it = backends_.find(key); it != backends_.end())
        return it->second;

    plugin::KV params;
    if (auto it = cfg_.backend_params.find(key); it != cfg_.backend_params.end())
        params = it->second;
    Backend b = Backend::external(plugins_.make_backend(key, params));
    LOGI("[runtime] backend '%s' ready\n", key.c_str());
    return backends_.emplace(key, std::move(b)).first->second;
}

} // namespace gridflow::master
