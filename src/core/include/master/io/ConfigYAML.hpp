#pragma once
#include <cctype>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML → RuntimeConfig loader and schema for the operator runtime.
 *
 * @details
 * @rst
 * The **YAML configuration** selects logging, the default backend and the backend
 * plugins. This file defines:
 *
 * - :cpp:struct:`RuntimeConfig`: the strongly-typed config object
 * - :cpp:func:`load_config_from_yaml`: parses a YAML file into :cpp:struct:`RuntimeConfig`
 *
 * **Schema (v0)**
 *
 * .. code-block:: yaml
 *
 *    log:
 *      level: info                  # quiet | error | warn | info | debug
 *      rank0_only: false            # collapse INFO/DEBUG to MPI rank 0
 *
 *    backend:
 *      default: embedded            # embedded | interpreter | <plugin key>
 *
 *    plugins:
 *      - lib: libgridflow_jit.so    # backend DSOs to load (in order)
 *
 *    backends:                      # free-form KV per backend key (string → string)
 *      interpreter:
 *        trace: "true"
 *
 * **Semantics**
 *
 * - Missing sections keep their defaults; unknown keys are ignored.
 * - An unknown ``log.level`` keeps ``info`` (which still honours ``GRIDFLOW_LOG``).
 * - ``backend.default`` is resolved lazily by
 *   :cpp:func:`gridflow::master::Runtime::default_backend`, so a key provided by a
 *   plugin is valid as long as the plugin is listed.
 *
 * **Core integration**
 *
 * - :cpp:class:`gridflow::master::Runtime` consumes the whole struct: it initializes
 *   logging, loads ``plugins`` through the plugin host and hands ``backends.<key>``
 *   to the factory of that key.
 * @endrst
 */

struct RuntimeConfig
{
    // log
    struct Log
    {
        std::string level = "info";
        bool rank0_only = false;
    } log;

    // backends
    std::string default_backend = "embedded";
    std::vector<std::string> plugin_libs{};
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>>
        backend_params{};
};

static inline std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}
static inline std::string parse_level(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "quiet" || v == "error" || v == "warn" || v == "info" || v == "debug")
        return v;
    if (v == "warning")
        return "warn";
    return "info";
}

inline RuntimeConfig load_config_from_yaml(const std::string& path)
{
    RuntimeConfig cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto L = root["log"])
    {
        if (auto n = L["level"])
            cfg.log.level = parse_level(n.as<std::string>());
        if (auto n = L["rank0_only"])
            cfg.log.rank0_only = n.as<bool>();
    }

    if (auto B = root["backend"])
    {
        if (auto n = B["default"])
            cfg.default_backend = to_lower(n.as<std::string>());
    }

    if (auto P = root["plugins"])
    {
        for (const auto& item : P)
        {
            if (auto n = item["lib"])
                cfg.plugin_libs.push_back(n.as<std::string>());
        }
    }

    if (auto K = root["backends"])
    {
        for (auto it = K.begin(); it != K.end(); ++it)
        {
            auto& params = cfg.backend_params[it->first.as<std::string>()];
            if (!it->second.IsMap())
                continue;
            for (auto p = it->second.begin(); p != it->second.end(); ++p)
                params.emplace(p->first.as<std::string>(), p->second.as<std::string>());
        }
    }

    return cfg;
}
