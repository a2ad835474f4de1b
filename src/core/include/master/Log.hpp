#pragma once
#include <string>

/**
 * @file Log.hpp
 * @brief printf-style leveled logging to stderr.
 *
 * @details
 * Verbosity comes from :cpp:struct:`Config` or, when the caller leaves the level at
 * ``Info``, from the ``GRIDFLOW_LOG`` environment variable
 * (``quiet|error|warn|info|debug``). When MPI is initialized, non-zero ranks get a
 * compact ``[rN]`` tag and INFO/DEBUG can be collapsed to rank 0. The rank is looked
 * up again on the first message after MPI comes up, so logging before ``MPI_Init`` is
 * fine.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   gridflow::master::logx::init({.level = Level::Debug});
 *   LOGD("[op] %s: outermost call, backend=%s\n", name.c_str(), "embedded");
 *   if (logx::enabled(Level::Debug))
 *       dump_operator_tree(op);
 * @endrst
 */

namespace gridflow::master::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

struct Config
{
    Level level = Level::Info; // Info defers to GRIDFLOW_LOG
    bool rank0_only = false;   // gate INFO/DEBUG to rank 0
};

// Case-insensitive; "warning" and "full" are accepted aliases.
Level level_from_string(std::string s, Level dflt = Level::Info);

void init(const Config& cfg = {});

Level level() noexcept;
int rank() noexcept;

// False when a message at L would be dropped (level or rank gating).
bool enabled(Level L) noexcept;

void print(Level L, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

// clang-format off
#define LOGD(...)                                                                \
    ::gridflow::master::logx::print(::gridflow::master::logx::Level::Debug, __VA_ARGS__)
#define LOGI(...)                                                                \
    ::gridflow::master::logx::print(::gridflow::master::logx::Level::Info, __VA_ARGS__)
#define LOGW(...)                                                                \
    ::gridflow::master::logx::print(::gridflow::master::logx::Level::Warn, __VA_ARGS__)
#define LOGE(...)                                                                \
    ::gridflow::master::logx::print(::gridflow::master::logx::Level::Error, __VA_ARGS__)
// clang-format on

} // namespace gridflow::master::logx
