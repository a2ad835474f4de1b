#include "master/Log.hpp"
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mpi.h>

namespace gridflow::master::logx
{

namespace
{

std::atomic<Level> g_level{Level::Info};
std::atomic<bool> g_rank0_only{false};
std::atomic<int> g_rank{-1}; // -1: MPI not seen yet

int query_rank() noexcept
{
    int inited = 0;
    MPI_Initialized(&inited);
    if (!inited)
        return -1;
    int finalized = 0;
    MPI_Finalized(&finalized);
    if (finalized)
        return -1;
    int r = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &r);
    return r;
}

Level level_from_env()
{
    const char* v = std::getenv("GRIDFLOW_LOG");
    return v ? level_from_string(v) : Level::Info;
}

const char* level_tag(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "[error] ";
    case Level::Warn:
        return "[warn ] ";
    case Level::Info:
        return "[info ] ";
    case Level::Debug:
        return "[debug] ";
    default:
        return "";
    }
}

} // namespace

Level level_from_string(std::string s, Level dflt)
{
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "quiet")
        return Level::Quiet;
    if (s == "error")
        return Level::Error;
    if (s == "warn" || s == "warning")
        return Level::Warn;
    if (s == "info")
        return Level::Info;
    if (s == "debug" || s == "full")
        return Level::Debug;
    return dflt;
}

void init(const Config& cfg)
{
    g_rank.store(query_rank());
    g_level.store(cfg.level == Level::Info ? level_from_env() : cfg.level);
    g_rank0_only.store(cfg.rank0_only);
}

Level level() noexcept
{
    return g_level.load();
}

int rank() noexcept
{
    int r = g_rank.load();
    if (r < 0)
    {
        r = query_rank();
        if (r >= 0)
            g_rank.store(r);
    }
    return r < 0 ? 0 : r;
}

bool enabled(Level L) noexcept
{
    if (L == Level::Quiet || L > g_level.load())
        return false;
    if (g_rank0_only.load() && L >= Level::Info && rank() != 0)
        return false;
    return true;
}

void print(Level L, const char* fmt, ...)
{
    if (!enabled(L))
        return;
    std::fputs(level_tag(L), stderr);
    const int r = rank();
    if (r != 0 && L >= Level::Info)
        std::fprintf(stderr, "[r%d] ", r);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fflush(stderr);
}

} // namespace gridflow::master::logx
