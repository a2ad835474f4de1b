#include "master/PluginHost.hpp"
#include "lang/Interpreter.hpp"
#include "master/Errors.hpp"
#include "master/Log.hpp"
#include <utility>

/// \cond DOXYGEN_EXCLUDE

#if defined(_WIN32)
#include <windows.h>

static void* load_so(const std::string& p)
{
    return (void*) ::LoadLibraryA(p.c_str());
}
static void close_so(void* h)
{
    if (h)
        ::FreeLibrary((HMODULE) h);
}
static void* load_sym(void* h, const char* s)
{
    return (void*) ::GetProcAddress((HMODULE) h, s);
}
static std::string last_error()
{
    return "error " + std::to_string(::GetLastError());
}

#else
#include <dlfcn.h>

static void* load_so(const std::string& p)
{
    return ::dlopen(p.c_str(), RTLD_NOW);
}
static void close_so(void* h)
{
    if (h)
        ::dlclose(h);
}
static void* load_sym(void* h, const char* s)
{
    return ::dlsym(h, s);
}
static std::string last_error()
{
    const char* e = ::dlerror();
    return e ? std::string(e) : std::string("unknown error");
}

#endif

/// \endcond

using namespace gridflow::master;

// ----- builtin "interpreter" backend so the external path runs with no plugins -----
namespace
{

inline void register_builtin_interpreter(plugin::Registry& r)
{
    r.add_backend("interpreter", [](const plugin::KV& kv)
                  { return std::make_shared<gridflow::lang::InterpreterBackend>(kv); });
}

} // namespace
// -----------------------------------------------------------------------------------

PluginHost::PluginHost()
{
    register_builtin_interpreter(reg_);
}

PluginHost::~PluginHost()
{
    for (void* h : handles_)
        close_so(h);
}

PluginHost::PluginHost(PluginHost&& o) noexcept
    : reg_(std::move(o.reg_)), handles_(std::move(o.handles_))
{
    o.handles_.clear();
}

PluginHost& PluginHost::operator=(PluginHost&& o) noexcept
{
    if (this != &o)
    {
        for (void* h : handles_)
            close_so(h);
        reg_ = std::move(o.reg_);
        handles_ = std::move(o.handles_);
        o.handles_.clear();
    }
    return *this;
}

void PluginHost::load_library(const std::filesystem::path& lib)
{
    auto* h = load_so(lib.string());
    if (!h)
        throw gridflow::BackendError("Failed to load plugin library: " + lib.string() + " (" +
                                     last_error() + ")");
    handles_.push_back(h);

    auto* sym = load_sym(h, plugin::kRegisterSymbol);
    if (!sym)
        throw gridflow::BackendError("Missing symbol in plugin: " +
                                     std::string(plugin::kRegisterSymbol));
    auto reg_fn = reinterpret_cast<plugin::RegisterFn>(sym);
    if (!reg_fn(&reg_))
        throw gridflow::BackendError("Plugin registration returned failure: " + lib.string());
    LOGI("[plugins] loaded %s\n", lib.string().c_str());
}

std::shared_ptr<plugin::IBackend> PluginHost::make_backend(const std::string& key,
                                                           const plugin::KV& cfg) const
{
    return reg_.make_backend(key, cfg);
}
