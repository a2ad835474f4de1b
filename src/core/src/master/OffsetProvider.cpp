#include "master/OffsetProvider.hpp"
#include "master/Errors.hpp"
#include "master/Log.hpp"

namespace gridflow::master
{

namespace
{
thread_local const OffsetProvider* t_active = nullptr;
} // namespace

const ProviderEntry& OffsetProvider::at(std::string_view name) const
{
    auto it = entries_.find(std::string(name));
    if (it == entries_.end())
        throw OffsetProviderError("No offset provider entry for '" + std::string(name) + "'");
    return it->second;
}

const OffsetProvider* active_offset_provider() noexcept
{
    return t_active;
}

const OffsetProvider& require_offset_provider()
{
    if (!t_active)
        throw ContextError("Field offsets can only be applied inside a field operator call");
    return *t_active;
}

OffsetProviderScope::OffsetProviderScope(const OffsetProvider& provider)
{
    if (t_active)
        throw ContextError("An offset provider context is already active on this thread");
    t_active = &provider;
    LOGD("[ctx] offset provider opened (%zu entries)\n", provider.size());
}

OffsetProviderScope::~OffsetProviderScope()
{
    t_active = nullptr;
    LOGD("[ctx] offset provider closed\n");
}

} // namespace gridflow::master
