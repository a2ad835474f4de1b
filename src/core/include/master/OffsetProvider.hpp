#pragma once
#include "field/Connectivity.hpp"
#include "field/Dimension.hpp"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>

/**
 * @file OffsetProvider.hpp
 * @brief Offset-name -> (Connectivity | Dimension) map and its scoped activation.
 *
 * @details
 * An outermost operator call activates its provider with an
 * :cpp:class:`OffsetProviderScope`; every shift evaluated during the call (including in
 * nested calls) resolves offset names through :cpp:func:`require_offset_provider`. The
 * active slot is thread-local and is **not** a stack: opening a scope while another one
 * is active is a :cpp:class:`gridflow::ContextError`. The scope clears the slot on every
 * exit path.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   OffsetProvider op{{"E2C", e2c}, {"Koff", K}};
 *   {
 *       OffsetProviderScope scope(op);
 *       auto g = cell_values(E2C[1]);
 *   } // released here, also when the body throws
 * @endrst
 *
 * @note Providers are held by reference while active; they must outlive the scope.
 */

namespace gridflow::master
{

using ProviderEntry = std::variant<field::Connectivity, field::Dimension>;

class OffsetProvider
{
  public:
    using Map = std::unordered_map<std::string, ProviderEntry>;

    OffsetProvider() = default;
    OffsetProvider(std::initializer_list<Map::value_type> entries) : entries_(entries) {}

    void add(std::string name, field::Connectivity c)
    {
        entries_.insert_or_assign(std::move(name), std::move(c));
    }
    void add(std::string name, field::Dimension d)
    {
        entries_.insert_or_assign(std::move(name), std::move(d));
    }

    bool empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }
    bool contains(std::string_view name) const { return entries_.count(std::string(name)) != 0; }

    // Throws OffsetProviderError when the name is not registered.
    const ProviderEntry& at(std::string_view name) const;

    Map::const_iterator begin() const noexcept { return entries_.begin(); }
    Map::const_iterator end() const noexcept { return entries_.end(); }

  private:
    Map entries_;
};

// nullptr when no outermost call is in flight on this thread
const OffsetProvider* active_offset_provider() noexcept;

// Throws ContextError outside an operator call.
const OffsetProvider& require_offset_provider();

class OffsetProviderScope
{
  public:
    explicit OffsetProviderScope(const OffsetProvider& provider);
    ~OffsetProviderScope();
    OffsetProviderScope(const OffsetProviderScope&) = delete;
    OffsetProviderScope& operator=(const OffsetProviderScope&) = delete;
};

} // namespace gridflow::master
