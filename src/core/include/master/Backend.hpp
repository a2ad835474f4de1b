#pragma once
#include "master/Errors.hpp"
#include "master/plugin/Backend.hpp"
#include <memory>
#include <string>
#include <utility>

/**
 * @file Backend.hpp
 * @brief Backend selector passed to an operator call.
 *
 * @details
 * The set of backend *kinds* is closed: ``Embedded`` runs the operator's C++ body in
 * process, ``External`` hands it to an :cpp:struct:`plugin::IBackend`. Which external
 * implementations exist is open and resolved by key through
 * :cpp:class:`gridflow::master::Runtime`.
 */

namespace gridflow::master
{

class Backend
{
  public:
    enum class Kind
    {
        Embedded,
        External
    };

    Backend() = default;

    static Backend embedded() { return Backend{}; }

    static Backend external(std::shared_ptr<plugin::IBackend> impl)
    {
        if (!impl)
            throw BackendError("External backend without an implementation");
        Backend b;
        b.kind_ = Kind::External;
        b.impl_ = std::move(impl);
        return b;
    }

    Kind kind() const noexcept { return kind_; }
    plugin::IBackend* impl() const noexcept { return impl_.get(); }
    std::string name() const { return impl_ ? impl_->name() : std::string("embedded"); }

  private:
    Kind kind_ = Kind::Embedded;
    std::shared_ptr<plugin::IBackend> impl_;
};

} // namespace gridflow::master
