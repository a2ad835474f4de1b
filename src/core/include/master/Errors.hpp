#pragma once
#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Exception taxonomy of the runtime.
 *
 * @details
 * Every failure is synchronous and aborts the current call. All types derive from
 * ``std::runtime_error`` so callers that only care about "something failed" can keep
 * catching that.
 *
 * - :cpp:class:`ShapeError`          dims/rank mismatch, bad broadcast set, ``out`` mismatch
 * - :cpp:class:`IndexError`          external index outside the origin-shifted range
 * - :cpp:class:`ConnectivityError`   illegal table entry, offset/connectivity disagreement
 * - :cpp:class:`ContextError`        offset-provider context discipline
 * - :cpp:class:`OffsetProviderError` missing or unsupported provider entry
 * - :cpp:class:`TupleShapeError`     ``where`` branches with different tuple structure
 * - :cpp:class:`BackendError`        backend resolution / execution
 * - :cpp:class:`ClosureError`        closure extraction
 * - :cpp:class:`ParseError`          operator source text
 * - :cpp:class:`EvalError`           interpreter evaluation
 */

namespace gridflow
{

struct Error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ShapeError : Error
{
    using Error::Error;
};
struct IndexError : Error
{
    using Error::Error;
};
struct ConnectivityError : Error
{
    using Error::Error;
};
struct ContextError : Error
{
    using Error::Error;
};
struct OffsetProviderError : Error
{
    using Error::Error;
};
struct TupleShapeError : Error
{
    using Error::Error;
};
struct BackendError : Error
{
    using Error::Error;
};
struct ClosureError : Error
{
    using Error::Error;
};
struct ParseError : Error
{
    using Error::Error;
};
struct EvalError : Error
{
    using Error::Error;
};

} // namespace gridflow
