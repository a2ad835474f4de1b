#pragma once
#include "lang/Environment.hpp"
#include "lang/Source.hpp"
#include <set>
#include <string>

/**
 * @file Closure.hpp
 * @brief Static free-variable analysis of an operator's source form.
 *
 * @details
 * :cpp:func:`extract_closure_vars` returns the entries of ``env`` that the operator
 * needs and does not bind itself:
 *
 * - every symbol of the body (call heads included) that is neither a local (parameter
 *   or assignment target), an arithmetic primitive nor a syntax word;
 * - every dimension named in a parameter annotation that ``env`` binds to a
 *   :cpp:class:`gridflow::field::Dimension`.
 *
 * Numbers and booleans are never captured. The result is only consumed by external
 * backends; the embedded path runs the C++ body and ignores it.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto src = parse_operator(
 *       "(field_operator f ((x Field Edge)) (neighbor_sum (x C2E) C2EDim))");
 *   auto captured = extract_closure_vars(src, with_builtins(user_env));
 *   // captured: Edge, C2E, C2EDim, neighbor_sum
 * @endrst
 */

namespace gridflow::lang
{

// Parameter names plus every assignment target of the body.
std::set<std::string> local_names(const Source& src);

// Names the body references that are not locally bound and not primitives.
std::set<std::string> free_names(const Source& src);

// Throws ClosureError for unannotated parameters or names missing from @p env.
Environment extract_closure_vars(const Source& src, const Environment& env);

} // namespace gridflow::lang
