#pragma once

#include <xgx/error/code.hpp>
#include <xgx/error/error_node.hpp>
#include <xgx/error/fwd.hpp>

namespace xgx
{

// true if any node reachable from e is classified as c
[[nodiscard]] auto has_code(error const &e, code const &c) -> bool;

/**
 * Returns the first classification found in e, the empty code otherwise.
 *
 * code_search::primary_path follows the single cause chain and the first
 * non-null child of each join. code_search::full_graph considers every node
 * in walk() order.
 */
[[nodiscard]] auto classification_of(error const &e,
                                     code_search search
                                     = code_search::primary_path) -> code;

// unavailable, timeout or too_many_requests anywhere in e
[[nodiscard]] auto is_retryable(error const &e) -> bool;
[[nodiscard]] auto is_defect(error const &e) -> bool;
[[nodiscard]] auto is_interrupt(error const &e) -> bool;

[[nodiscard]] auto is_canceled(error const &e) -> bool;
[[nodiscard]] auto is_deadline_exceeded(error const &e) -> bool;

} // namespace xgx
