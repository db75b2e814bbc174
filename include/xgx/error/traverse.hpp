#pragma once

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include <xgx/error/error_node.hpp>

namespace xgx
{

/**
 * Collects the leaves of the unwrap graph of root in depth first order.
 *
 * Multi children are expanded left to right, single unwrap chains are
 * followed without reporting the chain links. Each node is expanded at most
 * once. If the traversal hits max_traversal_depth or max_traversal_nodes it
 * stops and returns the leaves collected so far.
 */
[[nodiscard]] auto flatten(error const &root) -> std::vector<error>;

// the first leaf of flatten(), null for null
[[nodiscard]] auto root(error const &e) -> error;

// true if any node reachable from e compares equal to target
[[nodiscard]] auto has(error const &e, error const &target) -> bool;

namespace detail
{
using visit_fn = bool (*)(void *state, error const &node);

void walk(error const &root, visit_fn visit, void *state);
} // namespace detail

/**
 * Calls visitor for each distinct node reachable from root in pre-order,
 * i.e. before the children of the node are expanded. Returning false from
 * the visitor stops the traversal.
 */
template <typename Visitor>
    requires std::is_invocable_r_v<bool, Visitor &, error const &>
inline void walk(error const &root, Visitor &&visitor)
{
    using visitor_type = std::remove_reference_t<Visitor>;

    detail::walk(
            root,
            [](void *state, error const &node) -> bool
            { return (*static_cast<visitor_type *>(state))(node); },
            const_cast<void *>(
                    static_cast<void const *>(std::addressof(visitor))));
}

} // namespace xgx
