#pragma once

#include <cstddef>

#include <functional>
#include <unordered_set>

#include <xgx/error/error_node.hpp>
#include <xgx/error/fwd.hpp>

namespace xgx::detail
{

/**
 * Records the nodes a traversal has reached.
 *
 * Value identity nodes are deduplicated by equality, reference identity
 * nodes by address and transient nodes are always considered novel. The
 * recorded handles keep the nodes alive, i.e. an address can't be reused
 * during a traversal.
 */
class visit_guard final
{
public:
    visit_guard() = default;

    // returns true if e hasn't been seen before
    auto mark(error const &e) -> bool
    {
        ++mMarked;

        auto const node = e.node();
        switch (node->identity())
        {
        case node_identity::value:
            return mValues.insert(e).second;

        case node_identity::reference:
            return mIdentities.insert(e).second;

        case node_identity::transient:
        default:
            return true;
        }
    }

    [[nodiscard]] auto exhausted() const noexcept -> bool
    {
        return mMarked >= max_traversal_nodes;
    }

private:
    struct value_hash
    {
        auto operator()(error const &e) const noexcept -> std::size_t
        {
            return e.node()->hash_value();
        }
    };
    struct value_equal
    {
        auto operator()(error const &lhs, error const &rhs) const noexcept
                -> bool
        {
            return lhs.node() == rhs.node() || lhs.node()->equals(*rhs.node());
        }
    };

    struct identity_hash
    {
        auto operator()(error const &e) const noexcept -> std::size_t
        {
            return std::hash<error_node const *>{}(e.node());
        }
    };
    struct identity_equal
    {
        auto operator()(error const &lhs, error const &rhs) const noexcept
                -> bool
        {
            return lhs.node() == rhs.node();
        }
    };

    std::unordered_set<error, value_hash, value_equal> mValues;
    std::unordered_set<error, identity_hash, identity_equal> mIdentities;
    std::size_t mMarked{0};
};

} // namespace xgx::detail
