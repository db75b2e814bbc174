#pragma once

#include <cstddef>

#include <atomic>
#include <functional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <xgx/error/code.hpp>
#include <xgx/error/fwd.hpp>
#include <xgx/utils/ref_ptr.hpp>

namespace xgx
{

/**
 * The common base of every node within an error graph.
 *
 * Nodes are immutable after construction and reference counted, they are
 * shared between threads through error handles. A node type describes how
 * traversals recognize it as already visited by overriding identity().
 */
class error_node
{
public:
    using format_buffer = fmt::basic_memory_buffer<
            char,
            detail::error_format_stack_buffer_size>;

    error_node(error_node const &) = delete;
    auto operator=(error_node const &) -> error_node & = delete;

    // the concise single line description
    [[nodiscard]] virtual auto message() const -> std::string = 0;

    [[nodiscard]] virtual auto identity() const noexcept -> node_identity
    {
        return node_identity::reference;
    }
    // only consulted for node_identity::value nodes
    [[nodiscard]] virtual auto equals(error_node const &other) const noexcept
            -> bool
    {
        return this == &other;
    }
    [[nodiscard]] virtual auto hash_value() const noexcept -> std::size_t
    {
        return std::hash<void const *>{}(this);
    }

    // appends the structured multi line description
    virtual void format_verbose(format_buffer &out) const;

    void add_reference() const noexcept;
    void release() const noexcept;

protected:
    error_node() noexcept = default;
    virtual ~error_node() = default;

private:
    mutable std::atomic_int mRefCtr{1};
};

inline void error_node::add_reference() const noexcept
{
    mRefCtr.fetch_add(1, std::memory_order_relaxed);
}
inline void error_node::release() const noexcept
{
    if (mRefCtr.fetch_sub(1, std::memory_order_acq_rel) == 1)
    {
        delete this;
    }
}

/**
 * A nullable shared handle to an immutable error node.
 *
 * The null handle signals the absence of an error.
 */
class error final
{
public:
    using node_ptr = utils::ref_ptr<error_node const>;

    error() noexcept = default;
    error(std::nullptr_t) noexcept
        : mNode()
    {
    }
    explicit error(node_ptr node) noexcept
        : mNode(std::move(node))
    {
    }

    explicit operator bool() const noexcept
    {
        return static_cast<bool>(mNode);
    }

    [[nodiscard]] auto node() const noexcept -> error_node const *
    {
        return mNode.get();
    }
    [[nodiscard]] auto node_ref() const noexcept -> node_ptr const &
    {
        return mNode;
    }

    // the concise description, empty for the null error
    [[nodiscard]] auto message() const -> std::string;

    // queries a node capability, e.g. error_value or single_unwrapper
    template <typename T>
    [[nodiscard]] auto as() const noexcept -> T const *
    {
        return dynamic_cast<T const *>(mNode.get());
    }

    /**
     * Two handles compare equal if they refer to the same node or if both
     * refer to value identity nodes which equal each other.
     */
    friend auto operator==(error const &lhs, error const &rhs) noexcept
            -> bool;

private:
    node_ptr mNode;
};

// a node with exactly one (possibly null) child
class single_unwrapper
{
public:
    [[nodiscard]] virtual auto unwrap() const -> error = 0;

protected:
    virtual ~single_unwrapper() = default;
};

// a node with an ordered list of children, null children are skipped
class multi_unwrapper
{
public:
    [[nodiscard]] virtual auto unwrap_all() const noexcept
            -> std::span<error const> = 0;

protected:
    virtual ~multi_unwrapper() = default;
};

// a node which reports a code
class classified
{
public:
    [[nodiscard]] virtual auto classification() const -> code = 0;

protected:
    virtual ~classified() = default;
};

template <typename Node, typename... Args>
    requires std::is_base_of_v<error_node, Node>
inline auto make_node(Args &&...args) -> error
{
    return error{utils::make_ref_counted<Node>(std::forward<Args>(args)...)};
}

// the sentinel causes of interrupts, both are statically allocated
auto canceled() noexcept -> error;
auto deadline_exceeded() noexcept -> error;

} // namespace xgx
