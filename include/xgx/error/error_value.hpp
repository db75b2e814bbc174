#pragma once

#include <cstddef>

#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <boost/config.hpp>

#include <xgx/error/code.hpp>
#include <xgx/error/context.hpp>
#include <xgx/error/error_node.hpp>
#include <xgx/error/fwd.hpp>
#include <xgx/error/stack.hpp>
#include <xgx/utils/ref_ptr.hpp>

namespace xgx
{

/**
 * The capability set shared by the native error variants (failure, defect
 * and interrupt).
 *
 * Every mutator returns a new value and leaves the receiver untouched.
 */
class error_value : public error_node,
                    public single_unwrapper,
                    public classified
{
public:
    [[nodiscard]] virtual auto kind() const noexcept -> error_kind = 0;
    // the message as stored, message() composes the description
    [[nodiscard]] virtual auto raw_message() const noexcept
            -> std::string_view = 0;
    [[nodiscard]] virtual auto fields() const noexcept -> context const & = 0;
    [[nodiscard]] virtual auto stack() const noexcept -> stack_trace const & = 0;

    // sets the message if it is empty and appends the fields
    [[nodiscard]] virtual auto add_context(std::string_view msg,
                                           std::span<field const> more) const
            -> fault = 0;
    // add_context() which afterwards keeps the newest maxFields fields
    [[nodiscard]] virtual auto
    add_context_bounded(std::string_view msg,
                        std::size_t maxFields,
                        std::span<field const> more) const -> fault = 0;
    [[nodiscard]] virtual auto with_field(field f) const -> fault = 0;
    [[nodiscard]] virtual auto append_message(std::string_view msg) const
            -> fault = 0;
    [[nodiscard]] virtual auto replace_message(std::string_view msg) const
            -> fault = 0;
    // defects and interrupts have a fixed code and return a clone
    [[nodiscard]] virtual auto reclassify(code c) const -> fault = 0;
    /**
     * Records a fresh stack starting skip frames above the caller.
     * Defects keep their creation stack and interrupts never carry one,
     * both return a clone.
     */
    [[nodiscard]] virtual auto capture_stack(std::size_t skip) const
            -> fault = 0;

protected:
    error_value() noexcept = default;
};

/**
 * A nullable handle to a native error value with fluent copy-on-write
 * mutators.
 *
 * Mutating a null fault operates on a blank internal failure.
 */
class fault final
{
public:
    using node_ptr = utils::ref_ptr<error_value const>;

    fault() noexcept = default;
    fault(std::nullptr_t) noexcept
        : mNode()
    {
    }
    explicit fault(node_ptr node) noexcept
        : mNode(std::move(node))
    {
    }

    explicit operator bool() const noexcept
    {
        return static_cast<bool>(mNode);
    }
    operator error() const noexcept
    {
        return as_error();
    }
    [[nodiscard]] auto as_error() const noexcept -> error
    {
        return error{error::node_ptr{mNode}};
    }

    [[nodiscard]] auto node() const noexcept -> error_value const *
    {
        return mNode.get();
    }

    [[nodiscard]] auto kind() const noexcept -> error_kind;
    [[nodiscard]] auto message() const -> std::string;
    [[nodiscard]] auto raw_message() const noexcept -> std::string_view;
    [[nodiscard]] auto classification() const -> code;
    [[nodiscard]] auto cause() const -> error;
    [[nodiscard]] auto fields() const noexcept -> context const &;
    [[nodiscard]] auto context_snapshot() const -> context::snapshot_type;
    [[nodiscard]] auto stack() const noexcept -> stack_trace const &;

    template <typename... KVs>
    [[nodiscard]] auto add_context(std::string_view msg, KVs &&...kvs) const
            -> fault
    {
        auto const more = make_fields(std::forward<KVs>(kvs)...);
        return target().add_context(msg, more);
    }
    template <typename... KVs>
    [[nodiscard]] auto add_context_bounded(std::string_view msg,
                                           std::size_t maxFields,
                                           KVs &&...kvs) const -> fault
    {
        auto const more = make_fields(std::forward<KVs>(kvs)...);
        return target().add_context_bounded(msg, maxFields, more);
    }
    template <typename V>
    [[nodiscard]] auto with_field(std::string_view key, V &&value) const
            -> fault
    {
        return target().with_field(
                field{std::string(key), to_field_value(std::forward<V>(value))});
    }

    // concatenates with ": ", in contrast to add_context()
    [[nodiscard]] auto append_message(std::string_view msg) const -> fault;
    [[nodiscard]] auto replace_message(std::string_view msg) const -> fault;
    [[nodiscard]] auto reclassify(code c) const -> fault;
    // the recorded stack starts at the caller
    [[nodiscard]] BOOST_NOINLINE auto capture_stack() const -> fault;
    // the recorded stack starts skip frames above the caller
    [[nodiscard]] BOOST_NOINLINE auto
    capture_stack_skipping(std::size_t skip) const -> fault;

    friend auto operator==(fault const &lhs, fault const &rhs) noexcept -> bool
    {
        return lhs.mNode == rhs.mNode;
    }

private:
    [[nodiscard]] auto target() const noexcept -> error_value const &;

    node_ptr mNode;
};

template <typename Value, typename... Args>
    requires std::is_base_of_v<error_value, Value>
inline auto make_fault(Args &&...args) -> fault
{
    return fault{utils::make_ref_counted<Value>(std::forward<Args>(args)...)};
}

} // namespace xgx
