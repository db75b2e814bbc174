#include <xgx/error/error_value.hpp>

#include <utility>

#include <boost/config.hpp>

#include "error_values.hpp"

namespace xgx::detail
{

namespace
{

void set_message_once(std::string &current, std::string_view msg)
{
    if (current.empty() && !msg.empty())
    {
        current = msg;
    }
}

void concat_message(std::string &current, std::string_view msg)
{
    if (msg.empty())
    {
        return;
    }
    if (!current.empty())
    {
        current += ": ";
    }
    current += msg;
}

// the mutators shared by all variants, Derived only decides how a state is
// turned into a value of its kind
template <typename Derived>
class error_value_base : public error_value
{
public:
    explicit error_value_base(error_state state) noexcept
        : error_value()
        , mState(std::move(state))
    {
    }

    auto raw_message() const noexcept -> std::string_view override
    {
        return mState.message;
    }
    auto fields() const noexcept -> context const & override
    {
        return mState.fields;
    }
    auto stack() const noexcept -> stack_trace const & override
    {
        return mState.stack;
    }
    auto unwrap() const -> error override
    {
        return mState.cause;
    }

    auto add_context(std::string_view msg,
                     std::span<field const> more) const -> fault override
    {
        auto next = mState;
        set_message_once(next.message, msg);
        next.fields = next.fields.append(more);
        return Derived::rebuild(std::move(next));
    }
    auto add_context_bounded(std::string_view msg,
                             std::size_t maxFields,
                             std::span<field const> more) const
            -> fault override
    {
        auto next = mState;
        set_message_once(next.message, msg);
        next.fields = next.fields.append(more).keep_newest(maxFields);
        return Derived::rebuild(std::move(next));
    }
    auto with_field(field f) const -> fault override
    {
        auto next = mState;
        next.fields = next.fields.append(std::move(f));
        return Derived::rebuild(std::move(next));
    }
    auto append_message(std::string_view msg) const -> fault override
    {
        auto next = mState;
        concat_message(next.message, msg);
        return Derived::rebuild(std::move(next));
    }
    auto replace_message(std::string_view msg) const -> fault override
    {
        auto next = mState;
        next.message = msg;
        return Derived::rebuild(std::move(next));
    }

protected:
    error_state mState;
};

class failure_error final : public error_value_base<failure_error>
{
public:
    using error_value_base::error_value_base;

    static auto rebuild(error_state state) -> fault
    {
        return make_fault<failure_error>(std::move(state));
    }

    auto kind() const noexcept -> error_kind override
    {
        return error_kind::failure;
    }
    auto classification() const -> code override
    {
        return mState.classification;
    }
    auto message() const -> std::string override
    {
        auto const &c = mState.classification;
        if (mState.message.empty())
        {
            return c.empty() ? std::string{"error"} : std::string{c.value()};
        }
        if (c.empty())
        {
            return mState.message;
        }
        std::string composed{c.value()};
        composed += ": ";
        composed += mState.message;
        return composed;
    }

    auto reclassify(code c) const -> fault override
    {
        auto next = mState;
        next.classification = std::move(c);
        return rebuild(std::move(next));
    }
    BOOST_NOINLINE auto capture_stack(std::size_t skip) const -> fault override
    {
        auto next = mState;
        next.stack = stack_trace::capture(skip + 1u);
        return rebuild(std::move(next));
    }

    void format_verbose(format_buffer &out) const override
    {
        detail::format_verbose(out, mState.classification, mState.message,
                               mState.fields, mState.cause, mState.stack);
    }
};

class defect_error final : public error_value_base<defect_error>
{
public:
    using error_value_base::error_value_base;

    static auto rebuild(error_state state) -> fault
    {
        return make_fault<defect_error>(std::move(state));
    }

    auto kind() const noexcept -> error_kind override
    {
        return error_kind::defect;
    }
    auto classification() const -> code override
    {
        return codes::defect;
    }
    auto message() const -> std::string override
    {
        std::string composed{"defect"};
        if (!mState.message.empty())
        {
            composed += ": ";
            composed += mState.message;
        }
        else if (mState.cause)
        {
            composed += ": ";
            composed += mState.cause.message();
        }
        return composed;
    }

    auto reclassify(code) const -> fault override
    {
        return rebuild(mState);
    }
    // the creation stack is kept
    auto capture_stack(std::size_t) const -> fault override
    {
        return rebuild(mState);
    }

    void format_verbose(format_buffer &out) const override
    {
        detail::format_verbose(out, codes::defect, message(), mState.fields,
                               mState.cause, mState.stack);
    }
};

class interrupt_error final : public error_value_base<interrupt_error>
{
public:
    using error_value_base::error_value_base;

    static auto rebuild(error_state state) -> fault
    {
        return make_fault<interrupt_error>(std::move(state));
    }

    auto kind() const noexcept -> error_kind override
    {
        return error_kind::interrupt;
    }
    auto classification() const -> code override
    {
        return codes::interrupt;
    }
    auto message() const -> std::string override
    {
        if (mState.message.empty())
        {
            return std::string{"interrupt"};
        }
        return "interrupt: " + mState.message;
    }

    auto reclassify(code) const -> fault override
    {
        return rebuild(mState);
    }
    auto capture_stack(std::size_t) const -> fault override
    {
        return rebuild(mState);
    }

    void format_verbose(format_buffer &out) const override
    {
        detail::format_verbose(out, codes::interrupt, mState.message,
                               mState.fields, mState.cause, stack_trace{});
    }
};

// the leaf standing in for the absent cause of a defect
class nil_defect_error final : public error_node
{
public:
    auto message() const -> std::string override
    {
        return std::string{"nil defect"};
    }
};

} // namespace

auto make_failure(error_state state) -> fault
{
    return failure_error::rebuild(std::move(state));
}

auto make_defect(error_state state) -> fault
{
    state.classification = codes::defect;
    if (!state.cause)
    {
        state.cause = make_node<nil_defect_error>();
    }
    return defect_error::rebuild(std::move(state));
}

auto make_interrupt(error_state state) -> fault
{
    state.classification = codes::interrupt;
    state.stack = stack_trace{};
    return interrupt_error::rebuild(std::move(state));
}

auto blank_failure() noexcept -> error_value const &
{
    // never released, i.e. the instance can't be deleted
    static failure_error const blank{
            error_state{.classification = code{codes::internal}}};
    return blank;
}

} // namespace xgx::detail

namespace xgx
{

auto fault::target() const noexcept -> error_value const &
{
    return mNode ? *mNode : detail::blank_failure();
}

auto fault::kind() const noexcept -> error_kind
{
    return mNode ? mNode->kind() : error_kind::failure;
}

auto fault::message() const -> std::string
{
    return mNode ? mNode->message() : std::string{};
}

auto fault::raw_message() const noexcept -> std::string_view
{
    return mNode ? mNode->raw_message() : std::string_view{};
}

auto fault::classification() const -> code
{
    return mNode ? mNode->classification() : code{};
}

auto fault::cause() const -> error
{
    return mNode ? mNode->unwrap() : error{};
}

auto fault::fields() const noexcept -> context const &
{
    static context const empty{};
    return mNode ? mNode->fields() : empty;
}

auto fault::context_snapshot() const -> context::snapshot_type
{
    return fields().snapshot();
}

auto fault::stack() const noexcept -> stack_trace const &
{
    static stack_trace const empty{};
    return mNode ? mNode->stack() : empty;
}

auto fault::append_message(std::string_view msg) const -> fault
{
    return target().append_message(msg);
}

auto fault::replace_message(std::string_view msg) const -> fault
{
    return target().replace_message(msg);
}

auto fault::reclassify(code c) const -> fault
{
    return target().reclassify(std::move(c));
}

BOOST_NOINLINE auto fault::capture_stack() const -> fault
{
    return target().capture_stack(1u);
}

BOOST_NOINLINE auto fault::capture_stack_skipping(std::size_t skip) const
        -> fault
{
    return target().capture_stack(skip + 1u);
}

} // namespace xgx
