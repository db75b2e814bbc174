#include <xgx/error/wrap.hpp>

#include <xgx/error/stack.hpp>

#include "error_values.hpp"

namespace xgx
{

namespace
{

auto as_fault(error const &e) -> fault
{
    return fault{utils::dynamic_ref_cast<error_value const>(e.node_ref())};
}

// the foreign error becomes the cause of a new failure
auto enclose(error cause,
             std::string_view msg,
             code classification,
             context fields = {},
             stack_trace stack = {}) -> fault
{
    return detail::make_failure(detail::error_state{
            .message = std::string{msg},
            .classification = std::move(classification),
            .fields = std::move(fields),
            .cause = std::move(cause),
            .stack = std::move(stack),
    });
}

} // namespace

namespace detail
{

auto wrap_fields(error e, std::string_view msg, std::vector<field> fields)
        -> fault
{
    if (!e)
    {
        return enclose({}, msg, codes::internal, context{std::move(fields)});
    }
    if (auto native = as_fault(e))
    {
        return native.node()->add_context(msg, fields);
    }
    return enclose(std::move(e), msg, codes::internal,
                   context{std::move(fields)});
}

auto with_field(error e, field f) -> fault
{
    if (!e)
    {
        return enclose({}, "error", codes::internal,
                       context{}.append(std::move(f)));
    }
    if (auto native = as_fault(e))
    {
        return native.node()->with_field(std::move(f));
    }
    return enclose(std::move(e), "internal error", codes::internal,
                   context{}.append(std::move(f)));
}

} // namespace detail

auto from(error e) -> fault
{
    if (!e)
    {
        return {};
    }
    if (auto native = as_fault(e))
    {
        return native;
    }
    return enclose(std::move(e), "internal error", codes::internal);
}

auto recode(error e, code c) -> fault
{
    if (!e)
    {
        return enclose({}, "error", std::move(c));
    }
    if (auto native = as_fault(e))
    {
        return native.node()->reclassify(std::move(c));
    }
    return enclose(std::move(e), "internal error", std::move(c));
}

BOOST_NOINLINE auto with_stack(error e) -> fault
{
    if (!e)
    {
        return enclose({}, "error", codes::internal, {},
                       stack_trace::capture(1u));
    }
    if (auto native = as_fault(e))
    {
        return native.node()->capture_stack(1u);
    }
    return enclose(std::move(e), "internal error", codes::internal, {},
                   stack_trace::capture(1u));
}

BOOST_NOINLINE auto with_stack_skip(error e, std::size_t skip) -> fault
{
    if (!e)
    {
        return enclose({}, "error", codes::internal, {},
                       stack_trace::capture(skip + 1u));
    }
    if (auto native = as_fault(e))
    {
        return native.node()->capture_stack(skip + 1u);
    }
    return enclose(std::move(e), "internal error", codes::internal, {},
                   stack_trace::capture(skip + 1u));
}

} // namespace xgx
