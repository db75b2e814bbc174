#include <xgx/error/format.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

#include "error_values.hpp"

namespace xgx
{

namespace detail
{

void format_verbose(error_node::format_buffer &out, error const &e)
{
    if (!e)
    {
        fmt::format_to(std::back_inserter(out), "<nil>");
        return;
    }
    e.node()->format_verbose(out);
}

void format_verbose(error_node::format_buffer &out,
                    code const &classification,
                    std::string_view msg,
                    context const &fields,
                    error const &cause,
                    stack_trace const &stack)
{
    auto it = std::back_inserter(out);

    if (!classification.empty())
    {
        fmt::format_to(it, "code={} ", classification);
    }
    fmt::format_to(it, "msg={:?}", msg);

    if (std::any_of(fields.begin(), fields.end(),
                    [](field const &f) { return !f.key.empty(); }))
    {
        fmt::format_to(it, "\nctx:");
        for (auto const &f : fields)
        {
            if (!f.key.empty())
            {
                fmt::format_to(it, " {}={}", f.key, f.value);
            }
        }
    }

    if (cause)
    {
        fmt::format_to(it, "\ncause: ");
        format_verbose(out, cause);
    }

    if (!stack.empty())
    {
        fmt::format_to(it, "\nstack:");
        for (auto const &frame : stack)
        {
            fmt::format_to(it, "\n  {} {}:{}", frame.function, frame.file,
                           frame.line);
        }
    }
}

} // namespace detail

auto diagnostic_information(error const &e, error_message_format format)
        -> std::string
{
    if (!e)
    {
        return std::string{"<nil>"};
    }
    if (format == error_message_format::simple)
    {
        return e.message();
    }

    error_node::format_buffer buffer;
    detail::format_verbose(buffer, e);
    return fmt::to_string(buffer);
}

auto operator<<(std::ostream &out, error const &e) -> std::ostream &
{
    return out << diagnostic_information(e, error_message_format::simple);
}

auto operator<<(std::ostream &out, fault const &f) -> std::ostream &
{
    return out << f.as_error();
}

} // namespace xgx
