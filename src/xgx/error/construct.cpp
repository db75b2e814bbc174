#include <xgx/error/construct.hpp>

#include "error_values.hpp"

namespace xgx
{

namespace detail
{

auto make_classified(code classification,
                     std::string msg,
                     std::vector<field> fields) -> fault
{
    return make_failure(error_state{
            .message = std::move(msg),
            .classification = std::move(classification),
            .fields = context{std::move(fields)},
    });
}

} // namespace detail

auto invalid(std::string_view fieldName, std::string_view reason) -> fault
{
    return detail::make_classified(
            codes::invalid, "invalid " + std::string{fieldName},
            make_fields("field", fieldName, "reason", reason));
}

auto unprocessable(std::string_view fieldName, std::string_view reason)
        -> fault
{
    return detail::make_classified(
            codes::unprocessable, "unprocessable " + std::string{fieldName},
            make_fields("field", fieldName, "reason", reason));
}

auto bad_request(std::string_view msg) -> fault
{
    return detail::make_classified(codes::bad_request, std::string{msg}, {});
}

auto unauthorized(std::string_view msg) -> fault
{
    return detail::make_classified(codes::unauthorized, std::string{msg}, {});
}

auto conflict(std::string_view msg) -> fault
{
    return detail::make_classified(codes::conflict, std::string{msg}, {});
}

auto forbidden(std::string_view resource) -> fault
{
    return detail::make_classified(codes::forbidden, "forbidden",
                                   make_fields("resource", resource));
}

auto too_many_requests(std::string_view resource) -> fault
{
    return detail::make_classified(codes::too_many_requests,
                                   "too many requests",
                                   make_fields("resource", resource));
}

auto timeout(std::chrono::nanoseconds after) -> fault
{
    return detail::make_classified(codes::timeout, "timeout",
                                   make_fields("timeout_ms",
                        std::chrono::duration_cast<std::chrono::milliseconds>(
                                after)));
}

auto unavailable(std::string_view service) -> fault
{
    return detail::make_classified(codes::unavailable, "unavailable",
                                   make_fields("service", service));
}

BOOST_NOINLINE auto internal(error cause) -> fault
{
    return detail::make_failure(detail::error_state{
            .message = "internal error",
            .classification = codes::internal,
            .cause = std::move(cause),
            .stack = stack_trace::capture(1u),
    });
}

BOOST_NOINLINE auto defect(error cause) -> fault
{
    return detail::make_defect(detail::error_state{
            .cause = std::move(cause),
            .stack = stack_trace::capture(1u),
    });
}

auto interrupt(std::string_view reason) -> fault
{
    return detail::make_interrupt(detail::error_state{
            .message = std::string{reason},
            .cause = canceled(),
    });
}

auto interrupt_deadline(std::string_view reason) -> fault
{
    return detail::make_interrupt(detail::error_state{
            .message = std::string{reason},
            .cause = deadline_exceeded(),
    });
}

} // namespace xgx
