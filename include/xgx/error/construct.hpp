#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/config.hpp>

#include <xgx/error/context.hpp>
#include <xgx/error/error_node.hpp>
#include <xgx/error/error_value.hpp>

namespace xgx
{

namespace detail
{
auto make_classified(code classification,
                     std::string msg,
                     std::vector<field> fields) -> fault;
}

// "<entity> not found" {entity, id}
template <typename Id>
[[nodiscard]] inline auto not_found(std::string_view entity, Id &&id) -> fault
{
    return detail::make_classified(
            codes::not_found, std::string{entity} + " not found",
            make_fields("entity", entity, "id", std::forward<Id>(id)));
}

// "invalid <field>" {field, reason}
[[nodiscard]] auto invalid(std::string_view fieldName, std::string_view reason)
        -> fault;
// "unprocessable <field>" {field, reason}
[[nodiscard]] auto unprocessable(std::string_view fieldName,
                                 std::string_view reason) -> fault;

[[nodiscard]] auto bad_request(std::string_view msg) -> fault;
[[nodiscard]] auto unauthorized(std::string_view msg) -> fault;
[[nodiscard]] auto conflict(std::string_view msg) -> fault;
[[nodiscard]] auto forbidden(std::string_view resource) -> fault;
[[nodiscard]] auto too_many_requests(std::string_view resource) -> fault;

// {timeout_ms} in whole milliseconds, truncated toward zero
[[nodiscard]] auto timeout(std::chrono::nanoseconds after) -> fault;
[[nodiscard]] auto unavailable(std::string_view service) -> fault;

// "internal error" wrapping cause, the stack is recorded at the caller
[[nodiscard]] BOOST_NOINLINE auto internal(error cause = {}) -> fault;

/**
 * A programming error. The stack is recorded at the caller and a null
 * cause is replaced by a "nil defect" leaf.
 */
[[nodiscard]] BOOST_NOINLINE auto defect(error cause = {}) -> fault;

// caused by the canceled() sentinel
[[nodiscard]] auto interrupt(std::string_view reason = {}) -> fault;
// caused by the deadline_exceeded() sentinel
[[nodiscard]] auto interrupt_deadline(std::string_view reason = {}) -> fault;

// a generic internal failure without a stack
template <typename... KVs>
[[nodiscard]] inline auto make_error(std::string_view msg, KVs &&...kvs)
        -> fault
{
    return detail::make_classified(codes::internal, std::string{msg},
                                   make_fields(std::forward<KVs>(kvs)...));
}

} // namespace xgx
