#pragma once

#include <cstddef>

#include <string_view>
#include <utility>
#include <vector>

#include <boost/config.hpp>

#include <xgx/error/code.hpp>
#include <xgx/error/context.hpp>
#include <xgx/error/error_node.hpp>
#include <xgx/error/error_value.hpp>

namespace xgx
{

namespace detail
{
auto wrap_fields(error e, std::string_view msg, std::vector<field> fields)
        -> fault;
auto with_field(error e, field f) -> fault;
} // namespace detail

/**
 * Lifts an arbitrary error into a native value.
 *
 * Native values are shared as is, foreign errors become the cause of an
 * "internal error" failure. The null error stays null.
 */
[[nodiscard]] auto from(error e) -> fault;

// adds context to e, a null e materializes an internal failure
template <typename... KVs>
[[nodiscard]] inline auto wrap(error e, std::string_view msg, KVs &&...kvs)
        -> fault
{
    return detail::wrap_fields(std::move(e), msg,
                               make_fields(std::forward<KVs>(kvs)...));
}

template <typename V>
[[nodiscard]] inline auto with(error e, std::string_view key, V &&value)
        -> fault
{
    return detail::with_field(
            std::move(e),
            field{std::string(key), to_field_value(std::forward<V>(value))});
}

[[nodiscard]] auto recode(error e, code c) -> fault;

// the recorded stack starts at the caller
[[nodiscard]] BOOST_NOINLINE auto with_stack(error e) -> fault;
// the recorded stack starts skip frames above the caller
[[nodiscard]] BOOST_NOINLINE auto with_stack_skip(error e, std::size_t skip)
        -> fault;

} // namespace xgx
