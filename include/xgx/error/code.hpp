#pragma once

#include <compare>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <xgx/error/fwd.hpp>

namespace xgx
{

namespace codes
{
// domain
inline constexpr std::string_view bad_request = "bad_request";
inline constexpr std::string_view unauthorized = "unauthorized";
inline constexpr std::string_view forbidden = "forbidden";
inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view conflict = "conflict";
inline constexpr std::string_view invalid = "invalid";
inline constexpr std::string_view unprocessable = "unprocessable";
inline constexpr std::string_view too_many_requests = "too_many_requests";

// availability
inline constexpr std::string_view timeout = "timeout";
inline constexpr std::string_view unavailable = "unavailable";

// meta
inline constexpr std::string_view internal = "internal";
inline constexpr std::string_view defect = "defect";
inline constexpr std::string_view interrupt = "interrupt";
} // namespace codes

/**
 * An opaque classification tag. The empty code signals the absence of a
 * classification. Custom codes don't need to be registered anywhere.
 */
class code final
{
public:
    code() noexcept = default;
    code(std::string_view value)
        : mValue(value)
    {
    }
    code(char const *value)
        : mValue(value)
    {
    }
    explicit code(std::string value) noexcept
        : mValue(std::move(value))
    {
    }

    [[nodiscard]] auto value() const noexcept -> std::string_view
    {
        return mValue;
    }
    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return mValue.empty();
    }
    [[nodiscard]] auto is_builtin() const noexcept -> bool;

    friend auto operator==(code const &, code const &) noexcept
            -> bool = default;
    friend auto operator<=>(code const &, code const &) noexcept
            -> std::strong_ordering = default;

private:
    std::string mValue;
};

// returns a fresh copy of the built-in codes in declaration order
auto builtin_codes() -> std::vector<code>;

auto is_builtin(std::string_view value) noexcept -> bool;

inline auto code::is_builtin() const noexcept -> bool
{
    return xgx::is_builtin(mValue);
}

inline auto operator<<(std::ostream &out, code const &c) -> std::ostream &
{
    return out << c.value();
}

} // namespace xgx

template <>
struct fmt::formatter<xgx::code> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(xgx::code const &c, FormatContext &ctx) const
            -> decltype(ctx.out())
    {
        return fmt::formatter<std::string_view>::format(c.value(), ctx);
    }
};
