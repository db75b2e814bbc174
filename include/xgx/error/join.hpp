#pragma once

#include <concepts>
#include <span>
#include <string>
#include <vector>

#include <xgx/error/error_node.hpp>

namespace xgx
{

/**
 * An aggregate of two or more non-null errors.
 *
 * The concise message lists the messages of the children separated by new
 * lines, the verbose form lists their verbose forms.
 */
class joined_error final : public error_node, public multi_unwrapper
{
public:
    explicit joined_error(std::vector<error> children) noexcept;

    auto message() const -> std::string override;
    void format_verbose(format_buffer &out) const override;

    auto unwrap_all() const noexcept -> std::span<error const> override
    {
        return mChildren;
    }

private:
    std::vector<error> mChildren;
};

/**
 * Aggregates errs without the null errors. Joining no error yields the null
 * error and joining a single error yields that error.
 */
[[nodiscard]] auto join(std::span<error const> errs) -> error;

template <typename... Errors>
    requires(std::convertible_to<Errors, error> && ...)
[[nodiscard]] inline auto join(Errors const &...errs) -> error
{
    error const all[] = {error(errs)..., error{}};
    return join(std::span<error const>(all, sizeof...(Errors)));
}

// join(head, more...)
[[nodiscard]] auto append(error head, std::span<error const> more) -> error;

template <typename... Errors>
    requires(std::convertible_to<Errors, error> && ...)
[[nodiscard]] inline auto append(error head, Errors const &...more) -> error
{
    error const all[] = {error(more)..., error{}};
    return append(std::move(head),
                  std::span<error const>(all, sizeof...(Errors)));
}

} // namespace xgx
