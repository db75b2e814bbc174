#pragma once

#include <algorithm>
#include <ostream>
#include <string>

#include <fmt/format.h>

#include <xgx/error/error_node.hpp>
#include <xgx/error/error_value.hpp>
#include <xgx/error/fwd.hpp>

namespace xgx
{

/**
 * Renders e as text.
 *
 * error_message_format::simple yields the concise message,
 * error_message_format::with_diagnostics the structured verbose form
 * including context, causes and stack frames. The null error renders as
 * <nil>.
 */
[[nodiscard]] auto diagnostic_information(error const &e,
                                          error_message_format format)
        -> std::string;

auto operator<<(std::ostream &out, error const &e) -> std::ostream &;
auto operator<<(std::ostream &out, fault const &f) -> std::ostream &;

} // namespace xgx

// {} concise, {:v} verbose, {:!v} concise
template <>
struct fmt::formatter<xgx::error>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) -> decltype(ctx.begin())
    {
        constexpr auto errfmt = "invalid error formatter";

        int state = 0;
        auto xbegin = ctx.begin();
        auto xit = xbegin;
        auto xend = ctx.end();

        while (xit != xend)
        {
            auto const val = *xit;
            switch (state)
            {
            case 0:
                switch (val)
                {
                case '}':
                    xend = xit;
                    continue;

                case '!':
                    state = 1;
                    break;

                case 'v':
                    state = 2;
                    verbose = true;
                    break;

                default:
                    ctx.on_error(errfmt);
                    break;
                }
                break;

            case 1:
                if (val != 'v')
                {
                    ctx.on_error(errfmt);
                }
                state = 2;
                verbose = false;
                break;

            case 2:
                if (val != '}')
                {
                    ctx.on_error(errfmt);
                }
                xend = xit;
                continue;
            }
            ++xit;
        }

        return xend;
    }

    template <typename FormatContext>
    auto format(xgx::error const &e, FormatContext &ctx) const
            -> decltype(ctx.out())
    {
        auto const str = xgx::diagnostic_information(
                e, verbose ? xgx::error_message_format::with_diagnostics
                           : xgx::error_message_format::simple);
        return std::copy(str.cbegin(), str.cend(), ctx.out());
    }

    bool verbose = false;
};

template <>
struct fmt::formatter<xgx::fault> : fmt::formatter<xgx::error>
{
    template <typename FormatContext>
    auto format(xgx::fault const &f, FormatContext &ctx) const
            -> decltype(ctx.out())
    {
        return fmt::formatter<xgx::error>::format(f.as_error(), ctx);
    }
};
