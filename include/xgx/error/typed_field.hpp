#pragma once

#include <cstdint>

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <xgx/error/construct.hpp>
#include <xgx/error/context.hpp>
#include <xgx/error/error_node.hpp>
#include <xgx/error/error_value.hpp>
#include <xgx/error/result.hpp>
#include <xgx/error/wrap.hpp>
#include <xgx/utils/misc.hpp>

namespace xgx
{

namespace detail
{
inline auto field_type_name(field_value const &value) noexcept
        -> std::string_view
{
    constexpr std::array<std::string_view, std::variant_size_v<field_value>>
            names{"nil", "bool", "int64", "uint64", "double", "string"};
    return names[value.index()];
}
} // namespace detail

/**
 * Typed access to a context field.
 *
 * The stored value must hold exactly T, no conversions are applied on
 * retrieval.
 */
template <typename T>
    requires utils::
            any_of<T, bool, std::int64_t, std::uint64_t, double, std::string>
class typed_field final
{
public:
    explicit typed_field(std::string key) noexcept
        : mKey(std::move(key))
    {
    }

    [[nodiscard]] auto key() const noexcept -> std::string_view
    {
        return mKey;
    }

    // with(e, key(), value)
    [[nodiscard]] auto set(error e, T value) const -> fault
    {
        return with(std::move(e), mKey, std::move(value));
    }

    /**
     * Reads the most recent value stored under key().
     *
     * Fails with an invalid failure for the null error or a value of another
     * type and with a not_found failure if the field is absent.
     */
    [[nodiscard]] auto get(error const &e) const -> result<T>
    {
        if (!e)
        {
            return failure(invalid("error", "null error")
                                   .with_field("key", mKey)
                                   .as_error());
        }

        auto const value = e.as<error_value>();
        auto const stored = value ? value->fields().find(mKey) : nullptr;
        if (!stored)
        {
            return failure(not_found("field", mKey).as_error());
        }

        if (auto const typed = std::get_if<T>(stored))
        {
            return *typed;
        }
        return failure(invalid(mKey, "wrong dynamic type")
                               .with_field("actual",
                                           detail::field_type_name(*stored))
                               .as_error());
    }

    // throws an error_exception if get() fails
    [[nodiscard]] auto must_get(error const &e) const -> T
    {
        return get(e).value();
    }

private:
    std::string mKey;
};

} // namespace xgx
