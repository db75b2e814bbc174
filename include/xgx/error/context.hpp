#pragma once

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <concepts>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <xgx/error/fwd.hpp>
#include <xgx/utils/misc.hpp>

namespace xgx
{

using field_value = std::variant<std::monostate,
                                 bool,
                                 std::int64_t,
                                 std::uint64_t,
                                 double,
                                 std::string>;

struct field
{
    std::string key;
    field_value value;

    friend auto operator==(field const &, field const &) -> bool = default;
};

namespace detail
{
template <typename T>
struct is_duration : std::false_type
{
};
template <typename Rep, typename Period>
struct is_duration<std::chrono::duration<Rep, Period>> : std::true_type
{
};
} // namespace detail

// normalises an arbitrary value into the closed field_value set
template <typename T>
inline auto to_field_value(T &&value) -> field_value
{
    using value_type = std::remove_cvref_t<T>;

    if constexpr (std::same_as<value_type, field_value>)
    {
        return std::forward<T>(value);
    }
    else if constexpr (utils::any_of<value_type, std::nullptr_t, std::monostate>)
    {
        return field_value{};
    }
    else if constexpr (std::same_as<value_type, bool>)
    {
        return field_value{std::in_place_type<bool>, value};
    }
    else if constexpr (std::same_as<value_type, char>)
    {
        return field_value{std::in_place_type<std::string>, 1u, value};
    }
    else if constexpr (std::signed_integral<value_type>)
    {
        return field_value{std::in_place_type<std::int64_t>, value};
    }
    else if constexpr (std::unsigned_integral<value_type>)
    {
        return field_value{std::in_place_type<std::uint64_t>, value};
    }
    else if constexpr (std::floating_point<value_type>)
    {
        return field_value{std::in_place_type<double>,
                           static_cast<double>(value)};
    }
    else if constexpr (std::same_as<value_type, std::string>)
    {
        return field_value{std::in_place_type<std::string>,
                           std::forward<T>(value)};
    }
    else if constexpr (utils::string_like<T>)
    {
        return field_value{std::in_place_type<std::string>,
                           std::string_view(value)};
    }
    else if constexpr (detail::is_duration<value_type>::value)
    {
        return field_value{
                std::in_place_type<double>,
                std::chrono::duration<double, std::milli>(value).count()};
    }
    else if constexpr (fmt::is_formattable<value_type>::value)
    {
        return field_value{std::in_place_type<std::string>,
                           fmt::format("{}", value)};
    }
    else
    {
        static_assert(utils::dependent_false<value_type>,
                      "the value type can't be stored in an error context");
    }
}

template <typename T>
concept field_key = utils::string_like<T>;

namespace detail
{
inline void append_key_values(std::vector<field> &)
{
}

// a trailing key is stored with a nil value
template <typename K>
inline void append_key_values(std::vector<field> &out, K &&key)
{
    if constexpr (field_key<K>)
    {
        out.push_back(field{std::string(std::string_view(key)), {}});
    }
}

// a pair whose key is not a string is dropped as a whole
template <typename K, typename V, typename... Rest>
inline void append_key_values(std::vector<field> &out,
                              K &&key,
                              V &&value,
                              Rest &&...rest)
{
    if constexpr (field_key<K>)
    {
        out.push_back(field{std::string(std::string_view(key)),
                            to_field_value(std::forward<V>(value))});
    }
    append_key_values(out, std::forward<Rest>(rest)...);
}
} // namespace detail

// converts an alternating key, value, key, value... list into fields
template <typename... KVs>
inline auto make_fields(KVs &&...kvs) -> std::vector<field>
{
    std::vector<field> fields;
    fields.reserve((sizeof...(KVs) + 1) / 2);
    detail::append_key_values(fields, std::forward<KVs>(kvs)...);
    return fields;
}

/**
 * Insertion ordered, append-only key/value store.
 *
 * The field storage is shared and never mutated, i.e. every append creates
 * a new storage and copies are cheap. The empty context owns no allocation.
 */
class context final
{
public:
    using storage = std::shared_ptr<std::vector<field> const>;
    using iterator = std::span<field const>::iterator;
    using snapshot_type = std::map<std::string, field_value, std::less<>>;

    context() noexcept = default;
    explicit context(std::vector<field> fields);

    [[nodiscard]] auto append(std::span<field const> more) const -> context;
    [[nodiscard]] auto append(field f) const -> context;
    // keeps the newest maxFields entries, a zero limit disables bounding
    [[nodiscard]] auto keep_newest(std::size_t maxFields) const -> context;

    // last-write-wins map projection without empty keys
    [[nodiscard]] auto snapshot() const -> snapshot_type;
    // the most recent value stored under key (empty keys never match)
    [[nodiscard]] auto find(std::string_view key) const noexcept
            -> field_value const *;

    [[nodiscard]] auto fields() const noexcept -> std::span<field const>
    {
        if (!mFields)
        {
            return {};
        }
        return {mFields->data(), mFields->size()};
    }
    [[nodiscard]] auto begin() const noexcept -> iterator
    {
        return fields().begin();
    }
    [[nodiscard]] auto end() const noexcept -> iterator
    {
        return fields().end();
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return mFields ? mFields->size() : 0u;
    }
    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return size() == 0u;
    }

    [[nodiscard]] auto shares_storage_with(context const &other) const noexcept
            -> bool
    {
        return mFields == other.mFields;
    }

private:
    storage mFields;
};

} // namespace xgx

template <>
struct fmt::formatter<xgx::field_value>
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(xgx::field_value const &value, FormatContext &ctx) const
            -> decltype(ctx.out())
    {
        return std::visit(
                [&ctx](auto const &v) -> decltype(ctx.out())
                {
                    using value_type = std::remove_cvref_t<decltype(v)>;
                    if constexpr (std::same_as<value_type, std::monostate>)
                    {
                        return fmt::format_to(ctx.out(), "<nil>");
                    }
                    else
                    {
                        return fmt::format_to(ctx.out(), "{}", v);
                    }
                },
                value);
    }
};
