#pragma once

#include <concepts>
#include <string_view>
#include <type_traits>

namespace xgx::utils
{

template <typename T, typename... Ts>
concept any_of = (std::same_as<T, Ts> || ...);

template <typename T, typename... Ts>
concept none_of = (!std::same_as<T, Ts> && ...);

template <typename T>
concept string_like = std::convertible_to<T, std::string_view>
                      && none_of<std::remove_cvref_t<T>, std::nullptr_t>;

template <typename>
inline constexpr bool dependent_false = false;

} // namespace xgx::utils
