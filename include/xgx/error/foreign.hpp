#pragma once

#include <cstddef>

#include <exception>
#include <string>
#include <system_error>

#include <xgx/error/error_node.hpp>

namespace xgx
{

// a std::error_code leaf, equal codes are equal nodes
class system_error_node final : public error_node
{
public:
    explicit system_error_node(std::error_code ec) noexcept
        : error_node()
        , mCode(ec)
    {
    }

    auto message() const -> std::string override;
    auto identity() const noexcept -> node_identity override
    {
        return node_identity::value;
    }
    auto equals(error_node const &other) const noexcept -> bool override;
    auto hash_value() const noexcept -> std::size_t override;

    [[nodiscard]] auto value() const noexcept -> std::error_code
    {
        return mCode;
    }

private:
    std::error_code mCode;
};

// a captured foreign exception
class exception_node final : public error_node
{
public:
    exception_node(std::exception_ptr ptr, std::string what) noexcept
        : error_node()
        , mException(std::move(ptr))
        , mWhat(std::move(what))
    {
    }

    auto message() const -> std::string override
    {
        return mWhat;
    }

    [[nodiscard]] auto exception() const noexcept -> std::exception_ptr const &
    {
        return mException;
    }

private:
    std::exception_ptr mException;
    std::string mWhat;
};

// the null error for a success code
[[nodiscard]] auto from_error_code(std::error_code ec) -> error;

/**
 * Converts a caught exception. An error_exception yields the carried error,
 * other exceptions are captured by an exception_node.
 */
[[nodiscard]] auto from_exception(std::exception_ptr ptr) -> error;

} // namespace xgx
