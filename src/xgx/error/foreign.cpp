#include <xgx/error/foreign.hpp>

#include <functional>

#include <xgx/error/error_exception.hpp>

namespace xgx
{

auto system_error_node::message() const -> std::string
{
    auto msg = mCode.message();
    if (msg.empty())
    {
        msg = std::string{mCode.category().name()} + ":"
              + std::to_string(mCode.value());
    }
    return msg;
}

auto system_error_node::equals(error_node const &other) const noexcept -> bool
{
    auto const that = dynamic_cast<system_error_node const *>(&other);
    return that && that->mCode == mCode;
}

auto system_error_node::hash_value() const noexcept -> std::size_t
{
    return std::hash<std::error_code>{}(mCode);
}

auto from_error_code(std::error_code ec) -> error
{
    if (!ec)
    {
        return {};
    }
    return make_node<system_error_node>(ec);
}

auto from_exception(std::exception_ptr ptr) -> error
{
    if (!ptr)
    {
        return {};
    }
    try
    {
        std::rethrow_exception(ptr);
    }
    catch (error_exception const &exc)
    {
        return exc.error();
    }
    catch (std::exception const &exc)
    {
        return make_node<exception_node>(ptr, std::string{exc.what()});
    }
    catch (...)
    {
        return make_node<exception_node>(ptr, std::string{"unknown exception"});
    }
}

} // namespace xgx
