#include <xgx/error/error_node.hpp>

#include <iterator>
#include <string_view>

namespace xgx
{

void error_node::format_verbose(format_buffer &out) const
{
    fmt::format_to(std::back_inserter(out), "{}", message());
}

auto error::message() const -> std::string
{
    if (!mNode)
    {
        return {};
    }
    return mNode->message();
}

auto operator==(error const &lhs, error const &rhs) noexcept -> bool
{
    if (lhs.node() == rhs.node())
    {
        return true;
    }
    if (!lhs || !rhs)
    {
        return false;
    }
    return lhs.node()->identity() == node_identity::value
           && rhs.node()->identity() == node_identity::value
           && lhs.node()->equals(*rhs.node());
}

namespace
{

class sentinel_error final : public error_node
{
public:
    explicit sentinel_error(std::string_view msg) noexcept
        : error_node()
        , mMessage(msg)
    {
    }
    ~sentinel_error() override = default;

    auto message() const -> std::string override
    {
        return std::string{mMessage};
    }

private:
    std::string_view mMessage;
};

// the instance itself holds the initial reference, i.e. it is never deleted
sentinel_error const canceledInstance{"operation canceled"};
sentinel_error const deadlineExceededInstance{"deadline exceeded"};

} // namespace

auto canceled() noexcept -> error
{
    return error{error::node_ptr{&canceledInstance, utils::ref_ptr_acquire}};
}

auto deadline_exceeded() noexcept -> error
{
    return error{
            error::node_ptr{&deadlineExceededInstance, utils::ref_ptr_acquire}};
}

} // namespace xgx
