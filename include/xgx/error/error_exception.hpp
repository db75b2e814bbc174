#pragma once

#include <exception>
#include <string>

#include <boost/exception/exception.hpp>

#include <xgx/error/error_node.hpp>

namespace xgx
{

class error_exception : public virtual std::exception,
                        public virtual boost::exception
{
public:
    error_exception() = delete;
    explicit error_exception(xgx::error err) noexcept;

    // the verbose rendering of the carried error
    auto what() const noexcept -> char const * override;

    [[nodiscard]] auto error() const noexcept -> xgx::error const &
    {
        return mErr;
    }

private:
    xgx::error mErr;
    mutable std::string mErrDesc;
};

inline error_exception::error_exception(xgx::error err) noexcept
    : std::exception()
    , boost::exception()
    , mErr(std::move(err))
    , mErrDesc()
{
}

} // namespace xgx
