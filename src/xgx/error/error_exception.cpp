#include <xgx/error/error_exception.hpp>

#include <new>
#include <stdexcept>

#include <xgx/error/format.hpp>

namespace xgx
{

auto error_exception::what() const noexcept -> char const *
{
    if (mErrDesc.empty())
    {
        try
        {
            mErrDesc = diagnostic_information(
                    mErr, error_message_format::with_diagnostics);
        }
        catch (std::bad_alloc const &)
        {
            return "<error_exception|failed to allocate the diagnostic "
                   "information string>";
        }
        catch (std::exception const &)
        {
            return "<error_exception|failed to render the diagnostic "
                   "information of the error>";
        }
    }
    return mErrDesc.c_str();
}

} // namespace xgx
