#pragma once

#include <utility>

#include <boost/outcome/bad_access.hpp>
#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/policy/base.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>
#include <boost/throw_exception.hpp>

#include <xgx/error/error_exception.hpp>
#include <xgx/error/error_node.hpp>

namespace xgx
{
namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;
namespace oc = BOOST_OUTCOME_V2_NAMESPACE;

namespace detail
{
class result_no_value_policy : public outcome::policy::base
{
public:
    //! Performs a narrow check of state, used in the assume_value()
    //! functions.
    using base::narrow_value_check;

    //! Performs a narrow check of state, used in the assume_error()
    //! functions.
    using base::narrow_error_check;

    //! Performs a wide check of state, used in the value() functions.
    template <class Impl>
    static constexpr void wide_value_check(Impl &&self)
    {
        if (!base::_has_value(self))
        {
            if (base::_has_error(self))
            {
                BOOST_THROW_EXCEPTION(error_exception{
                        base::_error(std::forward<Impl>(self))});
            }
            BOOST_THROW_EXCEPTION(outcome::bad_result_access("no value"));
        }
    }

    //! Performs a wide check of state, used in the error() functions.
    template <class Impl>
    static constexpr void wide_error_check(Impl &&self)
    {
        if (!base::_has_error(self))
        {
            BOOST_THROW_EXCEPTION(outcome::bad_result_access("no error"));
        }
    }
};

} // namespace detail

using oc::failure;
using oc::success;

template <typename R>
using result = oc::basic_result<R, error, detail::result_no_value_policy>;

} // namespace xgx

#define XGX_TRY(...) BOOST_OUTCOME_TRY(__VA_ARGS__)
