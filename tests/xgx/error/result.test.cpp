#include <xgx/error/result.hpp>

#include <string>

#include <fmt/format.h>

#include <xgx/error/construct.hpp>
#include <xgx/error/predicates.hpp>
#include <xgx/error/wrap.hpp>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace xgx_tests
{

namespace
{

auto parse_port(int raw) -> xgx::result<int>
{
    if (raw <= 0 || raw > 65535)
    {
        return xgx::failure(
                xgx::invalid("port", "out of range").with_field("raw", raw)
                        .as_error());
    }
    return raw;
}

auto make_endpoint(int raw) -> xgx::result<std::string>
{
    XGX_TRY(port, parse_port(raw));
    return fmt::format("localhost:{}", port);
}

auto check_endpoint(int raw) -> xgx::result<void>
{
    XGX_TRY(make_endpoint(raw));
    return xgx::success();
}

} // namespace

BOOST_AUTO_TEST_SUITE(result)

BOOST_AUTO_TEST_CASE(values_pass_through)
{
    auto const rx = make_endpoint(8080);

    TEST_RESULT_REQUIRE(rx);
    BOOST_TEST(rx.assume_value() == "localhost:8080");
    TEST_RESULT(check_endpoint(8080));
}

BOOST_AUTO_TEST_CASE(try_propagates_the_error)
{
    auto const rx = check_endpoint(0);

    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(xgx::has_code(rx.assume_error(), xgx::codes::invalid));
}

BOOST_AUTO_TEST_CASE(value_access_throws_the_error)
{
    auto const rx = parse_port(-1);

    BOOST_CHECK_THROW((void)rx.value(), xgx::error_exception);
    try
    {
        (void)rx.value();
    }
    catch (xgx::error_exception const &exc)
    {
        BOOST_TEST((exc.error() == rx.assume_error()));
    }
}

BOOST_AUTO_TEST_CASE(error_access_on_success_throws)
{
    auto const rx = parse_port(80);

    BOOST_CHECK_THROW((void)rx.error(), xgx::outcome::bad_result_access);
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace xgx_tests
