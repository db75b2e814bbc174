#include <xgx/error/format.hpp>

#include <sstream>
#include <string>

#include <fmt/format.h>

#include <xgx/error/construct.hpp>
#include <xgx/error/error_exception.hpp>
#include <xgx/error/join.hpp>
#include <xgx/error/wrap.hpp>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace xgx_tests
{

BOOST_AUTO_TEST_SUITE(format)

BOOST_AUTO_TEST_CASE(concise_format)
{
    auto const subject = xgx::bad_request("bad input");

    BOOST_TEST(fmt::format("{}", subject) == "bad_request: bad input");
    BOOST_TEST(fmt::format("{:!v}", subject) == "bad_request: bad input");
    BOOST_TEST(fmt::format("{}", subject.as_error())
               == "bad_request: bad input");
}

BOOST_AUTO_TEST_CASE(null_renders_as_nil)
{
    BOOST_TEST(fmt::format("{}", xgx::error{}) == "<nil>");
    BOOST_TEST(fmt::format("{:v}", xgx::error{}) == "<nil>");
    BOOST_TEST(xgx::diagnostic_information(
                       xgx::error{}, xgx::error_message_format::simple)
               == "<nil>");
}

BOOST_AUTO_TEST_CASE(verbose_lists_code_message_and_context)
{
    auto const subject
            = xgx::bad_request("bad").with_field("line", 3).with_field("", 1);

    BOOST_TEST(fmt::format("{:v}", subject)
               == "code=bad_request msg=\"bad\"\nctx: line=3");
}

BOOST_AUTO_TEST_CASE(verbose_without_code_or_context)
{
    auto const subject = xgx::make_error("plain").reclassify("");

    BOOST_TEST(fmt::format("{:v}", subject) == "msg=\"plain\"");
}

BOOST_AUTO_TEST_CASE(verbose_omits_context_without_printable_keys)
{
    auto const subject = xgx::make_error("m").with_field("", 1);

    BOOST_TEST(fmt::format("{:v}", subject) == "code=internal msg=\"m\"");
}

BOOST_AUTO_TEST_CASE(verbose_escapes_the_message)
{
    auto const subject = xgx::conflict("two\nlines");

    BOOST_TEST(fmt::format("{:v}", subject)
               == "code=conflict msg=\"two\\nlines\"");
}

BOOST_AUTO_TEST_CASE(verbose_renders_the_cause_chain)
{
    auto const subject = xgx::wrap(
            xgx::wrap(make_leaf("eof"), "reading", "file", "a.txt"), "loading");

    BOOST_TEST(fmt::format("{:v}", subject)
               == "code=internal msg=\"reading\"\nctx: file=a.txt\ncause: eof");
}

BOOST_AUTO_TEST_CASE(verbose_renders_nested_values)
{
    auto const inner = xgx::not_found("user", 42);
    auto const subject = xgx::internal(inner).replace_message("lookup");

    auto const rendered = fmt::format("{:v}", subject);
    auto const expectedPrefix
            = std::string{"code=internal msg=\"lookup\"\ncause: "
                          "code=not_found msg=\"user not found\"\n"
                          "ctx: entity=user id=42\nstack:"};
    BOOST_TEST(rendered.starts_with(expectedPrefix));
}

BOOST_AUTO_TEST_CASE(verbose_renders_each_joined_child)
{
    auto const subject
            = xgx::join(xgx::conflict("a"), make_leaf("b"), xgx::error{});

    BOOST_TEST(fmt::format("{:v}", subject)
               == "code=conflict msg=\"a\"\nb");
    BOOST_TEST(fmt::format("{}", subject) == "conflict: a\nb");
}

BOOST_AUTO_TEST_CASE(verbose_defect)
{
    auto const rendered = fmt::format("{:v}", xgx::defect());

    BOOST_TEST(rendered.starts_with(
            "code=defect msg=\"defect: nil defect\"\ncause: nil defect\nstack:"));
}

BOOST_AUTO_TEST_CASE(verbose_interrupt)
{
    BOOST_TEST(fmt::format("{:v}", xgx::interrupt("shutdown"))
               == "code=interrupt msg=\"shutdown\"\ncause: operation canceled");
}

BOOST_AUTO_TEST_CASE(invalid_format_specs_are_rejected)
{
    auto const subject = xgx::conflict("c");

    BOOST_CHECK_THROW((void)fmt::format(fmt::runtime("{:x}"), subject),
                      fmt::format_error);
    BOOST_CHECK_THROW((void)fmt::format(fmt::runtime("{:!x}"), subject),
                      fmt::format_error);
    BOOST_CHECK_THROW((void)fmt::format(fmt::runtime("{:vv}"), subject),
                      fmt::format_error);
}

BOOST_AUTO_TEST_CASE(stream_output_is_concise)
{
    std::ostringstream out;
    out << xgx::conflict("c") << '|' << xgx::error{};

    BOOST_TEST(out.str() == "conflict: c|<nil>");
}

BOOST_AUTO_TEST_CASE(error_exception_what_is_verbose)
{
    xgx::error_exception const subject{xgx::conflict("c").with_field("k", 1)};

    BOOST_TEST(std::string{subject.what()}
               == "code=conflict msg=\"c\"\nctx: k=1");
    // rendered once
    BOOST_TEST(static_cast<void const *>(subject.what())
               == static_cast<void const *>(subject.what()));
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace xgx_tests
