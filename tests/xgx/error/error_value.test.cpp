#include <xgx/error/error_value.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <xgx/error/construct.hpp>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

using namespace std::string_literals;

namespace xgx_tests
{

BOOST_AUTO_TEST_SUITE(error_value)

BOOST_AUTO_TEST_CASE(failure_message_composition)
{
    auto const base = xgx::make_error("");

    BOOST_TEST(base.reclassify("").message() == "error");
    BOOST_TEST(base.message() == "internal");
    BOOST_TEST(base.reclassify("").replace_message("boom").message()
               == "boom");
    BOOST_TEST(base.replace_message("boom").message() == "internal: boom");
}

BOOST_AUTO_TEST_CASE(add_context_sets_the_message_once)
{
    auto const first = xgx::bad_request("").add_context("first");
    auto const second = first.add_context("second");

    BOOST_TEST((first.raw_message() == "first"s));
    BOOST_TEST((second.raw_message() == "first"s));
    BOOST_TEST((second.add_context("").raw_message() == "first"s));
}

BOOST_AUTO_TEST_CASE(add_context_appends_fields_in_order)
{
    auto const subject = xgx::conflict("dup")
                                 .add_context("", "a", 1)
                                 .add_context("", "b", 2, "a", 3);

    auto const fields = subject.fields().fields();
    BOOST_TEST_REQUIRE(fields.size() == 3U);
    BOOST_TEST(fields[0].key == "a");
    BOOST_TEST(fields[1].key == "b");
    BOOST_TEST(fields[2].key == "a");

    auto const snapshot = subject.context_snapshot();
    BOOST_TEST((snapshot.at("a") == xgx::field_value{std::int64_t{3}}));
}

BOOST_AUTO_TEST_CASE(fluent_mutators_never_touch_the_receiver)
{
    auto const base = xgx::not_found("user", 42);
    auto const baseFields = base.fields();

    auto const derived = base.add_context("ignored", "extra", true)
                                 .with_field("more", 1)
                                 .append_message("suffix")
                                 .reclassify("custom")
                                 .capture_stack();

    BOOST_TEST(base.message() == "not_found: user not found");
    BOOST_TEST((base.classification() == xgx::codes::not_found));
    BOOST_TEST(base.fields().size() == 2U);
    BOOST_TEST(base.fields().shares_storage_with(baseFields));
    BOOST_TEST(base.stack().empty());

    BOOST_TEST(derived.message() == "custom: user not found: suffix");
    BOOST_TEST(derived.fields().size() == 4U);
    BOOST_TEST(!derived.stack().empty());
    BOOST_TEST(!(derived == base));
}

BOOST_AUTO_TEST_CASE(add_context_bounded_keeps_the_newest)
{
    auto const subject
            = xgx::make_error("m", "a", 1, "b", 2)
                      .add_context_bounded("", 3U, "c", 3, "d", 4);

    auto const fields = subject.fields().fields();
    BOOST_TEST_REQUIRE(fields.size() == 3U);
    BOOST_TEST(fields[0].key == "b");
    BOOST_TEST(fields[1].key == "c");
    BOOST_TEST(fields[2].key == "d");

    auto const repeated = xgx::make_error("m", "k", 1, "j", 2, "k", 3)
                                  .add_context_bounded("", 2U);
    auto const kept = repeated.fields().fields();
    BOOST_TEST_REQUIRE(kept.size() == 2U);
    BOOST_TEST(kept[0].key == "j");
    BOOST_TEST((kept[0].value == xgx::field_value{std::int64_t{2}}));
    BOOST_TEST(kept[1].key == "k");
    BOOST_TEST((kept[1].value == xgx::field_value{std::int64_t{3}}));

    auto const snapshot = repeated.context_snapshot();
    BOOST_TEST(snapshot.size() == 2U);
    BOOST_TEST((snapshot.at("j") == xgx::field_value{std::int64_t{2}}));
    BOOST_TEST((snapshot.at("k") == xgx::field_value{std::int64_t{3}}));

    auto const unbounded
            = xgx::make_error("m", "a", 1).add_context_bounded("", 0U, "b", 2);
    BOOST_TEST(unbounded.fields().size() == 2U);
}

BOOST_AUTO_TEST_CASE(append_message_concatenates)
{
    auto const subject = xgx::bad_request("");

    BOOST_TEST((subject.append_message("a").raw_message() == "a"s));
    BOOST_TEST((subject.append_message("a").append_message("b").raw_message()
               == "a: b"s));
    BOOST_TEST((subject.append_message("a").append_message("").raw_message()
               == "a"s));
}

BOOST_AUTO_TEST_CASE(replace_message_overrides)
{
    auto const subject = xgx::conflict("old").replace_message("new");

    BOOST_TEST(subject.message() == "conflict: new");
    BOOST_TEST(subject.replace_message("").message() == "conflict");
}

BOOST_AUTO_TEST_CASE(reclassify_failure)
{
    auto const subject = xgx::make_error("m").reclassify("payment_declined");

    BOOST_TEST((subject.classification() == xgx::code{"payment_declined"}));
    BOOST_TEST(subject.kind() == xgx::error_kind::failure);
}

BOOST_AUTO_TEST_CASE(defect_classification_is_fixed)
{
    auto const subject = xgx::defect();
    auto const reclassified = subject.reclassify(xgx::codes::not_found);

    BOOST_TEST(reclassified.kind() == xgx::error_kind::defect);
    BOOST_TEST((reclassified.classification() == xgx::codes::defect));
    BOOST_TEST(reclassified.node() != subject.node());
}

BOOST_AUTO_TEST_CASE(defect_keeps_its_creation_stack)
{
    auto const subject = xgx::defect();
    auto const recaptured = subject.capture_stack();

    BOOST_TEST_REQUIRE(!subject.stack().empty());
    BOOST_TEST(recaptured.stack().frames().data()
               == subject.stack().frames().data());
}

BOOST_AUTO_TEST_CASE(interrupt_classification_is_fixed)
{
    auto const subject = xgx::interrupt("shutdown");
    auto const reclassified = subject.reclassify(xgx::codes::timeout);

    BOOST_TEST(reclassified.kind() == xgx::error_kind::interrupt);
    BOOST_TEST((reclassified.classification() == xgx::codes::interrupt));
}

BOOST_AUTO_TEST_CASE(interrupt_never_carries_a_stack)
{
    auto const subject = xgx::interrupt("shutdown").capture_stack();

    BOOST_TEST(subject.stack().empty());
    BOOST_TEST(subject.kind() == xgx::error_kind::interrupt);
}

BOOST_AUTO_TEST_CASE(capture_stack_on_failure)
{
    auto const subject = xgx::bad_request("x");
    auto const captured = subject.capture_stack();

    BOOST_TEST(subject.stack().empty());
    BOOST_TEST(!captured.stack().empty());
}

BOOST_AUTO_TEST_CASE(capture_stack_skipping_drops_the_caller_frames)
{
    auto const subject = xgx::bad_request("x");

    // same call site for both captures
    std::array<xgx::fault, 2> traced;
    for (std::size_t skip = 0; skip < traced.size(); ++skip)
    {
        traced[skip] = subject.capture_stack_skipping(skip);
    }
    auto const full = traced[0].stack().frames();
    auto const skipped = traced[1].stack().frames();

    BOOST_TEST_REQUIRE(full.size() < xgx::default_stack_depth);
    BOOST_TEST_REQUIRE(skipped.size() + 1U == full.size());
    for (std::size_t i = 0; i < skipped.size(); ++i)
    {
        BOOST_TEST(skipped[i].pc == full[i + 1U].pc);
    }
}

BOOST_AUTO_TEST_CASE(null_fault_accessors)
{
    xgx::fault const subject;

    BOOST_TEST(!subject);
    BOOST_TEST(subject.message().empty());
    BOOST_TEST(subject.classification().empty());
    BOOST_TEST(!subject.cause());
    BOOST_TEST(subject.fields().empty());
    BOOST_TEST(subject.stack().empty());
    BOOST_TEST(!subject.as_error());
}

BOOST_AUTO_TEST_CASE(null_fault_mutators_materialize_a_failure)
{
    xgx::fault const subject;
    auto const derived = subject.add_context("msg", "k", 1);

    BOOST_TEST_REQUIRE(static_cast<bool>(derived));
    BOOST_TEST(derived.kind() == xgx::error_kind::failure);
    BOOST_TEST((derived.classification() == xgx::codes::internal));
    BOOST_TEST(derived.message() == "internal: msg");
    BOOST_TEST(derived.fields().size() == 1U);
}

BOOST_AUTO_TEST_CASE(fault_converts_to_error)
{
    auto const subject = xgx::conflict("c");
    xgx::error const e = subject;

    BOOST_TEST(e.node() == subject.node());
    BOOST_TEST(e.as<xgx::error_value>() == subject.node());
    BOOST_TEST(e.message() == subject.message());
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace xgx_tests
