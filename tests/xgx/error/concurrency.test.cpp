#include <xgx/error.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace xgx_tests
{

BOOST_AUTO_TEST_SUITE(concurrency)

BOOST_AUTO_TEST_CASE(shared_values_derive_independently)
{
    constexpr int numThreads = 8;
    constexpr int numRounds = 200;

    auto const base = xgx::not_found("user", 42);
    auto const baseFields = base.fields();

    std::atomic_int mismatches{0};
    std::vector<std::thread> workers;
    workers.reserve(numThreads);
    for (int t = 0; t < numThreads; ++t)
    {
        workers.emplace_back(
                [&, t]
                {
                    auto const tag = std::to_string(t);
                    for (int i = 0; i < numRounds; ++i)
                    {
                        auto const derived
                                = base.add_context("ignored", "round", i)
                                          .with_field("thread", t)
                                          .reclassify(xgx::code{tag});
                        auto const snapshot = derived.context_snapshot();
                        if (derived.message() != tag + ": user not found"
                            || snapshot.at("thread")
                                       != xgx::field_value{std::int64_t{t}}
                            || derived.fields().size() != 4U
                            || base.fields().size() != 2U)
                        {
                            mismatches.fetch_add(1);
                        }
                    }
                });
    }
    for (auto &worker : workers)
    {
        worker.join();
    }

    BOOST_TEST(mismatches.load() == 0);
    BOOST_TEST(base.message() == "not_found: user not found");
    BOOST_TEST(base.fields().shares_storage_with(baseFields));
}

BOOST_AUTO_TEST_CASE(concurrent_traversal_of_a_shared_graph)
{
    constexpr int numThreads = 8;

    auto const leaf = make_leaf("shared");
    auto const graph = xgx::join(xgx::wrap(leaf, "a"), xgx::unavailable("db"),
                                 xgx::defect(leaf));

    std::atomic_int mismatches{0};
    std::vector<std::thread> workers;
    workers.reserve(numThreads);
    for (int t = 0; t < numThreads; ++t)
    {
        workers.emplace_back(
                [&]
                {
                    for (int i = 0; i < 100; ++i)
                    {
                        if (xgx::flatten(graph).size() != 2U
                            || !xgx::is_retryable(graph)
                            || !xgx::is_defect(graph)
                            || !xgx::has(graph, leaf))
                        {
                            mismatches.fetch_add(1);
                        }
                    }
                });
    }
    for (auto &worker : workers)
    {
        worker.join();
    }

    BOOST_TEST(mismatches.load() == 0);
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace xgx_tests
