#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"
#include "insar_rate/parallel/collectives.hpp"
#include "insar_rate/parallel/local_context.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace parallel = insar_rate::parallel;
namespace test = insar_rate::test;

TEST_CASE("split_range_partitions_every_index_once") {
    for (size_t n : {0u, 1u, 7u, 16u, 101u}) {
        for (int parts : {1, 2, 3, 5, 8}) {
            size_t next = 0;
            for (int i = 0; i < parts; ++i) {
                const auto r = parallel::split_range(n, parts, i);
                REQUIRE(r.begin == next);
                REQUIRE(r.size() <= n / static_cast<size_t>(parts) + 1);
                next = r.end;
            }
            REQUIRE(next == n);
        }
    }
    // leading parts take the remainder
    REQUIRE(parallel::split_range(7, 3, 0).size() == 3);
    REQUIRE(parallel::split_range(7, 3, 2).size() == 2);
    REQUIRE_THROWS_AS(parallel::split_range(7, 3, 3), insar_rate::ParallelError);
}

TEST_CASE("collectives_agree_across_local_ranks") {
    parallel::LocalGroup group(4);
    std::mutex mu;
    std::vector<std::vector<int>> broadcasts(4);
    std::vector<std::vector<double>> concat;

    group.run([&](parallel::ExecutionContext& ctx) {
        const std::vector<double> mine{static_cast<double>(ctx.rank()),
                                       static_cast<double>(ctx.rank()) + 0.5};
        const auto all = parallel::gather_concat(ctx, mine);
        const int value = parallel::broadcast_value(ctx, std::string("x") + std::to_string(ctx.rank()))
                              == "x0" ? 1 : 0;
        const auto gathered = parallel::allgather_values(ctx, std::to_string(ctx.rank()));

        std::lock_guard<std::mutex> lock(mu);
        broadcasts[static_cast<size_t>(ctx.rank())] = {value, static_cast<int>(gathered.size()),
                                                       gathered[3] == "3" ? 1 : 0};
        if (ctx.is_leader()) {
            concat.push_back(all);
        } else if (!all.empty()) {
            concat.push_back({-1.0});
        }
    });

    for (const auto& b : broadcasts) {
        REQUIRE(b == std::vector<int>{1, 4, 1});
    }
    REQUIRE(concat.size() == 1);
    REQUIRE(concat[0] == std::vector<double>{0.0, 0.5, 1.0, 1.5, 2.0, 2.5, 3.0, 3.5});
}

TEST_CASE("run_once_failure_reaches_every_rank") {
    parallel::LocalGroup group(3);
    std::atomic<int> parallel_errors{0};
    REQUIRE_THROWS_AS(group.run([&](parallel::ExecutionContext& ctx) {
                          try {
                              parallel::run_once(ctx, []() -> std::string {
                                  throw insar_rate::CovarianceError("leader only failure");
                              });
                          } catch (const insar_rate::ParallelError&) {
                              ++parallel_errors;
                              throw;
                          }
                      }),
                      insar_rate::InsarRateError);
    REQUIRE(parallel_errors == 2);
}

TEST_CASE("gather_ordered_by_rank_is_independent_of_arrival_order") {
    const size_t total = 11;
    std::vector<double> expected(total);
    for (size_t i = 0; i < total; ++i) {
        expected[i] = 10.0 * static_cast<double>(i);
    }

    for (unsigned seed = 1; seed <= 4; ++seed) {
        parallel::LocalGroup group(4);
        std::mt19937 rng(seed);
        std::vector<int> delays{0, 0, 0, 0};
        for (auto& d : delays) {
            d = static_cast<int>(rng() % 30);
        }
        group.set_send_delay([delays](int source, int, int) {
            return std::chrono::milliseconds(delays[static_cast<size_t>(source)]);
        });

        std::vector<double> result;
        group.run([&](parallel::ExecutionContext& ctx) {
            const auto r = parallel::split_range(total, ctx.size(), ctx.rank());
            std::vector<double> local(expected.begin() + static_cast<std::ptrdiff_t>(r.begin),
                                      expected.begin() + static_cast<std::ptrdiff_t>(r.end));
            auto out = parallel::gather_ordered_by_rank(ctx, local, total);
            if (ctx.is_leader()) {
                result = out;
            }
        });
        REQUIRE(result == expected);
    }
}

TEST_CASE("publish_gives_every_rank_the_leader_payload") {
    test::TempDir dir("publish");
    const auto path = dir / "shared" / "artifact.json";
    std::vector<std::string> seen(3);
    parallel::LocalGroup group(3);
    group.run([&](parallel::ExecutionContext& ctx) {
        seen[static_cast<size_t>(ctx.rank())] = parallel::publish(
            ctx, path, [&] { return std::string("{\"rank\": ") + std::to_string(ctx.rank()) + "}"; });
    });
    for (const auto& s : seen) {
        REQUIRE(s == "{\"rank\": 0}");
    }
    REQUIRE(insar_rate::core::read_text(path) == "{\"rank\": 0}");
    REQUIRE_FALSE(fs::exists(dir / "shared" / "artifact.json.tmp"));
}

TEST_CASE("publish_fails_on_tampered_or_missing_file") {
    test::TempDir dir("publish_tamper");
    const auto path = dir / "artifact.txt";
    parallel::SerialContext ctx;
    const std::string payload = "registry v1";
    parallel::publish(ctx, path, payload);
    const std::string digest =
        insar_rate::core::sha256_bytes(std::vector<uint8_t>(payload.begin(), payload.end()));
    REQUIRE(parallel::read_published(path, digest) == payload);

    std::ofstream(path, std::ios::trunc) << "registry v2";
    REQUIRE_THROWS_AS(parallel::read_published(path, digest), insar_rate::SynchronizationError);

    fs::remove(path);
    REQUIRE_THROWS_AS(parallel::read_published(path, digest), insar_rate::SynchronizationError);
}

TEST_CASE("publish_leader_failure_stops_other_ranks") {
    test::TempDir dir("publish_fail");
    std::atomic<int> follower_errors{0};
    parallel::LocalGroup group(2);
    REQUIRE_THROWS(group.run([&](parallel::ExecutionContext& ctx) {
        try {
            parallel::publish(ctx, dir / "never.json", []() -> std::string {
                throw insar_rate::PipelineError("cannot build payload");
            });
        } catch (const insar_rate::ParallelError&) {
            ++follower_errors;
            throw;
        }
    }));
    REQUIRE(follower_errors == 1);
    REQUIRE_FALSE(fs::exists(dir / "never.json"));
}

TEST_CASE("serial_context_queues_messages_to_itself") {
    parallel::SerialContext ctx;
    ctx.send(0, 5, parallel::encode(std::string("hello")));
    REQUIRE(parallel::decode<std::string>(ctx.recv(0, 5)) == "hello");
    REQUIRE_THROWS_AS(ctx.recv(0, 5), insar_rate::ParallelError);
    REQUIRE(parallel::gather_ordered_by_rank(ctx, {1.0, 2.0}, 2) == std::vector<double>{1.0, 2.0});
}
