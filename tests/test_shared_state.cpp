// ArbPerf - Shared Metrics and State Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include <arbperf/errors.hpp>
#include <arbperf/shared_state.hpp>

#include "test_support.hpp"

using namespace arbperf;
using namespace std::chrono_literals;
using nlohmann::json;
using Catch::Approx;

namespace {

SharedMemoryConfig shm_config(const testing::TempDir& dir) {
    SharedMemoryConfig config;
    config.base_dir = dir.str();
    config.lock_timeout = 2s;
    return config;
}

}  // namespace

TEST_CASE("Metrics store basics", "[metrics]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));
    SharedMetricsStore store(shm, 64 * 1024);
    store.initialize();

    SECTION("Registry region is created") {
        auto info = shm.get_region_info(SharedMetricsStore::REGISTRY_REGION);
        REQUIRE(info.has_value());
        REQUIRE(info->size == 64 * 1024);
        REQUIRE(info->schema.has_value());
        REQUIRE((*info->schema)["metrics_regions"] == "object");
    }

    SECTION("Store and get") {
        json system = {{"cpu_percent", 12.5}, {"memory_percent", 40.0}};
        store.store_metrics("system", system);

        auto got = store.get_metrics("system");
        REQUIRE(got.has_value());
        REQUIRE(*got == system);
        REQUIRE(shm.list_regions(RegionType::Metrics).size() == 2);
    }

    SECTION("Unknown type") {
        REQUIRE_FALSE(store.get_metrics("nothing").has_value());
    }

    SECTION("TTL defaults and overrides") {
        REQUIRE(store.get_ttl("market") == Approx(10.0));
        store.set_ttl("market", 2.5);
        REQUIRE(store.get_ttl("market") == Approx(2.5));
        REQUIRE_THROWS_AS(store.set_ttl("market", 0.0), std::invalid_argument);
    }

    SECTION("Update merges into current data") {
        store.store_metrics("system", json{{"cpu_percent", 50.0}, {"threads", 8}});
        store.update_metrics("system", [](const json& current) {
            json next = current;
            next["cpu_percent"] = 30.0;
            return next;
        });

        auto got = store.get_metrics("system");
        REQUIRE(got.has_value());
        REQUIRE((*got)["cpu_percent"].get<double>() == Approx(30.0));
        REQUIRE((*got)["threads"] == 8);
    }

    SECTION("Update of a never-stored type starts from empty") {
        json seen;
        store.update_metrics("fresh", [&](const json& current) {
            seen = current;
            return json{{"n", 1}};
        });
        REQUIRE(seen == json::object());
        REQUIRE(store.get_metrics("fresh").value() == json{{"n", 1}});
    }
}

TEST_CASE("Metrics store TTL staleness", "[metrics]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));
    SharedMetricsStore store(shm, 64 * 1024);

    store.set_ttl("system", 0.1);
    store.store_metrics("system", json{{"cpu", 1}});
    store.store_metrics("market", json{{"eth", 3000}});
    REQUIRE(store.get_metrics("system").has_value());

    std::this_thread::sleep_for(200ms);

    SECTION("Stale entries read as absent") {
        REQUIRE_FALSE(store.get_metrics("system").has_value());
        REQUIRE(store.get_metrics("market").has_value());
    }

    SECTION("get_all_metrics skips stale types") {
        auto all = store.get_all_metrics();
        REQUIRE_FALSE(all.contains("system"));
        REQUIRE(all["market"]["eth"] == 3000);
    }

    SECTION("clear_expired_metrics resets stale entries") {
        REQUIRE(store.clear_expired_metrics() == 1);
        REQUIRE(store.get_metrics("system").value() == json::object());
        REQUIRE(store.get_metrics("market").value() == json{{"eth", 3000}});
    }
}

TEST_CASE("Metrics store shares layout across instances", "[metrics]") {
    testing::TempDir dir;
    SharedMemoryManager shm_a(shm_config(dir));
    SharedMemoryManager shm_b(shm_config(dir));

    SharedMetricsStore writer(shm_a, 64 * 1024);
    SharedMetricsStore reader(shm_b, 64 * 1024);
    reader.initialize();

    writer.set_ttl("performance", 30.0);
    writer.store_metrics("performance", json{{"latency_ms", 4}});

    // Reader learns the region from the shared registry
    auto got = reader.get_metrics("performance");
    REQUIRE(got.has_value());
    REQUIRE((*got)["latency_ms"] == 4);
    REQUIRE(reader.get_ttl("performance") == Approx(30.0));

    // Same type from the reader reuses the writer's region
    reader.store_metrics("performance", json{{"latency_ms", 5}});
    REQUIRE(writer.get_metrics("performance").value() == json{{"latency_ms", 5}});
    REQUIRE(shm_a.list_regions(RegionType::Metrics).size() == 2);
}

TEST_CASE("State manager versioning", "[state]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));
    SharedStateManager state(shm, 64 * 1024);
    state.initialize();

    SECTION("Optimistic version check") {
        REQUIRE(state.set_state("positions", json{{"v", 1}}) == 1);
        REQUIRE(state.set_state("positions", json{{"v", 2}}, 1) == 2);

        try {
            state.set_state("positions", json{{"v", 3}}, 1);
            FAIL("Expected VersionConflictError");
        } catch (const VersionConflictError& e) {
            REQUIRE(e.expected() == 1);
            REQUIRE(e.actual() == 2);
        }

        auto [data, version] = state.get_state("positions");
        REQUIRE(version == 2);
        REQUIRE(data == json{{"v", 2}});
    }

    SECTION("Unconditional writes always increment") {
        for (uint64_t i = 1; i <= 5; ++i) {
            REQUIRE(state.set_state("counter", json{{"i", i}}) == i);
        }
    }

    SECTION("Unknown state") {
        REQUIRE_THROWS_AS(state.get_state("missing"), MemoryRegionNotFoundError);
    }

    SECTION("Version zero matches a fresh state") {
        REQUIRE(state.set_state("fresh", json{{"x", true}}, 0) == 1);
    }
}

TEST_CASE("State manager change callbacks", "[state]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));
    SharedStateManager state(shm, 64 * 1024);

    std::vector<std::pair<json, uint64_t>> seen;
    state.register_change_callback("config", [&](const json& value, uint64_t version) {
        seen.emplace_back(value, version);
    });
    state.register_change_callback("config", [](const json&, uint64_t) {
        throw std::runtime_error("listener failure");
    });
    state.register_change_callback("config", [](const json&, uint64_t) {
        throw 17;
    });

    REQUIRE_NOTHROW(state.set_state("config", json{{"slippage", 0.5}}));
    REQUIRE_NOTHROW(state.set_state("config", json{{"slippage", 0.3}}));
    state.set_state("other", json{{"ignored", 1}});

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].second == 1);
    REQUIRE(seen[1].second == 2);
    REQUIRE(seen[1].first["slippage"].get<double>() == Approx(0.3));

    SECTION("Failed writes do not notify") {
        REQUIRE_THROWS_AS(state.set_state("config", json{{"slippage", 9}}, 1),
                          VersionConflictError);
        REQUIRE(seen.size() == 2);
    }
}

TEST_CASE("State manager shared between instances", "[state]") {
    testing::TempDir dir;
    SharedMemoryManager shm_a(shm_config(dir));
    SharedMemoryManager shm_b(shm_config(dir));
    SharedStateManager a(shm_a, 64 * 1024);
    SharedStateManager b(shm_b, 64 * 1024);

    a.set_state("book", json{{"bids", 3}});
    auto [data, version] = b.get_state("book");
    REQUIRE(version == 1);
    REQUIRE(data["bids"] == 3);

    REQUIRE(b.set_state("book", json{{"bids", 4}}, 1) == 2);
    REQUIRE_THROWS_AS(a.set_state("book", json{{"bids", 5}}, 1), VersionConflictError);
    REQUIRE(a.get_state("book").second == 2);
}
