// ArbPerf - Shared Memory Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include <arbperf/errors.hpp>
#include <arbperf/shared_memory.hpp>

#include "test_support.hpp"

using namespace arbperf;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

SharedMemoryConfig shm_config(const testing::TempDir& dir) {
    SharedMemoryConfig config;
    config.base_dir = dir.str();
    config.lock_timeout = 2s;
    return config;
}

}  // namespace

TEST_CASE("Shared memory region lifecycle", "[shm]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));

    SECTION("Create registers files and metadata") {
        auto info = shm.create_region("m", 1024, RegionType::Metrics);

        REQUIRE(info.name == "m");
        REQUIRE(info.size == 1024);
        REQUIRE(info.type == RegionType::Metrics);
        REQUIRE(std::filesystem::file_size(info.path) == 1024);
        REQUIRE(std::filesystem::exists(info.lock_path));
        REQUIRE(std::filesystem::exists(dir.path() / "registry.json"));
        REQUIRE(shm.region_exists("m"));
    }

    SECTION("Invalid arguments") {
        REQUIRE_THROWS_AS(shm.create_region("", 64, RegionType::Custom), std::invalid_argument);
        REQUIRE_THROWS_AS(shm.create_region("a/b", 64, RegionType::Custom),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(shm.create_region("tiny", 4, RegionType::Custom),
                          std::invalid_argument);

        shm.create_region("dup", 64, RegionType::Cache);
        REQUIRE_THROWS_AS(shm.create_region("dup", 64, RegionType::Cache),
                          std::invalid_argument);
    }

    SECTION("List and filter") {
        shm.create_region("a", 64, RegionType::Metrics);
        shm.create_region("b", 64, RegionType::State);
        shm.create_region("c", 64, RegionType::Metrics);

        REQUIRE(shm.list_regions().size() == 3);
        REQUIRE(shm.list_regions(RegionType::Metrics).size() == 2);
        REQUIRE(shm.list_regions(RegionType::Config).empty());
        REQUIRE_FALSE(shm.get_region_info("zzz").has_value());
    }

    SECTION("Delete removes files and entry") {
        auto info = shm.create_region("gone", 128, RegionType::Custom);
        REQUIRE(shm.delete_region("gone"));

        REQUIRE_FALSE(shm.region_exists("gone"));
        REQUIRE_FALSE(std::filesystem::exists(info.path));
        REQUIRE_FALSE(std::filesystem::exists(info.lock_path));
        REQUIRE_THROWS_AS(shm.delete_region("gone"), MemoryRegionNotFoundError);
        REQUIRE_THROWS_AS(shm.read_data("gone"), MemoryRegionNotFoundError);
    }

    SECTION("Registry persists across managers") {
        shm.create_region("kept", 256, RegionType::Config);
        shm.write_data("kept", json{{"k", "v"}});

        SharedMemoryManager other(shm_config(dir));
        REQUIRE(other.region_exists("kept"));
        REQUIRE(other.read_data("kept") == json{{"k", "v"}});
    }
}

TEST_CASE("Shared memory data round trip", "[shm]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));

    SECTION("Simple object") {
        shm.create_region("m", 1024, RegionType::Metrics);
        REQUIRE(shm.write_data("m", json{{"a", 1}}) == json{{"a", 1}}.dump().size() + 4);
        REQUIRE(shm.read_data("m") == json{{"a", 1}});
    }

    SECTION("Nested values and offsets") {
        shm.create_region("n", 4096, RegionType::Cache);
        json value = {{"prices", {1.5, 2.25, 3.0}}, {"pair", "ETH/USDC"}, {"ok", true}};
        shm.write_data("n", value);
        shm.write_data("n", json{{"tail", 7}}, 2048);

        REQUIRE(shm.read_data("n") == value);
        REQUIRE(shm.read_data("n", 2048) == json{{"tail", 7}});
    }

    SECTION("Shorter payload clears the previous tail") {
        shm.create_region("s", 256, RegionType::Custom);
        shm.write_data("s", json{{"long", std::string(100, 'x')}});
        shm.write_data("s", json{{"a", 1}});
        REQUIRE(shm.read_data("s") == json{{"a", 1}});

        auto region = shm.open_region("s", LockType::Read);
        std::size_t used = 4 + json{{"a", 1}}.dump().size();
        for (std::size_t i = used; i < 120; ++i) {
            REQUIRE(region.data()[i] == 0);
        }
    }

    SECTION("Access statistics are tracked") {
        shm.create_region("acc", 64, RegionType::Custom);
        shm.write_data("acc", json::array());
        shm.read_data("acc");

        auto info = shm.get_region_info("acc");
        REQUIRE(info.has_value());
        REQUIRE(info->access_count == 2);
        REQUIRE(info->last_accessed >= info->created_at);
    }
}

TEST_CASE("Shared memory capacity enforcement", "[shm]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));
    shm.create_region("small", 32, RegionType::Custom);

    json fits = json{{"k", "1234567890"}};  // 18 bytes + 4
    shm.write_data("small", fits);

    json too_big = json{{"k", std::string(40, 'z')}};
    REQUIRE_THROWS_AS(shm.write_data("small", too_big), std::invalid_argument);
    REQUIRE(shm.read_data("small") == fits);

    // Exactly size - 4 bytes of payload fits
    json exact = std::string(26, 'q');  // 28 bytes once quoted
    REQUIRE(shm.write_data("small", exact) == 32);
    REQUIRE(shm.read_data("small") == exact);
}

TEST_CASE("Shared memory corrupt data", "[shm]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));
    auto info = shm.create_region("c", 64, RegionType::Custom);

    SECTION("Never written") {
        REQUIRE_THROWS_AS(shm.read_data("c"), CorruptDataError);
    }

    SECTION("Length beyond region") {
        {
            auto region = shm.open_region("c", LockType::Write);
            region.data()[0] = 0x7f;
        }
        REQUIRE_THROWS_AS(shm.read_data("c"), CorruptDataError);
    }

    SECTION("Unparsable payload") {
        {
            auto region = shm.open_region("c", LockType::Write);
            const char garbage[] = "{not json";
            region.data()[3] = sizeof(garbage) - 1;
            std::memcpy(region.data() + 4, garbage, sizeof(garbage) - 1);
        }
        REQUIRE_THROWS_AS(shm.read_data("c"), CorruptDataError);
    }

    SECTION("Offsets outside the region") {
        shm.write_data("c", json{{"k", 1}});
        const std::size_t huge = std::numeric_limits<std::size_t>::max() - 1;

        REQUIRE_THROWS_AS(shm.read_data("c", huge), CorruptDataError);
        REQUIRE_THROWS_AS(shm.read_data("c", 62), CorruptDataError);
        REQUIRE_THROWS_AS(shm.update_data("c", [](const json&) { return json{{"k", 2}}; }, huge),
                          CorruptDataError);
        REQUIRE(shm.read_data("c")["k"] == 1);
    }

    SECTION("Length header runs past the end") {
        {
            auto region = shm.open_region("c", LockType::Write);
            region.data()[63] = 1;  // length 1 at offset 60; payload would start at 64
        }
        REQUIRE_THROWS_AS(shm.read_data("c", 60), CorruptDataError);
    }

    SECTION("Corrupt registry") {
        {
            std::ofstream out(dir.path() / "registry.json", std::ios::trunc);
            out << "{ definitely not json";
        }
        REQUIRE_THROWS_AS(shm.list_regions(), CorruptDataError);
        REQUIRE_THROWS_AS(shm.create_region("x", 64, RegionType::Custom), CorruptDataError);
    }
}

TEST_CASE("Shared memory open after a concurrent delete", "[shm]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));
    auto info = shm.create_region("gone", 64, RegionType::Cache);

    // delete_region removed the lock file while this caller still saw the entry
    std::filesystem::remove(info.lock_path);

    REQUIRE_THROWS_AS(shm.open_region("gone", LockType::Read), MemoryRegionNotFoundError);
    REQUIRE_THROWS_AS(shm.read_data("gone"), MemoryRegionNotFoundError);
    REQUIRE_FALSE(std::filesystem::exists(info.lock_path));
}

TEST_CASE("Shared memory schema validation", "[shm]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));
    json schema = {{"price", "number"}, {"pair", "string"}, {"active", "boolean"},
                   {"meta", "object"}, {"fills", "array"}, {"extra", "decimal"}};
    shm.create_region("typed", 1024, RegionType::State, schema);

    json valid = {{"price", 1}, {"pair", "BTC/USDT"}, {"active", false},
                  {"meta", {{"nested", {{"ignored", "yes"}}}}}, {"fills", json::array()},
                  {"extra", "anything"}};

    SECTION("Valid value is written") {
        shm.write_data("typed", valid);
        REQUIRE(shm.read_data("typed") == valid);

        json fractional = valid;
        fractional["price"] = 2.5;
        REQUIRE_NOTHROW(shm.write_data("typed", fractional));
    }

    SECTION("Type mismatches are rejected") {
        json bad = valid;
        bad["price"] = true;  // booleans are not numbers
        REQUIRE_THROWS_AS(shm.write_data("typed", bad), SchemaValidationError);

        bad = valid;
        bad["pair"] = 5;
        REQUIRE_THROWS_AS(shm.write_data("typed", bad), SchemaValidationError);

        bad = valid;
        bad.erase("fills");
        REQUIRE_THROWS_AS(shm.write_data("typed", bad), SchemaValidationError);

        REQUIRE_THROWS_AS(shm.write_data("typed", json::array()), SchemaValidationError);
    }

    SECTION("Validation can be skipped") {
        REQUIRE_NOTHROW(shm.write_data("typed", json{{"raw", 1}}, 0, false));
    }

    SECTION("Free function") {
        REQUIRE_NOTHROW(validate_schema(valid, schema));
        REQUIRE_THROWS_AS(validate_schema(json{{"price", "1"}}, json{{"price", "number"}}),
                          SchemaValidationError);
    }
}

TEST_CASE("Shared memory atomic updates", "[shm]") {
    testing::TempDir dir;
    SharedMemoryManager shm(shm_config(dir));
    shm.create_region("counter", 256, RegionType::State);

    SECTION("Never-written region passes null") {
        json seen = "unset";
        shm.update_data("counter", [&](const json& current) {
            seen = current;
            return json{{"count", 0}};
        });
        REQUIRE(seen.is_null());
        REQUIRE(shm.read_data("counter")["count"] == 0);
    }

    SECTION("Concurrent increments are not lost") {
        shm.write_data("counter", json{{"count", 10}});

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 25; ++i) {
                    shm.update_data("counter", [](const json& current) {
                        json next = current;
                        next["count"] = current["count"].get<int>() + 1;
                        return next;
                    });
                }
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(shm.read_data("counter")["count"] == 110);
    }

    SECTION("Increments from two managers are not lost") {
        shm.write_data("counter", json{{"count", 0}});
        SharedMemoryManager other(shm_config(dir));

        auto bump = [](SharedMemoryManager& mgr) {
            for (int i = 0; i < 30; ++i) {
                mgr.update_data("counter", [](const json& current) {
                    return json{{"count", current["count"].get<int>() + 1}};
                });
            }
        };
        std::thread t1(bump, std::ref(shm));
        std::thread t2(bump, std::ref(other));
        t1.join();
        t2.join();

        REQUIRE(shm.read_data("counter")["count"] == 60);
    }

    SECTION("A throwing update leaves the region unchanged") {
        shm.write_data("counter", json{{"count", 5}});
        REQUIRE_THROWS_AS(shm.update_data("counter",
                                          [](const json&) -> json {
                                              throw std::runtime_error("abort");
                                          }),
                          std::runtime_error);
        REQUIRE(shm.read_data("counter")["count"] == 5);
    }
}

TEST_CASE("Shared memory locking", "[shm]") {
    testing::TempDir dir;
    auto config = shm_config(dir);
    config.lock_timeout = 100ms;
    SharedMemoryManager shm(config);
    shm.create_region("locked", 64, RegionType::Custom);
    shm.write_data("locked", json{{"v", 1}});

    SECTION("Readers share the lock") {
        auto r1 = shm.open_region("locked", LockType::Read);
        auto r2 = shm.open_region("locked", LockType::Read);
        REQUIRE_FALSE(r1.writable());
        REQUIRE(r2.size() == 64);
    }

    SECTION("A held exclusive lock times out other writers") {
        auto held = shm.open_region("locked", LockType::Exclusive);
        REQUIRE(held.writable());
        REQUIRE_THROWS_AS(shm.write_data("locked", json{{"v", 2}}), LockAcquisitionError);
        REQUIRE_THROWS_AS(shm.read_data("locked"), LockAcquisitionError);
    }

    SECTION("Lock is released when the mapping goes out of scope") {
        { auto held = shm.open_region("locked", LockType::Write); }
        REQUIRE_NOTHROW(shm.write_data("locked", json{{"v", 3}}));
        REQUIRE(shm.read_data("locked")["v"] == 3);
    }

    SECTION("Moved mapping keeps the lock") {
        auto first = shm.open_region("locked", LockType::Write);
        MappedRegion moved(std::move(first));
        REQUIRE_THROWS_AS(shm.read_data("locked"), LockAcquisitionError);
    }
}

TEST_CASE("Shared memory duplicate creation race", "[shm]") {
    testing::TempDir dir;
    SharedMemoryManager a(shm_config(dir));
    SharedMemoryManager b(shm_config(dir));

    std::atomic<int> created{0};
    std::atomic<int> rejected{0};
    auto attempt = [&](SharedMemoryManager& mgr) {
        try {
            mgr.create_region("contested", 64, RegionType::State);
            ++created;
        } catch (const std::invalid_argument&) {
            ++rejected;
        }
    };

    std::thread t1(attempt, std::ref(a));
    std::thread t2(attempt, std::ref(b));
    t1.join();
    t2.join();

    REQUIRE(created == 1);
    REQUIRE(rejected == 1);
    REQUIRE(a.list_regions().size() == 1);
}
