// ArbPerf - Resource Manager Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include <arbperf/errors.hpp>
#include <arbperf/resource_manager.hpp>

#include "test_support.hpp"

using namespace arbperf;
using namespace std::chrono_literals;

namespace {

struct ValueError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Buffer {
    std::string bytes;
};

Config test_config() {
    Config config;
    config.executor.num_workers = 2;
    config.executor.poll_interval = 10ms;
    config.executor.cpu_probe = [] { return 0.0; };
    config.io.batch_interval = 10ms;
    config.resources.monitor_interval = 50ms;
    return config;
}

}  // namespace

TEST_CASE("ResourceManager submit_task", "[resources]") {
    ResourceManager manager(test_config());

    SECTION("Returns the task result and starts lazily") {
        REQUIRE_FALSE(manager.is_running());
        int sum = manager.submit_task([](int a, int b) { return a + b; }, 20, 22);
        REQUIRE(sum == 42);
        REQUIRE(manager.is_running());
    }

    SECTION("Void tasks") {
        std::atomic<int> hits{0};
        manager.submit_task([&hits] { ++hits; });
        REQUIRE(hits == 1);
    }

    SECTION("Arguments are bound by value") {
        std::string text = "abc";
        auto len = manager.submit_task([](const std::string& s) { return s.size(); }, text);
        REQUIRE(len == 3);
    }

    SECTION("Retries then rethrows the original exception") {
        std::atomic<int> calls{0};
        TaskOptions options;
        options.max_retries = 2;
        options.retry_delay = 10ms;

        REQUIRE_THROWS_AS(manager.submit_task(options,
                                              [&calls]() -> int {
                                                  ++calls;
                                                  throw ValueError("bad input");
                                              }),
                          ValueError);
        REQUIRE(calls == 3);
    }

    SECTION("Timeouts surface as TaskTimeoutError") {
        TaskOptions options;
        options.timeout = 30ms;
        options.max_retries = 0;

        REQUIRE_THROWS_AS(manager.submit_task(options,
                                              [] {
                                                  std::this_thread::sleep_for(300ms);
                                                  return 1;
                                              }),
                          TaskTimeoutError);
    }

    manager.stop();
}

TEST_CASE("ResourceManager object pools", "[resources]") {
    ResourceManager manager(test_config());

    manager.create_object_pool<Buffer>("buffers", [] { return std::make_shared<Buffer>(); }, 4);

    SECTION("Get and release through the manager") {
        auto buf = manager.get_object<Buffer>("buffers");
        buf->bytes = "payload";
        manager.release_object<Buffer>("buffers", buf);

        auto again = manager.get_object<Buffer>("buffers");
        REQUIRE(again == buf);
        REQUIRE(again->bytes == "payload");
    }

    SECTION("Pool errors raise immediately") {
        REQUIRE_THROWS_AS(manager.create_object_pool<Buffer>(
                              "buffers", [] { return std::make_shared<Buffer>(); }),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(manager.get_object<Buffer>("nope"), std::invalid_argument);
        REQUIRE_THROWS_AS(manager.get_object<std::string>("buffers"), std::invalid_argument);
    }

    SECTION("Pool stats appear in get_stats") {
        auto buf = manager.get_object<Buffer>("buffers");
        auto stats = manager.get_stats();
        REQUIRE(stats["pools"]["buffers"]["in_use"] == 1);
        REQUIRE(stats["pools"]["buffers"]["created"] == 1);
        manager.release_object<Buffer>("buffers", buf);
    }
}

TEST_CASE("ResourceManager file I/O", "[resources]") {
    testing::TempDir dir;
    ResourceManager manager(test_config());

    auto path = dir.path() / "state" / "snapshot.json";
    REQUIRE(manager.write_file(path, R"({"pnl":1.5})") == 11);
    REQUIRE(manager.read_file(path) == R"({"pnl":1.5})");

    manager.stop();
}

TEST_CASE("ResourceManager monitoring", "[resources]") {
    SECTION("Usage sample") {
        ResourceManager manager(test_config());
        auto usage = manager.get_resource_usage();
        REQUIRE(usage.memory_percent >= 0.0);
        REQUIRE(usage.memory_percent <= 100.0);
        REQUIRE(usage.cpu_percent >= 0.0);
        REQUIRE(usage.timestamp > 0.0);
    }

    SECTION("History is recorded and bounded") {
        auto config = test_config();
        config.resources.history_size = 3;
        ResourceManager manager(config);
        manager.start();

        auto deadline = std::chrono::steady_clock::now() + 3s;
        while (manager.get_usage_history().size() < 3 &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(20ms);
        }
        std::this_thread::sleep_for(150ms);
        REQUIRE(manager.get_usage_history().size() == 3);

        auto stats = manager.get_stats();
        REQUIRE(stats["resources"]["history_size"] == 3);
        REQUIRE(stats["resources"]["current"].contains("memory_percent"));
        REQUIRE(stats["executor"]["running"] == true);
        REQUIRE(stats["io"]["running"] == true);

        manager.stop();
    }

    SECTION("Memory pressure triggers reclamation") {
        auto config = test_config();
        config.resources.max_memory_percent = 0.0;
        ResourceManager manager(config);
        manager.start();

        auto deadline = std::chrono::steady_clock::now() + 3s;
        while (manager.gc_count() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(20ms);
        }
        REQUIRE(manager.gc_count() > 0);
        REQUIRE(manager.get_stats()["resources"]["gc_count"].get<uint64_t>() > 0);

        manager.stop();
    }
}
