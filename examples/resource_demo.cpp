// ArbPerf - Resource Demo
// Wires the executor, pools, batched I/O and shared memory together

#include <arbperf/config.hpp>
#include <arbperf/errors.hpp>
#include <arbperf/logging.hpp>
#include <arbperf/resource_manager.hpp>
#include <arbperf/shared_memory.hpp>
#include <arbperf/shared_state.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace arbperf;
using nlohmann::json;

namespace {

struct PriceBuffer {
    std::vector<double> prices;
};

// Toy spread computation standing in for real opportunity scoring
double spread_bps(double bid, double ask) {
    return (ask - bid) / ((ask + bid) / 2.0) * 10000.0;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Config config = argc > 1 ? Config::from_file(argv[1]) : Config();
        logging::init(config.logging);
        auto log = logging::get("demo");

        ResourceManager manager(config);
        manager.start();

        // Object pool of scratch buffers
        manager.create_object_pool<PriceBuffer>(
            "price_buffers", [] { return std::make_shared<PriceBuffer>(); }, 16,
            std::chrono::seconds(30),
            [](const PriceBuffer& b) { return b.prices.capacity() < 4096; });

        auto buffer = manager.get_object<PriceBuffer>("price_buffers");
        buffer->prices = {3001.5, 3002.25, 2999.75};
        manager.release_object<PriceBuffer>("price_buffers", buffer);

        // Prioritized tasks
        TaskOptions critical;
        critical.priority = TaskPriority::Critical;
        double bps = manager.submit_task(critical, spread_bps, 3000.0, 3001.5);
        std::cout << "Spread: " << bps << " bps\n";

        TaskOptions flaky;
        flaky.max_retries = 1;
        flaky.retry_delay = std::chrono::milliseconds(50);
        try {
            manager.submit_task(flaky, []() -> int { throw std::domain_error("no quote"); });
        } catch (const std::domain_error& e) {
            std::cout << "Task failed after retry: " << e.what() << "\n";
        }

        // Batched I/O
        auto snapshot = std::filesystem::temp_directory_path() / "arbperf_demo" / "snapshot.json";
        manager.write_file(snapshot, json{{"spread_bps", bps}}.dump());
        std::cout << "Snapshot: " << manager.read_file(snapshot) << "\n";

        // Shared memory
        SharedMemoryManager shm(config.shared_memory);
        SharedMetricsStore metrics(shm, config.shared_memory.metrics_region_size,
                                   config.shared_memory.default_metrics_ttl);
        SharedStateManager state(shm, config.shared_memory.state_region_size);
        metrics.initialize();
        state.initialize();

        auto usage = manager.get_resource_usage();
        metrics.set_ttl("system", 5.0);
        metrics.store_metrics("system", json(usage));
        metrics.update_metrics("system", [](const json& m) {
            json next = m;
            next["demo"] = true;
            return next;
        });
        std::cout << "Metrics: " << metrics.get_all_metrics().dump() << "\n";

        state.register_change_callback("positions", [&](const json& value, uint64_t version) {
            log->info("positions -> v{}: {}", version, value.dump());
        });
        uint64_t version = 0;
        try {
            version = state.get_state("positions").second;
        } catch (const MemoryRegionNotFoundError&) {
            log->info("positions not published yet");
        }
        try {
            version = state.set_state("positions", json{{"ETH", 1.25}}, version);
        } catch (const VersionConflictError& e) {
            log->warn("{}", e.what());
            version = state.set_state("positions", json{{"ETH", 1.25}});
        }
        std::cout << "Positions at version " << version << "\n";

        std::cout << "\nStats:\n" << manager.get_stats().dump(2) << "\n";

        manager.stop();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
