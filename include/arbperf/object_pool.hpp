// ArbPerf - Object Pool
// Bounded reuse pool with TTL eviction and optional validation

#ifndef ARBPERF_OBJECT_POOL_HPP
#define ARBPERF_OBJECT_POOL_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging.hpp"
#include "types.hpp"

namespace arbperf {

// Type-erased view used by ResourceManager to hold pools of any element type
class PoolBase {
public:
    virtual ~PoolBase() = default;

    struct Stats {
        std::size_t available;
        std::size_t in_use;
        std::size_t max_size;
        double ttl_seconds;
        uint64_t created;
        uint64_t reused;
        uint64_t discarded;
    };

    virtual Stats get_stats() const = 0;
    virtual std::size_t evict_expired() = 0;
    virtual void shutdown() = 0;
};

inline void to_json(nlohmann::json& j, const PoolBase::Stats& stats) {
    j = nlohmann::json{
        {"available", stats.available},
        {"in_use", stats.in_use},
        {"max_size", stats.max_size},
        {"ttl", stats.ttl_seconds},
        {"created", stats.created},
        {"reused", stats.reused},
        {"discarded", stats.discarded},
    };
}

template <typename T>
class ObjectPool : public PoolBase {
public:
    using Factory = std::function<std::shared_ptr<T>()>;
    using Validator = std::function<bool(const T&)>;
    using Duration = std::chrono::duration<double>;

    ObjectPool(Factory factory, std::size_t max_size = 100,
               Duration ttl = std::chrono::seconds(60), Validator validation_func = {})
        : factory_(std::move(factory)),
          max_size_(max_size),
          ttl_(std::chrono::duration_cast<Clock::duration>(ttl)),
          validator_(std::move(validation_func)) {
        if (!factory_) {
            throw std::invalid_argument("ObjectPool requires a factory");
        }
        if (max_size_ == 0) {
            throw std::invalid_argument("ObjectPool max_size must be positive");
        }
        if (ttl_ <= Clock::duration::zero()) {
            throw std::invalid_argument("ObjectPool ttl must be positive");
        }
        reaper_ = std::thread(&ObjectPool::reaper_loop, this);
    }

    ~ObjectPool() override { shutdown(); }

    // Non-copyable
    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;

    // Most recently released valid object, or a fresh one from the factory
    std::shared_ptr<T> get() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();

        while (!available_.empty()) {
            Entry entry = std::move(available_.back());
            available_.pop_back();

            if (now - entry.released_at > ttl_ ||
                (validator_ && !validator_(*entry.object))) {
                ++discarded_;
                continue;
            }

            ++reused_;
            T* key = entry.object.get();
            in_use_.emplace(key, entry.object);
            return entry.object;
        }

        auto obj = factory_();
        if (!obj) {
            throw std::runtime_error("ObjectPool factory returned null");
        }
        ++created_;
        in_use_.emplace(obj.get(), obj);
        return obj;
    }

    // Return a checked-out object; the oldest available entry makes room when full
    void release(const std::shared_ptr<T>& obj) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = obj ? in_use_.find(obj.get()) : in_use_.end();
        if (it == in_use_.end()) {
            throw std::invalid_argument("Object was not checked out from this pool");
        }
        in_use_.erase(it);

        if (available_.size() >= max_size_) {
            available_.erase(available_.begin());
            ++discarded_;
        }
        available_.push_back(Entry{obj, Clock::now()});
    }

    // Drop every available entry older than ttl; returns how many went
    std::size_t evict_expired() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        auto before = available_.size();
        available_.erase(std::remove_if(available_.begin(), available_.end(),
                                        [&](const Entry& e) {
                                            return now - e.released_at > ttl_;
                                        }),
                         available_.end());
        std::size_t evicted = before - available_.size();
        discarded_ += evicted;
        return evicted;
    }

    Stats get_stats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return Stats{
            available_.size(),
            in_use_.size(),
            max_size_,
            std::chrono::duration<double>(ttl_).count(),
            created_,
            reused_,
            discarded_,
        };
    }

    void shutdown() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) return;
            stopped_ = true;
        }
        reaper_cv_.notify_all();
        if (reaper_.joinable()) {
            reaper_.join();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        available_.clear();
        in_use_.clear();
    }

private:
    struct Entry {
        std::shared_ptr<T> object;
        Clock::time_point released_at;
    };

    void reaper_loop() {
        auto log = logging::get("pool");
        auto interval = ttl_ / 2;

        while (true) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (reaper_cv_.wait_for(lock, interval, [this] { return stopped_; })) {
                    return;
                }
            }
            try {
                std::size_t evicted = evict_expired();
                if (evicted > 0) {
                    log->debug("Evicted {} expired objects", evicted);
                }
            } catch (const std::exception& e) {
                log->error("Error in pool reaper: {}", e.what());
            }
        }
    }

    Factory factory_;
    const std::size_t max_size_;
    const Clock::duration ttl_;
    Validator validator_;

    mutable std::mutex mutex_;
    std::condition_variable reaper_cv_;
    std::thread reaper_;
    bool stopped_{false};

    // Oldest at the front, most recently released at the back
    std::vector<Entry> available_;
    std::unordered_map<T*, std::shared_ptr<T>> in_use_;

    uint64_t created_{0};
    uint64_t reused_{0};
    uint64_t discarded_{0};
};

}  // namespace arbperf

#endif  // ARBPERF_OBJECT_POOL_HPP
