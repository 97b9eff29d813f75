#pragma once

// Document stores with controllable timing and failures, shared by the
// serializer and tracker tests.

#include <issuehub-cpp/document_store.hpp>
#include <issuehub-cpp/error.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>

namespace issuehub_cpp::test_support {

/// Records the highest number of save() calls ever running at once.
class SlowStore : public MemoryDocumentStore {
public:
    explicit SlowStore(std::chrono::microseconds delay) : delay_{delay} {}

    void save(const Document& doc) override {
        auto now_active = ++active_;
        auto seen = max_active_.load();
        while (now_active > seen && !max_active_.compare_exchange_weak(seen, now_active)) {}
        std::this_thread::sleep_for(delay_);
        MemoryDocumentStore::save(doc);
        --active_;
    }

    auto max_active() const -> int { return max_active_.load(); }

private:
    std::chrono::microseconds delay_;
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
};

/// Blocks every save() while armed, until open() is called.
class GatedStore : public MemoryDocumentStore {
public:
    void arm() {
        auto lock = std::scoped_lock{mutex_};
        release_ = std::promise<void>{};
        gate_ = release_.get_future().share();
        armed_ = true;
    }

    void open() {
        auto lock = std::scoped_lock{mutex_};
        if (armed_) release_.set_value();
        armed_ = false;
    }

    void save(const Document& doc) override {
        auto gate = std::shared_future<void>{};
        {
            auto lock = std::scoped_lock{mutex_};
            if (armed_) gate = gate_;
        }
        ++entered_;
        if (gate.valid()) gate.wait();
        MemoryDocumentStore::save(doc);
    }

    /// Poll until `n` saves have started. False on timeout.
    auto wait_entered(int n) const -> bool {
        for (auto i = 0; i < 2000; ++i) {
            if (entered_.load() >= n) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        return false;
    }

    auto entered() const -> int { return entered_.load(); }

private:
    std::mutex mutex_;
    bool armed_{false};
    std::promise<void> release_;
    std::shared_future<void> gate_;
    std::atomic<int> entered_{0};
};

/// Fails the next `n` save() calls with store_unavailable.
class FailingStore : public MemoryDocumentStore {
public:
    void fail_next(int n) { failures_left_ = n; }

    void save(const Document& doc) override {
        if (failures_left_.load() > 0) {
            --failures_left_;
            throw Exception{ErrorKind::store_unavailable, "disk full"};
        }
        MemoryDocumentStore::save(doc);
    }

private:
    std::atomic<int> failures_left_{0};
};

/// Poll `predicate` for up to two seconds.
template <typename Predicate>
auto eventually(Predicate predicate) -> bool {
    for (auto i = 0; i < 2000; ++i) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    return predicate();
}

}  // namespace issuehub_cpp::test_support
