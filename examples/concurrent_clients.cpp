// concurrent_clients — many writers, one serialized document
//
// Demonstrates: 16 client threads submit mutations at once. Saves never
// overlap; requests that arrive while a write is in flight coalesce into the
// single pending slot, so some callers are told their request was
// superseded. Every applied mutation is persisted, audited and broadcast in
// the same order.
//
// Build: cmake --build build
// Run:   ./build/examples/concurrent_clients

#include <issuehub-cpp/issuehub.hpp>
#include <issuehub-cpp/logging.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ih = issuehub_cpp;

namespace {

// A store that takes a few milliseconds per save, like a slow disk.
class SlowDiskStore : public ih::MemoryDocumentStore {
public:
    void save(const ih::Document& doc) override {
        std::this_thread::sleep_for(std::chrono::milliseconds{3});
        ih::MemoryDocumentStore::save(doc);
    }
};

}  // anonymous namespace

int main() {
    ih::configure_logging("warn");

    auto store = std::make_shared<SlowDiskStore>();
    auto trail = std::make_shared<ih::MemoryAuditLog>();
    auto tracker = ih::Tracker{store, trail, ih::BroadcastOptions{.delivery_threads = 2}};

    auto delivered = std::atomic<int>{0};
    tracker.subscribe([&](const ih::MutationEvent&) { ++delivered; });

    // One issue for every client to comment on and move between states.
    tracker.create_issue({"Shared issue", "", "admin"});

    constexpr int clients = 16;
    constexpr int requests_per_client = 20;
    auto applied = std::atomic<int>{0};
    auto superseded = std::atomic<int>{0};

    const auto start = std::chrono::steady_clock::now();
    {
        auto threads = std::vector<std::jthread>{};
        for (int c = 0; c < clients; ++c) {
            threads.emplace_back([&, c] {
                const auto who = "client-" + std::to_string(c);
                for (int i = 0; i < requests_per_client; ++i) {
                    auto result = (i % 2 == 0)
                        ? tracker.add_comment(1, {who, "update " + std::to_string(i)})
                        : tracker.change_status(1, {i % 4 == 1 ? "In Progress" : "Open", who});
                    if (ih::is_applied(result)) {
                        ++applied;
                    } else if (ih::error_of(result)->kind == ih::ErrorKind::superseded) {
                        ++superseded;
                    }
                }
            });
        }
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    tracker.broadcaster().wait_for_delivery();
    tracker.audit_logger()->flush();

    const auto stats = tracker.serializer().stats();
    std::printf("requests:    %d\n", clients * requests_per_client);
    std::printf("applied:     %d\n", applied.load());
    std::printf("superseded:  %d\n", superseded.load());
    std::printf("saves:       %zu (including the initial create)\n", store->save_count());
    std::printf("audited:     %zu\n", trail->entries().size());
    std::printf("broadcast:   %d\n", delivered.load());
    std::printf("stats:       applied=%llu superseded=%llu failed=%llu\n",
                static_cast<unsigned long long>(stats.applied),
                static_cast<unsigned long long>(stats.superseded),
                static_cast<unsigned long long>(stats.failed));
    std::printf("elapsed:     %lld ms\n",
                static_cast<long long>(
                    std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()));
    std::printf("comments:    %zu\n", tracker.current_document()->issues.front().comments.size());
    return 0;
}
