// issuehub-cpp benchmarks — measures throughput of the write path and fan-out.

#include <issuehub-cpp/issuehub.hpp>
#include <issuehub-cpp/json.hpp>
#include <issuehub-cpp/logging.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace issuehub_cpp;

namespace {

auto populated_document(int issues, int comments_each) -> Document {
    auto doc = Document{};
    for (int i = 0; i < issues; ++i) {
        auto& issue = doc.issues.emplace_back();
        issue.id = doc.next_id++;
        issue.title = "Issue " + std::to_string(i);
        issue.description = "Something is broken in component " + std::to_string(i % 17);
        issue.created_by = "user" + std::to_string(i % 5);
        issue.created_at = Timestamp{1714564800000 + i};
        for (int c = 0; c < comments_each; ++c) {
            issue.comments.push_back(Comment{"user" + std::to_string(c % 5),
                                             "comment " + std::to_string(c),
                                             Timestamp{1714564900000 + c}});
        }
    }
    return doc;
}

// Quiet the logger once for the whole suite.
[[maybe_unused]] const bool quiet_logging = configure_logging("error");

}  // anonymous namespace

// =============================================================================
// Write path
// =============================================================================

static void bm_create_issue(benchmark::State& state) {
    auto tracker = Tracker{std::make_shared<MemoryDocumentStore>()};
    for (auto _ : state) {
        auto result = tracker.create_issue({"Bug", "", "alice"});
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_create_issue);

static void bm_add_comment_large_document(benchmark::State& state) {
    const auto issues = static_cast<int>(state.range(0));
    auto tracker = Tracker{std::make_shared<MemoryDocumentStore>(populated_document(issues, 3))};
    for (auto _ : state) {
        auto result = tracker.add_comment(1, {"bob", "+1"});
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_add_comment_large_document)->Range(10, 1000);

static void bm_create_issue_audited(benchmark::State& state) {
    auto trail = std::make_shared<MemoryAuditLog>();
    auto tracker = Tracker{std::make_shared<MemoryDocumentStore>(), trail};
    for (auto _ : state) {
        auto result = tracker.create_issue({"Bug", "", "alice"});
        benchmark::DoNotOptimize(result);
    }
    tracker.audit_logger()->flush();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_create_issue_audited);

static void bm_concurrent_submitters(benchmark::State& state) {
    static auto tracker = std::unique_ptr<Tracker>{};
    if (state.thread_index() == 0) {
        tracker = std::make_unique<Tracker>(std::make_shared<MemoryDocumentStore>());
        tracker->create_issue({"Shared", "", "admin"});
    }
    for (auto _ : state) {
        auto result = tracker->add_comment(1, {"client", "update"});
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
    if (state.thread_index() == 0) {
        state.counters["applied"] = static_cast<double>(tracker->serializer().stats().applied);
    }
}
BENCHMARK(bm_concurrent_submitters)->Threads(1)->Threads(4)->Threads(8);

// =============================================================================
// Fan-out
// =============================================================================

static void bm_publish_pull_subscribers(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto broadcaster = Broadcaster{BroadcastOptions{.mailbox_capacity = 1u << 20}};
    auto subs = std::vector<std::shared_ptr<Subscription>>{};
    for (std::size_t i = 0; i < n; ++i) subs.push_back(broadcaster.subscribe());

    const auto event = MutationEvent{IssueCreated{populated_document(1, 0).issues.front()}};
    for (auto _ : state) {
        benchmark::DoNotOptimize(broadcaster.publish(event));
        state.PauseTiming();
        for (auto& s : subs) s->try_next();
        state.ResumeTiming();
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_publish_pull_subscribers)->Range(1, 256);

static void bm_publish_callback_subscribers(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto broadcaster = Broadcaster{BroadcastOptions{.mailbox_capacity = 1u << 20}};
    for (std::size_t i = 0; i < n; ++i) {
        broadcaster.subscribe([](const MutationEvent& e) { benchmark::DoNotOptimize(e); });
    }

    const auto event = MutationEvent{IssueCreated{populated_document(1, 0).issues.front()}};
    for (auto _ : state) {
        broadcaster.publish(event);
    }
    broadcaster.wait_for_delivery();
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_publish_callback_subscribers)->Range(1, 64);

// =============================================================================
// Encoding
// =============================================================================

static void bm_encode_document(benchmark::State& state) {
    const auto doc = populated_document(static_cast<int>(state.range(0)), 3);
    auto bytes = std::size_t{0};
    for (auto _ : state) {
        auto text = encode_document(doc);
        bytes += text.size();
        benchmark::DoNotOptimize(text);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(bytes));
}
BENCHMARK(bm_encode_document)->Range(10, 1000);

static void bm_decode_document(benchmark::State& state) {
    const auto text = encode_document(populated_document(static_cast<int>(state.range(0)), 3));
    for (auto _ : state) {
        auto doc = decode_document(text);
        benchmark::DoNotOptimize(doc);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_decode_document)->Range(10, 1000);

static void bm_document_checksum(benchmark::State& state) {
    const auto doc = populated_document(static_cast<int>(state.range(0)), 3);
    for (auto _ : state) {
        benchmark::DoNotOptimize(document_checksum(doc));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_document_checksum)->Range(10, 1000);
