#include <issuehub-cpp/broadcaster.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace issuehub_cpp;
using namespace std::chrono_literals;

namespace {

auto created(IssueId id) -> MutationEvent {
    auto issue = Issue{};
    issue.id = id;
    issue.title = "Issue " + std::to_string(id);
    return IssueCreated{issue};
}

// Collects delivered ids from a callback subscriber.
struct Recorder {
    std::mutex mutex;
    std::vector<IssueId> ids;

    auto callback() -> EventCallback {
        return [this](const MutationEvent& e) {
            auto lock = std::scoped_lock{mutex};
            ids.push_back(issue_id_of(e));
        };
    }

    auto snapshot() -> std::vector<IssueId> {
        auto lock = std::scoped_lock{mutex};
        return ids;
    }
};

}  // anonymous namespace

// -- Registry -----------------------------------------------------------------

TEST(Broadcaster, subscribe_and_unsubscribe_update_count) {
    auto broadcaster = Broadcaster{};
    auto a = broadcaster.subscribe();
    auto b = broadcaster.subscribe([](const MutationEvent&) {});
    EXPECT_EQ(broadcaster.subscriber_count(), 2u);

    broadcaster.unsubscribe(a->id());
    EXPECT_EQ(broadcaster.subscriber_count(), 1u);
    EXPECT_FALSE(a->is_open());
    EXPECT_EQ(a->close_reason(), CloseReason::unsubscribed);

    broadcaster.unsubscribe(b);
    EXPECT_EQ(broadcaster.subscriber_count(), 0u);
}

TEST(Broadcaster, unsubscribe_is_idempotent) {
    auto broadcaster = Broadcaster{};
    auto sub = broadcaster.subscribe();
    broadcaster.unsubscribe(sub->id());
    broadcaster.unsubscribe(sub->id());
    broadcaster.unsubscribe(9999);
    EXPECT_EQ(broadcaster.subscriber_count(), 0u);
}

TEST(Broadcaster, subscriber_ids_are_unique) {
    auto broadcaster = Broadcaster{};
    auto a = broadcaster.subscribe();
    auto b = broadcaster.subscribe();
    EXPECT_NE(a->id(), b->id());
}

// -- Pull delivery ------------------------------------------------------------

TEST(Broadcaster, publish_reaches_every_live_subscriber) {
    auto broadcaster = Broadcaster{};
    auto a = broadcaster.subscribe();
    auto b = broadcaster.subscribe();

    EXPECT_EQ(broadcaster.publish(created(1)), 2u);

    EXPECT_EQ(a->try_next(), created(1));
    EXPECT_EQ(b->try_next(), created(1));
    EXPECT_FALSE(a->try_next().has_value());
}

TEST(Broadcaster, events_arrive_in_publish_order) {
    auto broadcaster = Broadcaster{};
    auto sub = broadcaster.subscribe();
    for (IssueId id = 1; id <= 20; ++id) broadcaster.publish(created(id));
    for (IssueId id = 1; id <= 20; ++id) {
        auto event = sub->next(100ms);
        ASSERT_TRUE(event.has_value());
        EXPECT_EQ(issue_id_of(*event), id);
    }
}

TEST(Broadcaster, late_subscriber_misses_earlier_events) {
    auto broadcaster = Broadcaster{};
    broadcaster.publish(created(1));
    auto sub = broadcaster.subscribe();
    broadcaster.publish(created(2));
    EXPECT_EQ(sub->try_next(), created(2));
    EXPECT_FALSE(sub->try_next().has_value());
}

TEST(Broadcaster, unsubscribed_receives_nothing_more) {
    auto broadcaster = Broadcaster{};
    auto sub = broadcaster.subscribe();
    broadcaster.unsubscribe(sub->id());
    EXPECT_EQ(broadcaster.publish(created(1)), 0u);
    EXPECT_FALSE(sub->try_next().has_value());
}

TEST(Broadcaster, next_times_out_without_events) {
    auto broadcaster = Broadcaster{};
    auto sub = broadcaster.subscribe();
    EXPECT_FALSE(sub->next(10ms).has_value());
}

TEST(Broadcaster, next_wakes_on_close) {
    auto broadcaster = Broadcaster{};
    auto sub = broadcaster.subscribe();
    auto reader = std::async(std::launch::async, [&] { return sub->next(10s); });
    std::this_thread::sleep_for(20ms);
    sub->close();
    ASSERT_EQ(reader.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(reader.get().has_value());
}

TEST(Broadcaster, stalled_subscriber_does_not_delay_others) {
    auto broadcaster = Broadcaster{BroadcastOptions{.mailbox_capacity = 1000}};
    auto stalled = broadcaster.subscribe();  // never read
    auto reader = broadcaster.subscribe();

    const auto start = std::chrono::steady_clock::now();
    for (IssueId id = 1; id <= 500; ++id) broadcaster.publish(created(id));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    EXPECT_EQ(reader->pending(), 500u);
    EXPECT_EQ(stalled->pending(), 500u);
}

TEST(Broadcaster, lagging_subscriber_is_dropped) {
    auto broadcaster = Broadcaster{BroadcastOptions{.mailbox_capacity = 3}};
    auto slow = broadcaster.subscribe();
    auto fast = broadcaster.subscribe();

    for (IssueId id = 1; id <= 5; ++id) {
        broadcaster.publish(created(id));
        ASSERT_TRUE(fast->try_next().has_value());
    }

    EXPECT_FALSE(slow->is_open());
    EXPECT_EQ(slow->close_reason(), CloseReason::lagging);
    EXPECT_EQ(slow->pending(), 0u);
    EXPECT_TRUE(fast->is_open());
    EXPECT_EQ(broadcaster.subscriber_count(), 1u);
}

// -- Callback delivery --------------------------------------------------------

TEST(Broadcaster, callbacks_receive_events_in_order) {
    auto broadcaster = Broadcaster{BroadcastOptions{.delivery_threads = 2}};
    auto a = Recorder{};
    auto b = Recorder{};
    broadcaster.subscribe(a.callback());
    broadcaster.subscribe(b.callback());

    auto expected = std::vector<IssueId>{};
    for (IssueId id = 1; id <= 100; ++id) {
        broadcaster.publish(created(id));
        expected.push_back(id);
    }
    broadcaster.wait_for_delivery();

    EXPECT_EQ(a.snapshot(), expected);
    EXPECT_EQ(b.snapshot(), expected);
}

TEST(Broadcaster, slow_callback_does_not_block_publish) {
    auto broadcaster = Broadcaster{BroadcastOptions{.delivery_threads = 2}};
    auto release = std::promise<void>{};
    auto gate = release.get_future().share();
    broadcaster.subscribe([gate](const MutationEvent&) { gate.wait(); });
    auto fast = broadcaster.subscribe();

    const auto start = std::chrono::steady_clock::now();
    for (IssueId id = 1; id <= 10; ++id) broadcaster.publish(created(id));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(fast->pending(), 10u);

    release.set_value();
    broadcaster.wait_for_delivery();
}

TEST(Broadcaster, throwing_callback_closes_only_that_subscriber) {
    auto broadcaster = Broadcaster{BroadcastOptions{.delivery_threads = 1}};
    auto faulty = broadcaster.subscribe([](const MutationEvent&) {
        throw std::runtime_error{"socket closed"};
    });
    auto healthy = Recorder{};
    broadcaster.subscribe(healthy.callback());

    broadcaster.publish(created(1));
    broadcaster.wait_for_delivery();
    broadcaster.publish(created(2));
    broadcaster.wait_for_delivery();

    EXPECT_EQ(healthy.snapshot(), (std::vector<IssueId>{1, 2}));
    EXPECT_EQ(broadcaster.subscriber_count(), 1u);
    broadcaster.unsubscribe(faulty);
}

TEST(Broadcaster, non_standard_throw_closes_subscriber_and_delivery_completes) {
    auto broadcaster = Broadcaster{BroadcastOptions{.delivery_threads = 1}};
    broadcaster.subscribe([](const MutationEvent&) { throw 42; });
    auto healthy = Recorder{};
    broadcaster.subscribe(healthy.callback());

    broadcaster.publish(created(1));
    broadcaster.wait_for_delivery();
    broadcaster.publish(created(2));
    broadcaster.wait_for_delivery();

    EXPECT_EQ(healthy.snapshot(), (std::vector<IssueId>{1, 2}));
    EXPECT_EQ(broadcaster.subscriber_count(), 1u);
}

TEST(Broadcaster, unsubscribe_from_inside_callback) {
    auto broadcaster = Broadcaster{BroadcastOptions{.delivery_threads = 1}};
    auto count = std::atomic<int>{0};
    auto id = std::make_shared<std::atomic<SubscriberId>>(0);
    *id = broadcaster.subscribe([&, id](const MutationEvent&) {
        ++count;
        broadcaster.unsubscribe(id->load());
    });

    broadcaster.publish(created(1));
    broadcaster.wait_for_delivery();
    broadcaster.publish(created(2));
    broadcaster.wait_for_delivery();

    EXPECT_EQ(count.load(), 1);
    EXPECT_EQ(broadcaster.subscriber_count(), 0u);
}

TEST(Broadcaster, destruction_closes_pull_subscribers) {
    auto sub = std::shared_ptr<Subscription>{};
    {
        auto broadcaster = Broadcaster{};
        sub = broadcaster.subscribe();
    }
    EXPECT_FALSE(sub->is_open());
    EXPECT_EQ(sub->close_reason(), CloseReason::shutdown);
}
