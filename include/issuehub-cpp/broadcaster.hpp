/// @file broadcaster.hpp
/// @brief Subscriber registry and ordered, per-subscriber independent
///        fan-out of MutationEvents.

#pragma once

#include <issuehub-cpp/mutation_event.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tf {
class Executor;
}  // namespace tf

namespace issuehub_cpp {

/// Handle identifying one subscriber.
using SubscriberId = std::uint64_t;

/// Callback invoked for every event delivered to a callback subscriber.
using EventCallback = std::function<void(const MutationEvent&)>;

/// Tuning for a Broadcaster.
struct BroadcastOptions {
    /// Events a subscriber may have queued before it is dropped as lagging.
    std::size_t mailbox_capacity = 1024;
    /// Threads for callback delivery. 0 = the process-global executor.
    unsigned int delivery_threads = 0;
};

/// Why a subscription stopped receiving events.
enum class CloseReason : std::uint8_t {
    none,          ///< Still open.
    unsubscribed,  ///< Closed by the client or unsubscribe().
    lagging,       ///< The mailbox overflowed.
    faulted,       ///< The callback threw.
    shutdown,      ///< The broadcaster was destroyed.
};

/// One live observer: a bounded FIFO mailbox of events.
///
/// Pull subscribers read with next()/try_next(). Callback subscribers are
/// drained by the broadcaster's executor, one event at a time and in order.
/// close() discards queued events and wakes any reader.
class Subscription {
public:
    Subscription(SubscriberId id, std::size_t capacity, EventCallback callback = {});

    Subscription(const Subscription&) = delete;
    auto operator=(const Subscription&) -> Subscription& = delete;

    auto id() const -> SubscriberId { return id_; }

    /// Wait up to `timeout` for the next event.
    /// @return The event, or nullopt on timeout or once closed and empty.
    auto next(std::chrono::milliseconds timeout) -> std::optional<MutationEvent>;

    /// Pop the next event without waiting.
    auto try_next() -> std::optional<MutationEvent>;

    /// Stop accepting events. Idempotent.
    void close(CloseReason reason = CloseReason::unsubscribed);

    auto is_open() const -> bool;
    auto close_reason() const -> CloseReason;

    /// Number of events queued and not yet consumed.
    auto pending() const -> std::size_t;

private:
    friend class Broadcaster;

    enum class Offer : std::uint8_t { accepted, closed, overflow };

    // Enqueue without blocking. Reports whether a drain must be scheduled.
    auto offer(const MutationEvent& event, bool& schedule_drain) -> Offer;

    // Deliver queued events to the callback until the mailbox is empty.
    void drain_callback();

    const SubscriberId id_;
    const std::size_t capacity_;
    const EventCallback callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<MutationEvent> mailbox_;
    CloseReason closed_{CloseReason::none};
    bool draining_{false};
};

/// Tracks live subscribers and publishes events to each of them.
///
/// publish() snapshots the live set under the registry lock and enqueues
/// outside it. It never waits on a subscriber: a subscriber that does not
/// keep up overflows its own mailbox and is dropped, and callback delivery
/// runs on the executor. Subscribers that join after an event was
/// published never receive it; they fetch current state instead.
class Broadcaster {
public:
    explicit Broadcaster(BroadcastOptions options = {});
    ~Broadcaster();

    Broadcaster(const Broadcaster&) = delete;
    auto operator=(const Broadcaster&) -> Broadcaster& = delete;

    /// Register a pull subscriber.
    auto subscribe() -> std::shared_ptr<Subscription>;

    /// Register a callback subscriber.
    auto subscribe(EventCallback callback) -> SubscriberId;

    /// Close and remove a subscriber. Idempotent; safe during delivery.
    void unsubscribe(SubscriberId id);

    /// Deliver an event to every subscriber live at call time.
    /// @return The number of subscribers that accepted it.
    auto publish(const MutationEvent& event) -> std::size_t;

    /// Number of registered subscribers.
    auto subscriber_count() const -> std::size_t;

    /// Block until no callback delivery is running or scheduled.
    void wait_for_delivery();

private:
    auto add(EventCallback callback) -> std::shared_ptr<Subscription>;
    auto executor() -> tf::Executor&;
    void schedule_delivery(const std::shared_ptr<Subscription>& sub);
    void finish_delivery();

    BroadcastOptions options_;
    std::unique_ptr<tf::Executor> own_executor_;

    mutable std::mutex mutex_;
    std::unordered_map<SubscriberId, std::shared_ptr<Subscription>> subscribers_;
    SubscriberId next_id_{1};

    std::mutex delivery_mutex_;
    std::condition_variable delivery_cv_;
    std::size_t deliveries_in_flight_{0};
};

}  // namespace issuehub_cpp
