#include <issuehub-cpp/broadcaster.hpp>
#include <issuehub-cpp/logging.hpp>

#include "executor.hpp"

#include <algorithm>
#include <exception>

namespace issuehub_cpp {

// =============================================================================
// Subscription
// =============================================================================

Subscription::Subscription(SubscriberId id, std::size_t capacity, EventCallback callback)
    : id_{id}, capacity_{std::max<std::size_t>(capacity, 1)}, callback_{std::move(callback)} {}

auto Subscription::next(std::chrono::milliseconds timeout) -> std::optional<MutationEvent> {
    auto lock = std::unique_lock{mutex_};
    cv_.wait_for(lock, timeout, [&] {
        return !mailbox_.empty() || closed_ != CloseReason::none;
    });
    if (mailbox_.empty()) return std::nullopt;
    auto event = std::move(mailbox_.front());
    mailbox_.pop_front();
    return event;
}

auto Subscription::try_next() -> std::optional<MutationEvent> {
    auto lock = std::scoped_lock{mutex_};
    if (mailbox_.empty()) return std::nullopt;
    auto event = std::move(mailbox_.front());
    mailbox_.pop_front();
    return event;
}

void Subscription::close(CloseReason reason) {
    {
        auto lock = std::scoped_lock{mutex_};
        if (closed_ != CloseReason::none) return;
        closed_ = reason;
        mailbox_.clear();
    }
    cv_.notify_all();
}

auto Subscription::is_open() const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return closed_ == CloseReason::none;
}

auto Subscription::close_reason() const -> CloseReason {
    auto lock = std::scoped_lock{mutex_};
    return closed_;
}

auto Subscription::pending() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return mailbox_.size();
}

auto Subscription::offer(const MutationEvent& event, bool& schedule_drain) -> Offer {
    schedule_drain = false;
    auto result = Offer::accepted;
    {
        auto lock = std::scoped_lock{mutex_};
        if (closed_ != CloseReason::none) return Offer::closed;
        if (mailbox_.size() >= capacity_) {
            closed_ = CloseReason::lagging;
            mailbox_.clear();
            result = Offer::overflow;
        } else {
            mailbox_.push_back(event);
            if (callback_ && !draining_) {
                draining_ = true;
                schedule_drain = true;
            }
        }
    }
    cv_.notify_all();
    return result;
}

void Subscription::drain_callback() {
    while (true) {
        auto event = std::optional<MutationEvent>{};
        {
            auto lock = std::scoped_lock{mutex_};
            if (mailbox_.empty() || closed_ != CloseReason::none) {
                draining_ = false;
                return;
            }
            event = std::move(mailbox_.front());
            mailbox_.pop_front();
        }
        try {
            callback_(*event);
        } catch (const std::exception& e) {
            logger()->warn("subscriber {} callback failed, closing it: {}", id_, e.what());
            close(CloseReason::faulted);
        } catch (...) {
            logger()->warn("subscriber {} callback threw a non-standard exception, closing it",
                           id_);
            close(CloseReason::faulted);
        }
    }
}

// =============================================================================
// Broadcaster
// =============================================================================

Broadcaster::Broadcaster(BroadcastOptions options)
    : options_{options} {
    if (options_.delivery_threads > 0) {
        own_executor_ = std::make_unique<tf::Executor>(options_.delivery_threads);
    }
}

Broadcaster::~Broadcaster() {
    auto subscribers = decltype(subscribers_){};
    {
        auto lock = std::scoped_lock{mutex_};
        subscribers.swap(subscribers_);
    }
    for (auto& [id, sub] : subscribers) sub->close(CloseReason::shutdown);
    wait_for_delivery();
}

auto Broadcaster::executor() -> tf::Executor& {
    return own_executor_ ? *own_executor_ : detail::global_executor();
}

auto Broadcaster::add(EventCallback callback) -> std::shared_ptr<Subscription> {
    auto lock = std::scoped_lock{mutex_};
    auto id = next_id_++;
    auto sub = std::make_shared<Subscription>(id, options_.mailbox_capacity, std::move(callback));
    subscribers_.emplace(id, sub);
    logger()->debug("subscriber {} connected ({} live)", id, subscribers_.size());
    return sub;
}

auto Broadcaster::subscribe() -> std::shared_ptr<Subscription> {
    return add({});
}

auto Broadcaster::subscribe(EventCallback callback) -> SubscriberId {
    return add(std::move(callback))->id();
}

void Broadcaster::unsubscribe(SubscriberId id) {
    auto sub = std::shared_ptr<Subscription>{};
    {
        auto lock = std::scoped_lock{mutex_};
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) return;
        sub = std::move(it->second);
        subscribers_.erase(it);
    }
    sub->close(CloseReason::unsubscribed);
    logger()->debug("subscriber {} disconnected", id);
}

auto Broadcaster::publish(const MutationEvent& event) -> std::size_t {
    auto live = std::vector<std::shared_ptr<Subscription>>{};
    {
        auto lock = std::scoped_lock{mutex_};
        live.reserve(subscribers_.size());
        for (const auto& [id, sub] : subscribers_) live.push_back(sub);
    }

    auto delivered = std::size_t{0};
    auto gone = std::vector<SubscriberId>{};
    for (const auto& sub : live) {
        auto schedule_drain = false;
        switch (sub->offer(event, schedule_drain)) {
            case Subscription::Offer::accepted:
                ++delivered;
                break;
            case Subscription::Offer::overflow:
                logger()->warn("subscriber {} is lagging ({} queued events), dropping it",
                               sub->id(), options_.mailbox_capacity);
                gone.push_back(sub->id());
                break;
            case Subscription::Offer::closed:
                gone.push_back(sub->id());
                break;
        }
        if (schedule_drain) schedule_delivery(sub);
    }

    if (!gone.empty()) {
        auto lock = std::scoped_lock{mutex_};
        for (auto id : gone) subscribers_.erase(id);
    }
    return delivered;
}

void Broadcaster::schedule_delivery(const std::shared_ptr<Subscription>& sub) {
    // Counts the delivery as finished however the drain task ends.
    struct DeliveryDone {
        Broadcaster& broadcaster;
        ~DeliveryDone() { broadcaster.finish_delivery(); }
    };

    {
        auto lock = std::scoped_lock{delivery_mutex_};
        ++deliveries_in_flight_;
    }
    try {
        executor().silent_async([this, sub] {
            auto done = DeliveryDone{*this};
            sub->drain_callback();
        });
    } catch (const std::exception& e) {
        logger()->error("cannot schedule delivery to subscriber {}, closing it: {}",
                        sub->id(), e.what());
        sub->close(CloseReason::faulted);
        finish_delivery();
    }
}

void Broadcaster::finish_delivery() {
    // Notify under the lock: the destructor may be waiting.
    auto lock = std::scoped_lock{delivery_mutex_};
    --deliveries_in_flight_;
    delivery_cv_.notify_all();
}

auto Broadcaster::subscriber_count() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return static_cast<std::size_t>(std::ranges::count_if(subscribers_, [](const auto& entry) {
        return entry.second->is_open();
    }));
}

void Broadcaster::wait_for_delivery() {
    auto lock = std::unique_lock{delivery_mutex_};
    delivery_cv_.wait(lock, [&] { return deliveries_in_flight_ == 0; });
}

}  // namespace issuehub_cpp
