#include <issuehub-cpp/write_serializer.hpp>
#include <issuehub-cpp/audit_log.hpp>
#include <issuehub-cpp/broadcaster.hpp>
#include <issuehub-cpp/document_store.hpp>
#include <issuehub-cpp/json.hpp>
#include <issuehub-cpp/logging.hpp>

#include "work_queue.hpp"

#include <exception>
#include <utility>

namespace issuehub_cpp {

namespace {

auto render_label(const AuditLabel& label, const MutationEvent& event) -> std::string {
    return std::visit(overload{
        [](const std::string& text) { return text; },
        [&](const std::function<std::string(const MutationEvent&)>& fn) { return fn(event); },
    }, label);
}

}  // anonymous namespace

WriteSerializer::WriteSerializer(std::shared_ptr<DocumentStore> store,
                                 std::shared_ptr<AuditLogger> audit,
                                 std::shared_ptr<Broadcaster> broadcaster)
    : store_{std::move(store)},
      audit_{std::move(audit)},
      broadcaster_{std::move(broadcaster)} {
    if (!store_) {
        throw Exception{ErrorKind::store_unavailable, "no document store configured"};
    }
    state_.document = std::make_shared<const Document>(store_->load());
    continuation_ = std::make_unique<detail::WorkQueue>(1);
}

WriteSerializer::~WriteSerializer() {
    wait_idle();
    continuation_.reset();
}

// -- Submission ---------------------------------------------------------------

auto WriteSerializer::submit(Mutation mutation, AuditLabel label) -> SubmitResult {
    auto request = std::make_shared<Request>();
    request->mutation = std::move(mutation);
    request->label = std::move(label);

    auto owns_slot = false;
    auto reply = std::future<SubmitResult>{};
    {
        auto lock = std::scoped_lock{mutex_};
        if (state_.in_flight) {
            if (state_.pending) {
                state_.pending->reply.set_value(
                    Error{ErrorKind::superseded, "replaced by a newer submission before it ran"});
                ++state_.stats.superseded;
                logger()->debug("pending submission superseded");
            }
            reply = request->reply.get_future();
            state_.pending = request;
        } else {
            state_.in_flight = true;
            owns_slot = true;
        }
    }

    // Another write holds the slot: wait for this request's own turn.
    if (!owns_slot) return reply.get();

    auto result = SubmitResult{};
    try {
        result = apply(*request);
    } catch (...) {
        hand_on_slot();
        throw;
    }
    hand_on_slot();
    return result;
}

void WriteSerializer::hand_on_slot() {
    if (auto next = claim_next_or_release()) {
        continuation_->submit([this, next] { drain(next); });
    }
}

void WriteSerializer::drain(std::shared_ptr<Request> request) {
    while (request) {
        // Whatever apply throws belongs to that request's caller.
        try {
            request->reply.set_value(apply(*request));
        } catch (...) {
            request->reply.set_exception(std::current_exception());
        }
        request = claim_next_or_release();
    }
}

auto WriteSerializer::claim_next_or_release() -> std::shared_ptr<Request> {
    auto lock = std::scoped_lock{mutex_};
    if (state_.pending) {
        return std::exchange(state_.pending, nullptr);
    }
    state_.in_flight = false;
    idle_cv_.notify_all();
    return nullptr;
}

// -- The write itself ---------------------------------------------------------

auto WriteSerializer::apply(Request& request) -> SubmitResult {
    auto current = snapshot();

    auto transition = Transition{};
    try {
        transition = request.mutation(*current);
        check_transition(*current, transition.next);
    } catch (const Exception& e) {
        logger()->debug("mutation rejected: {}", e.what());
        auto lock = std::scoped_lock{mutex_};
        ++state_.stats.rejected;
        return e.error();
    } catch (const std::exception& e) {
        logger()->warn("mutation failed: {}", e.what());
        auto lock = std::scoped_lock{mutex_};
        ++state_.stats.rejected;
        return Error{ErrorKind::invalid_mutation, e.what()};
    }

    try {
        store_->save(transition.next);
    } catch (const std::exception& e) {
        logger()->error("persisting document failed: {}", e.what());
        auto lock = std::scoped_lock{mutex_};
        ++state_.stats.failed;
        return Error{ErrorKind::store_unavailable, e.what()};
    }

    auto next = std::make_shared<const Document>(std::move(transition.next));
    auto sequence = std::uint64_t{0};
    {
        auto lock = std::scoped_lock{mutex_};
        state_.document = next;
        sequence = ++state_.sequence;
        ++state_.stats.applied;
    }

    // The document is persisted: from here on nothing may fail the request.
    announce(request, sequence, *next, transition.event);
    return transition.event;
}

void WriteSerializer::announce(const Request& request, std::uint64_t sequence,
                               const Document& persisted, const MutationEvent& event) {
    auto text = std::string{};
    try {
        text = render_label(request.label, event);
    } catch (const std::exception& e) {
        logger()->warn("audit label for #{} failed: {}", sequence, e.what());
        text = "Mutation #" + std::to_string(sequence);
    }
    logger()->debug("applied #{}: {}", sequence, text);

    if (audit_) {
        try {
            audit_->record(AuditEntry{sequence, std::move(text), Timestamp::now(),
                                      document_checksum(persisted), encode_document(persisted)});
        } catch (const std::exception& e) {
            logger()->warn("audit record #{} could not be queued: {}", sequence, e.what());
        }
    }
    if (broadcaster_) {
        try {
            broadcaster_->publish(event);
        } catch (const std::exception& e) {
            logger()->error("broadcast of #{} failed: {}", sequence, e.what());
        }
    }
}

// -- Introspection ------------------------------------------------------------

auto WriteSerializer::snapshot() const -> std::shared_ptr<const Document> {
    auto lock = std::scoped_lock{mutex_};
    return state_.document;
}

auto WriteSerializer::status() const -> Status {
    auto lock = std::scoped_lock{mutex_};
    return Status{state_.in_flight, state_.pending != nullptr};
}

auto WriteSerializer::stats() const -> Stats {
    auto lock = std::scoped_lock{mutex_};
    return state_.stats;
}

void WriteSerializer::wait_idle() {
    auto lock = std::unique_lock{mutex_};
    idle_cv_.wait(lock, [&] { return !state_.in_flight && !state_.pending; });
}

}  // namespace issuehub_cpp
