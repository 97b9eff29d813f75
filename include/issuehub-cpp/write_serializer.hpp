/// @file write_serializer.hpp
/// @brief The WriteSerializer: the only path that persists a new document.

#pragma once

#include <issuehub-cpp/document.hpp>
#include <issuehub-cpp/error.hpp>
#include <issuehub-cpp/mutation_event.hpp>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace issuehub_cpp {

class AuditLogger;
class Broadcaster;
class DocumentStore;

namespace detail {
class WorkQueue;
}  // namespace detail

/// The outcome of a mutation: the next document and the event describing it.
struct Transition {
    Document next;
    MutationEvent event;
};

/// A pure function from the current document to its successor.
///
/// May throw Exception (e.g. ErrorKind::not_found) to reject the request;
/// nothing is persisted in that case.
using Mutation = std::function<Transition(const Document&)>;

/// The audit label of a mutation: fixed text, or computed from the
/// applied event (to name an id the mutation assigned).
using AuditLabel = std::variant<std::string, std::function<std::string(const MutationEvent&)>>;

/// The applied event, or why the request was not applied.
using SubmitResult = std::variant<MutationEvent, Error>;

/// True if the result holds an applied event.
inline auto is_applied(const SubmitResult& r) -> bool {
    return std::holds_alternative<MutationEvent>(r);
}

/// The error of a failed result, or nullptr.
inline auto error_of(const SubmitResult& r) -> const Error* {
    return std::get_if<Error>(&r);
}

/// Applies, persists, audits and broadcasts mutations in a single total
/// order with at most one write in flight.
///
/// - Idle: `submit` runs the write on the caller's thread and returns.
/// - Busy: the request takes the single pending slot and the caller waits
///   for its own turn. A request already in the slot is replaced and its
///   caller receives ErrorKind::superseded at once (last submission wins).
/// - When a write completes, the writer claims the pending slot and the
///   continuation worker processes it, looping until the slot is empty.
///
/// A store failure is logged and returned to that request's caller as
/// ErrorKind::store_unavailable; it is neither audited nor broadcast, and
/// the next request proceeds normally.
///
/// @code
/// auto result = serializer.submit(
///     [](const Document& doc) {
///         auto next = doc;
///         ...
///         return Transition{std::move(next), IssueCreated{issue}};
///     },
///     "Issue #1 created by alice");
/// @endcode
class WriteSerializer {
public:
    /// Whether a write is running and whether a request is waiting.
    struct Status {
        bool in_flight{false};
        bool pending{false};
    };

    /// Lifetime counters.
    struct Stats {
        std::uint64_t applied{0};     ///< Persisted, audited and broadcast.
        std::uint64_t failed{0};      ///< Store failures.
        std::uint64_t rejected{0};    ///< Mutation threw or broke an invariant.
        std::uint64_t superseded{0};  ///< Replaced in the pending slot.
    };

    /// Load the canonical document from `store`.
    /// `audit` and `broadcaster` may be null.
    /// @throws Exception with ErrorKind::store_unavailable if loading fails.
    WriteSerializer(std::shared_ptr<DocumentStore> store,
                    std::shared_ptr<AuditLogger> audit,
                    std::shared_ptr<Broadcaster> broadcaster);
    ~WriteSerializer();

    WriteSerializer(const WriteSerializer&) = delete;
    auto operator=(const WriteSerializer&) -> WriteSerializer& = delete;

    /// Submit a mutation. Blocks until this request was applied, failed, or
    /// was superseded; never waits for a different request's result.
    auto submit(Mutation mutation, AuditLabel label) -> SubmitResult;

    /// The canonical document: the last successfully persisted value.
    auto snapshot() const -> std::shared_ptr<const Document>;

    auto status() const -> Status;
    auto stats() const -> Stats;

    /// Block until no write is in flight or pending.
    void wait_idle();

private:
    struct Request {
        Mutation mutation;
        AuditLabel label;
        std::promise<SubmitResult> reply;
    };

    // Run one write: mutate, check, save, publish the new snapshot, audit,
    // broadcast. Called only by the holder of the in-flight slot.
    auto apply(Request& request) -> SubmitResult;

    // Audit and broadcast a persisted write. Failures are logged only.
    void announce(const Request& request, std::uint64_t sequence,
                  const Document& persisted, const MutationEvent& event);

    // Hand the pending request to the next writer, or release the slot.
    auto claim_next_or_release() -> std::shared_ptr<Request>;

    // Release the slot, or start the continuation on the claimed request.
    void hand_on_slot();

    // Continuation loop: process claimed requests until the slot is empty.
    void drain(std::shared_ptr<Request> request);

    std::shared_ptr<DocumentStore> store_;
    std::shared_ptr<AuditLogger> audit_;
    std::shared_ptr<Broadcaster> broadcaster_;

    // Everything below is guarded by mutex_.
    struct WriteState {
        bool in_flight{false};
        std::shared_ptr<Request> pending;
        std::shared_ptr<const Document> document;
        std::uint64_t sequence{0};
        Stats stats;
    };
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    WriteState state_;

    std::unique_ptr<detail::WorkQueue> continuation_;
};

}  // namespace issuehub_cpp
