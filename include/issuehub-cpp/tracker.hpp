/// @file tracker.hpp
/// @brief Tracker: the mutation handler surface over the serialized engine.

#pragma once

#include <issuehub-cpp/audit_log.hpp>
#include <issuehub-cpp/broadcaster.hpp>
#include <issuehub-cpp/document.hpp>
#include <issuehub-cpp/document_store.hpp>
#include <issuehub-cpp/write_serializer.hpp>

#include <memory>
#include <string>

namespace issuehub_cpp {

struct Config;

/// Input of Tracker::create_issue.
struct CreateIssueRequest {
    std::string title;        ///< Required.
    std::string description;  ///< Optional.
    std::string created_by;   ///< Required.
};

/// Input of Tracker::add_comment.
struct AddCommentRequest {
    std::string author;  ///< Required.
    std::string text;    ///< Required.
};

/// Input of Tracker::change_status.
struct ChangeStatusRequest {
    std::string status;      ///< "Open", "In Progress" or "Closed".
    std::string updated_by;  ///< Required.
};

/// The issue tracker: validates requests, turns them into mutations with
/// audit labels, and submits them to the WriteSerializer.
///
/// Validation and unknown-id errors are reported without entering the
/// serializer. Results are SubmitResults: the applied MutationEvent or an
/// Error (validation_error, not_found, store_unavailable, superseded).
///
/// @code
/// auto tracker = Tracker{std::make_shared<MemoryDocumentStore>()};
/// auto id = tracker.subscribe([](const MutationEvent& e) { ... });
/// auto result = tracker.create_issue({"Bug A", "", "alice"});
/// @endcode
class Tracker {
public:
    /// Wire a tracker from parts. `audit` may be null (no audit trail).
    explicit Tracker(std::shared_ptr<DocumentStore> store,
                     std::shared_ptr<AuditLog> audit = nullptr,
                     BroadcastOptions broadcast = {});

    /// Build the file store, the configured audit backend and the
    /// broadcaster described by `config`.
    /// @throws Exception with ErrorKind::store_unavailable if the data file
    ///   cannot be loaded or initialized.
    static auto open(const Config& config) -> std::unique_ptr<Tracker>;

    ~Tracker();

    Tracker(const Tracker&) = delete;
    auto operator=(const Tracker&) -> Tracker& = delete;

    // -- Reads ----------------------------------------------------------------

    /// The current document. Always succeeds.
    auto current_document() const -> std::shared_ptr<const Document>;

    // -- Mutations ------------------------------------------------------------

    /// Create an issue with status Open. Label `Issue #<id> created by <who>`.
    auto create_issue(const CreateIssueRequest& request) -> SubmitResult;

    /// Append a comment. Label `Comment on Issue #<id> by <author>`.
    auto add_comment(IssueId id, const AddCommentRequest& request) -> SubmitResult;

    /// Change an issue's status. Label `Issue #<id> marked as <status> by <who>`.
    auto change_status(IssueId id, const ChangeStatusRequest& request) -> SubmitResult;

    // -- Subscriptions --------------------------------------------------------

    auto subscribe() -> std::shared_ptr<Subscription>;
    auto subscribe(EventCallback callback) -> SubscriberId;
    void unsubscribe(SubscriberId id);

    // -- Parts ----------------------------------------------------------------

    auto serializer() -> WriteSerializer& { return *serializer_; }
    auto broadcaster() -> Broadcaster& { return *broadcaster_; }

    /// The audit front, or nullptr when no audit backend is configured.
    auto audit_logger() -> AuditLogger* { return audit_.get(); }

private:
    std::shared_ptr<AuditLogger> audit_;
    std::shared_ptr<Broadcaster> broadcaster_;
    std::unique_ptr<WriteSerializer> serializer_;
};

}  // namespace issuehub_cpp
