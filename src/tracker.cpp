#include <issuehub-cpp/tracker.hpp>
#include <issuehub-cpp/config.hpp>
#include <issuehub-cpp/error.hpp>
#include <issuehub-cpp/logging.hpp>

#include <utility>

namespace issuehub_cpp {

namespace {

auto issue_label(IssueId id) -> std::string {
    return "Issue #" + std::to_string(id);
}

auto missing_issue() -> Error {
    return Error{ErrorKind::not_found, "Issue not found"};
}

auto make_audit_log(const Config& config) -> std::shared_ptr<AuditLog> {
    const auto backend = config.audit.backend.get();
    if (backend == "file") {
        return std::make_shared<FileAuditLog>(config.audit.file.get());
    }
    if (backend == "git") {
        return std::make_shared<GitAuditLog>(config.audit.git_repo_dir.get(),
                                             config.storage.data_file.get());
    }
    return nullptr;
}

}  // anonymous namespace

Tracker::Tracker(std::shared_ptr<DocumentStore> store,
                 std::shared_ptr<AuditLog> audit,
                 BroadcastOptions broadcast)
    : audit_{audit ? std::make_shared<AuditLogger>(std::move(audit)) : nullptr},
      broadcaster_{std::make_shared<Broadcaster>(broadcast)},
      serializer_{std::make_unique<WriteSerializer>(std::move(store), audit_, broadcaster_)} {}

auto Tracker::open(const Config& config) -> std::unique_ptr<Tracker> {
    auto store = std::make_shared<FileDocumentStore>(config.storage.data_file.get());
    auto options = BroadcastOptions{};
    options.mailbox_capacity = config.broadcast.mailbox_capacity.get();
    options.delivery_threads =
        static_cast<unsigned int>(config.broadcast.delivery_threads.get());
    logger()->info("opening {} (audit: {})", config.storage.data_file.get(),
                   config.audit.backend.get());
    return std::make_unique<Tracker>(std::move(store), make_audit_log(config), options);
}

// Writes finish before the audit trail is flushed and the broadcaster closes.
Tracker::~Tracker() {
    serializer_.reset();
    if (audit_) audit_->flush();
}

auto Tracker::current_document() const -> std::shared_ptr<const Document> {
    return serializer_->snapshot();
}

auto Tracker::create_issue(const CreateIssueRequest& request) -> SubmitResult {
    if (request.title.empty() || request.created_by.empty()) {
        return Error{ErrorKind::validation_error, "title and createdBy required"};
    }

    const auto now = Timestamp::now();
    auto mutation = [request, now](const Document& doc) {
        auto next = doc;
        auto issue = Issue{};
        issue.id = next.next_id++;
        issue.title = request.title;
        issue.description = request.description;
        issue.status = IssueStatus::open;
        issue.created_by = request.created_by;
        issue.created_at = now;
        next.issues.push_back(issue);
        return Transition{std::move(next), IssueCreated{std::move(issue)}};
    };
    auto label = [who = request.created_by](const MutationEvent& event) {
        return issue_label(issue_id_of(event)) + " created by " + who;
    };
    return serializer_->submit(std::move(mutation), std::move(label));
}

auto Tracker::add_comment(IssueId id, const AddCommentRequest& request) -> SubmitResult {
    if (request.author.empty() || request.text.empty()) {
        return Error{ErrorKind::validation_error, "author and text required"};
    }
    if (!current_document()->find(id)) return missing_issue();

    auto comment = Comment{request.author, request.text, Timestamp::now()};
    auto mutation = [id, comment](const Document& doc) {
        auto next = doc;
        auto* issue = next.find(id);
        if (!issue) throw Exception{missing_issue()};
        issue->comments.push_back(comment);
        return Transition{std::move(next), IssueCommented{id, comment}};
    };
    return serializer_->submit(std::move(mutation),
                               "Comment on " + issue_label(id) + " by " + request.author);
}

auto Tracker::change_status(IssueId id, const ChangeStatusRequest& request) -> SubmitResult {
    if (request.status.empty() || request.updated_by.empty()) {
        return Error{ErrorKind::validation_error, "status and updatedBy required"};
    }
    auto status = parse_status(request.status);
    if (!status) return Error{ErrorKind::validation_error, "invalid status"};
    if (!current_document()->find(id)) return missing_issue();

    const auto now = Timestamp::now();
    auto mutation = [id, status = *status, now](const Document& doc) {
        auto next = doc;
        auto* issue = next.find(id);
        if (!issue) throw Exception{missing_issue()};
        issue->status = status;
        issue->updated_at = now;
        return Transition{std::move(next), IssueStatusChanged{*issue}};
    };
    return serializer_->submit(std::move(mutation),
                               issue_label(id) + " marked as " +
                                   std::string{to_string_view(*status)} + " by " +
                                   request.updated_by);
}

auto Tracker::subscribe() -> std::shared_ptr<Subscription> {
    return broadcaster_->subscribe();
}

auto Tracker::subscribe(EventCallback callback) -> SubscriberId {
    return broadcaster_->subscribe(std::move(callback));
}

void Tracker::unsubscribe(SubscriberId id) {
    broadcaster_->unsubscribe(id);
}

}  // namespace issuehub_cpp
