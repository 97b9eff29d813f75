/// @file mutation_event.hpp
/// @brief MutationEvent: the unit broadcast to subscribers and audited.

#pragma once

#include <issuehub-cpp/types.hpp>

#include <variant>

namespace issuehub_cpp {

/// An issue was created. Carries the full new issue.
struct IssueCreated {
    Issue issue;
    auto operator==(const IssueCreated&) const -> bool = default;
};

/// A comment was appended to an issue.
struct IssueCommented {
    IssueId id{0};    ///< The issue that received the comment.
    Comment comment;  ///< The appended comment.
    auto operator==(const IssueCommented&) const -> bool = default;
};

/// An issue's status changed. Carries the full updated issue.
struct IssueStatusChanged {
    Issue issue;
    auto operator==(const IssueStatusChanged&) const -> bool = default;
};

/// The set of changes a mutation can describe.
using MutationEvent = std::variant<
    IssueCreated,
    IssueCommented,
    IssueStatusChanged
>;

/// The id of the issue an event refers to.
inline auto issue_id_of(const MutationEvent& event) -> IssueId {
    return std::visit(overload{
        [](const IssueCreated& e) { return e.issue.id; },
        [](const IssueCommented& e) { return e.id; },
        [](const IssueStatusChanged& e) { return e.issue.id; },
    }, event);
}

}  // namespace issuehub_cpp
