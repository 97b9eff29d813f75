#include <issuehub-cpp/document.hpp>
#include <issuehub-cpp/error.hpp>

#include <algorithm>
#include <string>
#include <unordered_set>

namespace issuehub_cpp {

namespace {

[[noreturn]] void violation(const std::string& what) {
    throw Exception{ErrorKind::invalid_mutation, what};
}

}  // anonymous namespace

auto Document::find(IssueId id) -> Issue* {
    auto it = std::ranges::find(issues, id, &Issue::id);
    return it != issues.end() ? &*it : nullptr;
}

auto Document::find(IssueId id) const -> const Issue* {
    auto it = std::ranges::find(issues, id, &Issue::id);
    return it != issues.end() ? &*it : nullptr;
}

void check_invariants(const Document& doc) {
    if (doc.next_id < 1) violation("nextId must be at least 1");

    auto seen = std::unordered_set<IssueId>{};
    seen.reserve(doc.issues.size());
    for (const auto& issue : doc.issues) {
        auto label = "issue #" + std::to_string(issue.id);
        if (issue.id == 0) violation("issue id must be positive");
        if (issue.id >= doc.next_id) violation(label + " is not below nextId");
        if (!seen.insert(issue.id).second) violation("duplicate " + label);
        if (issue.title.empty()) violation(label + " has an empty title");
        for (const auto& comment : issue.comments) {
            if (comment.text.empty()) violation(label + " has an empty comment");
        }
    }
}

void check_transition(const Document& before, const Document& after) {
    check_invariants(after);
    if (after.next_id < before.next_id) violation("nextId decreased");

    for (const auto& old_issue : before.issues) {
        const auto* issue = after.find(old_issue.id);
        if (!issue) {
            violation("issue #" + std::to_string(old_issue.id) + " disappeared");
        }
        if (issue->comments.size() < old_issue.comments.size()) {
            violation("comments of issue #" + std::to_string(old_issue.id) + " shrank");
        }
    }
}

}  // namespace issuehub_cpp
