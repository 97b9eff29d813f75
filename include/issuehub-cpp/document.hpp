/// @file document.hpp
/// @brief The Document value: the shared collection of issues plus the id counter.

#pragma once

#include <issuehub-cpp/types.hpp>

#include <cstdint>
#include <vector>

namespace issuehub_cpp {

/// The single shared document.
///
/// A Document is a plain value. Once handed to the WriteSerializer or
/// published it is treated as immutable and shared through
/// `std::shared_ptr<const Document>`; mutations build a new value.
///
/// @code
/// auto doc = Document{};
/// auto& issue = doc.issues.emplace_back();
/// issue.id = doc.next_id++;
/// @endcode
struct Document {
    std::uint64_t next_id{1};   ///< Next id to assign. Greater than every issue id.
    std::vector<Issue> issues;  ///< Issues in insertion order.

    /// Find an issue by id.
    /// @return A pointer into `issues`, or nullptr if absent.
    auto find(IssueId id) -> Issue*;

    /// Find an issue by id (const).
    auto find(IssueId id) const -> const Issue*;

    auto operator==(const Document&) const -> bool = default;
};

/// Verify the structural invariants of a document.
///
/// Checks that `next_id >= 1`, every id is positive, unique and below
/// `next_id`, titles and comment texts are non-empty.
/// @throws Exception with ErrorKind::invalid_mutation on the first violation.
void check_invariants(const Document& doc);

/// Verify that `after` is a legal successor of `before`.
///
/// In addition to check_invariants(after): `next_id` never decreases, no
/// issue disappears or changes id, and no comment list shrinks.
/// @throws Exception with ErrorKind::invalid_mutation on the first violation.
void check_transition(const Document& before, const Document& after);

}  // namespace issuehub_cpp
