/// @file types.hpp
/// @brief Core value types: IssueId, IssueStatus, Timestamp, Comment, Issue.

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace issuehub_cpp {

/// Identity of an issue. Positive, assigned once, never reused.
using IssueId = std::uint64_t;

/// The three workflow states of an issue.
enum class IssueStatus : std::uint8_t {
    open,         ///< Newly reported, nobody working on it.
    in_progress,  ///< Being worked on.
    closed,       ///< Resolved.
};

/// Convert an IssueStatus to its wire representation
/// ("Open", "In Progress", "Closed").
constexpr auto to_string_view(IssueStatus status) noexcept -> std::string_view {
    switch (status) {
        case IssueStatus::open:        return "Open";
        case IssueStatus::in_progress: return "In Progress";
        case IssueStatus::closed:      return "Closed";
    }
    return "unknown";
}

/// Parse a wire status string. Accepts "InProgress" as an alias.
/// @return The status, or nullopt if the text names no status.
auto parse_status(std::string_view text) -> std::optional<IssueStatus>;

/// A millisecond-precision UTC timestamp.
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    /// The current wall-clock time.
    static auto now() -> Timestamp;

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

/// Format as ISO-8601 UTC with milliseconds, e.g. "2024-05-01T12:00:00.000Z".
auto to_iso8601(Timestamp t) -> std::string;

/// Parse an ISO-8601 UTC timestamp ("YYYY-MM-DDTHH:MM:SS[.fff]Z").
/// @return The timestamp, or nullopt if the text is malformed.
auto parse_iso8601(std::string_view text) -> std::optional<Timestamp>;

/// A comment on an issue. Ordered by append order; no identity of its own.
struct Comment {
    std::string author;    ///< Who wrote it.
    std::string text;      ///< Non-empty body.
    Timestamp created_at;  ///< When it was appended.

    auto operator==(const Comment&) const -> bool = default;
};

/// A tracked issue.
struct Issue {
    IssueId id{0};                          ///< Unique positive id.
    std::string title;                      ///< Non-empty title.
    std::string description;                ///< Possibly empty.
    IssueStatus status{IssueStatus::open};  ///< Workflow state.
    std::string created_by;                 ///< Reporter.
    Timestamp created_at;                   ///< Creation time.
    std::optional<Timestamp> updated_at;    ///< Last status change, if any.
    std::vector<Comment> comments;          ///< Append-only.

    auto operator==(const Issue&) const -> bool = default;
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const IssueCreated& e) { ... },
///     [](const auto&) { ... },
/// }, event);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace issuehub_cpp
