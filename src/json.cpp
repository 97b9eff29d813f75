#include <issuehub-cpp/json.hpp>
#include <issuehub-cpp/error.hpp>

#include <zlib.h>

#include <string>
#include <utility>
#include <variant>

namespace issuehub_cpp {

namespace {

// Wire names of the three event variants (shared with the browser client).
constexpr std::string_view created_type = "issue_created";
constexpr std::string_view commented_type = "issue_commented";
constexpr std::string_view updated_type = "issue_updated";

// Ids and counters must be stored as non-negative integers; get<uint64_t>
// would wrap a negative value.
auto unsigned_field(const nlohmann::json& j, const char* key) -> std::uint64_t {
    const auto& value = j.at(key);
    if (!value.is_number_unsigned()) {
        throw Exception{ErrorKind::decoding_error,
                        std::string{key} + " must be a non-negative integer, got " + value.dump()};
    }
    return value.get<std::uint64_t>();
}

}  // anonymous namespace

// =============================================================================
// Scalars
// =============================================================================

void to_json(nlohmann::json& j, IssueStatus s) {
    j = std::string{to_string_view(s)};
}

void from_json(const nlohmann::json& j, IssueStatus& s) {
    auto parsed = parse_status(j.get<std::string>());
    if (!parsed) {
        throw Exception{ErrorKind::decoding_error, "invalid status: " + j.dump()};
    }
    s = *parsed;
}

void to_json(nlohmann::json& j, Timestamp t) {
    j = to_iso8601(t);
}

void from_json(const nlohmann::json& j, Timestamp& t) {
    // Millisecond numbers are accepted as well as ISO strings.
    if (j.is_number_integer()) {
        t = Timestamp{j.get<std::int64_t>()};
        return;
    }
    auto parsed = parse_iso8601(j.get<std::string>());
    if (!parsed) {
        throw Exception{ErrorKind::decoding_error, "invalid timestamp: " + j.dump()};
    }
    t = *parsed;
}

// =============================================================================
// Model
// =============================================================================

void to_json(nlohmann::json& j, const Comment& c) {
    j = nlohmann::json{
        {"author", c.author},
        {"text", c.text},
        {"createdAt", c.created_at},
    };
}

void from_json(const nlohmann::json& j, Comment& c) {
    c.author = j.at("author").get<std::string>();
    c.text = j.at("text").get<std::string>();
    c.created_at = j.at("createdAt").get<Timestamp>();
}

void to_json(nlohmann::json& j, const Issue& issue) {
    j = nlohmann::json{
        {"id", issue.id},
        {"title", issue.title},
        {"description", issue.description},
        {"status", issue.status},
        {"createdBy", issue.created_by},
        {"createdAt", issue.created_at},
    };
    if (issue.updated_at) {
        j["updatedAt"] = *issue.updated_at;
    }
    j["comments"] = issue.comments;
}

void from_json(const nlohmann::json& j, Issue& issue) {
    issue.id = unsigned_field(j, "id");
    issue.title = j.at("title").get<std::string>();
    issue.description = j.value("description", std::string{});
    issue.status = j.at("status").get<IssueStatus>();
    issue.created_by = j.at("createdBy").get<std::string>();
    issue.created_at = j.at("createdAt").get<Timestamp>();
    if (auto it = j.find("updatedAt"); it != j.end() && !it->is_null()) {
        issue.updated_at = it->get<Timestamp>();
    } else {
        issue.updated_at.reset();
    }
    issue.comments = j.value("comments", std::vector<Comment>{});
}

void to_json(nlohmann::json& j, const Document& doc) {
    j = nlohmann::json{
        {"nextId", doc.next_id},
        {"issues", doc.issues},
    };
}

void from_json(const nlohmann::json& j, Document& doc) {
    doc.next_id = unsigned_field(j, "nextId");
    doc.issues = j.at("issues").get<std::vector<Issue>>();
}

// =============================================================================
// Events
// =============================================================================

auto event_type_name(const MutationEvent& event) -> std::string_view {
    return std::visit(overload{
        [](const IssueCreated&) { return created_type; },
        [](const IssueCommented&) { return commented_type; },
        [](const IssueStatusChanged&) { return updated_type; },
    }, event);
}

void to_json(nlohmann::json& j, const MutationEvent& event) {
    std::visit(overload{
        [&](const IssueCreated& e) {
            j = nlohmann::json{{"type", std::string{created_type}}, {"issue", e.issue}};
        },
        [&](const IssueCommented& e) {
            j = nlohmann::json{{"type", std::string{commented_type}}, {"id", e.id}, {"comment", e.comment}};
        },
        [&](const IssueStatusChanged& e) {
            j = nlohmann::json{{"type", std::string{updated_type}}, {"issue", e.issue}};
        },
    }, event);
}

void from_json(const nlohmann::json& j, MutationEvent& event) {
    auto type = j.at("type").get<std::string>();
    if (type == created_type) {
        event = IssueCreated{j.at("issue").get<Issue>()};
    } else if (type == commented_type) {
        event = IssueCommented{unsigned_field(j, "id"), j.at("comment").get<Comment>()};
    } else if (type == updated_type) {
        event = IssueStatusChanged{j.at("issue").get<Issue>()};
    } else {
        throw Exception{ErrorKind::decoding_error, "unknown event type: " + type};
    }
}

// =============================================================================
// Text encodings
// =============================================================================

auto encode_document(const Document& doc) -> std::string {
    return nlohmann::json(doc).dump(2);
}

auto decode_document(std::string_view text) -> Document {
    auto doc = Document{};
    try {
        nlohmann::json::parse(text).get_to(doc);
    } catch (const nlohmann::json::exception& e) {
        throw Exception{ErrorKind::decoding_error, std::string{"malformed document: "} + e.what()};
    }
    check_invariants(doc);
    return doc;
}

auto encode_event(const MutationEvent& event) -> std::string {
    return nlohmann::json(event).dump();
}

auto decode_event(std::string_view text) -> MutationEvent {
    auto event = MutationEvent{};
    try {
        nlohmann::json::parse(text).get_to(event);
    } catch (const nlohmann::json::exception& e) {
        throw Exception{ErrorKind::decoding_error, std::string{"malformed event: "} + e.what()};
    }
    return event;
}

auto document_checksum(const Document& doc) -> std::uint32_t {
    auto compact = nlohmann::json(doc).dump();
    auto crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(compact.data()),
                  static_cast<uInt>(compact.size()));
    return static_cast<std::uint32_t>(crc);
}

}  // namespace issuehub_cpp
