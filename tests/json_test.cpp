// json_test.cpp — Tests for the persisted and transport JSON encodings

#include <issuehub-cpp/json.hpp>
#include <issuehub-cpp/error.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

namespace ih = issuehub_cpp;
using json = nlohmann::json;

namespace {

auto sample_issue() -> ih::Issue {
    auto issue = ih::Issue{};
    issue.id = 1;
    issue.title = "Bug A";
    issue.description = "crashes on start";
    issue.status = ih::IssueStatus::in_progress;
    issue.created_by = "alice";
    issue.created_at = ih::Timestamp{1714564800000};
    issue.updated_at = ih::Timestamp{1714564860000};
    issue.comments.push_back(ih::Comment{"bob", "repro'd", ih::Timestamp{1714564830000}});
    return issue;
}

auto sample_document() -> ih::Document {
    auto doc = ih::Document{};
    doc.issues.push_back(sample_issue());
    doc.next_id = 2;
    return doc;
}

auto decode_kind(std::string_view text) -> ih::ErrorKind {
    try {
        ih::decode_document(text);
    } catch (const ih::Exception& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected decode_document to throw";
    return ih::ErrorKind::config_error;
}

}  // anonymous namespace

// =============================================================================
// Persisted document
// =============================================================================

TEST(DocumentJson, field_names) {
    auto j = json(sample_document());
    EXPECT_EQ(j["nextId"], 2);
    ASSERT_EQ(j["issues"].size(), 1u);

    const auto& issue = j["issues"][0];
    EXPECT_EQ(issue["id"], 1);
    EXPECT_EQ(issue["title"], "Bug A");
    EXPECT_EQ(issue["description"], "crashes on start");
    EXPECT_EQ(issue["status"], "In Progress");
    EXPECT_EQ(issue["createdBy"], "alice");
    EXPECT_EQ(issue["createdAt"], "2024-05-01T12:00:00.000Z");
    EXPECT_EQ(issue["updatedAt"], "2024-05-01T12:01:00.000Z");
    EXPECT_EQ(issue["comments"][0]["author"], "bob");
    EXPECT_EQ(issue["comments"][0]["text"], "repro'd");
}

TEST(DocumentJson, updated_at_omitted_until_set) {
    auto issue = sample_issue();
    issue.updated_at.reset();
    auto j = json(issue);
    EXPECT_FALSE(j.contains("updatedAt"));
}

TEST(DocumentJson, empty_document_encoding) {
    auto j = json::parse(ih::encode_document(ih::Document{}));
    EXPECT_EQ(j, json::parse(R"({"nextId": 1, "issues": []})"));
}

TEST(DocumentJson, encoding_is_pretty_printed) {
    auto text = ih::encode_document(ih::Document{});
    EXPECT_NE(text.find("\n  \"issues\""), std::string::npos);
}

TEST(DocumentJson, decode_restores_document) {
    const auto doc = sample_document();
    EXPECT_EQ(ih::decode_document(ih::encode_document(doc)), doc);
}

TEST(DocumentJson, decode_tolerates_missing_optional_fields) {
    auto doc = ih::decode_document(R"({
        "nextId": 2,
        "issues": [{"id": 1, "title": "t", "status": "Open",
                    "createdBy": "a", "createdAt": "2024-05-01T12:00:00.000Z"}]
    })");
    ASSERT_EQ(doc.issues.size(), 1u);
    EXPECT_TRUE(doc.issues[0].description.empty());
    EXPECT_TRUE(doc.issues[0].comments.empty());
    EXPECT_FALSE(doc.issues[0].updated_at.has_value());
}

TEST(DocumentJson, decode_accepts_compact_in_progress) {
    auto doc = ih::decode_document(R"({
        "nextId": 2,
        "issues": [{"id": 1, "title": "t", "status": "InProgress",
                    "createdBy": "a", "createdAt": "2024-05-01T12:00:00.000Z"}]
    })");
    EXPECT_EQ(doc.issues[0].status, ih::IssueStatus::in_progress);
}

TEST(DocumentJson, decode_rejects_malformed_text) {
    EXPECT_EQ(decode_kind("{not json"), ih::ErrorKind::decoding_error);
    EXPECT_EQ(decode_kind(R"({"issues": []})"), ih::ErrorKind::decoding_error);
    EXPECT_EQ(decode_kind(R"({"nextId": "one", "issues": []})"), ih::ErrorKind::decoding_error);
}

TEST(DocumentJson, decode_rejects_negative_or_fractional_counters) {
    EXPECT_EQ(decode_kind(R"({"nextId": -1, "issues": []})"), ih::ErrorKind::decoding_error);
    EXPECT_EQ(decode_kind(R"({"nextId": 2.5, "issues": []})"), ih::ErrorKind::decoding_error);
    EXPECT_EQ(decode_kind(R"({
        "nextId": 2,
        "issues": [{"id": -1, "title": "t", "status": "Open",
                    "createdBy": "a", "createdAt": "2024-05-01T12:00:00.000Z"}]
    })"), ih::ErrorKind::decoding_error);
}

TEST(EventJson, decode_rejects_negative_issue_id) {
    EXPECT_THROW(ih::decode_event(R"({"type": "issue_commented", "id": -3,
        "comment": {"author": "a", "text": "t", "createdAt": 0}})"), ih::Exception);
}

TEST(DocumentJson, decode_rejects_unknown_status) {
    EXPECT_EQ(decode_kind(R"({
        "nextId": 2,
        "issues": [{"id": 1, "title": "t", "status": "Done",
                    "createdBy": "a", "createdAt": "2024-05-01T12:00:00.000Z"}]
    })"), ih::ErrorKind::decoding_error);
}

TEST(DocumentJson, decode_rejects_broken_invariants) {
    EXPECT_EQ(decode_kind(R"({
        "nextId": 1,
        "issues": [{"id": 1, "title": "t", "status": "Open",
                    "createdBy": "a", "createdAt": "2024-05-01T12:00:00.000Z"}]
    })"), ih::ErrorKind::invalid_mutation);
}

// =============================================================================
// Transport events
// =============================================================================

TEST(EventJson, created_event_shape) {
    auto j = json::parse(ih::encode_event(ih::IssueCreated{sample_issue()}));
    EXPECT_EQ(j["type"], "issue_created");
    EXPECT_EQ(j["issue"]["id"], 1);
}

TEST(EventJson, commented_event_shape) {
    auto event = ih::IssueCommented{1, ih::Comment{"bob", "hi", ih::Timestamp{0}}};
    auto j = json::parse(ih::encode_event(event));
    EXPECT_EQ(j["type"], "issue_commented");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["comment"]["text"], "hi");
}

TEST(EventJson, status_event_uses_updated_type) {
    auto j = json::parse(ih::encode_event(ih::IssueStatusChanged{sample_issue()}));
    EXPECT_EQ(j["type"], "issue_updated");
    EXPECT_EQ(ih::event_type_name(ih::IssueStatusChanged{}), "issue_updated");
}

TEST(EventJson, decode_restores_each_variant) {
    const auto events = std::vector<ih::MutationEvent>{
        ih::IssueCreated{sample_issue()},
        ih::IssueCommented{1, ih::Comment{"bob", "hi", ih::Timestamp{5}}},
        ih::IssueStatusChanged{sample_issue()},
    };
    for (const auto& event : events) {
        EXPECT_EQ(ih::decode_event(ih::encode_event(event)), event);
    }
}

TEST(EventJson, decode_rejects_unknown_type) {
    try {
        ih::decode_event(R"({"type": "issue_deleted", "id": 1})");
        FAIL() << "expected decoding_error";
    } catch (const ih::Exception& e) {
        EXPECT_EQ(e.kind(), ih::ErrorKind::decoding_error);
    }
}

// =============================================================================
// Checksum
// =============================================================================

TEST(DocumentChecksum, stable_for_equal_documents) {
    EXPECT_EQ(ih::document_checksum(sample_document()), ih::document_checksum(sample_document()));
}

TEST(DocumentChecksum, changes_with_content) {
    auto doc = sample_document();
    const auto before = ih::document_checksum(doc);
    doc.issues[0].status = ih::IssueStatus::closed;
    EXPECT_NE(ih::document_checksum(doc), before);
}
