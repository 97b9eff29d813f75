// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <issuehub-cpp/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace ih = issuehub_cpp;

static void write_seed(const std::string& path, const std::string& text) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << text;
}

static auto sample_issue(ih::IssueId id) -> ih::Issue {
    auto issue = ih::Issue{};
    issue.id = id;
    issue.title = "Issue " + std::to_string(id);
    issue.description = "seed";
    issue.created_by = "alice";
    issue.created_at = ih::Timestamp{1714564800000};
    return issue;
}

int main() {
    namespace fs = std::filesystem;
    const auto documents = std::string{"fuzz/corpus/documents"};
    const auto events = std::string{"fuzz/corpus/events"};
    fs::create_directories(documents);
    fs::create_directories(events);

    // Documents: empty, one issue, issue with comments and an update.
    write_seed(documents + "/seed_empty.json", ih::encode_document(ih::Document{}));
    {
        auto doc = ih::Document{};
        doc.issues.push_back(sample_issue(doc.next_id++));
        write_seed(documents + "/seed_single_issue.json", ih::encode_document(doc));
    }
    {
        auto doc = ih::Document{};
        for (int i = 0; i < 3; ++i) {
            auto issue = sample_issue(doc.next_id++);
            issue.status = ih::IssueStatus::in_progress;
            issue.updated_at = ih::Timestamp{1714564900000};
            issue.comments.push_back(ih::Comment{"bob", "on it", ih::Timestamp{1714564850000}});
            doc.issues.push_back(issue);
        }
        write_seed(documents + "/seed_comments.json", ih::encode_document(doc));
    }

    // Events: one of each variant.
    write_seed(events + "/seed_created.json", ih::encode_event(ih::IssueCreated{sample_issue(1)}));
    write_seed(events + "/seed_commented.json",
               ih::encode_event(ih::IssueCommented{1, ih::Comment{"bob", "hi", ih::Timestamp{0}}}));
    write_seed(events + "/seed_updated.json",
               ih::encode_event(ih::IssueStatusChanged{sample_issue(1)}));
    return 0;
}
