// basic_usage — demonstrates the core issuehub-cpp API
//
// Creates issues, comments and status changes through a Tracker backed by an
// in-memory store, with a memory audit trail and one pull subscriber, then
// prints the trail, the received events and the resulting document.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <issuehub-cpp/issuehub.hpp>
#include <issuehub-cpp/json.hpp>

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>

namespace ih = issuehub_cpp;

int main() {
    auto trail = std::make_shared<ih::MemoryAuditLog>();
    auto tracker = ih::Tracker{std::make_shared<ih::MemoryDocumentStore>(), trail};
    auto inbox = tracker.subscribe();

    // -- Mutations ------------------------------------------------------------
    tracker.create_issue({"Login page returns 500", "Only with SSO accounts", "alice"});
    tracker.create_issue({"Typo in footer", "", "bob"});
    tracker.add_comment(1, {"carol", "Reproduced on staging"});
    tracker.change_status(1, {"In Progress", "carol"});

    // -- Rejected requests ----------------------------------------------------
    auto missing = tracker.add_comment(42, {"dave", "ping"});
    if (const auto* error = ih::error_of(missing)) {
        std::printf("comment on #42: %s (%s)\n", error->message.c_str(),
                    std::string{ih::to_string_view(error->kind)}.c_str());
    }
    auto invalid = tracker.change_status(2, {"Done", "bob"});
    if (const auto* error = ih::error_of(invalid)) {
        std::printf("status 'Done': %s\n", error->message.c_str());
    }

    // -- Events seen by the subscriber ----------------------------------------
    std::printf("\nEvents:\n");
    while (auto event = inbox->next(std::chrono::milliseconds{10})) {
        std::printf("  %s\n", ih::encode_event(*event).c_str());
    }

    // -- Audit trail ----------------------------------------------------------
    tracker.audit_logger()->flush();
    std::printf("\nAudit trail:\n");
    for (const auto& entry : trail->entries()) {
        std::printf("  %s", ih::format_audit_line(entry).c_str());
    }

    // -- Current document -----------------------------------------------------
    std::printf("\nDocument:\n%s\n", ih::encode_document(*tracker.current_document()).c_str());
    return 0;
}
