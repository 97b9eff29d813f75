// issue_console — an interactive issue tracker on a JSON data file
//
// Opens (or initializes) the data file, subscribes to broadcasts and reads
// commands from stdin:
//
//   list
//   show <id>
//   create <who> <title...>
//   comment <id> <who> <text...>
//   status <id> <who> <Open|In Progress|Closed>
//
// Build: cmake --build build
// Run:   ./build/examples/issue_console --data issues.json --audit file

#include <issuehub-cpp/issuehub.hpp>
#include <issuehub-cpp/json.hpp>
#include <issuehub-cpp/logging.hpp>

#include <cxxopts.hpp>

#include <cstdio>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>

namespace ih = issuehub_cpp;

namespace {

// The remainder of the stream after the parsed words, without leading blanks.
auto rest_of(std::istringstream& in) -> std::string {
    auto rest = std::string{};
    std::getline(in, rest);
    auto first = rest.find_first_not_of(" \t");
    return first == std::string::npos ? std::string{} : rest.substr(first);
}

void print_result(const ih::SubmitResult& result) {
    if (const auto* error = ih::error_of(result)) {
        std::printf("error: %s (%s)\n", error->message.c_str(),
                    std::string{ih::to_string_view(error->kind)}.c_str());
        return;
    }
    std::printf("ok: issue #%llu\n",
                static_cast<unsigned long long>(ih::issue_id_of(std::get<ih::MutationEvent>(result))));
}

void list_issues(const ih::Document& doc) {
    if (doc.issues.empty()) {
        std::printf("(no issues)\n");
        return;
    }
    for (const auto& issue : doc.issues) {
        std::printf("#%-4llu %-12s %s  [%s, %zu comments]\n",
                    static_cast<unsigned long long>(issue.id),
                    std::string{ih::to_string_view(issue.status)}.c_str(),
                    issue.title.c_str(), issue.created_by.c_str(), issue.comments.size());
    }
}

void show_issue(const ih::Issue& issue) {
    std::printf("#%llu %s\n", static_cast<unsigned long long>(issue.id), issue.title.c_str());
    std::printf("  status:  %s\n", std::string{ih::to_string_view(issue.status)}.c_str());
    std::printf("  created: %s by %s\n", ih::to_iso8601(issue.created_at).c_str(),
                issue.created_by.c_str());
    if (issue.updated_at) {
        std::printf("  updated: %s\n", ih::to_iso8601(*issue.updated_at).c_str());
    }
    if (!issue.description.empty()) {
        std::printf("  %s\n", issue.description.c_str());
    }
    for (const auto& c : issue.comments) {
        std::printf("  - %s (%s): %s\n", c.author.c_str(), ih::to_iso8601(c.created_at).c_str(),
                    c.text.c_str());
    }
}

auto run_command(ih::Tracker& tracker, const std::string& line) -> bool {
    auto in = std::istringstream{line};
    auto command = std::string{};
    in >> command;

    if (command.empty()) return true;
    if (command == "quit" || command == "exit") return false;

    if (command == "list") {
        list_issues(*tracker.current_document());
    } else if (command == "show") {
        auto id = ih::IssueId{0};
        in >> id;
        auto doc = tracker.current_document();
        if (const auto* issue = doc->find(id)) {
            show_issue(*issue);
        } else {
            std::printf("error: Issue not found\n");
        }
    } else if (command == "create") {
        auto who = std::string{};
        in >> who;
        print_result(tracker.create_issue({rest_of(in), "", who}));
    } else if (command == "comment") {
        auto id = ih::IssueId{0};
        auto who = std::string{};
        in >> id >> who;
        print_result(tracker.add_comment(id, {who, rest_of(in)}));
    } else if (command == "status") {
        auto id = ih::IssueId{0};
        auto who = std::string{};
        in >> id >> who;
        print_result(tracker.change_status(id, {rest_of(in), who}));
    } else {
        std::printf("commands: list | show <id> | create <who> <title> | "
                    "comment <id> <who> <text> | status <id> <who> <status> | quit\n");
    }
    return true;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("issue_console", "Interactive issue tracker on a JSON data file");
    options.add_options()
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("d,data", "Data file (overrides the config)", cxxopts::value<std::string>())
        ("a,audit", "Audit backend: file, git or none", cxxopts::value<std::string>())
        ("l,log-level", "Log level", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto args = options.parse(argc, argv);
        if (args.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        auto config = args.count("config")
            ? ih::load_config(args["config"].as<std::string>())
            : ih::Config{};
        if (args.count("data")) config.storage.data_file.set(args["data"].as<std::string>());
        if (args.count("audit")) config.audit.backend.set(args["audit"].as<std::string>());
        if (args.count("log-level")) config.logging.level.set(args["log-level"].as<std::string>());
        ih::apply_config(config);

        auto tracker = ih::Tracker::open(config);
        auto events = tracker->subscribe([](const ih::MutationEvent& event) {
            std::printf("<< %s\n", ih::encode_event(event).c_str());
        });

        for (auto line = std::string{}; std::getline(std::cin, line);) {
            if (!run_command(*tracker, line)) break;
        }
        tracker->unsubscribe(events);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 2;
    } catch (const ih::Exception& e) {
        ih::logger()->critical("{}", e.what());
        return 1;
    }
    return 0;
}
