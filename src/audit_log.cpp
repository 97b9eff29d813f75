#include <issuehub-cpp/audit_log.hpp>
#include <issuehub-cpp/error.hpp>
#include <issuehub-cpp/logging.hpp>

#include "scoped_fd.hpp"
#include "work_queue.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <system_error>

#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace issuehub_cpp {

namespace fs = std::filesystem;

auto format_audit_line(const AuditEntry& entry) -> std::string {
    char crc[9];
    std::snprintf(crc, sizeof(crc), "%08x", entry.snapshot_crc32);
    auto line = to_iso8601(entry.recorded_at);
    line += "\t#";
    line += std::to_string(entry.sequence);
    line += '\t';
    line += crc;
    line += '\t';
    // Keep one record per line.
    for (auto c : entry.label) {
        line += (c == '\n' || c == '\r') ? ' ' : c;
    }
    line += '\n';
    return line;
}

// =============================================================================
// FileAuditLog
// =============================================================================

FileAuditLog::FileAuditLog(fs::path path)
    : path_{std::move(path)} {}

void FileAuditLog::record(const AuditEntry& entry) {
    if (path_.has_parent_path()) {
        auto ec = std::error_code{};
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw Exception{ErrorKind::log_failure,
                            "cannot create " + path_.parent_path().string() + ": " + ec.message()};
        }
    }
    const auto name = path_.string();
    auto fd = detail::open_file(name, O_WRONLY | O_CREAT | O_APPEND, ErrorKind::log_failure);
    detail::write_all(fd, format_audit_line(entry), name, ErrorKind::log_failure);
    detail::sync_file(fd, name, ErrorKind::log_failure);
}

// =============================================================================
// GitAuditLog
// =============================================================================

namespace {

// A temporary file holding one snapshot, removed when it goes out of scope.
class SnapshotFile {
public:
    explicit SnapshotFile(std::string_view content) {
        auto pattern = (fs::temp_directory_path() / "issuehub-snapshot-XXXXXX").string();
        auto fd = detail::ScopedFd{::mkstemp(pattern.data())};
        if (!fd.valid()) {
            throw Exception{ErrorKind::log_failure, detail::errno_message("cannot create", pattern)};
        }
        path_ = pattern;
        try {
            detail::write_all(fd, content, path_, ErrorKind::log_failure);
        } catch (const Exception&) {
            remove();
            throw;
        }
    }

    ~SnapshotFile() { remove(); }

    SnapshotFile(const SnapshotFile&) = delete;
    auto operator=(const SnapshotFile&) -> SnapshotFile& = delete;

    auto path() const -> const std::string& { return path_; }

private:
    void remove() {
        auto ec = std::error_code{};
        fs::remove(path_, ec);
    }

    std::string path_;
};

auto trim(std::string text) -> std::string {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.pop_back();
    return text;
}

}  // anonymous namespace

GitAuditLog::GitAuditLog(fs::path repo_dir, fs::path data_file)
    : repo_dir_{fs::absolute(repo_dir)}, data_file_{fs::absolute(data_file)} {
    auto ec = std::error_code{};
    auto relative = fs::relative(data_file_, repo_dir_, ec);
    if (!ec && !relative.empty() && *relative.begin() != "..") {
        index_path_ = relative.generic_string();
    }
}

void GitAuditLog::record(const AuditEntry& entry) {
    if (index_path_.empty()) {
        throw Exception{ErrorKind::log_failure, data_file_.string() + " is not inside " +
                                                    repo_dir_.string()};
    }
    if (entry.snapshot.empty()) {
        throw Exception{ErrorKind::log_failure,
                        "entry #" + std::to_string(entry.sequence) + " carries no snapshot"};
    }

    auto file = SnapshotFile{entry.snapshot};
    auto blob = trim(run_git({"hash-object", "-w", "--", file.path()}));
    if (blob.empty()) {
        throw Exception{ErrorKind::log_failure, "git hash-object returned no object id"};
    }
    run_git({"update-index", "--add", "--cacheinfo", "100644," + blob + "," + index_path_});
    run_git({"commit", "--quiet", "--allow-empty", "-m", entry.label});
}

auto GitAuditLog::run_git(const std::vector<std::string>& args) const -> std::string {
    auto argv_storage = std::vector<std::string>{"git", "-C", repo_dir_.string()};
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    auto argv = std::vector<char*>{};
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        throw Exception{ErrorKind::log_failure,
                        std::string{"cannot create pipe: "} + std::strerror(errno)};
    }
    auto read_end = detail::ScopedFd{pipe_fds[0]};
    auto write_end = detail::ScopedFd{pipe_fds[1]};

    // Standard output is captured; failures are reported through the exit status.
    auto actions = posix_spawn_file_actions_t{};
    ::posix_spawn_file_actions_init(&actions);
    ::posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    ::posix_spawn_file_actions_adddup2(&actions, write_end.get(), STDOUT_FILENO);
    ::posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    auto pid = pid_t{};
    auto rc = ::posix_spawnp(&pid, "git", &actions, nullptr, argv.data(), environ);
    ::posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        throw Exception{ErrorKind::log_failure,
                        std::string{"cannot run git: "} + std::strerror(rc)};
    }
    write_end.reset();

    auto output = std::string{};
    char buffer[4096];
    while (true) {
        auto n = ::read(read_end.get(), buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        output.append(buffer, static_cast<std::size_t>(n));
    }

    auto status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw Exception{ErrorKind::log_failure,
                            std::string{"waitpid failed: "} + std::strerror(errno)};
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw Exception{ErrorKind::log_failure,
                        "git " + args.front() + " failed with status " +
                            std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1)};
    }
    return output;
}

// =============================================================================
// MemoryAuditLog
// =============================================================================

void MemoryAuditLog::record(const AuditEntry& entry) {
    auto lock = std::scoped_lock{mutex_};
    entries_.push_back(entry);
}

auto MemoryAuditLog::entries() const -> std::vector<AuditEntry> {
    auto lock = std::scoped_lock{mutex_};
    return entries_;
}

auto MemoryAuditLog::labels() const -> std::vector<std::string> {
    auto lock = std::scoped_lock{mutex_};
    auto out = std::vector<std::string>{};
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.label);
    return out;
}

// =============================================================================
// AuditLogger
// =============================================================================

AuditLogger::AuditLogger(std::shared_ptr<AuditLog> backend)
    : backend_{std::move(backend)},
      worker_{std::make_unique<detail::WorkQueue>(1)} {}

// Pending entries are written before the worker joins.
AuditLogger::~AuditLogger() = default;

void AuditLogger::record(AuditEntry entry) {
    worker_->submit([this, entry = std::move(entry)] { write(entry); });
}

void AuditLogger::flush() {
    worker_->wait_idle();
}

void AuditLogger::write(const AuditEntry& entry) {
    try {
        backend_->record(entry);
        ++recorded_;
    } catch (const std::exception& e) {
        ++failures_;
        logger()->warn("audit record #{} ({}) failed: {}", entry.sequence, entry.label, e.what());
    }
}

}  // namespace issuehub_cpp
