/// @file audit_log.hpp
/// @brief Audit trail: the AuditLog backend interface, its file, git and
///        in-memory backends, and the asynchronous AuditLogger front.

#pragma once

#include <issuehub-cpp/types.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace issuehub_cpp {

namespace detail {
class WorkQueue;
}  // namespace detail

/// One record of the audit trail.
struct AuditEntry {
    std::uint64_t sequence{0};        ///< Position in the persisted order (1-based).
    std::string label;                ///< Human-readable "what happened".
    Timestamp recorded_at;            ///< When the mutation was persisted.
    std::uint32_t snapshot_crc32{0};  ///< CRC-32 of the persisted document.
    std::string snapshot;             ///< The persisted document as stored.

    auto operator==(const AuditEntry&) const -> bool = default;
};

/// Format an entry as one trail line:
/// `<iso time>\t#<sequence>\t<crc32 hex>\t<label>`.
auto format_audit_line(const AuditEntry& entry) -> std::string;

/// A durable sink for audit entries.
class AuditLog {
public:
    virtual ~AuditLog() = default;

    /// Durably record one entry.
    /// @throws Exception with ErrorKind::log_failure on failure.
    virtual void record(const AuditEntry& entry) = 0;
};

/// Appends one line per entry to a text file.
class FileAuditLog : public AuditLog {
public:
    explicit FileAuditLog(std::filesystem::path path);

    void record(const AuditEntry& entry) override;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

/// Commits each entry's snapshot of the data file to a git repository, one
/// commit per entry, with the entry label as the commit message.
///
/// The snapshot is staged as a blob (`git hash-object -w`, then
/// `git update-index --cacheinfo`), so each commit holds exactly the state
/// its label describes, whatever the live file contains by then. The
/// working tree is never written. Git runs as a child process without a
/// shell; a non-zero exit (e.g. not a repository) is a log_failure.
class GitAuditLog : public AuditLog {
public:
    /// `data_file` is resolved against the current directory and must lie
    /// inside the work tree rooted at `repo_dir`.
    GitAuditLog(std::filesystem::path repo_dir, std::filesystem::path data_file);

    void record(const AuditEntry& entry) override;

private:
    // Run git in `repo_dir_`; returns its standard output.
    auto run_git(const std::vector<std::string>& args) const -> std::string;

    std::filesystem::path repo_dir_;
    std::filesystem::path data_file_;
    std::string index_path_;
};

/// Collects entries in memory.
class MemoryAuditLog : public AuditLog {
public:
    void record(const AuditEntry& entry) override;

    auto entries() const -> std::vector<AuditEntry>;
    auto labels() const -> std::vector<std::string>;

private:
    mutable std::mutex mutex_;
    std::vector<AuditEntry> entries_;
};

/// Best-effort, non-blocking, ordered front for an AuditLog.
///
/// `record` enqueues the entry on a single worker thread and returns at
/// once. Entries reach the backend in enqueue order. A backend failure is
/// logged and counted; it never reaches the caller.
class AuditLogger {
public:
    explicit AuditLogger(std::shared_ptr<AuditLog> backend);
    ~AuditLogger();

    AuditLogger(const AuditLogger&) = delete;
    auto operator=(const AuditLogger&) -> AuditLogger& = delete;

    /// Enqueue an entry for recording.
    void record(AuditEntry entry);

    /// Block until every entry enqueued so far has been attempted.
    void flush();

    /// Number of entries the backend rejected.
    auto failures() const -> std::uint64_t { return failures_.load(); }

    /// Number of entries the backend accepted.
    auto recorded() const -> std::uint64_t { return recorded_.load(); }

private:
    void write(const AuditEntry& entry);

    std::shared_ptr<AuditLog> backend_;
    std::atomic<std::uint64_t> failures_{0};
    std::atomic<std::uint64_t> recorded_{0};
    std::unique_ptr<detail::WorkQueue> worker_;
};

}  // namespace issuehub_cpp
