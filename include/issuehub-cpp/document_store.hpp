/// @file document_store.hpp
/// @brief Whole-document persistence: the DocumentStore interface and its
///        file-backed and in-memory implementations.

#pragma once

#include <issuehub-cpp/document.hpp>

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>

namespace issuehub_cpp {

/// Loads and persists the document as a whole.
///
/// A store has no concurrency control of its own beyond keeping each call
/// internally consistent; the WriteSerializer guarantees that no two
/// `save` calls overlap.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /// Read the persisted document, initializing and persisting an empty
    /// one (`{nextId: 1, issues: []}`) if none exists.
    /// @throws Exception with ErrorKind::store_unavailable if both the read
    ///   and the initialization write fail.
    virtual auto load() -> Document = 0;

    /// Persist a full snapshot, replacing the previous one atomically: a
    /// later `load` observes either the old or the new document, never a
    /// mixture.
    /// @throws Exception with ErrorKind::store_unavailable on failure.
    virtual void save(const Document& doc) = 0;
};

/// JSON file store.
///
/// `save` writes `<path>.tmp`, fsyncs it and renames it over `<path>`.
/// A file that cannot be decoded is moved aside to
/// `<path>.corrupt-<millis>` before a fresh document is initialized.
class FileDocumentStore : public DocumentStore {
public:
    explicit FileDocumentStore(std::filesystem::path path);

    auto load() -> Document override;
    void save(const Document& doc) override;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    void write_atomically(const Document& doc);
    void quarantine_corrupt_file();

    std::filesystem::path path_;
    std::mutex mutex_;
};

/// In-process store. Starts empty (nothing persisted) unless seeded.
class MemoryDocumentStore : public DocumentStore {
public:
    MemoryDocumentStore() = default;
    explicit MemoryDocumentStore(Document seed);

    auto load() -> Document override;
    void save(const Document& doc) override;

    /// Number of successful saves so far.
    auto save_count() const -> std::size_t;

    /// The last persisted document, or nullopt if nothing was persisted.
    auto persisted() const -> std::optional<Document>;

private:
    mutable std::mutex mutex_;
    std::optional<Document> doc_;
    std::size_t saves_{0};
};

}  // namespace issuehub_cpp
