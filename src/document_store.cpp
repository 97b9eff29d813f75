#include <issuehub-cpp/document_store.hpp>
#include <issuehub-cpp/error.hpp>
#include <issuehub-cpp/json.hpp>
#include <issuehub-cpp/logging.hpp>

#include "scoped_fd.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace issuehub_cpp {

namespace fs = std::filesystem;

// =============================================================================
// FileDocumentStore
// =============================================================================

FileDocumentStore::FileDocumentStore(fs::path path)
    : path_{std::move(path)} {}

auto FileDocumentStore::load() -> Document {
    auto lock = std::scoped_lock{mutex_};

    auto ec = std::error_code{};
    if (fs::exists(path_, ec)) {
        auto in = std::ifstream{path_, std::ios::binary};
        if (in) {
            auto text = std::string{std::istreambuf_iterator<char>{in},
                                    std::istreambuf_iterator<char>{}};
            try {
                return decode_document(text);
            } catch (const Exception& e) {
                logger()->error("data file {} is unreadable ({}), initializing a fresh document",
                                path_.string(), e.what());
                quarantine_corrupt_file();
            }
        } else {
            logger()->error("cannot open data file {}, initializing a fresh document",
                            path_.string());
            quarantine_corrupt_file();
        }
    }

    auto fresh = Document{};
    write_atomically(fresh);
    logger()->info("initialized empty document at {}", path_.string());
    return fresh;
}

void FileDocumentStore::save(const Document& doc) {
    auto lock = std::scoped_lock{mutex_};
    write_atomically(doc);
}

void FileDocumentStore::write_atomically(const Document& doc) {
    auto ec = std::error_code{};
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw Exception{ErrorKind::store_unavailable,
                            "cannot create " + path_.parent_path().string() + ": " + ec.message()};
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    const auto tmp_name = tmp.string();
    try {
        auto fd = detail::open_file(tmp_name, O_WRONLY | O_CREAT | O_TRUNC,
                                    ErrorKind::store_unavailable);
        detail::write_all(fd, encode_document(doc), tmp_name, ErrorKind::store_unavailable);
        detail::sync_file(fd, tmp_name, ErrorKind::store_unavailable);
    } catch (const Exception&) {
        auto ignored = std::error_code{};
        fs::remove(tmp, ignored);
        throw;
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        auto ignored = std::error_code{};
        fs::remove(tmp, ignored);
        throw Exception{ErrorKind::store_unavailable, "atomic rename failed: " + ec.message()};
    }
}

void FileDocumentStore::quarantine_corrupt_file() {
    auto aside = path_;
    aside += ".corrupt-" + std::to_string(Timestamp::now().millis_since_epoch);
    auto ec = std::error_code{};
    fs::rename(path_, aside, ec);
    if (ec) {
        throw Exception{ErrorKind::store_unavailable,
                        "cannot move corrupt data file aside: " + ec.message()};
    }
    logger()->warn("corrupt data file preserved as {}", aside.string());
}

// =============================================================================
// MemoryDocumentStore
// =============================================================================

MemoryDocumentStore::MemoryDocumentStore(Document seed)
    : doc_{std::move(seed)} {}

auto MemoryDocumentStore::load() -> Document {
    auto lock = std::scoped_lock{mutex_};
    if (!doc_) doc_ = Document{};
    return *doc_;
}

void MemoryDocumentStore::save(const Document& doc) {
    auto lock = std::scoped_lock{mutex_};
    doc_ = doc;
    ++saves_;
}

auto MemoryDocumentStore::save_count() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return saves_;
}

auto MemoryDocumentStore::persisted() const -> std::optional<Document> {
    auto lock = std::scoped_lock{mutex_};
    return doc_;
}

}  // namespace issuehub_cpp
