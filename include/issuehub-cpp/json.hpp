/// @file json.hpp
/// @brief nlohmann/json interoperability for issuehub-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the model types, the
/// transport encoding of MutationEvent (a `type` discriminator plus the
/// variant payload), and the snapshot checksum used by the audit trail.
///
/// Persisted field names follow the established wire form: `nextId`,
/// `issues`, `createdBy`, `createdAt`, `updatedAt`, `comments`.

#pragma once

#include <issuehub-cpp/document.hpp>
#include <issuehub-cpp/mutation_event.hpp>
#include <issuehub-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace issuehub_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Scalars ------------------------------------------------------------------

void to_json(nlohmann::json& j, IssueStatus s);
void from_json(const nlohmann::json& j, IssueStatus& s);

void to_json(nlohmann::json& j, Timestamp t);
void from_json(const nlohmann::json& j, Timestamp& t);

// -- Model --------------------------------------------------------------------

void to_json(nlohmann::json& j, const Comment& c);
void from_json(const nlohmann::json& j, Comment& c);

void to_json(nlohmann::json& j, const Issue& issue);
void from_json(const nlohmann::json& j, Issue& issue);

void to_json(nlohmann::json& j, const Document& doc);
void from_json(const nlohmann::json& j, Document& doc);

// -- Events -------------------------------------------------------------------

void to_json(nlohmann::json& j, const MutationEvent& event);
void from_json(const nlohmann::json& j, MutationEvent& event);

/// The `type` discriminator used for an event on the wire.
auto event_type_name(const MutationEvent& event) -> std::string_view;

// =============================================================================
// Text encodings
// =============================================================================

/// Encode a document as pretty-printed JSON (2-space indent).
auto encode_document(const Document& doc) -> std::string;

/// Decode a document and verify its invariants.
/// @throws Exception with ErrorKind::decoding_error on malformed input or
///   ErrorKind::invalid_mutation if the decoded value breaks an invariant.
auto decode_document(std::string_view text) -> Document;

/// Encode an event for transport to subscribers (compact JSON).
auto encode_event(const MutationEvent& event) -> std::string;

/// Decode a transported event.
/// @throws Exception with ErrorKind::decoding_error on malformed input.
auto decode_event(std::string_view text) -> MutationEvent;

/// CRC-32 (zlib) of the compact JSON encoding of a document.
///
/// Identifies the exact persisted state an audit record refers to.
auto document_checksum(const Document& doc) -> std::uint32_t;

}  // namespace issuehub_cpp
