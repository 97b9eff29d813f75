/// @file issuehub.hpp
/// @brief Umbrella header for the issuehub-cpp library.
///
/// Include this single header for access to all public types:
/// Tracker, WriteSerializer, DocumentStore, AuditLogger, Broadcaster,
/// Document, Issue, MutationEvent, Config and Error.

#pragma once

#include <issuehub-cpp/audit_log.hpp>
#include <issuehub-cpp/broadcaster.hpp>
#include <issuehub-cpp/config.hpp>
#include <issuehub-cpp/document.hpp>
#include <issuehub-cpp/document_store.hpp>
#include <issuehub-cpp/error.hpp>
#include <issuehub-cpp/mutation_event.hpp>
#include <issuehub-cpp/tracker.hpp>
#include <issuehub-cpp/types.hpp>
#include <issuehub-cpp/write_serializer.hpp>
