/// @file error.hpp
/// @brief Error types for the issuehub-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace issuehub_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    validation_error,   ///< A mutation request is malformed or missing input.
    not_found,          ///< A referenced issue id does not exist.
    store_unavailable,  ///< The document could not be persisted or loaded.
    log_failure,        ///< An audit record could not be written.
    superseded,         ///< A pending request was replaced before it ran.
    invalid_mutation,   ///< A mutation produced a document that breaks an invariant.
    decoding_error,     ///< Persisted or transported JSON could not be decoded.
    config_error,       ///< The configuration could not be read.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::validation_error:  return "validation_error";
        case ErrorKind::not_found:         return "not_found";
        case ErrorKind::store_unavailable: return "store_unavailable";
        case ErrorKind::log_failure:       return "log_failure";
        case ErrorKind::superseded:        return "superseded";
        case ErrorKind::invalid_mutation:  return "invalid_mutation";
        case ErrorKind::decoding_error:    return "decoding_error";
        case ErrorKind::config_error:      return "config_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception carrying a structured Error.
///
/// Thrown by the store, audit backends, codec and config loader. The
/// submission boundary (WriteSerializer, Tracker) converts it back into an
/// Error inside a SubmitResult.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace issuehub_cpp
