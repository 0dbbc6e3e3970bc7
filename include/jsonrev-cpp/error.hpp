/// @file error.hpp
/// @brief Error types for the jsonrev-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonrev_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    path_not_found,           ///< An edit or lookup addressed a node that does not exist.
    conflicting_add,          ///< An add targeted an object key that already exists.
    concurrent_modification,  ///< Another commit advanced the head first. Retryable.
    version_not_found,        ///< A version outside [1, head] was requested.
    malformed_document,       ///< Input is not a valid JSON value (syntax, duplicate keys).
    malformed_edit,           ///< A serialized edit could not be decoded.
    invalid_edit,             ///< An edit is meaningless for its target (e.g. removing the root).
    corrupt_revision,         ///< Stored revision data is damaged or the chain has a gap.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::path_not_found:          return "path_not_found";
        case ErrorKind::conflicting_add:         return "conflicting_add";
        case ErrorKind::concurrent_modification: return "concurrent_modification";
        case ErrorKind::version_not_found:       return "version_not_found";
        case ErrorKind::malformed_document:      return "malformed_document";
        case ErrorKind::malformed_edit:          return "malformed_edit";
        case ErrorKind::invalid_edit:            return "invalid_edit";
        case ErrorKind::corrupt_revision:        return "corrupt_revision";
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

/// The exception thrown by every failing library operation.
///
/// None of these failures is fatal: callers inspect kind() and decide.
/// Only concurrent_modification is worth retrying, against a fresh head.
///
/// @code
/// try {
///     chain.commit("service-a", doc, "alice");
/// } catch (const Exception& e) {
///     if (e.retryable()) { /* reload and try again */ }
/// }
/// @endcode
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const noexcept -> const Error& { return error_; }

    /// True when repeating the operation against fresh state may succeed.
    auto retryable() const noexcept -> bool {
        return error_.kind == ErrorKind::concurrent_modification;
    }

private:
    Error error_;
};

}  // namespace jsonrev_cpp
