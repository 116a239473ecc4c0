/// @file error.hpp
/// @brief Error types for the peersync library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace peersync {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    not_initialized,    ///< An engine operation was called before initialize().
    no_remote_store,    ///< A remote operation was called without a remote store.
    invalid_argument,   ///< A caller-supplied argument violates a precondition.
    invalid_config,     ///< Configuration could not be parsed or is out of range.
    transfer_failed,    ///< A chunk exhausted its retries.
    integrity_error,    ///< A reassembled payload does not match its content hash.
    timeout,            ///< A chunk attempt exceeded its deadline.
    aborted,            ///< A transfer was aborted or paused.
    encryption_error,   ///< Sealing or opening a payload failed.
    storage_error,      ///< A local or remote store operation failed.
    decoding_error,     ///< Serialized data is malformed.
    queue_full,         ///< The offline queue reached its size limit.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::not_initialized:  return "not_initialized";
        case ErrorKind::no_remote_store:  return "no_remote_store";
        case ErrorKind::invalid_argument: return "invalid_argument";
        case ErrorKind::invalid_config:   return "invalid_config";
        case ErrorKind::transfer_failed:  return "transfer_failed";
        case ErrorKind::integrity_error:  return "integrity_error";
        case ErrorKind::timeout:          return "timeout";
        case ErrorKind::aborted:          return "aborted";
        case ErrorKind::encryption_error: return "encryption_error";
        case ErrorKind::storage_error:    return "storage_error";
        case ErrorKind::decoding_error:   return "decoding_error";
        case ErrorKind::queue_full:       return "queue_full";
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

/// Exception thrown for fatal conditions. Carries an ErrorKind.
class SyncError : public std::runtime_error {
public:
    SyncError(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    auto kind() const noexcept -> ErrorKind { return kind_; }

    /// The error as a value.
    auto error() const -> Error { return Error{kind_, what()}; }

private:
    ErrorKind kind_;
};

/// A SyncError raised by the transfer engine. Carries the transfer id so
/// the caller can resume the transfer later.
class TransferError : public SyncError {
public:
    TransferError(ErrorKind kind, const std::string& message, std::string transfer_id)
        : SyncError{kind, message}, transfer_id_{std::move(transfer_id)} {}

    auto transfer_id() const noexcept -> const std::string& { return transfer_id_; }

private:
    std::string transfer_id_;
};

}  // namespace peersync
