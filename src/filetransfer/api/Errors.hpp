#pragma once

#include <FileTransferExports.h>
#include <absl/status/status.h>
#include <fmt/format.h>

#include <optional>
#include <ostream>
#include <string_view>

namespace FileTransfer {

/**
 * @brief Failure classes of a transfer
 *
 * Every error status produced by this library carries one of these as a
 * payload, next to a canonical absl status code.
 */
enum class ErrorKind {
    InvalidConfiguration,  ///< Bad segment size or path, raised before sending
    SourceReadError,       ///< Local source could not be read
    TransportError,        ///< Fabric failure on a single request
    TransferAborted,       ///< Session failed, wraps the cause
    OutOfOrderSegment,     ///< Store got an unexpected segment index
    SizeMismatch,          ///< Stored byte count differs from declared size
    HashMismatch,          ///< Stored digest differs from the client digest
    StorageWriteError,     ///< Store could not write to disk
    InvalidRequest,        ///< Store rejected malformed request metadata
    Cancelled,             ///< Session was cancelled between segments
};

FileTransfer_API std::string_view toString(ErrorKind kind);

FileTransfer_API std::optional<ErrorKind> errorKindFromString(
    std::string_view name);

// Canonical absl code used for a kind.
FileTransfer_API absl::StatusCode toStatusCode(ErrorKind kind);

/**
 * @brief Creates an error status of the given kind.
 */
FileTransfer_API absl::Status makeError(ErrorKind kind,
                                        std::string_view message);

/**
 * @brief Wraps a failure into TransferAborted.
 *
 * The resulting message reads "<cause kind>: <cause message>" and the kind of
 * the cause stays retrievable through causeKindOf().
 */
FileTransfer_API absl::Status abortedBy(const absl::Status& cause);

// Returns the kind attached to the status, nullopt for OK or foreign statuses.
FileTransfer_API std::optional<ErrorKind> errorKindOf(
    const absl::Status& status);

// Returns the cause kind of a TransferAborted status.
FileTransfer_API std::optional<ErrorKind> causeKindOf(
    const absl::Status& status);

inline std::ostream& operator<<(std::ostream& os, const ErrorKind kind) {
    return os << toString(kind);
}

}  // namespace FileTransfer

template <>
struct fmt::formatter<FileTransfer::ErrorKind> : formatter<std::string_view> {
    auto format(FileTransfer::ErrorKind kind, format_context& ctx) const
        -> format_context::iterator {
        return formatter<std::string_view>::format(
            FileTransfer::toString(kind), ctx);
    }
};
