#include "Errors.hpp"

#include <absl/strings/cord.h>
#include <absl/strings/str_cat.h>

#include <array>
#include <string>
#include <utility>

namespace FileTransfer {

namespace {

constexpr char kErrorKindUrl[] = "filetransfer/error_kind";
constexpr char kCauseKindUrl[] = "filetransfer/cause_kind";

constexpr std::array<std::pair<ErrorKind, std::string_view>, 10> kKindNames = {
    {
        {ErrorKind::InvalidConfiguration, "InvalidConfiguration"},
        {ErrorKind::SourceReadError, "SourceReadError"},
        {ErrorKind::TransportError, "TransportError"},
        {ErrorKind::TransferAborted, "TransferAborted"},
        {ErrorKind::OutOfOrderSegment, "OutOfOrderSegment"},
        {ErrorKind::SizeMismatch, "SizeMismatch"},
        {ErrorKind::HashMismatch, "HashMismatch"},
        {ErrorKind::StorageWriteError, "StorageWriteError"},
        {ErrorKind::InvalidRequest, "InvalidRequest"},
        {ErrorKind::Cancelled, "Cancelled"},
    }};

absl::Cord toCord(const ErrorKind kind) {
    const auto name = toString(kind);
    return absl::Cord(absl::string_view(name.data(), name.size()));
}

std::optional<ErrorKind> kindFromPayload(const absl::Status& status,
                                         const char* url) {
    const auto payload = status.GetPayload(url);
    if (!payload) {
        return std::nullopt;
    }
    return errorKindFromString(std::string(*payload));
}

}  // namespace

std::string_view toString(const ErrorKind kind) {
    for (const auto& [k, name] : kKindNames) {
        if (k == kind) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<ErrorKind> errorKindFromString(const std::string_view name) {
    for (const auto& [k, n] : kKindNames) {
        if (n == name) {
            return k;
        }
    }
    return std::nullopt;
}

absl::StatusCode toStatusCode(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidConfiguration:
        case ErrorKind::InvalidRequest:
            return absl::StatusCode::kInvalidArgument;
        case ErrorKind::SourceReadError:
            return absl::StatusCode::kNotFound;
        case ErrorKind::TransportError:
            return absl::StatusCode::kUnavailable;
        case ErrorKind::TransferAborted:
            return absl::StatusCode::kAborted;
        case ErrorKind::OutOfOrderSegment:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorKind::SizeMismatch:
        case ErrorKind::HashMismatch:
            return absl::StatusCode::kDataLoss;
        case ErrorKind::StorageWriteError:
            return absl::StatusCode::kInternal;
        case ErrorKind::Cancelled:
            return absl::StatusCode::kCancelled;
    }
    return absl::StatusCode::kUnknown;
}

absl::Status makeError(const ErrorKind kind, const std::string_view message) {
    absl::Status status(toStatusCode(kind),
                        absl::string_view(message.data(), message.size()));
    status.SetPayload(kErrorKindUrl, toCord(kind));
    return status;
}

absl::Status abortedBy(const absl::Status& cause) {
    // Already wrapped, keep the original cause
    if (errorKindOf(cause) == ErrorKind::TransferAborted) {
        return cause;
    }
    const auto kind = errorKindOf(cause);
    const std::string kindName = kind
                                     ? std::string(toString(*kind))
                                     : absl::StatusCodeToString(cause.code());
    absl::Status status = makeError(
        ErrorKind::TransferAborted,
        absl::StrCat(kindName, ": ", cause.message()));
    if (kind) {
        status.SetPayload(kCauseKindUrl, toCord(*kind));
    }
    return status;
}

std::optional<ErrorKind> errorKindOf(const absl::Status& status) {
    if (status.ok()) {
        return std::nullopt;
    }
    return kindFromPayload(status, kErrorKindUrl);
}

std::optional<ErrorKind> causeKindOf(const absl::Status& status) {
    if (errorKindOf(status) != ErrorKind::TransferAborted) {
        return std::nullopt;
    }
    return kindFromPayload(status, kCauseKindUrl);
}

}  // namespace FileTransfer
