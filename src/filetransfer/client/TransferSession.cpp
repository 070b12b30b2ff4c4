#include "TransferSession.hpp"

#include <LogCompat.hpp>
#include <absl/cleanup/cleanup.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>
#include <api/Errors.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <client/Segmenter.hpp>
#include <shared/MessageCodec.hpp>
#include <shared/Sha256.hpp>
#include <shared/TransferId.hpp>
#include <utility>
#include <vector>

namespace FileTransfer {

std::string_view toString(const TransferSession::State state) {
    switch (state) {
        case TransferSession::State::Created:
            return "Created";
        case TransferSession::State::Sending:
            return "Sending";
        case TransferSession::State::Completed:
            return "Completed";
        case TransferSession::State::Failed:
            return "Failed";
    }
    return "Unknown";
}

absl::StatusOr<std::string> TransferSession::normalizeDestination(
    const std::string_view path) {
    std::string normalized(path);
    std::ranges::replace(normalized, '\\', '/');

    if (normalized.empty()) {
        return makeError(ErrorKind::InvalidConfiguration,
                         "Destination path is empty");
    }
    if (normalized.size() > Limits::MAX_PATH_SIZE) {
        return makeError(ErrorKind::InvalidConfiguration,
                         "Destination path is too long");
    }
    if (normalized.front() == '/' ||
        (normalized.size() > 1 && normalized[1] == ':')) {
        return makeError(
            ErrorKind::InvalidConfiguration,
            fmt::format("Destination must be relative: {}", normalized));
    }
    if (normalized.back() == '/') {
        return makeError(
            ErrorKind::InvalidConfiguration,
            fmt::format("Destination must name a file: {}", normalized));
    }

    std::vector<std::string> parts;
    for (absl::string_view part : absl::StrSplit(normalized, '/')) {
        if (part == "..") {
            return makeError(
                ErrorKind::InvalidConfiguration,
                fmt::format("Destination escapes the store: {}", normalized));
        }
        // Collapse "a//b" and "a/./b"
        if (part.empty() || part == ".") {
            continue;
        }
        parts.emplace_back(part);
    }
    if (parts.empty()) {
        return makeError(
            ErrorKind::InvalidConfiguration,
            fmt::format("Destination must name a file: {}", normalized));
    }
    return absl::StrJoin(parts, "/");
}

absl::StatusOr<std::unique_ptr<TransferSession>> TransferSession::begin(
    std::unique_ptr<ByteSource> source, const std::string_view destination_path,
    Transport& transport, Options options) {
    if (!source) {
        return makeError(ErrorKind::InvalidConfiguration, "No source given");
    }
    if (options.max_segment_size == 0 ||
        options.max_segment_size > options.segment_size_ceiling) {
        return makeError(
            ErrorKind::InvalidConfiguration,
            fmt::format("Segment size must be within 1..{}, got {}",
                        options.segment_size_ceiling,
                        options.max_segment_size));
    }
    auto destination = normalizeDestination(destination_path);
    if (!destination.ok()) {
        return destination.status();
    }
    auto count = Segmenter::segmentCount(source->size(),
                                         options.max_segment_size);
    if (!count.ok()) {
        return count.status();
    }
    auto transfer_id = generateTransferId();
    if (!transfer_id.ok()) {
        return transfer_id.status();
    }
    // Escaped non-ASCII names can blow up the metadata of the final request
    const auto metadata_size =
        encodeRequest(FileTransferRequest{
                          .transfer_id = *transfer_id,
                          .destination_path = *destination,
                          .segment_index = *count - 1,
                          .segment_count = *count,
                          .total_size = source->size(),
                          .result = RequestResult::STORE,
                          .sha256 = std::string(Limits::SHA256_HEX_LENGTH, '0'),
                      },
                      {})
            .metadata.size();
    if (metadata_size > Limits::MAX_METADATA_SIZE) {
        return makeError(
            ErrorKind::InvalidConfiguration,
            fmt::format("Destination path needs {} bytes of metadata, limit "
                        "is {}",
                        metadata_size, Limits::MAX_METADATA_SIZE));
    }

    LOG(INFO) << fmt::format(
        "Transfer {}: {} -> {} ({} bytes, {} segments of {})", *transfer_id,
        source->describe(), *destination, source->size(), *count,
        options.max_segment_size);

    return std::unique_ptr<TransferSession>(new TransferSession(
        std::move(source), std::move(destination).value(), transport, options,
        std::move(transfer_id).value(), *count));
}

absl::StatusOr<std::unique_ptr<TransferSession>> TransferSession::begin(
    const std::filesystem::path& source, const std::string_view destination_path,
    Transport& transport, Options options) {
    auto file = FileByteSource::create(source);
    if (!file.ok()) {
        return file.status();
    }
    return begin(std::move(file).value(), destination_path, transport,
                 options);
}

TransferSession::TransferSession(std::unique_ptr<ByteSource> source,
                                 std::string destination_path,
                                 Transport& transport, Options options,
                                 std::string transfer_id,
                                 uint32_t segment_count)
    : source_(std::move(source)),
      destination_path_(std::move(destination_path)),
      transport_(transport),
      options_(options),
      transfer_id_(std::move(transfer_id)),
      total_size_(source_->size()),
      segment_count_(segment_count) {}

absl::StatusOr<TransferResult> TransferSession::send(
    const ProgressCallback& progress) {
    State expected = State::Created;
    if (!state_.compare_exchange_strong(expected, State::Sending)) {
        return makeError(ErrorKind::InvalidConfiguration,
                         fmt::format("Session {} is already {}", transfer_id_,
                                     toString(expected)));
    }
    started_at_ = std::chrono::system_clock::now();

    if (auto status = source_->open(); !status.ok()) {
        return fail(status);
    }
    absl::Cleanup closer = [this] { source_->close(); };

    auto result = run(progress);
    if (!result.ok()) {
        return fail(result.status());
    }
    state_ = State::Completed;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - started_at_);
    LOG(INFO) << fmt::format("Transfer {} completed: {} bytes in {}ms",
                             transfer_id_, total_size_, elapsed.count());
    return result;
}

absl::StatusOr<TransferResult> TransferSession::run(
    const ProgressCallback& progress) {
    auto segmenter = Segmenter::create(*source_, options_.max_segment_size);
    if (!segmenter.ok()) {
        return segmenter.status();
    }
    Sha256 hash;
    uint32_t acknowledged = 0;

    while (true) {
        if (cancel_requested_) {
            return makeError(
                ErrorKind::Cancelled,
                fmt::format("Transfer cancelled after {} of {} segments",
                            acknowledged, segment_count_));
        }
        auto next = segmenter->next();
        if (!next.ok()) {
            return next.status();
        }
        if (!next->has_value()) {
            break;
        }
        Segment& segment = next->value();

        if (!hash.update(segment.data.data(), segment.data.size())) {
            return absl::InternalError("Failed to hash segment");
        }

        FileTransferRequest request{
            .transfer_id = transfer_id_,
            .destination_path = destination_path_,
            .segment_index = segment.index,
            .segment_count = segment.count,
            .total_size = total_size_,
            .payload = std::move(segment.data),
        };
        if (request.isFinal()) {
            auto digest = hash.hexDigest();
            if (!digest) {
                return absl::InternalError("Failed to finalize hash");
            }
            request.result = RequestResult::STORE;
            request.sha256 = std::move(*digest);
        }

        any_request_sent_ = true;
        auto response = transport_.request(request);
        if (!response.ok()) {
            LOG(ERROR) << "Segment " << request.segment_index << " of "
                       << transfer_id_ << " failed: " << response.status();
            return response.status();
        }
        if (auto status = checkAck(request, *response); !status.ok()) {
            return status;
        }

        ++acknowledged;
        bytes_sent_ += request.payload.size();
        if (progress) {
            progress(total_size_ == 0
                         ? 100
                         : static_cast<int>(bytes_sent_ * 100 / total_size_));
        }
        DLOG(INFO) << "Segment " << request.segment_index + 1 << "/"
                   << segment_count_ << " acknowledged";

        if (request.isFinal()) {
            if (response->result->size != total_size_) {
                return makeError(
                    ErrorKind::SizeMismatch,
                    fmt::format("Store reports {} bytes, sent {}",
                                response->result->size, total_size_));
            }
            return *response->result;
        }
    }
    return makeError(ErrorKind::TransportError,
                     "Transfer ended without a store result");
}

absl::Status TransferSession::checkAck(const FileTransferRequest& request,
                                       const SegmentResponse& response) const {
    if (response.file_id != transfer_id_) {
        return makeError(
            ErrorKind::TransportError,
            fmt::format("Acknowledgement for file id '{}', expected '{}'",
                        response.file_id, transfer_id_));
    }
    if (response.segments_received != request.segment_index + 1) {
        return makeError(
            ErrorKind::TransportError,
            fmt::format("Store acknowledged {} segments, expected {}",
                        response.segments_received, request.segment_index + 1));
    }
    if (request.isFinal() && !response.result) {
        return makeError(ErrorKind::TransportError,
                         "Final acknowledgement carries no store result");
    }
    return absl::OkStatus();
}

void TransferSession::notifyCancel() {
    FileTransferRequest request{
        .transfer_id = transfer_id_,
        .destination_path = destination_path_,
        .result = RequestResult::CANCEL,
    };
    auto response = transport_.request(request);
    if (!response.ok()) {
        LOG(WARNING) << "Cancel notification for " << transfer_id_
                     << " failed: " << response.status();
    } else {
        LOG(INFO) << "Store discarded partial data of " << transfer_id_;
    }
}

absl::Status TransferSession::fail(const absl::Status& cause) {
    state_ = State::Failed;
    LOG(ERROR) << fmt::format("Transfer {} failed after {} of {} bytes: {}",
                              transfer_id_, bytes_sent_, total_size_,
                              cause.ToString());
    if (options_.notify_cancel_on_failure && any_request_sent_) {
        notifyCancel();
    }
    return abortedBy(cause);
}

}  // namespace FileTransfer
