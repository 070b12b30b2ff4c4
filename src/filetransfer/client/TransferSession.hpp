#pragma once

#include <FileTransferExports.h>
#include <absl/status/statusor.h>

#include <api/CoreTypes.hpp>
#include <api/Types.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <shared/ByteSource.hpp>
#include <string>
#include <string_view>
#include <transport/Transport.hpp>

namespace FileTransfer {

/**
 * @brief Sends one file to the store, segment by segment.
 *
 * Segments go out strictly in order with at most one request in flight.
 * A session is used once: after send() it is Completed or Failed for good.
 */
class FileTransfer_API TransferSession {
   public:
    enum class State {
        Created,
        Sending,
        Completed,
        Failed,
    };

    // Integer percent 0-100, called after each acknowledged segment.
    using ProgressCallback = std::function<void(int percent)>;

    struct Options {
        std::size_t max_segment_size = Limits::DEFAULT_SEGMENT_SIZE;
        // Largest segment the fabric can carry after framing and metadata.
        std::size_t segment_size_ceiling = Limits::MAX_SEGMENT_SIZE;
        // Ask the store to drop partial data after a failure.
        bool notify_cancel_on_failure = true;
    };

    /**
     * @brief Creates a session for an unopened byte source.
     *
     * @param source Owned by the session, opened only during send().
     * @param destination_path Relative path of the file on the store.
     * @param transport Shared fabric, must outlive the session.
     * @param options Segmenting options.
     * @return InvalidConfiguration for a bad segment size or destination.
     */
    static absl::StatusOr<std::unique_ptr<TransferSession>> begin(
        std::unique_ptr<ByteSource> source, std::string_view destination_path,
        Transport& transport, Options options);

    // Same as above for a local file. Fails with SourceReadError if the
    // file is missing or not a regular file.
    static absl::StatusOr<std::unique_ptr<TransferSession>> begin(
        const std::filesystem::path& source, std::string_view destination_path,
        Transport& transport, Options options);

    /**
     * @brief Runs the transfer to completion.
     *
     * @param progress Optional progress callback.
     * @return The stored file summary, or TransferAborted carrying the kind
     * of the failure. InvalidConfiguration if the session was already used.
     */
    absl::StatusOr<TransferResult> send(const ProgressCallback& progress = {});

    // Requests cancellation. Takes effect before the next segment.
    void cancel() noexcept { cancel_requested_ = true; }

    /**
     * @brief Normalizes a destination path.
     *
     * Backslashes become '/', and empty, absolute, trailing-separator or
     * '..' paths are rejected with InvalidConfiguration.
     */
    static absl::StatusOr<std::string> normalizeDestination(
        std::string_view path);

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] const std::string& transferId() const noexcept {
        return transfer_id_;
    }
    [[nodiscard]] const std::string& destinationPath() const noexcept {
        return destination_path_;
    }
    [[nodiscard]] uint64_t totalSize() const noexcept { return total_size_; }
    [[nodiscard]] uint32_t segmentCount() const noexcept {
        return segment_count_;
    }
    [[nodiscard]] uint64_t bytesSent() const noexcept { return bytes_sent_; }
    [[nodiscard]] std::chrono::system_clock::time_point startedAt()
        const noexcept {
        return started_at_;
    }

   private:
    TransferSession(std::unique_ptr<ByteSource> source,
                    std::string destination_path, Transport& transport,
                    Options options, std::string transfer_id,
                    uint32_t segment_count);

    absl::StatusOr<TransferResult> run(const ProgressCallback& progress);
    absl::Status checkAck(const FileTransferRequest& request,
                          const SegmentResponse& response) const;
    void notifyCancel();
    absl::Status fail(const absl::Status& cause);

    std::unique_ptr<ByteSource> source_;
    std::string destination_path_;
    Transport& transport_;
    Options options_;
    std::string transfer_id_;
    uint64_t total_size_;
    uint32_t segment_count_;
    uint64_t bytes_sent_ = 0;
    bool any_request_sent_ = false;
    std::chrono::system_clock::time_point started_at_{};
    std::atomic<State> state_ = State::Created;
    std::atomic_bool cancel_requested_ = false;
};

FileTransfer_API std::string_view toString(TransferSession::State state);

}  // namespace FileTransfer
