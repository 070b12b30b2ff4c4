#pragma once

#include <FileTransferExports.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <api/Types.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <shared/Sha256.hpp>
#include <string>
#include <unordered_map>

namespace FileTransfer::Server {

/**
 * @brief Reassembles segmented files into a storage directory.
 *
 * Segments of a transfer are appended to a file in the working directory
 * while a running SHA-256 is kept. The final segment validates size and
 * digest and moves the file to its destination under the storage
 * directory. Any fault drops the transfer and its working data.
 */
class FileTransfer_API FileStoreManager {
   public:
    /**
     * @brief Creates the directories and purges incomplete transfers.
     *
     * @param storage_dir Root of all stored files.
     * @param working_dir Holds files in transit, `<storage_dir>/.workdir` by
     * default.
     * @param stale_after Idle time after which a pending transfer is dropped.
     * @return StorageWriteError if a directory cannot be prepared.
     */
    static absl::StatusOr<std::unique_ptr<FileStoreManager>> create(
        const std::filesystem::path& storage_dir,
        std::optional<std::filesystem::path> working_dir = std::nullopt,
        std::chrono::milliseconds stale_after = kDefaultStaleAfter);

    static constexpr std::chrono::milliseconds kDefaultStaleAfter =
        std::chrono::hours(1);

    ~FileStoreManager();

    FileStoreManager(const FileStoreManager&) = delete;
    FileStoreManager& operator=(const FileStoreManager&) = delete;

    /**
     * @brief Handles one store request.
     *
     * @param request A segment, or a cancellation when result is CANCEL.
     * @return The acknowledgement. The final segment's acknowledgement
     * carries the TransferResult.
     */
    absl::StatusOr<SegmentResponse> storeSegment(
        const FileTransferRequest& request);

    // Number of transfers with segments pending.
    [[nodiscard]] std::size_t activeTransfers() const;

    /**
     * @brief Aborts pending transfers idle for longer than stale_after.
     *
     * Runs before each new transfer starts. Entries busy with a segment are
     * skipped.
     * @return Number of transfers dropped.
     */
    std::size_t purgeStale();

    [[nodiscard]] const std::filesystem::path& storageDir() const {
        return storage_dir_;
    }
    [[nodiscard]] const std::filesystem::path& workingDir() const {
        return working_dir_;
    }

   private:
    struct Transfer {
        std::string file_id;
        std::string file_name;
        std::filesystem::path destination;
        std::filesystem::path working_file;
        uint32_t segment_count = 0;
        uint64_t total_size = 0;
        uint32_t segments_received = 0;
        uint64_t bytes_written = 0;
        Sha256 hash;
        std::ofstream stream;
        std::chrono::system_clock::time_point start_time;
        std::chrono::steady_clock::time_point last_activity;
        bool finished = false;
        std::mutex mutex;
    };

    FileStoreManager(std::filesystem::path storage_dir,
                     std::filesystem::path working_dir,
                     std::chrono::milliseconds stale_after);

    void purgeIncomplete();
    absl::StatusOr<std::filesystem::path> resolveDestination(
        const std::string& file_name) const;
    // Aborts a pending transfer, if any.
    void discardTransfer(const std::string& file_id);
    absl::StatusOr<std::shared_ptr<Transfer>> startTransfer(
        const FileTransferRequest& request,
        const std::filesystem::path& destination);
    absl::StatusOr<SegmentResponse> appendSegment(
        Transfer& transfer, const FileTransferRequest& request);
    absl::StatusOr<TransferResult> finalize(Transfer& transfer,
                                            const FileTransferRequest& request);
    // Drops the transfer and its working file. Caller holds transfer.mutex.
    void abort(Transfer& transfer);

    std::filesystem::path storage_dir_;
    std::filesystem::path working_dir_;
    std::chrono::milliseconds stale_after_;
    std::unordered_map<std::string, std::shared_ptr<Transfer>> transfers_;
    mutable std::mutex transfers_mutex_;
};

}  // namespace FileTransfer::Server
