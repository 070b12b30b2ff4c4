#include "FileStoreManager.hpp"

#include <LogCompat.hpp>
#include <absl/strings/ascii.h>
#include <api/CoreTypes.hpp>
#include <api/Errors.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <shared/TransferId.hpp>
#include <system_error>
#include <utility>
#include <vector>

namespace FileTransfer::Server {

namespace {

// Whether `path` lies inside `root`. Both must be normalized.
bool isWithin(const std::filesystem::path& path,
              const std::filesystem::path& root) {
    const auto mismatch =
        std::mismatch(root.begin(), root.end(), path.begin(), path.end());
    return mismatch.first == root.end();
}

std::filesystem::path normalized(const std::filesystem::path& path) {
    std::error_code ec;
    auto result = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        result = std::filesystem::absolute(path, ec).lexically_normal();
    }
    // Drop a trailing separator so component-wise comparison works
    if (!result.has_filename() && result.has_parent_path()) {
        result = result.parent_path();
    }
    return result;
}

}  // namespace

absl::StatusOr<std::unique_ptr<FileStoreManager>> FileStoreManager::create(
    const std::filesystem::path& storage_dir,
    std::optional<std::filesystem::path> working_dir,
    std::chrono::milliseconds stale_after) {
    std::error_code ec;

    if (storage_dir.empty()) {
        return makeError(ErrorKind::InvalidConfiguration,
                         "Storage directory must be set");
    }
    if (stale_after <= std::chrono::milliseconds::zero()) {
        return makeError(ErrorKind::InvalidConfiguration,
                         "Stale transfer timeout must be positive");
    }
    std::filesystem::create_directories(storage_dir, ec);
    if (ec) {
        return makeError(ErrorKind::StorageWriteError,
                         fmt::format("Cannot create storage directory {}: {}",
                                     storage_dir.string(), ec.message()));
    }
    auto storage = normalized(storage_dir);
    auto working = normalized(
        working_dir.value_or(storage / Storage::WORKING_DIR_NAME));
    if (storage == working) {
        return makeError(ErrorKind::InvalidConfiguration,
                         "Working directory must differ from storage");
    }
    std::filesystem::create_directories(working, ec);
    if (ec) {
        return makeError(ErrorKind::StorageWriteError,
                         fmt::format("Cannot create working directory {}: {}",
                                     working.string(), ec.message()));
    }

    std::unique_ptr<FileStoreManager> manager(
        new FileStoreManager(std::move(storage), std::move(working),
                             stale_after));
    manager->purgeIncomplete();
    return manager;
}

FileStoreManager::FileStoreManager(std::filesystem::path storage_dir,
                                   std::filesystem::path working_dir,
                                   std::chrono::milliseconds stale_after)
    : storage_dir_(std::move(storage_dir)),
      working_dir_(std::move(working_dir)),
      stale_after_(stale_after) {
    LOG(INFO) << "Storage directory: " << storage_dir_
              << ", working directory: " << working_dir_;
}

FileStoreManager::~FileStoreManager() {
    const std::lock_guard<std::mutex> lock(transfers_mutex_);
    if (!transfers_.empty()) {
        LOG(WARNING) << transfers_.size()
                     << " transfers left incomplete, purged on next start";
    }
}

void FileStoreManager::purgeIncomplete() {
    std::error_code ec;
    std::filesystem::directory_iterator it(working_dir_, ec);
    if (ec) {
        LOG(WARNING) << "Cannot list " << working_dir_ << ": " << ec.message();
        return;
    }
    for (const auto& entry : it) {
        std::filesystem::remove_all(entry.path(), ec);
        if (ec) {
            LOG(WARNING) << "Cannot purge " << entry.path() << ": "
                         << ec.message();
        } else {
            LOG(INFO) << "Purged incomplete transfer " << entry.path();
        }
    }
}

std::size_t FileStoreManager::activeTransfers() const {
    const std::lock_guard<std::mutex> lock(transfers_mutex_);
    return transfers_.size();
}

std::size_t FileStoreManager::purgeStale() {
    std::vector<std::shared_ptr<Transfer>> pending;
    {
        const std::lock_guard<std::mutex> lock(transfers_mutex_);
        pending.reserve(transfers_.size());
        for (const auto& [id, transfer] : transfers_) {
            pending.emplace_back(transfer);
        }
    }
    const auto now = std::chrono::steady_clock::now();
    std::size_t purged = 0;
    for (const auto& transfer : pending) {
        // abort() takes the map lock, so entries are locked outside of it
        std::unique_lock<std::mutex> entry_lock(transfer->mutex,
                                                std::try_to_lock);
        if (!entry_lock.owns_lock() || transfer->finished ||
            now - transfer->last_activity < stale_after_) {
            continue;
        }
        LOG(WARNING) << fmt::format(
            "Transfer {} idle for over {}ms, dropping it", transfer->file_id,
            stale_after_.count());
        abort(*transfer);
        ++purged;
    }
    return purged;
}

absl::StatusOr<std::filesystem::path> FileStoreManager::resolveDestination(
    const std::string& file_name) const {
    if (file_name.empty() || file_name.size() > Limits::MAX_PATH_SIZE) {
        return makeError(ErrorKind::InvalidRequest,
                         "file_name_on_server must be a non-empty path");
    }
    std::string relative = file_name;
    std::replace(relative.begin(), relative.end(), '\\', '/');
    const std::filesystem::path name(relative);
    if (name.is_absolute() || name.has_root_name() || !name.has_filename()) {
        return makeError(ErrorKind::InvalidRequest,
                         fmt::format("Invalid file name: {}", file_name));
    }

    auto destination = normalized(storage_dir_ / name);
    if (destination == storage_dir_ || !isWithin(destination, storage_dir_)) {
        return makeError(
            ErrorKind::InvalidRequest,
            fmt::format("File name {} is outside of the storage directory",
                        file_name));
    }
    if (isWithin(destination, working_dir_)) {
        return makeError(
            ErrorKind::InvalidRequest,
            fmt::format("File name {} is inside the working directory",
                        file_name));
    }
    return destination;
}

absl::StatusOr<SegmentResponse> FileStoreManager::storeSegment(
    const FileTransferRequest& request) {
    if (!isValidTransferId(request.transfer_id)) {
        return makeError(
            ErrorKind::InvalidRequest,
            fmt::format("Invalid file id '{}'", request.transfer_id));
    }
    if (request.result == RequestResult::CANCEL) {
        discardTransfer(request.transfer_id);
        return SegmentResponse{
            .file_id = request.transfer_id,
            .segments_received = 0,
            .total_segments = 0,
            .result = std::nullopt,
            .cancelled = true,
        };
    }
    if (request.segment_count == 0 ||
        request.segment_index >= request.segment_count) {
        return makeError(
            ErrorKind::InvalidRequest,
            fmt::format("Segment {} out of range for a count of {}",
                        request.segment_index, request.segment_count));
    }

    auto destination = resolveDestination(request.destination_path);
    if (!destination.ok()) {
        // Refuse the whole transfer
        discardTransfer(request.transfer_id);
        return destination.status();
    }

    std::shared_ptr<Transfer> transfer;
    {
        const std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(request.transfer_id);
        if (it != transfers_.end()) {
            transfer = it->second;
        }
    }
    if (!transfer) {
        if (request.segment_index != 0) {
            LOG(WARNING) << "Segment " << request.segment_index
                         << " for unknown transfer " << request.transfer_id;
            return makeError(
                ErrorKind::OutOfOrderSegment,
                fmt::format("Expected segment 0 of {}, got {}",
                            request.transfer_id, request.segment_index));
        }
        if (const auto purged = purgeStale(); purged != 0) {
            LOG(INFO) << "Dropped " << purged << " stale transfers";
        }
        auto started = startTransfer(request, *destination);
        if (!started.ok()) {
            return started.status();
        }
        transfer = std::move(started).value();
    }

    const std::lock_guard<std::mutex> entry_lock(transfer->mutex);
    if (transfer->finished) {
        // Aborted or completed by a concurrent request
        return makeError(ErrorKind::OutOfOrderSegment,
                         fmt::format("Transfer {} is no longer active",
                                     request.transfer_id));
    }
    if (transfer->segment_count != request.segment_count ||
        transfer->total_size != request.total_size ||
        transfer->destination != *destination) {
        abort(*transfer);
        return makeError(
            ErrorKind::InvalidRequest,
            fmt::format("Segment {} of {} changes the transfer metadata",
                        request.segment_index, request.transfer_id));
    }
    return appendSegment(*transfer, request);
}

absl::StatusOr<std::shared_ptr<FileStoreManager::Transfer>>
FileStoreManager::startTransfer(const FileTransferRequest& request,
                                const std::filesystem::path& destination) {
    auto transfer = std::make_shared<Transfer>();
    transfer->file_id = request.transfer_id;
    transfer->file_name = request.destination_path;
    transfer->destination = destination;
    transfer->working_file = working_dir_ / request.transfer_id;
    transfer->segment_count = request.segment_count;
    transfer->total_size = request.total_size;
    transfer->start_time = std::chrono::system_clock::now();
    transfer->last_activity = std::chrono::steady_clock::now();

    const std::lock_guard<std::mutex> lock(transfers_mutex_);
    if (transfers_.contains(request.transfer_id)) {
        return makeError(ErrorKind::OutOfOrderSegment,
                         fmt::format("Transfer {} already started",
                                     request.transfer_id));
    }
    transfer->stream.open(transfer->working_file,
                          std::ios::out | std::ios::binary | std::ios::trunc);
    if (!transfer->stream.is_open()) {
        PLOG(ERROR) << "Cannot open " << transfer->working_file;
        return makeError(ErrorKind::StorageWriteError,
                         fmt::format("Cannot create working file for {}",
                                     request.transfer_id));
    }
    transfers_.emplace(request.transfer_id, transfer);

    LOG(INFO) << "Started transfer " << request.transfer_id << " -> "
              << destination << ", total size: " << request.total_size
              << ", segments: " << request.segment_count;
    return transfer;
}

absl::StatusOr<SegmentResponse> FileStoreManager::appendSegment(
    Transfer& transfer, const FileTransferRequest& request) {
    if (request.segment_index != transfer.segments_received) {
        LOG(WARNING) << "Segment index mismatch for " << transfer.file_id
                     << ": expected " << transfer.segments_received << ", got "
                     << request.segment_index;
        const auto expected = transfer.segments_received;
        abort(transfer);
        return makeError(ErrorKind::OutOfOrderSegment,
                         fmt::format("Expected segment {}, got {}", expected,
                                     request.segment_index));
    }
    if (transfer.bytes_written + request.payload.size() > transfer.total_size) {
        LOG(ERROR) << "Segment size overflow for " << transfer.file_id;
        abort(transfer);
        return makeError(ErrorKind::SizeMismatch,
                         "Segment would exceed total file size");
    }

    transfer.stream.write(reinterpret_cast<const char*>(request.payload.data()),
                          static_cast<std::streamsize>(request.payload.size()));
    if (!transfer.stream) {
        PLOG(ERROR) << "Failed to write " << transfer.working_file;
        abort(transfer);
        return makeError(ErrorKind::StorageWriteError,
                         fmt::format("Failed to write segment {} of {}",
                                     request.segment_index, transfer.file_id));
    }
    if (!transfer.hash.update(request.payload.data(), request.payload.size())) {
        abort(transfer);
        return absl::InternalError("Failed to hash segment");
    }
    transfer.bytes_written += request.payload.size();
    ++transfer.segments_received;
    transfer.last_activity = std::chrono::steady_clock::now();

    DLOG(INFO) << "Received segment " << request.segment_index << " for "
               << transfer.file_id << " (" << transfer.bytes_written << "/"
               << transfer.total_size << " bytes)";

    SegmentResponse response{
        .file_id = transfer.file_id,
        .segments_received = transfer.segments_received,
        .total_segments = transfer.segment_count,
    };
    if (transfer.segments_received == transfer.segment_count) {
        auto result = finalize(transfer, request);
        if (!result.ok()) {
            return result.status();
        }
        response.result = std::move(result).value();
    }
    return response;
}

absl::StatusOr<TransferResult> FileStoreManager::finalize(
    Transfer& transfer, const FileTransferRequest& request) {
    transfer.stream.close();
    if (transfer.stream.fail()) {
        abort(transfer);
        return makeError(ErrorKind::StorageWriteError,
                         fmt::format("Failed to flush {}", transfer.file_id));
    }
    if (transfer.bytes_written != transfer.total_size) {
        const auto written = transfer.bytes_written;
        abort(transfer);
        return makeError(ErrorKind::SizeMismatch,
                         fmt::format("Received {} bytes, expected {} bytes",
                                     written, transfer.total_size));
    }
    auto digest = transfer.hash.hexDigest();
    if (!digest) {
        abort(transfer);
        return absl::InternalError("Failed to finalize hash");
    }
    if (!request.sha256.empty() &&
        absl::AsciiStrToLower(request.sha256) != *digest) {
        LOG(ERROR) << "Hash mismatch for " << transfer.file_id << ": got "
                   << request.sha256 << ", computed " << *digest;
        abort(transfer);
        return makeError(ErrorKind::HashMismatch,
                         "File hash does not match the client hash");
    }

    std::error_code ec;
    std::filesystem::create_directories(transfer.destination.parent_path(), ec);
    if (ec) {
        abort(transfer);
        return makeError(ErrorKind::StorageWriteError,
                         fmt::format("Cannot create directory for {}: {}",
                                     transfer.file_name, ec.message()));
    }
    if (std::filesystem::is_directory(transfer.destination, ec)) {
        abort(transfer);
        return makeError(ErrorKind::StorageWriteError,
                         fmt::format("Destination {} is a directory",
                                     transfer.file_name));
    }
    std::filesystem::rename(transfer.working_file, transfer.destination, ec);
    if (ec) {
        // Working directory may live on another filesystem
        std::filesystem::copy_file(
            transfer.working_file, transfer.destination,
            std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            LOG(ERROR) << "Failed to move " << transfer.working_file << " to "
                       << transfer.destination << ": " << ec.message();
            abort(transfer);
            return makeError(ErrorKind::StorageWriteError,
                             fmt::format("Cannot store {}: {}",
                                         transfer.file_name, ec.message()));
        }
        std::filesystem::remove(transfer.working_file, ec);
    }

    transfer.finished = true;
    {
        const std::lock_guard<std::mutex> lock(transfers_mutex_);
        transfers_.erase(transfer.file_id);
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - transfer.start_time);
    LOG(INFO) << fmt::format("Stored {} as {} ({} bytes, {}ms)",
                             transfer.file_id, transfer.destination.string(),
                             transfer.total_size, elapsed.count());
    return TransferResult{
        .file_id = transfer.file_id,
        .sha256 = std::move(*digest),
        .size = transfer.total_size,
    };
}

void FileStoreManager::abort(Transfer& transfer) {
    transfer.finished = true;
    transfer.stream.close();
    std::error_code ec;
    std::filesystem::remove(transfer.working_file, ec);
    if (ec) {
        LOG(WARNING) << "Cannot remove " << transfer.working_file << ": "
                     << ec.message();
    }
    const std::lock_guard<std::mutex> lock(transfers_mutex_);
    transfers_.erase(transfer.file_id);
    LOG(INFO) << "Aborted transfer " << transfer.file_id;
}

void FileStoreManager::discardTransfer(const std::string& file_id) {
    std::shared_ptr<Transfer> transfer;
    {
        const std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(file_id);
        if (it != transfers_.end()) {
            transfer = it->second;
        }
    }
    if (!transfer) {
        DLOG(INFO) << "Nothing to discard for " << file_id;
        return;
    }
    const std::lock_guard<std::mutex> entry_lock(transfer->mutex);
    if (!transfer->finished) {
        abort(*transfer);
    }
}

}  // namespace FileTransfer::Server
