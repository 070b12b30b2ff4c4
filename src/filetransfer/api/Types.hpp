#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace FileTransfer {

/**
 * @brief What the store should do with the file after this request
 */
enum class RequestResult {
    NONE = 0,    ///< Intermediate segment
    STORE = 1,   ///< Final segment, finalize and store the file
    CANCEL = 2,  ///< Discard everything received for the transfer
};

/**
 * @brief One segment of a file on its way to the store
 *
 * JSON metadata:
 * {
 *   "file_id": string, "file_name_on_server": string,
 *   "segment_index": uint32, "segment_count": uint32, "total_size": uint64,
 *   "result": "store" | "cancel" (optional),
 *   "hashes": { "sha256": string } (optional, final segment)
 * }
 * followed by the raw segment bytes as the message payload.
 */
struct FileTransferRequest {
    std::string transfer_id;
    std::string destination_path;
    uint32_t segment_index = 0;
    uint32_t segment_count = 0;
    uint64_t total_size = 0;
    std::vector<uint8_t> payload;
    RequestResult result = RequestResult::NONE;
    std::string sha256;

    [[nodiscard]] bool isFinal() const {
        return segment_count != 0 && segment_index + 1 == segment_count;
    }
};

/**
 * @brief Summary of a stored file
 *
 * JSON schema: { "file_id": string, "hashes": { "sha256": string },
 *                "size": uint64 }
 */
struct TransferResult {
    std::string file_id;
    std::string sha256;
    uint64_t size = 0;

    bool operator==(const TransferResult& other) const = default;
};

/**
 * @brief Acknowledgement of a single segment
 *
 * JSON schema:
 * {
 *   "file_id": string, "segments_received": uint32, "total_segments": uint32,
 *   "result": "store" | "cancel" (optional),
 *   "hashes": { "sha256": string }, "size": uint64 (with "store")
 * }
 */
struct SegmentResponse {
    std::string file_id;
    uint32_t segments_received = 0;
    uint32_t total_segments = 0;
    std::optional<TransferResult> result;
    bool cancelled = false;
};

}  // namespace FileTransfer
