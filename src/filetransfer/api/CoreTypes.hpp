#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace FileTransfer {

/**
 * @brief Protocol version and magic values
 */
namespace Protocol {
    constexpr int64_t MAGIC_VALUE_BASE = 0xF11E5E6D;
    constexpr int DATA_VERSION = 1;
    constexpr int64_t MAGIC_VALUE = MAGIC_VALUE_BASE + DATA_VERSION;
}  // namespace Protocol

/**
 * @brief Size limits of the fabric and of the transfer protocol
 */
namespace Limits {
    // Default maximum message size accepted by a fabric broker (1 MB)
    constexpr std::size_t FABRIC_MAX_MESSAGE_SIZE = 1024 * 1024;
    // Room kept free in each message for the frame header, topic and metadata
    constexpr std::size_t MESSAGE_OVERHEAD_RESERVE = 16 * 1024;
    constexpr std::size_t MAX_SEGMENT_SIZE =
        FABRIC_MAX_MESSAGE_SIZE - MESSAGE_OVERHEAD_RESERVE;
    constexpr std::size_t DEFAULT_SEGMENT_SIZE = 50 * 1024;

    constexpr std::size_t MAX_TOPIC_SIZE = 512;
    constexpr std::size_t MAX_METADATA_SIZE = 8 * 1024;
    constexpr std::size_t MAX_PATH_SIZE = 4096;
    constexpr std::size_t MAX_FILE_ID_SIZE = 128;
    constexpr std::size_t SHA256_HEX_LENGTH = 64;
}  // namespace Limits

/**
 * @brief Topic names of the file transfer service
 */
namespace Topics {
    constexpr std::string_view SERVICE_TYPE =
        "/opendxl-file-transfer/service/file-transfer";
    constexpr std::string_view FILE_STORE = "file/store";
}  // namespace Topics

namespace Storage {
    // Default working directory name, relative to the storage directory
    constexpr const char* WORKING_DIR_NAME = ".workdir";
}  // namespace Storage

/**
 * @brief JSON metadata keys used in requests and responses
 */
namespace Fields {
    constexpr const char* FILE_ID = "file_id";
    constexpr const char* FILE_NAME = "file_name_on_server";
    constexpr const char* SEGMENT_INDEX = "segment_index";
    constexpr const char* SEGMENT_COUNT = "segment_count";
    constexpr const char* TOTAL_SIZE = "total_size";
    constexpr const char* RESULT = "result";
    constexpr const char* HASHES = "hashes";
    constexpr const char* SHA256 = "sha256";
    constexpr const char* SIZE = "size";
    constexpr const char* SEGMENTS_RECEIVED = "segments_received";
    constexpr const char* TOTAL_SEGMENTS = "total_segments";
    constexpr const char* ERROR = "error";
    constexpr const char* KIND = "kind";
    constexpr const char* MESSAGE = "message";

    constexpr std::string_view RESULT_STORE = "store";
    constexpr std::string_view RESULT_CANCEL = "cancel";
}  // namespace Fields

}  // namespace FileTransfer
