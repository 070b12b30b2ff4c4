#pragma once

#include <FileTransferExports.h>
#include <absl/status/statusor.h>

#include <api/Types.hpp>
#include <client/TransferSession.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string_view>
#include <transport/Transport.hpp>

namespace FileTransfer {

/**
 * @brief Entry point for storing files through a transport.
 *
 * Each call runs one TransferSession to completion. Calls from different
 * threads proceed independently over the shared transport.
 */
class FileTransfer_API FileTransferClient {
   public:
    explicit FileTransferClient(
        Transport& transport,
        TransferSession::Options defaults = TransferSession::Options{});

    /**
     * @brief Stores a local file on the server.
     *
     * @param source File to send.
     * @param name_on_server Destination relative to the store root. Uses the
     * source file name when empty.
     * @param progress Optional percent callback.
     * @param max_segment_size Segment size, unset keeps the default.
     * @return The stored file summary or TransferAborted.
     */
    absl::StatusOr<TransferResult> storeFile(
        const std::filesystem::path& source, std::string_view name_on_server,
        const TransferSession::ProgressCallback& progress = {},
        std::optional<std::size_t> max_segment_size = std::nullopt);

    /**
     * @brief Stores exactly `size` bytes read from a stream.
     *
     * @param stream Borrowed for the duration of the call.
     */
    absl::StatusOr<TransferResult> storeStream(
        std::istream& stream, uint64_t size, std::string_view name_on_server,
        const TransferSession::ProgressCallback& progress = {},
        std::optional<std::size_t> max_segment_size = std::nullopt);

   private:
    [[nodiscard]] TransferSession::Options optionsFor(
        std::optional<std::size_t> max_segment_size) const;

    Transport& transport_;
    TransferSession::Options defaults_;
};

}  // namespace FileTransfer
