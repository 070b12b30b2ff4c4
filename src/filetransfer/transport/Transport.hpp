#pragma once

#include <FileTransferExports.h>
#include <absl/status/statusor.h>

#include <api/Types.hpp>

namespace FileTransfer {

/**
 * @brief Request/response capability of the messaging fabric.
 *
 * One call sends one request and waits for its answer. Implementations are
 * shared by sessions and must be safe for concurrent use.
 */
struct FileTransfer_API Transport {
    virtual ~Transport() = default;

    /**
     * @brief Sends a request and waits for the matching response.
     *
     * @return The decoded acknowledgement, TransportError for channel
     * failures, or the kind the service answered with.
     */
    virtual absl::StatusOr<SegmentResponse> request(
        const FileTransferRequest& request) = 0;
};

}  // namespace FileTransfer
