#pragma once

#include <FileTransferExports.h>

#include <server/StoreService.hpp>
#include <string>
#include <transport/Transport.hpp>

namespace FileTransfer {

/**
 * @brief In-process fabric bound to a StoreService.
 *
 * Requests still go through the full frame codec in both directions, so
 * message limits apply exactly as on a socket.
 */
class FileTransfer_API LoopbackTransport : public Transport {
   public:
    // Sends to the service's own topic.
    explicit LoopbackTransport(Server::StoreService& service);
    LoopbackTransport(Server::StoreService& service, std::string topic);

    absl::StatusOr<SegmentResponse> request(
        const FileTransferRequest& request) override;

   private:
    Server::StoreService& service_;
    std::string topic_;
};

}  // namespace FileTransfer
