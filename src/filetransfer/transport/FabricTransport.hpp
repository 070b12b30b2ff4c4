#pragma once

#include <FileTransferExports.h>

#include <api/Message.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <transport/TcpChannel.hpp>
#include <transport/Transport.hpp>

namespace FileTransfer {

/**
 * @brief Transport over a TCP connection to a fabric server.
 *
 * The connection is opened lazily and reopened after a failure. One request
 * is outstanding at a time; concurrent callers are serialized.
 */
class FileTransfer_API FabricTransport : public Transport {
   public:
    /**
     * @param endpoint Address of the fabric server.
     * @param service_id Optional id of the store service instance.
     * @param options Connect and I/O timeouts.
     */
    FabricTransport(TcpChannel::Endpoint endpoint,
                    std::string_view service_id = {},
                    TcpChannel::Options options = {});
    ~FabricTransport() override;

    absl::StatusOr<SegmentResponse> request(
        const FileTransferRequest& request) override;

    [[nodiscard]] const std::string& topic() const { return topic_; }

   private:
    absl::StatusOr<Message> roundTrip(const Message& message);

    TcpChannel::Endpoint endpoint_;
    TcpChannel::Options options_;
    std::string topic_;
    std::unique_ptr<TcpChannel> channel_;
    std::mutex mutex_;
};

}  // namespace FileTransfer
