#include "FabricTransport.hpp"

#include <LogCompat.hpp>
#include <api/Errors.hpp>
#include <fmt/format.h>

#include <shared/MessageCodec.hpp>
#include <utility>

namespace FileTransfer {

FabricTransport::FabricTransport(TcpChannel::Endpoint endpoint,
                                 const std::string_view service_id,
                                 TcpChannel::Options options)
    : endpoint_(std::move(endpoint)),
      options_(options),
      topic_(storeTopic(service_id)) {}

FabricTransport::~FabricTransport() = default;

absl::StatusOr<SegmentResponse> FabricTransport::request(
    const FileTransferRequest& request) {
    auto answer = roundTrip(encodeRequest(request, topic_));
    if (!answer.ok()) {
        return answer.status();
    }
    return decodeResponse(*answer);
}

absl::StatusOr<Message> FabricTransport::roundTrip(const Message& message) {
    auto frame = serializeMessage(message);
    if (!frame.ok()) {
        return frame.status();
    }

    const std::lock_guard<std::mutex> lock(mutex_);
    if (!channel_ || !*channel_) {
        channel_ = std::make_unique<TcpChannel>(options_);
        if (!channel_->connect(endpoint_)) {
            channel_.reset();
            return makeError(ErrorKind::TransportError,
                             fmt::format("Cannot connect to {}:{}",
                                         endpoint_.address, endpoint_.port));
        }
    }

    // Drops the connection, a half read frame leaves the stream unusable
    const auto broken = [this](std::string_view what) {
        channel_.reset();
        return makeError(ErrorKind::TransportError, what);
    };

    if (!channel_->write(frame->data(), frame->size())) {
        return broken("Failed to send request");
    }
    auto header_bytes = channel_->read(Message::Header::kWireSize);
    if (!header_bytes || header_bytes->size() != Message::Header::kWireSize) {
        return broken("Failed to receive response header");
    }
    auto header = parseHeader(header_bytes->data(), header_bytes->size());
    if (!header.ok()) {
        channel_.reset();
        return header.status();
    }
    std::vector<uint8_t> body;
    if (header->bodySize() != 0) {
        auto read = channel_->read(header->bodySize());
        if (!read || read->size() != header->bodySize()) {
            return broken("Failed to receive response body");
        }
        body = std::move(*read);
    }
    auto answer = parseBody(*header, body.data(), body.size());
    if (!answer.ok()) {
        channel_.reset();
    }
    return answer;
}

}  // namespace FileTransfer
