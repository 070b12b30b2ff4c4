#include "LoopbackTransport.hpp"

#include <api/Errors.hpp>

#include <shared/MessageCodec.hpp>
#include <utility>

namespace FileTransfer {

namespace {

// Serializes and parses back a message like a socket round trip would.
absl::StatusOr<Message> overTheWire(const Message& message) {
    auto frame = serializeMessage(message);
    if (!frame.ok()) {
        return frame.status();
    }
    auto header = parseHeader(frame->data(), frame->size());
    if (!header.ok()) {
        return header.status();
    }
    return parseBody(*header, frame->data() + Message::Header::kWireSize,
                     frame->size() - Message::Header::kWireSize);
}

}  // namespace

LoopbackTransport::LoopbackTransport(Server::StoreService& service)
    : LoopbackTransport(service, service.topic()) {}

LoopbackTransport::LoopbackTransport(Server::StoreService& service,
                                     std::string topic)
    : service_(service), topic_(std::move(topic)) {}

absl::StatusOr<SegmentResponse> LoopbackTransport::request(
    const FileTransferRequest& request) {
    auto sent = overTheWire(encodeRequest(request, topic_));
    if (!sent.ok()) {
        return sent.status();
    }
    auto received = overTheWire(service_.handle(*sent));
    if (!received.ok()) {
        return received.status();
    }
    return decodeResponse(*received);
}

}  // namespace FileTransfer
