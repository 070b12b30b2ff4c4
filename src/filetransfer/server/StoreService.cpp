#include "StoreService.hpp"

#include <LogCompat.hpp>
#include <api/Errors.hpp>
#include <fmt/format.h>

#include <shared/MessageCodec.hpp>

namespace FileTransfer::Server {

StoreService::StoreService(FileStoreManager& store,
                           const std::string_view service_id)
    : store_(store), topic_(storeTopic(service_id)) {
    LOG(INFO) << "Store service registered on " << topic_;
}

Message StoreService::handle(const Message& message) {
    if (message.type != MessageType::REQUEST) {
        return encodeError(makeError(ErrorKind::InvalidRequest,
                                     "Only requests are accepted"));
    }
    if (message.topic != topic_) {
        LOG(WARNING) << "Request for unknown topic: " << message.topic;
        return encodeError(makeError(
            ErrorKind::InvalidRequest,
            fmt::format("Unknown topic: {}", message.topic)));
    }

    auto request = decodeRequest(message);
    if (!request.ok()) {
        return encodeError(request.status());
    }
    auto response = store_.storeSegment(*request);
    if (!response.ok()) {
        LOG(WARNING) << "Request for " << request->transfer_id
                     << " failed: " << response.status();
        return encodeError(response.status());
    }
    return encodeResponse(*response);
}

}  // namespace FileTransfer::Server
