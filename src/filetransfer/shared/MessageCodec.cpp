#include "MessageCodec.hpp"

#include <LogCompat.hpp>
#include <api/CoreTypes.hpp>
#include <api/Errors.hpp>
#include <fmt/format.h>
#include <json/reader.h>
#include <json/writer.h>

#include <boost/endian/conversion.hpp>
#include <cstring>
#include <limits>
#include <memory>

template <>
struct fmt::formatter<FileTransfer::MessageType> : formatter<string_view> {
    auto format(FileTransfer::MessageType c, format_context& ctx) const
        -> format_context::iterator {
        string_view name = "unknown";
        switch (c) {
            case FileTransfer::MessageType::REQUEST:
                name = "request";
                break;
            case FileTransfer::MessageType::RESPONSE:
                name = "response";
                break;
            case FileTransfer::MessageType::ERROR_RESPONSE:
                name = "error";
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

namespace FileTransfer {

namespace {

std::string_view toString(const RequestResult result) {
    switch (result) {
        case RequestResult::STORE:
            return Fields::RESULT_STORE;
        case RequestResult::CANCEL:
            return Fields::RESULT_CANCEL;
        case RequestResult::NONE:
            break;
    }
    return {};
}

template <typename T>
void putBig(uint8_t*& cursor, T value) {
    value = boost::endian::native_to_big(value);
    std::memcpy(cursor, &value, sizeof(T));
    cursor += sizeof(T);
}

template <typename T>
T getBig(const uint8_t*& cursor) {
    T value{};
    std::memcpy(&value, cursor, sizeof(T));
    cursor += sizeof(T);
    return boost::endian::big_to_native(value);
}

absl::Status invalidRequest(std::string_view what) {
    LOG(WARNING) << "Rejecting request: " << what;
    return makeError(ErrorKind::InvalidRequest, what);
}

absl::Status malformedResponse(std::string_view what) {
    LOG(ERROR) << "Malformed response: " << what;
    return makeError(ErrorKind::TransportError,
                     fmt::format("Malformed response: {}", what));
}

}  // namespace

std::string storeTopic(const std::string_view serviceId) {
    if (serviceId.empty()) {
        return fmt::format("{}/{}", Topics::SERVICE_TYPE, Topics::FILE_STORE);
    }
    return fmt::format("{}/{}/{}", Topics::SERVICE_TYPE, serviceId,
                       Topics::FILE_STORE);
}

std::optional<Json::Value> parseAndCheck(
    const std::string_view text, const std::initializer_list<const char*> nodes) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    if (!reader->parse(text.data(), text.data() + text.size(), &root,
                       &errors)) {
        LOG(WARNING) << "Failed to parse json: " << errors;
        return std::nullopt;
    }
    if (!root.isObject()) {
        LOG(WARNING) << "Expected an object in json";
        return std::nullopt;
    }
    for (const auto& node : nodes) {
        if (!root.isMember(node)) {
            LOG(WARNING) << fmt::format("Missing node '{}' in json", node);
            return std::nullopt;
        }
    }
    return root;
}

std::string writeJson(const Json::Value& value, const bool styled) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = styled ? "    " : "";
    return Json::writeString(builder, value);
}

Json::Value toJson(const TransferResult& result) {
    Json::Value root;
    root[Fields::FILE_ID] = result.file_id;
    root[Fields::HASHES][Fields::SHA256] = result.sha256;
    root[Fields::SIZE] = Json::UInt64{result.size};
    return root;
}

Message encodeRequest(const FileTransferRequest& request, std::string topic) {
    Json::Value meta;
    meta[Fields::FILE_ID] = request.transfer_id;
    meta[Fields::FILE_NAME] = request.destination_path;
    meta[Fields::SEGMENT_INDEX] = Json::UInt{request.segment_index};
    meta[Fields::SEGMENT_COUNT] = Json::UInt{request.segment_count};
    meta[Fields::TOTAL_SIZE] = Json::UInt64{request.total_size};
    if (request.result != RequestResult::NONE) {
        meta[Fields::RESULT] = std::string(toString(request.result));
    }
    if (!request.sha256.empty()) {
        meta[Fields::HASHES][Fields::SHA256] = request.sha256;
    }

    Message message;
    message.type = MessageType::REQUEST;
    message.topic = std::move(topic);
    message.metadata = writeJson(meta);
    message.payload = request.payload;
    return message;
}

absl::StatusOr<FileTransferRequest> decodeRequest(const Message& message) {
    if (message.type != MessageType::REQUEST) {
        return invalidRequest(
            fmt::format("Expected a request, got {}", message.type));
    }
    auto _root = parseAndCheck(message.metadata, {Fields::FILE_ID});
    if (!_root) {
        return invalidRequest("Invalid request metadata");
    }
    const auto& root = _root.value();
    FileTransferRequest request;

    if (!root[Fields::FILE_ID].isString()) {
        return invalidRequest("file_id must be a string");
    }
    request.transfer_id = root[Fields::FILE_ID].asString();

    if (root.isMember(Fields::RESULT)) {
        if (!root[Fields::RESULT].isString()) {
            return invalidRequest("result must be a string");
        }
        const auto result = root[Fields::RESULT].asString();
        if (result == Fields::RESULT_STORE) {
            request.result = RequestResult::STORE;
        } else if (result == Fields::RESULT_CANCEL) {
            request.result = RequestResult::CANCEL;
        } else {
            return invalidRequest(
                fmt::format("Unexpected result value: '{}'", result));
        }
    }
    if (root.isMember(Fields::FILE_NAME) && root[Fields::FILE_NAME].isString()) {
        request.destination_path = root[Fields::FILE_NAME].asString();
    }

    // Cancellation only needs the id
    if (request.result == RequestResult::CANCEL) {
        return request;
    }

    for (const char* node : {Fields::FILE_NAME, Fields::SEGMENT_INDEX,
                             Fields::SEGMENT_COUNT, Fields::TOTAL_SIZE}) {
        if (!root.isMember(node)) {
            return invalidRequest(fmt::format("Missing node '{}'", node));
        }
    }
    if (!root[Fields::FILE_NAME].isString() ||
        !root[Fields::SEGMENT_INDEX].isUInt() ||
        !root[Fields::SEGMENT_COUNT].isUInt() ||
        !root[Fields::TOTAL_SIZE].isUInt64()) {
        return invalidRequest("Request metadata has wrong types");
    }
    request.segment_index = root[Fields::SEGMENT_INDEX].asUInt();
    request.segment_count = root[Fields::SEGMENT_COUNT].asUInt();
    request.total_size = root[Fields::TOTAL_SIZE].asUInt64();

    if (root.isMember(Fields::HASHES)) {
        const auto& hashes = root[Fields::HASHES];
        if (!hashes.isObject() || !hashes[Fields::SHA256].isString()) {
            return invalidRequest("hashes.sha256 must be a string");
        }
        request.sha256 = hashes[Fields::SHA256].asString();
    }
    if (request.result == RequestResult::STORE && request.sha256.empty()) {
        return invalidRequest("File hash must be specified for store request");
    }
    request.payload = message.payload;
    return request;
}

Message encodeResponse(const SegmentResponse& response) {
    Json::Value meta;
    meta[Fields::FILE_ID] = response.file_id;
    meta[Fields::SEGMENTS_RECEIVED] = Json::UInt{response.segments_received};
    meta[Fields::TOTAL_SEGMENTS] = Json::UInt{response.total_segments};
    if (response.result) {
        meta[Fields::RESULT] = std::string(Fields::RESULT_STORE);
        meta[Fields::HASHES][Fields::SHA256] = response.result->sha256;
        meta[Fields::SIZE] = Json::UInt64{response.result->size};
    } else if (response.cancelled) {
        meta[Fields::RESULT] = std::string(Fields::RESULT_CANCEL);
    }

    Message message;
    message.type = MessageType::RESPONSE;
    message.metadata = writeJson(meta);
    return message;
}

Message encodeError(const absl::Status& status) {
    Json::Value meta;
    const auto kind = errorKindOf(status);
    meta[Fields::ERROR][Fields::KIND] =
        std::string(kind ? toString(*kind) : toString(ErrorKind::InvalidRequest));
    meta[Fields::ERROR][Fields::MESSAGE] = std::string(status.message());

    Message message;
    message.type = MessageType::ERROR_RESPONSE;
    message.metadata = writeJson(meta);
    return message;
}

absl::StatusOr<SegmentResponse> decodeResponse(const Message& message) {
    if (message.type == MessageType::ERROR_RESPONSE) {
        auto _root = parseAndCheck(message.metadata, {Fields::ERROR});
        if (!_root) {
            return malformedResponse("unreadable error response");
        }
        const auto& error = (*_root)[Fields::ERROR];
        if (!error.isObject() || !error[Fields::KIND].isString()) {
            return malformedResponse("error response without kind");
        }
        if (error.isMember(Fields::MESSAGE) &&
            !error[Fields::MESSAGE].isString()) {
            return malformedResponse("error message must be a string");
        }
        const auto kindName = error[Fields::KIND].asString();
        const auto text = error[Fields::MESSAGE].asString();
        const auto kind = errorKindFromString(kindName);
        if (!kind) {
            return makeError(ErrorKind::TransportError,
                             fmt::format("{}: {}", kindName, text));
        }
        return makeError(*kind, text);
    }
    if (message.type != MessageType::RESPONSE) {
        return malformedResponse(
            fmt::format("unexpected message type {}", message.type));
    }

    auto _root = parseAndCheck(message.metadata,
                               {Fields::FILE_ID, Fields::SEGMENTS_RECEIVED,
                                Fields::TOTAL_SEGMENTS});
    if (!_root) {
        return malformedResponse("missing acknowledgement fields");
    }
    const auto& root = _root.value();
    if (!root[Fields::FILE_ID].isString() ||
        !root[Fields::SEGMENTS_RECEIVED].isUInt() ||
        !root[Fields::TOTAL_SEGMENTS].isUInt()) {
        return malformedResponse("acknowledgement fields have wrong types");
    }

    SegmentResponse response;
    response.file_id = root[Fields::FILE_ID].asString();
    response.segments_received = root[Fields::SEGMENTS_RECEIVED].asUInt();
    response.total_segments = root[Fields::TOTAL_SEGMENTS].asUInt();

    if (root.isMember(Fields::RESULT)) {
        if (!root[Fields::RESULT].isString()) {
            return malformedResponse("result must be a string");
        }
        const auto result = root[Fields::RESULT].asString();
        if (result == Fields::RESULT_CANCEL) {
            response.cancelled = true;
        } else if (result == Fields::RESULT_STORE) {
            const auto& hashes = root[Fields::HASHES];
            if (!hashes.isObject() || !hashes[Fields::SHA256].isString() ||
                !root[Fields::SIZE].isUInt64()) {
                return malformedResponse("store result without hash or size");
            }
            response.result = TransferResult{
                .file_id = response.file_id,
                .sha256 = hashes[Fields::SHA256].asString(),
                .size = root[Fields::SIZE].asUInt64(),
            };
        } else {
            return malformedResponse(
                fmt::format("unexpected result '{}'", result));
        }
    }
    return response;
}

absl::StatusOr<std::vector<uint8_t>> serializeMessage(const Message& message) {
    if (message.topic.size() > Limits::MAX_TOPIC_SIZE) {
        return makeError(
            ErrorKind::TransportError,
            fmt::format("Topic of {} bytes exceeds the limit of {}",
                        message.topic.size(), Limits::MAX_TOPIC_SIZE));
    }
    if (message.metadata.size() > Limits::MAX_METADATA_SIZE) {
        return makeError(
            ErrorKind::TransportError,
            fmt::format("Metadata of {} bytes exceeds the limit of {}",
                        message.metadata.size(), Limits::MAX_METADATA_SIZE));
    }
    if (message.wireSize() > Limits::FABRIC_MAX_MESSAGE_SIZE) {
        return makeError(
            ErrorKind::TransportError,
            fmt::format("Message of {} bytes exceeds the fabric limit of {}",
                        message.wireSize(), Limits::FABRIC_MAX_MESSAGE_SIZE));
    }

    std::vector<uint8_t> frame(message.wireSize());
    uint8_t* cursor = frame.data();
    putBig<int64_t>(cursor, Protocol::MAGIC_VALUE);
    putBig<uint32_t>(cursor, static_cast<uint32_t>(message.type));
    putBig<uint32_t>(cursor, static_cast<uint32_t>(message.topic.size()));
    putBig<uint32_t>(cursor, static_cast<uint32_t>(message.metadata.size()));
    putBig<uint32_t>(cursor, static_cast<uint32_t>(message.payload.size()));

    std::memcpy(cursor, message.topic.data(), message.topic.size());
    cursor += message.topic.size();
    std::memcpy(cursor, message.metadata.data(), message.metadata.size());
    cursor += message.metadata.size();
    if (!message.payload.empty()) {
        std::memcpy(cursor, message.payload.data(), message.payload.size());
    }
    return frame;
}

absl::StatusOr<Message::Header> parseHeader(const uint8_t* data,
                                            const std::size_t length) {
    if (length < Message::Header::kWireSize) {
        return makeError(ErrorKind::TransportError, "Truncated frame header");
    }
    const uint8_t* cursor = data;
    Message::Header header;
    header.magic = getBig<int64_t>(cursor);
    const auto type = getBig<uint32_t>(cursor);
    header.topic_size = getBig<uint32_t>(cursor);
    header.meta_size = getBig<uint32_t>(cursor);
    header.payload_size = getBig<uint32_t>(cursor);

    if (header.magic != Protocol::MAGIC_VALUE) {
        const auto diff = header.magic - Protocol::MAGIC_VALUE_BASE;
        if (diff > 0 && diff < Protocol::DATA_VERSION) {
            LOG(INFO) << "This frame has protocol version " << diff
                      << ", but we have version " << Protocol::DATA_VERSION;
        }
        return makeError(ErrorKind::TransportError, "Invalid magic value");
    }
    if (type < static_cast<uint32_t>(MessageType::REQUEST) ||
        type > static_cast<uint32_t>(MessageType::ERROR_RESPONSE)) {
        return makeError(ErrorKind::TransportError,
                         fmt::format("Invalid message type {}", type));
    }
    header.type = static_cast<MessageType>(type);

    if (header.topic_size > Limits::MAX_TOPIC_SIZE ||
        header.meta_size > Limits::MAX_METADATA_SIZE ||
        header.bodySize() + Message::Header::kWireSize >
            Limits::FABRIC_MAX_MESSAGE_SIZE) {
        return makeError(ErrorKind::TransportError,
                         fmt::format("Frame of {} bytes exceeds the fabric limit",
                                     header.bodySize()));
    }
    return header;
}

absl::StatusOr<Message> parseBody(const Message::Header& header,
                                  const uint8_t* data,
                                  const std::size_t length) {
    if (length != header.bodySize()) {
        return makeError(ErrorKind::TransportError,
                         fmt::format("Frame body has {} bytes, expected {}",
                                     length, header.bodySize()));
    }
    Message message;
    message.type = header.type;
    const auto* cursor = reinterpret_cast<const char*>(data);
    message.topic.assign(cursor, header.topic_size);
    cursor += header.topic_size;
    message.metadata.assign(cursor, header.meta_size);
    cursor += header.meta_size;
    const auto* payload = reinterpret_cast<const uint8_t*>(cursor);
    message.payload.assign(payload, payload + header.payload_size);
    return message;
}

}  // namespace FileTransfer
