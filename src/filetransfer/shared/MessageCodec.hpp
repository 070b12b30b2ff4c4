#pragma once

#include <FileTransferExports.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <json/value.h>

#include <api/Message.hpp>
#include <api/Types.hpp>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FileTransfer {

/**
 * @brief Builds the topic a store service listens on.
 *
 * @param serviceId Optional unique id of one service instance.
 * @return "<service type>[/<serviceId>]/file/store"
 */
FileTransfer_API std::string storeTopic(std::string_view serviceId = {});

/**
 * @brief Parses a JSON document and checks that it is an object containing
 * the given nodes.
 *
 * @return The parsed root, or std::nullopt (logged) on any failure.
 */
FileTransfer_API std::optional<Json::Value> parseAndCheck(
    std::string_view text, std::initializer_list<const char*> nodes);

// Compact JSON text, or indented if styled is set.
FileTransfer_API std::string writeJson(const Json::Value& value,
                                       bool styled = false);

FileTransfer_API Json::Value toJson(const TransferResult& result);

// Request <-> message. Decoding errors are InvalidRequest.
FileTransfer_API Message encodeRequest(const FileTransferRequest& request,
                                       std::string topic);
FileTransfer_API absl::StatusOr<FileTransferRequest> decodeRequest(
    const Message& message);

// Response <-> message. An error response decodes into its error status,
// anything malformed into TransportError.
FileTransfer_API Message encodeResponse(const SegmentResponse& response);
FileTransfer_API Message encodeError(const absl::Status& status);
FileTransfer_API absl::StatusOr<SegmentResponse> decodeResponse(
    const Message& message);

/**
 * @brief Serializes a message into one fabric frame.
 *
 * @return The frame, or TransportError if it exceeds the fabric limits.
 */
FileTransfer_API absl::StatusOr<std::vector<uint8_t>> serializeMessage(
    const Message& message);

/**
 * @brief Parses and validates a frame header.
 *
 * @param data At least Message::Header::kWireSize bytes.
 */
FileTransfer_API absl::StatusOr<Message::Header> parseHeader(
    const uint8_t* data, std::size_t length);

// Splits a frame body (everything after the header) into a message.
FileTransfer_API absl::StatusOr<Message> parseBody(
    const Message::Header& header, const uint8_t* data, std::size_t length);

}  // namespace FileTransfer
