#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "CoreTypes.hpp"

namespace FileTransfer {

enum class MessageType : uint32_t {
    REQUEST = 1,
    RESPONSE = 2,
    ERROR_RESPONSE = 3,
};

/**
 * @brief A message as carried by the fabric
 *
 * Wire format:
 * 1. Header (24 bytes, big endian)
 * 2. Topic (topic_size bytes)
 * 3. JSON metadata (meta_size bytes)
 * 4. Raw payload (payload_size bytes)
 */
struct Message {
    struct Header {
        int64_t magic = Protocol::MAGIC_VALUE;
        MessageType type = MessageType::REQUEST;
        uint32_t topic_size = 0;
        uint32_t meta_size = 0;
        uint32_t payload_size = 0;

        static constexpr std::size_t kWireSize = 24;

        [[nodiscard]] std::size_t bodySize() const {
            return static_cast<std::size_t>(topic_size) + meta_size +
                   payload_size;
        }
    };

    MessageType type = MessageType::REQUEST;
    std::string topic;
    std::string metadata;
    std::vector<uint8_t> payload;

    [[nodiscard]] std::size_t wireSize() const {
        return Header::kWireSize + topic.size() + metadata.size() +
               payload.size();
    }
};

}  // namespace FileTransfer
