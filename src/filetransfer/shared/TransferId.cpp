#include "TransferId.hpp"

#include <LogCompat.hpp>
#include <api/CoreTypes.hpp>
#include <api/Errors.hpp>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cstdint>

namespace FileTransfer {

absl::StatusOr<std::string> generateTransferId() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), bytes.size()) != 1) {
        const auto err = ERR_get_error();
        LOG(ERROR) << "RAND_bytes failed: " << ERR_error_string(err, nullptr);
        return absl::InternalError("Cannot generate transfer id");
    }
    // Version 4, variant 1
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return fmt::format(
        "{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
        "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6],
        bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12],
        bytes[13], bytes[14], bytes[15]);
}

bool isValidTransferId(const std::string_view id) {
    if (id.empty() || id.size() > Limits::MAX_FILE_ID_SIZE) {
        return false;
    }
    return std::ranges::none_of(
        id, [](const char c) { return c == '.' || c == '/' || c == '\\'; });
}

}  // namespace FileTransfer
