#pragma once

#include <FileTransferExports.h>
#include <absl/status/statusor.h>

#include <string>
#include <string_view>

namespace FileTransfer {

/**
 * @brief Generates a random RFC 4122 version 4 UUID, lowercase.
 *
 * @return The id, or an error if the random source failed.
 */
FileTransfer_API absl::StatusOr<std::string> generateTransferId();

/**
 * @brief Checks whether a file id is safe to use as a directory name.
 *
 * Ids must be non-empty, bounded in length and free of path name separator
 * characters ('.', '/', '\').
 */
FileTransfer_API bool isValidTransferId(std::string_view id);

}  // namespace FileTransfer
