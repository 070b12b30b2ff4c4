#pragma once

#include <filesystem>

/**
 * Initializes spdlog for the file transfer binaries and tests.
 * Installs a colored stderr sink as the default logger.
 *
 * @note Calling it more than once is a no-op.
 */
extern void FileTransfer_LogInit();

/**
 * Attaches a file sink to the default logger.
 *
 * @param path Log file to append to.
 * @return false if the file could not be opened.
 */
extern bool FileTransfer_AddLogFile(const std::filesystem::path& path);

// Deregister and cleanup spdlog
extern void FileTransfer_LogDeInit();
