#include "ByteSource.hpp"

#include <LogCompat.hpp>
#include <api/Errors.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <system_error>
#include <utility>

namespace FileTransfer {

absl::StatusOr<std::unique_ptr<FileByteSource>> FileByteSource::create(
    const std::filesystem::path& path) {
    std::error_code errc;

    if (!std::filesystem::is_regular_file(path, errc)) {
        return makeError(ErrorKind::SourceReadError,
                         fmt::format("Not a readable regular file: {}",
                                     path.string()));
    }
    const auto file_size = std::filesystem::file_size(path, errc);
    if (errc) {
        return makeError(ErrorKind::SourceReadError,
                         fmt::format("Failed to get file size: {}: {}",
                                     path.string(), errc.message()));
    }
    return std::unique_ptr<FileByteSource>(
        new FileByteSource(path, file_size));
}

FileByteSource::FileByteSource(std::filesystem::path path, uint64_t size)
    : path_(std::move(path)), size_(size) {}

FileByteSource::~FileByteSource() { close(); }

absl::Status FileByteSource::open() {
    if (stream_.is_open()) {
        return absl::OkStatus();
    }
    stream_.open(path_, std::ios::in | std::ios::binary);
    if (!stream_.is_open()) {
        return makeError(ErrorKind::SourceReadError,
                         fmt::format("Failed to open file: {}", path_.string()));
    }
    DLOG(INFO) << "Opened " << path_ << " (" << size_ << " bytes)";
    return absl::OkStatus();
}

absl::StatusOr<std::size_t> FileByteSource::read(uint8_t* buffer,
                                                 const std::size_t length) {
    if (!stream_.is_open()) {
        return makeError(ErrorKind::SourceReadError,
                         fmt::format("File is not open: {}", path_.string()));
    }
    stream_.read(reinterpret_cast<char*>(buffer),
                 static_cast<std::streamsize>(length));
    if (stream_.bad()) {
        return makeError(ErrorKind::SourceReadError,
                         fmt::format("Failed to read from file: {}",
                                     path_.string()));
    }
    return static_cast<std::size_t>(stream_.gcount());
}

void FileByteSource::close() {
    if (stream_.is_open()) {
        stream_.close();
        DLOG(INFO) << "Closed " << path_;
    }
}

std::string FileByteSource::describe() const { return path_.string(); }

StreamByteSource::StreamByteSource(std::istream& stream, uint64_t size,
                                   std::string name)
    : stream_(stream), size_(size), name_(std::move(name)) {}

absl::Status StreamByteSource::open() {
    if (!stream_) {
        return makeError(ErrorKind::SourceReadError,
                         fmt::format("Stream {} is not readable", name_));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::size_t> StreamByteSource::read(uint8_t* buffer,
                                                   const std::size_t length) {
    const auto wanted =
        static_cast<std::size_t>(std::min<uint64_t>(length, size_ - consumed_));
    if (wanted == 0) {
        return std::size_t{0};
    }
    stream_.read(reinterpret_cast<char*>(buffer),
                 static_cast<std::streamsize>(wanted));
    if (stream_.bad()) {
        return makeError(ErrorKind::SourceReadError,
                         fmt::format("Failed to read from {}", name_));
    }
    const auto got = static_cast<std::size_t>(stream_.gcount());
    consumed_ += got;
    return got;
}

}  // namespace FileTransfer
