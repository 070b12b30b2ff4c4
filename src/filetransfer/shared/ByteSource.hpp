#pragma once

#include <FileTransferExports.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <string>

namespace FileTransfer {

/**
 * @brief A readable, sized stream of bytes to be transferred.
 *
 * The size is known before open() so a session can compute its segment
 * count eagerly. The handle is only held between open() and close().
 */
struct FileTransfer_API ByteSource {
    virtual ~ByteSource() = default;

    /**
     * @brief Acquires the underlying handle.
     *
     * @return SourceReadError if the source cannot be opened.
     */
    virtual absl::Status open() = 0;

    /**
     * @brief Reads up to `length` bytes.
     *
     * @param buffer Destination, at least `length` bytes.
     * @param length Maximum number of bytes to read.
     * @return Number of bytes read, 0 at end of source, or SourceReadError.
     */
    virtual absl::StatusOr<std::size_t> read(uint8_t* buffer,
                                             std::size_t length) = 0;

    // Releases the handle. Safe to call when not open.
    virtual void close() = 0;

    [[nodiscard]] virtual uint64_t size() const = 0;

    // Human readable name used in logs.
    [[nodiscard]] virtual std::string describe() const = 0;
};

// A regular file on the local filesystem.
class FileTransfer_API FileByteSource : public ByteSource {
   public:
    /**
     * @brief Stats the file without opening it.
     *
     * @return SourceReadError if the path is missing or not a regular file.
     */
    static absl::StatusOr<std::unique_ptr<FileByteSource>> create(
        const std::filesystem::path& path);

    ~FileByteSource() override;

    absl::Status open() override;
    absl::StatusOr<std::size_t> read(uint8_t* buffer,
                                     std::size_t length) override;
    void close() override;
    [[nodiscard]] uint64_t size() const override { return size_; }
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] bool isOpen() const { return stream_.is_open(); }

   private:
    FileByteSource(std::filesystem::path path, uint64_t size);

    std::filesystem::path path_;
    uint64_t size_;
    std::ifstream stream_;
};

/**
 * @brief An already opened stream with a caller-declared size.
 *
 * The stream is borrowed and must outlive the source. Exactly `size` bytes
 * are consumed; a stream that ends earlier is a read error.
 */
class FileTransfer_API StreamByteSource : public ByteSource {
   public:
    StreamByteSource(std::istream& stream, uint64_t size,
                     std::string name = "stream");

    absl::Status open() override;
    absl::StatusOr<std::size_t> read(uint8_t* buffer,
                                     std::size_t length) override;
    void close() override {}
    [[nodiscard]] uint64_t size() const override { return size_; }
    [[nodiscard]] std::string describe() const override { return name_; }

   private:
    std::istream& stream_;
    uint64_t size_;
    uint64_t consumed_ = 0;
    std::string name_;
};

}  // namespace FileTransfer
