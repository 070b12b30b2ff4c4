#pragma once

#include <FileTransferExports.h>
#include <absl/status/statusor.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared/ByteSource.hpp>
#include <vector>

namespace FileTransfer {

struct Segment {
    uint32_t index = 0;
    uint32_t count = 0;
    std::vector<uint8_t> data;

    [[nodiscard]] bool isLast() const { return index + 1 == count; }
};

/**
 * @brief Splits an open byte source into ordered, size-bounded segments.
 *
 * The sequence is lazy and can be walked only once. Every segment has
 * exactly max_segment_size bytes except the last one, and an empty source
 * yields a single empty segment.
 */
class FileTransfer_API Segmenter {
   public:
    /**
     * @brief Creates a segmenter over an already opened source.
     *
     * @param source Borrowed, must outlive the segmenter.
     * @param max_segment_size Upper bound of a segment payload.
     * @return InvalidConfiguration if the size is 0 or the segment count
     * overflows a 32-bit index.
     */
    static absl::StatusOr<Segmenter> create(ByteSource& source,
                                            std::size_t max_segment_size);

    /**
     * @brief Number of segments needed for total bytes.
     *
     * @return ceil(total / max_segment_size), 1 when total is 0, or
     * InvalidConfiguration.
     */
    static absl::StatusOr<uint32_t> segmentCount(uint64_t total,
                                                 std::size_t max_segment_size);

    /**
     * @brief Reads the next segment.
     *
     * @return The segment, std::nullopt once the sequence is exhausted, or
     * SourceReadError if the source fails or ends early.
     */
    absl::StatusOr<std::optional<Segment>> next();

    [[nodiscard]] bool done() const { return next_index_ == count_; }
    [[nodiscard]] uint32_t segmentCount() const { return count_; }
    [[nodiscard]] uint64_t bytesRead() const { return bytes_read_; }

   private:
    Segmenter(ByteSource& source, std::size_t max_segment_size,
              uint32_t count);

    ByteSource* source_;
    std::size_t max_segment_size_;
    uint32_t count_;
    uint32_t next_index_ = 0;
    uint64_t bytes_read_ = 0;
};

}  // namespace FileTransfer
