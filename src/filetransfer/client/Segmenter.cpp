#include "Segmenter.hpp"

#include <LogCompat.hpp>
#include <api/Errors.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <limits>
#include <utility>

namespace FileTransfer {

absl::StatusOr<uint32_t> Segmenter::segmentCount(
    const uint64_t total, const std::size_t max_segment_size) {
    if (max_segment_size == 0) {
        return makeError(ErrorKind::InvalidConfiguration,
                         "Segment size must be greater than zero");
    }
    if (total == 0) {
        return 1U;
    }
    const uint64_t count = (total - 1) / max_segment_size + 1;
    if (count > std::numeric_limits<uint32_t>::max()) {
        return makeError(
            ErrorKind::InvalidConfiguration,
            fmt::format("{} bytes need {} segments of {} bytes, too many",
                        total, count, max_segment_size));
    }
    return static_cast<uint32_t>(count);
}

absl::StatusOr<Segmenter> Segmenter::create(
    ByteSource& source, const std::size_t max_segment_size) {
    auto count = segmentCount(source.size(), max_segment_size);
    if (!count.ok()) {
        return count.status();
    }
    return Segmenter(source, max_segment_size, *count);
}

Segmenter::Segmenter(ByteSource& source, std::size_t max_segment_size,
                     uint32_t count)
    : source_(&source), max_segment_size_(max_segment_size), count_(count) {}

absl::StatusOr<std::optional<Segment>> Segmenter::next() {
    if (done()) {
        return std::optional<Segment>();
    }
    const uint64_t remaining = source_->size() - bytes_read_;
    const auto expected = static_cast<std::size_t>(
        std::min<uint64_t>(remaining, max_segment_size_));

    Segment segment{.index = next_index_, .count = count_, .data = {}};
    segment.data.resize(expected);

    std::size_t filled = 0;
    while (filled < expected) {
        auto got = source_->read(segment.data.data() + filled,
                                 expected - filled);
        if (!got.ok()) {
            return got.status();
        }
        if (*got == 0) {
            LOG(ERROR) << "Source " << source_->describe() << " ended at byte "
                       << bytes_read_ + filled << " of " << source_->size();
            return makeError(
                ErrorKind::SourceReadError,
                fmt::format("{} ended after {} of {} bytes",
                            source_->describe(), bytes_read_ + filled,
                            source_->size()));
        }
        filled += *got;
    }

    bytes_read_ += filled;
    ++next_index_;
    DLOG(INFO) << "Segment " << segment.index << "/" << count_ << ": "
               << filled << " bytes";
    return std::make_optional(std::move(segment));
}

}  // namespace FileTransfer
