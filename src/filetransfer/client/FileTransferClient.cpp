#include "FileTransferClient.hpp"

#include <api/Errors.hpp>

#include <memory>
#include <shared/ByteSource.hpp>
#include <string>

namespace FileTransfer {

FileTransferClient::FileTransferClient(Transport& transport,
                                       TransferSession::Options defaults)
    : transport_(transport), defaults_(defaults) {}

TransferSession::Options FileTransferClient::optionsFor(
    const std::optional<std::size_t> max_segment_size) const {
    auto options = defaults_;
    if (max_segment_size) {
        options.max_segment_size = *max_segment_size;
    }
    return options;
}

absl::StatusOr<TransferResult> FileTransferClient::storeFile(
    const std::filesystem::path& source, std::string_view name_on_server,
    const TransferSession::ProgressCallback& progress,
    const std::optional<std::size_t> max_segment_size) {
    const std::string fallback = source.filename().string();
    if (name_on_server.empty()) {
        name_on_server = fallback;
    }
    auto session = TransferSession::begin(source, name_on_server, transport_,
                                          optionsFor(max_segment_size));
    if (!session.ok()) {
        return session.status();
    }
    return (*session)->send(progress);
}

absl::StatusOr<TransferResult> FileTransferClient::storeStream(
    std::istream& stream, const uint64_t size,
    const std::string_view name_on_server,
    const TransferSession::ProgressCallback& progress,
    const std::optional<std::size_t> max_segment_size) {
    auto session = TransferSession::begin(
        std::make_unique<StreamByteSource>(stream, size,
                                           std::string(name_on_server)),
        name_on_server, transport_, optionsFor(max_segment_size));
    if (!session.ok()) {
        return session.status();
    }
    return (*session)->send(progress);
}

}  // namespace FileTransfer
