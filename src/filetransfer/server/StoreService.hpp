#pragma once

#include <FileTransferExports.h>

#include <api/Message.hpp>
#include <server/FileStoreManager.hpp>
#include <string>
#include <string_view>

namespace FileTransfer::Server {

/**
 * @brief Binds a FileStoreManager to the file store topic.
 *
 * Turns request messages into reassembler calls and answers with either a
 * response or an error response carrying the error kind.
 */
class FileTransfer_API StoreService {
   public:
    /**
     * @param store Reassembler, must outlive the service.
     * @param service_id Optional instance id inserted into the topic.
     */
    explicit StoreService(FileStoreManager& store,
                          std::string_view service_id = {});

    // Handles one request message. Never fails, errors become messages.
    Message handle(const Message& message);

    [[nodiscard]] const std::string& topic() const { return topic_; }

   private:
    FileStoreManager& store_;
    std::string topic_;
};

}  // namespace FileTransfer::Server
