#pragma once

#include <FileTransferExports.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace FileTransfer {

/**
 * @brief Client side of a TCP connection with bounded waits.
 *
 * Asynchronous operations run on a private io thread; callers block on
 * them with a timeout. All methods return false or std::nullopt after
 * logging the failure.
 */
class FileTransfer_API TcpChannel {
   public:
    struct Endpoint {
        std::string address;
        uint16_t port = 0;
    };

    struct Options {
        std::chrono::milliseconds connect_timeout = std::chrono::seconds(10);
        // Zero disables the timeout
        std::chrono::milliseconds io_timeout = std::chrono::seconds(30);
    };

    explicit TcpChannel(Options options);
    ~TcpChannel();

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    bool connect(const Endpoint& endpoint);
    bool write(const uint8_t* data, std::size_t length);
    std::optional<std::vector<uint8_t>> read(std::size_t length);
    bool close();

    explicit operator bool() const { return socket_.is_open(); }

   private:
    Options options_;
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>>
        work_guard_;
    boost::asio::ip::tcp::socket socket_;
    std::thread io_thread_;
};

inline std::ostream& operator<<(std::ostream& os,
                                const TcpChannel::Endpoint& endpoint) {
    return os << endpoint.address << ":" << endpoint.port;
}

}  // namespace FileTransfer
