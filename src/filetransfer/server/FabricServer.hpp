#pragma once

#include <FileTransferExports.h>

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <server/StoreService.hpp>
#include <string>
#include <thread>
#include <vector>

namespace FileTransfer::Server {

/**
 * @brief TCP side of the fabric for one StoreService.
 *
 * Each connection reads frames in order and answers each one before reading
 * the next. Connections are served on a pool of io threads.
 */
class FileTransfer_API FabricServer {
   public:
    struct Options {
        std::string address = "0.0.0.0";
        // 0 picks a free port, see port()
        uint16_t port = 0;
        std::size_t io_threads = 4;
    };

    FabricServer(StoreService& service, Options options);
    ~FabricServer();

    FabricServer(const FabricServer&) = delete;
    FabricServer& operator=(const FabricServer&) = delete;

    /**
     * @brief Binds, listens and starts the io threads.
     *
     * @return false (logged) if the address cannot be bound.
     */
    bool start();

    // Stops accepting, closes open connections and joins the io threads.
    void stop();

    [[nodiscard]] bool running() const { return running_; }

    // Port actually bound, valid after start().
    [[nodiscard]] uint16_t port() const { return bound_port_; }

   private:
    class Connection;

    void doAccept();

    StoreService& service_;
    Options options_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    // Open connections, closed by stop(). Guards running_ transitions too.
    std::vector<std::weak_ptr<Connection>> connections_;
    std::mutex connections_mutex_;
    std::atomic_bool running_ = false;
    uint16_t bound_port_ = 0;
};

}  // namespace FileTransfer::Server
