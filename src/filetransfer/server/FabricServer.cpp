#include "FabricServer.hpp"

#include <LogCompat.hpp>
#include <api/Errors.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <memory>
#include <shared/MessageCodec.hpp>
#include <utility>

namespace FileTransfer::Server {

class FabricServer::Connection
    : public std::enable_shared_from_this<Connection> {
   public:
    Connection(boost::asio::ip::tcp::socket socket, StoreService& service)
        : socket_(std::move(socket)), service_(service) {
        boost::system::error_code ec;
        const auto remote = socket_.remote_endpoint(ec);
        if (!ec) {
            remote_ = fmt::format("{}:{}", remote.address().to_string(),
                                  remote.port());
        }
    }

    void start() {
        LOG(INFO) << "Handling new connection: Client address: " << remote_;
        readHeader();
    }

    // Closes the socket on its strand, pending handlers end with an error.
    void shutdown() {
        boost::asio::post(socket_.get_executor(),
                          [self = shared_from_this()] { self->closed({}); });
    }

   private:
    void readHeader() {
        boost::asio::async_read(
            socket_, boost::asio::buffer(header_),
            [self = shared_from_this()](boost::system::error_code ec,
                                        std::size_t /*length*/) {
                if (ec) {
                    self->closed(ec);
                    return;
                }
                auto header = parseHeader(self->header_.data(),
                                          self->header_.size());
                if (!header.ok()) {
                    // Cannot resync on a bad header
                    LOG(ERROR) << "Dropping " << self->remote_ << ": "
                               << header.status();
                    self->reply(encodeError(header.status()), false);
                    return;
                }
                self->readBody(*header);
            });
    }

    void readBody(const Message::Header& header) {
        body_.resize(header.bodySize());
        boost::asio::async_read(
            socket_, boost::asio::buffer(body_),
            [self = shared_from_this(), header](boost::system::error_code ec,
                                                std::size_t /*length*/) {
                if (ec) {
                    self->closed(ec);
                    return;
                }
                auto message =
                    parseBody(header, self->body_.data(), self->body_.size());
                if (!message.ok()) {
                    self->reply(encodeError(message.status()), false);
                    return;
                }
                self->reply(self->service_.handle(*message), true);
            });
    }

    void reply(const Message& answer, const bool keep_reading) {
        auto frame = serializeMessage(answer);
        if (!frame.ok()) {
            LOG(ERROR) << "Cannot encode answer: " << frame.status();
            frame = serializeMessage(encodeError(frame.status()));
            if (!frame.ok()) {
                closed({});
                return;
            }
        }
        out_ = std::move(frame).value();
        boost::asio::async_write(
            socket_, boost::asio::buffer(out_),
            [self = shared_from_this(), keep_reading](
                boost::system::error_code ec, std::size_t /*length*/) {
                if (ec || !keep_reading) {
                    self->closed(ec);
                    return;
                }
                self->readHeader();
            });
    }

    void closed(const boost::system::error_code& ec) {
        if (ec && ec != boost::asio::error::eof &&
            ec != boost::asio::error::operation_aborted) {
            LOG(WARNING) << "Connection " << remote_ << ": " << ec.message();
        } else {
            DLOG(INFO) << "Connection " << remote_ << " closed";
        }
        boost::system::error_code ignored;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both,
                         ignored);  // NOLINT
        socket_.close(ignored);     // NOLINT
    }

    boost::asio::ip::tcp::socket socket_;
    StoreService& service_;
    std::string remote_ = "unknown";
    std::array<uint8_t, Message::Header::kWireSize> header_{};
    std::vector<uint8_t> body_;
    std::vector<uint8_t> out_;
};

FabricServer::FabricServer(StoreService& service, Options options)
    : service_(service),
      options_(std::move(options)),
      acceptor_(boost::asio::make_strand(io_context_)) {}

FabricServer::~FabricServer() { stop(); }

bool FabricServer::start() {
    if (running_) {
        return true;
    }
    try {
        const boost::asio::ip::tcp::endpoint endpoint(
            boost::asio::ip::make_address(options_.address), options_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        bound_port_ = acceptor_.local_endpoint().port();
    } catch (const boost::system::system_error& e) {
        LOG(ERROR) << fmt::format("Cannot listen on {}:{}: {}",
                                  options_.address, options_.port, e.what());
        boost::system::error_code ec;
        acceptor_.close(ec);  // NOLINT
        return false;
    }

    {
        const std::lock_guard<std::mutex> lock(connections_mutex_);
        running_ = true;
    }
    io_context_.restart();
    doAccept();
    const auto count = std::max<std::size_t>(options_.io_threads, 1);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { io_context_.run(); });
    }
    LOG(INFO) << fmt::format("Fabric server listening on {}:{} with {} threads",
                             options_.address, bound_port_, count);
    return true;
}

void FabricServer::doAccept() {
    // Every connection gets its own strand so stop() can close it safely
    const boost::asio::any_io_executor strand =
        boost::asio::make_strand(io_context_);
    acceptor_.async_accept(
        strand, [this](boost::system::error_code ec,
                       boost::asio::ip::tcp::socket socket) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG(ERROR) << "Accept error: " << ec.message();
                }
            } else {
                auto connection =
                    std::make_shared<Connection>(std::move(socket), service_);
                const std::lock_guard<std::mutex> lock(connections_mutex_);
                if (!running_) {
                    return;
                }
                std::erase_if(connections_, [](const auto& weak) {
                    return weak.expired();
                });
                connections_.emplace_back(connection);
                connection->start();
            }
            if (running_ && acceptor_.is_open()) {
                doAccept();
            }
        });
}

void FabricServer::stop() {
    std::vector<std::shared_ptr<Connection>> open;
    {
        const std::lock_guard<std::mutex> lock(connections_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
        for (const auto& weak : connections_) {
            if (auto connection = weak.lock()) {
                open.emplace_back(std::move(connection));
            }
        }
        connections_.clear();
    }

    boost::asio::post(acceptor_.get_executor(), [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            LOG(WARNING) << "Cannot close acceptor: " << ec.message();
        }
    });
    for (const auto& connection : open) {
        connection->shutdown();
    }
    const auto closed = open.size();
    open.clear();

    // Returns once the closed sockets have drained their handlers
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    LOG(INFO) << "Fabric server stopped, closed " << closed << " connections";
}

}  // namespace FileTransfer::Server
