#include "TcpChannel.hpp"

#include <LogCompat.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>
#include <future>
#include <string_view>

namespace FileTransfer {

namespace {

// Waits for an asio operation started with use_future. On timeout the
// socket is cancelled and the aborted operation is drained, so the caller's
// buffers stay valid until asio is done with them.
template <class T>
bool awaitOperation(std::future<T>& operation,
                    const std::chrono::milliseconds timeout,
                    boost::asio::ip::tcp::socket& socket,
                    const std::string_view what) {
    if (timeout == std::chrono::milliseconds::zero()) {
        operation.wait();
        return true;
    }
    const auto status = operation.wait_for(timeout);
    if (status == std::future_status::ready) {
        return true;
    }
    LOG(ERROR) << fmt::format("{} did not finish within {}", what, timeout);
    boost::system::error_code ignored;
    socket.cancel(ignored);
    operation.wait();
    return false;
}

}  // namespace

TcpChannel::TcpChannel(Options options)
    : options_(options), socket_(io_context_) {
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    io_thread_ = std::thread([this]() { io_context_.run(); });
}

TcpChannel::~TcpChannel() {
    if (operator bool()) {
        close();
    }
    work_guard_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

bool TcpChannel::connect(const Endpoint& endpoint) {
    boost::asio::ip::tcp::resolver resolver(io_context_);
    boost::asio::ip::tcp::resolver::results_type endpoints;
    try {
        endpoints =
            resolver.resolve(endpoint.address, std::to_string(endpoint.port));
    } catch (const boost::system::system_error& e) {
        LOG(ERROR) << "Cannot resolve " << endpoint << ": " << e.what();
        return false;
    }

    auto fut = boost::asio::async_connect(socket_, endpoints,
                                          boost::asio::use_future);
    DLOG(INFO) << fmt::format("Waiting up to {} to connect",
                              options_.connect_timeout);
    if (!awaitOperation(fut, options_.connect_timeout, socket_,
                        fmt::format("Connecting to {}", endpoint.address))) {
        close();
        return false;
    }
    try {
        fut.get();
    } catch (const boost::system::system_error& e) {
        LOG(ERROR) << "Failed to connect to " << endpoint << ": " << e.what();
        close();
        return false;
    }
    LOG(INFO) << "Connected to " << endpoint;
    return true;
}

bool TcpChannel::write(const uint8_t* data, const std::size_t length) {
    auto fut = boost::asio::async_write(
        socket_, boost::asio::buffer(data, length), boost::asio::use_future);
    if (!awaitOperation(fut, options_.io_timeout, socket_, "Write")) {
        return false;
    }
    try {
        return fut.get() == length;
    } catch (const boost::system::system_error& e) {
        LOG(ERROR) << "TcpChannel::write: " << e.what();
        return false;
    }
}

std::optional<std::vector<uint8_t>> TcpChannel::read(const std::size_t length) {
    std::vector<uint8_t> buf(length);
    auto fut = boost::asio::async_read(
        socket_, boost::asio::buffer(buf.data(), length),
        boost::asio::use_future);
    if (!awaitOperation(fut, options_.io_timeout, socket_, "Read")) {
        return std::nullopt;
    }
    try {
        buf.resize(fut.get());
    } catch (const boost::system::system_error& e) {
        LOG(ERROR) << "TcpChannel::read: " << e.what();
        return std::nullopt;
    }
    return buf;
}

bool TcpChannel::close() {
    boost::system::error_code ec;
    // Shutdown fails on a peer that already went away, closing still works
    socket_.shutdown(boost::asio::socket_base::shutdown_both, ec);
    if (socket_.close(ec)) {
        LOG(WARNING) << "Closing socket failed: " << ec.message();
        return false;
    }
    return true;
}

}  // namespace FileTransfer
