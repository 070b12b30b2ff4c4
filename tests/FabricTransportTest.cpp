#include <gtest/gtest.h>

#include <api/Errors.hpp>
#include <client/FileTransferClient.hpp>
#include <server/FabricServer.hpp>
#include <server/FileStoreManager.hpp>
#include <server/StoreService.hpp>
#include <transport/FabricTransport.hpp>

#include "TestHelpers.hpp"

using namespace FileTransfer;
using namespace std::chrono_literals;

class FabricTransportTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto store = Server::FileStoreManager::create(dir_.path() / "storage");
        ASSERT_TRUE(store.ok()) << store.status();
        store_ = std::move(store).value();
        service_ = std::make_unique<Server::StoreService>(*store_, "unit");
        server_ = std::make_unique<Server::FabricServer>(
            *service_, Server::FabricServer::Options{.address = "127.0.0.1",
                                                     .port = 0,
                                                     .io_threads = 2});
        ASSERT_TRUE(server_->start());
        ASSERT_NE(server_->port(), 0);
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
        }
    }

    [[nodiscard]] TcpChannel::Endpoint endpoint() const {
        return {.address = "127.0.0.1", .port = server_->port()};
    }

    static TcpChannel::Options shortTimeouts() {
        return {.connect_timeout = 2s, .io_timeout = 5s};
    }

    TempDir dir_;
    std::unique_ptr<Server::FileStoreManager> store_;
    std::unique_ptr<Server::StoreService> service_;
    std::unique_ptr<Server::FabricServer> server_;
};

TEST_F(FabricTransportTest, StoresFileOverTcp) {
    const auto bytes = makeBytes(300000, 7);
    const auto source = dir_.path() / "source.bin";
    writeFile(source, bytes);

    FabricTransport transport(endpoint(), "unit", shortTimeouts());
    FileTransferClient client(transport);
    const auto result = client.storeFile(source, "tcp/copy.bin", {}, 65536);
    ASSERT_TRUE(result.ok()) << result.status();

    EXPECT_EQ(result->size, bytes.size());
    EXPECT_EQ(result->sha256, sha256Hex(bytes));
    EXPECT_EQ(readFile(store_->storageDir() / "tcp/copy.bin"), bytes);
}

TEST_F(FabricTransportTest, ConnectionIsReusedAcrossTransfers) {
    FabricTransport transport(endpoint(), "unit", shortTimeouts());
    FileTransferClient client(transport);
    for (int i = 0; i < 3; ++i) {
        const auto source = dir_.path() / ("src" + std::to_string(i));
        writeFile(source, makeBytes(1000 + i, i));
        const auto result = client.storeFile(source, "");
        ASSERT_TRUE(result.ok()) << result.status();
    }
    EXPECT_TRUE(std::filesystem::exists(store_->storageDir() / "src2"));
}

TEST_F(FabricTransportTest, ServiceIdMismatchIsRejected) {
    const auto source = dir_.path() / "source.bin";
    writeFile(source, makeBytes(10));

    FabricTransport transport(endpoint(), "another", shortTimeouts());
    FileTransferClient client(transport);
    const auto result = client.storeFile(source, "x.bin");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(errorKindOf(result.status()), ErrorKind::TransferAborted);
    EXPECT_EQ(causeKindOf(result.status()), ErrorKind::InvalidRequest);
}

TEST_F(FabricTransportTest, UnreachableServerIsTransportError) {
    const auto port = server_->port();
    server_->stop();

    const auto source = dir_.path() / "source.bin";
    writeFile(source, makeBytes(10));

    FabricTransport transport({.address = "127.0.0.1", .port = port}, "unit",
                              shortTimeouts());
    FileTransferClient client(transport);
    const auto result = client.storeFile(source, "x.bin");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(causeKindOf(result.status()), ErrorKind::TransportError);
    EXPECT_FALSE(std::filesystem::exists(store_->storageDir() / "x.bin"));
}

TEST_F(FabricTransportTest, StopClosesOpenConnections) {
    const auto first = dir_.path() / "first.bin";
    const auto second = dir_.path() / "second.bin";
    writeFile(first, makeBytes(100, 1));
    writeFile(second, makeBytes(100, 2));

    FabricTransport transport(endpoint(), "unit", shortTimeouts());
    FileTransferClient client(transport);
    ASSERT_TRUE(client.storeFile(first, "").ok());

    // Would block on the idle connection if it stayed open
    server_->stop();
    EXPECT_FALSE(server_->running());

    const auto result = client.storeFile(second, "");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(causeKindOf(result.status()), ErrorKind::TransportError);
}
