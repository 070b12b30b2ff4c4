#include <gtest/gtest.h>

#include <api/Errors.hpp>
#include <atomic>
#include <client/FileTransferClient.hpp>
#include <server/FileStoreManager.hpp>
#include <server/StoreService.hpp>
#include <shared/MessageCodec.hpp>
#include <sstream>
#include <thread>
#include <transport/LoopbackTransport.hpp>
#include <vector>

#include "TestHelpers.hpp"

using namespace FileTransfer;

// Fails one request, forwards everything else.
class FlakyTransport : public Transport {
   public:
    FlakyTransport(Transport& inner, int fail_at)
        : inner_(inner), fail_at_(fail_at) {}

    absl::StatusOr<SegmentResponse> request(
        const FileTransferRequest& request) override {
        if (calls_++ == fail_at_) {
            return makeError(ErrorKind::TransportError, "connection reset");
        }
        return inner_.request(request);
    }

   private:
    Transport& inner_;
    int fail_at_;
    std::atomic_int calls_ = 0;
};

class LoopbackTransferTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto store = Server::FileStoreManager::create(dir_.path() / "storage");
        ASSERT_TRUE(store.ok()) << store.status();
        store_ = std::move(store).value();
        service_ = std::make_unique<Server::StoreService>(*store_);
        transport_ = std::make_unique<LoopbackTransport>(*service_);
    }

    std::filesystem::path sourceFile(const std::vector<uint8_t>& bytes) {
        const auto path = dir_.path() / "source" / "payload.bin";
        writeFile(path, bytes);
        return path;
    }

    TempDir dir_;
    std::unique_ptr<Server::FileStoreManager> store_;
    std::unique_ptr<Server::StoreService> service_;
    std::unique_ptr<LoopbackTransport> transport_;
};

TEST_F(LoopbackTransferTest, StoresFileInThreeSegments) {
    const auto bytes = makeBytes(2500000);
    FileTransferClient client(*transport_);

    std::vector<int> progress;
    const auto result = client.storeFile(
        sourceFile(bytes), "nested/dir/copy.bin",
        [&progress](int percent) { progress.push_back(percent); }, 1000000);
    ASSERT_TRUE(result.ok()) << result.status();

    EXPECT_EQ(result->size, 2500000U);
    EXPECT_EQ(result->sha256, sha256Hex(bytes));
    EXPECT_EQ(progress, (std::vector<int>{40, 80, 100}));
    EXPECT_EQ(readFile(store_->storageDir() / "nested/dir/copy.bin"), bytes);
}

TEST_F(LoopbackTransferTest, StoresZeroByteFile) {
    FileTransferClient client(*transport_);
    std::vector<int> progress;
    const auto result = client.storeFile(
        sourceFile({}), "", [&progress](int percent) { progress.push_back(percent); });
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->size, 0U);
    EXPECT_EQ(progress, (std::vector<int>{100}));
    // Falls back to the source file name
    EXPECT_TRUE(std::filesystem::exists(store_->storageDir() / "payload.bin"));
}

TEST_F(LoopbackTransferTest, StoresFromStream) {
    const auto bytes = makeBytes(123456);
    std::istringstream stream(std::string(bytes.begin(), bytes.end()));
    FileTransferClient client(*transport_);

    const auto result = client.storeStream(stream, bytes.size(), "stream.bin");
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(readFile(store_->storageDir() / "stream.bin"), bytes);
}

TEST_F(LoopbackTransferTest, ExplicitZeroSegmentSizeIsRejected) {
    std::istringstream stream("12345");
    FileTransferClient client(*transport_);

    const auto result = client.storeStream(stream, 5, "x.bin", {}, 0);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(errorKindOf(result.status()), ErrorKind::InvalidConfiguration);
    EXPECT_EQ(store_->activeTransfers(), 0U);
    EXPECT_FALSE(std::filesystem::exists(store_->storageDir() / "x.bin"));
}

TEST_F(LoopbackTransferTest, FailureDiscardsPartialData) {
    FlakyTransport flaky(*transport_, 2);
    FileTransferClient client(flaky);

    const auto result =
        client.storeFile(sourceFile(makeBytes(5000)), "partial.bin", {}, 1000);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(errorKindOf(result.status()), ErrorKind::TransferAborted);
    EXPECT_EQ(causeKindOf(result.status()), ErrorKind::TransportError);

    EXPECT_EQ(store_->activeTransfers(), 0U);
    EXPECT_TRUE(std::filesystem::is_empty(store_->workingDir()));
    EXPECT_FALSE(std::filesystem::exists(store_->storageDir() / "partial.bin"));
}

TEST_F(LoopbackTransferTest, UnknownTopicIsRejected) {
    LoopbackTransport wrong(*service_, storeTopic("other-service"));
    FileTransferClient client(wrong);

    const auto result = client.storeFile(sourceFile(makeBytes(10)), "x.bin");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(causeKindOf(result.status()), ErrorKind::InvalidRequest);
}

TEST_F(LoopbackTransferTest, SegmentAboveFabricLimitIsRejected) {
    FileTransferClient client(*transport_);
    const auto result = client.storeFile(sourceFile(makeBytes(10)), "x.bin", {},
                                         Limits::FABRIC_MAX_MESSAGE_SIZE);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(errorKindOf(result.status()), ErrorKind::InvalidConfiguration);
}

TEST_F(LoopbackTransferTest, ConcurrentSessionsShareTransport) {
    constexpr int kSessions = 4;
    std::vector<std::vector<uint8_t>> contents;
    std::vector<std::filesystem::path> sources;
    for (int i = 0; i < kSessions; ++i) {
        contents.emplace_back(makeBytes(40000 + i * 17, i));
        sources.emplace_back(dir_.path() / "source" /
                             ("file" + std::to_string(i)));
        writeFile(sources.back(), contents.back());
    }

    FileTransferClient client(*transport_);
    std::vector<std::thread> threads;
    for (int i = 0; i < kSessions; ++i) {
        threads.emplace_back([&client, &sources, i] {
            const auto result = client.storeFile(
                sources[i], "out/file" + std::to_string(i), {}, 4096);
            EXPECT_TRUE(result.ok()) << result.status();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int i = 0; i < kSessions; ++i) {
        EXPECT_EQ(readFile(store_->storageDir() / "out" /
                           ("file" + std::to_string(i))),
                  contents[i]);
    }
}
