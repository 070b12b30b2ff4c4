#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <json/json.h>

#include <api/CoreTypes.hpp>
#include <api/Errors.hpp>
#include <shared/MessageCodec.hpp>

#include "TestHelpers.hpp"

using namespace FileTransfer;

class MessageCodecTest : public ::testing::Test {
   protected:
    static FileTransferRequest finalRequest() {
        return FileTransferRequest{
            .transfer_id = "4f6b0c1e-2d7a-4c1b-9a51-0d0b8f1f2e3a",
            .destination_path = "dir/file.bin",
            .segment_index = 2,
            .segment_count = 3,
            .total_size = 2500000,
            .payload = makeBytes(500000),
            .result = RequestResult::STORE,
            .sha256 = std::string(64, 'a'),
        };
    }

    // Serializes and parses back one frame.
    static Message reframe(const Message& message) {
        auto frame = serializeMessage(message);
        EXPECT_TRUE(frame.ok()) << frame.status();
        auto header = parseHeader(frame->data(), frame->size());
        EXPECT_TRUE(header.ok()) << header.status();
        auto parsed =
            parseBody(*header, frame->data() + Message::Header::kWireSize,
                      frame->size() - Message::Header::kWireSize);
        EXPECT_TRUE(parsed.ok()) << parsed.status();
        return *parsed;
    }
};

TEST_F(MessageCodecTest, StoreTopic) {
    EXPECT_EQ(storeTopic(),
              "/opendxl-file-transfer/service/file-transfer/file/store");
    EXPECT_EQ(storeTopic("abc"),
              "/opendxl-file-transfer/service/file-transfer/abc/file/store");
}

TEST_F(MessageCodecTest, RequestMetadataUsesWireNames) {
    const auto message = encodeRequest(finalRequest(), storeTopic());
    const auto root = parseAndCheck(message.metadata, {"file_id"});
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ((*root)["file_name_on_server"].asString(), "dir/file.bin");
    EXPECT_EQ((*root)["segment_index"].asUInt(), 2U);
    EXPECT_EQ((*root)["segment_count"].asUInt(), 3U);
    EXPECT_EQ((*root)["total_size"].asUInt64(), 2500000U);
    EXPECT_EQ((*root)["result"].asString(), "store");
    EXPECT_EQ((*root)["hashes"]["sha256"].asString(), std::string(64, 'a'));
    EXPECT_EQ(message.payload.size(), 500000U);
}

TEST_F(MessageCodecTest, RequestSurvivesFraming) {
    const auto original = finalRequest();
    const auto decoded = decodeRequest(reframe(encodeRequest(original, "t")));
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    EXPECT_EQ(decoded->transfer_id, original.transfer_id);
    EXPECT_EQ(decoded->destination_path, original.destination_path);
    EXPECT_EQ(decoded->segment_index, original.segment_index);
    EXPECT_EQ(decoded->segment_count, original.segment_count);
    EXPECT_EQ(decoded->total_size, original.total_size);
    EXPECT_EQ(decoded->result, RequestResult::STORE);
    EXPECT_EQ(decoded->sha256, original.sha256);
    EXPECT_EQ(decoded->payload, original.payload);
    EXPECT_TRUE(decoded->isFinal());
}

TEST_F(MessageCodecTest, CancelNeedsOnlyId) {
    Message message;
    message.metadata = R"({"file_id": "abc", "result": "cancel"})";
    const auto decoded = decodeRequest(message);
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    EXPECT_EQ(decoded->result, RequestResult::CANCEL);
    EXPECT_EQ(decoded->transfer_id, "abc");
}

TEST_F(MessageCodecTest, MalformedRequestsAreInvalid) {
    Message message;
    for (const char* metadata : {
             "not json",
             "[1, 2]",
             R"({"file_name_on_server": "a"})",
             R"({"file_id": "a", "file_name_on_server": "b"})",
             R"({"file_id": "a", "file_name_on_server": "b",
                 "segment_index": -1, "segment_count": 1, "total_size": 0})",
             R"({"file_id": "a", "file_name_on_server": "b",
                 "segment_index": 0, "segment_count": 1, "total_size": 0,
                 "result": "store"})",
             R"({"file_id": "a", "result": "delete"})",
         }) {
        message.metadata = metadata;
        const auto decoded = decodeRequest(message);
        ASSERT_FALSE(decoded.ok()) << metadata;
        EXPECT_EQ(errorKindOf(decoded.status()), ErrorKind::InvalidRequest)
            << metadata;
    }
}

TEST_F(MessageCodecTest, FinalResponse) {
    const SegmentResponse response{
        .file_id = "id",
        .segments_received = 3,
        .total_segments = 3,
        .result = TransferResult{.file_id = "id",
                                 .sha256 = std::string(64, 'b'),
                                 .size = 42},
    };
    const auto decoded = decodeResponse(reframe(encodeResponse(response)));
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    EXPECT_EQ(decoded->segments_received, 3U);
    EXPECT_EQ(decoded->total_segments, 3U);
    ASSERT_TRUE(decoded->result.has_value());
    EXPECT_EQ(*decoded->result, *response.result);
    EXPECT_FALSE(decoded->cancelled);
}

TEST_F(MessageCodecTest, ErrorResponseKeepsKind) {
    const auto decoded = decodeResponse(reframe(
        encodeError(makeError(ErrorKind::OutOfOrderSegment, "expected 1"))));
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(errorKindOf(decoded.status()), ErrorKind::OutOfOrderSegment);
    EXPECT_EQ(decoded.status().message(), "expected 1");
}

TEST_F(MessageCodecTest, MalformedResponseIsTransportError) {
    Message message;
    message.type = MessageType::RESPONSE;
    for (const char* metadata : {
             R"({"file_id": "a"})",
             R"({"file_id": "a", "segments_received": 1, "total_segments": 1,)"
             R"( "result": {}})",
             R"({"file_id": "a", "segments_received": 1, "total_segments": 1,)"
             R"( "result": ["store"]})",
         }) {
        message.metadata = metadata;
        const auto decoded = decodeResponse(message);
        ASSERT_FALSE(decoded.ok()) << metadata;
        EXPECT_EQ(errorKindOf(decoded.status()), ErrorKind::TransportError)
            << metadata;
    }

    message.type = MessageType::ERROR_RESPONSE;
    message.metadata =
        R"({"error": {"kind": "SizeMismatch", "message": {"x": 1}}})";
    const auto error = decodeResponse(message);
    ASSERT_FALSE(error.ok());
    EXPECT_EQ(errorKindOf(error.status()), ErrorKind::TransportError);
}

TEST_F(MessageCodecTest, OversizedMessageIsRejected) {
    auto request = finalRequest();
    request.payload = makeBytes(Limits::FABRIC_MAX_MESSAGE_SIZE);
    const auto frame = serializeMessage(encodeRequest(request, storeTopic()));
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(errorKindOf(frame.status()), ErrorKind::TransportError);

    request.payload = makeBytes(Limits::MAX_SEGMENT_SIZE);
    EXPECT_TRUE(serializeMessage(encodeRequest(request, storeTopic())).ok());

    request.payload.clear();
    request.destination_path = std::string(Limits::MAX_METADATA_SIZE, 'a');
    const auto metadata =
        serializeMessage(encodeRequest(request, storeTopic()));
    ASSERT_FALSE(metadata.ok());
    EXPECT_THAT(std::string(metadata.status().message()),
                testing::HasSubstr("Metadata"));
}

TEST_F(MessageCodecTest, BadHeaders) {
    auto frame = serializeMessage(encodeRequest(finalRequest(), "topic"));
    ASSERT_TRUE(frame.ok());

    // Truncated
    EXPECT_FALSE(parseHeader(frame->data(), 10).ok());

    // Wrong magic
    auto corrupted = *frame;
    corrupted[7] ^= 0xFF;
    const auto magic = parseHeader(corrupted.data(), corrupted.size());
    ASSERT_FALSE(magic.ok());
    EXPECT_EQ(errorKindOf(magic.status()), ErrorKind::TransportError);

    // Unknown message type
    corrupted = *frame;
    corrupted[11] = 9;
    EXPECT_FALSE(parseHeader(corrupted.data(), corrupted.size()).ok());

    // Payload size above the fabric limit
    corrupted = *frame;
    corrupted[20] = 0x7F;
    EXPECT_FALSE(parseHeader(corrupted.data(), corrupted.size()).ok());
}
