#pragma once

#include <gmock/gmock.h>

#include <shared/ByteSource.hpp>

class MockByteSource : public FileTransfer::ByteSource {
   public:
    MOCK_METHOD(absl::Status, open, (), (override));
    MOCK_METHOD(absl::StatusOr<std::size_t>, read,
                (uint8_t * buffer, std::size_t length), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(uint64_t, size, (), (const, override));
    MOCK_METHOD(std::string, describe, (), (const, override));
};
