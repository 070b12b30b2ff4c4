#include <fmt/format.h>
#include <gtest/gtest.h>

#include <api/Errors.hpp>

using namespace FileTransfer;

TEST(ErrorsTest, MakeErrorCarriesKind) {
    const auto status = makeError(ErrorKind::SizeMismatch, "too short");
    EXPECT_EQ(status.code(), absl::StatusCode::kDataLoss);
    EXPECT_EQ(status.message(), "too short");
    EXPECT_EQ(errorKindOf(status), ErrorKind::SizeMismatch);
    EXPECT_EQ(causeKindOf(status), std::nullopt);
}

TEST(ErrorsTest, OkAndForeignStatusHaveNoKind) {
    EXPECT_EQ(errorKindOf(absl::OkStatus()), std::nullopt);
    EXPECT_EQ(errorKindOf(absl::InternalError("boom")), std::nullopt);
}

TEST(ErrorsTest, AbortedByKeepsCauseKind) {
    const auto aborted =
        abortedBy(makeError(ErrorKind::HashMismatch, "digest differs"));
    EXPECT_EQ(aborted.code(), absl::StatusCode::kAborted);
    EXPECT_EQ(errorKindOf(aborted), ErrorKind::TransferAborted);
    EXPECT_EQ(causeKindOf(aborted), ErrorKind::HashMismatch);
    EXPECT_EQ(aborted.message(), "HashMismatch: digest differs");
}

TEST(ErrorsTest, AbortedByDoesNotWrapTwice) {
    const auto once = abortedBy(makeError(ErrorKind::Cancelled, "stop"));
    const auto twice = abortedBy(once);
    EXPECT_EQ(once, twice);
    EXPECT_EQ(causeKindOf(twice), ErrorKind::Cancelled);
}

TEST(ErrorsTest, AbortedByForeignStatusUsesCodeName) {
    const auto aborted = abortedBy(absl::InternalError("boom"));
    EXPECT_EQ(errorKindOf(aborted), ErrorKind::TransferAborted);
    EXPECT_EQ(causeKindOf(aborted), std::nullopt);
    EXPECT_EQ(aborted.message(), "INTERNAL: boom");
}

TEST(ErrorsTest, KindNames) {
    for (const auto kind :
         {ErrorKind::InvalidConfiguration, ErrorKind::SourceReadError,
          ErrorKind::TransportError, ErrorKind::TransferAborted,
          ErrorKind::OutOfOrderSegment, ErrorKind::SizeMismatch,
          ErrorKind::HashMismatch, ErrorKind::StorageWriteError,
          ErrorKind::InvalidRequest, ErrorKind::Cancelled}) {
        EXPECT_EQ(errorKindFromString(toString(kind)), kind);
    }
    EXPECT_EQ(errorKindFromString("NoSuchKind"), std::nullopt);
    EXPECT_EQ(fmt::format("{}", ErrorKind::OutOfOrderSegment),
              "OutOfOrderSegment");
}
