#include <gtest/gtest.h>
#include "rpc/status_mapping.h"

#include "common/errors.h"

using namespace Chronicle;

TEST(StatusMappingTest, LibraryErrorsMapToDistinctCodes) {
    EXPECT_EQ(StatusFromException(ConcurrencyError("taken")).error_code(),
              grpc::StatusCode::ABORTED);
    EXPECT_EQ(StatusFromException(SequenceExhausted("max")).error_code(),
              grpc::StatusCode::OUT_OF_RANGE);
    EXPECT_EQ(StatusFromException(InvalidPosition("-1")).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(StatusFromException(InvalidSectionId("x")).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(StatusFromException(UnknownTopic("t")).error_code(),
              grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(StatusFromException(StorageError("down")).error_code(),
              grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(StatusFromException(std::logic_error("bug")).error_code(),
              grpc::StatusCode::INTERNAL);
}

TEST(StatusMappingTest, StatusesRaiseMatchingExceptions) {
    EXPECT_NO_THROW(ThrowIfError(grpc::Status::OK, "Call"));
    EXPECT_THROW(ThrowIfError(grpc::Status(grpc::StatusCode::ABORTED, ""), "Call"),
                 ConcurrencyError);
    EXPECT_THROW(ThrowIfError(grpc::Status(grpc::StatusCode::OUT_OF_RANGE, ""), "Call"),
                 SequenceExhausted);
    EXPECT_THROW(ThrowIfError(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, ""), "Call"),
                 std::invalid_argument);
    EXPECT_THROW(ThrowIfError(grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, ""), "Call"),
                 StorageError);
    EXPECT_THROW(ThrowIfError(grpc::Status(grpc::StatusCode::UNAVAILABLE, ""), "Call"),
                 StorageError);
}

TEST(StatusMappingTest, MessageNamesTheCall) {
    try {
        ThrowIfError(grpc::Status(grpc::StatusCode::UNAVAILABLE, "connection refused"), "Increment");
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(std::string(e.what()), "Increment failed: connection refused");
    }
}
