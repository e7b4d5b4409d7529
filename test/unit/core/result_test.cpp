#include <gtest/gtest.h>
#include "telemdb/core/config.h"
#include "telemdb/core/error.h"
#include "telemdb/core/result.h"
#include "telemdb/core/types.h"

#include <string>

namespace telemdb {
namespace core {
namespace {

Result<Duration> ParseRetention(int64_t hours) {
    if (hours <= 0) {
        return Result<Duration>(InvalidArgumentError("retention must be at least one hour"));
    }
    return Result<Duration>(hours * 3600LL * 1000);
}

TEST(ResultTest, HoldsValue) {
    auto result = ParseRetention(24);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 86400000);
}

TEST(ResultTest, HoldsErrorFromException) {
    auto result = ParseRetention(0);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "retention must be at least one hour");
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ResultTest, ErrorFactoryDefaultsToUnknownCode) {
    auto result = Result<StoreConfig>::error("Config root must be a JSON object");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::UNKNOWN);

    auto tagged = Result<StoreConfig>::error("bad snapshot", Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(tagged.error_code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ResultTest, TakeValueMovesConfigOut) {
    StoreConfig config;
    config.data_dir = "/var/lib/telemdb";
    Result<StoreConfig> result(config);

    StoreConfig taken = result.take_value();
    EXPECT_EQ(taken.data_dir, "/var/lib/telemdb");
}

TEST(ResultTest, MoveKeepsErrorAndCode) {
    Result<int> io{IOError("Write failed", "/tmp/timeseries.json.tmp")};
    Result<int> moved(std::move(io));
    ASSERT_FALSE(moved.ok());
    EXPECT_EQ(moved.error_code(), Error::Code::IO);
    EXPECT_EQ(moved.error(), "Write failed: /tmp/timeseries.json.tmp");

    Result<int> assigned(0);
    assigned = std::move(moved);
    EXPECT_EQ(assigned.error_code(), Error::Code::IO);
}

TEST(ResultTest, VoidResults) {
    Result<void> ok;
    EXPECT_TRUE(ok.ok());

    Result<void> not_found{NotFoundError("No such job: snapshot")};
    ASSERT_FALSE(not_found.ok());
    EXPECT_EQ(not_found.error(), "No such job: snapshot");
    EXPECT_EQ(not_found.error_code(), Error::Code::NOT_FOUND);

    // Forwarding keeps the code
    auto forwarded = Result<void>::error("Final snapshot failed: " + not_found.error(), not_found.error_code());
    EXPECT_EQ(forwarded.error_code(), Error::Code::NOT_FOUND);
}

TEST(ResultTest, VoidResultIsCopyable) {
    auto result = Result<void>::error("copy me", Error::Code::INTERNAL);
    Result<void> copy = result;
    EXPECT_FALSE(copy.ok());
    EXPECT_EQ(copy.error(), "copy me");
    EXPECT_EQ(copy.error_code(), Error::Code::INTERNAL);
}

TEST(ResultTest, AccessingErrorOfOkResultThrows) {
    Result<int> result(42);
    EXPECT_THROW(result.error(), std::runtime_error);
    EXPECT_THROW(result.error_code(), std::runtime_error);

    Result<void> void_result;
    EXPECT_THROW(void_result.error(), std::runtime_error);
    EXPECT_THROW(void_result.error_code(), std::runtime_error);
}

} // namespace
} // namespace core
} // namespace telemdb
