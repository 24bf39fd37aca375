#include "glog/logging.h"
#include "gtest/gtest.h"

#include "base/status.hpp"

namespace s3r {
namespace {

class TestStatus : public testing::Test {};

TEST_F(TestStatus, DefaultIsOk) {
  Status s;
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(s.code(), ErrorCode::kOk);
  EXPECT_EQ(s, Status::OK());
  EXPECT_EQ(s.DebugString(), "OK");
}

TEST_F(TestStatus, CarriesCodeAndMessage) {
  Status s = Status::TransportError("connection reset");
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.code(), ErrorCode::kTransportError);
  EXPECT_EQ(s.msg(), "connection reset");
  EXPECT_EQ(s.DebugString(), "TransportError: connection reset");
  VLOG(1) << s.DebugString();
}

TEST_F(TestStatus, CodeNames) {
  EXPECT_STREQ(ErrorCodeName(ErrorCode::kMalformedUri), "MalformedUri");
  EXPECT_STREQ(ErrorCodeName(ErrorCode::kNotFound), "NotFound");
  EXPECT_STREQ(ErrorCodeName(ErrorCode::kAccessDenied), "AccessDenied");
  EXPECT_STREQ(ErrorCodeName(ErrorCode::kInvalidSeek), "InvalidSeek");
  EXPECT_STREQ(ErrorCodeName(ErrorCode::kInvalidRange), "InvalidRange");
}

}  // namespace
}  // namespace s3r
