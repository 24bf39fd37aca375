#include "glog/logging.h"
#include "gtest/gtest.h"

#include "io/object_uri.hpp"

#include <string>
#include <vector>

namespace s3r {
namespace {

class TestObjectUri : public testing::Test {};

TEST_F(TestObjectUri, ParseSimple) {
  ObjectUri uri;
  Status s = ObjectUri::Parse("s3://mybucket/file.bin", &uri);
  ASSERT_TRUE(s.ok()) << s.DebugString();
  EXPECT_EQ(uri.bucket(), "mybucket");
  EXPECT_EQ(uri.key(), "file.bin");
}

TEST_F(TestObjectUri, ParseNestedKey) {
  ObjectUri uri;
  Status s = ObjectUri::Parse("s3://mybucket/path/to/file.xls", &uri);
  ASSERT_TRUE(s.ok()) << s.DebugString();
  EXPECT_EQ(uri.bucket(), "mybucket");
  EXPECT_EQ(uri.key(), "path/to/file.xls");
  EXPECT_EQ(uri.ToString(), "s3://mybucket/path/to/file.xls");
}

TEST_F(TestObjectUri, KeyIsNotNormalized) {
  ObjectUri uri;
  ASSERT_TRUE(ObjectUri::Parse("s3://b//a%20b/./c/", &uri).ok());
  EXPECT_EQ(uri.bucket(), "b");
  EXPECT_EQ(uri.key(), "/a%20b/./c/");
}

TEST_F(TestObjectUri, RejectMalformed) {
  const std::vector<std::string> bad = {
    "",
    "s3:/",
    "s3://",
    "mybucket/key",
    "S3://mybucket/key",
    "gs://mybucket/key",
    "http://mybucket/key",
    "s3:/mybucket/key",
    "s3://mybucket",
    "s3://mybucket/",
    "s3:///key",
  };
  for (const auto& address : bad) {
    ObjectUri uri;
    Status s = ObjectUri::Parse(address, &uri);
    EXPECT_EQ(s.code(), ErrorCode::kMalformedUri) << "address: " << address;
  }
}

TEST_F(TestObjectUri, FailedParseLeavesOutput) {
  ObjectUri uri("keep", "me");
  EXPECT_FALSE(ObjectUri::Parse("s3://only-bucket", &uri).ok());
  EXPECT_EQ(uri, ObjectUri("keep", "me"));
}

}  // namespace
}  // namespace s3r
