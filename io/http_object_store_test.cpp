#include "glog/logging.h"
#include "gtest/gtest.h"

#include "io/http_object_store.hpp"

#include "core/executor/executor.hpp"

#include <string>

namespace s3r {
namespace {

class TestHttpObjectStore : public testing::Test {};

TEST_F(TestHttpObjectStore, EscapeKey) {
  EXPECT_EQ(EscapeKey("path/to/file.xls"), "path/to/file.xls");
  EXPECT_EQ(EscapeKey("a b+c"), "a%20b%2Bc");
  EXPECT_EQ(EscapeKey("x%y~z_-"), "x%25y~z_-");
  EXPECT_EQ(EscapeKey("\xc3\xa9"), "%C3%A9");
  EXPECT_EQ(EscapeKey("/a//b c/"), "/a//b%20c/");
}

TEST_F(TestHttpObjectStore, BuildObjectUrl) {
  ObjectUri uri("mybucket", "path/to/my file");
  EXPECT_EQ(BuildObjectUrl("https://s3.amazonaws.com", uri),
            "https://s3.amazonaws.com/mybucket/path/to/my%20file");
  EXPECT_EQ(BuildObjectUrl("http://localhost:9000//", uri),
            "http://localhost:9000/mybucket/path/to/my%20file");
}

TEST_F(TestHttpObjectStore, BuildRangeHeader) {
  EXPECT_EQ(BuildRangeHeader(0, 1), "Range: bytes=0-0");
  EXPECT_EQ(BuildRangeHeader(10, 110), "Range: bytes=10-109");
  EXPECT_EQ(BuildRangeHeader(4294967296ULL, 4294967306ULL),
            "Range: bytes=4294967296-4294967305");
}

TEST_F(TestHttpObjectStore, HttpStatusToStatus) {
  EXPECT_TRUE(HttpStatusToStatus(200, "GET").ok());
  EXPECT_TRUE(HttpStatusToStatus(206, "GET").ok());
  EXPECT_EQ(HttpStatusToStatus(404, "HEAD").code(), ErrorCode::kNotFound);
  EXPECT_EQ(HttpStatusToStatus(403, "HEAD").code(), ErrorCode::kAccessDenied);
  EXPECT_EQ(HttpStatusToStatus(401, "HEAD").code(), ErrorCode::kAccessDenied);
  EXPECT_EQ(HttpStatusToStatus(416, "GET").code(), ErrorCode::kTransportError);
  Status s = HttpStatusToStatus(503, "GET http://x/b/k");
  EXPECT_EQ(s.code(), ErrorCode::kTransportError);
  EXPECT_EQ(s.msg(), "GET http://x/b/k: HTTP 503");
}

size_t FeedHeader(const std::string& line, ResponseHeaders* headers) {
  std::string copy = line;
  return ParseResponseHeader(&copy[0], 1, copy.size(), headers);
}

size_t FeedBody(const std::string& chunk, BodySink* sink) {
  std::string copy = chunk;
  return WriteBody(&copy[0], 1, copy.size(), sink);
}

TEST_F(TestHttpObjectStore, ParseResponseHeader) {
  ResponseHeaders headers;
  EXPECT_EQ(FeedHeader("HTTP/1.1 200 OK\r\n", &headers), 17);
  EXPECT_EQ(headers.http_code, 200);
  FeedHeader("Content-Length: 1000\r\n", &headers);
  FeedHeader("ETag:   \"abc123\" \r\n", &headers);
  FeedHeader("last-MODIFIED: Wed, 21 Oct 2015 07:28:00 GMT\r\n", &headers);
  FeedHeader("\r\n", &headers);
  EXPECT_EQ(headers.meta.etag, "\"abc123\"");
  EXPECT_EQ(headers.meta.last_modified, "Wed, 21 Oct 2015 07:28:00 GMT");

  FeedHeader("etag:\t\"v2\"\t\r\n", &headers);
  EXPECT_EQ(headers.meta.etag, "\"v2\"");
}

TEST_F(TestHttpObjectStore, NewStatusLineStartsOver) {
  ResponseHeaders headers;
  FeedHeader("HTTP/1.1 301 Moved Permanently\r\n", &headers);
  FeedHeader("ETag: \"old\"\r\n", &headers);
  EXPECT_EQ(headers.http_code, 301);
  FeedHeader("HTTP/2 206\r\n", &headers);
  EXPECT_EQ(headers.http_code, 206);
  EXPECT_TRUE(headers.meta.etag.empty());
}

TEST_F(TestHttpObjectStore, WriteBodyWithinLimit) {
  ResponseHeaders headers;
  FeedHeader("HTTP/1.1 206 Partial Content\r\n", &headers);
  BodySink sink;
  sink.headers = &headers;
  sink.limit = 10;
  EXPECT_EQ(FeedBody("hello", &sink), 5);
  EXPECT_EQ(FeedBody("world", &sink), 5);
  EXPECT_EQ(sink.data, "helloworld");
}

TEST_F(TestHttpObjectStore, WriteBodyAbortsOversizedBody) {
  ResponseHeaders headers;
  FeedHeader("HTTP/1.1 200 OK\r\n", &headers);
  BodySink sink;
  sink.headers = &headers;
  sink.limit = 8;
  EXPECT_EQ(FeedBody("12345", &sink), 5);
  // A non-matching count makes libcurl fail the transfer with
  // CURLE_WRITE_ERROR, which Perform reports as kTransportError.
  EXPECT_EQ(FeedBody("6789", &sink), 0);
  EXPECT_EQ(sink.data, "12345");
}

TEST_F(TestHttpObjectStore, WriteBodyDiscardsErrorDocument) {
  ResponseHeaders headers;
  FeedHeader("HTTP/1.1 403 Forbidden\r\n", &headers);
  BodySink sink;
  sink.headers = &headers;
  sink.limit = 1;
  const std::string doc = "<Error><Code>AccessDenied</Code></Error>";
  EXPECT_EQ(FeedBody(doc, &sink), doc.size());
  EXPECT_TRUE(sink.data.empty());
  EXPECT_EQ(HttpStatusToStatus(headers.http_code, "GET").code(), ErrorCode::kAccessDenied);
}

TEST_F(TestHttpObjectStore, ContentLengthToSize) {
  uint64_t size = 7;
  Status s = ContentLengthToSize(-1, "HEAD http://x/b/k", &size);
  EXPECT_EQ(s.code(), ErrorCode::kTransportError);
  EXPECT_EQ(s.msg(), "HEAD http://x/b/k: missing Content-Length");
  EXPECT_EQ(size, 7);
  ASSERT_TRUE(ContentLengthToSize(0, "HEAD", &size).ok());
  EXPECT_EQ(size, 0);
  ASSERT_TRUE(ContentLengthToSize(5368709120LL, "HEAD", &size).ok());
  EXPECT_EQ(size, 5368709120ULL);
}

TEST_F(TestHttpObjectStore, UnreachableEndpointIsTransportError) {
  HttpStoreConfig config;
  // Nothing listens on port 1.
  config.endpoint = "http://127.0.0.1:1";
  config.connect_timeout_ms = 2000;
  config.timeout_ms = 5000;
  auto executor = std::make_shared<Executor>(2);
  HttpObjectStore store(config, executor);
  ObjectUri uri("bucket", "key");

  HeadResponse head = store.HeadObject(uri).get();
  EXPECT_EQ(head.status.code(), ErrorCode::kTransportError);
  RangeResponse range = store.GetObjectRange(uri, 0, 10).get();
  EXPECT_EQ(range.status.code(), ErrorCode::kTransportError);
  EXPECT_FALSE(range.body);
  // The shared caches stay usable after failed transfers.
  RangeResponse again = store.GetObjectRange(uri, 0, 10).get();
  EXPECT_EQ(again.status.code(), ErrorCode::kTransportError);
}

}  // namespace
}  // namespace s3r
