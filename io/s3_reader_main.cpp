#include "io/s3_reader.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "io/http_object_store.hpp"

DEFINE_string(url, "", "The object to read, s3://bucket/key");
DEFINE_string(endpoint, "https://s3.amazonaws.com", "The S3 compatible endpoint");
DEFINE_uint64(offset, 0, "The first byte to read");
DEFINE_int64(length, -1, "The number of bytes to read, -1 to read to the end");
DEFINE_uint64(chunk_size, 4 << 20, "The size of each ranged request");
DEFINE_int32(num_threads, 2, "# threads issuing requests");
DEFINE_int32(connect_timeout_ms, 10000, "Connect timeout of each request");
DEFINE_int32(timeout_ms, 0, "Timeout of each request, 0 for none");
DEFINE_string(header, "", "Extra header sent with every request, e.g. a pre-signed Authorization");

using namespace s3r;

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  CHECK(!FLAGS_url.empty()) << "--url is required";
  CHECK_GT(FLAGS_chunk_size, 0);

  HttpStoreConfig config;
  config.endpoint = FLAGS_endpoint;
  config.num_threads = FLAGS_num_threads;
  config.connect_timeout_ms = FLAGS_connect_timeout_ms;
  config.timeout_ms = FLAGS_timeout_ms;
  if (!FLAGS_header.empty()) {
    config.headers.push_back(FLAGS_header);
  }
  auto store = std::make_shared<HttpObjectStore>(config);

  std::unique_ptr<S3Reader> reader;
  Status s = S3Reader::Open(FLAGS_url, store, &reader);
  if (!s.ok()) {
    LOG(ERROR) << "Failed to open " << FLAGS_url << ": " << s.DebugString();
    return 1;
  }
  LOG(INFO) << "Opened " << FLAGS_url << ", " << reader->GetMeta().DebugString();

  uint64_t pos;
  s = reader->Seek(SeekFrom::Start(FLAGS_offset), &pos);
  CHECK(s.ok()) << s.DebugString();
  uint64_t remaining = FLAGS_length < 0 ? reader->GetFileSize() - std::min(pos, reader->GetFileSize())
                                        : static_cast<uint64_t>(FLAGS_length);

  std::vector<char> buffer(FLAGS_chunk_size);
  uint64_t total = 0;
  while (remaining > 0) {
    size_t n;
    s = reader->Read(buffer.data(), std::min<uint64_t>(remaining, buffer.size()), &n);
    if (!s.ok()) {
      LOG(ERROR) << "Read failed at " << reader->GetPosition() << ": " << s.DebugString();
      return 1;
    }
    if (n == 0) {
      break;
    }
    CHECK_EQ(std::fwrite(buffer.data(), 1, n, stdout), n);
    remaining -= n;
    total += n;
  }
  std::fflush(stdout);
  LOG(INFO) << "Read " << total << " bytes from " << FLAGS_url << " starting at " << FLAGS_offset;
  return 0;
}
