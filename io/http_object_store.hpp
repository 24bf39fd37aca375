#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "core/executor/abstract_executor.hpp"
#include "io/abstract_object_store.hpp"

namespace s3r {

struct HttpStoreConfig {
  // Scheme, host and optional port of an S3 compatible endpoint.
  std::string endpoint = "https://s3.amazonaws.com";
  int num_threads = 4;
  long connect_timeout_ms = 10000;
  // 0 disables the per request timeout.
  long timeout_ms = 0;
  // Sent verbatim with every request, e.g. "Authorization: ...".
  std::vector<std::string> headers;

  std::string DebugString() const {
    std::stringstream ss;
    ss << "endpoint: " << endpoint;
    ss << ", num_threads: " << num_threads;
    ss << ", connect_timeout_ms: " << connect_timeout_ms;
    ss << ", timeout_ms: " << timeout_ms;
    ss << ", num_headers: " << headers.size();
    return ss.str();
  }
};

/*
 * Object store speaking plain HTTP to an S3 compatible endpoint with
 * path-style addressing: <endpoint>/<bucket>/<key>.
 * Requests run on the executor, one libcurl easy handle per request. All
 * handles of a store share one connection cache, DNS cache and TLS
 * session cache, so readers on the same store reuse connections.
 * Request signing is not done here, pre-signed headers can be passed in
 * the config.
 */
class CurlShare;

class HttpObjectStore : public AbstractObjectStore {
 public:
  HttpObjectStore(const HttpStoreConfig& config,
                  std::shared_ptr<AbstractExecutor> executor);
  // Owns an Executor with config.num_threads threads.
  explicit HttpObjectStore(const HttpStoreConfig& config);

  virtual std::future<HeadResponse> HeadObject(const ObjectUri& uri) override;
  virtual std::future<RangeResponse> GetObjectRange(const ObjectUri& uri,
                                                    uint64_t start,
                                                    uint64_t end) override;

 private:
  std::shared_ptr<const HttpStoreConfig> config_;
  std::shared_ptr<CurlShare> share_;
  std::shared_ptr<AbstractExecutor> executor_;
};

// Status line and object metadata collected by ParseResponseHeader.
// A new status line (redirect, 100 Continue) starts over.
struct ResponseHeaders {
  long http_code = 0;
  ObjectMeta meta;
};

// Destination of WriteBody. Bodies of non-2xx responses are discarded,
// a 2xx body longer than limit aborts the transfer.
struct BodySink {
  const ResponseHeaders* headers = nullptr;
  std::string data;
  size_t limit = 0;
};

// libcurl CURLOPT_HEADERFUNCTION, userdata is a ResponseHeaders.
size_t ParseResponseHeader(char* buffer, size_t size, size_t nitems, void* userdata);
// libcurl CURLOPT_WRITEFUNCTION, userdata is a BodySink. Returns 0 to abort.
size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata);
// length is what libcurl reports for Content-Length, -1 when absent.
Status ContentLengthToSize(int64_t length, const std::string& what, uint64_t* size);

// Percent-encode each '/' separated segment of the key, keeping the '/'.
std::string EscapeKey(const std::string& key);
std::string BuildObjectUrl(const std::string& endpoint, const ObjectUri& uri);
// "Range: bytes=<start>-<end - 1>", HTTP ranges are inclusive.
std::string BuildRangeHeader(uint64_t start, uint64_t end);
Status HttpStatusToStatus(long http_code, const std::string& what);

}  // namespace s3r
