#include "io/http_object_store.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstdlib>
#include <mutex>

#include "glog/logging.h"

#include "core/executor/executor.hpp"
#include "io/string_byte_stream.hpp"

namespace s3r {
namespace {

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []() { CHECK_EQ(curl_global_init(CURL_GLOBAL_DEFAULT), CURLE_OK); });
}

struct CurlDeleter {
  void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct HeaderList {
  curl_slist* list = nullptr;
  ~HeaderList() {
    if (list) {
      curl_slist_free_all(list);
    }
  }
  void Add(const std::string& h) {
    curl_slist* appended = curl_slist_append(list, h.c_str());
    CHECK(appended) << "curl_slist_append failed";
    list = appended;
  }
};

bool StartsWithNoCase(const std::string& line, const std::string& prefix) {
  if (line.size() < prefix.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(line[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

std::string HeaderValue(const std::string& line, size_t name_len) {
  size_t b = name_len;
  while (b < line.size() && (line[b] == ' ' || line[b] == '\t')) {
    ++b;
  }
  size_t e = line.size();
  while (e > b && (line[e - 1] == '\r' || line[e - 1] == '\n' || line[e - 1] == ' ' ||
                   line[e - 1] == '\t')) {
    --e;
  }
  return line.substr(b, e - b);
}

}  // namespace

/*
 * Caches shared by every easy handle of one HttpObjectStore.
 * Destroyed after the last request holding it has cleaned up its handle.
 */
class CurlShare {
 public:
  CurlShare() {
    EnsureCurlGlobalInit();
    share_ = curl_share_init();
    CHECK(share_) << "curl_share_init failed";
    CHECK_EQ(curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, Lock), CURLSHE_OK);
    CHECK_EQ(curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, Unlock), CURLSHE_OK);
    CHECK_EQ(curl_share_setopt(share_, CURLSHOPT_USERDATA, this), CURLSHE_OK);
    CHECK_EQ(curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS), CURLSHE_OK);
    CHECK_EQ(curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION), CURLSHE_OK);
    CHECK_EQ(curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT), CURLSHE_OK);
  }
  ~CurlShare() { curl_share_cleanup(share_); }

  CurlShare(const CurlShare&) = delete;
  CurlShare& operator=(const CurlShare&) = delete;

  CURLSH* get() const { return share_; }

 private:
  static void Lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    static_cast<CurlShare*>(userptr)->mu_[data].lock();
  }
  static void Unlock(CURL*, curl_lock_data data, void* userptr) {
    static_cast<CurlShare*>(userptr)->mu_[data].unlock();
  }

  CURLSH* share_;
  std::mutex mu_[CURL_LOCK_DATA_LAST];
};

namespace {

CurlHandle NewHandle(const HttpStoreConfig& config, const CurlShare& share,
                     const std::string& url, const HeaderList& headers) {
  CurlHandle h(curl_easy_init());
  CHECK(h) << "curl_easy_init failed";
  curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(h.get(), CURLOPT_SHARE, share.get());
  curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h.get(), CURLOPT_CONNECTTIMEOUT_MS, config.connect_timeout_ms);
  curl_easy_setopt(h.get(), CURLOPT_TIMEOUT_MS, config.timeout_ms);
  curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.list);
  return h;
}

Status Perform(CURL* h, const std::string& what, long* http_code) {
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
  CURLcode rc = curl_easy_perform(h);
  if (rc != CURLE_OK) {
    std::string detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
    return Status::TransportError(what + ": " + detail);
  }
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, http_code);
  return HttpStatusToStatus(*http_code, what);
}

HeadResponse DoHead(const HttpStoreConfig& config, const CurlShare& share,
                    const ObjectUri& uri) {
  HeadResponse resp;
  const std::string url = BuildObjectUrl(config.endpoint, uri);
  HeaderList headers;
  for (const auto& header : config.headers) {
    headers.Add(header);
  }
  ResponseHeaders response_headers;
  CurlHandle h = NewHandle(config, share, url, headers);
  curl_easy_setopt(h.get(), CURLOPT_NOBODY, 1L);
  curl_easy_setopt(h.get(), CURLOPT_HEADERFUNCTION, ParseResponseHeader);
  curl_easy_setopt(h.get(), CURLOPT_HEADERDATA, &response_headers);

  VLOG(1) << "HEAD " << url;
  long http_code = 0;
  resp.status = Perform(h.get(), "HEAD " + url, &http_code);
  if (!resp.status.ok()) {
    return resp;
  }
  curl_off_t length = -1;
  curl_easy_getinfo(h.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
  resp.meta = response_headers.meta;
  resp.status = ContentLengthToSize(length, "HEAD " + url, &resp.meta.size);
  return resp;
}

RangeResponse DoGet(const HttpStoreConfig& config, const CurlShare& share,
                    const ObjectUri& uri, uint64_t start, uint64_t end) {
  RangeResponse resp;
  const std::string url = BuildObjectUrl(config.endpoint, uri);
  const std::string range = BuildRangeHeader(start, end);
  HeaderList headers;
  for (const auto& header : config.headers) {
    headers.Add(header);
  }
  headers.Add(range);
  ResponseHeaders response_headers;
  BodySink sink;
  sink.headers = &response_headers;
  sink.limit = end - start;
  sink.data.reserve(sink.limit);
  CurlHandle h = NewHandle(config, share, url, headers);
  curl_easy_setopt(h.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(h.get(), CURLOPT_HEADERFUNCTION, ParseResponseHeader);
  curl_easy_setopt(h.get(), CURLOPT_HEADERDATA, &response_headers);
  curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &sink);

  VLOG(1) << "GET " << url << " " << range;
  long http_code = 0;
  resp.status = Perform(h.get(), "GET " + url, &http_code);
  if (!resp.status.ok()) {
    return resp;
  }
  resp.body.reset(new StringByteStream(std::move(sink.data)));
  return resp;
}

}  // namespace

HttpObjectStore::HttpObjectStore(const HttpStoreConfig& config,
                                 std::shared_ptr<AbstractExecutor> executor)
    : config_(std::make_shared<const HttpStoreConfig>(config)),
      share_(std::make_shared<CurlShare>()),
      executor_(std::move(executor)) {
  CHECK(executor_);
  LOG(INFO) << "HttpObjectStore: " << config_->DebugString();
}

HttpObjectStore::HttpObjectStore(const HttpStoreConfig& config)
    : HttpObjectStore(config, std::make_shared<Executor>(config.num_threads)) {}

std::future<HeadResponse> HttpObjectStore::HeadObject(const ObjectUri& uri) {
  auto promise = std::make_shared<std::promise<HeadResponse>>();
  auto result = promise->get_future();
  auto config = config_;
  auto share = share_;
  executor_->Add([config, share, uri, promise]() {
    promise->set_value(DoHead(*config, *share, uri));
  });
  return result;
}

std::future<RangeResponse> HttpObjectStore::GetObjectRange(const ObjectUri& uri,
                                                           uint64_t start,
                                                           uint64_t end) {
  CHECK_LT(start, end);
  auto promise = std::make_shared<std::promise<RangeResponse>>();
  auto result = promise->get_future();
  auto config = config_;
  auto share = share_;
  executor_->Add([config, share, uri, start, end, promise]() {
    promise->set_value(DoGet(*config, *share, uri, start, end));
  });
  return result;
}

size_t ParseResponseHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* headers = static_cast<ResponseHeaders*>(userdata);
  size_t n = size * nitems;
  std::string line(buffer, n);
  if (StartsWithNoCase(line, "http/")) {
    // "HTTP/1.1 206 Partial Content"
    *headers = ResponseHeaders();
    size_t sp = line.find(' ');
    if (sp != std::string::npos) {
      headers->http_code = std::strtol(line.c_str() + sp + 1, nullptr, 10);
    }
  } else if (StartsWithNoCase(line, "last-modified:")) {
    headers->meta.last_modified = HeaderValue(line, 14);
  } else if (StartsWithNoCase(line, "etag:")) {
    headers->meta.etag = HeaderValue(line, 5);
  }
  return n;
}

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* sink = static_cast<BodySink*>(userdata);
  size_t n = size * nmemb;
  const long http_code = sink->headers ? sink->headers->http_code : 0;
  if (http_code < 200 || http_code >= 300) {
    // Error document, the status code is all that is reported.
    return n;
  }
  if (sink->data.size() + n > sink->limit) {
    // Server ignored the range, abort instead of buffering the object.
    return 0;
  }
  sink->data.append(ptr, n);
  return n;
}

Status ContentLengthToSize(int64_t length, const std::string& what, uint64_t* size) {
  CHECK(size);
  if (length < 0) {
    return Status::TransportError(what + ": missing Content-Length");
  }
  *size = static_cast<uint64_t>(length);
  return Status::OK();
}

std::string EscapeKey(const std::string& key) {
  EnsureCurlGlobalInit();
  CurlHandle h(curl_easy_init());
  CHECK(h) << "curl_easy_init failed";
  std::string out;
  size_t begin = 0;
  while (true) {
    size_t slash = key.find('/', begin);
    const std::string segment =
        key.substr(begin, slash == std::string::npos ? std::string::npos : slash - begin);
    if (!segment.empty()) {
      char* escaped = curl_easy_escape(h.get(), segment.c_str(), static_cast<int>(segment.size()));
      CHECK(escaped) << "curl_easy_escape failed";
      out += escaped;
      curl_free(escaped);
    }
    if (slash == std::string::npos) {
      break;
    }
    out.push_back('/');
    begin = slash + 1;
  }
  return out;
}

std::string BuildObjectUrl(const std::string& endpoint, const ObjectUri& uri) {
  std::string base = endpoint;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/" + EscapeKey(uri.bucket()) + "/" + EscapeKey(uri.key());
}

std::string BuildRangeHeader(uint64_t start, uint64_t end) {
  CHECK_LT(start, end);
  std::stringstream ss;
  ss << "Range: bytes=" << start << "-" << end - 1;
  return ss.str();
}

Status HttpStatusToStatus(long http_code, const std::string& what) {
  if (http_code >= 200 && http_code < 300) {
    return Status::OK();
  }
  std::stringstream ss;
  ss << what << ": HTTP " << http_code;
  if (http_code == 404) {
    return Status::NotFound(ss.str());
  }
  if (http_code == 401 || http_code == 403) {
    return Status::AccessDenied(ss.str());
  }
  return Status::TransportError(ss.str());
}

}  // namespace s3r
