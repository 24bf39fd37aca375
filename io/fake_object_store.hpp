#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "glog/logging.h"

#include "io/abstract_object_store.hpp"
#include "io/string_byte_stream.hpp"

namespace s3r {

/*
 * In-memory object store for tests.
 * Responses are ready as soon as the call returns. Failures can be
 * injected per call type, and every range request is recorded.
 */
class FakeObjectStore : public AbstractObjectStore {
 public:
  void Put(const std::string& bucket, const std::string& key, std::string content) {
    std::lock_guard<std::mutex> lk(mu_);
    objects_[Path(bucket, key)] = std::move(content);
  }

  virtual std::future<HeadResponse> HeadObject(const ObjectUri& uri) override {
    std::lock_guard<std::mutex> lk(mu_);
    num_head_ += 1;
    VLOG(2) << "fake head " << uri.DebugString();
    std::promise<HeadResponse> promise;
    HeadResponse resp;
    if (!head_error_.ok()) {
      resp.status = head_error_;
    } else {
      auto it = objects_.find(Path(uri.bucket(), uri.key()));
      if (it == objects_.end()) {
        resp.status = Status::NotFound("no such key: " + uri.ToString());
      } else {
        resp.meta.size = it->second.size();
        resp.meta.last_modified = "Wed, 21 Oct 2015 07:28:00 GMT";
        resp.meta.etag = "\"fake-etag\"";
      }
    }
    promise.set_value(std::move(resp));
    return promise.get_future();
  }

  virtual std::future<RangeResponse> GetObjectRange(const ObjectUri& uri,
                                                    uint64_t start,
                                                    uint64_t end) override {
    std::lock_guard<std::mutex> lk(mu_);
    ranges_.push_back({start, end});
    std::promise<RangeResponse> promise;
    RangeResponse resp;
    auto it = objects_.find(Path(uri.bucket(), uri.key()));
    if (num_get_failures_ > 0) {
      num_get_failures_ -= 1;
      resp.status = get_error_;
    } else if (it == objects_.end()) {
      resp.status = Status::NotFound("no such key: " + uri.ToString());
    } else {
      CHECK_LT(start, end);
      const std::string& content = it->second;
      std::string slice;
      if (start < content.size()) {
        // Like a real server, clamp the end to the object size.
        slice = content.substr(start, std::min<uint64_t>(end, content.size()) - start);
      }
      slice.append(extra_bytes_, 'x');
      if (truncate_bytes_ > 0) {
        slice.resize(slice.size() > truncate_bytes_ ? slice.size() - truncate_bytes_ : 0);
      }
      if (stream_fail_after_ != kNoFailure) {
        resp.body.reset(new FailingByteStream(std::move(slice), chunk_size_,
                                              stream_fail_after_));
        stream_fail_after_ = kNoFailure;
      } else {
        resp.body.reset(new StringByteStream(std::move(slice), chunk_size_));
      }
    }
    promise.set_value(std::move(resp));
    return promise.get_future();
  }

  // Every HeadObject fails with status until cleared with Status::OK().
  void SetHeadError(Status status) {
    std::lock_guard<std::mutex> lk(mu_);
    head_error_ = std::move(status);
  }
  // The next n GetObjectRange calls fail with status.
  void FailNextGets(int n, Status status) {
    std::lock_guard<std::mutex> lk(mu_);
    num_get_failures_ = n;
    get_error_ = std::move(status);
  }
  // The next body returns -1 once it has handed out bytes bytes.
  void FailNextStreamAfter(size_t bytes) {
    std::lock_guard<std::mutex> lk(mu_);
    stream_fail_after_ = bytes;
  }
  void SetChunkSize(size_t chunk_size) {
    std::lock_guard<std::mutex> lk(mu_);
    chunk_size_ = chunk_size;
  }
  // Misbehaving servers: bodies longer or shorter than the requested range.
  void SetExtraBytes(size_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    extra_bytes_ = n;
  }
  void SetTruncateBytes(size_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    truncate_bytes_ = n;
  }

  int GetNumHead() {
    std::lock_guard<std::mutex> lk(mu_);
    return num_head_;
  }
  std::vector<std::pair<uint64_t, uint64_t>> GetRanges() {
    std::lock_guard<std::mutex> lk(mu_);
    return ranges_;
  }

 private:
  static const size_t kNoFailure = static_cast<size_t>(-1);

  class FailingByteStream : public StringByteStream {
   public:
    FailingByteStream(std::string data, size_t max_chunk, size_t fail_after)
        : StringByteStream(std::move(data), max_chunk), budget_(fail_after) {}
    virtual int64_t Read(void* buffer, size_t len) override {
      if (budget_ == 0) {
        return -1;
      }
      int64_t n = StringByteStream::Read(buffer, std::min(len, budget_));
      budget_ -= n;
      return n;
    }

   private:
    size_t budget_;
  };

  static std::string Path(const std::string& bucket, const std::string& key) {
    return bucket + "/" + key;
  }

  std::mutex mu_;
  std::map<std::string, std::string> objects_;
  Status head_error_;
  Status get_error_;
  int num_get_failures_ = 0;
  size_t stream_fail_after_ = kNoFailure;
  size_t chunk_size_ = StringByteStream::kDefaultChunk;
  size_t extra_bytes_ = 0;
  size_t truncate_bytes_ = 0;
  int num_head_ = 0;
  std::vector<std::pair<uint64_t, uint64_t>> ranges_;
};

}  // namespace s3r
