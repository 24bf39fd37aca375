#pragma once

#include <algorithm>
#include <cstring>
#include <string>

#include "io/abstract_object_store.hpp"

namespace s3r {

// A body that is already fully in memory, handed out max_chunk bytes at a
// time.
class StringByteStream : public AbstractByteStream {
 public:
  explicit StringByteStream(std::string data, size_t max_chunk = kDefaultChunk)
      : data_(std::move(data)), max_chunk_(max_chunk) {}

  virtual int64_t Read(void* buffer, size_t len) override {
    size_t n = std::min(std::min(len, max_chunk_), data_.size() - offset_);
    std::memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
    return static_cast<int64_t>(n);
  }

  size_t Remaining() const { return data_.size() - offset_; }

  static const size_t kDefaultChunk = 128 * 1024;

 private:
  std::string data_;
  size_t max_chunk_;
  size_t offset_ = 0;
};

}  // namespace s3r
