#pragma once

#include <sstream>
#include <string>

#include "base/status.hpp"

namespace s3r {

/*
 * The (bucket, key) address of one remote object.
 *
 * Usage:
 * ObjectUri uri;
 * Status s = ObjectUri::Parse("s3://mybucket/path/to/file.bin", &uri);
 * // uri.bucket() == "mybucket", uri.key() == "path/to/file.bin"
 */
class ObjectUri {
 public:
  static const char* const kScheme;

  ObjectUri() = default;
  ObjectUri(std::string bucket, std::string key)
      : bucket_(std::move(bucket)), key_(std::move(key)) {}

  // Accepts exactly "s3://<bucket>/<key>". The key keeps every character
  // after the first '/' following the bucket, it is not decoded.
  static Status Parse(const std::string& address, ObjectUri* uri);

  const std::string& bucket() const { return bucket_; }
  const std::string& key() const { return key_; }

  std::string ToString() const { return kScheme + bucket_ + "/" + key_; }

  std::string DebugString() const {
    std::stringstream ss;
    ss << "bucket: " << bucket_;
    ss << ", key: " << key_;
    return ss.str();
  }

  bool operator==(const ObjectUri& other) const {
    return bucket_ == other.bucket_ && key_ == other.key_;
  }

 private:
  std::string bucket_;
  std::string key_;
};

}  // namespace s3r
