#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace s3r {

// What a metadata request reports about one object. Remote objects are
// always regular, read-only files.
struct ObjectMeta {
  uint64_t size = 0;
  std::string last_modified;
  std::string etag;

  bool IsFile() const { return true; }
  bool IsReadOnly() const { return true; }

  std::string DebugString() const {
    std::stringstream ss;
    ss << "size: " << size;
    ss << ", last_modified: " << last_modified;
    ss << ", etag: " << etag;
    return ss.str();
  }
};

}  // namespace s3r
