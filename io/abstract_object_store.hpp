#pragma once

#include <cstdint>
#include <future>
#include <memory>

#include "base/status.hpp"
#include "io/object_meta.hpp"
#include "io/object_uri.hpp"

namespace s3r {

/*
 * Body of a ranged fetch. Must be drained until Read returns 0.
 */
class AbstractByteStream {
 public:
  virtual ~AbstractByteStream() {}

  // Copy at most len bytes into buffer.
  // Return the number of bytes copied, 0 at the end of the body, -1 on error.
  // A short count does not mean the body is exhausted.
  virtual int64_t Read(void* buffer, size_t len) = 0;
};

struct HeadResponse {
  Status status;
  ObjectMeta meta;
};

struct RangeResponse {
  Status status;
  std::unique_ptr<AbstractByteStream> body;
};

/*
 * The two primitives the reader consumes from an object store.
 * Both calls are asynchronous, the future is fulfilled once the response
 * headers are in. Implementations must be safe to share between readers
 * and threads.
 *
 * Errors are reported in the response status:
 * kNotFound, kAccessDenied or kTransportError.
 */
class AbstractObjectStore {
 public:
  virtual ~AbstractObjectStore() {}

  virtual std::future<HeadResponse> HeadObject(const ObjectUri& uri) = 0;

  // Fetch the bytes [start, end) of the object. Requires start < end.
  virtual std::future<RangeResponse> GetObjectRange(const ObjectUri& uri,
                                                    uint64_t start,
                                                    uint64_t end) = 0;
};

}  // namespace s3r
