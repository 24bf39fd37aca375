#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "base/status.hpp"
#include "io/abstract_object_store.hpp"
#include "io/abstract_reader.hpp"
#include "io/object_meta.hpp"
#include "io/object_uri.hpp"

namespace s3r {

/*
 * Seekable reader over one remote object.
 *
 * Every Read issues exactly one ranged fetch for the bytes under the
 * cursor and blocks until the body is fully drained. Nothing is cached
 * between calls apart from the metadata fetched by Open. Seek only moves
 * the cursor.
 *
 * Not thread-safe, use one reader per thread. The store may be shared.
 *
 * Usage:
 * std::unique_ptr<S3Reader> reader;
 * Status s = S3Reader::Open("s3://my-bucket/path/to/huge/file", store, &reader);
 * uint64_t pos;
 * reader->Seek(SeekFrom::Start(100), &pos);
 * std::vector<char> buf(1024);
 * size_t n;
 * s = reader->Read(buf.data(), buf.size(), &n);
 */
class S3Reader : public AbstractReader {
 public:
  // Fetch the object's metadata and create a reader positioned at 0.
  // Fails with kNotFound, kAccessDenied or kTransportError.
  static Status Open(const ObjectUri& uri,
                     std::shared_ptr<AbstractObjectStore> store,
                     std::unique_ptr<S3Reader>* reader);
  // As above, additionally fails with kMalformedUri.
  static Status Open(const std::string& address,
                     std::shared_ptr<AbstractObjectStore> store,
                     std::unique_ptr<S3Reader>* reader);

  virtual uint64_t GetFileSize() const override { return meta_.size; }
  virtual uint64_t GetPosition() const override { return cursor_; }
  const ObjectMeta& GetMeta() const { return meta_; }
  const ObjectUri& GetUri() const { return uri_; }

  // Fails only with kTransportError.
  virtual Status Read(void* buffer, size_t len, size_t* bytes_read) override;

  // Positions past the end of the object are accepted, reads there return
  // 0 bytes. Fails with kInvalidSeek for positions that do not fit in
  // [0, 2^64).
  virtual Status Seek(SeekFrom pos, uint64_t* new_pos) override;

  // Fetch [from, to) in a single request, to is clamped to the file size.
  // Does not use or move the cursor.
  Status ReadRange(uint64_t from, uint64_t to, std::string* data);

  // Append everything from the cursor to the end of the object to data
  // using a single request, and move the cursor to the end.
  Status ReadToEnd(std::string* data);

 private:
  S3Reader(ObjectUri uri, std::shared_ptr<AbstractObjectStore> store, ObjectMeta meta)
      : uri_(std::move(uri)), store_(std::move(store)), meta_(std::move(meta)) {}

  // Fetch [start, end) into out, which must hold end - start bytes.
  Status FetchRange(uint64_t start, uint64_t end, char* out);

  ObjectUri uri_;
  std::shared_ptr<AbstractObjectStore> store_;
  ObjectMeta meta_;
  uint64_t cursor_ = 0;
};

// Resolve pos against a file of size len with the cursor at cursor.
Status ComputeSeek(uint64_t len, uint64_t cursor, SeekFrom pos, uint64_t* new_pos);

}  // namespace s3r
