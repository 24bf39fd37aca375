#include "io/s3_reader.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

#include "glog/logging.h"

namespace s3r {

Status S3Reader::Open(const ObjectUri& uri,
                      std::shared_ptr<AbstractObjectStore> store,
                      std::unique_ptr<S3Reader>* reader) {
  CHECK(store);
  CHECK(reader);
  VLOG(1) << "Fetching header of " << uri.ToString();
  HeadResponse resp = store->HeadObject(uri).get();
  switch (resp.status.code()) {
  case ErrorCode::kOk:
    break;
  case ErrorCode::kNotFound:
  case ErrorCode::kAccessDenied:
  case ErrorCode::kTransportError:
    return resp.status;
  default:
    return Status::TransportError(resp.status.DebugString());
  }
  VLOG(1) << "Opened " << uri.ToString() << ", " << resp.meta.DebugString();
  reader->reset(new S3Reader(uri, std::move(store), std::move(resp.meta)));
  return Status::OK();
}

Status S3Reader::Open(const std::string& address,
                      std::shared_ptr<AbstractObjectStore> store,
                      std::unique_ptr<S3Reader>* reader) {
  ObjectUri uri;
  Status s = ObjectUri::Parse(address, &uri);
  if (!s.ok()) {
    return s;
  }
  return Open(uri, std::move(store), reader);
}

Status S3Reader::Read(void* buffer, size_t len, size_t* bytes_read) {
  CHECK(bytes_read);
  *bytes_read = 0;
  if (cursor_ >= meta_.size || len == 0) {
    return Status::OK();
  }
  uint64_t end = cursor_ + std::min<uint64_t>(len, meta_.size - cursor_);
  Status s = FetchRange(cursor_, end, static_cast<char*>(buffer));
  if (!s.ok()) {
    return s;
  }
  *bytes_read = end - cursor_;
  cursor_ = end;
  return Status::OK();
}

Status S3Reader::Seek(SeekFrom pos, uint64_t* new_pos) {
  CHECK(new_pos);
  uint64_t target;
  Status s = ComputeSeek(meta_.size, cursor_, pos, &target);
  if (!s.ok()) {
    return s;
  }
  cursor_ = target;
  *new_pos = cursor_;
  return Status::OK();
}

Status S3Reader::ReadRange(uint64_t from, uint64_t to, std::string* data) {
  CHECK(data);
  if (to < from || from > meta_.size) {
    std::stringstream ss;
    ss << "invalid read range " << from << "-" << to << " for size " << meta_.size;
    return Status::InvalidRange(ss.str());
  }
  to = std::min(to, meta_.size);
  data->clear();
  if (from == to) {
    return Status::OK();
  }
  data->resize(to - from);
  Status s = FetchRange(from, to, &(*data)[0]);
  if (!s.ok()) {
    data->clear();
  }
  return s;
}

Status S3Reader::ReadToEnd(std::string* data) {
  CHECK(data);
  if (cursor_ >= meta_.size) {
    return Status::OK();
  }
  const size_t old_size = data->size();
  data->resize(old_size + (meta_.size - cursor_));
  Status s = FetchRange(cursor_, meta_.size, &(*data)[old_size]);
  if (!s.ok()) {
    data->resize(old_size);
    return s;
  }
  cursor_ = meta_.size;
  return Status::OK();
}

Status S3Reader::FetchRange(uint64_t start, uint64_t end, char* out) {
  CHECK_LT(start, end);
  VLOG(1) << "Reading range " << start << "-" << end << " of " << uri_.ToString();
  RangeResponse resp = store_->GetObjectRange(uri_, start, end).get();
  if (!resp.status.ok()) {
    return Status::TransportError("object could not be fetched: " + resp.status.DebugString());
  }
  CHECK(resp.body);

  // Drain the whole body, the transport may hand it out in small chunks.
  const uint64_t want = end - start;
  uint64_t got = 0;
  while (got < want) {
    int64_t n = resp.body->Read(out + got, want - got);
    if (n < 0) {
      return Status::TransportError("could not read from body of " + uri_.ToString());
    }
    if (n == 0) {
      break;
    }
    got += n;
  }
  if (got != want) {
    std::stringstream ss;
    ss << "short body for range " << start << "-" << end << ": got " << got
       << " of " << want << " bytes";
    return Status::TransportError(ss.str());
  }
  char extra;
  int64_t n = resp.body->Read(&extra, 1);
  if (n < 0) {
    return Status::TransportError("could not read from body of " + uri_.ToString());
  }
  if (n > 0) {
    std::stringstream ss;
    ss << "body for range " << start << "-" << end << " is longer than " << want << " bytes";
    return Status::TransportError(ss.str());
  }
  return Status::OK();
}

Status ComputeSeek(uint64_t len, uint64_t cursor, SeekFrom pos, uint64_t* new_pos) {
  CHECK(new_pos);
  uint64_t base = 0;
  switch (pos.whence) {
  case SeekFrom::Whence::kStart:
    *new_pos = pos.offset;
    return Status::OK();
  case SeekFrom::Whence::kCurrent:
    base = cursor;
    break;
  case SeekFrom::Whence::kEnd:
    base = len;
    break;
  }
  if (pos.delta >= 0) {
    uint64_t delta = static_cast<uint64_t>(pos.delta);
    if (delta > std::numeric_limits<uint64_t>::max() - base) {
      return Status::InvalidSeek("position overflows: " + pos.DebugString());
    }
    *new_pos = base + delta;
  } else {
    // -(delta + 1) + 1 keeps INT64_MIN representable.
    uint64_t magnitude = static_cast<uint64_t>(-(pos.delta + 1)) + 1;
    if (magnitude > base) {
      return Status::InvalidSeek("position cannot be negative: " + pos.DebugString());
    }
    *new_pos = base - magnitude;
  }
  return Status::OK();
}

}  // namespace s3r
