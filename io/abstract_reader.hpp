#pragma once

#include <cstdint>
#include <sstream>
#include <string>

#include "base/status.hpp"

namespace s3r {

// Target of a Seek call, mirroring the three origins of lseek.
struct SeekFrom {
  enum class Whence { kStart, kCurrent, kEnd };

  static SeekFrom Start(uint64_t offset) { return SeekFrom(Whence::kStart, offset, 0); }
  static SeekFrom Current(int64_t delta) { return SeekFrom(Whence::kCurrent, 0, delta); }
  static SeekFrom End(int64_t delta) { return SeekFrom(Whence::kEnd, 0, delta); }

  Whence whence;
  uint64_t offset;  // kStart only
  int64_t delta;    // kCurrent and kEnd

  std::string DebugString() const {
    std::stringstream ss;
    switch (whence) {
    case Whence::kStart:
      ss << "Start(" << offset << ")";
      break;
    case Whence::kCurrent:
      ss << "Current(" << delta << ")";
      break;
    case Whence::kEnd:
      ss << "End(" << delta << ")";
      break;
    }
    return ss.str();
  }

 private:
  SeekFrom(Whence w, uint64_t o, int64_t d) : whence(w), offset(o), delta(d) {}
};

/*
 * A file-like byte source with a cursor.
 *
 * Usage:
 * reader->Seek(SeekFrom::Start(100), &pos);
 * size_t n;
 * while (reader->Read(buf, sizeof(buf), &n).ok() && n > 0) {
 *   consume(buf, n);
 * }
 */
class AbstractReader {
 public:
  virtual ~AbstractReader() {}

  virtual uint64_t GetFileSize() const = 0;
  virtual uint64_t GetPosition() const = 0;

  // Read up to len bytes at the cursor. *bytes_read is 0 at end of file.
  // The cursor is left untouched when an error is returned.
  virtual Status Read(void* buffer, size_t len, size_t* bytes_read) = 0;

  virtual Status Seek(SeekFrom pos, uint64_t* new_pos) = 0;
};

}  // namespace s3r
