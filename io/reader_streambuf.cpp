#include "io/reader_streambuf.hpp"

#include <ios>

#include "glog/logging.h"

namespace s3r {

ReaderStreamBuf::ReaderStreamBuf(AbstractReader* reader) : reader_(reader), lookahead_(0) {
  CHECK(reader_);
  setg(&lookahead_, &lookahead_ + 1, &lookahead_ + 1);
}

size_t ReaderStreamBuf::ReadOnce(char* s, size_t n) {
  size_t nread = 0;
  last_status_ = reader_->Read(s, n, &nread);
  if (!last_status_.ok()) {
    throw std::ios_base::failure(last_status_.DebugString());
  }
  return nread;
}

ReaderStreamBuf::int_type ReaderStreamBuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }
  if (ReadOnce(&lookahead_, 1) == 0) {
    return traits_type::eof();
  }
  setg(&lookahead_, &lookahead_, &lookahead_ + 1);
  return traits_type::to_int_type(lookahead_);
}

std::streamsize ReaderStreamBuf::xsgetn(char* s, std::streamsize n) {
  if (n <= 0) {
    return 0;
  }
  const std::streamsize pending = egptr() - gptr();
  size_t nread = 0;
  // Read before consuming the lookahead byte, a throwing ReadOnce must
  // leave it in place for the next attempt.
  if (pending < n) {
    nread = ReadOnce(s + pending, static_cast<size_t>(n - pending));
  }
  if (pending > 0) {
    *s = *gptr();
    gbump(1);
  }
  return pending + static_cast<std::streamsize>(nread);
}

std::streamsize ReaderStreamBuf::showmanyc() {
  uint64_t size = reader_->GetFileSize();
  uint64_t pos = reader_->GetPosition();
  if (pos >= size) {
    return -1;
  }
  return static_cast<std::streamsize>(size - pos);
}

bool ReaderStreamBuf::DropLookahead() {
  std::streamsize pending = egptr() - gptr();
  if (pending == 0) {
    return true;
  }
  uint64_t pos;
  last_status_ = reader_->Seek(SeekFrom::Current(-pending), &pos);
  if (!last_status_.ok()) {
    return false;
  }
  setg(&lookahead_, &lookahead_ + 1, &lookahead_ + 1);
  return true;
}

ReaderStreamBuf::pos_type ReaderStreamBuf::seekoff(off_type off,
                                                   std::ios_base::seekdir dir,
                                                   std::ios_base::openmode which) {
  const pos_type kInvalid = pos_type(off_type(-1));
  if (!(which & std::ios_base::in)) {
    return kInvalid;
  }
  if (!DropLookahead()) {
    return kInvalid;
  }
  SeekFrom target = SeekFrom::Current(off);
  if (dir == std::ios_base::beg) {
    if (off < 0) {
      last_status_ = Status::InvalidSeek("negative absolute position");
      return kInvalid;
    }
    target = SeekFrom::Start(static_cast<uint64_t>(off));
  } else if (dir == std::ios_base::end) {
    target = SeekFrom::End(off);
  }
  uint64_t pos;
  last_status_ = reader_->Seek(target, &pos);
  if (!last_status_.ok()) {
    return kInvalid;
  }
  return pos_type(off_type(pos));
}

ReaderStreamBuf::pos_type ReaderStreamBuf::seekpos(pos_type pos,
                                                   std::ios_base::openmode which) {
  return seekoff(off_type(pos), std::ios_base::beg, which);
}

}  // namespace s3r
