#pragma once

#include <streambuf>

#include "base/status.hpp"
#include "io/abstract_reader.hpp"

namespace s3r {

/*
 * Unbuffered std::streambuf over an AbstractReader, so that std::istream
 * based code can read remote objects.
 *
 * istream::read maps onto exactly one reader Read. Only single character
 * extraction (get, peek, operator>>) keeps one byte of lookahead.
 * A failed Read sets badbit on the stream, the cause is in LastStatus().
 * The reader must outlive the buffer.
 *
 * Usage:
 * ReaderStreamBuf buf(reader.get());
 * std::istream in(&buf);
 * in.seekg(100);
 * in.read(data, 4096);
 */
class ReaderStreamBuf : public std::streambuf {
 public:
  explicit ReaderStreamBuf(AbstractReader* reader);

  // The get area points into this object.
  ReaderStreamBuf(const ReaderStreamBuf&) = delete;
  ReaderStreamBuf& operator=(const ReaderStreamBuf&) = delete;

  const Status& LastStatus() const { return last_status_; }

 protected:
  virtual int_type underflow() override;
  virtual std::streamsize xsgetn(char* s, std::streamsize n) override;
  virtual std::streamsize showmanyc() override;
  virtual pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                           std::ios_base::openmode which) override;
  virtual pos_type seekpos(pos_type pos, std::ios_base::openmode which) override;

 private:
  // Read once from the reader. Throws std::ios_base::failure on error,
  // which the stream turns into badbit.
  size_t ReadOnce(char* s, size_t n);
  // Give the lookahead byte back to the reader.
  bool DropLookahead();

  AbstractReader* reader_;
  char lookahead_;
  Status last_status_;
};

}  // namespace s3r
