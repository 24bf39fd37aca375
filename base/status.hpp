#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace s3r {

enum class ErrorCode {
  kOk = 0,
  kMalformedUri,
  kNotFound,
  kAccessDenied,
  kTransportError,
  kInvalidSeek,
  kInvalidRange,
};

const char* ErrorCodeName(ErrorCode code);

/*
 * Result of every fallible call in the library.
 * A non-ok status always carries a human readable message.
 */
class Status {
 public:
  Status() : code_(ErrorCode::kOk) {}
  Status(ErrorCode code, std::string msg) : code_(code), msg_(std::move(msg)) {}

  static Status OK() { return Status(); }
  static Status MalformedUri(const std::string& msg) {
    return Status(ErrorCode::kMalformedUri, msg);
  }
  static Status NotFound(const std::string& msg) {
    return Status(ErrorCode::kNotFound, msg);
  }
  static Status AccessDenied(const std::string& msg) {
    return Status(ErrorCode::kAccessDenied, msg);
  }
  static Status TransportError(const std::string& msg) {
    return Status(ErrorCode::kTransportError, msg);
  }
  static Status InvalidSeek(const std::string& msg) {
    return Status(ErrorCode::kInvalidSeek, msg);
  }
  static Status InvalidRange(const std::string& msg) {
    return Status(ErrorCode::kInvalidRange, msg);
  }

  bool ok() const { return code_ == ErrorCode::kOk; }
  ErrorCode code() const { return code_; }
  const std::string& msg() const { return msg_; }

  std::string DebugString() const {
    std::stringstream ss;
    ss << ErrorCodeName(code_);
    if (!msg_.empty()) {
      ss << ": " << msg_;
    }
    return ss.str();
  }

  bool operator==(const Status& other) const {
    return code_ == other.code_ && msg_ == other.msg_;
  }

 private:
  ErrorCode code_;
  std::string msg_;
};

}  // namespace s3r
