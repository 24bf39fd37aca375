#include "base/status.hpp"

namespace s3r {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::kOk:
    return "OK";
  case ErrorCode::kMalformedUri:
    return "MalformedUri";
  case ErrorCode::kNotFound:
    return "NotFound";
  case ErrorCode::kAccessDenied:
    return "AccessDenied";
  case ErrorCode::kTransportError:
    return "TransportError";
  case ErrorCode::kInvalidSeek:
    return "InvalidSeek";
  case ErrorCode::kInvalidRange:
    return "InvalidRange";
  }
  return "Unknown";
}

}  // namespace s3r
