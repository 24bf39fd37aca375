#include "io/object_uri.hpp"

#include <cstring>

#include "glog/logging.h"

namespace s3r {

const char* const ObjectUri::kScheme = "s3://";

Status ObjectUri::Parse(const std::string& address, ObjectUri* uri) {
  CHECK(uri);
  const size_t scheme_len = std::strlen(kScheme);
  if (address.compare(0, scheme_len, kScheme) != 0) {
    return Status::MalformedUri("missing s3:// scheme in " + address);
  }
  size_t sep = address.find('/', scheme_len);
  if (sep == std::string::npos) {
    return Status::MalformedUri("missing key in " + address);
  }
  if (sep == scheme_len) {
    return Status::MalformedUri("empty bucket in " + address);
  }
  if (sep + 1 == address.size()) {
    return Status::MalformedUri("empty key in " + address);
  }
  *uri = ObjectUri(address.substr(scheme_len, sep - scheme_len),
                   address.substr(sep + 1));
  return Status::OK();
}

}  // namespace s3r
