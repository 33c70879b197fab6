#include "merkletree/digest.h"

#include <algorithm>
#include <sstream>

#include "util/util.h"

using std::ostream;
using std::string;
using util::Status;
using util::StatusOr;

namespace lightproof {


const size_t Digest::kSize;


Digest::Digest() {
  bytes_.fill(0);
}


// static
StatusOr<Digest> Digest::FromBytes(const string& bytes) {
  if (bytes.size() != kSize) {
    return InvalidDigestLength("digest", bytes.size());
  }

  Digest digest;
  std::copy(bytes.begin(), bytes.end(), digest.bytes_.begin());
  return digest;
}


// static
StatusOr<Digest> Digest::FromHex(const string& hex) {
  string bytes;
  if (!util::ReadHexString(hex, &bytes)) {
    return Status(util::error::INVALID_ARGUMENT,
                  "digest is not a valid hex string: \"" + hex + "\"");
  }
  return FromBytes(bytes);
}


string Digest::ToString() const {
  return string(reinterpret_cast<const char*>(bytes_.data()), bytes_.size());
}


string Digest::ToHex() const {
  return util::HexString(ToString());
}


ostream& operator<<(ostream& os, const Digest& digest) {
  return os << digest.ToHex();
}


Status InvalidDigestLength(const string& what, size_t length) {
  std::ostringstream oss;
  oss << what << " has length " << length << ", expected " << Digest::kSize;
  return Status(util::error::INVALID_ARGUMENT, oss.str());
}


}  // namespace lightproof
