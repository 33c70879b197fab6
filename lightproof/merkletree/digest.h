#ifndef LIGHTPROOF_MERKLETREE_DIGEST_H_
#define LIGHTPROOF_MERKLETREE_DIGEST_H_

#include <stddef.h>
#include <array>
#include <ostream>
#include <string>

#include "util/status.h"
#include "util/statusor.h"

namespace lightproof {


// A hash output of exactly kSize bytes. Instances can only be created
// from input of the right length, so code holding a Digest never needs
// to check it again.
class Digest {
 public:
  static const size_t kSize = 32;

  // All zeroes. Only useful as a placeholder to be assigned to.
  Digest();

  // Fails with INVALID_ARGUMENT unless |bytes| is exactly kSize long.
  static util::StatusOr<Digest> FromBytes(const std::string& bytes);

  // As FromBytes(), for a hex-encoded digest. Malformed hex is reported
  // the same way as a wrong length.
  static util::StatusOr<Digest> FromHex(const std::string& hex);

  const unsigned char* data() const {
    return bytes_.data();
  }

  size_t size() const {
    return bytes_.size();
  }

  // The raw bytes.
  std::string ToString() const;

  std::string ToHex() const;

  bool operator==(const Digest& other) const {
    return bytes_ == other.bytes_;
  }

  bool operator!=(const Digest& other) const {
    return bytes_ != other.bytes_;
  }

 private:
  std::array<unsigned char, kSize> bytes_;
};


std::ostream& operator<<(std::ostream& os, const Digest& digest);


// The error reported for any digest (sibling or root) whose length does
// not match Digest::kSize. |what| names the digest in the message.
util::Status InvalidDigestLength(const std::string& what, size_t length);


}  // namespace lightproof

#endif  // LIGHTPROOF_MERKLETREE_DIGEST_H_
