#ifndef LIGHTPROOF_MERKLETREE_SERIAL_HASHER_H_
#define LIGHTPROOF_MERKLETREE_SERIAL_HASHER_H_

#include <stddef.h>
#include <memory>
#include <string>

#include "util/openssl_scoped_types.h"

namespace lightproof {


// An incremental cryptographic hash with fixed-size output. This is the
// integration point for the hash function of the ledger being verified.
class SerialHasher {
 public:
  SerialHasher() = default;
  virtual ~SerialHasher() = default;
  SerialHasher(const SerialHasher&) = delete;
  SerialHasher& operator=(const SerialHasher&) = delete;

  virtual size_t DigestSize() const = 0;

  // Reset the context. Must be called before the first Update() call.
  // Optionally it can be called after each Final() call; however
  // doing so is a no-op since Final() will leave the hasher in a
  // reset state.
  virtual void Reset() = 0;

  // Update the hash context with (binary) data.
  virtual void Update(const std::string& data) = 0;

  // Finalize the hash context and return the binary digest blob.
  virtual std::string Final() = 0;

  // A virtual constructor, creates a new instance of the same type.
  virtual std::unique_ptr<SerialHasher> Create() const = 0;
};


// SHA-256, backed by OpenSSL's EVP interface.
class Sha256Hasher : public SerialHasher {
 public:
  Sha256Hasher();
  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;

  size_t DigestSize() const override {
    return kDigestSize;
  }

  void Reset() override;
  void Update(const std::string& data) override;
  std::string Final() override;
  std::unique_ptr<SerialHasher> Create() const override;

  // Create a new hasher and call Reset(), Update(), and Final().
  static std::string Sha256Digest(const std::string& data);

 private:
  static const size_t kDigestSize;

  const ScopedEVP_MD_CTX ctx_;
  bool initialized_;
};


}  // namespace lightproof

#endif  // LIGHTPROOF_MERKLETREE_SERIAL_HASHER_H_
