#include "merkletree/serial_hasher.h"

#include <glog/logging.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

using std::string;
using std::unique_ptr;

namespace lightproof {


const size_t Sha256Hasher::kDigestSize = SHA256_DIGEST_LENGTH;


Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()), initialized_(false) {
  CHECK(ctx_) << "EVP_MD_CTX_new() failed";
}


void Sha256Hasher::Reset() {
  CHECK_EQ(1, EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr));
  initialized_ = true;
}


void Sha256Hasher::Update(const string& data) {
  if (!initialized_)
    Reset();

  CHECK_EQ(1, EVP_DigestUpdate(ctx_.get(), data.data(), data.size()));
}


string Sha256Hasher::Final() {
  if (!initialized_)
    Reset();

  unsigned char hash[SHA256_DIGEST_LENGTH];
  unsigned int length(0);
  CHECK_EQ(1, EVP_DigestFinal_ex(ctx_.get(), hash, &length));
  CHECK_EQ(kDigestSize, length);
  initialized_ = false;
  return string(reinterpret_cast<char*>(hash), SHA256_DIGEST_LENGTH);
}


unique_ptr<SerialHasher> Sha256Hasher::Create() const {
  return unique_ptr<SerialHasher>(new Sha256Hasher);
}


// static
string Sha256Hasher::Sha256Digest(const string& data) {
  Sha256Hasher hasher;
  hasher.Reset();
  hasher.Update(data);
  return hasher.Final();
}


}  // namespace lightproof
