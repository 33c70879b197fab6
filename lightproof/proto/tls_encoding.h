#ifndef LIGHTPROOF_PROTO_TLS_ENCODING_H_
#define LIGHTPROOF_PROTO_TLS_ENCODING_H_

#include <glog/logging.h>
#include <stddef.h>
#include <string>

namespace lightproof {

namespace serialization {

///////////////////////////////////////////////////////////////////////////////
// Basic serialization functions (TLS presentation language, big-endian).   //
///////////////////////////////////////////////////////////////////////////////
template <class T>
void WriteUint(T in, size_t bytes, std::string* output) {
  CHECK_LE(bytes, sizeof(in));
  CHECK(bytes == sizeof(in) || in >> (bytes * 8) == 0);
  for (; bytes > 0; --bytes)
    output->push_back(((in & (static_cast<T>(0xff) << ((bytes - 1) * 8))) >>
                       ((bytes - 1) * 8)));
}

// Fixed-length byte array.
void WriteFixedBytes(const std::string& in, std::string* output);

// Variable-length byte array.
// Caller is responsible for checking |in| <= max_length.
void WriteVarBytes(const std::string& in, size_t max_length,
                   std::string* output);

namespace internal {

// Returns the number of bytes needed to store a value up to max_length.
size_t PrefixLength(size_t max_length);

}  // namespace internal

}  // namespace serialization


class TLSDeserializer {
 public:
  // We do not make a copy, so input must remain valid.
  explicit TLSDeserializer(const std::string& input);
  TLSDeserializer(const TLSDeserializer&) = delete;
  TLSDeserializer& operator=(const TLSDeserializer&) = delete;

  bool ReadFixedBytes(size_t bytes, std::string* result);

  bool ReadVarBytes(size_t max_length, std::string* result);

  bool ReachedEnd() const {
    return bytes_remaining_ == 0;
  }

  template <class T>
  bool ReadUint(size_t bytes, T* result) {
    if (bytes_remaining_ < bytes)
      return false;
    T res = 0;
    for (size_t i = 0; i < bytes; ++i) {
      res = (res << 8) | static_cast<unsigned char>(*current_pos_);
      ++current_pos_;
    }

    bytes_remaining_ -= bytes;
    *result = res;
    return true;
  }

 private:
  const char* current_pos_;
  size_t bytes_remaining_;
};


}  // namespace lightproof

#endif  // LIGHTPROOF_PROTO_TLS_ENCODING_H_
