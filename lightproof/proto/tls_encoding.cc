#include "proto/tls_encoding.h"

using std::string;

namespace lightproof {

namespace serialization {


void WriteFixedBytes(const string& in, string* output) {
  output->append(in);
}


void WriteVarBytes(const string& in, size_t max_length, string* output) {
  CHECK_LE(in.size(), max_length);

  size_t prefix_length = internal::PrefixLength(max_length);
  WriteUint(in.size(), prefix_length, output);
  WriteFixedBytes(in, output);
}


namespace internal {

size_t PrefixLength(size_t max_length) {
  CHECK_GT(max_length, 0U);
  size_t prefix_length = 0;
  for (; max_length > 0; max_length >>= 8)
    ++prefix_length;
  return prefix_length;
}

}  // namespace internal

}  // namespace serialization


TLSDeserializer::TLSDeserializer(const string& input)
    : current_pos_(input.data()), bytes_remaining_(input.size()) {
}


bool TLSDeserializer::ReadFixedBytes(size_t bytes, string* result) {
  if (bytes_remaining_ < bytes)
    return false;
  result->assign(current_pos_, bytes);
  current_pos_ += bytes;
  bytes_remaining_ -= bytes;
  return true;
}


bool TLSDeserializer::ReadVarBytes(size_t max_length, string* result) {
  size_t prefix_length = serialization::internal::PrefixLength(max_length);
  size_t length;
  if (!ReadUint(prefix_length, &length) || length > max_length)
    return false;
  return ReadFixedBytes(length, result);
}


}  // namespace lightproof
