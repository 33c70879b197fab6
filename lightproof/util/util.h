#ifndef LIGHTPROOF_UTIL_UTIL_H_
#define LIGHTPROOF_UTIL_UTIL_H_

#include <string>

namespace util {

// Lowercase hex encoding of |data|.
std::string HexString(const std::string& data);

// Decodes |hex_string|, which must have even length and contain only
// [0-9a-fA-F]. Dies on malformed input, so only use it on trusted
// constants (test vectors and the like).
std::string BinaryString(const std::string& hex_string);

// As above, but reports malformed input by returning false, in which
// case |result| is left untouched.
bool ReadHexString(const std::string& hex_string, std::string* result);

}  // namespace util

#endif  // LIGHTPROOF_UTIL_UTIL_H_
