#include "util/util.h"

#include <glog/logging.h>

using std::string;

namespace util {

namespace {

const char nibble[] = "0123456789abcdef";

// Returns the value of a hex digit, or -1.
int NibbleValue(char c) {
  if ('0' <= c && c <= '9')
    return c - '0';
  if ('a' <= c && c <= 'f')
    return c - 'a' + 10;
  if ('A' <= c && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

}  // namespace


string HexString(const string& data) {
  string ret;
  ret.reserve(data.size() * 2);
  for (size_t i = 0; i < data.size(); ++i) {
    ret.push_back(nibble[(data[i] >> 4) & 0xf]);
    ret.push_back(nibble[data[i] & 0xf]);
  }
  return ret;
}


string BinaryString(const string& hex_string) {
  string ret;
  CHECK(ReadHexString(hex_string, &ret)) << "Malformed hex string: "
                                         << hex_string;
  return ret;
}


bool ReadHexString(const string& hex_string, string* result) {
  CHECK_NOTNULL(result);
  if (hex_string.size() % 2 != 0)
    return false;

  string ret;
  ret.reserve(hex_string.size() / 2);
  for (size_t i = 0; i < hex_string.size(); i += 2) {
    const int high = NibbleValue(hex_string[i]);
    const int low = NibbleValue(hex_string[i + 1]);
    if (high < 0 || low < 0)
      return false;
    ret.push_back(static_cast<char>((high << 4) | low));
  }
  result->swap(ret);
  return true;
}


}  // namespace util
