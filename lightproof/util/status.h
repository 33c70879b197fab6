#ifndef LIGHTPROOF_UTIL_STATUS_H_
#define LIGHTPROOF_UTIL_STATUS_H_

#include <ostream>
#include <string>

namespace util {
namespace error {

// Canonical error space, limited to the codes the library reports. The
// numbering follows the canonical codes.
enum Code {
  // Not an error; returned on success.
  OK = 0,

  // Unknown error, typically a Status that was never assigned.
  UNKNOWN = 2,

  // Client specified an invalid argument, independent of any system
  // state (e.g. a digest of the wrong length, undecodable bytes).
  INVALID_ARGUMENT = 3,

  // The input is well-formed, but rejected by the configured policy
  // (e.g. an empty leaf when empty leaves are disallowed).
  FAILED_PRECONDITION = 9,
};

}  // namespace error


class Status {
 public:
  // Creates an OK status.
  Status();
  Status(::util::error::Code error, const std::string& error_message);
  Status(const Status& other);
  Status& operator=(const Status& other);

  static const Status& OK;
  static const Status& UNKNOWN;

  bool ok() const {
    return code_ == ::util::error::OK;
  }

  ::util::error::Code CanonicalCode() const {
    return code_;
  }

  const std::string& error_message() const {
    return message_;
  }

  bool operator==(const Status& other) const {
    return code_ == other.code_ && message_ == other.message_;
  }

  bool operator!=(const Status& other) const {
    return !(*this == other);
  }

  std::string ToString() const;

 private:
  ::util::error::Code code_;
  std::string message_;
};


std::ostream& operator<<(std::ostream& os, util::error::Code code);
std::ostream& operator<<(std::ostream& os, const Status& status);


}  // namespace util

#endif  // LIGHTPROOF_UTIL_STATUS_H_
