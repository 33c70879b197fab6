#include "util/status.h"

#include <sstream>

using std::ostream;
using std::string;

namespace util {

namespace {


const Status& GetOk() {
  static const Status status;
  return status;
}

const Status& GetUnknown() {
  static const Status status(::util::error::UNKNOWN, "");
  return status;
}


}  // namespace


Status::Status() : code_(::util::error::OK), message_("") {
}

Status::Status(::util::error::Code error, const string& error_message)
    : code_(error), message_(error_message) {
  if (code_ == ::util::error::OK) {
    message_.clear();
  }
}

Status::Status(const Status& other)
    : code_(other.code_), message_(other.message_) {
}

Status& Status::operator=(const Status& other) {
  code_ = other.code_;
  message_ = other.message_;
  return *this;
}

const Status& Status::OK = GetOk();
const Status& Status::UNKNOWN = GetUnknown();

string Status::ToString() const {
  if (code_ == ::util::error::OK) {
    return "OK";
  }

  std::ostringstream oss;
  oss << code_ << ": " << message_;
  return oss.str();
}

ostream& operator<<(ostream& os, util::error::Code code) {
  switch (code) {
    case util::error::OK:
      return os << "OK";
    case util::error::UNKNOWN:
      return os << "UNKNOWN";
    case util::error::INVALID_ARGUMENT:
      return os << "INVALID_ARGUMENT";
    case util::error::FAILED_PRECONDITION:
      return os << "FAILED_PRECONDITION";
  }
  // Avoid using a "default" in the switch, so that the compiler can
  // give us a warning, but still provide a fallback here.
  return os << static_cast<int>(code);
}

ostream& operator<<(ostream& os, const Status& status) {
  return os << status.ToString();
}


}  // namespace util
