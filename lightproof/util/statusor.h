#ifndef LIGHTPROOF_UTIL_STATUSOR_H_
#define LIGHTPROOF_UTIL_STATUSOR_H_

#include <glog/logging.h>
#include <utility>

#include "util/status.h"

namespace util {


// A StatusOr<T> holds either a usable value of type T, or a non-OK
// Status explaining why the value is not present.
//
// T must be default-constructible and copyable.
template <typename T>
class StatusOr {
 public:
  // Creates a StatusOr holding Status::UNKNOWN.
  StatusOr();

  // Implicit on purpose, so that functions returning StatusOr<T> can
  // "return status;". It is a fatal error to pass an OK status.
  StatusOr(const Status& status);

  // Implicit on purpose, so that functions returning StatusOr<T> can
  // "return value;".
  StatusOr(const T& value);
  StatusOr(T&& value);

  StatusOr(const StatusOr& other) = default;
  StatusOr& operator=(const StatusOr& other) = default;

  const Status& status() const {
    return status_;
  }

  bool ok() const {
    return status_.ok();
  }

  // It is a fatal error to call these on a non-OK StatusOr.
  const T& ValueOrDie() const;
  T& ValueOrDie();

 private:
  Status status_;
  T value_;
};


template <typename T>
StatusOr<T>::StatusOr() : status_(Status::UNKNOWN) {
}


template <typename T>
StatusOr<T>::StatusOr(const Status& status) : status_(status) {
  CHECK(!status_.ok()) << "StatusOr constructed from an OK status";
}


template <typename T>
StatusOr<T>::StatusOr(const T& value) : value_(value) {
}


template <typename T>
StatusOr<T>::StatusOr(T&& value) : value_(std::move(value)) {
}


template <typename T>
const T& StatusOr<T>::ValueOrDie() const {
  CHECK(status_.ok()) << status_;
  return value_;
}


template <typename T>
T& StatusOr<T>::ValueOrDie() {
  CHECK(status_.ok()) << status_;
  return value_;
}


}  // namespace util

#endif  // LIGHTPROOF_UTIL_STATUSOR_H_
