#ifndef LIGHTPROOF_UTIL_TESTING_H_
#define LIGHTPROOF_UTIL_TESTING_H_

namespace lightproof {
namespace test {

// Parses gtest and gflags command-line flags, and sets up glog.
// Call from the main() of every test binary, before RUN_ALL_TESTS().
void InitTesting(const char* name, int* argc, char*** argv, bool remove_flags);

}  // namespace test
}  // namespace lightproof

#endif  // LIGHTPROOF_UTIL_TESTING_H_
