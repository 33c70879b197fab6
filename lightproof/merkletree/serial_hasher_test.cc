#include <gtest/gtest.h>
#include <stddef.h>
#include <memory>
#include <string>

#include "merkletree/serial_hasher.h"
#include "util/testing.h"
#include "util/util.h"

namespace {

using lightproof::SerialHasher;
using lightproof::Sha256Hasher;
using std::string;
using std::unique_ptr;

const char kTestString[] = "Hello world!";

typedef struct {
  const char* input;
  const char* output;
} HashTestVector;

// A couple of SHA-256 test vectors from http://csrc.nist.gov/groups/STM/cavp/
const HashTestVector kSha256Vectors[] = {
    {"", "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"},
    {"5738c929c4f4ccb6",
     "963bb88f27f512777aab6c8b1a02c70ec0ad651d428f870036e1917120fb48bf"},
    {"e2f76e97606a872e317439f1a03fcd92e632e5bd4e7cbc4e97f1afc19a16fde9"
     "2d77cbe546416b51640cddb92af996534dfd81edb17c4424cf1ac4d75aceeb",
     "18041bd4665083001fba8c5411d2d748e8abbfdcdfd9218cb02b68a78e7d4c23"},
};


class SerialHasherTest : public ::testing::Test {
 protected:
  Sha256Hasher hasher_;
};


TEST_F(SerialHasherTest, DigestSize) {
  EXPECT_EQ(32U, hasher_.DigestSize());
}


// Known Answer Tests
TEST_F(SerialHasherTest, KnownAnswers) {
  for (const HashTestVector& v : kSha256Vectors) {
    hasher_.Reset();
    hasher_.Update(util::BinaryString(v.input));
    EXPECT_EQ(v.output, util::HexString(hasher_.Final())) << v.input;
  }
}


TEST_F(SerialHasherTest, FragmentedUpdates) {
  const string input(kTestString);

  hasher_.Reset();
  hasher_.Update(input);
  const string digest(hasher_.Final());
  EXPECT_EQ(hasher_.DigestSize(), digest.size());

  // The same in two chunks
  hasher_.Reset();
  hasher_.Update(input.substr(0, 5));
  hasher_.Update(input.substr(5));
  EXPECT_EQ(digest, hasher_.Final());
}


TEST_F(SerialHasherTest, FinalResets) {
  hasher_.Update("garbage");
  hasher_.Final();

  // No Reset(): Final() must have left a fresh context behind.
  hasher_.Update(kTestString);
  EXPECT_EQ(Sha256Hasher::Sha256Digest(kTestString), hasher_.Final());
}


TEST_F(SerialHasherTest, CreateMakesIndependentHasher) {
  unique_ptr<SerialHasher> other(hasher_.Create());
  ASSERT_TRUE(other);
  EXPECT_EQ(hasher_.DigestSize(), other->DigestSize());

  hasher_.Update("abc");
  other->Update(kTestString);
  EXPECT_EQ(Sha256Hasher::Sha256Digest(kTestString), other->Final());
  EXPECT_EQ(Sha256Hasher::Sha256Digest("abc"), hasher_.Final());
}


}  // namespace

int main(int argc, char** argv) {
  lightproof::test::InitTesting(argv[0], &argc, &argv, true);
  return RUN_ALL_TESTS();
}
