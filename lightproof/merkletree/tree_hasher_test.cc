#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>

#include "merkletree/digest.h"
#include "merkletree/serial_hasher.h"
#include "merkletree/tree_hasher.h"
#include "util/testing.h"
#include "util/util.h"

namespace {

using lightproof::Digest;
using lightproof::SerialHasher;
using lightproof::Sha256Hasher;
using lightproof::TreeHasher;
using std::string;
using std::unique_ptr;

typedef struct {
  const char* input;
  const char* output;
} LeafTestVector;

// Inputs and outputs are of fixed digest size.
typedef struct {
  const char* left;
  const char* right;
  const char* output;
} NodeTestVector;

const LeafTestVector kSha256Leaves[] = {
    {"", "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d"},
    {"00", "96a296d224f285c67bee93c30f8a309157f0daa35dc5b87e410b78630a09cfc7"},
    {"101112131415161718191a1b1c1d1e1f",
     "3bfb960453ebaebf33727da7a1f4db38acc051d381b6da20d6d4e88f0eabfd7a"},
};

const NodeTestVector kSha256Nodes[] = {
    {"000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f",
     "202122232425262728292a2b2c2d2e2f303132333435363738393a3b3c3d3e3f",
     "1a378704c17da31e2d05b6d121c2bb2c7d76f6ee6fa8f983e596c2d034963c57"},
};


Digest D(const string& hex) {
  return Digest::FromHex(hex).ValueOrDie();
}


class TreeHasherTest : public ::testing::Test {
 protected:
  TreeHasherTest()
      : tree_hasher_(unique_ptr<SerialHasher>(new Sha256Hasher)) {
  }

  TreeHasher tree_hasher_;
};


typedef TreeHasherTest TreeHasherDeathTest;


TEST_F(TreeHasherTest, DefaultPrefixes) {
  EXPECT_EQ('\x00', tree_hasher_.leaf_prefix());
  EXPECT_EQ('\x01', tree_hasher_.node_prefix());
  EXPECT_EQ(Digest::kSize, tree_hasher_.DigestSize());
}


TEST_F(TreeHasherTest, LeafKnownAnswers) {
  for (const LeafTestVector& v : kSha256Leaves) {
    EXPECT_EQ(v.output,
              tree_hasher_.HashLeaf(util::BinaryString(v.input)).ToHex())
        << v.input;
  }
}


TEST_F(TreeHasherTest, NodeKnownAnswers) {
  for (const NodeTestVector& v : kSha256Nodes) {
    EXPECT_EQ(v.output,
              tree_hasher_.HashChildren(D(v.left), D(v.right)).ToHex());
  }
}


TEST_F(TreeHasherTest, MatchesPrefixedSha256) {
  const Digest left(tree_hasher_.HashLeaf("Hello"));
  const Digest right(tree_hasher_.HashLeaf("World"));

  EXPECT_EQ(Sha256Hasher::Sha256Digest(string(1, '\x00') + "Hello"),
            left.ToString());
  EXPECT_EQ(Sha256Hasher::Sha256Digest(string(1, '\x01') + left.ToString() +
                                       right.ToString()),
            tree_hasher_.HashChildren(left, right).ToString());
}


// TreeHashers are collision resistant when used correctly, i.e.,
// when HashChildren() is called on the (fixed-length) outputs of HashLeaf().
TEST_F(TreeHasherTest, DifferentLeavesDiffer) {
  EXPECT_NE(tree_hasher_.HashLeaf("Hello"), tree_hasher_.HashLeaf("World"));
}


TEST_F(TreeHasherTest, ChildOrderMatters) {
  const Digest left(tree_hasher_.HashLeaf("Hello"));
  const Digest right(tree_hasher_.HashLeaf("World"));
  EXPECT_NE(tree_hasher_.HashChildren(left, right),
            tree_hasher_.HashChildren(right, left));
}


// Without the prefixes, H(left || right) would be both the interior node
// over (left, right) and the leaf hash of the 64-byte string left || right.
TEST_F(TreeHasherTest, LeafAndNodeHashesAreSeparated) {
  const Digest left(tree_hasher_.HashLeaf("Hello"));
  const Digest right(tree_hasher_.HashLeaf("World"));
  const string concatenated(left.ToString() + right.ToString());

  EXPECT_NE(tree_hasher_.HashChildren(left, right),
            tree_hasher_.HashLeaf(concatenated));

  // A leaf that spells out the node prefix and both children is still a
  // leaf.
  EXPECT_NE(tree_hasher_.HashChildren(left, right),
            tree_hasher_.HashLeaf(string(1, '\x01') + concatenated));

  // And neither matches the unprefixed hash.
  const string raw(Sha256Hasher::Sha256Digest(concatenated));
  EXPECT_NE(raw, tree_hasher_.HashChildren(left, right).ToString());
  EXPECT_NE(raw, tree_hasher_.HashLeaf(concatenated).ToString());
}


TEST_F(TreeHasherTest, CustomPrefixes) {
  TreeHasher custom(unique_ptr<SerialHasher>(new Sha256Hasher), 'L', 'N');
  EXPECT_EQ('L', custom.leaf_prefix());
  EXPECT_EQ('N', custom.node_prefix());

  EXPECT_EQ(Sha256Hasher::Sha256Digest("Ldata"),
            custom.HashLeaf("data").ToString());
  EXPECT_NE(tree_hasher_.HashLeaf("data"), custom.HashLeaf("data"));

  const Digest leaf(custom.HashLeaf("data"));
  EXPECT_EQ(Sha256Hasher::Sha256Digest("N" + leaf.ToString() +
                                       leaf.ToString()),
            custom.HashChildren(leaf, leaf).ToString());
}


TEST_F(TreeHasherDeathTest, RejectsEqualPrefixes) {
  EXPECT_DEATH(TreeHasher(unique_ptr<SerialHasher>(new Sha256Hasher), 'X',
                          'X'),
               "prefixes must be distinct");
}


TEST_F(TreeHasherDeathTest, RejectsMissingHasher) {
  unique_ptr<SerialHasher> missing;
  EXPECT_DEATH(TreeHasher hasher(std::move(missing)), "needs a SerialHasher");
}


}  // namespace

int main(int argc, char** argv) {
  lightproof::test::InitTesting(argv[0], &argc, &argv, true);
  return RUN_ALL_TESTS();
}
