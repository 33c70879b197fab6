#include "merkletree/merkle_proof.h"

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <utility>

#include "util/util.h"

DEFINE_bool(merkle_proof_allow_empty_leaf, false,
            "Accept inclusion proofs whose leaf data is empty.");

using std::ostream;
using std::string;
using std::vector;
using util::Status;
using util::StatusOr;

namespace lightproof {


MerkleProof::MerkleProof(const string& leaf_data, vector<LevelNode> levels)
    : leaf_data_(leaf_data), levels_(std::move(levels)) {
}


// static
StatusOr<MerkleProof> MerkleProof::Create(const string& leaf_data,
                                          vector<LevelNode> levels) {
  if (leaf_data.empty() && !FLAGS_merkle_proof_allow_empty_leaf) {
    return EmptyLeafIdentifier();
  }
  return MerkleProof(leaf_data, std::move(levels));
}


namespace {


// One step up the tree from |running|.
Digest Climb(const TreeHasher& hasher, const Digest& running,
             const LevelNode& level) {
  switch (level.side()) {
    case Side::LEFT:
      return hasher.HashChildren(level.sibling(), running);
    case Side::RIGHT:
      return hasher.HashChildren(running, level.sibling());
  }
  LOG(FATAL) << "unexpected side " << static_cast<int>(level.side());
  return running;
}


}  // namespace


Digest MerkleProof::RootHash(const TreeHasher& hasher) const {
  Digest running(hasher.HashLeaf(leaf_data_));
  for (vector<LevelNode>::const_iterator it = levels_.begin();
       it != levels_.end(); ++it) {
    running = Climb(hasher, running, *it);
  }
  return running;
}


bool MerkleProof::IsValid(const TreeHasher& hasher,
                          const Digest& expected_root) const {
  // Both sides are full Digest::kSize arrays, so this is a whole-digest
  // comparison.
  return RootHash(hasher) == expected_root;
}


StatusOr<bool> MerkleProof::IsValid(const TreeHasher& hasher,
                                    const string& expected_root) const {
  if (expected_root.size() != Digest::kSize) {
    return InvalidDigestLength("root digest", expected_root.size());
  }
  return IsValid(hasher, Digest::FromBytes(expected_root).ValueOrDie());
}


ostream& operator<<(ostream& os, const MerkleProof& proof) {
  os << "{leaf: " << util::HexString(proof.leaf_data()) << ", levels: [";
  for (size_t i = 0; i < proof.levels().size(); ++i) {
    if (i != 0)
      os << ", ";
    os << proof.levels()[i];
  }
  return os << "]}";
}


Status EmptyLeafIdentifier() {
  return Status(util::error::FAILED_PRECONDITION,
                "leaf data is empty (see --merkle_proof_allow_empty_leaf)");
}


}  // namespace lightproof
