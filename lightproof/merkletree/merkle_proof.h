#ifndef LIGHTPROOF_MERKLETREE_MERKLE_PROOF_H_
#define LIGHTPROOF_MERKLETREE_MERKLE_PROOF_H_

#include <ostream>
#include <string>
#include <vector>

#include "merkletree/digest.h"
#include "merkletree/level_node.h"
#include "merkletree/tree_hasher.h"
#include "util/statusor.h"

namespace lightproof {


// An inclusion proof for one leaf of a binary Merkle tree: the leaf
// data, and the siblings met on the way up to the root, ordered from
// the leaf (index 0) to just below the root.
//
// The root implied by the proof is
//   r_0     = HashLeaf(leaf_data)
//   r_{i+1} = HashChildren(sibling_i, r_i)   if side_i == LEFT
//             HashChildren(r_i, sibling_i)   if side_i == RIGHT
// and the proof is valid for a root iff that root equals r_n. A proof
// with no levels is the proof for a single-leaf tree.
//
// Immutable, and safe to verify concurrently.
class MerkleProof {
 public:
  // Fails with FAILED_PRECONDITION if |leaf_data| is empty, unless
  // --merkle_proof_allow_empty_leaf is set.
  static util::StatusOr<MerkleProof> Create(const std::string& leaf_data,
                                            std::vector<LevelNode> levels);

  const std::string& leaf_data() const {
    return leaf_data_;
  }

  const std::vector<LevelNode>& levels() const {
    return levels_;
  }

  // The root implied by this proof under |hasher|.
  Digest RootHash(const TreeHasher& hasher) const;

  // True iff the proof leads to |expected_root|.
  bool IsValid(const TreeHasher& hasher, const Digest& expected_root) const;

  // As above, for a root given as raw bytes. Fails with INVALID_ARGUMENT
  // if |expected_root| is not exactly Digest::kSize bytes long, so that
  // a malformed root is never mistaken for a proof that doesn't verify.
  util::StatusOr<bool> IsValid(const TreeHasher& hasher,
                               const std::string& expected_root) const;

  bool operator==(const MerkleProof& other) const {
    return leaf_data_ == other.leaf_data_ && levels_ == other.levels_;
  }

  bool operator!=(const MerkleProof& other) const {
    return !(*this == other);
  }

 private:
  friend class util::StatusOr<MerkleProof>;

  MerkleProof() = default;
  MerkleProof(const std::string& leaf_data, std::vector<LevelNode> levels);

  std::string leaf_data_;
  std::vector<LevelNode> levels_;
};


std::ostream& operator<<(std::ostream& os, const MerkleProof& proof);


// The error reported when a proof is built for empty leaf data and the
// configured policy disallows it.
util::Status EmptyLeafIdentifier();


}  // namespace lightproof

#endif  // LIGHTPROOF_MERKLETREE_MERKLE_PROOF_H_
