#ifndef LIGHTPROOF_MERKLETREE_TREE_HASHER_H_
#define LIGHTPROOF_MERKLETREE_TREE_HASHER_H_

#include <stddef.h>
#include <memory>
#include <string>

#include "merkletree/digest.h"
#include "merkletree/serial_hasher.h"

namespace lightproof {


// Domain-separated Merkle tree hashing:
//   leaf:     H(leaf_prefix || data)
//   interior: H(node_prefix || left || right)
//
// The prefixes keep a leaf preimage from ever being read back as an
// interior node (and vice versa). The hash function and the prefixes
// are fixed for the lifetime of the object; pick them to match the
// ledger whose roots are being checked.
//
// Thread-safe: every hash runs on a fresh SerialHasher made by
// Create(), so calls share no mutable state.
class TreeHasher {
 public:
  static const char kDefaultLeafPrefix;
  static const char kDefaultNodePrefix;

  // Uses kDefaultLeafPrefix and kDefaultNodePrefix.
  explicit TreeHasher(std::unique_ptr<SerialHasher> hasher);

  // |hasher| must produce Digest::kSize bytes, and the two prefixes
  // must differ.
  TreeHasher(std::unique_ptr<SerialHasher> hasher, char leaf_prefix,
             char node_prefix);

  TreeHasher(const TreeHasher&) = delete;
  TreeHasher& operator=(const TreeHasher&) = delete;

  size_t DigestSize() const {
    return hasher_->DigestSize();
  }

  char leaf_prefix() const {
    return leaf_prefix_[0];
  }

  char node_prefix() const {
    return node_prefix_[0];
  }

  Digest HashLeaf(const std::string& data) const;

  Digest HashChildren(const Digest& left_child,
                      const Digest& right_child) const;

 private:
  Digest HashWithPrefix(const std::string& prefix, const std::string& first,
                        const std::string& second) const;

  // Prototype only; never updated.
  const std::unique_ptr<SerialHasher> hasher_;
  const std::string leaf_prefix_;
  const std::string node_prefix_;
};


}  // namespace lightproof

#endif  // LIGHTPROOF_MERKLETREE_TREE_HASHER_H_
