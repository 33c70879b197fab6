#include "merkletree/tree_hasher.h"

#include <glog/logging.h>
#include <utility>

using std::string;
using std::unique_ptr;

namespace lightproof {


const char TreeHasher::kDefaultLeafPrefix = '\x00';
const char TreeHasher::kDefaultNodePrefix = '\x01';


TreeHasher::TreeHasher(unique_ptr<SerialHasher> hasher)
    : TreeHasher(std::move(hasher), kDefaultLeafPrefix, kDefaultNodePrefix) {
}


TreeHasher::TreeHasher(unique_ptr<SerialHasher> hasher, char leaf_prefix,
                       char node_prefix)
    : hasher_(std::move(hasher)),
      leaf_prefix_(1, leaf_prefix),
      node_prefix_(1, node_prefix) {
  CHECK(hasher_) << "TreeHasher needs a SerialHasher";
  CHECK_EQ(Digest::kSize, hasher_->DigestSize());
  CHECK_NE(leaf_prefix_, node_prefix_)
      << "leaf and node prefixes must be distinct";
}


Digest TreeHasher::HashLeaf(const string& data) const {
  return HashWithPrefix(leaf_prefix_, data, string());
}


Digest TreeHasher::HashChildren(const Digest& left_child,
                                const Digest& right_child) const {
  return HashWithPrefix(node_prefix_, left_child.ToString(),
                        right_child.ToString());
}


Digest TreeHasher::HashWithPrefix(const string& prefix, const string& first,
                                  const string& second) const {
  const unique_ptr<SerialHasher> hasher(hasher_->Create());
  hasher->Reset();
  hasher->Update(prefix);
  hasher->Update(first);
  hasher->Update(second);
  // The digest size was checked in the constructor.
  return Digest::FromBytes(hasher->Final()).ValueOrDie();
}


}  // namespace lightproof
