#ifndef LIGHTPROOF_MERKLETREE_LEVEL_NODE_H_
#define LIGHTPROOF_MERKLETREE_LEVEL_NODE_H_

#include <ostream>
#include <string>

#include "merkletree/digest.h"
#include "util/statusor.h"

namespace lightproof {


// Where a sibling sits relative to the node being proven. The values
// are the wire encoding of the side byte.
enum class Side {
  LEFT = 0,
  RIGHT = 1,
};

std::ostream& operator<<(std::ostream& os, Side side);

// True iff |side| is LEFT or RIGHT.
bool SideIsValid(Side side);


// One step of an inclusion proof: the sibling digest needed to climb
// one level of the tree, and which side of the running digest it goes.
class LevelNode {
 public:
  // A zero digest on the left. Only useful as a placeholder.
  LevelNode();

  // |side| must be LEFT or RIGHT.
  LevelNode(const Digest& sibling, Side side);

  // Fails with INVALID_ARGUMENT unless |sibling| is exactly
  // Digest::kSize bytes and |side| is LEFT or RIGHT.
  static util::StatusOr<LevelNode> Create(const std::string& sibling,
                                          Side side);

  // As Create(), with a hex-encoded sibling.
  static util::StatusOr<LevelNode> FromHex(const std::string& sibling_hex,
                                           Side side);

  const Digest& sibling() const {
    return sibling_;
  }

  Side side() const {
    return side_;
  }

  bool operator==(const LevelNode& other) const {
    return side_ == other.side_ && sibling_ == other.sibling_;
  }

  bool operator!=(const LevelNode& other) const {
    return !(*this == other);
  }

 private:
  Digest sibling_;
  Side side_;
};


std::ostream& operator<<(std::ostream& os, const LevelNode& node);


}  // namespace lightproof

#endif  // LIGHTPROOF_MERKLETREE_LEVEL_NODE_H_
