#include "merkletree/level_node.h"

#include <glog/logging.h>
#include <sstream>

#include "util/util.h"

using std::ostream;
using std::string;
using util::StatusOr;

namespace lightproof {


ostream& operator<<(ostream& os, Side side) {
  switch (side) {
    case Side::LEFT:
      return os << "LEFT";
    case Side::RIGHT:
      return os << "RIGHT";
  }
  return os << "<unknown side " << static_cast<int>(side) << ">";
}


bool SideIsValid(Side side) {
  switch (side) {
    case Side::LEFT:
    case Side::RIGHT:
      return true;
  }
  return false;
}


LevelNode::LevelNode() : side_(Side::LEFT) {
}


LevelNode::LevelNode(const Digest& sibling, Side side)
    : sibling_(sibling), side_(side) {
  CHECK(SideIsValid(side_)) << "invalid side " << static_cast<int>(side_);
}


// static
StatusOr<LevelNode> LevelNode::Create(const string& sibling, Side side) {
  if (!SideIsValid(side)) {
    std::ostringstream oss;
    oss << "side has value " << static_cast<int>(side)
        << ", expected LEFT (0) or RIGHT (1)";
    return util::Status(util::error::INVALID_ARGUMENT, oss.str());
  }
  if (sibling.size() != Digest::kSize) {
    return InvalidDigestLength("sibling digest", sibling.size());
  }
  return LevelNode(Digest::FromBytes(sibling).ValueOrDie(), side);
}


// static
StatusOr<LevelNode> LevelNode::FromHex(const string& sibling_hex, Side side) {
  string sibling;
  if (!util::ReadHexString(sibling_hex, &sibling)) {
    return util::Status(util::error::INVALID_ARGUMENT,
                        "sibling digest is not a valid hex string: \"" +
                            sibling_hex + "\"");
  }
  return Create(sibling, side);
}


ostream& operator<<(ostream& os, const LevelNode& node) {
  return os << "{" << node.side() << ", " << node.sibling() << "}";
}


}  // namespace lightproof
