#include "proto/proof_serializer.h"

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <sstream>
#include <utility>
#include <vector>

#include "merkletree/digest.h"
#include "merkletree/level_node.h"
#include "proto/tls_encoding.h"

DEFINE_int32(max_merkle_proof_levels, 64,
             "Maximum number of levels accepted in an inclusion proof. A "
             "proof has one level per tree level above its leaf.");

using lightproof::proto::AuditPathNode;
using lightproof::proto::MerkleAuditProof;
using lightproof::serialization::DeserializeResult;
using lightproof::serialization::SerializeResult;
using std::ostream;
using std::string;
using std::vector;
using util::Status;
using util::StatusOr;

namespace lightproof {

namespace serialization {


ostream& operator<<(ostream& stream, const SerializeResult& r) {
  switch (r) {
    case SerializeResult::OK:
      return stream << "OK";
    case SerializeResult::LEAF_DATA_TOO_LONG:
      return stream << "LEAF_DATA_TOO_LONG";
    case SerializeResult::INVALID_HASH_LENGTH:
      return stream << "INVALID_HASH_LENGTH";
    case SerializeResult::TOO_MANY_LEVELS:
      return stream << "TOO_MANY_LEVELS";
  }
  return stream << "<unknown>";
}


ostream& operator<<(ostream& stream, const DeserializeResult& r) {
  switch (r) {
    case DeserializeResult::OK:
      return stream << "OK";
    case DeserializeResult::INPUT_TOO_SHORT:
      return stream << "INPUT_TOO_SHORT";
    case DeserializeResult::INVALID_SIDE:
      return stream << "INVALID_SIDE";
    case DeserializeResult::TOO_MANY_LEVELS:
      return stream << "TOO_MANY_LEVELS";
  }
  return stream << "<unknown>";
}


}  // namespace serialization


namespace {


bool TooManyLevels(int levels) {
  return levels > FLAGS_max_merkle_proof_levels;
}


Side SideFromProto(AuditPathNode::Side side) {
  switch (side) {
    case AuditPathNode::LEFT:
      return Side::LEFT;
    case AuditPathNode::RIGHT:
      return Side::RIGHT;
  }
  LOG(FATAL) << "unexpected AuditPathNode side " << side;
  return Side::LEFT;
}


AuditPathNode::Side SideToProto(Side side) {
  switch (side) {
    case Side::LEFT:
      return AuditPathNode::LEFT;
    case Side::RIGHT:
      return AuditPathNode::RIGHT;
  }
  LOG(FATAL) << "unexpected side " << static_cast<int>(side);
  return AuditPathNode::LEFT;
}


}  // namespace


SerializeResult SerializeAuditProof(const MerkleAuditProof& proof,
                                    string* result) {
  CHECK_NOTNULL(result);
  if (proof.leaf_data().size() > serialization::constants::kMaxLeafDataLength)
    return SerializeResult::LEAF_DATA_TOO_LONG;
  if (TooManyLevels(proof.path_size()))
    return SerializeResult::TOO_MANY_LEVELS;
  for (int i = 0; i < proof.path_size(); ++i) {
    if (proof.path(i).sibling().size() != Digest::kSize)
      return SerializeResult::INVALID_HASH_LENGTH;
  }

  string output;
  serialization::WriteVarBytes(proof.leaf_data(),
                               serialization::constants::kMaxLeafDataLength,
                               &output);
  for (int i = 0; i < proof.path_size(); ++i) {
    serialization::WriteUint(static_cast<int>(proof.path(i).side()),
                             serialization::constants::kSideLengthInBytes,
                             &output);
    serialization::WriteFixedBytes(proof.path(i).sibling(), &output);
  }
  result->swap(output);
  return SerializeResult::OK;
}


DeserializeResult DeserializeAuditProof(const string& in,
                                        MerkleAuditProof* proof) {
  CHECK_NOTNULL(proof);
  TLSDeserializer deserializer(in);

  MerkleAuditProof local;
  if (!deserializer.ReadVarBytes(serialization::constants::kMaxLeafDataLength,
                                 local.mutable_leaf_data())) {
    VLOG(1) << "Truncated leaf data in proof of " << in.size() << " bytes";
    return DeserializeResult::INPUT_TOO_SHORT;
  }

  while (!deserializer.ReachedEnd()) {
    if (TooManyLevels(local.path_size() + 1)) {
      VLOG(1) << "Proof has more than " << FLAGS_max_merkle_proof_levels
              << " levels";
      return DeserializeResult::TOO_MANY_LEVELS;
    }

    int side;
    string sibling;
    if (!deserializer.ReadUint(serialization::constants::kSideLengthInBytes,
                               &side) ||
        !deserializer.ReadFixedBytes(Digest::kSize, &sibling)) {
      VLOG(1) << "Truncated level " << local.path_size() << " in proof";
      return DeserializeResult::INPUT_TOO_SHORT;
    }
    if (!AuditPathNode::Side_IsValid(side)) {
      VLOG(1) << "Invalid side byte " << side << " at level "
              << local.path_size();
      return DeserializeResult::INVALID_SIDE;
    }

    AuditPathNode* node(local.add_path());
    node->set_side(static_cast<AuditPathNode::Side>(side));
    node->set_sibling(sibling);
  }

  proof->Swap(&local);
  return DeserializeResult::OK;
}


void MerkleProofToProto(const MerkleProof& proof, MerkleAuditProof* result) {
  CHECK_NOTNULL(result);
  result->Clear();
  result->set_leaf_data(proof.leaf_data());
  for (vector<LevelNode>::const_iterator it = proof.levels().begin();
       it != proof.levels().end(); ++it) {
    AuditPathNode* node(result->add_path());
    node->set_sibling(it->sibling().ToString());
    node->set_side(SideToProto(it->side()));
  }
}


StatusOr<MerkleProof> MerkleProofFromProto(const MerkleAuditProof& proof) {
  if (TooManyLevels(proof.path_size())) {
    std::ostringstream oss;
    oss << "proof has " << proof.path_size() << " levels, more than the "
        << FLAGS_max_merkle_proof_levels << " allowed";
    return Status(util::error::INVALID_ARGUMENT, oss.str());
  }

  vector<LevelNode> levels;
  levels.reserve(proof.path_size());
  for (int i = 0; i < proof.path_size(); ++i) {
    // set_side() only checks its argument in debug builds.
    if (!AuditPathNode::Side_IsValid(proof.path(i).side())) {
      std::ostringstream oss;
      oss << "level " << i << " has invalid side "
          << static_cast<int>(proof.path(i).side());
      return Status(util::error::INVALID_ARGUMENT, oss.str());
    }
    const StatusOr<LevelNode> level(
        LevelNode::Create(proof.path(i).sibling(),
                          SideFromProto(proof.path(i).side())));
    if (!level.ok()) {
      return level.status();
    }
    levels.push_back(level.ValueOrDie());
  }

  return MerkleProof::Create(proof.leaf_data(), std::move(levels));
}


StatusOr<string> SerializeMerkleProof(const MerkleProof& proof) {
  MerkleAuditProof pb;
  MerkleProofToProto(proof, &pb);

  string result;
  const SerializeResult res(SerializeAuditProof(pb, &result));
  if (res != SerializeResult::OK) {
    std::ostringstream oss;
    oss << "cannot serialize proof: " << res;
    return Status(util::error::INVALID_ARGUMENT, oss.str());
  }
  return result;
}


StatusOr<MerkleProof> DeserializeMerkleProof(const string& in) {
  MerkleAuditProof pb;
  const DeserializeResult res(DeserializeAuditProof(in, &pb));
  if (res != DeserializeResult::OK) {
    std::ostringstream oss;
    oss << "malformed proof: " << res;
    return Status(util::error::INVALID_ARGUMENT, oss.str());
  }
  return MerkleProofFromProto(pb);
}


}  // namespace lightproof
