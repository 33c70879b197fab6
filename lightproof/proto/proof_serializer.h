#ifndef LIGHTPROOF_PROTO_PROOF_SERIALIZER_H_
#define LIGHTPROOF_PROTO_PROOF_SERIALIZER_H_

#include <stddef.h>
#include <ostream>
#include <string>

#include "merkletree/merkle_proof.h"
#include "proto/lightproof.pb.h"
#include "util/statusor.h"

namespace lightproof {

// Binary encoding of an inclusion proof:
//
//   opaque leaf_data<0..2^16-1>;
//   struct {
//     uint8 side;            // 0 = LEFT, 1 = RIGHT
//     opaque sibling[32];
//   } level;                 // repeated until the end of the input
//
// The number of levels is capped by --max_merkle_proof_levels.
namespace serialization {

enum class SerializeResult {
  OK,
  LEAF_DATA_TOO_LONG,
  INVALID_HASH_LENGTH,
  TOO_MANY_LEVELS,
};

std::ostream& operator<<(std::ostream& stream, const SerializeResult& r);

enum class DeserializeResult {
  OK,
  INPUT_TOO_SHORT,
  INVALID_SIDE,
  TOO_MANY_LEVELS,
};

std::ostream& operator<<(std::ostream& stream, const DeserializeResult& r);

namespace constants {
static const size_t kMaxLeafDataLength = (1 << 16) - 1;
static const size_t kSideLengthInBytes = 1;
}  // namespace constants

}  // namespace serialization


// Wire format <-> protobuf. These check framing only: sibling lengths
// and leaf policy are checked when building a MerkleProof.
serialization::SerializeResult SerializeAuditProof(
    const proto::MerkleAuditProof& proof, std::string* result);

serialization::DeserializeResult DeserializeAuditProof(
    const std::string& in, proto::MerkleAuditProof* proof);


// Protobuf <-> MerkleProof. MerkleProofFromProto() applies the same
// checks as LevelNode::Create() and MerkleProof::Create().
void MerkleProofToProto(const MerkleProof& proof,
                        proto::MerkleAuditProof* result);

util::StatusOr<MerkleProof> MerkleProofFromProto(
    const proto::MerkleAuditProof& proof);


// Wire format <-> MerkleProof. Framing errors are reported as
// INVALID_ARGUMENT; content errors as by MerkleProofFromProto().
util::StatusOr<std::string> SerializeMerkleProof(const MerkleProof& proof);

util::StatusOr<MerkleProof> DeserializeMerkleProof(const std::string& in);


}  // namespace lightproof

#endif  // LIGHTPROOF_PROTO_PROOF_SERIALIZER_H_
