// SEMAPHORE - Semaphore Proof Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/proof.h"

#include <sstream>

namespace semaphore {
namespace proof {

PackedGroth16Proof Groth16Points::Pack() const {
    return {a[0], a[1], b[0][1], b[0][0], b[1][1], b[1][0], c[0], c[1]};
}

Groth16Points Groth16Points::Unpack(const PackedGroth16Proof& packed) {
    Groth16Points points;
    points.a = {packed[0], packed[1]};
    points.b[0] = {packed[3], packed[2]};
    points.b[1] = {packed[5], packed[4]};
    points.c = {packed[6], packed[7]};
    return points;
}

bool SemaphoreProof::operator==(const SemaphoreProof& other) const {
    return merkleTreeDepth == other.merkleTreeDepth &&
           merkleTreeRoot == other.merkleTreeRoot &&
           nullifier == other.nullifier &&
           message == other.message &&
           scope == other.scope &&
           points == other.points;
}

std::string SemaphoreProof::ToString() const {
    std::ostringstream oss;
    oss << "SemaphoreProof(depth=" << merkleTreeDepth
        << ", root=" << merkleTreeRoot.ToDecimal()
        << ", nullifier=" << nullifier.ToDecimal() << ")";
    return oss.str();
}

} // namespace proof
} // namespace semaphore
