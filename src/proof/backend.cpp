// SEMAPHORE - Circuit Inputs
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/backend.h"

#include "semaphore/proof/signal.h"

#include <openssl/crypto.h>

namespace semaphore {
namespace proof {

WitnessInputs::~WitnessInputs() {
    OPENSSL_cleanse(&trapdoor, sizeof(trapdoor));
    OPENSSL_cleanse(&identityNullifier, sizeof(identityNullifier));
}

void Witness::Wipe() {
    if (!values.empty()) {
        OPENSSL_cleanse(values.data(), values.size() * sizeof(FieldElement));
    }
    values.clear();
}

std::vector<FieldElement> WitnessInputs::PublicInputs() const {
    return {merkleTreeRoot, nullifier, signalHash, scopeHash,
            FieldElement(static_cast<uint64_t>(depth))};
}

std::vector<FieldElement> PublicInputsOf(const SemaphoreProof& proof) {
    return {proof.merkleTreeRoot,
            proof.nullifier,
            HashSignal(proof.message),
            HashSignal(proof.scope),
            FieldElement(static_cast<uint64_t>(proof.merkleTreeDepth))};
}

} // namespace proof
} // namespace semaphore
