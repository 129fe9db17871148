// SEMAPHORE - Rapidsnark Groth16 Backend Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/rapidsnark_backend.h"

#include "semaphore/core/errors.h"
#include "semaphore/proof/circom.h"
#include "semaphore/util/logging.h"

#include <prover.h>
#include <verifier.h>

#include <openssl/crypto.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace semaphore {
namespace proof {

namespace {

constexpr unsigned long INITIAL_PROOF_BUFFER = 4 * 1024;
constexpr unsigned long INITIAL_PUBLIC_BUFFER = 4 * 1024;
constexpr unsigned long ERROR_BUFFER = 256;

std::string ReadFile(const std::string& path, const char* what) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ProvingError(std::string("Cannot open ") + what + " '" + path + "'");
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string CString(const std::vector<char>& buffer) {
    return std::string(buffer.data());
}

} // namespace

RapidsnarkBackend::RapidsnarkBackend(std::shared_ptr<IWitnessCalculator> calculator)
    : calculator_(std::move(calculator)) {
    if (!calculator_) {
        throw std::invalid_argument("RapidsnarkBackend needs a witness calculator");
    }
}

RapidsnarkBackend::~RapidsnarkBackend() = default;

void RapidsnarkBackend::ClearCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    provingKeys_.clear();
    verificationKeys_.clear();
}

std::shared_ptr<const Bytes> RapidsnarkBackend::ProvingKey(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = provingKeys_.find(path);
    if (it != provingKeys_.end()) {
        return it->second;
    }
    std::string contents = ReadFile(path, "proving key");
    auto key = std::make_shared<const Bytes>(contents.begin(), contents.end());
    provingKeys_.emplace(path, key);
    LOG_DEBUG(util::LogCategory::Proof) << "Loaded proving key " << path << " ("
                                        << key->size() << " bytes)";
    return key;
}

std::shared_ptr<const std::string> RapidsnarkBackend::VerificationKey(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = verificationKeys_.find(path);
    if (it != verificationKeys_.end()) {
        return it->second;
    }
    auto key = std::make_shared<const std::string>(ReadFile(path, "verification key"));
    verificationKeys_.emplace(path, key);
    return key;
}

// ============================================================================
// Witness
// ============================================================================

Witness RapidsnarkBackend::ComputeWitness(const CircuitArtifacts& circuit,
                                          const WitnessInputs& inputs) {
    if (inputs.merkleProofSiblings.size() != circuit.depth) {
        throw ProvingError("Circuit of depth " + std::to_string(circuit.depth) + " expects " +
                           std::to_string(circuit.depth) + " siblings, got " +
                           std::to_string(inputs.merkleProofSiblings.size()));
    }

    util::JSONValue json = circom::CircuitInputsToJSON(inputs);
    Bytes wtns = calculator_->Calculate(circuit, json);

    Witness witness;
    try {
        witness.values = circom::DecodeWtns(wtns);
    } catch (...) {
        OPENSSL_cleanse(wtns.data(), wtns.size());
        throw;
    }
    OPENSSL_cleanse(wtns.data(), wtns.size());

    if (witness.values.empty() || witness.values[0] != FieldElement::One()) {
        throw ProvingError("Witness does not start with the constant signal 1");
    }
    witness.publicSignals = inputs.PublicInputs();

    LOG_TRACE(util::LogCategory::Proof) << "Witness generator produced "
                                        << witness.values.size() << " signals";
    return witness;
}

// ============================================================================
// Prove / Verify
// ============================================================================

Groth16Points RapidsnarkBackend::Prove(const CircuitArtifacts& circuit, const Witness& witness) {
    std::shared_ptr<const Bytes> zkey = ProvingKey(circuit.zkeyPath);
    Bytes wtns = circom::EncodeWtns(witness.values);

    unsigned long proofSize = INITIAL_PROOF_BUFFER;
    unsigned long publicSize = INITIAL_PUBLIC_BUFFER;
    std::vector<char> proofBuffer;
    std::vector<char> publicBuffer;
    std::vector<char> error(ERROR_BUFFER, '\0');

    int status = PROVER_ERROR_SHORT_BUFFER;
    // A short buffer reports the sizes it needs; the second pass uses them
    for (int attempt = 0; attempt < 2 && status == PROVER_ERROR_SHORT_BUFFER; ++attempt) {
        proofBuffer.assign(proofSize, '\0');
        publicBuffer.assign(publicSize, '\0');
        status = groth16_prover(zkey->data(), zkey->size(), wtns.data(), wtns.size(),
                                proofBuffer.data(), &proofSize,
                                publicBuffer.data(), &publicSize,
                                error.data(), error.size());
    }
    OPENSSL_cleanse(wtns.data(), wtns.size());

    switch (status) {
    case PROVER_OK:
        break;
    case PROVER_INVALID_WITNESS_LENGTH:
        throw ProvingError("Witness length does not match the proving key for depth " +
                           std::to_string(circuit.depth));
    case PROVER_ERROR_SHORT_BUFFER:
        throw ProvingError("Proof does not fit the buffer sizes reported by the prover");
    default:
        throw ProvingError("groth16_prover failed: " + CString(error));
    }

    auto json = util::JSONValue::TryParse(CString(proofBuffer));
    if (!json) {
        throw ProvingError("groth16_prover returned malformed proof JSON");
    }
    return circom::Groth16FromJSON(*json);
}

bool RapidsnarkBackend::Verify(const CircuitArtifacts& circuit,
                               const std::vector<FieldElement>& publicInputs,
                               const Groth16Points& points) {
    std::shared_ptr<const std::string> vkey = VerificationKey(circuit.vkeyPath);
    std::string proofJson = circom::Groth16ToJSON(points).ToJSON();
    std::string inputsJson = circom::PublicSignalsToJSON(publicInputs).ToJSON();
    std::vector<char> error(ERROR_BUFFER, '\0');

    int status = groth16_verify(proofJson.c_str(), inputsJson.c_str(), vkey->c_str(),
                                error.data(), error.size());
    switch (status) {
    case VERIFIER_VALID_PROOF:
        return true;
    case VERIFIER_INVALID_PROOF:
        return false;
    default:
        throw ProvingError("groth16_verify failed: " + CString(error));
    }
}

} // namespace proof
} // namespace semaphore
