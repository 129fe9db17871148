// SEMAPHORE - Rapidsnark Groth16 Backend
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Production backend: witnesses come from the circuit's witness generator,
// proofs from rapidsnark's groth16_prover and verification from
// groth16_verify. Proving keys and verification keys are read once per
// path and kept in memory.

#ifndef SEMAPHORE_PROOF_RAPIDSNARK_BACKEND_H
#define SEMAPHORE_PROOF_RAPIDSNARK_BACKEND_H

#include "semaphore/core/types.h"
#include "semaphore/proof/backend.h"
#include "semaphore/util/json.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace semaphore {
namespace proof {

/**
 * Runs a compiled circuit's witness generator (circom's C++ or wasm
 * output) on an input object from circom::CircuitInputsToJSON.
 *
 * Implementations must be safe to call from several threads.
 */
class IWitnessCalculator {
public:
    virtual ~IWitnessCalculator() = default;

    /// @return the witness as a .wtns file
    /// @throws ProvingError if the inputs violate a circuit constraint
    virtual Bytes Calculate(const CircuitArtifacts& circuit, const util::JSONValue& inputs) = 0;
};

class RapidsnarkBackend : public IProvingBackend {
public:
    explicit RapidsnarkBackend(std::shared_ptr<IWitnessCalculator> calculator);
    ~RapidsnarkBackend() override;

    Witness ComputeWitness(const CircuitArtifacts& circuit,
                           const WitnessInputs& inputs) override;

    /// @throws ProvingError if the proving key cannot be read or rapidsnark fails
    Groth16Points Prove(const CircuitArtifacts& circuit,
                        const Witness& witness) override;

    /// @throws ProvingError if the verification key cannot be read or is rejected
    bool Verify(const CircuitArtifacts& circuit,
                const std::vector<FieldElement>& publicInputs,
                const Groth16Points& points) override;

    /// Drop cached keys (e.g. after artifacts were rebuilt)
    void ClearCache();

private:
    std::shared_ptr<const Bytes> ProvingKey(const std::string& path);
    std::shared_ptr<const std::string> VerificationKey(const std::string& path);

    std::shared_ptr<IWitnessCalculator> calculator_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const Bytes>> provingKeys_;
    std::map<std::string, std::shared_ptr<const std::string>> verificationKeys_;
};

} // namespace proof
} // namespace semaphore

#endif // SEMAPHORE_PROOF_RAPIDSNARK_BACKEND_H
