// SEMAPHORE - Proof Generation and Verification Tests
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include <gtest/gtest.h>

#include "semaphore/core/errors.h"
#include "semaphore/crypto/poseidon.h"
#include "semaphore/group/group.h"
#include "semaphore/identity/identity.h"
#include "semaphore/proof/native_backend.h"
#include "semaphore/proof/prover.h"
#include "semaphore/proof/signal.h"
#include "semaphore/util/logging.h"
#include "semaphore/util/threadpool.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace semaphore;
using namespace semaphore::proof;
using semaphore::group::Group;
using semaphore::group::MerkleProof;
using semaphore::identity::Identity;

namespace {

FieldElement Fe(uint64_t v) { return FieldElement(v); }

/// Native backend that remembers the last witness inputs it saw
class RecordingBackend : public NativeBackend {
public:
    Witness ComputeWitness(const CircuitArtifacts& circuit,
                           const WitnessInputs& inputs) override {
        lastInputs = inputs;
        lastCircuit = circuit;
        return NativeBackend::ComputeWitness(circuit, inputs);
    }

    WitnessInputs lastInputs;
    CircuitArtifacts lastCircuit;
};

/// Backend whose verifier always fails with an exception
class ThrowingVerifier : public NativeBackend {
public:
    bool Verify(const CircuitArtifacts&, const std::vector<FieldElement>&,
                const Groth16Points&) override {
        throw std::runtime_error("verification key unreadable");
    }
};

} // namespace

class ProverTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<RecordingBackend>();
        registry_ = ArtifactRegistry::FromDirectory("artifacts");
        prover_ = std::make_unique<Prover>(backend_, registry_);
        group_ = Group({c1_.Commitment(), c2_.Commitment(), c3_.Commitment()});
    }

    Identity c1_ = Identity::FromString("member-1");
    Identity c2_ = Identity::FromString("member-2");
    Identity c3_ = Identity::FromString("member-3");
    Group group_;

    std::shared_ptr<RecordingBackend> backend_;
    std::shared_ptr<const ArtifactRegistry> registry_;
    std::unique_ptr<Prover> prover_;

    const Bytes hello_ = ToBytes("hello");
    const Bytes vote1_ = ToBytes("vote-1");
};

// ============================================================================
// Generation
// ============================================================================

TEST_F(ProverTest, GeneratedProofCarriesPublicSignals) {
    SemaphoreProof proof = prover_->GenerateProof(c2_, group_, hello_, vote1_, 2);

    EXPECT_EQ(proof.merkleTreeDepth, 2);
    EXPECT_EQ(proof.merkleTreeRoot, *group_.Root());
    EXPECT_EQ(proof.message, EncodeSignal(hello_));
    EXPECT_EQ(proof.scope, EncodeSignal(vote1_));
    EXPECT_EQ(proof.nullifier, ComputeNullifier(c2_, EncodeSignal(vote1_)));
    EXPECT_EQ(proof.nullifier,
              Poseidon::Hash2(HashSignal(EncodeSignal(vote1_)), c2_.Nullifier()));
}

TEST_F(ProverTest, WitnessInputsArePaddedToDepth) {
    prover_->GenerateProof(c1_, group_, hello_, vote1_, 10);

    const WitnessInputs& inputs = backend_->lastInputs;
    EXPECT_EQ(backend_->lastCircuit.depth, 10);
    EXPECT_EQ(inputs.depth, 10);
    EXPECT_EQ(inputs.merkleProofLength, 2u);
    ASSERT_EQ(inputs.merkleProofSiblings.size(), 10u);
    EXPECT_EQ(inputs.merkleProofSiblings[0], c2_.Commitment());
    EXPECT_EQ(inputs.merkleProofSiblings[1], c3_.Commitment());
    for (size_t i = 2; i < 10; ++i) {
        EXPECT_TRUE(inputs.merkleProofSiblings[i].IsZero());
    }
    EXPECT_EQ(inputs.trapdoor, c1_.Trapdoor());
    EXPECT_EQ(inputs.identityNullifier, c1_.Nullifier());
}

TEST_F(ProverTest, PublicInputOrder) {
    SemaphoreProof proof = prover_->GenerateProof(c1_, group_, hello_, vote1_, 2);

    auto pub = backend_->lastInputs.PublicInputs();
    ASSERT_EQ(pub.size(), 5u);
    EXPECT_EQ(pub[0], proof.merkleTreeRoot);
    EXPECT_EQ(pub[1], proof.nullifier);
    EXPECT_EQ(pub[2], HashSignal(proof.message));
    EXPECT_EQ(pub[3], HashSignal(proof.scope));
    EXPECT_EQ(pub[4], FieldElement(uint64_t{2}));
    EXPECT_EQ(pub, PublicInputsOf(proof));
}

TEST_F(ProverTest, DefaultDepthFollowsGroup) {
    SemaphoreProof proof = prover_->GenerateProof(c1_, group_, hello_, vote1_);
    EXPECT_EQ(proof.merkleTreeDepth, 2);

    Group single({c1_.Commitment()});
    SemaphoreProof singleProof = prover_->GenerateProof(c1_, single, hello_, vote1_);
    EXPECT_EQ(singleProof.merkleTreeDepth, MIN_TREE_DEPTH);
    EXPECT_EQ(singleProof.merkleTreeRoot, c1_.Commitment());
    EXPECT_TRUE(prover_->VerifyProof(singleProof));
}

TEST_F(ProverTest, FromPrecomputedMerkleProof) {
    MerkleProof path = group_.GenerateMerkleProof(2);
    SemaphoreProof proof = prover_->GenerateProof(c3_, path, hello_, vote1_, 4);
    EXPECT_EQ(proof.merkleTreeRoot, *group_.Root());
    EXPECT_TRUE(prover_->VerifyProof(proof));
}

TEST_F(ProverTest, LongMessageIsAccepted) {
    Bytes longMessage = ToBytes("This message is over 32 bytes long!!");
    SemaphoreProof proof = prover_->GenerateProof(c1_, group_, longMessage, vote1_, 2);
    EXPECT_EQ(proof.message, EncodeSignal(longMessage));
    EXPECT_TRUE(prover_->VerifyProof(proof));
}

// ============================================================================
// Nullifiers
// ============================================================================

TEST_F(ProverTest, NullifierIndependentOfMessage) {
    auto p1 = prover_->GenerateProof(c1_, group_, ToBytes("yes"), vote1_, 2);
    auto p2 = prover_->GenerateProof(c1_, group_, ToBytes("no"), vote1_, 2);
    EXPECT_EQ(p1.nullifier, p2.nullifier);
    EXPECT_NE(p1.points, p2.points);
}

TEST_F(ProverTest, NullifierDependsOnScope) {
    auto p1 = prover_->GenerateProof(c1_, group_, hello_, ToBytes("vote-1"), 2);
    auto p2 = prover_->GenerateProof(c1_, group_, hello_, ToBytes("vote-2"), 2);
    EXPECT_NE(p1.nullifier, p2.nullifier);
}

TEST_F(ProverTest, NullifierDependsOnIdentity) {
    auto p1 = prover_->GenerateProof(c1_, group_, hello_, vote1_, 2);
    auto p2 = prover_->GenerateProof(c2_, group_, hello_, vote1_, 2);
    EXPECT_NE(p1.nullifier, p2.nullifier);
}

TEST_F(ProverTest, NullifierIndependentOfDepth) {
    auto p1 = prover_->GenerateProof(c1_, group_, hello_, vote1_, 2);
    auto p2 = prover_->GenerateProof(c1_, group_, hello_, vote1_, 16);
    EXPECT_EQ(p1.nullifier, p2.nullifier);
}

// ============================================================================
// Generation Failures
// ============================================================================

TEST_F(ProverTest, NonMemberRejected) {
    Identity outsider = Identity::FromString("outsider");
    EXPECT_THROW(prover_->GenerateProof(outsider, group_, hello_, vote1_, 2),
                 MemberNotFoundError);
}

TEST_F(ProverTest, UnsupportedDepthRejected) {
    EXPECT_THROW(prover_->GenerateProof(c1_, group_, hello_, vote1_, 0), UnsupportedDepthError);
    EXPECT_THROW(prover_->GenerateProof(c1_, group_, hello_, vote1_, 33), UnsupportedDepthError);
}

TEST_F(ProverTest, DepthBelowPathLengthRejected) {
    Group five({c2_.Commitment(), Fe(2), Fe(3), Fe(4), c1_.Commitment()});
    ASSERT_EQ(five.Depth(), 3u);
    EXPECT_THROW(prover_->GenerateProof(c2_, five, hello_, vote1_, 2), ProvingError);
}

TEST_F(ProverTest, StaleRootRejected) {
    MerkleProof path = group_.GenerateMerkleProof(0);
    path.root = Poseidon::Hash2(path.root, path.root);
    EXPECT_THROW(prover_->GenerateProof(c1_, path, hello_, vote1_, 2), ProvingError);
}

TEST_F(ProverTest, PathForAnotherMemberRejected) {
    MerkleProof path = group_.GenerateMerkleProof(1);
    EXPECT_THROW(prover_->GenerateProof(c1_, path, hello_, vote1_, 2), ProvingError);
}

TEST_F(ProverTest, RestrictedRegistry) {
    Prover narrow(backend_, ArtifactRegistry::FromDirectory("artifacts", 4, 8));
    EXPECT_THROW(narrow.GenerateProof(c1_, group_, hello_, vote1_, 2), UnsupportedDepthError);

    SemaphoreProof proof = prover_->GenerateProof(c1_, group_, hello_, vote1_, 2);
    EXPECT_FALSE(narrow.VerifyProof(proof));
}

TEST_F(ProverTest, ConstructorRequiresCollaborators) {
    EXPECT_THROW(Prover(nullptr, registry_), std::invalid_argument);
    EXPECT_THROW(Prover(backend_, nullptr), std::invalid_argument);
}

// ============================================================================
// Verification
// ============================================================================

TEST_F(ProverTest, TamperedProofsRejected) {
    SemaphoreProof proof = prover_->GenerateProof(c2_, group_, hello_, vote1_, 2);
    ASSERT_TRUE(prover_->VerifyProof(proof));

    SemaphoreProof wrongRoot = proof;
    wrongRoot.merkleTreeRoot = wrongRoot.merkleTreeRoot + FieldElement::One();
    EXPECT_FALSE(prover_->VerifyProof(wrongRoot));

    SemaphoreProof wrongNullifier = proof;
    wrongNullifier.nullifier = FieldElement(uint64_t{1});
    EXPECT_FALSE(prover_->VerifyProof(wrongNullifier));

    SemaphoreProof wrongMessage = proof;
    wrongMessage.message = EncodeSignal(ToBytes("goodbye"));
    EXPECT_FALSE(prover_->VerifyProof(wrongMessage));

    SemaphoreProof wrongScope = proof;
    wrongScope.scope = EncodeSignal(ToBytes("vote-2"));
    EXPECT_FALSE(prover_->VerifyProof(wrongScope));

    SemaphoreProof wrongPoints = proof;
    wrongPoints.points.a[0] = Uint256(1);
    EXPECT_FALSE(prover_->VerifyProof(wrongPoints));

    SemaphoreProof wrongDepth = proof;
    wrongDepth.merkleTreeDepth = 3;
    EXPECT_FALSE(prover_->VerifyProof(wrongDepth));
}

TEST_F(ProverTest, UnsupportedDepthVerifiesFalse) {
    SemaphoreProof proof = prover_->GenerateProof(c1_, group_, hello_, vote1_, 2);
    proof.merkleTreeDepth = 0;
    EXPECT_FALSE(prover_->VerifyProof(proof));
    proof.merkleTreeDepth = 33;
    EXPECT_FALSE(prover_->VerifyProof(proof));
    proof.merkleTreeDepth = 65535;
    EXPECT_FALSE(prover_->VerifyProof(proof));
}

TEST_F(ProverTest, BackendErrorsVerifyFalse) {
    SemaphoreProof proof = prover_->GenerateProof(c1_, group_, hello_, vote1_, 2);
    Prover failing(std::make_shared<ThrowingVerifier>(), registry_);
    EXPECT_FALSE(failing.VerifyProof(proof));
}

TEST_F(ProverTest, ProofSurvivesMemberRemoval) {
    SemaphoreProof proof = prover_->GenerateProof(c2_, group_, hello_, vote1_, 2);
    EXPECT_TRUE(prover_->VerifyProof(proof));

    auto index = group_.IndexOf(c2_.Commitment());
    ASSERT_TRUE(index.has_value());
    group_.RemoveMember(*index);

    EXPECT_TRUE(prover_->VerifyProof(proof));
    EXPECT_FALSE(prover_->VerifyProof(proof, *group_.Root()));
    EXPECT_THROW(prover_->GenerateProof(c2_, group_, hello_, vote1_, 2), MemberNotFoundError);
}

TEST_F(ProverTest, DepthBoundaryInvalidatesOldRoot) {
    Identity c4 = Identity::FromString("member-4");
    Identity c5 = Identity::FromString("member-5");
    group_.AddMember(c4.Commitment());
    ASSERT_EQ(group_.Depth(), 2u);
    FieldElement oldRoot = *group_.Root();

    std::vector<SemaphoreProof> issued;
    for (const Identity* id : {&c1_, &c2_, &c3_, &c4}) {
        issued.push_back(prover_->GenerateProof(*id, group_, hello_, vote1_, 2));
    }

    group_.AddMember(c5.Commitment());
    EXPECT_EQ(group_.Depth(), 3u);
    FieldElement newRoot = *group_.Root();
    ASSERT_NE(oldRoot, newRoot);

    for (const auto& proof : issued) {
        EXPECT_TRUE(prover_->VerifyProof(proof));
        EXPECT_TRUE(prover_->VerifyProof(proof, oldRoot));
        EXPECT_FALSE(prover_->VerifyProof(proof, newRoot));
    }
}

TEST_F(ProverTest, BatchVerification) {
    SemaphoreProof good = prover_->GenerateProof(c1_, group_, hello_, vote1_, 2);
    SemaphoreProof bad = good;
    bad.nullifier = FieldElement::One();
    SemaphoreProof other = prover_->GenerateProof(c3_, group_, hello_, vote1_, 8);

    std::vector<SemaphoreProof> batch = {good, bad, other};
    std::vector<bool> expected = {true, false, true};
    EXPECT_EQ(prover_->VerifyProofs(batch), expected);

    util::ThreadPool pool(2);
    EXPECT_EQ(prover_->VerifyProofs(batch, pool), expected);
    EXPECT_TRUE(prover_->VerifyProofs({}, pool).empty());
}

TEST_F(ProverTest, BatchVerificationLargerThanPoolQueue) {
    SemaphoreProof good = prover_->GenerateProof(c1_, group_, hello_, vote1_, 2);
    SemaphoreProof bad = good;
    bad.scope = EncodeSignal(ToBytes("vote-2"));

    std::vector<SemaphoreProof> batch;
    std::vector<bool> expected;
    for (int i = 0; i < 64; ++i) {
        batch.push_back(i % 5 == 0 ? bad : good);
        expected.push_back(i % 5 != 0);
    }

    util::ThreadPool::Config config;
    config.numThreads = 1;
    config.maxQueueSize = 8;
    config.name = "verify";
    util::ThreadPool pool(config);

    EXPECT_EQ(prover_->VerifyProofs(batch, pool), expected);
}

TEST_F(ProverTest, GenerationIsLoggedWithoutSecrets) {
    auto& logger = util::Logger::Instance();
    std::vector<util::LogRecord> entries;
    auto sink = std::make_shared<util::CallbackSink>(
        [&entries](const util::LogRecord& record) { entries.push_back(record); });

    util::LogLevel previous = logger.GetLevel();
    logger.SetLevel(util::LogLevel::Trace);
    logger.AddSink(sink);
    prover_->GenerateProof(c1_, group_, hello_, vote1_, 2);
    logger.RemoveSink(sink);
    logger.SetLevel(previous);

    bool sawTiming = false;
    for (const auto& entry : entries) {
        if (entry.level == util::LogLevel::Debug &&
            entry.category == util::LogCategory::Proof &&
            entry.message.find("Proof generation") != std::string::npos) {
            sawTiming = true;
        }
        EXPECT_EQ(entry.message.find(c1_.Trapdoor().ToDecimal()), std::string::npos);
        EXPECT_EQ(entry.message.find(c1_.Nullifier().ToDecimal()), std::string::npos);
    }
    EXPECT_TRUE(sawTiming);
}
