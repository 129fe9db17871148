// SEMAPHORE - Identity Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/identity/identity.h"

#include "semaphore/core/errors.h"
#include "semaphore/core/random.h"
#include "semaphore/crypto/blake512.h"
#include "semaphore/crypto/poseidon.h"
#include "semaphore/crypto/sha256.h"
#include "semaphore/util/logging.h"

#include <array>
#include <cstring>
#include <string>

#include <openssl/crypto.h>

namespace semaphore {
namespace identity {

namespace {

FieldElement DeriveScalar(const Bytes& seed, const char* domain) {
    SHA256 hasher;
    hasher.Write(seed.data(), seed.size());
    hasher.Write(reinterpret_cast<const Byte*>(domain), std::strlen(domain));
    std::array<Byte, SHA256::OUTPUT_SIZE> digest;
    hasher.Finalize(digest.data());
    FieldElement scalar = FieldElement::FromBytes(digest.data(), digest.size());
    OPENSSL_cleanse(digest.data(), digest.size());
    return scalar;
}

/// BLAKE-512 of the private key with the scalar half pruned
Hash512 PrunedKeyHash(const Bytes& privateKey) {
    Hash512 h = Blake512Hash(privateKey);
    h[0] &= 0xF8;
    h[31] &= 0x7F;
    h[31] |= 0x40;
    return h;
}

void CheckMessageSize(const Bytes& message) {
    if (message.size() > MAX_MESSAGE_SIZE) {
        throw MessageTooLongError("Message is " + std::to_string(message.size()) +
                                  " bytes, at most " + std::to_string(MAX_MESSAGE_SIZE) +
                                  " can be signed");
    }
}

/// c = Poseidon(R8.x, R8.y, A.x, A.y, message) reduced mod l
babyjubjub::Scalar Challenge(const babyjubjub::Point& r, const babyjubjub::Point& a,
                             const Bytes& message) {
    FieldElement m(Uint256::FromBytesBE(message.data(), message.size()));
    FieldElement c = Poseidon::Hash({r.X(), r.Y(), a.X(), a.Y(), m});
    return babyjubjub::Scalar::FromUint256(c.ToUint256());
}

} // namespace

// ============================================================================
// PublicKey
// ============================================================================

FieldElement PublicKey::Commitment() const {
    return Poseidon::Hash2(point_.X(), point_.Y());
}

bool PublicKey::VerifySignature(const Bytes& message, const Signature& signature) const {
    CheckMessageSize(message);

    if (!signature.r.IsOnCurve() || !point_.IsOnCurve()) {
        return false;
    }

    babyjubjub::Scalar c = Challenge(signature.r, point_, message);
    babyjubjub::Scalar cofactor = babyjubjub::Scalar::FromUint256(Uint256(babyjubjub::COFACTOR));

    babyjubjub::Point left = babyjubjub::Point::Base8() * signature.s;
    babyjubjub::Point right = signature.r + point_ * (cofactor * c);
    return left == right;
}

// ============================================================================
// Identity
// ============================================================================

Identity::Identity(const Bytes& seed) {
    if (seed.empty()) {
        throw InvalidSeedError("Identity seed must not be empty");
    }

    trapdoor_ = DeriveScalar(seed, TRAPDOOR_DOMAIN);
    nullifier_ = DeriveScalar(seed, NULLIFIER_DOMAIN);
    commitment_ = Poseidon::Hash2(trapdoor_, nullifier_);

    privateKey_ = seed;
    Hash512 h = PrunedKeyHash(privateKey_);
    Uint256 pruned(h.data(), 32);
    secretScalar_ = babyjubjub::Scalar::FromUint256(pruned >> 3);
    publicKey_ = PublicKey(babyjubjub::Point::Base8() * secretScalar_);
    OPENSSL_cleanse(h.data(), h.size());
    OPENSSL_cleanse(&pruned, sizeof(pruned));

    LOG_DEBUG(util::LogCategory::Identity) << "Derived identity " << commitment_.ToDecimal();
}

Identity::~Identity() {
    OPENSSL_cleanse(&trapdoor_, sizeof(trapdoor_));
    OPENSSL_cleanse(&nullifier_, sizeof(nullifier_));
    OPENSSL_cleanse(privateKey_.data(), privateKey_.size());
}

Identity Identity::FromString(const std::string& text) {
    return Identity(ToBytes(text));
}

Identity Identity::Generate() {
    Bytes seed(32);
    GetRandBytes(seed.data(), seed.size());
    Identity id(seed);
    OPENSSL_cleanse(seed.data(), seed.size());
    return id;
}

Signature Identity::SignMessage(const Bytes& message) const {
    CheckMessageSize(message);

    Hash512 h = PrunedKeyHash(privateKey_);

    // Nonce input: upper half of the key hash, then the message reversed
    std::array<Byte, 64> nonceInput{};
    std::memcpy(nonceInput.data(), h.data() + 32, 32);
    for (size_t i = 0; i < message.size(); ++i) {
        nonceInput[32 + i] = message[message.size() - 1 - i];
    }
    Hash512 nonceHash = Blake512Hash(nonceInput.data(), nonceInput.size());
    babyjubjub::Scalar k = babyjubjub::Scalar::FromBytesLE(nonceHash.data(), nonceHash.size());

    Signature signature;
    signature.r = babyjubjub::Point::Base8() * k;

    babyjubjub::Scalar c = Challenge(signature.r, publicKey_.GetPoint(), message);
    babyjubjub::Scalar a = babyjubjub::Scalar::FromBytesLE(h.data(), 32);
    signature.s = k + c * a;

    OPENSSL_cleanse(h.data(), h.size());
    OPENSSL_cleanse(nonceInput.data(), nonceInput.size());
    OPENSSL_cleanse(nonceHash.data(), nonceHash.size());
    return signature;
}

std::string Identity::ToString() const {
    return "Identity(commitment=" + commitment_.ToDecimal() + ")";
}

} // namespace identity
} // namespace semaphore
