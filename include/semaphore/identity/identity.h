// SEMAPHORE - Identity
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// A member's private identity. Two secret scalars are derived from a seed;
// only their commitment is ever published. The seed also serves as an
// EdDSA private key on Baby Jubjub for signing short messages.

#ifndef SEMAPHORE_IDENTITY_IDENTITY_H
#define SEMAPHORE_IDENTITY_IDENTITY_H

#include "semaphore/core/types.h"
#include "semaphore/crypto/babyjubjub.h"
#include "semaphore/crypto/field.h"

#include <cstddef>
#include <string>

namespace semaphore {
namespace identity {

/// Domain tags for seed derivation
constexpr const char* TRAPDOOR_DOMAIN = "semaphore_identity_trapdoor";
constexpr const char* NULLIFIER_DOMAIN = "semaphore_identity_nullifier";

/// Longest message accepted by SignMessage, in bytes
constexpr size_t MAX_MESSAGE_SIZE = 32;

// ============================================================================
// Signatures
// ============================================================================

/// EdDSA signature over Baby Jubjub: nonce point R8 and response S
struct Signature {
    babyjubjub::Point r;
    babyjubjub::Scalar s;
};

/// EdDSA public key A = Base8 * secretScalar
class PublicKey {
public:
    PublicKey() = default;
    explicit PublicKey(const babyjubjub::Point& point) : point_(point) {}

    const babyjubjub::Point& GetPoint() const { return point_; }

    /// Poseidon(A.x, A.y)
    FieldElement Commitment() const;

    /**
     * Check Base8 * S == R8 + A * (8 * c), with
     * c = Poseidon(R8.x, R8.y, A.x, A.y, message) mod l.
     *
     * Returns false when R8 or A is not on the curve.
     * @throws MessageTooLongError if the message exceeds MAX_MESSAGE_SIZE
     */
    bool VerifySignature(const Bytes& message, const Signature& signature) const;

    bool operator==(const PublicKey& other) const { return point_ == other.point_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    babyjubjub::Point point_;
};

// ============================================================================
// Identity
// ============================================================================

/**
 * Secret identity of a group member.
 *
 * SECURITY: the trapdoor and nullifier must never leave the owner's device.
 * They are not logged and are wiped when the object is destroyed. The same
 * seed always yields the same identity, which makes a seed sufficient for
 * recovery.
 */
class Identity {
public:
    /**
     * Derive an identity from a seed.
     *
     * trapdoor  = SHA256(seed || TRAPDOOR_DOMAIN)  reduced mod r
     * nullifier = SHA256(seed || NULLIFIER_DOMAIN) reduced mod r
     *
     * @throws InvalidSeedError if the seed is empty
     */
    explicit Identity(const Bytes& seed);

    Identity(const Identity& other) = default;
    Identity& operator=(const Identity& other) = default;
    ~Identity();

    /// Seed is the UTF-8 encoding of the text
    static Identity FromString(const std::string& text);

    /// Fresh identity from 32 bytes of OS entropy
    static Identity Generate();

    const FieldElement& Trapdoor() const { return trapdoor_; }
    const FieldElement& Nullifier() const { return nullifier_; }

    /// Poseidon(trapdoor, nullifier); the only public part of an identity
    const FieldElement& Commitment() const { return commitment_; }

    /// (BLAKE-512(seed) pruned, as little-endian, >> 3) mod l
    const babyjubjub::Scalar& SecretScalar() const { return secretScalar_; }

    const PublicKey& GetPublicKey() const { return publicKey_; }

    /**
     * Deterministic EdDSA signature of a message of at most 32 bytes.
     *
     * @throws MessageTooLongError for longer messages
     */
    Signature SignMessage(const Bytes& message) const;

    /// Printable form; contains the commitment only
    std::string ToString() const;

    bool operator==(const Identity& other) const { return commitment_ == other.commitment_; }
    bool operator!=(const Identity& other) const { return !(*this == other); }

private:
    FieldElement trapdoor_;
    FieldElement nullifier_;
    FieldElement commitment_;

    /// Seed bytes, used as the EdDSA private key
    Bytes privateKey_;
    babyjubjub::Scalar secretScalar_;
    PublicKey publicKey_;
};

} // namespace identity
} // namespace semaphore

#endif // SEMAPHORE_IDENTITY_IDENTITY_H
