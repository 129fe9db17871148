// SEMAPHORE - Lean Incremental Merkle Tree
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Binary Merkle tree that grows one leaf at a time. A node without a right
// sibling is carried to the next level unchanged instead of being hashed
// with a filler value, so the depth is always ceil(log2(size)).

#ifndef SEMAPHORE_GROUP_LEAN_IMT_H
#define SEMAPHORE_GROUP_LEAN_IMT_H

#include "semaphore/crypto/field.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace semaphore {
namespace group {

/// 2-to-1 node hash
using NodeHasher = std::function<FieldElement(const FieldElement&, const FieldElement&)>;

// ============================================================================
// Merkle Proof
// ============================================================================

/**
 * Membership path for one leaf.
 *
 * Only levels where the node had a sibling contribute an entry. Bit i of
 * `index` is set when siblings[i] sits on the left of the running node.
 */
struct MerkleProof {
    FieldElement root;
    FieldElement leaf;
    uint64_t index{0};
    std::vector<FieldElement> siblings;

    bool operator==(const MerkleProof& other) const {
        return root == other.root && leaf == other.leaf &&
               index == other.index && siblings == other.siblings;
    }
    bool operator!=(const MerkleProof& other) const { return !(*this == other); }
};

// ============================================================================
// LeanIMT
// ============================================================================

class LeanIMT {
public:
    /// Tree hashed with Poseidon::Hash2
    LeanIMT();

    explicit LeanIMT(NodeHasher hasher);

    /// Append a leaf and rehash its path to the root
    void Insert(const FieldElement& leaf);

    /// Append several leaves, rebuilding each level once
    void InsertMany(const std::vector<FieldElement>& leaves);

    /// Replace a leaf and rehash its path.
    /// @throws IndexOutOfRangeError if index >= Size()
    void Update(size_t index, const FieldElement& leaf);

    bool Has(const FieldElement& leaf) const;

    /// Position of the first leaf equal to `leaf`
    std::optional<size_t> IndexOf(const FieldElement& leaf) const;

    /// Leaf at index; throws IndexOutOfRangeError when out of range
    const FieldElement& Leaf(size_t index) const;

    const std::vector<FieldElement>& Leaves() const { return nodes_[0]; }

    size_t Size() const { return nodes_[0].size(); }

    /// Number of hashing levels above the leaves
    size_t Depth() const { return nodes_.size() - 1; }

    /// nullopt for an empty tree; the single leaf for a one-leaf tree
    std::optional<FieldElement> Root() const;

    /// @throws IndexOutOfRangeError if index >= Size()
    MerkleProof GenerateProof(size_t index) const;

    /// Replay the path with the default hasher and compare with proof.root
    static bool VerifyProof(const MerkleProof& proof);

    static bool VerifyProof(const MerkleProof& proof, const NodeHasher& hasher);

private:
    NodeHasher hasher_;

    /// nodes_[0] holds the leaves, nodes_[Depth()] the root
    std::vector<std::vector<FieldElement>> nodes_;

    /// ceil(log2(n)), 0 for n <= 1
    static size_t DepthFor(size_t n);
};

} // namespace group
} // namespace semaphore

#endif // SEMAPHORE_GROUP_LEAN_IMT_H
