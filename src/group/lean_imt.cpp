// SEMAPHORE - Lean Incremental Merkle Tree Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/group/lean_imt.h"

#include "semaphore/core/errors.h"
#include "semaphore/crypto/poseidon.h"

#include <algorithm>
#include <string>
#include <utility>

namespace semaphore {
namespace group {

namespace {

FieldElement DefaultHash(const FieldElement& left, const FieldElement& right) {
    return Poseidon::Hash2(left, right);
}

} // namespace

LeanIMT::LeanIMT() : LeanIMT(DefaultHash) {}

LeanIMT::LeanIMT(NodeHasher hasher) : hasher_(std::move(hasher)), nodes_(1) {}

size_t LeanIMT::DepthFor(size_t n) {
    size_t depth = 0;
    while ((size_t{1} << depth) < n) {
        ++depth;
    }
    return depth;
}

// ============================================================================
// Mutation
// ============================================================================

void LeanIMT::Insert(const FieldElement& leaf) {
    size_t index = Size();
    size_t depth = Depth();

    if (DepthFor(index + 1) > depth) {
        nodes_.emplace_back();
        ++depth;
    }

    FieldElement node = leaf;
    for (size_t level = 0; level < depth; ++level) {
        auto& row = nodes_[level];
        if (index < row.size()) {
            row[index] = node;
        } else {
            row.push_back(node);
        }

        if (index & 1) {
            node = hasher_(row[index - 1], node);
        }
        index >>= 1;
    }

    nodes_[depth].assign(1, node);
}

void LeanIMT::InsertMany(const std::vector<FieldElement>& leaves) {
    if (leaves.empty()) {
        return;
    }

    size_t startIndex = Size() >> 1;
    nodes_[0].insert(nodes_[0].end(), leaves.begin(), leaves.end());

    size_t depth = DepthFor(Size());
    nodes_.resize(std::max(nodes_.size(), depth + 1));

    for (size_t level = 0; level < depth; ++level) {
        const auto& row = nodes_[level];
        auto& parents = nodes_[level + 1];
        size_t parentCount = (row.size() + 1) / 2;
        parents.resize(parentCount);

        for (size_t i = startIndex; i < parentCount; ++i) {
            size_t left = i * 2;
            parents[i] = left + 1 < row.size()
                ? hasher_(row[left], row[left + 1])
                : row[left];
        }
        startIndex >>= 1;
    }
}

void LeanIMT::Update(size_t index, const FieldElement& leaf) {
    if (index >= Size()) {
        throw IndexOutOfRangeError("Leaf index " + std::to_string(index) +
                                   " is out of range (size " + std::to_string(Size()) + ")");
    }

    FieldElement node = leaf;
    size_t depth = Depth();
    for (size_t level = 0; level < depth; ++level) {
        auto& row = nodes_[level];
        row[index] = node;

        if (index & 1) {
            node = hasher_(row[index - 1], node);
        } else if (index + 1 < row.size()) {
            node = hasher_(node, row[index + 1]);
        }
        index >>= 1;
    }

    nodes_[depth][0] = node;
}

// ============================================================================
// Queries
// ============================================================================

bool LeanIMT::Has(const FieldElement& leaf) const {
    return IndexOf(leaf).has_value();
}

std::optional<size_t> LeanIMT::IndexOf(const FieldElement& leaf) const {
    const auto& leaves = nodes_[0];
    auto it = std::find(leaves.begin(), leaves.end(), leaf);
    if (it == leaves.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - leaves.begin());
}

const FieldElement& LeanIMT::Leaf(size_t index) const {
    if (index >= Size()) {
        throw IndexOutOfRangeError("Leaf index " + std::to_string(index) +
                                   " is out of range (size " + std::to_string(Size()) + ")");
    }
    return nodes_[0][index];
}

std::optional<FieldElement> LeanIMT::Root() const {
    const auto& top = nodes_[Depth()];
    if (top.empty()) {
        return std::nullopt;
    }
    return top[0];
}

// ============================================================================
// Proofs
// ============================================================================

MerkleProof LeanIMT::GenerateProof(size_t index) const {
    if (index >= Size()) {
        throw IndexOutOfRangeError("Leaf index " + std::to_string(index) +
                                   " is out of range (size " + std::to_string(Size()) + ")");
    }

    MerkleProof proof;
    proof.leaf = nodes_[0][index];
    proof.root = nodes_[Depth()][0];

    uint64_t pathBits = 0;
    size_t position = index;
    for (size_t level = 0; level < Depth(); ++level) {
        const auto& row = nodes_[level];
        bool isRight = (position & 1) != 0;
        size_t siblingIndex = isRight ? position - 1 : position + 1;

        if (siblingIndex < row.size()) {
            if (isRight) {
                pathBits |= uint64_t{1} << proof.siblings.size();
            }
            proof.siblings.push_back(row[siblingIndex]);
        }
        position >>= 1;
    }

    proof.index = pathBits;
    return proof;
}

bool LeanIMT::VerifyProof(const MerkleProof& proof) {
    return VerifyProof(proof, DefaultHash);
}

bool LeanIMT::VerifyProof(const MerkleProof& proof, const NodeHasher& hasher) {
    if (proof.siblings.size() > 64) {
        return false;
    }

    FieldElement node = proof.leaf;
    for (size_t i = 0; i < proof.siblings.size(); ++i) {
        if ((proof.index >> i) & 1) {
            node = hasher(proof.siblings[i], node);
        } else {
            node = hasher(node, proof.siblings[i]);
        }
    }
    return node == proof.root;
}

} // namespace group
} // namespace semaphore
