// SEMAPHORE - Group
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Set of identity commitments stored in a lean incremental Merkle tree.
// Removed members leave a zero sentinel in their slot so that the indices
// of the remaining members never change.

#ifndef SEMAPHORE_GROUP_GROUP_H
#define SEMAPHORE_GROUP_GROUP_H

#include "semaphore/crypto/field.h"
#include "semaphore/group/lean_imt.h"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace semaphore {
namespace group {

/// Value written into the slot of a removed member
inline FieldElement ZeroSentinel() { return FieldElement::Zero(); }

class Group {
public:
    /// Empty group
    Group();

    /**
     * Group built from an initial member list, in order.
     *
     * @throws EmptyMemberError if a member equals the zero sentinel
     * @throws DuplicateMemberError if a member appears twice
     */
    explicit Group(const std::vector<FieldElement>& members);

    /// @throws EmptyMemberError, DuplicateMemberError
    void AddMember(const FieldElement& member);

    /// All-or-nothing: nothing is inserted if any member is rejected
    void AddMembers(const std::vector<FieldElement>& members);

    /**
     * Replace the member at index.
     *
     * @throws IndexOutOfRangeError, RemovedMemberError,
     *         EmptyMemberError, DuplicateMemberError
     */
    void UpdateMember(size_t index, const FieldElement& member);

    /**
     * Overwrite the member at index with the zero sentinel.
     *
     * @throws IndexOutOfRangeError, AlreadyRemovedMemberError
     */
    void RemoveMember(size_t index);

    /// nullopt while the group is empty
    std::optional<FieldElement> Root() const { return tree_.Root(); }

    size_t Depth() const { return tree_.Depth(); }

    /// Number of slots, removed ones included
    size_t Size() const { return tree_.Size(); }

    const std::vector<FieldElement>& Members() const { return tree_.Leaves(); }

    /// Never matches the zero sentinel
    std::optional<size_t> IndexOf(const FieldElement& member) const;

    bool HasMember(const FieldElement& member) const { return IndexOf(member).has_value(); }

    /// @throws IndexOutOfRangeError if index >= Size() or the slot is removed
    MerkleProof GenerateMerkleProof(size_t index) const;

    /// false for a zero-sentinel leaf
    static bool VerifyMerkleProof(const MerkleProof& proof);

    /// Checks that the proof is for `leaf` before replaying it
    static bool VerifyMerkleProof(const MerkleProof& proof, const FieldElement& leaf);

private:
    LeanIMT tree_;

    /// Live members by value; removed slots are not indexed
    std::map<FieldElement, size_t> positions_;

    void CheckNewMember(const FieldElement& member) const;
};

} // namespace group
} // namespace semaphore

#endif // SEMAPHORE_GROUP_GROUP_H
