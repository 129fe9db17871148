// SEMAPHORE - Group Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/group/group.h"

#include "semaphore/core/errors.h"
#include "semaphore/util/logging.h"

#include <set>
#include <string>

namespace semaphore {
namespace group {

Group::Group() = default;

Group::Group(const std::vector<FieldElement>& members) {
    AddMembers(members);
}

void Group::CheckNewMember(const FieldElement& member) const {
    if (member.IsZero()) {
        throw EmptyMemberError("Member value must not be the zero sentinel");
    }
    if (positions_.count(member) > 0) {
        throw DuplicateMemberError("Member " + member.ToDecimal() + " is already in the group");
    }
}

// ============================================================================
// Membership Changes
// ============================================================================

void Group::AddMember(const FieldElement& member) {
    CheckNewMember(member);
    positions_.emplace(member, Size());
    tree_.Insert(member);

    LOG_DEBUG(util::LogCategory::Group) << "Added member at index " << (Size() - 1)
                                        << ", size " << Size() << ", depth " << Depth();
}

void Group::AddMembers(const std::vector<FieldElement>& members) {
    std::set<FieldElement> seen;
    for (const auto& member : members) {
        CheckNewMember(member);
        if (!seen.insert(member).second) {
            throw DuplicateMemberError("Member " + member.ToDecimal() + " appears more than once");
        }
    }

    size_t next = Size();
    for (const auto& member : members) {
        positions_.emplace(member, next++);
    }
    tree_.InsertMany(members);

    LOG_DEBUG(util::LogCategory::Group) << "Added " << members.size() << " members, size "
                                        << Size() << ", depth " << Depth();
}

void Group::UpdateMember(size_t index, const FieldElement& member) {
    FieldElement current = tree_.Leaf(index);
    if (current.IsZero()) {
        throw RemovedMemberError("Member at index " + std::to_string(index) + " has been removed");
    }
    if (current == member) {
        return;
    }
    CheckNewMember(member);

    tree_.Update(index, member);
    positions_.erase(current);
    positions_.emplace(member, index);
    LOG_DEBUG(util::LogCategory::Group) << "Updated member at index " << index;
}

void Group::RemoveMember(size_t index) {
    FieldElement current = tree_.Leaf(index);
    if (current.IsZero()) {
        throw AlreadyRemovedMemberError("Member at index " + std::to_string(index) +
                                        " has already been removed");
    }

    positions_.erase(current);
    tree_.Update(index, ZeroSentinel());
    LOG_DEBUG(util::LogCategory::Group) << "Removed member at index " << index;
}

// ============================================================================
// Queries and Proofs
// ============================================================================

std::optional<size_t> Group::IndexOf(const FieldElement& member) const {
    if (member.IsZero()) {
        return std::nullopt;
    }
    auto it = positions_.find(member);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

MerkleProof Group::GenerateMerkleProof(size_t index) const {
    if (tree_.Leaf(index).IsZero()) {
        throw IndexOutOfRangeError("Member at index " + std::to_string(index) +
                                   " has been removed");
    }
    return tree_.GenerateProof(index);
}

bool Group::VerifyMerkleProof(const MerkleProof& proof) {
    if (proof.leaf.IsZero()) {
        return false;
    }
    return LeanIMT::VerifyProof(proof);
}

bool Group::VerifyMerkleProof(const MerkleProof& proof, const FieldElement& leaf) {
    return proof.leaf == leaf && VerifyMerkleProof(proof);
}

} // namespace group
} // namespace semaphore
