// SEMAPHORE - Error Types
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Exception hierarchy for failures surfaced to callers. Lookups that may
// legitimately miss return std::optional instead of throwing.

#ifndef SEMAPHORE_CORE_ERRORS_H
#define SEMAPHORE_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace semaphore {

/// Base class of every error raised by this library
class SemaphoreError : public std::runtime_error {
public:
    explicit SemaphoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Identity
// ============================================================================

/// Identity seed was empty
class InvalidSeedError : public SemaphoreError {
public:
    explicit InvalidSeedError(const std::string& msg) : SemaphoreError(msg) {}
};

/// Message to sign or verify is longer than 32 bytes
class MessageTooLongError : public SemaphoreError {
public:
    explicit MessageTooLongError(const std::string& msg) : SemaphoreError(msg) {}
};

// ============================================================================
// Group
// ============================================================================

/// A member value equal to the zero sentinel was supplied
class EmptyMemberError : public SemaphoreError {
public:
    explicit EmptyMemberError(const std::string& msg) : SemaphoreError(msg) {}
};

/// A member value is already present in the group
class DuplicateMemberError : public SemaphoreError {
public:
    explicit DuplicateMemberError(const std::string& msg) : SemaphoreError(msg) {}
};

/// The identity commitment is not a member of the group
class MemberNotFoundError : public SemaphoreError {
public:
    explicit MemberNotFoundError(const std::string& msg) : SemaphoreError(msg) {}
};

/// Leaf index is outside the tree or points at a removed slot
class IndexOutOfRangeError : public SemaphoreError {
public:
    explicit IndexOutOfRangeError(const std::string& msg) : SemaphoreError(msg) {}
};

/// Attempt to update a slot that has been removed
class RemovedMemberError : public SemaphoreError {
public:
    explicit RemovedMemberError(const std::string& msg) : SemaphoreError(msg) {}
};

/// Attempt to remove a slot that has already been removed
class AlreadyRemovedMemberError : public SemaphoreError {
public:
    explicit AlreadyRemovedMemberError(const std::string& msg) : SemaphoreError(msg) {}
};

// ============================================================================
// Proof
// ============================================================================

/// Requested tree depth has no circuit artifacts
class UnsupportedDepthError : public SemaphoreError {
public:
    explicit UnsupportedDepthError(const std::string& msg) : SemaphoreError(msg) {}
};

/// Witness computation or proving failed
class ProvingError : public SemaphoreError {
public:
    explicit ProvingError(const std::string& msg) : SemaphoreError(msg) {}
};

/// Serialized proof does not match the expected schema
class MalformedProofError : public SemaphoreError {
public:
    explicit MalformedProofError(const std::string& msg) : SemaphoreError(msg) {}
};

// ============================================================================
// Configuration
// ============================================================================

/// Configuration file could not be read or holds an invalid value
class ConfigError : public SemaphoreError {
public:
    explicit ConfigError(const std::string& msg) : SemaphoreError(msg) {}
};

} // namespace semaphore

#endif // SEMAPHORE_CORE_ERRORS_H
