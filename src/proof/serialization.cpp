// SEMAPHORE - Proof Serialization Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/serialization.h"

#include "semaphore/core/errors.h"

#include <array>
#include <limits>
#include <set>
#include <string>
#include <utility>

namespace semaphore {
namespace proof {

using util::JSONValue;

namespace {

const std::set<std::string> KNOWN_KEYS = {
    "merkleTreeDepth", "merkleTreeRoot", "nullifier", "message", "scope", "points", "version"
};

JSONValue PairToJSON(const std::array<Uint256, 2>& pair) {
    JSONValue arr = JSONValue::MakeArray();
    arr.Push(pair[0].ToDecimal());
    arr.Push(pair[1].ToDecimal());
    return arr;
}

const JSONValue& Require(const JSONValue& object, const std::string& key) {
    const JSONValue* value = object.Find(key);
    if (!value) {
        throw MalformedProofError("Missing field '" + key + "'");
    }
    return *value;
}

Uint256 ParseUint(const JSONValue& value, const std::string& what) {
    if (!value.IsString()) {
        throw MalformedProofError("Field '" + what + "' must be a decimal string");
    }
    auto parsed = Uint256::FromDecimal(value.GetString());
    if (!parsed) {
        throw MalformedProofError("Field '" + what + "' is not a canonical 256-bit decimal");
    }
    return *parsed;
}

FieldElement ParseField(const JSONValue& value, const std::string& what) {
    Uint256 raw = ParseUint(value, what);
    auto element = FieldElement::FromUint256Canonical(raw);
    if (!element) {
        throw MalformedProofError("Field '" + what + "' is not below the scalar field modulus");
    }
    return *element;
}

Uint256 ParseCoordinate(const JSONValue& value, const std::string& what) {
    Uint256 coordinate = ParseUint(value, what);
    if (coordinate >= BN254_BASE_MODULUS) {
        throw MalformedProofError("Coordinate '" + what + "' is not below the base field modulus");
    }
    return coordinate;
}

std::array<Uint256, 2> ParsePair(const JSONValue& value, const std::string& what) {
    if (!value.IsArray() || value.Size() != 2) {
        throw MalformedProofError("Field '" + what + "' must be an array of 2 coordinates");
    }
    return {ParseCoordinate(value[size_t{0}], what + "[0]"),
            ParseCoordinate(value[size_t{1}], what + "[1]")};
}

} // namespace

// ============================================================================
// Export
// ============================================================================

JSONValue ProofToJSON(const SemaphoreProof& proof) {
    JSONValue b = JSONValue::MakeArray();
    b.Push(PairToJSON(proof.points.b[0]));
    b.Push(PairToJSON(proof.points.b[1]));

    JSONValue points = JSONValue::MakeObject();
    points.Set("a", PairToJSON(proof.points.a));
    points.Set("b", std::move(b));
    points.Set("c", PairToJSON(proof.points.c));

    JSONValue json = JSONValue::MakeObject();
    json.Set("merkleTreeDepth", static_cast<int64_t>(proof.merkleTreeDepth));
    json.Set("merkleTreeRoot", proof.merkleTreeRoot.ToDecimal());
    json.Set("nullifier", proof.nullifier.ToDecimal());
    json.Set("message", proof.message.ToDecimal());
    json.Set("scope", proof.scope.ToDecimal());
    json.Set("points", std::move(points));
    json.Set("version", PROOF_FORMAT_VERSION);
    return json;
}

std::string ExportProof(const SemaphoreProof& proof) {
    return ProofToJSON(proof).ToJSON();
}

// ============================================================================
// Import
// ============================================================================

SemaphoreProof ProofFromJSON(const JSONValue& json) {
    if (!json.IsObject()) {
        throw MalformedProofError("Proof must be a JSON object");
    }
    for (const auto& [key, value] : json.GetObject()) {
        if (KNOWN_KEYS.count(key) == 0) {
            throw MalformedProofError("Unknown field '" + key + "'");
        }
    }

    if (const JSONValue* version = json.Find("version")) {
        if (!version->IsInt() || version->GetInt() != PROOF_FORMAT_VERSION) {
            throw MalformedProofError("Unsupported proof format version");
        }
    }

    SemaphoreProof proof;

    const JSONValue& depth = Require(json, "merkleTreeDepth");
    if (!depth.IsInt() || depth.GetInt() < 0 ||
        depth.GetInt() > std::numeric_limits<uint16_t>::max()) {
        throw MalformedProofError("Field 'merkleTreeDepth' must be an integer in 0..65535");
    }
    proof.merkleTreeDepth = static_cast<uint16_t>(depth.GetInt());

    proof.merkleTreeRoot = ParseField(Require(json, "merkleTreeRoot"), "merkleTreeRoot");
    proof.nullifier = ParseField(Require(json, "nullifier"), "nullifier");
    proof.message = ParseUint(Require(json, "message"), "message");
    proof.scope = ParseUint(Require(json, "scope"), "scope");

    const JSONValue& points = Require(json, "points");
    if (!points.IsObject() || points.GetObject().size() != 3) {
        throw MalformedProofError("Field 'points' must be an object with keys a, b and c");
    }
    proof.points.a = ParsePair(Require(points, "a"), "points.a");
    proof.points.c = ParsePair(Require(points, "c"), "points.c");

    const JSONValue& b = Require(points, "b");
    if (!b.IsArray() || b.Size() != 2) {
        throw MalformedProofError("Field 'points.b' must be an array of 2 pairs");
    }
    proof.points.b[0] = ParsePair(b[size_t{0}], "points.b[0]");
    proof.points.b[1] = ParsePair(b[size_t{1}], "points.b[1]");

    return proof;
}

SemaphoreProof ImportProof(const std::string& text) {
    auto json = JSONValue::TryParse(text);
    if (!json) {
        throw MalformedProofError("Proof is not valid JSON");
    }
    return ProofFromJSON(*json);
}

} // namespace proof
} // namespace semaphore
