// SEMAPHORE - Circom Interchange Formats Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/proof/circom.h"

#include "semaphore/core/errors.h"

#include <array>
#include <cstring>
#include <optional>
#include <string>

namespace semaphore {
namespace proof {
namespace circom {

using util::JSONValue;

namespace {

constexpr Byte WTNS_MAGIC[4] = {'w', 't', 'n', 's'};

void PutU32(Bytes& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<Byte>(value >> (8 * i)));
    }
}

void PutU64(Bytes& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<Byte>(value >> (8 * i)));
    }
}

void PutWord(Bytes& out, const std::array<Byte, 32>& word) {
    out.insert(out.end(), word.begin(), word.end());
}

/// Bounds-checked little-endian reader over a byte buffer
class WtnsReader {
public:
    WtnsReader(const Byte* data, size_t len) : data_(data), len_(len) {}

    size_t Position() const { return pos_; }
    size_t Remaining() const { return len_ - pos_; }

    const Byte* Take(size_t n, const char* what) {
        if (n > Remaining()) {
            throw ProvingError(std::string("Witness file truncated in ") + what);
        }
        const Byte* start = data_ + pos_;
        pos_ += n;
        return start;
    }

    uint32_t U32(const char* what) {
        const Byte* p = Take(4, what);
        uint32_t value = 0;
        for (int i = 3; i >= 0; --i) {
            value = (value << 8) | p[i];
        }
        return value;
    }

    uint64_t U64(const char* what) {
        const Byte* p = Take(8, what);
        uint64_t value = 0;
        for (int i = 7; i >= 0; --i) {
            value = (value << 8) | p[i];
        }
        return value;
    }

    void Seek(size_t pos) { pos_ = pos; }

private:
    const Byte* data_;
    size_t len_;
    size_t pos_{0};
};

JSONValue Decimal(const Uint256& value) {
    return JSONValue(value.ToDecimal());
}

JSONValue Decimal(const FieldElement& value) {
    return JSONValue(value.ToDecimal());
}

Uint256 ParseCoordinate(const JSONValue& value, const std::string& what) {
    if (!value.IsString()) {
        throw ProvingError("Proof field '" + what + "' must be a decimal string");
    }
    auto parsed = Uint256::FromDecimal(value.GetString());
    if (!parsed || *parsed >= BN254_BASE_MODULUS) {
        throw ProvingError("Proof field '" + what + "' is not a base field element");
    }
    return *parsed;
}

const JSONValue& RequireArray(const JSONValue& json, const std::string& key, size_t minSize) {
    const JSONValue* value = json.Find(key);
    if (!value || !value->IsArray() || value->Size() < minSize) {
        throw ProvingError("Proof field '" + key + "' must be an array of at least " +
                           std::to_string(minSize) + " entries");
    }
    return *value;
}

std::array<Uint256, 2> ParseG1(const JSONValue& json, const std::string& key) {
    const JSONValue& arr = RequireArray(json, key, 2);
    return {ParseCoordinate(arr[0], key + "[0]"), ParseCoordinate(arr[1], key + "[1]")};
}

} // namespace

// ============================================================================
// Circuit inputs
// ============================================================================

JSONValue CircuitInputsToJSON(const WitnessInputs& inputs) {
    JSONValue siblings = JSONValue::MakeArray();
    for (const auto& sibling : inputs.merkleProofSiblings) {
        siblings.Push(Decimal(sibling));
    }

    JSONValue json = JSONValue::MakeObject();
    json.Set("identityTrapdoor", Decimal(inputs.trapdoor));
    json.Set("identityNullifier", Decimal(inputs.identityNullifier));
    json.Set("merkleProofLength", Decimal(Uint256(inputs.merkleProofLength)));
    json.Set("merkleProofIndex", Decimal(Uint256(inputs.merkleProofIndex)));
    json.Set("merkleProofSiblings", std::move(siblings));
    json.Set("message", Decimal(inputs.signalHash));
    json.Set("scope", Decimal(inputs.scopeHash));
    return json;
}

// ============================================================================
// .wtns
// ============================================================================

Bytes EncodeWtns(const std::vector<FieldElement>& values) {
    const uint64_t headerSize = 4 + WTNS_FIELD_SIZE + 4;
    const uint64_t valuesSize = static_cast<uint64_t>(values.size()) * WTNS_FIELD_SIZE;

    Bytes out;
    out.reserve(12 + 2 * 12 + headerSize + valuesSize);
    out.insert(out.end(), WTNS_MAGIC, WTNS_MAGIC + 4);
    PutU32(out, WTNS_VERSION);
    PutU32(out, 2);

    PutU32(out, WTNS_SECTION_HEADER);
    PutU64(out, headerSize);
    PutU32(out, WTNS_FIELD_SIZE);
    PutWord(out, FieldElement::MODULUS.ToBytes());
    PutU32(out, static_cast<uint32_t>(values.size()));

    PutU32(out, WTNS_SECTION_VALUES);
    PutU64(out, valuesSize);
    for (const auto& value : values) {
        PutWord(out, value.ToBytes());
    }
    return out;
}

std::vector<FieldElement> DecodeWtns(const Byte* data, size_t len) {
    WtnsReader reader(data, len);

    const Byte* magic = reader.Take(4, "magic");
    if (std::memcmp(magic, WTNS_MAGIC, 4) != 0) {
        throw ProvingError("Not a witness file");
    }
    uint32_t version = reader.U32("version");
    if (version != WTNS_VERSION) {
        throw ProvingError("Unsupported witness file version " + std::to_string(version));
    }
    uint32_t numSections = reader.U32("section count");

    // Sections may appear in any order; remember where each one starts
    size_t headerPos = 0, valuesPos = 0;
    uint64_t headerSize = 0, valuesSize = 0;
    bool haveHeader = false, haveValues = false;
    for (uint32_t i = 0; i < numSections; ++i) {
        uint32_t type = reader.U32("section type");
        uint64_t size = reader.U64("section size");
        size_t start = reader.Position();
        if (size > reader.Remaining()) {
            throw ProvingError("Witness file truncated in section " + std::to_string(type));
        }
        if (type == WTNS_SECTION_HEADER) {
            headerPos = start;
            headerSize = size;
            haveHeader = true;
        } else if (type == WTNS_SECTION_VALUES) {
            valuesPos = start;
            valuesSize = size;
            haveValues = true;
        }
        reader.Seek(start + static_cast<size_t>(size));
    }
    if (!haveHeader || !haveValues) {
        throw ProvingError("Witness file lacks a header or value section");
    }

    reader.Seek(headerPos);
    uint32_t n8 = reader.U32("field size");
    if (n8 != WTNS_FIELD_SIZE || headerSize != 4 + WTNS_FIELD_SIZE + 4) {
        throw ProvingError("Witness uses " + std::to_string(n8) + "-byte field elements");
    }
    Uint256 prime(reader.Take(WTNS_FIELD_SIZE, "prime"), WTNS_FIELD_SIZE);
    if (prime != FieldElement::MODULUS) {
        throw ProvingError("Witness is over a field other than the BN254 scalar field");
    }
    uint32_t count = reader.U32("witness count");
    if (valuesSize != static_cast<uint64_t>(count) * WTNS_FIELD_SIZE) {
        throw ProvingError("Witness declares " + std::to_string(count) +
                           " values but the value section has " +
                           std::to_string(valuesSize) + " bytes");
    }

    reader.Seek(valuesPos);
    std::vector<FieldElement> values;
    values.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        Uint256 raw(reader.Take(WTNS_FIELD_SIZE, "values"), WTNS_FIELD_SIZE);
        auto element = FieldElement::FromUint256Canonical(raw);
        if (!element) {
            throw ProvingError("Witness value " + std::to_string(i) + " is not reduced");
        }
        values.push_back(*element);
    }
    return values;
}

// ============================================================================
// snarkjs JSON
// ============================================================================

JSONValue Groth16ToJSON(const Groth16Points& points) {
    auto projective = [](const JSONValue& x, const JSONValue& y, const JSONValue& z) {
        JSONValue arr = JSONValue::MakeArray();
        arr.Push(x);
        arr.Push(y);
        arr.Push(z);
        return arr;
    };
    auto fq2 = [](const JSONValue& c0, const JSONValue& c1) {
        JSONValue arr = JSONValue::MakeArray();
        arr.Push(c0);
        arr.Push(c1);
        return arr;
    };

    JSONValue json = JSONValue::MakeObject();
    json.Set("pi_a", projective(Decimal(points.a[0]), Decimal(points.a[1]), JSONValue("1")));
    json.Set("pi_b", projective(fq2(Decimal(points.b[0][0]), Decimal(points.b[0][1])),
                                fq2(Decimal(points.b[1][0]), Decimal(points.b[1][1])),
                                fq2(JSONValue("1"), JSONValue("0"))));
    json.Set("pi_c", projective(Decimal(points.c[0]), Decimal(points.c[1]), JSONValue("1")));
    json.Set("protocol", "groth16");
    json.Set("curve", "bn128");
    return json;
}

Groth16Points Groth16FromJSON(const JSONValue& json) {
    if (!json.IsObject()) {
        throw ProvingError("Proof must be a JSON object");
    }
    const JSONValue* protocol = json.Find("protocol");
    if (protocol && (!protocol->IsString() || protocol->GetString() != "groth16")) {
        throw ProvingError("Proof is not a Groth16 proof");
    }

    Groth16Points points;
    points.a = ParseG1(json, "pi_a");
    points.c = ParseG1(json, "pi_c");

    const JSONValue& b = RequireArray(json, "pi_b", 2);
    for (size_t i = 0; i < 2; ++i) {
        const std::string key = "pi_b[" + std::to_string(i) + "]";
        if (!b[i].IsArray() || b[i].Size() != 2) {
            throw ProvingError("Proof field '" + key + "' must hold two coordinates");
        }
        points.b[i] = {ParseCoordinate(b[i][0], key + "[0]"),
                       ParseCoordinate(b[i][1], key + "[1]")};
    }
    return points;
}

JSONValue PublicSignalsToJSON(const std::vector<FieldElement>& signals) {
    JSONValue arr = JSONValue::MakeArray();
    for (const auto& signal : signals) {
        arr.Push(Decimal(signal));
    }
    return arr;
}

std::vector<FieldElement> PublicSignalsFromJSON(const JSONValue& json) {
    if (!json.IsArray()) {
        throw ProvingError("Public signals must be a JSON array");
    }
    std::vector<FieldElement> signals;
    signals.reserve(json.Size());
    for (size_t i = 0; i < json.Size(); ++i) {
        const JSONValue& entry = json[i];
        std::optional<FieldElement> element;
        if (entry.IsString()) {
            element = FieldElement::FromDecimal(entry.GetString());
        }
        if (!element) {
            throw ProvingError("Public signal " + std::to_string(i) +
                               " is not a canonical field element");
        }
        signals.push_back(*element);
    }
    return signals;
}

} // namespace circom
} // namespace proof
} // namespace semaphore
