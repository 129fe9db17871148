// SEMAPHORE - Poseidon Hash Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/crypto/poseidon.h"

#include <array>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <tuple>

namespace semaphore {

// ============================================================================
// Standard Configurations
// ============================================================================

namespace {

/// Partial rounds for widths 2..17
constexpr size_t PARTIAL_ROUNDS[PoseidonParams::MAX_INPUTS] = {
    56, 57, 56, 60, 60, 63, 64, 63, 60, 66, 60, 65, 70, 60, 64, 68
};

} // anonymous namespace

namespace PoseidonParams {

PoseidonConfig ForInputs(size_t numInputs) {
    if (numInputs == 0 || numInputs > MAX_INPUTS) {
        throw std::invalid_argument("Poseidon accepts 1 to " + std::to_string(MAX_INPUTS) +
                                    " inputs, got " + std::to_string(numInputs));
    }
    return PoseidonConfig{numInputs + 1, FULL_ROUNDS, PARTIAL_ROUNDS[numInputs - 1]};
}

} // namespace PoseidonParams

// ============================================================================
// Constant Generation
// ============================================================================

namespace {

/// Field element size in bits
constexpr size_t FIELD_BITS = 254;

/// 80-bit Grain LFSR seeded with the permutation shape
class GrainLFSR {
public:
    explicit GrainLFSR(const PoseidonConfig& config) : pos_(0) {
        size_t n = 0;
        auto append = [this, &n](uint64_t value, int bits) {
            for (int i = bits - 1; i >= 0; --i) {
                state_[n++] = ((value >> i) & 1) != 0;
            }
        };
        append(1, 2);               // prime field
        append(0, 4);               // x^alpha S-box
        append(FIELD_BITS, 12);
        append(config.width, 12);
        append(config.fullRounds, 10);
        append(config.partialRounds, 10);
        append((1ULL << 30) - 1, 30);

        for (int i = 0; i < 160; ++i) {
            NextBit();
        }
    }

    /// Shrinking output: a 1 emits the following bit, a 0 drops it
    bool Bit() {
        for (;;) {
            bool keep = NextBit();
            bool bit = NextBit();
            if (keep) {
                return bit;
            }
        }
    }

    /// FIELD_BITS output bits, most significant first
    Uint256 Value() {
        Uint256 v;
        for (size_t i = 0; i < FIELD_BITS; ++i) {
            if (Bit()) {
                size_t pos = FIELD_BITS - 1 - i;
                v.limbs[pos / 64] |= uint64_t(1) << (pos % 64);
            }
        }
        return v;
    }

private:
    std::array<bool, 80> state_;
    size_t pos_;

    bool At(size_t offset) const { return state_[(pos_ + offset) % 80]; }

    bool NextBit() {
        bool bit = At(62) ^ At(51) ^ At(38) ^ At(23) ^ At(13) ^ At(0);
        state_[pos_] = bit;
        pos_ = (pos_ + 1) % 80;
        return bit;
    }
};

/// Round constants by rejection sampling below the modulus
std::vector<FieldElement> GenerateRoundConstants(const PoseidonConfig& config,
                                                 GrainLFSR& grain) {
    std::vector<FieldElement> constants;
    constants.reserve(config.totalRounds() * config.width);
    while (constants.size() < config.totalRounds() * config.width) {
        auto value = FieldElement::FromUint256Canonical(grain.Value());
        if (value) {
            constants.push_back(*value);
        }
    }
    return constants;
}

/// Cauchy matrix M[i][j] = 1 / (x_i + y_j) over 2t further draws
std::vector<std::vector<FieldElement>> GenerateMDSMatrix(const PoseidonConfig& config,
                                                         GrainLFSR& grain) {
    std::vector<FieldElement> xs;
    std::vector<FieldElement> ys;
    for (size_t i = 0; i < config.width; ++i) {
        xs.push_back(FieldElement(grain.Value()));
    }
    for (size_t i = 0; i < config.width; ++i) {
        ys.push_back(FieldElement(grain.Value()));
    }

    std::vector<std::vector<FieldElement>> mds(config.width,
                                               std::vector<FieldElement>(config.width));
    for (size_t i = 0; i < config.width; ++i) {
        for (size_t j = 0; j < config.width; ++j) {
            mds[i][j] = (xs[i] + ys[j]).Inverse();
        }
    }
    return mds;
}

} // anonymous namespace

std::shared_ptr<const PoseidonConstants> Poseidon::ConstantsFor(const PoseidonConfig& config) {
    using Key = std::tuple<size_t, size_t, size_t>;
    static std::mutex mutex;
    static std::map<Key, std::shared_ptr<const PoseidonConstants>> cache;

    Key key{config.width, config.fullRounds, config.partialRounds};
    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(key);
    if (it != cache.end()) {
        return it->second;
    }

    GrainLFSR grain(config);
    auto constants = std::make_shared<PoseidonConstants>();
    constants->roundConstants = GenerateRoundConstants(config, grain);
    constants->mds = GenerateMDSMatrix(config, grain);
    cache.emplace(key, constants);
    return constants;
}

// ============================================================================
// Poseidon Implementation
// ============================================================================

Poseidon::Poseidon(size_t numInputs)
    : config_(PoseidonParams::ForInputs(numInputs))
    , constants_(ConstantsFor(config_)) {}

void Poseidon::AddRoundConstants(std::vector<FieldElement>& state, size_t roundIdx) const {
    const FieldElement* rc = constants_->roundConstants.data() + roundIdx * config_.width;
    for (size_t i = 0; i < config_.width; ++i) {
        state[i] += rc[i];
    }
}

void Poseidon::MixColumns(std::vector<FieldElement>& state) const {
    std::vector<FieldElement> mixed(config_.width, FieldElement::Zero());
    for (size_t i = 0; i < config_.width; ++i) {
        for (size_t j = 0; j < config_.width; ++j) {
            mixed[i] += constants_->mds[i][j] * state[j];
        }
    }
    state = std::move(mixed);
}

void Poseidon::Permute(std::vector<FieldElement>& state) const {
    if (state.size() != config_.width) {
        throw std::invalid_argument("Poseidon state must have " +
                                    std::to_string(config_.width) + " elements");
    }

    size_t halfFull = config_.fullRounds / 2;
    for (size_t round = 0; round < config_.totalRounds(); ++round) {
        AddRoundConstants(state, round);
        bool full = round < halfFull || round >= halfFull + config_.partialRounds;
        if (full) {
            for (auto& x : state) {
                x = x.PoseidonSbox();
            }
        } else {
            state[0] = state[0].PoseidonSbox();
        }
        MixColumns(state);
    }
}

FieldElement Poseidon::Digest(const std::vector<FieldElement>& inputs) const {
    if (inputs.size() + 1 != config_.width) {
        throw std::invalid_argument("Poseidon expects " + std::to_string(config_.width - 1) +
                                    " inputs, got " + std::to_string(inputs.size()));
    }

    std::vector<FieldElement> state;
    state.reserve(config_.width);
    state.push_back(FieldElement::Zero());
    state.insert(state.end(), inputs.begin(), inputs.end());
    Permute(state);
    return state[0];
}

// ============================================================================
// Static Convenience Methods
// ============================================================================

FieldElement Poseidon::Hash(const std::vector<FieldElement>& inputs) {
    return Poseidon(inputs.size()).Digest(inputs);
}

FieldElement Poseidon::Hash2(const FieldElement& left, const FieldElement& right) {
    return Poseidon(2).Digest({left, right});
}

} // namespace semaphore
