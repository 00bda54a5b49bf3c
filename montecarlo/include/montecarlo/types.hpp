#ifndef MONTECARLO_TYPES_HPP
#define MONTECARLO_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

namespace montecarlo {

using ParticleId = std::uint64_t;
constexpr ParticleId INVALID_PARTICLE = std::numeric_limits<ParticleId>::max();

// Opaque token; the library never interprets its contents
using Token = std::string;
using TokenSequence = std::vector<Token>;

using RandomEngine = std::mt19937_64;

constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

/**
 * Derive an independent seed for (stream, index) from a master seed.
 * SplitMix64 finalizer; used so per-particle proposal streams do not depend
 * on which worker runs the particle.
 */
constexpr std::uint64_t derive_seed(std::uint64_t master, std::uint64_t stream, std::uint64_t index) {
    std::uint64_t z = master + 0x9E3779B97F4A7C15ULL * (stream + 1) + 0xBF58476D1CE4E5B9ULL * (index + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

// Join tokens with a separator, e.g. for display or pattern matching
inline std::string join_tokens(const TokenSequence& tokens, std::size_t begin = 0,
                               const std::string& separator = " ") {
    std::string text;
    for (std::size_t i = begin; i < tokens.size(); ++i) {
        if (i > begin) text += separator;
        text += tokens[i];
    }
    return text;
}

} // namespace montecarlo

#endif // MONTECARLO_TYPES_HPP
