#ifndef MONTECARLO_RESAMPLING_HPP
#define MONTECARLO_RESAMPLING_HPP

#include <montecarlo/types.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace montecarlo {

enum class ResamplingScheme {
    Multinomial,
    Systematic,
    Stratified,
    Residual
};

const char* to_string(ResamplingScheme scheme);
// Accepts the lowercase names; throws ConfigurationError otherwise
ResamplingScheme parse_resampling_scheme(std::string_view name);

/**
 * Maps normalized weights to ancestor indices.
 *
 * Output has one entry per offspring (same count as the input) and is sorted
 * ascending. A cumulative-weight tie resolves to the lower index, so equal
 * inputs always produce equal outputs for the same random stream.
 */
class ResamplingStrategy {
public:
    virtual ~ResamplingStrategy() = default;

    virtual std::vector<std::size_t> select(const std::vector<double>& weights, RandomEngine& rng) const = 0;
    virtual ResamplingScheme scheme() const = 0;

    const char* name() const { return to_string(scheme()); }
};

// N independent categorical draws
class MultinomialResampling : public ResamplingStrategy {
public:
    std::vector<std::size_t> select(const std::vector<double>& weights, RandomEngine& rng) const override;
    ResamplingScheme scheme() const override { return ResamplingScheme::Multinomial; }
};

// One offset u in [0, 1/N), points u + k/N
class SystematicResampling : public ResamplingStrategy {
public:
    std::vector<std::size_t> select(const std::vector<double>& weights, RandomEngine& rng) const override;
    ResamplingScheme scheme() const override { return ResamplingScheme::Systematic; }
};

// One independent draw inside each stratum [k/N, (k+1)/N)
class StratifiedResampling : public ResamplingStrategy {
public:
    std::vector<std::size_t> select(const std::vector<double>& weights, RandomEngine& rng) const override;
    ResamplingScheme scheme() const override { return ResamplingScheme::Stratified; }
};

// floor(N w_i) deterministic copies, remainder drawn multinomially from residual weights
class ResidualResampling : public ResamplingStrategy {
public:
    std::vector<std::size_t> select(const std::vector<double>& weights, RandomEngine& rng) const override;
    ResamplingScheme scheme() const override { return ResamplingScheme::Residual; }
};

std::unique_ptr<ResamplingStrategy> make_resampling_strategy(ResamplingScheme scheme);

} // namespace montecarlo

#endif // MONTECARLO_RESAMPLING_HPP
