#include <montecarlo/resampling.hpp>
#include <montecarlo/errors.hpp>
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace montecarlo {

namespace {

/**
 * Cumulative weights with the tail clamped to exactly 1 from the last
 * positive entry on, so rounding can never select a zero-weight slot.
 */
std::vector<double> cumulative_weights(const std::vector<double>& weights) {
    if (weights.empty()) {
        throw std::invalid_argument("cannot resample an empty population");
    }

    double total = 0.0;
    std::size_t last_positive = weights.size();
    for (std::size_t i = 0; i < weights.size(); ++i) {
        double w = weights[i];
        if (!(w >= 0.0) || std::isinf(w)) {
            throw std::invalid_argument("resampling weights must be finite and non-negative");
        }
        if (w > 0.0) last_positive = i;
        total += w;
    }
    if (last_positive == weights.size()) {
        throw std::invalid_argument("resampling weights sum to zero");
    }

    std::vector<double> cumulative(weights.size());
    double running = 0.0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        running += weights[i] / total;
        cumulative[i] = i >= last_positive ? 1.0 : running;
    }
    return cumulative;
}

// Ancestor for each sorted point in [0, 1): first slot whose cumulative weight exceeds it
std::vector<std::size_t> select_sorted(const std::vector<double>& cumulative, const std::vector<double>& points) {
    std::vector<std::size_t> ancestors;
    ancestors.reserve(points.size());
    std::size_t slot = 0;
    for (double u : points) {
        while (slot + 1 < cumulative.size() && cumulative[slot] <= u) {
            ++slot;
        }
        ancestors.push_back(slot);
    }
    return ancestors;
}

std::vector<std::size_t> multinomial_draws(const std::vector<double>& cumulative, std::size_t count,
                                           RandomEngine& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::vector<double> points(count);
    for (double& u : points) {
        u = uniform(rng);
    }
    std::sort(points.begin(), points.end());
    return select_sorted(cumulative, points);
}

} // namespace

const char* to_string(ResamplingScheme scheme) {
    switch (scheme) {
        case ResamplingScheme::Multinomial: return "multinomial";
        case ResamplingScheme::Systematic: return "systematic";
        case ResamplingScheme::Stratified: return "stratified";
        case ResamplingScheme::Residual: return "residual";
    }
    return "unknown";
}

ResamplingScheme parse_resampling_scheme(std::string_view name) {
    if (name == "multinomial") return ResamplingScheme::Multinomial;
    if (name == "systematic") return ResamplingScheme::Systematic;
    if (name == "stratified") return ResamplingScheme::Stratified;
    if (name == "residual") return ResamplingScheme::Residual;
    throw ConfigurationError("unknown resampling strategy '" + std::string(name) + "'");
}

std::vector<std::size_t> MultinomialResampling::select(const std::vector<double>& weights, RandomEngine& rng) const {
    auto cumulative = cumulative_weights(weights);
    return multinomial_draws(cumulative, weights.size(), rng);
}

std::vector<std::size_t> SystematicResampling::select(const std::vector<double>& weights, RandomEngine& rng) const {
    auto cumulative = cumulative_weights(weights);
    const std::size_t n = weights.size();
    const double step = 1.0 / static_cast<double>(n);

    std::uniform_real_distribution<double> offset(0.0, step);
    double u0 = offset(rng);

    std::vector<double> points(n);
    for (std::size_t k = 0; k < n; ++k) {
        points[k] = u0 + static_cast<double>(k) * step;
    }
    return select_sorted(cumulative, points);
}

std::vector<std::size_t> StratifiedResampling::select(const std::vector<double>& weights, RandomEngine& rng) const {
    auto cumulative = cumulative_weights(weights);
    const std::size_t n = weights.size();

    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::vector<double> points(n);
    for (std::size_t k = 0; k < n; ++k) {
        points[k] = (static_cast<double>(k) + uniform(rng)) / static_cast<double>(n);
    }
    return select_sorted(cumulative, points);
}

std::vector<std::size_t> ResidualResampling::select(const std::vector<double>& weights, RandomEngine& rng) const {
    auto cumulative = cumulative_weights(weights);
    const std::size_t n = weights.size();

    // Recover normalized weights from the validated cumulative sums
    std::vector<double> normalized(n);
    double previous = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        normalized[i] = std::max(0.0, cumulative[i] - previous);
        previous = cumulative[i];
    }

    std::vector<std::size_t> ancestors;
    ancestors.reserve(n);
    std::vector<double> residuals(n, 0.0);
    double residual_total = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        double expected = static_cast<double>(n) * normalized[i];
        auto copies = static_cast<std::size_t>(std::floor(expected));
        ancestors.insert(ancestors.end(), std::min(copies, n - ancestors.size()), i);
        residuals[i] = expected - static_cast<double>(copies);
        residual_total += residuals[i];
    }

    std::size_t remaining = n - ancestors.size();
    if (remaining > 0) {
        std::vector<std::size_t> extra;
        if (residual_total > 0.0) {
            extra = multinomial_draws(cumulative_weights(residuals), remaining, rng);
        } else {
            extra = multinomial_draws(cumulative, remaining, rng);
        }
        ancestors.insert(ancestors.end(), extra.begin(), extra.end());
        std::sort(ancestors.begin(), ancestors.end());
    }
    return ancestors;
}

std::unique_ptr<ResamplingStrategy> make_resampling_strategy(ResamplingScheme scheme) {
    switch (scheme) {
        case ResamplingScheme::Multinomial: return std::make_unique<MultinomialResampling>();
        case ResamplingScheme::Systematic: return std::make_unique<SystematicResampling>();
        case ResamplingScheme::Stratified: return std::make_unique<StratifiedResampling>();
        case ResamplingScheme::Residual: return std::make_unique<ResidualResampling>();
    }
    throw ConfigurationError("unsupported resampling scheme");
}

} // namespace montecarlo
