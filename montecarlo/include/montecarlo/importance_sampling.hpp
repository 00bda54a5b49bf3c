#ifndef MONTECARLO_IMPORTANCE_SAMPLING_HPP
#define MONTECARLO_IMPORTANCE_SAMPLING_HPP

#include <montecarlo/distribution.hpp>
#include <montecarlo/errors.hpp>
#include <montecarlo/log_weights.hpp>
#include <montecarlo/debug_log.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>

namespace montecarlo {

/**
 * Weighted draws from a proposal, weights w = target / proposal.
 */
template<typename T>
struct ImportanceResult {
    std::vector<T> samples;
    std::vector<double> log_weights;  // log target - log proposal
    std::vector<double> weights;      // normalized
    double effective_sample_size = 0.0;
    double log_evidence = NEG_INF;    // log of the mean unnormalized weight

    // Self-normalized estimate of E_target[f]
    template<typename F>
    double expectation(F&& f) const {
        double total = 0.0;
        for (std::size_t i = 0; i < samples.size(); ++i) {
            if (weights[i] > 0.0) total += weights[i] * f(samples[i]);
        }
        return total;
    }
};

namespace detail {

template<typename T>
void finalize_importance_result(ImportanceResult<T>& result) {
    sanitize_log_weights(result.log_weights, "importance sampler");
    auto weights = normalize_log_weights(result.log_weights);
    if (!weights) {
        throw ConstraintUnsatisfiableError("target density is zero on every draw", 0);
    }
    result.weights = std::move(*weights);
    result.effective_sample_size = effective_sample_size(result.weights);
    result.log_evidence = log_sum_exp(result.log_weights) - std::log(static_cast<double>(result.samples.size()));
}

} // namespace detail

template<typename T>
class ImportanceSampler {
public:
    using LogDensity = std::function<double(const T&)>;

private:
    std::shared_ptr<const Distribution<T>> proposal_;
    LogDensity target_log_density_;
    RandomEngine rng_;

public:
    ImportanceSampler(std::shared_ptr<const Distribution<T>> proposal, LogDensity target_log_density,
                      std::uint64_t seed = std::random_device{}())
        : proposal_(std::move(proposal)), target_log_density_(std::move(target_log_density)), rng_(seed) {
        if (!proposal_ || !target_log_density_) {
            throw ConfigurationError("importance sampler needs a proposal and a target density");
        }
    }

    /**
     * Draw count samples in one shot.
     * @throws ConstraintUnsatisfiableError if no draw has positive target density
     */
    ImportanceResult<T> sample(std::size_t count) {
        if (count == 0) {
            throw ConfigurationError("importance sampler needs at least one draw");
        }
        ImportanceResult<T> result;
        result.samples.reserve(count);
        result.log_weights.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            T value = proposal_->sample(rng_);
            double log_q = proposal_->log_pdf(value);
            double log_w = log_q == NEG_INF ? NEG_INF : target_log_density_(value) - log_q;
            result.samples.push_back(std::move(value));
            result.log_weights.push_back(log_w);
        }
        detail::finalize_importance_result(result);
        return result;
    }
};

/**
 * Importance sampling with a mixture proposal whose component weights are
 * re-fitted every adaptation_interval draws. Each component's new weight is
 * the importance-weighted responsibility it carried in the last round, floored
 * so no component is switched off permanently.
 */
template<typename T>
class AdaptiveImportanceSampler {
public:
    using LogDensity = std::function<double(const T&)>;

private:
    MixtureDistribution<T> proposal_;
    LogDensity target_log_density_;
    std::size_t adaptation_interval_;
    double weight_floor_;
    RandomEngine rng_;
    std::vector<std::vector<double>> weight_history_;

    void adapt(const std::vector<T>& samples, const std::vector<double>& log_weights) {
        auto weights = normalize_log_weights(log_weights);
        if (!weights) {
            MONTECARLO_DEBUG_LOG("adaptive importance sampler: round without mass, keeping weights");
            return;
        }

        const std::size_t k_count = proposal_.component_count();
        std::vector<double> updated(k_count, 0.0);
        for (std::size_t i = 0; i < samples.size(); ++i) {
            if ((*weights)[i] == 0.0) continue;
            auto component_logs = proposal_.component_log_pdfs(samples[i]);
            for (std::size_t k = 0; k < k_count; ++k) {
                double pi = proposal_.weights()[k];
                component_logs[k] = pi > 0.0 ? std::log(pi) + component_logs[k] : NEG_INF;
            }
            auto responsibilities = normalize_log_weights(component_logs);
            if (!responsibilities) continue;
            for (std::size_t k = 0; k < k_count; ++k) {
                updated[k] += (*weights)[i] * (*responsibilities)[k];
            }
        }
        for (double& w : updated) {
            w = std::max(w, weight_floor_);
        }
        proposal_.set_weights(std::move(updated));
        weight_history_.push_back(proposal_.weights());
    }

public:
    AdaptiveImportanceSampler(MixtureDistribution<T> proposal, LogDensity target_log_density,
                              std::size_t adaptation_interval = 100, double weight_floor = 1e-3,
                              std::uint64_t seed = std::random_device{}())
        : proposal_(std::move(proposal)),
          target_log_density_(std::move(target_log_density)),
          adaptation_interval_(adaptation_interval),
          weight_floor_(weight_floor),
          rng_(seed) {
        if (!target_log_density_) {
            throw ConfigurationError("adaptive importance sampler needs a target density");
        }
        if (adaptation_interval_ == 0) {
            throw ConfigurationError("adaptation interval must be positive");
        }
        if (!(weight_floor_ >= 0.0 && weight_floor_ < 1.0)) {
            throw ConfigurationError("weight floor must lie in [0, 1)");
        }
    }

    ImportanceResult<T> sample(std::size_t count) {
        if (count == 0) {
            throw ConfigurationError("importance sampler needs at least one draw");
        }
        ImportanceResult<T> result;
        result.samples.reserve(count);
        result.log_weights.reserve(count);

        std::vector<T> round_samples;
        std::vector<double> round_log_weights;
        for (std::size_t i = 0; i < count; ++i) {
            T value = proposal_.sample(rng_);
            double log_q = proposal_.log_pdf(value);
            double log_w = log_q == NEG_INF ? NEG_INF : target_log_density_(value) - log_q;

            round_samples.push_back(value);
            round_log_weights.push_back(log_w);
            result.samples.push_back(std::move(value));
            result.log_weights.push_back(log_w);

            if (round_samples.size() == adaptation_interval_) {
                adapt(round_samples, round_log_weights);
                round_samples.clear();
                round_log_weights.clear();
            }
        }
        detail::finalize_importance_result(result);
        return result;
    }

    const MixtureDistribution<T>& proposal() const { return proposal_; }
    const std::vector<std::vector<double>>& weight_history() const { return weight_history_; }
};

} // namespace montecarlo

#endif // MONTECARLO_IMPORTANCE_SAMPLING_HPP
