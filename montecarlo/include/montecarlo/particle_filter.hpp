#ifndef MONTECARLO_PARTICLE_FILTER_HPP
#define MONTECARLO_PARTICLE_FILTER_HPP

#include <montecarlo/distribution.hpp>
#include <montecarlo/errors.hpp>
#include <montecarlo/particle.hpp>
#include <montecarlo/resampling.hpp>
#include <montecarlo/debug_log.hpp>
#include <cstdint>
#include <memory>
#include <random>

namespace montecarlo {

/**
 * Transition model: draws the next state given the current one.
 * Must be reentrant; the filter may share it between threads.
 */
template<typename State>
class SystemModel {
public:
    virtual ~SystemModel() = default;
    virtual State propagate(const State& state, double dt, RandomEngine& rng) const = 0;
};

// log p(observation | state); -inf for impossible observations
template<typename State, typename Observation>
class ObservationModel {
public:
    virtual ~ObservationModel() = default;
    virtual double log_likelihood(const Observation& observation, const State& state) const = 0;
};

struct ParticleFilterOptions {
    std::size_t particle_count = 1000;
    double resampling_threshold = 0.5;  // Resample when ESS / N falls below this
    ResamplingScheme resampling = ResamplingScheme::Systematic;
    std::uint64_t seed = std::random_device{}();
};

/**
 * Bootstrap particle filter.
 *
 * predict() moves every particle through the system model; update() reweights
 * by the observation likelihood and resamples when the effective sample size
 * drops below threshold * N. The caller decides when to stop.
 */
template<typename State, typename Observation>
class ParticleFilter {
private:
    std::shared_ptr<const SystemModel<State>> system_;
    std::shared_ptr<const ObservationModel<State, Observation>> observation_;
    std::unique_ptr<ResamplingStrategy> resampler_;
    ParticlePopulation<State> population_;
    RandomEngine rng_;
    double resampling_threshold_;
    std::size_t update_count_ = 0;
    std::size_t resample_count_ = 0;

public:
    ParticleFilter(std::shared_ptr<const SystemModel<State>> system,
                   std::shared_ptr<const ObservationModel<State, Observation>> observation,
                   const Distribution<State>& initial,
                   const ParticleFilterOptions& options = {})
        : system_(std::move(system)),
          observation_(std::move(observation)),
          resampler_(make_resampling_strategy(options.resampling)),
          rng_(options.seed),
          resampling_threshold_(options.resampling_threshold) {
        if (!system_ || !observation_) {
            throw ConfigurationError("particle filter needs a system model and an observation model");
        }
        if (options.particle_count == 0) {
            throw ConfigurationError("particle filter needs at least one particle");
        }
        if (!(resampling_threshold_ >= 0.0 && resampling_threshold_ <= 1.0)) {
            throw ConfigurationError("resampling threshold must lie in [0, 1]");
        }
        population_ = ParticlePopulation<State>(initial.sample_n(rng_, options.particle_count));
    }

    void predict(double dt = 1.0) {
        for (auto& particle : population_) {
            particle.state = system_->propagate(particle.state, dt, rng_);
        }
    }

    /**
     * Reweight by the observation and resample if degenerate.
     * @return true if resampling happened
     * @throws ConstraintUnsatisfiableError when every likelihood is zero
     */
    bool update(const Observation& observation) {
        ++update_count_;
        for (auto& particle : population_) {
            particle.log_weight += observation_->log_likelihood(observation, particle.state);
        }
        population_.sanitize_weights("particle filter update");

        auto weights = population_.normalized_weights();
        if (!weights) {
            throw ConstraintUnsatisfiableError("observation has zero likelihood under every particle", update_count_);
        }

        double ess = montecarlo::effective_sample_size(*weights);
        if (population_.size() > 1 &&
            ess < resampling_threshold_ * static_cast<double>(population_.size())) {
            MONTECARLO_DEBUG_LOG("particle filter: resampling at update %zu (ESS %.2f)", update_count_, ess);
            population_.resample_from(resampler_->select(*weights, rng_));
            ++resample_count_;
            return true;
        }
        return false;
    }

    bool step(const Observation& observation, double dt = 1.0) {
        predict(dt);
        return update(observation);
    }

    double effective_sample_size() const { return population_.effective_sample_size(); }

    // State of the highest-weight particle, lowest index on ties
    const State& map_estimate() const {
        auto weights = population_.normalized_weights();
        if (!weights) {
            throw ConstraintUnsatisfiableError("no live particle to estimate from", update_count_);
        }
        return population_[argmax_index(*weights)].state;
    }

    const ParticlePopulation<State>& population() const { return population_; }
    std::size_t resample_count() const { return resample_count_; }
    std::size_t update_count() const { return update_count_; }
};

} // namespace montecarlo

#endif // MONTECARLO_PARTICLE_FILTER_HPP
