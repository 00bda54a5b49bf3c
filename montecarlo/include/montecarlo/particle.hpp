#ifndef MONTECARLO_PARTICLE_HPP
#define MONTECARLO_PARTICLE_HPP

#include <montecarlo/log_weights.hpp>
#include <montecarlo/types.hpp>
#include <cmath>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace montecarlo {

/**
 * One weighted hypothesis.
 * log_weight is the cumulative, unnormalized log-weight; -inf marks a dead
 * particle that violated a hard constraint.
 */
template<typename State>
struct Particle {
    ParticleId id = INVALID_PARTICLE;
    State state{};
    double log_weight = 0.0;
    ParticleId parent = INVALID_PARTICLE;  // Predecessor before the last resampling
    bool finished = false;                 // Stop condition met, state is frozen
    std::map<std::string, std::string> metadata;

    bool has_parent() const { return parent != INVALID_PARTICLE; }
    bool is_alive() const { return log_weight != NEG_INF && !std::isnan(log_weight); }
};

/**
 * Fixed-size set of particles stored contiguously.
 * Index is the particle's slot in the arena; ids are unique over the
 * population's lifetime and change only when resampling creates offspring.
 */
template<typename State>
class ParticlePopulation {
private:
    std::vector<Particle<State>> particles_;
    ParticleId next_id_ = 0;

public:
    ParticlePopulation() = default;

    ParticlePopulation(std::size_t count, const State& initial) {
        particles_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            Particle<State> p;
            p.id = next_id_++;
            p.state = initial;
            particles_.push_back(std::move(p));
        }
    }

    explicit ParticlePopulation(std::vector<State> states) {
        particles_.reserve(states.size());
        for (auto& state : states) {
            Particle<State> p;
            p.id = next_id_++;
            p.state = std::move(state);
            particles_.push_back(std::move(p));
        }
    }

    std::size_t size() const { return particles_.size(); }
    bool empty() const { return particles_.empty(); }

    Particle<State>& operator[](std::size_t i) { return particles_[i]; }
    const Particle<State>& operator[](std::size_t i) const { return particles_[i]; }

    auto begin() { return particles_.begin(); }
    auto end() { return particles_.end(); }
    auto begin() const { return particles_.begin(); }
    auto end() const { return particles_.end(); }

    const std::vector<Particle<State>>& particles() const { return particles_; }

    std::vector<double> log_weights() const {
        std::vector<double> result;
        result.reserve(particles_.size());
        for (const auto& p : particles_) {
            result.push_back(p.log_weight);
        }
        return result;
    }

    // nullopt when every particle is dead
    std::optional<std::vector<double>> normalized_weights() const {
        return normalize_log_weights(log_weights());
    }

    // 1 / sum(w^2); 0 for a collapsed population
    double effective_sample_size() const {
        auto weights = normalized_weights();
        return weights ? montecarlo::effective_sample_size(*weights) : 0.0;
    }

    bool is_collapsed() const {
        return montecarlo::is_collapsed(log_weights());
    }

    std::size_t sanitize_weights(const char* context) {
        auto weights = log_weights();
        std::size_t changed = sanitize_log_weights(weights, context);
        if (changed > 0) {
            for (std::size_t i = 0; i < particles_.size(); ++i) {
                particles_[i].log_weight = weights[i];
            }
        }
        return changed;
    }

    void reset_weights() {
        for (auto& p : particles_) {
            p.log_weight = 0.0;
        }
    }

    /**
     * Replace the population by offspring of the given ancestor slots.
     * Offspring get fresh ids, record their ancestor and share uniform weight.
     */
    void resample_from(const std::vector<std::size_t>& ancestors) {
        if (ancestors.size() != particles_.size()) {
            throw std::invalid_argument("resampling must preserve the population size");
        }
        std::vector<Particle<State>> offspring;
        offspring.reserve(ancestors.size());
        for (std::size_t a : ancestors) {
            const Particle<State>& source = particles_.at(a);
            Particle<State> child = source;
            child.id = next_id_++;
            child.parent = source.id;
            child.log_weight = 0.0;
            offspring.push_back(std::move(child));
        }
        particles_ = std::move(offspring);
    }
};

} // namespace montecarlo

#endif // MONTECARLO_PARTICLE_HPP
