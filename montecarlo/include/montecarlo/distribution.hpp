#ifndef MONTECARLO_DISTRIBUTION_HPP
#define MONTECARLO_DISTRIBUTION_HPP

#include <montecarlo/errors.hpp>
#include <montecarlo/log_weights.hpp>
#include <montecarlo/types.hpp>
#include <cmath>
#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace montecarlo {

/**
 * Stateless sampling capability.
 * sample() always returns a value inside the support; log_pdf() is finite
 * inside the support and -inf outside it. Randomness comes from the caller's
 * engine so one distribution object can be shared between threads.
 */
template<typename T>
class Distribution {
public:
    using value_type = T;

    virtual ~Distribution() = default;

    virtual T sample(RandomEngine& rng) const = 0;
    virtual double log_pdf(const T& value) const = 0;

    double pdf(const T& value) const {
        return std::exp(log_pdf(value));
    }

    std::vector<T> sample_n(RandomEngine& rng, std::size_t count) const {
        std::vector<T> values;
        values.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            values.push_back(sample(rng));
        }
        return values;
    }
};

class GaussianDistribution : public Distribution<double> {
private:
    double mean_;
    double stddev_;

public:
    GaussianDistribution(double mean, double stddev);

    double sample(RandomEngine& rng) const override;
    double log_pdf(const double& value) const override;

    double mean() const { return mean_; }
    double stddev() const { return stddev_; }
};

// Continuous uniform on the closed interval [low, high]
class UniformDistribution : public Distribution<double> {
private:
    double low_;
    double high_;

public:
    UniformDistribution(double low, double high);

    double sample(RandomEngine& rng) const override;
    double log_pdf(const double& value) const override;

    double low() const { return low_; }
    double high() const { return high_; }
};

// Independent Gaussians per coordinate
class DiagonalGaussianDistribution : public Distribution<std::vector<double>> {
private:
    std::vector<double> means_;
    std::vector<double> stddevs_;

public:
    DiagonalGaussianDistribution(std::vector<double> means, std::vector<double> stddevs);
    DiagonalGaussianDistribution(std::size_t dimension, double mean, double stddev);

    std::vector<double> sample(RandomEngine& rng) const override;
    // -inf for a vector of the wrong dimension
    double log_pdf(const std::vector<double>& value) const override;

    std::size_t dimension() const { return means_.size(); }
    const std::vector<double>& means() const { return means_; }
    const std::vector<double>& stddevs() const { return stddevs_; }
};

/**
 * Finite categorical distribution over arbitrary values.
 * Probabilities are normalized on construction; duplicate values pool their mass.
 */
template<typename T>
class DiscreteDistribution : public Distribution<T> {
private:
    std::vector<T> values_;
    std::vector<double> probabilities_;

public:
    DiscreteDistribution(std::vector<T> values, std::vector<double> probabilities)
        : values_(std::move(values)), probabilities_(std::move(probabilities)) {
        if (values_.empty()) {
            throw ConfigurationError("discrete distribution needs at least one value");
        }
        if (values_.size() != probabilities_.size()) {
            throw ConfigurationError("discrete distribution has " + std::to_string(values_.size()) +
                                     " values but " + std::to_string(probabilities_.size()) + " probabilities");
        }
        double total = 0.0;
        for (double p : probabilities_) {
            if (!(p >= 0.0) || std::isinf(p)) {
                throw ConfigurationError("discrete probabilities must be finite and non-negative");
            }
            total += p;
        }
        if (total <= 0.0) {
            throw ConfigurationError("discrete probabilities sum to zero");
        }
        for (double& p : probabilities_) {
            p /= total;
        }
    }

    // Uniform over the given values
    explicit DiscreteDistribution(std::vector<T> values)
        : DiscreteDistribution(values, std::vector<double>(values.size(), 1.0)) {}

    T sample(RandomEngine& rng) const override {
        std::discrete_distribution<std::size_t> pick(probabilities_.begin(), probabilities_.end());
        return values_[pick(rng)];
    }

    double log_pdf(const T& value) const override {
        double mass = 0.0;
        for (std::size_t i = 0; i < values_.size(); ++i) {
            if (values_[i] == value) mass += probabilities_[i];
        }
        return mass > 0.0 ? std::log(mass) : NEG_INF;
    }

    const std::vector<T>& values() const { return values_; }
    const std::vector<double>& probabilities() const { return probabilities_; }
};

/**
 * Weighted mixture of component distributions.
 * Component weights can be re-fitted, which adaptive importance sampling uses.
 */
template<typename T>
class MixtureDistribution : public Distribution<T> {
private:
    std::vector<std::shared_ptr<const Distribution<T>>> components_;
    std::vector<double> weights_;

public:
    MixtureDistribution(std::vector<std::shared_ptr<const Distribution<T>>> components,
                        std::vector<double> weights = {})
        : components_(std::move(components)) {
        if (components_.empty()) {
            throw ConfigurationError("mixture needs at least one component");
        }
        if (weights.empty()) {
            weights.assign(components_.size(), 1.0);
        }
        set_weights(std::move(weights));
    }

    void set_weights(std::vector<double> weights) {
        if (weights.size() != components_.size()) {
            throw ConfigurationError("mixture weight count does not match component count");
        }
        double total = 0.0;
        for (double w : weights) {
            if (!(w >= 0.0) || std::isinf(w)) {
                throw ConfigurationError("mixture weights must be finite and non-negative");
            }
            total += w;
        }
        if (total <= 0.0) {
            throw ConfigurationError("mixture weights sum to zero");
        }
        for (double& w : weights) {
            w /= total;
        }
        weights_ = std::move(weights);
    }

    T sample(RandomEngine& rng) const override {
        std::discrete_distribution<std::size_t> pick(weights_.begin(), weights_.end());
        return components_[pick(rng)]->sample(rng);
    }

    double log_pdf(const T& value) const override {
        std::vector<double> terms;
        terms.reserve(components_.size());
        for (std::size_t k = 0; k < components_.size(); ++k) {
            terms.push_back(weights_[k] > 0.0 ? std::log(weights_[k]) + components_[k]->log_pdf(value) : NEG_INF);
        }
        return log_sum_exp(terms);
    }

    // log p_k(value) for every component, unweighted
    std::vector<double> component_log_pdfs(const T& value) const {
        std::vector<double> result;
        result.reserve(components_.size());
        for (const auto& component : components_) {
            result.push_back(component->log_pdf(value));
        }
        return result;
    }

    std::size_t component_count() const { return components_.size(); }
    const std::vector<double>& weights() const { return weights_; }
    const Distribution<T>& component(std::size_t k) const { return *components_.at(k); }
};

} // namespace montecarlo

#endif // MONTECARLO_DISTRIBUTION_HPP
