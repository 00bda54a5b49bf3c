#ifndef MONTECARLO_MCMC_HPP
#define MONTECARLO_MCMC_HPP

#include <montecarlo/distribution.hpp>
#include <montecarlo/types.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>

namespace montecarlo {

using Vector = std::vector<double>;
using LogDensity = std::function<double(const Vector&)>;
using LogDensityGradient = std::function<Vector(const Vector&)>;

struct McmcOptions {
    std::size_t num_samples = 1000;  // Samples kept after burn-in and thinning
    std::size_t burn_in = 0;
    std::size_t thinning = 1;        // Keep every k-th post-burn-in state
    std::uint64_t seed = std::random_device{}();
};

struct McmcResult {
    std::vector<Vector> samples;
    std::vector<double> log_densities;
    std::size_t proposals = 0;  // Post-burn-in transitions attempted
    std::size_t accepted = 0;

    double acceptance_rate() const;
    // Autocorrelation-based ESS for each coordinate
    std::vector<double> effective_sample_size() const;
    Vector mean() const;
};

/**
 * Autocorrelation-based effective sample size of one scalar chain:
 * n / (1 + 2 * sum(rho_k)), summing lags up to min(50, n / 2) and stopping
 * at the first non-positive autocorrelation. A constant chain scores 1.
 */
double autocorrelation_ess(const std::vector<double>& chain);

/**
 * Proposal kernel for Metropolis-Hastings.
 * log_correction() returns log q(current | proposed) - log q(proposed | current),
 * zero for symmetric kernels.
 */
class ProposalKernel {
public:
    virtual ~ProposalKernel() = default;

    virtual Vector propose(const Vector& current, RandomEngine& rng) = 0;
    virtual double log_correction(const Vector& /*current*/, const Vector& /*proposed*/) const { return 0.0; }

    // Called after every accept/reject decision during burn-in
    virtual void observe(bool /*accepted*/) {}
};

class GaussianRandomWalkProposal : public ProposalKernel {
private:
    Vector scales_;  // One entry applies to every coordinate

public:
    explicit GaussianRandomWalkProposal(double scale);
    explicit GaussianRandomWalkProposal(Vector scales);

    Vector propose(const Vector& current, RandomEngine& rng) override;
};

// current + U(-half_width, half_width) per coordinate
class UniformRandomWalkProposal : public ProposalKernel {
private:
    double half_width_;

public:
    explicit UniformRandomWalkProposal(double half_width);

    Vector propose(const Vector& current, RandomEngine& rng) override;
};

/**
 * Gaussian random walk whose scale is tuned during burn-in:
 * log(scale) += rate * (accepted - target_acceptance).
 */
class AdaptiveGaussianProposal : public ProposalKernel {
private:
    double scale_;
    double target_acceptance_;
    double adaptation_rate_;

public:
    explicit AdaptiveGaussianProposal(double initial_scale, double target_acceptance = 0.234,
                                      double adaptation_rate = 0.05);

    Vector propose(const Vector& current, RandomEngine& rng) override;
    void observe(bool accepted) override;

    double scale() const { return scale_; }
};

// Draws independently of the current state; asymmetric
class IndependenceProposal : public ProposalKernel {
private:
    std::shared_ptr<const Distribution<Vector>> distribution_;

public:
    explicit IndependenceProposal(std::shared_ptr<const Distribution<Vector>> distribution);

    Vector propose(const Vector& current, RandomEngine& rng) override;
    double log_correction(const Vector& current, const Vector& proposed) const override;
};

/**
 * Shared chain driver: burn-in, thinning and acceptance bookkeeping.
 * Subclasses implement one transition of the chain.
 */
class MarkovChainSampler {
public:
    virtual ~MarkovChainSampler() = default;

    McmcResult run(const Vector& initial, const McmcOptions& options);

protected:
    // Advance state in place; returns whether the move was accepted
    virtual bool transition(Vector& state, double& log_density, RandomEngine& rng) = 0;
    virtual double evaluate(const Vector& state) const = 0;
    virtual void observe(bool /*accepted*/) {}
};

class MetropolisHastingsSampler : public MarkovChainSampler {
private:
    LogDensity target_;
    std::unique_ptr<ProposalKernel> proposal_;

public:
    MetropolisHastingsSampler(LogDensity target, std::unique_ptr<ProposalKernel> proposal);

    const ProposalKernel& proposal() const { return *proposal_; }

protected:
    bool transition(Vector& state, double& log_density, RandomEngine& rng) override;
    double evaluate(const Vector& state) const override;
    void observe(bool accepted) override;
};

/**
 * Systematic-scan Gibbs sampler. One full-conditional sampler per coordinate;
 * every update is accepted. The target density is optional and only used for
 * the recorded log densities.
 */
class GibbsSampler : public MarkovChainSampler {
public:
    using ConditionalSampler = std::function<double(const Vector& state, RandomEngine& rng)>;

private:
    std::vector<ConditionalSampler> conditionals_;
    LogDensity target_;

public:
    explicit GibbsSampler(std::vector<ConditionalSampler> conditionals, LogDensity target = nullptr);

protected:
    bool transition(Vector& state, double& log_density, RandomEngine& rng) override;
    double evaluate(const Vector& state) const override;
};

// Hamiltonian Monte Carlo with a leapfrog integrator and unit-diagonal mass
class HamiltonianSampler : public MarkovChainSampler {
private:
    LogDensity target_;
    LogDensityGradient gradient_;
    double step_size_;
    std::size_t leapfrog_steps_;
    double mass_;

public:
    HamiltonianSampler(LogDensity target, LogDensityGradient gradient, double step_size,
                       std::size_t leapfrog_steps, double mass = 1.0);

protected:
    bool transition(Vector& state, double& log_density, RandomEngine& rng) override;
    double evaluate(const Vector& state) const override;
};

} // namespace montecarlo

#endif // MONTECARLO_MCMC_HPP
