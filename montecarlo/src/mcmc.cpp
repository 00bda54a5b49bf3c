#include <montecarlo/mcmc.hpp>
#include <montecarlo/errors.hpp>
#include <montecarlo/debug_log.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace montecarlo {

namespace {

bool accept_move(double log_alpha, RandomEngine& rng) {
    if (std::isnan(log_alpha)) return false;
    if (log_alpha >= 0.0) return true;
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    return std::log(uniform(rng)) < log_alpha;
}

void require_dimension(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("vector dimensions differ");
    }
}

} // namespace

// === Diagnostics ===

double McmcResult::acceptance_rate() const {
    return proposals > 0 ? static_cast<double>(accepted) / static_cast<double>(proposals) : 0.0;
}

std::vector<double> McmcResult::effective_sample_size() const {
    std::vector<double> ess;
    if (samples.empty()) return ess;
    const std::size_t dims = samples.front().size();
    for (std::size_t d = 0; d < dims; ++d) {
        std::vector<double> chain;
        chain.reserve(samples.size());
        for (const auto& s : samples) {
            chain.push_back(s[d]);
        }
        ess.push_back(autocorrelation_ess(chain));
    }
    return ess;
}

Vector McmcResult::mean() const {
    if (samples.empty()) return {};
    Vector m(samples.front().size(), 0.0);
    for (const auto& s : samples) {
        for (std::size_t d = 0; d < m.size(); ++d) {
            m[d] += s[d];
        }
    }
    for (double& v : m) {
        v /= static_cast<double>(samples.size());
    }
    return m;
}

double autocorrelation_ess(const std::vector<double>& chain) {
    const std::size_t n = chain.size();
    if (n < 2) return static_cast<double>(n);

    double mean = 0.0;
    for (double x : chain) mean += x;
    mean /= static_cast<double>(n);

    double variance = 0.0;
    for (double x : chain) variance += (x - mean) * (x - mean);
    variance /= static_cast<double>(n);
    if (variance <= 0.0) return 1.0;

    const std::size_t max_lag = std::min<std::size_t>(50, n / 2);
    double rho_sum = 0.0;
    for (std::size_t lag = 1; lag <= max_lag; ++lag) {
        double cov = 0.0;
        for (std::size_t i = 0; i + lag < n; ++i) {
            cov += (chain[i] - mean) * (chain[i + lag] - mean);
        }
        double rho = cov / (static_cast<double>(n) * variance);
        if (rho <= 0.0) break;
        rho_sum += rho;
    }
    double ess = static_cast<double>(n) / (1.0 + 2.0 * rho_sum);
    return std::clamp(ess, 1.0, static_cast<double>(n));
}

// === Proposals ===

GaussianRandomWalkProposal::GaussianRandomWalkProposal(double scale)
    : GaussianRandomWalkProposal(Vector{scale}) {}

GaussianRandomWalkProposal::GaussianRandomWalkProposal(Vector scales)
    : scales_(std::move(scales)) {
    if (scales_.empty()) {
        throw ConfigurationError("random walk proposal needs a scale");
    }
    for (double s : scales_) {
        if (!(s > 0.0) || std::isinf(s)) {
            throw ConfigurationError("random walk scale must be positive and finite");
        }
    }
}

Vector GaussianRandomWalkProposal::propose(const Vector& current, RandomEngine& rng) {
    if (scales_.size() != 1 && scales_.size() != current.size()) {
        throw std::invalid_argument("proposal scale dimension does not match the state");
    }
    std::normal_distribution<double> standard(0.0, 1.0);
    Vector proposed = current;
    for (std::size_t i = 0; i < proposed.size(); ++i) {
        double scale = scales_.size() == 1 ? scales_[0] : scales_[i];
        proposed[i] += scale * standard(rng);
    }
    return proposed;
}

UniformRandomWalkProposal::UniformRandomWalkProposal(double half_width)
    : half_width_(half_width) {
    if (!(half_width_ > 0.0) || std::isinf(half_width_)) {
        throw ConfigurationError("uniform proposal width must be positive and finite");
    }
}

Vector UniformRandomWalkProposal::propose(const Vector& current, RandomEngine& rng) {
    std::uniform_real_distribution<double> step(-half_width_, half_width_);
    Vector proposed = current;
    for (double& x : proposed) {
        x += step(rng);
    }
    return proposed;
}

AdaptiveGaussianProposal::AdaptiveGaussianProposal(double initial_scale, double target_acceptance,
                                                   double adaptation_rate)
    : scale_(initial_scale), target_acceptance_(target_acceptance), adaptation_rate_(adaptation_rate) {
    if (!(scale_ > 0.0) || std::isinf(scale_)) {
        throw ConfigurationError("adaptive proposal scale must be positive and finite");
    }
    if (!(target_acceptance_ > 0.0 && target_acceptance_ < 1.0)) {
        throw ConfigurationError("target acceptance rate must lie in (0, 1)");
    }
    if (!(adaptation_rate_ >= 0.0)) {
        throw ConfigurationError("adaptation rate must be non-negative");
    }
}

Vector AdaptiveGaussianProposal::propose(const Vector& current, RandomEngine& rng) {
    std::normal_distribution<double> standard(0.0, 1.0);
    Vector proposed = current;
    for (double& x : proposed) {
        x += scale_ * standard(rng);
    }
    return proposed;
}

void AdaptiveGaussianProposal::observe(bool accepted) {
    double signal = (accepted ? 1.0 : 0.0) - target_acceptance_;
    scale_ = std::clamp(scale_ * std::exp(adaptation_rate_ * signal), 1e-8, 1e8);
}

IndependenceProposal::IndependenceProposal(std::shared_ptr<const Distribution<Vector>> distribution)
    : distribution_(std::move(distribution)) {
    if (!distribution_) {
        throw ConfigurationError("independence proposal needs a distribution");
    }
}

Vector IndependenceProposal::propose(const Vector&, RandomEngine& rng) {
    return distribution_->sample(rng);
}

double IndependenceProposal::log_correction(const Vector& current, const Vector& proposed) const {
    return distribution_->log_pdf(current) - distribution_->log_pdf(proposed);
}

// === Chain driver ===

McmcResult MarkovChainSampler::run(const Vector& initial, const McmcOptions& options) {
    if (options.num_samples == 0) {
        throw ConfigurationError("MCMC needs at least one sample");
    }
    if (options.thinning == 0) {
        throw ConfigurationError("thinning interval must be at least 1");
    }
    if (initial.empty()) {
        throw ConfigurationError("MCMC initial state is empty");
    }

    RandomEngine rng(options.seed);
    Vector state = initial;
    double log_density = evaluate(state);
    if (std::isnan(log_density) || log_density == NEG_INF) {
        throw ConfigurationError("initial state has zero target density");
    }

    McmcResult result;
    result.samples.reserve(options.num_samples);
    result.log_densities.reserve(options.num_samples);

    for (std::size_t i = 0; i < options.burn_in; ++i) {
        bool accepted = transition(state, log_density, rng);
        observe(accepted);
    }

    const std::size_t iterations = options.num_samples * options.thinning;
    for (std::size_t i = 1; i <= iterations; ++i) {
        bool accepted = transition(state, log_density, rng);
        ++result.proposals;
        if (accepted) ++result.accepted;
        if (i % options.thinning == 0) {
            result.samples.push_back(state);
            result.log_densities.push_back(log_density);
        }
    }

    MONTECARLO_DEBUG_LOG("mcmc: %zu samples, acceptance %.3f", result.samples.size(), result.acceptance_rate());
    return result;
}

// === Metropolis-Hastings ===

MetropolisHastingsSampler::MetropolisHastingsSampler(LogDensity target, std::unique_ptr<ProposalKernel> proposal)
    : target_(std::move(target)), proposal_(std::move(proposal)) {
    if (!target_ || !proposal_) {
        throw ConfigurationError("Metropolis-Hastings needs a target density and a proposal");
    }
}

bool MetropolisHastingsSampler::transition(Vector& state, double& log_density, RandomEngine& rng) {
    Vector proposed = proposal_->propose(state, rng);
    require_dimension(state, proposed);
    double proposed_density = target_(proposed);
    if (std::isnan(proposed_density) || proposed_density == NEG_INF) {
        return false;
    }
    double log_alpha = proposed_density - log_density + proposal_->log_correction(state, proposed);
    if (!accept_move(log_alpha, rng)) {
        return false;
    }
    state = std::move(proposed);
    log_density = proposed_density;
    return true;
}

double MetropolisHastingsSampler::evaluate(const Vector& state) const {
    return target_(state);
}

void MetropolisHastingsSampler::observe(bool accepted) {
    proposal_->observe(accepted);
}

// === Gibbs ===

GibbsSampler::GibbsSampler(std::vector<ConditionalSampler> conditionals, LogDensity target)
    : conditionals_(std::move(conditionals)), target_(std::move(target)) {
    if (conditionals_.empty()) {
        throw ConfigurationError("Gibbs sampler needs one conditional per coordinate");
    }
    for (const auto& c : conditionals_) {
        if (!c) throw ConfigurationError("Gibbs conditional sampler is empty");
    }
}

bool GibbsSampler::transition(Vector& state, double& log_density, RandomEngine& rng) {
    if (state.size() != conditionals_.size()) {
        throw std::invalid_argument("Gibbs state dimension does not match the conditionals");
    }
    for (std::size_t i = 0; i < conditionals_.size(); ++i) {
        state[i] = conditionals_[i](state, rng);
    }
    log_density = evaluate(state);
    return true;
}

double GibbsSampler::evaluate(const Vector& state) const {
    return target_ ? target_(state) : 0.0;
}

// === Hamiltonian ===

HamiltonianSampler::HamiltonianSampler(LogDensity target, LogDensityGradient gradient, double step_size,
                                       std::size_t leapfrog_steps, double mass)
    : target_(std::move(target)),
      gradient_(std::move(gradient)),
      step_size_(step_size),
      leapfrog_steps_(leapfrog_steps),
      mass_(mass) {
    if (!target_ || !gradient_) {
        throw ConfigurationError("HMC needs a target density and its gradient");
    }
    if (!(step_size_ > 0.0) || std::isinf(step_size_)) {
        throw ConfigurationError("HMC step size must be positive and finite");
    }
    if (leapfrog_steps_ == 0) {
        throw ConfigurationError("HMC needs at least one leapfrog step");
    }
    if (!(mass_ > 0.0) || std::isinf(mass_)) {
        throw ConfigurationError("HMC mass must be positive and finite");
    }
}

bool HamiltonianSampler::transition(Vector& state, double& log_density, RandomEngine& rng) {
    std::normal_distribution<double> momentum_dist(0.0, std::sqrt(mass_));
    Vector momentum(state.size());
    for (double& p : momentum) {
        p = momentum_dist(rng);
    }

    auto kinetic = [this](const Vector& p) {
        double k = 0.0;
        for (double v : p) k += v * v;
        return 0.5 * k / mass_;
    };
    const double initial_energy = -log_density + kinetic(momentum);

    Vector q = state;
    Vector p = momentum;
    Vector grad = gradient_(q);
    require_dimension(q, grad);

    for (std::size_t i = 0; i < p.size(); ++i) p[i] += 0.5 * step_size_ * grad[i];
    for (std::size_t step = 0; step < leapfrog_steps_; ++step) {
        for (std::size_t i = 0; i < q.size(); ++i) q[i] += step_size_ * p[i] / mass_;
        grad = gradient_(q);
        require_dimension(q, grad);
        double factor = step + 1 < leapfrog_steps_ ? 1.0 : 0.5;
        for (std::size_t i = 0; i < p.size(); ++i) p[i] += factor * step_size_ * grad[i];
    }

    double proposed_density = target_(q);
    if (std::isnan(proposed_density) || proposed_density == NEG_INF) {
        return false;
    }
    const double proposed_energy = -proposed_density + kinetic(p);
    if (!accept_move(initial_energy - proposed_energy, rng)) {
        return false;
    }
    state = std::move(q);
    log_density = proposed_density;
    return true;
}

double HamiltonianSampler::evaluate(const Vector& state) const {
    return target_(state);
}

} // namespace montecarlo
