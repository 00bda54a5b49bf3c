/**
 * Sampler Showcase
 *
 * Tours the statistical toolkit:
 * - Particle filter tracking a drifting 2D position
 * - Importance sampling and adaptive mixture proposals
 * - Monte Carlo tree search on a small combinatorial problem
 * - Metropolis-Hastings, Gibbs and Hamiltonian Monte Carlo
 */

#include <montecarlo/errors.hpp>
#include <montecarlo/importance_sampling.hpp>
#include <montecarlo/mcmc.hpp>
#include <montecarlo/mcts.hpp>
#include <montecarlo/particle_filter.hpp>
#include <montecarlo/particle_filter_models.hpp>
#include <cmath>
#include <iostream>
#include <memory>
#include <random>

using namespace montecarlo;

namespace {

void particle_filter_demo() {
    std::cout << "=== Particle Filter ===\n";

    // Constant-velocity motion in 1D: state (position, velocity)
    Matrix transition{{1.0, 1.0}, {0.0, 1.0}};
    auto system = std::make_shared<LinearGaussianModel>(transition, Vector{0.2, 0.05});
    auto observation = std::make_shared<GaussianObservationModel>(Matrix{{1.0, 0.0}}, Vector{1.0});

    ParticleFilterOptions options;
    options.particle_count = 1000;
    options.seed = 7;
    ParticleFilter<Vector, Vector> filter(system, observation, DiagonalGaussianDistribution({0.0, 0.0}, {5.0, 2.0}),
                                          options);

    RandomEngine world(99);
    std::normal_distribution<double> sensor(0.0, 1.0);
    double position = 0.0;
    const double velocity = 0.8;
    for (int t = 1; t <= 25; ++t) {
        position += velocity;
        filter.step(Vector{position + sensor(world)});
        if (t % 5 == 0) {
            Vector estimate = weighted_mean(filter.population());
            std::cout << "  t=" << t << " true=" << position << " estimate=" << estimate[0]
                      << " velocity=" << estimate[1] << " ESS=" << filter.effective_sample_size() << "\n";
        }
    }
    std::cout << "  resampled " << filter.resample_count() << " of " << filter.update_count() << " updates\n\n";
}

void importance_sampling_demo() {
    std::cout << "=== Importance Sampling ===\n";

    auto target = [](const double& x) { return GaussianDistribution(3.0, 0.5).log_pdf(x); };
    ImportanceSampler<double> sampler(std::make_shared<GaussianDistribution>(0.0, 4.0), target, 11);
    auto result = sampler.sample(10000);
    std::cout << "  E[x] = " << result.expectation([](double x) { return x; })
              << ", ESS = " << result.effective_sample_size << ", log Z = " << result.log_evidence << "\n";

    MixtureDistribution<double> mixture({std::make_shared<GaussianDistribution>(-4.0, 1.0),
                                         std::make_shared<GaussianDistribution>(0.0, 1.0),
                                         std::make_shared<GaussianDistribution>(4.0, 1.0)});
    AdaptiveImportanceSampler<double> adaptive(mixture, target, 250, 1e-3, 12);
    auto adapted = adaptive.sample(5000);
    std::cout << "  adaptive E[x] = " << adapted.expectation([](double x) { return x; }) << ", weights:";
    for (double w : adaptive.proposal().weights()) {
        std::cout << " " << w;
    }
    std::cout << "\n\n";
}

// Pick digits 0-9 to build a 4-digit number; reward how close the digit sum is to 30
class DigitSumProblem : public SearchProblem<std::vector<int>, int> {
public:
    std::vector<int> legal_actions(const std::vector<int>&) const override {
        return {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    }
    std::vector<int> apply(const std::vector<int>& state, const int& digit) const override {
        auto next = state;
        next.push_back(digit);
        return next;
    }
    bool is_terminal(const std::vector<int>& state) const override { return state.size() >= 4; }
    double reward(const std::vector<int>& state) const override {
        int sum = 0;
        for (int d : state) sum += d;
        return 1.0 / (1.0 + std::abs(30 - sum));
    }
};

void tree_search_demo() {
    std::cout << "=== Monte Carlo Tree Search ===\n";

    auto problem = std::make_shared<DigitSumProblem>();
    MctsOptions options;
    options.max_iterations = 2000;
    options.seed = 5;
    MonteCarloTreeSearch<std::vector<int>, int> search(problem, {}, nullptr, options);

    std::cout << "  digits:";
    while (!problem->is_terminal(search.root_state())) {
        search.search();
        auto action = search.most_visited_action();
        if (!action) break;
        std::cout << " " << *action;
        search.advance_root(*action);
    }
    std::cout << " (reward " << problem->reward(search.root_state()) << ")\n\n";
}

void mcmc_demo() {
    std::cout << "=== Markov Chain Monte Carlo ===\n";

    // Banana-shaped 2D target
    LogDensity banana = [](const Vector& v) {
        double a = v[0];
        double b = v[1] - 0.5 * v[0] * v[0];
        return -0.5 * (a * a / 4.0 + b * b);
    };
    McmcOptions options;
    options.num_samples = 5000;
    options.burn_in = 1000;
    options.seed = 21;

    MetropolisHastingsSampler metropolis(banana, std::make_unique<AdaptiveGaussianProposal>(0.5));
    auto mh = metropolis.run({0.0, 0.0}, options);
    auto mh_ess = mh.effective_sample_size();
    std::cout << "  Metropolis-Hastings: acceptance " << mh.acceptance_rate() << ", ESS " << mh_ess[0] << " / "
              << mh_ess[1] << "\n";

    const double rho = 0.8;
    auto conditional = [rho](std::size_t other) {
        return [rho, other](const Vector& state, RandomEngine& rng) {
            std::normal_distribution<double> dist(rho * state[other], std::sqrt(1.0 - rho * rho));
            return dist(rng);
        };
    };
    GibbsSampler gibbs({conditional(1), conditional(0)});
    auto g = gibbs.run({0.0, 0.0}, options);
    std::cout << "  Gibbs: mean (" << g.mean()[0] << ", " << g.mean()[1] << ")\n";

    LogDensityGradient gradient = [](const Vector& v) {
        double b = v[1] - 0.5 * v[0] * v[0];
        return Vector{-v[0] / 4.0 + b * v[0], -b};
    };
    HamiltonianSampler hmc(banana, gradient, 0.1, 20);
    auto h = hmc.run({0.0, 0.0}, options);
    auto h_ess = h.effective_sample_size();
    std::cout << "  Hamiltonian: acceptance " << h.acceptance_rate() << ", ESS " << h_ess[0] << " / " << h_ess[1]
              << "\n\n";
}

} // namespace

int main() {
    std::cout << "=== Monte Carlo Sampler Showcase ===\n\n";
    try {
        particle_filter_demo();
        importance_sampling_demo();
        tree_search_demo();
        mcmc_demo();
    } catch (const MonteCarloException& e) {
        std::cerr << "Sampler failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
