#include <gtest/gtest.h>
#include <montecarlo/errors.hpp>
#include <montecarlo/mcmc.hpp>
#include <cmath>
#include <memory>
#include <random>

using namespace montecarlo;

namespace {

LogDensity normal_log_density(double mean, double sd) {
    return [mean, sd](const Vector& x) {
        double total = 0.0;
        for (double v : x) {
            double z = (v - mean) / sd;
            total += -0.5 * z * z;
        }
        return total;
    };
}

McmcOptions options_with(std::size_t samples, std::size_t burn_in, std::uint64_t seed) {
    McmcOptions options;
    options.num_samples = samples;
    options.burn_in = burn_in;
    options.seed = seed;
    return options;
}

} // namespace

TEST(Mcmc, RandomWalkMetropolisRecoversMean) {
    MetropolisHastingsSampler sampler(normal_log_density(2.0, 1.0), std::make_unique<GaussianRandomWalkProposal>(1.0));
    auto result = sampler.run({0.0}, options_with(20000, 1000, 31));

    ASSERT_EQ(result.samples.size(), 20000u);
    ASSERT_EQ(result.log_densities.size(), 20000u);
    EXPECT_NEAR(result.mean()[0], 2.0, 0.15);
    EXPECT_GT(result.acceptance_rate(), 0.3);
    EXPECT_LT(result.acceptance_rate(), 0.9);
    EXPECT_EQ(result.proposals, 20000u);
}

TEST(Mcmc, UniformRandomWalkStaysInSupport) {
    LogDensity box = [](const Vector& x) { return (x[0] >= 0.0 && x[0] <= 1.0) ? 0.0 : NEG_INF; };
    MetropolisHastingsSampler sampler(box, std::make_unique<UniformRandomWalkProposal>(0.3));
    auto result = sampler.run({0.5}, options_with(5000, 0, 2));
    for (const auto& s : result.samples) {
        EXPECT_GE(s[0], 0.0);
        EXPECT_LE(s[0], 1.0);
    }
    EXPECT_NEAR(result.mean()[0], 0.5, 0.1);
}

TEST(Mcmc, AdaptiveProposalWidensForWideTarget) {
    MetropolisHastingsSampler sampler(normal_log_density(0.0, 10.0), std::make_unique<AdaptiveGaussianProposal>(0.1));
    sampler.run({0.0}, options_with(100, 2000, 17));

    const auto* adaptive = dynamic_cast<const AdaptiveGaussianProposal*>(&sampler.proposal());
    ASSERT_NE(adaptive, nullptr);
    EXPECT_GT(adaptive->scale(), 1.0);
}

TEST(Mcmc, AdaptationOnlyDuringBurnIn) {
    MetropolisHastingsSampler sampler(normal_log_density(0.0, 10.0), std::make_unique<AdaptiveGaussianProposal>(0.1));
    sampler.run({0.0}, options_with(500, 0, 17));

    const auto& adaptive = dynamic_cast<const AdaptiveGaussianProposal&>(sampler.proposal());
    EXPECT_DOUBLE_EQ(adaptive.scale(), 0.1);
}

TEST(Mcmc, IndependenceProposalIsCorrected) {
    auto proposal = std::make_shared<DiagonalGaussianDistribution>(1, 0.0, 3.0);
    MetropolisHastingsSampler sampler(normal_log_density(1.0, 1.0), std::make_unique<IndependenceProposal>(proposal));
    auto result = sampler.run({0.0}, options_with(20000, 500, 5));
    EXPECT_NEAR(result.mean()[0], 1.0, 0.1);
}

TEST(Mcmc, GibbsOnCorrelatedGaussian) {
    const double rho = 0.5;
    const double conditional_sd = std::sqrt(1.0 - rho * rho);
    auto conditional = [rho, conditional_sd](std::size_t other) {
        return [rho, conditional_sd, other](const Vector& state, RandomEngine& rng) {
            std::normal_distribution<double> dist(rho * state[other], conditional_sd);
            return dist(rng);
        };
    };

    GibbsSampler sampler({conditional(1), conditional(0)});
    auto result = sampler.run({3.0, -3.0}, options_with(10000, 200, 44));

    EXPECT_DOUBLE_EQ(result.acceptance_rate(), 1.0);
    auto mean = result.mean();
    EXPECT_NEAR(mean[0], 0.0, 0.1);
    EXPECT_NEAR(mean[1], 0.0, 0.1);

    double cross = 0.0;
    for (const auto& s : result.samples) cross += s[0] * s[1];
    EXPECT_NEAR(cross / static_cast<double>(result.samples.size()), rho, 0.1);
}

TEST(Mcmc, HamiltonianOnStandardNormal) {
    LogDensityGradient gradient = [](const Vector& x) {
        Vector g(x.size());
        for (std::size_t i = 0; i < x.size(); ++i) g[i] = -x[i];
        return g;
    };
    HamiltonianSampler sampler(normal_log_density(0.0, 1.0), gradient, 0.2, 10);
    auto result = sampler.run({1.0, -1.0}, options_with(5000, 200, 9));

    EXPECT_GT(result.acceptance_rate(), 0.8);
    auto mean = result.mean();
    EXPECT_NEAR(mean[0], 0.0, 0.15);
    EXPECT_NEAR(mean[1], 0.0, 0.15);

    double second_moment = 0.0;
    for (const auto& s : result.samples) second_moment += s[0] * s[0];
    EXPECT_NEAR(second_moment / static_cast<double>(result.samples.size()), 1.0, 0.2);
}

TEST(Mcmc, ThinningKeepsEveryKthState) {
    MetropolisHastingsSampler sampler(normal_log_density(0.0, 1.0), std::make_unique<GaussianRandomWalkProposal>(0.5));
    McmcOptions options = options_with(100, 50, 3);
    options.thinning = 5;
    auto result = sampler.run({0.0}, options);
    EXPECT_EQ(result.samples.size(), 100u);
    EXPECT_EQ(result.proposals, 500u);
}

TEST(Mcmc, SameSeedSameChain) {
    auto run_once = [] {
        MetropolisHastingsSampler sampler(normal_log_density(0.0, 1.0),
                                          std::make_unique<GaussianRandomWalkProposal>(0.5));
        return sampler.run({0.0}, options_with(200, 10, 123)).samples;
    };
    EXPECT_EQ(run_once(), run_once());
}

TEST(Mcmc, AutocorrelationEss) {
    EXPECT_DOUBLE_EQ(autocorrelation_ess(std::vector<double>(100, 4.0)), 1.0);

    RandomEngine rng(8);
    std::normal_distribution<double> normal(0.0, 1.0);
    std::vector<double> iid(1000);
    for (double& x : iid) x = normal(rng);
    EXPECT_GT(autocorrelation_ess(iid), 500.0);
    EXPECT_LE(autocorrelation_ess(iid), 1000.0);

    std::vector<double> sticky(1000);
    double x = 0.0;
    for (double& v : sticky) {
        x = 0.95 * x + normal(rng);
        v = x;
    }
    EXPECT_LT(autocorrelation_ess(sticky), 200.0);
}

TEST(Mcmc, InvalidOptionsThrow) {
    MetropolisHastingsSampler sampler(normal_log_density(0.0, 1.0), std::make_unique<GaussianRandomWalkProposal>(0.5));
    EXPECT_THROW(sampler.run({0.0}, options_with(0, 0, 1)), ConfigurationError);
    EXPECT_THROW(sampler.run({}, options_with(10, 0, 1)), ConfigurationError);

    McmcOptions no_thinning = options_with(10, 0, 1);
    no_thinning.thinning = 0;
    EXPECT_THROW(sampler.run({0.0}, no_thinning), ConfigurationError);

    LogDensity positive = [](const Vector& v) { return v[0] > 0.0 ? 0.0 : NEG_INF; };
    MetropolisHastingsSampler restricted(positive, std::make_unique<GaussianRandomWalkProposal>(0.5));
    EXPECT_THROW(restricted.run({-1.0}, options_with(10, 0, 1)), ConfigurationError);

    EXPECT_THROW((GaussianRandomWalkProposal(0.0)), ConfigurationError);
    EXPECT_THROW((AdaptiveGaussianProposal(1.0, 1.5)), ConfigurationError);
    EXPECT_THROW((HamiltonianSampler(positive, nullptr, 0.1, 5)), ConfigurationError);
}
