#include <gtest/gtest.h>
#include <montecarlo/errors.hpp>
#include <montecarlo/resampling.hpp>
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace montecarlo;

namespace {

const std::vector<ResamplingScheme> ALL_SCHEMES = {
    ResamplingScheme::Multinomial,
    ResamplingScheme::Systematic,
    ResamplingScheme::Stratified,
    ResamplingScheme::Residual,
};

} // namespace

TEST(Resampling, EveryStrategyPreservesCountAndSortsAncestors) {
    const std::vector<double> weights{0.1, 0.0, 0.4, 0.2, 0.0, 0.3};
    for (auto scheme : ALL_SCHEMES) {
        auto strategy = make_resampling_strategy(scheme);
        RandomEngine rng(42);
        for (int round = 0; round < 50; ++round) {
            auto ancestors = strategy->select(weights, rng);
            ASSERT_EQ(ancestors.size(), weights.size()) << strategy->name();
            EXPECT_TRUE(std::is_sorted(ancestors.begin(), ancestors.end())) << strategy->name();
            for (std::size_t a : ancestors) {
                ASSERT_LT(a, weights.size());
                EXPECT_GT(weights[a], 0.0) << strategy->name() << " selected a zero-weight slot";
            }
        }
    }
}

TEST(Resampling, DegenerateWeightsSelectTheOnlySurvivor) {
    for (auto scheme : ALL_SCHEMES) {
        auto strategy = make_resampling_strategy(scheme);
        RandomEngine rng(1);
        auto ancestors = strategy->select({0.0, 1.0, 0.0, 0.0}, rng);
        EXPECT_EQ(ancestors, (std::vector<std::size_t>{1, 1, 1, 1})) << strategy->name();
    }
}

TEST(Resampling, SystematicAndStratifiedKeepUniformPopulations) {
    const std::vector<double> uniform(4, 0.25);
    for (auto scheme : {ResamplingScheme::Systematic, ResamplingScheme::Stratified, ResamplingScheme::Residual}) {
        auto strategy = make_resampling_strategy(scheme);
        RandomEngine rng(17);
        for (int round = 0; round < 20; ++round) {
            EXPECT_EQ(strategy->select(uniform, rng), (std::vector<std::size_t>{0, 1, 2, 3})) << strategy->name();
        }
    }
}

TEST(Resampling, ResidualCopiesIntegerPartsDeterministically) {
    ResidualResampling residual;
    RandomEngine rng(3);
    EXPECT_EQ(residual.select({0.5, 0.25, 0.25, 0.0}, rng), (std::vector<std::size_t>{0, 0, 1, 2}));
}

TEST(Resampling, MultinomialFrequenciesFollowWeights) {
    const std::size_t n = 1000;
    std::vector<double> weights(n, 0.5 / static_cast<double>(n - 1));
    weights[0] = 0.5;

    MultinomialResampling multinomial;
    RandomEngine rng(2024);
    auto ancestors = multinomial.select(weights, rng);
    auto zeros = std::count(ancestors.begin(), ancestors.end(), 0u);
    EXPECT_NEAR(static_cast<double>(zeros), 500.0, 80.0);
}

TEST(Resampling, SameStreamGivesSameAncestors) {
    const std::vector<double> weights{0.3, 0.3, 0.2, 0.2};
    for (auto scheme : ALL_SCHEMES) {
        auto strategy = make_resampling_strategy(scheme);
        RandomEngine first(99);
        RandomEngine second(99);
        EXPECT_EQ(strategy->select(weights, first), strategy->select(weights, second)) << strategy->name();
    }
}

TEST(Resampling, InvalidWeightsAreRejected) {
    SystematicResampling systematic;
    RandomEngine rng(0);
    EXPECT_THROW(systematic.select({}, rng), std::invalid_argument);
    EXPECT_THROW(systematic.select({0.0, 0.0}, rng), std::invalid_argument);
    EXPECT_THROW(systematic.select({0.5, -0.1}, rng), std::invalid_argument);
}

TEST(Resampling, SchemeNamesRoundTrip) {
    for (auto scheme : ALL_SCHEMES) {
        EXPECT_EQ(parse_resampling_scheme(to_string(scheme)), scheme);
    }
    EXPECT_STREQ(SystematicResampling().name(), "systematic");
    EXPECT_THROW(parse_resampling_scheme("bootstrap"), ConfigurationError);
}
