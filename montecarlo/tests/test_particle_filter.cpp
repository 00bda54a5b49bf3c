#include <gtest/gtest.h>
#include <montecarlo/particle_filter.hpp>
#include <montecarlo/particle_filter_models.hpp>
#include <memory>
#include <numeric>

using namespace montecarlo;

namespace {

class ImpossibleObservation : public ObservationModel<Vector, Vector> {
public:
    double log_likelihood(const Vector&, const Vector&) const override { return NEG_INF; }
};

ParticleFilterOptions options_with(std::size_t particles, double threshold, std::uint64_t seed) {
    ParticleFilterOptions options;
    options.particle_count = particles;
    options.resampling_threshold = threshold;
    options.seed = seed;
    return options;
}

} // namespace

TEST(ParticleFilter, TracksAConstantSignal) {
    auto system = std::make_shared<RandomWalkModel>(Vector{0.1});
    auto observation = std::make_shared<GaussianObservationModel>(GaussianObservationModel::direct(1, 0.5));
    DiagonalGaussianDistribution prior(1, 0.0, 2.0);

    ParticleFilter<Vector, Vector> filter(system, observation, prior, options_with(500, 0.5, 7));
    for (int t = 0; t < 20; ++t) {
        filter.step(Vector{3.0});
    }

    Vector estimate = weighted_mean(filter.population());
    ASSERT_EQ(estimate.size(), 1u);
    EXPECT_NEAR(estimate[0], 3.0, 0.5);
    EXPECT_NEAR(filter.map_estimate()[0], 3.0, 1.0);
    EXPECT_GT(filter.resample_count(), 0u);
    EXPECT_EQ(filter.update_count(), 20u);
}

TEST(ParticleFilter, PopulationSizeIsConstant) {
    auto system = std::make_shared<RandomWalkModel>(Vector{1.0, 1.0});
    auto observation = std::make_shared<GaussianObservationModel>(GaussianObservationModel::direct(2, 1.0));
    DiagonalGaussianDistribution prior(2, 0.0, 1.0);

    ParticleFilter<Vector, Vector> filter(system, observation, prior, options_with(64, 1.0, 3));
    for (int t = 0; t < 10; ++t) {
        filter.step(Vector{static_cast<double>(t), -static_cast<double>(t)});
        EXPECT_EQ(filter.population().size(), 64u);
        auto weights = filter.population().normalized_weights();
        ASSERT_TRUE(weights.has_value());
        EXPECT_NEAR(std::accumulate(weights->begin(), weights->end(), 0.0), 1.0, 1e-9);
    }
}

TEST(ParticleFilter, WeightsAreUniformAfterResampling) {
    auto system = std::make_shared<RandomWalkModel>(Vector{0.5});
    auto observation = std::make_shared<GaussianObservationModel>(GaussianObservationModel::direct(1, 0.2));
    DiagonalGaussianDistribution prior(1, 0.0, 1.0);

    ParticleFilter<Vector, Vector> filter(system, observation, prior, options_with(100, 1.0, 5));
    filter.predict();
    ASSERT_TRUE(filter.update(Vector{0.3}));

    auto weights = filter.population().normalized_weights();
    ASSERT_TRUE(weights.has_value());
    for (double w : *weights) {
        EXPECT_NEAR(w, 0.01, 1e-12);
    }
    EXPECT_NEAR(filter.effective_sample_size(), 100.0, 1e-9);
}

TEST(ParticleFilter, SingleParticleNeverResamples) {
    auto system = std::make_shared<RandomWalkModel>(Vector{0.5});
    auto observation = std::make_shared<GaussianObservationModel>(GaussianObservationModel::direct(1, 0.2));
    DiagonalGaussianDistribution prior(1, 0.0, 1.0);

    ParticleFilter<Vector, Vector> filter(system, observation, prior, options_with(1, 1.0, 5));
    for (int t = 0; t < 25; ++t) {
        EXPECT_FALSE(filter.step(Vector{1.0}));
    }
    EXPECT_EQ(filter.resample_count(), 0u);
}

TEST(ParticleFilter, ZeroLikelihoodEverywhereIsUnsatisfiable) {
    auto system = std::make_shared<RandomWalkModel>(Vector{0.5});
    auto observation = std::make_shared<ImpossibleObservation>();
    DiagonalGaussianDistribution prior(1, 0.0, 1.0);

    ParticleFilter<Vector, Vector> filter(system, observation, prior, options_with(10, 0.5, 1));
    EXPECT_THROW(filter.update(Vector{0.0}), ConstraintUnsatisfiableError);
}

TEST(ParticleFilter, LinearModelWithoutNoiseIsDeterministic) {
    LinearGaussianModel model({{1.0, 1.0}, {0.0, 1.0}}, {0.0, 0.0});
    RandomEngine rng(0);
    Vector next = model.propagate({0.0, 2.0}, 1.0, rng);
    EXPECT_EQ(next, (Vector{2.0, 2.0}));

    NonlinearGaussianModel doubling([](const Vector& x, double) { return Vector{2.0 * x[0]}; }, {0.0});
    EXPECT_EQ(doubling.propagate({1.5}, 1.0, rng), (Vector{3.0}));
}

TEST(ParticleFilter, InvalidConfigurationThrows) {
    auto system = std::make_shared<RandomWalkModel>(Vector{0.5});
    auto observation = std::make_shared<GaussianObservationModel>(GaussianObservationModel::direct(1, 0.2));
    DiagonalGaussianDistribution prior(1, 0.0, 1.0);

    using Filter = ParticleFilter<Vector, Vector>;
    EXPECT_THROW((Filter(system, observation, prior, options_with(0, 0.5, 1))), ConfigurationError);
    EXPECT_THROW((Filter(system, observation, prior, options_with(10, 1.5, 1))), ConfigurationError);
    EXPECT_THROW((Filter(nullptr, observation, prior, options_with(10, 0.5, 1))), ConfigurationError);
    EXPECT_THROW((LinearGaussianModel(Matrix{{1.0}}, Vector{0.1, 0.1})), ConfigurationError);
    EXPECT_THROW(GaussianObservationModel::direct(1, 0.0), ConfigurationError);
}
