#ifndef MONTECARLO_PARTICLE_FILTER_MODELS_HPP
#define MONTECARLO_PARTICLE_FILTER_MODELS_HPP

#include <montecarlo/particle_filter.hpp>
#include <functional>
#include <vector>

namespace montecarlo {

using Vector = std::vector<double>;
using Matrix = std::vector<std::vector<double>>;  // row-major

Matrix identity_matrix(std::size_t dimension);
Vector multiply(const Matrix& m, const Vector& v);

// x' = x + noise * sqrt(dt)
class RandomWalkModel : public SystemModel<Vector> {
private:
    Vector noise_stddevs_;

public:
    explicit RandomWalkModel(Vector noise_stddevs);

    Vector propagate(const Vector& state, double dt, RandomEngine& rng) const override;
};

// x' = F x + noise * sqrt(dt)
class LinearGaussianModel : public SystemModel<Vector> {
private:
    Matrix transition_;
    Vector noise_stddevs_;

public:
    LinearGaussianModel(Matrix transition, Vector noise_stddevs);

    Vector propagate(const Vector& state, double dt, RandomEngine& rng) const override;

    const Matrix& transition() const { return transition_; }
};

// x' = f(x, dt) + noise * sqrt(dt)
class NonlinearGaussianModel : public SystemModel<Vector> {
public:
    using TransitionFunction = std::function<Vector(const Vector&, double)>;

private:
    TransitionFunction transition_;
    Vector noise_stddevs_;

public:
    NonlinearGaussianModel(TransitionFunction transition, Vector noise_stddevs);

    Vector propagate(const Vector& state, double dt, RandomEngine& rng) const override;
};

// z ~ N(H x, diag(noise^2))
class GaussianObservationModel : public ObservationModel<Vector, Vector> {
private:
    Matrix observation_;
    Vector noise_stddevs_;

public:
    GaussianObservationModel(Matrix observation, Vector noise_stddevs);

    // Observes the full state directly
    static GaussianObservationModel direct(std::size_t dimension, double noise_stddev);

    double log_likelihood(const Vector& observation, const Vector& state) const override;
};

// Weighted mean of a vector-valued population
Vector weighted_mean(const ParticlePopulation<Vector>& population);

} // namespace montecarlo

#endif // MONTECARLO_PARTICLE_FILTER_MODELS_HPP
