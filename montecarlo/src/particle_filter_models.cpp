#include <montecarlo/particle_filter_models.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <random>
#include <stdexcept>
#include <string>

namespace montecarlo {

namespace {

void require_noise(const Vector& noise_stddevs) {
    if (noise_stddevs.empty()) {
        throw ConfigurationError("noise vector must have at least one dimension");
    }
    for (double s : noise_stddevs) {
        if (!(s >= 0.0) || std::isinf(s)) {
            throw ConfigurationError("noise standard deviations must be finite and non-negative");
        }
    }
}

void require_rows(const Matrix& m, std::size_t rows, std::size_t cols, const char* what) {
    if (m.size() != rows) {
        throw ConfigurationError(std::string(what) + " has the wrong number of rows");
    }
    for (const auto& row : m) {
        if (row.size() != cols) {
            throw ConfigurationError(std::string(what) + " has a row of the wrong length");
        }
    }
}

void add_noise(Vector& state, const Vector& noise_stddevs, double dt, RandomEngine& rng) {
    if (state.size() != noise_stddevs.size()) {
        throw std::invalid_argument("state dimension does not match the model");
    }
    std::normal_distribution<double> standard(0.0, 1.0);
    double scale = std::sqrt(std::max(dt, 0.0));
    for (std::size_t i = 0; i < state.size(); ++i) {
        if (noise_stddevs[i] > 0.0) {
            state[i] += noise_stddevs[i] * scale * standard(rng);
        }
    }
}

} // namespace

Matrix identity_matrix(std::size_t dimension) {
    Matrix m(dimension, Vector(dimension, 0.0));
    for (std::size_t i = 0; i < dimension; ++i) {
        m[i][i] = 1.0;
    }
    return m;
}

Vector multiply(const Matrix& m, const Vector& v) {
    Vector result(m.size(), 0.0);
    for (std::size_t r = 0; r < m.size(); ++r) {
        if (m[r].size() != v.size()) {
            throw std::invalid_argument("matrix and vector dimensions differ");
        }
        for (std::size_t c = 0; c < v.size(); ++c) {
            result[r] += m[r][c] * v[c];
        }
    }
    return result;
}

RandomWalkModel::RandomWalkModel(Vector noise_stddevs)
    : noise_stddevs_(std::move(noise_stddevs)) {
    require_noise(noise_stddevs_);
}

Vector RandomWalkModel::propagate(const Vector& state, double dt, RandomEngine& rng) const {
    Vector next = state;
    add_noise(next, noise_stddevs_, dt, rng);
    return next;
}

LinearGaussianModel::LinearGaussianModel(Matrix transition, Vector noise_stddevs)
    : transition_(std::move(transition)), noise_stddevs_(std::move(noise_stddevs)) {
    require_noise(noise_stddevs_);
    require_rows(transition_, noise_stddevs_.size(), noise_stddevs_.size(), "transition matrix");
}

Vector LinearGaussianModel::propagate(const Vector& state, double dt, RandomEngine& rng) const {
    Vector next = multiply(transition_, state);
    add_noise(next, noise_stddevs_, dt, rng);
    return next;
}

NonlinearGaussianModel::NonlinearGaussianModel(TransitionFunction transition, Vector noise_stddevs)
    : transition_(std::move(transition)), noise_stddevs_(std::move(noise_stddevs)) {
    if (!transition_) {
        throw ConfigurationError("nonlinear model needs a transition function");
    }
    require_noise(noise_stddevs_);
}

Vector NonlinearGaussianModel::propagate(const Vector& state, double dt, RandomEngine& rng) const {
    Vector next = transition_(state, dt);
    add_noise(next, noise_stddevs_, dt, rng);
    return next;
}

GaussianObservationModel::GaussianObservationModel(Matrix observation, Vector noise_stddevs)
    : observation_(std::move(observation)), noise_stddevs_(std::move(noise_stddevs)) {
    require_noise(noise_stddevs_);
    if (observation_.size() != noise_stddevs_.size() || observation_.empty()) {
        throw ConfigurationError("observation matrix rows must match the noise dimension");
    }
    for (double s : noise_stddevs_) {
        if (s == 0.0) {
            throw ConfigurationError("observation noise must be strictly positive");
        }
    }
}

GaussianObservationModel GaussianObservationModel::direct(std::size_t dimension, double noise_stddev) {
    return GaussianObservationModel(identity_matrix(dimension), Vector(dimension, noise_stddev));
}

double GaussianObservationModel::log_likelihood(const Vector& observation, const Vector& state) const {
    if (observation.size() != observation_.size()) {
        return NEG_INF;
    }
    Vector predicted = multiply(observation_, state);
    double total = 0.0;
    for (std::size_t i = 0; i < predicted.size(); ++i) {
        double z = (observation[i] - predicted[i]) / noise_stddevs_[i];
        total += -0.5 * z * z - std::log(noise_stddevs_[i]) - 0.5 * std::log(2.0 * std::numbers::pi);
    }
    return total;
}

Vector weighted_mean(const ParticlePopulation<Vector>& population) {
    auto weights = population.normalized_weights();
    if (!weights || population.empty()) {
        throw std::invalid_argument("weighted mean of an empty or collapsed population");
    }
    Vector mean(population[0].state.size(), 0.0);
    for (std::size_t i = 0; i < population.size(); ++i) {
        const Vector& state = population[i].state;
        for (std::size_t d = 0; d < mean.size() && d < state.size(); ++d) {
            mean[d] += (*weights)[i] * state[d];
        }
    }
    return mean;
}

} // namespace montecarlo
