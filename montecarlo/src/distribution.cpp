#include <montecarlo/distribution.hpp>
#include <numbers>

namespace montecarlo {

namespace {

const double LOG_SQRT_2PI = 0.5 * std::log(2.0 * std::numbers::pi);

double gaussian_log_density(double x, double mean, double stddev) {
    double z = (x - mean) / stddev;
    return -0.5 * z * z - std::log(stddev) - LOG_SQRT_2PI;
}

void require_positive_stddev(double stddev) {
    if (!(stddev > 0.0) || std::isinf(stddev)) {
        throw ConfigurationError("standard deviation must be positive and finite, got " + std::to_string(stddev));
    }
}

} // namespace

GaussianDistribution::GaussianDistribution(double mean, double stddev)
    : mean_(mean), stddev_(stddev) {
    require_positive_stddev(stddev);
    if (!std::isfinite(mean)) {
        throw ConfigurationError("gaussian mean must be finite");
    }
}

double GaussianDistribution::sample(RandomEngine& rng) const {
    std::normal_distribution<double> normal(mean_, stddev_);
    return normal(rng);
}

double GaussianDistribution::log_pdf(const double& value) const {
    if (!std::isfinite(value)) return NEG_INF;
    return gaussian_log_density(value, mean_, stddev_);
}

UniformDistribution::UniformDistribution(double low, double high)
    : low_(low), high_(high) {
    if (!std::isfinite(low) || !std::isfinite(high) || !(low < high)) {
        throw ConfigurationError("uniform bounds must be finite with low < high");
    }
}

double UniformDistribution::sample(RandomEngine& rng) const {
    std::uniform_real_distribution<double> uniform(low_, high_);
    return uniform(rng);
}

double UniformDistribution::log_pdf(const double& value) const {
    if (value < low_ || value > high_ || std::isnan(value)) return NEG_INF;
    return -std::log(high_ - low_);
}

DiagonalGaussianDistribution::DiagonalGaussianDistribution(std::vector<double> means, std::vector<double> stddevs)
    : means_(std::move(means)), stddevs_(std::move(stddevs)) {
    if (means_.empty()) {
        throw ConfigurationError("diagonal gaussian needs at least one dimension");
    }
    if (means_.size() != stddevs_.size()) {
        throw ConfigurationError("diagonal gaussian mean and stddev dimensions differ");
    }
    for (double s : stddevs_) {
        require_positive_stddev(s);
    }
}

DiagonalGaussianDistribution::DiagonalGaussianDistribution(std::size_t dimension, double mean, double stddev)
    : DiagonalGaussianDistribution(std::vector<double>(dimension, mean), std::vector<double>(dimension, stddev)) {}

std::vector<double> DiagonalGaussianDistribution::sample(RandomEngine& rng) const {
    std::normal_distribution<double> standard(0.0, 1.0);
    std::vector<double> value(means_.size());
    for (std::size_t i = 0; i < means_.size(); ++i) {
        value[i] = means_[i] + stddevs_[i] * standard(rng);
    }
    return value;
}

double DiagonalGaussianDistribution::log_pdf(const std::vector<double>& value) const {
    if (value.size() != means_.size()) return NEG_INF;
    double total = 0.0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (!std::isfinite(value[i])) return NEG_INF;
        total += gaussian_log_density(value[i], means_[i], stddevs_[i]);
    }
    return total;
}

} // namespace montecarlo
