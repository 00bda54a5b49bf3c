#include <montecarlo/log_weights.hpp>
#include <montecarlo/debug_log.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace montecarlo {

double log_sum_exp(const std::vector<double>& log_values) {
    if (log_values.empty()) {
        return -std::numeric_limits<double>::infinity();
    }
    double max_value = *std::max_element(log_values.begin(), log_values.end());
    if (std::isinf(max_value)) {
        return max_value;
    }

    double sum = 0.0;
    for (double v : log_values) {
        sum += std::exp(v - max_value);
    }
    return max_value + std::log(sum);
}

bool is_collapsed(const std::vector<double>& log_weights) {
    return std::none_of(log_weights.begin(), log_weights.end(), [](double w) {
        return !std::isnan(w) && w != -std::numeric_limits<double>::infinity();
    });
}

std::size_t sanitize_log_weights(std::vector<double>& log_weights, const char* context) {
    std::size_t nan_count = 0;
    std::size_t overflow_count = 0;

    for (double& w : log_weights) {
        if (std::isnan(w)) {
            w = -std::numeric_limits<double>::infinity();
            ++nan_count;
        } else if (w == std::numeric_limits<double>::infinity()) {
            w = std::numeric_limits<double>::max();
            ++overflow_count;
        }
    }

    if (nan_count > 0) {
        MONTECARLO_WARN_LOG("%s: clipped %zu NaN log-weight(s) to -inf", context, nan_count);
    }
    if (overflow_count > 0) {
        MONTECARLO_WARN_LOG("%s: clipped %zu +inf log-weight(s) to the largest finite value",
                            context, overflow_count);
    }
    return nan_count + overflow_count;
}

std::optional<std::vector<double>> normalize_log_weights(const std::vector<double>& log_weights) {
    if (is_collapsed(log_weights)) {
        return std::nullopt;
    }

    double max_log = -std::numeric_limits<double>::infinity();
    for (double w : log_weights) {
        if (!std::isnan(w)) max_log = std::max(max_log, w);
    }

    std::vector<double> weights(log_weights.size(), 0.0);
    double total = 0.0;
    for (std::size_t i = 0; i < log_weights.size(); ++i) {
        if (std::isnan(log_weights[i])) continue;
        weights[i] = std::exp(log_weights[i] - max_log);
        total += weights[i];
    }
    // total >= 1 because the maximum contributes exp(0)
    for (double& w : weights) {
        w /= total;
    }
    return weights;
}

double effective_sample_size(const std::vector<double>& normalized_weights) {
    double sum_sq = 0.0;
    for (double w : normalized_weights) {
        sum_sq += w * w;
    }
    return sum_sq > 0.0 ? 1.0 / sum_sq : 0.0;
}

std::size_t argmax_index(const std::vector<double>& values) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i] > values[best]) best = i;
    }
    return best;
}

} // namespace montecarlo
