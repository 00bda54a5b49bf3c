#ifndef MONTECARLO_LOG_WEIGHTS_HPP
#define MONTECARLO_LOG_WEIGHTS_HPP

#include <cstddef>
#include <optional>
#include <vector>

namespace montecarlo {

/**
 * Log-space weight arithmetic shared by every weighted sampler.
 * Weights stay in log space until normalization; normalization subtracts the
 * maximum before exponentiating.
 */

// log(sum(exp(x))); -inf for empty input or when every entry is -inf
double log_sum_exp(const std::vector<double>& log_values);

// True when no entry carries probability mass (empty input included)
bool is_collapsed(const std::vector<double>& log_weights);

/**
 * Replace NaN with -inf and +inf with the largest finite double.
 * Each replacement is reported through MONTECARLO_WARN_LOG.
 * @return number of entries changed
 */
std::size_t sanitize_log_weights(std::vector<double>& log_weights, const char* context);

/**
 * Normalized linear-space weights summing to 1.
 * @return nullopt when the weights are collapsed
 */
std::optional<std::vector<double>> normalize_log_weights(const std::vector<double>& log_weights);

// 1 / sum(w^2) over normalized weights
double effective_sample_size(const std::vector<double>& normalized_weights);

// Index of the largest value, lowest index on ties
std::size_t argmax_index(const std::vector<double>& values);

} // namespace montecarlo

#endif // MONTECARLO_LOG_WEIGHTS_HPP
