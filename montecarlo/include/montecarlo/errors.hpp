#ifndef MONTECARLO_ERRORS_HPP
#define MONTECARLO_ERRORS_HPP

#include <job_system/job.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace montecarlo {

// Cooperative cancellation signal shared with the worker pool
using job_system::AbortedException;

// Root of every error raised by the library
class MonteCarloException : public std::runtime_error {
public:
    explicit MonteCarloException(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid GenerationTask, sampler or distribution parameters
class ConfigurationError : public MonteCarloException {
public:
    explicit ConfigurationError(const std::string& message)
        : MonteCarloException("Configuration error: " + message) {}
};

/**
 * Every particle's weight collapsed to -inf: no hypothesis satisfies the
 * potentials. Raised instead of silently resetting to uniform weights.
 */
class ConstraintUnsatisfiableError : public MonteCarloException {
public:
    ConstraintUnsatisfiableError(const std::string& message, std::size_t step)
        : MonteCarloException("Constraint unsatisfiable at step " + std::to_string(step) + ": " + message),
          step_(step) {}

    std::size_t step() const noexcept { return step_; }

private:
    std::size_t step_;
};

// The wall-clock budget expired before a single step completed
class GenerationTimeoutError : public MonteCarloException {
public:
    explicit GenerationTimeoutError(double timeout_seconds)
        : MonteCarloException("Timed out after " + std::to_string(timeout_seconds) +
                              "s before completing a step"),
          timeout_seconds_(timeout_seconds) {}

    double timeout_seconds() const noexcept { return timeout_seconds_; }

private:
    double timeout_seconds_;
};

// A potential registered as fatal threw while scoring
class PotentialEvaluationError : public MonteCarloException {
public:
    PotentialEvaluationError(const std::string& potential, const std::string& message)
        : MonteCarloException("Potential '" + potential + "' failed: " + message),
          potential_(potential) {}

    const std::string& potential() const noexcept { return potential_; }

private:
    std::string potential_;
};

// Batched inference failed and fallback to per-particle proposals is disabled
class BatchInferenceError : public MonteCarloException {
public:
    explicit BatchInferenceError(const std::string& message)
        : MonteCarloException("Batched inference failed: " + message) {}
};

} // namespace montecarlo

#endif // MONTECARLO_ERRORS_HPP
