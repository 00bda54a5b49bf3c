#ifndef MONTECARLO_GUIDED_GENERATION_HPP
#define MONTECARLO_GUIDED_GENERATION_HPP

#include <montecarlo/generation_task.hpp>
#include <montecarlo/particle.hpp>
#include <montecarlo/potential.hpp>
#include <montecarlo/propagation.hpp>
#include <montecarlo/resampling.hpp>
#include <montecarlo/token_generator.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace montecarlo {

struct GenerationResult {
    TokenSequence best_sequence;  // Generated tokens only; context and, by default, the stop token excluded
    std::string best_text;
    double best_log_weight = NEG_INF;
    std::optional<ParticlePopulation<TokenSequence>> final_population;
    std::chrono::duration<double> elapsed_time{0.0};
    std::size_t steps_completed = 0;
    bool timed_out = false;
    bool early_stopped = false;  // No per-token score improvement within the patience window

    std::size_t resample_count = 0;
    std::vector<double> ess_history;  // ESS before resampling, one entry per completed step
    std::size_t failed_particles = 0;
    std::size_t retried_particles = 0;
    std::size_t isolated_failures = 0;
    PropagationMode mode = PropagationMode::Sequential;
    std::size_t worker_count = 1;
    std::uint64_t seed = 0;
};

/**
 * Sequential Monte Carlo guided generation.
 *
 * Each step every live, unfinished particle receives a proposal from the
 * token generator, is reweighted by the potentials, and the population is
 * resampled when its ESS drops below threshold * N. The loop ends when all
 * particles are finished, max_steps is reached or the wall-clock budget
 * expires; the selected particle of the last completed step is returned.
 *
 * The engine is stateless between runs and may be shared across threads.
 * Each generate() call builds and tears down its own worker pool.
 */
class GuidedGenerationEngine {
private:
    std::shared_ptr<const TokenGenerator> generator_;
    PotentialSet potentials_;
    StopPredicate stop_predicate_;
    std::shared_ptr<const ResamplingStrategy> resampler_;

    PropagationMode resolve_mode(const GenerationTask& task) const;

public:
    /**
     * @param stop_predicate optional completion test in addition to stop tokens
     * @param resampler overrides the task's resampling_strategy when set
     */
    GuidedGenerationEngine(std::shared_ptr<const TokenGenerator> generator, PotentialSet potentials,
                           StopPredicate stop_predicate = nullptr,
                           std::shared_ptr<const ResamplingStrategy> resampler = nullptr);

    /**
     * @throws ConfigurationError for an invalid task
     * @throws ConstraintUnsatisfiableError when every particle's weight collapses
     * @throws GenerationTimeoutError when the budget expires before the first step completes
     * @throws PotentialEvaluationError when a potential registered with AbortRun throws
     * @throws BatchInferenceError when batching is unavailable or fails with GpuFallback::Fail
     */
    GenerationResult generate(const GenerationTask& task) const;

    const PotentialSet& potentials() const { return potentials_; }
    const TokenGenerator& generator() const { return *generator_; }
};

} // namespace montecarlo

#endif // MONTECARLO_GUIDED_GENERATION_HPP
