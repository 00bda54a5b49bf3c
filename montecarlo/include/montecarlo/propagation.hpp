#ifndef MONTECARLO_PROPAGATION_HPP
#define MONTECARLO_PROPAGATION_HPP

#include <montecarlo/cancellation.hpp>
#include <montecarlo/generation_task.hpp>
#include <montecarlo/particle.hpp>
#include <montecarlo/potential.hpp>
#include <montecarlo/token_generator.hpp>
#include <job_system/job_system.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace montecarlo {

/**
 * Job types for one propagation superstep.
 */
enum class PropagationJobType {
    PROPOSE,        // Propose and score a contiguous chunk of particles
    BATCH_PROPOSE,  // One coalesced propose_batch call, then spawns SCORE jobs
    SCORE           // Score one particle's batched proposal
};

// Caller-supplied completion test on (full sequence, context length)
using StopPredicate = std::function<bool(const TokenSequence& tokens, std::size_t context_length)>;

struct PropagationSettings {
    std::size_t context_length = 0;
    std::size_t max_steps = 100;
    std::size_t tokens_per_step = 1;
    std::vector<Token> stop_tokens;
    std::string separator = " ";
    std::uint64_t seed = 0;
    std::size_t batch_size = 0;
    GpuFallback gpu_fallback = GpuFallback::TaskParallel;
};

// Result slot for one particle; written by exactly one job at a time
struct ParticleUpdate {
    TokenSequence state;
    double incremental = 0.0;
    bool finished = false;
    bool proposed = false;  // Slot holds a new state for this step
    bool failed = false;    // Collaborator threw; eligible for one retry
    std::string error;
    std::size_t isolated_failures = 0;
    std::size_t worker = 0;
};

struct StepOutcome {
    bool completed = false;  // false: cancelled or timed out, updates are invalid
    std::vector<ParticleUpdate> updates;
    std::size_t retried = 0;
    std::size_t failed = 0;  // Particles killed after the retry also failed
    std::size_t isolated_failures = 0;
};

using PropagationJobSystem = job_system::JobSystem<PropagationJobType>;

/**
 * Shared state of one superstep.
 * Jobs hold it by shared_ptr so in-flight work abandoned at a timeout never
 * touches freed memory; the engine only reads the slots after the join.
 */
struct StepContext {
    std::shared_ptr<const TokenGenerator> generator;
    PotentialSet potentials;
    StopPredicate stop_predicate;
    PropagationSettings settings;
    CancellationToken cancel;
    std::size_t step = 0;
    std::size_t attempt = 0;

    std::vector<TokenSequence> inputs;  // Value copies of the states to extend
    std::vector<ParticleUpdate> slots;

    PropagationJobSystem* job_system = nullptr;
    std::atomic<bool> abandoned{false};
    std::atomic<bool> batch_failed{false};

    std::mutex fatal_mutex;
    std::exception_ptr fatal;

    bool should_stop() const { return abandoned.load(std::memory_order_acquire) || cancel.stop_requested(); }
    bool has_fatal();
    void record_fatal(std::exception_ptr error);

    RandomEngine particle_rng(std::size_t index) const;

    // Apply a proposal to slot index: stop handling, completion, scoring
    void complete_particle(std::size_t index, TokenSequence proposal);
    // Propose and score one particle; collaborator errors mark the slot failed
    void propagate_particle(std::size_t index);
};

/**
 * PROPOSE task: propagates a contiguous chunk of particle indices.
 */
class ProposeTask : public job_system::Job<PropagationJobType> {
private:
    std::shared_ptr<StepContext> context_;
    std::vector<std::size_t> indices_;

public:
    ProposeTask(std::shared_ptr<StepContext> ctx, std::vector<std::size_t> indices)
        : Job(PropagationJobType::PROPOSE, 0), context_(std::move(ctx)), indices_(std::move(indices)) {}

    void execute() override;
};

/**
 * BATCH_PROPOSE task: one propose_batch call for a batch of particles.
 * Spawns SCORE tasks on success; on failure either records a fatal
 * BatchInferenceError or re-submits the batch as PROPOSE tasks.
 */
class BatchProposeTask : public job_system::Job<PropagationJobType> {
private:
    std::shared_ptr<StepContext> context_;
    std::vector<std::size_t> indices_;

public:
    BatchProposeTask(std::shared_ptr<StepContext> ctx, std::vector<std::size_t> indices)
        : Job(PropagationJobType::BATCH_PROPOSE, 0), context_(std::move(ctx)), indices_(std::move(indices)) {}

    void execute() override;
};

class ScoreTask : public job_system::Job<PropagationJobType> {
private:
    std::shared_ptr<StepContext> context_;
    std::size_t index_;
    TokenSequence proposal_;

public:
    ScoreTask(std::shared_ptr<StepContext> ctx, std::size_t index, TokenSequence proposal)
        : Job(PropagationJobType::SCORE, 0), context_(std::move(ctx)), index_(index), proposal_(std::move(proposal)) {}

    void execute() override;
};

/**
 * Runs one propose-and-score superstep over a population.
 *
 * Owns the worker pool for the duration of a generation run. run_step()
 * submits the step's jobs, joins on completion or cancellation, retries
 * particles whose collaborator call failed once on a different worker and
 * returns per-index updates for the engine to merge.
 *
 * After an abandoned step the destructor does not wait for in-flight jobs:
 * a collaborator that ignores its cancellation token may hold a worker long
 * past the deadline. The pool is handed to a detached reaper thread that
 * joins the workers once those calls return.
 */
class Propagator {
private:
    PropagationMode mode_;
    std::shared_ptr<const TokenGenerator> generator_;
    PotentialSet potentials_;
    StopPredicate stop_predicate_;
    PropagationSettings settings_;
    std::shared_ptr<PropagationJobSystem> job_system_;
    bool abandoned_ = false;  // A step was left with jobs possibly still inside a collaborator call

    std::shared_ptr<StepContext> make_context(const ParticlePopulation<TokenSequence>& population,
                                              std::size_t step, const CancellationToken& cancel) const;

    void submit_chunks(const std::shared_ptr<StepContext>& ctx, const std::vector<std::size_t>& active);
    void submit_batches(const std::shared_ptr<StepContext>& ctx, const std::vector<std::size_t>& active);
    void submit_retries(const std::shared_ptr<StepContext>& ctx, const std::vector<std::size_t>& failed);

    bool run_sequential(StepContext& ctx, const std::vector<std::size_t>& indices);
    // @return false if cancelled before all jobs finished
    bool join(StepContext& ctx);
    bool dispatch(const std::shared_ptr<StepContext>& ctx, const std::vector<std::size_t>& indices, bool retry);

public:
    Propagator(PropagationMode mode, std::size_t worker_count, std::shared_ptr<const TokenGenerator> generator,
               PotentialSet potentials, StopPredicate stop_predicate, PropagationSettings settings);
    ~Propagator();

    Propagator(const Propagator&) = delete;
    Propagator& operator=(const Propagator&) = delete;

    /**
     * Propagate every live, unfinished particle of population by one step.
     * @throws PotentialEvaluationError if a fatal potential failed
     * @throws BatchInferenceError if batching failed and fallback is disabled
     */
    StepOutcome run_step(const ParticlePopulation<TokenSequence>& population, std::size_t step,
                         const CancellationToken& cancel);

    // Current mode; Batched degrades to TaskParallel after a batch failure
    PropagationMode mode() const { return mode_; }
    std::size_t worker_count() const { return job_system_ ? job_system_->get_num_workers() : 1; }
};

} // namespace montecarlo

#endif // MONTECARLO_PROPAGATION_HPP
