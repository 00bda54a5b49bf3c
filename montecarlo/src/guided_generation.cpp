#include <montecarlo/guided_generation.hpp>
#include <montecarlo/cancellation.hpp>
#include <montecarlo/debug_log.hpp>
#include <montecarlo/errors.hpp>
#include <montecarlo/log_weights.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <thread>

namespace montecarlo {

namespace {

using Clock = CancellationToken::Clock;

// Resampling and weighted selection draw from one stream, separate from every particle stream
constexpr std::uint64_t SELECTION_STREAM = std::numeric_limits<std::uint64_t>::max();

std::uint64_t fresh_seed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

// Best lineage log-weight per generated token over the live particles
double best_token_score(const ParticlePopulation<TokenSequence>& population, const std::vector<double>& lineage,
                        std::size_t context_length) {
    double best = NEG_INF;
    for (std::size_t i = 0; i < population.size(); ++i) {
        if (!population[i].is_alive() || std::isnan(lineage[i])) continue;
        std::size_t generated = population[i].state.size() > context_length
            ? population[i].state.size() - context_length
            : 1;
        best = std::max(best, lineage[i] / static_cast<double>(generated));
    }
    return best;
}

bool all_finished(const ParticlePopulation<TokenSequence>& population) {
    return std::all_of(population.begin(), population.end(),
                       [](const Particle<TokenSequence>& p) { return p.finished || !p.is_alive(); });
}

} // namespace

GuidedGenerationEngine::GuidedGenerationEngine(std::shared_ptr<const TokenGenerator> generator,
                                               PotentialSet potentials, StopPredicate stop_predicate,
                                               std::shared_ptr<const ResamplingStrategy> resampler)
    : generator_(std::move(generator)),
      potentials_(std::move(potentials)),
      stop_predicate_(std::move(stop_predicate)),
      resampler_(std::move(resampler)) {
    if (!generator_) {
        throw ConfigurationError("guided generation needs a token generator");
    }
}

PropagationMode GuidedGenerationEngine::resolve_mode(const GenerationTask& task) const {
    PropagationMode mode = task.requested_mode();
    if (mode == PropagationMode::Batched && !generator_->supports_batching()) {
        if (task.gpu_fallback == GpuFallback::Fail) {
            throw BatchInferenceError("token generator does not support batched proposals");
        }
        MONTECARLO_WARN_LOG("use_gpu requested but the generator cannot batch; using task-parallel propagation");
        mode = PropagationMode::TaskParallel;
    }
    return mode;
}

GenerationResult GuidedGenerationEngine::generate(const GenerationTask& task) const {
    task.validate();
    const auto start = Clock::now();

    CancellationToken cancel;
    if (task.timeout_seconds > 0.0) {
        cancel = CancellationToken(start + std::chrono::duration_cast<Clock::duration>(
                                               std::chrono::duration<double>(task.timeout_seconds)));
    }

    GenerationResult result;
    result.seed = task.seed ? *task.seed : fresh_seed();
    result.mode = resolve_mode(task);
    result.worker_count = result.mode == PropagationMode::Sequential
        ? 1
        : default_worker_count(task, result.mode == PropagationMode::Batched, generator_->device_count(),
                               std::thread::hardware_concurrency());

    PropagationSettings settings;
    settings.context_length = task.context.size();
    settings.max_steps = task.max_steps;
    settings.tokens_per_step = task.tokens_per_step;
    settings.stop_tokens = task.stop_tokens;
    settings.separator = task.token_separator;
    settings.seed = result.seed;
    settings.batch_size = task.batch_size;
    settings.gpu_fallback = task.gpu_fallback;

    std::shared_ptr<const ResamplingStrategy> resampler = resampler_;
    if (!resampler) {
        resampler = make_resampling_strategy(task.resampling_strategy);
    }
    RandomEngine selection_rng(derive_seed(result.seed, SELECTION_STREAM, 0));

    MONTECARLO_DEBUG_LOG("generate: N=%zu mode=%s workers=%zu resampling=%s seed=%llu",
                         task.particle_count, to_string(result.mode), result.worker_count, resampler->name(),
                         static_cast<unsigned long long>(result.seed));

    Propagator propagator(result.mode, result.worker_count, generator_, potentials_, stop_predicate_, settings);
    ParticlePopulation<TokenSequence> population(task.particle_count, task.context);
    const double n = static_cast<double>(population.size());

    // Resampling resets log_weight, so improvement is tracked on a lineage score that survives it
    std::vector<double> lineage(population.size(), 0.0);
    double best_score = NEG_INF;
    std::size_t steps_without_improvement = 0;
    const std::size_t patience = task.early_stopping_patience > 0
        ? task.early_stopping_patience
        : std::max<std::size_t>(20, task.max_steps / 5);

    for (std::size_t step = 0; step < task.max_steps; ++step) {
        if (all_finished(population)) {
            break;
        }
        if (cancel.stop_requested()) {
            result.timed_out = true;
            break;
        }

        StepOutcome outcome = propagator.run_step(population, step, cancel);
        if (!outcome.completed) {
            result.timed_out = true;
            break;
        }

        for (std::size_t i = 0; i < population.size(); ++i) {
            auto& particle = population[i];
            auto& update = outcome.updates[i];
            if (update.proposed) {
                particle.state = std::move(update.state);
                particle.finished = update.finished;
            }
            particle.log_weight += update.incremental;
            lineage[i] += update.incremental;
        }
        result.failed_particles += outcome.failed;
        result.retried_particles += outcome.retried;
        result.isolated_failures += outcome.isolated_failures;

        population.sanitize_weights("guided generation");
        auto weights = population.normalized_weights();
        if (!weights) {
            throw ConstraintUnsatisfiableError("every particle violated a hard constraint", step + 1);
        }

        const double ess = effective_sample_size(*weights);
        result.ess_history.push_back(ess);
        result.steps_completed = step + 1;

        if (population.size() > 1 && ess < task.resampling_threshold * n) {
            MONTECARLO_DEBUG_LOG("step %zu: ESS %.2f below %.2f, resampling", step + 1, ess,
                                 task.resampling_threshold * n);
            auto ancestors = resampler->select(*weights, selection_rng);
            std::vector<double> inherited(ancestors.size());
            for (std::size_t i = 0; i < ancestors.size(); ++i) {
                inherited[i] = lineage.at(ancestors[i]);
            }
            population.resample_from(ancestors);
            lineage = std::move(inherited);
            ++result.resample_count;
        }

        const double score = best_token_score(population, lineage, task.context.size());
        if (score > best_score) {
            best_score = score;
            steps_without_improvement = 0;
        } else {
            ++steps_without_improvement;
        }
        if (task.early_stopping && steps_without_improvement >= patience) {
            MONTECARLO_DEBUG_LOG("generate: no improvement for %zu step(s), stopping early", patience);
            result.early_stopped = true;
            break;
        }
    }

    if (result.timed_out) {
        if (result.steps_completed == 0) {
            throw GenerationTimeoutError(task.timeout_seconds);
        }
        MONTECARLO_DEBUG_LOG("generate: budget expired after %zu step(s)", result.steps_completed);
    }

    auto weights = population.normalized_weights();
    if (!weights) {
        throw ConstraintUnsatisfiableError("no live particle to select", result.steps_completed);
    }
    std::size_t best = 0;
    if (task.output_selection == OutputSelection::MaxWeight) {
        best = argmax_index(*weights);
    } else {
        std::discrete_distribution<std::size_t> pick(weights->begin(), weights->end());
        best = pick(selection_rng);
    }

    const auto& chosen = population[best];
    result.best_sequence.assign(chosen.state.begin() + static_cast<std::ptrdiff_t>(
                                    std::min(task.context.size(), chosen.state.size())),
                                chosen.state.end());
    if (!task.include_stop_token && chosen.finished && !result.best_sequence.empty() &&
        std::find(task.stop_tokens.begin(), task.stop_tokens.end(), result.best_sequence.back()) !=
            task.stop_tokens.end()) {
        result.best_sequence.pop_back();
    }
    result.best_text = join_tokens(result.best_sequence, 0, task.token_separator);
    result.best_log_weight = chosen.log_weight;
    result.mode = propagator.mode();
    if (task.keep_final_population) {
        result.final_population = std::move(population);
    }
    result.elapsed_time = Clock::now() - start;
    return result;
}

} // namespace montecarlo
