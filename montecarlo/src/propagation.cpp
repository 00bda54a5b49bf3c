#include <montecarlo/propagation.hpp>
#include <montecarlo/debug_log.hpp>
#include <montecarlo/errors.hpp>
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace montecarlo {

namespace {

std::vector<std::vector<std::size_t>> split_contiguous(const std::vector<std::size_t>& indices, std::size_t parts) {
    std::vector<std::vector<std::size_t>> chunks;
    if (indices.empty() || parts == 0) return chunks;
    parts = std::min(parts, indices.size());
    chunks.reserve(parts);
    for (std::size_t k = 0; k < parts; ++k) {
        std::size_t begin = k * indices.size() / parts;
        std::size_t end = (k + 1) * indices.size() / parts;
        chunks.emplace_back(indices.begin() + begin, indices.begin() + end);
    }
    return chunks;
}

std::size_t this_worker() {
    return PropagationJobSystem::current_worker_index().value_or(0);
}

} // namespace

// === StepContext ===

bool StepContext::has_fatal() {
    std::lock_guard<std::mutex> lock(fatal_mutex);
    return fatal != nullptr;
}

void StepContext::record_fatal(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(fatal_mutex);
    if (!fatal) {
        fatal = std::move(error);
    }
    abandoned.store(true, std::memory_order_release);
}

RandomEngine StepContext::particle_rng(std::size_t index) const {
    // Retries get a fresh stream so a deterministic failure is not replayed verbatim
    return RandomEngine(derive_seed(settings.seed, step, index) + attempt * 0x9E3779B97F4A7C15ULL);
}

void StepContext::complete_particle(std::size_t index, TokenSequence proposal) {
    ParticleUpdate& slot = slots[index];
    TokenSequence tokens = inputs[index];
    const std::size_t new_begin = tokens.size();

    bool stopped = false;
    const std::size_t limit = std::min(proposal.size(), settings.tokens_per_step);
    for (std::size_t k = 0; k < limit && !stopped; ++k) {
        tokens.push_back(std::move(proposal[k]));
        stopped = std::find(settings.stop_tokens.begin(), settings.stop_tokens.end(), tokens.back()) !=
                  settings.stop_tokens.end();
    }
    const bool stopped_on_token = stopped && tokens.size() > settings.context_length;
    if (!stopped && stop_predicate) {
        stopped = stop_predicate(tokens, settings.context_length);
    }
    const bool complete = stopped || step + 1 >= settings.max_steps;

    SequenceView view{tokens, settings.context_length, new_begin, complete, settings.separator, stopped_on_token};
    IncrementalWeight weight = potentials.incremental_log_weight(view);

    slot.state = std::move(tokens);
    slot.incremental = weight.log_weight;
    slot.isolated_failures = weight.isolated_failures;
    slot.finished = complete;
    slot.proposed = true;
    slot.failed = false;
    slot.error.clear();
}

void StepContext::propagate_particle(std::size_t index) {
    ParticleUpdate& slot = slots[index];
    slot.worker = this_worker();

    TokenSequence proposal;
    try {
        RandomEngine rng = particle_rng(index);
        proposal = generator->propose(inputs[index], settings.tokens_per_step, rng, cancel);
    } catch (const AbortedException&) {
        throw;
    } catch (const std::exception& e) {
        slot.failed = true;
        slot.error = e.what();
        return;
    }
    complete_particle(index, std::move(proposal));
}

// === Tasks ===

void ProposeTask::execute() {
    StepContext& ctx = *context_;
    try {
        for (std::size_t index : indices_) {
            if (ctx.should_stop()) {
                throw AbortedException();
            }
            ctx.propagate_particle(index);
        }
    } catch (const PotentialEvaluationError&) {
        ctx.record_fatal(std::current_exception());
    }
}

void BatchProposeTask::execute() {
    StepContext& ctx = *context_;
    if (ctx.should_stop()) {
        throw AbortedException();
    }

    std::vector<TokenSequence> states;
    std::vector<RandomEngine> rngs;
    states.reserve(indices_.size());
    rngs.reserve(indices_.size());
    for (std::size_t index : indices_) {
        states.push_back(ctx.inputs[index]);
        rngs.push_back(ctx.particle_rng(index));
    }

    std::vector<TokenSequence> proposals;
    try {
        proposals = ctx.generator->propose_batch(states, ctx.settings.tokens_per_step, rngs, ctx.cancel);
        if (proposals.size() != indices_.size()) {
            throw std::runtime_error("propose_batch returned " + std::to_string(proposals.size()) +
                                     " proposals for " + std::to_string(indices_.size()) + " states");
        }
    } catch (const AbortedException&) {
        throw;
    } catch (const std::exception& e) {
        if (ctx.settings.gpu_fallback == GpuFallback::Fail) {
            ctx.record_fatal(std::make_exception_ptr(BatchInferenceError(e.what())));
            return;
        }
        MONTECARLO_WARN_LOG("batched proposal for %zu particles failed, falling back to task-parallel: %s",
                            indices_.size(), e.what());
        ctx.batch_failed.store(true, std::memory_order_release);
        if (ctx.should_stop()) return;

        auto chunks = split_contiguous(indices_, ctx.job_system->get_num_workers());
        for (auto& chunk : chunks) {
            ctx.job_system->submit(std::make_unique<ProposeTask>(context_, std::move(chunk)),
                                   job_system::ScheduleMode::FIFO);
        }
        return;
    }

    for (std::size_t k = 0; k < indices_.size(); ++k) {
        ctx.job_system->submit(std::make_unique<ScoreTask>(context_, indices_[k], std::move(proposals[k])),
                               job_system::ScheduleMode::FIFO);
    }
}

void ScoreTask::execute() {
    StepContext& ctx = *context_;
    if (ctx.should_stop()) {
        throw AbortedException();
    }
    ctx.slots[index_].worker = this_worker();
    try {
        ctx.complete_particle(index_, std::move(proposal_));
    } catch (const PotentialEvaluationError&) {
        ctx.record_fatal(std::current_exception());
    }
}

// === Propagator ===

Propagator::Propagator(PropagationMode mode, std::size_t worker_count,
                       std::shared_ptr<const TokenGenerator> generator, PotentialSet potentials,
                       StopPredicate stop_predicate, PropagationSettings settings)
    : mode_(mode),
      generator_(std::move(generator)),
      potentials_(std::move(potentials)),
      stop_predicate_(std::move(stop_predicate)),
      settings_(std::move(settings)) {
    if (!generator_) {
        throw ConfigurationError("propagation needs a token generator");
    }
    if (mode_ != PropagationMode::Sequential) {
        job_system_ = std::make_shared<PropagationJobSystem>(worker_count);
        job_system_->start();
    }
}

Propagator::~Propagator() {
    if (!job_system_) {
        return;
    }
    job_system_->cancel_pending();
    if (abandoned_) {
        try {
            std::thread([pool = job_system_] { pool->shutdown(); }).detach();
            return;
        } catch (const std::system_error& e) {
            MONTECARLO_WARN_LOG("could not start pool reaper, joining in place: %s", e.what());
        }
    }
    job_system_->shutdown();
}

std::shared_ptr<StepContext> Propagator::make_context(const ParticlePopulation<TokenSequence>& population,
                                                      std::size_t step, const CancellationToken& cancel) const {
    auto ctx = std::make_shared<StepContext>();
    ctx->generator = generator_;
    ctx->potentials = potentials_;
    ctx->stop_predicate = stop_predicate_;
    ctx->settings = settings_;
    ctx->cancel = cancel;
    ctx->step = step;
    ctx->inputs.resize(population.size());
    ctx->slots.resize(population.size());
    ctx->job_system = job_system_.get();
    return ctx;
}

void Propagator::submit_chunks(const std::shared_ptr<StepContext>& ctx, const std::vector<std::size_t>& active) {
    auto chunks = split_contiguous(active, job_system_->get_num_workers());
    for (std::size_t worker = 0; worker < chunks.size(); ++worker) {
        job_system_->submit_to_worker(worker, std::make_unique<ProposeTask>(ctx, std::move(chunks[worker])),
                                      job_system::ScheduleMode::FIFO);
    }
}

void Propagator::submit_batches(const std::shared_ptr<StepContext>& ctx, const std::vector<std::size_t>& active) {
    const std::size_t batch = settings_.batch_size == 0 ? active.size() : settings_.batch_size;
    for (std::size_t begin = 0; begin < active.size(); begin += batch) {
        std::size_t end = std::min(active.size(), begin + batch);
        std::vector<std::size_t> indices(active.begin() + begin, active.begin() + end);
        job_system_->submit(std::make_unique<BatchProposeTask>(ctx, std::move(indices)),
                            job_system::ScheduleMode::FIFO);
    }
}

void Propagator::submit_retries(const std::shared_ptr<StepContext>& ctx, const std::vector<std::size_t>& failed) {
    const std::size_t workers = job_system_->get_num_workers();
    for (std::size_t index : failed) {
        // With a single worker the retry lands on the same thread; only the attempt stream is fresh
        std::size_t worker = (ctx->slots[index].worker + 1) % workers;
        job_system_->submit_to_worker(worker, std::make_unique<ProposeTask>(ctx, std::vector<std::size_t>{index}),
                                      job_system::ScheduleMode::FIFO);
    }
}

bool Propagator::run_sequential(StepContext& ctx, const std::vector<std::size_t>& indices) {
    for (std::size_t index : indices) {
        if (ctx.cancel.stop_requested()) {
            return false;
        }
        try {
            ctx.propagate_particle(index);
        } catch (const AbortedException& e) {
            if (ctx.cancel.stop_requested()) {
                return false;
            }
            ctx.slots[index].failed = true;
            ctx.slots[index].error = e.what();
        }
    }
    return true;
}

bool Propagator::join(StepContext& ctx) {
    bool aborted = job_system_->wait_for_completion_with_abort(
        [&ctx] { return ctx.cancel.stop_requested() || ctx.has_fatal(); });

    std::exception_ptr fatal;
    {
        std::lock_guard<std::mutex> lock(ctx.fatal_mutex);
        fatal = ctx.fatal;
    }
    if (fatal) {
        ctx.abandoned.store(true, std::memory_order_release);
        abandoned_ = true;
        job_system_->cancel_pending();
        std::rethrow_exception(fatal);
    }
    if (aborted) {
        ctx.abandoned.store(true, std::memory_order_release);
        abandoned_ = true;
        std::size_t dropped = job_system_->cancel_pending();
        MONTECARLO_DEBUG_LOG("step %zu cancelled, %zu queued jobs dropped", ctx.step, dropped);
        (void)dropped;
        return false;
    }
    return true;
}

bool Propagator::dispatch(const std::shared_ptr<StepContext>& ctx, const std::vector<std::size_t>& indices,
                          bool retry) {
    if (mode_ == PropagationMode::Sequential) {
        return run_sequential(*ctx, indices);
    }
    if (retry) {
        submit_retries(ctx, indices);
    } else if (mode_ == PropagationMode::Batched) {
        submit_batches(ctx, indices);
    } else {
        submit_chunks(ctx, indices);
    }
    return join(*ctx);
}

StepOutcome Propagator::run_step(const ParticlePopulation<TokenSequence>& population, std::size_t step,
                                 const CancellationToken& cancel) {
    auto ctx = make_context(population, step, cancel);

    std::vector<std::size_t> active;
    for (std::size_t i = 0; i < population.size(); ++i) {
        const auto& particle = population[i];
        if (!particle.finished && particle.is_alive()) {
            active.push_back(i);
            ctx->inputs[i] = particle.state;
        }
    }

    StepOutcome outcome;
    if (!dispatch(ctx, active, false)) {
        return outcome;
    }
    if (ctx->batch_failed.load(std::memory_order_acquire)) {
        MONTECARLO_WARN_LOG("batched propagation disabled for the rest of the run");
        mode_ = PropagationMode::TaskParallel;
    }

    std::vector<std::size_t> failed;
    for (std::size_t index : active) {
        if (!ctx->slots[index].proposed) {
            failed.push_back(index);
        }
    }
    if (!failed.empty()) {
        MONTECARLO_WARN_LOG("step %zu: retrying %zu particle(s) after proposal failure", step, failed.size());
        outcome.retried = failed.size();
        ctx->attempt = 1;
        if (!dispatch(ctx, failed, true)) {
            return outcome;
        }
    }

    for (std::size_t index : active) {
        ParticleUpdate& slot = ctx->slots[index];
        if (!slot.proposed) {
            MONTECARLO_WARN_LOG("step %zu: particle %zu dropped after retry: %s", step, index,
                                slot.error.empty() ? "job did not complete" : slot.error.c_str());
            slot.incremental = NEG_INF;
            ++outcome.failed;
        }
        outcome.isolated_failures += slot.isolated_failures;
    }

    outcome.completed = true;
    outcome.updates = std::move(ctx->slots);
    return outcome;
}

} // namespace montecarlo
