#ifndef MONTECARLO_GENERATION_TASK_HPP
#define MONTECARLO_GENERATION_TASK_HPP

#include <montecarlo/resampling.hpp>
#include <montecarlo/types.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace montecarlo {

enum class OutputSelection {
    MaxWeight,      // argmax of the final weights, lowest index on ties
    WeightedSample  // one draw from the normalized final weights
};

// What happens when batched (GPU) propagation fails or is unavailable
enum class GpuFallback {
    TaskParallel,  // Log a warning and continue with per-particle jobs
    Fail           // Raise BatchInferenceError
};

enum class PropagationMode {
    Sequential,    // Inline on the calling thread
    TaskParallel,  // Contiguous particle chunks per pool worker
    Batched        // Coalesced propose_batch calls, scoring on the pool
};

const char* to_string(OutputSelection selection);
const char* to_string(GpuFallback fallback);
const char* to_string(PropagationMode mode);

OutputSelection parse_output_selection(std::string_view name);
GpuFallback parse_gpu_fallback(std::string_view name);

/**
 * One generation request. Plain value; the engine never modifies it.
 *
 * Zero means "automatic" for worker_count and batch_size, and "no limit"
 * for timeout_seconds.
 */
struct GenerationTask {
    TokenSequence context;
    std::size_t particle_count = 100;
    std::size_t worker_count = 0;
    bool use_parallel = true;
    bool use_gpu = false;
    std::size_t batch_size = 0;
    double timeout_seconds = 0.0;
    double resampling_threshold = 0.5;
    ResamplingScheme resampling_strategy = ResamplingScheme::Systematic;
    OutputSelection output_selection = OutputSelection::MaxWeight;

    std::size_t max_steps = 100;
    std::size_t tokens_per_step = 1;
    std::vector<Token> stop_tokens{"</s>"};
    bool include_stop_token = false;  // Keep a terminating stop token in best_sequence
    std::string token_separator = " ";
    std::optional<std::uint64_t> seed;
    bool keep_final_population = false;
    // End the run once the best per-token score has not improved for
    // early_stopping_patience steps; 0 selects max(20, max_steps / 5)
    bool early_stopping = false;
    std::size_t early_stopping_patience = 0;
    GpuFallback gpu_fallback = GpuFallback::TaskParallel;

    /**
     * @throws ConfigurationError describing the first invalid field
     */
    void validate() const;

    /**
     * Set one field from its string form. Keys are the field names, with
     * '-' accepted for '_' ("particle-count"). "workers", "timeout" and
     * "batch_size_per_step" are accepted aliases; list values (stop_tokens,
     * context) are comma- or space-separated respectively.
     * @throws ConfigurationError on an unknown key or malformed value
     */
    void apply_option(std::string_view key, std::string_view value);

    void configure(const std::map<std::string, std::string>& options);

    static GenerationTask from_options(const std::map<std::string, std::string>& options);

    PropagationMode requested_mode() const;
};

/**
 * Worker count for a run: an explicit request wins; GPU-assisted batching
 * uses two threads per device (one blocked in the batched call, one
 * scoring); otherwise one less than the hardware threads, at least one.
 */
std::size_t default_worker_count(const GenerationTask& task, bool batching, std::size_t device_count,
                                 std::size_t hardware_threads);

} // namespace montecarlo

#endif // MONTECARLO_GENERATION_TASK_HPP
