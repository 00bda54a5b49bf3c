#include <montecarlo/generation_task.hpp>
#include <montecarlo/errors.hpp>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace montecarlo {

namespace {

std::string normalize_key(std::string_view key) {
    std::string result(key);
    std::replace(result.begin(), result.end(), '-', '_');
    return result;
}

std::size_t parse_count(std::string_view key, std::string_view value) {
    std::string text(value);
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigurationError("option '" + std::string(key) + "' expects a non-negative integer, got '" + text + "'");
    }
    errno = 0;
    unsigned long long parsed = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        throw ConfigurationError("option '" + std::string(key) + "' is out of range: " + text);
    }
    return static_cast<std::size_t>(parsed);
}

double parse_real(std::string_view key, std::string_view value) {
    std::string text(value);
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE || std::isnan(parsed)) {
        throw ConfigurationError("option '" + std::string(key) + "' expects a number, got '" + text + "'");
    }
    return parsed;
}

bool parse_flag(std::string_view key, std::string_view value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw ConfigurationError("option '" + std::string(key) + "' expects true or false, got '" + std::string(value) + "'");
}

std::vector<std::string> split(std::string_view value, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : value) {
        if (c == delimiter) {
            if (!current.empty()) parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

} // namespace

const char* to_string(OutputSelection selection) {
    switch (selection) {
        case OutputSelection::MaxWeight: return "max_weight";
        case OutputSelection::WeightedSample: return "weighted_sample";
    }
    return "unknown";
}

const char* to_string(GpuFallback fallback) {
    switch (fallback) {
        case GpuFallback::TaskParallel: return "task_parallel";
        case GpuFallback::Fail: return "fail";
    }
    return "unknown";
}

const char* to_string(PropagationMode mode) {
    switch (mode) {
        case PropagationMode::Sequential: return "sequential";
        case PropagationMode::TaskParallel: return "task_parallel";
        case PropagationMode::Batched: return "batched";
    }
    return "unknown";
}

OutputSelection parse_output_selection(std::string_view name) {
    if (name == "max_weight") return OutputSelection::MaxWeight;
    if (name == "weighted_sample") return OutputSelection::WeightedSample;
    throw ConfigurationError("unknown output selection '" + std::string(name) + "'");
}

GpuFallback parse_gpu_fallback(std::string_view name) {
    if (name == "task_parallel") return GpuFallback::TaskParallel;
    if (name == "fail") return GpuFallback::Fail;
    throw ConfigurationError("unknown GPU fallback policy '" + std::string(name) + "'");
}

void GenerationTask::validate() const {
    if (particle_count == 0) {
        throw ConfigurationError("particle_count must be at least 1");
    }
    if (!(resampling_threshold >= 0.0 && resampling_threshold <= 1.0)) {
        throw ConfigurationError("resampling_threshold must lie in [0, 1]");
    }
    if (!(timeout_seconds >= 0.0) || std::isinf(timeout_seconds)) {
        throw ConfigurationError("timeout_seconds must be finite and non-negative");
    }
    if (max_steps == 0) {
        throw ConfigurationError("max_steps must be at least 1");
    }
    if (tokens_per_step == 0) {
        throw ConfigurationError("tokens_per_step must be at least 1");
    }
    for (const auto& token : stop_tokens) {
        if (token.empty()) {
            throw ConfigurationError("stop tokens must not be empty");
        }
    }
}

void GenerationTask::apply_option(std::string_view raw_key, std::string_view value) {
    const std::string key = normalize_key(raw_key);

    if (key == "particle_count" || key == "particles") {
        particle_count = parse_count(key, value);
    } else if (key == "worker_count" || key == "workers") {
        worker_count = parse_count(key, value);
    } else if (key == "use_parallel") {
        use_parallel = parse_flag(key, value);
    } else if (key == "use_gpu") {
        use_gpu = parse_flag(key, value);
    } else if (key == "batch_size" || key == "batch_size_per_step") {
        batch_size = parse_count(key, value);
    } else if (key == "timeout_seconds" || key == "timeout") {
        timeout_seconds = parse_real(key, value);
    } else if (key == "resampling_threshold") {
        resampling_threshold = parse_real(key, value);
    } else if (key == "resampling_strategy") {
        resampling_strategy = parse_resampling_scheme(value);
    } else if (key == "output_selection") {
        output_selection = parse_output_selection(value);
    } else if (key == "max_steps") {
        max_steps = parse_count(key, value);
    } else if (key == "tokens_per_step") {
        tokens_per_step = parse_count(key, value);
    } else if (key == "stop_tokens") {
        stop_tokens = split(value, ',');
    } else if (key == "include_stop_token") {
        include_stop_token = parse_flag(key, value);
    } else if (key == "token_separator") {
        token_separator = std::string(value);
    } else if (key == "seed") {
        seed = static_cast<std::uint64_t>(parse_count(key, value));
    } else if (key == "keep_final_population") {
        keep_final_population = parse_flag(key, value);
    } else if (key == "early_stopping") {
        early_stopping = parse_flag(key, value);
    } else if (key == "early_stopping_patience" || key == "patience") {
        early_stopping_patience = parse_count(key, value);
    } else if (key == "gpu_fallback") {
        gpu_fallback = parse_gpu_fallback(value);
    } else if (key == "context") {
        context = split(value, ' ');
    } else {
        throw ConfigurationError("unknown option '" + std::string(raw_key) + "'");
    }
}

void GenerationTask::configure(const std::map<std::string, std::string>& options) {
    for (const auto& [key, value] : options) {
        apply_option(key, value);
    }
}

GenerationTask GenerationTask::from_options(const std::map<std::string, std::string>& options) {
    GenerationTask task;
    task.configure(options);
    task.validate();
    return task;
}

PropagationMode GenerationTask::requested_mode() const {
    if (!use_parallel) return PropagationMode::Sequential;
    return use_gpu ? PropagationMode::Batched : PropagationMode::TaskParallel;
}

std::size_t default_worker_count(const GenerationTask& task, bool batching, std::size_t device_count,
                                 std::size_t hardware_threads) {
    if (task.worker_count > 0) {
        return task.worker_count;
    }
    if (batching && device_count > 0) {
        return 2 * device_count;
    }
    return hardware_threads > 1 ? hardware_threads - 1 : 1;
}

} // namespace montecarlo
