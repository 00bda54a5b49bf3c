/**
 * Guided Generation Example
 *
 * Runs SMC-guided generation over a small bigram model:
 * - Task options from the command line (--particles 64 --timeout 2 ...)
 * - Style and punctuation potentials steering the particles
 * - Result diagnostics (ESS history, resampling, failures)
 */

#include <montecarlo/errors.hpp>
#include <montecarlo/guided_generation.hpp>
#include <montecarlo/potentials.hpp>
#include <montecarlo/token_generator.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace montecarlo;

namespace {

const std::vector<std::string> CORPUS = {
    "it is clear that the method works .",
    "therefore the results are consistent with the model .",
    "however the data suggest a different explanation .",
    "furthermore it should be noted that the system is stable .",
    "the cat sat on the mat and looked at the moon !",
    "i think the results are pretty good actually .",
    "consequently there are several open questions .",
    "the analysis of the data is therefore incomplete .",
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--option value ...]\n"
              << "  Any task field is accepted, e.g. --particles 64 --workers 4 --timeout 2\n"
              << "  --max-steps 20 --use-gpu true --resampling-strategy residual --seed 7 --early-stopping true\n"
              << "  --context \"it is\" --style formal|conversational|technical|creative\n";
}

std::vector<StylePattern> style_by_name(const std::string& name) {
    if (name == "formal") return StylePotential::formal_patterns();
    if (name == "conversational") return StylePotential::conversational_patterns();
    if (name == "technical") return StylePotential::technical_patterns();
    if (name == "creative") return StylePotential::creative_patterns();
    throw ConfigurationError("unknown style '" + name + "'");
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "=== Guided Generation Example ===\n\n";

    GenerationTask task;
    task.particle_count = 64;
    task.max_steps = 20;
    task.stop_tokens = {".", "!", "?"};
    task.include_stop_token = true;
    task.context = {"the"};
    std::string style = "formal";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string key = argv[i];
            if (key == "--help" || key == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            if (key.rfind("--", 0) != 0 || i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            std::string value = argv[++i];
            if (key == "--style") {
                style = value;
            } else {
                task.apply_option(key.substr(2), value);
            }
        }

        auto generator = std::make_shared<MarkovChainTokenGenerator>(
            MarkovChainTokenGenerator::tokenize_corpus(CORPUS));
        std::cout << "Bigram model: " << generator->vocabulary_size() << " tokens, "
                  << generator->transition_count() << " contexts\n";

        PotentialSet potentials;
        potentials.add(std::make_shared<EndsWithTerminalPunctuation>());
        potentials.add(std::make_shared<BannedTokensPotential>(std::vector<Token>{"cat"}));
        potentials.add(std::make_shared<StylePotential>(style, style_by_name(style)));
        potentials.add(std::make_shared<ConstraintPotential>(
            "shape", std::vector<TextConstraint>{length_constraint(20, 120)}));

        std::cout << "Potentials:";
        for (const auto& name : potentials.names()) {
            std::cout << " " << name;
        }
        std::cout << "\n";
        std::cout << "Particles: " << task.particle_count << ", max steps: " << task.max_steps
                  << ", resampling: " << to_string(task.resampling_strategy) << "\n\n";

        GuidedGenerationEngine engine(generator, potentials);
        GenerationResult result = engine.generate(task);

        std::cout << "Context:  " << join_tokens(task.context, 0, task.token_separator) << "\n";
        std::cout << "Result:   " << result.best_text << "\n";
        std::cout << "Log weight: " << result.best_log_weight << "\n";
        std::cout << "Steps: " << result.steps_completed << (result.timed_out ? " (timed out)" : "")
                  << (result.early_stopped ? " (stopped early)" : "") << "\n";
        std::cout << "Mode: " << to_string(result.mode) << " with " << result.worker_count << " worker(s)\n";
        std::cout << "Resampled " << result.resample_count << " time(s); ESS per step:";
        for (double ess : result.ess_history) {
            std::cout << " " << static_cast<int>(ess + 0.5);
        }
        std::cout << "\n";
        if (result.failed_particles > 0 || result.retried_particles > 0) {
            std::cout << "Retried " << result.retried_particles << ", dropped " << result.failed_particles << "\n";
        }
        std::cout << "Seed: " << result.seed << ", elapsed: " << result.elapsed_time.count() << " s\n";
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const MonteCarloException& e) {
        std::cerr << "Generation failed: " << e.what() << "\n";
        return 2;
    }

    return 0;
}
