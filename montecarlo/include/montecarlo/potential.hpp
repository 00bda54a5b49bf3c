#ifndef MONTECARLO_POTENTIAL_HPP
#define MONTECARLO_POTENTIAL_HPP

#include <montecarlo/types.hpp>
#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace montecarlo {

/**
 * What a potential sees of one particle during one step.
 *
 * tokens is the full sequence (caller context followed by generated tokens);
 * tokens from new_begin on were added in the current step. complete is set
 * once the particle met its stop condition or the step cap.
 * stop_token_at_end marks a final token that is one of the run's stop tokens;
 * content() and content_text() leave it out.
 */
struct SequenceView {
    const TokenSequence& tokens;
    std::size_t context_length = 0;
    std::size_t new_begin = 0;
    bool complete = false;
    const std::string& separator;
    bool stop_token_at_end = false;

    std::span<const Token> generated() const {
        return std::span<const Token>(tokens).subspan(std::min(context_length, tokens.size()));
    }
    std::span<const Token> new_tokens() const {
        return std::span<const Token>(tokens).subspan(std::min(new_begin, tokens.size()));
    }

    std::string generated_text() const { return join_tokens(tokens, context_length, separator); }
    std::string new_text() const { return join_tokens(tokens, new_begin, separator); }

    std::span<const Token> content() const {
        auto tokens_generated = generated();
        if (stop_token_at_end && !tokens_generated.empty()) {
            return tokens_generated.first(tokens_generated.size() - 1);
        }
        return tokens_generated;
    }
    std::string content_text() const {
        auto tokens_kept = content();
        std::string text;
        for (std::size_t i = 0; i < tokens_kept.size(); ++i) {
            if (i > 0) text += separator;
            text += tokens_kept[i];
        }
        return text;
    }
};

/**
 * Soft or hard constraint on candidate sequences.
 *
 * score() returns a probability-like value in [0, 1]; 0 (or -inf) marks a
 * violated hard constraint. Implementations must be pure and reentrant:
 * the engine calls them concurrently for different particles.
 */
class Potential {
public:
    virtual ~Potential() = default;

    virtual std::string name() const = 0;
    virtual double score(const SequenceView& view) const = 0;

    // Cheap pre-check; false prunes the particle without calling score()
    virtual bool is_satisfied(const SequenceView& /*view*/) const { return true; }

    // Efficient potentials run first so expensive ones can be skipped for dead particles
    virtual bool is_efficient() const { return true; }
};

// What happens when a potential throws while scoring
enum class FailurePolicy {
    IsolateParticle,  // That particle scores -inf, the run continues
    AbortRun          // PotentialEvaluationError ends the run
};

struct IncrementalWeight {
    double log_weight = 0.0;
    std::size_t isolated_failures = 0;
};

/**
 * Ordered set of potentials for one run.
 * The incremental log-weight is the sum of log scores; evaluation stops at the
 * first -inf. Efficient potentials are evaluated before expensive ones.
 */
class PotentialSet {
private:
    struct Entry {
        std::shared_ptr<const Potential> potential;
        FailurePolicy on_error;
    };

    std::vector<Entry> entries_;

public:
    PotentialSet() = default;
    PotentialSet(std::initializer_list<std::shared_ptr<const Potential>> potentials);

    void add(std::shared_ptr<const Potential> potential, FailurePolicy on_error = FailurePolicy::IsolateParticle);

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<std::string> names() const;

    /**
     * @throws PotentialEvaluationError if an AbortRun potential throws
     */
    IncrementalWeight incremental_log_weight(const SequenceView& view) const;
};

// log(score) with the conventions above: NaN, negative and zero map to -inf
double log_potential(double score);

} // namespace montecarlo

#endif // MONTECARLO_POTENTIAL_HPP
