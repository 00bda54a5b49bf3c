#ifndef MONTECARLO_TOKEN_GENERATOR_HPP
#define MONTECARLO_TOKEN_GENERATOR_HPP

#include <montecarlo/cancellation.hpp>
#include <montecarlo/distribution.hpp>
#include <montecarlo/types.hpp>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace montecarlo {

/**
 * Token-generation collaborator: proposes continuations for partial sequences.
 *
 * The engine calls propose() concurrently from pool workers, so
 * implementations must be safe for concurrent const calls. All randomness
 * comes from the engine-supplied per-particle engine. Long-running
 * implementations should poll cancel and throw AbortedException once it
 * reports a stop.
 */
class TokenGenerator {
public:
    virtual ~TokenGenerator() = default;

    /**
     * Propose up to max_tokens tokens to append to state.
     * Returning fewer (even zero) tokens is allowed.
     */
    virtual TokenSequence propose(const TokenSequence& state, std::size_t max_tokens,
                                  RandomEngine& rng, const CancellationToken& cancel) const = 0;

    /**
     * One coalesced call for many states; rngs[i] belongs to states[i].
     * The default loops over propose(); batching backends override it.
     */
    virtual std::vector<TokenSequence> propose_batch(const std::vector<TokenSequence>& states,
                                                     std::size_t max_tokens,
                                                     std::vector<RandomEngine>& rngs,
                                                     const CancellationToken& cancel) const;

    // True when propose_batch is a real coalesced call rather than a loop
    virtual bool supports_batching() const { return false; }

    // Accelerator devices behind the batched path, 0 for none
    virtual std::size_t device_count() const { return 0; }
};

// Draws every token independently from a fixed categorical distribution
class VocabularyTokenGenerator : public TokenGenerator {
private:
    DiscreteDistribution<Token> vocabulary_;

public:
    explicit VocabularyTokenGenerator(DiscreteDistribution<Token> vocabulary);
    explicit VocabularyTokenGenerator(std::vector<Token> vocabulary);

    TokenSequence propose(const TokenSequence& state, std::size_t max_tokens,
                          RandomEngine& rng, const CancellationToken& cancel) const override;

    const DiscreteDistribution<Token>& vocabulary() const { return vocabulary_; }
};

/**
 * Bigram model estimated from a whitespace-tokenized corpus.
 * Falls back to corpus unigram frequencies when the last token has no
 * observed successor (or the state is empty).
 */
class MarkovChainTokenGenerator : public TokenGenerator {
private:
    std::unordered_map<Token, DiscreteDistribution<Token>> transitions_;
    std::vector<Token> unigram_values_;
    std::vector<double> unigram_counts_;

    const DiscreteDistribution<Token>* successors(const Token& token) const;

public:
    explicit MarkovChainTokenGenerator(const std::vector<TokenSequence>& corpus);

    static std::vector<TokenSequence> tokenize_corpus(const std::vector<std::string>& lines);

    TokenSequence propose(const TokenSequence& state, std::size_t max_tokens,
                          RandomEngine& rng, const CancellationToken& cancel) const override;

    std::size_t vocabulary_size() const { return unigram_values_.size(); }
    std::size_t transition_count() const { return transitions_.size(); }
};

} // namespace montecarlo

#endif // MONTECARLO_TOKEN_GENERATOR_HPP
