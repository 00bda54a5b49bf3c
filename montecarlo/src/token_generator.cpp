#include <montecarlo/token_generator.hpp>
#include <montecarlo/errors.hpp>
#include <map>
#include <sstream>
#include <stdexcept>

namespace montecarlo {

std::vector<TokenSequence> TokenGenerator::propose_batch(const std::vector<TokenSequence>& states,
                                                         std::size_t max_tokens,
                                                         std::vector<RandomEngine>& rngs,
                                                         const CancellationToken& cancel) const {
    if (rngs.size() != states.size()) {
        throw std::invalid_argument("propose_batch needs one random engine per state");
    }
    std::vector<TokenSequence> proposals;
    proposals.reserve(states.size());
    for (std::size_t i = 0; i < states.size(); ++i) {
        cancel.throw_if_cancelled();
        proposals.push_back(propose(states[i], max_tokens, rngs[i], cancel));
    }
    return proposals;
}

// === VocabularyTokenGenerator ===

VocabularyTokenGenerator::VocabularyTokenGenerator(DiscreteDistribution<Token> vocabulary)
    : vocabulary_(std::move(vocabulary)) {}

VocabularyTokenGenerator::VocabularyTokenGenerator(std::vector<Token> vocabulary)
    : vocabulary_(std::move(vocabulary)) {}

TokenSequence VocabularyTokenGenerator::propose(const TokenSequence&, std::size_t max_tokens,
                                                RandomEngine& rng, const CancellationToken& cancel) const {
    cancel.throw_if_cancelled();
    TokenSequence tokens;
    tokens.reserve(max_tokens);
    for (std::size_t i = 0; i < max_tokens; ++i) {
        tokens.push_back(vocabulary_.sample(rng));
    }
    return tokens;
}

// === MarkovChainTokenGenerator ===

MarkovChainTokenGenerator::MarkovChainTokenGenerator(const std::vector<TokenSequence>& corpus) {
    // Ordered maps keep the value order (and so sampling) independent of hashing
    std::map<Token, std::map<Token, double>> bigrams;
    std::map<Token, double> unigrams;
    for (const auto& sentence : corpus) {
        for (std::size_t i = 0; i < sentence.size(); ++i) {
            unigrams[sentence[i]] += 1.0;
            if (i + 1 < sentence.size()) {
                bigrams[sentence[i]][sentence[i + 1]] += 1.0;
            }
        }
    }
    if (unigrams.empty()) {
        throw ConfigurationError("Markov chain generator needs a non-empty corpus");
    }

    for (const auto& [token, count] : unigrams) {
        unigram_values_.push_back(token);
        unigram_counts_.push_back(count);
    }
    for (const auto& [token, followers] : bigrams) {
        std::vector<Token> values;
        std::vector<double> counts;
        for (const auto& [next, count] : followers) {
            values.push_back(next);
            counts.push_back(count);
        }
        transitions_.emplace(token, DiscreteDistribution<Token>(std::move(values), std::move(counts)));
    }
}

std::vector<TokenSequence> MarkovChainTokenGenerator::tokenize_corpus(const std::vector<std::string>& lines) {
    std::vector<TokenSequence> corpus;
    for (const auto& line : lines) {
        std::istringstream in(line);
        TokenSequence sentence;
        Token token;
        while (in >> token) {
            sentence.push_back(token);
        }
        if (!sentence.empty()) {
            corpus.push_back(std::move(sentence));
        }
    }
    return corpus;
}

const DiscreteDistribution<Token>* MarkovChainTokenGenerator::successors(const Token& token) const {
    auto it = transitions_.find(token);
    return it == transitions_.end() ? nullptr : &it->second;
}

TokenSequence MarkovChainTokenGenerator::propose(const TokenSequence& state, std::size_t max_tokens,
                                                 RandomEngine& rng, const CancellationToken& cancel) const {
    cancel.throw_if_cancelled();
    TokenSequence tokens;
    tokens.reserve(max_tokens);
    const Token* last = state.empty() ? nullptr : &state.back();
    for (std::size_t i = 0; i < max_tokens; ++i) {
        const DiscreteDistribution<Token>* next = last ? successors(*last) : nullptr;
        if (next) {
            tokens.push_back(next->sample(rng));
        } else {
            std::discrete_distribution<std::size_t> pick(unigram_counts_.begin(), unigram_counts_.end());
            tokens.push_back(unigram_values_[pick(rng)]);
        }
        last = &tokens.back();
    }
    return tokens;
}

} // namespace montecarlo
