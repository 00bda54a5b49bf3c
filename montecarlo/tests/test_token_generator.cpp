#include <gtest/gtest.h>
#include <montecarlo/errors.hpp>
#include <montecarlo/token_generator.hpp>
#include <algorithm>
#include <stdexcept>

using namespace montecarlo;

TEST(TokenGenerator, VocabularyProposesRequestedCount) {
    VocabularyTokenGenerator generator(std::vector<Token>{"x", "y"});
    RandomEngine rng(1);
    CancellationToken cancel;

    auto tokens = generator.propose({"ctx"}, 5, rng, cancel);
    ASSERT_EQ(tokens.size(), 5u);
    for (const auto& t : tokens) {
        EXPECT_TRUE(t == "x" || t == "y");
    }
    EXPECT_FALSE(generator.supports_batching());
    EXPECT_EQ(generator.device_count(), 0u);
}

TEST(TokenGenerator, DefaultBatchMatchesPerStateCalls) {
    VocabularyTokenGenerator generator(std::vector<Token>{"a", "b", "c", "d"});
    CancellationToken cancel;
    std::vector<TokenSequence> states{{"one"}, {"two"}, {"three"}};

    std::vector<RandomEngine> rngs{RandomEngine(10), RandomEngine(11), RandomEngine(12)};
    auto batch = generator.propose_batch(states, 3, rngs, cancel);

    ASSERT_EQ(batch.size(), 3u);
    for (std::size_t i = 0; i < states.size(); ++i) {
        RandomEngine rng(10 + i);
        EXPECT_EQ(batch[i], generator.propose(states[i], 3, rng, cancel));
    }

    std::vector<RandomEngine> too_few{RandomEngine(1)};
    EXPECT_THROW(generator.propose_batch(states, 1, too_few, cancel), std::invalid_argument);
}

TEST(TokenGenerator, CancelledTokenStopsProposals) {
    VocabularyTokenGenerator generator(std::vector<Token>{"a"});
    RandomEngine rng(0);
    CancellationToken cancel;
    cancel.request_stop();
    EXPECT_THROW(generator.propose({}, 1, rng, cancel), AbortedException);

    CancellationToken expired(CancellationToken::Clock::now());
    EXPECT_TRUE(expired.deadline_passed());
    EXPECT_THROW(expired.throw_if_cancelled(), AbortedException);
}

TEST(MarkovChainTokenGenerator, FollowsObservedBigrams) {
    auto corpus = MarkovChainTokenGenerator::tokenize_corpus({"red fish blue fish", "  ", "one fish two fish"});
    ASSERT_EQ(corpus.size(), 2u);

    MarkovChainTokenGenerator generator(corpus);
    EXPECT_EQ(generator.vocabulary_size(), 5u);
    EXPECT_EQ(generator.transition_count(), 5u);

    RandomEngine rng(3);
    CancellationToken cancel;
    for (int i = 0; i < 50; ++i) {
        auto next = generator.propose({"red"}, 1, rng, cancel);
        ASSERT_EQ(next.size(), 1u);
        EXPECT_EQ(next[0], "fish");

        auto after_fish = generator.propose({"fish"}, 1, rng, cancel);
        EXPECT_TRUE(after_fish[0] == "blue" || after_fish[0] == "two");
    }
}

TEST(MarkovChainTokenGenerator, UnknownTokenFallsBackToUnigrams) {
    std::vector<TokenSequence> corpus{TokenSequence{"a", "b"}};
    MarkovChainTokenGenerator generator(corpus);
    RandomEngine rng(5);
    CancellationToken cancel;

    auto tokens = generator.propose({"zzz"}, 4, rng, cancel);
    ASSERT_EQ(tokens.size(), 4u);
    for (const auto& t : tokens) {
        EXPECT_TRUE(t == "a" || t == "b");
    }
    EXPECT_EQ(generator.propose({}, 2, rng, cancel).size(), 2u);
}

TEST(MarkovChainTokenGenerator, EmptyCorpusIsRejected) {
    EXPECT_THROW(MarkovChainTokenGenerator(std::vector<TokenSequence>{}), ConfigurationError);
}
