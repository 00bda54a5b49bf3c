#include <gtest/gtest.h>
#include <montecarlo/debug_log.hpp>
#include <montecarlo/log_weights.hpp>
#include <montecarlo/types.hpp>
#include <atomic>
#include <cmath>
#include <limits>
#include <numeric>

using namespace montecarlo;

namespace {

std::atomic<int> g_warnings{0};

void count_warnings(debug::LogLevel level, const char*) {
    if (level == debug::LogLevel::Warning) {
        g_warnings.fetch_add(1);
    }
}

} // namespace

TEST(LogWeights, LogSumExpMatchesDirectSum) {
    std::vector<double> values{std::log(1.0), std::log(2.0), std::log(3.0)};
    EXPECT_NEAR(log_sum_exp(values), std::log(6.0), 1e-12);
}

TEST(LogWeights, LogSumExpOfNothingIsNegativeInfinity) {
    EXPECT_EQ(log_sum_exp({}), NEG_INF);
    EXPECT_EQ(log_sum_exp({NEG_INF, NEG_INF}), NEG_INF);
}

TEST(LogWeights, NormalizationSurvivesHugeLogWeights) {
    auto weights = normalize_log_weights({1000.0, 1000.0, NEG_INF});
    ASSERT_TRUE(weights.has_value());
    EXPECT_DOUBLE_EQ((*weights)[0], 0.5);
    EXPECT_DOUBLE_EQ((*weights)[1], 0.5);
    EXPECT_DOUBLE_EQ((*weights)[2], 0.0);
}

TEST(LogWeights, NormalizedWeightsSumToOne) {
    auto weights = normalize_log_weights({-3.2, 0.7, -12.0, 4.1, -0.5});
    ASSERT_TRUE(weights.has_value());
    double total = std::accumulate(weights->begin(), weights->end(), 0.0);
    EXPECT_NEAR(total, 1.0, 1e-12);
    for (double w : *weights) {
        EXPECT_GE(w, 0.0);
    }
}

TEST(LogWeights, CollapsedWeightsDoNotNormalize) {
    EXPECT_TRUE(is_collapsed({NEG_INF, NEG_INF}));
    EXPECT_TRUE(is_collapsed({}));
    EXPECT_FALSE(is_collapsed({NEG_INF, -50.0}));
    EXPECT_FALSE(normalize_log_weights({NEG_INF, NEG_INF}).has_value());
}

TEST(LogWeights, EffectiveSampleSizeBounds) {
    EXPECT_DOUBLE_EQ(effective_sample_size({0.25, 0.25, 0.25, 0.25}), 4.0);
    EXPECT_DOUBLE_EQ(effective_sample_size({1.0, 0.0, 0.0, 0.0}), 1.0);
    EXPECT_DOUBLE_EQ(effective_sample_size({0.5, 0.5, 0.0, 0.0}), 2.0);
}

TEST(LogWeights, SanitizeClipsNanAndInfinityWithDiagnostics) {
    g_warnings.store(0);
    debug::set_log_callback(count_warnings);

    std::vector<double> weights{std::numeric_limits<double>::quiet_NaN(),
                                std::numeric_limits<double>::infinity(), 0.0};
    std::size_t changed = sanitize_log_weights(weights, "test");
    debug::clear_log_callback();

    EXPECT_EQ(changed, 2u);
    EXPECT_EQ(weights[0], NEG_INF);
    EXPECT_EQ(weights[1], std::numeric_limits<double>::max());
    EXPECT_EQ(weights[2], 0.0);
    EXPECT_EQ(g_warnings.load(), 2);
}

TEST(LogWeights, SanitizeLeavesCleanWeightsAlone) {
    std::vector<double> weights{-1.0, NEG_INF, 2.0};
    EXPECT_EQ(sanitize_log_weights(weights, "test"), 0u);
    EXPECT_EQ(weights[1], NEG_INF);
}

TEST(LogWeights, ArgmaxPrefersLowestIndexOnTies) {
    EXPECT_EQ(argmax_index({0.1, 0.4, 0.4, 0.1}), 1u);
    EXPECT_EQ(argmax_index({NEG_INF, NEG_INF}), 0u);
}

TEST(LogWeights, DerivedSeedsAreDistinctPerStreamAndIndex) {
    static_assert(derive_seed(1, 2, 3) == derive_seed(1, 2, 3));
    EXPECT_NE(derive_seed(7, 0, 0), derive_seed(7, 0, 1));
    EXPECT_NE(derive_seed(7, 0, 1), derive_seed(7, 1, 0));
    EXPECT_NE(derive_seed(7, 1, 1), derive_seed(8, 1, 1));
}

TEST(LogWeights, JoinTokensFromOffset) {
    TokenSequence tokens{"a", "b", "c"};
    EXPECT_EQ(join_tokens(tokens), "a b c");
    EXPECT_EQ(join_tokens(tokens, 1, "-"), "b-c");
    EXPECT_EQ(join_tokens(tokens, 3), "");
}
