#include <gtest/gtest.h>
#include <montecarlo/debug_log.hpp>
#include <montecarlo/errors.hpp>
#include <montecarlo/potentials.hpp>
#include <atomic>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

using namespace montecarlo;

namespace {

const std::string SPACE = " ";

SequenceView view_of(const TokenSequence& tokens, std::size_t context_length, std::size_t new_begin,
                     bool complete) {
    return SequenceView{tokens, context_length, new_begin, complete, SPACE};
}

std::shared_ptr<const Potential> constant(std::string name, double score, bool efficient = true) {
    return std::make_shared<CustomPotential>(std::move(name), [score](const SequenceView&) { return score; },
                                             efficient);
}

std::atomic<int> g_warnings{0};

void count_warnings(debug::LogLevel level, const char*) {
    if (level == debug::LogLevel::Warning) g_warnings.fetch_add(1);
}

} // namespace

TEST(SequenceView, SplitsContextAndNewTokens) {
    TokenSequence tokens{"the", "cat", "sat", "down"};
    auto view = view_of(tokens, 1, 3, false);
    EXPECT_EQ(view.generated().size(), 3u);
    EXPECT_EQ(view.new_tokens().size(), 1u);
    EXPECT_EQ(view.generated_text(), "cat sat down");
    EXPECT_EQ(view.new_text(), "down");
}

TEST(Potentials, LogPotentialConventions) {
    EXPECT_EQ(log_potential(1.0), 0.0);
    EXPECT_NEAR(log_potential(0.5), std::log(0.5), 1e-15);
    EXPECT_EQ(log_potential(0.0), NEG_INF);
    EXPECT_EQ(log_potential(-0.2), NEG_INF);
    EXPECT_EQ(log_potential(std::numeric_limits<double>::quiet_NaN()), NEG_INF);
}

TEST(PotentialSet, SumsLogScores) {
    PotentialSet set{constant("half", 0.5), constant("quarter", 0.25)};
    TokenSequence tokens{"a"};
    auto weight = set.incremental_log_weight(view_of(tokens, 0, 0, false));
    EXPECT_NEAR(weight.log_weight, std::log(0.125), 1e-12);
    EXPECT_EQ(weight.isolated_failures, 0u);

    PotentialSet empty;
    EXPECT_EQ(empty.incremental_log_weight(view_of(tokens, 0, 0, false)).log_weight, 0.0);
}

TEST(PotentialSet, StopsAtFirstZero) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    auto counting = std::make_shared<CustomPotential>("counting", [calls](const SequenceView&) {
        calls->fetch_add(1);
        return 1.0;
    });

    PotentialSet set;
    set.add(constant("zero", 0.0));
    set.add(counting);
    TokenSequence tokens{"a"};
    EXPECT_EQ(set.incremental_log_weight(view_of(tokens, 0, 0, false)).log_weight, NEG_INF);
    EXPECT_EQ(calls->load(), 0);
}

TEST(PotentialSet, EfficientPotentialsRunFirst) {
    PotentialSet set;
    set.add(constant("slow_a", 1.0, false));
    set.add(constant("fast_a", 1.0, true));
    set.add(constant("slow_b", 1.0, false));
    set.add(constant("fast_b", 1.0, true));
    EXPECT_EQ(set.names(), (std::vector<std::string>{"fast_a", "fast_b", "slow_a", "slow_b"}));
    EXPECT_THROW(set.add(nullptr), ConfigurationError);
}

TEST(PotentialSet, ThrowingPotentialIsIsolatedByDefault) {
    g_warnings = 0;
    debug::set_log_callback(count_warnings);

    PotentialSet set;
    set.add(std::make_shared<CustomPotential>("broken", [](const SequenceView&) -> double {
        throw std::runtime_error("scorer crashed");
    }));
    TokenSequence tokens{"a"};
    auto weight = set.incremental_log_weight(view_of(tokens, 0, 0, false));
    EXPECT_EQ(weight.log_weight, NEG_INF);
    EXPECT_EQ(weight.isolated_failures, 1u);
    EXPECT_EQ(g_warnings.load(), 1);

    debug::clear_log_callback();
}

TEST(PotentialSet, AbortRunPolicyRaises) {
    PotentialSet set;
    set.add(std::make_shared<CustomPotential>("fatal", [](const SequenceView&) -> double {
        throw std::runtime_error("model offline");
    }), FailurePolicy::AbortRun);
    TokenSequence tokens{"a"};
    try {
        set.incremental_log_weight(view_of(tokens, 0, 0, false));
        FAIL() << "expected PotentialEvaluationError";
    } catch (const PotentialEvaluationError& e) {
        EXPECT_NE(std::string(e.what()).find("fatal"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("model offline"), std::string::npos);
    }
}

TEST(PotentialSet, NanScoreIsClippedWithWarning) {
    g_warnings = 0;
    debug::set_log_callback(count_warnings);

    PotentialSet set{constant("nan", std::numeric_limits<double>::quiet_NaN())};
    TokenSequence tokens{"a"};
    EXPECT_EQ(set.incremental_log_weight(view_of(tokens, 0, 0, false)).log_weight, NEG_INF);
    EXPECT_EQ(g_warnings.load(), 1);

    debug::clear_log_callback();
}

TEST(PatternPotential, ScoresNewContentOnly) {
    PatternPotential no_digits("no_digits", "[0-9]", 0.0, 1.0);
    TokenSequence tokens{"call", "555", "now"};

    EXPECT_EQ(no_digits.score(view_of(tokens, 0, 2, false)), 1.0);
    EXPECT_EQ(no_digits.score(view_of(tokens, 0, 1, false)), 0.0);
    EXPECT_EQ(no_digits.score(view_of(tokens, 0, 3, false)), 1.0);
    EXPECT_EQ(no_digits.name(), "no_digits");
}

TEST(PatternPotential, CompletionScopeWaitsForCompletion) {
    PatternPotential greeting("greeting", "^hello", 1.0, 0.2, PotentialScope::Completion);
    TokenSequence tokens{"prompt:", "goodbye", "world"};

    EXPECT_EQ(greeting.score(view_of(tokens, 1, 2, false)), 1.0);
    EXPECT_EQ(greeting.score(view_of(tokens, 1, 2, true)), 0.2);

    TokenSequence polite{"prompt:", "hello", "world"};
    EXPECT_EQ(greeting.score(view_of(polite, 1, 2, true)), 1.0);

    PatternPotential closing("closing", "world$", 1.0, 0.2, PotentialScope::Completion);
    TokenSequence stopped{"prompt:", "hello", "world", "</s>"};
    SequenceView view{stopped, 1, 3, true, SPACE, true};
    EXPECT_EQ(view.content_text(), "hello world");
    EXPECT_EQ(closing.score(view), 1.0);
}

TEST(PatternPotential, InvalidConfigurationThrows) {
    EXPECT_THROW((PatternPotential("bad", "([unclosed")), ConfigurationError);
    EXPECT_THROW((PatternPotential("bad", "x", 1.5)), ConfigurationError);
}

TEST(EndsWithTerminalPunctuation, ChecksLastGeneratedToken) {
    EndsWithTerminalPunctuation potential;
    TokenSequence finished{"Once", "upon", "a", "time."};
    TokenSequence unfinished{"Once", "upon", "a", "time"};
    TokenSequence trailing_blank{"Once", "stop!", "  "};
    TokenSequence context_only{"Question?"};

    EXPECT_EQ(potential.score(view_of(finished, 1, 3, true)), 1.0);
    EXPECT_EQ(potential.score(view_of(unfinished, 1, 3, true)), 0.0);
    EXPECT_EQ(potential.score(view_of(unfinished, 1, 3, false)), 1.0);
    EXPECT_EQ(potential.score(view_of(trailing_blank, 1, 2, true)), 1.0);
    EXPECT_EQ(potential.score(view_of(context_only, 1, 1, true)), 0.0);
}

TEST(EndsWithTerminalPunctuation, LooksPastTrailingStopToken) {
    EndsWithTerminalPunctuation potential;
    TokenSequence eos_after_period{"Hello", "world", ".", "</s>"};
    TokenSequence eos_after_word{"Hello", "world", "</s>"};
    TokenSequence eos_only{"Prompt", "</s>"};

    EXPECT_EQ(potential.score(SequenceView{eos_after_period, 0, 3, true, SPACE, true}), 1.0);
    EXPECT_EQ(potential.score(SequenceView{eos_after_word, 0, 2, true, SPACE, true}), 0.0);
    EXPECT_EQ(potential.score(SequenceView{eos_only, 1, 1, true, SPACE, true}), 0.0);
    // Without the marker the final token is read as content
    EXPECT_EQ(potential.score(view_of(eos_after_period, 0, 3, true)), 0.0);
}

TEST(StylePotential, FormalPresetCountsMatchedWeight) {
    StylePotential formal("formal", StylePotential::formal_patterns());
    TokenSequence formal_text{"therefore", "it", "is", "done."};
    TokenSequence casual_text{"yeah", "sure"};

    EXPECT_NEAR(formal.score(view_of(formal_text, 0, 0, true)), 0.4, 1e-12);
    EXPECT_NEAR(formal.score(view_of(casual_text, 0, 0, true)), 0.1, 1e-12);
    EXPECT_EQ(formal.score(view_of(casual_text, 0, 0, false)), 1.0);
}

TEST(StylePotential, PresetsCompile) {
    EXPECT_NO_THROW(StylePotential("conversational", StylePotential::conversational_patterns()));
    EXPECT_NO_THROW(StylePotential("technical", StylePotential::technical_patterns()));
    EXPECT_NO_THROW(StylePotential("creative", StylePotential::creative_patterns()));
    EXPECT_THROW((StylePotential("empty", {})), ConfigurationError);
}

TEST(ConstraintPotential, WeakestConstraintDecides) {
    ConstraintPotential constraints("shape", {length_constraint(5, 20), forbidden_content_constraint({"spam"})});
    TokenSequence good{"a", "fine", "text"};
    TokenSequence spam{"buy", "spam"};
    TokenSequence tiny{"ab"};

    EXPECT_EQ(constraints.score(view_of(good, 0, 0, true)), 1.0);
    EXPECT_NEAR(constraints.score(view_of(spam, 0, 0, true)), 0.1, 1e-12);
    EXPECT_NEAR(constraints.score(view_of(tiny, 0, 0, true)), 0.4, 1e-12);
}

TEST(ConstraintPotential, ConstraintHelpers) {
    auto length = length_constraint(2, 4);
    EXPECT_EQ(length("abc"), 1.0);
    EXPECT_NEAR(length("abcdefgh"), 0.5, 1e-12);
    EXPECT_NEAR(length(std::string(100, 'x')), 0.1, 1e-12);
    EXPECT_THROW(length_constraint(5, 2), ConfigurationError);

    auto required = required_elements_constraint({"alpha", "beta", "gamma", "delta"}, 2);
    EXPECT_EQ(required("alpha and beta"), 1.0);
    EXPECT_NEAR(required("only alpha"), 0.5, 1e-12);
    EXPECT_NEAR(required("nothing"), 0.1, 1e-12);
    EXPECT_THROW(required_elements_constraint({"x"}, 2), ConfigurationError);
    EXPECT_THROW(required_elements_constraint({"x"}, 0), ConfigurationError);
}

TEST(BannedTokensPotential, PrunesBannedNewTokens) {
    BannedTokensPotential banned({"darn", "heck"});
    TokenSequence tokens{"heck", "no", "way"};

    EXPECT_TRUE(banned.is_satisfied(view_of(tokens, 0, 1, false)));
    EXPECT_FALSE(banned.is_satisfied(view_of(tokens, 0, 0, false)));
    EXPECT_EQ(banned.score(view_of(tokens, 0, 0, false)), 0.0);

    PotentialSet set;
    set.add(std::make_shared<BannedTokensPotential>(std::vector<Token>{"way"}));
    EXPECT_EQ(set.incremental_log_weight(view_of(tokens, 0, 2, false)).log_weight, NEG_INF);
    EXPECT_EQ(set.incremental_log_weight(view_of(tokens, 0, 3, false)).log_weight, 0.0);
}

TEST(CustomPotential, RejectsEmptyScorer) {
    EXPECT_THROW((CustomPotential("empty", nullptr)), ConfigurationError);
}
