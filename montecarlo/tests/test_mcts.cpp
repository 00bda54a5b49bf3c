#include <gtest/gtest.h>
#include <montecarlo/mcts.hpp>
#include <algorithm>
#include <memory>
#include <vector>

using namespace montecarlo;

namespace {

using Bits = std::vector<int>;

// Choose three bits; reward is the fraction of ones
class BitStringProblem : public SearchProblem<Bits, int> {
public:
    std::vector<int> legal_actions(const Bits&) const override { return {0, 1}; }

    Bits apply(const Bits& state, const int& action) const override {
        Bits next = state;
        next.push_back(action);
        return next;
    }

    bool is_terminal(const Bits& state) const override { return state.size() >= 3; }

    double reward(const Bits& state) const override {
        return static_cast<double>(std::count(state.begin(), state.end(), 1)) / 3.0;
    }
};

MctsOptions options_with(std::size_t iterations, std::uint64_t seed) {
    MctsOptions options;
    options.max_iterations = iterations;
    options.seed = seed;
    return options;
}

} // namespace

TEST(MonteCarloTreeSearch, FindsTheRewardingAction) {
    auto problem = std::make_shared<BitStringProblem>();
    MonteCarloTreeSearch<Bits, int> search(problem, Bits{}, nullptr, options_with(500, 12));

    EXPECT_EQ(search.search(), 500u);
    ASSERT_TRUE(search.best_action().has_value());
    EXPECT_EQ(*search.best_action(), 1);
    EXPECT_EQ(*search.most_visited_action(), 1);
    EXPECT_EQ(search.root_visits(), 500u);
    EXPECT_EQ(search.iterations_run(), 500u);
    EXPECT_LE(search.tree_depth(), 3u);
}

TEST(MonteCarloTreeSearch, NoActionBeforeSearch) {
    auto problem = std::make_shared<BitStringProblem>();
    MonteCarloTreeSearch<Bits, int> search(problem, Bits{}, nullptr, options_with(10, 1));
    EXPECT_FALSE(search.best_action().has_value());
    EXPECT_FALSE(search.most_visited_action().has_value());
    EXPECT_EQ(search.node_count(), 1u);
}

TEST(MonteCarloTreeSearch, EachIterationExpandsOneChild) {
    auto problem = std::make_shared<BitStringProblem>();
    MonteCarloTreeSearch<Bits, int> search(problem, Bits{}, nullptr, options_with(10, 4));

    search.run_iteration();
    search.run_iteration();
    auto children = search.root_children();
    ASSERT_EQ(children.size(), 2u);
    EXPECT_NE(children[0].action, children[1].action);
    EXPECT_EQ(children[0].visits, 1u);
    EXPECT_EQ(children[1].visits, 1u);
    EXPECT_EQ(search.node_count(), 3u);
}

TEST(MonteCarloTreeSearch, AdvanceRootKeepsSubtreeStatistics) {
    auto problem = std::make_shared<BitStringProblem>();
    MonteCarloTreeSearch<Bits, int> search(problem, Bits{}, nullptr, options_with(200, 8));
    search.search();

    std::size_t visits_of_one = 0;
    for (const auto& child : search.root_children()) {
        if (child.action == 1) visits_of_one = child.visits;
    }
    ASSERT_GT(visits_of_one, 0u);

    search.advance_root(1);
    EXPECT_EQ(search.root_state(), (Bits{1}));
    EXPECT_EQ(search.root_visits(), visits_of_one);
    EXPECT_LE(search.tree_depth(), 2u);

    search.search();
    EXPECT_EQ(*search.best_action(), 1);
}

TEST(MonteCarloTreeSearch, AdvanceIntoUnexpandedActionStartsFresh) {
    auto problem = std::make_shared<BitStringProblem>();
    MonteCarloTreeSearch<Bits, int> search(problem, Bits{}, nullptr, options_with(1, 3));
    search.search();
    ASSERT_EQ(search.root_children().size(), 1u);

    int unexpanded = search.root_children()[0].action == 0 ? 1 : 0;
    search.advance_root(unexpanded);
    EXPECT_EQ(search.root_state(), (Bits{unexpanded}));
    EXPECT_EQ(search.node_count(), 1u);
    EXPECT_EQ(search.root_visits(), 0u);
}

TEST(MonteCarloTreeSearch, TerminalRootIsStable) {
    auto problem = std::make_shared<BitStringProblem>();
    MonteCarloTreeSearch<Bits, int> search(problem, Bits{1, 1, 0}, nullptr, options_with(5, 3));
    search.search();
    EXPECT_EQ(search.node_count(), 1u);
    EXPECT_EQ(search.root_visits(), 5u);
    EXPECT_FALSE(search.best_action().has_value());
}

TEST(RolloutPolicies, GreedyPicksHighestScoreFirstOnTies) {
    GreedyRolloutPolicy<Bits, int> greedy([](const Bits&, const int& a) { return a == 2 ? 1.0 : 0.0; });
    RandomEngine rng(0);
    EXPECT_EQ(greedy.choose({}, {0, 2, 1}, rng), 1u);

    GreedyRolloutPolicy<Bits, int> flat([](const Bits&, const int&) { return 0.5; });
    EXPECT_EQ(flat.choose({}, {4, 5, 6}, rng), 0u);
}

TEST(RolloutPolicies, GreedyRolloutGuidesSearch) {
    auto problem = std::make_shared<BitStringProblem>();
    auto greedy = std::make_shared<GreedyRolloutPolicy<Bits, int>>(
        [](const Bits&, const int& a) { return static_cast<double>(a); });
    MonteCarloTreeSearch<Bits, int> search(problem, Bits{}, greedy, options_with(100, 6));
    search.search();
    EXPECT_EQ(*search.best_action(), 1);
}

TEST(RolloutPolicies, HeuristicIgnoresZeroScores) {
    HeuristicRolloutPolicy<Bits, int> heuristic([](const Bits&, const int& a) { return a == 1 ? 3.0 : 0.0; });
    RandomEngine rng(21);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(heuristic.choose({}, {0, 1}, rng), 1u);
    }
}

TEST(RolloutPolicies, InvalidConfigurationThrows) {
    auto heuristic = [](const Bits&, const int&) { return 0.0; };
    EXPECT_THROW((EpsilonGreedyRolloutPolicy<Bits, int>(heuristic, 1.5)), ConfigurationError);
    EXPECT_THROW((EpsilonGreedyRolloutPolicy<Bits, int>(heuristic, -0.1)), ConfigurationError);
    EXPECT_THROW((GreedyRolloutPolicy<Bits, int>(nullptr)), ConfigurationError);

    MctsOptions options;
    options.exploration_weight = -1.0;
    EXPECT_THROW((MonteCarloTreeSearch<Bits, int>(std::make_shared<BitStringProblem>(), Bits{}, nullptr, options)),
                 ConfigurationError);
}
