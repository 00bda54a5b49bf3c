#ifndef MONTECARLO_MCTS_HPP
#define MONTECARLO_MCTS_HPP

#include <montecarlo/errors.hpp>
#include <montecarlo/types.hpp>
#include <montecarlo/debug_log.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <numbers>
#include <optional>
#include <random>
#include <utility>
#include <vector>

namespace montecarlo {

/**
 * Search domain for tree search: legal moves, transitions and a terminal
 * reward. Implementations must be pure functions of their arguments.
 */
template<typename State, typename Action>
class SearchProblem {
public:
    virtual ~SearchProblem() = default;

    virtual std::vector<Action> legal_actions(const State& state) const = 0;
    virtual State apply(const State& state, const Action& action) const = 0;
    virtual bool is_terminal(const State& state) const = 0;
    // Reward of the state a rollout ends in (terminal or depth-capped)
    virtual double reward(const State& state) const = 0;
};

// Chooses the next move during simulation; actions is never empty
template<typename State, typename Action>
class RolloutPolicy {
public:
    virtual ~RolloutPolicy() = default;

    virtual std::size_t choose(const State& state, const std::vector<Action>& actions,
                               RandomEngine& rng) const = 0;
};

template<typename State, typename Action>
class RandomRolloutPolicy : public RolloutPolicy<State, Action> {
public:
    std::size_t choose(const State&, const std::vector<Action>& actions, RandomEngine& rng) const override {
        std::uniform_int_distribution<std::size_t> pick(0, actions.size() - 1);
        return pick(rng);
    }
};

template<typename State, typename Action>
using ActionHeuristic = std::function<double(const State&, const Action&)>;

// Always the highest heuristic score, first action on ties
template<typename State, typename Action>
class GreedyRolloutPolicy : public RolloutPolicy<State, Action> {
private:
    ActionHeuristic<State, Action> heuristic_;

public:
    explicit GreedyRolloutPolicy(ActionHeuristic<State, Action> heuristic) : heuristic_(std::move(heuristic)) {
        if (!heuristic_) throw ConfigurationError("greedy rollout policy needs a heuristic");
    }

    std::size_t choose(const State& state, const std::vector<Action>& actions, RandomEngine&) const override {
        std::size_t best = 0;
        double best_score = heuristic_(state, actions[0]);
        for (std::size_t i = 1; i < actions.size(); ++i) {
            double score = heuristic_(state, actions[i]);
            if (score > best_score) {
                best_score = score;
                best = i;
            }
        }
        return best;
    }
};

// Uniform random with probability epsilon, greedy otherwise
template<typename State, typename Action>
class EpsilonGreedyRolloutPolicy : public RolloutPolicy<State, Action> {
private:
    GreedyRolloutPolicy<State, Action> greedy_;
    double epsilon_;

public:
    EpsilonGreedyRolloutPolicy(ActionHeuristic<State, Action> heuristic, double epsilon)
        : greedy_(std::move(heuristic)), epsilon_(epsilon) {
        if (!(epsilon_ >= 0.0 && epsilon_ <= 1.0)) {
            throw ConfigurationError("epsilon must lie in [0, 1]");
        }
    }

    std::size_t choose(const State& state, const std::vector<Action>& actions, RandomEngine& rng) const override {
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        if (coin(rng) < epsilon_) {
            std::uniform_int_distribution<std::size_t> pick(0, actions.size() - 1);
            return pick(rng);
        }
        return greedy_.choose(state, actions, rng);
    }
};

// Random in proportion to non-negative heuristic scores; uniform if all are zero
template<typename State, typename Action>
class HeuristicRolloutPolicy : public RolloutPolicy<State, Action> {
private:
    ActionHeuristic<State, Action> heuristic_;

public:
    explicit HeuristicRolloutPolicy(ActionHeuristic<State, Action> heuristic) : heuristic_(std::move(heuristic)) {
        if (!heuristic_) throw ConfigurationError("heuristic rollout policy needs a heuristic");
    }

    std::size_t choose(const State& state, const std::vector<Action>& actions, RandomEngine& rng) const override {
        std::vector<double> scores;
        scores.reserve(actions.size());
        double total = 0.0;
        for (const auto& action : actions) {
            double s = heuristic_(state, action);
            s = std::isfinite(s) && s > 0.0 ? s : 0.0;
            scores.push_back(s);
            total += s;
        }
        if (total <= 0.0) {
            std::uniform_int_distribution<std::size_t> pick(0, actions.size() - 1);
            return pick(rng);
        }
        std::discrete_distribution<std::size_t> pick(scores.begin(), scores.end());
        return pick(rng);
    }
};

struct MctsOptions {
    double exploration_weight = std::numbers::sqrt2;
    std::size_t max_iterations = 1000;
    std::size_t max_depth = 50;  // Tree plus rollout depth, counted from the root
    std::uint64_t seed = std::random_device{}();
};

/**
 * Monte Carlo tree search with UCB1 selection.
 *
 * Nodes live in an arena and refer to each other by index. Each iteration
 * selects down fully expanded nodes, expands one untried action, runs a
 * rollout with the configured policy and backs the reward up to the root.
 */
template<typename State, typename Action>
class MonteCarloTreeSearch {
public:
    struct ChildStatistics {
        Action action;
        std::size_t visits;
        double mean_reward;
    };

private:
    static constexpr std::size_t NO_NODE = std::numeric_limits<std::size_t>::max();

    struct Node {
        State state;
        std::optional<Action> action;  // Move that led here; empty for the root
        std::size_t parent = NO_NODE;
        std::vector<std::size_t> children;  // Creation order == first-visit order
        std::vector<Action> untried;
        std::size_t visits = 0;
        double total_reward = 0.0;
        std::size_t depth = 0;
        bool terminal = false;

        double mean_reward() const { return visits > 0 ? total_reward / static_cast<double>(visits) : 0.0; }
    };

    std::shared_ptr<const SearchProblem<State, Action>> problem_;
    std::shared_ptr<const RolloutPolicy<State, Action>> rollout_policy_;
    MctsOptions options_;
    RandomEngine rng_;
    std::vector<Node> nodes_;
    std::size_t root_ = 0;
    std::size_t iterations_run_ = 0;

    std::size_t add_node(State state, std::optional<Action> action, std::size_t parent, std::size_t depth) {
        bool terminal = problem_->is_terminal(state);
        std::vector<Action> untried;
        if (!terminal && depth < options_.max_depth) {
            untried = problem_->legal_actions(state);
        }
        nodes_.push_back(Node{std::move(state), std::move(action), parent, {}, std::move(untried),
                              0, 0.0, depth, terminal});
        return nodes_.size() - 1;
    }

    double ucb1(const Node& child, std::size_t parent_visits) const {
        if (child.visits == 0) {
            return std::numeric_limits<double>::infinity();
        }
        return child.mean_reward() +
               options_.exploration_weight *
                   std::sqrt(std::log(static_cast<double>(parent_visits)) / static_cast<double>(child.visits));
    }

    std::size_t select(std::size_t node_index) const {
        while (true) {
            const Node& node = nodes_[node_index];
            if (node.terminal || !node.untried.empty() || node.children.empty()) {
                return node_index;
            }
            std::size_t best = node.children.front();
            double best_score = ucb1(nodes_[best], node.visits);
            for (std::size_t i = 1; i < node.children.size(); ++i) {
                double score = ucb1(nodes_[node.children[i]], node.visits);
                if (score > best_score) {
                    best_score = score;
                    best = node.children[i];
                }
            }
            node_index = best;
        }
    }

    std::size_t expand(std::size_t node_index) {
        if (nodes_[node_index].untried.empty()) {
            return node_index;
        }
        auto& untried = nodes_[node_index].untried;
        std::uniform_int_distribution<std::size_t> pick(0, untried.size() - 1);
        std::size_t choice = pick(rng_);
        Action action = untried[choice];
        untried.erase(untried.begin() + static_cast<std::ptrdiff_t>(choice));

        State next = problem_->apply(nodes_[node_index].state, action);
        std::size_t depth = nodes_[node_index].depth + 1;
        std::size_t child = add_node(std::move(next), action, node_index, depth);
        nodes_[node_index].children.push_back(child);
        return child;
    }

    double simulate(std::size_t node_index) {
        State state = nodes_[node_index].state;
        std::size_t depth = nodes_[node_index].depth;
        while (depth < options_.max_depth && !problem_->is_terminal(state)) {
            auto actions = problem_->legal_actions(state);
            if (actions.empty()) break;
            std::size_t choice = rollout_policy_->choose(state, actions, rng_);
            state = problem_->apply(state, actions.at(choice));
            ++depth;
        }
        return problem_->reward(state);
    }

    void backpropagate(std::size_t node_index, double reward) {
        while (node_index != NO_NODE) {
            Node& node = nodes_[node_index];
            node.visits += 1;
            node.total_reward += reward;
            if (node_index == root_) break;
            node_index = node.parent;
        }
    }

    // Rebuild the arena with new_root's subtree only, depths relative to it
    void compact_from(std::size_t new_root) {
        std::vector<Node> compacted;
        std::vector<std::pair<std::size_t, std::size_t>> queue{{new_root, NO_NODE}};
        std::size_t head = 0;
        while (head < queue.size()) {
            auto [old_index, new_parent] = queue[head++];
            Node node = nodes_[old_index];
            node.parent = new_parent;
            node.depth = new_parent == NO_NODE ? 0 : compacted[new_parent].depth + 1;
            auto old_children = std::move(node.children);
            node.children.clear();
            std::size_t new_index = compacted.size();
            compacted.push_back(std::move(node));
            if (new_parent != NO_NODE) {
                compacted[new_parent].children.push_back(new_index);
            }
            for (std::size_t c : old_children) {
                queue.emplace_back(c, new_index);
            }
        }
        nodes_ = std::move(compacted);
        root_ = 0;
    }

public:
    MonteCarloTreeSearch(std::shared_ptr<const SearchProblem<State, Action>> problem, State root_state,
                         std::shared_ptr<const RolloutPolicy<State, Action>> rollout_policy = nullptr,
                         const MctsOptions& options = {})
        : problem_(std::move(problem)),
          rollout_policy_(std::move(rollout_policy)),
          options_(options),
          rng_(options.seed) {
        if (!problem_) {
            throw ConfigurationError("tree search needs a problem definition");
        }
        if (!(options_.exploration_weight >= 0.0) || std::isinf(options_.exploration_weight)) {
            throw ConfigurationError("exploration weight must be finite and non-negative");
        }
        if (!rollout_policy_) {
            rollout_policy_ = std::make_shared<RandomRolloutPolicy<State, Action>>();
        }
        add_node(std::move(root_state), std::nullopt, NO_NODE, 0);
    }

    void run_iteration() {
        std::size_t leaf = select(root_);
        std::size_t node = expand(leaf);
        double reward = simulate(node);
        backpropagate(node, reward);
        ++iterations_run_;
    }

    // Runs max_iterations iterations; returns the number run
    std::size_t search() {
        for (std::size_t i = 0; i < options_.max_iterations; ++i) {
            run_iteration();
        }
        MONTECARLO_DEBUG_LOG("mcts: %zu iterations, %zu nodes, root visits %zu",
                             options_.max_iterations, nodes_.size(), nodes_[root_].visits);
        return options_.max_iterations;
    }

    /**
     * Root child with the highest mean reward, first-created child on ties.
     * @return nullopt if the root has not been expanded
     */
    std::optional<Action> best_action() const {
        const Node& root = nodes_[root_];
        if (root.children.empty()) return std::nullopt;
        std::size_t best = root.children.front();
        for (std::size_t c : root.children) {
            if (nodes_[c].mean_reward() > nodes_[best].mean_reward()) best = c;
        }
        return nodes_[best].action;
    }

    std::optional<Action> most_visited_action() const {
        const Node& root = nodes_[root_];
        if (root.children.empty()) return std::nullopt;
        std::size_t best = root.children.front();
        for (std::size_t c : root.children) {
            if (nodes_[c].visits > nodes_[best].visits) best = c;
        }
        return nodes_[best].action;
    }

    /**
     * Make the child reached by action the new root, keeping its statistics.
     * An action that was never expanded starts a fresh tree.
     */
    void advance_root(const Action& action) {
        for (std::size_t c : nodes_[root_].children) {
            if (nodes_[c].action && *nodes_[c].action == action) {
                compact_from(c);
                nodes_[root_].action.reset();
                return;
            }
        }
        State next = problem_->apply(nodes_[root_].state, action);
        nodes_.clear();
        root_ = 0;
        add_node(std::move(next), std::nullopt, NO_NODE, 0);
    }

    std::vector<ChildStatistics> root_children() const {
        std::vector<ChildStatistics> stats;
        for (std::size_t c : nodes_[root_].children) {
            stats.push_back(ChildStatistics{*nodes_[c].action, nodes_[c].visits, nodes_[c].mean_reward()});
        }
        return stats;
    }

    const State& root_state() const { return nodes_[root_].state; }
    std::size_t root_visits() const { return nodes_[root_].visits; }
    std::size_t node_count() const { return nodes_.size(); }
    std::size_t iterations_run() const { return iterations_run_; }

    std::size_t tree_depth() const {
        std::size_t deepest = 0;
        for (const auto& node : nodes_) {
            deepest = std::max(deepest, node.depth);
        }
        return deepest;
    }
};

} // namespace montecarlo

#endif // MONTECARLO_MCTS_HPP
