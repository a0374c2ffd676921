#include "policies/rollout.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace mcts {

namespace {

// Actions are drawn by `pick`; the terminal reward is returned.
template <typename Pick>
double playOut(const State& start, std::mt19937& rng, Pick pick) {
    if (start.isTerminal()) {
        return start.reward();
    }

    StatePtr current = start.executeAction(*pick(start, rng));
    while (!current->isTerminal()) {
        current = current->executeAction(*pick(*current, rng));
    }
    return current->reward();
}

ActionPtr pickUniform(const std::vector<ActionPtr>& actions, std::mt19937& rng) {
    std::uniform_int_distribution<size_t> dist(0, actions.size() - 1);
    return actions[dist(rng)];
}

std::vector<ActionPtr> requireActions(const State& state) {
    auto actions = state.possibleActions();
    if (actions.empty()) {
        throw std::logic_error("Non-terminal state offers no actions: " + state.toString());
    }
    return actions;
}

} // namespace

double randomRollout(const State& state, std::mt19937& rng) {
    return playOut(state, rng, [](const State& s, std::mt19937& r) {
        return pickUniform(requireActions(s), r);
    });
}

RolloutPolicy makeFilteredRollout(ActionFilter filter) {
    if (!filter) {
        throw std::invalid_argument("Filtered rollout requires a filter");
    }
    return [filter](const State& state, std::mt19937& rng) {
        return playOut(state, rng, [&filter](const State& s, std::mt19937& r) {
            auto actions = requireActions(s);
            std::vector<ActionPtr> accepted;
            for (const auto& a : actions) {
                if (filter(s, *a)) accepted.push_back(a);
            }
            return pickUniform(accepted.empty() ? actions : accepted, r);
        });
    };
}

} // namespace mcts
