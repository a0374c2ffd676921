#pragma once

#include "domain/state.hpp"

#include <functional>
#include <random>

namespace mcts {

/// Default playout: pick actions uniformly at random until a terminal
/// state is reached and return that state's reward. The start state is
/// left untouched.
double randomRollout(const State& state, std::mt19937& rng);

using RolloutPolicy = std::function<double(const State&, std::mt19937&)>;

/// Predicate over (state, action) used to bias a playout.
using ActionFilter = std::function<bool(const State&, const Action&)>;

/// Playout that draws uniformly among the actions accepted by `filter`,
/// falling back to every available action when none is accepted.
RolloutPolicy makeFilteredRollout(ActionFilter filter);

} // namespace mcts
