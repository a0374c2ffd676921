#pragma once

#include "tree/node.hpp"

#include <functional>

namespace mcts {

/// Add one visit and `reward` to `node` and every ancestor up to the root.
/// The reward is not negated between levels: it is always measured for the
/// domain's fixed reward subject. Adversarial domains must encode the
/// perspective in State::reward().
void backpropagate(Node* node, double reward);

using BackpropagatePolicy = std::function<void(Node*, double)>;

} // namespace mcts
