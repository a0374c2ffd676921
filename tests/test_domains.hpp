#pragma once

// Small domains used by the test suite.

#include "domain/state.hpp"

#include <array>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcts {
namespace fixtures {

inline int actionValue(const Action& action) {
    return dynamic_cast<const ValueAction<int>&>(action).value();
}

inline int actionValue(const ActionPtr& action) {
    return actionValue(*action);
}

// ─── ArmState ──────────────────────────────────────────────────
// One decision: action i leads to a terminal state paying rewards[i].

class ArmState : public State {
public:
    explicit ArmState(std::vector<double> rewards, int chosen = -1)
        : rewards_(std::move(rewards)), chosen_(chosen) {}

    std::vector<ActionPtr> possibleActions() const override {
        std::vector<ActionPtr> actions;
        if (isTerminal()) return actions;
        for (int i = 0; i < static_cast<int>(rewards_.size()); i++) {
            actions.push_back(makeAction(i));
        }
        return actions;
    }

    StatePtr executeAction(const Action& action) const override {
        return std::make_unique<ArmState>(rewards_, actionValue(action));
    }

    bool isTerminal() const override { return chosen_ >= 0; }
    double reward() const override { return isTerminal() ? rewards_[chosen_] : 0.0; }
    int chosen() const { return chosen_; }

private:
    std::vector<double> rewards_;
    int chosen_;
};

// ─── PathState ─────────────────────────────────────────────────
// `depth` moves, each picking a value in [0, width). The terminal
// reward is the mean picked value scaled to [0, 1], so the all-max
// path is the unique optimum.

class PathState : public State {
public:
    explicit PathState(int depth, int width = 2) : depth_(depth), width_(width) {}

    std::vector<ActionPtr> possibleActions() const override {
        std::vector<ActionPtr> actions;
        for (int i = 0; i < width_; i++) {
            actions.push_back(makeAction(i));
        }
        return actions;
    }

    StatePtr executeAction(const Action& action) const override {
        auto next = std::make_unique<PathState>(*this);
        next->moves_.push_back(actionValue(action));
        return next;
    }

    bool isTerminal() const override { return static_cast<int>(moves_.size()) >= depth_; }

    double reward() const override {
        double sum = 0.0;
        for (int m : moves_) sum += m;
        return sum / (depth_ * (width_ - 1));
    }

    const std::vector<int>& moves() const { return moves_; }

private:
    int depth_;
    int width_;
    std::vector<int> moves_;
};

// ─── TicTacToeState ────────────────────────────────────────────
// Cells 0..8, X moves first. Reward for `reward_player`
// (1 = X, 2 = O): 1 win, 0.5 draw, 0 loss.

class TicTacToeState : public State {
public:
    explicit TicTacToeState(int reward_player = 1) : reward_player_(reward_player) {
        board_.fill(0);
    }

    std::vector<ActionPtr> possibleActions() const override {
        std::vector<ActionPtr> actions;
        if (isTerminal()) return actions;
        for (int i = 0; i < 9; i++) {
            if (board_[i] == 0) actions.push_back(makeAction(i));
        }
        return actions;
    }

    StatePtr executeAction(const Action& action) const override {
        int cell = actionValue(action);
        if (cell < 0 || cell > 8 || board_[cell] != 0) {
            throw std::invalid_argument("Illegal move: " + std::to_string(cell));
        }
        auto next = std::make_unique<TicTacToeState>(*this);
        next->board_[cell] = to_move_;
        next->to_move_ = 3 - to_move_;
        return next;
    }

    bool isTerminal() const override {
        if (winner() != 0) return true;
        for (int c : board_) {
            if (c == 0) return false;
        }
        return true;
    }

    double reward() const override {
        int w = winner();
        if (w == 0) return 0.5;
        return w == reward_player_ ? 1.0 : 0.0;
    }

    int winner() const {
        static const int lines[8][3] = {
            {0, 1, 2}, {3, 4, 5}, {6, 7, 8},
            {0, 3, 6}, {1, 4, 7}, {2, 5, 8},
            {0, 4, 8}, {2, 4, 6}
        };
        for (const auto& l : lines) {
            if (board_[l[0]] != 0 && board_[l[0]] == board_[l[1]] &&
                board_[l[1]] == board_[l[2]]) {
                return board_[l[0]];
            }
        }
        return 0;
    }

    /// Place a stone for the side to move, in place.
    TicTacToeState& play(int cell) {
        board_[cell] = to_move_;
        to_move_ = 3 - to_move_;
        return *this;
    }

    const std::array<int, 9>& board() const { return board_; }

private:
    std::array<int, 9> board_;
    int to_move_ = 1;
    int reward_player_;
};

// ─── Faulty domains ────────────────────────────────────────────

/// Non-terminal state whose successor function always throws.
class ThrowingState : public State {
public:
    std::vector<ActionPtr> possibleActions() const override { return {makeAction(0)}; }
    StatePtr executeAction(const Action&) const override {
        throw std::runtime_error("domain failure");
    }
    bool isTerminal() const override { return false; }
    double reward() const override { return 0.0; }
};

/// Violates the contract: not terminal, yet no actions.
class StuckState : public State {
public:
    std::vector<ActionPtr> possibleActions() const override { return {}; }
    StatePtr executeAction(const Action&) const override { return std::make_unique<StuckState>(); }
    bool isTerminal() const override { return false; }
    double reward() const override { return 0.0; }
};

} // namespace fixtures
} // namespace mcts
