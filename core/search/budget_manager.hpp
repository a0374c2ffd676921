#pragma once

#include <chrono>
#include <functional>

namespace mcts {

/// Manages the computational budget of one search.
/// Tracks the round count, an optional wall-clock deadline and an
/// optional cancel predicate, all checked between rounds.
class BudgetManager {
public:
    using CancelFn = std::function<bool()>;

    /// max_seconds <= 0 disables the deadline.
    BudgetManager(int max_rounds, double max_seconds, CancelFn cancel = nullptr)
        : max_rounds_(max_rounds), max_seconds_(max_seconds), cancel_(std::move(cancel)) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        rounds_ = 0;
        interrupted_ = false;
    }

    void recordRound() { rounds_++; }

    bool canContinue() {
        if (rounds_ >= max_rounds_) return false;
        if (isTimeExhausted() || (cancel_ && cancel_())) {
            interrupted_ = true;
            return false;
        }
        return true;
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int rounds() const { return rounds_; }
    bool isTimeExhausted() const { return max_seconds_ > 0.0 && elapsedSeconds() >= max_seconds_; }
    bool isRoundExhausted() const { return rounds_ >= max_rounds_; }

    /// True once the deadline or the cancel hook stopped the search.
    bool wasInterrupted() const { return interrupted_; }

private:
    int max_rounds_;
    double max_seconds_;
    CancelFn cancel_;
    int rounds_ = 0;
    bool interrupted_ = false;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace mcts
