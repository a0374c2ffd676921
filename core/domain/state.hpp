#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace mcts {

// ─── Action ────────────────────────────────────────────────────
// An edge label of the decision process. Child lookup compares
// hash() before equals(), so the two must agree.

class Action {
public:
    virtual ~Action() = default;

    virtual bool equals(const Action& other) const = 0;
    virtual size_t hash() const = 0;

    /// Human-readable form, used only for logging.
    virtual std::string toString() const { return "<action>"; }
};

using ActionPtr = std::shared_ptr<const Action>;

// ─── State ─────────────────────────────────────────────────────
// The capability interface the engine needs from a domain.
// States are value-like: executeAction() returns a new state and
// never mutates the receiver.

class State {
public:
    virtual ~State() = default;

    /// Actions available here. Must be non-empty unless isTerminal().
    virtual std::vector<ActionPtr> possibleActions() const = 0;

    /// Successor state reached by taking the action.
    virtual std::unique_ptr<State> executeAction(const Action& action) const = 0;

    virtual bool isTerminal() const = 0;

    /// Reward from the perspective of the domain's fixed reward subject.
    /// Must be stable across repeated reads of a terminal state.
    virtual double reward() const = 0;

    virtual std::string toString() const { return "<state>"; }
};

using StatePtr = std::unique_ptr<State>;

// ─── ValueAction ───────────────────────────────────────────────
// Convenience action wrapping a hashable, equality-comparable value.

template <typename T>
class ValueAction : public Action {
public:
    explicit ValueAction(T value) : value_(std::move(value)) {}

    const T& value() const { return value_; }

    bool equals(const Action& other) const override {
        auto* o = dynamic_cast<const ValueAction<T>*>(&other);
        return o != nullptr && o->value_ == value_;
    }

    size_t hash() const override { return std::hash<T>{}(value_); }

    std::string toString() const override {
        std::ostringstream os;
        os << value_;
        return os.str();
    }

private:
    T value_;
};

template <typename T>
ActionPtr makeAction(T value) {
    return std::make_shared<const ValueAction<T>>(std::move(value));
}

} // namespace mcts
