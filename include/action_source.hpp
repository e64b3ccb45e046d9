/**
 * pokesim - Action Sources
 *
 * Policies that pick each side's action for a turn and its replacement
 * after a faint. The engine only ever offers legal choices; whatever a
 * source returns is validated again before it runs.
 */

#pragma once

#include "battle_state.hpp"
#include "random_source.hpp"
#include <deque>
#include <functional>

namespace pokesim {

/**
 * ActionSource - Interface for a side's decision maker.
 */
class ActionSource {
public:
    virtual ~ActionSource() = default;

    /**
     * Choose one of `legal` (never empty) for `side`.
     */
    virtual BattleAction choose_action(const BattleState& state, SideID side,
                                       const std::vector<BattleAction>& legal) = 0;

    /**
     * Choose a roster index from `candidates` (never empty) to replace a
     * fainted or ejected active. Defaults to the first candidate.
     */
    virtual int choose_replacement(const BattleState& state, SideID side,
                                   const std::vector<int>& candidates);
};

/**
 * RandomActionSource - Uniform over moves or switches.
 *
 * Picks a move with `move_bias` probability when both kinds are legal.
 */
class RandomActionSource : public ActionSource {
public:
    explicit RandomActionSource(uint64_t seed = 0, double move_bias = 0.7)
        : rng_(seed)
        , move_bias_(move_bias)
    {}

    BattleAction choose_action(const BattleState& state, SideID side,
                               const std::vector<BattleAction>& legal) override;

    int choose_replacement(const BattleState& state, SideID side,
                           const std::vector<int>& candidates) override;

private:
    Mt19937Random rng_;
    double move_bias_;
};

/**
 * FirstLegalActionSource - Always the first legal action and the first
 * replacement candidate. Deterministic without any randomness.
 */
class FirstLegalActionSource : public ActionSource {
public:
    BattleAction choose_action(const BattleState& state, SideID side,
                               const std::vector<BattleAction>& legal) override;
};

/**
 * ScriptedActionSource - Plays queued actions in order, then falls back to
 * the first legal action. Queued actions are returned even when illegal
 * so tests can exercise the engine's fallback path.
 */
class ScriptedActionSource : public ActionSource {
public:
    ScriptedActionSource() = default;
    explicit ScriptedActionSource(std::vector<BattleAction> actions,
                                  std::vector<int> replacements = {});

    void push(const BattleAction& action) { actions_.push_back(action); }
    void push_replacement(int roster_index) { replacements_.push_back(roster_index); }

    BattleAction choose_action(const BattleState& state, SideID side,
                               const std::vector<BattleAction>& legal) override;

    int choose_replacement(const BattleState& state, SideID side,
                           const std::vector<int>& candidates) override;

    size_t remaining() const { return actions_.size(); }

private:
    std::deque<BattleAction> actions_;
    std::deque<int> replacements_;
};

/**
 * CallbackActionSource - Delegates to std::function (Python bindings).
 */
class CallbackActionSource : public ActionSource {
public:
    using ActionCallback = std::function<BattleAction(const BattleState&, SideID,
                                                      const std::vector<BattleAction>&)>;
    using ReplacementCallback = std::function<int(const BattleState&, SideID,
                                                  const std::vector<int>&)>;

    explicit CallbackActionSource(ActionCallback on_action,
                                  ReplacementCallback on_replacement = nullptr)
        : on_action_(std::move(on_action))
        , on_replacement_(std::move(on_replacement))
    {}

    BattleAction choose_action(const BattleState& state, SideID side,
                               const std::vector<BattleAction>& legal) override;

    int choose_replacement(const BattleState& state, SideID side,
                           const std::vector<int>& candidates) override;

private:
    ActionCallback on_action_;
    ReplacementCallback on_replacement_;
};

} // namespace pokesim
