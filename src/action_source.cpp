/**
 * pokesim - Action Sources Implementation
 */

#include "action_source.hpp"

namespace pokesim {

// ============================================================================
// DEFAULT REPLACEMENT
// ============================================================================

int ActionSource::choose_replacement(const BattleState& /*state*/, SideID /*side*/,
                                     const std::vector<int>& candidates) {
    return candidates.front();
}

// ============================================================================
// RANDOM
// ============================================================================

BattleAction RandomActionSource::choose_action(const BattleState& /*state*/, SideID /*side*/,
                                               const std::vector<BattleAction>& legal) {
    std::vector<const BattleAction*> moves;
    std::vector<const BattleAction*> switches;
    for (const auto& action : legal) {
        (action.is_move() ? moves : switches).push_back(&action);
    }

    const std::vector<const BattleAction*>* pool = &moves;
    if (moves.empty()) {
        pool = &switches;
    } else if (!switches.empty() && !rng_.chance(move_bias_)) {
        pool = &switches;
    }

    int pick = rng_.next_int(0, static_cast<int>(pool->size()) - 1);
    return *(*pool)[static_cast<size_t>(pick)];
}

int RandomActionSource::choose_replacement(const BattleState& /*state*/, SideID /*side*/,
                                           const std::vector<int>& candidates) {
    int pick = rng_.next_int(0, static_cast<int>(candidates.size()) - 1);
    return candidates[static_cast<size_t>(pick)];
}

// ============================================================================
// FIRST LEGAL
// ============================================================================

BattleAction FirstLegalActionSource::choose_action(const BattleState& /*state*/, SideID /*side*/,
                                                   const std::vector<BattleAction>& legal) {
    return legal.front();
}

// ============================================================================
// SCRIPTED
// ============================================================================

ScriptedActionSource::ScriptedActionSource(std::vector<BattleAction> actions,
                                           std::vector<int> replacements)
    : actions_(actions.begin(), actions.end())
    , replacements_(replacements.begin(), replacements.end())
{}

BattleAction ScriptedActionSource::choose_action(const BattleState& /*state*/, SideID side,
                                                 const std::vector<BattleAction>& legal) {
    if (actions_.empty()) {
        return legal.front();
    }
    BattleAction action = actions_.front();
    actions_.pop_front();
    action.side = side;
    return action;
}

int ScriptedActionSource::choose_replacement(const BattleState& state, SideID side,
                                             const std::vector<int>& candidates) {
    if (replacements_.empty()) {
        return ActionSource::choose_replacement(state, side, candidates);
    }
    int index = replacements_.front();
    replacements_.pop_front();
    return index;
}

// ============================================================================
// CALLBACK
// ============================================================================

BattleAction CallbackActionSource::choose_action(const BattleState& state, SideID side,
                                                 const std::vector<BattleAction>& legal) {
    if (!on_action_) {
        return legal.front();
    }
    return on_action_(state, side, legal);
}

int CallbackActionSource::choose_replacement(const BattleState& state, SideID side,
                                             const std::vector<int>& candidates) {
    if (!on_replacement_) {
        return ActionSource::choose_replacement(state, side, candidates);
    }
    return on_replacement_(state, side, candidates);
}

} // namespace pokesim
