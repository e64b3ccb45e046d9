/**
 * pokesim - Battle Action
 *
 * Defines the BattleAction struct returned by get_legal_actions() and
 * consumed by run_turn().
 */

#pragma once

#include "types.hpp"

namespace pokesim {

/**
 * BattleAction - One side's choice for a turn.
 *
 * MOVE: `index` is the move slot (-1 = Struggle).
 * SWITCH: `index` is the roster index to bring in.
 */
struct BattleAction {
    ActionType type = ActionType::MOVE;
    SideID side = SIDE_A;
    int index = 0;
    bool terastallize = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    BattleAction() = default;

    BattleAction(ActionType action_type, SideID side_id, int idx, bool tera = false)
        : type(action_type)
        , side(side_id)
        , index(idx)
        , terastallize(tera)
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static BattleAction move(SideID side, int slot, bool tera = false) {
        return BattleAction(ActionType::MOVE, side, slot, tera);
    }

    static BattleAction struggle(SideID side) {
        return BattleAction(ActionType::MOVE, side, STRUGGLE_INDEX);
    }

    static BattleAction switch_to(SideID side, int roster_index) {
        return BattleAction(ActionType::SWITCH, side, roster_index);
    }

    static constexpr int STRUGGLE_INDEX = -1;

    bool is_move() const { return type == ActionType::MOVE; }
    bool is_switch() const { return type == ActionType::SWITCH; }
    bool is_struggle() const { return is_move() && index == STRUGGLE_INDEX; }

    // ========================================================================
    // COMPARISON
    // ========================================================================

    bool operator==(const BattleAction& other) const {
        return type == other.type && side == other.side &&
               index == other.index && terastallize == other.terastallize;
    }

    bool operator!=(const BattleAction& other) const {
        return !(*this == other);
    }

    std::string to_string() const {
        std::string s = side == SIDE_A ? "A:" : "B:";
        if (is_struggle()) return s + "struggle";
        if (is_move()) {
            s += "move(" + std::to_string(index) + ")";
            if (terastallize) s += "+tera";
            return s;
        }
        return s + "switch(" + std::to_string(index) + ")";
    }
};

} // namespace pokesim
