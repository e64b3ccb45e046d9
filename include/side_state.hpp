/**
 * pokesim - Side State
 *
 * One player's half of the battle: roster, active index and the
 * side-scoped field conditions (hazards, screens, tailwind).
 */

#pragma once

#include "combatant.hpp"

namespace pokesim {

constexpr int MAX_SPIKES = 3;
constexpr int MAX_TOXIC_SPIKES = 2;
constexpr int SCREEN_TURNS = 5;
constexpr int TAILWIND_TURNS = 4;

struct SideHazards {
    bool stealth_rock = false;
    int spikes = 0;          // 0-3
    int toxic_spikes = 0;    // 0-2
    bool sticky_web = false;

    bool any() const {
        return stealth_rock || spikes > 0 || toxic_spikes > 0 || sticky_web;
    }

    void clear() { *this = SideHazards{}; }
};

/**
 * SideState - Complete state for one side.
 */
struct SideState {
    SideID id = SIDE_A;
    std::string name = "Side";

    std::vector<Combatant> roster;
    int active = 0;

    SideHazards hazards;
    std::array<int, SCREEN_COUNT> screens{};   // Remaining turns, 0 = down
    int tailwind_turns = 0;

    // Global flags - persist entire battle
    bool tera_used = false;

    // Set by item/move effects mid-turn, consumed by the orchestrator
    bool pending_self_switch = false;     // Eject Button, Eject Pack, U-turn
    bool pending_forced_switch = false;   // Red Card, Roar: random replacement

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    SideState() = default;

    explicit SideState(SideID side_id) : id(side_id) {}

    // ========================================================================
    // ACCESS
    // ========================================================================

    Combatant& active_combatant() { return roster.at(static_cast<size_t>(active)); }
    const Combatant& active_combatant() const { return roster.at(static_cast<size_t>(active)); }

    bool screen_up(Screen screen) const {
        return screens[static_cast<size_t>(screen)] > 0;
    }

    bool tailwind() const { return tailwind_turns > 0; }

    /**
     * Number of non-fainted combatants.
     */
    int remaining() const {
        int count = 0;
        for (const auto& c : roster) {
            if (!c.fainted()) count++;
        }
        return count;
    }

    bool defeated() const { return remaining() == 0; }

    /**
     * Roster indices that could switch in (non-fainted, not active).
     */
    std::vector<int> switch_candidates() const {
        std::vector<int> indices;
        for (size_t i = 0; i < roster.size(); i++) {
            if (static_cast<int>(i) != active && !roster[i].fainted()) {
                indices.push_back(static_cast<int>(i));
            }
        }
        return indices;
    }
};

} // namespace pokesim
