/**
 * pokesim - Battle State
 *
 * The root state object for one battle: two sides, the global field and
 * the append-only log. Owned exclusively by one battle invocation.
 */

#pragma once

#include "side_state.hpp"
#include "battle_log.hpp"
#include "action.hpp"

namespace pokesim {

constexpr int WEATHER_TURNS = 5;
constexpr int TERRAIN_TURNS = 5;
constexpr int ROOM_TURNS = 5;

/**
 * FieldState - Global conditions shared by both sides.
 */
struct FieldState {
    Weather weather = Weather::NONE;
    int weather_turns = 0;
    bool weather_sustained = false;       // Set by an ability; no countdown while the setter is active
    SideID weather_setter = NO_SIDE;

    Terrain terrain = Terrain::NONE;
    int terrain_turns = 0;

    std::array<int, ROOM_COUNT> rooms{};  // Remaining turns, 0 = inactive

    bool room_active(Room room) const {
        return rooms[static_cast<size_t>(room)] > 0;
    }

    bool trick_room() const { return room_active(Room::TRICK_ROOM); }
    bool gravity() const { return room_active(Room::GRAVITY); }
    bool wonder_room() const { return room_active(Room::WONDER_ROOM); }
    bool magic_room() const { return room_active(Room::MAGIC_ROOM); }
};

/**
 * BattleState - The complete battle snapshot.
 */
struct BattleState {
    std::array<SideState, 2> sides;
    FieldState field;

    int turn = 0;
    TurnPhase phase = TurnPhase::AWAITING_ACTIONS;
    std::optional<BattleWinner> winner;
    bool started = false;                 // Leads have switched in

    // Actions chosen for the turn in progress (Sucker Punch reads the foe's)
    std::array<std::optional<BattleAction>, 2> queued_actions;

    BattleLog log;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    BattleState() {
        sides[SIDE_A] = SideState(SIDE_A);
        sides[SIDE_B] = SideState(SIDE_B);
        sides[SIDE_A].name = "A";
        sides[SIDE_B].name = "B";
    }

    // ========================================================================
    // ACCESS
    // ========================================================================

    SideState& side(SideID id) { return sides[id]; }
    const SideState& side(SideID id) const { return sides[id]; }

    SideState& foe_side(SideID id) { return sides[opponent_of(id)]; }
    const SideState& foe_side(SideID id) const { return sides[opponent_of(id)]; }

    Combatant& active(SideID id) { return sides[id].active_combatant(); }
    const Combatant& active(SideID id) const { return sides[id].active_combatant(); }

    bool is_over() const { return winner.has_value(); }

    // ========================================================================
    // LOGGING
    // ========================================================================

    LogEntry& record(SideID side_id, LogKind kind, Outcome outcome,
                     std::string actor, std::string detail = "") {
        return log.add(turn, side_id, kind, outcome, std::move(actor), std::move(detail));
    }

    /**
     * Check invariants of every combatant on both sides.
     */
    void check_invariants() const {
        for (const auto& s : sides) {
            for (const auto& c : s.roster) {
                c.check_invariants();
            }
            if (s.hazards.spikes < 0 || s.hazards.spikes > MAX_SPIKES ||
                s.hazards.toxic_spikes < 0 || s.hazards.toxic_spikes > MAX_TOXIC_SPIKES) {
                throw InvariantViolation("hazard layer count out of range on side " + s.name);
            }
        }
    }
};

} // namespace pokesim
