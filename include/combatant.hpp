/**
 * pokesim - Combatant
 *
 * One battling Pokemon with mutable runtime state: HP, boosts, status,
 * volatiles, move slots with PP, held item and per-turn bookkeeping.
 */

#pragma once

#include "rule_tables.hpp"
#include <stdexcept>

namespace pokesim {

/**
 * Thrown when a state invariant is broken (HP out of range, boost outside
 * [-6, 6], PP out of range, inconsistent status counters). Indicates a
 * rule-table or engine bug, never a recoverable battle condition.
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * A known move with its remaining PP.
 */
struct MoveSlot {
    const MoveDef* move = nullptr;
    int pp = 0;
    int max_pp = 0;
    bool used_fallback = false;   // Unknown id replaced by the baseline move

    const MoveID& id() const { return move->id; }
};

/**
 * A volatile condition instance.
 *
 * `turns` counts down for timed volatiles (taunt, encore, disable,
 * partial trap, perish song) and up for confusion (turns confused).
 */
struct VolatileState {
    Volatile kind;
    int turns = 0;
    MoveID move;                  // Encore / Disable / Charging target move
    SideID source = NO_SIDE;      // Leech Seed setter, trapper
};

// ============================================================================
// STAT HELPERS
// ============================================================================

/**
 * Stage multiplier for Atk/Def/SpA/SpD/Spe: (2+s)/2 or 2/(2-s).
 */
double boost_multiplier(int stage);

/**
 * Stage multiplier for accuracy/evasion: (3+s)/3 or 3/(3-s).
 */
double accuracy_boost_multiplier(int stage);

/**
 * Standard stat formula. HP: floor((2B+IV+EV/4)*L/100)+L+10,
 * others: floor((2B+IV+EV/4)*L/100)+5.
 */
int calculate_stat(Stat stat, int base, int level, int iv = 0, int ev = 0);

// ============================================================================
// COMBATANT
// ============================================================================

struct Combatant {
    // Identity
    SpeciesID species;
    std::string name;
    int level = 100;
    bool used_fallback_species = false;

    // HP and stats
    int hp = 0;
    int max_hp = 0;
    StatBlock stats;
    std::array<int, BOOST_STAT_COUNT> boosts{};

    // Typing (replaced wholesale on Tera)
    std::vector<Type> types;
    std::vector<Type> original_types;
    std::optional<Type> tera_type;
    bool terastallized = false;

    // Ability / item ("" = none; item cleared on consumption)
    std::string ability;
    std::string item;

    std::vector<MoveSlot> moves;

    // Major status
    MajorStatus status = MajorStatus::NONE;
    int status_turns = 0;         // Sleep turns elapsed / toxic counter

    std::vector<VolatileState> volatiles;

    // Move memory
    MoveID last_move;
    MoveID choice_locked_move;

    // Per-turn bookkeeping (reset at end of turn)
    int protect_chain = 0;
    bool moved_this_turn = false;
    bool protected_this_turn = false;
    int physical_damage_taken = 0;
    int special_damage_taken = 0;
    int substitute_hp = 0;
    std::optional<Stat> paradox_stat;  // Protosynthesis / Quark Drive boosted stat
    bool faint_recorded = false;

    // ========================================================================
    // STATE QUERIES
    // ========================================================================

    bool fainted() const { return hp <= 0; }
    bool at_full_hp() const { return hp == max_hp; }
    bool has_type(Type type) const;
    bool has_status() const { return status != MajorStatus::NONE; }

    int boost(BoostStat stat) const { return boosts[static_cast<size_t>(stat)]; }

    /**
     * Raw stat (no boosts) for Atk/Def/SpA/SpD/Spe.
     */
    int stat(Stat s) const { return stats.get(s); }

    // ========================================================================
    // MUTATION
    // ========================================================================

    /**
     * Subtract HP, clamped at 0. Returns HP actually lost.
     */
    int take_damage(int amount);

    /**
     * Restore HP, clamped at max. Returns HP actually restored.
     */
    int heal(int amount);

    /**
     * Change a boost stage, clamped to [-6, 6]. Returns the applied delta.
     */
    int change_boost(BoostStat stat, int delta);
    void clear_boosts() { boosts.fill(0); }

    // ========================================================================
    // VOLATILES
    // ========================================================================

    bool has_volatile(Volatile kind) const;
    VolatileState* find_volatile(Volatile kind);
    const VolatileState* find_volatile(Volatile kind) const;

    /**
     * Add a volatile. Returns false if already present.
     */
    bool add_volatile(VolatileState state);
    bool remove_volatile(Volatile kind);

    /**
     * Clear everything that does not survive a switch out:
     * volatiles, boosts, choice lock, per-turn counters.
     */
    void on_switch_out();

    // ========================================================================
    // MOVES
    // ========================================================================

    MoveSlot* find_move(const MoveID& id);
    const MoveSlot* find_move(const MoveID& id) const;
    bool knows_move(const MoveID& id) const { return find_move(id) != nullptr; }
    bool has_usable_pp() const;

    /**
     * Replace typing with the Tera type. Returns false if already used
     * or no Tera type is set.
     */
    bool terastallize();

    /**
     * Throws InvariantViolation if any state invariant is broken.
     */
    void check_invariants() const;
};

} // namespace pokesim
