/**
 * pokesim - Status / Volatile Engine
 *
 * Major status transitions, volatile conditions, action-time prevention
 * checks, end-of-turn status ticks and move legality.
 *
 * Every function that can change HP or status appends to the battle log.
 */

#pragma once

#include "battle_context.hpp"

namespace pokesim {

// Status constants
constexpr double PARALYSIS_FULL_STOP_CHANCE = 0.25;
constexpr double SLEEP_WAKE_CHANCE = 0.33;
constexpr int SLEEP_MAX_TURNS = 3;
constexpr double FREEZE_THAW_CHANCE = 0.20;
constexpr double CONFUSION_SELF_HIT_CHANCE = 0.33;
constexpr int CONFUSION_MAX_TURNS = 4;
constexpr double STATUS_DAMAGE_FRACTION = 1.0 / 8.0;

// Volatile durations
constexpr int TAUNT_TURNS = 3;
constexpr int ENCORE_TURNS = 3;
constexpr int DISABLE_TURNS = 4;
constexpr int PERISH_TURNS = 3;
constexpr double LEECH_SEED_FRACTION = 1.0 / 8.0;
constexpr double PARTIAL_TRAP_FRACTION = 1.0 / 8.0;
constexpr double SUBSTITUTE_COST = 0.25;

// ============================================================================
// TRANSITIONS
// ============================================================================

/**
 * Transition table: may `from` become `to` without an explicit overwrite?
 * Any status may be cleared (to NONE); a status only lands on a clean slate.
 */
bool status_transition_allowed(MajorStatus from, MajorStatus to);

/**
 * Type immunity (Fire/burn, Electric/paralysis, Poison+Steel/poison,
 * Ice/freeze).
 */
bool is_type_immune_to_status(const Combatant& target, MajorStatus status);

/**
 * Try to inflict a major status. Checks the transition table, type and
 * terrain immunities and substitute, then logs the result.
 *
 * @param source      Name of what caused it (move or effect), for the log
 * @param overwrite   Replace an existing status instead of failing
 * @param from_foe    Inflicted by the opposing side (substitute blocks it)
 * @return APPLIED, STATUS_PREVENTED, IMMUNE or BLOCKED
 */
Outcome try_apply_status(BattleContext& ctx, SideID side, Combatant& target,
                         MajorStatus status, const std::string& source,
                         bool overwrite = false, bool from_foe = true);

/**
 * Remove the major status and its counter.
 */
void cure_status(BattleContext& ctx, SideID side, Combatant& target, const std::string& source);

/**
 * Try to add a volatile with its standard duration.
 *
 * @param move         Move the volatile refers to (encore, disable); for
 *                     perish song the counter is set on both actives by
 *                     the caller
 * @param source_side  Side that caused it (leech seed recipient)
 */
Outcome try_apply_volatile(BattleContext& ctx, SideID side, Combatant& target,
                           Volatile kind, SideID source_side,
                           const std::string& source, const MoveID& move = "");

// ============================================================================
// ACTION TIME
// ============================================================================

/**
 * Run the pre-move checks in order: freeze, sleep, flinch, confusion,
 * paralysis. Logs an ACTION_PREVENTED entry when the combatant loses its
 * action; a confusion self-hit is dealt here.
 *
 * @return true if the move is prevented
 */
bool check_action_prevention(BattleContext& ctx, SideID side, Combatant& user);

// ============================================================================
// END OF TURN
// ============================================================================

/**
 * Burn / poison 1/8, badly poisoned n/8.
 */
void end_of_turn_status(BattleContext& ctx, SideID side, Combatant& combatant);

/**
 * Leech seed drain and partial trap chip.
 */
void end_of_turn_volatiles(BattleContext& ctx, SideID side, Combatant& combatant);

/**
 * Perish counter tick; faints at 0.
 */
void end_of_turn_perish(BattleContext& ctx, SideID side, Combatant& combatant);

/**
 * Count down taunt, encore, disable and partial trap; clear flinch and
 * protect; reset per-turn bookkeeping.
 */
void tick_volatiles(BattleContext& ctx, SideID side, Combatant& combatant);

// ============================================================================
// LEGALITY
// ============================================================================

/**
 * Whether a move slot may be selected this turn (PP, taunt, encore,
 * disable, torment, imprison, Assault Vest, choice lock).
 */
bool can_use_move(const EffectView& view, const Combatant& user,
                  const Combatant* foe, const MoveSlot& slot);

/**
 * Whether the active combatant may switch out (trapped, partial trap).
 */
bool can_switch_out(const Combatant& active);

// ============================================================================
// HP AND BOOST HELPERS
// ============================================================================

/**
 * floor(max_hp * fraction), at least 1.
 */
int fraction_of_max_hp(const Combatant& combatant, double fraction);

/**
 * Indirect damage (status, weather, hazards, recoil from items). Magic
 * Guard holders take none. Logs with the given kind.
 *
 * @return HP actually lost
 */
int apply_indirect_damage(BattleContext& ctx, SideID side, Combatant& target,
                          int amount, LogKind kind, const std::string& detail);

/**
 * Heal and log a HEALED entry when anything was restored.
 */
int apply_heal(BattleContext& ctx, SideID side, Combatant& target,
               int amount, LogKind kind, const std::string& detail);

/**
 * Apply a boost change with Contrary / Clear Body handling, log it and
 * fire stat-lowered hooks.
 *
 * @param from_foe   Caused by the opponent (Clear Body blocks drops)
 * @return stage delta actually applied
 */
int apply_boost(BattleContext& ctx, SideID side, Combatant& target,
                BoostStat stat, int delta, const std::string& source,
                bool from_foe = false);

void apply_boosts(BattleContext& ctx, SideID side, Combatant& target,
                  const std::vector<BoostPair>& boosts, const std::string& source,
                  bool from_foe = false);

/**
 * Log a FAINT entry once per faint.
 *
 * @return true if the combatant is fainted
 */
bool record_faint(BattleContext& ctx, SideID side, Combatant& combatant);

} // namespace pokesim
