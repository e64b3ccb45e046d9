/**
 * pokesim - Field Effects Engine
 *
 * Entry hazards, screens, tailwind, weather, terrain and the global rooms
 * (Trick Room, Gravity, Wonder Room, Magic Room).
 *
 * Side conditions live on SideState, global ones on FieldState.
 */

#pragma once

#include "battle_context.hpp"

namespace pokesim {

constexpr double STEALTH_ROCK_FRACTION = 0.125;
constexpr double SPIKES_FRACTION_PER_LAYER = 0.125;

// ============================================================================
// QUERIES
// ============================================================================

/**
 * Grounded: not Flying-type, no Levitate / Air Balloon, or Gravity active.
 */
bool is_grounded(const EffectView& view, const Combatant& combatant);

/**
 * Weather damage multiplier for a move type (sun: Fire 1.5 / Water 0.5).
 */
double weather_damage_modifier(const RuleTables& rules, Weather weather, Type move_type);

/**
 * Stealth Rock damage fraction for a combatant: a flat 12.5%, or
 * 12.5% x Rock effectiveness when the rule tables ask for type scaling.
 */
double stealth_rock_fraction(const RuleTables& rules, const Combatant& combatant);

// ============================================================================
// HAZARDS
// ============================================================================

/**
 * Apply the side's hazards to a combatant that just switched in.
 * Heavy-Duty Boots skip everything; Magic Guard skips the damage parts.
 */
void apply_switch_in_hazards(BattleContext& ctx, SideID side, Combatant& combatant);

/**
 * Lay one hazard (layer) on a side. FAILED at the layer cap.
 */
Outcome add_hazard(BattleContext& ctx, SideID target_side, Hazard hazard, const std::string& actor);

/**
 * Remove a side's hazards per the removal kind:
 * - DEFOG: both sides' hazards plus the target side's screens
 * - RAPID_SPIN: own hazards plus leech seed and partial trap on the user
 * - COURT_CHANGE: swap hazards, screens and tailwind between the sides
 */
void remove_hazards(BattleContext& ctx, SideID user_side, HazardRemoval removal, const std::string& actor);

// ============================================================================
// SIDE CONDITIONS
// ============================================================================

/**
 * Raise a screen for SCREEN_TURNS. Aurora Veil fails outside hail/snow.
 */
Outcome raise_screen(BattleContext& ctx, SideID side, Screen screen, const std::string& actor);

Outcome set_tailwind(BattleContext& ctx, SideID side, const std::string& actor);

// ============================================================================
// GLOBAL CONDITIONS
// ============================================================================

/**
 * Start weather. A sustained weather (from an ability) does not count
 * down while its setter stays active.
 */
Outcome set_weather(BattleContext& ctx, Weather weather, SideID setter,
                    const std::string& actor, bool sustained = false);

Outcome set_terrain(BattleContext& ctx, Terrain terrain, const std::string& actor);

/**
 * Start a room, or end it if already active (rooms toggle).
 */
Outcome toggle_room(BattleContext& ctx, Room room, const std::string& actor);

/**
 * Setter of a sustained weather left the field: the weather starts its
 * normal countdown.
 */
void release_sustained_weather(BattleContext& ctx, SideID side);

// ============================================================================
// END OF TURN
// ============================================================================

/**
 * Sandstorm / hail chip on both actives.
 */
void end_of_turn_weather(BattleContext& ctx);

/**
 * Grassy Terrain heal on grounded actives.
 */
void end_of_turn_terrain(BattleContext& ctx);

/**
 * Count down weather, terrain, rooms, screens and tailwind; log expiry.
 */
void tick_field_durations(BattleContext& ctx);

} // namespace pokesim
