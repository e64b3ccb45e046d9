/**
 * pokesim - Damage Calculator
 *
 * Pure computation of move damage from attacker, defender, move and field.
 * The only randomness is the critical-hit draw and the damage roll, taken
 * in that order by calculate_damage(); compute_damage() takes both as
 * arguments and is fully deterministic.
 */

#pragma once

#include "side_state.hpp"
#include "effect_registry.hpp"
#include "random_source.hpp"

namespace pokesim {

struct FieldState;

constexpr double CRIT_CHANCE = 1.0 / 16.0;
constexpr double HIGH_CRIT_CHANCE = 1.0 / 8.0;
constexpr int MIN_DAMAGE_ROLL = 85;
constexpr int MAX_DAMAGE_ROLL = 100;
constexpr double STAB_MULTIPLIER = 1.5;
constexpr double TERA_STAB_MULTIPLIER = 2.0;
constexpr double SCREEN_MULTIPLIER = 0.5;
constexpr double BURN_MULTIPLIER = 0.5;

// Absorbs binary rounding so an exact product like 44 never floors to 43
constexpr double FLOOR_EPSILON = 1e-9;

/**
 * Floor a damage or HP amount computed in double precision.
 */
int floor_amount(double value);

/**
 * Inputs for one damage calculation.
 */
struct DamageQuery {
    const Combatant& attacker;
    const Combatant& defender;
    const SideState& defender_side;
    const MoveDef& move;
    const EffectView& view;
};

/**
 * DamageResult - Outcome of one hit.
 */
struct DamageResult {
    int damage = 0;
    bool critical_hit = false;
    double effectiveness = 1.0;
    Type move_type = Type::TYPELESS;
    bool immune = false;              // Effectiveness 0 (type or Levitate)
};

/**
 * Effective move type after type-changing abilities (-ate).
 */
Type resolve_move_type(const Combatant& attacker, const Combatant* defender,
                       const MoveDef& move, const EffectView& view);

/**
 * Type effectiveness of a move type against a defender, including
 * Gravity (Ground hits Flying) and Levitate / Air Balloon (Ground immunity).
 */
double compute_effectiveness(const Combatant& attacker, const Combatant& defender,
                             Type move_type, const EffectView& view);

/**
 * STAB multiplier: 1.5 for a matching current or (after Tera) original
 * type, 2.0 when the Tera type matches an original type.
 */
double stab_multiplier(const Combatant& attacker, Type move_type);

/**
 * Critical-hit probability for a move.
 */
double critical_hit_chance(const MoveDef& move);

/**
 * Deterministic damage.
 *
 * @param critical  Critical hit (doubles the level factor)
 * @param roll      Damage roll in [0.85, 1.00]
 */
DamageResult compute_damage(const DamageQuery& query, bool critical, double roll);

/**
 * Draw the critical hit, then the roll, then compute.
 */
DamageResult calculate_damage(const DamageQuery& query, RandomSource& rng);

/**
 * Damage roll draw: integer percent 85..100 as a fraction.
 */
double draw_damage_roll(RandomSource& rng);

} // namespace pokesim
