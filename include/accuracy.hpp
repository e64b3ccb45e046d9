/**
 * pokesim - Accuracy Resolver
 *
 * Effective accuracy from the move, boosts, weather, Gravity and
 * paralysis, then one draw against it.
 */

#pragma once

#include "combatant.hpp"
#include "random_source.hpp"

namespace pokesim {

struct FieldState;

constexpr double GRAVITY_ACCURACY_MULTIPLIER = 5.0 / 3.0;
constexpr double PARALYSIS_ACCURACY_MULTIPLIER = 0.8;

/**
 * AccuracyResult - Outcome of an accuracy check.
 */
struct AccuracyResult {
    bool hit = true;
    std::optional<double> roll;              // Absent for always-hit moves
    std::optional<double> effective_accuracy;  // Percent, absent for always-hit moves
};

/**
 * Effective accuracy in percent, clamped to [1, 100]; nullopt when the
 * move always hits.
 */
std::optional<double> effective_accuracy(const MoveDef& move, const Combatant& attacker,
                                         const Combatant& defender, const FieldState& field);

/**
 * Draw u in [0, 1) and hit iff u < accuracy / 100. Always-hit moves
 * consume no draw.
 */
AccuracyResult resolve_accuracy(const MoveDef& move, const Combatant& attacker,
                                const Combatant& defender, const FieldState& field,
                                RandomSource& rng);

} // namespace pokesim
