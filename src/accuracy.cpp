/**
 * pokesim - Accuracy Resolver Implementation
 */

#include "accuracy.hpp"
#include "battle_state.hpp"
#include <algorithm>

namespace pokesim {

std::optional<double> effective_accuracy(const MoveDef& move, const Combatant& attacker,
                                         const Combatant& defender, const FieldState& field) {
    if (move.always_hits()) {
        return std::nullopt;
    }

    double accuracy = *move.accuracy;

    // Weather overrides replace the base value (Thunder in rain, Blizzard in
    // snow). A 100% override is a sure hit that stages and paralysis can't lower.
    for (const auto& [weather, value] : move.weather_accuracy) {
        if (weather == field.weather) {
            if (value >= 100) {
                return 100.0;
            }
            accuracy = value;
            break;
        }
    }

    accuracy *= accuracy_boost_multiplier(attacker.boost(BoostStat::ACCURACY));
    accuracy /= accuracy_boost_multiplier(defender.boost(BoostStat::EVASION));

    if (field.gravity()) {
        accuracy *= GRAVITY_ACCURACY_MULTIPLIER;
    }
    if (attacker.status == MajorStatus::PARALYSIS) {
        accuracy *= PARALYSIS_ACCURACY_MULTIPLIER;
    }

    return std::clamp(accuracy, 1.0, 100.0);
}

AccuracyResult resolve_accuracy(const MoveDef& move, const Combatant& attacker,
                                const Combatant& defender, const FieldState& field,
                                RandomSource& rng) {
    AccuracyResult result;
    result.effective_accuracy = effective_accuracy(move, attacker, defender, field);
    if (!result.effective_accuracy) {
        return result;
    }

    double roll = rng.next_unit();
    result.roll = roll;
    result.hit = roll < *result.effective_accuracy / 100.0;
    return result;
}

} // namespace pokesim
