/**
 * pokesim - Damage Calculator Implementation
 */

#include "damage_calculator.hpp"
#include "battle_state.hpp"
#include "field_effects.hpp"
#include <algorithm>
#include <cmath>

namespace pokesim {

namespace {

double terrain_modifier(const DamageQuery& q, Type move_type) {
    const FieldState& field = q.view.field();
    if (field.terrain == Terrain::NONE) {
        return 1.0;
    }

    const TerrainDef& terrain = q.view.rules().get_terrain(field.terrain);
    double modifier = 1.0;

    if (terrain.boosted_type != Type::TYPELESS && move_type == terrain.boosted_type &&
        is_grounded(q.view, q.attacker)) {
        modifier *= terrain.boost;
    }
    if (terrain.weakened_type != Type::TYPELESS && move_type == terrain.weakened_type &&
        is_grounded(q.view, q.defender)) {
        modifier *= terrain.weaken;
    }
    if (field.terrain == Terrain::GRASSY && q.move.flags.grassy_halved &&
        is_grounded(q.view, q.defender)) {
        modifier *= 0.5;
    }
    return modifier;
}

double screen_modifier(const DamageQuery& q) {
    if (q.view.ability_has(q.attacker, EffectHandler::INFILTRATES)) {
        return 1.0;
    }

    bool physical = q.move.category == MoveCategory::PHYSICAL;
    double modifier = 1.0;
    if (physical && q.defender_side.screen_up(Screen::REFLECT)) modifier *= SCREEN_MULTIPLIER;
    if (!physical && q.defender_side.screen_up(Screen::LIGHT_SCREEN)) modifier *= SCREEN_MULTIPLIER;
    if (q.defender_side.screen_up(Screen::AURORA_VEIL)) modifier *= SCREEN_MULTIPLIER;
    return modifier;
}

} // anonymous namespace

// ============================================================================
// TYPE RESOLUTION
// ============================================================================

Type resolve_move_type(const Combatant& attacker, const Combatant* defender,
                       const MoveDef& move, const EffectView& view) {
    if (move.type == Type::TYPELESS) {
        return Type::TYPELESS;
    }

    BoundEffect ability = view.ability(attacker);
    if (ability && ability.handler->move_type) {
        ModifierContext ctx{attacker, defender, &move, move.type, view.field(), *ability.def};
        if (auto changed = ability.handler->move_type(ctx)) {
            return *changed;
        }
    }
    return move.type;
}

double compute_effectiveness(const Combatant& attacker, const Combatant& defender,
                             Type move_type, const EffectView& view) {
    if (move_type == Type::TYPELESS) {
        return 1.0;
    }

    const TypeChart& chart = view.rules().type_chart();
    bool gravity = view.field().gravity();

    double effectiveness = 1.0;
    for (Type defend : defender.types) {
        if (gravity && move_type == Type::GROUND && defend == Type::FLYING) {
            continue;
        }
        effectiveness *= chart.effectiveness(move_type, defend);
    }

    if (move_type == Type::GROUND && !gravity) {
        if (view.target_ability(attacker, defender).has(EffectHandler::LEVITATES) ||
            view.item_has(defender, EffectHandler::LEVITATES)) {
            effectiveness = 0.0;
        }
    }
    return effectiveness;
}

double stab_multiplier(const Combatant& attacker, Type move_type) {
    if (move_type == Type::TYPELESS) {
        return 1.0;
    }

    bool original_match = std::find(attacker.original_types.begin(), attacker.original_types.end(),
                                    move_type) != attacker.original_types.end();

    if (attacker.terastallized && attacker.tera_type.has_value()) {
        if (*attacker.tera_type == move_type) {
            return original_match ? TERA_STAB_MULTIPLIER : STAB_MULTIPLIER;
        }
        return original_match ? STAB_MULTIPLIER : 1.0;
    }
    return attacker.has_type(move_type) ? STAB_MULTIPLIER : 1.0;
}

double critical_hit_chance(const MoveDef& move) {
    return move.flags.high_crit ? HIGH_CRIT_CHANCE : CRIT_CHANCE;
}

// ============================================================================
// DAMAGE
// ============================================================================

DamageResult compute_damage(const DamageQuery& q, bool critical, double roll) {
    DamageResult result;
    const Combatant& attacker = q.attacker;
    const Combatant& defender = q.defender;
    const MoveDef& move = q.move;
    const FieldState& field = q.view.field();

    result.move_type = resolve_move_type(attacker, &defender, move, q.view);
    if (move.is_status() || move.power <= 0) {
        return result;
    }

    result.effectiveness = compute_effectiveness(attacker, defender, result.move_type, q.view);
    if (result.effectiveness == 0.0) {
        result.immune = true;
        return result;
    }
    result.critical_hit = critical;

    // 1. Attack and defense
    bool physical = move.category == MoveCategory::PHYSICAL;
    Stat attack_stat = physical ? Stat::ATK : Stat::SPA;
    Stat defense_stat = physical ? Stat::DEF : Stat::SPD;
    BoostStat attack_boost = physical ? BoostStat::ATK : BoostStat::SPA;
    BoostStat defense_boost = physical ? BoostStat::DEF : BoostStat::SPD;

    bool defender_unaware = q.view.target_ability(attacker, defender).has(EffectHandler::IGNORES_BOOSTS);
    bool attacker_unaware = q.view.ability_has(attacker, EffectHandler::IGNORES_BOOSTS);

    double attack = attacker.stat(attack_stat);
    if (!defender_unaware) {
        attack *= boost_multiplier(attacker.boost(attack_boost));
    }
    attack = q.view.modify(&EffectHandler::attack_stat, attacker, &defender, &move,
                           result.move_type, attack);

    // Wonder Room swaps the raw defensive stats, not the boosts
    Stat raw_defense = defense_stat;
    if (field.wonder_room()) {
        raw_defense = physical ? Stat::SPD : Stat::DEF;
    }
    double defense = defender.stat(raw_defense);
    if (!attacker_unaware) {
        defense *= boost_multiplier(defender.boost(defense_boost));
    }

    const WeatherDef& weather = q.view.rules().get_weather(field.weather);
    if (weather.defense_boost_type != Type::TYPELESS && weather.defense_boost_stat == defense_stat &&
        defender.has_type(weather.defense_boost_type)) {
        defense *= weather.defense_boost;
    }
    defense = q.view.modify_target(&EffectHandler::defense_stat, attacker, defender, &move,
                                   result.move_type, defense);
    defense = std::max(1.0, defense);

    // 2. Level factor, 4. critical hit
    double level_factor = (2.0 * attacker.level + 10.0) / 250.0;
    if (critical) {
        level_factor *= 2.0;
    }

    double base = level_factor * attack * move.power / defense + 2.0;

    // 3. Effectiveness, 5. STAB, 6. weather and terrain, 7. screens
    double modifier = result.effectiveness;
    modifier *= stab_multiplier(attacker, result.move_type);
    modifier *= weather_damage_modifier(q.view.rules(), field.weather, result.move_type);
    modifier *= terrain_modifier(q, result.move_type);
    modifier *= screen_modifier(q);

    // 8. Ability / item power modifiers
    modifier = q.view.modify(&EffectHandler::power, attacker, &defender, &move,
                             result.move_type, modifier);

    // 9. Random roll, 10. burn
    modifier *= roll;
    if (physical && attacker.status == MajorStatus::BURN) {
        modifier *= BURN_MULTIPLIER;
    }

    result.damage = std::max(1, floor_amount(base * modifier));
    return result;
}

DamageResult calculate_damage(const DamageQuery& query, RandomSource& rng) {
    if (query.move.is_status() || query.move.power <= 0) {
        return compute_damage(query, false, 1.0);
    }

    Type move_type = resolve_move_type(query.attacker, &query.defender, query.move, query.view);
    if (compute_effectiveness(query.attacker, query.defender, move_type, query.view) == 0.0) {
        return compute_damage(query, false, 1.0);
    }

    bool critical = rng.chance(critical_hit_chance(query.move));
    double roll = draw_damage_roll(rng);
    return compute_damage(query, critical, roll);
}

int floor_amount(double value) {
    return static_cast<int>(std::floor(value + FLOOR_EPSILON));
}

double draw_damage_roll(RandomSource& rng) {
    return rng.next_int(MIN_DAMAGE_ROLL, MAX_DAMAGE_ROLL) / 100.0;
}

} // namespace pokesim
