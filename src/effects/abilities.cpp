/**
 * pokesim - Ability Effects
 *
 * Handlers for the ability effect functions named by the rule tables.
 * Effects that take a parameter (absorb type, weather, terrain) read it
 * from the table entry's params, so one handler serves several abilities:
 *
 *   "volt_absorb":  {"effect": "absorb_heal",    "params": {"type": "electric"}}
 *   "drought":      {"effect": "weather_setter", "params": {"weather": "sun"}}
 */

#include "effects/effect_catalog.hpp"
#include "battle_context.hpp"
#include "field_effects.hpp"
#include "status_engine.hpp"
#include <initializer_list>

namespace pokesim {
namespace effects {

namespace {

void announce(HookContext& ctx, Outcome outcome, const std::string& detail = "") {
    ctx.battle.state.record(ctx.side, LogKind::ABILITY_TRIGGER, outcome, ctx.holder.name,
                            detail.empty() ? ctx.def.name : ctx.def.name + " " + detail);
}

bool physical(const ModifierContext& ctx) {
    return ctx.move && ctx.move->category == MoveCategory::PHYSICAL;
}

/**
 * Paradox boost on/off check against the ability's condition.
 */
void refresh_paradox(HookContext& ctx) {
    const FieldState& field = ctx.battle.state.field;
    Weather weather = RuleTables::parse_weather(ctx.def.param("weather"));
    Terrain terrain = RuleTables::parse_terrain(ctx.def.param("terrain"));

    bool condition = (weather != Weather::NONE && field.weather == weather) ||
                     (terrain != Terrain::NONE && field.terrain == terrain);

    const VolatileState* boost = ctx.holder.find_volatile(Volatile::PARADOX_BOOST);
    if (condition && !boost) {
        activate_paradox_boost(ctx.battle, ctx.side, ctx.holder, weather != Weather::NONE ? "weather" : "terrain");
    } else if (!condition && boost && (boost->move == "weather" || boost->move == "terrain")) {
        ctx.holder.remove_volatile(Volatile::PARADOX_BOOST);
        announce(ctx, Outcome::EXPIRED);
    }
}

} // anonymous namespace

// ============================================================================
// STAT STAGES
// ============================================================================

void register_intimidate(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_switch_in = [](HookContext& ctx) {
        SideID foe_side = opponent_of(ctx.side);
        Combatant& foe = ctx.battle.state.active(foe_side);
        if (foe.fainted()) {
            return;
        }
        announce(ctx, Outcome::APPLIED);
        apply_boost(ctx.battle, foe_side, foe, BoostStat::ATK, -1, ctx.def.name, true);
    };
    registry.register_ability("intimidate", std::move(handler));
}

void register_clear_body(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::BLOCKS_STAT_DROPS;
    registry.register_ability("clear_body", std::move(handler));
}

void register_contrary(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::REVERSES_BOOSTS;
    registry.register_ability("contrary", std::move(handler));
}

void register_unaware(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::IGNORES_BOOSTS;
    registry.register_ability("unaware", std::move(handler));
}

// ============================================================================
// RULE BREAKERS
// ============================================================================

void register_mold_breaker(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::IGNORES_ABILITIES;
    handler.on_switch_in = [](HookContext& ctx) { announce(ctx, Outcome::APPLIED); };
    registry.register_ability("mold_breaker", std::move(handler));
}

void register_magic_guard(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::NO_INDIRECT_DAMAGE;
    registry.register_ability("magic_guard", std::move(handler));
}

void register_magic_bounce(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::REFLECTS_STATUS_MOVES;
    registry.register_ability("magic_bounce", std::move(handler));
}

void register_good_as_gold(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::BLOCKS_STATUS_MOVES;
    registry.register_ability("good_as_gold", std::move(handler));
}

void register_infiltrator(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::INFILTRATES;
    registry.register_ability("infiltrator", std::move(handler));
}

void register_levitate(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::LEVITATES;
    registry.register_ability("levitate", std::move(handler));
}

// ============================================================================
// ABSORBERS
// ============================================================================

void register_absorb_heal(EffectRegistry& registry) {
    EffectHandler handler;
    handler.absorb = [](HookContext& ctx, Type move_type) {
        Type absorbed = ctx.def.param_type("type");
        if (absorbed == Type::TYPELESS || move_type != absorbed) {
            return false;
        }
        announce(ctx, Outcome::BLOCKED);
        int amount = fraction_of_max_hp(ctx.holder, ctx.def.param_double("heal", 0.25));
        apply_heal(ctx.battle, ctx.side, ctx.holder, amount, LogKind::ABILITY_TRIGGER, ctx.def.name);
        return true;
    };
    registry.register_ability("absorb_heal", std::move(handler));
}

void register_absorb_boost(EffectRegistry& registry) {
    EffectHandler handler;
    handler.absorb = [](HookContext& ctx, Type move_type) {
        Type absorbed = ctx.def.param_type("type");
        if (absorbed == Type::TYPELESS || move_type != absorbed) {
            return false;
        }
        announce(ctx, Outcome::BLOCKED);
        auto stat = RuleTables::parse_boost_stat(ctx.def.param("stat", "spa"));
        apply_boost(ctx.battle, ctx.side, ctx.holder, stat.value_or(BoostStat::SPA), 1, ctx.def.name);
        return true;
    };
    registry.register_ability("absorb_boost", std::move(handler));
}

void register_flash_fire(EffectRegistry& registry) {
    EffectHandler handler;
    handler.absorb = [](HookContext& ctx, Type move_type) {
        if (move_type != Type::FIRE) {
            return false;
        }
        announce(ctx, Outcome::BLOCKED);
        ctx.holder.add_volatile(VolatileState{Volatile::FLASH_FIRE, 0, "", ctx.side});
        return true;
    };
    handler.power = [](const ModifierContext& ctx, double value) {
        if (ctx.move_type == Type::FIRE && ctx.holder.has_volatile(Volatile::FLASH_FIRE)) {
            return value * 1.5;
        }
        return value;
    };
    registry.register_ability("flash_fire", std::move(handler));
}

// ============================================================================
// POWER
// ============================================================================

void register_technician(EffectRegistry& registry) {
    EffectHandler handler;
    handler.power = [](const ModifierContext& ctx, double value) {
        if (ctx.move && ctx.move->power > 0 && ctx.move->power <= 60) {
            return value * 1.5;
        }
        return value;
    };
    registry.register_ability("technician", std::move(handler));
}

void register_sheer_force(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::REMOVES_SECONDARIES;
    handler.power = [](const ModifierContext& ctx, double value) {
        if (ctx.move && ctx.move->has_secondary()) {
            return value * 1.3;
        }
        return value;
    };
    registry.register_ability("sheer_force", std::move(handler));
}

void register_type_change(EffectRegistry& registry) {
    EffectHandler handler;
    handler.move_type = [](const ModifierContext& ctx) -> std::optional<Type> {
        if (ctx.move && ctx.move->type == Type::NORMAL) {
            return ctx.def.param_type("type", Type::NORMAL);
        }
        return std::nullopt;
    };
    handler.power = [](const ModifierContext& ctx, double value) {
        if (ctx.move && ctx.move->type == Type::NORMAL && ctx.move_type != Type::NORMAL) {
            return value * ctx.def.param_double("boost", 1.2);
        }
        return value;
    };
    registry.register_ability("type_change", std::move(handler));
}

// ============================================================================
// CONTACT PUNISHERS
// ============================================================================

void register_contact_damage(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_contact = [](HookContext& ctx) {
        if (!ctx.other || ctx.other->fainted()) {
            return;
        }
        int amount = fraction_of_max_hp(*ctx.other, ctx.def.param_double("fraction", 0.125));
        apply_indirect_damage(ctx.battle, ctx.other_side, *ctx.other, amount,
                              LogKind::ABILITY_TRIGGER, ctx.def.name);
        record_faint(ctx.battle, ctx.other_side, *ctx.other);
    };
    registry.register_ability("contact_damage", std::move(handler));
}

void register_contact_status(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_contact = [](HookContext& ctx) {
        if (!ctx.other || ctx.other->fainted()) {
            return;
        }
        if (!ctx.battle.rng.chance(ctx.def.param_double("chance", 0.3))) {
            return;
        }
        MajorStatus status = RuleTables::parse_status(ctx.def.param("status"));
        try_apply_status(ctx.battle, ctx.other_side, *ctx.other, status, ctx.def.name, false, false);
    };
    registry.register_ability("contact_status", std::move(handler));
}

// ============================================================================
// PRIORITY
// ============================================================================

void register_prankster(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::PRANKSTER;
    handler.priority = [](const ModifierContext& ctx) {
        return ctx.move && ctx.move->is_status() ? 1 : 0;
    };
    registry.register_ability("prankster", std::move(handler));
}

void register_gale_wings(EffectRegistry& registry) {
    EffectHandler handler;
    handler.priority = [](const ModifierContext& ctx) {
        return ctx.move && ctx.move->type == Type::FLYING && ctx.holder.at_full_hp() ? 1 : 0;
    };
    registry.register_ability("gale_wings", std::move(handler));
}

// ============================================================================
// FIELD
// ============================================================================

void register_weather_setter(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_switch_in = [](HookContext& ctx) {
        Weather weather = RuleTables::parse_weather(ctx.def.param("weather"));
        if (weather == Weather::NONE || ctx.battle.state.field.weather == weather) {
            return;
        }
        announce(ctx, Outcome::APPLIED);
        set_weather(ctx.battle, weather, ctx.side, ctx.holder.name, true);
    };
    registry.register_ability("weather_setter", std::move(handler));
}

void register_terrain_setter(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_switch_in = [](HookContext& ctx) {
        Terrain terrain = RuleTables::parse_terrain(ctx.def.param("terrain"));
        if (terrain == Terrain::NONE || ctx.battle.state.field.terrain == terrain) {
            return;
        }
        announce(ctx, Outcome::APPLIED);
        set_terrain(ctx.battle, terrain, ctx.holder.name);
    };
    registry.register_ability("terrain_setter", std::move(handler));
}

void register_weather_speed(EffectRegistry& registry) {
    EffectHandler handler;
    handler.speed = [](const ModifierContext& ctx, double value) {
        Weather weather = RuleTables::parse_weather(ctx.def.param("weather"));
        if (weather != Weather::NONE && ctx.field.weather == weather) {
            return value * 2.0;
        }
        return value;
    };
    registry.register_ability("weather_speed", std::move(handler));
}

void register_paradox(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_switch_in = refresh_paradox;
    handler.on_end_of_turn = refresh_paradox;
    handler.attack_stat = [](const ModifierContext& ctx, double value) {
        if (!ctx.holder.paradox_stat || !ctx.move) return value;
        Stat boosted = physical(ctx) ? Stat::ATK : Stat::SPA;
        return *ctx.holder.paradox_stat == boosted ? value * 1.3 : value;
    };
    handler.defense_stat = [](const ModifierContext& ctx, double value) {
        if (!ctx.holder.paradox_stat || !ctx.move) return value;
        Stat boosted = physical(ctx) ? Stat::DEF : Stat::SPD;
        return *ctx.holder.paradox_stat == boosted ? value * 1.3 : value;
    };
    handler.speed = [](const ModifierContext& ctx, double value) {
        if (ctx.holder.paradox_stat == Stat::SPE) {
            return value * 1.5;
        }
        return value;
    };
    registry.register_ability("paradox", std::move(handler));
}

// ============================================================================
// SWITCHING
// ============================================================================

void register_regenerator(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_switch_out = [](HookContext& ctx) {
        if (ctx.holder.fainted() || ctx.holder.at_full_hp()) {
            return;
        }
        int amount = fraction_of_max_hp(ctx.holder, ctx.def.param_double("fraction", 1.0 / 3.0));
        apply_heal(ctx.battle, ctx.side, ctx.holder, amount, LogKind::ABILITY_TRIGGER, ctx.def.name);
    };
    registry.register_ability("regenerator", std::move(handler));
}

// ============================================================================
// SHARED HELPERS
// ============================================================================

Stat highest_stat(const Combatant& combatant) {
    Stat best = Stat::ATK;
    for (Stat stat : {Stat::DEF, Stat::SPA, Stat::SPD, Stat::SPE}) {
        if (combatant.stat(stat) > combatant.stat(best)) {
            best = stat;
        }
    }
    return best;
}

void activate_paradox_boost(BattleContext& battle, SideID side, Combatant& holder,
                            const std::string& source) {
    if (holder.has_volatile(Volatile::PARADOX_BOOST) || holder.fainted()) {
        return;
    }
    Stat stat = highest_stat(holder);
    holder.paradox_stat = stat;
    holder.add_volatile(VolatileState{Volatile::PARADOX_BOOST, 0, source, side});
    battle.state.record(side, LogKind::ABILITY_TRIGGER, Outcome::APPLIED, holder.name,
                        holder.ability + " " + to_string(stat) + " (" + source + ")");
}

// ============================================================================
// REGISTRATION
// ============================================================================

void register_all_abilities(EffectRegistry& registry) {
    register_intimidate(registry);
    register_clear_body(registry);
    register_contrary(registry);
    register_unaware(registry);

    register_mold_breaker(registry);
    register_magic_guard(registry);
    register_magic_bounce(registry);
    register_good_as_gold(registry);
    register_infiltrator(registry);
    register_levitate(registry);

    register_absorb_heal(registry);
    register_absorb_boost(registry);
    register_flash_fire(registry);

    register_technician(registry);
    register_sheer_force(registry);
    register_type_change(registry);

    register_contact_damage(registry);
    register_contact_status(registry);

    register_prankster(registry);
    register_gale_wings(registry);

    register_weather_setter(registry);
    register_terrain_setter(registry);
    register_weather_speed(registry);
    register_paradox(registry);

    register_regenerator(registry);
}

} // namespace effects
} // namespace pokesim
