/**
 * pokesim - Item Effects
 *
 * Handlers for the item effect functions named by the rule tables.
 * Consumable items clear Combatant::item when they trigger.
 */

#include "effects/effect_catalog.hpp"
#include "battle_context.hpp"
#include "status_engine.hpp"

namespace pokesim {
namespace effects {

namespace {

bool holder_has_paradox_ability(HookContext& ctx) {
    const AbilityDef* ability = ctx.battle.rules.get_ability(ctx.holder.ability);
    return ability && RuleTables::normalize_id(ability->effect) == "paradox";
}

} // anonymous namespace

// ============================================================================
// PASSIVE
// ============================================================================

void register_heavy_duty_boots(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::HAZARD_IMMUNE;
    registry.register_item("heavy_duty_boots", std::move(handler));
}

void register_loaded_dice(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::UNIFORM_MULTI_HIT;
    registry.register_item("loaded_dice", std::move(handler));
}

void register_quick_claw(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::MAY_ACT_FIRST;
    registry.register_item("quick_claw", std::move(handler));
}

// ============================================================================
// STAT AND POWER
// ============================================================================

void register_life_orb(EffectRegistry& registry) {
    EffectHandler handler;
    handler.power = [](const ModifierContext& ctx, double value) {
        return value * ctx.def.param_double("boost", 1.3);
    };
    handler.on_after_attack = [](HookContext& ctx) {
        if (ctx.holder.fainted() || ctx.damage <= 0) {
            return;
        }
        // No recoil when Sheer Force removed the move's secondary effect
        if (ctx.move && ctx.move->has_secondary() &&
            ctx.battle.view().ability_has(ctx.holder, EffectHandler::REMOVES_SECONDARIES)) {
            return;
        }
        int recoil = fraction_of_max_hp(ctx.holder, ctx.def.param_double("recoil", 0.1));
        apply_indirect_damage(ctx.battle, ctx.side, ctx.holder, recoil, LogKind::ITEM_TRIGGER, ctx.def.name);
        record_faint(ctx.battle, ctx.side, ctx.holder);
    };
    registry.register_item("life_orb", std::move(handler));
}

/**
 * Choice Band / Specs / Scarf: "stat" param picks atk, spa or spe.
 * The engine enforces the lock through the CHOICE_LOCK flag.
 */
void register_choice_item(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::CHOICE_LOCK;
    handler.attack_stat = [](const ModifierContext& ctx, double value) {
        if (!ctx.move) return value;
        std::string stat = RuleTables::normalize_id(ctx.def.param("stat"));
        bool physical = ctx.move->category == MoveCategory::PHYSICAL;
        if ((stat == "atk" && physical) || (stat == "spa" && !physical)) {
            return value * ctx.def.param_double("boost", 1.5);
        }
        return value;
    };
    handler.speed = [](const ModifierContext& ctx, double value) {
        if (RuleTables::normalize_id(ctx.def.param("stat")) == "spe") {
            return value * ctx.def.param_double("boost", 1.5);
        }
        return value;
    };
    registry.register_item("choice", std::move(handler));
}

void register_assault_vest(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::FORBIDS_STATUS_MOVES;
    handler.defense_stat = [](const ModifierContext& ctx, double value) {
        if (ctx.move && ctx.move->category == MoveCategory::SPECIAL) {
            return value * ctx.def.param_double("boost", 1.5);
        }
        return value;
    };
    registry.register_item("assault_vest", std::move(handler));
}

void register_type_boost(EffectRegistry& registry) {
    EffectHandler handler;
    handler.power = [](const ModifierContext& ctx, double value) {
        Type boosted = ctx.def.param_type("type");
        if (boosted != Type::TYPELESS && ctx.move_type == boosted) {
            return value * ctx.def.param_double("boost", 1.2);
        }
        return value;
    };
    registry.register_item("type_boost", std::move(handler));
}

// ============================================================================
// TRIGGERED
// ============================================================================

void register_focus_sash(EffectRegistry& registry) {
    EffectHandler handler;
    handler.before_damage = [](HookContext& ctx, int damage) {
        if (ctx.holder.at_full_hp() && ctx.holder.hp > 1 && damage >= ctx.holder.hp) {
            consume_item(ctx.battle, ctx.side, ctx.holder, "survived");
            return ctx.holder.hp - 1;
        }
        return damage;
    };
    registry.register_item("focus_sash", std::move(handler));
}

void register_leftovers(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_end_of_turn = [](HookContext& ctx) {
        if (ctx.holder.fainted() || ctx.holder.at_full_hp()) {
            return;
        }
        int amount = fraction_of_max_hp(ctx.holder, ctx.def.param_double("fraction", 1.0 / 16.0));
        apply_heal(ctx.battle, ctx.side, ctx.holder, amount, LogKind::ITEM_TRIGGER, ctx.def.name);
    };
    registry.register_item("leftovers", std::move(handler));
}

void register_rocky_helmet(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_contact = [](HookContext& ctx) {
        if (!ctx.other || ctx.other->fainted()) {
            return;
        }
        int amount = fraction_of_max_hp(*ctx.other, ctx.def.param_double("fraction", 0.25));
        apply_indirect_damage(ctx.battle, ctx.other_side, *ctx.other, amount,
                              LogKind::ITEM_TRIGGER, ctx.def.name);
        record_faint(ctx.battle, ctx.other_side, *ctx.other);
    };
    registry.register_item("rocky_helmet", std::move(handler));
}

void register_eject_button(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_hit = [](HookContext& ctx) {
        SideState& side = ctx.battle.state.side(ctx.side);
        if (ctx.holder.fainted() || side.switch_candidates().empty()) {
            return;
        }
        consume_item(ctx.battle, ctx.side, ctx.holder, "switch out");
        side.pending_self_switch = true;
    };
    registry.register_item("eject_button", std::move(handler));
}

void register_eject_pack(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_stat_lowered = [](HookContext& ctx) {
        SideState& side = ctx.battle.state.side(ctx.side);
        if (ctx.holder.fainted() || side.switch_candidates().empty()) {
            return;
        }
        consume_item(ctx.battle, ctx.side, ctx.holder, "switch out");
        side.pending_self_switch = true;
    };
    registry.register_item("eject_pack", std::move(handler));
}

void register_red_card(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_hit = [](HookContext& ctx) {
        if (ctx.holder.fainted() || !ctx.other || ctx.other->fainted() || ctx.other_side == NO_SIDE) {
            return;
        }
        SideState& attacker_side = ctx.battle.state.side(ctx.other_side);
        if (attacker_side.switch_candidates().empty()) {
            return;
        }
        consume_item(ctx.battle, ctx.side, ctx.holder, "forced switch");
        attacker_side.pending_forced_switch = true;
    };
    registry.register_item("red_card", std::move(handler));
}

void register_booster_energy(EffectRegistry& registry) {
    EffectHandler handler;
    handler.on_switch_in = [](HookContext& ctx) {
        if (ctx.holder.has_volatile(Volatile::PARADOX_BOOST) || !holder_has_paradox_ability(ctx)) {
            return;
        }
        consume_item(ctx.battle, ctx.side, ctx.holder, "activated");
        activate_paradox_boost(ctx.battle, ctx.side, ctx.holder, "booster_energy");
    };
    registry.register_item("booster_energy", std::move(handler));
}

void register_air_balloon(EffectRegistry& registry) {
    EffectHandler handler;
    handler.flags = EffectHandler::LEVITATES;
    handler.on_hit = [](HookContext& ctx) {
        consume_item(ctx.battle, ctx.side, ctx.holder, "popped");
    };
    registry.register_item("air_balloon", std::move(handler));
}

// ============================================================================
// SHARED HELPERS
// ============================================================================

void consume_item(BattleContext& battle, SideID side, Combatant& holder, const std::string& reason) {
    if (holder.item.empty()) {
        return;
    }
    std::string detail = holder.item + " " + reason;
    holder.item.clear();
    battle.state.record(side, LogKind::ITEM_TRIGGER, Outcome::APPLIED, holder.name, detail);
}

// ============================================================================
// REGISTRATION
// ============================================================================

void register_all_items(EffectRegistry& registry) {
    register_heavy_duty_boots(registry);
    register_loaded_dice(registry);
    register_quick_claw(registry);

    register_life_orb(registry);
    register_choice_item(registry);
    register_assault_vest(registry);
    register_type_boost(registry);

    register_focus_sash(registry);
    register_leftovers(registry);
    register_rocky_helmet(registry);
    register_eject_button(registry);
    register_eject_pack(registry);
    register_red_card(registry);
    register_booster_energy(registry);
    register_air_balloon(registry);
}

} // namespace effects
} // namespace pokesim
