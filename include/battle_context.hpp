/**
 * pokesim - Battle Context
 *
 * Bundles the mutable battle state with the read-only tables, the effect
 * registry and the battle's random source. Passed by reference into every
 * component that mutates a battle.
 */

#pragma once

#include "battle_state.hpp"
#include "effect_registry.hpp"
#include "random_source.hpp"
#include "format_rules.hpp"

namespace pokesim {

struct BattleContext {
    BattleState& state;
    const RuleTables& rules;
    const EffectRegistry& effects;
    RandomSource& rng;
    const FormatRules* format = nullptr;   // Clause checks skipped when absent

    EffectView view() const {
        return EffectView(rules, effects, state.field);
    }

    /**
     * Run a hook on a combatant's ability then item, if present.
     */
    void fire(HookCallback EffectHandler::*hook, SideID side, Combatant& holder,
              const MoveDef* move = nullptr, Combatant* other = nullptr,
              SideID other_side = NO_SIDE, int damage = 0) {
        fire_one(view().ability(holder), hook, side, holder, move, other, other_side, damage);
        // Item resolved after the ability ran; the ability may have removed it
        fire_one(view().item(holder), hook, side, holder, move, other, other_side, damage);
    }

    void fire_one(const BoundEffect& bound, HookCallback EffectHandler::*hook,
                  SideID side, Combatant& holder, const MoveDef* move,
                  Combatant* other, SideID other_side, int damage) {
        if (!bound || !(bound.handler->*hook)) {
            return;
        }
        HookContext ctx{*this, side, holder, *bound.def, move, other, other_side, damage};
        (bound.handler->*hook)(ctx);
    }
};

} // namespace pokesim
