/**
 * pokesim - Effect Registry Implementation
 */

#include "effect_registry.hpp"
#include "battle_state.hpp"
#include <initializer_list>
#include "effects/effect_catalog.hpp"

namespace pokesim {

// ============================================================================
// REGISTRATION
// ============================================================================

void EffectRegistry::register_ability(const std::string& effect, EffectHandler handler) {
    abilities_[RuleTables::normalize_id(effect)] = std::move(handler);
}

void EffectRegistry::register_item(const std::string& effect, EffectHandler handler) {
    items_[RuleTables::normalize_id(effect)] = std::move(handler);
}

// ============================================================================
// LOOKUP
// ============================================================================

const EffectHandler* EffectRegistry::find_ability(const std::string& effect) const {
    auto it = abilities_.find(RuleTables::normalize_id(effect));
    return it != abilities_.end() ? &it->second : nullptr;
}

const EffectHandler* EffectRegistry::find_item(const std::string& effect) const {
    auto it = items_.find(RuleTables::normalize_id(effect));
    return it != items_.end() ? &it->second : nullptr;
}

// ============================================================================
// EFFECT VIEW
// ============================================================================

BoundEffect EffectView::ability(const Combatant& combatant) const {
    BoundEffect bound;
    if (combatant.ability.empty()) {
        return bound;
    }
    bound.def = rules_.get_ability(combatant.ability);
    if (bound.def) {
        bound.handler = registry_.find_ability(bound.def->effect);
    }
    return bound;
}

BoundEffect EffectView::item(const Combatant& combatant) const {
    BoundEffect bound;
    if (combatant.item.empty() || field_.magic_room()) {
        return bound;
    }
    bound.def = rules_.get_item(combatant.item);
    if (bound.def) {
        bound.handler = registry_.find_item(bound.def->effect);
    }
    return bound;
}

BoundEffect EffectView::target_ability(const Combatant& attacker, const Combatant& target) const {
    if (ability_has(attacker, EffectHandler::IGNORES_ABILITIES)) {
        return BoundEffect{};
    }
    return ability(target);
}

double EffectView::modify(ModifierCallback EffectHandler::*modifier, const Combatant& holder,
                          const Combatant* other, const MoveDef* move, Type move_type,
                          double value) const {
    value = apply_modifier(ability(holder), modifier, holder, other, move, move_type, field_, value);
    return apply_modifier(item(holder), modifier, holder, other, move, move_type, field_, value);
}

double EffectView::modify_target(ModifierCallback EffectHandler::*modifier, const Combatant& attacker,
                                 const Combatant& target, const MoveDef* move, Type move_type,
                                 double value) const {
    value = apply_modifier(target_ability(attacker, target), modifier,
                           target, &attacker, move, move_type, field_, value);
    return apply_modifier(item(target), modifier, target, &attacker, move, move_type, field_, value);
}

int EffectView::priority_bonus(const Combatant& holder, const Combatant* other, const MoveDef& move) const {
    int bonus = 0;
    for (const BoundEffect& bound : {ability(holder), item(holder)}) {
        if (bound && bound.handler->priority) {
            ModifierContext ctx{holder, other, &move, move.type, field_, *bound.def};
            bonus += bound.handler->priority(ctx);
        }
    }
    return bonus;
}

double apply_modifier(const BoundEffect& bound, ModifierCallback EffectHandler::*modifier,
                      const Combatant& holder, const Combatant* other, const MoveDef* move,
                      Type move_type, const FieldState& field, double value) {
    if (!bound || !(bound.handler->*modifier)) {
        return value;
    }
    ModifierContext ctx{holder, other, move, move_type, field, *bound.def};
    return (bound.handler->*modifier)(ctx, value);
}

// ============================================================================
// BUILT-IN HANDLERS
// ============================================================================

void register_all_effects(EffectRegistry& registry) {
    effects::register_all_abilities(registry);
    effects::register_all_items(registry);
}

} // namespace pokesim
