/**
 * pokesim - Move Execution
 *
 * Resolves one move from selection to aftermath:
 * charge turn, PP, failure checks, protection, absorption, accuracy,
 * then the damaging or status body.
 */

#include "engine.hpp"
#include "accuracy.hpp"
#include "damage_calculator.hpp"
#include "field_effects.hpp"
#include "status_engine.hpp"
#include <algorithm>
#include <cmath>

namespace pokesim {

namespace {

constexpr double SPIKY_SHIELD_FRACTION = 1.0 / 8.0;
constexpr double PROTECT_CHAIN_CHANCE = 1.0 / 3.0;

/**
 * Volatiles a status move puts on its user rather than the target.
 */
bool is_self_volatile(Volatile kind) {
    switch (kind) {
        case Volatile::SUBSTITUTE:
        case Volatile::PROTECT:
        case Volatile::DESTINY_BOND:
        case Volatile::IMPRISON:
        case Volatile::CHARGING:
        case Volatile::FLASH_FIRE:
        case Volatile::PARADOX_BOOST:
            return true;
        default:
            return false;
    }
}

/**
 * Moves aimed at the opposing combatant: these need a live target, run
 * the accuracy check and can be protected against.
 */
bool hits_target(const MoveDef& move) {
    if (move.is_damaging()) {
        return true;
    }
    if (move.inflicts_status != MajorStatus::NONE || !move.target_boosts.empty() ||
        move.flags.force_switch) {
        return true;
    }
    return move.inflicts_volatile && !is_self_volatile(*move.inflicts_volatile) &&
           *move.inflicts_volatile != Volatile::PERISH_SONG;
}

double weather_heal_fraction(Weather weather, double base) {
    if (base <= 0.0) {
        base = 0.5;
    }
    if (weather == Weather::NONE || weather == Weather::SUN) {
        return base;
    }
    return base / 2.0;
}

} // anonymous namespace

// ============================================================================
// ENTRY POINT
// ============================================================================

void BattleEngine::execute_move(BattleContext& ctx, SideID side, int slot_index) const {
    BattleState& state = ctx.state;
    SideID foe_side = opponent_of(side);
    Combatant& user = state.active(side);
    Combatant& target = state.active(foe_side);
    EffectView v = ctx.view();

    MoveSlot* slot = nullptr;
    const MoveDef* selected = &rules_.struggle();
    if (slot_index != BattleAction::STRUGGLE_INDEX) {
        slot = &user.moves.at(static_cast<size_t>(slot_index));
        selected = slot->move;
    }
    const MoveDef& move = *selected;
    user.moved_this_turn = true;

    auto fail = [&](const std::string& reason) {
        LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::FAILED, user.name,
                                       move.name + ": " + reason);
        entry.target = target.name;
    };

    // Two-turn moves: the first turn only charges (solar moves skip it in sun)
    bool releasing = false;
    if (const VolatileState* charging = user.find_volatile(Volatile::CHARGING)) {
        releasing = charging->move == move.id;
        user.remove_volatile(Volatile::CHARGING);
    }
    if (move.flags.charge && !releasing &&
        !(move.flags.solar && state.field.weather == Weather::SUN)) {
        if (slot && slot->pp > 0) slot->pp--;
        user.last_move = move.id;
        user.add_volatile(VolatileState{Volatile::CHARGING, 0, move.id, side});
        LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::APPLIED, user.name,
                                       move.name + " (charging)");
        entry.target = target.name;
        return;
    }

    if (slot) {
        if (!releasing && slot->pp > 0) slot->pp--;
        user.last_move = move.id;
        if (user.choice_locked_move.empty() && v.item_has(user, EffectHandler::CHOICE_LOCK)) {
            user.choice_locked_move = move.id;
        }
    }
    if (!move.destiny_bond) {
        user.remove_volatile(Volatile::DESTINY_BOND);
    }

    bool aimed = hits_target(move);
    if (aimed && target.fainted()) {
        fail("no target");
        return;
    }

    // Psychic Terrain: grounded targets are protected from priority moves
    int priority = move.priority + v.priority_bonus(user, &target, move);
    if (aimed && priority > 0 && rules_.get_terrain(state.field.terrain).blocks_priority &&
        is_grounded(v, target)) {
        fail("terrain");
        return;
    }

    if (aimed && move.is_status() && v.ability_has(user, EffectHandler::PRANKSTER) &&
        target.has_type(Type::DARK)) {
        fail("dark type");
        return;
    }

    // Sucker Punch: target must be about to use a damaging move
    if (move.flags.requires_target_attack) {
        const auto& queued = state.queued_actions[foe_side];
        bool attacking = false;
        if (queued && queued->is_move() && !target.moved_this_turn) {
            if (queued->is_struggle()) {
                attacking = true;
            } else if (queued->index >= 0 && queued->index < static_cast<int>(target.moves.size())) {
                attacking = target.moves[static_cast<size_t>(queued->index)].move->is_damaging();
            }
        }
        if (!attacking) {
            fail("target not attacking");
            return;
        }
    }

    if (move.protect != ProtectKind::NONE) {
        bool success = user.protect_chain == 0 ||
                       ctx.rng.chance(std::pow(PROTECT_CHAIN_CHANCE, user.protect_chain));
        if (!success) {
            user.protect_chain = 0;
            fail("consecutive use");
            return;
        }
        user.protect_chain++;
        user.protected_this_turn = true;
        user.add_volatile(VolatileState{Volatile::PROTECT, 0, move.id, side});
        state.record(side, LogKind::MOVE, Outcome::APPLIED, user.name, move.name);
        return;
    }

    Type move_type = resolve_move_type(user, &target, move, v);
    if (aimed && blocked_by_target(ctx, side, user, target, move, move_type)) {
        return;
    }

    // Hazards skip accuracy and protection but still bounce
    if (!aimed && move.hazard && !target.fainted() && bounced_by_target(ctx, side, user, target, move)) {
        return;
    }

    std::optional<double> accuracy_roll;
    if (aimed) {
        AccuracyResult accuracy = resolve_accuracy(move, user, target, state.field, ctx.rng);
        accuracy_roll = accuracy.roll;
        if (!accuracy.hit) {
            LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::MISS, user.name, move.name);
            entry.target = target.name;
            entry.accuracy_roll = accuracy.roll;
            return;
        }
    }

    if (move.is_damaging()) {
        execute_damaging_move(ctx, side, user, target, move, accuracy_roll);
    } else {
        execute_status_move(ctx, side, user, target, move);
    }
}

// ============================================================================
// TARGET GUARDS
// ============================================================================

bool BattleEngine::blocked_by_target(BattleContext& ctx, SideID side, Combatant& user,
                                     Combatant& target, const MoveDef& move, Type move_type) const {
    BattleState& state = ctx.state;
    SideID foe_side = opponent_of(side);
    EffectView v = ctx.view();

    auto blocked = [&](Outcome outcome, const std::string& reason) {
        LogEntry& entry = state.record(side, LogKind::MOVE, outcome, user.name,
                                       move.name + " (" + reason + ")");
        entry.target = target.name;
        return true;
    };

    if (const VolatileState* protect = target.find_volatile(Volatile::PROTECT)) {
        const MoveDef* shield = rules_.get_move(protect->move);
        ProtectKind kind = shield ? shield->protect : ProtectKind::PROTECT;

        if (move.flags.breaks_protect) {
            target.remove_volatile(Volatile::PROTECT);
            state.record(foe_side, LogKind::VOLATILE_TICK, Outcome::EXPIRED, target.name,
                         "protect (" + move.name + ")");
        } else if (!(kind == ProtectKind::KINGS_SHIELD && move.is_status())) {
            blocked(Outcome::BLOCKED, "protect");
            if (move.flags.contact && kind == ProtectKind::SPIKY_SHIELD) {
                apply_indirect_damage(ctx, side, user, fraction_of_max_hp(user, SPIKY_SHIELD_FRACTION),
                                      LogKind::MOVE, "spiky_shield");
                record_faint(ctx, side, user);
            } else if (move.flags.contact && kind == ProtectKind::KINGS_SHIELD) {
                apply_boost(ctx, side, user, BoostStat::ATK, -1, "kings_shield", true);
            }
            return true;
        }
    }

    BoundEffect ability = v.target_ability(user, target);

    if (bounced_by_target(ctx, side, user, target, move)) {
        return true;
    }

    if (move.is_status() && ability.has(EffectHandler::BLOCKS_STATUS_MOVES)) {
        state.record(foe_side, LogKind::ABILITY_TRIGGER, Outcome::BLOCKED, target.name,
                     ability.def->name + " (" + move.name + ")");
        return true;
    }

    if (ability && ability.handler->absorb && move_type != Type::TYPELESS) {
        HookContext hook{ctx, foe_side, target, *ability.def, &move, &user, side, 0};
        if (ability.handler->absorb(hook, move_type)) {
            return blocked(Outcome::IMMUNE, ability.def->name);
        }
    }

    return false;
}

bool BattleEngine::bounced_by_target(BattleContext& ctx, SideID side, Combatant& user,
                                     Combatant& target, const MoveDef& move) const {
    BoundEffect ability = ctx.view().target_ability(user, target);
    if (!move.is_status() || !ability.has(EffectHandler::REFLECTS_STATUS_MOVES)) {
        return false;
    }

    SideID foe_side = opponent_of(side);
    ctx.state.record(foe_side, LogKind::ABILITY_TRIGGER, Outcome::APPLIED, target.name,
                     ability.def->name + " (" + move.name + ")");
    // Reflected once; a bounced move is never bounced back. Hazards land on
    // the original user's side.
    if (!user.fainted()) {
        execute_status_move(ctx, foe_side, target, user, move);
    }
    return true;
}

// ============================================================================
// DAMAGING MOVES
// ============================================================================

int BattleEngine::fixed_damage(const Combatant& user, const Combatant& target, const MoveDef& move) const {
    switch (move.fixed_damage) {
        case FixedDamage::LEVEL:
            return user.level;
        case FixedDamage::HALF_HP:
            return std::max(1, target.hp / 2);
        case FixedDamage::ENDEAVOR:
            return std::max(0, target.hp - user.hp);
        case FixedDamage::COUNTER:
            return 2 * user.physical_damage_taken;
        case FixedDamage::MIRROR_COAT:
            return 2 * user.special_damage_taken;
        case FixedDamage::METAL_BURST:
            return floor_amount(1.5 * (user.physical_damage_taken + user.special_damage_taken));
        case FixedDamage::OHKO:
            return target.hp;
        default:
            return 0;
    }
}

int BattleEngine::roll_hit_count(BattleContext& ctx, const Combatant& user, const MoveDef& move) const {
    if (!move.is_multi_hit()) {
        return 1;
    }
    if (ctx.view().item_has(user, EffectHandler::UNIFORM_MULTI_HIT)) {
        return ctx.rng.next_int(move.min_hits, move.max_hits);
    }
    if (move.min_hits == 2 && move.max_hits == 5) {
        // 35% / 35% / 15% / 15%
        double u = ctx.rng.next_unit();
        if (u < 0.35) return 2;
        if (u < 0.70) return 3;
        if (u < 0.85) return 4;
        return 5;
    }
    return ctx.rng.next_int(move.min_hits, move.max_hits);
}

void BattleEngine::execute_damaging_move(BattleContext& ctx, SideID side, Combatant& user,
                                         Combatant& target, const MoveDef& move,
                                         std::optional<double> accuracy_roll) const {
    BattleState& state = ctx.state;
    SideID foe_side = opponent_of(side);
    EffectView v = ctx.view();
    const SideState& defender_side = state.side(foe_side);
    Type move_type = resolve_move_type(user, &target, move, v);

    bool bypass_substitute = move.flags.sound || v.ability_has(user, EffectHandler::INFILTRATES);
    int hits = roll_hit_count(ctx, user, move);
    int total = 0;
    int landed = 0;
    bool hit_substitute = false;

    for (int i = 0; i < hits; i++) {
        if (target.fainted() || user.fainted()) {
            break;
        }

        DamageResult result;
        if (move.fixed_damage != FixedDamage::NONE) {
            result.move_type = move_type;
            result.effectiveness = compute_effectiveness(user, target, move_type, v);
            result.immune = result.effectiveness == 0.0;
            if (!result.immune && move.fixed_damage == FixedDamage::OHKO && target.level > user.level) {
                LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::FAILED, user.name,
                                               move.name + ": target level too high");
                entry.target = target.name;
                return;
            }
            if (!result.immune) {
                result.effectiveness = 1.0;
                result.damage = fixed_damage(user, target, move);
                if (result.damage <= 0) {
                    LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::FAILED, user.name,
                                                   move.name + ": nothing to return");
                    entry.target = target.name;
                    return;
                }
            }
        } else {
            DamageQuery query{user, target, defender_side, move, v};
            result = calculate_damage(query, ctx.rng);
        }

        if (result.immune) {
            LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::IMMUNE, user.name, move.name);
            entry.target = target.name;
            entry.effectiveness = 0.0;
            entry.accuracy_roll = accuracy_roll;
            return;
        }

        int damage = result.damage;

        if (target.has_volatile(Volatile::SUBSTITUTE) && !bypass_substitute) {
            int absorbed = std::min(damage, target.substitute_hp);
            target.substitute_hp -= absorbed;
            hit_substitute = true;
            total += absorbed;
            landed++;

            LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::HIT, user.name,
                                           move.name + " (substitute)");
            entry.target = target.name;
            entry.damage = absorbed;
            entry.critical_hit = result.critical_hit;
            entry.effectiveness = result.effectiveness;
            if (i == 0) entry.accuracy_roll = accuracy_roll;

            if (target.substitute_hp <= 0) {
                target.remove_volatile(Volatile::SUBSTITUTE);
                state.record(foe_side, LogKind::VOLATILE_TICK, Outcome::EXPIRED, target.name, "substitute");
            }
            continue;
        }

        // Focus Sash and other damage guards
        for (const BoundEffect& guard : {v.target_ability(user, target), v.item(target)}) {
            if (guard && guard.handler->before_damage) {
                HookContext hook{ctx, foe_side, target, *guard.def, &move, &user, side, damage};
                damage = guard.handler->before_damage(hook, damage);
            }
        }

        int dealt = target.take_damage(damage);
        total += dealt;
        landed++;
        if (move.category == MoveCategory::PHYSICAL) {
            target.physical_damage_taken += dealt;
        } else {
            target.special_damage_taken += dealt;
        }

        LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::HIT, user.name, move.name);
        entry.target = target.name;
        entry.damage = dealt;
        entry.critical_hit = result.critical_hit;
        entry.effectiveness = result.effectiveness;
        if (i == 0) entry.accuracy_roll = accuracy_roll;

        if (target.fainted() && target.has_volatile(Volatile::DESTINY_BOND) && !user.fainted()) {
            int lost = user.take_damage(user.hp);
            LogEntry& bond = state.record(foe_side, LogKind::VOLATILE_TICK, Outcome::DAMAGED,
                                          user.name, "destiny_bond");
            bond.target = target.name;
            bond.damage = lost;
        }
        record_faint(ctx, foe_side, target);

        if (move.flags.contact) {
            ctx.fire(&EffectHandler::on_contact, foe_side, target, &move, &user, side, dealt);
        }
        ctx.fire(&EffectHandler::on_hit, foe_side, target, &move, &user, side, dealt);
        record_faint(ctx, side, user);
    }

    if (landed == 0) {
        return;
    }
    if (move.is_multi_hit()) {
        state.record(side, LogKind::MOVE, Outcome::APPLIED, user.name,
                     move.name + " hit " + std::to_string(landed) + " time(s)");
    }

    if (move.drain > 0.0 && total > 0 && !user.fainted()) {
        int amount = std::max(1, floor_amount(total * move.drain));
        apply_heal(ctx, side, user, amount, LogKind::MOVE, move.name + " drain");
    }
    if (move.recoil > 0.0 && total > 0 && !user.fainted()) {
        int amount = std::max(1, floor_amount(total * move.recoil));
        apply_indirect_damage(ctx, side, user, amount, LogKind::MOVE, move.name + " recoil");
        record_faint(ctx, side, user);
    }

    bool sheer_force = move.has_secondary() && v.ability_has(user, EffectHandler::REMOVES_SECONDARIES);
    if (move.has_secondary() && !sheer_force && (move.secondary->self || !hit_substitute)) {
        apply_secondary(ctx, side, user, target, move);
    }

    if (!move.self_boosts.empty() && !user.fainted()) {
        apply_boosts(ctx, side, user, move.self_boosts, move.name);
    }
    if (!target.fainted() && !hit_substitute) {
        if (!move.target_boosts.empty()) {
            apply_boosts(ctx, foe_side, target, move.target_boosts, move.name, true);
        }
        if (move.inflicts_status != MajorStatus::NONE) {
            try_apply_status(ctx, foe_side, target, move.inflicts_status, move.name);
        }
        if (move.inflicts_volatile && !is_self_volatile(*move.inflicts_volatile)) {
            try_apply_volatile(ctx, foe_side, target, *move.inflicts_volatile, side, move.name);
        }
    }

    if (move.hazard_removal != HazardRemoval::NONE && !user.fainted()) {
        remove_hazards(ctx, side, move.hazard_removal, user.name);
    }

    // Struggle recoil is a fraction of max HP and ignores Magic Guard
    if (move.self_damage > 0.0 && !user.fainted()) {
        int lost = user.take_damage(fraction_of_max_hp(user, move.self_damage));
        LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::DAMAGED, user.name, move.name + " recoil");
        entry.damage = lost;
        record_faint(ctx, side, user);
    }

    ctx.fire(&EffectHandler::on_after_attack, side, user, &move, &target, foe_side, total);

    if (move.flags.force_switch && !target.fainted() && !hit_substitute) {
        state.side(foe_side).pending_forced_switch = true;
    }
    if (move.flags.self_switch && !user.fainted()) {
        state.side(side).pending_self_switch = true;
    }
}

void BattleEngine::apply_secondary(BattleContext& ctx, SideID side, Combatant& user,
                                   Combatant& target, const MoveDef& move) const {
    const SecondaryEffect& secondary = *move.secondary;
    if (!ctx.rng.chance(secondary.chance / 100.0)) {
        return;
    }

    if (secondary.self) {
        if (!user.fainted()) {
            apply_boosts(ctx, side, user, secondary.boosts, move.name);
        }
        return;
    }

    SideID foe_side = opponent_of(side);
    if (target.fainted()) {
        return;
    }
    if (secondary.status != MajorStatus::NONE) {
        try_apply_status(ctx, foe_side, target, secondary.status, move.name);
    }
    if (secondary.volatile_status) {
        try_apply_volatile(ctx, foe_side, target, *secondary.volatile_status, side, move.name);
    }
    if (!secondary.boosts.empty()) {
        apply_boosts(ctx, foe_side, target, secondary.boosts, move.name, true);
    }
}

// ============================================================================
// STATUS MOVES
// ============================================================================

void BattleEngine::execute_status_move(BattleContext& ctx, SideID side, Combatant& user,
                                       Combatant& target, const MoveDef& move) const {
    BattleState& state = ctx.state;
    SideID foe_side = opponent_of(side);
    EffectView v = ctx.view();
    bool aimed = hits_target(move);

    if (aimed && move.flags.powder && target.has_type(Type::GRASS)) {
        LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::IMMUNE, user.name, move.name);
        entry.target = target.name;
        return;
    }

    LogEntry& entry = state.record(side, LogKind::MOVE, Outcome::APPLIED, user.name, move.name);
    if (aimed) {
        entry.target = target.name;
    }

    if (move.inflicts_status != MajorStatus::NONE) {
        Type move_type = resolve_move_type(user, &target, move, v);
        // Thunder Wave respects type immunity
        if (move.inflicts_status == MajorStatus::PARALYSIS &&
            compute_effectiveness(user, target, move_type, v) == 0.0) {
            state.record(foe_side, LogKind::STATUS_APPLIED, Outcome::IMMUNE, target.name,
                         std::string(to_string(move.inflicts_status)) + " (" + move.name + "): type");
        } else {
            try_apply_status(ctx, foe_side, target, move.inflicts_status, move.name);
        }
    }

    if (move.inflicts_volatile) {
        Volatile kind = *move.inflicts_volatile;
        if (kind == Volatile::PERISH_SONG) {
            for (SideID s : {side, foe_side}) {
                Combatant& active = state.active(s);
                if (!active.fainted()) {
                    try_apply_volatile(ctx, s, active, kind, side, move.name);
                }
            }
        } else if (is_self_volatile(kind)) {
            try_apply_volatile(ctx, side, user, kind, side, move.name);
        } else {
            try_apply_volatile(ctx, foe_side, target, kind, side, move.name);
        }
    }

    if (move.destiny_bond) {
        try_apply_volatile(ctx, side, user, Volatile::DESTINY_BOND, side, move.name);
    }

    if (!move.self_boosts.empty()) {
        apply_boosts(ctx, side, user, move.self_boosts, move.name);
    }
    if (!move.target_boosts.empty()) {
        bool bypass = move.flags.sound || v.ability_has(user, EffectHandler::INFILTRATES);
        if (target.has_volatile(Volatile::SUBSTITUTE) && !bypass) {
            state.record(foe_side, LogKind::STAT_CHANGE, Outcome::BLOCKED, target.name,
                         "substitute (" + move.name + ")");
        } else {
            apply_boosts(ctx, foe_side, target, move.target_boosts, move.name, true);
        }
    }

    if (move.heal > 0.0 || move.weather_heal) {
        double fraction = move.weather_heal ? weather_heal_fraction(state.field.weather, move.heal) : move.heal;
        apply_heal(ctx, side, user, fraction_of_max_hp(user, fraction), LogKind::MOVE, move.name);
    }

    if (move.hazard) {
        add_hazard(ctx, foe_side, *move.hazard, user.name);
    }
    if (move.screen) {
        raise_screen(ctx, side, *move.screen, user.name);
    }
    if (move.sets_weather != Weather::NONE) {
        set_weather(ctx, move.sets_weather, side, user.name);
    }
    if (move.sets_terrain != Terrain::NONE) {
        set_terrain(ctx, move.sets_terrain, user.name);
    }
    if (move.room) {
        toggle_room(ctx, *move.room, user.name);
    }
    if (move.tailwind) {
        set_tailwind(ctx, side, user.name);
    }
    if (move.hazard_removal != HazardRemoval::NONE) {
        remove_hazards(ctx, side, move.hazard_removal, user.name);
    }

    if (move.flags.force_switch && !target.fainted()) {
        state.side(foe_side).pending_forced_switch = true;
    }
    if (move.flags.self_switch && !user.fainted()) {
        state.side(side).pending_self_switch = true;
    }
}

} // namespace pokesim
