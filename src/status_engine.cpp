/**
 * pokesim - Status / Volatile Engine Implementation
 */

#include "status_engine.hpp"
#include "damage_calculator.hpp"
#include "field_effects.hpp"
#include <algorithm>
#include <cmath>

namespace pokesim {

namespace {

constexpr size_t STATUS_COUNT = 7;

// STATUS_TRANSITIONS[from][to]
constexpr bool STATUS_TRANSITIONS[STATUS_COUNT][STATUS_COUNT] = {
    //            NONE   BRN    PSN    TOX    PAR    SLP    FRZ
    /* NONE */  { true,  true,  true,  true,  true,  true,  true  },
    /* BRN  */  { true,  false, false, false, false, false, false },
    /* PSN  */  { true,  false, false, false, false, false, false },
    /* TOX  */  { true,  false, false, false, false, false, false },
    /* PAR  */  { true,  false, false, false, false, false, false },
    /* SLP  */  { true,  false, false, false, false, false, false },
    /* FRZ  */  { true,  false, false, false, false, false, false },
};

std::string signed_delta(int delta) {
    return delta > 0 ? "+" + std::to_string(delta) : std::to_string(delta);
}

int standard_turns(BattleContext& ctx, Volatile kind) {
    switch (kind) {
        case Volatile::TAUNT: return TAUNT_TURNS;
        case Volatile::ENCORE: return ENCORE_TURNS;
        case Volatile::DISABLE: return DISABLE_TURNS;
        case Volatile::PERISH_SONG: return PERISH_TURNS;
        case Volatile::PARTIAL_TRAP: return ctx.rng.next_int(4, 5);
        default: return 0;
    }
}

bool substitute_blocks(Volatile kind) {
    return kind == Volatile::CONFUSION || kind == Volatile::LEECH_SEED;
}

void confusion_self_hit(BattleContext& ctx, SideID side, Combatant& user) {
    EffectView view = ctx.view();
    const MoveDef& hit = ctx.rules.confusion_hit();
    DamageQuery query{user, user, ctx.state.side(side), hit, view};
    DamageResult result = compute_damage(query, false, draw_damage_roll(ctx.rng));

    int dealt = user.take_damage(result.damage);
    LogEntry& entry = ctx.state.record(side, LogKind::ACTION_PREVENTED, Outcome::DAMAGED,
                                       user.name, "confusion");
    entry.target = user.name;
    entry.damage = dealt;
    record_faint(ctx, side, user);
}

} // anonymous namespace

// ============================================================================
// TRANSITIONS
// ============================================================================

bool status_transition_allowed(MajorStatus from, MajorStatus to) {
    return STATUS_TRANSITIONS[static_cast<size_t>(from)][static_cast<size_t>(to)];
}

bool is_type_immune_to_status(const Combatant& target, MajorStatus status) {
    switch (status) {
        case MajorStatus::BURN:
            return target.has_type(Type::FIRE);
        case MajorStatus::POISON:
        case MajorStatus::BADLY_POISONED:
            return target.has_type(Type::POISON) || target.has_type(Type::STEEL);
        case MajorStatus::PARALYSIS:
            return target.has_type(Type::ELECTRIC);
        case MajorStatus::FREEZE:
            return target.has_type(Type::ICE);
        default:
            return false;
    }
}

Outcome try_apply_status(BattleContext& ctx, SideID side, Combatant& target,
                         MajorStatus status, const std::string& source,
                         bool overwrite, bool from_foe) {
    if (target.fainted() || status == MajorStatus::NONE) {
        return Outcome::FAILED;
    }

    auto log = [&](Outcome outcome, const std::string& reason) {
        std::string detail = std::string(to_string(status)) + " (" + source + ")";
        if (!reason.empty()) detail += ": " + reason;
        ctx.state.record(side, LogKind::STATUS_APPLIED, outcome, target.name, detail);
        return outcome;
    };

    if (!overwrite && !status_transition_allowed(target.status, status)) {
        return log(Outcome::STATUS_PREVENTED, "already " + std::string(to_string(target.status)));
    }
    if (is_type_immune_to_status(target, status)) {
        return log(Outcome::IMMUNE, "type");
    }
    if (from_foe && target.has_volatile(Volatile::SUBSTITUTE)) {
        return log(Outcome::BLOCKED, "substitute");
    }

    if (status == MajorStatus::SLEEP && ctx.format && ctx.format->clause_enabled(SLEEP_CLAUSE)) {
        for (const auto& member : ctx.state.side(side).roster) {
            if (&member != &target && !member.fainted() && member.status == MajorStatus::SLEEP) {
                return log(Outcome::STATUS_PREVENTED, SLEEP_CLAUSE);
            }
        }
    }

    const FieldState& field = ctx.state.field;
    if (field.terrain != Terrain::NONE && is_grounded(ctx.view(), target)) {
        const TerrainDef& terrain = ctx.rules.get_terrain(field.terrain);
        if (terrain.blocks_status || (terrain.blocks_sleep && status == MajorStatus::SLEEP)) {
            return log(Outcome::STATUS_PREVENTED, std::string(to_string(field.terrain)) + "_terrain");
        }
    }

    target.status = status;
    target.status_turns = 0;
    return log(Outcome::APPLIED, "");
}

void cure_status(BattleContext& ctx, SideID side, Combatant& target, const std::string& source) {
    if (!target.has_status()) {
        return;
    }
    std::string detail = std::string(to_string(target.status)) + " cured (" + source + ")";
    target.status = MajorStatus::NONE;
    target.status_turns = 0;
    ctx.state.record(side, LogKind::STATUS_APPLIED, Outcome::EXPIRED, target.name, detail);
}

Outcome try_apply_volatile(BattleContext& ctx, SideID side, Combatant& target,
                           Volatile kind, SideID source_side,
                           const std::string& source, const MoveID& move) {
    if (target.fainted()) {
        return Outcome::FAILED;
    }

    auto log = [&](Outcome outcome, const std::string& reason) {
        std::string detail = std::string(to_string(kind)) + " (" + source + ")";
        if (!reason.empty()) detail += ": " + reason;
        ctx.state.record(side, LogKind::STATUS_APPLIED, outcome, target.name, detail);
        return outcome;
    };

    if (target.has_volatile(kind)) {
        return log(Outcome::FAILED, "already active");
    }
    if (kind == Volatile::LEECH_SEED && target.has_type(Type::GRASS)) {
        return log(Outcome::IMMUNE, "type");
    }
    if (source_side != side && substitute_blocks(kind) && target.has_volatile(Volatile::SUBSTITUTE)) {
        return log(Outcome::BLOCKED, "substitute");
    }

    VolatileState state{kind, standard_turns(ctx, kind), move, source_side};

    if (kind == Volatile::ENCORE || kind == Volatile::DISABLE) {
        if (target.last_move.empty() || !target.knows_move(target.last_move)) {
            return log(Outcome::FAILED, "no move to lock");
        }
        state.move = target.last_move;
    }

    if (kind == Volatile::SUBSTITUTE) {
        int cost = fraction_of_max_hp(target, SUBSTITUTE_COST);
        if (target.hp <= cost) {
            return log(Outcome::FAILED, "not enough HP");
        }
        target.take_damage(cost);
        target.substitute_hp = cost;
    }

    target.add_volatile(std::move(state));
    return log(Outcome::APPLIED, "");
}

// ============================================================================
// ACTION TIME
// ============================================================================

bool check_action_prevention(BattleContext& ctx, SideID side, Combatant& user) {
    auto prevented = [&](const std::string& reason) {
        ctx.state.record(side, LogKind::ACTION_PREVENTED, Outcome::STATUS_PREVENTED, user.name, reason);
        return true;
    };

    if (user.status == MajorStatus::FREEZE) {
        if (ctx.rng.chance(FREEZE_THAW_CHANCE)) {
            cure_status(ctx, side, user, "thaw");
        } else {
            return prevented("freeze");
        }
    }

    if (user.status == MajorStatus::SLEEP) {
        if (user.status_turns >= SLEEP_MAX_TURNS || ctx.rng.chance(SLEEP_WAKE_CHANCE)) {
            cure_status(ctx, side, user, "woke up");
        } else {
            user.status_turns++;
            return prevented("sleep");
        }
    }

    if (user.has_volatile(Volatile::FLINCH)) {
        return prevented("flinch");
    }

    if (VolatileState* confusion = user.find_volatile(Volatile::CONFUSION)) {
        confusion->turns++;
        if (confusion->turns > CONFUSION_MAX_TURNS) {
            user.remove_volatile(Volatile::CONFUSION);
            ctx.state.record(side, LogKind::VOLATILE_TICK, Outcome::EXPIRED, user.name, "confusion");
        } else if (ctx.rng.chance(CONFUSION_SELF_HIT_CHANCE)) {
            confusion_self_hit(ctx, side, user);
            return true;
        }
    }

    if (user.status == MajorStatus::PARALYSIS && ctx.rng.chance(PARALYSIS_FULL_STOP_CHANCE)) {
        return prevented("paralysis");
    }

    return false;
}

// ============================================================================
// END OF TURN
// ============================================================================

void end_of_turn_status(BattleContext& ctx, SideID side, Combatant& combatant) {
    if (combatant.fainted()) {
        return;
    }

    int damage = 0;
    switch (combatant.status) {
        case MajorStatus::BURN:
        case MajorStatus::POISON:
            damage = fraction_of_max_hp(combatant, STATUS_DAMAGE_FRACTION);
            break;
        case MajorStatus::BADLY_POISONED:
            combatant.status_turns++;
            damage = fraction_of_max_hp(combatant, STATUS_DAMAGE_FRACTION * combatant.status_turns);
            break;
        default:
            return;
    }

    apply_indirect_damage(ctx, side, combatant, damage, LogKind::STATUS_TICK, to_string(combatant.status));
    record_faint(ctx, side, combatant);
}

void end_of_turn_volatiles(BattleContext& ctx, SideID side, Combatant& combatant) {
    if (combatant.fainted()) {
        return;
    }

    if (combatant.has_volatile(Volatile::LEECH_SEED)) {
        int drained = apply_indirect_damage(ctx, side, combatant,
                                            fraction_of_max_hp(combatant, LEECH_SEED_FRACTION),
                                            LogKind::VOLATILE_TICK, "leech_seed");
        SideID foe = opponent_of(side);
        Combatant& recipient = ctx.state.active(foe);
        if (drained > 0 && !recipient.fainted()) {
            apply_heal(ctx, foe, recipient, drained, LogKind::VOLATILE_TICK, "leech_seed");
        }
        if (record_faint(ctx, side, combatant)) {
            return;
        }
    }

    if (combatant.has_volatile(Volatile::PARTIAL_TRAP)) {
        apply_indirect_damage(ctx, side, combatant,
                              fraction_of_max_hp(combatant, PARTIAL_TRAP_FRACTION),
                              LogKind::VOLATILE_TICK, "partial_trap");
        record_faint(ctx, side, combatant);
    }
}

void end_of_turn_perish(BattleContext& ctx, SideID side, Combatant& combatant) {
    VolatileState* perish = combatant.find_volatile(Volatile::PERISH_SONG);
    if (!perish || combatant.fainted()) {
        return;
    }

    perish->turns--;
    if (perish->turns > 0) {
        ctx.state.record(side, LogKind::VOLATILE_TICK, Outcome::APPLIED, combatant.name,
                         "perish_song " + std::to_string(perish->turns));
        return;
    }

    int lost = combatant.take_damage(combatant.hp);
    LogEntry& entry = ctx.state.record(side, LogKind::VOLATILE_TICK, Outcome::DAMAGED,
                                       combatant.name, "perish_song 0");
    entry.damage = lost;
    record_faint(ctx, side, combatant);
}

void tick_volatiles(BattleContext& ctx, SideID side, Combatant& combatant) {
    std::vector<Volatile> expired;
    for (auto& v : combatant.volatiles) {
        switch (v.kind) {
            case Volatile::TAUNT:
            case Volatile::DISABLE:
            case Volatile::PARTIAL_TRAP:
                if (--v.turns <= 0) expired.push_back(v.kind);
                break;
            case Volatile::ENCORE: {
                const MoveSlot* slot = combatant.find_move(v.move);
                if (--v.turns <= 0 || !slot || slot->pp <= 0) expired.push_back(v.kind);
                break;
            }
            default:
                break;
        }
    }

    for (Volatile kind : expired) {
        combatant.remove_volatile(kind);
        ctx.state.record(side, LogKind::VOLATILE_TICK, Outcome::EXPIRED, combatant.name, to_string(kind));
    }

    combatant.remove_volatile(Volatile::FLINCH);
    combatant.remove_volatile(Volatile::PROTECT);
    if (!combatant.protected_this_turn) {
        combatant.protect_chain = 0;
    }
    combatant.protected_this_turn = false;
    combatant.moved_this_turn = false;
    combatant.physical_damage_taken = 0;
    combatant.special_damage_taken = 0;
}

// ============================================================================
// LEGALITY
// ============================================================================

bool can_use_move(const EffectView& view, const Combatant& user,
                  const Combatant* foe, const MoveSlot& slot) {
    if (!slot.move || slot.pp <= 0) {
        return false;
    }
    const MoveDef& move = *slot.move;

    if (const VolatileState* charging = user.find_volatile(Volatile::CHARGING)) {
        return charging->move == move.id;
    }
    if (move.is_status() && user.has_volatile(Volatile::TAUNT)) {
        return false;
    }
    if (const VolatileState* encore = user.find_volatile(Volatile::ENCORE)) {
        if (encore->move != move.id) return false;
    }
    if (const VolatileState* disable = user.find_volatile(Volatile::DISABLE)) {
        if (disable->move == move.id) return false;
    }
    if (user.has_volatile(Volatile::TORMENT) && user.last_move == move.id) {
        return false;
    }
    if (foe && foe->has_volatile(Volatile::IMPRISON) && foe->knows_move(move.id)) {
        return false;
    }
    if (move.is_status() && view.has(user, EffectHandler::FORBIDS_STATUS_MOVES)) {
        return false;
    }

    if (!user.choice_locked_move.empty() && user.choice_locked_move != move.id &&
        view.item_has(user, EffectHandler::CHOICE_LOCK)) {
        const MoveSlot* locked = user.find_move(user.choice_locked_move);
        if (locked && locked->pp > 0) {
            return false;
        }
    }
    return true;
}

bool can_switch_out(const Combatant& active) {
    return !active.has_volatile(Volatile::TRAPPED) && !active.has_volatile(Volatile::PARTIAL_TRAP);
}

// ============================================================================
// HP AND BOOST HELPERS
// ============================================================================

int fraction_of_max_hp(const Combatant& combatant, double fraction) {
    return std::max(1, floor_amount(combatant.max_hp * fraction));
}

int apply_indirect_damage(BattleContext& ctx, SideID side, Combatant& target,
                          int amount, LogKind kind, const std::string& detail) {
    if (amount <= 0 || target.fainted()) {
        return 0;
    }
    if (ctx.view().ability_has(target, EffectHandler::NO_INDIRECT_DAMAGE)) {
        return 0;
    }

    int dealt = target.take_damage(amount);
    LogEntry& entry = ctx.state.record(side, kind, Outcome::DAMAGED, target.name, detail);
    entry.damage = dealt;
    return dealt;
}

int apply_heal(BattleContext& ctx, SideID side, Combatant& target,
               int amount, LogKind kind, const std::string& detail) {
    int restored = target.heal(amount);
    if (restored > 0) {
        LogEntry& entry = ctx.state.record(side, kind, Outcome::HEALED, target.name, detail);
        entry.damage = restored;
    }
    return restored;
}

int apply_boost(BattleContext& ctx, SideID side, Combatant& target,
                BoostStat stat, int delta, const std::string& source, bool from_foe) {
    if (target.fainted() || delta == 0) {
        return 0;
    }

    EffectView view = ctx.view();
    if (view.ability_has(target, EffectHandler::REVERSES_BOOSTS)) {
        delta = -delta;
    }

    if (delta < 0 && from_foe && view.ability_has(target, EffectHandler::BLOCKS_STAT_DROPS)) {
        ctx.state.record(side, LogKind::ABILITY_TRIGGER, Outcome::BLOCKED, target.name,
                         target.ability + " (" + source + ")");
        return 0;
    }

    int applied = target.change_boost(stat, delta);
    std::string detail = std::string(to_string(stat)) + " " + signed_delta(delta) + " (" + source + ")";
    ctx.state.record(side, LogKind::STAT_CHANGE, applied != 0 ? Outcome::APPLIED : Outcome::FAILED,
                     target.name, detail);

    if (applied < 0) {
        ctx.fire(&EffectHandler::on_stat_lowered, side, target);
    }
    return applied;
}

void apply_boosts(BattleContext& ctx, SideID side, Combatant& target,
                  const std::vector<BoostPair>& boosts, const std::string& source,
                  bool from_foe) {
    for (const auto& [stat, delta] : boosts) {
        apply_boost(ctx, side, target, stat, delta, source, from_foe);
    }
}

bool record_faint(BattleContext& ctx, SideID side, Combatant& combatant) {
    if (!combatant.fainted()) {
        return false;
    }
    if (!combatant.faint_recorded) {
        combatant.faint_recorded = true;
        ctx.state.record(side, LogKind::FAINT, Outcome::FAINTED, combatant.name);
    }
    return true;
}

} // namespace pokesim
