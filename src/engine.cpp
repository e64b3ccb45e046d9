/**
 * pokesim - Engine Implementation
 *
 * Turn orchestration: legal actions, ordering, switching, end of turn
 * and the battle loop. Move resolution lives in move_execution.cpp.
 */

#include "engine.hpp"
#include "status_engine.hpp"
#include "field_effects.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace pokesim {

namespace {

constexpr double PARALYSIS_SPEED_MULTIPLIER = 0.25;
constexpr double TAILWIND_SPEED_MULTIPLIER = 2.0;
constexpr double QUICK_CLAW_CHANCE = 0.2;

constexpr std::array<SideID, 2> A_FIRST = {SIDE_A, SIDE_B};
constexpr std::array<SideID, 2> B_FIRST = {SIDE_B, SIDE_A};

bool contains(const std::vector<BattleAction>& actions, const BattleAction& action) {
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

} // anonymous namespace

BattleEngine::BattleEngine(const RuleTables& rules, FormatRules format)
    : rules_(rules)
    , format_(std::move(format))
{
    register_all_effects(effects_);
}

// ============================================================================
// CORE API
// ============================================================================

std::vector<BattleAction> BattleEngine::get_legal_actions(const BattleState& state, SideID side) const {
    std::vector<BattleAction> actions;
    if (state.is_over()) {
        return actions;
    }

    const SideState& own = state.side(side);
    const Combatant& active = own.active_combatant();
    if (active.fainted()) {
        return actions;
    }
    const Combatant& foe = state.active(opponent_of(side));

    // A charging combatant must release its move
    if (const VolatileState* charging = active.find_volatile(Volatile::CHARGING)) {
        for (size_t i = 0; i < active.moves.size(); i++) {
            if (active.moves[i].move && active.moves[i].move->id == charging->move) {
                actions.push_back(BattleAction::move(side, static_cast<int>(i)));
                return actions;
            }
        }
    }

    EffectView v = view(state);
    bool tera = tera_available(state, side);
    for (size_t i = 0; i < active.moves.size(); i++) {
        if (!can_use_move(v, active, &foe, active.moves[i])) {
            continue;
        }
        actions.push_back(BattleAction::move(side, static_cast<int>(i)));
        if (tera) {
            actions.push_back(BattleAction::move(side, static_cast<int>(i), true));
        }
    }

    if (actions.empty()) {
        actions.push_back(BattleAction::struggle(side));
    }

    if (can_switch_out(active)) {
        for (int index : own.switch_candidates()) {
            actions.push_back(BattleAction::switch_to(side, index));
        }
    }

    return actions;
}

bool BattleEngine::is_legal(const BattleState& state, const BattleAction& action) const {
    if (action.side != SIDE_A && action.side != SIDE_B) {
        return false;
    }
    return contains(get_legal_actions(state, action.side), action);
}

void BattleEngine::run_turn(BattleState& state, const BattleAction& action_a,
                            const BattleAction& action_b, RandomSource& rng,
                            ActionSource* source_a, ActionSource* source_b) const {
    if (state.is_over()) {
        return;
    }
    if (!state.started) {
        start_battle(state, rng);
        if (state.is_over()) {
            state.phase = TurnPhase::BATTLE_OVER;
            return;
        }
    }

    BattleContext ctx = context(state, rng);
    state.turn++;
    state.phase = TurnPhase::AWAITING_ACTIONS;

    std::array<BattleAction, 2> actions = {
        sanitize_action(state, SIDE_A, action_a),
        sanitize_action(state, SIDE_B, action_b)
    };
    state.queued_actions = {actions[SIDE_A], actions[SIDE_B]};

    // Tera happens before either action
    apply_tera(ctx, actions[SIDE_A]);
    apply_tera(ctx, actions[SIDE_B]);

    std::array<SideID, 2> order = determine_order(state, actions[SIDE_A], actions[SIDE_B], rng);
    state.phase = TurnPhase::ORDER_DETERMINED;

    // Whoever is active now owns the chosen action
    std::array<int, 2> actor = {state.side(SIDE_A).active, state.side(SIDE_B).active};

    for (size_t step = 0; step < order.size(); step++) {
        state.phase = step == 0 ? TurnPhase::EXECUTING_FIRST : TurnPhase::EXECUTING_SECOND;
        SideID side = order[step];
        const SideState& own = state.side(side);
        if (own.active != actor[side] || own.active_combatant().fainted()) {
            continue;
        }

        execute_action(ctx, actions[side]);
        resolve_pending_switches(ctx, source_a, source_b);

        check_winner(state);
        if (state.is_over()) {
            state.queued_actions = {std::nullopt, std::nullopt};
            state.phase = TurnPhase::BATTLE_OVER;
            state.check_invariants();
            return;
        }
    }

    state.phase = TurnPhase::END_OF_TURN;
    run_end_of_turn(ctx);

    check_winner(state);
    if (!state.is_over()) {
        settle_switches(ctx, source_a, source_b);
        check_winner(state);
    }

    state.queued_actions = {std::nullopt, std::nullopt};
    state.phase = state.is_over() ? TurnPhase::BATTLE_OVER : TurnPhase::CONTINUE;
    state.check_invariants();
}

BattleResult BattleEngine::simulate(BattleState& state, ActionSource& source_a,
                                    ActionSource& source_b, int max_turns,
                                    RandomSource& rng) const {
    if (max_turns <= 0) {
        max_turns = format_.max_turns;
    }

    if (!state.started) {
        start_battle(state, rng);
    }

    while (!state.is_over() && state.turn < max_turns) {
        std::vector<BattleAction> legal_a = get_legal_actions(state, SIDE_A);
        std::vector<BattleAction> legal_b = get_legal_actions(state, SIDE_B);
        if (legal_a.empty() || legal_b.empty()) {
            break;
        }
        BattleAction action_a = source_a.choose_action(state, SIDE_A, legal_a);
        BattleAction action_b = source_b.choose_action(state, SIDE_B, legal_b);
        run_turn(state, action_a, action_b, rng, &source_a, &source_b);
    }

    check_winner(state);
    if (!state.is_over()) {
        // Turn cap reached
        state.winner = BattleWinner::TIE;
    }
    state.phase = TurnPhase::BATTLE_OVER;

    BattleResult result;
    result.winner = *state.winner;
    result.turn_count = state.turn;
    result.log = state.log;
    return result;
}

// ============================================================================
// BATTLE SETUP
// ============================================================================

BattleState BattleEngine::create_battle(const Roster& roster_a, const Roster& roster_b) const {
    if (roster_a.empty() || roster_b.empty()) {
        throw std::invalid_argument("create_battle: both rosters need at least one member");
    }
    if (roster_a.members.size() > static_cast<size_t>(MAX_ROSTER_SIZE) ||
        roster_b.members.size() > static_cast<size_t>(MAX_ROSTER_SIZE)) {
        throw std::invalid_argument("create_battle: rosters hold at most " +
                                    std::to_string(MAX_ROSTER_SIZE) + " members");
    }
    bool species_clause = format_.clause_enabled(SPECIES_CLAUSE);

    BattleState state;
    const std::array<const Roster*, 2> rosters = {&roster_a, &roster_b};

    for (SideID side : {SIDE_A, SIDE_B}) {
        SideState& own = state.side(side);
        const Roster& roster = *rosters[side];
        if (!roster.name.empty()) {
            own.name = roster.name;
        }

        std::unordered_set<std::string> seen_species;
        for (const auto& spec : roster.members) {
            if (species_clause && !seen_species.insert(RuleTables::normalize_id(spec.species)).second) {
                state.record(side, LogKind::FALLBACK, Outcome::FALLBACK, spec.species,
                             "species " + spec.species + " repeated; dropped by " + SPECIES_CLAUSE);
                continue;
            }
            std::vector<std::string> fallbacks;
            own.roster.push_back(build_combatant(rules_, spec, format_, fallbacks));
            for (const auto& note : fallbacks) {
                state.record(side, LogKind::FALLBACK, Outcome::FALLBACK, own.roster.back().name, note);
            }
        }
        own.active = 0;
    }

    state.check_invariants();
    return state;
}

void BattleEngine::start_battle(BattleState& state, RandomSource& rng) const {
    if (state.started) {
        return;
    }
    state.started = true;
    BattleContext ctx = context(state, rng);

    for (SideID side : {SIDE_A, SIDE_B}) {
        state.record(side, LogKind::SWITCH, Outcome::SWITCHED, state.active(side).name, "lead");
    }

    // Switch-in effects run in speed order, ties to side A
    std::array<SideID, 2> order = effective_speed(state, SIDE_B) > effective_speed(state, SIDE_A)
                                  ? B_FIRST : A_FIRST;
    for (SideID side : order) {
        SideID foe_side = opponent_of(side);
        Combatant& lead = state.active(side);
        if (!lead.fainted()) {
            ctx.fire(&EffectHandler::on_switch_in, side, lead, nullptr,
                     &state.active(foe_side), foe_side);
        }
    }

    settle_switches(ctx, nullptr, nullptr);
    check_winner(state);
}

// ============================================================================
// WIN CONDITION CHECKS
// ============================================================================

void BattleEngine::check_winner(BattleState& state) const {
    if (state.is_over()) {
        return;
    }
    bool a_out = state.side(SIDE_A).defeated();
    bool b_out = state.side(SIDE_B).defeated();

    if (a_out && b_out) {
        state.winner = BattleWinner::TIE;
    } else if (a_out) {
        state.winner = BattleWinner::SIDE_B;
    } else if (b_out) {
        state.winner = BattleWinner::SIDE_A;
    }
}

// ============================================================================
// TURN ORDER
// ============================================================================

int BattleEngine::action_priority(const BattleState& state, const BattleAction& action) const {
    if (action.is_switch()) {
        return SWITCH_PRIORITY;
    }
    const Combatant& user = state.active(action.side);
    const Combatant& foe = state.active(opponent_of(action.side));
    const MoveDef& move = move_for(state, action);
    return move.priority + view(state).priority_bonus(user, &foe, move);
}

double BattleEngine::effective_speed(const BattleState& state, SideID side) const {
    const Combatant& c = state.active(side);
    const Combatant& foe = state.active(opponent_of(side));

    double speed = c.stat(Stat::SPE) * boost_multiplier(c.boost(BoostStat::SPE));
    speed = view(state).modify(&EffectHandler::speed, c, &foe, nullptr, Type::TYPELESS, speed);
    if (c.status == MajorStatus::PARALYSIS) {
        speed *= PARALYSIS_SPEED_MULTIPLIER;
    }
    if (state.side(side).tailwind()) {
        speed *= TAILWIND_SPEED_MULTIPLIER;
    }
    return speed;
}

std::array<SideID, 2> BattleEngine::determine_order(BattleState& state, const BattleAction& action_a,
                                                    const BattleAction& action_b,
                                                    RandomSource& rng) const {
    int priority_a = action_priority(state, action_a);
    int priority_b = action_priority(state, action_b);
    if (priority_a != priority_b) {
        return priority_a > priority_b ? A_FIRST : B_FIRST;
    }

    // Quick Claw: front of the bracket
    EffectView v = view(state);
    auto quick_claw = [&](SideID side, const BattleAction& action) {
        if (!action.is_move()) {
            return false;
        }
        const Combatant& holder = state.active(side);
        BoundEffect item = v.item(holder);
        if (!item.has(EffectHandler::MAY_ACT_FIRST) ||
            !rng.chance(item.def->param_double("chance", QUICK_CLAW_CHANCE))) {
            return false;
        }
        state.record(side, LogKind::ITEM_TRIGGER, Outcome::APPLIED, holder.name, holder.item + " (acts first)");
        return true;
    };
    bool claw_a = quick_claw(SIDE_A, action_a);
    bool claw_b = quick_claw(SIDE_B, action_b);
    if (claw_a != claw_b) {
        return claw_a ? A_FIRST : B_FIRST;
    }

    double speed_a = effective_speed(state, SIDE_A);
    double speed_b = effective_speed(state, SIDE_B);
    if (speed_a != speed_b) {
        bool a_first = state.field.trick_room() ? speed_a < speed_b : speed_a > speed_b;
        return a_first ? A_FIRST : B_FIRST;
    }

    return rng.chance(0.5) ? A_FIRST : B_FIRST;
}

// ============================================================================
// HELPERS
// ============================================================================

const MoveDef& BattleEngine::move_for(const BattleState& state, const BattleAction& action) const {
    if (action.is_struggle()) {
        return rules_.struggle();
    }
    const Combatant& user = state.active(action.side);
    return *user.moves.at(static_cast<size_t>(action.index)).move;
}

bool BattleEngine::tera_available(const BattleState& state, SideID side) const {
    const SideState& own = state.side(side);
    const Combatant& active = own.active_combatant();
    return format_.tera_allowed && !own.tera_used && active.tera_type.has_value() && !active.terastallized;
}

// ============================================================================
// ACTION APPLICATION
// ============================================================================

BattleAction BattleEngine::sanitize_action(BattleState& state, SideID side, const BattleAction& action) const {
    BattleAction requested = action;
    requested.side = side;

    std::vector<BattleAction> legal = get_legal_actions(state, side);
    if (contains(legal, requested)) {
        return requested;
    }

    if (legal.empty()) {
        // Nothing to act with; execution skips a fainted active
        return requested;
    }

    BattleAction replacement = legal.front();
    if (requested.terastallize) {
        BattleAction stripped = requested;
        stripped.terastallize = false;
        if (contains(legal, stripped)) {
            replacement = stripped;
        }
    }

    state.record(side, LogKind::FALLBACK, Outcome::FALLBACK, state.active(side).name,
                 "illegal action " + requested.to_string() + "; using " + replacement.to_string());
    return replacement;
}

void BattleEngine::apply_tera(BattleContext& ctx, const BattleAction& action) const {
    if (!action.terastallize || !tera_available(ctx.state, action.side)) {
        return;
    }
    SideState& own = ctx.state.side(action.side);
    Combatant& active = own.active_combatant();
    if (!active.terastallize()) {
        return;
    }
    own.tera_used = true;
    ctx.state.record(action.side, LogKind::TERA, Outcome::APPLIED, active.name, to_string(*active.tera_type));
}

void BattleEngine::execute_action(BattleContext& ctx, const BattleAction& action) const {
    if (action.is_switch()) {
        perform_switch(ctx, action.side, action.index);
        return;
    }

    Combatant& user = ctx.state.active(action.side);
    if (check_action_prevention(ctx, action.side, user)) {
        user.moved_this_turn = true;
        user.remove_volatile(Volatile::CHARGING);
        return;
    }
    execute_move(ctx, action.side, action.index);
}

// ============================================================================
// SWITCHING
// ============================================================================

void BattleEngine::perform_switch(BattleContext& ctx, SideID side, int roster_index) const {
    BattleState& state = ctx.state;
    SideState& own = state.side(side);
    if (roster_index == own.active || roster_index < 0 ||
        roster_index >= static_cast<int>(own.roster.size()) ||
        own.roster[static_cast<size_t>(roster_index)].fainted()) {
        return;
    }

    SideID foe_side = opponent_of(side);
    Combatant& outgoing = own.active_combatant();
    if (!outgoing.fainted()) {
        ctx.fire(&EffectHandler::on_switch_out, side, outgoing);
    }
    release_sustained_weather(ctx, side);
    outgoing.on_switch_out();

    // Traps set by the outgoing combatant end with it
    Combatant& foe = state.active(foe_side);
    for (Volatile trap : {Volatile::TRAPPED, Volatile::PARTIAL_TRAP}) {
        const VolatileState* v = foe.find_volatile(trap);
        if (v && v->source == side) {
            foe.remove_volatile(trap);
        }
    }

    own.active = roster_index;
    Combatant& incoming = own.active_combatant();
    LogEntry& entry = state.record(side, LogKind::SWITCH, Outcome::SWITCHED, incoming.name, "in");
    entry.target = outgoing.name;

    apply_switch_in_hazards(ctx, side, incoming);
    if (!record_faint(ctx, side, incoming)) {
        ctx.fire(&EffectHandler::on_switch_in, side, incoming, nullptr, &foe, foe_side);
    }
}

int BattleEngine::pick_replacement(BattleContext& ctx, SideID side, ActionSource* source) const {
    std::vector<int> candidates = ctx.state.side(side).switch_candidates();
    if (!source) {
        return candidates.front();
    }

    int pick = source->choose_replacement(ctx.state, side, candidates);
    if (std::find(candidates.begin(), candidates.end(), pick) == candidates.end()) {
        ctx.state.record(side, LogKind::FALLBACK, Outcome::FALLBACK, ctx.state.active(side).name,
                         "invalid replacement " + std::to_string(pick) + "; using " +
                         std::to_string(candidates.front()));
        pick = candidates.front();
    }
    return pick;
}

void BattleEngine::resolve_pending_switches(BattleContext& ctx, ActionSource* source_a,
                                            ActionSource* source_b) const {
    const std::array<ActionSource*, 2> sources = {source_a, source_b};

    for (SideID side : {SIDE_A, SIDE_B}) {
        SideState& own = ctx.state.side(side);

        if (own.pending_forced_switch) {
            own.pending_forced_switch = false;
            std::vector<int> candidates = own.switch_candidates();
            if (!candidates.empty() && !own.active_combatant().fainted()) {
                int pick = ctx.rng.next_int(0, static_cast<int>(candidates.size()) - 1);
                perform_switch(ctx, side, candidates[static_cast<size_t>(pick)]);
                own.pending_self_switch = false;
            }
        }

        if (own.pending_self_switch) {
            own.pending_self_switch = false;
            if (!own.switch_candidates().empty() && !own.active_combatant().fainted()) {
                perform_switch(ctx, side, pick_replacement(ctx, side, sources[side]));
            }
        }
    }
}

void BattleEngine::replace_fainted(BattleContext& ctx, ActionSource* source_a,
                                   ActionSource* source_b) const {
    const std::array<ActionSource*, 2> sources = {source_a, source_b};

    for (SideID side : {SIDE_A, SIDE_B}) {
        SideState& own = ctx.state.side(side);
        // Hazards may knock out the replacement too
        while (own.active_combatant().fainted() && !own.switch_candidates().empty()) {
            perform_switch(ctx, side, pick_replacement(ctx, side, sources[side]));
        }
    }
}

void BattleEngine::settle_switches(BattleContext& ctx, ActionSource* source_a,
                                   ActionSource* source_b) const {
    // A replacement's switch-in can queue a switch on either side (Intimidate
    // into Eject Pack), and that switch-in can faint on hazards in turn
    while (true) {
        replace_fainted(ctx, source_a, source_b);
        bool pending = false;
        for (SideID side : {SIDE_A, SIDE_B}) {
            const SideState& own = ctx.state.side(side);
            pending = pending || own.pending_forced_switch || own.pending_self_switch;
        }
        if (!pending) {
            return;
        }
        resolve_pending_switches(ctx, source_a, source_b);
    }
}

// ============================================================================
// END OF TURN
// ============================================================================

void BattleEngine::run_end_of_turn(BattleContext& ctx) const {
    BattleState& state = ctx.state;

    for (SideID side : {SIDE_A, SIDE_B}) {
        end_of_turn_status(ctx, side, state.active(side));
    }
    for (SideID side : {SIDE_A, SIDE_B}) {
        end_of_turn_volatiles(ctx, side, state.active(side));
    }

    end_of_turn_weather(ctx);
    end_of_turn_terrain(ctx);

    for (SideID side : {SIDE_A, SIDE_B}) {
        Combatant& active = state.active(side);
        if (!active.fainted()) {
            SideID foe_side = opponent_of(side);
            ctx.fire(&EffectHandler::on_end_of_turn, side, active, nullptr,
                     &state.active(foe_side), foe_side);
        }
    }

    for (SideID side : {SIDE_A, SIDE_B}) {
        end_of_turn_perish(ctx, side, state.active(side));
    }

    tick_field_durations(ctx);
    for (SideID side : {SIDE_A, SIDE_B}) {
        tick_volatiles(ctx, side, state.active(side));
    }
}

// ============================================================================
// BATTLE LOOP
// ============================================================================

BattleResult simulate_battle(const RuleTables& rules, const Roster& roster_a,
                             const Roster& roster_b, int max_turns, uint64_t seed,
                             ActionSource* source_a, ActionSource* source_b,
                             const FormatRules& format) {
    BattleEngine engine(rules, format);
    BattleState state = engine.create_battle(roster_a, roster_b);
    Mt19937Random rng(seed);

    RandomActionSource default_a(seed * 2 + 1);
    RandomActionSource default_b(seed * 2 + 2);

    return engine.simulate(state, source_a ? *source_a : default_a,
                           source_b ? *source_b : default_b, max_turns, rng);
}

} // namespace pokesim
