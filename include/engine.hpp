/**
 * pokesim - Battle Engine Interface
 *
 * This is the primary interface for the battle engine.
 * Provides get_legal_actions() and run_turn() for self-play drivers, and
 * simulate() / simulate_battle() for complete battles.
 */

#pragma once

#include "battle_context.hpp"
#include "format_rules.hpp"
#include "roster.hpp"
#include "action_source.hpp"

namespace pokesim {

/**
 * BattleResult - Outcome of a complete battle.
 */
struct BattleResult {
    BattleWinner winner = BattleWinner::TIE;
    int turn_count = 0;
    BattleLog log;
};

/**
 * BattleEngine - The turn orchestrator.
 *
 * Holds the rule tables, the format and the effect registry; all battle
 * state is passed in. Thread-safe for concurrent battles as long as each
 * battle owns its BattleState and RandomSource.
 */
class BattleEngine {
public:
    explicit BattleEngine(const RuleTables& rules, FormatRules format = {});
    ~BattleEngine() = default;

    BattleEngine(const BattleEngine&) = delete;
    BattleEngine& operator=(const BattleEngine&) = delete;

    // ========================================================================
    // CORE API
    // ========================================================================

    /**
     * Get all legal actions for one side in the current state.
     *
     * Usable moves (plus their Tera variants while Tera is available),
     * Struggle when no move is usable, and switches to each healthy bench
     * member unless the active is trapped or charging.
     */
    std::vector<BattleAction> get_legal_actions(const BattleState& state, SideID side) const;

    bool is_legal(const BattleState& state, const BattleAction& action) const;

    /**
     * Resolve one full turn in place: Tera, ordering, both actions, end of
     * turn and faint replacement. Illegal actions are replaced by a legal
     * default and logged as fallback.
     *
     * Sources, when given, choose mid-turn and end-of-turn replacements;
     * otherwise the first candidate comes in.
     */
    void run_turn(BattleState& state, const BattleAction& action_a, const BattleAction& action_b,
                  RandomSource& rng, ActionSource* source_a = nullptr,
                  ActionSource* source_b = nullptr) const;

    /**
     * Run turns until a side is defeated or `max_turns` turns have run.
     */
    BattleResult simulate(BattleState& state, ActionSource& source_a, ActionSource& source_b,
                          int max_turns, RandomSource& rng) const;

    // ========================================================================
    // BATTLE SETUP
    // ========================================================================

    /**
     * Build a battle from two rosters, applying format gating. Throws
     * std::invalid_argument when a roster is empty.
     */
    BattleState create_battle(const Roster& roster_a, const Roster& roster_b) const;

    /**
     * Send out both leads and run their switch-in effects in speed order.
     * Called by run_turn() on the first turn if not done already.
     */
    void start_battle(BattleState& state, RandomSource& rng) const;

    // ========================================================================
    // WIN CONDITION CHECKS
    // ========================================================================

    /**
     * Set the winner when a side has no healthy combatant left
     * (both at once is a tie).
     */
    void check_winner(BattleState& state) const;

    // ========================================================================
    // TURN ORDER
    // ========================================================================

    /**
     * Priority bracket: SWITCH_PRIORITY for switches, otherwise move
     * priority plus ability / item bonuses.
     */
    int action_priority(const BattleState& state, const BattleAction& action) const;

    /**
     * Speed used for ordering: stat, stage, speed modifiers, paralysis
     * and tailwind.
     */
    double effective_speed(const BattleState& state, SideID side) const;

    /**
     * Order two actions: priority, Quick Claw, speed (inverted under
     * Trick Room), then a coin flip. Draws only when needed.
     */
    std::array<SideID, 2> determine_order(BattleState& state, const BattleAction& action_a,
                                          const BattleAction& action_b, RandomSource& rng) const;

    static constexpr int SWITCH_PRIORITY = 7;

    // ========================================================================
    // ACCESS
    // ========================================================================

    const RuleTables& rules() const { return rules_; }
    const FormatRules& format() const { return format_; }
    const EffectRegistry& effects() const { return effects_; }

private:
    const RuleTables& rules_;
    FormatRules format_;
    EffectRegistry effects_;

    EffectView view(const BattleState& state) const {
        return EffectView(rules_, effects_, state.field);
    }

    BattleContext context(BattleState& state, RandomSource& rng) const {
        return BattleContext{state, rules_, effects_, rng, &format_};
    }

    const MoveDef& move_for(const BattleState& state, const BattleAction& action) const;
    bool tera_available(const BattleState& state, SideID side) const;

    // ========================================================================
    // ACTION APPLICATION
    // ========================================================================

    BattleAction sanitize_action(BattleState& state, SideID side, const BattleAction& action) const;
    void apply_tera(BattleContext& ctx, const BattleAction& action) const;
    void execute_action(BattleContext& ctx, const BattleAction& action) const;

    // ========================================================================
    // SWITCHING
    // ========================================================================

    void perform_switch(BattleContext& ctx, SideID side, int roster_index) const;
    void resolve_pending_switches(BattleContext& ctx, ActionSource* source_a,
                                  ActionSource* source_b) const;
    int pick_replacement(BattleContext& ctx, SideID side, ActionSource* source) const;
    void replace_fainted(BattleContext& ctx, ActionSource* source_a, ActionSource* source_b) const;
    void settle_switches(BattleContext& ctx, ActionSource* source_a, ActionSource* source_b) const;

    // ========================================================================
    // END OF TURN
    // ========================================================================

    void run_end_of_turn(BattleContext& ctx) const;

    // ========================================================================
    // MOVE EXECUTION (move_execution.cpp)
    // ========================================================================

    void execute_move(BattleContext& ctx, SideID side, int slot_index) const;

    /**
     * Protect, Magic Bounce, Good as Gold and absorb checks.
     * @return true if the move was stopped
     */
    bool blocked_by_target(BattleContext& ctx, SideID side, Combatant& user,
                           Combatant& target, const MoveDef& move, Type move_type) const;
    bool bounced_by_target(BattleContext& ctx, SideID side, Combatant& user,
                           Combatant& target, const MoveDef& move) const;

    /**
     * Damaging move body: hits, secondaries, drain/recoil, hooks.
     */
    void execute_damaging_move(BattleContext& ctx, SideID side, Combatant& user,
                               Combatant& target, const MoveDef& move,
                               std::optional<double> accuracy_roll) const;

    /**
     * Status move body: status, volatiles, boosts, healing, field.
     */
    void execute_status_move(BattleContext& ctx, SideID side, Combatant& user,
                             Combatant& target, const MoveDef& move) const;

    int fixed_damage(const Combatant& user, const Combatant& target, const MoveDef& move) const;
    int roll_hit_count(BattleContext& ctx, const Combatant& user, const MoveDef& move) const;
    void apply_secondary(BattleContext& ctx, SideID side, Combatant& user,
                         Combatant& target, const MoveDef& move) const;
};

/**
 * One complete battle from rosters: builds the state, seeds an
 * Mt19937Random from `seed` and runs to completion. Missing sources
 * default to random policies seeded from `seed`.
 */
BattleResult simulate_battle(const RuleTables& rules, const Roster& roster_a,
                             const Roster& roster_b, int max_turns, uint64_t seed,
                             ActionSource* source_a = nullptr, ActionSource* source_b = nullptr,
                             const FormatRules& format = {});

} // namespace pokesim
