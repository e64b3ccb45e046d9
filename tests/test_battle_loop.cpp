/**
 * Tests for battle setup, legal actions, the turn loop and its outputs
 */

#include <sstream>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "test_helpers.hpp"
#include "replay_writer.hpp"

using namespace pokesim;
using namespace pokesim_test;

namespace {

Roster glass_pair() {
    return roster({member("Glass", {"Swords Dance"}), member("Glass", {"Swords Dance"})}, "Glass Pair");
}

} // anonymous namespace

// ============================================================================
// SETUP
// ============================================================================

TEST(Battle, CreateRejectsEmptyRoster) {
    RuleTables rules = standard_rules();
    BattleEngine engine(rules);

    bool thrown = false;
    try {
        engine.create_battle(Roster{}, roster({member("Normie", {"Body Slam"})}));
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

TEST(Battle, CreateRejectsOversizedRoster) {
    RuleTables rules = standard_rules();
    BattleEngine engine(rules);
    std::vector<CombatantSpec> seven(MAX_ROSTER_SIZE + 1, member("Normie", {"Body Slam"}));

    bool thrown = false;
    try {
        engine.create_battle(roster(seven), roster({member("Normie", {"Body Slam"})}));
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

TEST(Battle, SpeciesClauseDropsRepeats) {
    RuleTables rules = standard_rules();
    FormatRules format;
    format.clauses[SPECIES_CLAUSE] = true;
    BattleEngine engine(rules, format);

    BattleState state = engine.create_battle(roster({member("Normie", {"Body Slam"})}), glass_pair());
    TEST_ASSERT_EQ(1u, state.side(SIDE_B).roster.size());
    TEST_ASSERT_TRUE(log_detail_contains(state, LogKind::FALLBACK, SPECIES_CLAUSE));

    BattleState open = BattleEngine(rules).create_battle(roster({member("Normie", {"Body Slam"})}), glass_pair());
    TEST_ASSERT_EQ(2u, open.side(SIDE_B).roster.size());
}

TEST(Battle, UnknownSpeciesFallsBack) {
    Arena arena(roster({member("Missingno", {"Body Slam"})}),
                roster({member("Normie", {"Body Slam"})}));

    TEST_ASSERT_TRUE(arena.active(SIDE_A).used_fallback_species);
    TEST_ASSERT_EQ(std::string("Missingno"), arena.active(SIDE_A).name);
    TEST_ASSERT_TRUE(log_detail_contains(arena.state, LogKind::FALLBACK, "unknown species Missingno"));
}

TEST(Battle, StartLogsLeads) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Leafy", {"Body Slam"})}, "Greens"));
    arena.start();

    std::vector<LogEntry> leads = arena.state.log.filter(LogKind::SWITCH);
    TEST_ASSERT_EQ(2u, leads.size());
    TEST_ASSERT_EQ(std::string("lead"), leads[0].detail);
    TEST_ASSERT_EQ(std::string("Leafy"), leads[1].actor);
    TEST_ASSERT_EQ(std::string("Greens"), arena.state.side(SIDE_B).name);
    TEST_ASSERT_TRUE(arena.state.started);

    // A second start is a no-op
    arena.start();
    TEST_ASSERT_EQ(2u, arena.state.log.count(LogKind::SWITCH));
}

// ============================================================================
// LEGAL ACTIONS
// ============================================================================

TEST(Battle, LegalActionsIncludeSwitches) {
    Arena arena(roster({member("Normie", {"Body Slam", "Recover"}), member("Leafy", {"Body Slam"})}),
                roster({member("Normie", {"Body Slam"})}));

    std::vector<BattleAction> legal = arena.engine.get_legal_actions(arena.state, SIDE_A);
    TEST_ASSERT_EQ(3u, legal.size());
    TEST_ASSERT_TRUE(legal[2] == BattleAction::switch_to(SIDE_A, 1));
    TEST_ASSERT_TRUE(arena.engine.is_legal(arena.state, BattleAction::move(SIDE_A, 1)));
    TEST_ASSERT_FALSE(arena.engine.is_legal(arena.state, BattleAction::move(SIDE_A, 2)));
    TEST_ASSERT_FALSE(arena.engine.is_legal(arena.state, BattleAction::switch_to(SIDE_A, 0)));
}

TEST(Battle, TrappedCannotSwitch) {
    Arena arena(roster({member("Normie", {"Body Slam"}), member("Leafy", {"Body Slam"})}),
                roster({member("Normie", {"Body Slam"})}));
    arena.active(SIDE_A).add_volatile(VolatileState{Volatile::TRAPPED, 0, MoveID{}, SIDE_B});

    std::vector<BattleAction> legal = arena.engine.get_legal_actions(arena.state, SIDE_A);
    TEST_ASSERT_EQ(1u, legal.size());
    TEST_ASSERT_TRUE(legal.front().is_move());
}

TEST(Battle, TauntRemovesStatusMoves) {
    Arena arena(roster({member("Normie", {"Swords Dance", "Body Slam"})}),
                roster({member("Normie", {"Body Slam"})}));
    arena.active(SIDE_A).add_volatile(VolatileState{Volatile::TAUNT, 3, MoveID{}, SIDE_B});

    std::vector<BattleAction> legal = arena.engine.get_legal_actions(arena.state, SIDE_A);
    TEST_ASSERT_EQ(1u, legal.size());
    TEST_ASSERT_EQ(1, legal.front().index);
}

TEST(Battle, TeraDoublesMoveChoices) {
    FormatRules format;
    format.tera_allowed = true;
    CombatantSpec fiery = member("Normie", {"Body Slam"});
    fiery.tera_type = Type::FIRE;
    Arena arena(roster({fiery}), roster({member("Normie", {"Swords Dance"})}), format);

    std::vector<BattleAction> legal = arena.engine.get_legal_actions(arena.state, SIDE_A);
    TEST_ASSERT_EQ(2u, legal.size());
    TEST_ASSERT_TRUE(legal[1].terastallize);

    arena.turn(BattleAction::move(SIDE_A, 0, true), BattleAction::move(SIDE_B, 0));
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::TERA, Outcome::APPLIED));
    TEST_ASSERT_TRUE(arena.state.side(SIDE_A).tera_used);
    TEST_ASSERT_TRUE(arena.active(SIDE_A).terastallized);
    TEST_ASSERT_EQ(1u, arena.engine.get_legal_actions(arena.state, SIDE_A).size());
}

TEST(Battle, TeraIgnoredWhenFormatForbids) {
    CombatantSpec fiery = member("Normie", {"Body Slam"});
    fiery.tera_type = Type::FIRE;
    Arena arena(roster({fiery}), roster({member("Normie", {"Swords Dance"})}));
    TEST_ASSERT_EQ(1u, arena.engine.get_legal_actions(arena.state, SIDE_A).size());

    arena.turn(BattleAction::move(SIDE_A, 0, true), BattleAction::move(SIDE_B, 0));
    TEST_ASSERT_FALSE(arena.active(SIDE_A).terastallized);
    TEST_ASSERT_TRUE(log_detail_contains(arena.state, LogKind::FALLBACK, "using A:move(0)"));
}

// ============================================================================
// TURN LOOP
// ============================================================================

TEST(Battle, IllegalActionUsesFirstLegal) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.turn(BattleAction::move(SIDE_A, 3), BattleAction::move(SIDE_B, 0));

    TEST_ASSERT_TRUE(log_detail_contains(arena.state, LogKind::FALLBACK,
                                         "illegal action A:move(3); using A:move(0)"));
    TEST_ASSERT_FALSE(arena.active(SIDE_B).at_full_hp());
}

TEST(Battle, WinnerWhenBothSidesFaint) {
    Combatant a = make_combatant("Left");
    Combatant b = make_combatant("Right");
    a.hp = 0;
    b.hp = 0;
    BattleState state = make_state(a, b);

    RuleTables rules = standard_rules();
    BattleEngine engine(rules);
    engine.check_winner(state);
    TEST_ASSERT_TRUE(state.winner == BattleWinner::TIE);
    TEST_ASSERT_TRUE(engine.get_legal_actions(state, SIDE_A).empty());
}

TEST(Battle, FaintedActiveIsReplaced) {
    RuleTables rules = standard_rules();
    BattleEngine engine(rules);
    BattleState state = engine.create_battle(roster({member("Normie", {"Body Slam"})}), glass_pair());
    FirstLegalActionSource first_a;
    FirstLegalActionSource first_b;
    ScriptedRandom rng;

    BattleResult result = engine.simulate(state, first_a, first_b, 10, rng);
    TEST_ASSERT_TRUE(result.winner == BattleWinner::SIDE_A);
    TEST_ASSERT_EQ(2, result.turn_count);
    TEST_ASSERT_EQ(2u, result.log.count(LogKind::FAINT));
    TEST_ASSERT_TRUE(state.phase == TurnPhase::BATTLE_OVER);
}

TEST(Battle, ChainedSwitchIntoHazardsIsReplaced) {
    // A's replacement Intimidates, B's Eject Pack pulls a 1 HP member into Stealth Rock
    Arena arena(roster({member("Glass", {"Swords Dance"}), member("Normie", {"Body Slam"}, "Intimidate")}),
                roster({member("Normie", {"Body Slam"}, "", "Eject Pack"), member("Leafy", {"Body Slam"})}));
    arena.rules.add_item(make_effect("Eject Pack", "eject_pack"));
    arena.state.side(SIDE_A).roster[0].hp = 1;
    arena.state.side(SIDE_B).roster[1].hp = 1;
    arena.state.side(SIDE_B).hazards.stealth_rock = true;

    arena.turn(0, 0);

    const SideState& b = arena.state.side(SIDE_B);
    TEST_ASSERT_TRUE(b.roster[1].fainted());
    TEST_ASSERT_EQ(0, b.active);
    TEST_ASSERT_FALSE(arena.active(SIDE_B).fainted());
    TEST_ASSERT_TRUE(arena.active(SIDE_B).item.empty());
    TEST_ASSERT_FALSE(arena.state.is_over());
    TEST_ASSERT_EQ(2u, arena.state.log.count(LogKind::FAINT));
    TEST_ASSERT_FALSE(arena.engine.get_legal_actions(arena.state, SIDE_B).empty());
}

TEST(Battle, InvalidReplacementFallsBack) {
    RuleTables rules = standard_rules();
    BattleEngine engine(rules);
    BattleState state = engine.create_battle(roster({member("Normie", {"Body Slam"})}), glass_pair());
    FirstLegalActionSource first_a;
    ScriptedActionSource scripted_b({}, {5});
    ScriptedRandom rng;

    engine.simulate(state, first_a, scripted_b, 10, rng);
    TEST_ASSERT_TRUE(log_detail_contains(state, LogKind::FALLBACK, "invalid replacement 5; using 1"));
    TEST_ASSERT_TRUE(state.winner == BattleWinner::SIDE_A);
}

TEST(Battle, TurnCapEndsInTie) {
    RuleTables rules = standard_rules();
    BattleEngine engine(rules);
    BattleState state = engine.create_battle(roster({member("Normie", {"Body Slam"})}),
                                             roster({member("Normie", {"Body Slam"})}));
    FirstLegalActionSource first_a;
    FirstLegalActionSource first_b;
    ScriptedRandom rng;

    BattleResult result = engine.simulate(state, first_a, first_b, 1, rng);
    TEST_ASSERT_TRUE(result.winner == BattleWinner::TIE);
    TEST_ASSERT_EQ(1, result.turn_count);
}

TEST(Battle, FormatTurnCapWhenUnset) {
    RuleTables rules = standard_rules();
    FormatRules format;
    format.max_turns = 3;
    BattleEngine engine(rules, format);
    BattleState state = engine.create_battle(roster({member("Normie", {"Recover"})}),
                                             roster({member("Normie", {"Recover"})}));
    FirstLegalActionSource first_a;
    FirstLegalActionSource first_b;
    ScriptedRandom rng;

    BattleResult result = engine.simulate(state, first_a, first_b, 0, rng);
    TEST_ASSERT_TRUE(result.winner == BattleWinner::TIE);
    TEST_ASSERT_EQ(3, result.turn_count);
}

TEST(Battle, ScriptedActionsPlayInOrder) {
    RuleTables rules = standard_rules();
    BattleEngine engine(rules);
    BattleState state = engine.create_battle(
        roster({member("Normie", {"Swords Dance", "Body Slam"})}),
        roster({member("Normie", {"Recover"})}));
    ScriptedActionSource scripted_a({BattleAction::move(SIDE_A, 0), BattleAction::move(SIDE_A, 1)});
    FirstLegalActionSource first_b;
    ScriptedRandom rng;

    engine.simulate(state, scripted_a, first_b, 2, rng);
    TEST_ASSERT_EQ(0u, scripted_a.remaining());
    TEST_ASSERT_EQ(2, state.active(SIDE_A).boost(BoostStat::ATK));
    TEST_ASSERT_EQ(std::string("bodyslam"), state.active(SIDE_A).last_move);
}

// ============================================================================
// DETERMINISM AND OUTPUT
// ============================================================================

TEST(Battle, SameSeedSameBattle) {
    RuleTables rules = standard_rules();
    Roster team_a = roster({member("Normie", {"Body Slam", "Thunder Wave", "Protect"}),
                            member("Leafy", {"Bullet Seed", "Spore"})});
    Roster team_b = roster({member("Speedster", {"Thunderbolt", "Substitute"}),
                            member("Slowpoke", {"Fire Fang", "Recover"})});

    BattleResult first = simulate_battle(rules, team_a, team_b, 100, 42);
    BattleResult second = simulate_battle(rules, team_a, team_b, 100, 42);

    TEST_ASSERT_TRUE(first.winner == second.winner);
    TEST_ASSERT_EQ(first.turn_count, second.turn_count);
    TEST_ASSERT_EQ(first.log.to_jsonl(), second.log.to_jsonl());
    TEST_ASSERT_TRUE(first.log.size() > 0);
}

TEST(Battle, LogSerializesAsJsonLines) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.turn(0, 0);

    std::istringstream lines(arena.state.log.to_jsonl());
    std::string line;
    size_t parsed = 0;
    bool saw_hit = false;
    while (std::getline(lines, line)) {
        if (line.empty()) continue;
        nlohmann::json entry = nlohmann::json::parse(line);
        TEST_ASSERT_TRUE(entry.contains("kind"));
        TEST_ASSERT_TRUE(entry.contains("turn"));
        if (entry["outcome"] == to_string(Outcome::HIT)) {
            saw_hit = true;
            TEST_ASSERT_EQ(110, entry["damage"].get<int>());
        }
        parsed++;
    }
    TEST_ASSERT_EQ(arena.state.log.size(), parsed);
    TEST_ASSERT_TRUE(saw_hit);
}

TEST(Battle, ReplayWriterProducesTraceAndLog) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "pokesim_replay_test";
    std::filesystem::remove_all(dir);

    RuleTables rules = standard_rules();
    BattleEngine engine(rules);
    BattleState state = engine.create_battle(roster({member("Normie", {"Body Slam"})}), glass_pair());
    ScriptedRandom rng;

    std::string jsonl_path;
    {
        ReplayWriter writer(dir.string());
        TEST_ASSERT_TRUE(writer.is_enabled());
        engine.start_battle(state, rng);
        size_t seen = 0;
        while (!state.is_over()) {
            BattleAction a = BattleAction::move(SIDE_A, 0);
            BattleAction b = BattleAction::move(SIDE_B, 0);
            writer.log_actions(state.turn + 1, a, b);
            engine.run_turn(state, a, b, rng);
            seen = writer.log_turn(state, seen);
        }
        TEST_ASSERT_EQ(state.log.size(), seen);

        BattleResult result;
        result.winner = *state.winner;
        result.turn_count = state.turn;
        result.log = state.log;
        writer.log_battle_end(result);
        jsonl_path = writer.get_jsonl_path();
        TEST_ASSERT_TRUE(std::filesystem::exists(writer.get_log_path()));
    }

    std::ifstream jsonl(jsonl_path);
    TEST_ASSERT_TRUE(jsonl.is_open());
    size_t lines = 0;
    std::string line;
    while (std::getline(jsonl, line)) {
        if (!line.empty()) lines++;
    }
    TEST_ASSERT_EQ(state.log.size(), lines);

    std::filesystem::remove_all(dir);
}
