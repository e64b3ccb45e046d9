/**
 * Tests for move execution: protection, failure checks, multi-hit,
 * fixed damage, charge turns, substitutes and secondary effects
 */

#include <sstream>
#include "test_helpers.hpp"

using namespace pokesim;
using namespace pokesim_test;

// ============================================================================
// PROTECTION
// ============================================================================

TEST(Moves, ProtectBlocksAndChainFails) {
    Arena arena(roster({member("Normie", {"Protect"})}),
                roster({member("Normie", {"Body Slam"})}));

    arena.turn(0, 0);
    TEST_ASSERT_TRUE(arena.active(SIDE_A).at_full_hp());
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::MOVE, Outcome::BLOCKED));
    TEST_ASSERT_EQ(0u, arena.rng.draws());
    TEST_ASSERT_EQ(1, arena.active(SIDE_A).protect_chain);

    // Second consecutive Protect rolls 1/3 and fails on 0.99
    arena.turn(0, 0);
    TEST_ASSERT_TRUE(log_detail_contains(arena.state, LogKind::MOVE, "consecutive use"));
    TEST_ASSERT_EQ(231, arena.active(SIDE_A).hp);
    TEST_ASSERT_EQ(0, arena.active(SIDE_A).protect_chain);
}

TEST(Moves, FeintBreaksProtect) {
    Arena arena(roster({member("Normie", {"Protect"})}),
                roster({member("Normie", {"Feint"})}));
    arena.turn(0, 0);

    TEST_ASSERT_TRUE(log_detail_contains(arena.state, LogKind::VOLATILE_TICK, "protect (Feint)"));
    TEST_ASSERT_EQ(301, arena.active(SIDE_A).hp);
}

TEST(Moves, SpikyShieldHurtsContact) {
    Arena arena(roster({member("Normie", {"Spiky Shield"})}),
                roster({member("Normie", {"Body Slam"})}));
    arena.turn(0, 0);

    TEST_ASSERT_TRUE(arena.active(SIDE_A).at_full_hp());
    TEST_ASSERT_EQ(299, arena.active(SIDE_B).hp);
}

// ============================================================================
// FAILURE CHECKS
// ============================================================================

TEST(Moves, SuckerPunchNeedsAttackingTarget) {
    Arena idle(roster({member("Normie", {"Sucker Punch"})}),
               roster({member("Normie", {"Swords Dance"})}));
    idle.turn(0, 0);
    TEST_ASSERT_TRUE(log_detail_contains(idle.state, LogKind::MOVE, "target not attacking"));
    TEST_ASSERT_TRUE(idle.active(SIDE_B).at_full_hp());

    Arena attacking(roster({member("Normie", {"Sucker Punch"})}),
                    roster({member("Normie", {"Body Slam"})}));
    attacking.turn(0, 0);
    TEST_ASSERT_EQ(std::string("Normie"), first_mover(attacking.state, 1));
    TEST_ASSERT_EQ(281, attacking.active(SIDE_B).hp);
}

TEST(Moves, AccuracyMissIsLogged) {
    Arena arena(roster({member("Speedster", {"Thunder Wave"})}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.turn(0, 0);

    const LogEntry* miss = last_of(arena.state, LogKind::MOVE);
    TEST_ASSERT_NOT_NULL(miss);
    TEST_ASSERT_TRUE(miss->outcome == Outcome::APPLIED);   // Swords Dance came last

    std::vector<LogEntry> moves = arena.state.log.filter(LogKind::MOVE);
    TEST_ASSERT_TRUE(moves[0].outcome == Outcome::MISS);
    TEST_ASSERT_EQ(0.99, *moves[0].accuracy_roll);
    TEST_ASSERT_FALSE(arena.active(SIDE_B).has_status());
}

TEST(Moves, ThunderWaveRespectsGroundImmunity) {
    Arena arena(roster({member("Speedster", {"Thunder Wave"})}),
                roster({member("Digger", {"Swords Dance"})}));
    arena.rng.push(0.0);
    arena.turn(0, 0);

    TEST_ASSERT_FALSE(arena.active(SIDE_B).has_status());
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::STATUS_APPLIED, Outcome::IMMUNE));
}

TEST(Moves, PowderFailsOnGrass) {
    Arena arena(roster({member("Normie", {"Spore"})}),
                roster({member("Leafy", {"Swords Dance"})}));
    arena.turn(0, 0);

    TEST_ASSERT_FALSE(arena.active(SIDE_B).has_status());
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::MOVE, Outcome::IMMUNE));
}

TEST(Moves, MagicBounceReflectsStatus) {
    Arena arena(roster({member("Normie", {"Thunder Wave"})}),
                roster({member("Normie", {"Swords Dance"}, "Magic Bounce")}));
    arena.turn(0, 0);

    TEST_ASSERT_TRUE(arena.active(SIDE_A).status == MajorStatus::PARALYSIS);
    TEST_ASSERT_FALSE(arena.active(SIDE_B).has_status());
}

TEST(Moves, GoodAsGoldBlocksStatus) {
    Arena arena(roster({member("Normie", {"Growl"})}),
                roster({member("Normie", {"Swords Dance"}, "Good as Gold")}));
    arena.turn(0, 0);

    TEST_ASSERT_EQ(2, arena.active(SIDE_B).boost(BoostStat::ATK));
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::ABILITY_TRIGGER, Outcome::BLOCKED));
}

// ============================================================================
// DAMAGE VARIANTS
// ============================================================================

TEST(Moves, MultiHitDistribution) {
    Arena arena(roster({member("Leafy", {"Bullet Seed"})}),
                roster({member("Slowpoke", {"Swords Dance"})}));
    arena.rng.push(0.0);   // accuracy
    arena.rng.push(0.1);   // two hits
    arena.turn(0, 0);

    TEST_ASSERT_EQ(2u, arena.state.log.count(LogKind::MOVE, Outcome::HIT));
    TEST_ASSERT_TRUE(log_detail_contains(arena.state, LogKind::MOVE, "hit 2 time(s)"));
    TEST_ASSERT_EQ(203, arena.active(SIDE_B).hp);
}

TEST(Moves, LoadedDiceRollsUniformly) {
    Arena arena(roster({member("Leafy", {"Bullet Seed"}, "", "Loaded Dice")}),
                roster({member("Slowpoke", {"Swords Dance"})}));
    arena.turn(0, 0);
    TEST_ASSERT_EQ(5u, arena.state.log.count(LogKind::MOVE, Outcome::HIT));
}

TEST(Moves, CounterReturnsDoublePhysical) {
    Arena arena(roster({member("Normie", {"Counter"})}),
                roster({member("Normie", {"Body Slam"})}));
    arena.turn(0, 0);

    TEST_ASSERT_EQ(231, arena.active(SIDE_A).hp);
    TEST_ASSERT_EQ(121, arena.active(SIDE_B).hp);

    Arena idle(roster({member("Normie", {"Counter"})}),
               roster({member("Normie", {"Swords Dance"})}));
    idle.turn(0, 0);
    TEST_ASSERT_TRUE(log_detail_contains(idle.state, LogKind::MOVE, "nothing to return"));
}

TEST(Moves, LevelDamageHonorsImmunity) {
    Arena ghost(roster({member("Speedster", {"Night Shade"})}),
                roster({member("Normie", {"Swords Dance"})}));
    ghost.turn(0, 0);
    TEST_ASSERT_TRUE(ghost.active(SIDE_B).at_full_hp());
    TEST_ASSERT_TRUE(log_has(ghost.state, LogKind::MOVE, Outcome::IMMUNE));

    Arena water(roster({member("Speedster", {"Night Shade"})}),
                roster({member("Slowpoke", {"Swords Dance"})}));
    water.turn(0, 0);
    TEST_ASSERT_EQ(241, water.active(SIDE_B).hp);
}

TEST(Moves, SecondaryEffectRoll) {
    Arena arena(roster({member("Normie", {"Fire Fang"})}),
                roster({member("Slowpoke", {"Swords Dance"})}));
    for (double draw : {0.0, 0.99, 0.99, 0.05}) {
        arena.rng.push(draw);
    }
    arena.turn(0, 0);
    TEST_ASSERT_TRUE(arena.active(SIDE_B).status == MajorStatus::BURN);
}

// ============================================================================
// CHARGE, PP, STRUGGLE
// ============================================================================

TEST(Moves, ChargeTurnThenRelease) {
    Arena arena(roster({member("Leafy", {"Solar Beam", "Body Slam"})}),
                roster({member("Slowpoke", {"Swords Dance"})}));

    arena.turn(0, 0);
    TEST_ASSERT_TRUE(arena.active(SIDE_A).has_volatile(Volatile::CHARGING));
    TEST_ASSERT_TRUE(arena.active(SIDE_B).at_full_hp());
    TEST_ASSERT_EQ(9, arena.active(SIDE_A).moves[0].pp);

    std::vector<BattleAction> legal = arena.engine.get_legal_actions(arena.state, SIDE_A);
    TEST_ASSERT_EQ(1u, legal.size());
    TEST_ASSERT_EQ(0, legal.front().index);

    arena.turn(0, 0);
    TEST_ASSERT_FALSE(arena.active(SIDE_A).has_volatile(Volatile::CHARGING));
    TEST_ASSERT_FALSE(arena.active(SIDE_B).at_full_hp());
    TEST_ASSERT_EQ(9, arena.active(SIDE_A).moves[0].pp);
}

TEST(Moves, SolarMoveSkipsChargeInSun) {
    Arena arena(roster({member("Leafy", {"Solar Beam"})}),
                roster({member("Slowpoke", {"Swords Dance"})}));
    arena.state.field.weather = Weather::SUN;
    arena.state.field.weather_turns = 5;

    arena.turn(0, 0);
    TEST_ASSERT_FALSE(arena.active(SIDE_A).has_volatile(Volatile::CHARGING));
    TEST_ASSERT_FALSE(arena.active(SIDE_B).at_full_hp());
}

TEST(Moves, PpDecrements) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.turn(0, 0);
    TEST_ASSERT_EQ(9, arena.active(SIDE_A).moves[0].pp);
    TEST_ASSERT_EQ(std::string("bodyslam"), arena.active(SIDE_A).last_move);
}

TEST(Moves, StruggleWhenOutOfPp) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.active(SIDE_A).moves[0].pp = 0;

    std::vector<BattleAction> legal = arena.engine.get_legal_actions(arena.state, SIDE_A);
    TEST_ASSERT_EQ(1u, legal.size());
    TEST_ASSERT_TRUE(legal.front().is_struggle());

    arena.turn(BattleAction::struggle(SIDE_A), BattleAction::move(SIDE_B, 0));
    TEST_ASSERT_EQ(297, arena.active(SIDE_B).hp);
    TEST_ASSERT_EQ(256, arena.active(SIDE_A).hp);
}

// ============================================================================
// SUBSTITUTE AND SWITCHING MOVES
// ============================================================================

TEST(Moves, SubstituteAbsorbsHit) {
    Arena arena(roster({member("Speedster", {"Substitute"})}),
                roster({member("Normie", {"Body Slam"})}));
    arena.turn(0, 0);

    TEST_ASSERT_EQ(256, arena.active(SIDE_A).hp);
    TEST_ASSERT_FALSE(arena.active(SIDE_A).has_volatile(Volatile::SUBSTITUTE));
    TEST_ASSERT_TRUE(log_detail_contains(arena.state, LogKind::MOVE, "(substitute)"));
}

TEST(Moves, SoundBypassesSubstitute) {
    Arena arena(roster({member("Speedster", {"Substitute"})}),
                roster({member("Normie", {"Growl"})}));
    arena.turn(0, 0);
    TEST_ASSERT_EQ(-1, arena.active(SIDE_A).boost(BoostStat::ATK));
    TEST_ASSERT_TRUE(arena.active(SIDE_A).has_volatile(Volatile::SUBSTITUTE));
}

TEST(Moves, SelfSwitchAfterHit) {
    Arena arena(roster({member("Normie", {"U-turn"}), member("Leafy", {"Body Slam"})}),
                roster({member("Slowpoke", {"Swords Dance"})}));
    arena.turn(0, 0);

    TEST_ASSERT_EQ(1, arena.state.side(SIDE_A).active);
    TEST_ASSERT_FALSE(arena.active(SIDE_B).at_full_hp());
    const LogEntry* swap = last_of(arena.state, LogKind::SWITCH);
    TEST_ASSERT_NOT_NULL(swap);
    TEST_ASSERT_EQ(std::string("Leafy"), swap->actor);
}

TEST(Moves, HazardMoveLaysOnFoeSide) {
    Arena arena(roster({member("Normie", {"Stealth Rock"})}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.turn(0, 0);
    TEST_ASSERT_TRUE(arena.state.side(SIDE_B).hazards.stealth_rock);
    TEST_ASSERT_FALSE(arena.state.side(SIDE_A).hazards.any());
}

TEST(Moves, MagicBounceReflectsHazards) {
    Arena arena(roster({member("Normie", {"Stealth Rock"})}),
                roster({member("Normie", {"Swords Dance"}, "Magic Bounce")}));
    arena.turn(0, 0);

    TEST_ASSERT_TRUE(arena.state.side(SIDE_A).hazards.stealth_rock);
    TEST_ASSERT_FALSE(arena.state.side(SIDE_B).hazards.any());
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::ABILITY_TRIGGER, Outcome::APPLIED));
}

TEST(Moves, MoldBreakerHazardsAreNotBounced) {
    Arena arena(roster({member("Normie", {"Stealth Rock"}, "Mold Breaker")}),
                roster({member("Normie", {"Swords Dance"}, "Magic Bounce")}));
    arena.turn(0, 0);

    TEST_ASSERT_TRUE(arena.state.side(SIDE_B).hazards.stealth_rock);
    TEST_ASSERT_FALSE(arena.state.side(SIDE_A).hazards.any());
}

TEST(Moves, OhkoMoveTakesRemainingHp) {
    Arena arena(roster({member("Speedster", {"Fissure"})}),
                roster({member("Normie", {"Swords Dance"}), member("Normie", {"Swords Dance"})}));
    arena.rng.push(0.1);
    arena.turn(0, 0);

    TEST_ASSERT_TRUE(arena.state.side(SIDE_B).roster[0].fainted());
    TEST_ASSERT_EQ(1, arena.state.side(SIDE_B).active);
}

TEST(Moves, OhkoMoveFailsOnHigherLevel) {
    CombatantSpec low = member("Speedster", {"Fissure"});
    low.level = 50;
    Arena arena(roster({low}), roster({member("Normie", {"Swords Dance"})}));
    arena.rng.push(0.1);
    arena.turn(0, 0);

    TEST_ASSERT_TRUE(arena.active(SIDE_B).at_full_hp());
    TEST_ASSERT_TRUE(log_detail_contains(arena.state, LogKind::MOVE, "level too high"));
}

TEST(Moves, RecoverHealsHalf) {
    Arena arena(roster({member("Normie", {"Recover"})}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.active(SIDE_A).hp = 100;
    arena.turn(0, 0);
    TEST_ASSERT_EQ(270, arena.active(SIDE_A).hp);
}
