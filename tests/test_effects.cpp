/**
 * Tests for ability and item effects through the engine
 */

#include <sstream>
#include "test_helpers.hpp"
#include "effects/effect_catalog.hpp"

using namespace pokesim;
using namespace pokesim_test;

// ============================================================================
// SWITCH-IN ABILITIES
// ============================================================================

TEST(Abilities, IntimidateOnLead) {
    Arena arena(roster({member("Normie", {"Body Slam"}, "Intimidate")}),
                roster({member("Normie", {"Body Slam"})}));
    arena.start();

    TEST_ASSERT_EQ(-1, arena.active(SIDE_B).boost(BoostStat::ATK));
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::ABILITY_TRIGGER, Outcome::APPLIED));
    TEST_ASSERT_EQ(0u, arena.rng.draws());
}

TEST(Abilities, ClearBodyBlocksIntimidate) {
    Arena arena(roster({member("Normie", {"Body Slam"}, "Intimidate")}),
                roster({member("Normie", {"Body Slam"}, "Clear Body")}));
    arena.start();

    TEST_ASSERT_EQ(0, arena.active(SIDE_B).boost(BoostStat::ATK));
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::ABILITY_TRIGGER, Outcome::BLOCKED));
}

TEST(Abilities, DroughtSustainsSunUntilSwitch) {
    Arena arena(roster({member("Normie", {"Body Slam"}, "Drought"), member("Leafy", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.start();
    TEST_ASSERT_TRUE(arena.state.field.weather == Weather::SUN);
    TEST_ASSERT_TRUE(arena.state.field.weather_sustained);

    arena.turn(BattleAction::switch_to(SIDE_A, 1), BattleAction::move(SIDE_B, 0));
    TEST_ASSERT_TRUE(arena.state.field.weather == Weather::SUN);
    TEST_ASSERT_FALSE(arena.state.field.weather_sustained);
    TEST_ASSERT_EQ(4, arena.state.field.weather_turns);
}

TEST(Abilities, VoltAbsorbHeals) {
    Arena arena(roster({member("Speedster", {"Thunderbolt"})}),
                roster({member("Normie", {"Swords Dance"}, "Volt Absorb")}));
    arena.active(SIDE_B).hp = 200;

    arena.turn(0, 0);
    TEST_ASSERT_EQ(285, arena.active(SIDE_B).hp);
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::MOVE, Outcome::IMMUNE));
    // Absorbed before the accuracy check
    TEST_ASSERT_EQ(0u, arena.rng.draws());
}

TEST(Abilities, PranksterStatusMovesGoFirst) {
    Arena arena(roster({member("Speedster", {"Body Slam"})}),
                roster({member("Slowpoke", {"Swords Dance"}, "Prankster")}));
    arena.turn(0, 0);
    TEST_ASSERT_EQ(std::string("Slowpoke"), first_mover(arena.state, 1));
}

TEST(Abilities, RoughSkinPunishesContact) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"}, "Rough Skin")}));
    arena.turn(0, 0);
    TEST_ASSERT_EQ(299, arena.active(SIDE_A).hp);
}

TEST(Abilities, RegeneratorOnSwitchOut) {
    Arena arena(roster({member("Normie", {"Body Slam"}, "Regenerator"), member("Leafy", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.active(SIDE_A).hp = 100;

    arena.turn(BattleAction::switch_to(SIDE_A, 1), BattleAction::move(SIDE_B, 0));
    TEST_ASSERT_EQ(1, arena.state.side(SIDE_A).active);
    TEST_ASSERT_EQ(213, arena.state.side(SIDE_A).roster[0].hp);
}

// ============================================================================
// ITEMS
// ============================================================================

TEST(Items, FocusSashSurvivesOnce) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Glass", {"Swords Dance"}, "", "Focus Sash")}));

    arena.turn(0, 0);
    TEST_ASSERT_EQ(1, arena.active(SIDE_B).hp);
    TEST_ASSERT_TRUE(arena.active(SIDE_B).item.empty());
    TEST_ASSERT_TRUE(log_has(arena.state, LogKind::ITEM_TRIGGER, Outcome::APPLIED));

    arena.turn(0, 0);
    TEST_ASSERT_TRUE(arena.active(SIDE_B).fainted());
    TEST_ASSERT_TRUE(arena.state.winner == BattleWinner::SIDE_A);
}

TEST(Items, LifeOrbBoostAndRecoil) {
    Arena arena(roster({member("Normie", {"Body Slam"}, "", "Life Orb")}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.turn(0, 0);

    TEST_ASSERT_EQ(198, arena.active(SIDE_B).hp);
    TEST_ASSERT_EQ(307, arena.active(SIDE_A).hp);
}

TEST(Items, MagicGuardIgnoresLifeOrbRecoil) {
    Arena arena(roster({member("Normie", {"Body Slam"}, "Magic Guard", "Life Orb")}),
                roster({member("Normie", {"Swords Dance"})}));
    arena.turn(0, 0);

    TEST_ASSERT_EQ(198, arena.active(SIDE_B).hp);
    TEST_ASSERT_TRUE(arena.active(SIDE_A).at_full_hp());
}

TEST(Items, RockyHelmet) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"}, "", "Rocky Helmet")}));
    arena.turn(0, 0);
    TEST_ASSERT_EQ(256, arena.active(SIDE_A).hp);
}

TEST(Items, LeftoversAtEndOfTurn) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"}, "", "Leftovers")}));
    arena.turn(0, 0);

    TEST_ASSERT_EQ(252, arena.active(SIDE_B).hp);
    const LogEntry* heal = last_of(arena.state, LogKind::ITEM_TRIGGER);
    TEST_ASSERT_NOT_NULL(heal);
    TEST_ASSERT_TRUE(heal->outcome == Outcome::HEALED);
    TEST_ASSERT_EQ(21, heal->damage);
}

TEST(Items, EjectButtonSwitchesHolderOut) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"}, "", "Eject Button"), member("Leafy", {"Body Slam"})}));
    arena.turn(0, 0);

    const SideState& side_b = arena.state.side(SIDE_B);
    TEST_ASSERT_EQ(1, side_b.active);
    TEST_ASSERT_TRUE(side_b.roster[0].item.empty());
    TEST_ASSERT_EQ(0, side_b.roster[0].boost(BoostStat::ATK));
}

TEST(Items, ChoiceScarfSpeedAndLock) {
    Arena arena(roster({member("Normie", {"Body Slam", "Thunderbolt"}, "", "Choice Scarf")}),
                roster({member("Speedster", {"Swords Dance"})}));
    TEST_ASSERT_EQ(354.0, arena.engine.effective_speed(arena.state, SIDE_A));

    arena.turn(0, 0);
    TEST_ASSERT_EQ(std::string("Normie"), first_mover(arena.state, 1));
    TEST_ASSERT_EQ(std::string("bodyslam"), arena.active(SIDE_A).choice_locked_move);

    std::vector<BattleAction> legal = arena.engine.get_legal_actions(arena.state, SIDE_A);
    TEST_ASSERT_EQ(1u, legal.size());
    TEST_ASSERT_TRUE(legal.front() == BattleAction::move(SIDE_A, 0));
}

TEST(Items, AirBalloonPopsOnHit) {
    Arena arena(roster({member("Normie", {"Earthquake", "Body Slam"})}),
                roster({member("Normie", {"Swords Dance"}, "", "Air Balloon")}));

    arena.turn(0, 0);
    TEST_ASSERT_TRUE(arena.active(SIDE_B).at_full_hp());
    TEST_ASSERT_EQ(std::string("airballoon"), arena.active(SIDE_B).item);

    arena.turn(1, 0);
    TEST_ASSERT_FALSE(arena.active(SIDE_B).at_full_hp());
    TEST_ASSERT_TRUE(arena.active(SIDE_B).item.empty());
}

TEST(Items, AssaultVestForbidsStatusMoves) {
    Arena arena(roster({member("Normie", {"Body Slam", "Recover"}, "", "Assault Vest")}),
                roster({member("Normie", {"Body Slam"})}));

    std::vector<BattleAction> legal = arena.engine.get_legal_actions(arena.state, SIDE_A);
    TEST_ASSERT_EQ(1u, legal.size());
    TEST_ASSERT_EQ(0, legal.front().index);
}

TEST(Items, MagicRoomSuppressesLeftovers) {
    Arena arena(roster({member("Normie", {"Body Slam"})}),
                roster({member("Normie", {"Swords Dance"}, "", "Leftovers")}));
    arena.state.field.rooms[static_cast<size_t>(Room::MAGIC_ROOM)] = 5;
    arena.turn(0, 0);
    TEST_ASSERT_EQ(231, arena.active(SIDE_B).hp);
}

// ============================================================================
// REGISTRY
// ============================================================================

TEST(Registry, UnknownEffectsAreInert) {
    RuleTables rules = standard_rules();
    rules.add_ability(make_effect("Mystery Aura", "not_a_real_effect"));
    EffectRegistry registry;
    register_all_effects(registry);
    FieldState field;
    EffectView view(rules, registry, field);

    Combatant c = make_combatant("Holder");
    c.ability = "mysteryaura";
    TEST_ASSERT_FALSE(static_cast<bool>(view.ability(c)));

    c.ability = "intimidate";
    TEST_ASSERT_TRUE(static_cast<bool>(view.ability(c)));
    TEST_ASSERT_TRUE(registry.has_ability("intimidate"));
    TEST_ASSERT_FALSE(registry.has_ability("not_a_real_effect"));
}

TEST(Registry, CatalogMatchesRegisteredHandlers) {
    EffectRegistry registry;
    register_all_effects(registry);

    for (const auto& info : effects::get_effect_info()) {
        bool registered = info.category == "ability" ? registry.has_ability(info.effect)
                                                     : registry.has_item(info.effect);
        TEST_ASSERT_MSG(registered == info.implemented, info.effect);
    }
    TEST_ASSERT_TRUE(effects::is_effect_implemented("Focus Sash"));
    TEST_ASSERT_FALSE(effects::is_effect_implemented("multiscale"));
}

TEST(Registry, InertEffectsReported) {
    RuleTables rules = standard_rules();
    TEST_ASSERT_TRUE(effects::find_inert_effects(rules).empty());

    rules.add_ability(make_effect("Mystery Aura", "not_a_real_effect"));
    rules.add_item(make_effect("Sitrus Berry", "sitrus_berry"));
    std::vector<std::string> inert = effects::find_inert_effects(rules);
    TEST_ASSERT_EQ(2u, inert.size());
    TEST_ASSERT_EQ(std::string("ability mysteryaura (not_a_real_effect)"), inert[0]);
    TEST_ASSERT_EQ(std::string("item sitrusberry (sitrus_berry)"), inert[1]);
}
