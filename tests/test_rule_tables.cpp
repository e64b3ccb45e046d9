/**
 * Tests for Rule Tables and Format Rules
 */

#include <sstream>
#include "test_helpers.hpp"

using namespace pokesim;
using namespace pokesim_test;

static const char* RULES_JSON = R"({
    "type_chart": {"Normal": {"Ghost": 0.0}, "Fire": {"Grass": 2.0}},
    "species": [
        {"name": "Garchomp", "types": ["Dragon", "Ground"],
         "base_stats": {"hp": 108, "atk": 130, "def": 95, "spa": 80, "spd": 85, "spe": 102},
         "abilities": ["Rough Skin"]},
        {"name": "Mystery"}
    ],
    "moves": [
        {"name": "Earthquake", "type": "Ground", "category": "physical", "power": 100,
         "accuracy": 100, "pp": 10, "flags": ["grassy_halved"]},
        {"name": "Swift", "type": "Normal", "category": "special", "power": 60, "accuracy": true},
        {"name": "Fire Fang", "type": "Fire", "category": "physical", "power": 65, "accuracy": 95,
         "flags": ["contact", "bite"],
         "secondary": {"chance": 10, "status": "brn"}},
        {"name": "Broken Fang", "type": "Fire", "category": "physical", "power": 65,
         "secondary": {"chance": 10, "status": "sunburn"}},
        {"name": "Calm Mind", "type": "Psychic", "category": "status", "power": 40,
         "self_boosts": {"spa": 1, "spd": 1}},
        {"name": "Bullet Seed", "type": "Grass", "category": "physical", "power": 25,
         "multi_hit": [2, 5]},
        {"name": "King's Shield", "type": "Steel", "category": "status", "priority": 4,
         "protect": "King's Shield"},
        {"name": "Thunder", "type": "Electric", "category": "special", "power": 110, "accuracy": 70,
         "weather_accuracy": {"rain": 100}}
    ],
    "abilities": [
        {"name": "Rough Skin", "effect": "contact_damage", "params": {"fraction": 0.125}},
        {"name": "Intimidate"}
    ],
    "items": [
        {"name": "Life Orb", "effect": "life_orb", "params": {"boost": 1.3, "recoil": 0.1}}
    ],
    "weather": [
        {"weather": "sandstorm", "duration": 8, "chip": 0.0625}
    ],
    "terrain": [
        {"terrain": "grassy", "heal": 0.125}
    ]
})";

// ============================================================================
// IDENTIFIERS
// ============================================================================

TEST(RuleTables, NormalizeId) {
    TEST_ASSERT_EQ(std::string("kingsshield"), RuleTables::normalize_id("King's Shield"));
    TEST_ASSERT_EQ(std::string("uturn"), RuleTables::normalize_id("U-turn"));
    TEST_ASSERT_EQ(std::string("heavydutyboots"), RuleTables::normalize_id("Heavy-Duty Boots"));
    TEST_ASSERT_EQ(std::string(""), RuleTables::normalize_id("  -- "));
}

TEST(RuleTables, ParseEnumsAcceptAliases) {
    TEST_ASSERT_TRUE(RuleTables::parse_status("brn") == MajorStatus::BURN);
    TEST_ASSERT_TRUE(RuleTables::parse_status("Toxic") == MajorStatus::BADLY_POISONED);
    TEST_ASSERT_TRUE(RuleTables::parse_status("glitter") == MajorStatus::NONE);
    TEST_ASSERT_TRUE(RuleTables::parse_weather("Rain Dance") == Weather::RAIN);
    TEST_ASSERT_TRUE(RuleTables::parse_type("Fairy") == Type::FAIRY);
    TEST_ASSERT_TRUE(RuleTables::parse_type("???") == Type::TYPELESS);
    TEST_ASSERT_TRUE(RuleTables::parse_volatile("Mean Look") == Volatile::TRAPPED);
    TEST_ASSERT_FALSE(RuleTables::parse_boost_stat("luck").has_value());
}

// ============================================================================
// DEFAULTS
// ============================================================================

TEST(RuleTables, DefaultsWithoutLoading) {
    RuleTables rules;
    TEST_ASSERT_EQ(0u, rules.species_count());
    TEST_ASSERT_EQ(2.0, rules.type_chart().effectiveness(Type::WATER, Type::FIRE));
    TEST_ASSERT_EQ(0.0, rules.type_chart().effectiveness(Type::GROUND, Type::FLYING));
    TEST_ASSERT_EQ(4.0, rules.type_chart().effectiveness(Type::ROCK, {Type::FIRE, Type::FLYING}));
    TEST_ASSERT_EQ(1.5, rules.get_weather(Weather::SUN).type_modifiers.front().second);
    TEST_ASSERT_TRUE(rules.get_terrain(Terrain::PSYCHIC).blocks_priority);
    TEST_ASSERT_TRUE(rules.struggle().always_hits());
    TEST_ASSERT_EQ(0.25, rules.struggle().self_damage);
}

TEST(RuleTables, UnknownIdsResolveToBaseline) {
    RuleTables rules;
    TEST_ASSERT_NULL(rules.get_species("missingno"));
    TEST_ASSERT_NULL(rules.get_move("hyperdrive"));

    Resolved<SpeciesDef> species = rules.resolve_species("missingno");
    TEST_ASSERT_TRUE(species.used_fallback);
    TEST_ASSERT_EQ(100, species.def->base_stats.spe);
    TEST_ASSERT_TRUE(species.def->types.front() == Type::NORMAL);

    Resolved<MoveDef> move = rules.resolve_move("hyperdrive");
    TEST_ASSERT_TRUE(move.used_fallback);
    TEST_ASSERT_EQ(std::string("tackle"), move.def->id);
    TEST_ASSERT_EQ(40, move.def->power);
}

// ============================================================================
// JSON LOADING
// ============================================================================

TEST(RuleTables, LoadFromString) {
    RuleTables rules;
    TEST_ASSERT_TRUE(rules.load_from_string(RULES_JSON));
    TEST_ASSERT_EQ(2u, rules.species_count());
    TEST_ASSERT_EQ(8u, rules.move_count());
    TEST_ASSERT_EQ(2u, rules.ability_count());
    TEST_ASSERT_EQ(1u, rules.item_count());

    const SpeciesDef* chomp = rules.get_species("GARCHOMP");
    TEST_ASSERT_NOT_NULL(chomp);
    TEST_ASSERT_EQ(2u, chomp->types.size());
    TEST_ASSERT_EQ(130, chomp->base_stats.atk);
    TEST_ASSERT_EQ(std::string("roughskin"), chomp->abilities.front());

    const SpeciesDef* mystery = rules.get_species("mystery");
    TEST_ASSERT_NOT_NULL(mystery);
    TEST_ASSERT_EQ(100, mystery->base_stats.hp);
    TEST_ASSERT_TRUE(mystery->types.front() == Type::NORMAL);
}

TEST(RuleTables, MoveFieldsParsed) {
    RuleTables rules;
    TEST_ASSERT_TRUE(rules.load_from_string(RULES_JSON));

    const MoveDef* eq = rules.get_move("earthquake");
    TEST_ASSERT_NOT_NULL(eq);
    TEST_ASSERT_TRUE(eq->type == Type::GROUND);
    TEST_ASSERT_TRUE(eq->category == MoveCategory::PHYSICAL);
    TEST_ASSERT_TRUE(eq->flags.grassy_halved);
    TEST_ASSERT_FALSE(eq->flags.contact);

    TEST_ASSERT_TRUE(rules.get_move("swift")->always_hits());

    const MoveDef* fang = rules.get_move("Fire Fang");
    TEST_ASSERT_TRUE(fang->flags.contact);
    TEST_ASSERT_TRUE(fang->has_secondary());
    TEST_ASSERT_EQ(10, fang->secondary->chance);
    TEST_ASSERT_TRUE(fang->secondary->status == MajorStatus::BURN);

    const MoveDef* seed = rules.get_move("bulletseed");
    TEST_ASSERT_EQ(2, seed->min_hits);
    TEST_ASSERT_EQ(5, seed->max_hits);

    TEST_ASSERT_TRUE(rules.get_move("kingsshield")->protect == ProtectKind::KINGS_SHIELD);
    TEST_ASSERT_EQ(4, rules.get_move("kingsshield")->priority);

    const MoveDef* thunder = rules.get_move("thunder");
    TEST_ASSERT_EQ(1u, thunder->weather_accuracy.size());
    TEST_ASSERT_TRUE(thunder->weather_accuracy.front().first == Weather::RAIN);
}

TEST(RuleTables, MalformedSecondaryMeansNoEffect) {
    RuleTables rules;
    TEST_ASSERT_TRUE(rules.load_from_string(RULES_JSON));

    const MoveDef* broken = rules.get_move("brokenfang");
    TEST_ASSERT_NOT_NULL(broken);
    TEST_ASSERT_FALSE(broken->has_secondary());
    TEST_ASSERT_EQ(65, broken->power);
}

TEST(RuleTables, StatusMovePowerForcedToZero) {
    RuleTables rules;
    TEST_ASSERT_TRUE(rules.load_from_string(RULES_JSON));

    const MoveDef* calm_mind = rules.get_move("calmmind");
    TEST_ASSERT_EQ(0, calm_mind->power);
    TEST_ASSERT_EQ(2u, calm_mind->self_boosts.size());
}

TEST(RuleTables, EffectDefsAndParams) {
    RuleTables rules;
    TEST_ASSERT_TRUE(rules.load_from_string(RULES_JSON));

    const AbilityDef* rough = rules.get_ability("roughskin");
    TEST_ASSERT_EQ(std::string("contact_damage"), rough->effect);
    TEST_ASSERT_EQ(0.125, rough->param_double("fraction", 0.0));
    TEST_ASSERT_EQ(0.5, rough->param_double("missing", 0.5));

    // Effect defaults to the id
    TEST_ASSERT_EQ(std::string("intimidate"), rules.get_ability("intimidate")->effect);
    TEST_ASSERT_EQ(1.3, rules.get_item("lifeorb")->param_double("boost", 1.0));
}

TEST(RuleTables, TablesOverrideDefaults) {
    RuleTables rules;
    TEST_ASSERT_TRUE(rules.load_from_string(RULES_JSON));

    TEST_ASSERT_EQ(0.0, rules.type_chart().effectiveness(Type::NORMAL, Type::GHOST));
    TEST_ASSERT_EQ(8, rules.get_weather(Weather::SANDSTORM).duration);
    // Untouched fields keep the built-in value
    TEST_ASSERT_EQ(3u, rules.get_weather(Weather::SANDSTORM).chip_immune_types.size());
    TEST_ASSERT_EQ(0.125, rules.get_terrain(Terrain::GRASSY).heal_fraction);
}

TEST(RuleTables, RejectsInvalidDocuments) {
    RuleTables rules;
    TEST_ASSERT_FALSE(rules.load_from_string("{not json"));
    TEST_ASSERT_FALSE(rules.load_from_string("[1, 2, 3]"));
    TEST_ASSERT_FALSE(rules.load_from_json("/nonexistent/rules.json"));
}

TEST(RuleTables, ProgrammaticRegistration) {
    RuleTables rules;
    rules.add_move(make_move("Hyper Beam", Type::NORMAL, MoveCategory::SPECIAL, 150, 90));
    rules.set_type_effectiveness(Type::DRAGON, Type::FAIRY, 1.0);

    TEST_ASSERT_NOT_NULL(rules.get_move("hyperbeam"));
    TEST_ASSERT_EQ(1.0, rules.type_chart().effectiveness(Type::DRAGON, Type::FAIRY));
}

// ============================================================================
// FORMAT RULES
// ============================================================================

TEST(FormatRules, Defaults) {
    FormatRules format;
    TEST_ASSERT_FALSE(format.tera_allowed);
    TEST_ASSERT_EQ(DEFAULT_MAX_TURNS, format.max_turns);
    TEST_ASSERT_FALSE(format.species_banned("garchomp"));
}

TEST(FormatRules, LoadBansAndClauses) {
    FormatRules format;
    TEST_ASSERT_TRUE(format.load_from_string(R"({
        "name": "ou", "tera_allowed": true, "max_turns": 200,
        "banned_pokemon": ["Koraidon"],
        "banned_moves": ["Baton Pass"],
        "banned_items": ["King's Rock"],
        "banned_abilities": ["Shadow Tag"],
        "clauses": {"sleep_clause": true, "evasion_clause": false}
    })"));

    TEST_ASSERT_EQ(std::string("ou"), format.name);
    TEST_ASSERT_TRUE(format.tera_allowed);
    TEST_ASSERT_EQ(200, format.max_turns);
    TEST_ASSERT_TRUE(format.species_banned("koraidon"));
    TEST_ASSERT_TRUE(format.move_banned("Baton Pass"));
    TEST_ASSERT_TRUE(format.item_banned("kingsrock"));
    TEST_ASSERT_TRUE(format.ability_banned("shadowtag"));
    TEST_ASSERT_TRUE(format.clause_enabled("sleep_clause"));
    TEST_ASSERT_FALSE(format.clause_enabled("evasion_clause"));
}

TEST(FormatRules, NonPositiveTurnCapUsesDefault) {
    FormatRules format;
    TEST_ASSERT_TRUE(format.load_from_string(R"({"max_turns": 0})"));
    TEST_ASSERT_EQ(DEFAULT_MAX_TURNS, format.max_turns);
}
