/**
 * pokesim - Static Rule Tables
 *
 * Immutable lookup data loaded from JSON: species, moves, type chart,
 * abilities, items, weather and terrain tables. Loaded once before any
 * battle and only read afterwards, so one instance can be shared by
 * battles running on separate threads.
 */

#pragma once

#include "types.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace pokesim {

// ============================================================================
// STAT BLOCK
// ============================================================================

struct StatBlock {
    int hp = 0;
    int atk = 0;
    int def = 0;
    int spa = 0;
    int spd = 0;
    int spe = 0;

    int get(Stat stat) const {
        switch (stat) {
            case Stat::HP: return hp;
            case Stat::ATK: return atk;
            case Stat::DEF: return def;
            case Stat::SPA: return spa;
            case Stat::SPD: return spd;
            case Stat::SPE: return spe;
            default: return 0;
        }
    }

    void set(Stat stat, int value) {
        switch (stat) {
            case Stat::HP: hp = value; break;
            case Stat::ATK: atk = value; break;
            case Stat::DEF: def = value; break;
            case Stat::SPA: spa = value; break;
            case Stat::SPD: spd = value; break;
            case Stat::SPE: spe = value; break;
        }
    }

    static StatBlock uniform(int value) {
        return StatBlock{value, value, value, value, value, value};
    }
};

// ============================================================================
// MOVE DEFINITION
// ============================================================================

enum class FixedDamage : uint8_t {
    NONE,
    LEVEL,          // Night Shade, Seismic Toss
    HALF_HP,        // Super Fang
    ENDEAVOR,       // target HP down to user HP
    COUNTER,        // 2x physical damage taken this turn
    MIRROR_COAT,    // 2x special damage taken this turn
    METAL_BURST,    // 1.5x any damage taken this turn
    OHKO            // Fissure, Sheer Cold: the target's remaining HP
};

enum class ProtectKind : uint8_t {
    NONE,
    PROTECT,        // Protect, Detect
    SPIKY_SHIELD,   // contact attackers lose 1/8
    KINGS_SHIELD    // contact attackers get -1 Atk (status moves pass)
};

enum class HazardRemoval : uint8_t {
    NONE,
    DEFOG,          // clears both sides' hazards and the target's screens
    RAPID_SPIN,     // clears own hazards, traps and leech seed
    COURT_CHANGE    // swaps side conditions
};

/**
 * Secondary effect (chance-based rider on a damaging move).
 */
struct SecondaryEffect {
    int chance = 0;                          // Percent (1-100)
    MajorStatus status = MajorStatus::NONE;
    std::optional<Volatile> volatile_status;
    std::vector<BoostPair> boosts;
    bool self = false;                       // Boosts apply to the user
};

struct MoveFlags {
    bool contact = false;
    bool sound = false;
    bool powder = false;
    bool bullet = false;
    bool punch = false;
    bool high_crit = false;
    bool breaks_protect = false;         // Feint
    bool requires_target_attack = false; // Sucker Punch
    bool charge = false;                 // Two-turn move
    bool solar = false;                  // Charge skipped in sun
    bool grassy_halved = false;          // Earthquake-class
    bool self_switch = false;            // U-turn, Volt Switch
    bool force_switch = false;           // Roar, Dragon Tail
};

/**
 * Move definition (immutable).
 */
struct MoveDef {
    MoveID id;
    std::string name;
    Type type = Type::NORMAL;
    MoveCategory category = MoveCategory::STATUS;
    int power = 0;
    std::optional<int> accuracy = 100;   // nullopt = always hits
    int pp = 1;
    int priority = 0;
    MoveFlags flags;

    // Multi-hit range (1/1 for single-hit moves)
    int min_hits = 1;
    int max_hits = 1;

    std::optional<SecondaryEffect> secondary;

    // Primary effects
    MajorStatus inflicts_status = MajorStatus::NONE;
    std::optional<Volatile> inflicts_volatile;
    std::optional<Hazard> hazard;
    std::optional<Screen> screen;
    Weather sets_weather = Weather::NONE;
    Terrain sets_terrain = Terrain::NONE;
    std::optional<Room> room;
    bool tailwind = false;
    std::vector<BoostPair> self_boosts;
    std::vector<BoostPair> target_boosts;
    double heal = 0.0;                   // Fraction of max HP
    bool weather_heal = false;           // Moonlight / Morning Sun / Synthesis
    double drain = 0.0;                  // Fraction of damage dealt
    double recoil = 0.0;                 // Fraction of damage dealt
    double self_damage = 0.0;            // Fraction of user max HP (Struggle)
    ProtectKind protect = ProtectKind::NONE;
    HazardRemoval hazard_removal = HazardRemoval::NONE;
    FixedDamage fixed_damage = FixedDamage::NONE;
    bool destiny_bond = false;
    std::vector<std::pair<Weather, int>> weather_accuracy;

    bool is_status() const { return category == MoveCategory::STATUS; }
    bool is_damaging() const { return category != MoveCategory::STATUS; }
    bool is_multi_hit() const { return max_hits > 1; }
    bool has_secondary() const { return secondary.has_value() && secondary->chance > 0; }
    bool always_hits() const { return !accuracy.has_value(); }
};

// ============================================================================
// SPECIES / ABILITY / ITEM DEFINITIONS
// ============================================================================

/**
 * Species definition (immutable).
 */
struct SpeciesDef {
    SpeciesID id;
    std::string name;
    std::vector<Type> types;
    StatBlock base_stats;
    std::vector<std::string> abilities;
};

/**
 * Ability or item definition (immutable).
 *
 * `effect` names the handler in the EffectRegistry; several entries may
 * share one handler and differ only by params (e.g. Pixilate and Aerilate
 * both use "type_change" with a different "type" param).
 */
struct EffectDef {
    std::string id;
    std::string name;
    std::string effect;
    std::unordered_map<std::string, std::string> params;

    std::string param(const std::string& key, const std::string& fallback = "") const {
        auto it = params.find(key);
        return it != params.end() ? it->second : fallback;
    }

    double param_double(const std::string& key, double fallback) const;
    Type param_type(const std::string& key, Type fallback = Type::TYPELESS) const;
};

using AbilityDef = EffectDef;
using ItemDef = EffectDef;

/**
 * Weather table row.
 */
struct WeatherDef {
    Weather weather = Weather::NONE;
    int duration = 5;
    std::vector<std::pair<Type, double>> type_modifiers;   // Move type -> damage multiplier
    double chip_fraction = 0.0;                             // End-of-turn damage
    std::vector<Type> chip_immune_types;
    Type defense_boost_type = Type::TYPELESS;               // Holder type that gets a stat boost
    Stat defense_boost_stat = Stat::DEF;
    double defense_boost = 1.0;
};

/**
 * Terrain table row.
 */
struct TerrainDef {
    Terrain terrain = Terrain::NONE;
    int duration = 5;
    Type boosted_type = Type::TYPELESS;    // Grounded attacker's move of this type
    double boost = 1.3;
    Type weakened_type = Type::TYPELESS;   // Moves of this type vs grounded targets
    double weaken = 1.0;
    double heal_fraction = 0.0;            // End-of-turn heal for grounded combatants
    bool blocks_status = false;
    bool blocks_sleep = false;
    bool blocks_priority = false;
};

// ============================================================================
// TYPE CHART
// ============================================================================

/**
 * TypeChart - Attack type x defend type effectiveness multipliers.
 */
class TypeChart {
public:
    TypeChart();

    double effectiveness(Type attack, Type defend) const;
    double effectiveness(Type attack, const std::vector<Type>& defend) const;
    void set(Type attack, Type defend, double multiplier);

    /**
     * Standard 18-type chart.
     */
    static TypeChart standard();

private:
    std::array<std::array<double, TYPE_COUNT>, TYPE_COUNT> table_;
};

// ============================================================================
// RULE TABLES
// ============================================================================

/**
 * Result of a lookup that may have substituted the documented baseline.
 */
template <typename T>
struct Resolved {
    const T* def = nullptr;
    bool used_fallback = false;
};

/**
 * RuleTables - Central static data lookup.
 *
 * Starts out with the standard type chart, the built-in weather and
 * terrain tables, Struggle and the fallback species/move; JSON loading
 * and the add_* methods layer content on top.
 */
class RuleTables {
public:
    RuleTables();
    ~RuleTables() = default;

    /**
     * Load tables from a JSON file.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load tables from a JSON document held in memory.
     */
    bool load_from_string(const std::string& text);

    // ========================================================================
    // LOOKUP (nullptr if not found)
    // ========================================================================

    const SpeciesDef* get_species(const std::string& id) const;
    const MoveDef* get_move(const std::string& id) const;
    const AbilityDef* get_ability(const std::string& id) const;
    const ItemDef* get_item(const std::string& id) const;
    const WeatherDef& get_weather(Weather weather) const;
    const TerrainDef& get_terrain(Terrain terrain) const;
    const TypeChart& type_chart() const { return type_chart_; }

    /**
     * When set, Stealth Rock damage scales with Rock effectiveness against
     * the switch-in. Off by default: a flat 12.5% chunk.
     */
    bool stealth_rock_type_scaled() const { return stealth_rock_type_scaled_; }
    void set_stealth_rock_type_scaled(bool scaled) { stealth_rock_type_scaled_ = scaled; }

    // ========================================================================
    // LOOKUP WITH BASELINE FALLBACK
    // ========================================================================

    /**
     * Species lookup; unknown ids resolve to the 100-stat Normal baseline.
     */
    Resolved<SpeciesDef> resolve_species(const std::string& id) const;

    /**
     * Move lookup; unknown ids resolve to Tackle.
     */
    Resolved<MoveDef> resolve_move(const std::string& id) const;

    const SpeciesDef& fallback_species() const { return fallback_species_; }
    const MoveDef& fallback_move() const { return fallback_move_; }
    const MoveDef& struggle() const { return struggle_; }
    const MoveDef& confusion_hit() const { return confusion_hit_; }

    // ========================================================================
    // PROGRAMMATIC REGISTRATION
    // ========================================================================

    void add_species(SpeciesDef species);
    void add_move(MoveDef move);
    void add_ability(AbilityDef ability);
    void add_item(ItemDef item);
    void set_weather(WeatherDef weather);
    void set_terrain(TerrainDef terrain);
    void set_type_effectiveness(Type attack, Type defend, double multiplier);

    size_t species_count() const { return species_.size(); }
    size_t move_count() const { return moves_.size(); }
    size_t ability_count() const { return abilities_.size(); }
    size_t item_count() const { return items_.size(); }

    const std::unordered_map<std::string, AbilityDef>& abilities() const { return abilities_; }
    const std::unordered_map<std::string, ItemDef>& items() const { return items_; }

    /**
     * Normalize an identifier: lowercase, alphanumerics only.
     * "King's Shield" -> "kingsshield", "U-turn" -> "uturn".
     */
    static std::string normalize_id(const std::string& name);

    /**
     * Static parsing utilities - public for use by other components.
     */
    static Type parse_type(const std::string& s);
    static MoveCategory parse_category(const std::string& s);
    static MajorStatus parse_status(const std::string& s);
    static std::optional<Volatile> parse_volatile(const std::string& s);
    static std::optional<BoostStat> parse_boost_stat(const std::string& s);
    static Weather parse_weather(const std::string& s);
    static Terrain parse_terrain(const std::string& s);
    static std::optional<Hazard> parse_hazard(const std::string& s);
    static std::optional<Screen> parse_screen(const std::string& s);
    static std::optional<Room> parse_room(const std::string& s);

private:
    std::unordered_map<std::string, SpeciesDef> species_;
    std::unordered_map<std::string, MoveDef> moves_;
    std::unordered_map<std::string, AbilityDef> abilities_;
    std::unordered_map<std::string, ItemDef> items_;
    std::array<WeatherDef, 6> weather_;
    std::array<TerrainDef, 5> terrain_;
    TypeChart type_chart_;
    bool stealth_rock_type_scaled_ = false;

    SpeciesDef fallback_species_;
    MoveDef fallback_move_;
    MoveDef struggle_;
    MoveDef confusion_hit_;

    void install_defaults();
    bool load_document(const nlohmann::json& data);

    // Parse helpers
    SpeciesDef parse_species(const nlohmann::json& species_json) const;
    MoveDef parse_move(const nlohmann::json& move_json) const;
    void parse_move_effects(const nlohmann::json& move_json, MoveDef& move) const;
    EffectDef parse_effect_def(const nlohmann::json& effect_json) const;
    void parse_weather_row(const nlohmann::json& row);
    void parse_terrain_row(const nlohmann::json& row);
    static std::vector<BoostPair> parse_boosts(const nlohmann::json& boosts_json);
};

} // namespace pokesim
