/**
 * pokesim - Static Rule Tables Implementation
 *
 * Loads species, moves, abilities, items, type chart and weather/terrain
 * rows from JSON using nlohmann/json.
 */

#include "rule_tables.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace pokesim {

// ============================================================================
// EFFECT DEF PARAMS
// ============================================================================

double EffectDef::param_double(const std::string& key, double fallback) const {
    auto it = params.find(key);
    if (it == params.end()) {
        return fallback;
    }
    try {
        return std::stod(it->second);
    } catch (const std::exception&) {
        std::cerr << "[RuleTables] Non-numeric param '" << key << "' on " << id << std::endl;
        return fallback;
    }
}

Type EffectDef::param_type(const std::string& key, Type fallback) const {
    auto it = params.find(key);
    if (it == params.end()) {
        return fallback;
    }
    return RuleTables::parse_type(it->second);
}

// ============================================================================
// TYPE CHART
// ============================================================================

TypeChart::TypeChart() {
    for (auto& row : table_) {
        row.fill(1.0);
    }
}

double TypeChart::effectiveness(Type attack, Type defend) const {
    if (attack == Type::TYPELESS || defend == Type::TYPELESS) {
        return 1.0;
    }
    return table_[static_cast<size_t>(attack)][static_cast<size_t>(defend)];
}

double TypeChart::effectiveness(Type attack, const std::vector<Type>& defend) const {
    double multiplier = 1.0;
    for (Type t : defend) {
        multiplier *= effectiveness(attack, t);
    }
    return multiplier;
}

void TypeChart::set(Type attack, Type defend, double multiplier) {
    if (attack == Type::TYPELESS || defend == Type::TYPELESS) {
        return;
    }
    table_[static_cast<size_t>(attack)][static_cast<size_t>(defend)] = multiplier;
}

TypeChart TypeChart::standard() {
    TypeChart chart;

    struct Row {
        Type attack;
        std::vector<Type> super_effective;
        std::vector<Type> resisted;
        std::vector<Type> immune;
    };

    using T = Type;
    const std::vector<Row> rows = {
        {T::NORMAL,   {}, {T::ROCK, T::STEEL}, {T::GHOST}},
        {T::FIRE,     {T::GRASS, T::ICE, T::BUG, T::STEEL},
                      {T::FIRE, T::WATER, T::ROCK, T::DRAGON}, {}},
        {T::WATER,    {T::FIRE, T::GROUND, T::ROCK}, {T::WATER, T::GRASS, T::DRAGON}, {}},
        {T::ELECTRIC, {T::WATER, T::FLYING}, {T::ELECTRIC, T::GRASS, T::DRAGON}, {T::GROUND}},
        {T::GRASS,    {T::WATER, T::GROUND, T::ROCK},
                      {T::FIRE, T::GRASS, T::POISON, T::FLYING, T::BUG, T::DRAGON, T::STEEL}, {}},
        {T::ICE,      {T::GRASS, T::GROUND, T::FLYING, T::DRAGON},
                      {T::FIRE, T::WATER, T::ICE, T::STEEL}, {}},
        {T::FIGHTING, {T::NORMAL, T::ICE, T::ROCK, T::DARK, T::STEEL},
                      {T::POISON, T::FLYING, T::PSYCHIC, T::BUG, T::FAIRY}, {T::GHOST}},
        {T::POISON,   {T::GRASS, T::FAIRY}, {T::POISON, T::GROUND, T::ROCK, T::GHOST}, {T::STEEL}},
        {T::GROUND,   {T::FIRE, T::ELECTRIC, T::POISON, T::ROCK, T::STEEL},
                      {T::GRASS, T::BUG}, {T::FLYING}},
        {T::FLYING,   {T::GRASS, T::FIGHTING, T::BUG}, {T::ELECTRIC, T::ROCK, T::STEEL}, {}},
        {T::PSYCHIC,  {T::FIGHTING, T::POISON}, {T::PSYCHIC, T::STEEL}, {T::DARK}},
        {T::BUG,      {T::GRASS, T::PSYCHIC, T::DARK},
                      {T::FIRE, T::FIGHTING, T::POISON, T::FLYING, T::GHOST, T::STEEL, T::FAIRY}, {}},
        {T::ROCK,     {T::FIRE, T::ICE, T::FLYING, T::BUG}, {T::FIGHTING, T::GROUND, T::STEEL}, {}},
        {T::GHOST,    {T::PSYCHIC, T::GHOST}, {T::DARK}, {T::NORMAL}},
        {T::DRAGON,   {T::DRAGON}, {T::STEEL}, {T::FAIRY}},
        {T::DARK,     {T::PSYCHIC, T::GHOST}, {T::FIGHTING, T::DARK, T::FAIRY}, {}},
        {T::STEEL,    {T::ICE, T::ROCK, T::FAIRY}, {T::FIRE, T::WATER, T::ELECTRIC, T::STEEL}, {}},
        {T::FAIRY,    {T::FIGHTING, T::DRAGON, T::DARK}, {T::FIRE, T::POISON, T::STEEL}, {}},
    };

    for (const auto& row : rows) {
        for (Type t : row.super_effective) chart.set(row.attack, t, 2.0);
        for (Type t : row.resisted) chart.set(row.attack, t, 0.5);
        for (Type t : row.immune) chart.set(row.attack, t, 0.0);
    }

    return chart;
}

// ============================================================================
// RULE TABLES - DEFAULTS
// ============================================================================

RuleTables::RuleTables() {
    install_defaults();
}

void RuleTables::install_defaults() {
    type_chart_ = TypeChart::standard();

    for (size_t i = 0; i < weather_.size(); i++) {
        weather_[i] = WeatherDef{};
        weather_[i].weather = static_cast<Weather>(i);
    }
    auto& sun = weather_[static_cast<size_t>(Weather::SUN)];
    sun.type_modifiers = {{Type::FIRE, 1.5}, {Type::WATER, 0.5}};

    auto& rain = weather_[static_cast<size_t>(Weather::RAIN)];
    rain.type_modifiers = {{Type::WATER, 1.5}, {Type::FIRE, 0.5}};

    auto& sand = weather_[static_cast<size_t>(Weather::SANDSTORM)];
    sand.chip_fraction = 1.0 / 16.0;
    sand.chip_immune_types = {Type::ROCK, Type::GROUND, Type::STEEL};
    sand.defense_boost_type = Type::ROCK;
    sand.defense_boost_stat = Stat::SPD;
    sand.defense_boost = 1.5;

    auto& hail = weather_[static_cast<size_t>(Weather::HAIL)];
    hail.chip_fraction = 1.0 / 16.0;
    hail.chip_immune_types = {Type::ICE};

    auto& snow = weather_[static_cast<size_t>(Weather::SNOW)];
    snow.defense_boost_type = Type::ICE;
    snow.defense_boost_stat = Stat::DEF;
    snow.defense_boost = 1.5;

    for (size_t i = 0; i < terrain_.size(); i++) {
        terrain_[i] = TerrainDef{};
        terrain_[i].terrain = static_cast<Terrain>(i);
    }
    auto& electric = terrain_[static_cast<size_t>(Terrain::ELECTRIC)];
    electric.boosted_type = Type::ELECTRIC;
    electric.blocks_sleep = true;

    auto& grassy = terrain_[static_cast<size_t>(Terrain::GRASSY)];
    grassy.boosted_type = Type::GRASS;
    grassy.heal_fraction = 1.0 / 16.0;

    auto& misty = terrain_[static_cast<size_t>(Terrain::MISTY)];
    misty.weakened_type = Type::DRAGON;
    misty.weaken = 0.5;
    misty.blocks_status = true;

    auto& psychic = terrain_[static_cast<size_t>(Terrain::PSYCHIC)];
    psychic.boosted_type = Type::PSYCHIC;
    psychic.blocks_priority = true;

    // Baseline species for unknown ids: 100 in every stat, Normal type
    fallback_species_.id = "baseline";
    fallback_species_.name = "Baseline";
    fallback_species_.types = {Type::NORMAL};
    fallback_species_.base_stats = StatBlock::uniform(100);

    fallback_move_.id = "tackle";
    fallback_move_.name = "Tackle";
    fallback_move_.type = Type::NORMAL;
    fallback_move_.category = MoveCategory::PHYSICAL;
    fallback_move_.power = 40;
    fallback_move_.accuracy = 100;
    fallback_move_.pp = 35;
    fallback_move_.flags.contact = true;

    struggle_.id = "struggle";
    struggle_.name = "Struggle";
    struggle_.type = Type::TYPELESS;
    struggle_.category = MoveCategory::PHYSICAL;
    struggle_.power = 50;
    struggle_.accuracy = std::nullopt;
    struggle_.pp = 1;
    struggle_.flags.contact = true;
    struggle_.self_damage = 0.25;

    confusion_hit_.id = "confusionhit";
    confusion_hit_.name = "Confusion Self-Hit";
    confusion_hit_.type = Type::TYPELESS;
    confusion_hit_.category = MoveCategory::PHYSICAL;
    confusion_hit_.power = 40;
    confusion_hit_.accuracy = std::nullopt;
}

// ============================================================================
// LOADING
// ============================================================================

bool RuleTables::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[RuleTables] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[RuleTables] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[RuleTables] Error: " << e.what() << std::endl;
        return false;
    }
}

bool RuleTables::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[RuleTables] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[RuleTables] Error: " << e.what() << std::endl;
        return false;
    }
}

bool RuleTables::load_document(const json& data) {
    if (!data.is_object()) {
        std::cerr << "[RuleTables] Top-level JSON must be an object" << std::endl;
        return false;
    }

    if (data.contains("type_chart") && data["type_chart"].is_object()) {
        for (const auto& [attack_name, row] : data["type_chart"].items()) {
            Type attack = parse_type(attack_name);
            for (const auto& [defend_name, multiplier] : row.items()) {
                type_chart_.set(attack, parse_type(defend_name), multiplier.get<double>());
            }
        }
    }

    if (data.contains("species") && data["species"].is_array()) {
        for (const auto& species_json : data["species"]) {
            SpeciesDef species = parse_species(species_json);
            if (!species.id.empty()) {
                species_[species.id] = std::move(species);
            }
        }
    }

    if (data.contains("moves") && data["moves"].is_array()) {
        for (const auto& move_json : data["moves"]) {
            MoveDef move = parse_move(move_json);
            if (!move.id.empty()) {
                moves_[move.id] = std::move(move);
            }
        }
    }

    if (data.contains("abilities") && data["abilities"].is_array()) {
        for (const auto& ability_json : data["abilities"]) {
            AbilityDef ability = parse_effect_def(ability_json);
            if (!ability.id.empty()) {
                abilities_[ability.id] = std::move(ability);
            }
        }
    }

    if (data.contains("items") && data["items"].is_array()) {
        for (const auto& item_json : data["items"]) {
            ItemDef item = parse_effect_def(item_json);
            if (!item.id.empty()) {
                items_[item.id] = std::move(item);
            }
        }
    }

    if (data.contains("weather") && data["weather"].is_array()) {
        for (const auto& row : data["weather"]) {
            parse_weather_row(row);
        }
    }

    if (data.contains("terrain") && data["terrain"].is_array()) {
        for (const auto& row : data["terrain"]) {
            parse_terrain_row(row);
        }
    }

    if (data.contains("hazards") && data["hazards"].is_object()) {
        stealth_rock_type_scaled_ = data["hazards"].value("stealth_rock_type_scaled", stealth_rock_type_scaled_);
    }

    std::cout << "[RuleTables] Loaded " << species_.size() << " species, "
              << moves_.size() << " moves, " << abilities_.size() << " abilities, "
              << items_.size() << " items" << std::endl;
    return true;
}

SpeciesDef RuleTables::parse_species(const json& species_json) const {
    SpeciesDef species;

    species.name = species_json.value("name", "");
    species.id = normalize_id(species_json.value("id", species.name));
    if (species.id.empty()) {
        return species;  // Invalid entry
    }
    if (species.name.empty()) {
        species.name = species.id;
    }

    if (species_json.contains("types") && species_json["types"].is_array()) {
        for (const auto& t : species_json["types"]) {
            species.types.push_back(parse_type(t.get<std::string>()));
        }
    }
    if (species.types.empty()) {
        species.types.push_back(Type::NORMAL);
    }

    if (species_json.contains("base_stats") && species_json["base_stats"].is_object()) {
        const auto& stats = species_json["base_stats"];
        species.base_stats.hp = stats.value("hp", 100);
        species.base_stats.atk = stats.value("atk", 100);
        species.base_stats.def = stats.value("def", 100);
        species.base_stats.spa = stats.value("spa", 100);
        species.base_stats.spd = stats.value("spd", 100);
        species.base_stats.spe = stats.value("spe", 100);
    } else {
        species.base_stats = StatBlock::uniform(100);
    }

    if (species_json.contains("abilities") && species_json["abilities"].is_array()) {
        for (const auto& a : species_json["abilities"]) {
            species.abilities.push_back(normalize_id(a.get<std::string>()));
        }
    }

    return species;
}

MoveDef RuleTables::parse_move(const json& move_json) const {
    MoveDef move;

    move.name = move_json.value("name", "");
    move.id = normalize_id(move_json.value("id", move.name));
    if (move.id.empty()) {
        return move;  // Invalid entry
    }
    if (move.name.empty()) {
        move.name = move.id;
    }

    move.type = parse_type(move_json.value("type", "Normal"));
    move.category = parse_category(move_json.value("category", "status"));
    move.power = move_json.value("power", 0);
    move.pp = move_json.value("pp", 10);
    move.priority = move_json.value("priority", 0);

    // Accuracy: number, or true / "always" / null for always-hit moves
    if (move_json.contains("accuracy")) {
        const auto& acc = move_json["accuracy"];
        if (acc.is_number()) {
            move.accuracy = acc.get<int>();
        } else {
            move.accuracy = std::nullopt;
        }
    }

    if (move.is_status() && move.power != 0) {
        std::cerr << "[RuleTables] Status move " << move.id
                  << " declares power " << move.power << "; using 0" << std::endl;
        move.power = 0;
    }

    if (move_json.contains("flags") && move_json["flags"].is_array()) {
        for (const auto& f : move_json["flags"]) {
            std::string flag = f.get<std::string>();
            if (flag == "contact") move.flags.contact = true;
            else if (flag == "sound") move.flags.sound = true;
            else if (flag == "powder") move.flags.powder = true;
            else if (flag == "bullet") move.flags.bullet = true;
            else if (flag == "punch") move.flags.punch = true;
            else if (flag == "high_crit") move.flags.high_crit = true;
            else if (flag == "breaks_protect") move.flags.breaks_protect = true;
            else if (flag == "requires_target_attack") move.flags.requires_target_attack = true;
            else if (flag == "charge") move.flags.charge = true;
            else if (flag == "solar") move.flags.solar = true;
            else if (flag == "grassy_halved") move.flags.grassy_halved = true;
            else if (flag == "self_switch") move.flags.self_switch = true;
            else if (flag == "force_switch") move.flags.force_switch = true;
        }
    }

    // Effect data is optional; anything malformed degrades to "no effect"
    try {
        parse_move_effects(move_json, move);
    } catch (const std::exception& e) {
        std::cerr << "[RuleTables] Malformed effect data on move " << move.id
                  << " (" << e.what() << "); treating as no secondary effect" << std::endl;
        MoveDef clean;
        clean.id = move.id;
        clean.name = move.name;
        clean.type = move.type;
        clean.category = move.category;
        clean.power = move.power;
        clean.accuracy = move.accuracy;
        clean.pp = move.pp;
        clean.priority = move.priority;
        clean.flags = move.flags;
        move = std::move(clean);
    }

    return move;
}

void RuleTables::parse_move_effects(const json& move_json, MoveDef& move) const {
    if (move_json.contains("multi_hit")) {
        const auto& hits = move_json["multi_hit"];
        if (hits.is_array() && hits.size() == 2) {
            move.min_hits = hits[0].get<int>();
            move.max_hits = hits[1].get<int>();
        } else if (hits.is_number()) {
            move.min_hits = move.max_hits = hits.get<int>();
        } else {
            throw std::invalid_argument("multi_hit must be [min, max] or a count");
        }
        if (move.min_hits < 1 || move.max_hits < move.min_hits) {
            throw std::invalid_argument("invalid multi_hit range");
        }
    }

    if (move_json.contains("secondary") && !move_json["secondary"].is_null()) {
        const auto& sec = move_json["secondary"];
        SecondaryEffect effect;
        effect.chance = sec.at("chance").get<int>();
        if (sec.contains("status")) {
            effect.status = parse_status(sec["status"].get<std::string>());
            if (effect.status == MajorStatus::NONE) {
                throw std::invalid_argument("unknown secondary status");
            }
        }
        if (sec.contains("volatile")) {
            effect.volatile_status = parse_volatile(sec["volatile"].get<std::string>());
            if (!effect.volatile_status) {
                throw std::invalid_argument("unknown secondary volatile");
            }
        }
        if (sec.contains("boosts")) {
            effect.boosts = parse_boosts(sec["boosts"]);
        }
        effect.self = sec.value("self", false);
        move.secondary = effect;
    }

    if (move_json.contains("status")) {
        move.inflicts_status = parse_status(move_json["status"].get<std::string>());
        if (move.inflicts_status == MajorStatus::NONE) {
            throw std::invalid_argument("unknown status");
        }
    }
    if (move_json.contains("volatile")) {
        move.inflicts_volatile = parse_volatile(move_json["volatile"].get<std::string>());
        if (!move.inflicts_volatile) {
            throw std::invalid_argument("unknown volatile");
        }
    }
    if (move_json.contains("hazard")) {
        move.hazard = parse_hazard(move_json["hazard"].get<std::string>());
        if (!move.hazard) throw std::invalid_argument("unknown hazard");
    }
    if (move_json.contains("screen")) {
        move.screen = parse_screen(move_json["screen"].get<std::string>());
        if (!move.screen) throw std::invalid_argument("unknown screen");
    }
    if (move_json.contains("weather")) {
        move.sets_weather = parse_weather(move_json["weather"].get<std::string>());
    }
    if (move_json.contains("terrain")) {
        move.sets_terrain = parse_terrain(move_json["terrain"].get<std::string>());
    }
    if (move_json.contains("room")) {
        move.room = parse_room(move_json["room"].get<std::string>());
        if (!move.room) throw std::invalid_argument("unknown room");
    }
    move.tailwind = move_json.value("tailwind", false);

    if (move_json.contains("self_boosts")) {
        move.self_boosts = parse_boosts(move_json["self_boosts"]);
    }
    if (move_json.contains("target_boosts")) {
        move.target_boosts = parse_boosts(move_json["target_boosts"]);
    }

    move.heal = move_json.value("heal", 0.0);
    move.weather_heal = move_json.value("weather_heal", false);
    move.drain = move_json.value("drain", 0.0);
    move.recoil = move_json.value("recoil", 0.0);
    move.self_damage = move_json.value("self_damage", 0.0);
    move.destiny_bond = move_json.value("destiny_bond", false);

    if (move_json.contains("protect")) {
        std::string kind = normalize_id(move_json["protect"].get<std::string>());
        if (kind == "protect" || kind == "detect") move.protect = ProtectKind::PROTECT;
        else if (kind == "spikyshield") move.protect = ProtectKind::SPIKY_SHIELD;
        else if (kind == "kingsshield") move.protect = ProtectKind::KINGS_SHIELD;
        else throw std::invalid_argument("unknown protect kind");
    }

    if (move_json.contains("hazard_removal")) {
        std::string kind = normalize_id(move_json["hazard_removal"].get<std::string>());
        if (kind == "defog") move.hazard_removal = HazardRemoval::DEFOG;
        else if (kind == "rapidspin") move.hazard_removal = HazardRemoval::RAPID_SPIN;
        else if (kind == "courtchange") move.hazard_removal = HazardRemoval::COURT_CHANGE;
        else throw std::invalid_argument("unknown hazard removal");
    }

    if (move_json.contains("fixed_damage")) {
        std::string kind = normalize_id(move_json["fixed_damage"].get<std::string>());
        if (kind == "level") move.fixed_damage = FixedDamage::LEVEL;
        else if (kind == "halfhp") move.fixed_damage = FixedDamage::HALF_HP;
        else if (kind == "endeavor") move.fixed_damage = FixedDamage::ENDEAVOR;
        else if (kind == "counter") move.fixed_damage = FixedDamage::COUNTER;
        else if (kind == "mirrorcoat") move.fixed_damage = FixedDamage::MIRROR_COAT;
        else if (kind == "metalburst") move.fixed_damage = FixedDamage::METAL_BURST;
        else if (kind == "ohko") move.fixed_damage = FixedDamage::OHKO;
        else throw std::invalid_argument("unknown fixed damage kind");
    }

    if (move_json.contains("weather_accuracy") && move_json["weather_accuracy"].is_object()) {
        for (const auto& [weather_name, acc] : move_json["weather_accuracy"].items()) {
            move.weather_accuracy.emplace_back(parse_weather(weather_name), acc.get<int>());
        }
    }
}

std::vector<BoostPair> RuleTables::parse_boosts(const json& boosts_json) {
    std::vector<BoostPair> boosts;
    if (!boosts_json.is_object()) {
        throw std::invalid_argument("boosts must be an object");
    }
    for (const auto& [stat_name, stages] : boosts_json.items()) {
        auto stat = parse_boost_stat(stat_name);
        if (!stat) {
            throw std::invalid_argument("unknown boost stat " + stat_name);
        }
        boosts.emplace_back(*stat, stages.get<int>());
    }
    return boosts;
}

EffectDef RuleTables::parse_effect_def(const json& effect_json) const {
    EffectDef def;
    def.name = effect_json.value("name", "");
    def.id = normalize_id(effect_json.value("id", def.name));
    if (def.id.empty()) {
        return def;
    }
    if (def.name.empty()) {
        def.name = def.id;
    }
    def.effect = effect_json.value("effect", def.id);

    if (effect_json.contains("params") && effect_json["params"].is_object()) {
        for (const auto& [key, value] : effect_json["params"].items()) {
            def.params[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return def;
}

void RuleTables::parse_weather_row(const json& row) {
    Weather weather = parse_weather(row.value("weather", "none"));
    if (weather == Weather::NONE) {
        return;
    }
    WeatherDef& def = weather_[static_cast<size_t>(weather)];
    def.duration = row.value("duration", def.duration);
    if (row.contains("type_modifiers") && row["type_modifiers"].is_object()) {
        def.type_modifiers.clear();
        for (const auto& [type_name, mult] : row["type_modifiers"].items()) {
            def.type_modifiers.emplace_back(parse_type(type_name), mult.get<double>());
        }
    }
    def.chip_fraction = row.value("chip", def.chip_fraction);
    if (row.contains("chip_immune") && row["chip_immune"].is_array()) {
        def.chip_immune_types.clear();
        for (const auto& t : row["chip_immune"]) {
            def.chip_immune_types.push_back(parse_type(t.get<std::string>()));
        }
    }
    if (row.contains("defense_boost") && row["defense_boost"].is_object()) {
        const auto& boost = row["defense_boost"];
        def.defense_boost_type = parse_type(boost.value("type", "Typeless"));
        def.defense_boost_stat = boost.value("stat", "def") == "spd" ? Stat::SPD : Stat::DEF;
        def.defense_boost = boost.value("multiplier", 1.5);
    }
}

void RuleTables::parse_terrain_row(const json& row) {
    Terrain terrain = parse_terrain(row.value("terrain", "none"));
    if (terrain == Terrain::NONE) {
        return;
    }
    TerrainDef& def = terrain_[static_cast<size_t>(terrain)];
    def.duration = row.value("duration", def.duration);
    if (row.contains("boosted_type")) {
        def.boosted_type = parse_type(row["boosted_type"].get<std::string>());
    }
    def.boost = row.value("boost", def.boost);
    if (row.contains("weakened_type")) {
        def.weakened_type = parse_type(row["weakened_type"].get<std::string>());
    }
    def.weaken = row.value("weaken", def.weaken);
    def.heal_fraction = row.value("heal", def.heal_fraction);
    def.blocks_status = row.value("blocks_status", def.blocks_status);
    def.blocks_sleep = row.value("blocks_sleep", def.blocks_sleep);
    def.blocks_priority = row.value("blocks_priority", def.blocks_priority);
}

// ============================================================================
// LOOKUP
// ============================================================================

const SpeciesDef* RuleTables::get_species(const std::string& id) const {
    auto it = species_.find(normalize_id(id));
    return it != species_.end() ? &it->second : nullptr;
}

const MoveDef* RuleTables::get_move(const std::string& id) const {
    std::string key = normalize_id(id);
    if (key == struggle_.id) {
        return &struggle_;
    }
    auto it = moves_.find(key);
    return it != moves_.end() ? &it->second : nullptr;
}

const AbilityDef* RuleTables::get_ability(const std::string& id) const {
    if (id.empty()) return nullptr;
    auto it = abilities_.find(normalize_id(id));
    return it != abilities_.end() ? &it->second : nullptr;
}

const ItemDef* RuleTables::get_item(const std::string& id) const {
    if (id.empty()) return nullptr;
    auto it = items_.find(normalize_id(id));
    return it != items_.end() ? &it->second : nullptr;
}

const WeatherDef& RuleTables::get_weather(Weather weather) const {
    return weather_[static_cast<size_t>(weather)];
}

const TerrainDef& RuleTables::get_terrain(Terrain terrain) const {
    return terrain_[static_cast<size_t>(terrain)];
}

Resolved<SpeciesDef> RuleTables::resolve_species(const std::string& id) const {
    const SpeciesDef* def = get_species(id);
    if (def) {
        return {def, false};
    }
    return {&fallback_species_, true};
}

Resolved<MoveDef> RuleTables::resolve_move(const std::string& id) const {
    const MoveDef* def = get_move(id);
    if (def) {
        return {def, false};
    }
    return {&fallback_move_, true};
}

// ============================================================================
// PROGRAMMATIC REGISTRATION
// ============================================================================

void RuleTables::add_species(SpeciesDef species) {
    species.id = normalize_id(species.id.empty() ? species.name : species.id);
    if (species.types.empty()) {
        species.types.push_back(Type::NORMAL);
    }
    species_[species.id] = std::move(species);
}

void RuleTables::add_move(MoveDef move) {
    move.id = normalize_id(move.id.empty() ? move.name : move.id);
    if (move.is_status()) {
        move.power = 0;
    }
    moves_[move.id] = std::move(move);
}

void RuleTables::add_ability(AbilityDef ability) {
    ability.id = normalize_id(ability.id.empty() ? ability.name : ability.id);
    if (ability.effect.empty()) {
        ability.effect = ability.id;
    }
    abilities_[ability.id] = std::move(ability);
}

void RuleTables::add_item(ItemDef item) {
    item.id = normalize_id(item.id.empty() ? item.name : item.id);
    if (item.effect.empty()) {
        item.effect = item.id;
    }
    items_[item.id] = std::move(item);
}

void RuleTables::set_weather(WeatherDef weather) {
    weather_[static_cast<size_t>(weather.weather)] = std::move(weather);
}

void RuleTables::set_terrain(TerrainDef terrain) {
    terrain_[static_cast<size_t>(terrain.terrain)] = std::move(terrain);
}

void RuleTables::set_type_effectiveness(Type attack, Type defend, double multiplier) {
    type_chart_.set(attack, defend, multiplier);
}

// ============================================================================
// PARSING UTILITIES
// ============================================================================

std::string RuleTables::normalize_id(const std::string& name) {
    std::string id;
    id.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            id.push_back(static_cast<char>(std::tolower(uc)));
        }
    }
    return id;
}

Type RuleTables::parse_type(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "normal") return Type::NORMAL;
    if (id == "fire") return Type::FIRE;
    if (id == "water") return Type::WATER;
    if (id == "electric") return Type::ELECTRIC;
    if (id == "grass") return Type::GRASS;
    if (id == "ice") return Type::ICE;
    if (id == "fighting") return Type::FIGHTING;
    if (id == "poison") return Type::POISON;
    if (id == "ground") return Type::GROUND;
    if (id == "flying") return Type::FLYING;
    if (id == "psychic") return Type::PSYCHIC;
    if (id == "bug") return Type::BUG;
    if (id == "rock") return Type::ROCK;
    if (id == "ghost") return Type::GHOST;
    if (id == "dragon") return Type::DRAGON;
    if (id == "dark") return Type::DARK;
    if (id == "steel") return Type::STEEL;
    if (id == "fairy") return Type::FAIRY;
    return Type::TYPELESS;
}

MoveCategory RuleTables::parse_category(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "physical") return MoveCategory::PHYSICAL;
    if (id == "special") return MoveCategory::SPECIAL;
    return MoveCategory::STATUS;
}

MajorStatus RuleTables::parse_status(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "burn" || id == "brn") return MajorStatus::BURN;
    if (id == "poison" || id == "psn") return MajorStatus::POISON;
    if (id == "badlypoisoned" || id == "toxic" || id == "tox") return MajorStatus::BADLY_POISONED;
    if (id == "paralysis" || id == "par") return MajorStatus::PARALYSIS;
    if (id == "sleep" || id == "slp") return MajorStatus::SLEEP;
    if (id == "freeze" || id == "frz") return MajorStatus::FREEZE;
    return MajorStatus::NONE;
}

std::optional<Volatile> RuleTables::parse_volatile(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "confusion") return Volatile::CONFUSION;
    if (id == "flinch") return Volatile::FLINCH;
    if (id == "taunt") return Volatile::TAUNT;
    if (id == "encore") return Volatile::ENCORE;
    if (id == "disable") return Volatile::DISABLE;
    if (id == "torment") return Volatile::TORMENT;
    if (id == "imprison") return Volatile::IMPRISON;
    if (id == "substitute") return Volatile::SUBSTITUTE;
    if (id == "trapped" || id == "meanlook") return Volatile::TRAPPED;
    if (id == "partialtrap") return Volatile::PARTIAL_TRAP;
    if (id == "leechseed") return Volatile::LEECH_SEED;
    if (id == "perishsong") return Volatile::PERISH_SONG;
    return std::nullopt;
}

std::optional<BoostStat> RuleTables::parse_boost_stat(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "atk" || id == "attack") return BoostStat::ATK;
    if (id == "def" || id == "defense") return BoostStat::DEF;
    if (id == "spa" || id == "specialattack") return BoostStat::SPA;
    if (id == "spd" || id == "specialdefense") return BoostStat::SPD;
    if (id == "spe" || id == "speed") return BoostStat::SPE;
    if (id == "accuracy") return BoostStat::ACCURACY;
    if (id == "evasion") return BoostStat::EVASION;
    return std::nullopt;
}

Weather RuleTables::parse_weather(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "sun" || id == "sunnyday" || id == "harshsunlight") return Weather::SUN;
    if (id == "rain" || id == "raindance") return Weather::RAIN;
    if (id == "sandstorm" || id == "sand") return Weather::SANDSTORM;
    if (id == "hail") return Weather::HAIL;
    if (id == "snow" || id == "snowscape") return Weather::SNOW;
    return Weather::NONE;
}

Terrain RuleTables::parse_terrain(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "electric" || id == "electricterrain") return Terrain::ELECTRIC;
    if (id == "grassy" || id == "grassyterrain") return Terrain::GRASSY;
    if (id == "misty" || id == "mistyterrain") return Terrain::MISTY;
    if (id == "psychic" || id == "psychicterrain") return Terrain::PSYCHIC;
    return Terrain::NONE;
}

std::optional<Hazard> RuleTables::parse_hazard(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "stealthrock") return Hazard::STEALTH_ROCK;
    if (id == "spikes") return Hazard::SPIKES;
    if (id == "toxicspikes") return Hazard::TOXIC_SPIKES;
    if (id == "stickyweb") return Hazard::STICKY_WEB;
    return std::nullopt;
}

std::optional<Screen> RuleTables::parse_screen(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "reflect") return Screen::REFLECT;
    if (id == "lightscreen") return Screen::LIGHT_SCREEN;
    if (id == "auroraveil") return Screen::AURORA_VEIL;
    return std::nullopt;
}

std::optional<Room> RuleTables::parse_room(const std::string& s) {
    std::string id = normalize_id(s);
    if (id == "trickroom") return Room::TRICK_ROOM;
    if (id == "gravity") return Room::GRAVITY;
    if (id == "wonderroom") return Room::WONDER_ROOM;
    if (id == "magicroom") return Room::MAGIC_ROOM;
    return std::nullopt;
}

} // namespace pokesim
