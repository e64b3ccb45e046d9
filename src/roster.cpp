/**
 * pokesim - Roster Implementation
 */

#include "roster.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace pokesim {

namespace {

StatBlock parse_stat_block(const json& stats_json, int fallback) {
    StatBlock stats = StatBlock::uniform(fallback);
    stats.hp = stats_json.value("hp", fallback);
    stats.atk = stats_json.value("atk", fallback);
    stats.def = stats_json.value("def", fallback);
    stats.spa = stats_json.value("spa", fallback);
    stats.spd = stats_json.value("spd", fallback);
    stats.spe = stats_json.value("spe", fallback);
    return stats;
}

constexpr std::array<Stat, 6> ALL_STATS = {
    Stat::HP, Stat::ATK, Stat::DEF, Stat::SPA, Stat::SPD, Stat::SPE
};

} // anonymous namespace

// ============================================================================
// PARSING
// ============================================================================

CombatantSpec parse_combatant_spec(const json& member_json) {
    CombatantSpec spec;
    spec.species = member_json.value("species", "");
    spec.nickname = member_json.value("name", "");
    spec.level = member_json.value("level", 100);
    spec.ability = member_json.value("ability", "");
    spec.item = member_json.value("item", "");

    if (member_json.contains("moves") && member_json["moves"].is_array()) {
        for (const auto& m : member_json["moves"]) {
            if (m.is_string()) {
                spec.moves.push_back(m.get<std::string>());
            }
        }
    }

    if (member_json.contains("tera_type") && member_json["tera_type"].is_string()) {
        Type tera = RuleTables::parse_type(member_json["tera_type"].get<std::string>());
        if (tera != Type::TYPELESS) {
            spec.tera_type = tera;
        }
    }

    if (member_json.contains("ivs") && member_json["ivs"].is_object()) {
        spec.ivs = parse_stat_block(member_json["ivs"], 31);
    }
    if (member_json.contains("evs") && member_json["evs"].is_object()) {
        spec.evs = parse_stat_block(member_json["evs"], 0);
    }
    return spec;
}

bool Roster::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Roster] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::exception& e) {
        std::cerr << "[Roster] JSON error in " << filepath << ": " << e.what() << std::endl;
        return false;
    }
}

bool Roster::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load_document(data);
    } catch (const json::exception& e) {
        std::cerr << "[Roster] JSON error: " << e.what() << std::endl;
        return false;
    }
}

bool Roster::load_document(const json& data) {
    const json* members_json = &data;
    if (data.is_object()) {
        name = data.value("name", name);
        if (!data.contains("members") || !data["members"].is_array()) {
            std::cerr << "[Roster] Object roster needs a 'members' array" << std::endl;
            return false;
        }
        members_json = &data["members"];
    } else if (!data.is_array()) {
        std::cerr << "[Roster] Roster must be an array or an object" << std::endl;
        return false;
    }

    members.clear();
    for (const auto& member_json : *members_json) {
        if (!member_json.is_object()) {
            std::cerr << "[Roster] Skipping non-object member" << std::endl;
            continue;
        }
        members.push_back(parse_combatant_spec(member_json));
    }

    if (members.empty()) {
        std::cerr << "[Roster] Roster has no members" << std::endl;
        return false;
    }
    if (members.size() > static_cast<size_t>(MAX_ROSTER_SIZE)) {
        std::cerr << "[Roster] Roster has " << members.size() << " members; at most "
                  << MAX_ROSTER_SIZE << " allowed" << std::endl;
        return false;
    }
    return true;
}

// ============================================================================
// BUILDING
// ============================================================================

Combatant build_combatant(const RuleTables& rules, const CombatantSpec& spec,
                          const FormatRules& format, std::vector<std::string>& fallbacks) {
    Combatant c;

    const SpeciesDef* species = nullptr;
    if (format.species_banned(spec.species)) {
        fallbacks.push_back("species " + spec.species + " banned; using baseline");
        species = &rules.fallback_species();
        c.used_fallback_species = true;
    } else {
        Resolved<SpeciesDef> resolved = rules.resolve_species(spec.species);
        species = resolved.def;
        if (resolved.used_fallback) {
            fallbacks.push_back("unknown species " + spec.species + "; using baseline");
            c.used_fallback_species = true;
        }
    }

    c.species = species->id;
    c.name = !spec.nickname.empty() ? spec.nickname
           : (c.used_fallback_species && !spec.species.empty() ? spec.species : species->name);
    c.level = std::clamp(spec.level, 1, 100);
    if (c.level != spec.level) {
        fallbacks.push_back(c.name + " level " + std::to_string(spec.level) + " clamped to " +
                            std::to_string(c.level));
    }

    StatBlock ivs = spec.ivs.value_or(StatBlock::uniform(31));
    StatBlock evs = spec.evs.value_or(StatBlock::uniform(0));
    for (Stat stat : ALL_STATS) {
        c.stats.set(stat, calculate_stat(stat, species->base_stats.get(stat), c.level,
                                         ivs.get(stat), evs.get(stat)));
    }
    c.max_hp = c.stats.hp;
    c.hp = c.max_hp;

    c.types = species->types;
    c.original_types = species->types;
    c.tera_type = spec.tera_type;

    std::string ability = RuleTables::normalize_id(spec.ability);
    if (ability.empty() && !species->abilities.empty()) {
        ability = species->abilities.front();
    }
    if (!ability.empty() && format.ability_banned(ability)) {
        fallbacks.push_back(c.name + " ability " + ability + " banned; removed");
        ability.clear();
    }
    c.ability = ability;

    std::string item = RuleTables::normalize_id(spec.item);
    if (!item.empty() && format.item_banned(item)) {
        fallbacks.push_back(c.name + " item " + item + " banned; removed");
        item.clear();
    }
    c.item = item;

    for (const auto& move_name : spec.moves) {
        if (static_cast<int>(c.moves.size()) >= MAX_MOVES) {
            fallbacks.push_back(c.name + " knows more than " + std::to_string(MAX_MOVES) +
                                " moves; extra dropped");
            break;
        }
        if (format.move_banned(move_name)) {
            fallbacks.push_back(c.name + " move " + move_name + " banned; removed");
            continue;
        }
        Resolved<MoveDef> resolved = rules.resolve_move(move_name);
        if (c.knows_move(resolved.def->id)) {
            continue;
        }
        if (const char* clause = format.clause_forbidding(*resolved.def)) {
            fallbacks.push_back(c.name + " move " + move_name + " removed by " + clause);
            continue;
        }
        if (resolved.used_fallback) {
            fallbacks.push_back(c.name + " unknown move " + move_name + "; using " + resolved.def->id);
        }
        MoveSlot slot;
        slot.move = resolved.def;
        slot.pp = slot.max_pp = std::max(1, resolved.def->pp);
        slot.used_fallback = resolved.used_fallback;
        c.moves.push_back(slot);
    }

    if (c.moves.empty()) {
        fallbacks.push_back(c.name + " has no usable moves; using " + rules.fallback_move().id);
        MoveSlot slot;
        slot.move = &rules.fallback_move();
        slot.pp = slot.max_pp = rules.fallback_move().pp;
        slot.used_fallback = true;
        c.moves.push_back(slot);
    }

    return c;
}

} // namespace pokesim
