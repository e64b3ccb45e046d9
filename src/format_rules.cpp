/**
 * pokesim - Format Rules Implementation
 */

#include "format_rules.hpp"
#include "rule_tables.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace pokesim {

namespace {

bool contains_id(const std::unordered_set<std::string>& ids, const std::string& id) {
    return !ids.empty() && ids.count(RuleTables::normalize_id(id)) > 0;
}

void read_id_list(const json& data, const char* key, std::unordered_set<std::string>& out) {
    if (!data.contains(key)) {
        return;
    }
    const auto& list = data[key];
    if (!list.is_array()) {
        std::cerr << "[FormatRules] '" << key << "' must be an array; ignored" << std::endl;
        return;
    }
    for (const auto& entry : list) {
        if (entry.is_string()) {
            out.insert(RuleTables::normalize_id(entry.get<std::string>()));
        }
    }
}

} // anonymous namespace

// ============================================================================
// QUERIES
// ============================================================================

bool FormatRules::species_banned(const std::string& id) const {
    return contains_id(banned_species, id);
}

bool FormatRules::move_banned(const std::string& id) const {
    return contains_id(banned_moves, id);
}

bool FormatRules::item_banned(const std::string& id) const {
    return contains_id(banned_items, id);
}

bool FormatRules::ability_banned(const std::string& id) const {
    return contains_id(banned_abilities, id);
}

bool FormatRules::clause_enabled(const std::string& clause) const {
    auto it = clauses.find(clause);
    return it != clauses.end() && it->second;
}

const char* FormatRules::clause_forbidding(const MoveDef& move) const {
    if (move.fixed_damage == FixedDamage::OHKO && clause_enabled(OHKO_CLAUSE)) {
        return OHKO_CLAUSE;
    }
    if (clause_enabled(EVASION_CLAUSE)) {
        for (const auto& [stat, delta] : move.self_boosts) {
            if (stat == BoostStat::EVASION && delta > 0) {
                return EVASION_CLAUSE;
            }
        }
    }
    return nullptr;
}

// ============================================================================
// LOADING
// ============================================================================

bool FormatRules::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[FormatRules] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::exception& e) {
        std::cerr << "[FormatRules] JSON error: " << e.what() << std::endl;
        return false;
    }
}

bool FormatRules::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return load_document(data);
    } catch (const json::exception& e) {
        std::cerr << "[FormatRules] JSON error: " << e.what() << std::endl;
        return false;
    }
}

bool FormatRules::load_document(const json& data) {
    if (!data.is_object()) {
        std::cerr << "[FormatRules] Top-level JSON must be an object" << std::endl;
        return false;
    }

    name = data.value("name", name);
    version = data.value("version", version);
    dex_version = data.value("dex_version", dex_version);
    tera_allowed = data.value("tera_allowed", tera_allowed);
    max_turns = data.value("max_turns", max_turns);
    if (max_turns < 1) {
        std::cerr << "[FormatRules] max_turns " << max_turns << " is not positive; using "
                  << DEFAULT_MAX_TURNS << std::endl;
        max_turns = DEFAULT_MAX_TURNS;
    }

    read_id_list(data, "banned_species", banned_species);
    read_id_list(data, "banned_pokemon", banned_species);
    read_id_list(data, "banned_moves", banned_moves);
    read_id_list(data, "banned_items", banned_items);
    read_id_list(data, "banned_abilities", banned_abilities);

    if (data.contains("clauses") && data["clauses"].is_object()) {
        for (const auto& [clause, enabled] : data["clauses"].items()) {
            clauses[clause] = enabled.is_boolean() && enabled.get<bool>();
        }
    }

    std::cout << "[FormatRules] Loaded format " << name << " (tera "
              << (tera_allowed ? "allowed" : "banned") << ", "
              << banned_species.size() + banned_moves.size() + banned_items.size() +
                 banned_abilities.size()
              << " bans)" << std::endl;
    return true;
}

} // namespace pokesim
