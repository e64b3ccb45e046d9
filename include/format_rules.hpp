/**
 * pokesim - Format Rules
 *
 * Per-format gating: Tera availability, banned species / moves / items /
 * abilities, named clauses and the default turn cap. Read-only once
 * loaded; one instance may be shared by many battles.
 */

#pragma once

#include "types.hpp"
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json_fwd.hpp>

namespace pokesim {

constexpr int DEFAULT_MAX_TURNS = 1000;
constexpr int MAX_ROSTER_SIZE = 6;

constexpr const char* SPECIES_CLAUSE = "species_clause";
constexpr const char* SLEEP_CLAUSE = "sleep_clause";
constexpr const char* EVASION_CLAUSE = "evasion_clause";
constexpr const char* OHKO_CLAUSE = "ohko_clause";

struct MoveDef;

struct FormatRules {
    std::string name = "default";
    std::string version = "1.0.0";
    std::string dex_version = "gen9";

    bool tera_allowed = false;

    // Normalized ids
    std::unordered_set<std::string> banned_species;
    std::unordered_set<std::string> banned_moves;
    std::unordered_set<std::string> banned_items;
    std::unordered_set<std::string> banned_abilities;

    std::unordered_map<std::string, bool> clauses;

    int max_turns = DEFAULT_MAX_TURNS;

    // ========================================================================
    // QUERIES
    // ========================================================================

    bool species_banned(const std::string& id) const;
    bool move_banned(const std::string& id) const;
    bool item_banned(const std::string& id) const;
    bool ability_banned(const std::string& id) const;

    /**
     * A clause counts as enabled only when explicitly set to true.
     */
    bool clause_enabled(const std::string& clause) const;

    /**
     * Name of the enabled clause that forbids a move (OHKO moves, moves
     * raising the user's evasion), or nullptr.
     */
    const char* clause_forbidding(const MoveDef& move) const;

    // ========================================================================
    // LOADING
    // ========================================================================

    /**
     * Load format rules from a JSON file. Keys absent from the document
     * keep their defaults.
     */
    bool load_from_json(const std::string& filepath);
    bool load_from_string(const std::string& text);

private:
    bool load_document(const nlohmann::json& data);
};

} // namespace pokesim
