/**
 * pokesim - Roster
 *
 * Team specifications (species, level, moves, ability, item, Tera type,
 * IVs/EVs) loaded from JSON and turned into battle-ready Combatants.
 */

#pragma once

#include "combatant.hpp"
#include "format_rules.hpp"
#include <nlohmann/json_fwd.hpp>

namespace pokesim {

constexpr int MAX_MOVES = 4;

/**
 * CombatantSpec - One team member as written in a team file.
 */
struct CombatantSpec {
    std::string species;
    std::string nickname;
    int level = 100;
    std::vector<std::string> moves;
    std::string ability;          // "" = species' first ability
    std::string item;
    std::optional<Type> tera_type;
    std::optional<StatBlock> ivs;
    std::optional<StatBlock> evs;
};

/**
 * Roster - An ordered team; the first member leads.
 */
struct Roster {
    std::string name;
    std::vector<CombatantSpec> members;

    bool empty() const { return members.empty(); }
    size_t size() const { return members.size(); }

    /**
     * Load a roster from a JSON file: either an array of members or an
     * object with "name" and "members".
     */
    bool load_from_json(const std::string& filepath);
    bool load_from_string(const std::string& text);

private:
    bool load_document(const nlohmann::json& data);
};

CombatantSpec parse_combatant_spec(const nlohmann::json& member_json);

/**
 * Build a Combatant from a spec.
 *
 * Unknown species and moves resolve to the baseline, banned species,
 * moves, items and abilities are stripped; each substitution appends a
 * human-readable note to `fallbacks`.
 */
Combatant build_combatant(const RuleTables& rules, const CombatantSpec& spec,
                          const FormatRules& format, std::vector<std::string>& fallbacks);

} // namespace pokesim
