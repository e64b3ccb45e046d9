/**
 * pokesim - Replay Writer
 *
 * Full battle visibility for debugging.
 * Writes a human-readable linear trace (actions, log entries, both
 * rosters after every turn) and the JSON-lines battle log next to it.
 */

#pragma once

#include "engine.hpp"
#include <fstream>
#include <string>

namespace pokesim {

/**
 * ReplayWriter - Battle trace files for one battle.
 *
 * Creates `<output_dir>/battle_<timestamp>.log` for the trace and
 * `<output_dir>/battle_<timestamp>.jsonl` for the structured log.
 */
class ReplayWriter {
public:
    /**
     * Constructor - creates timestamped trace file.
     *
     * @param output_dir Directory for replay files (created if missing)
     */
    explicit ReplayWriter(const std::string& output_dir = "replays");

    ~ReplayWriter();

    ReplayWriter(const ReplayWriter&) = delete;
    ReplayWriter& operator=(const ReplayWriter&) = delete;

    /**
     * Log the header for a turn about to run.
     */
    void log_actions(int turn, const BattleAction& action_a, const BattleAction& action_b);

    /**
     * Log entries appended since `first_entry`, then a state snapshot.
     * Returns the new log size for the next call.
     */
    size_t log_turn(const BattleState& state, size_t first_entry);

    /**
     * Log complete battle state snapshot (both rosters and the field).
     */
    void log_state(const BattleState& state);

    /**
     * Log the result and write the JSON-lines file.
     */
    void log_battle_end(const BattleResult& result);

    const std::string& get_log_path() const { return log_path_; }
    const std::string& get_jsonl_path() const { return jsonl_path_; }

    bool is_enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::string jsonl_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format: "ACTIVE:  Garchomp (garchomp) | HP: 357/357 | Status: none | Boosts: [atk+2]"
     */
    std::string format_combatant_line(const Combatant& combatant, const std::string& label) const;

    std::string format_side_conditions(const SideState& side) const;
};

} // namespace pokesim
