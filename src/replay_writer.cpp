/**
 * pokesim - Replay Writer Implementation
 */

#include "replay_writer.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace pokesim {

namespace {

std::string timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

} // anonymous namespace

ReplayWriter::ReplayWriter(const std::string& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[ReplayWriter] Failed to create directory " << output_dir
                  << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    std::string stem = output_dir + "/battle_" + timestamp("%Y%m%d_%H%M%S");
    log_path_ = stem + ".log";
    jsonl_path_ = stem + ".jsonl";

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[ReplayWriter] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "BATTLE REPLAY - LINEAR STATE TRACE\n";
    log_file_ << "Started: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[ReplayWriter] Logging to: " << log_path_ << std::endl;
}

ReplayWriter::~ReplayWriter() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string ReplayWriter::format_combatant_line(const Combatant& combatant,
                                                const std::string& label) const {
    std::ostringstream line;
    line << label << ":  " << combatant.name << " (" << combatant.species << ")"
         << " | HP: " << combatant.hp << "/" << combatant.max_hp
         << " | Status: " << to_string(combatant.status);

    line << " | Boosts: [";
    bool first = true;
    for (size_t i = 0; i < BOOST_STAT_COUNT; i++) {
        int stage = combatant.boosts[i];
        if (stage == 0) continue;
        if (!first) line << ", ";
        line << to_string(static_cast<BoostStat>(i)) << (stage > 0 ? "+" : "") << stage;
        first = false;
    }
    line << "]";

    if (!combatant.volatiles.empty()) {
        line << " | Volatiles: [";
        for (size_t i = 0; i < combatant.volatiles.size(); i++) {
            if (i > 0) line << ", ";
            line << to_string(combatant.volatiles[i].kind);
        }
        line << "]";
    }

    if (!combatant.item.empty()) {
        line << " | Item: " << combatant.item;
    }
    if (combatant.terastallized && combatant.tera_type) {
        line << " | Tera: " << to_string(*combatant.tera_type);
    }

    return line.str();
}

std::string ReplayWriter::format_side_conditions(const SideState& side) const {
    std::ostringstream line;
    line << "Hazards: [";
    std::vector<std::string> hazards;
    if (side.hazards.stealth_rock) hazards.push_back("stealth_rock");
    if (side.hazards.spikes > 0) hazards.push_back("spikes x" + std::to_string(side.hazards.spikes));
    if (side.hazards.toxic_spikes > 0) {
        hazards.push_back("toxic_spikes x" + std::to_string(side.hazards.toxic_spikes));
    }
    if (side.hazards.sticky_web) hazards.push_back("sticky_web");
    for (size_t i = 0; i < hazards.size(); i++) {
        if (i > 0) line << ", ";
        line << hazards[i];
    }
    line << "]";

    line << " | Screens: [";
    bool first = true;
    for (size_t i = 0; i < SCREEN_COUNT; i++) {
        if (side.screens[i] <= 0) continue;
        if (!first) line << ", ";
        line << to_string(static_cast<Screen>(i)) << " (" << side.screens[i] << ")";
        first = false;
    }
    line << "]";

    if (side.tailwind()) {
        line << " | Tailwind: " << side.tailwind_turns;
    }
    return line.str();
}

void ReplayWriter::log_actions(int turn, const BattleAction& action_a, const BattleAction& action_b) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << turn << "] ACTIONS: " << action_a.to_string()
              << " | " << action_b.to_string() << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    log_file_.flush();
}

size_t ReplayWriter::log_turn(const BattleState& state, size_t first_entry) {
    const auto& entries = state.log.entries();
    if (!enabled_ || !log_file_.is_open()) return entries.size();

    for (size_t i = first_entry; i < entries.size(); i++) {
        log_file_ << "  " << entries[i].to_string() << "\n";
    }
    log_file_ << "\n";

    log_state(state);
    return entries.size();
}

void ReplayWriter::log_state(const BattleState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";

    for (const auto& side : state.sides) {
        log_file_ << "[SIDE " << side.name << "]\n";
        for (size_t i = 0; i < side.roster.size(); i++) {
            std::string label = static_cast<int>(i) == side.active
                ? std::string("ACTIVE")
                : "BENCH " + std::to_string(i);
            log_file_ << format_combatant_line(side.roster[i], label) << "\n";
        }
        log_file_ << format_side_conditions(side) << "\n";
        log_file_ << "Tera used: " << (side.tera_used ? "yes" : "no") << "\n\n";
    }

    log_file_ << "[FIELD]\n";
    log_file_ << "Weather: " << to_string(state.field.weather);
    if (state.field.weather != Weather::NONE) {
        if (state.field.weather_sustained) {
            log_file_ << " (sustained)";
        } else {
            log_file_ << " (" << state.field.weather_turns << ")";
        }
    }
    log_file_ << " | Terrain: " << to_string(state.field.terrain);
    if (state.field.terrain != Terrain::NONE) {
        log_file_ << " (" << state.field.terrain_turns << ")";
    }
    log_file_ << "\n";

    for (size_t i = 0; i < ROOM_COUNT; i++) {
        if (state.field.rooms[i] > 0) {
            log_file_ << "Room: " << to_string(static_cast<Room>(i))
                      << " (" << state.field.rooms[i] << ")\n";
        }
    }

    log_file_ << "Phase: " << to_string(state.phase) << " | Turn: " << state.turn << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void ReplayWriter::log_battle_end(const BattleResult& result) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "BATTLE END\n";
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "Winner: " << to_string(result.winner) << "\n";
    log_file_ << "Turns: " << result.turn_count << "\n";
    log_file_ << "Log entries: " << result.log.size() << "\n";
    log_file_ << "Ended: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";
    log_file_.flush();

    std::ofstream jsonl(jsonl_path_);
    if (!jsonl.is_open()) {
        std::cerr << "[ReplayWriter] Failed to open " << jsonl_path_ << std::endl;
        return;
    }
    result.log.write_jsonl(jsonl);
}

} // namespace pokesim
