/**
 * pokesim - Battle Log Implementation
 */

#include "battle_log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <ostream>
#include <sstream>

using json = nlohmann::json;

namespace pokesim {

bool LogEntry::operator==(const LogEntry& other) const {
    return turn == other.turn &&
           side == other.side &&
           kind == other.kind &&
           actor == other.actor &&
           target == other.target &&
           detail == other.detail &&
           outcome == other.outcome &&
           damage == other.damage &&
           accuracy_roll == other.accuracy_roll &&
           critical_hit == other.critical_hit &&
           effectiveness == other.effectiveness;
}

std::string LogEntry::to_string() const {
    std::ostringstream ss;
    ss << "T" << turn << " ";
    if (side != NO_SIDE) {
        ss << (side == SIDE_A ? "[A] " : "[B] ");
    }
    ss << pokesim::to_string(kind) << " " << actor;
    if (!target.empty()) ss << " -> " << target;
    if (!detail.empty()) ss << " (" << detail << ")";
    ss << ": " << pokesim::to_string(outcome);
    if (damage != 0) ss << " " << damage;
    if (critical_hit) ss << " crit";
    if (effectiveness != 1.0) ss << " x" << effectiveness;
    return ss.str();
}

LogEntry& BattleLog::add(int turn, SideID side, LogKind kind, Outcome outcome,
                         std::string actor, std::string detail) {
    LogEntry entry;
    entry.turn = turn;
    entry.side = side;
    entry.kind = kind;
    entry.outcome = outcome;
    entry.actor = std::move(actor);
    entry.detail = std::move(detail);
    entries_.push_back(std::move(entry));
    return entries_.back();
}

size_t BattleLog::count(LogKind kind) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [kind](const LogEntry& e) { return e.kind == kind; }));
}

size_t BattleLog::count(LogKind kind, Outcome outcome) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [kind, outcome](const LogEntry& e) { return e.kind == kind && e.outcome == outcome; }));
}

std::vector<LogEntry> BattleLog::filter(LogKind kind) const {
    std::vector<LogEntry> matching;
    for (const auto& e : entries_) {
        if (e.kind == kind) matching.push_back(e);
    }
    return matching;
}

void BattleLog::write_jsonl(std::ostream& out) const {
    for (const auto& entry : entries_) {
        json j = entry;
        out << j.dump() << "\n";
    }
}

std::string BattleLog::to_jsonl() const {
    std::ostringstream ss;
    write_jsonl(ss);
    return ss.str();
}

void to_json(json& j, const LogEntry& entry) {
    j = json{
        {"turn", entry.turn},
        {"side", entry.side == NO_SIDE ? json(nullptr)
                                       : json(entry.side == SIDE_A ? "a" : "b")},
        {"kind", to_string(entry.kind)},
        {"actor", entry.actor},
        {"target", entry.target},
        {"detail", entry.detail},
        {"outcome", to_string(entry.outcome)},
        {"damage", entry.damage},
        {"accuracy_roll", entry.accuracy_roll ? json(*entry.accuracy_roll) : json(nullptr)},
        {"critical_hit", entry.critical_hit},
        {"effectiveness", entry.effectiveness},
    };
}

} // namespace pokesim
