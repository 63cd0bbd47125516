#include "memory/CommandHistory.h"
#include <algorithm>
#include <sstream>
#include "utils/Platform.h"

namespace {
const char* HISTORY_KEY = "command_history";
}

void to_json(nlohmann::json& j, const CommandEntry& entry) {
    j = nlohmann::json{
        {"timestamp", entry.timestampMs},
        {"command", entry.command},
        {"optimized", entry.optimized},
        {"context", entry.context},
        {"success", entry.success}
    };
}

void from_json(const nlohmann::json& j, CommandEntry& entry) {
    entry.timestampMs = j.value("timestamp", static_cast<std::int64_t>(0));
    entry.command = j.value("command", "");
    entry.optimized = j.value("optimized", "");
    entry.context = j.value("context", "");
    entry.success = j.value("success", false);
}

CommandHistory::CommandHistory(KeyValueStore& store, size_t maxEntries)
    : store(store), maxEntries(maxEntries == 0 ? DEFAULT_MAX_ENTRIES : maxEntries) {}

std::vector<CommandEntry> CommandHistory::loadAll() const {
    std::vector<CommandEntry> entries;
    nlohmann::json stored = store.get(HISTORY_KEY);
    if (!stored.is_array()) return entries;
    for (const auto& item : stored) {
        if (item.is_object()) entries.push_back(item.get<CommandEntry>());
    }
    return entries;
}

void CommandHistory::append(const CommandEntry& entry) {
    std::vector<CommandEntry> entries = loadAll();
    entries.push_back(entry);
    if (entries.size() > maxEntries) {
        entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(maxEntries));
    }
    store.put(HISTORY_KEY, entries);
}

std::vector<CommandEntry> CommandHistory::recent(size_t limit, const std::string& filter) const {
    std::vector<CommandEntry> entries = loadAll();
    if (entries.size() > limit) {
        entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(limit));
    }
    if (!filter.empty()) {
        entries.erase(std::remove_if(entries.begin(), entries.end(), [&filter](const CommandEntry& e) {
            return e.command.find(filter) == std::string::npos &&
                   e.optimized.find(filter) == std::string::npos;
        }), entries.end());
    }
    return entries;
}

size_t CommandHistory::size() const {
    return loadAll().size();
}

std::string CommandHistory::render(const std::vector<CommandEntry>& entries) {
    if (entries.empty()) return "No command history";

    std::ostringstream out;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (i > 0) out << "\n\n";
        out << (i + 1) << ". [" << (entry.success ? "OK" : "FAIL") << "] "
            << formatLocalTime(entry.timestampMs) << "\n   " << entry.command;
        if (!entry.optimized.empty() && entry.optimized != entry.command) {
            out << "\n   Optimized: " << entry.optimized;
        }
    }
    return out.str();
}
