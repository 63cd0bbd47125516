#include "memory/ContextSummary.h"
#include <sstream>
#include "utils/Platform.h"

namespace {
const char* SUMMARY_KEY = "context_summary";
const char* NOT_SET = "(not set)";

std::string orNotSet(const std::string& value) {
    return value.empty() ? NOT_SET : value;
}
}

ContextSummary::ContextSummary(KeyValueStore& store) : store(store) {}

nlohmann::json ContextSummary::snapshot() const {
    nlohmann::json stored = store.get(SUMMARY_KEY);
    return stored.is_object() ? stored : nlohmann::json::object();
}

void ContextSummary::update(const Update& fields) {
    nlohmann::json summary = snapshot();
    if (fields.projectName) summary["projectName"] = *fields.projectName;
    if (fields.projectType) summary["projectType"] = *fields.projectType;
    if (fields.technologies) summary["mainTechnologies"] = *fields.technologies;
    if (fields.currentTask) summary["currentTask"] = *fields.currentTask;
    summary["lastUpdate"] = epochMillis();
    store.put(SUMMARY_KEY, summary);
}

std::string ContextSummary::getProjectName() const {
    return snapshot().value("projectName", "");
}

std::string ContextSummary::getProjectType() const {
    return snapshot().value("projectType", "");
}

std::vector<std::string> ContextSummary::getTechnologies() const {
    nlohmann::json summary = snapshot();
    std::vector<std::string> technologies;
    if (summary.contains("mainTechnologies") && summary["mainTechnologies"].is_array()) {
        for (const auto& item : summary["mainTechnologies"]) {
            if (item.is_string()) technologies.push_back(item.get<std::string>());
        }
    }
    return technologies;
}

std::string ContextSummary::getCurrentTask() const {
    return snapshot().value("currentTask", "");
}

std::int64_t ContextSummary::getLastUpdate() const {
    return snapshot().value("lastUpdate", static_cast<std::int64_t>(0));
}

std::string ContextSummary::render() const {
    std::string technologies;
    for (const auto& tech : getTechnologies()) {
        if (!technologies.empty()) technologies += ", ";
        technologies += tech;
    }
    std::int64_t lastUpdate = getLastUpdate();

    std::ostringstream out;
    out << "Project context summary:\n\n"
        << "Project name: " << orNotSet(getProjectName()) << "\n"
        << "Project type: " << orNotSet(getProjectType()) << "\n"
        << "Technologies: " << orNotSet(technologies) << "\n"
        << "Current task: " << orNotSet(getCurrentTask()) << "\n"
        << "Last update: " << (lastUpdate > 0 ? formatLocalTime(lastUpdate) : "unknown");
    return out.str();
}
