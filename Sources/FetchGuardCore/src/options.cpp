#include "fetchguard/options.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace fetchguard {

using json = nlohmann::json;

std::string controller_options::to_json() const {
    json j;
    j["reconcileBatches"] = reconcile_batches;
    j["maxSectionChanges"] = max_section_changes;
    j["reportUnmatchedDidChange"] = report_unmatched_did_change;
    if (log_verbosity) {
        j["logLevel"] = to_string(*log_verbosity);
    }
    return j.dump();
}

std::optional<controller_options> controller_options::from_json(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        LOG_WARN("options", "Invalid options JSON: %s", e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        LOG_WARN("options", "Options JSON must be an object");
        return std::nullopt;
    }

    controller_options options;

    if (j.contains("reconcileBatches")) {
        if (!j["reconcileBatches"].is_boolean()) return std::nullopt;
        options.reconcile_batches = j["reconcileBatches"].get<bool>();
    }
    if (j.contains("maxSectionChanges")) {
        if (!j["maxSectionChanges"].is_number_unsigned()) return std::nullopt;
        options.max_section_changes = j["maxSectionChanges"].get<std::size_t>();
    }
    if (j.contains("reportUnmatchedDidChange")) {
        if (!j["reportUnmatchedDidChange"].is_boolean()) return std::nullopt;
        options.report_unmatched_did_change = j["reportUnmatchedDidChange"].get<bool>();
    }
    if (j.contains("logLevel")) {
        if (!j["logLevel"].is_string()) return std::nullopt;
        auto level = log_level_from_string(j["logLevel"].get<std::string>());
        if (!level) {
            LOG_WARN("options", "Unknown logLevel: %s", j["logLevel"].get<std::string>().c_str());
            return std::nullopt;
        }
        options.log_verbosity = level;
    }

    return options;
}

void controller_options::apply_log_level() const {
    if (log_verbosity) {
        set_log_level(*log_verbosity);
    }
}

controller_options load_options(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw options_error("Unable to open options file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();

    auto options = controller_options::from_json(ss.str());
    if (!options) {
        throw options_error("Invalid options file: " + path);
    }
    LOG_INFO("options", "Loaded options from %s", path.c_str());
    return *options;
}

} // namespace fetchguard
