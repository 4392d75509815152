#include "fetchguard/types.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace fetchguard {

using json = nlohmann::json;

std::string index_path::to_string() const {
    std::stringstream ss;
    ss << '[' << section << ',' << row << ']';
    return ss.str();
}

std::string to_string(const std::optional<index_path>& path) {
    return path ? path->to_string() : "nil";
}

const char* to_string(change_type type) noexcept {
    switch (type) {
        case change_type::insert: return "insert";
        case change_type::remove: return "delete";
        case change_type::move:   return "move";
        case change_type::update: return "update";
    }
    return "unknown";
}

std::optional<change_type> change_type_from_string(const std::string& name) {
    if (name == "insert") return change_type::insert;
    if (name == "delete") return change_type::remove;
    if (name == "move")   return change_type::move;
    if (name == "update") return change_type::update;
    return std::nullopt;
}

std::string describe_section_change(change_type type, std::size_t section_index) {
    std::stringstream ss;
    ss << "<section_change type(" << to_string(type) << ") index(" << section_index << ")>";
    return ss.str();
}

std::string describe_object_change(change_type type,
                                   const std::optional<index_path>& path,
                                   const std::optional<index_path>& new_path) {
    std::stringstream ss;
    ss << "<object_change type(" << to_string(type) << ") index_path(" << to_string(path)
       << ") new_index_path(" << to_string(new_path) << ")>";
    return ss.str();
}

static json index_path_to_json(const std::optional<index_path>& path) {
    if (!path) return nullptr;
    return json{{"section", path->section}, {"row", path->row}};
}

std::string section_change_to_json(change_type type, std::size_t section_index) {
    json j;
    j["kind"] = "section";
    j["changeType"] = to_string(type);
    j["sectionIndex"] = section_index;
    return j.dump();
}

std::string object_change_to_json(change_type type,
                                  const std::optional<index_path>& path,
                                  const std::optional<index_path>& new_path) {
    json j;
    j["kind"] = "object";
    j["changeType"] = to_string(type);
    j["indexPath"] = index_path_to_json(path);
    j["newIndexPath"] = index_path_to_json(new_path);
    return j.dump();
}

} // namespace fetchguard
