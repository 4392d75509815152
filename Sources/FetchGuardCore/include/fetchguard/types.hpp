#pragma once

#ifdef __cplusplus

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace fetchguard {

// ============================================================================
// index_path - Position of an object inside a sectioned result set
// ============================================================================

struct index_path {
    std::size_t section = 0;
    std::size_t row = 0;

    index_path() = default;

    index_path(std::size_t s, std::size_t r) : section(s), row(r) {}

    bool operator==(const index_path& other) const {
        return section == other.section && row == other.row;
    }
    bool operator!=(const index_path& other) const { return !(*this == other); }

    // "[section,row]"
    std::string to_string() const;
};

/// "[section,row]", or "nil" when absent.
std::string to_string(const std::optional<index_path>& path);

// ============================================================================
// change_type - Kind of structural change reported for an object or section
// Values match the platform controllers this library sits in front of.
// ============================================================================

enum class change_type : int {
    insert = 1,
    remove = 2,
    move = 3,
    update = 4
};

const char* to_string(change_type type) noexcept;

/// Parses "insert", "delete", "move" or "update".
std::optional<change_type> change_type_from_string(const std::string& name);

// ============================================================================
// section_info - Description of one section of the fetched results
// ============================================================================

struct section_info {
    /// Value of the section key path shared by every object in the section
    std::string name;

    /// Title shown in a section index (usually the capitalized first letter)
    std::string index_title;

    /// Number of objects currently in the section
    std::size_t number_of_objects = 0;
};

// Descriptions of individual changes, used by debug logging.
std::string describe_section_change(change_type type, std::size_t section_index);
std::string describe_object_change(change_type type,
                                   const std::optional<index_path>& path,
                                   const std::optional<index_path>& new_path);

std::string section_change_to_json(change_type type, std::size_t section_index);
std::string object_change_to_json(change_type type,
                                  const std::optional<index_path>& path,
                                  const std::optional<index_path>& new_path);

} // namespace fetchguard

#endif // __cplusplus
