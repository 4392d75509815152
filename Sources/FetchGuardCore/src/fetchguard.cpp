#include "fetchguard/log.hpp"

namespace fetchguard {

std::atomic<log_level> g_log_level{log_level::off};

const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::off:   return "off";
        case log_level::error: return "error";
        case log_level::warn:  return "warn";
        case log_level::info:  return "info";
        case log_level::debug: return "debug";
    }
    return "off";
}

std::optional<log_level> log_level_from_string(const std::string& name) {
    if (name == "off")   return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn")  return log_level::warn;
    if (name == "info")  return log_level::info;
    if (name == "debug") return log_level::debug;
    return std::nullopt;
}

} // namespace fetchguard
