#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace fetchguard {

class options_error : public std::runtime_error {
public:
    explicit options_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// controller_options - Behaviour switches for safe_results_controller
// ============================================================================
//
// JSON form (every key optional):
//   {
//     "reconcileBatches": false,
//     "maxSectionChanges": 1,
//     "reportUnmatchedDidChange": true,
//     "logLevel": "off"
//   }

struct controller_options {
    /// Buffer each bracketed batch and replay it through a batch_reconciler
    bool reconcile_batches = false;

    /// Section inserts + deletes a reconciled batch may carry before it is
    /// reported as unsafe instead of being replayed
    std::size_t max_section_changes = 1;

    /// Report a did_change_content that arrives with no open batch
    bool report_unmatched_did_change = true;

    /// Global log level to install with apply_log_level(), if any
    std::optional<log_level> log_verbosity;

    std::string to_json() const;

    /// Returns nullopt for malformed JSON or keys of the wrong type.
    static std::optional<controller_options> from_json(const std::string& json);

    /// Installs log_verbosity as the global log level when it is set.
    void apply_log_level() const;
};

/// Reads options from a JSON file. Throws options_error on failure.
controller_options load_options(const std::string& path);

} // namespace fetchguard

#endif // __cplusplus
