#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include "results_controller.hpp"
#include "types.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fetchguard {

// ============================================================================
// batch_reconciler - Buffers a change batch and replays it in a safe order
// ============================================================================
//
// Controllers report a moved object as a plain update whenever inserts or
// deletes around it leave it at the same index path. Example, sorted by name:
//
//   [0,0] "Robbie Hanson"            [0,0] "Adam West"           (insert)
//   [0,1] "Z"                 --->   [0,1] "Benjamin Zacharias"  (update?)
//                                    [0,2] "Robbie Hanson"
//
// "Z" was renamed and moved, yet its index path is still [0,1], so it comes
// through as an update at [0,1]. Applied after the insert, the presentation
// layer refreshes the wrong row and leaves a stale one behind.
//
// The reconciler queues every change between will/did, turns such updates
// into moves from and to the same path, and replays the batch as section
// inserts, section deletes, object inserts, deletes, updates, moves.
// Batches carrying more section changes than a presentation layer can apply
// in one pass are not replayed at all; the downstream delegate receives the
// unsafe change signal instead and is expected to reload.
//
// Section infos are copied into the queue. Objects are referenced by address
// and must stay alive until did_change_content, as they do for any controller
// batch. A will_change_content inside an open batch keeps what is already
// queued; the next did_change_content replays everything.

template<typename Object>
class batch_reconciler final : public results_controller_delegate<Object> {
public:
    using controller_type = results_controller<Object>;
    using delegate_type = results_controller_delegate<Object>;

    explicit batch_reconciler(std::size_t max_section_changes = 1)
        : max_section_changes_(max_section_changes) {}

    void set_downstream(std::weak_ptr<delegate_type> downstream) {
        downstream_ = std::move(downstream);
    }

    [[nodiscard]] bool in_batch() const noexcept { return in_batch_; }

    [[nodiscard]] std::size_t max_section_changes() const noexcept { return max_section_changes_; }

    void controller_will_change_content(controller_type&) override {
        // Replayed together with the rest of the batch
        if (in_batch_) {
            LOG_DEBUG("batch_reconciler", "will_change_content while a batch is already open");
            return;
        }
        clear();
        in_batch_ = true;
    }

    void controller_did_change_section(controller_type& controller,
                                       const section_info& section,
                                       std::size_t section_index,
                                       change_type type) override {
        if (!in_batch_) {
            if (auto downstream = downstream_.lock()) {
                downstream->controller_did_change_section(controller, section, section_index, type);
            }
            return;
        }

        section_change change{section, section_index, type};
        switch (type) {
            case change_type::insert: inserted_sections_.push_back(change); break;
            case change_type::remove: deleted_sections_.push_back(change); break;
            default:
                LOG_DEBUG("batch_reconciler", "Ignoring %s", change.to_string().c_str());
                break;
        }
    }

    void controller_did_change_object(controller_type& controller,
                                      const Object& object,
                                      const std::optional<index_path>& path,
                                      change_type type,
                                      const std::optional<index_path>& new_path) override {
        if (!in_batch_) {
            if (auto downstream = downstream_.lock()) {
                downstream->controller_did_change_object(controller, object, path, type, new_path);
            }
            return;
        }

        object_change change{&object, path, type, new_path};
        switch (type) {
            case change_type::insert: inserted_objects_.push_back(change); break;
            case change_type::remove: deleted_objects_.push_back(change); break;
            case change_type::update: updated_objects_.push_back(change); break;
            case change_type::move:   moved_objects_.push_back(change);   break;
        }
    }

    void controller_did_change_content(controller_type& controller) override {
        if (!in_batch_) {
            if (auto downstream = downstream_.lock()) {
                downstream->controller_did_change_content(controller);
            }
            return;
        }

        try {
            process_changes(controller);
        } catch (...) {
            clear();
            in_batch_ = false;
            throw;
        }
        clear();
        in_batch_ = false;
    }

    std::optional<std::string> controller_section_index_title(controller_type& controller,
                                                              const std::string& section_name) override {
        if (auto downstream = downstream_.lock()) {
            return downstream->controller_section_index_title(controller, section_name);
        }
        return std::nullopt;
    }

private:
    struct section_change {
        section_info section;
        std::size_t section_index;
        change_type type;

        std::string to_string() const { return describe_section_change(type, section_index); }
        std::string to_json() const { return section_change_to_json(type, section_index); }
    };

    struct object_change {
        const Object* object;
        std::optional<index_path> path;
        change_type type;
        std::optional<index_path> new_path;

        std::string to_string() const { return describe_object_change(type, path, new_path); }
        std::string to_json() const { return object_change_to_json(type, path, new_path); }
    };

    using index_set = std::set<std::size_t>;

    static bool has_index_at_or_before(const index_set& indexes, std::size_t index) {
        return !indexes.empty() && *indexes.begin() <= index;
    }

    /// Multiple section changes in a single batch are not applied reliably
    /// by table and collection views.
    bool has_unsafe_changes() const {
        return inserted_sections_.size() + deleted_sections_.size() > max_section_changes_;
    }

    /// Marks updates that may really be moves. An update at [s,r] is suspect
    /// when a section at or before s was inserted or deleted, or an object at
    /// or before row r of section s was inserted, deleted or moved.
    void fix_update_bugs() {
        if (updated_objects_.empty()) return;

        std::size_t num_changes = inserted_sections_.size() + deleted_sections_.size() +
                                  inserted_objects_.size() + deleted_objects_.size() +
                                  moved_objects_.size();
        if (num_changes == 0) return;

        index_set section_inserts;
        index_set section_deletes;
        for (const auto& change : inserted_sections_) section_inserts.insert(change.section_index);
        for (const auto& change : deleted_sections_) section_deletes.insert(change.section_index);

        // Rows touched by inserts and deletes, keyed by section. A move counts
        // as a delete at its old path plus an insert at its new one.
        std::map<std::size_t, index_set> object_inserts;
        std::map<std::size_t, index_set> object_deletes;
        auto add = [](std::map<std::size_t, index_set>& rows, const std::optional<index_path>& path) {
            if (path) rows[path->section].insert(path->row);
        };
        for (const auto& change : inserted_objects_) add(object_inserts, change.new_path);
        for (const auto& change : deleted_objects_) add(object_deletes, change.path);
        for (const auto& change : moved_objects_) {
            add(object_deletes, change.path);
            add(object_inserts, change.new_path);
        }

        for (auto& change : updated_objects_) {
            if (change.new_path || !change.path) continue;

            const auto& path = *change.path;
            bool affected = has_index_at_or_before(section_inserts, path.section) ||
                            has_index_at_or_before(section_deletes, path.section);

            if (!affected) {
                auto inserts = object_inserts.find(path.section);
                auto deletes = object_deletes.find(path.section);
                affected = (inserts != object_inserts.end() && has_index_at_or_before(inserts->second, path.row)) ||
                           (deletes != object_deletes.end() && has_index_at_or_before(deletes->second, path.row));
            }

            if (affected) {
                LOG_DEBUG("batch_reconciler", "Treating %s as a move", change.to_string().c_str());
                change.new_path = change.path;
            }
        }
    }

    void log_changes() const {
        if (get_log_level() < log_level::debug) return;

        LOG_DEBUG("batch_reconciler", "Processing batch");
        for (const auto* changes : {&inserted_sections_, &deleted_sections_}) {
            for (const auto& change : *changes) {
                LOG_DEBUG("batch_reconciler", "  %s", change.to_json().c_str());
            }
        }
        for (const auto* changes : {&inserted_objects_, &deleted_objects_, &updated_objects_, &moved_objects_}) {
            for (const auto& change : *changes) {
                LOG_DEBUG("batch_reconciler", "  %s", change.to_json().c_str());
            }
        }
    }

    void process_changes(controller_type& controller) {
        log_changes();

        if (has_unsafe_changes()) {
            LOG_DEBUG("batch_reconciler", "Batch has %zu section changes, reporting unsafe changes",
                      inserted_sections_.size() + deleted_sections_.size());
            if (!notify_unsafe_changes(downstream_, controller)) {
                LOG_DEBUG("batch_reconciler", "Downstream delegate does not observe unsafe changes");
            }
            return;
        }

        fix_update_bugs();

        auto downstream = downstream_.lock();
        if (!downstream) return;

        downstream->controller_will_change_content(controller);

        for (const auto* changes : {&inserted_sections_, &deleted_sections_}) {
            for (const auto& change : *changes) {
                downstream->controller_did_change_section(controller, change.section,
                                                          change.section_index, change.type);
            }
        }
        for (const auto* changes : {&inserted_objects_, &deleted_objects_, &updated_objects_, &moved_objects_}) {
            for (const auto& change : *changes) {
                downstream->controller_did_change_object(controller, *change.object, change.path,
                                                         change.type, change.new_path);
            }
        }

        downstream->controller_did_change_content(controller);
    }

    void clear() {
        inserted_sections_.clear();
        deleted_sections_.clear();
        inserted_objects_.clear();
        deleted_objects_.clear();
        updated_objects_.clear();
        moved_objects_.clear();
    }

    std::weak_ptr<delegate_type> downstream_;
    std::size_t max_section_changes_;
    bool in_batch_ = false;

    std::vector<section_change> inserted_sections_;
    std::vector<section_change> deleted_sections_;

    std::vector<object_change> inserted_objects_;
    std::vector<object_change> deleted_objects_;
    std::vector<object_change> updated_objects_;
    std::vector<object_change> moved_objects_;
};

} // namespace fetchguard

#endif // __cplusplus
