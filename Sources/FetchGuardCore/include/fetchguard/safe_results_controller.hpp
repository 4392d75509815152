#pragma once

#ifdef __cplusplus

#include "batch_reconciler.hpp"
#include "log.hpp"
#include "options.hpp"
#include "results_controller.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fetchguard {

// ============================================================================
// safe_results_controller - Guards a results controller's change stream
// ============================================================================
//
// Registers itself as the underlying controller's delegate and forwards every
// callback, unchanged and in order, to the application delegate. A structural
// callback (object or section change) that arrives outside a
// will_change_content / did_change_content bracket means the store broke its
// notification contract; applying it incrementally can leave a table view
// with row counts that no longer match its data source. Each such callback is
// additionally reported through unsafe_change_delegate, if the application
// delegate implements it, before being forwarded.
//
// Usage:
//   auto controller = std::make_shared<my_results_controller>(...);
//   fetchguard::safe_results_controller<Row> safe(controller);
//   safe.set_application_delegate(view_model);   // weak
//   safe.perform_fetch();
//
// All callbacks must come from the thread the underlying controller notifies
// on. The application delegate is not owned; once it is destroyed callbacks
// are dropped.

template<typename Object>
class safe_results_controller final : public results_controller_delegate<Object> {
public:
    using controller_type = results_controller<Object>;
    using delegate_type = results_controller_delegate<Object>;

    explicit safe_results_controller(std::shared_ptr<controller_type> controller,
                                     controller_options options = {})
        : controller_(std::move(controller)), options_(std::move(options)) {
        if (!controller_) {
            throw std::invalid_argument("safe_results_controller requires a results controller");
        }
        if (options_.reconcile_batches) {
            reconciler_ = std::make_shared<batch_reconciler<Object>>(options_.max_section_changes);
        }
        controller_->set_delegate(this);
    }

    ~safe_results_controller() override {
        if (controller_->delegate() == this) {
            controller_->set_delegate(nullptr);
        }
    }

    // Registered with the controller by address
    safe_results_controller(const safe_results_controller&) = delete;
    safe_results_controller& operator=(const safe_results_controller&) = delete;
    safe_results_controller(safe_results_controller&&) = delete;
    safe_results_controller& operator=(safe_results_controller&&) = delete;

    void set_application_delegate(std::weak_ptr<delegate_type> delegate) {
        application_delegate_ = std::move(delegate);
        if (reconciler_) {
            reconciler_->set_downstream(application_delegate_);
        }
    }

    [[nodiscard]] std::shared_ptr<delegate_type> application_delegate() const {
        return application_delegate_.lock();
    }

    [[nodiscard]] controller_type& controller() noexcept { return *controller_; }
    [[nodiscard]] const controller_type& controller() const noexcept { return *controller_; }

    [[nodiscard]] const controller_options& options() const noexcept { return options_; }

    void perform_fetch() { controller_->perform_fetch(); }

    [[nodiscard]] std::vector<section_info> sections() const { return controller_->sections(); }

    [[nodiscard]] const Object* object_at(const index_path& path) const {
        return controller_->object_at(path);
    }

    /// True between a forwarded will_change_content and the matching
    /// did_change_content.
    [[nodiscard]] bool has_pending_will_change() const noexcept { return has_pending_will_change_; }

    /// Callbacks seen outside a batch since construction, reported or not.
    /// Batches rejected by the reconciler are not counted.
    [[nodiscard]] uint64_t unsafe_change_count() const noexcept { return unsafe_change_count_; }

    // ========================================================================
    // results_controller_delegate
    // ========================================================================

    void controller_will_change_content(controller_type& controller) override {
        if (has_pending_will_change_) {
            LOG_DEBUG("safe_results_controller", "will_change_content while a batch is already open");
        }
        has_pending_will_change_ = true;
        if (auto downstream = downstream_delegate()) {
            downstream->controller_will_change_content(controller);
        }
    }

    void controller_did_change_object(controller_type& controller,
                                      const Object& object,
                                      const std::optional<index_path>& path,
                                      change_type type,
                                      const std::optional<index_path>& new_path) override {
        auto forward = [&] {
            if (auto downstream = downstream_delegate()) {
                downstream->controller_did_change_object(controller, object, path, type, new_path);
            }
        };
        if (!has_pending_will_change_) {
            try {
                report_unsafe_changes(controller, "object change outside of a batch");
            } catch (...) {
                forward();
                throw;
            }
        }
        forward();
    }

    void controller_did_change_section(controller_type& controller,
                                       const section_info& section,
                                       std::size_t section_index,
                                       change_type type) override {
        auto forward = [&] {
            if (auto downstream = downstream_delegate()) {
                downstream->controller_did_change_section(controller, section, section_index, type);
            }
        };
        if (!has_pending_will_change_) {
            try {
                report_unsafe_changes(controller, "section change outside of a batch");
            } catch (...) {
                forward();
                throw;
            }
        }
        forward();
    }

    void controller_did_change_content(controller_type& controller) override {
        try {
            if (!has_pending_will_change_ && options_.report_unmatched_did_change) {
                try {
                    report_unsafe_changes(controller, "did_change_content without will_change_content");
                } catch (...) {
                    if (auto downstream = downstream_delegate()) {
                        downstream->controller_did_change_content(controller);
                    }
                    throw;
                }
            }
            if (auto downstream = downstream_delegate()) {
                downstream->controller_did_change_content(controller);
            }
        } catch (...) {
            has_pending_will_change_ = false;
            throw;
        }
        has_pending_will_change_ = false;
    }

    std::optional<std::string> controller_section_index_title(controller_type& controller,
                                                              const std::string& section_name) override {
        if (auto downstream = downstream_delegate()) {
            return downstream->controller_section_index_title(controller, section_name);
        }
        return std::nullopt;
    }

private:
    std::shared_ptr<delegate_type> downstream_delegate() const {
        if (reconciler_) {
            return reconciler_;
        }
        return application_delegate_.lock();
    }

    void report_unsafe_changes(controller_type& controller, const char* reason) {
        ++unsafe_change_count_;
        LOG_DEBUG("safe_results_controller", "Unsafe change detected: %s", reason);
        if (!notify_unsafe_changes(application_delegate_, controller)) {
            LOG_DEBUG("safe_results_controller", "Application delegate does not observe unsafe changes");
        }
    }

    std::shared_ptr<controller_type> controller_;
    controller_options options_;
    std::weak_ptr<delegate_type> application_delegate_;
    std::shared_ptr<batch_reconciler<Object>> reconciler_;

    bool has_pending_will_change_ = false;
    uint64_t unsafe_change_count_ = 0;
};

} // namespace fetchguard

#endif // __cplusplus
