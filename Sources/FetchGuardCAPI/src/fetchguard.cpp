#include "fetchguard.h"
#include <FetchGuard.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Thread-local error message storage
static thread_local std::string g_last_error;

static void set_error(const std::string& msg) {
    g_last_error = msg;
}

namespace {

using object_t = fetchguard_object_t;
using controller_base = fetchguard::results_controller<object_t>;
using delegate_base = fetchguard::results_controller_delegate<object_t>;

fetchguard::change_type to_change_type(fetchguard_change_type_t type) {
    return static_cast<fetchguard::change_type>(type);
}

fetchguard_change_type_t to_c_change_type(fetchguard::change_type type) {
    return static_cast<fetchguard_change_type_t>(type);
}

bool is_valid_change_type(fetchguard_change_type_t type) {
    return type >= FETCHGUARD_CHANGE_INSERT && type <= FETCHGUARD_CHANGE_UPDATE;
}

std::optional<fetchguard::index_path> to_index_path(const fetchguard_index_path_t* path) {
    if (!path) return std::nullopt;
    return fetchguard::index_path(static_cast<std::size_t>(path->section),
                                  static_cast<std::size_t>(path->row));
}

fetchguard_index_path_t to_c_index_path(const fetchguard::index_path& path) {
    return fetchguard_index_path_t{path.section, path.row};
}

fetchguard::section_info to_section_info(const fetchguard_section_info_t& section) {
    fetchguard::section_info info;
    info.name = section.name ? section.name : "";
    info.index_title = section.index_title ? section.index_title : "";
    info.number_of_objects = static_cast<std::size_t>(section.number_of_objects);
    return info;
}

// =============================================================================
// foreign_results_controller - results_controller backed by a C callback table
// =============================================================================

class foreign_results_controller final : public controller_base {
public:
    explicit foreign_results_controller(const fetchguard_results_source_t& source)
        : source_(source) {}

    void* context() const noexcept { return source_.context; }

    void set_delegate(delegate_type* delegate) override { delegate_ = delegate; }

    [[nodiscard]] delegate_type* delegate() const noexcept override { return delegate_; }

    void perform_fetch() override {
        if (!source_.perform_fetch) return;
        const char* error = nullptr;
        if (!source_.perform_fetch(source_.context, &error)) {
            throw fetchguard::fetch_error(error ? error : "perform_fetch failed");
        }
    }

    [[nodiscard]] std::vector<fetchguard::section_info> sections() const override {
        std::vector<fetchguard::section_info> result;
        if (!source_.number_of_sections || !source_.section_at) return result;

        uint64_t count = source_.number_of_sections(source_.context);
        result.reserve(static_cast<std::size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            fetchguard_section_info_t section{};
            if (!source_.section_at(source_.context, i, &section)) {
                LOG_WARN("fetchguard_capi", "section_at(%llu) failed", (unsigned long long)i);
                break;
            }
            result.push_back(to_section_info(section));
        }
        return result;
    }

    [[nodiscard]] const object_t* object_at(const fetchguard::index_path& path) const override {
        if (!source_.object_at) return nullptr;
        return source_.object_at(source_.context, to_c_index_path(path));
    }

private:
    fetchguard_results_source_t source_;
    delegate_type* delegate_ = nullptr;
};

// =============================================================================
// foreign_delegate - results_controller_delegate backed by a C callback table
// =============================================================================

class foreign_delegate : public delegate_base {
public:
    explicit foreign_delegate(const fetchguard_delegate_t& table) : table_(table) {}

    ~foreign_delegate() override {
        if (table_.release) {
            table_.release(table_.context);
        }
    }

    foreign_delegate(const foreign_delegate&) = delete;
    foreign_delegate& operator=(const foreign_delegate&) = delete;

    void controller_will_change_content(controller_base& controller) override {
        if (table_.will_change_content) {
            table_.will_change_content(table_.context, source_of(controller));
        }
    }

    void controller_did_change_object(controller_base& controller,
                                      const object_t& object,
                                      const std::optional<fetchguard::index_path>& path,
                                      fetchguard::change_type type,
                                      const std::optional<fetchguard::index_path>& new_path) override {
        if (!table_.did_change_object) return;

        fetchguard_index_path_t c_path{};
        fetchguard_index_path_t c_new_path{};
        if (path) c_path = to_c_index_path(*path);
        if (new_path) c_new_path = to_c_index_path(*new_path);

        table_.did_change_object(table_.context, source_of(controller), &object,
                                 path ? &c_path : nullptr,
                                 to_c_change_type(type),
                                 new_path ? &c_new_path : nullptr);
    }

    void controller_did_change_section(controller_base& controller,
                                       const fetchguard::section_info& section,
                                       std::size_t section_index,
                                       fetchguard::change_type type) override {
        if (!table_.did_change_section) return;

        fetchguard_section_info_t c_section{section.name.c_str(), section.index_title.c_str(),
                                            section.number_of_objects};
        table_.did_change_section(table_.context, source_of(controller), &c_section,
                                  section_index, to_c_change_type(type));
    }

    void controller_did_change_content(controller_base& controller) override {
        if (table_.did_change_content) {
            table_.did_change_content(table_.context, source_of(controller));
        }
    }

    std::optional<std::string> controller_section_index_title(controller_base& controller,
                                                              const std::string& section_name) override {
        if (!table_.section_index_title) return std::nullopt;
        const char* title = table_.section_index_title(table_.context, source_of(controller),
                                                       section_name.c_str());
        if (!title) return std::nullopt;
        return std::string(title);
    }

protected:
    static void* source_of(controller_base& controller) {
        return static_cast<foreign_results_controller&>(controller).context();
    }

    fetchguard_delegate_t table_;
};

// Only delegates with a did_make_unsafe_changes entry advertise the extension.
class foreign_unsafe_delegate final : public foreign_delegate,
                                      public fetchguard::unsafe_change_delegate<object_t> {
public:
    using foreign_delegate::foreign_delegate;

    void controller_did_make_unsafe_changes(controller_base& controller) override {
        table_.did_make_unsafe_changes(table_.context, source_of(controller));
    }
};

} // namespace

// =============================================================================
// Opaque Type Definitions (internal)
// =============================================================================

struct fetchguard_controller {
    std::shared_ptr<foreign_results_controller> source;
    std::unique_ptr<fetchguard::safe_results_controller<object_t>> safe;
    std::shared_ptr<delegate_base> delegate;
    std::string last_index_title;
};

// =============================================================================
// Error Handling
// =============================================================================

extern "C" const char* fetchguard_last_error(void) {
    return g_last_error.empty() ? nullptr : g_last_error.c_str();
}

extern "C" void fetchguard_set_log_level(int level) {
    if (level < static_cast<int>(fetchguard::log_level::off)) {
        level = static_cast<int>(fetchguard::log_level::off);
    }
    if (level > static_cast<int>(fetchguard::log_level::debug)) {
        level = static_cast<int>(fetchguard::log_level::debug);
    }
    fetchguard::set_log_level(static_cast<fetchguard::log_level>(level));
}

// =============================================================================
// Controller Lifecycle
// =============================================================================

extern "C" fetchguard_controller_t* fetchguard_controller_create(const fetchguard_results_source_t* source,
                                                                 const char* options_json) {
    if (!source) {
        set_error("source is null");
        return nullptr;
    }

    fetchguard::controller_options options;
    if (options_json) {
        auto parsed = fetchguard::controller_options::from_json(options_json);
        if (!parsed) {
            set_error("invalid options JSON");
            return nullptr;
        }
        options = std::move(*parsed);
        options.apply_log_level();
    }

    try {
        auto controller = std::make_unique<fetchguard_controller>();
        controller->source = std::make_shared<foreign_results_controller>(*source);
        controller->safe = std::make_unique<fetchguard::safe_results_controller<object_t>>(
            controller->source, std::move(options));
        return controller.release();
    } catch (const std::exception& e) {
        set_error(e.what());
        return nullptr;
    }
}

extern "C" void fetchguard_controller_destroy(fetchguard_controller_t* controller) {
    if (!controller) return;
    // Detach from the source before the delegate is released
    controller->safe.reset();
    delete controller;
}

extern "C" fetchguard_status_t fetchguard_controller_set_delegate(fetchguard_controller_t* controller,
                                                                  const fetchguard_delegate_t* delegate) {
    if (!controller) {
        set_error("controller is null");
        return FETCHGUARD_ERROR_NULL_POINTER;
    }

    std::shared_ptr<delegate_base> next;
    if (delegate) {
        if (delegate->did_make_unsafe_changes) {
            next = std::make_shared<foreign_unsafe_delegate>(*delegate);
        } else {
            next = std::make_shared<foreign_delegate>(*delegate);
        }
    }

    controller->safe->set_application_delegate(next);
    controller->delegate = std::move(next);
    return FETCHGUARD_OK;
}

extern "C" fetchguard_status_t fetchguard_controller_perform_fetch(fetchguard_controller_t* controller) {
    if (!controller) {
        set_error("controller is null");
        return FETCHGUARD_ERROR_NULL_POINTER;
    }
    try {
        controller->safe->perform_fetch();
        return FETCHGUARD_OK;
    } catch (const fetchguard::fetch_error& e) {
        set_error(e.what());
        return FETCHGUARD_ERROR_FETCH;
    } catch (const std::exception& e) {
        set_error(e.what());
        return FETCHGUARD_ERROR_DELEGATE;
    }
}

extern "C" uint64_t fetchguard_controller_number_of_sections(fetchguard_controller_t* controller) {
    if (!controller) return 0;
    try {
        return controller->safe->sections().size();
    } catch (const std::exception& e) {
        set_error(e.what());
        return 0;
    }
}

extern "C" const fetchguard_object_t* fetchguard_controller_object_at(fetchguard_controller_t* controller,
                                                                      fetchguard_index_path_t path) {
    if (!controller) return nullptr;
    return controller->safe->object_at(fetchguard::index_path(static_cast<std::size_t>(path.section),
                                                              static_cast<std::size_t>(path.row)));
}

// =============================================================================
// Change Notifications
// =============================================================================
//
// The host controller reports through its registered delegate, which is the
// safe controller for as long as the fetchguard_controller_t exists.

extern "C" fetchguard_status_t fetchguard_controller_will_change_content(fetchguard_controller_t* controller) {
    if (!controller) {
        set_error("controller is null");
        return FETCHGUARD_ERROR_NULL_POINTER;
    }
    try {
        controller->source->delegate()->controller_will_change_content(*controller->source);
        return FETCHGUARD_OK;
    } catch (const std::exception& e) {
        set_error(e.what());
        return FETCHGUARD_ERROR_DELEGATE;
    }
}

extern "C" fetchguard_status_t fetchguard_controller_did_change_object(fetchguard_controller_t* controller,
                                                                       const fetchguard_object_t* object,
                                                                       const fetchguard_index_path_t* index_path,
                                                                       fetchguard_change_type_t type,
                                                                       const fetchguard_index_path_t* new_index_path) {
    if (!controller || !object) {
        set_error(controller ? "object is null" : "controller is null");
        return FETCHGUARD_ERROR_NULL_POINTER;
    }
    if (!is_valid_change_type(type)) {
        set_error("invalid change type");
        return FETCHGUARD_ERROR_INVALID_ARGUMENT;
    }
    try {
        controller->source->delegate()->controller_did_change_object(
            *controller->source, *object, to_index_path(index_path), to_change_type(type),
            to_index_path(new_index_path));
        return FETCHGUARD_OK;
    } catch (const std::exception& e) {
        set_error(e.what());
        return FETCHGUARD_ERROR_DELEGATE;
    }
}

extern "C" fetchguard_status_t fetchguard_controller_did_change_section(fetchguard_controller_t* controller,
                                                                        const fetchguard_section_info_t* section,
                                                                        uint64_t section_index,
                                                                        fetchguard_change_type_t type) {
    if (!controller || !section) {
        set_error(controller ? "section is null" : "controller is null");
        return FETCHGUARD_ERROR_NULL_POINTER;
    }
    if (!is_valid_change_type(type)) {
        set_error("invalid change type");
        return FETCHGUARD_ERROR_INVALID_ARGUMENT;
    }
    try {
        controller->source->delegate()->controller_did_change_section(
            *controller->source, to_section_info(*section), static_cast<std::size_t>(section_index),
            to_change_type(type));
        return FETCHGUARD_OK;
    } catch (const std::exception& e) {
        set_error(e.what());
        return FETCHGUARD_ERROR_DELEGATE;
    }
}

extern "C" fetchguard_status_t fetchguard_controller_did_change_content(fetchguard_controller_t* controller) {
    if (!controller) {
        set_error("controller is null");
        return FETCHGUARD_ERROR_NULL_POINTER;
    }
    try {
        controller->source->delegate()->controller_did_change_content(*controller->source);
        return FETCHGUARD_OK;
    } catch (const std::exception& e) {
        set_error(e.what());
        return FETCHGUARD_ERROR_DELEGATE;
    }
}

extern "C" const char* fetchguard_controller_section_index_title(fetchguard_controller_t* controller,
                                                                 const char* section_name) {
    if (!controller || !section_name) return nullptr;
    try {
        auto title = controller->source->delegate()->controller_section_index_title(
            *controller->source, std::string(section_name));
        if (!title) return nullptr;
        controller->last_index_title = std::move(*title);
        return controller->last_index_title.c_str();
    } catch (const std::exception& e) {
        set_error(e.what());
        return nullptr;
    }
}

// =============================================================================
// Diagnostics
// =============================================================================

extern "C" bool fetchguard_controller_has_pending_will_change(const fetchguard_controller_t* controller) {
    if (!controller) return false;
    return controller->safe->has_pending_will_change();
}

extern "C" uint64_t fetchguard_controller_unsafe_change_count(const fetchguard_controller_t* controller) {
    if (!controller) return 0;
    return controller->safe->unsafe_change_count();
}
