#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fetchguard {

class fetch_error : public std::runtime_error {
public:
    explicit fetch_error(const std::string& msg) : std::runtime_error(msg) {}
};

template<typename Object> class results_controller;

// ============================================================================
// results_controller_delegate - Change observation contract
// ============================================================================
//
// A results controller reports every batch of store mutations as:
//
//   will_change_content
//     did_change_section / did_change_object   (zero or more)
//   did_change_content
//
// Every callback is optional: the defaults do nothing, so a delegate only
// overrides what it cares about.

template<typename Object>
class results_controller_delegate {
public:
    virtual ~results_controller_delegate() = default;

    virtual void controller_will_change_content(results_controller<Object>&) {}

    /// path is empty for inserts; new_path is empty for deletes and updates.
    virtual void controller_did_change_object(results_controller<Object>&,
                                              const Object&,
                                              const std::optional<index_path>&,
                                              change_type,
                                              const std::optional<index_path>&) {}

    virtual void controller_did_change_section(results_controller<Object>&,
                                               const section_info&,
                                               std::size_t,
                                               change_type) {}

    virtual void controller_did_change_content(results_controller<Object>&) {}

    /// Returning nullopt lets the controller use its default index title.
    virtual std::optional<std::string> controller_section_index_title(results_controller<Object>&,
                                                                      const std::string&) {
        return std::nullopt;
    }
};

// ============================================================================
// unsafe_change_delegate - Optional extension of the delegate contract
// ============================================================================
//
// A delegate that also derives from this interface is told when a batch of
// changes cannot be applied incrementally. The receiver should drop any
// pending incremental updates and reload its presentation from the controller.

template<typename Object>
class unsafe_change_delegate {
public:
    virtual ~unsafe_change_delegate() = default;

    virtual void controller_did_make_unsafe_changes(results_controller<Object>& controller) = 0;
};

// ============================================================================
// results_controller - A live, sectioned, ordered view over a store query
// ============================================================================

template<typename Object>
class results_controller {
public:
    using object_type = Object;
    using delegate_type = results_controller_delegate<Object>;

    virtual ~results_controller() = default;

    /// Registers the single observer of this controller. Not owned.
    virtual void set_delegate(delegate_type* delegate) = 0;

    [[nodiscard]] virtual delegate_type* delegate() const noexcept = 0;

    /// Executes the fetch request. Throws fetch_error on failure.
    virtual void perform_fetch() = 0;

    [[nodiscard]] virtual std::vector<section_info> sections() const = 0;

    /// Returns nullptr if the path is outside the fetched results.
    [[nodiscard]] virtual const Object* object_at(const index_path& path) const = 0;
};

/// Delivers the unsafe change signal if the delegate is still alive and
/// implements unsafe_change_delegate. Returns true if it was delivered.
template<typename Object>
bool notify_unsafe_changes(const std::weak_ptr<results_controller_delegate<Object>>& delegate,
                           results_controller<Object>& controller) {
    auto strong = delegate.lock();
    if (!strong) {
        return false;
    }
    auto* unsafe = dynamic_cast<unsafe_change_delegate<Object>*>(strong.get());
    if (!unsafe) {
        return false;
    }
    unsafe->controller_did_make_unsafe_changes(controller);
    return true;
}

} // namespace fetchguard

#endif // __cplusplus
