#ifndef FETCHGUARD_C_API_H
#define FETCHGUARD_C_API_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Opaque Types
// =============================================================================

typedef struct fetchguard_controller fetchguard_controller_t;

// Objects of the host's results controller. Never dereferenced by FetchGuard.
typedef struct fetchguard_object fetchguard_object_t;

// =============================================================================
// Error Handling
// =============================================================================

typedef enum {
    FETCHGUARD_OK = 0,
    FETCHGUARD_ERROR_NULL_POINTER = -1,
    FETCHGUARD_ERROR_INVALID_ARGUMENT = -2,
    FETCHGUARD_ERROR_FETCH = -3,
    FETCHGUARD_ERROR_DELEGATE = -4,
} fetchguard_status_t;

// Get the last error message (thread-local)
const char* fetchguard_last_error(void);

// 0 = off, 1 = error, 2 = warn, 3 = info, 4 = debug
void fetchguard_set_log_level(int level);

// =============================================================================
// Change Types
// =============================================================================

typedef enum {
    FETCHGUARD_CHANGE_INSERT = 1,
    FETCHGUARD_CHANGE_DELETE = 2,
    FETCHGUARD_CHANGE_MOVE = 3,
    FETCHGUARD_CHANGE_UPDATE = 4,
} fetchguard_change_type_t;

typedef struct {
    uint64_t section;
    uint64_t row;
} fetchguard_index_path_t;

typedef struct {
    const char* name;
    const char* index_title;
    uint64_t number_of_objects;
} fetchguard_section_info_t;

// =============================================================================
// Results Source - the host's fetched results controller
// =============================================================================
//
// `context` identifies the host controller. It is handed back as `source` in
// every delegate callback. All entries are optional.

typedef struct {
    void* context;

    // Return false on failure; the message is taken from `error` if non-NULL.
    bool (*perform_fetch)(void* context, const char** error);

    uint64_t (*number_of_sections)(void* context);

    // Fill `out`; return false if the index is out of range.
    bool (*section_at)(void* context, uint64_t index, fetchguard_section_info_t* out);

    const fetchguard_object_t* (*object_at)(void* context, fetchguard_index_path_t path);
} fetchguard_results_source_t;

// =============================================================================
// Delegate - receives forwarded callbacks
// =============================================================================
//
// Every entry may be NULL. A NULL did_make_unsafe_changes means the delegate
// does not want unsafe change notifications. `release` is called once when
// FetchGuard drops the delegate.

typedef struct {
    void* context;

    void (*will_change_content)(void* context, void* source);

    // index_path is NULL for inserts; new_index_path is NULL for deletes and updates.
    void (*did_change_object)(void* context, void* source,
                              const fetchguard_object_t* object,
                              const fetchguard_index_path_t* index_path,
                              fetchguard_change_type_t type,
                              const fetchguard_index_path_t* new_index_path);

    void (*did_change_section)(void* context, void* source,
                               const fetchguard_section_info_t* section,
                               uint64_t section_index,
                               fetchguard_change_type_t type);

    void (*did_change_content)(void* context, void* source);

    // Return NULL to keep the default title.
    const char* (*section_index_title)(void* context, void* source, const char* section_name);

    void (*did_make_unsafe_changes)(void* context, void* source);

    void (*release)(void* context);
} fetchguard_delegate_t;

// =============================================================================
// Controller Lifecycle
// =============================================================================

// options_json may be NULL. Returns NULL on failure.
fetchguard_controller_t* fetchguard_controller_create(const fetchguard_results_source_t* source,
                                                      const char* options_json);

void fetchguard_controller_destroy(fetchguard_controller_t* controller);

// The table is copied. Pass NULL to clear the delegate.
fetchguard_status_t fetchguard_controller_set_delegate(fetchguard_controller_t* controller,
                                                       const fetchguard_delegate_t* delegate);

fetchguard_status_t fetchguard_controller_perform_fetch(fetchguard_controller_t* controller);

uint64_t fetchguard_controller_number_of_sections(fetchguard_controller_t* controller);

const fetchguard_object_t* fetchguard_controller_object_at(fetchguard_controller_t* controller,
                                                           fetchguard_index_path_t path);

// =============================================================================
// Change Notifications - called by the host controller
// =============================================================================

fetchguard_status_t fetchguard_controller_will_change_content(fetchguard_controller_t* controller);

fetchguard_status_t fetchguard_controller_did_change_object(fetchguard_controller_t* controller,
                                                            const fetchguard_object_t* object,
                                                            const fetchguard_index_path_t* index_path,
                                                            fetchguard_change_type_t type,
                                                            const fetchguard_index_path_t* new_index_path);

fetchguard_status_t fetchguard_controller_did_change_section(fetchguard_controller_t* controller,
                                                             const fetchguard_section_info_t* section,
                                                             uint64_t section_index,
                                                             fetchguard_change_type_t type);

fetchguard_status_t fetchguard_controller_did_change_content(fetchguard_controller_t* controller);

// Valid until the next call on this controller. NULL if the delegate keeps the default.
const char* fetchguard_controller_section_index_title(fetchguard_controller_t* controller,
                                                      const char* section_name);

// =============================================================================
// Diagnostics
// =============================================================================

bool fetchguard_controller_has_pending_will_change(const fetchguard_controller_t* controller);

uint64_t fetchguard_controller_unsafe_change_count(const fetchguard_controller_t* controller);

#ifdef __cplusplus
}
#endif

#endif // FETCHGUARD_C_API_H
