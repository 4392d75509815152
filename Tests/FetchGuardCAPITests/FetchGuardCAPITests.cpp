#include "fetchguard.h"
#include <cassert>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// ============================================================================
// Host side: a results controller and delegate written against the C API
// ============================================================================

namespace {

struct host_row {
    int id;
};

struct host_controller {
    std::vector<host_row> rows;
    bool fail_fetch = false;
    int fetch_count = 0;
};

bool host_perform_fetch(void* context, const char** error) {
    auto* host = static_cast<host_controller*>(context);
    ++host->fetch_count;
    if (host->fail_fetch) {
        *error = "disk full";
        return false;
    }
    return true;
}

uint64_t host_number_of_sections(void*) {
    return 1;
}

bool host_section_at(void* context, uint64_t index, fetchguard_section_info_t* out) {
    auto* host = static_cast<host_controller*>(context);
    if (index != 0) return false;
    out->name = "All";
    out->index_title = "A";
    out->number_of_objects = host->rows.size();
    return true;
}

const fetchguard_object_t* host_object_at(void* context, fetchguard_index_path_t path) {
    auto* host = static_cast<host_controller*>(context);
    if (path.section != 0 || path.row >= host->rows.size()) return nullptr;
    return reinterpret_cast<const fetchguard_object_t*>(&host->rows[path.row]);
}

struct host_delegate {
    std::vector<std::string> events;
    void* last_source = nullptr;
    const fetchguard_object_t* last_object = nullptr;
    bool released = false;
};

std::string describe(const fetchguard_index_path_t* path) {
    if (!path) return "nil";
    return "[" + std::to_string(path->section) + "," + std::to_string(path->row) + "]";
}

void on_will_change(void* context, void* source) {
    auto* d = static_cast<host_delegate*>(context);
    d->last_source = source;
    d->events.push_back("will");
}

void on_object(void* context, void* source, const fetchguard_object_t* object,
               const fetchguard_index_path_t* index_path, fetchguard_change_type_t type,
               const fetchguard_index_path_t* new_index_path) {
    auto* d = static_cast<host_delegate*>(context);
    d->last_source = source;
    d->last_object = object;
    auto* row = reinterpret_cast<const host_row*>(object);
    d->events.push_back("object:" + std::to_string(row->id) + ":" + std::to_string(type) + ":" +
                        describe(index_path) + ":" + describe(new_index_path));
}

void on_section(void* context, void* source, const fetchguard_section_info_t* section,
                uint64_t section_index, fetchguard_change_type_t type) {
    auto* d = static_cast<host_delegate*>(context);
    d->last_source = source;
    d->events.push_back(std::string("section:") + section->name + ":" + std::to_string(section_index) +
                        ":" + std::to_string(type));
}

void on_did_change(void* context, void* source) {
    auto* d = static_cast<host_delegate*>(context);
    d->last_source = source;
    d->events.push_back("did");
}

const char* on_index_title(void* context, void*, const char* section_name) {
    auto* d = static_cast<host_delegate*>(context);
    d->events.push_back(std::string("title:") + section_name);
    return "#";
}

void on_unsafe(void* context, void* source) {
    auto* d = static_cast<host_delegate*>(context);
    d->last_source = source;
    d->events.push_back("unsafe");
}

void on_release(void* context) {
    static_cast<host_delegate*>(context)->released = true;
}

fetchguard_results_source_t make_source(host_controller* host) {
    fetchguard_results_source_t source{};
    source.context = host;
    source.perform_fetch = host_perform_fetch;
    source.number_of_sections = host_number_of_sections;
    source.section_at = host_section_at;
    source.object_at = host_object_at;
    return source;
}

fetchguard_delegate_t make_delegate(host_delegate* d, bool wants_unsafe) {
    fetchguard_delegate_t table{};
    table.context = d;
    table.will_change_content = on_will_change;
    table.did_change_object = on_object;
    table.did_change_section = on_section;
    table.did_change_content = on_did_change;
    table.section_index_title = on_index_title;
    table.did_make_unsafe_changes = wants_unsafe ? on_unsafe : nullptr;
    table.release = on_release;
    return table;
}

} // namespace

// ============================================================================
// Tests
// ============================================================================

void test_capi_bracketed_batch() {
    std::cout << "  test_capi_bracketed_batch..." << std::flush;

    host_controller host;
    host.rows = {{10}, {11}};
    auto source = make_source(&host);
    auto* controller = fetchguard_controller_create(&source, nullptr);
    assert(controller != nullptr);

    host_delegate d;
    auto table = make_delegate(&d, true);
    assert(fetchguard_controller_set_delegate(controller, &table) == FETCHGUARD_OK);

    auto* row = reinterpret_cast<const fetchguard_object_t*>(&host.rows[0]);
    fetchguard_index_path_t path{0, 0};

    assert(fetchguard_controller_will_change_content(controller) == FETCHGUARD_OK);
    assert(fetchguard_controller_has_pending_will_change(controller));
    assert(fetchguard_controller_did_change_object(controller, row, nullptr,
                                                   FETCHGUARD_CHANGE_INSERT, &path) == FETCHGUARD_OK);
    assert(fetchguard_controller_did_change_content(controller) == FETCHGUARD_OK);
    assert(!fetchguard_controller_has_pending_will_change(controller));

    assert(d.events.size() == 3);
    assert(d.events[0] == "will");
    assert(d.events[1] == "object:10:1:nil:[0,0]");
    assert(d.events[2] == "did");
    assert(d.last_source == &host);
    assert(d.last_object == row);
    assert(fetchguard_controller_unsafe_change_count(controller) == 0);

    fetchguard_controller_destroy(controller);
    assert(d.released);

    std::cout << " OK" << std::endl;
}

void test_capi_unsafe_changes() {
    std::cout << "  test_capi_unsafe_changes..." << std::flush;

    host_controller host;
    host.rows = {{10}, {11}, {12}};
    auto source = make_source(&host);
    auto* controller = fetchguard_controller_create(&source, nullptr);

    host_delegate d;
    auto table = make_delegate(&d, true);
    fetchguard_controller_set_delegate(controller, &table);

    auto* row = reinterpret_cast<const fetchguard_object_t*>(&host.rows[2]);
    fetchguard_index_path_t path{0, 2};
    fetchguard_section_info_t section{"All", "A", 3};

    fetchguard_controller_did_change_object(controller, row, &path, FETCHGUARD_CHANGE_DELETE, nullptr);
    fetchguard_controller_did_change_section(controller, &section, 0, FETCHGUARD_CHANGE_INSERT);

    assert(d.events.size() == 4);
    assert(d.events[0] == "unsafe");
    assert(d.events[1] == "object:12:2:[0,2]:nil");
    assert(d.events[2] == "unsafe");
    assert(d.events[3] == "section:All:0:1");
    assert(d.last_source == &host);
    assert(fetchguard_controller_unsafe_change_count(controller) == 2);
    assert(!fetchguard_controller_has_pending_will_change(controller));

    // Without did_make_unsafe_changes only the standard callbacks arrive
    host_delegate plain;
    auto plain_table = make_delegate(&plain, false);
    fetchguard_controller_set_delegate(controller, &plain_table);
    assert(d.released);

    fetchguard_controller_did_change_object(controller, row, &path, FETCHGUARD_CHANGE_UPDATE, nullptr);
    assert(plain.events.size() == 1);
    assert(plain.events[0] == "object:12:4:[0,2]:nil");
    assert(fetchguard_controller_unsafe_change_count(controller) == 3);

    fetchguard_controller_destroy(controller);
    assert(plain.released);

    std::cout << " OK" << std::endl;
}

void test_capi_source_passthrough() {
    std::cout << "  test_capi_source_passthrough..." << std::flush;

    host_controller host;
    host.rows = {{1}, {2}};
    auto source = make_source(&host);
    auto* controller = fetchguard_controller_create(&source, R"({"reconcileBatches": true})");
    assert(controller != nullptr);

    assert(fetchguard_controller_perform_fetch(controller) == FETCHGUARD_OK);
    assert(host.fetch_count == 1);

    host.fail_fetch = true;
    assert(fetchguard_controller_perform_fetch(controller) == FETCHGUARD_ERROR_FETCH);
    assert(std::strcmp(fetchguard_last_error(), "disk full") == 0);

    assert(fetchguard_controller_number_of_sections(controller) == 1);
    fetchguard_index_path_t second{0, 1};
    fetchguard_index_path_t missing{0, 5};
    assert(fetchguard_controller_object_at(controller, second) ==
           reinterpret_cast<const fetchguard_object_t*>(&host.rows[1]));
    assert(fetchguard_controller_object_at(controller, missing) == nullptr);

    // No delegate: title keeps its default
    assert(fetchguard_controller_section_index_title(controller, "All") == nullptr);

    host_delegate d;
    auto table = make_delegate(&d, true);
    fetchguard_controller_set_delegate(controller, &table);
    const char* title = fetchguard_controller_section_index_title(controller, "All");
    assert(title != nullptr);
    assert(std::strcmp(title, "#") == 0);
    assert(d.events.size() == 1 && d.events[0] == "title:All");

    // Clearing the delegate releases it
    assert(fetchguard_controller_set_delegate(controller, nullptr) == FETCHGUARD_OK);
    assert(d.released);

    fetchguard_controller_destroy(controller);

    std::cout << " OK" << std::endl;
}

void test_capi_reconciled_batch() {
    std::cout << "  test_capi_reconciled_batch..." << std::flush;

    host_controller host;
    host.rows = {{1}, {2}};
    auto source = make_source(&host);
    auto* controller = fetchguard_controller_create(&source, R"({"reconcileBatches": true})");

    host_delegate d;
    auto table = make_delegate(&d, true);
    fetchguard_controller_set_delegate(controller, &table);

    auto* first = reinterpret_cast<const fetchguard_object_t*>(&host.rows[0]);
    auto* second = reinterpret_cast<const fetchguard_object_t*>(&host.rows[1]);
    fetchguard_index_path_t top{0, 0};
    fetchguard_index_path_t next{0, 1};

    fetchguard_controller_will_change_content(controller);
    fetchguard_controller_did_change_object(controller, second, &next, FETCHGUARD_CHANGE_UPDATE, nullptr);
    {
        // Host-side strings are gone before the batch is replayed
        std::string name = "Later";
        std::string title = "L";
        fetchguard_section_info_t section{name.c_str(), title.c_str(), 0};
        fetchguard_controller_did_change_section(controller, &section, 1, FETCHGUARD_CHANGE_INSERT);
    }
    fetchguard_controller_did_change_object(controller, first, nullptr, FETCHGUARD_CHANGE_INSERT, &top);
    assert(d.events.empty());
    fetchguard_controller_did_change_content(controller);

    assert(d.events.size() == 5);
    assert(d.events[0] == "will");
    assert(d.events[1] == "section:Later:1:1");
    assert(d.events[2] == "object:1:1:nil:[0,0]");
    assert(d.events[3] == "object:2:4:[0,1]:[0,1]");
    assert(d.events[4] == "did");

    fetchguard_controller_destroy(controller);

    std::cout << " OK" << std::endl;
}

void test_capi_invalid_arguments() {
    std::cout << "  test_capi_invalid_arguments..." << std::flush;

    assert(fetchguard_controller_create(nullptr, nullptr) == nullptr);
    assert(std::strcmp(fetchguard_last_error(), "source is null") == 0);

    host_controller host;
    auto source = make_source(&host);
    assert(fetchguard_controller_create(&source, "{\"maxSectionChanges\": \"many\"}") == nullptr);
    assert(std::strcmp(fetchguard_last_error(), "invalid options JSON") == 0);

    assert(fetchguard_controller_will_change_content(nullptr) == FETCHGUARD_ERROR_NULL_POINTER);
    assert(fetchguard_controller_set_delegate(nullptr, nullptr) == FETCHGUARD_ERROR_NULL_POINTER);
    assert(!fetchguard_controller_has_pending_will_change(nullptr));
    assert(fetchguard_controller_unsafe_change_count(nullptr) == 0);

    auto* controller = fetchguard_controller_create(&source, nullptr);
    fetchguard_index_path_t path{0, 0};
    assert(fetchguard_controller_did_change_object(controller, nullptr, &path,
                                                   FETCHGUARD_CHANGE_UPDATE, nullptr) ==
           FETCHGUARD_ERROR_NULL_POINTER);

    host_row row{1};
    auto* object = reinterpret_cast<const fetchguard_object_t*>(&row);
    assert(fetchguard_controller_did_change_object(controller, object, &path,
                                                   static_cast<fetchguard_change_type_t>(9), nullptr) ==
           FETCHGUARD_ERROR_INVALID_ARGUMENT);
    assert(fetchguard_controller_did_change_section(controller, nullptr, 0, FETCHGUARD_CHANGE_INSERT) ==
           FETCHGUARD_ERROR_NULL_POINTER);

    // Rejected calls are not counted as unsafe changes
    assert(fetchguard_controller_unsafe_change_count(controller) == 0);

    fetchguard_controller_destroy(controller);
    fetchguard_controller_destroy(nullptr);

    fetchguard_set_log_level(99);
    fetchguard_set_log_level(0);

    std::cout << " OK" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Running FetchGuardCAPI Tests..." << std::endl;
    std::cout << "========================================" << std::endl;

    test_capi_bracketed_batch();
    test_capi_unsafe_changes();
    test_capi_source_passthrough();
    test_capi_reconciled_batch();
    test_capi_invalid_arguments();

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "All tests passed! (5 tests)" << std::endl;
    std::cout << "========================================" << std::endl;
    return 0;
}
