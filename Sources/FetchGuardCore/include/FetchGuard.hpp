#pragma once

// FetchGuard - Safety shim for fetched results controllers
//
// Usage:
//   #include <FetchGuard.hpp>
//
//   struct contacts_view : fetchguard::results_controller_delegate<Contact>,
//                          fetchguard::unsafe_change_delegate<Contact> {
//       void controller_did_make_unsafe_changes(
//               fetchguard::results_controller<Contact>& controller) override {
//           reload_all(controller.sections());
//       }
//       // ... incremental updates in the other callbacks
//   };
//
//   fetchguard::safe_results_controller<Contact> safe(platform_controller);
//   safe.set_application_delegate(view);
//   safe.perform_fetch();

#include "fetchguard/log.hpp"
#include "fetchguard/types.hpp"
#include "fetchguard/options.hpp"
#include "fetchguard/results_controller.hpp"
#include "fetchguard/batch_reconciler.hpp"
#include "fetchguard/safe_results_controller.hpp"
