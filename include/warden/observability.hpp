#pragma once

// warden/observability.hpp: Structured governance event stream.
//
// DESIGN:
//   GovernanceEvent is the canonical observable unit. Every significant step
//   of the crossing protocol and the integrity verifier emits one event,
//   which is:
//     - counted in the process-wide GovernanceStats, then
//     - handed to a registered hook, or else
//     - JSONL-appended to the event log (set_event_log_path() or
//       WARDEN_EVENT_LOG), or else dropped.
//
// INVARIANTS:
//   - Emission never blocks on anything but a single file append and never
//     fails the governance operation that triggered it.
//   - Events carry identifiers, codes and short details only; payload data
//     never reaches the event stream.

#include <atomic>
#include <cstdint>
#include <string>

#include "warden/types.hpp"

namespace warden {

enum class GovernanceEventKind {
  crossing_submitted,
  crossing_validation_failed,
  crossing_authorized,
  crossing_denied,
  crossing_completed,
  crossing_failed,
  crossing_attested,
  trust_decay,
  verification_run,
  violation_recorded,
  tether_failure,
  persistence_failure,
  store_load_failure,
  rbac_denied,
};

std::string to_string(GovernanceEventKind k);

struct GovernanceEvent {
  GovernanceEventKind kind{GovernanceEventKind::crossing_submitted};
  std::string subject_id;   // request id or verification id
  std::string boundary_id;
  bool        ok{true};
  ErrorCode   error{ErrorCode::none};
  std::string detail;
  double      magnitude{0.0};  // trust decay magnitude, when applicable
  uint64_t    timestamp_unix_ms{0};
};

std::string governance_event_to_json(const GovernanceEvent& ev);

// ---------------------------------------------------------------------------
// GovernanceStats: process-wide counters
// ---------------------------------------------------------------------------
// Thread-safe. All counters are atomic.
class GovernanceStats {
 public:
  void record(const GovernanceEvent& ev);
  void reset();
  std::string to_json() const;

  std::atomic<uint64_t> crossings_submitted{0};
  std::atomic<uint64_t> crossings_completed{0};
  std::atomic<uint64_t> crossings_failed{0};
  std::atomic<uint64_t> crossings_denied{0};
  std::atomic<uint64_t> crossings_validation_failed{0};
  std::atomic<uint64_t> crossings_attested{0};
  std::atomic<uint64_t> verifications_run{0};
  std::atomic<uint64_t> violations_recorded{0};
  std::atomic<uint64_t> trust_decay_events{0};
  std::atomic<uint64_t> tether_failures{0};
  std::atomic<uint64_t> persistence_failures{0};
  std::atomic<uint64_t> store_load_failures{0};
  std::atomic<uint64_t> rbac_denials{0};
};

GovernanceStats& global_governance_stats();

// Emit an event (fire-and-forget).
void emit_governance_event(GovernanceEvent ev);

using GovernanceEventHook = void (*)(const GovernanceEvent&);
void set_governance_event_hook(GovernanceEventHook hook);

// Overrides WARDEN_EVENT_LOG. "" restores the environment lookup.
void set_event_log_path(const std::string& path);

}  // namespace warden
