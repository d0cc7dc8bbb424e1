#include "warden/observability.hpp"

#include "warden/jsonlite.hpp"

#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace warden {

std::string to_string(GovernanceEventKind k) {
  switch (k) {
    case GovernanceEventKind::crossing_submitted:         return "crossing.submitted";
    case GovernanceEventKind::crossing_validation_failed: return "crossing.validation_failed";
    case GovernanceEventKind::crossing_authorized:        return "crossing.authorized";
    case GovernanceEventKind::crossing_denied:            return "crossing.denied";
    case GovernanceEventKind::crossing_completed:         return "crossing.completed";
    case GovernanceEventKind::crossing_failed:            return "crossing.failed";
    case GovernanceEventKind::crossing_attested:          return "crossing.attested";
    case GovernanceEventKind::trust_decay:                return "trust.decay";
    case GovernanceEventKind::verification_run:           return "verification.run";
    case GovernanceEventKind::violation_recorded:         return "violation.recorded";
    case GovernanceEventKind::tether_failure:             return "tether.failure";
    case GovernanceEventKind::persistence_failure:        return "persistence.failure";
    case GovernanceEventKind::store_load_failure:         return "store.load_failure";
    case GovernanceEventKind::rbac_denied:                return "rbac.denied";
  }
  return "unknown";
}

std::string governance_event_to_json(const GovernanceEvent& ev) {
  jsonlite::Object o;
  o["event"] = jsonlite::Value{to_string(ev.kind)};
  o["subject_id"] = jsonlite::Value{ev.subject_id};
  o["boundary_id"] = jsonlite::Value{ev.boundary_id};
  o["ok"] = jsonlite::Value{ev.ok};
  o["error_code"] = jsonlite::Value{to_string(ev.error)};
  o["detail"] = jsonlite::Value{ev.detail};
  if (ev.kind == GovernanceEventKind::trust_decay) {
    o["magnitude"] = jsonlite::Value{ev.magnitude};
  }
  o["timestamp_unix_ms"] = jsonlite::Value{static_cast<std::uint64_t>(ev.timestamp_unix_ms)};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

// ---------------------------------------------------------------------------
// GovernanceStats
// ---------------------------------------------------------------------------

void GovernanceStats::record(const GovernanceEvent& ev) {
  switch (ev.kind) {
    case GovernanceEventKind::crossing_submitted:
      crossings_submitted.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::crossing_validation_failed:
      crossings_validation_failed.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::crossing_authorized:
      break;
    case GovernanceEventKind::crossing_denied:
      crossings_denied.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::crossing_completed:
      crossings_completed.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::crossing_failed:
      crossings_failed.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::crossing_attested:
      crossings_attested.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::trust_decay:
      trust_decay_events.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::verification_run:
      verifications_run.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::violation_recorded:
      violations_recorded.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::tether_failure:
      tether_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::persistence_failure:
      persistence_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::store_load_failure:
      store_load_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case GovernanceEventKind::rbac_denied:
      rbac_denials.fetch_add(1, std::memory_order_relaxed);
      break;
  }
}

void GovernanceStats::reset() {
  for (auto* c : {&crossings_submitted, &crossings_completed, &crossings_failed,
                  &crossings_denied, &crossings_validation_failed, &crossings_attested,
                  &verifications_run, &violations_recorded, &trust_decay_events,
                  &tether_failures, &persistence_failures, &store_load_failures,
                  &rbac_denials}) {
    c->store(0, std::memory_order_relaxed);
  }
}

std::string GovernanceStats::to_json() const {
  auto n = [](const std::atomic<uint64_t>& a) {
    return jsonlite::Value{static_cast<std::uint64_t>(a.load(std::memory_order_relaxed))};
  };
  jsonlite::Object crossings;
  crossings["submitted"] = n(crossings_submitted);
  crossings["completed"] = n(crossings_completed);
  crossings["failed"] = n(crossings_failed);
  crossings["denied"] = n(crossings_denied);
  crossings["validation_failed"] = n(crossings_validation_failed);
  crossings["attested"] = n(crossings_attested);

  jsonlite::Object fatal;
  fatal["tether_failures"] = n(tether_failures);
  fatal["persistence_failures"] = n(persistence_failures);

  jsonlite::Object o;
  o["crossings"] = jsonlite::Value{std::move(crossings)};
  o["fatal"] = jsonlite::Value{std::move(fatal)};
  o["verifications_run"] = n(verifications_run);
  o["violations_recorded"] = n(violations_recorded);
  o["trust_decay_events"] = n(trust_decay_events);
  o["store_load_failures"] = n(store_load_failures);
  o["rbac_denials"] = n(rbac_denials);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

GovernanceStats& global_governance_stats() {
  static GovernanceStats stats;
  return stats;
}

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------

namespace {
std::atomic<GovernanceEventHook> g_event_hook{nullptr};
std::mutex g_log_mu;
std::string g_log_path;  // protected by g_log_mu
}  // namespace

void set_governance_event_hook(GovernanceEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_path = path;
}

void emit_governance_event(GovernanceEvent ev) {
  if (ev.timestamp_unix_ms == 0) ev.timestamp_unix_ms = now_unix_ms();

  // 1. Counters (always).
  global_governance_stats().record(ev);

  // 2. Registered hook replaces the file sink.
  GovernanceEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // 3. JSONL sink. Activation: WARDEN_EVENT_LOG=/path/to/events.jsonl
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::string path = g_log_path;
  if (path.empty()) {
    const char* env = std::getenv("WARDEN_EVENT_LOG");
    if (!env || !env[0]) return;
    path = env;
  }
  const std::string line = governance_event_to_json(ev) + "\n";
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace warden
