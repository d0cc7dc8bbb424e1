#include "warden/crossing.hpp"

#include "warden/codec.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace warden {

namespace {

constexpr std::size_t kPerfLowBytes = 0;
constexpr std::size_t kPerfMediumBytes = 64 * 1024;
constexpr std::size_t kPerfHighBytes = 1024 * 1024;

ImpactLevel at_least(ImpactLevel a, ImpactLevel b) {
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

double classification_trust_impact(Classification c) {
  switch (c) {
    case Classification::public_:      return 0.0;
    case Classification::internal:     return -0.01;
    case Classification::confidential: return -0.03;
    case Classification::restricted:   return -0.05;
    case Classification::critical:     return -0.1;
  }
  return 0.0;
}

ImpactLevel classification_level(Classification c) {
  switch (c) {
    case Classification::public_:
    case Classification::internal:     return ImpactLevel::none;
    case Classification::confidential: return ImpactLevel::low;
    case Classification::restricted:   return ImpactLevel::medium;
    case Classification::critical:     return ImpactLevel::high;
  }
  return ImpactLevel::none;
}

std::string impact_summary(const ImpactAssessment& i) {
  return "trust=" + jsonlite::format_double(i.trust_impact) +
         " security=" + to_string(i.security_impact) +
         " governance=" + to_string(i.governance_impact) +
         " performance=" + to_string(i.performance_impact);
}

GovernanceEvent crossing_event(GovernanceEventKind kind, const CrossingRequest& r,
                               std::string detail = "") {
  GovernanceEvent ev;
  ev.kind = kind;
  ev.subject_id = r.request_id;
  ev.boundary_id = r.target_boundary_id;
  ev.ok = kind != GovernanceEventKind::crossing_failed &&
          kind != GovernanceEventKind::crossing_validation_failed &&
          kind != GovernanceEventKind::crossing_denied;
  ev.detail = std::move(detail);
  return ev;
}

}  // namespace

// ---------------------------------------------------------------------------
// assess_impact
// ---------------------------------------------------------------------------

ImpactAssessment assess_impact(const CrossingRequest& request, const ExecutionOutcome& outcome) {
  const Classification cls = request.payload.classification.value_or(Classification::internal);

  ImpactAssessment i;
  i.trust_impact = classification_trust_impact(cls);
  i.security_impact = classification_level(cls);
  i.governance_impact = classification_level(cls);

  switch (request.kind) {
    case CrossingKind::control_transfer:
      i.trust_impact -= 0.05;
      i.security_impact = ImpactLevel::high;
      i.governance_impact = ImpactLevel::high;
      break;
    case CrossingKind::authentication:
    case CrossingKind::authorization:
      i.security_impact = at_least(i.security_impact, ImpactLevel::medium);
      break;
    case CrossingKind::data_transfer:
    case CrossingKind::query:
    case CrossingKind::notification:
      break;
  }
  if (!outcome.success) i.trust_impact -= 0.02;
  i.trust_impact = std::max(i.trust_impact, -1.0);

  const std::size_t n = request.payload.data.size();
  if (n > kPerfHighBytes) i.performance_impact = ImpactLevel::high;
  else if (n > kPerfMediumBytes) i.performance_impact = ImpactLevel::medium;
  else if (n > kPerfLowBytes) i.performance_impact = ImpactLevel::low;
  else i.performance_impact = ImpactLevel::none;
  return i;
}

// ---------------------------------------------------------------------------
// CrossingProtocol
// ---------------------------------------------------------------------------

CrossingProtocol::CrossingProtocol(Collaborators collab, EvidenceLedger& ledger,
                                   IRecordStore& store, CrossingConfig config,
                                   ControlHooks hooks, CrossingExecutor* executor)
    : collab_(collab),
      ledger_(ledger),
      store_(store),
      config_(config),
      evaluator_(hooks),
      executor_(executor) {
  load();
}

void CrossingProtocol::load() {
  if (!collab_.seals) {
    load_status_.error = ErrorCode::invalid_argument;
    load_status_.message = "seal service missing";
    return;
  }
  auto doc = store_.load();
  if (!doc) return;

  auto records = open_sealed_document(*doc, kCollection, *collab_.seals,
                                      config_.verify_seal_on_load);
  if (!records.ok()) {
    load_status_.error = records.error;
    load_status_.message = records.message;
  } else {
    std::map<std::string, CrossingRequest> loaded;
    for (const auto& [id, value] : *records.value) {
      const auto* obj = std::get_if<jsonlite::Object>(&value.v);
      if (!obj) {
        load_status_.error = ErrorCode::validation_failed;
        load_status_.message = "crossing " + id + " is not an object";
        break;
      }
      auto req = codec::decode_crossing(*obj);
      if (!req.ok()) {
        load_status_.error = req.error;
        load_status_.message = req.message;
        break;
      }
      for (const auto& ev : req.value->audit_trail) {
        last_timestamp_ = std::max(last_timestamp_, ev.timestamp_unix_ms);
      }
      for (const auto& d : req.value->trust_decay) {
        last_timestamp_ = std::max(last_timestamp_, d.timestamp_unix_ms);
      }
      loaded[id] = std::move(*req.value);
    }
    if (load_status_.ok()) {
      requests_ = std::move(loaded);
      load_status_.records = requests_.size();
      return;
    }
  }

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::store_load_failure;
  ev.subject_id = store_.backend_id();
  ev.ok = false;
  ev.error = load_status_.error;
  ev.detail = load_status_.message;
  emit_governance_event(std::move(ev));
}

std::optional<CrossingProtocol::Denial> CrossingProtocol::precheck(const std::string& operation) {
  if (!collab_.registry || !collab_.seals) {
    return Denial{ErrorCode::invalid_argument, "crossing protocol lacks registry or seal service"};
  }
  if (!load_status_.ok()) {
    return Denial{ErrorCode::store_unavailable,
                  operation + " refused: crossing store did not load (" +
                      to_string(load_status_.error) + ": " + load_status_.message + ")"};
  }

  jsonlite::Object snap;
  snap["component"] = jsonlite::Value{kComponent};
  snap["operation"] = jsonlite::Value{operation};
  snap["timestamp"] = jsonlite::Value{static_cast<std::uint64_t>(now_unix_ms())};
  snap["record_count"] = jsonlite::Value{static_cast<std::uint64_t>(requests_.size())};
  const std::string snapshot = jsonlite::to_json(jsonlite::Value{std::move(snap)});

  if (collab_.seals->verify_contract_tether(kComponent, operation, snapshot)) {
    return std::nullopt;
  }
  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::tether_failure;
  ev.subject_id = operation;
  ev.ok = false;
  ev.error = ErrorCode::contract_tether_failed;
  ev.detail = snapshot;
  emit_governance_event(std::move(ev));
  return Denial{ErrorCode::contract_tether_failed,
                "contract tether check failed for " + operation};
}

std::optional<CrossingProtocol::Denial> CrossingProtocol::check_role(
    rbac::Role role, rbac::Permission permission, const std::string& principal_id,
    const std::string& request_id) {
  if (!config_.enforce_rbac) return std::nullopt;
  auto decision = rbac::check(principal_id, role, permission);
  if (decision.ok) return std::nullopt;

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::rbac_denied;
  ev.subject_id = request_id;
  ev.ok = false;
  ev.error = ErrorCode::unauthorized;
  ev.detail = decision.to_json();
  emit_governance_event(std::move(ev));
  return Denial{ErrorCode::unauthorized, decision.denial_reason};
}

uint64_t CrossingProtocol::next_timestamp() {
  last_timestamp_ = std::max(last_timestamp_, now_unix_ms());
  return last_timestamp_;
}

void CrossingProtocol::append_event(CrossingRequest& req, const std::string& event_type,
                                    const std::string& actor_id, const std::string& details,
                                    CrossingStatus new_status) {
  AuditEvent ev;
  ev.event_id = random_id("evt");
  ev.timestamp_unix_ms = next_timestamp();
  ev.event_type = event_type;
  ev.actor_id = actor_id;
  ev.details = details;

  jsonlite::Object payload;
  payload["event"] = codec::encode(ev);
  payload["status"] = jsonlite::Value{to_string(new_status)};
  ledger_.append(EvidenceKind::crossing_event, req.request_id,
                 jsonlite::to_json(jsonlite::Value{std::move(payload)}),
                 ev.timestamp_unix_ms);

  req.audit_trail.push_back(std::move(ev));
  req.status = new_status;
}

void CrossingProtocol::decay(CrossingRequest& req, const std::string& actor_id,
                             double magnitude, const std::string& reason) {
  const std::string& request_id = req.request_id;
  TrustDecayEvent d;
  d.actor_id = actor_id;
  d.magnitude = magnitude;
  d.reason = reason;
  d.request_id = request_id;
  d.timestamp_unix_ms = next_timestamp();

  jsonlite::Object payload;
  payload["actor_id"] = jsonlite::Value{actor_id};
  payload["magnitude"] = jsonlite::Value{magnitude};
  payload["reason"] = jsonlite::Value{reason};
  payload["request_id"] = jsonlite::Value{request_id};
  ledger_.append(EvidenceKind::trust_decay, actor_id,
                 jsonlite::to_json(jsonlite::Value{std::move(payload)}),
                 d.timestamp_unix_ms);

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::trust_decay;
  ev.subject_id = request_id;
  ev.boundary_id = actor_id;
  ev.detail = reason;
  ev.magnitude = magnitude;
  emit_governance_event(std::move(ev));

  req.trust_decay.push_back(std::move(d));
}

std::optional<std::string> CrossingProtocol::persist() {
  jsonlite::Object records;
  for (const auto& [id, req] : requests_) records[id] = codec::encode(req);

  auto doc = build_sealed_document(kCollection, records, *collab_.seals);
  std::string error;
  if (!doc.ok()) {
    error = doc.message;
  } else if (!store_.save(*doc.value)) {
    error = "write to " + store_.backend_id() + " failed";
  } else {
    return std::nullopt;
  }

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::persistence_failure;
  ev.subject_id = store_.backend_id();
  ev.ok = false;
  ev.error = ErrorCode::persistence_failed;
  ev.detail = error;
  emit_governance_event(std::move(ev));
  return error;
}

// ---------------------------------------------------------------------------
// submit
// ---------------------------------------------------------------------------

Result<CrossingRequest> CrossingProtocol::submit(CrossingRequest request, rbac::Role role) {
  using R = Result<CrossingRequest>;
  std::lock_guard<std::mutex> lk(mu_);

  if (auto d = precheck("submit")) return R::failure(d->error, d->message);
  if (auto d = check_role(role, rbac::Permission::crossing_submit,
                          request.requester_id, request.request_id)) {
    return R::failure(d->error, d->message);
  }
  if (request.status != CrossingStatus::requested || !request.audit_trail.empty() ||
      request.authorization || request.execution) {
    return R::failure(ErrorCode::illegal_transition,
                      "submit requires a fresh request in status requested");
  }
  if (request.request_id.empty()) request.request_id = random_id("crossing");
  if (requests_.count(request.request_id)) {
    return R::failure(ErrorCode::invalid_argument,
                      "request " + request.request_id + " already exists");
  }
  if (request.created_at_unix_ms == 0) request.created_at_unix_ms = next_timestamp();
  request.control_results.clear();
  request.applied_controls.clear();
  request.validation_failure_reason.clear();
  request.impact.reset();

  const std::string actor = request.requester_id.empty() ? "unknown" : request.requester_id;
  append_event(request, "request_received", actor,
               "crossing " + to_string(request.kind) + " from " +
                   request.source_boundary_id + " to " + request.target_boundary_id,
               CrossingStatus::validating);

  auto boundary = collab_.registry->get(request.target_boundary_id);
  if (!boundary) {
    ExecutionOutcome outcome;
    outcome.success = false;
    outcome.error_code = "BOUNDARY_NOT_FOUND";
    outcome.error_message = "target boundary " + request.target_boundary_id + " not found";
    request.execution = outcome;
    append_event(request, "failed", "system", outcome.error_message, CrossingStatus::failed);
    emit_governance_event(crossing_event(GovernanceEventKind::crossing_failed, request,
                                         outcome.error_code));
  } else {
    const ControlResult* failing = nullptr;
    for (const Control* control : request_evaluation_order(*boundary)) {
      request.control_results.push_back(evaluator_.evaluate(*control, *boundary, &request));
      if (request.control_results.back().status == ControlStatus::ineffective) {
        failing = &request.control_results.back();
        break;
      }
    }

    if (failing) {
      request.validation_failure_reason = failing->control_id + ": " + failing->detail;
      append_event(request, "validation_failed", "system",
                   request.validation_failure_reason, CrossingStatus::validation_failed);
      emit_governance_event(crossing_event(GovernanceEventKind::crossing_validation_failed,
                                           request, request.validation_failure_reason));
    } else {
      for (const auto& c : boundary->controls) request.applied_controls.push_back(c.control_id);
      append_event(request, "validated", "system",
                   std::to_string(request.applied_controls.size()) + " controls passed",
                   CrossingStatus::validated);
      append_event(request, "authorization_pending", "system",
                   "awaiting authorization", CrossingStatus::authorization_pending);
      emit_governance_event(crossing_event(GovernanceEventKind::crossing_submitted, request));
    }
  }

  const std::string id = request.request_id;
  requests_[id] = request;
  if (auto err = persist()) return R::unpersisted(std::move(request), *err);
  return R::success(std::move(request));
}

// ---------------------------------------------------------------------------
// authorize
// ---------------------------------------------------------------------------

Result<CrossingRequest> CrossingProtocol::authorize(const std::string& request_id,
                                                    const std::string& authorizer_id,
                                                    AuthorizationDecision decision,
                                                    const std::string& reason,
                                                    rbac::Role role) {
  using R = Result<CrossingRequest>;
  std::lock_guard<std::mutex> lk(mu_);

  if (auto d = precheck("authorize")) return R::failure(d->error, d->message);
  auto it = requests_.find(request_id);
  if (it == requests_.end()) {
    return R::failure(ErrorCode::not_found, "request " + request_id + " not found");
  }
  if (it->second.authorization ||
      it->second.status != CrossingStatus::authorization_pending) {
    return R::failure(ErrorCode::illegal_transition,
                      "request " + request_id + " is " + to_string(it->second.status) +
                          (is_terminal(it->second.status) ? " (terminal)" : "") +
                          "; authorize requires authorization_pending");
  }
  if (auto d = check_role(role, rbac::Permission::crossing_authorize, authorizer_id,
                          request_id)) {
    decay(it->second, authorizer_id, config_.decay.unauthorized, "unauthorized");
    if (auto err = persist()) return R::failure(d->error, d->message + "; " + *err);
    return R::failure(d->error, d->message);
  }

  CrossingRequest req = it->second;
  AuthorizationRecord rec;
  rec.decision = decision;
  rec.authorizer_id = authorizer_id;
  rec.timestamp_unix_ms = next_timestamp();
  rec.reason = reason;
  req.authorization = rec;

  const std::string details = reason.empty() ? to_string(decision) : reason;
  if (decision == AuthorizationDecision::allow) {
    append_event(req, "authorized", authorizer_id, details, CrossingStatus::authorized);
    emit_governance_event(crossing_event(GovernanceEventKind::crossing_authorized, req));
  } else {
    append_event(req, "denied", authorizer_id, details, CrossingStatus::denied);
    emit_governance_event(crossing_event(GovernanceEventKind::crossing_denied, req, details));
    decay(req, req.source_boundary_id, config_.decay.denied, "denied");
    decay(req, req.target_boundary_id, config_.decay.denied, "denied");
  }

  it->second = req;
  if (auto err = persist()) return R::unpersisted(std::move(req), *err);
  return R::success(std::move(req));
}

// ---------------------------------------------------------------------------
// execute
// ---------------------------------------------------------------------------

Result<CrossingRequest> CrossingProtocol::execute(const std::string& request_id,
                                                  const std::string& actor_id,
                                                  rbac::Role role) {
  using R = Result<CrossingRequest>;
  std::lock_guard<std::mutex> lk(mu_);

  if (auto d = precheck("execute")) return R::failure(d->error, d->message);
  auto it = requests_.find(request_id);
  if (it == requests_.end()) {
    return R::failure(ErrorCode::not_found, "request " + request_id + " not found");
  }
  if (it->second.status != CrossingStatus::authorized) {
    return R::failure(ErrorCode::illegal_transition,
                      "request " + request_id + " is " + to_string(it->second.status) +
                          (is_terminal(it->second.status) ? " (terminal)" : "") +
                          "; execute requires authorized");
  }
  if (auto d = check_role(role, rbac::Permission::crossing_execute, actor_id, request_id)) {
    return R::failure(d->error, d->message);
  }

  CrossingRequest req = it->second;
  append_event(req, "executing", actor_id, "crossing started", CrossingStatus::executing);

  ExecutionOutcome outcome;
  if (executor_) {
    try {
      outcome = executor_->perform(req);
    } catch (const std::exception& e) {
      outcome = ExecutionOutcome{};
      outcome.success = false;
      outcome.error_code = "EXECUTION_EXCEPTION";
      outcome.error_message = e.what();
    }
  } else {
    outcome.success = true;
    outcome.result_data["simulated"] = "true";
  }
  if (!outcome.success && outcome.error_code.empty()) outcome.error_code = "EXECUTION_FAILED";
  req.execution = outcome;

  const ImpactAssessment impact = assess_impact(req, outcome);
  req.impact = impact;
  append_event(req, "impact_assessed", "system", impact_summary(impact), req.status);

  if (outcome.success) {
    append_event(req, "completed", actor_id, "crossing completed", CrossingStatus::completed);
    emit_governance_event(crossing_event(GovernanceEventKind::crossing_completed, req));
  } else {
    append_event(req, "failed", actor_id, outcome.error_code + ": " + outcome.error_message,
                 CrossingStatus::failed);
    emit_governance_event(crossing_event(GovernanceEventKind::crossing_failed, req,
                                         outcome.error_code));
    decay(req, req.source_boundary_id, config_.decay.failed, "failed");
    decay(req, req.target_boundary_id, config_.decay.failed, "failed");
  }

  it->second = req;
  if (auto err = persist()) return R::unpersisted(std::move(req), *err);
  return R::success(std::move(req));
}

// ---------------------------------------------------------------------------
// attest
// ---------------------------------------------------------------------------

Result<AttestationRef> CrossingProtocol::attest(const std::string& request_id,
                                                const std::string& attester_id,
                                                const std::map<std::string, std::string>& claims,
                                                rbac::Role role) {
  using R = Result<AttestationRef>;
  std::lock_guard<std::mutex> lk(mu_);

  if (auto d = precheck("attest")) return R::failure(d->error, d->message);
  auto it = requests_.find(request_id);
  if (it == requests_.end()) {
    return R::failure(ErrorCode::not_found, "request " + request_id + " not found");
  }
  if (auto d = check_role(role, rbac::Permission::crossing_attest, attester_id, request_id)) {
    return R::failure(d->error, d->message);
  }
  if (!collab_.attestations) {
    return R::failure(ErrorCode::invalid_argument, "no attestation service configured");
  }

  auto att = collab_.attestations->issue(attester_id, request_id, claims);
  if (!att) {
    return R::failure(ErrorCode::validation_failed,
                      "attestation service refused to attest " + request_id);
  }
  AttestationRef ref;
  ref.attestation_id = att->attestation_id;
  ref.attester_id = att->attester_id;
  it->second.attestations.push_back(ref);

  jsonlite::Object payload;
  payload["attestation_id"] = jsonlite::Value{ref.attestation_id};
  payload["attester_id"] = jsonlite::Value{ref.attester_id};
  payload["status"] = jsonlite::Value{to_string(it->second.status)};
  ledger_.append(EvidenceKind::attestation, request_id,
                 jsonlite::to_json(jsonlite::Value{std::move(payload)}), next_timestamp());
  emit_governance_event(crossing_event(GovernanceEventKind::crossing_attested, it->second,
                                       ref.attestation_id));

  if (auto err = persist()) return R::unpersisted(std::move(ref), *err);
  return R::success(std::move(ref));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<CrossingRequest> CrossingProtocol::get(const std::string& request_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = requests_.find(request_id);
  if (it == requests_.end()) return std::nullopt;
  return it->second;
}

std::vector<CrossingRequest> CrossingProtocol::list(const std::optional<std::string>& boundary_id,
                                                    std::optional<CrossingStatus> status) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<CrossingRequest> out;
  for (const auto& [id, req] : requests_) {
    if (boundary_id && req.source_boundary_id != *boundary_id &&
        req.target_boundary_id != *boundary_id) {
      continue;
    }
    if (status && req.status != *status) continue;
    out.push_back(req);
  }
  return out;
}

Result<std::vector<AuditEvent>> CrossingProtocol::get_audit_trail(const std::string& request_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = requests_.find(request_id);
  if (it == requests_.end()) {
    return Result<std::vector<AuditEvent>>::failure(ErrorCode::not_found,
                                                    "request " + request_id + " not found");
  }
  return Result<std::vector<AuditEvent>>::success(it->second.audit_trail);
}

std::vector<TrustDecayEvent> CrossingProtocol::trust_decay_events() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<TrustDecayEvent> out;
  for (const auto& [id, req] : requests_) {
    out.insert(out.end(), req.trust_decay.begin(), req.trust_decay.end());
  }
  std::stable_sort(out.begin(), out.end(), [](const TrustDecayEvent& a, const TrustDecayEvent& b) {
    return a.timestamp_unix_ms < b.timestamp_unix_ms;
  });
  return out;
}

std::size_t CrossingProtocol::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return requests_.size();
}

}  // namespace warden
