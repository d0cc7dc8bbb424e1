#include "warden/integrity.hpp"

#include "warden/codec.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"

#include <algorithm>
#include <utility>

namespace warden {

namespace {

bool is_digits(const std::string& s, std::size_t b, std::size_t e) {
  if (b >= e) return false;
  for (std::size_t i = b; i < e; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

std::vector<std::string> steps(std::initializer_list<const char*> xs) {
  std::vector<std::string> out;
  for (const char* x : xs) out.emplace_back(x);
  return out;
}

Recommendation recommend(RecommendationKind kind, Severity priority, std::string description,
                         std::vector<std::string> implementation_steps) {
  Recommendation r;
  r.recommendation_id = random_id("recommendation");
  r.kind = kind;
  r.priority = priority;
  r.description = std::move(description);
  r.steps = std::move(implementation_steps);
  return r;
}

Violation violation(ViolationKind kind, Severity severity, uint64_t ts, std::string detail,
                    std::string evidence, std::string remediation) {
  Violation v;
  v.violation_id = random_id("violation");
  v.kind = kind;
  v.severity = severity;
  v.detected_at_unix_ms = ts;
  v.detail = std::move(detail);
  v.evidence = std::move(evidence);
  v.remediation = std::move(remediation);
  return v;
}

Recommendation recommendation_for(const Violation& v) {
  switch (v.kind) {
    case ViolationKind::control_bypass:
      return recommend(RecommendationKind::control_enhancement, Severity::high,
                       "Enhance bypassed control: " + v.detail,
                       steps({"Review control configuration", "Update control implementation",
                              "Verify effectiveness"}));
    case ViolationKind::seal_broken:
      return recommend(RecommendationKind::seal_renewal, Severity::critical,
                       "Renew broken seal: " + v.detail,
                       steps({"Investigate seal invalidation cause",
                              "Recreate seal with current state", "Verify new seal"}));
    case ViolationKind::unauthorized_mutation:
      return recommend(RecommendationKind::mutation_reversion, v.severity,
                       "Revert unauthorized mutation: " + v.detail,
                       steps({"Identify the unapproved change", "Restore the approved definition",
                              "Re-baseline and verify"}));
    case ViolationKind::invalid_attestation:
      return recommend(RecommendationKind::attestation_update, Severity::high,
                       "Update invalid attestation: " + v.detail,
                       steps({"Investigate attestation invalidation cause",
                              "Create new attestation", "Verify new attestation"}));
    case ViolationKind::compliance_failure:
      return recommend(RecommendationKind::compliance_improvement, Severity::medium,
                       "Address compliance issue: " + v.detail,
                       steps({"Review compliance requirement", "Implement necessary changes",
                              "Verify compliance"}));
  }
  return recommend(RecommendationKind::monitoring_enhancement, Severity::medium, v.detail, {});
}

Recommendation redefine_boundary() {
  return recommend(RecommendationKind::boundary_redefinition, Severity::critical,
                   "Redefine compromised boundary",
                   steps({"Investigate compromise cause",
                          "Recreate boundary with proper controls", "Verify integrity"}));
}

VerificationKind kind_for(ViolationKind k) {
  switch (k) {
    case ViolationKind::control_bypass:        return VerificationKind::control_verification;
    case ViolationKind::seal_broken:           return VerificationKind::seal_validation;
    case ViolationKind::unauthorized_mutation: return VerificationKind::mutation_detection;
    case ViolationKind::invalid_attestation:   return VerificationKind::attestation_verification;
    case ViolationKind::compliance_failure:    return VerificationKind::compliance_checking;
  }
  return VerificationKind::comprehensive;
}

bool runs(VerificationKind selected, VerificationKind category) {
  return selected == VerificationKind::comprehensive || selected == category;
}

std::string join(const std::vector<std::string>& xs, const char* sep) {
  std::string out;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    if (i) out += sep;
    out += xs[i];
  }
  return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// Aggregation and derivation
// ---------------------------------------------------------------------------

bool is_semver_triplet(const std::string& version) {
  const auto d1 = version.find('.');
  if (d1 == std::string::npos) return false;
  const auto d2 = version.find('.', d1 + 1);
  if (d2 == std::string::npos) return false;
  return is_digits(version, 0, d1) && is_digits(version, d1 + 1, d2) &&
         is_digits(version, d2 + 1, version.size());
}

void aggregate_integrity(VerificationRecord& r) {
  uint32_t total = 0, passed = 0, critical = 0;

  if (r.control_checks) {
    for (const auto& c : *r.control_checks) {
      ++total;
      switch (c.status) {
        case ControlStatus::effective:   ++passed; break;
        case ControlStatus::ineffective: ++critical; break;
        case ControlStatus::degraded:
        case ControlStatus::warning:     break;
      }
    }
  }
  if (r.seal_checks) {
    for (const auto& s : *r.seal_checks) {
      ++total;
      if (s.valid) ++passed;
      else ++critical;
    }
  }
  if (r.mutations) {
    ++total;
    if (r.mutations->empty()) {
      ++passed;
    } else if (std::any_of(r.mutations->begin(), r.mutations->end(), [](const Mutation& m) {
                 return m.severity == Severity::high || m.severity == Severity::critical;
               })) {
      ++critical;
    }
  }
  if (r.attestation_checks) {
    for (const auto& a : *r.attestation_checks) {
      ++total;
      if (a.valid) ++passed;
      else ++critical;
    }
  }
  if (r.compliance_checks) {
    for (const auto& c : *r.compliance_checks) {
      ++total;
      if (c.compliant) ++passed;
      else ++critical;
    }
  }

  r.total_checks = total;
  r.passed_checks = passed;
  r.critical_failures = critical;
  r.confidence = total > 0 ? static_cast<double>(passed) / static_cast<double>(total) : 0.0;

  if (critical > 0) r.status = IntegrityStatus::compromised;
  else if (r.confidence >= 0.9) r.status = IntegrityStatus::intact;
  else if (r.confidence >= 0.7) r.status = IntegrityStatus::warning;
  else r.status = IntegrityStatus::unknown;

  r.result_detail = std::to_string(passed) + "/" + std::to_string(total) +
                    " checks passed, " + std::to_string(critical) + " critical failures";
}

std::vector<Violation> derive_violations(const VerificationRecord& r) {
  std::vector<Violation> out;
  const uint64_t ts = r.timestamp_unix_ms;

  if (r.control_checks) {
    for (const auto& c : *r.control_checks) {
      if (c.status != ControlStatus::ineffective) continue;
      out.push_back(violation(ViolationKind::control_bypass, Severity::high, ts,
                              "Control " + c.control_id + " is ineffective: " + c.detail,
                              c.evidence, "Review and fix control " + c.control_id));
    }
  }
  if (r.seal_checks) {
    for (const auto& s : *r.seal_checks) {
      if (s.valid) continue;
      out.push_back(violation(ViolationKind::seal_broken, Severity::critical, ts,
                              "Seal " + s.seal_id + " is invalid: " + s.detail, s.evidence,
                              "Investigate and recreate seal " + s.seal_id));
    }
  }
  if (r.mutations) {
    for (const auto& m : *r.mutations) {
      out.push_back(violation(ViolationKind::unauthorized_mutation, m.severity,
                              m.detected_at_unix_ms ? m.detected_at_unix_ms : ts,
                              "Unauthorized mutation detected: " + m.detail, m.evidence,
                              "Investigate and revert unauthorized mutation"));
    }
  }
  if (r.attestation_checks) {
    for (const auto& a : *r.attestation_checks) {
      if (a.valid) continue;
      out.push_back(violation(ViolationKind::invalid_attestation, Severity::high, ts,
                              "Attestation " + a.attestation_id + " is invalid: " + a.detail,
                              a.evidence,
                              "Investigate and recreate attestation " + a.attestation_id));
    }
  }
  if (r.compliance_checks) {
    for (const auto& c : *r.compliance_checks) {
      if (c.compliant) continue;
      out.push_back(violation(ViolationKind::compliance_failure, Severity::medium, ts,
                              "Compliance failure: " + c.detail, c.evidence,
                              "Address compliance issue: " + c.requirement_id));
    }
  }
  return out;
}

std::vector<Recommendation> derive_recommendations(const VerificationRecord& r) {
  std::vector<Recommendation> out;

  if (r.control_checks) {
    for (const auto& c : *r.control_checks) {
      if (c.status == ControlStatus::ineffective) {
        out.push_back(recommend(RecommendationKind::control_enhancement, Severity::high,
                                "Enhance control " + c.control_id + ": " + c.detail,
                                steps({"Review control configuration",
                                       "Update control implementation",
                                       "Verify effectiveness"})));
      } else if (c.status == ControlStatus::degraded) {
        out.push_back(recommend(RecommendationKind::control_enhancement, Severity::medium,
                                "Improve degraded control " + c.control_id + ": " + c.detail,
                                steps({"Identify degradation cause",
                                       "Restore control effectiveness",
                                       "Verify improvement"})));
      }
    }
  }
  if (r.seal_checks) {
    for (const auto& s : *r.seal_checks) {
      if (s.valid) continue;
      out.push_back(recommend(RecommendationKind::seal_renewal, Severity::critical,
                              "Renew invalid seal " + s.seal_id + ": " + s.detail,
                              steps({"Investigate seal invalidation cause",
                                     "Recreate seal with current state",
                                     "Verify new seal"})));
    }
  }
  if (r.mutations) {
    for (const auto& m : *r.mutations) {
      out.push_back(recommend(RecommendationKind::mutation_reversion, m.severity,
                              "Revert mutation " + m.mutation_id + ": " + m.detail,
                              steps({"Identify the unapproved change",
                                     "Restore the approved definition",
                                     "Re-baseline and verify"})));
    }
  }
  if (r.attestation_checks) {
    for (const auto& a : *r.attestation_checks) {
      if (a.valid) continue;
      out.push_back(recommend(RecommendationKind::attestation_update, Severity::high,
                              "Update invalid attestation " + a.attestation_id + ": " + a.detail,
                              steps({"Investigate attestation invalidation cause",
                                     "Create new attestation",
                                     "Verify new attestation"})));
    }
  }
  if (r.compliance_checks) {
    for (const auto& c : *r.compliance_checks) {
      if (c.compliant) continue;
      out.push_back(recommend(RecommendationKind::compliance_improvement, Severity::medium,
                              "Address compliance issue " + c.requirement_id + ": " + c.detail,
                              steps({"Review compliance requirement",
                                     "Implement necessary changes",
                                     "Verify compliance"})));
    }
  }

  switch (r.status) {
    case IntegrityStatus::compromised:
      out.push_back(redefine_boundary());
      break;
    case IntegrityStatus::warning:
      out.push_back(recommend(RecommendationKind::monitoring_enhancement, Severity::high,
                              "Enhance boundary monitoring",
                              steps({"Increase monitoring frequency",
                                     "Add additional monitoring controls",
                                     "Verify monitoring effectiveness"})));
      break;
    case IntegrityStatus::intact:
    case IntegrityStatus::unknown:
      break;
  }
  return out;
}

// ---------------------------------------------------------------------------
// IntegrityVerifier
// ---------------------------------------------------------------------------

IntegrityVerifier::IntegrityVerifier(Collaborators collab, EvidenceLedger& ledger,
                                     IRecordStore& store, VerifierConfig config)
    : collab_(collab), ledger_(ledger), store_(store), config_(std::move(config)) {
  load();
}

void IntegrityVerifier::load() {
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
    std::map<std::string, VerificationRecord> loaded;
    for (const auto& [id, value] : *records.value) {
      const auto* obj = std::get_if<jsonlite::Object>(&value.v);
      if (!obj) {
        load_status_.error = ErrorCode::validation_failed;
        load_status_.message = "verification " + id + " is not an object";
        break;
      }
      auto rec = codec::decode_verification(*obj);
      if (!rec.ok()) {
        load_status_.error = rec.error;
        load_status_.message = rec.message;
        break;
      }
      loaded[id] = std::move(*rec.value);
    }
    if (load_status_.ok()) {
      records_ = std::move(loaded);
      load_status_.records = records_.size();
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

std::optional<IntegrityVerifier::Denial> IntegrityVerifier::precheck(
    const std::string& operation, rbac::Role role, rbac::Permission permission) {
  if (!collab_.registry || !collab_.seals || !collab_.attestations || !collab_.mutations ||
      !collab_.schemas) {
    return Denial{ErrorCode::invalid_argument, "integrity verifier lacks a collaborator"};
  }
  if (!load_status_.ok()) {
    return Denial{ErrorCode::store_unavailable,
                  operation + " refused: verification store did not load (" +
                      to_string(load_status_.error) + ": " + load_status_.message + ")"};
  }

  jsonlite::Object snap;
  snap["component"] = jsonlite::Value{kComponent};
  snap["operation"] = jsonlite::Value{operation};
  snap["timestamp"] = jsonlite::Value{static_cast<std::uint64_t>(now_unix_ms())};
  snap["record_count"] = jsonlite::Value{static_cast<std::uint64_t>(records_.size())};
  const std::string snapshot = jsonlite::to_json(jsonlite::Value{std::move(snap)});
  if (!collab_.seals->verify_contract_tether(kComponent, operation, snapshot)) {
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

  if (config_.enforce_rbac) {
    auto decision = rbac::check(config_.verifier_id, role, permission);
    if (!decision.ok) {
      GovernanceEvent ev;
      ev.kind = GovernanceEventKind::rbac_denied;
      ev.subject_id = operation;
      ev.ok = false;
      ev.error = ErrorCode::unauthorized;
      ev.detail = decision.to_json();
      emit_governance_event(std::move(ev));
      return Denial{ErrorCode::unauthorized, decision.denial_reason};
    }
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Check categories
// ---------------------------------------------------------------------------

std::vector<ControlResult> IntegrityVerifier::check_controls(const Boundary& b) const {
  std::vector<ControlResult> out;
  out.reserve(b.controls.size());
  for (const auto& c : b.controls) out.push_back(evaluator_.evaluate(c, b, nullptr));
  return out;
}

std::vector<SealCheck> IntegrityVerifier::check_seals(const Boundary& b) const {
  std::vector<SealCheck> out;
  if (b.signature) {
    SealCheck s;
    s.seal_id = "boundary-signature";
    s.valid = collab_.seals->verify(codec::boundary_content_for_seal(b), *b.signature);
    s.detail = "Boundary definition signature";
    s.evidence = "Cryptographic verification";
    out.push_back(std::move(s));
  }
  for (const auto& seal : b.seals) {
    SealCheck s;
    s.seal_id = seal.seal_id;
    s.valid = collab_.seals->verify(seal.data, seal.signature);
    s.detail = "Seal " + seal.seal_id;
    s.evidence = "Cryptographic verification";
    out.push_back(std::move(s));
  }
  return out;
}

std::vector<Mutation> IntegrityVerifier::check_mutations(const Boundary& b, uint64_t now) {
  const std::string state = jsonlite::to_json(codec::encode(b));
  std::vector<Mutation> out = collab_.mutations->detect(b.boundary_id, "boundary", state);
  for (auto& m : out) {
    if (m.mutation_id.empty()) m.mutation_id = random_id("mutation");
    if (m.mutation_type.empty()) m.mutation_type = "boundary_definition";
    if (m.detected_at_unix_ms == 0) m.detected_at_unix_ms = now;
  }
  return out;
}

std::vector<AttestationCheck> IntegrityVerifier::check_attestations(const Boundary& b) const {
  std::vector<AttestationCheck> out;
  for (const auto& ref : b.attestations) {
    AttestationCheck a;
    a.attestation_id = ref.attestation_id;
    auto att = collab_.attestations->get(ref.attestation_id);
    if (!att) {
      a.valid = false;
      a.detail = "Attestation not found";
      a.evidence = "Attestation service query";
    } else {
      a.valid = collab_.attestations->verify(ref.attestation_id);
      a.detail = "Attestation by " +
                 (att->attester_id.empty() ? std::string("unknown") : att->attester_id);
      a.evidence = "Attestation service verification";
    }
    out.push_back(std::move(a));
  }
  return out;
}

std::vector<ComplianceCheck> IntegrityVerifier::check_compliance(const Boundary& b) const {
  std::vector<ComplianceCheck> out;
  auto add = [&out](const char* id, bool ok, std::string detail, std::string evidence) {
    ComplianceCheck c;
    c.requirement_id = id;
    c.compliant = ok;
    c.detail = std::move(detail);
    c.evidence = std::move(evidence);
    out.push_back(std::move(c));
  };
  auto raw = [&b](const char* field, const auto& value) -> std::string {
    if (value) return to_string(*value);
    auto it = b.unrecognized.find(field);
    return it == b.unrecognized.end() ? std::string() : it->second;
  };

  const SchemaVerdict schema =
      collab_.schemas->validate(jsonlite::to_json(codec::encode(b)), config_.boundary_schema);
  add("schema-compliance", schema.valid, "Schema compliance check",
      schema.valid ? "Schema validation" : "Schema validation: " + join(schema.errors, "; "));

  const std::string kind = raw("boundary_type", b.kind);
  const std::string cls = raw("classification", b.classification);
  const std::string status = raw("status", b.status);

  std::vector<std::string> missing;
  const std::pair<const char*, bool> required[] = {
    { "boundary_id",    !b.boundary_id.empty() },
    { "name",           !b.name.empty() },
    { "description",    !b.description.empty() },
    { "boundary_type",  !kind.empty() },
    { "classification", !cls.empty() },
    { "created_at",     !b.created_at.empty() },
    { "updated_at",     !b.updated_at.empty() },
    { "version",        !b.version.empty() },
    { "status",         !status.empty() },
  };
  for (const auto& [field, present] : required) {
    if (!present) missing.emplace_back(field);
  }
  add("required-fields", missing.empty(), "Required fields check",
      "Missing fields: " + (missing.empty() ? std::string("None") : join(missing, ", ")));

  add("valid-boundary-type", b.kind.has_value(), "Boundary type check", "Boundary type: " + kind);
  add("valid-classification", b.classification.has_value(), "Classification check",
      "Classification: " + cls);
  add("valid-version-format", is_semver_triplet(b.version), "Version format check",
      "Version: " + b.version);
  add("valid-status", b.status.has_value(), "Status check", "Status: " + status);
  return out;
}

// ---------------------------------------------------------------------------
// verify / report_violation
// ---------------------------------------------------------------------------

Result<VerificationRecord> IntegrityVerifier::verify(const std::string& boundary_id,
                                                     VerificationKind kind,
                                                     TriggerSource trigger,
                                                     rbac::Role role) {
  using R = Result<VerificationRecord>;
  std::lock_guard<std::mutex> lk(mu_);

  if (auto d = precheck("verify", role, rbac::Permission::verification_run)) {
    return R::failure(d->error, d->message);
  }
  auto boundary = collab_.registry->get(boundary_id);
  if (!boundary) return R::failure(ErrorCode::not_found, "boundary " + boundary_id + " not found");

  VerificationRecord r;
  r.verification_id = random_id("verification");
  r.boundary_id = boundary_id;
  r.timestamp_unix_ms = now_unix_ms();
  r.kind = kind;
  r.verifier_id = config_.verifier_id;
  r.triggered_by = trigger;

  if (runs(kind, VerificationKind::control_verification)) r.control_checks = check_controls(*boundary);
  if (runs(kind, VerificationKind::seal_validation)) r.seal_checks = check_seals(*boundary);
  if (runs(kind, VerificationKind::mutation_detection)) {
    r.mutations = check_mutations(*boundary, r.timestamp_unix_ms);
  }
  if (runs(kind, VerificationKind::attestation_verification)) {
    r.attestation_checks = check_attestations(*boundary);
  }
  if (runs(kind, VerificationKind::compliance_checking)) {
    r.compliance_checks = check_compliance(*boundary);
  }

  aggregate_integrity(r);
  r.violations = derive_violations(r);
  r.recommendations = derive_recommendations(r);
  return commit(std::move(r));
}

Result<VerificationRecord> IntegrityVerifier::report_violation(const std::string& boundary_id,
                                                               ViolationKind kind,
                                                               const std::string& detail,
                                                               Severity severity,
                                                               const std::string& evidence,
                                                               rbac::Role role) {
  using R = Result<VerificationRecord>;
  std::lock_guard<std::mutex> lk(mu_);

  if (auto d = precheck("report_violation", role, rbac::Permission::violation_report)) {
    return R::failure(d->error, d->message);
  }
  if (!collab_.registry->get(boundary_id)) {
    return R::failure(ErrorCode::not_found, "boundary " + boundary_id + " not found");
  }

  VerificationRecord r;
  r.verification_id = random_id("verification");
  r.boundary_id = boundary_id;
  r.timestamp_unix_ms = now_unix_ms();
  r.kind = kind_for(kind);
  r.verifier_id = config_.verifier_id;
  r.triggered_by = TriggerSource::reported;
  r.status = IntegrityStatus::compromised;
  r.confidence = 1.0;
  r.total_checks = 1;
  r.passed_checks = 0;
  r.critical_failures = 1;
  r.result_detail = "reported incident";

  r.violations.push_back(violation(kind, severity, r.timestamp_unix_ms, detail,
                                   evidence.empty() ? "manual report" : evidence,
                                   "Investigate reported incident"));
  r.recommendations.push_back(recommendation_for(r.violations.front()));
  r.recommendations.push_back(redefine_boundary());
  return commit(std::move(r));
}

Result<VerificationRecord> IntegrityVerifier::commit(VerificationRecord r) {
  using R = Result<VerificationRecord>;
  r.next_scheduled_verification_unix_ms =
      r.timestamp_unix_ms + config_.reverification_interval_ms;

  r.signature = collab_.seals->create(codec::verification_content_for_seal(r));
  if (r.signature.empty()) {
    return R::failure(ErrorCode::validation_failed,
                      "seal service refused to sign verification " + r.verification_id);
  }
  const SchemaVerdict schema =
      collab_.schemas->validate(jsonlite::to_json(codec::encode(r)), config_.record_schema);
  if (!schema.valid) {
    return R::failure(ErrorCode::validation_failed,
                      "verification record failed " + config_.record_schema + ": " +
                          join(schema.errors, "; "));
  }

  records_[r.verification_id] = r;

  jsonlite::Object payload;
  payload["verification_id"] = jsonlite::Value{r.verification_id};
  payload["status"] = jsonlite::Value{to_string(r.status)};
  payload["confidence"] = jsonlite::Value{r.confidence};
  payload["triggered_by"] = jsonlite::Value{to_string(r.triggered_by)};
  payload["signature"] = jsonlite::Value{r.signature};
  ledger_.append(EvidenceKind::verification_record, r.boundary_id,
                 jsonlite::to_json(jsonlite::Value{std::move(payload)}), r.timestamp_unix_ms);

  for (const auto& v : r.violations) {
    ledger_.append(EvidenceKind::violation, r.boundary_id,
                   jsonlite::to_json(codec::encode(v)), r.timestamp_unix_ms);
    GovernanceEvent ev;
    ev.kind = GovernanceEventKind::violation_recorded;
    ev.subject_id = v.violation_id;
    ev.boundary_id = r.boundary_id;
    ev.ok = false;
    ev.detail = to_string(v.kind) + "/" + to_string(v.severity);
    emit_governance_event(std::move(ev));
  }

  GovernanceEvent ev;
  ev.kind = GovernanceEventKind::verification_run;
  ev.subject_id = r.verification_id;
  ev.boundary_id = r.boundary_id;
  ev.ok = r.status != IntegrityStatus::compromised;
  ev.detail = to_string(r.status) + " " + r.result_detail;
  emit_governance_event(std::move(ev));

  if (auto err = persist()) return R::unpersisted(std::move(r), *err);
  return R::success(std::move(r));
}

std::optional<std::string> IntegrityVerifier::persist() {
  jsonlite::Object records;
  for (const auto& [id, rec] : records_) records[id] = codec::encode(rec);

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
// Queries
// ---------------------------------------------------------------------------

std::optional<VerificationRecord> IntegrityVerifier::get_verification(
    const std::string& verification_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = records_.find(verification_id);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

std::vector<VerificationRecord> IntegrityVerifier::list_verifications(
    const std::optional<std::string>& boundary_id, std::optional<IntegrityStatus> status) const {
  std::vector<VerificationRecord> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, r] : records_) {
      if (boundary_id && r.boundary_id != *boundary_id) continue;
      if (status && r.status != *status) continue;
      out.push_back(r);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const VerificationRecord& a,
                                              const VerificationRecord& b) {
    return a.timestamp_unix_ms < b.timestamp_unix_ms;
  });
  return out;
}

std::vector<Violation> IntegrityVerifier::boundary_violations(const std::string& boundary_id) const {
  std::vector<Violation> out;
  for (const auto& r : list_verifications(boundary_id)) {
    out.insert(out.end(), r.violations.begin(), r.violations.end());
  }
  return out;
}

std::vector<Recommendation> IntegrityVerifier::boundary_recommendations(
    const std::string& boundary_id) const {
  std::vector<Recommendation> out;
  for (const auto& r : list_verifications(boundary_id)) {
    out.insert(out.end(), r.recommendations.begin(), r.recommendations.end());
  }
  return out;
}

std::size_t IntegrityVerifier::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return records_.size();
}

bool IntegrityVerifier::verify_record_signature(const VerificationRecord& record) const {
  if (!collab_.seals) return false;
  return collab_.seals->verify(codec::verification_content_for_seal(record), record.signature);
}

}  // namespace warden
