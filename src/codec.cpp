#include "warden/codec.hpp"

#include <utility>

namespace warden::codec {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

Value str_map(const std::map<std::string, std::string>& m) {
  Object o;
  for (const auto& [k, v] : m) o[k] = Value{v};
  return Value{std::move(o)};
}

Value str_array(const std::vector<std::string>& xs) {
  Array a;
  a.reserve(xs.size());
  for (const auto& x : xs) a.emplace_back(x);
  return Value{std::move(a)};
}

Value u64(uint64_t v) { return Value{static_cast<std::uint64_t>(v)}; }

// Omit empty strings so the encoding reflects only what the owner supplied.
void put_if(Object& o, const char* key, const std::string& v) {
  if (!v.empty()) o[key] = Value{v};
}

template <typename T, typename F>
Value encode_list(const std::vector<T>& xs, F&& fn) {
  Array a;
  a.reserve(xs.size());
  for (const auto& x : xs) a.push_back(fn(x));
  return Value{std::move(a)};
}

const Array kEmptyArray{};

const Array& array_or_empty(const Object& o, const std::string& key) {
  const Array* a = jsonlite::get_array(o, key);
  return a ? *a : kEmptyArray;
}

// Iterate the objects of an array member, skipping non-object items.
template <typename F>
void for_each_object(const Object& o, const std::string& key, F&& fn) {
  for (const auto& item : array_or_empty(o, key)) {
    if (const auto* obj = std::get_if<Object>(&item.v)) fn(*obj);
  }
}

// Decode an enum field; unknown text is reported through *bad.
template <typename E, typename Parse>
E enum_or(const Object& o, const std::string& key, E def, Parse&& parse,
          std::string* bad) {
  const std::string s = jsonlite::get_string(o, key);
  if (s.empty()) return def;
  auto v = parse(s);
  if (!v) {
    if (bad && bad->empty()) *bad = key + "=" + s;
    return def;
  }
  return *v;
}

}  // namespace

// ---------------------------------------------------------------------------
// Boundary
// ---------------------------------------------------------------------------

Value encode(const Control& c) {
  Object o;
  o["control_id"] = Value{c.control_id};
  o["control_type"] = Value{to_string(c.kind)};
  put_if(o, "name", c.name);
  if (!c.parameters.empty()) o["parameters"] = str_map(c.parameters);
  return Value{std::move(o)};
}

namespace {

Object boundary_object(const Boundary& b, bool with_signature) {
  Object o;
  o["boundary_id"] = Value{b.boundary_id};
  put_if(o, "name", b.name);
  put_if(o, "description", b.description);
  put_if(o, "version", b.version);
  put_if(o, "created_at", b.created_at);
  put_if(o, "updated_at", b.updated_at);
  if (b.kind) o["boundary_type"] = Value{to_string(*b.kind)};
  if (b.classification) o["classification"] = Value{to_string(*b.classification)};
  if (b.status) o["status"] = Value{to_string(*b.status)};
  // Unrecognized enum text is written back verbatim so the sealed content
  // the owner signed is reproduced exactly.
  for (const auto& [field, raw] : b.unrecognized) o[field] = Value{raw};

  if (!b.controls.empty()) {
    o["controls"] = encode_list(b.controls, [](const Control& c) { return encode(c); });
  }
  if (!b.seals.empty()) {
    o["seals"] = encode_list(b.seals, [](const Seal& s) {
      Object so;
      so["seal_id"] = Value{s.seal_id};
      so["data"] = Value{s.data};
      so["signature"] = Value{s.signature};
      return Value{std::move(so)};
    });
  }
  if (!b.attestations.empty()) {
    o["attestations"] = encode_list(b.attestations, [](const AttestationRef& a) {
      Object ao;
      ao["attestation_id"] = Value{a.attestation_id};
      put_if(ao, "attester_id", a.attester_id);
      return Value{std::move(ao)};
    });
  }
  if (with_signature && b.signature) o["signature"] = Value{*b.signature};
  return o;
}

}  // namespace

Value encode(const Boundary& b) { return Value{boundary_object(b, true)}; }

std::string boundary_content_for_seal(const Boundary& b) {
  return jsonlite::to_json(Value{boundary_object(b, false)});
}

Result<Boundary> decode_boundary(const Object& o) {
  Boundary b;
  b.boundary_id = jsonlite::get_string(o, "boundary_id");
  if (b.boundary_id.empty()) {
    return Result<Boundary>::failure(ErrorCode::validation_failed,
                                     "boundary definition lacks boundary_id");
  }
  b.name = jsonlite::get_string(o, "name");
  b.description = jsonlite::get_string(o, "description");
  b.version = jsonlite::get_string(o, "version");
  b.created_at = jsonlite::get_string(o, "created_at");
  b.updated_at = jsonlite::get_string(o, "updated_at");

  auto take_enum = [&](const char* key, auto parse, auto& out) {
    const std::string s = jsonlite::get_string(o, key);
    if (s.empty()) return;
    if (auto v = parse(s)) out = *v;
    else b.unrecognized[key] = s;
  };
  take_enum("boundary_type", boundary_kind_from_string, b.kind);
  take_enum("classification", classification_from_string, b.classification);
  take_enum("status", boundary_status_from_string, b.status);

  std::string bad;
  for_each_object(o, "controls", [&](const Object& co) {
    Control c;
    c.control_id = jsonlite::get_string(co, "control_id");
    c.kind = enum_or(co, "control_type", ControlKind::authentication,
                     control_kind_from_string, &bad);
    if (!jsonlite::has_key(co, "control_type") && bad.empty()) {
      bad = "control " + c.control_id + " lacks control_type";
    }
    c.name = jsonlite::get_string(co, "name");
    c.parameters = jsonlite::get_string_map(co, "parameters");
    b.controls.push_back(std::move(c));
  });
  if (!bad.empty()) {
    return Result<Boundary>::failure(ErrorCode::validation_failed,
                                     "invalid control in boundary " +
                                         b.boundary_id + ": " + bad);
  }

  for_each_object(o, "seals", [&](const Object& so) {
    Seal s;
    s.seal_id = jsonlite::get_string(so, "seal_id", "unknown");
    s.data = jsonlite::get_string(so, "data");
    s.signature = jsonlite::get_string(so, "signature");
    b.seals.push_back(std::move(s));
  });
  for_each_object(o, "attestations", [&](const Object& ao) {
    AttestationRef a;
    a.attestation_id = jsonlite::get_string(ao, "attestation_id");
    a.attester_id = jsonlite::get_string(ao, "attester_id");
    if (!a.attestation_id.empty()) b.attestations.push_back(std::move(a));
  });
  if (jsonlite::has_key(o, "signature")) {
    b.signature = jsonlite::get_string(o, "signature");
  }
  return Result<Boundary>::success(std::move(b));
}

Result<Boundary> boundary_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) {
    return Result<Boundary>::failure(ErrorCode::json_parse_error, err->message);
  }
  return decode_boundary(obj);
}

// ---------------------------------------------------------------------------
// Crossing request
// ---------------------------------------------------------------------------

Value encode(const AuditEvent& e) {
  Object o;
  o["event_id"] = Value{e.event_id};
  o["timestamp"] = u64(e.timestamp_unix_ms);
  o["event_type"] = Value{e.event_type};
  o["actor_id"] = Value{e.actor_id};
  o["details"] = Value{e.details};
  return Value{std::move(o)};
}

Value encode(const ControlResult& r) {
  Object o;
  o["control_id"] = Value{r.control_id};
  o["control_type"] = Value{to_string(r.kind)};
  o["status"] = Value{to_string(r.status)};
  o["details"] = Value{r.detail};
  o["evidence"] = Value{r.evidence};
  return Value{std::move(o)};
}

Value encode(const ImpactAssessment& i) {
  Object o;
  o["trust_impact"] = Value{i.trust_impact};
  o["security_impact"] = Value{to_string(i.security_impact)};
  o["governance_impact"] = Value{to_string(i.governance_impact)};
  o["performance_impact"] = Value{to_string(i.performance_impact)};
  return Value{std::move(o)};
}

Value encode(const CrossingRequest& r) {
  Object o;
  o["request_id"] = Value{r.request_id};
  o["source_boundary_id"] = Value{r.source_boundary_id};
  o["target_boundary_id"] = Value{r.target_boundary_id};
  o["request_type"] = Value{to_string(r.kind)};
  o["direction"] = Value{to_string(r.direction)};
  o["requester_id"] = Value{r.requester_id};
  o["created_at"] = u64(r.created_at_unix_ms);
  o["status"] = Value{to_string(r.status)};

  Object payload;
  payload["data"] = Value{r.payload.data};
  put_if(payload, "content_hash", r.payload.content_hash);
  if (r.payload.classification) {
    payload["classification"] = Value{to_string(*r.payload.classification)};
  }
  if (!r.payload.attributes.empty()) payload["attributes"] = str_map(r.payload.attributes);
  o["payload"] = Value{std::move(payload)};

  o["audit_trail"] = encode_list(r.audit_trail, [](const AuditEvent& e) { return encode(e); });
  o["control_results"] = encode_list(r.control_results, [](const ControlResult& c) { return encode(c); });
  o["applied_controls"] = str_array(r.applied_controls);
  put_if(o, "validation_failure_reason", r.validation_failure_reason);

  if (r.authorization) {
    Object a;
    a["decision"] = Value{to_string(r.authorization->decision)};
    a["authorizer_id"] = Value{r.authorization->authorizer_id};
    a["timestamp"] = u64(r.authorization->timestamp_unix_ms);
    a["reason"] = Value{r.authorization->reason};
    o["authorization"] = Value{std::move(a)};
  }
  if (r.execution) {
    Object x;
    x["success"] = Value{r.execution->success};
    x["result_data"] = str_map(r.execution->result_data);
    put_if(x, "error_code", r.execution->error_code);
    put_if(x, "error_message", r.execution->error_message);
    o["execution"] = Value{std::move(x)};
  }
  if (r.impact) o["impact"] = encode(*r.impact);
  if (!r.attestations.empty()) {
    o["attestations"] = encode_list(r.attestations, [](const AttestationRef& a) {
      Object ao;
      ao["attestation_id"] = Value{a.attestation_id};
      put_if(ao, "attester_id", a.attester_id);
      return Value{std::move(ao)};
    });
  }
  if (!r.trust_decay.empty()) {
    o["trust_decay"] = encode_list(r.trust_decay, [](const TrustDecayEvent& d) {
      Object dobj;
      dobj["actor_id"] = Value{d.actor_id};
      dobj["magnitude"] = Value{d.magnitude};
      dobj["reason"] = Value{d.reason};
      dobj["timestamp"] = u64(d.timestamp_unix_ms);
      return Value{std::move(dobj)};
    });
  }
  return Value{std::move(o)};
}

Result<CrossingRequest> decode_crossing(const Object& o) {
  CrossingRequest r;
  std::string bad;
  r.request_id = jsonlite::get_string(o, "request_id");
  if (r.request_id.empty()) {
    return Result<CrossingRequest>::failure(ErrorCode::validation_failed,
                                            "crossing record lacks request_id");
  }
  r.source_boundary_id = jsonlite::get_string(o, "source_boundary_id");
  r.target_boundary_id = jsonlite::get_string(o, "target_boundary_id");
  r.kind = enum_or(o, "request_type", CrossingKind::data_transfer,
                   crossing_kind_from_string, &bad);
  r.direction = enum_or(o, "direction", CrossingDirection::outbound,
                        crossing_direction_from_string, &bad);
  r.requester_id = jsonlite::get_string(o, "requester_id");
  r.created_at_unix_ms = jsonlite::get_u64(o, "created_at");
  r.status = enum_or(o, "status", CrossingStatus::requested,
                     crossing_status_from_string, &bad);

  if (const Object* p = jsonlite::get_object(o, "payload")) {
    r.payload.data = jsonlite::get_string(*p, "data");
    r.payload.content_hash = jsonlite::get_string(*p, "content_hash");
    const std::string cls = jsonlite::get_string(*p, "classification");
    if (!cls.empty()) {
      r.payload.classification = classification_from_string(cls);
      if (!r.payload.classification && bad.empty()) bad = "classification=" + cls;
    }
    r.payload.attributes = jsonlite::get_string_map(*p, "attributes");
  }

  for_each_object(o, "audit_trail", [&](const Object& eo) {
    AuditEvent e;
    e.event_id = jsonlite::get_string(eo, "event_id");
    e.timestamp_unix_ms = jsonlite::get_u64(eo, "timestamp");
    e.event_type = jsonlite::get_string(eo, "event_type");
    e.actor_id = jsonlite::get_string(eo, "actor_id");
    e.details = jsonlite::get_string(eo, "details");
    r.audit_trail.push_back(std::move(e));
  });
  for_each_object(o, "control_results", [&](const Object& co) {
    ControlResult c;
    c.control_id = jsonlite::get_string(co, "control_id");
    c.kind = enum_or(co, "control_type", ControlKind::authentication,
                     control_kind_from_string, &bad);
    c.status = enum_or(co, "status", ControlStatus::effective,
                       control_status_from_string, &bad);
    c.detail = jsonlite::get_string(co, "details");
    c.evidence = jsonlite::get_string(co, "evidence");
    r.control_results.push_back(std::move(c));
  });
  r.applied_controls = jsonlite::get_string_array(o, "applied_controls");
  r.validation_failure_reason = jsonlite::get_string(o, "validation_failure_reason");

  if (const Object* a = jsonlite::get_object(o, "authorization")) {
    AuthorizationRecord ar;
    ar.decision = enum_or(*a, "decision", AuthorizationDecision::deny,
                          authorization_decision_from_string, &bad);
    ar.authorizer_id = jsonlite::get_string(*a, "authorizer_id");
    ar.timestamp_unix_ms = jsonlite::get_u64(*a, "timestamp");
    ar.reason = jsonlite::get_string(*a, "reason");
    r.authorization = std::move(ar);
  }
  if (const Object* x = jsonlite::get_object(o, "execution")) {
    ExecutionOutcome ex;
    ex.success = jsonlite::get_bool(*x, "success");
    ex.result_data = jsonlite::get_string_map(*x, "result_data");
    ex.error_code = jsonlite::get_string(*x, "error_code");
    ex.error_message = jsonlite::get_string(*x, "error_message");
    r.execution = std::move(ex);
  }
  if (const Object* im = jsonlite::get_object(o, "impact")) {
    ImpactAssessment ia;
    ia.trust_impact = jsonlite::get_double(*im, "trust_impact");
    ia.security_impact = enum_or(*im, "security_impact", ImpactLevel::none,
                                 impact_level_from_string, &bad);
    ia.governance_impact = enum_or(*im, "governance_impact", ImpactLevel::none,
                                   impact_level_from_string, &bad);
    ia.performance_impact = enum_or(*im, "performance_impact", ImpactLevel::none,
                                    impact_level_from_string, &bad);
    r.impact = ia;
  }
  for_each_object(o, "attestations", [&](const Object& ao) {
    AttestationRef a;
    a.attestation_id = jsonlite::get_string(ao, "attestation_id");
    a.attester_id = jsonlite::get_string(ao, "attester_id");
    r.attestations.push_back(std::move(a));
  });
  // request_id is implied by the owning record.
  for_each_object(o, "trust_decay", [&](const Object& dobj) {
    TrustDecayEvent d;
    d.actor_id = jsonlite::get_string(dobj, "actor_id");
    d.magnitude = jsonlite::get_double(dobj, "magnitude");
    d.reason = jsonlite::get_string(dobj, "reason");
    d.request_id = r.request_id;
    d.timestamp_unix_ms = jsonlite::get_u64(dobj, "timestamp");
    r.trust_decay.push_back(std::move(d));
  });

  if (!bad.empty()) {
    return Result<CrossingRequest>::failure(
        ErrorCode::validation_failed,
        "crossing " + r.request_id + " has unrecognized value: " + bad);
  }
  return Result<CrossingRequest>::success(std::move(r));
}

// ---------------------------------------------------------------------------
// Verification record
// ---------------------------------------------------------------------------

Value encode(const Violation& v) {
  Object o;
  o["violation_id"] = Value{v.violation_id};
  o["violation_type"] = Value{to_string(v.kind)};
  o["severity"] = Value{to_string(v.severity)};
  o["details"] = Value{v.detail};
  o["evidence"] = Value{v.evidence};
  o["remediation_steps"] = Value{v.remediation};
  o["detection_timestamp"] = u64(v.detected_at_unix_ms);
  return Value{std::move(o)};
}

Value encode(const Recommendation& r) {
  Object o;
  o["recommendation_id"] = Value{r.recommendation_id};
  o["recommendation_type"] = Value{to_string(r.kind)};
  o["priority"] = Value{to_string(r.priority)};
  o["description"] = Value{r.description};
  o["implementation_steps"] = str_array(r.steps);
  return Value{std::move(o)};
}

namespace {

Object verification_object(const VerificationRecord& r, bool with_signature) {
  Object o;
  o["verification_id"] = Value{r.verification_id};
  o["boundary_id"] = Value{r.boundary_id};
  o["timestamp"] = u64(r.timestamp_unix_ms);
  o["verification_type"] = Value{to_string(r.kind)};
  o["verifier_id"] = Value{r.verifier_id};

  if (r.control_checks) {
    o["control_verifications"] = encode_list(*r.control_checks,
        [](const ControlResult& c) { return encode(c); });
  }
  if (r.seal_checks) {
    o["seal_validations"] = encode_list(*r.seal_checks, [](const SealCheck& s) {
      Object so;
      so["seal_id"] = Value{s.seal_id};
      so["is_valid"] = Value{s.valid};
      so["details"] = Value{s.detail};
      so["evidence"] = Value{s.evidence};
      return Value{std::move(so)};
    });
  }
  if (r.mutations) {
    o["mutation_detections"] = encode_list(*r.mutations, [](const Mutation& m) {
      Object mo;
      mo["mutation_id"] = Value{m.mutation_id};
      mo["mutation_type"] = Value{m.mutation_type};
      mo["detection_timestamp"] = u64(m.detected_at_unix_ms);
      mo["severity"] = Value{to_string(m.severity)};
      mo["details"] = Value{m.detail};
      mo["evidence"] = Value{m.evidence};
      return Value{std::move(mo)};
    });
  }
  if (r.attestation_checks) {
    o["attestation_verifications"] = encode_list(*r.attestation_checks,
        [](const AttestationCheck& a) {
          Object ao;
          ao["attestation_id"] = Value{a.attestation_id};
          ao["is_valid"] = Value{a.valid};
          ao["details"] = Value{a.detail};
          ao["evidence"] = Value{a.evidence};
          return Value{std::move(ao)};
        });
  }
  if (r.compliance_checks) {
    o["compliance_checks"] = encode_list(*r.compliance_checks,
        [](const ComplianceCheck& c) {
          Object co;
          co["requirement_id"] = Value{c.requirement_id};
          co["is_compliant"] = Value{c.compliant};
          co["details"] = Value{c.detail};
          co["evidence"] = Value{c.evidence};
          return Value{std::move(co)};
        });
  }

  Object result;
  result["integrity_status"] = Value{to_string(r.status)};
  result["confidence"] = Value{r.confidence};
  result["total_checks"] = u64(r.total_checks);
  result["passed_checks"] = u64(r.passed_checks);
  result["critical_failures"] = u64(r.critical_failures);
  put_if(result, "details", r.result_detail);
  o["result"] = Value{std::move(result)};

  o["violations"] = encode_list(r.violations, [](const Violation& v) { return encode(v); });
  o["recommendations"] = encode_list(r.recommendations,
      [](const Recommendation& rec) { return encode(rec); });

  Object meta;
  meta["triggered_by"] = Value{to_string(r.triggered_by)};
  meta["next_scheduled_verification"] = u64(r.next_scheduled_verification_unix_ms);
  o["verification_metadata"] = Value{std::move(meta)};

  if (with_signature) o["signature"] = Value{r.signature};
  return o;
}

}  // namespace

Value encode(const VerificationRecord& r) {
  return Value{verification_object(r, true)};
}

std::string verification_content_for_seal(const VerificationRecord& r) {
  return jsonlite::to_json(Value{verification_object(r, false)});
}

Result<VerificationRecord> decode_verification(const Object& o) {
  VerificationRecord r;
  std::string bad;
  r.verification_id = jsonlite::get_string(o, "verification_id");
  if (r.verification_id.empty()) {
    return Result<VerificationRecord>::failure(
        ErrorCode::validation_failed, "verification record lacks verification_id");
  }
  r.boundary_id = jsonlite::get_string(o, "boundary_id");
  r.timestamp_unix_ms = jsonlite::get_u64(o, "timestamp");
  r.kind = enum_or(o, "verification_type", VerificationKind::comprehensive,
                   verification_kind_from_string, &bad);
  r.verifier_id = jsonlite::get_string(o, "verifier_id");

  if (jsonlite::get_array(o, "control_verifications")) {
    r.control_checks.emplace();
    for_each_object(o, "control_verifications", [&](const Object& co) {
      ControlResult c;
      c.control_id = jsonlite::get_string(co, "control_id");
      c.kind = enum_or(co, "control_type", ControlKind::authentication,
                       control_kind_from_string, &bad);
      c.status = enum_or(co, "status", ControlStatus::effective,
                         control_status_from_string, &bad);
      c.detail = jsonlite::get_string(co, "details");
      c.evidence = jsonlite::get_string(co, "evidence");
      r.control_checks->push_back(std::move(c));
    });
  }
  if (jsonlite::get_array(o, "seal_validations")) {
    r.seal_checks.emplace();
    for_each_object(o, "seal_validations", [&](const Object& so) {
      SealCheck s;
      s.seal_id = jsonlite::get_string(so, "seal_id");
      s.valid = jsonlite::get_bool(so, "is_valid");
      s.detail = jsonlite::get_string(so, "details");
      s.evidence = jsonlite::get_string(so, "evidence");
      r.seal_checks->push_back(std::move(s));
    });
  }
  if (jsonlite::get_array(o, "mutation_detections")) {
    r.mutations.emplace();
    for_each_object(o, "mutation_detections", [&](const Object& mo) {
      Mutation m;
      m.mutation_id = jsonlite::get_string(mo, "mutation_id");
      m.mutation_type = jsonlite::get_string(mo, "mutation_type");
      m.detected_at_unix_ms = jsonlite::get_u64(mo, "detection_timestamp");
      m.severity = enum_or(mo, "severity", Severity::medium,
                           severity_from_string, &bad);
      m.detail = jsonlite::get_string(mo, "details");
      m.evidence = jsonlite::get_string(mo, "evidence");
      r.mutations->push_back(std::move(m));
    });
  }
  if (jsonlite::get_array(o, "attestation_verifications")) {
    r.attestation_checks.emplace();
    for_each_object(o, "attestation_verifications", [&](const Object& ao) {
      AttestationCheck a;
      a.attestation_id = jsonlite::get_string(ao, "attestation_id");
      a.valid = jsonlite::get_bool(ao, "is_valid");
      a.detail = jsonlite::get_string(ao, "details");
      a.evidence = jsonlite::get_string(ao, "evidence");
      r.attestation_checks->push_back(std::move(a));
    });
  }
  if (jsonlite::get_array(o, "compliance_checks")) {
    r.compliance_checks.emplace();
    for_each_object(o, "compliance_checks", [&](const Object& co) {
      ComplianceCheck c;
      c.requirement_id = jsonlite::get_string(co, "requirement_id");
      c.compliant = jsonlite::get_bool(co, "is_compliant");
      c.detail = jsonlite::get_string(co, "details");
      c.evidence = jsonlite::get_string(co, "evidence");
      r.compliance_checks->push_back(std::move(c));
    });
  }

  if (const Object* res = jsonlite::get_object(o, "result")) {
    r.status = enum_or(*res, "integrity_status", IntegrityStatus::unknown,
                       integrity_status_from_string, &bad);
    r.confidence = jsonlite::get_double(*res, "confidence");
    r.total_checks = static_cast<uint32_t>(jsonlite::get_u64(*res, "total_checks"));
    r.passed_checks = static_cast<uint32_t>(jsonlite::get_u64(*res, "passed_checks"));
    r.critical_failures = static_cast<uint32_t>(jsonlite::get_u64(*res, "critical_failures"));
    r.result_detail = jsonlite::get_string(*res, "details");
  }

  for_each_object(o, "violations", [&](const Object& vo) {
    Violation v;
    v.violation_id = jsonlite::get_string(vo, "violation_id");
    v.kind = enum_or(vo, "violation_type", ViolationKind::compliance_failure,
                     violation_kind_from_string, &bad);
    v.severity = enum_or(vo, "severity", Severity::medium, severity_from_string, &bad);
    v.detail = jsonlite::get_string(vo, "details");
    v.evidence = jsonlite::get_string(vo, "evidence");
    v.remediation = jsonlite::get_string(vo, "remediation_steps");
    v.detected_at_unix_ms = jsonlite::get_u64(vo, "detection_timestamp");
    r.violations.push_back(std::move(v));
  });
  for_each_object(o, "recommendations", [&](const Object& ro) {
    Recommendation rec;
    rec.recommendation_id = jsonlite::get_string(ro, "recommendation_id");
    rec.kind = enum_or(ro, "recommendation_type",
                       RecommendationKind::monitoring_enhancement,
                       recommendation_kind_from_string, &bad);
    rec.priority = enum_or(ro, "priority", Severity::medium, severity_from_string, &bad);
    rec.description = jsonlite::get_string(ro, "description");
    rec.steps = jsonlite::get_string_array(ro, "implementation_steps");
    r.recommendations.push_back(std::move(rec));
  });

  if (const Object* meta = jsonlite::get_object(o, "verification_metadata")) {
    r.triggered_by = enum_or(*meta, "triggered_by", TriggerSource::manual,
                             trigger_source_from_string, &bad);
    r.next_scheduled_verification_unix_ms =
        jsonlite::get_u64(*meta, "next_scheduled_verification");
  }
  r.signature = jsonlite::get_string(o, "signature");

  if (!bad.empty()) {
    return Result<VerificationRecord>::failure(
        ErrorCode::validation_failed,
        "verification " + r.verification_id + " has unrecognized value: " + bad);
  }
  return Result<VerificationRecord>::success(std::move(r));
}

}  // namespace warden::codec
