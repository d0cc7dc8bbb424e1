#pragma once

// warden/types.hpp: Core data model for trust boundaries, crossings and
// integrity verification.
//
// DESIGN:
//   Every record the engine produces or consumes is a value type with closed
//   enumerations. String forms of the enums exist only at the JSON edge
//   (codec.hpp); inside the engine switches are exhaustive over the enums.
//
// OWNERSHIP:
//   - All members are value-owned. No borrowed references or raw pointers.
//   - Boundary is owned by the external registry; the engine holds copies and
//     never writes them back.
//   - CrossingRequest is mutated only by CrossingProtocol.
//   - VerificationRecord is immutable once signed; a new record is created
//     instead of editing an old one.
//
// ERRORS:
//   Operations return Result<T>. ErrorCode::none means success. Two codes form
//   the fatal channel (see is_fatal()); everything else is an ordinary,
//   locally reported failure. No automatic retry anywhere.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden {

// ---------------------------------------------------------------------------
// ErrorCode / Result
// ---------------------------------------------------------------------------
enum class ErrorCode {
  none,
  not_found,               // boundary / request / verification absent
  validation_failed,       // schema or record validation failed
  unauthorized,            // caller role lacks the permission
  contract_tether_failed,  // integrity precondition not met (fatal channel)
  persistence_failed,      // store write failed (fatal channel)
  illegal_transition,      // state machine rejected the call
  invalid_argument,
  seal_mismatch,           // persisted document seal did not verify on load
  json_parse_error,
  store_unavailable,       // stored records failed to load; mutations refused (fatal channel)
};

std::string to_string(ErrorCode code);

// Fatal channel: the operation's precondition or durability guarantee broke.
bool is_fatal(ErrorCode code);

// Result of an engine operation.
// INVARIANT: ok() iff error == ErrorCode::none.
// On persistence_failed, `value` still carries the computed record so the
// caller can retry the write or surface it; it was NOT durably stored.
template <typename T>
struct Result {
  std::optional<T> value;
  ErrorCode        error{ErrorCode::none};
  std::string      message;

  bool ok() const { return error == ErrorCode::none; }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }
  static Result failure(ErrorCode code, std::string msg) {
    Result r;
    r.error   = code;
    r.message = std::move(msg);
    return r;
  }
  // Computed but not durably stored.
  static Result unpersisted(T v, std::string msg) {
    Result r;
    r.value   = std::move(v);
    r.error   = ErrorCode::persistence_failed;
    r.message = std::move(msg);
    return r;
  }
};

// ---------------------------------------------------------------------------
// Boundary enumerations
// ---------------------------------------------------------------------------
enum class Classification { public_, internal, confidential, restricted, critical };
enum class BoundaryKind { process, network, data, user, module, governance };
enum class BoundaryStatus { draft, active, deprecated, retired };

enum class ControlKind {
  authentication,
  authorization,
  encryption,
  validation,
  monitoring,
  logging,
  filtering,
  rate_limiting,
  isolation,
};

// Outcome of evaluating one control.
enum class ControlStatus { effective, ineffective, degraded, warning };

// ---------------------------------------------------------------------------
// Boundary and its attachments
// ---------------------------------------------------------------------------
struct Control {
  std::string control_id;
  ControlKind kind{ControlKind::authentication};
  std::string name;
  std::map<std::string, std::string> parameters;  // implementation-specific
};

struct Seal {
  std::string seal_id;
  std::string data;       // sealed content
  std::string signature;  // seal produced by the SealService over `data`
};

struct AttestationRef {
  std::string attestation_id;
  std::string attester_id;
};

// A declared trust perimeter.
// Enum fields are optional: a definition arriving from the registry with an
// unrecognized value is still loaded, and compliance checking reports it.
struct Boundary {
  std::string boundary_id;
  std::string name;
  std::string description;
  std::optional<BoundaryKind>   kind;
  std::optional<Classification> classification;
  std::optional<BoundaryStatus> status;
  std::string version;     // MAJOR.MINOR.PATCH
  std::string created_at;  // ISO-8601, as supplied by the registry
  std::string updated_at;
  std::vector<Control> controls;  // declaration order; see request_evaluation_order()
  std::optional<std::string> signature;
  std::vector<Seal> seals;
  std::vector<AttestationRef> attestations;
  // field name -> raw text, for enum fields whose value was not recognized.
  std::map<std::string, std::string> unrecognized;
};

// ---------------------------------------------------------------------------
// Crossing request
// ---------------------------------------------------------------------------
enum class CrossingKind {
  data_transfer,
  control_transfer,
  authentication,
  authorization,
  query,
  notification,
};

enum class CrossingDirection { inbound, outbound, bidirectional };

// Lifecycle. Order of declaration is the forward order of the state machine.
enum class CrossingStatus {
  requested,
  validating,
  validation_failed,  // terminal
  validated,
  authorization_pending,
  denied,             // terminal
  authorized,
  executing,
  completed,          // terminal
  failed,             // terminal
};

bool is_terminal(CrossingStatus s);

enum class AuthorizationDecision { allow, deny };

enum class ImpactLevel { none, low, medium, high };

struct Payload {
  std::string data;                             // opaque
  std::string content_hash;                     // payload_digest(data) or empty
  std::optional<Classification> classification; // classification tag
  std::map<std::string, std::string> attributes;
};

struct AuditEvent {
  std::string event_id;
  uint64_t    timestamp_unix_ms{0};
  std::string event_type;
  std::string actor_id;
  std::string details;
};

struct ControlResult {
  std::string   control_id;
  ControlKind   kind{ControlKind::authentication};
  ControlStatus status{ControlStatus::effective};
  std::string   detail;
  std::string   evidence;
};

struct AuthorizationRecord {
  AuthorizationDecision decision{AuthorizationDecision::deny};
  std::string authorizer_id;
  uint64_t    timestamp_unix_ms{0};
  std::string reason;
};

struct ExecutionOutcome {
  bool success{false};
  std::map<std::string, std::string> result_data;
  std::string error_code;     // empty on success
  std::string error_message;
};

struct ImpactAssessment {
  double      trust_impact{0.0};  // signed; negative = trust reduction
  ImpactLevel security_impact{ImpactLevel::none};
  ImpactLevel governance_impact{ImpactLevel::none};
  ImpactLevel performance_impact{ImpactLevel::none};
};

// Trust reduction recorded against a boundary or principal.
struct TrustDecayEvent {
  std::string actor_id;    // boundary id or principal id
  double      magnitude{0.0};
  std::string reason;      // "denied" | "failed" | "unauthorized"
  std::string request_id;
  uint64_t    timestamp_unix_ms{0};
};

struct CrossingRequest {
  std::string request_id;
  std::string source_boundary_id;
  std::string target_boundary_id;
  CrossingKind      kind{CrossingKind::data_transfer};
  CrossingDirection direction{CrossingDirection::outbound};
  Payload     payload;
  std::string requester_id;
  uint64_t    created_at_unix_ms{0};
  CrossingStatus status{CrossingStatus::requested};
  std::vector<AuditEvent>    audit_trail;      // total order
  std::vector<ControlResult> control_results;  // in evaluation order
  std::vector<std::string>   applied_controls;
  std::string validation_failure_reason;
  std::optional<AuthorizationRecord> authorization;
  std::optional<ExecutionOutcome>    execution;
  std::optional<ImpactAssessment>    impact;
  std::vector<AttestationRef>        attestations;
  std::vector<TrustDecayEvent>       trust_decay;  // recorded against this request
};

// ---------------------------------------------------------------------------
// Integrity verification
// ---------------------------------------------------------------------------
enum class VerificationKind {
  comprehensive,
  control_verification,
  seal_validation,
  mutation_detection,
  attestation_verification,
  compliance_checking,
};

enum class IntegrityStatus { intact, warning, compromised, unknown };

enum class Severity { low, medium, high, critical };

enum class ViolationKind {
  control_bypass,
  seal_broken,
  unauthorized_mutation,
  invalid_attestation,
  compliance_failure,
};

enum class RecommendationKind {
  control_enhancement,
  seal_renewal,
  mutation_reversion,
  attestation_update,
  compliance_improvement,
  boundary_redefinition,
  monitoring_enhancement,
};

enum class TriggerSource { manual, scheduled, reported };

struct SealCheck {
  std::string seal_id;
  bool        valid{false};
  std::string detail;
  std::string evidence;
};

struct Mutation {
  std::string mutation_id;
  std::string mutation_type;
  uint64_t    detected_at_unix_ms{0};
  Severity    severity{Severity::medium};
  std::string detail;
  std::string evidence;
};

struct AttestationCheck {
  std::string attestation_id;
  bool        valid{false};
  std::string detail;
  std::string evidence;
};

struct ComplianceCheck {
  std::string requirement_id;
  bool        compliant{false};
  std::string detail;
  std::string evidence;
};

struct Violation {
  std::string   violation_id;
  ViolationKind kind{ViolationKind::compliance_failure};
  Severity      severity{Severity::medium};
  std::string   detail;
  std::string   evidence;
  std::string   remediation;
  uint64_t      detected_at_unix_ms{0};
};

struct Recommendation {
  std::string        recommendation_id;
  RecommendationKind kind{RecommendationKind::monitoring_enhancement};
  Severity           priority{Severity::medium};
  std::string        description;
  std::vector<std::string> steps;  // ordered remediation steps
};

struct VerificationRecord {
  std::string      verification_id;
  std::string      boundary_id;
  uint64_t         timestamp_unix_ms{0};
  VerificationKind kind{VerificationKind::comprehensive};
  std::string      verifier_id;
  TriggerSource    triggered_by{TriggerSource::manual};

  // Per-category results; nullopt = category not run.
  std::optional<std::vector<ControlResult>>    control_checks;
  std::optional<std::vector<SealCheck>>        seal_checks;
  std::optional<std::vector<Mutation>>         mutations;
  std::optional<std::vector<AttestationCheck>> attestation_checks;
  std::optional<std::vector<ComplianceCheck>>  compliance_checks;

  IntegrityStatus status{IntegrityStatus::unknown};
  double   confidence{0.0};  // in [0, 1]
  uint32_t total_checks{0};
  uint32_t passed_checks{0};
  uint32_t critical_failures{0};
  std::string result_detail;

  std::vector<Violation>      violations;
  std::vector<Recommendation> recommendations;
  uint64_t    next_scheduled_verification_unix_ms{0};
  std::string signature;  // SealService seal over the record minus signature
};

// ---------------------------------------------------------------------------
// Enum <-> string (JSON edge)
// ---------------------------------------------------------------------------
std::string to_string(Classification v);
std::string to_string(BoundaryKind v);
std::string to_string(BoundaryStatus v);
std::string to_string(ControlKind v);
std::string to_string(ControlStatus v);
std::string to_string(CrossingKind v);
std::string to_string(CrossingDirection v);
std::string to_string(CrossingStatus v);
std::string to_string(AuthorizationDecision v);
std::string to_string(ImpactLevel v);
std::string to_string(VerificationKind v);
std::string to_string(IntegrityStatus v);
std::string to_string(Severity v);
std::string to_string(ViolationKind v);
std::string to_string(RecommendationKind v);
std::string to_string(TriggerSource v);

// Parsers return nullopt on unrecognized input.
std::optional<Classification>        classification_from_string(const std::string& s);
std::optional<BoundaryKind>          boundary_kind_from_string(const std::string& s);
std::optional<BoundaryStatus>        boundary_status_from_string(const std::string& s);
std::optional<ControlKind>           control_kind_from_string(const std::string& s);
std::optional<ControlStatus>         control_status_from_string(const std::string& s);
std::optional<CrossingKind>          crossing_kind_from_string(const std::string& s);
std::optional<CrossingDirection>     crossing_direction_from_string(const std::string& s);
std::optional<CrossingStatus>        crossing_status_from_string(const std::string& s);
std::optional<AuthorizationDecision> authorization_decision_from_string(const std::string& s);
std::optional<ImpactLevel>           impact_level_from_string(const std::string& s);
std::optional<VerificationKind>      verification_kind_from_string(const std::string& s);
std::optional<IntegrityStatus>       integrity_status_from_string(const std::string& s);
std::optional<Severity>              severity_from_string(const std::string& s);
std::optional<ViolationKind>         violation_kind_from_string(const std::string& s);
std::optional<RecommendationKind>    recommendation_kind_from_string(const std::string& s);
std::optional<TriggerSource>         trigger_source_from_string(const std::string& s);

// Wall-clock milliseconds since the Unix epoch.
uint64_t now_unix_ms();

}  // namespace warden
