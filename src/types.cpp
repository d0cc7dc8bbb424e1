#include "warden/types.hpp"

#include <chrono>

namespace warden {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::validation_failed: return "validation_failed";
    case ErrorCode::unauthorized: return "unauthorized";
    case ErrorCode::contract_tether_failed: return "contract_tether_failed";
    case ErrorCode::persistence_failed: return "persistence_failed";
    case ErrorCode::illegal_transition: return "illegal_transition";
    case ErrorCode::invalid_argument: return "invalid_argument";
    case ErrorCode::seal_mismatch: return "seal_mismatch";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::store_unavailable: return "store_unavailable";
  }
  return "";
}

bool is_fatal(ErrorCode code) {
  return code == ErrorCode::contract_tether_failed ||
         code == ErrorCode::persistence_failed ||
         code == ErrorCode::store_unavailable;
}

bool is_terminal(CrossingStatus s) {
  switch (s) {
    case CrossingStatus::validation_failed:
    case CrossingStatus::denied:
    case CrossingStatus::completed:
    case CrossingStatus::failed:
      return true;
    case CrossingStatus::requested:
    case CrossingStatus::validating:
    case CrossingStatus::validated:
    case CrossingStatus::authorization_pending:
    case CrossingStatus::authorized:
    case CrossingStatus::executing:
      return false;
  }
  return false;
}

uint64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          SC::now().time_since_epoch())
          .count());
}

// ---------------------------------------------------------------------------
// to_string
// ---------------------------------------------------------------------------

std::string to_string(Classification v) {
  switch (v) {
    case Classification::public_:      return "public";
    case Classification::internal:     return "internal";
    case Classification::confidential: return "confidential";
    case Classification::restricted:   return "restricted";
    case Classification::critical:     return "critical";
  }
  return "unknown";
}

std::string to_string(BoundaryKind v) {
  switch (v) {
    case BoundaryKind::process:    return "process";
    case BoundaryKind::network:    return "network";
    case BoundaryKind::data:       return "data";
    case BoundaryKind::user:       return "user";
    case BoundaryKind::module:     return "module";
    case BoundaryKind::governance: return "governance";
  }
  return "unknown";
}

std::string to_string(BoundaryStatus v) {
  switch (v) {
    case BoundaryStatus::draft:      return "draft";
    case BoundaryStatus::active:     return "active";
    case BoundaryStatus::deprecated: return "deprecated";
    case BoundaryStatus::retired:    return "retired";
  }
  return "unknown";
}

std::string to_string(ControlKind v) {
  switch (v) {
    case ControlKind::authentication: return "authentication";
    case ControlKind::authorization:  return "authorization";
    case ControlKind::encryption:     return "encryption";
    case ControlKind::validation:     return "validation";
    case ControlKind::monitoring:     return "monitoring";
    case ControlKind::logging:        return "logging";
    case ControlKind::filtering:      return "filtering";
    case ControlKind::rate_limiting:  return "rate_limiting";
    case ControlKind::isolation:      return "isolation";
  }
  return "unknown";
}

std::string to_string(ControlStatus v) {
  switch (v) {
    case ControlStatus::effective:   return "effective";
    case ControlStatus::ineffective: return "ineffective";
    case ControlStatus::degraded:    return "degraded";
    case ControlStatus::warning:     return "warning";
  }
  return "unknown";
}

std::string to_string(CrossingKind v) {
  switch (v) {
    case CrossingKind::data_transfer:    return "data_transfer";
    case CrossingKind::control_transfer: return "control_transfer";
    case CrossingKind::authentication:   return "authentication";
    case CrossingKind::authorization:    return "authorization";
    case CrossingKind::query:            return "query";
    case CrossingKind::notification:     return "notification";
  }
  return "unknown";
}

std::string to_string(CrossingDirection v) {
  switch (v) {
    case CrossingDirection::inbound:       return "inbound";
    case CrossingDirection::outbound:      return "outbound";
    case CrossingDirection::bidirectional: return "bidirectional";
  }
  return "unknown";
}

std::string to_string(CrossingStatus v) {
  switch (v) {
    case CrossingStatus::requested:             return "requested";
    case CrossingStatus::validating:            return "validating";
    case CrossingStatus::validation_failed:     return "validation_failed";
    case CrossingStatus::validated:             return "validated";
    case CrossingStatus::authorization_pending: return "authorization_pending";
    case CrossingStatus::denied:                return "denied";
    case CrossingStatus::authorized:            return "authorized";
    case CrossingStatus::executing:             return "executing";
    case CrossingStatus::completed:             return "completed";
    case CrossingStatus::failed:                return "failed";
  }
  return "unknown";
}

std::string to_string(AuthorizationDecision v) {
  switch (v) {
    case AuthorizationDecision::allow: return "allow";
    case AuthorizationDecision::deny:  return "deny";
  }
  return "unknown";
}

std::string to_string(ImpactLevel v) {
  switch (v) {
    case ImpactLevel::none:   return "none";
    case ImpactLevel::low:    return "low";
    case ImpactLevel::medium: return "medium";
    case ImpactLevel::high:   return "high";
  }
  return "unknown";
}

std::string to_string(VerificationKind v) {
  switch (v) {
    case VerificationKind::comprehensive:            return "comprehensive";
    case VerificationKind::control_verification:     return "control_verification";
    case VerificationKind::seal_validation:          return "seal_validation";
    case VerificationKind::mutation_detection:       return "mutation_detection";
    case VerificationKind::attestation_verification: return "attestation_verification";
    case VerificationKind::compliance_checking:      return "compliance_checking";
  }
  return "unknown";
}

std::string to_string(IntegrityStatus v) {
  switch (v) {
    case IntegrityStatus::intact:      return "intact";
    case IntegrityStatus::warning:     return "warning";
    case IntegrityStatus::compromised: return "compromised";
    case IntegrityStatus::unknown:     return "unknown";
  }
  return "unknown";
}

std::string to_string(Severity v) {
  switch (v) {
    case Severity::low:      return "low";
    case Severity::medium:   return "medium";
    case Severity::high:     return "high";
    case Severity::critical: return "critical";
  }
  return "unknown";
}

std::string to_string(ViolationKind v) {
  switch (v) {
    case ViolationKind::control_bypass:        return "control_bypass";
    case ViolationKind::seal_broken:           return "seal_broken";
    case ViolationKind::unauthorized_mutation: return "unauthorized_mutation";
    case ViolationKind::invalid_attestation:   return "invalid_attestation";
    case ViolationKind::compliance_failure:    return "compliance_failure";
  }
  return "unknown";
}

std::string to_string(RecommendationKind v) {
  switch (v) {
    case RecommendationKind::control_enhancement:    return "control_enhancement";
    case RecommendationKind::seal_renewal:           return "seal_renewal";
    case RecommendationKind::mutation_reversion:     return "mutation_reversion";
    case RecommendationKind::attestation_update:     return "attestation_update";
    case RecommendationKind::compliance_improvement: return "compliance_improvement";
    case RecommendationKind::boundary_redefinition:  return "boundary_redefinition";
    case RecommendationKind::monitoring_enhancement: return "monitoring_enhancement";
  }
  return "unknown";
}

std::string to_string(TriggerSource v) {
  switch (v) {
    case TriggerSource::manual:    return "manual";
    case TriggerSource::scheduled: return "scheduled";
    case TriggerSource::reported:  return "reported";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// from_string
// ---------------------------------------------------------------------------
// Each parser walks the closed enum range through to_string() so that the two
// directions cannot drift apart.

namespace {

template <typename E, std::size_t N>
std::optional<E> parse_enum(const std::string& s, const E (&values)[N]) {
  for (const E v : values) {
    if (to_string(v) == s) return v;
  }
  return std::nullopt;
}

}  // namespace

std::optional<Classification> classification_from_string(const std::string& s) {
  static const Classification kAll[] = {
      Classification::public_, Classification::internal,
      Classification::confidential, Classification::restricted,
      Classification::critical};
  return parse_enum(s, kAll);
}

std::optional<BoundaryKind> boundary_kind_from_string(const std::string& s) {
  static const BoundaryKind kAll[] = {
      BoundaryKind::process, BoundaryKind::network, BoundaryKind::data,
      BoundaryKind::user, BoundaryKind::module, BoundaryKind::governance};
  return parse_enum(s, kAll);
}

std::optional<BoundaryStatus> boundary_status_from_string(const std::string& s) {
  static const BoundaryStatus kAll[] = {
      BoundaryStatus::draft, BoundaryStatus::active,
      BoundaryStatus::deprecated, BoundaryStatus::retired};
  return parse_enum(s, kAll);
}

std::optional<ControlKind> control_kind_from_string(const std::string& s) {
  static const ControlKind kAll[] = {
      ControlKind::authentication, ControlKind::authorization,
      ControlKind::encryption,     ControlKind::validation,
      ControlKind::monitoring,     ControlKind::logging,
      ControlKind::filtering,      ControlKind::rate_limiting,
      ControlKind::isolation};
  // Registry documents sometimes spell it with a hyphen.
  if (s == "rate-limiting") return ControlKind::rate_limiting;
  return parse_enum(s, kAll);
}

std::optional<ControlStatus> control_status_from_string(const std::string& s) {
  static const ControlStatus kAll[] = {
      ControlStatus::effective, ControlStatus::ineffective,
      ControlStatus::degraded, ControlStatus::warning};
  return parse_enum(s, kAll);
}

std::optional<CrossingKind> crossing_kind_from_string(const std::string& s) {
  static const CrossingKind kAll[] = {
      CrossingKind::data_transfer, CrossingKind::control_transfer,
      CrossingKind::authentication, CrossingKind::authorization,
      CrossingKind::query, CrossingKind::notification};
  if (s == "data-transfer") return CrossingKind::data_transfer;
  if (s == "control-transfer") return CrossingKind::control_transfer;
  return parse_enum(s, kAll);
}

std::optional<CrossingDirection> crossing_direction_from_string(const std::string& s) {
  static const CrossingDirection kAll[] = {
      CrossingDirection::inbound, CrossingDirection::outbound,
      CrossingDirection::bidirectional};
  return parse_enum(s, kAll);
}

std::optional<CrossingStatus> crossing_status_from_string(const std::string& s) {
  static const CrossingStatus kAll[] = {
      CrossingStatus::requested,  CrossingStatus::validating,
      CrossingStatus::validation_failed, CrossingStatus::validated,
      CrossingStatus::authorization_pending, CrossingStatus::denied,
      CrossingStatus::authorized, CrossingStatus::executing,
      CrossingStatus::completed,  CrossingStatus::failed};
  return parse_enum(s, kAll);
}

std::optional<AuthorizationDecision> authorization_decision_from_string(const std::string& s) {
  static const AuthorizationDecision kAll[] = {AuthorizationDecision::allow,
                                               AuthorizationDecision::deny};
  return parse_enum(s, kAll);
}

std::optional<ImpactLevel> impact_level_from_string(const std::string& s) {
  static const ImpactLevel kAll[] = {ImpactLevel::none, ImpactLevel::low,
                                     ImpactLevel::medium, ImpactLevel::high};
  return parse_enum(s, kAll);
}

std::optional<VerificationKind> verification_kind_from_string(const std::string& s) {
  static const VerificationKind kAll[] = {
      VerificationKind::comprehensive, VerificationKind::control_verification,
      VerificationKind::seal_validation, VerificationKind::mutation_detection,
      VerificationKind::attestation_verification,
      VerificationKind::compliance_checking};
  return parse_enum(s, kAll);
}

std::optional<IntegrityStatus> integrity_status_from_string(const std::string& s) {
  static const IntegrityStatus kAll[] = {
      IntegrityStatus::intact, IntegrityStatus::warning,
      IntegrityStatus::compromised, IntegrityStatus::unknown};
  return parse_enum(s, kAll);
}

std::optional<Severity> severity_from_string(const std::string& s) {
  static const Severity kAll[] = {Severity::low, Severity::medium,
                                  Severity::high, Severity::critical};
  return parse_enum(s, kAll);
}

std::optional<ViolationKind> violation_kind_from_string(const std::string& s) {
  static const ViolationKind kAll[] = {
      ViolationKind::control_bypass, ViolationKind::seal_broken,
      ViolationKind::unauthorized_mutation, ViolationKind::invalid_attestation,
      ViolationKind::compliance_failure};
  return parse_enum(s, kAll);
}

std::optional<RecommendationKind> recommendation_kind_from_string(const std::string& s) {
  static const RecommendationKind kAll[] = {
      RecommendationKind::control_enhancement,
      RecommendationKind::seal_renewal,
      RecommendationKind::mutation_reversion,
      RecommendationKind::attestation_update,
      RecommendationKind::compliance_improvement,
      RecommendationKind::boundary_redefinition,
      RecommendationKind::monitoring_enhancement};
  return parse_enum(s, kAll);
}

std::optional<TriggerSource> trigger_source_from_string(const std::string& s) {
  static const TriggerSource kAll[] = {TriggerSource::manual,
                                       TriggerSource::scheduled,
                                       TriggerSource::reported};
  return parse_enum(s, kAll);
}

}  // namespace warden
