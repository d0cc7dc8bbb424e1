#pragma once

// warden/integrity.hpp: Point-in-time integrity verification of a boundary.
//
// CHECK CATEGORIES (selected by VerificationKind; comprehensive = all five):
//   control_verification      ControlEvaluator in verification mode, per control
//   seal_validation           self-signature over the boundary content minus
//                             the signature, then every attached seal
//   mutation_detection        MutationDetector over the boundary's full state
//   attestation_verification  every attestation ref via AttestationService;
//                             a missing attestation is invalid ("not found")
//   compliance_checking       schema, required fields, enum membership,
//                             MAJOR.MINOR.PATCH version format
//
// AGGREGATION:
//   Every control/seal/attestation/compliance check is one check. A failed
//   one (ineffective control, invalid seal or attestation, non-compliance)
//   is a critical failure; a degraded or warning control is neither passed
//   nor critical. Mutation detection is one check: passed iff no mutations,
//   critical iff any mutation is high or critical.
//   confidence = passed / total (0 when total == 0).
//   status: critical failures => compromised; else confidence >= 0.9 =>
//   intact; >= 0.7 => warning; else unknown.
//
// RECORD LIFECYCLE:
//   built -> aggregated -> violations/recommendations derived -> signed ->
//   schema-validated -> stored + ledgered -> persisted.
//   A record is never edited after signing.
//   When the stored record set failed to load, verify and report_violation
//   are refused with store_unavailable and the store is left untouched.

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "warden/audit.hpp"
#include "warden/collaborators.hpp"
#include "warden/config.hpp"
#include "warden/control_evaluator.hpp"
#include "warden/rbac.hpp"
#include "warden/record_store.hpp"
#include "warden/types.hpp"

namespace warden {

// Fill total/passed/critical counts, confidence, status and result_detail
// from the category results present in `record`.
void aggregate_integrity(VerificationRecord& record);

// One violation per failed check, in category order.
std::vector<Violation> derive_violations(const VerificationRecord& record);

// Per-category recommendations, plus boundary_redefinition when compromised
// or monitoring_enhancement when warning.
std::vector<Recommendation> derive_recommendations(const VerificationRecord& record);

// True iff `version` matches ^\d+\.\d+\.\d+$.
bool is_semver_triplet(const std::string& version);

class IntegrityVerifier {
 public:
  static constexpr const char* kComponent = "integrity_verifier";
  static constexpr const char* kCollection = "verifications";

  // All five collaborators are required. References must outlive the
  // verifier.
  IntegrityVerifier(Collaborators collab, EvidenceLedger& ledger, IRecordStore& store,
                    VerifierConfig config = {});

  Result<VerificationRecord> verify(const std::string& boundary_id,
                                    VerificationKind kind = VerificationKind::comprehensive,
                                    TriggerSource trigger = TriggerSource::manual,
                                    rbac::Role role = rbac::Role::auditor);

  // Record an externally discovered incident as a single-violation record
  // with status compromised and confidence 1.0.
  Result<VerificationRecord> report_violation(const std::string& boundary_id,
                                              ViolationKind kind,
                                              const std::string& detail,
                                              Severity severity,
                                              const std::string& evidence = "",
                                              rbac::Role role = rbac::Role::admin);

  // --- Queries (read-only) ---
  std::optional<VerificationRecord> get_verification(const std::string& verification_id) const;
  std::vector<VerificationRecord> list_verifications(
      const std::optional<std::string>& boundary_id = std::nullopt,
      std::optional<IntegrityStatus> status = std::nullopt) const;
  std::vector<Violation> boundary_violations(const std::string& boundary_id) const;
  std::vector<Recommendation> boundary_recommendations(const std::string& boundary_id) const;
  std::size_t size() const;

  // Re-check a record's signature against its content.
  bool verify_record_signature(const VerificationRecord& record) const;

  const LoadStatus& load_status() const { return load_status_; }
  const VerifierConfig& config() const { return config_; }

 private:
  struct Denial {
    ErrorCode   error{ErrorCode::none};
    std::string message;
  };

  std::optional<Denial> precheck(const std::string& operation, rbac::Role role,
                                 rbac::Permission permission);

  std::vector<ControlResult>    check_controls(const Boundary& b) const;
  std::vector<SealCheck>        check_seals(const Boundary& b) const;
  std::vector<Mutation>         check_mutations(const Boundary& b, uint64_t now);
  std::vector<AttestationCheck> check_attestations(const Boundary& b) const;
  std::vector<ComplianceCheck>  check_compliance(const Boundary& b) const;

  // Sign, validate, store, ledger and persist a finished record.
  Result<VerificationRecord> commit(VerificationRecord record);
  std::optional<std::string> persist();
  void load();

  Collaborators    collab_;
  EvidenceLedger&  ledger_;
  IRecordStore&    store_;
  VerifierConfig   config_;
  ControlEvaluator evaluator_;

  mutable std::mutex mu_;
  std::map<std::string, VerificationRecord> records_;
  LoadStatus load_status_;
};

}  // namespace warden
