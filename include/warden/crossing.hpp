#pragma once

// warden/crossing.hpp: Boundary crossing protocol.
//
// STATE MACHINE:
//   requested -> validating -> (validation_failed | validated)
//             -> authorization_pending -> (denied | authorized)
//             -> executing -> (completed | failed)
//   Terminal: validation_failed, denied, completed, failed.
//
//   call                         events appended                         status
//   submit, boundary missing     request_received, failed                failed
//   submit, control ineffective  request_received, validation_failed     validation_failed
//   submit, all controls pass    request_received, validated,            authorization_pending
//                                authorization_pending
//   authorize allow              authorized                              authorized
//   authorize deny               denied                                  denied
//   execute                      executing, impact_assessed,             completed | failed
//                                completed | failed
//
// INVARIANTS:
//   - Status only moves forward. Illegal calls return illegal_transition and
//     change nothing; authorization is single-assignment.
//   - Every transition appends its event before the status changes. Event
//     timestamps are non-decreasing per protocol instance, and the last
//     event's type equals the final status.
//   - Every mutating call runs the contract-tether check first; on failure
//     nothing is mutated. Reads never check and never mutate.
//   - If the stored record set failed to load, every mutating call is
//     refused with store_unavailable and the store is never written, so a
//     document that could not be read is never replaced.
//   - authorize/execute check existence and state before the caller's role:
//     a call on a request in the wrong state has no side effects, not even
//     the unauthorized trust decay.
//   - Trust-decay events are stored on the request they concern and persist
//     with it.
//   - Every event is mirrored into the EvidenceLedger; every mutation
//     persists the whole crossing set as a sealed document.
//
// THREADING:
//   Public methods are internally serialized. Concurrent callers acting on
//   the same request id still race at the application level; only the
//   single-assignment guard is enforced.

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

// Performs the crossing. Absent executor = simulated success.
class CrossingExecutor {
 public:
  virtual ~CrossingExecutor() = default;
  virtual ExecutionOutcome perform(const CrossingRequest& request) = 0;
};

// Impact of a performed crossing, from its kind, payload classification and
// outcome. Unclassified payloads are assessed as internal.
ImpactAssessment assess_impact(const CrossingRequest& request, const ExecutionOutcome& outcome);

class CrossingProtocol {
 public:
  static constexpr const char* kComponent = "crossing_protocol";
  static constexpr const char* kCollection = "crossings";

  // `collab.registry` and `collab.seals` are required; `collab.attestations`
  // only for attest(). All references must outlive the protocol.
  CrossingProtocol(Collaborators collab, EvidenceLedger& ledger, IRecordStore& store,
                   CrossingConfig config = {}, ControlHooks hooks = {},
                   CrossingExecutor* executor = nullptr);

  Result<CrossingRequest> submit(CrossingRequest request,
                                 rbac::Role role = rbac::Role::operator_);

  Result<CrossingRequest> authorize(const std::string& request_id,
                                    const std::string& authorizer_id,
                                    AuthorizationDecision decision,
                                    const std::string& reason = "",
                                    rbac::Role role = rbac::Role::operator_);

  Result<CrossingRequest> execute(const std::string& request_id,
                                  const std::string& actor_id = "system",
                                  rbac::Role role = rbac::Role::operator_);

  // Attach an attestation issued by the AttestationService. Legal in any
  // state; never changes the crossing status.
  Result<AttestationRef> attest(const std::string& request_id,
                                const std::string& attester_id,
                                const std::map<std::string, std::string>& claims,
                                rbac::Role role = rbac::Role::auditor);

  // --- Queries (read-only) ---
  std::optional<CrossingRequest> get(const std::string& request_id) const;
  // Boundary filter matches either the source or the target boundary.
  std::vector<CrossingRequest> list(const std::optional<std::string>& boundary_id = std::nullopt,
                                    std::optional<CrossingStatus> status = std::nullopt) const;
  Result<std::vector<AuditEvent>> get_audit_trail(const std::string& request_id) const;
  // Every decay recorded against the stored requests, ordered by time.
  std::vector<TrustDecayEvent> trust_decay_events() const;
  std::size_t size() const;

  const LoadStatus& load_status() const { return load_status_; }
  const CrossingConfig& config() const { return config_; }

 private:
  struct Denial {
    ErrorCode   error{ErrorCode::none};
    std::string message;
  };

  // Collaborator presence, a usable record set, contract tether.
  // nullopt = proceed.
  std::optional<Denial> precheck(const std::string& operation);
  std::optional<Denial> check_role(rbac::Role role, rbac::Permission permission,
                                   const std::string& principal_id,
                                   const std::string& request_id);
  uint64_t next_timestamp();
  void append_event(CrossingRequest& req, const std::string& event_type,
                    const std::string& actor_id, const std::string& details,
                    CrossingStatus new_status);
  // Records the decay on `req` and mirrors it into the ledger.
  void decay(CrossingRequest& req, const std::string& actor_id, double magnitude,
             const std::string& reason);
  // Persist the whole set; on failure returns the message.
  std::optional<std::string> persist();
  void load();

  Collaborators     collab_;
  EvidenceLedger&   ledger_;
  IRecordStore&     store_;
  CrossingConfig    config_;
  ControlEvaluator  evaluator_;
  CrossingExecutor* executor_;

  mutable std::mutex mu_;
  std::map<std::string, CrossingRequest> requests_;
  uint64_t last_timestamp_{0};
  LoadStatus load_status_;
};

}  // namespace warden
