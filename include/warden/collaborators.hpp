#pragma once

// warden/collaborators.hpp: Capability interfaces consumed by the crossing
// protocol and the integrity verifier, plus in-process reference
// implementations.
//
// DESIGN:
//   The engine never reaches for ambient state. CrossingProtocol and
//   IntegrityVerifier are constructed with a Collaborators bundle of
//   non-owning pointers; the caller owns the implementations and must keep
//   them alive for the lifetime of the component.
//
// FAILURE SHAPE:
//   Every interface reports failure through its return value (nullopt, false,
//   empty string, invalid verdict). Implementations must not throw; the
//   engine does not catch exceptions from these interfaces.
//
// EXTENSION_POINT: remote_collaborators
//   Current: in-memory registry, BLAKE3 keyed seals, in-memory attestations,
//   digest-snapshot mutation detector, required-key schema validator.
//   Upgrade: HSM-backed SealService, registry over the governance API.
//   The interfaces are stable.

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "warden/hash.hpp"
#include "warden/types.hpp"

namespace warden {

// ---------------------------------------------------------------------------
// Interfaces
// ---------------------------------------------------------------------------

class BoundaryRegistry {
 public:
  virtual ~BoundaryRegistry() = default;

  // Returns nullopt if no boundary has this id.
  virtual std::optional<Boundary> get(const std::string& boundary_id) const = 0;
};

class SealService {
 public:
  virtual ~SealService() = default;

  // Seal `content`. Returns "" on failure.
  virtual std::string create(const std::string& content) = 0;

  virtual bool verify(const std::string& content, const std::string& seal) const = 0;

  // Precondition for every mutating operation: the caller-visible snapshot
  // (component, operation, timestamp, record count) is still acceptable.
  virtual bool verify_contract_tether(const std::string& component,
                                      const std::string& operation,
                                      const std::string& state_snapshot) = 0;
};

struct Attestation {
  std::string attestation_id;
  std::string attester_id;
  std::string subject_id;
  std::map<std::string, std::string> claims;
  uint64_t    issued_at_unix_ms{0};
  std::string signature;
};

class AttestationService {
 public:
  virtual ~AttestationService() = default;

  // Record an attestation about `subject_id`. Returns nullopt on failure.
  virtual std::optional<Attestation> issue(const std::string& attester_id,
                                           const std::string& subject_id,
                                           const std::map<std::string, std::string>& claims) = 0;

  virtual std::optional<Attestation> get(const std::string& attestation_id) const = 0;

  virtual bool verify(const std::string& attestation_id) const = 0;
};

class MutationDetector {
 public:
  virtual ~MutationDetector() = default;

  // Returns every mutation found between the last known state of the entity
  // and `current_state`. Empty when nothing changed.
  virtual std::vector<Mutation> detect(const std::string& entity_id,
                                       const std::string& entity_type,
                                       const std::string& current_state) = 0;
};

struct SchemaVerdict {
  bool valid{false};
  std::vector<std::string> errors;
};

class SchemaValidator {
 public:
  virtual ~SchemaValidator() = default;

  virtual SchemaVerdict validate(const std::string& record_json,
                                 const std::string& schema_id) const = 0;
};

// Non-owning handles. All five must be set for IntegrityVerifier;
// CrossingProtocol needs registry and seals, attestations only for attest().
struct Collaborators {
  BoundaryRegistry*   registry{nullptr};
  SealService*        seals{nullptr};
  AttestationService* attestations{nullptr};
  MutationDetector*   mutations{nullptr};
  SchemaValidator*    schemas{nullptr};
};

// ---------------------------------------------------------------------------
// Reference implementations
// ---------------------------------------------------------------------------

// Thread-safe in-memory registry.
class InMemoryBoundaryRegistry : public BoundaryRegistry {
 public:
  void put(Boundary boundary);
  bool remove(const std::string& boundary_id);

  // Load definitions from a JSON array, or an object with a "boundaries"
  // array. Returns the number loaded; rejects the whole document on the
  // first invalid definition.
  Result<std::size_t> load_json(const std::string& text);

  std::optional<Boundary> get(const std::string& boundary_id) const override;
  std::size_t size() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, Boundary> boundaries_;
};

// BLAKE3 keyed-hash seals: "blake3-keyed:v1:<64 hex>".
// The contract tether accepts any well-formed snapshot whose component and
// operation match the call and whose component has not been revoked.
class KeyedSealService : public SealService {
 public:
  static constexpr const char* kSealPrefix = "blake3-keyed:v1:";

  explicit KeyedSealService(const SealKey& key);

  std::string create(const std::string& content) override;
  bool verify(const std::string& content, const std::string& seal) const override;
  bool verify_contract_tether(const std::string& component,
                              const std::string& operation,
                              const std::string& state_snapshot) override;

  // Subsequent tether checks for `component` fail until restored.
  void revoke_tether(const std::string& component);
  void restore_tether(const std::string& component);
  uint64_t tether_checks() const;

 private:
  SealKey key_;
  mutable std::mutex mu_;
  std::set<std::string> revoked_;
  uint64_t tether_checks_{0};
};

// Attestations signed with a SealService over their canonical content.
class InMemoryAttestationService : public AttestationService {
 public:
  explicit InMemoryAttestationService(SealService& seals);

  std::optional<Attestation> issue(const std::string& attester_id,
                                   const std::string& subject_id,
                                   const std::map<std::string, std::string>& claims) override;
  std::optional<Attestation> get(const std::string& attestation_id) const override;
  bool verify(const std::string& attestation_id) const override;

  // Store an externally produced attestation as-is.
  void put(Attestation attestation);
  void revoke(const std::string& attestation_id);

  static std::string canonical_content(const Attestation& a);

 private:
  SealService& seals_;
  mutable std::mutex mu_;
  std::map<std::string, Attestation> attestations_;
  std::set<std::string> revoked_;
};

// Records a digest baseline per entity on first sight; any later state with
// a different digest is reported as one mutation of `severity`.
class SnapshotMutationDetector : public MutationDetector {
 public:
  explicit SnapshotMutationDetector(Severity severity = Severity::high);

  std::vector<Mutation> detect(const std::string& entity_id,
                               const std::string& entity_type,
                               const std::string& current_state) override;

  // Adopt `state` as the approved baseline for the entity.
  void accept(const std::string& entity_id, const std::string& state);

 private:
  Severity severity_;
  std::mutex mu_;
  std::map<std::string, std::string> baselines_;  // entity id -> digest
};

// Schema = set of keys the top-level JSON object must carry. Unknown schema
// ids fail validation.
class RequiredKeysSchemaValidator : public SchemaValidator {
 public:
  // Registers the boundary and verification record schemas.
  RequiredKeysSchemaValidator();

  void register_schema(const std::string& schema_id, std::vector<std::string> required_keys);

  SchemaVerdict validate(const std::string& record_json,
                         const std::string& schema_id) const override;

 private:
  std::map<std::string, std::vector<std::string>> schemas_;
};

}  // namespace warden
