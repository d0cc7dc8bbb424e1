#include "warden/collaborators.hpp"

#include "warden/codec.hpp"
#include "warden/jsonlite.hpp"

#include <utility>

namespace warden {

// ---------------------------------------------------------------------------
// InMemoryBoundaryRegistry
// ---------------------------------------------------------------------------

void InMemoryBoundaryRegistry::put(Boundary boundary) {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string id = boundary.boundary_id;
  boundaries_[id] = std::move(boundary);
}

bool InMemoryBoundaryRegistry::remove(const std::string& boundary_id) {
  std::lock_guard<std::mutex> lk(mu_);
  return boundaries_.erase(boundary_id) > 0;
}

Result<std::size_t> InMemoryBoundaryRegistry::load_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  jsonlite::Value root = jsonlite::parse_value(text, &err);
  if (err) {
    return Result<std::size_t>::failure(ErrorCode::json_parse_error, err->message);
  }

  const jsonlite::Array* items = nullptr;
  if (const auto* arr = std::get_if<jsonlite::Array>(&root.v)) {
    items = arr;
  } else if (const auto* obj = std::get_if<jsonlite::Object>(&root.v)) {
    items = jsonlite::get_array(*obj, "boundaries");
  }
  if (!items) {
    return Result<std::size_t>::failure(
        ErrorCode::validation_failed,
        "expected an array of boundaries or {\"boundaries\":[...]}");
  }

  std::vector<Boundary> decoded;
  for (const auto& item : *items) {
    const auto* obj = std::get_if<jsonlite::Object>(&item.v);
    if (!obj) {
      return Result<std::size_t>::failure(ErrorCode::validation_failed,
                                          "boundary definition is not an object");
    }
    auto b = codec::decode_boundary(*obj);
    if (!b.ok()) return Result<std::size_t>::failure(b.error, b.message);
    decoded.push_back(std::move(*b.value));
  }

  std::lock_guard<std::mutex> lk(mu_);
  for (auto& b : decoded) {
    const std::string id = b.boundary_id;
    boundaries_[id] = std::move(b);
  }
  return Result<std::size_t>::success(decoded.size());
}

std::optional<Boundary> InMemoryBoundaryRegistry::get(const std::string& boundary_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = boundaries_.find(boundary_id);
  if (it == boundaries_.end()) return std::nullopt;
  return it->second;
}

std::size_t InMemoryBoundaryRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return boundaries_.size();
}

// ---------------------------------------------------------------------------
// KeyedSealService
// ---------------------------------------------------------------------------

KeyedSealService::KeyedSealService(const SealKey& key) : key_(key) {}

std::string KeyedSealService::create(const std::string& content) {
  return std::string(kSealPrefix) + keyed_hex(key_, content);
}

bool KeyedSealService::verify(const std::string& content, const std::string& seal) const {
  const std::string prefix(kSealPrefix);
  if (seal.size() != prefix.size() + 64) return false;
  if (seal.compare(0, prefix.size(), prefix) != 0) return false;
  return digest_equal(seal.substr(prefix.size()), keyed_hex(key_, content));
}

bool KeyedSealService::verify_contract_tether(const std::string& component,
                                              const std::string& operation,
                                              const std::string& state_snapshot) {
  std::lock_guard<std::mutex> lk(mu_);
  ++tether_checks_;
  if (revoked_.count(component)) return false;

  std::optional<jsonlite::JsonError> err;
  auto snap = jsonlite::parse(state_snapshot, &err);
  if (err) return false;
  if (jsonlite::get_string(snap, "component") != component) return false;
  if (jsonlite::get_string(snap, "operation") != operation) return false;
  // A snapshot without a timestamp cannot be ordered against later writes.
  return jsonlite::get_u64(snap, "timestamp") != 0;
}

void KeyedSealService::revoke_tether(const std::string& component) {
  std::lock_guard<std::mutex> lk(mu_);
  revoked_.insert(component);
}

void KeyedSealService::restore_tether(const std::string& component) {
  std::lock_guard<std::mutex> lk(mu_);
  revoked_.erase(component);
}

uint64_t KeyedSealService::tether_checks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tether_checks_;
}

// ---------------------------------------------------------------------------
// InMemoryAttestationService
// ---------------------------------------------------------------------------

InMemoryAttestationService::InMemoryAttestationService(SealService& seals)
    : seals_(seals) {}

std::string InMemoryAttestationService::canonical_content(const Attestation& a) {
  jsonlite::Object o;
  o["attestation_id"] = jsonlite::Value{a.attestation_id};
  o["attester_id"] = jsonlite::Value{a.attester_id};
  o["subject_id"] = jsonlite::Value{a.subject_id};
  o["issued_at"] = jsonlite::Value{static_cast<std::uint64_t>(a.issued_at_unix_ms)};
  jsonlite::Object claims;
  for (const auto& [k, v] : a.claims) claims[k] = jsonlite::Value{v};
  o["claims"] = jsonlite::Value{std::move(claims)};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::optional<Attestation> InMemoryAttestationService::issue(
    const std::string& attester_id, const std::string& subject_id,
    const std::map<std::string, std::string>& claims) {
  if (attester_id.empty() || subject_id.empty()) return std::nullopt;

  Attestation a;
  a.attestation_id = random_id("att");
  a.attester_id = attester_id;
  a.subject_id = subject_id;
  a.claims = claims;
  a.issued_at_unix_ms = now_unix_ms();
  a.signature = seals_.create(canonical_content(a));
  if (a.signature.empty()) return std::nullopt;

  std::lock_guard<std::mutex> lk(mu_);
  attestations_[a.attestation_id] = a;
  return a;
}

std::optional<Attestation> InMemoryAttestationService::get(const std::string& attestation_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = attestations_.find(attestation_id);
  if (it == attestations_.end()) return std::nullopt;
  return it->second;
}

bool InMemoryAttestationService::verify(const std::string& attestation_id) const {
  Attestation a;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (revoked_.count(attestation_id)) return false;
    auto it = attestations_.find(attestation_id);
    if (it == attestations_.end()) return false;
    a = it->second;
  }
  return seals_.verify(canonical_content(a), a.signature);
}

void InMemoryAttestationService::put(Attestation attestation) {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string id = attestation.attestation_id;
  attestations_[id] = std::move(attestation);
}

void InMemoryAttestationService::revoke(const std::string& attestation_id) {
  std::lock_guard<std::mutex> lk(mu_);
  revoked_.insert(attestation_id);
}

// ---------------------------------------------------------------------------
// SnapshotMutationDetector
// ---------------------------------------------------------------------------

SnapshotMutationDetector::SnapshotMutationDetector(Severity severity)
    : severity_(severity) {}

std::vector<Mutation> SnapshotMutationDetector::detect(const std::string& entity_id,
                                                       const std::string& entity_type,
                                                       const std::string& current_state) {
  const std::string digest = boundary_state_digest(current_state);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = baselines_.find(entity_id);
  if (it == baselines_.end()) {
    baselines_[entity_id] = digest;
    return {};
  }
  if (it->second == digest) return {};

  Mutation m;
  m.mutation_id = random_id("mut");
  m.mutation_type = entity_type + "_state_changed";
  m.detected_at_unix_ms = now_unix_ms();
  m.severity = severity_;
  m.detail = entity_type + " " + entity_id + " differs from its approved baseline";
  m.evidence = "baseline=" + it->second + " current=" + digest;
  return {m};
}

void SnapshotMutationDetector::accept(const std::string& entity_id, const std::string& state) {
  std::lock_guard<std::mutex> lk(mu_);
  baselines_[entity_id] = boundary_state_digest(state);
}

// ---------------------------------------------------------------------------
// RequiredKeysSchemaValidator
// ---------------------------------------------------------------------------

RequiredKeysSchemaValidator::RequiredKeysSchemaValidator() {
  register_schema("trust_boundary.schema.v1",
                  {"boundary_id", "name", "boundary_type", "classification"});
  register_schema("boundary_integrity.schema.v1",
                  {"verification_id", "boundary_id", "timestamp",
                   "verification_type", "verifier_id", "result", "signature"});
}

void RequiredKeysSchemaValidator::register_schema(const std::string& schema_id,
                                                  std::vector<std::string> required_keys) {
  schemas_[schema_id] = std::move(required_keys);
}

SchemaVerdict RequiredKeysSchemaValidator::validate(const std::string& record_json,
                                                    const std::string& schema_id) const {
  SchemaVerdict verdict;
  auto it = schemas_.find(schema_id);
  if (it == schemas_.end()) {
    verdict.errors.push_back("unknown schema: " + schema_id);
    return verdict;
  }

  std::optional<jsonlite::JsonError> err;
  jsonlite::Value root = jsonlite::parse_value(record_json, &err);
  if (err) {
    verdict.errors.push_back("invalid JSON: " + err->message);
    return verdict;
  }
  const auto* obj = std::get_if<jsonlite::Object>(&root.v);
  if (!obj) {
    verdict.errors.push_back("record is not a JSON object");
    return verdict;
  }
  for (const auto& key : it->second) {
    if (!jsonlite::has_key(*obj, key)) verdict.errors.push_back("missing required key: " + key);
  }
  verdict.valid = verdict.errors.empty();
  return verdict;
}

}  // namespace warden
