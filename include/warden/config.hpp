#pragma once

// warden/config.hpp: Engine configuration.
//
// SOURCES (later overrides earlier):
//   1. Compiled defaults (the member initializers below).
//   2. A JSON document (config_from_json).
//   3. WARDEN_* environment variables (config_from_env).
//
// Invalid values never abort: the default is kept and the problem is
// appended to the `warnings` output.

#include <cstdint>
#include <string>
#include <vector>

namespace warden {

// Trust reduction applied to the affected actors per failure reason.
struct TrustDecayPolicy {
  double denied{0.05};
  double failed{0.02};
  double unauthorized{0.1};
};

struct CrossingConfig {
  TrustDecayPolicy decay;
  bool enforce_rbac{true};
  bool verify_seal_on_load{true};
};

struct VerifierConfig {
  std::string verifier_id{"system"};
  uint64_t    reverification_interval_ms{86400000};  // 24 h
  std::string boundary_schema{"trust_boundary.schema.v1"};
  std::string record_schema{"boundary_integrity.schema.v1"};
  bool        enforce_rbac{true};
  bool        verify_seal_on_load{true};
};

struct WardenConfig {
  CrossingConfig crossing;
  VerifierConfig verifier;
  std::string crossing_store_path;      // "" = in-memory store
  std::string verification_store_path;  // "" = in-memory store
  std::string audit_log_path;           // "" = no ledger mirror
  std::string event_log_path;           // "" = WARDEN_EVENT_LOG / none

  std::string to_json() const;
};

// Apply WARDEN_* environment variables on top of `base`.
WardenConfig config_from_env(WardenConfig base = {},
                             std::vector<std::string>* warnings = nullptr);

// Parse a JSON config document on top of the defaults. Unknown keys are
// ignored. Returns defaults and sets *error on unparseable text.
WardenConfig config_from_json(const std::string& text, std::string* error,
                              std::vector<std::string>* warnings = nullptr);

}  // namespace warden
