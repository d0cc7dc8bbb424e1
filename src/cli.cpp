#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "warden/audit.hpp"
#include "warden/codec.hpp"
#include "warden/collaborators.hpp"
#include "warden/config.hpp"
#include "warden/hash.hpp"
#include "warden/integrity.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/record_store.hpp"
#include "warden/version.hpp"

namespace {

// Exit codes shared by every subcommand.
constexpr int kExitOk = 0;
constexpr int kExitWarning = 1;
constexpr int kExitCompromised = 2;
constexpr int kExitError = 3;

bool read_file(const std::string& path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

int fail(const std::string& message) {
  std::cerr << "{\"error\":\"" << warden::jsonlite::escape(message) << "\"}\n";
  return kExitError;
}

std::string arg_value(int argc, char** argv, int start, const std::string& flag) {
  for (int i = start; i < argc; ++i) {
    if (std::string(argv[i]) == flag && i + 1 < argc) return argv[i + 1];
  }
  return "";
}

// --key wins over WARDEN_SEAL_KEY.
bool resolve_key(int argc, char** argv, warden::SealKey& key, std::string& error) {
  std::string hex = arg_value(argc, argv, 3, "--key");
  if (hex.empty()) {
    const char* env = std::getenv("WARDEN_SEAL_KEY");
    if (env) hex = env;
  }
  if (hex.empty()) {
    error = "seal key required (--key or WARDEN_SEAL_KEY)";
    return false;
  }
  if (!warden::seal_key_from_hex(key, hex)) {
    error = "seal key must be 64 hex characters";
    return false;
  }
  return true;
}

bool load_registry(const std::string& path, warden::InMemoryBoundaryRegistry& registry,
                   std::string& error) {
  if (path.empty()) {
    error = "--registry is required";
    return false;
  }
  std::string text;
  if (!read_file(path, text)) {
    error = "cannot read " + path;
    return false;
  }
  auto loaded = registry.load_json(text);
  if (!loaded.ok()) {
    error = warden::to_string(loaded.error) + ": " + loaded.message;
    return false;
  }
  return true;
}

int exit_for(warden::IntegrityStatus status) {
  switch (status) {
    case warden::IntegrityStatus::intact:      return kExitOk;
    case warden::IntegrityStatus::compromised: return kExitCompromised;
    case warden::IntegrityStatus::warning:
    case warden::IntegrityStatus::unknown:     return kExitWarning;
  }
  return kExitError;
}

int cmd_boundary_verify(int argc, char** argv, const warden::WardenConfig& cfg) {
  warden::SealKey key{};
  std::string error;
  if (!resolve_key(argc, argv, key, error)) return fail(error);

  warden::InMemoryBoundaryRegistry registry;
  if (!load_registry(arg_value(argc, argv, 3, "--registry"), registry, error)) return fail(error);

  const std::string boundary_id = arg_value(argc, argv, 3, "--boundary");
  if (boundary_id.empty()) return fail("--boundary is required");

  auto kind = warden::VerificationKind::comprehensive;
  const std::string kind_text = arg_value(argc, argv, 3, "--kind");
  if (!kind_text.empty()) {
    auto parsed = warden::verification_kind_from_string(kind_text);
    if (!parsed) return fail("unknown verification kind: " + kind_text);
    kind = *parsed;
  }

  warden::KeyedSealService seals(key);
  warden::InMemoryAttestationService attestations(seals);
  warden::SnapshotMutationDetector mutations;
  warden::RequiredKeysSchemaValidator schemas;
  warden::Collaborators collab{&registry, &seals, &attestations, &mutations, &schemas};

  std::string store_path = arg_value(argc, argv, 3, "--store");
  if (store_path.empty()) store_path = cfg.verification_store_path;
  std::unique_ptr<warden::IRecordStore> store;
  if (store_path.empty()) store = std::make_unique<warden::MemoryRecordStore>();
  else store = std::make_unique<warden::FileRecordStore>(store_path);

  warden::EvidenceLedger ledger(cfg.audit_log_path);
  warden::IntegrityVerifier verifier(collab, ledger, *store, cfg.verifier);
  if (!verifier.load_status().ok()) {
    return fail("verification store: " + verifier.load_status().message);
  }

  auto result = verifier.verify(boundary_id, kind);
  if (!result.value) return fail(warden::to_string(result.error) + ": " + result.message);
  std::cout << warden::jsonlite::to_json(warden::codec::encode(*result.value)) << "\n";
  if (!result.ok()) {
    std::cerr << "{\"warning\":\"" << warden::jsonlite::escape(result.message) << "\"}\n";
    return kExitError;
  }
  return exit_for(result.value->status);
}

int cmd_boundary_seal(int argc, char** argv) {
  warden::SealKey key{};
  std::string error;
  if (!resolve_key(argc, argv, key, error)) return fail(error);

  warden::InMemoryBoundaryRegistry registry;
  if (!load_registry(arg_value(argc, argv, 3, "--registry"), registry, error)) return fail(error);

  const std::string boundary_id = arg_value(argc, argv, 3, "--boundary");
  auto boundary = registry.get(boundary_id);
  if (!boundary) return fail("boundary not found: " + boundary_id);

  warden::KeyedSealService seals(key);
  const std::string seal = seals.create(warden::codec::boundary_content_for_seal(*boundary));
  if (seal.empty()) return fail("seal service refused to sign");
  std::cout << seal << "\n";
  return kExitOk;
}

int cmd_store_verify(int argc, char** argv) {
  warden::SealKey key{};
  std::string error;
  if (!resolve_key(argc, argv, key, error)) return fail(error);

  const std::string path = arg_value(argc, argv, 3, "--store");
  const std::string collection = arg_value(argc, argv, 3, "--collection");
  if (path.empty() || collection.empty()) return fail("--store and --collection are required");

  warden::FileRecordStore store(path);
  auto doc = store.load();
  if (!doc) return fail("cannot read " + path);

  warden::KeyedSealService seals(key);
  auto records = warden::open_sealed_document(*doc, collection, seals, true);
  if (!records.ok()) {
    std::cout << "{\"ok\":false,\"error\":\"" << warden::to_string(records.error)
              << "\",\"message\":\"" << warden::jsonlite::escape(records.message) << "\"}\n";
    return kExitCompromised;
  }
  std::cout << "{\"ok\":true,\"records\":" << records.value->size() << "}\n";
  return kExitOk;
}

int cmd_audit_verify(int argc, char** argv, const warden::WardenConfig& cfg) {
  std::string path = arg_value(argc, argv, 3, "--log");
  if (path.empty()) path = cfg.audit_log_path;
  if (path.empty()) return fail("--log is required");

  const auto verdict = warden::verify_ndjson_file(path);
  std::cout << "{\"ok\":" << (verdict.ok ? "true" : "false")
            << ",\"entries_checked\":" << verdict.entries_checked
            << ",\"first_bad_sequence\":" << verdict.first_bad_sequence
            << ",\"error\":\"" << warden::jsonlite::escape(verdict.error) << "\"}\n";
  return verdict.ok ? kExitOk : kExitCompromised;
}

}  // namespace

int main(int argc, char** argv) {
  const std::string cmd = argc >= 2 ? argv[1] : "";
  if (cmd.empty() || cmd.rfind("--", 0) == 0) {
    std::cerr << "usage: warden <version|boundary verify|boundary seal|store verify|"
                 "audit verify> [options]\n";
    return kExitError;
  }

  std::vector<std::string> warnings;
  warden::WardenConfig cfg;
  const std::string config_path = arg_value(argc, argv, 2, "--config");
  if (!config_path.empty()) {
    std::string text;
    if (!read_file(config_path, text)) return fail("cannot read " + config_path);
    std::string error;
    cfg = warden::config_from_json(text, &error, &warnings);
    if (!error.empty()) return fail("config: " + error);
  }
  cfg = warden::config_from_env(cfg, &warnings);
  for (const auto& w : warnings) {
    std::cerr << "{\"config_warning\":\"" << warden::jsonlite::escape(w) << "\"}\n";
  }
  if (!cfg.event_log_path.empty()) warden::set_event_log_path(cfg.event_log_path);

  const std::string sub = argc >= 3 ? argv[2] : "";

  if (cmd == "version") {
    std::cout << warden::version::manifest_to_json(warden::version::current_manifest()) << "\n";
    return kExitOk;
  }
  if (cmd == "config") {
    std::cout << cfg.to_json() << "\n";
    return kExitOk;
  }
  if (cmd == "boundary" && sub == "verify") {
    const int rc = cmd_boundary_verify(argc, argv, cfg);
    std::cerr << warden::global_governance_stats().to_json() << "\n";
    return rc;
  }
  if (cmd == "boundary" && sub == "seal") return cmd_boundary_seal(argc, argv);
  if (cmd == "store" && sub == "verify") return cmd_store_verify(argc, argv);
  if (cmd == "audit" && sub == "verify") return cmd_audit_verify(argc, argv, cfg);

  return fail("unknown command: " + cmd + (sub.empty() ? "" : " " + sub));
}
