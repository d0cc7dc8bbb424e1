#pragma once

// warden/audit.hpp: Hash-chained, append-only evidence ledger shared by the
// crossing protocol and the integrity verifier.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a strictly increasing sequence number.
//   3. CHAINED: entry.digest = BLAKE3("ledger:" + canonical line without the
//      digest field); entry.previous_digest = digest of the entry before it,
//      or 64 zeros for the first entry of a fresh ledger.
//   4. STRUCTURED: the optional mirror file is NDJSON, one canonical entry per
//      line, and can be verified offline with verify_ndjson_file().
//   5. FAIL-SAFE: mirror write failures never fail the governance operation.
//      They increment mirror_failure_count().
//
// Reopening an existing mirror resumes its sequence and chain head, so a
// sequence number is never re-used across process restarts.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden {

enum class EvidenceKind {
  crossing_event,
  trust_decay,
  verification_record,
  violation,
  attestation,
};

std::string to_string(EvidenceKind k);
std::optional<EvidenceKind> evidence_kind_from_string(const std::string& s);

struct EvidenceEntry {
  uint64_t     sequence{0};
  EvidenceKind kind{EvidenceKind::crossing_event};
  std::string  subject_id;         // request id, boundary id, verification id
  uint64_t     timestamp_unix_ms{0};
  std::string  payload_json;       // canonical JSON object
  std::string  previous_digest;
  std::string  digest;
};

inline constexpr const char* kGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

// Canonical single-line JSON of the entry. The digest field is omitted when
// `with_digest` is false (the form that is hashed).
std::string entry_to_json(const EvidenceEntry& e, bool with_digest = true);

struct ChainVerdict {
  bool        ok{false};
  uint64_t    entries_checked{0};
  uint64_t    first_bad_sequence{0};  // 0 when ok
  std::string error;
};

class EvidenceLedger {
 public:
  // mirror_path: NDJSON mirror, created if absent. "" = in-memory only.
  explicit EvidenceLedger(const std::string& mirror_path = "");
  ~EvidenceLedger();

  EvidenceLedger(const EvidenceLedger&) = delete;
  EvidenceLedger& operator=(const EvidenceLedger&) = delete;

  // Append an entry; assigns sequence, digests and (when 0) the timestamp.
  // Never throws. Returns the stored entry.
  EvidenceEntry append(EvidenceKind kind, const std::string& subject_id,
                       const std::string& payload_json,
                       uint64_t timestamp_unix_ms = 0);

  std::vector<EvidenceEntry> entries() const;
  std::vector<EvidenceEntry> entries_of(EvidenceKind kind) const;
  std::vector<EvidenceEntry> entries_for(const std::string& subject_id) const;

  uint64_t size() const;
  std::string head_digest() const;
  uint64_t mirror_failure_count() const;
  const std::string& mirror_path() const { return path_; }

  // Recompute every digest and link of the in-memory chain.
  ChainVerdict verify_chain() const;

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

// Verify a mirrored NDJSON ledger: every line parses, digests recompute,
// sequences increase by one and each entry links to its predecessor.
ChainVerdict verify_ndjson_file(const std::string& path);

}  // namespace warden
