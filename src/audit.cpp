#include "warden/audit.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/types.hpp"

#include <cstdio>
#include <fstream>
#include <mutex>
#include <string>

namespace warden {

std::string to_string(EvidenceKind k) {
  switch (k) {
    case EvidenceKind::crossing_event:      return "crossing_event";
    case EvidenceKind::trust_decay:         return "trust_decay";
    case EvidenceKind::verification_record: return "verification_record";
    case EvidenceKind::violation:           return "violation";
    case EvidenceKind::attestation:         return "attestation";
  }
  return "unknown";
}

std::optional<EvidenceKind> evidence_kind_from_string(const std::string& s) {
  if (s == "crossing_event")      return EvidenceKind::crossing_event;
  if (s == "trust_decay")         return EvidenceKind::trust_decay;
  if (s == "verification_record") return EvidenceKind::verification_record;
  if (s == "violation")           return EvidenceKind::violation;
  if (s == "attestation")         return EvidenceKind::attestation;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Entry <-> JSON
// ---------------------------------------------------------------------------

namespace {

jsonlite::Value payload_value(const std::string& payload_json) {
  std::optional<jsonlite::JsonError> err;
  jsonlite::Value v = jsonlite::parse_value(payload_json, &err);
  if (err) return jsonlite::Value{payload_json};
  return v;
}

}  // namespace

std::string entry_to_json(const EvidenceEntry& e, bool with_digest) {
  jsonlite::Object o;
  o["seq"] = jsonlite::Value{static_cast<std::uint64_t>(e.sequence)};
  o["kind"] = jsonlite::Value{to_string(e.kind)};
  o["subject_id"] = jsonlite::Value{e.subject_id};
  o["timestamp_unix_ms"] = jsonlite::Value{static_cast<std::uint64_t>(e.timestamp_unix_ms)};
  o["payload"] = payload_value(e.payload_json);
  o["prev"] = jsonlite::Value{e.previous_digest};
  if (with_digest) o["digest"] = jsonlite::Value{e.digest};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

// ---------------------------------------------------------------------------
// EvidenceLedger
// ---------------------------------------------------------------------------

struct EvidenceLedger::Impl {
  mutable std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t base_seq{0};
  std::string base_digest{kGenesisDigest};
  std::string last_digest{kGenesisDigest};
  uint64_t mirror_failures{0};
  std::vector<EvidenceEntry> entries;
};

namespace {

// Recover sequence and chain head from the last line of an existing mirror.
void resume_from_mirror(const std::string& path, uint64_t& seq, std::string& digest) {
  std::ifstream in(path);
  if (!in) return;
  std::string line, last;
  while (std::getline(in, line)) {
    if (!line.empty()) last = line;
  }
  if (last.empty()) return;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(last, &err);
  if (err) return;
  const std::string d = jsonlite::get_string(obj, "digest");
  if (d.size() != 64) return;
  seq = jsonlite::get_u64(obj, "seq");
  digest = d;
}

}  // namespace

EvidenceLedger::EvidenceLedger(const std::string& mirror_path)
    : path_(mirror_path), impl_(std::make_unique<Impl>()) {
  if (!path_.empty()) {
    resume_from_mirror(path_, impl_->seq, impl_->last_digest);
    impl_->base_seq = impl_->seq;
    impl_->base_digest = impl_->last_digest;
    impl_->file = std::fopen(path_.c_str(), "a");
    if (!impl_->file) ++impl_->mirror_failures;
  }
}

EvidenceLedger::~EvidenceLedger() {
  if (impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

EvidenceEntry EvidenceLedger::append(EvidenceKind kind, const std::string& subject_id,
                                     const std::string& payload_json,
                                     uint64_t timestamp_unix_ms) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  EvidenceEntry e;
  e.sequence = ++impl_->seq;
  e.kind = kind;
  e.subject_id = subject_id;
  e.timestamp_unix_ms = timestamp_unix_ms ? timestamp_unix_ms : now_unix_ms();
  {
    std::optional<jsonlite::JsonError> err;
    const std::string canon = jsonlite::canonicalize_json(payload_json, &err);
    e.payload_json = err ? payload_json : canon;
  }
  e.previous_digest = impl_->last_digest;
  e.digest = ledger_entry_hash(entry_to_json(e, false));
  impl_->last_digest = e.digest;
  impl_->entries.push_back(e);

  if (impl_->file) {
    const std::string line = entry_to_json(e) + "\n";
    std::fseek(impl_->file, 0, SEEK_END);
    const bool written =
        std::fwrite(line.data(), 1, line.size(), impl_->file) == line.size();
    std::fflush(impl_->file);
    if (!written) ++impl_->mirror_failures;
  }
  return e;
}

std::vector<EvidenceEntry> EvidenceLedger::entries() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entries;
}

std::vector<EvidenceEntry> EvidenceLedger::entries_of(EvidenceKind kind) const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  std::vector<EvidenceEntry> out;
  for (const auto& e : impl_->entries) {
    if (e.kind == kind) out.push_back(e);
  }
  return out;
}

std::vector<EvidenceEntry> EvidenceLedger::entries_for(const std::string& subject_id) const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  std::vector<EvidenceEntry> out;
  for (const auto& e : impl_->entries) {
    if (e.subject_id == subject_id) out.push_back(e);
  }
  return out;
}

uint64_t EvidenceLedger::size() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entries.size();
}

std::string EvidenceLedger::head_digest() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->last_digest;
}

uint64_t EvidenceLedger::mirror_failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->mirror_failures;
}

ChainVerdict EvidenceLedger::verify_chain() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  ChainVerdict v;
  uint64_t expected_seq = impl_->base_seq + 1;
  std::string prev = impl_->base_digest;
  for (const auto& e : impl_->entries) {
    if (e.sequence != expected_seq) {
      v.first_bad_sequence = e.sequence;
      v.error = "sequence gap at " + std::to_string(e.sequence);
      return v;
    }
    if (e.previous_digest != prev) {
      v.first_bad_sequence = e.sequence;
      v.error = "broken link at " + std::to_string(e.sequence);
      return v;
    }
    if (!digest_equal(ledger_entry_hash(entry_to_json(e, false)), e.digest)) {
      v.first_bad_sequence = e.sequence;
      v.error = "digest mismatch at " + std::to_string(e.sequence);
      return v;
    }
    prev = e.digest;
    ++expected_seq;
    ++v.entries_checked;
  }
  v.ok = true;
  return v;
}

// ---------------------------------------------------------------------------
// Offline verification
// ---------------------------------------------------------------------------

ChainVerdict verify_ndjson_file(const std::string& path) {
  ChainVerdict v;
  std::ifstream in(path);
  if (!in) {
    v.error = "cannot open " + path;
    return v;
  }

  std::string line;
  std::string prev = kGenesisDigest;
  uint64_t prev_seq = 0;
  bool first = true;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(line, &err);
    const uint64_t seq = err ? 0 : jsonlite::get_u64(obj, "seq");
    if (err) {
      v.first_bad_sequence = prev_seq + 1;
      v.error = "unparseable line after sequence " + std::to_string(prev_seq) +
                ": " + err->message;
      return v;
    }
    if (!evidence_kind_from_string(jsonlite::get_string(obj, "kind"))) {
      v.first_bad_sequence = seq;
      v.error = "unknown entry kind at " + std::to_string(seq);
      return v;
    }
    if (!first && seq != prev_seq + 1) {
      v.first_bad_sequence = seq;
      v.error = "sequence gap at " + std::to_string(seq);
      return v;
    }
    // The first line anchors the chain: a fresh ledger starts at genesis.
    if (first && seq == 1) prev = kGenesisDigest;
    else if (first) prev = jsonlite::get_string(obj, "prev");
    if (jsonlite::get_string(obj, "prev") != prev) {
      v.first_bad_sequence = seq;
      v.error = "broken link at " + std::to_string(seq);
      return v;
    }
    const std::string digest = jsonlite::get_string(obj, "digest");
    obj.erase("digest");
    if (!digest_equal(ledger_entry_hash(jsonlite::to_json(jsonlite::Value{obj})), digest)) {
      v.first_bad_sequence = seq;
      v.error = "digest mismatch at " + std::to_string(seq);
      return v;
    }
    prev = digest;
    prev_seq = seq;
    first = false;
    ++v.entries_checked;
  }
  v.ok = true;
  return v;
}

}  // namespace warden
