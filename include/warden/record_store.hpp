#pragma once

// warden/record_store.hpp: Sealed JSON document persistence for the
// crossing and verification record sets.
//
// DOCUMENT FORMAT:
//   {"<collection>":{"<id>":<record>,...},"seal":"<seal>"}
//   where seal = SealService.create(canonical JSON of the records map).
//   Canonical JSON makes save -> load -> save byte-identical.
//
// LOAD-TIME AUTHENTICITY:
//   open_sealed_document() re-verifies the seal unless told not to. A
//   mismatch yields ErrorCode::seal_mismatch and no records.
//
// EXTENSION_POINT: storage_backends
//   Current: local file (atomic tmp + rename) and in-memory.
//   Upgrade: any medium that can store one document atomically.

#include <optional>
#include <string>

#include "warden/jsonlite.hpp"
#include "warden/types.hpp"

namespace warden {

class SealService;

class IRecordStore {
 public:
  virtual ~IRecordStore() = default;

  // Replace the stored document. Returns false on write failure; the
  // previous document is then left untouched.
  virtual bool save(const std::string& document) = 0;

  // nullopt if nothing was ever stored.
  virtual std::optional<std::string> load() const = 0;

  virtual std::string backend_id() const = 0;
};

class FileRecordStore : public IRecordStore {
 public:
  explicit FileRecordStore(std::string path);

  bool save(const std::string& document) override;
  std::optional<std::string> load() const override;
  std::string backend_id() const override { return "file:" + path_; }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

class MemoryRecordStore : public IRecordStore {
 public:
  bool save(const std::string& document) override;
  std::optional<std::string> load() const override;
  std::string backend_id() const override { return "memory"; }

  // Make every subsequent save() fail (fault injection).
  void set_fail_writes(bool fail) { fail_writes_ = fail; }
  uint64_t save_count() const { return save_count_; }

 private:
  std::optional<std::string> document_;
  bool fail_writes_{false};
  uint64_t save_count_{0};
};

// Outcome of loading a component's record set at construction.
struct LoadStatus {
  ErrorCode   error{ErrorCode::none};
  std::string message;
  std::size_t records{0};

  bool ok() const { return error == ErrorCode::none; }
};

// Atomic write: write to a temp file beside `path`, then rename into place.
bool atomic_write_file(const std::string& path, const std::string& data);

Result<std::string> build_sealed_document(const std::string& collection,
                                          const jsonlite::Object& records,
                                          SealService& seals);

// Returns the records map of `collection` (empty if absent).
Result<jsonlite::Object> open_sealed_document(const std::string& document,
                                              const std::string& collection,
                                              const SealService& seals,
                                              bool verify_seal);

}  // namespace warden
