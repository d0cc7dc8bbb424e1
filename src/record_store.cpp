#include "warden/record_store.hpp"

#include "warden/collaborators.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace warden {

namespace {

// Unique temporary filename so concurrent writers never share a temp file.
std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

}  // namespace

bool atomic_write_file(const std::string& path, const std::string& data) {
  const fs::path target(path);
  fs::path dir = target.parent_path();
  if (dir.empty()) dir = ".";
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) return false;

  const std::string tmp = make_tmp_name(dir);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// FileRecordStore
// ---------------------------------------------------------------------------

FileRecordStore::FileRecordStore(std::string path) : path_(std::move(path)) {}

bool FileRecordStore::save(const std::string& document) {
  return atomic_write_file(path_, document);
}

std::optional<std::string> FileRecordStore::load() const {
  std::ifstream ifs(path_, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

// ---------------------------------------------------------------------------
// MemoryRecordStore
// ---------------------------------------------------------------------------

bool MemoryRecordStore::save(const std::string& document) {
  if (fail_writes_) return false;
  document_ = document;
  ++save_count_;
  return true;
}

std::optional<std::string> MemoryRecordStore::load() const { return document_; }

// ---------------------------------------------------------------------------
// Sealed documents
// ---------------------------------------------------------------------------

Result<std::string> build_sealed_document(const std::string& collection,
                                          const jsonlite::Object& records,
                                          SealService& seals) {
  const std::string records_json = jsonlite::to_json(jsonlite::Value{records});
  std::string seal = seals.create(records_json);
  if (seal.empty()) {
    return Result<std::string>::failure(ErrorCode::persistence_failed,
                                        "seal service refused to seal " + collection);
  }
  jsonlite::Object doc;
  doc[collection] = jsonlite::Value{records};
  doc["seal"] = jsonlite::Value{std::move(seal)};
  return Result<std::string>::success(jsonlite::to_json(jsonlite::Value{std::move(doc)}));
}

Result<jsonlite::Object> open_sealed_document(const std::string& document,
                                              const std::string& collection,
                                              const SealService& seals,
                                              bool verify_seal) {
  std::optional<jsonlite::JsonError> err;
  jsonlite::Value root = jsonlite::parse_value(document, &err);
  if (err) {
    return Result<jsonlite::Object>::failure(ErrorCode::json_parse_error, err->message);
  }
  const auto* doc = std::get_if<jsonlite::Object>(&root.v);
  if (!doc) {
    return Result<jsonlite::Object>::failure(ErrorCode::json_parse_error,
                                             "sealed document is not an object");
  }

  jsonlite::Object records;
  if (const auto* r = jsonlite::get_object(*doc, collection)) records = *r;

  if (verify_seal) {
    const std::string seal = jsonlite::get_string(*doc, "seal");
    if (!seals.verify(jsonlite::to_json(jsonlite::Value{records}), seal)) {
      return Result<jsonlite::Object>::failure(
          ErrorCode::seal_mismatch, "seal over " + collection + " does not verify");
    }
  }
  return Result<jsonlite::Object>::success(std::move(records));
}

}  // namespace warden
