#pragma once

// warden/version.hpp: Version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift across the record store, the evidence ledger
//   and the seal encoding. Any structural change to one of these formats
//   must bump its constant here.

#include <cstdint>
#include <string>

namespace warden::version {

// Version 1 = BLAKE3, 32-byte digests hex-encoded to 64 chars, with the
// "ledger:", "payload:" and "boundary:" domain prefixes.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Version 1 = {"<collection>":{id:record},"seal":...} canonical JSON.
constexpr uint32_t RECORD_STORE_FORMAT_VERSION = 1;

// Version 1 = NDJSON {seq,kind,subject_id,timestamp_unix_ms,payload,prev,digest}.
constexpr uint32_t LEDGER_FORMAT_VERSION = 1;

// Version 1 = "blake3-keyed:v1:<hex>".
constexpr uint32_t SEAL_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t record_store_format{RECORD_STORE_FORMAT_VERSION};
  uint32_t ledger_format{LEDGER_FORMAT_VERSION};
  uint32_t seal_format{SEAL_FORMAT_VERSION};
  std::string semver;           // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace warden::version
