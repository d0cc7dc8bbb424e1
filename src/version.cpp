#include "warden/version.hpp"

#include "warden/jsonlite.hpp"

#ifndef WARDEN_VERSION
#define WARDEN_VERSION "0.0.0"
#endif

namespace warden::version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver          = WARDEN_VERSION;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["hash_algorithm"] = jsonlite::Value{static_cast<std::uint64_t>(m.hash_algorithm)};
  o["record_store_format"] = jsonlite::Value{static_cast<std::uint64_t>(m.record_store_format)};
  o["ledger_format"] = jsonlite::Value{static_cast<std::uint64_t>(m.ledger_format)};
  o["seal_format"] = jsonlite::Value{static_cast<std::uint64_t>(m.seal_format)};
  o["semver"] = jsonlite::Value{m.semver};
  o["hash_primitive"] = jsonlite::Value{m.hash_primitive};
  o["build_timestamp"] = jsonlite::Value{m.build_timestamp};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace warden::version
