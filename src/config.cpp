#include "warden/config.hpp"

#include "warden/jsonlite.hpp"

#include <cstdlib>
#include <optional>

namespace warden {

namespace {

std::optional<double> parse_decay(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const double d = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size()) return std::nullopt;
  if (!(d >= 0.0 && d <= 1.0)) return std::nullopt;
  return d;
}

std::optional<uint64_t> parse_interval(const std::string& s) {
  if (s.empty()) return std::nullopt;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (v == 0) return std::nullopt;
  return static_cast<uint64_t>(v);
}

void warn(std::vector<std::string>* warnings, std::string msg) {
  if (warnings) warnings->push_back(std::move(msg));
}

void apply_decay_value(double& slot, const jsonlite::Object& o, const char* key,
                       std::vector<std::string>* warnings) {
  if (!jsonlite::has_key(o, key)) return;
  const double d = jsonlite::get_double(o, key, -1.0);
  if (d >= 0.0 && d <= 1.0) {
    slot = d;
  } else {
    warn(warnings, std::string("crossing.decay.") + key + " must be a number in [0,1]");
  }
}

void apply_bool(bool& slot, const jsonlite::Object& o, const char* key) {
  if (jsonlite::has_key(o, key)) slot = jsonlite::get_bool(o, key, slot);
}

void apply_string(std::string& slot, const jsonlite::Object& o, const char* key) {
  if (jsonlite::has_key(o, key)) slot = jsonlite::get_string(o, key, slot);
}

}  // namespace

std::string WardenConfig::to_json() const {
  jsonlite::Object decay;
  decay["denied"] = jsonlite::Value{crossing.decay.denied};
  decay["failed"] = jsonlite::Value{crossing.decay.failed};
  decay["unauthorized"] = jsonlite::Value{crossing.decay.unauthorized};

  jsonlite::Object c;
  c["decay"] = jsonlite::Value{std::move(decay)};
  c["enforce_rbac"] = jsonlite::Value{crossing.enforce_rbac};
  c["verify_seal_on_load"] = jsonlite::Value{crossing.verify_seal_on_load};

  jsonlite::Object v;
  v["verifier_id"] = jsonlite::Value{verifier.verifier_id};
  v["reverification_interval_ms"] =
      jsonlite::Value{static_cast<std::uint64_t>(verifier.reverification_interval_ms)};
  v["boundary_schema"] = jsonlite::Value{verifier.boundary_schema};
  v["record_schema"] = jsonlite::Value{verifier.record_schema};
  v["enforce_rbac"] = jsonlite::Value{verifier.enforce_rbac};
  v["verify_seal_on_load"] = jsonlite::Value{verifier.verify_seal_on_load};

  jsonlite::Object o;
  o["crossing"] = jsonlite::Value{std::move(c)};
  o["verifier"] = jsonlite::Value{std::move(v)};
  o["crossing_store_path"] = jsonlite::Value{crossing_store_path};
  o["verification_store_path"] = jsonlite::Value{verification_store_path};
  o["audit_log_path"] = jsonlite::Value{audit_log_path};
  o["event_log_path"] = jsonlite::Value{event_log_path};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

WardenConfig config_from_env(WardenConfig base, std::vector<std::string>* warnings) {
  auto env = [](const char* name) -> std::string {
    const char* v = std::getenv(name);
    return (v && v[0]) ? std::string(v) : std::string();
  };

  if (auto s = env("WARDEN_CROSSING_STORE"); !s.empty()) base.crossing_store_path = s;
  if (auto s = env("WARDEN_VERIFICATION_STORE"); !s.empty()) base.verification_store_path = s;
  if (auto s = env("WARDEN_AUDIT_LOG"); !s.empty()) base.audit_log_path = s;
  if (auto s = env("WARDEN_EVENT_LOG"); !s.empty()) base.event_log_path = s;

  struct DecayVar {
    const char* name;
    double*     slot;
  };
  const DecayVar decay_vars[] = {
    { "WARDEN_DECAY_DENIED",       &base.crossing.decay.denied },
    { "WARDEN_DECAY_FAILED",       &base.crossing.decay.failed },
    { "WARDEN_DECAY_UNAUTHORIZED", &base.crossing.decay.unauthorized },
  };
  for (const auto& dv : decay_vars) {
    const std::string s = env(dv.name);
    if (s.empty()) continue;
    if (auto d = parse_decay(s)) {
      *dv.slot = *d;
    } else {
      warn(warnings, std::string(dv.name) + "=" + s + " is not a number in [0,1]; default kept");
    }
  }

  if (auto s = env("WARDEN_REVERIFY_INTERVAL_MS"); !s.empty()) {
    if (auto v = parse_interval(s)) {
      base.verifier.reverification_interval_ms = *v;
    } else {
      warn(warnings, "WARDEN_REVERIFY_INTERVAL_MS=" + s + " is not a positive integer; default kept");
    }
  }
  return base;
}

WardenConfig config_from_json(const std::string& text, std::string* error,
                              std::vector<std::string>* warnings) {
  WardenConfig cfg;
  std::optional<jsonlite::JsonError> err;
  jsonlite::Value root = jsonlite::parse_value(text, &err);
  const auto* obj = std::get_if<jsonlite::Object>(&root.v);
  if (err || !obj) {
    if (error) *error = err ? err->message : "config root is not an object";
    return cfg;
  }

  if (const auto* c = jsonlite::get_object(*obj, "crossing")) {
    if (const auto* d = jsonlite::get_object(*c, "decay")) {
      apply_decay_value(cfg.crossing.decay.denied, *d, "denied", warnings);
      apply_decay_value(cfg.crossing.decay.failed, *d, "failed", warnings);
      apply_decay_value(cfg.crossing.decay.unauthorized, *d, "unauthorized", warnings);
    }
    apply_bool(cfg.crossing.enforce_rbac, *c, "enforce_rbac");
    apply_bool(cfg.crossing.verify_seal_on_load, *c, "verify_seal_on_load");
  }

  if (const auto* v = jsonlite::get_object(*obj, "verifier")) {
    apply_string(cfg.verifier.verifier_id, *v, "verifier_id");
    apply_string(cfg.verifier.boundary_schema, *v, "boundary_schema");
    apply_string(cfg.verifier.record_schema, *v, "record_schema");
    apply_bool(cfg.verifier.enforce_rbac, *v, "enforce_rbac");
    apply_bool(cfg.verifier.verify_seal_on_load, *v, "verify_seal_on_load");
    if (jsonlite::has_key(*v, "reverification_interval_ms")) {
      const auto ms = jsonlite::get_u64(*v, "reverification_interval_ms", 0);
      if (ms > 0) {
        cfg.verifier.reverification_interval_ms = ms;
      } else {
        warn(warnings, "verifier.reverification_interval_ms must be a positive integer");
      }
    }
  }

  apply_string(cfg.crossing_store_path, *obj, "crossing_store_path");
  apply_string(cfg.verification_store_path, *obj, "verification_store_path");
  apply_string(cfg.audit_log_path, *obj, "audit_log_path");
  apply_string(cfg.event_log_path, *obj, "event_log_path");
  if (error) error->clear();
  return cfg;
}

}  // namespace warden
