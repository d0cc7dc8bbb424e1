#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "warden/audit.hpp"
#include "warden/codec.hpp"
#include "warden/collaborators.hpp"
#include "warden/config.hpp"
#include "warden/control_evaluator.hpp"
#include "warden/crossing.hpp"
#include "warden/hash.hpp"
#include "warden/integrity.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/rbac.hpp"
#include "warden/record_store.hpp"
#include "warden/version.hpp"

namespace fs = std::filesystem;
using namespace warden;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

// ============================================================================
// Fixtures
// ============================================================================

SealKey test_key(uint8_t seed = 7) {
  SealKey k{};
  for (std::size_t i = 0; i < k.size(); ++i) k[i] = static_cast<uint8_t>(seed + i);
  return k;
}

struct Env {
  InMemoryBoundaryRegistry    registry;
  KeyedSealService            seals{test_key()};
  InMemoryAttestationService  attestations{seals};
  SnapshotMutationDetector    mutations;
  RequiredKeysSchemaValidator schemas;
  EvidenceLedger              ledger;
  MemoryRecordStore           crossing_store;
  MemoryRecordStore           verification_store;

  Collaborators collab() {
    return Collaborators{&registry, &seals, &attestations, &mutations, &schemas};
  }
};

Control make_control(const std::string& id, ControlKind kind,
                     std::map<std::string, std::string> params = {}) {
  Control c;
  c.control_id = id;
  c.kind = kind;
  c.name = id;
  c.parameters = std::move(params);
  return c;
}

Boundary make_boundary(const std::string& id, std::vector<Control> controls = {}) {
  Boundary b;
  b.boundary_id = id;
  b.name = "Boundary " + id;
  b.description = "test boundary";
  b.kind = BoundaryKind::data;
  b.classification = Classification::internal;
  b.status = BoundaryStatus::active;
  b.version = "1.0.0";
  b.created_at = "2024-01-01T00:00:00Z";
  b.updated_at = "2024-01-02T00:00:00Z";
  b.controls = std::move(controls);
  return b;
}

CrossingRequest make_request(const std::string& id, const std::string& source,
                             const std::string& target,
                             CrossingKind kind = CrossingKind::data_transfer) {
  CrossingRequest r;
  r.request_id = id;
  r.source_boundary_id = source;
  r.target_boundary_id = target;
  r.kind = kind;
  r.requester_id = "alice";
  r.payload.data = "hello";
  r.payload.content_hash = payload_digest("hello");
  return r;
}

class TokenLimiter : public RateLimiter {
 public:
  explicit TokenLimiter(int tokens) : tokens_(tokens) {}
  bool try_acquire(const std::string&, const std::string&) override {
    ++calls;
    if (tokens_ <= 0) return false;
    --tokens_;
    return true;
  }
  int calls{0};

 private:
  int tokens_;
};

class FixedPredicate : public CrossingPredicate {
 public:
  FixedPredicate(bool ok, std::string detail) : ok_(ok), detail_(std::move(detail)) {}
  PredicateVerdict check(const Control&, const Boundary&, const CrossingRequest&) override {
    return PredicateVerdict{ok_, detail_};
  }

 private:
  bool ok_;
  std::string detail_;
};

class ThrowingPredicate : public CrossingPredicate {
 public:
  PredicateVerdict check(const Control&, const Boundary&, const CrossingRequest&) override {
    throw std::runtime_error("policy engine offline");
  }
};

class FailingExecutor : public CrossingExecutor {
 public:
  ExecutionOutcome perform(const CrossingRequest&) override {
    ExecutionOutcome o;
    o.success = false;
    o.error_message = "transport closed";
    return o;
  }
};

class ThrowingExecutor : public CrossingExecutor {
 public:
  ExecutionOutcome perform(const CrossingRequest&) override {
    throw std::runtime_error("socket reset");
  }
};

std::vector<GovernanceEvent> g_events;
void capture_event(const GovernanceEvent& ev) { g_events.push_back(ev); }

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

// ============================================================================
// Hashing and JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string p = payload_digest("x");
  const std::string l = ledger_entry_hash("x");
  const std::string b = boundary_state_digest("x");
  expect(p.size() == 64 && l.size() == 64 && b.size() == 64, "digests are 64 hex chars");
  expect(p != l && l != b && p != b, "domains produce distinct digests");
  expect(p != blake3_hex("x"), "domain digest differs from the plain digest");
  expect(p == hash_domain("payload:", "x"), "payload domain prefix");
}

void test_keyed_seals() {
  KeyedSealService a(test_key(1));
  KeyedSealService b(test_key(2));
  const std::string seal = a.create("content");
  expect(seal.rfind(KeyedSealService::kSealPrefix, 0) == 0, "seal carries format prefix");
  expect(a.verify("content", seal), "seal verifies under its key");
  expect(!a.verify("content!", seal), "tampered content fails");
  expect(!b.verify("content", seal), "other key fails");
  expect(!a.verify("content", seal.substr(16)),
         "seal without prefix fails");

  SealKey k{};
  expect(!seal_key_from_hex(k, "abcd"), "short key rejected");
  expect(!seal_key_from_hex(k, std::string(64, 'g')), "non-hex key rejected");
  expect(seal_key_from_hex(k, std::string(64, 'A')), "uppercase hex accepted");
  expect(k[0] == 0xAA, "hex decoded");
}

void test_random_ids() {
  const std::string a = random_id("crossing");
  const std::string b = random_id("crossing");
  expect(a.rfind("crossing-", 0) == 0, "id prefix");
  expect(a.size() == std::string("crossing-").size() + 32, "id length");
  expect(a != b, "ids are unique");
}

void test_json_canonicalization() {
  std::optional<jsonlite::JsonError> err;
  const std::string canon =
      jsonlite::canonicalize_json("{ \"b\": 1, \"a\": [true, null, \"x\"] }", &err);
  expect(!err, "valid JSON canonicalizes");
  expect(canon == "{\"a\":[true,null,\"x\"],\"b\":1}", "keys sorted, whitespace removed");

  std::optional<jsonlite::JsonError> dup;
  jsonlite::parse("{\"a\":1,\"a\":2}", &dup);
  expect(dup.has_value() && dup->code == "json_duplicate_key", "duplicate key rejected");

  std::optional<jsonlite::JsonError> bad;
  jsonlite::parse("{\"a\":", &bad);
  expect(bad.has_value(), "truncated JSON rejected");

  std::optional<jsonlite::JsonError> esc;
  auto o = jsonlite::parse("{\"s\":\"caf\\u00e9 \\ud83d\\ude00\"}", &esc);
  expect(!esc, "unicode escapes accepted");
  expect(jsonlite::get_string(o, "s") == "caf\xC3\xA9 \xF0\x9F\x98\x80", "escapes decoded to UTF-8");
  expect(jsonlite::validate_strict("{\"s\":\"\\ud83d\"}").has_value(), "lone surrogate rejected");
  expect(jsonlite::validate_strict("{\"s\":\"\\q\"}").has_value(), "unknown escape rejected");

  std::string deep;
  for (int i = 0; i < 100; ++i) deep += "[";
  for (int i = 0; i < 100; ++i) deep += "]";
  expect(jsonlite::validate_strict(deep).has_value(), "deep nesting rejected");

  expect(jsonlite::format_double(1.0) == "1.0", "doubles keep a fractional digit");
  expect(jsonlite::to_json(jsonlite::parse_value("-3", nullptr)) == "-3.0",
         "negative integers read as doubles");
}

// ============================================================================
// Control evaluator
// ============================================================================

void test_controls_authentication_and_encryption() {
  ControlEvaluator ev;
  const Boundary b = make_boundary("b");
  CrossingRequest req = make_request("r", "a", "b");

  auto auth = make_control("auth", ControlKind::authentication);
  expect(ev.evaluate(auth, b, &req).status == ControlStatus::effective, "requester present");
  req.requester_id.clear();
  expect(ev.evaluate(auth, b, &req).status == ControlStatus::ineffective, "requester missing");

  req.requester_id = "mallory";
  auto allow = make_control("allow", ControlKind::authentication,
                            {{"allowed_requesters", "alice, bob"}});
  expect(ev.evaluate(allow, b, &req).status == ControlStatus::ineffective, "not allow-listed");
  req.requester_id = "bob";
  expect(ev.evaluate(allow, b, &req).status == ControlStatus::effective, "allow-listed");

  auto enc = make_control("enc", ControlKind::encryption);
  expect(ev.evaluate(enc, b, &req).status == ControlStatus::effective, "hash matches");
  req.payload.content_hash = payload_digest("other");
  auto mismatch = ev.evaluate(enc, b, &req);
  expect(mismatch.status == ControlStatus::ineffective, "hash mismatch");
  expect(mismatch.control_id == "enc" && mismatch.kind == ControlKind::encryption,
         "result identifies its control");
  req.payload.content_hash.clear();
  expect(ev.evaluate(enc, b, &req).status == ControlStatus::warning, "hash absent warns");
}

void test_controls_validation_and_filtering() {
  FixedPredicate reject(false, "destination quarantined");
  ThrowingPredicate thrower;
  const Boundary b = make_boundary("b");
  CrossingRequest req = make_request("r", "a", "b", CrossingKind::control_transfer);

  ControlEvaluator plain;
  auto size = make_control("size", ControlKind::validation, {{"max_payload_bytes", "3"}});
  expect(plain.evaluate(size, b, &req).status == ControlStatus::ineffective, "payload too large");
  auto bad_size = make_control("bad", ControlKind::validation, {{"max_payload_bytes", "lots"}});
  expect(plain.evaluate(bad_size, b, &req).status == ControlStatus::degraded, "malformed limit");
  auto attrs = make_control("attrs", ControlKind::validation,
                            {{"required_attributes", "origin"}});
  expect(plain.evaluate(attrs, b, &req).status == ControlStatus::ineffective, "attribute missing");
  req.payload.attributes["origin"] = "etl";
  expect(plain.evaluate(attrs, b, &req).status == ControlStatus::effective, "attribute present");

  auto blocked = make_control("flt", ControlKind::filtering,
                              {{"blocked_kinds", "control_transfer"}});
  expect(plain.evaluate(blocked, b, &req).status == ControlStatus::ineffective, "kind blocked");
  req.kind = CrossingKind::query;
  expect(plain.evaluate(blocked, b, &req).status == ControlStatus::effective, "kind allowed");

  ControlHooks hooks;
  hooks.filter = &reject;
  ControlEvaluator filtered(hooks);
  auto r = filtered.evaluate(make_control("f", ControlKind::filtering), b, &req);
  expect(r.status == ControlStatus::ineffective && r.detail == "destination quarantined",
         "filter predicate rejection carries its detail");

  hooks.filter = &thrower;
  ControlEvaluator throwing(hooks);
  auto t = throwing.evaluate(make_control("f", ControlKind::filtering), b, &req);
  expect(t.status == ControlStatus::ineffective, "throwing predicate is ineffective");
  expect(t.detail.find("policy engine offline") != std::string::npos, "exception text kept");

  expect(plain.evaluate(make_control("m", ControlKind::monitoring), b, &req).status ==
             ControlStatus::effective, "monitoring effective");
  expect(plain.evaluate(make_control("l", ControlKind::logging), b, &req).status ==
             ControlStatus::effective, "logging effective");
}

void test_controls_hooks() {
  TokenLimiter limiter(1);
  FixedPredicate allow(true, "");
  FixedPredicate deny(false, "");
  const Boundary b = make_boundary("b");
  const CrossingRequest req = make_request("r", "a", "b");

  ControlEvaluator none;
  expect(none.evaluate(make_control("rl", ControlKind::rate_limiting), b, &req).status ==
             ControlStatus::warning, "no limiter warns");
  expect(none.evaluate(make_control("iso", ControlKind::isolation), b, &req).status ==
             ControlStatus::warning, "no isolation predicate warns");
  auto authz = none.evaluate(make_control("az", ControlKind::authorization), b, &req);
  expect(authz.status == ControlStatus::effective, "authorization deferred");
  expect(authz.detail == "deferred to explicit authorization", "deferral detail");

  ControlHooks hooks;
  hooks.rate_limiter = &limiter;
  hooks.isolation = &allow;
  hooks.authorization = &deny;
  ControlEvaluator ev(hooks);
  const auto rl = make_control("rl", ControlKind::rate_limiting);
  expect(ev.evaluate(rl, b, &req).status == ControlStatus::effective, "first token");
  expect(ev.evaluate(rl, b, &req).status == ControlStatus::ineffective, "limit reached");
  expect(ev.evaluate(make_control("iso", ControlKind::isolation), b, &req).status ==
             ControlStatus::effective, "isolation predicate passes");
  expect(ev.evaluate(make_control("az", ControlKind::authorization), b, &req).status ==
             ControlStatus::ineffective, "authorization predicate denies");
}

void test_controls_verification_mode() {
  TokenLimiter limiter(0);
  ControlHooks hooks;
  hooks.rate_limiter = &limiter;
  ControlEvaluator ev(hooks);
  const Boundary b = make_boundary("b");

  auto auth = ev.evaluate(make_control("a", ControlKind::authentication), b, nullptr);
  expect(auth.status == ControlStatus::effective, "auth configured");
  expect(auth.detail == "Authentication control is properly configured", "auth detail");
  expect(ev.evaluate(make_control("a", ControlKind::authentication, {{"allowed_requesters", " "}}),
                     b, nullptr).status == ControlStatus::degraded, "empty allow-list degraded");
  expect(ev.evaluate(make_control("e", ControlKind::encryption, {{"min_key_bits", "64"}}),
                     b, nullptr).status == ControlStatus::degraded, "short key degraded");
  expect(ev.evaluate(make_control("e", ControlKind::encryption, {{"min_key_bits", "x"}}),
                     b, nullptr).status == ControlStatus::ineffective, "malformed key bits");
  expect(ev.evaluate(make_control("e", ControlKind::encryption, {{"min_key_bits", "256"}}),
                     b, nullptr).status == ControlStatus::effective, "strong key");
  expect(ev.evaluate(make_control("v", ControlKind::validation, {{"max_payload_bytes", "0"}}),
                     b, nullptr).status == ControlStatus::ineffective, "zero limit");
  expect(ev.evaluate(make_control("f", ControlKind::filtering, {{"blocked_kinds", "teleport"}}),
                     b, nullptr).status == ControlStatus::degraded, "unknown blocked kind");
  expect(ev.evaluate(make_control("r", ControlKind::rate_limiting, {{"max_requests", "10"}}),
                     b, nullptr).status == ControlStatus::effective, "rate limit configured");
  expect(limiter.calls == 0, "verification mode never consults the limiter");
}

// ============================================================================
// Crossing protocol
// ============================================================================

void expect_trail_consistent(const CrossingRequest& r, const std::string& label) {
  expect(!r.audit_trail.empty(), label + ": trail not empty");
  for (std::size_t i = 1; i < r.audit_trail.size(); ++i) {
    expect(r.audit_trail[i - 1].timestamp_unix_ms <= r.audit_trail[i].timestamp_unix_ms,
           label + ": timestamps non-decreasing");
  }
  expect(r.audit_trail.back().event_type == to_string(r.status),
         label + ": last event matches status");
}

void test_scenario_a_missing_requester() {
  Env env;
  env.registry.put(make_boundary("b1", {make_control("auth", ControlKind::authentication)}));
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);

  CrossingRequest req = make_request("req-a", "b0", "b1");
  req.requester_id.clear();
  auto res = proto.submit(req);
  expect(res.ok(), "submit returns the record");
  expect(res.value->status == CrossingStatus::validation_failed, "validation_failed");
  expect(res.value->audit_trail.size() == 2, "two events");
  expect(res.value->audit_trail[0].event_type == "request_received", "first event");
  expect(res.value->audit_trail[1].event_type == "validation_failed", "second event");
  expect(res.value->validation_failure_reason.rfind("auth: ", 0) == 0,
         "reason names the failing control");
  expect_trail_consistent(*res.value, "scenario A");
}

void test_scenario_b_critical_payload() {
  Env env;
  env.registry.put(make_boundary("b1"));
  env.registry.put(make_boundary("b2", {make_control("auth", ControlKind::authentication),
                                        make_control("enc", ControlKind::encryption),
                                        make_control("log", ControlKind::logging)}));
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);

  CrossingRequest req = make_request("req-b", "b1", "b2");
  req.payload.classification = Classification::critical;
  auto sub = proto.submit(req);
  expect(sub.ok() && sub.value->status == CrossingStatus::authorization_pending, "pending");
  expect(sub.value->applied_controls.size() == 3, "all controls applied");
  expect(sub.value->control_results.size() == 3, "all controls evaluated");

  auto auth = proto.authorize("req-b", "carol", AuthorizationDecision::allow, "ok");
  expect(auth.ok() && auth.value->status == CrossingStatus::authorized, "authorized");
  expect(auth.value->authorization->authorizer_id == "carol", "authorizer recorded");

  auto exe = proto.execute("req-b");
  expect(exe.ok(), "execute ok");
  const CrossingRequest& done = *exe.value;
  expect(done.status == CrossingStatus::completed, "completed");
  expect(done.execution->success, "simulated success");
  expect(done.execution->result_data.at("simulated") == "true", "simulation flagged");
  expect(near(done.impact->trust_impact, -0.1), "critical trust impact");
  expect(done.impact->security_impact == ImpactLevel::high, "critical security impact");
  expect(to_string(done.impact->security_impact) == "high", "impact level string");

  const std::vector<std::string> expected = {"request_received", "validated",
                                             "authorization_pending", "authorized",
                                             "executing", "impact_assessed", "completed"};
  expect(done.audit_trail.size() == expected.size(), "seven events");
  for (std::size_t i = 0; i < expected.size(); ++i) {
    expect(done.audit_trail[i].event_type == expected[i], "event " + expected[i]);
  }
  expect_trail_consistent(done, "scenario B");
  expect(env.ledger.entries_of(EvidenceKind::crossing_event).size() == 7,
         "every event mirrored to the ledger");
}

void test_scenario_c_denial_decay() {
  Env env;
  env.registry.put(make_boundary("src"));
  env.registry.put(make_boundary("dst"));
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);

  expect(proto.submit(make_request("req-c", "src", "dst")).ok(), "submit");
  auto res = proto.authorize("req-c", "carol", AuthorizationDecision::deny, "policy");
  expect(res.ok() && res.value->status == CrossingStatus::denied, "denied");
  expect(res.value->audit_trail.back().details == "policy", "reason recorded");

  const auto decay = proto.trust_decay_events();
  expect(decay.size() == 2, "two decay events");
  expect(decay[0].actor_id == "src" && decay[1].actor_id == "dst", "both boundaries decayed");
  expect(near(decay[0].magnitude, 0.05) && near(decay[1].magnitude, 0.05), "denied magnitude");
  expect(decay[0].reason == "denied", "decay reason");
  expect(env.ledger.entries_of(EvidenceKind::trust_decay).size() == 2, "decay ledgered");
  expect_trail_consistent(*res.value, "scenario C");
}

void test_rate_limit_charged_last() {
  Env env;
  env.registry.put(make_boundary("b", {make_control("rl", ControlKind::rate_limiting),
                                       make_control("auth", ControlKind::authentication,
                                                    {{"allowed_requesters", "alice"}})}));
  TokenLimiter limiter(5);
  ControlHooks hooks;
  hooks.rate_limiter = &limiter;
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store, {}, hooks);

  CrossingRequest stranger = make_request("r1", "a", "b");
  stranger.requester_id = "mallory";
  auto rejected = proto.submit(stranger);
  expect(rejected.value->status == CrossingStatus::validation_failed, "stranger rejected");
  expect(limiter.calls == 0, "rejected request consumes no rate-limit unit");
  expect(rejected.value->control_results.size() == 1 &&
             rejected.value->control_results[0].control_id == "auth", "limiter never reached");

  auto admitted = proto.submit(make_request("r2", "a", "b"));
  expect(admitted.value->status == CrossingStatus::authorization_pending, "alice admitted");
  expect(limiter.calls == 1, "admitted request consumes one unit");
  const auto& results = admitted.value->control_results;
  expect(results.size() == 2 && results[0].control_id == "auth" && results[1].control_id == "rl",
         "rate limiting evaluated after the other controls");
  expect(admitted.value->applied_controls.front() == "rl", "applied in declaration order");
}

void test_missing_boundary_fails_crossing() {
  Env env;
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);
  auto res = proto.submit(make_request("req-x", "a", "nowhere"));
  expect(res.ok(), "missing boundary is a recorded outcome");
  expect(res.value->status == CrossingStatus::failed, "failed");
  expect(res.value->execution->error_code == "BOUNDARY_NOT_FOUND", "error code");
  expect(res.value->audit_trail.size() == 2, "trail closed");
  expect_trail_consistent(*res.value, "missing boundary");
}

void test_illegal_transitions() {
  Env env;
  env.registry.put(make_boundary("b"));
  env.registry.put(make_boundary("guarded", {make_control("auth", ControlKind::authentication)}));
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);

  expect(proto.submit(make_request("r1", "a", "b")).ok(), "submit r1");
  expect(proto.execute("r1").error == ErrorCode::illegal_transition, "execute before authorize");
  expect(proto.authorize("r1", "carol", AuthorizationDecision::allow).ok(), "authorize");
  expect(proto.authorize("r1", "carol", AuthorizationDecision::deny).error ==
             ErrorCode::illegal_transition, "authorization is single-assignment");
  expect(proto.execute("r1").ok(), "execute");
  const std::size_t trail = proto.get("r1")->audit_trail.size();
  expect(proto.execute("r1").error == ErrorCode::illegal_transition, "execute after terminal");
  expect(proto.authorize("r1", "carol", AuthorizationDecision::allow).error ==
             ErrorCode::illegal_transition, "authorize after terminal");
  expect(proto.get("r1")->audit_trail.size() == trail, "illegal calls append nothing");
  expect(proto.get("r1")->status == CrossingStatus::completed, "status unchanged");

  CrossingRequest anon = make_request("r2", "a", "guarded");
  anon.requester_id.clear();
  expect(proto.submit(anon).value->status == CrossingStatus::validation_failed, "r2 rejected");
  expect(proto.authorize("r2", "carol", AuthorizationDecision::allow).error ==
             ErrorCode::illegal_transition, "authorize after validation_failed");

  expect(proto.submit(make_request("r1", "a", "b")).error == ErrorCode::invalid_argument,
         "duplicate id rejected");
  CrossingRequest stale = make_request("r3", "a", "b");
  stale.status = CrossingStatus::authorized;
  expect(proto.submit(stale).error == ErrorCode::illegal_transition, "non-fresh request rejected");

  expect(proto.authorize("ghost", "carol", AuthorizationDecision::allow).error ==
             ErrorCode::not_found, "unknown request");
  expect(proto.execute("ghost").error == ErrorCode::not_found, "unknown request on execute");
  expect(proto.get_audit_trail("ghost").error == ErrorCode::not_found, "unknown trail");
}

void test_execution_failures() {
  Env env;
  env.registry.put(make_boundary("s"));
  env.registry.put(make_boundary("t"));

  FailingExecutor failing;
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store, {}, {}, &failing);
  expect(proto.submit(make_request("f1", "s", "t")).ok(), "submit");
  expect(proto.authorize("f1", "carol", AuthorizationDecision::allow).ok(), "authorize");
  auto res = proto.execute("f1", "runner");
  expect(res.ok() && res.value->status == CrossingStatus::failed, "failed");
  expect(res.value->execution->error_code == "EXECUTION_FAILED", "default failure code");
  expect(near(res.value->impact->trust_impact, -0.03), "internal + failure impact");
  expect_trail_consistent(*res.value, "executor failure");
  const auto decay = proto.trust_decay_events();
  expect(decay.size() == 2 && near(decay[0].magnitude, 0.02), "failure decay");

  Env env2;
  env2.registry.put(make_boundary("s"));
  env2.registry.put(make_boundary("t"));
  ThrowingExecutor thrower;
  CrossingProtocol proto2(env2.collab(), env2.ledger, env2.crossing_store, {}, {}, &thrower);
  expect(proto2.submit(make_request("f2", "s", "t")).ok(), "submit");
  expect(proto2.authorize("f2", "carol", AuthorizationDecision::allow).ok(), "authorize");
  auto thrown = proto2.execute("f2");
  expect(thrown.value->status == CrossingStatus::failed, "exception fails the crossing");
  expect(thrown.value->execution->error_code == "EXECUTION_EXCEPTION", "exception code");
  expect(thrown.value->execution->error_message == "socket reset", "exception message");
}

void test_rbac_on_crossings() {
  Env env;
  env.registry.put(make_boundary("b"));
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);

  expect(proto.submit(make_request("r", "a", "b"), rbac::Role::viewer).error ==
             ErrorCode::unauthorized, "viewer cannot submit");
  expect(proto.size() == 0, "nothing stored");

  expect(proto.submit(make_request("r", "a", "b")).ok(), "operator submits");
  auto denied = proto.authorize("r", "intern", AuthorizationDecision::allow, "",
                                rbac::Role::auditor);
  expect(denied.error == ErrorCode::unauthorized, "auditor cannot authorize");
  expect(proto.get("r")->status == CrossingStatus::authorization_pending, "status unchanged");
  const auto decay = proto.trust_decay_events();
  expect(decay.size() == 1 && decay[0].actor_id == "intern", "decay against the authorizer");
  expect(near(decay[0].magnitude, 0.1) && decay[0].reason == "unauthorized",
         "unauthorized magnitude");

  expect(proto.authorize("r", "carol", AuthorizationDecision::allow).ok(), "operator authorizes");
  expect(proto.execute("r").ok(), "operator executes");
  const uint64_t ledger_before = env.ledger.size();
  const uint64_t saves_before = env.crossing_store.save_count();
  const std::string doc_before = *env.crossing_store.load();
  auto late = proto.authorize("r", "mallory", AuthorizationDecision::allow, "",
                              rbac::Role::viewer);
  expect(late.error == ErrorCode::illegal_transition, "terminal request rejects authorize first");
  expect(proto.execute("r", "mallory", rbac::Role::viewer).error == ErrorCode::illegal_transition,
         "terminal request rejects execute first");
  expect(proto.trust_decay_events().size() == 1, "no decay for a call on a terminal request");
  expect(env.ledger.size() == ledger_before, "no ledger entry");
  expect(env.crossing_store.save_count() == saves_before &&
             *env.crossing_store.load() == doc_before, "nothing persisted");
  expect(proto.get("r")->status == CrossingStatus::completed, "status unchanged");

  CrossingConfig open;
  open.enforce_rbac = false;
  Env env2;
  env2.registry.put(make_boundary("b"));
  CrossingProtocol relaxed(env2.collab(), env2.ledger, env2.crossing_store, open);
  expect(relaxed.submit(make_request("r", "a", "b"), rbac::Role::viewer).ok(),
         "rbac can be disabled");
}

void test_tether_failure_blocks_mutation() {
  Env env;
  env.registry.put(make_boundary("b"));
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);

  env.seals.revoke_tether(CrossingProtocol::kComponent);
  auto res = proto.submit(make_request("r", "a", "b"));
  expect(res.error == ErrorCode::contract_tether_failed, "tether failure");
  expect(is_fatal(res.error), "tether failure is fatal");
  expect(proto.size() == 0 && env.ledger.size() == 0, "no mutation");
  expect(env.crossing_store.save_count() == 0, "nothing persisted");

  env.seals.restore_tether(CrossingProtocol::kComponent);
  expect(proto.submit(make_request("r", "a", "b")).ok(), "restored tether");
  env.seals.revoke_tether(CrossingProtocol::kComponent);
  expect(proto.authorize("r", "carol", AuthorizationDecision::allow).error ==
             ErrorCode::contract_tether_failed, "authorize checks the tether");
  expect(proto.get("r")->status == CrossingStatus::authorization_pending, "reads still work");
}

void test_persistence_failure_surfaced() {
  Env env;
  env.registry.put(make_boundary("b"));
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);

  env.crossing_store.set_fail_writes(true);
  auto res = proto.submit(make_request("r", "a", "b"));
  expect(res.error == ErrorCode::persistence_failed, "persistence failure surfaced");
  expect(res.value.has_value(), "computed record returned");
  expect(res.value->status == CrossingStatus::authorization_pending, "record is complete");
  expect(proto.get("r").has_value(), "record kept in memory");

  env.crossing_store.set_fail_writes(false);
  expect(proto.authorize("r", "carol", AuthorizationDecision::allow).ok(), "later write succeeds");
  expect(env.crossing_store.load().has_value(), "document stored");
}

void test_attest_and_queries() {
  Env env;
  env.registry.put(make_boundary("a"));
  env.registry.put(make_boundary("b"));
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);

  expect(proto.submit(make_request("r1", "a", "b")).ok(), "r1");
  expect(proto.submit(make_request("r2", "b", "a")).ok(), "r2");
  expect(proto.submit(make_request("r3", "x", "missing")).ok(), "r3");
  expect(proto.authorize("r2", "carol", AuthorizationDecision::allow).ok(), "authorize r2");

  auto att = proto.attest("r1", "auditor-1", {{"reviewed", "yes"}});
  expect(att.ok(), "attest");
  expect(env.attestations.verify(att.value->attestation_id), "attestation verifies");
  expect(proto.get("r1")->attestations.size() == 1, "reference attached");
  expect(proto.get("r1")->status == CrossingStatus::authorization_pending, "status unchanged");
  expect(proto.attest("r1", "v", {}, rbac::Role::viewer).error == ErrorCode::unauthorized,
         "viewer cannot attest");
  expect(proto.attest("ghost", "auditor-1", {}).error == ErrorCode::not_found, "unknown request");
  expect(env.ledger.entries_of(EvidenceKind::attestation).size() == 1, "attestation ledgered");

  expect(proto.list().size() == 3, "list all");
  expect(proto.list(std::string("a")).size() == 2, "boundary filter matches source or target");
  expect(proto.list(std::nullopt, CrossingStatus::authorized).size() == 1, "status filter");
  expect(proto.list(std::nullopt, CrossingStatus::failed).size() == 1, "failed filter");

  const std::size_t before = proto.get("r1")->audit_trail.size();
  auto trail = proto.get_audit_trail("r1");
  expect(trail.ok() && trail.value->size() == before, "trail query");
  expect(proto.get("r1")->audit_trail.size() == before, "queries do not mutate");
}

void test_impact_assessment() {
  ExecutionOutcome ok;
  ok.success = true;
  ExecutionOutcome bad;

  CrossingRequest pub = make_request("r", "a", "b", CrossingKind::query);
  pub.payload.classification = Classification::public_;
  auto i = assess_impact(pub, ok);
  expect(near(i.trust_impact, 0.0) && i.security_impact == ImpactLevel::none, "public query");
  expect(i.performance_impact == ImpactLevel::low, "small payload low performance impact");

  CrossingRequest ctl = make_request("r", "a", "b", CrossingKind::control_transfer);
  i = assess_impact(ctl, ok);
  expect(near(i.trust_impact, -0.06), "control transfer of internal payload");
  expect(i.security_impact == ImpactLevel::high && i.governance_impact == ImpactLevel::high,
         "control transfer always high");

  CrossingRequest authn = make_request("r", "a", "b", CrossingKind::authentication);
  authn.payload.classification = Classification::confidential;
  i = assess_impact(authn, bad);
  expect(i.security_impact == ImpactLevel::medium, "authentication at least medium");
  expect(i.governance_impact == ImpactLevel::low, "confidential governance low");
  expect(near(i.trust_impact, -0.05), "confidential + failure");

  CrossingRequest big = make_request("r", "a", "b");
  big.payload.data.assign(70 * 1024, 'x');
  expect(assess_impact(big, ok).performance_impact == ImpactLevel::medium, "70KB medium");
  big.payload.data.assign(2 * 1024 * 1024, 'x');
  expect(assess_impact(big, ok).performance_impact == ImpactLevel::high, "2MB high");
  big.payload.data.clear();
  expect(assess_impact(big, ok).performance_impact == ImpactLevel::none, "empty none");
}

// ============================================================================
// Persistence
// ============================================================================

void test_crossing_store_round_trip() {
  Env env;
  env.registry.put(make_boundary("a"));
  env.registry.put(make_boundary("b"));
  {
    CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);
    CrossingRequest req = make_request("r1", "a", "b");
    req.payload.classification = Classification::restricted;
    req.payload.attributes["k"] = "v \"quoted\"";
    expect(proto.submit(req).ok(), "submit");
    expect(proto.authorize("r1", "carol", AuthorizationDecision::allow, "fine").ok(), "authorize");
    expect(proto.execute("r1").ok(), "execute");
    expect(proto.submit(make_request("r2", "b", "a")).ok(), "submit r2");
    expect(proto.submit(make_request("r3", "a", "b")).ok(), "submit r3");
    expect(proto.authorize("r3", "carol", AuthorizationDecision::deny, "policy").ok(), "deny r3");
    expect(proto.trust_decay_events().size() == 2, "denial decayed both boundaries");
  }
  const std::string doc = *env.crossing_store.load();

  auto records = open_sealed_document(doc, CrossingProtocol::kCollection, env.seals, true);
  expect(records.ok() && records.value->size() == 3, "sealed document opens");
  jsonlite::Object reencoded;
  for (const auto& [id, value] : *records.value) {
    auto decoded = codec::decode_crossing(std::get<jsonlite::Object>(value.v));
    expect(decoded.ok(), "record decodes");
    reencoded[id] = codec::encode(*decoded.value);
  }
  auto rebuilt = build_sealed_document(CrossingProtocol::kCollection, reencoded, env.seals);
  expect(rebuilt.ok() && *rebuilt.value == doc, "save -> load -> save is byte-identical");

  CrossingProtocol reloaded(env.collab(), env.ledger, env.crossing_store);
  expect(reloaded.load_status().ok() && reloaded.load_status().records == 3, "reload");
  auto r1 = reloaded.get("r1");
  expect(r1 && r1->status == CrossingStatus::completed, "status survives reload");
  expect(r1->audit_trail.size() == 7 && r1->impact.has_value(), "trail and impact survive");
  expect(r1->payload.attributes.at("k") == "v \"quoted\"", "payload attributes survive");

  const auto decay = reloaded.trust_decay_events();
  expect(decay.size() == 2, "decay events survive reload");
  expect(decay[0].actor_id == "a" && decay[1].actor_id == "b", "decayed boundaries");
  expect(decay[0].request_id == "r3" && decay[0].reason == "denied", "decay attribution");
  expect(near(decay[0].magnitude, 0.05) && near(decay[1].magnitude, 0.05), "decay magnitude");
  expect(reloaded.get("r3")->trust_decay.size() == 2, "decay stored on the request");
}

void test_seal_verified_on_load() {
  Env env;
  env.registry.put(make_boundary("b"));
  {
    CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);
    expect(proto.submit(make_request("r", "a", "b")).ok(), "submit");
  }

  global_governance_stats().reset();
  KeyedSealService other(test_key(99));
  Collaborators foreign = env.collab();
  foreign.seals = &other;
  CrossingProtocol tampered(foreign, env.ledger, env.crossing_store);
  expect(tampered.load_status().error == ErrorCode::seal_mismatch, "seal mismatch detected");
  expect(tampered.size() == 0, "no records adopted");
  expect(global_governance_stats().store_load_failures.load() == 1, "load failure counted");

  CrossingConfig trusting;
  trusting.verify_seal_on_load = false;
  CrossingProtocol lenient(foreign, env.ledger, env.crossing_store, trusting);
  expect(lenient.load_status().ok() && lenient.size() == 1, "trusted medium loads");

  MemoryRecordStore garbage;
  expect(garbage.save("{not json"), "memory save");
  CrossingProtocol broken(env.collab(), env.ledger, garbage);
  expect(broken.load_status().error == ErrorCode::json_parse_error, "malformed document");
}

void test_failed_load_refuses_mutation() {
  Env env;
  env.registry.put(make_boundary("b"));
  {
    CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);
    expect(proto.submit(make_request("r1", "a", "b")).ok(), "r1");
    expect(proto.submit(make_request("r2", "a", "b")).ok(), "r2");
    expect(proto.submit(make_request("r3", "a", "b")).ok(), "r3");
    IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);
    expect(verifier.verify("b").ok(), "verification stored");
  }
  const std::string crossings_doc = *env.crossing_store.load();
  const std::string verifications_doc = *env.verification_store.load();
  const uint64_t crossing_saves = env.crossing_store.save_count();
  const uint64_t verification_saves = env.verification_store.save_count();
  const uint64_t ledger_before = env.ledger.size();

  KeyedSealService other(test_key(99));
  Collaborators foreign = env.collab();
  foreign.seals = &other;

  CrossingProtocol proto(foreign, env.ledger, env.crossing_store);
  expect(proto.load_status().error == ErrorCode::seal_mismatch, "crossing load failed");
  auto refused = proto.submit(make_request("r4", "a", "b"));
  expect(refused.error == ErrorCode::store_unavailable, "submit refused");
  expect(!refused.value.has_value() && is_fatal(refused.error), "refusal is fatal, no record");
  expect(proto.authorize("r1", "carol", AuthorizationDecision::allow).error ==
             ErrorCode::store_unavailable, "authorize refused");
  expect(proto.size() == 0, "nothing adopted");
  expect(proto.list().empty(), "reads still work");

  IntegrityVerifier verifier(foreign, env.ledger, env.verification_store);
  expect(verifier.load_status().error == ErrorCode::seal_mismatch, "verification load failed");
  expect(verifier.verify("b").error == ErrorCode::store_unavailable, "verify refused");
  expect(verifier.report_violation("b", ViolationKind::seal_broken, "key rotated",
                                   Severity::high).error == ErrorCode::store_unavailable,
         "report refused");

  expect(env.crossing_store.save_count() == crossing_saves, "crossing store not written");
  expect(*env.crossing_store.load() == crossings_doc, "crossing document byte-unchanged");
  expect(env.verification_store.save_count() == verification_saves,
         "verification store not written");
  expect(*env.verification_store.load() == verifications_doc,
         "verification document byte-unchanged");
  expect(env.ledger.size() == ledger_before, "nothing ledgered");

  MemoryRecordStore garbage;
  expect(garbage.save("{not json"), "memory save");
  CrossingProtocol broken(env.collab(), env.ledger, garbage);
  expect(broken.submit(make_request("r5", "a", "b")).error == ErrorCode::store_unavailable,
         "malformed document also refuses");
  expect(*garbage.load() == "{not json", "malformed document left for repair");

  CrossingProtocol healthy(env.collab(), env.ledger, env.crossing_store);
  expect(healthy.load_status().ok() && healthy.size() == 3, "all history still loads");
}

void test_file_record_store() {
  const fs::path dir = fresh_dir("warden_store_test");
  const std::string path = (dir / "crossings.json").string();
  FileRecordStore store(path);
  expect(!store.load().has_value(), "missing file loads nothing");
  expect(store.save("{\"a\":1}"), "save");
  expect(store.save("{\"a\":2}"), "overwrite");
  expect(store.load().value() == "{\"a\":2}", "latest document");
  expect(store.backend_id() == "file:" + path, "backend id");

  // The parent "directory" is a regular file.
  FileRecordStore unwritable((dir / "crossings.json" / "nested.json").string());
  expect(!unwritable.save("{}"), "write below a regular file fails");
  expect(store.load().value() == "{\"a\":2}", "failed write leaves the document intact");
  fs::remove_all(dir);
}

// ============================================================================
// Integrity verifier
// ============================================================================

Boundary signed_boundary(KeyedSealService& seals, const std::string& id,
                         std::vector<Control> controls) {
  Boundary b = make_boundary(id, std::move(controls));
  b.signature = seals.create(codec::boundary_content_for_seal(b));
  return b;
}

void test_comprehensive_intact() {
  Env env;
  env.registry.put(signed_boundary(env.seals, "b", {make_control("auth", ControlKind::authentication)}));
  IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);

  auto res = verifier.verify("b");
  expect(res.ok(), "verify ok");
  const VerificationRecord& r = *res.value;
  expect(r.status == IntegrityStatus::intact, "intact");
  expect(r.total_checks == 9 && r.passed_checks == 9, "1 control + 1 seal + 1 mutation + 6 compliance");
  expect(near(r.confidence, 1.0), "full confidence");
  expect(r.violations.empty() && r.recommendations.empty(), "nothing to report");
  expect(r.seal_checks->at(0).seal_id == "boundary-signature", "self-signature checked");
  expect(r.compliance_checks->at(1).evidence == "Missing fields: None", "required fields evidence");
  expect(r.verifier_id == "system" && r.triggered_by == TriggerSource::manual, "metadata");
  expect(r.next_scheduled_verification_unix_ms == r.timestamp_unix_ms + 86400000,
         "next verification scheduled");
  expect(verifier.verify_record_signature(r), "record signature verifies");

  VerificationRecord edited = r;
  edited.confidence = 0.5;
  expect(!verifier.verify_record_signature(edited), "edited record fails its signature");
  expect(env.ledger.entries_of(EvidenceKind::verification_record).size() == 1, "ledgered");
}

void test_scenario_d_broken_self_signature() {
  Env env;
  Boundary b = make_boundary("b");
  b.signature = std::string(KeyedSealService::kSealPrefix) + std::string(64, '0');
  env.registry.put(b);
  IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);

  auto res = verifier.verify("b", VerificationKind::seal_validation);
  expect(res.ok(), "verify ok");
  const VerificationRecord& r = *res.value;
  expect(!r.control_checks && !r.mutations && !r.compliance_checks, "only seals run");
  expect(r.total_checks == 1 && r.passed_checks == 0 && r.critical_failures == 1, "0/1");
  expect(near(r.confidence, 0.0), "zero confidence");
  expect(r.status == IntegrityStatus::compromised, "compromised");
  expect(r.violations.size() == 1, "one violation");
  expect(r.violations[0].kind == ViolationKind::seal_broken, "seal_broken");
  expect(r.violations[0].severity == Severity::critical, "critical");
  expect(r.violations[0].remediation == "Investigate and recreate seal boundary-signature",
         "remediation text");
  expect(r.recommendations.size() == 2, "seal renewal + redefinition");
  expect(r.recommendations[0].kind == RecommendationKind::seal_renewal, "seal renewal");
  expect(r.recommendations[1].kind == RecommendationKind::boundary_redefinition, "redefine");
  expect(env.ledger.entries_of(EvidenceKind::violation).size() == 1, "violation ledgered");
}

void test_scenario_e_report_on_missing_boundary() {
  Env env;
  IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);
  auto res = verifier.report_violation("ghost", ViolationKind::control_bypass, "bypass seen",
                                       Severity::high);
  expect(res.error == ErrorCode::not_found, "not found");
  expect(verifier.size() == 0, "no record created");
  expect(env.verification_store.save_count() == 0, "nothing persisted");
  expect(verifier.verify("ghost").error == ErrorCode::not_found, "verify not found");
}

void test_warning_and_degraded_controls() {
  Env env;
  env.registry.put(make_boundary("b", {make_control("auth", ControlKind::authentication,
                                                    {{"allowed_requesters", ""}})}));
  IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);

  auto res = verifier.verify("b");
  const VerificationRecord& r = *res.value;
  expect(r.total_checks == 8 && r.passed_checks == 7 && r.critical_failures == 0, "7/8");
  expect(r.status == IntegrityStatus::warning, "0.875 is a warning");
  expect(r.violations.empty(), "degraded controls are not violations");
  expect(r.recommendations.size() == 2, "degraded control + monitoring");
  expect(r.recommendations[0].priority == Severity::medium, "degraded control is medium");
  expect(r.recommendations[1].kind == RecommendationKind::monitoring_enhancement, "monitoring");
  expect(r.recommendations[1].priority == Severity::high, "monitoring is high");
  expect(r.recommendations[1].steps.size() == 3, "ordered steps");
}

void test_mutation_detection() {
  Env env;
  env.registry.put(make_boundary("b"));
  IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);

  auto first = verifier.verify("b", VerificationKind::mutation_detection);
  expect(first.value->mutations->empty(), "first run records the baseline");
  expect(first.value->status == IntegrityStatus::intact, "baseline intact");

  Boundary changed = make_boundary("b");
  changed.description = "quietly widened";
  env.registry.put(changed);
  auto second = verifier.verify("b", VerificationKind::mutation_detection);
  const VerificationRecord& r = *second.value;
  expect(r.mutations->size() == 1, "mutation found");
  expect(r.mutations->at(0).mutation_type == "boundary_state_changed", "mutation type");
  expect(r.status == IntegrityStatus::compromised, "high mutation is critical");
  expect(r.violations.size() == 1 && r.violations[0].kind == ViolationKind::unauthorized_mutation,
         "unauthorized_mutation");
  expect(r.violations[0].severity == Severity::high, "severity passed through");
  expect(r.recommendations[0].kind == RecommendationKind::mutation_reversion, "revert");

  env.mutations.accept("b", jsonlite::to_json(codec::encode(changed)));
  auto third = verifier.verify("b", VerificationKind::mutation_detection);
  expect(third.value->mutations->empty(), "accepted change is the new baseline");

  SnapshotMutationDetector low(Severity::low);
  low.detect("e", "boundary", "{}");
  auto found = low.detect("e", "boundary", "{\"x\":1}");
  VerificationRecord rec;
  rec.mutations = found;
  aggregate_integrity(rec);
  expect(rec.critical_failures == 0 && rec.passed_checks == 0, "low mutation is neither");
  expect(rec.status == IntegrityStatus::unknown, "0/1 without criticals is unknown");
}

void test_attestation_verification() {
  Env env;
  auto att = env.attestations.issue("auditor-1", "b", {{"scope", "full"}});
  expect(att.has_value(), "issued");
  Boundary b = make_boundary("b");
  b.attestations.push_back(AttestationRef{att->attestation_id, "auditor-1"});
  b.attestations.push_back(AttestationRef{"att-missing", "nobody"});
  env.registry.put(b);
  IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);

  auto res = verifier.verify("b", VerificationKind::attestation_verification);
  const VerificationRecord& r = *res.value;
  expect(r.attestation_checks->size() == 2, "two attestations checked");
  expect(r.attestation_checks->at(0).valid, "issued attestation valid");
  expect(r.attestation_checks->at(0).detail == "Attestation by auditor-1", "attester named");
  expect(!r.attestation_checks->at(1).valid, "missing attestation invalid");
  expect(r.attestation_checks->at(1).detail == "Attestation not found", "not found detail");
  expect(r.status == IntegrityStatus::compromised, "invalid attestation is critical");
  expect(r.violations.size() == 1 && r.violations[0].kind == ViolationKind::invalid_attestation,
         "invalid_attestation");
  expect(r.violations[0].detail == "Attestation att-missing is invalid: Attestation not found",
         "violation detail");

  env.attestations.revoke(att->attestation_id);
  auto after = verifier.verify("b", VerificationKind::attestation_verification);
  expect(after.value->passed_checks == 0, "revoked attestation fails");
}

void test_compliance_checks() {
  Env env;
  auto loaded = env.registry.load_json(
      "{\"boundaries\":[{\"boundary_id\":\"odd\",\"name\":\"Odd\",\"description\":\"d\","
      "\"boundary_type\":\"galaxy\",\"classification\":\"internal\",\"status\":\"active\","
      "\"version\":\"1.0\",\"created_at\":\"2024-01-01\",\"updated_at\":\"2024-01-01\"}]}");
  expect(loaded.ok() && *loaded.value == 1, "registry accepts unrecognized enum values");
  IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);

  auto res = verifier.verify("odd", VerificationKind::compliance_checking);
  const VerificationRecord& r = *res.value;
  expect(r.compliance_checks->size() == 6, "six requirements");
  expect(r.compliance_checks->at(0).compliant, "schema keys present");
  expect(!r.compliance_checks->at(2).compliant, "unknown boundary type");
  expect(r.compliance_checks->at(2).evidence == "Boundary type: galaxy", "raw value reported");
  expect(!r.compliance_checks->at(4).compliant, "version must be a triplet");
  expect(r.violations.size() == 2, "two compliance failures");
  expect(r.violations[0].severity == Severity::medium, "compliance failures are medium");
  expect(r.violations[1].remediation == "Address compliance issue: valid-version-format",
         "remediation names the requirement");

  Boundary sparse;
  sparse.boundary_id = "sparse";
  env.registry.put(sparse);
  auto s = verifier.verify("sparse", VerificationKind::compliance_checking);
  expect(!s.value->compliance_checks->at(0).compliant, "schema fails without name");
  expect(s.value->compliance_checks->at(1).evidence.find("description") != std::string::npos,
         "missing fields listed");
}

void test_report_violation() {
  Env env;
  env.registry.put(make_boundary("b"));
  IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);

  expect(verifier.report_violation("b", ViolationKind::seal_broken, "seal torn", Severity::high,
                                   "", rbac::Role::operator_).error == ErrorCode::unauthorized,
         "operator cannot report violations");

  auto res = verifier.report_violation("b", ViolationKind::seal_broken, "seal torn",
                                       Severity::high, "pager alert");
  expect(res.ok(), "reported");
  const VerificationRecord& r = *res.value;
  expect(r.status == IntegrityStatus::compromised && near(r.confidence, 1.0), "forced status");
  expect(r.kind == VerificationKind::seal_validation, "kind follows the violation");
  expect(r.triggered_by == TriggerSource::reported, "reported trigger");
  expect(r.violations.size() == 1 && r.violations[0].detail == "seal torn", "single violation");
  expect(r.violations[0].evidence == "pager alert", "evidence kept");
  expect(r.recommendations.back().kind == RecommendationKind::boundary_redefinition, "redefine");
  expect(verifier.verify_record_signature(r), "reported record is signed");
  expect(verifier.boundary_violations("b").size() == 1, "violation queryable");
}

void test_verifier_queries_and_reload() {
  Env env;
  env.registry.put(signed_boundary(env.seals, "good", {}));
  Boundary bad = make_boundary("bad");
  bad.version = "one";
  env.registry.put(bad);
  std::string good_id;
  {
    IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);
    good_id = verifier.verify("good").value->verification_id;
    expect(verifier.verify("bad").ok(), "verify bad");
    expect(verifier.verify("bad", VerificationKind::compliance_checking).ok(), "verify bad again");
    expect(verifier.size() == 3, "three records");
    expect(verifier.list_verifications(std::string("bad")).size() == 2, "boundary filter");
    expect(verifier.list_verifications(std::nullopt, IntegrityStatus::compromised).size() == 2,
           "status filter");
    expect(verifier.boundary_violations("bad").size() == 2, "violations across records");
    expect(!verifier.boundary_recommendations("bad").empty(), "recommendations across records");
    expect(!verifier.get_verification("nope").has_value(), "unknown id");
  }

  IntegrityVerifier reloaded(env.collab(), env.ledger, env.verification_store);
  expect(reloaded.load_status().ok() && reloaded.size() == 3, "records reload");
  auto good = reloaded.get_verification(good_id);
  expect(good && good->status == IntegrityStatus::intact, "record survives reload");
  expect(reloaded.verify_record_signature(*good), "signature survives reload");
}

void test_verifier_failure_channels() {
  Env env;
  env.registry.put(make_boundary("b"));
  IntegrityVerifier verifier(env.collab(), env.ledger, env.verification_store);

  env.verification_store.set_fail_writes(true);
  auto res = verifier.verify("b");
  expect(res.error == ErrorCode::persistence_failed, "persistence failure surfaced");
  expect(res.value.has_value() && res.value->status == IntegrityStatus::intact,
         "computed record returned");
  expect(verifier.size() == 1, "record retained in memory");
  env.verification_store.set_fail_writes(false);

  env.seals.revoke_tether(IntegrityVerifier::kComponent);
  expect(verifier.verify("b").error == ErrorCode::contract_tether_failed, "tether checked");
  expect(verifier.size() == 1, "no record on tether failure");
  env.seals.restore_tether(IntegrityVerifier::kComponent);

  expect(verifier.verify("b", VerificationKind::comprehensive, TriggerSource::scheduled,
                         rbac::Role::viewer).error == ErrorCode::unauthorized,
         "viewer cannot run verifications");

  VerifierConfig strict;
  strict.record_schema = "no.such.schema";
  IntegrityVerifier misconfigured(env.collab(), env.ledger, env.verification_store, strict);
  expect(misconfigured.verify("b").error == ErrorCode::validation_failed,
         "record failing its schema is rejected");
  expect(misconfigured.size() == 0, "rejected record is not kept");

  Collaborators partial = env.collab();
  partial.mutations = nullptr;
  IntegrityVerifier incomplete(partial, env.ledger, env.verification_store);
  expect(incomplete.verify("b").error == ErrorCode::invalid_argument, "collaborators required");
}

void test_aggregation_rules() {
  VerificationRecord empty;
  aggregate_integrity(empty);
  expect(empty.total_checks == 0 && near(empty.confidence, 0.0), "no checks");
  expect(empty.status == IntegrityStatus::unknown, "no checks is unknown");

  VerificationRecord r;
  std::vector<ComplianceCheck> checks(10);
  for (auto& c : checks) c.compliant = true;
  r.compliance_checks = checks;
  aggregate_integrity(r);
  expect(r.status == IntegrityStatus::intact, "10/10 intact");

  std::vector<ControlResult> controls(10);
  controls[0].status = ControlStatus::warning;
  controls[1].status = ControlStatus::degraded;
  controls[2].status = ControlStatus::degraded;
  VerificationRecord w;
  w.control_checks = controls;
  aggregate_integrity(w);
  expect(w.passed_checks == 7 && w.critical_failures == 0, "warnings are not passes");
  expect(w.status == IntegrityStatus::warning, "0.7 is a warning");
  expect(w.confidence >= 0.0 && w.confidence <= 1.0, "confidence bounded");

  expect(is_semver_triplet("1.2.3") && is_semver_triplet("10.0.42"), "valid triplets");
  expect(!is_semver_triplet("1.2") && !is_semver_triplet("1.2.3-beta") &&
             !is_semver_triplet("a.b.c") && !is_semver_triplet("1..3") &&
             !is_semver_triplet(""), "invalid triplets");
}

// ============================================================================
// Evidence ledger
// ============================================================================

void test_ledger_chain_and_mirror() {
  const fs::path dir = fresh_dir("warden_ledger_test");
  const std::string path = (dir / "evidence.ndjson").string();
  std::string head;
  {
    EvidenceLedger ledger(path);
    auto first = ledger.append(EvidenceKind::crossing_event, "r1", "{\"b\":2,\"a\":1}");
    expect(first.sequence == 1 && first.previous_digest == kGenesisDigest, "genesis link");
    expect(first.payload_json == "{\"a\":1,\"b\":2}", "payload canonicalized");
    auto second = ledger.append(EvidenceKind::violation, "b1", "{\"x\":true}");
    expect(second.previous_digest == first.digest, "chained");
    ledger.append(EvidenceKind::trust_decay, "b1", "{}");
    expect(ledger.verify_chain().ok, "in-memory chain verifies");
    expect(ledger.entries_for("b1").size() == 2, "entries by subject");
    expect(ledger.entries_of(EvidenceKind::violation).size() == 1, "entries by kind");
    expect(ledger.mirror_failure_count() == 0, "mirror healthy");
    head = ledger.head_digest();
  }

  auto verdict = verify_ndjson_file(path);
  expect(verdict.ok && verdict.entries_checked == 3, "mirror verifies");

  {
    EvidenceLedger resumed(path);
    auto next = resumed.append(EvidenceKind::attestation, "r1", "{}");
    expect(next.sequence == 4, "sequence resumes");
    expect(next.previous_digest == head, "chain resumes");
  }
  expect(verify_ndjson_file(path).entries_checked == 4, "resumed mirror verifies");

  std::string text;
  {
    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    text = ss.str();
  }
  const auto pos = text.find("\"x\":true");
  expect(pos != std::string::npos, "payload present in mirror");
  text.replace(pos, 8, "\"x\":null");
  {
    std::ofstream ofs(path, std::ios::trunc);
    ofs << text;
  }
  auto tampered = verify_ndjson_file(path);
  expect(!tampered.ok && tampered.first_bad_sequence == 2, "tampering located");
  fs::remove_all(dir);
}

// ============================================================================
// Observability, RBAC, config, collaborators, version
// ============================================================================

void test_governance_events() {
  g_events.clear();
  global_governance_stats().reset();
  set_governance_event_hook(&capture_event);

  Env env;
  env.registry.put(make_boundary("b"));
  CrossingProtocol proto(env.collab(), env.ledger, env.crossing_store);
  expect(proto.submit(make_request("r", "a", "b")).ok(), "submit");
  expect(proto.authorize("r", "carol", AuthorizationDecision::deny).ok(), "deny");
  set_governance_event_hook(nullptr);

  auto& stats = global_governance_stats();
  expect(stats.crossings_submitted.load() == 1, "submitted counted");
  expect(stats.crossings_denied.load() == 1, "denied counted");
  expect(stats.trust_decay_events.load() == 2, "decay counted");
  bool saw_denied = false;
  for (const auto& ev : g_events) {
    if (ev.kind == GovernanceEventKind::crossing_denied) saw_denied = !ev.ok;
  }
  expect(saw_denied, "hook receives the denial");
  expect(to_string(GovernanceEventKind::trust_decay) == "trust.decay", "event name");
  expect(stats.to_json().find("\"denied\":1") != std::string::npos, "stats JSON");
  expect(governance_event_to_json(g_events.front()).find("crossing.submitted") !=
             std::string::npos, "event JSON");
}

void test_rbac_matrix() {
  using rbac::Permission;
  using rbac::Role;
  expect(!rbac::has_permission(Role::viewer, Permission::crossing_submit), "viewer no submit");
  expect(!rbac::has_permission(Role::viewer, Permission::crossing_attest), "viewer no attest");
  expect(rbac::has_permission(Role::auditor, Permission::verification_run), "auditor verifies");
  expect(!rbac::has_permission(Role::auditor, Permission::crossing_authorize), "auditor no authz");
  expect(rbac::has_permission(Role::operator_, Permission::crossing_execute), "operator executes");
  expect(!rbac::has_permission(Role::operator_, Permission::violation_report), "admin only");
  expect(rbac::has_permission(Role::admin, Permission::violation_report), "admin reports");
  expect(rbac::role_from_string("operator") == Role::operator_, "role parse");
  expect(!rbac::role_from_string("root").has_value(), "unknown role");

  auto d = rbac::check("eve", Role::viewer, Permission::verification_run);
  expect(!d.ok && !d.denial_reason.empty(), "denial explained");
  expect(d.to_json().find("\"principal_id\":\"eve\"") != std::string::npos, "decision JSON");
}

void test_config_env_and_json() {
  WardenConfig defaults;
  expect(near(defaults.crossing.decay.denied, 0.05) && near(defaults.crossing.decay.failed, 0.02) &&
             near(defaults.crossing.decay.unauthorized, 0.1), "decay defaults");
  expect(defaults.verifier.reverification_interval_ms == 86400000, "interval default");

  setenv("WARDEN_DECAY_DENIED", "0.2", 1);
  setenv("WARDEN_DECAY_FAILED", "lots", 1);
  setenv("WARDEN_REVERIFY_INTERVAL_MS", "1000", 1);
  setenv("WARDEN_AUDIT_LOG", "/tmp/warden-audit.ndjson", 1);
  std::vector<std::string> warnings;
  WardenConfig env_cfg = config_from_env({}, &warnings);
  unsetenv("WARDEN_DECAY_DENIED");
  unsetenv("WARDEN_DECAY_FAILED");
  unsetenv("WARDEN_REVERIFY_INTERVAL_MS");
  unsetenv("WARDEN_AUDIT_LOG");
  expect(near(env_cfg.crossing.decay.denied, 0.2), "env decay");
  expect(near(env_cfg.crossing.decay.failed, 0.02), "invalid env keeps default");
  expect(warnings.size() == 1, "invalid env reported");
  expect(env_cfg.verifier.reverification_interval_ms == 1000, "env interval");
  expect(env_cfg.audit_log_path == "/tmp/warden-audit.ndjson", "env audit log");

  std::string error;
  warnings.clear();
  WardenConfig json_cfg = config_from_json(
      "{\"crossing\":{\"decay\":{\"denied\":0.3,\"failed\":2},\"enforce_rbac\":false},"
      "\"verifier\":{\"verifier_id\":\"v-1\",\"reverification_interval_ms\":60000},"
      "\"crossing_store_path\":\"/tmp/crossings.json\"}",
      &error, &warnings);
  expect(error.empty(), "config parses");
  expect(near(json_cfg.crossing.decay.denied, 0.3), "json decay");
  expect(near(json_cfg.crossing.decay.failed, 0.02) && warnings.size() == 1, "out of range");
  expect(!json_cfg.crossing.enforce_rbac, "json rbac flag");
  expect(json_cfg.verifier.verifier_id == "v-1", "json verifier id");
  expect(json_cfg.verifier.reverification_interval_ms == 60000, "json interval");
  expect(json_cfg.crossing_store_path == "/tmp/crossings.json", "json path");
  expect(json_cfg.to_json().find("\"verifier_id\":\"v-1\"") != std::string::npos, "to_json");

  config_from_json("[1,2]", &error);
  expect(!error.empty(), "non-object config rejected");
}

void test_registry_and_codec() {
  InMemoryBoundaryRegistry registry;
  auto bad = registry.load_json(
      "[{\"boundary_id\":\"ok\"},"
      "{\"boundary_id\":\"broken\",\"controls\":[{\"control_id\":\"c\",\"control_type\":\"magic\"}]}]");
  expect(bad.error == ErrorCode::validation_failed, "unknown control kind rejected");
  expect(registry.size() == 0, "whole document rejected");
  expect(registry.load_json("{\"boundaries\":[{\"name\":\"anon\"}]}").error ==
             ErrorCode::validation_failed, "boundary id required");
  expect(registry.load_json("not json").error == ErrorCode::json_parse_error, "parse error");

  auto good = registry.load_json(
      "[{\"boundary_id\":\"b\",\"boundary_type\":\"network\",\"classification\":\"top-secret\","
      "\"controls\":[{\"control_id\":\"c1\",\"control_type\":\"rate_limiting\","
      "\"parameters\":{\"max_requests\":\"5\"}}]}]");
  expect(good.ok() && registry.size() == 1, "array form loads");
  auto b = registry.get("b");
  expect(b->kind == BoundaryKind::network, "kind parsed");
  expect(!b->classification && b->unrecognized.at("classification") == "top-secret",
         "unrecognized value kept");
  expect(b->controls.at(0).parameters.at("max_requests") == "5", "parameters parsed");
  const std::string encoded = jsonlite::to_json(codec::encode(*b));
  expect(encoded.find("\"classification\":\"top-secret\"") != std::string::npos,
         "unrecognized value re-emitted");
  auto again = codec::boundary_from_json(encoded);
  expect(again.ok() && jsonlite::to_json(codec::encode(*again.value)) == encoded,
         "boundary encoding is stable");
  expect(registry.remove("b") && !registry.get("b"), "remove");
}

void test_reference_collaborators() {
  RequiredKeysSchemaValidator schemas;
  auto unknown = schemas.validate("{}", "nope");
  expect(!unknown.valid && !unknown.errors.empty(), "unknown schema invalid");
  auto missing = schemas.validate("{\"boundary_id\":\"b\"}", "trust_boundary.schema.v1");
  expect(!missing.valid && missing.errors.size() == 3, "missing keys listed");
  expect(!schemas.validate("[]", "trust_boundary.schema.v1").valid, "non-object invalid");

  KeyedSealService seals(test_key());
  expect(!seals.verify_contract_tether("c", "op", "not json"), "unparsable snapshot");
  expect(!seals.verify_contract_tether("c", "op",
                                       "{\"component\":\"c\",\"operation\":\"other\",\"timestamp\":1}"),
         "operation mismatch");
  expect(!seals.verify_contract_tether("c", "op", "{\"component\":\"c\",\"operation\":\"op\"}"),
         "timestamp required");
  expect(seals.verify_contract_tether("c", "op",
                                      "{\"component\":\"c\",\"operation\":\"op\",\"timestamp\":1}"),
         "valid snapshot");
  expect(seals.tether_checks() == 4, "checks counted");

  InMemoryAttestationService attestations(seals);
  expect(!attestations.issue("", "s", {}).has_value(), "attester required");
  auto a = attestations.issue("x", "s", {});
  Attestation forged = *a;
  forged.attestation_id = "att-forged";
  forged.claims["scope"] = "everything";
  attestations.put(forged);
  expect(attestations.verify(a->attestation_id), "genuine verifies");
  expect(!attestations.verify("att-forged"), "forged claims fail");
}

void test_version_manifest() {
  auto m = version::current_manifest();
  expect(m.hash_primitive == "blake3", "hash primitive");
  expect(m.hash_algorithm == version::HASH_ALGORITHM_VERSION, "hash version");
  const std::string json = version::manifest_to_json(m);
  expect(json.find("\"ledger_format\":1") != std::string::npos, "manifest JSON");
  expect(!m.semver.empty(), "semver present");
}

}  // namespace

int main() {
  std::cout << "=== Warden Test Suite ===\n";

  std::cout << "\n[Hashing] BLAKE3 and canonical JSON\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("keyed seals", test_keyed_seals);
  run_test("random ids", test_random_ids);
  run_test("JSON canonicalization", test_json_canonicalization);

  std::cout << "\n[Controls] Control evaluator\n";
  run_test("authentication and encryption", test_controls_authentication_and_encryption);
  run_test("validation and filtering", test_controls_validation_and_filtering);
  run_test("caller-supplied hooks", test_controls_hooks);
  run_test("verification mode", test_controls_verification_mode);

  std::cout << "\n[Crossings] Crossing protocol\n";
  run_test("scenario A: missing requester", test_scenario_a_missing_requester);
  run_test("scenario B: critical payload", test_scenario_b_critical_payload);
  run_test("scenario C: denial decay", test_scenario_c_denial_decay);
  run_test("rate limit charged last", test_rate_limit_charged_last);
  run_test("missing boundary", test_missing_boundary_fails_crossing);
  run_test("illegal transitions", test_illegal_transitions);
  run_test("execution failures", test_execution_failures);
  run_test("rbac on crossings", test_rbac_on_crossings);
  run_test("tether failure", test_tether_failure_blocks_mutation);
  run_test("persistence failure", test_persistence_failure_surfaced);
  run_test("attest and queries", test_attest_and_queries);
  run_test("impact assessment", test_impact_assessment);

  std::cout << "\n[Persistence] Sealed record store\n";
  run_test("crossing store round trip", test_crossing_store_round_trip);
  run_test("seal verified on load", test_seal_verified_on_load);
  run_test("failed load refuses mutation", test_failed_load_refuses_mutation);
  run_test("file record store", test_file_record_store);

  std::cout << "\n[Integrity] Integrity verifier\n";
  run_test("comprehensive intact", test_comprehensive_intact);
  run_test("scenario D: broken self-signature", test_scenario_d_broken_self_signature);
  run_test("scenario E: report on missing boundary", test_scenario_e_report_on_missing_boundary);
  run_test("warning and degraded controls", test_warning_and_degraded_controls);
  run_test("mutation detection", test_mutation_detection);
  run_test("attestation verification", test_attestation_verification);
  run_test("compliance checks", test_compliance_checks);
  run_test("report violation", test_report_violation);
  run_test("queries and reload", test_verifier_queries_and_reload);
  run_test("failure channels", test_verifier_failure_channels);
  run_test("aggregation rules", test_aggregation_rules);

  std::cout << "\n[Ledger] Evidence ledger\n";
  run_test("chain, mirror, resume, tamper", test_ledger_chain_and_mirror);

  std::cout << "\n[Ambient] Events, RBAC, config, collaborators, version\n";
  run_test("governance events", test_governance_events);
  run_test("rbac matrix", test_rbac_matrix);
  run_test("config env and json", test_config_env_and_json);
  run_test("registry and codec", test_registry_and_codec);
  run_test("reference collaborators", test_reference_collaborators);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
