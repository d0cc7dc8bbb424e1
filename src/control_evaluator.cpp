#include "warden/control_evaluator.hpp"

#include "warden/hash.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <vector>

namespace warden {

namespace {

ControlResult make(const Control& c, ControlStatus status, std::string detail,
                   std::string evidence) {
  ControlResult r;
  r.control_id = c.control_id;
  r.kind = c.kind;
  r.status = status;
  r.detail = std::move(detail);
  r.evidence = std::move(evidence);
  return r;
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  auto flush = [&] {
    auto b = cur.find_first_not_of(" \t");
    auto e = cur.find_last_not_of(" \t");
    if (b != std::string::npos) out.push_back(cur.substr(b, e - b + 1));
    cur.clear();
  };
  for (char ch : s) {
    if (ch == ',') flush();
    else cur.push_back(ch);
  }
  flush();
  return out;
}

bool contains(const std::vector<std::string>& xs, const std::string& x) {
  return std::find(xs.begin(), xs.end(), x) != xs.end();
}

const std::string* param(const Control& c, const char* key) {
  auto it = c.parameters.find(key);
  return it == c.parameters.end() ? nullptr : &it->second;
}

// Strict positive decimal integer.
bool parse_positive(const std::string& s, uint64_t& out) {
  if (s.empty()) return false;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && out > 0;
}

ControlResult run_predicate(const Control& c, CrossingPredicate& pred,
                            const Boundary& b, const CrossingRequest& req,
                            const char* what) {
  try {
    PredicateVerdict v = pred.check(c, b, req);
    if (v.ok) {
      return make(c, ControlStatus::effective,
                  v.detail.empty() ? std::string(what) + " predicate passed" : v.detail,
                  std::string(what) + " predicate");
    }
    return make(c, ControlStatus::ineffective,
                v.detail.empty() ? std::string(what) + " predicate rejected the crossing" : v.detail,
                std::string(what) + " predicate");
  } catch (const std::exception& e) {
    return make(c, ControlStatus::ineffective,
                std::string(what) + " predicate failed: " + e.what(),
                std::string(what) + " predicate raised");
  }
}

// ---------------------------------------------------------------------------
// Request mode
// ---------------------------------------------------------------------------

ControlResult request_authentication(const Control& c, const CrossingRequest& req) {
  if (req.requester_id.empty()) {
    return make(c, ControlStatus::ineffective, "requester identity missing",
                "requester_id is empty");
  }
  if (const auto* allowed = param(c, "allowed_requesters")) {
    if (!contains(split_csv(*allowed), req.requester_id)) {
      return make(c, ControlStatus::ineffective,
                  "requester " + req.requester_id + " is not an allowed requester",
                  "allowed_requesters=" + *allowed);
    }
  }
  return make(c, ControlStatus::effective, "requester authenticated",
              "requester_id=" + req.requester_id);
}

ControlResult request_encryption(const Control& c, const CrossingRequest& req) {
  if (req.payload.content_hash.empty()) {
    return make(c, ControlStatus::warning, "payload lacks a content hash",
                "content_hash is empty");
  }
  const std::string actual = payload_digest(req.payload.data);
  if (!digest_equal(actual, req.payload.content_hash)) {
    return make(c, ControlStatus::ineffective, "payload content hash mismatch",
                "declared=" + req.payload.content_hash + " actual=" + actual);
  }
  return make(c, ControlStatus::effective, "payload content hash verified",
              "content_hash=" + actual);
}

ControlResult request_validation(const Control& c, const CrossingRequest& req) {
  if (const auto* max = param(c, "max_payload_bytes")) {
    uint64_t limit = 0;
    if (!parse_positive(*max, limit)) {
      return make(c, ControlStatus::degraded, "max_payload_bytes is not a positive integer",
                  "max_payload_bytes=" + *max);
    }
    if (req.payload.data.size() > limit) {
      return make(c, ControlStatus::ineffective, "payload exceeds max_payload_bytes",
                  "size=" + std::to_string(req.payload.data.size()) +
                      " limit=" + std::to_string(limit));
    }
  }
  if (const auto* required = param(c, "required_attributes")) {
    for (const auto& key : split_csv(*required)) {
      if (!req.payload.attributes.count(key)) {
        return make(c, ControlStatus::ineffective,
                    "payload lacks required attribute " + key,
                    "required_attributes=" + *required);
      }
    }
  }
  return make(c, ControlStatus::effective, "payload validated",
              "size=" + std::to_string(req.payload.data.size()));
}

ControlResult request_filtering(const Control& c, const Boundary& b,
                                const CrossingRequest& req, CrossingPredicate* filter) {
  if (filter) {
    ControlResult r = run_predicate(c, *filter, b, req, "filter");
    if (r.status != ControlStatus::effective) return r;
  }
  if (const auto* blocked = param(c, "blocked_kinds")) {
    const std::string kind = to_string(req.kind);
    if (contains(split_csv(*blocked), kind)) {
      return make(c, ControlStatus::ineffective,
                  "crossing kind " + kind + " is blocked at this boundary",
                  "blocked_kinds=" + *blocked);
    }
  }
  return make(c, ControlStatus::effective, "crossing passed filtering",
              "request_type=" + to_string(req.kind));
}

ControlResult request_rate_limiting(const Control& c, const Boundary& b,
                                    const CrossingRequest& req, RateLimiter* limiter) {
  if (!limiter) {
    return make(c, ControlStatus::warning, "no rate limiter configured",
                "rate limiter hook absent");
  }
  try {
    if (!limiter->try_acquire(req.requester_id, b.boundary_id)) {
      return make(c, ControlStatus::ineffective,
                  "rate limit exceeded for requester " + req.requester_id,
                  "boundary=" + b.boundary_id);
    }
  } catch (const std::exception& e) {
    return make(c, ControlStatus::ineffective,
                std::string("rate limiter failed: ") + e.what(), "rate limiter raised");
  }
  return make(c, ControlStatus::effective, "within rate limit",
              "requester_id=" + req.requester_id);
}

ControlResult evaluate_request(const Control& c, const Boundary& b,
                               const CrossingRequest& req, const ControlHooks& hooks) {
  switch (c.kind) {
    case ControlKind::authentication:
      return request_authentication(c, req);
    case ControlKind::authorization:
      if (hooks.authorization) return run_predicate(c, *hooks.authorization, b, req, "authorization");
      return make(c, ControlStatus::effective, "deferred to explicit authorization",
                  "no authorization predicate");
    case ControlKind::encryption:
      return request_encryption(c, req);
    case ControlKind::validation:
      return request_validation(c, req);
    case ControlKind::monitoring:
      return make(c, ControlStatus::effective, "crossing is monitored",
                  "events recorded to the audit trail");
    case ControlKind::logging:
      return make(c, ControlStatus::effective, "crossing is logged",
                  "events recorded to the evidence ledger");
    case ControlKind::filtering:
      return request_filtering(c, b, req, hooks.filter);
    case ControlKind::rate_limiting:
      return request_rate_limiting(c, b, req, hooks.rate_limiter);
    case ControlKind::isolation:
      if (hooks.isolation) return run_predicate(c, *hooks.isolation, b, req, "isolation");
      return make(c, ControlStatus::warning, "no isolation predicate configured",
                  "isolation hook absent");
  }
  return make(c, ControlStatus::ineffective, "unknown control kind", "");
}

// ---------------------------------------------------------------------------
// Verification mode
// ---------------------------------------------------------------------------

ControlResult check_positive(const Control& c, const char* key, const char* ok_detail) {
  if (const auto* v = param(c, key)) {
    uint64_t n = 0;
    if (!parse_positive(*v, n)) {
      return make(c, ControlStatus::ineffective,
                  std::string(key) + " is not a positive integer",
                  std::string(key) + "=" + *v);
    }
    return make(c, ControlStatus::effective, ok_detail, std::string(key) + "=" + *v);
  }
  return make(c, ControlStatus::effective, ok_detail, "defaults in effect");
}

ControlResult evaluate_config(const Control& c) {
  switch (c.kind) {
    case ControlKind::authentication:
      if (const auto* allowed = param(c, "allowed_requesters")) {
        if (split_csv(*allowed).empty()) {
          return make(c, ControlStatus::degraded, "allowed_requesters is empty",
                      "no requester can pass this control");
        }
      }
      return make(c, ControlStatus::effective,
                  "Authentication control is properly configured",
                  "requester identity required");
    case ControlKind::authorization:
      return make(c, ControlStatus::effective,
                  "Authorization control is properly configured",
                  "explicit authorization required");
    case ControlKind::encryption:
      if (const auto* bits = param(c, "min_key_bits")) {
        uint64_t n = 0;
        if (!parse_positive(*bits, n)) {
          return make(c, ControlStatus::ineffective, "min_key_bits is not a positive integer",
                      "min_key_bits=" + *bits);
        }
        if (n < 128) {
          return make(c, ControlStatus::degraded, "key size below 128 bits",
                      "min_key_bits=" + *bits);
        }
      }
      return make(c, ControlStatus::effective,
                  "Encryption control is properly configured", "content hash enforced");
    case ControlKind::validation:
      return check_positive(c, "max_payload_bytes",
                            "Validation control is properly configured");
    case ControlKind::monitoring:
      return make(c, ControlStatus::effective,
                  "Monitoring control is properly configured", "audit trail enabled");
    case ControlKind::logging:
      return make(c, ControlStatus::effective,
                  "Logging control is properly configured", "evidence ledger enabled");
    case ControlKind::filtering:
      if (const auto* blocked = param(c, "blocked_kinds")) {
        for (const auto& k : split_csv(*blocked)) {
          if (!crossing_kind_from_string(k)) {
            return make(c, ControlStatus::degraded, "blocked_kinds names unknown kind " + k,
                        "blocked_kinds=" + *blocked);
          }
        }
      }
      return make(c, ControlStatus::effective,
                  "Filtering control is properly configured", "filter rules parsed");
    case ControlKind::rate_limiting:
      return check_positive(c, "max_requests",
                            "Rate limiting control is properly configured");
    case ControlKind::isolation:
      return make(c, ControlStatus::effective,
                  "Isolation control is properly configured", "isolation declared");
  }
  return make(c, ControlStatus::ineffective, "unknown control kind", "");
}

}  // namespace

ControlEvaluator::ControlEvaluator(ControlHooks hooks) : hooks_(hooks) {}

ControlResult ControlEvaluator::evaluate(const Control& control, const Boundary& boundary,
                                         const CrossingRequest* request) const {
  if (!request) return evaluate_config(control);
  return evaluate_request(control, boundary, *request, hooks_);
}

std::vector<const Control*> request_evaluation_order(const Boundary& boundary) {
  std::vector<const Control*> order;
  order.reserve(boundary.controls.size());
  for (const auto& c : boundary.controls) order.push_back(&c);
  std::stable_partition(order.begin(), order.end(), [](const Control* c) {
    return c->kind != ControlKind::rate_limiting;
  });
  return order;
}

}  // namespace warden
