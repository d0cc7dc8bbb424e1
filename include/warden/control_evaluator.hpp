#pragma once

// warden/control_evaluator.hpp: Per-kind evaluation of boundary controls.
//
// MODES:
//   request mode       evaluate(control, boundary, &request)
//                      Checks the control against one concrete crossing and
//                      consults the caller-supplied hooks. A rate_limiting
//                      control consumes one limiter unit when it passes;
//                      request_evaluation_order() runs those controls last
//                      so a request rejected by any other control consumes
//                      nothing.
//   verification mode  evaluate(control, boundary, nullptr)
//                      Checks only that the control is soundly configured;
//                      hooks are never consulted, so verification runs have
//                      no side effects on rate limiters.
//
// INVARIANTS:
//   - Deterministic for fixed inputs and hook behaviour.
//   - Never throws. A std::exception escaping a hook is reported as an
//     ineffective result carrying the exception text.
//   - Dispatch is an exhaustive switch over ControlKind.
//
// CONTROL PARAMETERS (all optional, string-valued):
//   authentication  allowed_requesters   comma-separated requester ids
//   encryption      min_key_bits         positive integer, < 128 => degraded
//   validation      max_payload_bytes    positive integer
//                   required_attributes  comma-separated payload attribute keys
//   filtering       blocked_kinds        comma-separated crossing kinds
//   rate_limiting   max_requests         positive integer

#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

struct PredicateVerdict {
  bool        ok{false};
  std::string detail;
};

// Caller-supplied predicate over a crossing (isolation, filtering,
// authorization policy).
class CrossingPredicate {
 public:
  virtual ~CrossingPredicate() = default;
  virtual PredicateVerdict check(const Control& control, const Boundary& boundary,
                                 const CrossingRequest& request) = 0;
};

class RateLimiter {
 public:
  virtual ~RateLimiter() = default;
  // Consume one unit for `requester_id` at `boundary_id`. False = limited.
  virtual bool try_acquire(const std::string& requester_id,
                           const std::string& boundary_id) = 0;
};

// Non-owning. Any hook may be null.
struct ControlHooks {
  RateLimiter*       rate_limiter{nullptr};
  CrossingPredicate* isolation{nullptr};
  CrossingPredicate* filter{nullptr};
  CrossingPredicate* authorization{nullptr};
};

class ControlEvaluator {
 public:
  explicit ControlEvaluator(ControlHooks hooks = {});

  // `request` == nullptr selects verification mode.
  ControlResult evaluate(const Control& control, const Boundary& boundary,
                         const CrossingRequest* request) const;

  const ControlHooks& hooks() const { return hooks_; }

 private:
  ControlHooks hooks_;
};

// Order in which a crossing evaluates a boundary's controls: declaration
// order, with every rate_limiting control moved after the others.
std::vector<const Control*> request_evaluation_order(const Boundary& boundary);

}  // namespace warden
