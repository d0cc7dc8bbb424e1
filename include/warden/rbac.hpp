#pragma once

// warden/rbac.hpp: Role-based access control for governance operations.
//
// ROLES (ordered by privilege, ascending):
//   viewer    no governance operation; queries are not role-gated.
//   auditor   attestations and verification runs.
//   operator  auditor + crossing submission, authorization and execution.
//   admin     operator + manual violation reports.
//
// INVARIANTS:
//   - The matrix is static and fail-closed: a permission missing from the
//     table is admin-only.
//   - Only mutating operations are checked. Denials are reported by
//     CrossingProtocol and IntegrityVerifier as ErrorCode::unauthorized and
//     emitted as rbac.denied governance events.

#include <cstdint>
#include <optional>
#include <string>

namespace warden::rbac {

enum class Role : uint8_t {
  viewer    = 0,
  auditor   = 1,
  operator_ = 2,  // trailing underscore avoids C++ keyword conflict
  admin     = 3,
};

std::optional<Role> role_from_string(const std::string& s);
std::string role_to_string(Role r);

enum class Permission {
  crossing_submit,     // operator+
  crossing_authorize,  // operator+
  crossing_execute,    // operator+
  crossing_attest,     // auditor+
  verification_run,    // auditor+
  violation_report,    // admin only
};

std::string permission_to_string(Permission p);

bool has_permission(Role role, Permission permission);

struct RbacDecision {
  bool        ok{false};
  Role        role{Role::viewer};
  std::string principal_id;
  std::string denial_reason;  // non-empty if !ok

  std::string to_json() const;
};

// Never throws.
RbacDecision check(const std::string& principal_id, Role role, Permission permission);

}  // namespace warden::rbac
