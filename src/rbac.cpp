#include "warden/rbac.hpp"

#include "warden/jsonlite.hpp"

namespace warden::rbac {

std::optional<Role> role_from_string(const std::string& s) {
  if (s == "viewer")   return Role::viewer;
  if (s == "auditor")  return Role::auditor;
  if (s == "operator") return Role::operator_;
  if (s == "admin")    return Role::admin;
  return std::nullopt;
}

std::string role_to_string(Role r) {
  switch (r) {
    case Role::viewer:    return "viewer";
    case Role::auditor:   return "auditor";
    case Role::operator_: return "operator";
    case Role::admin:     return "admin";
  }
  return "unknown";
}

std::string permission_to_string(Permission p) {
  switch (p) {
    case Permission::crossing_submit:    return "crossing_submit";
    case Permission::crossing_authorize: return "crossing_authorize";
    case Permission::crossing_execute:   return "crossing_execute";
    case Permission::crossing_attest:    return "crossing_attest";
    case Permission::verification_run:  return "verification_run";
    case Permission::violation_report:  return "violation_report";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// has_permission: static role -> permission matrix
// ---------------------------------------------------------------------------
// A role satisfies a permission if role >= minimum_role.

struct PermissionRule {
  Permission perm;
  Role       minimum_role;
};

static const PermissionRule kPermissionTable[] = {
  { Permission::crossing_attest,    Role::auditor },
  { Permission::verification_run,   Role::auditor },

  { Permission::crossing_submit,    Role::operator_ },
  { Permission::crossing_authorize, Role::operator_ },
  { Permission::crossing_execute,   Role::operator_ },

  { Permission::violation_report,   Role::admin },
};

bool has_permission(Role role, Permission permission) {
  const uint8_t role_level = static_cast<uint8_t>(role);
  for (const auto& rule : kPermissionTable) {
    if (rule.perm == permission) {
      return role_level >= static_cast<uint8_t>(rule.minimum_role);
    }
  }
  // Unknown permission: admin-only (fail-closed).
  return role == Role::admin;
}

RbacDecision check(const std::string& principal_id, Role role, Permission permission) {
  RbacDecision d;
  d.principal_id = principal_id;
  d.role = role;
  if (has_permission(role, permission)) {
    d.ok = true;
  } else {
    d.denial_reason = "role '" + role_to_string(role) + "' lacks permission " +
                      permission_to_string(permission);
  }
  return d;
}

std::string RbacDecision::to_json() const {
  jsonlite::Object o;
  o["ok"] = jsonlite::Value{ok};
  o["role"] = jsonlite::Value{role_to_string(role)};
  o["principal_id"] = jsonlite::Value{principal_id};
  if (!denial_reason.empty()) o["denial_reason"] = jsonlite::Value{denial_reason};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace warden::rbac
