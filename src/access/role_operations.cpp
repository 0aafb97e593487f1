#include <spdlog/spdlog.h>
#include <escrow/access/authorizer.hpp>
#include <escrow/access/role_operations.hpp>
#include <escrow/execution/events.hpp>
#include <escrow/execution/result.hpp>

using namespace escrow::schema;
using escrow::execution::kAccessCodespace;
using escrow::execution::make_failure;
using escrow::execution::make_success;

namespace escrow::access {

transaction_result_t grant_self_role(
    escrow::execution::operation_context& context,
    const grant_self_role_t& operation) {
  if (!authorizer::is_self_grantable(operation.role)) {
    return make_failure(transaction_error_code::role_not_self_grantable,
                        kAccessCodespace,
                        std::string{to_string(operation.role)} +
                            " cannot be self-granted");
  }

  auto roles = authorizer{context.state};
  if (roles.grant_self(context.caller, operation.role)) {
    spdlog::debug("Granted {} to {}", to_string(operation.role),
                  to_hex(context.caller));
    context.events.push_back(escrow::execution::make_role_changed_event(
        true, context.caller, operation.role, context.caller));
  }
  return make_success("grant_self_role accepted");
}

transaction_result_t set_role_membership(
    escrow::execution::operation_context& context,
    const set_role_membership_t& operation) {
  auto roles = authorizer{context.state};
  if (!roles.has_role(context.caller, role_id_t::administrator)) {
    return make_failure(transaction_error_code::unauthorized, kAccessCodespace,
                        "administrator role required");
  }
  if (!operation.enabled && operation.role == role_id_t::administrator &&
      operation.subject == context.caller) {
    return make_failure(transaction_error_code::unauthorized, kAccessCodespace,
                        "administrator cannot revoke own administrator role");
  }

  if (roles.set_membership(operation.subject, operation.role,
                           operation.enabled)) {
    spdlog::info("{} {} for {}", operation.enabled ? "Granted" : "Revoked",
                 to_string(operation.role), to_hex(operation.subject));
    context.events.push_back(escrow::execution::make_role_changed_event(
        operation.enabled, operation.subject, operation.role, context.caller));
  }
  return make_success("set_role_membership accepted");
}

}  // namespace escrow::access
