#pragma once

#include <escrow/execution/operation_context.hpp>
#include <escrow/schema/grant_self_role.hpp>
#include <escrow/schema/set_role_membership.hpp>
#include <escrow/schema/transaction_result.hpp>

namespace escrow::access {

/// Self-service client/freelancer membership. Idempotent; emits
/// `role_granted` only when membership changes.
escrow::schema::transaction_result_t grant_self_role(
    escrow::execution::operation_context& context,
    const escrow::schema::grant_self_role_t& operation);

/// Administrator-only grant/revoke of any role. An administrator cannot
/// revoke their own administrator standing.
escrow::schema::transaction_result_t set_role_membership(
    escrow::execution::operation_context& context,
    const escrow::schema::set_role_membership_t& operation);

}  // namespace escrow::access
