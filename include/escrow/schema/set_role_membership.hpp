#pragma once
#include <escrow/schema/primitives.hpp>
#include <escrow/schema/role_id.hpp>

// Schema type: set role membership.
// Administrative grant or revoke of any role for any account.
namespace escrow::schema {

template <uint16_t Version>
struct set_role_membership;

template <>
struct set_role_membership<1> final {
  uint16_t version{1};
  account_id_t subject{};
  role_id_t role{role_id_t::client};
  bool enabled{true};
};

using set_role_membership_t = set_role_membership<1>;

}  // namespace escrow::schema
