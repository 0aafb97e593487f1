#pragma once
#include <escrow/schema/primitives.hpp>
#include <escrow/schema/role_id.hpp>

// Schema type: grant self role.
// Self-service membership request; only client and freelancer are accepted.
namespace escrow::schema {

template <uint16_t Version>
struct grant_self_role;

template <>
struct grant_self_role<1> final {
  uint16_t version{1};
  role_id_t role{role_id_t::client};
};

using grant_self_role_t = grant_self_role<1>;

}  // namespace escrow::schema
