#pragma once

#include <escrow/schema/primitives.hpp>
#include <escrow/schema/role_id.hpp>
#include <escrow/storage/pending_state.hpp>

namespace escrow::access {

/// Role registry over ledger state, keyed by (role, account).
///
/// Client and freelancer standing is self-service. Administrator standing is
/// seeded once at genesis and otherwise changed only through
/// `set_membership`, which callers must gate on administrator standing.
class authorizer final {
 public:
  explicit authorizer(escrow::storage::pending_state& state);

  bool has_role(const escrow::schema::account_id_t& account,
                escrow::schema::role_id_t role) const;

  /// Roles an account may grant to itself.
  static constexpr bool is_self_grantable(escrow::schema::role_id_t role) {
    return role == escrow::schema::role_id_t::client ||
           role == escrow::schema::role_id_t::freelancer;
  }

  /// Grant a self-grantable role to `account`. Returns true when membership
  /// changed; false when already held or the role is not self-grantable.
  bool grant_self(const escrow::schema::account_id_t& account,
                  escrow::schema::role_id_t role);

  /// Administrative path. Returns true when membership changed.
  bool set_membership(const escrow::schema::account_id_t& account,
                      escrow::schema::role_id_t role,
                      bool enabled);

 private:
  escrow::storage::pending_state& state_;
};

}  // namespace escrow::access
