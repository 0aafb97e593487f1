#include <escrow/access/authorizer.hpp>
#include <escrow/schema/key/engine_keys.hpp>

using namespace escrow::schema;

namespace escrow::access {

namespace {

using encoder_t = escrow::schema::encoding::encoder<
    escrow::schema::encoding::scale_encoder_tag>;

bytes_t role_key(const role_id_t role, const account_id_t& account) {
  auto encoder = encoder_t{};
  return escrow::schema::key::make_role_key(encoder, role, account);
}

}  // namespace

authorizer::authorizer(escrow::storage::pending_state& state)
    : state_{state} {}

bool authorizer::has_role(const account_id_t& account,
                          const role_id_t role) const {
  return state_.get<bool>(role_key(role, account)).value_or(false);
}

bool authorizer::grant_self(const account_id_t& account, const role_id_t role) {
  if (!is_self_grantable(role)) {
    return false;
  }
  return set_membership(account, role, true);
}

bool authorizer::set_membership(const account_id_t& account,
                                const role_id_t role,
                                const bool enabled) {
  if (has_role(account, role) == enabled) {
    return false;
  }
  state_.put(role_key(role, account), enabled);
  return true;
}

}  // namespace escrow::access
