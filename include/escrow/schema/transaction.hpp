#pragma once
#include <escrow/schema/approve_work.hpp>
#include <escrow/schema/cancel_job.hpp>
#include <escrow/schema/grant_self_role.hpp>
#include <escrow/schema/post_job.hpp>
#include <escrow/schema/primitives.hpp>
#include <escrow/schema/reject_work.hpp>
#include <escrow/schema/set_role_membership.hpp>
#include <escrow/schema/submit_work.hpp>
#include <escrow/schema/update_job.hpp>
#include <variant>

namespace escrow::schema {

using transaction_payload_t = std::variant<grant_self_role_t,
                                           set_role_membership_t,
                                           post_job_t,
                                           update_job_t,
                                           cancel_job_t,
                                           submit_work_t,
                                           approve_work_t,
                                           reject_work_t>;

template <uint16_t Version>
struct transaction;

/// Transaction envelope. `signer` is the caller identity already
/// authenticated by the host; `value` is the amount attached to the call.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  account_id_t signer{};
  amount_t value{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace escrow::schema
