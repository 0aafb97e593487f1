#pragma once

#include <cstdint>
#include <string_view>

// Schema type: transaction error code.
// Stable numeric rejection codes. 1-9 are envelope checks, 10-19 the job
// lifecycle, 20-29 custody and access control.
namespace escrow::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  not_initialized = 5,
  unauthorized = 10,
  no_value_deposited = 11,
  job_not_open = 12,
  job_not_found = 13,
  no_work_submitted = 14,
  empty_field = 15,
  invalid_deadline = 16,
  transfer_failed = 20,
  reentrant_call = 21,
  value_not_accepted = 22,
  role_not_self_grantable = 23,
};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  switch (value) {
    case transaction_error_code::invalid_transaction:
      return "invalid transaction";
    case transaction_error_code::unsupported_transaction_version:
      return "unsupported transaction version";
    case transaction_error_code::invalid_chain_id:
      return "invalid chain id";
    case transaction_error_code::invalid_nonce:
      return "invalid nonce";
    case transaction_error_code::not_initialized:
      return "ledger not initialized";
    case transaction_error_code::unauthorized:
      return "unauthorized";
    case transaction_error_code::no_value_deposited:
      return "no value deposited";
    case transaction_error_code::job_not_open:
      return "job not open";
    case transaction_error_code::job_not_found:
      return "job not found";
    case transaction_error_code::no_work_submitted:
      return "no work submitted";
    case transaction_error_code::empty_field:
      return "empty field";
    case transaction_error_code::invalid_deadline:
      return "invalid deadline";
    case transaction_error_code::transfer_failed:
      return "transfer failed";
    case transaction_error_code::reentrant_call:
      return "reentrant call";
    case transaction_error_code::value_not_accepted:
      return "value not accepted";
    case transaction_error_code::role_not_self_grantable:
      return "role not self grantable";
  }
  return "unknown";
}

}  // namespace escrow::schema
