#pragma once

#include <escrow/schema/primitives.hpp>
#include <escrow/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// Per-transaction outcome. code 0 is success; otherwise a
// transaction_error_code. `data` carries the SCALE-encoded job id for
// post_job.
namespace escrow::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace escrow::schema
