#pragma once

#include <escrow/schema/primitives.hpp>
#include <escrow/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Finalize output: per-transaction results in submission order plus the
// candidate state root after the block.
namespace escrow::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  uint64_t height{};
  timestamp_milliseconds_t block_time{};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root{};
};

using block_result_t = block_result<1>;

}  // namespace escrow::schema
