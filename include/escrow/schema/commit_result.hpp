#pragma once

#include <escrow/schema/primitives.hpp>
#include <cstdint>

namespace escrow::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root{};
  uint64_t writes{};
};

using commit_result_t = commit_result<1>;

}  // namespace escrow::schema
