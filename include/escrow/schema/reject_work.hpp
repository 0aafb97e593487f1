#pragma once
#include <escrow/schema/primitives.hpp>

namespace escrow::schema {

template <uint16_t Version>
struct reject_work;

template <>
struct reject_work<1> final {
  uint16_t version{1};
  job_id_t job_id{};
};

using reject_work_t = reject_work<1>;

}  // namespace escrow::schema
