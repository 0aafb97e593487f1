#pragma once
#include <escrow/schema/primitives.hpp>

namespace escrow::schema {

template <uint16_t Version>
struct approve_work;

template <>
struct approve_work<1> final {
  uint16_t version{1};
  job_id_t job_id{};
};

using approve_work_t = approve_work<1>;

}  // namespace escrow::schema
