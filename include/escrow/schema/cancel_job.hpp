#pragma once
#include <escrow/schema/primitives.hpp>

namespace escrow::schema {

template <uint16_t Version>
struct cancel_job;

template <>
struct cancel_job<1> final {
  uint16_t version{1};
  job_id_t job_id{};
};

using cancel_job_t = cancel_job<1>;

}  // namespace escrow::schema
