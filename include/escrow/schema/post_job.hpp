#pragma once
#include <escrow/schema/primitives.hpp>
#include <string>

// Schema type: post job.
// Opens a new escrowed job. The deposit is the value attached to the
// enclosing transaction.
namespace escrow::schema {

template <uint16_t Version>
struct post_job;

template <>
struct post_job<1> final {
  uint16_t version{1};
  std::string title;
  std::string description;
  timestamp_milliseconds_t deadline{};
};

using post_job_t = post_job<1>;

}  // namespace escrow::schema
