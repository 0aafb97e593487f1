#pragma once
#include <escrow/schema/primitives.hpp>
#include <string>

// Schema type: update job.
// Rewrites the metadata of an open job; any value attached to the transaction
// is added to the escrowed amount.
namespace escrow::schema {

template <uint16_t Version>
struct update_job;

template <>
struct update_job<1> final {
  uint16_t version{1};
  job_id_t job_id{};
  std::string title;
  std::string description;
  timestamp_milliseconds_t deadline{};
};

using update_job_t = update_job<1>;

}  // namespace escrow::schema
