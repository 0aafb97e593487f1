#pragma once
#include <escrow/schema/job_status.hpp>
#include <escrow/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: job state.
// Escrowed job record. amount is the value still held in custody for the job
// and is zero once the job is completed or cancelled.
namespace escrow::schema {

template <uint16_t Version>
struct job_state;

template <>
struct job_state<1> final {
  uint16_t version{1};
  job_id_t job_id{};
  account_id_t client{};
  std::optional<account_id_t> freelancer;
  job_status_t status{job_status_t::open};
  std::string title;
  std::string description;
  amount_t amount{};
  timestamp_milliseconds_t deadline{};
  std::string proof_hash;
};

using job_state_t = job_state<1>;

}  // namespace escrow::schema
