#pragma once
#include <escrow/schema/primitives.hpp>
#include <string>

// Schema type: submit work.
// Freelancer claim on an open job. proof_hash is an opaque reference and is
// never dereferenced by the ledger.
namespace escrow::schema {

template <uint16_t Version>
struct submit_work;

template <>
struct submit_work<1> final {
  uint16_t version{1};
  job_id_t job_id{};
  std::string proof_hash;
};

using submit_work_t = submit_work<1>;

}  // namespace escrow::schema
