#pragma once

#include <escrow/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: job status.
// Job lifecycle enum. in_review is reserved; no transition produces it.
namespace escrow::schema {

enum class job_status_t : uint8_t {
  open = 0,
  submitted = 1,
  in_review = 2,
  completed = 3,
  cancelled = 4
};

inline constexpr auto kJobStatusMappings = std::array{
    std::pair<std::string_view, job_status_t>{"open", job_status_t::open},
    std::pair<std::string_view, job_status_t>{"submitted",
                                              job_status_t::submitted},
    std::pair<std::string_view, job_status_t>{"in_review",
                                              job_status_t::in_review},
    std::pair<std::string_view, job_status_t>{"completed",
                                              job_status_t::completed},
    std::pair<std::string_view, job_status_t>{"cancelled",
                                              job_status_t::cancelled}};

template <>
inline std::optional<job_status_t> try_from_string<job_status_t>(
    const std::string_view value) {
  return from_string(value, kJobStatusMappings);
}

inline constexpr std::string_view to_string(const job_status_t value) {
  return to_string(value, kJobStatusMappings).value_or("unknown");
}

/// Completed and cancelled jobs have no outgoing transitions.
inline constexpr bool is_terminal(const job_status_t value) {
  return value == job_status_t::completed || value == job_status_t::cancelled;
}

}  // namespace escrow::schema
