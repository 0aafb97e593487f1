#pragma once

#include <escrow/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Audit event names appended to the event log by successful transactions.
namespace escrow::schema {

enum class event_type_t : uint8_t {
  job_posted = 0,
  job_updated = 1,
  job_cancelled = 2,
  work_submitted = 3,
  payment_released = 4,
  work_rejected = 5,
  role_granted = 6,
  role_revoked = 7
};

inline constexpr auto kEventTypeMappings = std::array{
    std::pair<std::string_view, event_type_t>{"job_posted",
                                              event_type_t::job_posted},
    std::pair<std::string_view, event_type_t>{"job_updated",
                                              event_type_t::job_updated},
    std::pair<std::string_view, event_type_t>{"job_cancelled",
                                              event_type_t::job_cancelled},
    std::pair<std::string_view, event_type_t>{"work_submitted",
                                              event_type_t::work_submitted},
    std::pair<std::string_view, event_type_t>{"payment_released",
                                              event_type_t::payment_released},
    std::pair<std::string_view, event_type_t>{"work_rejected",
                                              event_type_t::work_rejected},
    std::pair<std::string_view, event_type_t>{"role_granted",
                                              event_type_t::role_granted},
    std::pair<std::string_view, event_type_t>{"role_revoked",
                                              event_type_t::role_revoked}};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

}  // namespace escrow::schema
