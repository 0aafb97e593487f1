#pragma once

#include <escrow/schema/primitives.hpp>
#include <escrow/schema/transaction_event.hpp>

// Schema type: event record.
// Persisted audit log entry. event_id is dense and starts at 1.
namespace escrow::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  timestamp_milliseconds_t recorded_at{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace escrow::schema
