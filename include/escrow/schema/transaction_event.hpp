#pragma once

#include <escrow/schema/event_type.hpp>
#include <escrow/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Audit stream item: one emitted ledger event with its attributes.
namespace escrow::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  event_type_t type{};
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

/// Value of the first attribute named `key`, if any.
inline std::optional<std::string_view> find_attribute(
    const transaction_event_t& event,
    const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return std::string_view{attribute.value};
    }
  }
  return std::nullopt;
}

}  // namespace escrow::schema
