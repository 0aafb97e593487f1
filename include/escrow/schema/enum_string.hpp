#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for schema enums. Each enum header declares a
// `std::array<enum_name_t<E>, N>` and specializes `try_from_string`; the names
// are what the builder tool accepts and what events carry.
namespace escrow::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_name_t<Enum>, N>& names) {
  auto found = std::ranges::find(names, value, &enum_name_t<Enum>::first);
  if (found == std::end(names)) {
    return std::nullopt;
  }
  return found->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_name_t<Enum>, N>& names) {
  auto found = std::ranges::find(names, value, &enum_name_t<Enum>::second);
  if (found == std::end(names)) {
    return std::nullopt;
  }
  return found->first;
}

/// Parse an enum by name. Only enums with a name table specialize this.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace escrow::schema
