#pragma once

#include <escrow/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Marketplace roles: administrator manages memberships, clients post and fund
// jobs, freelancers submit work.
namespace escrow::schema {

enum class role_id_t : uint8_t { administrator = 0, client = 1, freelancer = 2 };

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"administrator",
                                           role_id_t::administrator},
    std::pair<std::string_view, role_id_t>{"client", role_id_t::client},
    std::pair<std::string_view, role_id_t>{"freelancer", role_id_t::freelancer},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

}  // namespace escrow::schema
