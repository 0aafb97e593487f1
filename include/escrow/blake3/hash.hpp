#pragma once
#include <escrow/schema/primitives.hpp>
#include <string_view>

namespace escrow::blake3 {

escrow::schema::hash32_t hash(const std::string_view& str);
escrow::schema::hash32_t hash(const escrow::schema::bytes_view_t& bytes);

}  // namespace escrow::blake3
