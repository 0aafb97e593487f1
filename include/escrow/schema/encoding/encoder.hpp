#pragma once
#include <escrow/schema/primitives.hpp>
#include <optional>
#include <span>

namespace escrow::schema::encoding {

// The codec is a build time choice: callers name the library through a tag
// type (`encoder<scale_encoder_tag>`) and never touch the library API
// directly. Hot swapping codecs is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  escrow::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, escrow::schema::bytes_t& out);

  template <typename T>
  T decode(const escrow::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const escrow::schema::bytes_view_t& bytes);
};

}  // namespace escrow::schema::encoding
