#pragma once
#include <escrow/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace escrow::storage {

using key_value_entry_t =
    std::pair<escrow::schema::bytes_t, escrow::schema::bytes_t>;

/// Last committed ledger checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  escrow::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<escrow::schema::bytes_t> get_raw(
      const escrow::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const escrow::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Atomically write all entries together with the new checkpoint.
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace escrow::storage
