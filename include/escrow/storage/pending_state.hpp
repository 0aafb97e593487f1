#pragma once
#include <escrow/schema/encoding/scale/encoder.hpp>
#include <escrow/schema/primitives.hpp>
#include <escrow/storage/rocksdb/storage.hpp>
#include <escrow/storage/storage.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace escrow::storage {

/// Uncommitted writes layered over committed storage.
///
/// Writes are visible to every later read as soon as they are staged, so a
/// nested call made while a transaction is still running observes the
/// staged state. Each transaction opens a journal scope with `begin`; the
/// scope records the previous overlay value of every key it touches and
/// `rollback` restores them newest first. A nested scope that succeeds stays
/// in the enclosing journal, so rolling back the enclosing scope undoes it
/// too. Journals are discarded once the outermost scope is released.
class pending_state final {
 public:
  using storage_t = storage<rocksdb_storage_tag>;
  using encoder_t = escrow::schema::encoding::encoder<
      escrow::schema::encoding::scale_encoder_tag>;

  explicit pending_state(const storage_t& storage);

  std::optional<escrow::schema::bytes_t> get_raw(
      const escrow::schema::bytes_t& key) const;
  void put_raw(const escrow::schema::bytes_t& key,
               escrow::schema::bytes_t value);

  template <typename T>
  std::optional<T> get(const escrow::schema::bytes_t& key) const {
    auto raw = get_raw(key);
    if (!raw) {
      return std::nullopt;
    }
    auto encoder = encoder_t{};
    return encoder.decode<T>(
        escrow::schema::bytes_view_t{raw->data(), raw->size()});
  }

  template <typename T>
  void put(const escrow::schema::bytes_t& key, const T& value) {
    auto encoder = encoder_t{};
    put_raw(key, encoder.encode(value));
  }

  /// Open a journal scope and return its marker.
  std::size_t begin();
  /// Close the scope opened at `marker`, keeping its writes.
  void release(std::size_t marker);
  /// Close the scope opened at `marker`, undoing its writes.
  void rollback(std::size_t marker);

  /// Depth of currently open journal scopes.
  std::size_t depth() const { return depth_; }
  /// Number of distinct staged keys.
  std::size_t size() const { return writes_.size(); }

  /// Move all staged writes out, leaving the overlay empty.
  std::vector<key_value_entry_t> drain();

 private:
  const storage_t& storage_;
  std::map<escrow::schema::bytes_t, escrow::schema::bytes_t> writes_;
  std::vector<
      std::pair<escrow::schema::bytes_t, std::optional<escrow::schema::bytes_t>>>
      journal_;
  std::size_t depth_{};
};

}  // namespace escrow::storage
