#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <escrow/common/critical.hpp>
#include <escrow/schema/encoding/scale/encoder.hpp>
#include <escrow/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace escrow::storage {

namespace detail {

using encoder_t = escrow::schema::encoding::encoder<
    escrow::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const escrow::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<escrow::schema::bytes_t> get_raw(
      const escrow::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const escrow::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;
  void commit(const std::vector<key_value_entry_t>& entries,
              const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<escrow::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const escrow::schema::bytes_view_t& key) const {
  if (!database) {
    escrow::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    escrow::common::critical("Failed to read ledger key: {}",
                             status.ToString());
  }
  return escrow::schema::bytes_t(std::begin(value), std::end(value));
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const escrow::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      escrow::schema::bytes_view_t{value->data(), value->size()})};
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(
      escrow::schema::make_bytes_view(detail::kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, escrow::schema::hash32_t>>(
          escrow::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    escrow::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    escrow::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(escrow::schema::make_bytes_view(key)),
                  detail::to_slice(escrow::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      escrow::common::critical("failed staging key for commit");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      std::string{reinterpret_cast<const char*>(encoded.data()),
                  encoded.size()});
  if (!state_status.ok()) {
    escrow::common::critical("failed staging committed state");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    escrow::common::critical("Failed to commit ledger batch at height {}: {}",
                             state.height, write_status.ToString());
  }
}

}  // namespace escrow::storage
