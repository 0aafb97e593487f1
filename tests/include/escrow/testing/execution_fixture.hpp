#pragma once

#include <escrow/execution/engine.hpp>
#include <escrow/schema/primitives.hpp>
#include <escrow/storage/rocksdb/storage.hpp>
#include <escrow/testing/common.hpp>
#include <escrow/testing/execution_harness.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace escrow::testing {

inline constexpr auto kGenesisBlockTime =
    escrow::schema::timestamp_milliseconds_t{1'000'000};

/// Engine over a throwaway RocksDB store, initialized with `admin()`.
///
/// `execute` runs one transaction per block and commits it, tracking signer
/// nonces so tests only state what they send.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool initialize = true)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{escrow::storage::make_storage<
            escrow::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_} {
    if (initialize) {
      EXPECT_TRUE(engine_.initialize(admin()));
    }
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  static escrow::schema::account_id_t admin() { return make_account(0xA0); }

  scale_encoder_t& encoder() { return encoder_; }
  escrow::storage::storage<escrow::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }
  escrow::execution::engine& engine() { return engine_; }
  escrow::schema::hash32_t chain_id() const {
    return escrow::execution::engine::default_chain_id();
  }

  escrow::schema::timestamp_milliseconds_t block_time() const {
    return block_time_;
  }
  void set_block_time(const escrow::schema::timestamp_milliseconds_t value) {
    block_time_ = value;
  }

  uint64_t next_nonce(const escrow::schema::account_id_t& signer) const {
    auto found = nonces_.find(signer);
    return found == std::end(nonces_) ? 1 : found->second + 1;
  }

  /// Encode a transaction using the signer's next nonce and reserve it.
  escrow::schema::bytes_t sign(
      const escrow::schema::account_id_t& signer,
      const escrow::schema::transaction_payload_t& payload,
      const escrow::schema::amount_t& value = 0) {
    auto tx = make_transaction(chain_id(), next_nonce(signer), signer, payload,
                               value);
    ++nonces_[signer];
    return encode_transaction(tx);
  }

  /// Forget a reserved nonce whose transaction failed.
  void release_nonce(const escrow::schema::account_id_t& signer) {
    --nonces_[signer];
  }

  escrow::schema::block_result_t finalize(
      const std::vector<escrow::schema::bytes_t>& txs) {
    auto block = engine_.finalize_block(++height_, block_time_, txs);
    (void)engine_.commit();
    return block;
  }

  escrow::schema::transaction_result_t execute(
      const escrow::schema::account_id_t& signer,
      const escrow::schema::transaction_payload_t& payload,
      const escrow::schema::amount_t& value = 0) {
    auto block = finalize({sign(signer, payload, value)});
    EXPECT_EQ(block.tx_results.size(), 1u);
    auto result = block.tx_results.front();
    if (result.code != 0) {
      release_nonce(signer);
    }
    return result;
  }

  uint64_t height() const { return height_; }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  escrow::storage::storage<escrow::storage::rocksdb_storage_tag> storage_;
  escrow::execution::engine engine_;
  std::map<escrow::schema::account_id_t, uint64_t> nonces_;
  escrow::schema::timestamp_milliseconds_t block_time_{kGenesisBlockTime};
  uint64_t height_{};
};

}  // namespace escrow::testing
