#pragma once

#include <escrow/execution/transfer_handler.hpp>
#include <escrow/lifecycle/job_lifecycle.hpp>
#include <escrow/schema/app_info.hpp>
#include <escrow/schema/block_result.hpp>
#include <escrow/schema/commit_result.hpp>
#include <escrow/schema/encoding/scale/encoder.hpp>
#include <escrow/schema/primitives.hpp>
#include <escrow/schema/query_result.hpp>
#include <escrow/schema/role_id.hpp>
#include <escrow/schema/transaction.hpp>
#include <escrow/schema/transaction_result.hpp>
#include <escrow/storage/pending_state.hpp>
#include <escrow/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

namespace escrow::execution {

/// Deterministic escrow ledger driven by an ordering host.
///
/// Transactions are applied one at a time in block order. Each transaction
/// runs inside a journal scope over the block overlay and either keeps all
/// of its writes or none of them. `commit` persists the overlay atomically.
class engine final {
 public:
  using encoder_t = escrow::schema::encoding::encoder<
      escrow::schema::encoding::scale_encoder_tag>;
  using storage_t =
      escrow::storage::storage<escrow::storage::rocksdb_storage_tag>;

  /// Construct the engine over an opened store and load the last committed
  /// checkpoint. Transactions must carry `chain_id`.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  escrow::schema::hash32_t chain_id = default_chain_id());

  /// Chain id used when none is configured.
  static escrow::schema::hash32_t default_chain_id();

  /// One-time genesis: seed `administrator` with the administrator role and
  /// persist it. Returns false if the ledger is already initialized or a
  /// block is pending commit.
  bool initialize(const escrow::schema::account_id_t& administrator);

  /// Admission check (decode + envelope validation). Does not mutate state.
  escrow::schema::transaction_result_t check_transaction(
      const escrow::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block at `block_time` and compute its state root.
  ///
  /// Per-transaction results are returned in order, failures included.
  escrow::schema::block_result_t finalize_block(
      uint64_t height,
      escrow::schema::timestamp_milliseconds_t block_time,
      const std::vector<escrow::schema::bytes_t>& txs);

  /// Execute one transaction inside the block currently being finalized.
  ///
  /// This is the entry point for a transfer handler that calls back into the
  /// ledger. Its writes join the enclosing transaction's scope.
  escrow::schema::transaction_result_t execute(
      const escrow::schema::bytes_view_t& raw_tx);

  /// Persist the finalized block overlay with the new checkpoint.
  escrow::schema::commit_result_t commit();

  escrow::schema::app_info_t info() const;

  /// Read-path query against committed state.
  escrow::schema::query_result_t query(
      std::string_view path,
      const escrow::schema::bytes_view_t& data);

  /// Role membership as of the latest executed transaction.
  bool has_role(const escrow::schema::account_id_t& account,
                escrow::schema::role_id_t role) const;

  /// Install the value transfer primitive. An empty handler restores the
  /// built-in ledger transfer, which credits withdrawable balances.
  ///
  /// A handler that throws is treated as a failed transfer. Returns false,
  /// leaving the current handler installed, when called from inside a
  /// transfer.
  bool set_transfer_handler(transfer_handler_t handler);

 private:
  escrow::schema::transaction_result_t apply_transaction(
      const escrow::schema::bytes_view_t& raw_tx);

  /// Envelope checks: version, genesis, chain id, nonce.
  escrow::schema::transaction_result_t validate_transaction(
      const escrow::schema::transaction_t& tx,
      std::string_view codespace) const;

  escrow::schema::transaction_result_t execute_operation(
      const escrow::schema::transaction_t& tx,
      std::vector<escrow::schema::transaction_event_t>& events);

  void record_events(
      const std::vector<escrow::schema::transaction_event_t>& events,
      uint32_t tx_index);

  bool credit_balance(const escrow::schema::account_id_t& recipient,
                      const escrow::schema::amount_t& amount);
  void install_ledger_transfer();

  mutable std::recursive_mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  escrow::storage::pending_state pending_;
  escrow::lifecycle::job_lifecycle jobs_;
  transfer_handler_t transfer_handler_;
  escrow::schema::hash32_t chain_id_;
  bool initialized_{};
  int64_t last_committed_height_{};
  escrow::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  escrow::schema::hash32_t pending_state_root_{};
  bool in_block_{};
  uint64_t current_block_height_{};
  escrow::schema::timestamp_milliseconds_t current_block_time_ms_{};
  uint32_t current_tx_index_{};
};

}  // namespace escrow::execution
