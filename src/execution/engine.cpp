#include <spdlog/spdlog.h>
#include <escrow/access/role_operations.hpp>
#include <escrow/blake3/hash.hpp>
#include <escrow/execution/engine.hpp>
#include <escrow/execution/events.hpp>
#include <escrow/execution/result.hpp>
#include <escrow/schema/event_record.hpp>
#include <escrow/schema/job_state.hpp>
#include <escrow/schema/key/engine_keys.hpp>
#include <escrow/schema/query_error_code.hpp>
#include <exception>
#include <iterator>
#include <tuple>
#include <utility>

using namespace escrow::schema;

namespace {

using encoder_t = escrow::schema::encoding::encoder<
    escrow::schema::encoding::scale_encoder_tag>;

inline constexpr auto kQueryCodespace = std::string_view{"escrow.query"};
inline constexpr auto kMaxEventRange = uint64_t{1000};

escrow::schema::hash32_t fold_state_root(const escrow::schema::hash32_t& seed,
                                         const escrow::schema::bytes_view_t& tx,
                                         const uint64_t height,
                                         const uint64_t index) {
  auto material = escrow::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(std::tuple{height, index}, material);
  return escrow::blake3::hash(
      escrow::schema::bytes_view_t{material.data(), material.size()});
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

bool is_payable(const transaction_payload_t& payload) {
  return std::holds_alternative<post_job_t>(payload) ||
         std::holds_alternative<update_job_t>(payload);
}

// Rolls a journal scope back unless it was released, including on unwind.
class journal_scope final {
 public:
  explicit journal_scope(escrow::storage::pending_state& state)
      : state_{state}, marker_{state.begin()} {}
  ~journal_scope() {
    if (open_) {
      state_.rollback(marker_);
    }
  }

  journal_scope(const journal_scope&) = delete;
  journal_scope& operator=(const journal_scope&) = delete;

  void release() {
    state_.release(marker_);
    open_ = false;
  }
  void rollback() {
    state_.rollback(marker_);
    open_ = false;
  }

 private:
  escrow::storage::pending_state& state_;
  std::size_t marker_;
  bool open_{true};
};

class block_scope final {
 public:
  explicit block_scope(bool& in_block) : in_block_{in_block} {
    in_block_ = true;
  }
  ~block_scope() { in_block_ = false; }

  block_scope(const block_scope&) = delete;
  block_scope& operator=(const block_scope&) = delete;

 private:
  bool& in_block_;
};

}  // namespace

namespace escrow::execution {

engine::engine(encoder_t& encoder, storage_t& storage, hash32_t chain_id)
    : encoder_{encoder},
      storage_{storage},
      pending_{storage},
      chain_id_{chain_id} {
  auto lock = std::scoped_lock{mutex_};
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }
  pending_state_root_ = last_committed_state_root_;
  initialized_ =
      storage_
          .get_raw(make_bytes_view(
              escrow::schema::key::make_genesis_key(encoder_)))
          .has_value();
  install_ledger_transfer();
  spdlog::info("Escrow engine ready at height {} (initialized: {})",
               last_committed_height_, initialized_);
}

hash32_t engine::default_chain_id() {
  return escrow::blake3::hash(std::string_view{"escrow-jobs-chain"});
}

bool engine::initialize(const account_id_t& administrator) {
  auto lock = std::scoped_lock{mutex_};
  if (initialized_) {
    spdlog::warn("Ledger already initialized; ignoring genesis request");
    return false;
  }
  if (in_block_ || pending_.size() != 0) {
    spdlog::warn("Genesis requested with an uncommitted block pending");
    return false;
  }

  pending_.put(escrow::schema::key::make_genesis_key(encoder_), administrator);
  pending_.put(escrow::schema::key::make_role_key(
                   encoder_, role_id_t::administrator, administrator),
               true);
  record_events({make_role_changed_event(true, administrator,
                                         role_id_t::administrator,
                                         administrator)},
                0);
  storage_.commit(pending_.drain(),
                  escrow::storage::committed_state{
                      .height = last_committed_height_,
                      .state_root = last_committed_state_root_});
  initialized_ = true;
  spdlog::info("Initialized escrow ledger with administrator {}",
               to_hex(administrator));
  return true;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!tx.has_value()) {
    return make_failure(transaction_error_code::invalid_transaction,
                        kCheckTxCodespace, "failed to decode transaction");
  }
  auto result = validate_transaction(*tx, kCheckTxCodespace);
  if (result.code != 0) {
    return result;
  }
  if (tx->value > 0 && !is_payable(tx->payload)) {
    return make_failure(transaction_error_code::value_not_accepted,
                        kCheckTxCodespace,
                        "operation does not accept attached value");
  }
  return make_success("transaction admitted");
}

block_result_t engine::finalize_block(
    const uint64_t height,
    const timestamp_milliseconds_t block_time,
    const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.height = height;
  result.block_time = block_time;
  result.tx_results.reserve(txs.size());

  current_block_height_ = height;
  current_block_time_ms_ = block_time;

  auto rolling_root = last_committed_state_root_;
  auto scope = block_scope{in_block_};
  for (size_t i = 0; i < txs.size(); ++i) {
    current_tx_index_ = static_cast<uint32_t>(i);
    auto raw = bytes_view_t{txs[i].data(), txs[i].size()};
    auto tx_result = apply_transaction(raw);
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, raw, height, i);
    } else {
      spdlog::debug("Transaction {} in block {} failed: {} ({})", i, height,
                    tx_result.log, tx_result.info);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  if (!in_block_) {
    return make_failure(transaction_error_code::invalid_transaction,
                        kFinalizeCodespace, "no block is being finalized");
  }
  return apply_transaction(raw_tx);
}

transaction_result_t engine::apply_transaction(const bytes_view_t& raw_tx) {
  auto tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!tx.has_value()) {
    return make_failure(transaction_error_code::invalid_transaction,
                        kFinalizeCodespace, "failed to decode transaction");
  }
  if (auto invalid = validate_transaction(*tx, kFinalizeCodespace);
      invalid.code != 0) {
    return invalid;
  }
  if (tx->value > 0 && !is_payable(tx->payload)) {
    return make_failure(transaction_error_code::value_not_accepted,
                        kFinalizeCodespace,
                        "operation does not accept attached value");
  }

  auto tx_index = current_tx_index_;
  auto scope = journal_scope{pending_};
  // Staged before the operation runs so a nested call cannot reuse it.
  pending_.put(escrow::schema::key::make_nonce_key(encoder_, tx->signer),
               tx->nonce);
  auto events = std::vector<transaction_event_t>{};
  auto result = execute_operation(*tx, events);
  if (result.code != 0) {
    scope.rollback();
    return result;
  }

  record_events(events, tx_index);
  scope.release();
  result.events = std::move(events);
  return result;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_failure(transaction_error_code::unsupported_transaction_version,
                        codespace, "expected version 1");
  }
  if (!initialized_) {
    return make_failure(transaction_error_code::not_initialized, codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_failure(transaction_error_code::invalid_chain_id, codespace,
                        "expected " + to_hex(chain_id_));
  }
  auto last_nonce =
      pending_
          .get<uint64_t>(
              escrow::schema::key::make_nonce_key(encoder_, tx.signer))
          .value_or(0);
  if (tx.nonce != last_nonce + 1) {
    return make_failure(transaction_error_code::invalid_nonce, codespace,
                        "expected nonce " + std::to_string(last_nonce + 1));
  }
  return make_success({});
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    std::vector<transaction_event_t>& events) {
  auto transfer = transfer_handler_t{
      [handler = transfer_handler_](const account_id_t& recipient,
                                    const amount_t& amount) {
        try {
          return handler(recipient, amount);
        } catch (const std::exception& e) {
          spdlog::warn("Transfer of {} to {} threw: {}", amount.str(),
                       to_hex(recipient), e.what());
          return false;
        }
      }};
  auto context = operation_context{.state = pending_,
                                   .caller = tx.signer,
                                   .value = tx.value,
                                   .now = current_block_time_ms_,
                                   .transfer = transfer,
                                   .events = events};
  return std::visit(
      overloaded{[&](const grant_self_role_t& operation) {
                   return escrow::access::grant_self_role(context, operation);
                 },
                 [&](const set_role_membership_t& operation) {
                   return escrow::access::set_role_membership(context,
                                                              operation);
                 },
                 [&](const post_job_t& operation) {
                   return jobs_.post_job(context, operation);
                 },
                 [&](const update_job_t& operation) {
                   return jobs_.update_job(context, operation);
                 },
                 [&](const cancel_job_t& operation) {
                   return jobs_.cancel_job(context, operation);
                 },
                 [&](const submit_work_t& operation) {
                   return jobs_.submit_work(context, operation);
                 },
                 [&](const approve_work_t& operation) {
                   return jobs_.approve_work(context, operation);
                 },
                 [&](const reject_work_t& operation) {
                   return jobs_.reject_work(context, operation);
                 }},
      tx.payload);
}

void engine::record_events(const std::vector<transaction_event_t>& events,
                           const uint32_t tx_index) {
  if (events.empty()) {
    return;
  }
  auto seq_key = escrow::schema::key::make_event_seq_key(encoder_);
  auto event_id = pending_.get<uint64_t>(seq_key).value_or(0);
  for (const auto& event : events) {
    ++event_id;
    pending_.put(escrow::schema::key::make_event_key(encoder_, event_id),
                 event_record_t{.event_id = event_id,
                                .height = current_block_height_,
                                .tx_index = tx_index,
                                .recorded_at = current_block_time_ms_,
                                .event = event});
  }
  pending_.put(seq_key, event_id);
}

bool engine::credit_balance(const account_id_t& recipient,
                            const amount_t& amount) {
  auto key = escrow::schema::key::make_balance_key(encoder_, recipient);
  auto balance = pending_.get<amount_t>(key).value_or(0);
  pending_.put(key, amount_t{balance + amount});
  return true;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  auto entries = pending_.drain();
  storage_.commit(entries, escrow::storage::committed_state{
                               .height = last_committed_height_,
                               .state_root = last_committed_state_root_});
  spdlog::info("Committed height {} with {} write(s), state root {}",
               last_committed_height_, entries.size(),
               to_hex(last_committed_state_root_));

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  result.writes = entries.size();
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.initialized = initialized_;
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  if (path == "/engine/info") {
    auto info = app_info_t{};
    info.initialized = initialized_;
    info.last_block_height = last_committed_height_;
    info.last_block_state_root = last_committed_state_root_;
    result.value = encoder_.encode(info);
    return result;
  }

  if (path == "/state/job") {
    auto job_id = encoder_.try_decode<job_id_t>(data);
    if (!job_id.has_value()) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE job id", data,
                              last_committed_height_);
    }
    auto key = escrow::schema::key::make_job_key(encoder_, *job_id);
    auto job = storage_.get<job_state_t>(encoder_, make_bytes_view(key));
    if (!job.has_value()) {
      return make_query_error(query_error_code::not_found, "job not found",
                              data, last_committed_height_);
    }
    result.value = encoder_.encode(*job);
    return result;
  }

  if (path == "/state/next_job_id") {
    auto key = escrow::schema::key::make_next_job_id_key(encoder_);
    auto next = storage_.get<job_id_t>(encoder_, make_bytes_view(key));
    result.value = encoder_.encode(next.value_or(job_id_t{1}));
    return result;
  }

  if (path == "/state/role") {
    auto decoded = encoder_.try_decode<std::tuple<uint8_t, account_id_t>>(data);
    if (!decoded.has_value() ||
        std::get<0>(*decoded) >
            static_cast<uint8_t>(role_id_t::freelancer)) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE (role, account)", data,
                              last_committed_height_);
    }
    auto key = escrow::schema::key::make_role_key(
        encoder_, static_cast<role_id_t>(std::get<0>(*decoded)),
        std::get<1>(*decoded));
    auto member = storage_.get<bool>(encoder_, make_bytes_view(key));
    result.value = encoder_.encode(member.value_or(false));
    return result;
  }

  if (path == "/state/balance" || path == "/state/nonce") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account.has_value()) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE account id", data,
                              last_committed_height_);
    }
    if (path == "/state/balance") {
      auto key = escrow::schema::key::make_balance_key(encoder_, *account);
      auto balance = storage_.get<amount_t>(encoder_, make_bytes_view(key));
      result.value = encoder_.encode(balance.value_or(amount_t{0}));
    } else {
      auto key = escrow::schema::key::make_nonce_key(encoder_, *account);
      auto nonce = storage_.get<uint64_t>(encoder_, make_bytes_view(key));
      result.value = encoder_.encode(nonce.value_or(uint64_t{0}));
    }
    return result;
  }

  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range.has_value()) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE (from_id, to_id)", data,
                              last_committed_height_);
    }
    auto [from_id, to_id] = *range;
    if (from_id == 0 || from_id > to_id ||
        (to_id - from_id) >= kMaxEventRange) {
      return make_query_error(query_error_code::invalid_range,
                              "event range must be 1-based, ordered and "
                              "at most 1000 entries",
                              data, last_committed_height_);
    }
    auto records = std::vector<event_record_t>{};
    for (auto id = from_id; id <= to_id; ++id) {
      auto key = escrow::schema::key::make_event_key(encoder_, id);
      auto record = storage_.get<event_record_t>(encoder_, make_bytes_view(key));
      if (!record.has_value()) {
        break;
      }
      records.push_back(std::move(*record));
    }
    result.value = encoder_.encode(records);
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data,
                          last_committed_height_);
}

bool engine::has_role(const account_id_t& account, const role_id_t role) const {
  auto lock = std::scoped_lock{mutex_};
  return pending_
      .get<bool>(escrow::schema::key::make_role_key(encoder_, role, account))
      .value_or(false);
}

bool engine::set_transfer_handler(transfer_handler_t handler) {
  auto lock = std::scoped_lock{mutex_};
  if (jobs_.transfer_in_progress()) {
    spdlog::warn("Transfer handler cannot be replaced during a transfer");
    return false;
  }
  if (handler) {
    transfer_handler_ = std::move(handler);
  } else {
    install_ledger_transfer();
  }
  return true;
}

void engine::install_ledger_transfer() {
  transfer_handler_ = [this](const account_id_t& recipient,
                             const amount_t& amount) {
    return credit_balance(recipient, amount);
  };
}

}  // namespace escrow::execution
