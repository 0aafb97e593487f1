#pragma once

#include <escrow/execution/transfer_handler.hpp>
#include <escrow/schema/primitives.hpp>
#include <escrow/schema/transaction_event.hpp>
#include <escrow/storage/pending_state.hpp>
#include <vector>

namespace escrow::execution {

/// Everything an operation may read or touch while it executes.
struct operation_context final {
  escrow::storage::pending_state& state;
  const escrow::schema::account_id_t& caller;
  const escrow::schema::amount_t& value;
  escrow::schema::timestamp_milliseconds_t now{};
  const transfer_handler_t& transfer;
  std::vector<escrow::schema::transaction_event_t>& events;
};

}  // namespace escrow::execution
