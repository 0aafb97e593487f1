#pragma once

#include <escrow/execution/operation_context.hpp>
#include <escrow/schema/approve_work.hpp>
#include <escrow/schema/cancel_job.hpp>
#include <escrow/schema/job_state.hpp>
#include <escrow/schema/post_job.hpp>
#include <escrow/schema/reject_work.hpp>
#include <escrow/schema/submit_work.hpp>
#include <escrow/schema/transaction_result.hpp>
#include <escrow/schema/update_job.hpp>
#include <optional>

namespace escrow::lifecycle {

/// Job registry and escrow state machine.
///
///   open -> submitted -> completed
///     ^         |
///     +---------+ (reject)
///   open -> cancelled
///
/// Every operation validates before it writes. Value-moving operations
/// (`cancel_job`, `approve_work`) stage their state change before calling the
/// transfer primitive and refuse to run while another value-moving operation
/// is in progress on this instance. A failed transfer is reported as
/// `transfer_failed`; undoing the staged writes is the caller's job scope.
class job_lifecycle final {
 public:
  escrow::schema::transaction_result_t post_job(
      escrow::execution::operation_context& context,
      const escrow::schema::post_job_t& operation);

  escrow::schema::transaction_result_t update_job(
      escrow::execution::operation_context& context,
      const escrow::schema::update_job_t& operation);

  escrow::schema::transaction_result_t cancel_job(
      escrow::execution::operation_context& context,
      const escrow::schema::cancel_job_t& operation);

  escrow::schema::transaction_result_t submit_work(
      escrow::execution::operation_context& context,
      const escrow::schema::submit_work_t& operation);

  escrow::schema::transaction_result_t approve_work(
      escrow::execution::operation_context& context,
      const escrow::schema::approve_work_t& operation);

  escrow::schema::transaction_result_t reject_work(
      escrow::execution::operation_context& context,
      const escrow::schema::reject_work_t& operation);

  /// True while a value-moving operation is executing.
  bool transfer_in_progress() const { return transfer_in_progress_; }

  static std::optional<escrow::schema::job_state_t> load_job(
      const escrow::storage::pending_state& state,
      escrow::schema::job_id_t job_id);

 private:
  class transfer_scope;

  bool transfer_in_progress_{};
};

}  // namespace escrow::lifecycle
