#include <spdlog/spdlog.h>
#include <escrow/access/authorizer.hpp>
#include <escrow/common/critical.hpp>
#include <escrow/execution/events.hpp>
#include <escrow/execution/result.hpp>
#include <escrow/lifecycle/job_lifecycle.hpp>
#include <escrow/schema/key/engine_keys.hpp>

using namespace escrow::schema;
using escrow::execution::kJobsCodespace;
using escrow::execution::make_success;
using escrow::execution::operation_context;

namespace escrow::lifecycle {

namespace {

using encoder_t = escrow::schema::encoding::encoder<
    escrow::schema::encoding::scale_encoder_tag>;

transaction_result_t failure(const transaction_error_code code,
                             std::string info = {}) {
  return escrow::execution::make_failure(code, kJobsCodespace,
                                         std::move(info));
}

bytes_t job_key(const job_id_t job_id) {
  auto encoder = encoder_t{};
  return escrow::schema::key::make_job_key(encoder, job_id);
}

bytes_t next_job_id_key() {
  auto encoder = encoder_t{};
  return escrow::schema::key::make_next_job_id_key(encoder);
}

bool has_role(const operation_context& context, const role_id_t role) {
  return escrow::access::authorizer{context.state}.has_role(context.caller,
                                                           role);
}

std::optional<transaction_result_t> validate_fields(
    const operation_context& context,
    const std::string& title,
    const timestamp_milliseconds_t deadline) {
  if (title.empty() || deadline == 0) {
    return failure(transaction_error_code::empty_field,
                   "title and deadline are required");
  }
  if (deadline <= context.now) {
    return failure(transaction_error_code::invalid_deadline,
                   "deadline must be after the current block time");
  }
  return std::nullopt;
}

// Found, owner and open checks shared by update_job and cancel_job.
std::optional<transaction_result_t> validate_open_owned(
    const operation_context& context,
    const std::optional<job_state_t>& job) {
  if (!job.has_value()) {
    return failure(transaction_error_code::job_not_found);
  }
  if (job->client != context.caller) {
    return failure(transaction_error_code::unauthorized,
                   "only the posting client may modify the job");
  }
  if (job->status != job_status_t::open) {
    return failure(transaction_error_code::job_not_open,
                   std::string{"job is "} + std::string{to_string(job->status)});
  }
  return std::nullopt;
}

// Found, owner and submitted checks shared by approve_work and reject_work.
std::optional<transaction_result_t> validate_submitted_owned(
    const operation_context& context,
    const std::optional<job_state_t>& job) {
  if (!job.has_value()) {
    return failure(transaction_error_code::job_not_found);
  }
  if (job->client != context.caller) {
    return failure(transaction_error_code::unauthorized,
                   "only the posting client may review work");
  }
  if (job->status != job_status_t::submitted) {
    return failure(transaction_error_code::no_work_submitted,
                   std::string{"job is "} + std::string{to_string(job->status)});
  }
  return std::nullopt;
}

}  // namespace

class job_lifecycle::transfer_scope final {
 public:
  explicit transfer_scope(bool& flag) : flag_{flag} { flag_ = true; }
  ~transfer_scope() { flag_ = false; }

  transfer_scope(const transfer_scope&) = delete;
  transfer_scope& operator=(const transfer_scope&) = delete;

 private:
  bool& flag_;
};

std::optional<job_state_t> job_lifecycle::load_job(
    const escrow::storage::pending_state& state,
    const job_id_t job_id) {
  return state.get<job_state_t>(job_key(job_id));
}

transaction_result_t job_lifecycle::post_job(operation_context& context,
                                             const post_job_t& operation) {
  if (!has_role(context, role_id_t::client)) {
    return failure(transaction_error_code::unauthorized,
                   "client role required");
  }
  if (auto invalid =
          validate_fields(context, operation.title, operation.deadline)) {
    return *invalid;
  }
  if (context.value == 0) {
    return failure(transaction_error_code::no_value_deposited);
  }

  auto job_id = context.state.get<job_id_t>(next_job_id_key()).value_or(1);
  context.state.put(next_job_id_key(), job_id_t{job_id + 1});
  context.state.put(job_key(job_id),
                    job_state_t{.job_id = job_id,
                                .client = context.caller,
                                .freelancer = std::nullopt,
                                .status = job_status_t::open,
                                .title = operation.title,
                                .description = operation.description,
                                .amount = context.value,
                                .deadline = operation.deadline,
                                .proof_hash = {}});
  context.events.push_back(escrow::execution::make_job_posted_event(
      job_id, context.caller, context.value));
  spdlog::debug("Posted job {} for {} with {}", job_id, to_hex(context.caller),
                context.value.str());

  auto result = make_success("post_job accepted");
  auto encoder = encoder_t{};
  result.data = encoder.encode(job_id);
  return result;
}

transaction_result_t job_lifecycle::update_job(operation_context& context,
                                               const update_job_t& operation) {
  if (!has_role(context, role_id_t::client)) {
    return failure(transaction_error_code::unauthorized,
                   "client role required");
  }
  if (auto invalid =
          validate_fields(context, operation.title, operation.deadline)) {
    return *invalid;
  }
  auto job = load_job(context.state, operation.job_id);
  if (auto invalid = validate_open_owned(context, job)) {
    return *invalid;
  }

  job->title = operation.title;
  job->description = operation.description;
  job->deadline = operation.deadline;
  if (context.value > 0) {
    job->amount += context.value;
  }
  context.state.put(job_key(operation.job_id), *job);
  context.events.push_back(
      escrow::execution::make_job_updated_event(operation.job_id));
  return make_success("update_job accepted");
}

transaction_result_t job_lifecycle::cancel_job(operation_context& context,
                                               const cancel_job_t& operation) {
  if (!has_role(context, role_id_t::client)) {
    return failure(transaction_error_code::unauthorized,
                   "client role required");
  }
  if (transfer_in_progress_) {
    return failure(transaction_error_code::reentrant_call);
  }
  auto scope = transfer_scope{transfer_in_progress_};

  auto job = load_job(context.state, operation.job_id);
  if (auto invalid = validate_open_owned(context, job)) {
    return *invalid;
  }

  auto refund = job->amount;
  job->status = job_status_t::cancelled;
  job->amount = 0;
  context.state.put(job_key(operation.job_id), *job);
  context.events.push_back(
      escrow::execution::make_job_cancelled_event(operation.job_id, refund));

  if (refund > 0 && !context.transfer(job->client, refund)) {
    spdlog::warn("Refund of {} for job {} failed", refund.str(),
                 operation.job_id);
    return failure(transaction_error_code::transfer_failed,
                   "refund to client failed");
  }
  return make_success("cancel_job accepted");
}

transaction_result_t job_lifecycle::submit_work(
    operation_context& context,
    const submit_work_t& operation) {
  if (!has_role(context, role_id_t::freelancer)) {
    return failure(transaction_error_code::unauthorized,
                   "freelancer role required");
  }
  auto job = load_job(context.state, operation.job_id);
  if (!job.has_value()) {
    return failure(transaction_error_code::job_not_found);
  }
  if (job->status != job_status_t::open) {
    return failure(transaction_error_code::job_not_open,
                   std::string{"job is "} + std::string{to_string(job->status)});
  }
  if (context.now > job->deadline) {
    return failure(transaction_error_code::invalid_deadline,
                   "submission deadline has passed");
  }
  if (operation.proof_hash.empty()) {
    return failure(transaction_error_code::empty_field,
                   "proof_hash is required");
  }

  job->freelancer = context.caller;
  job->proof_hash = operation.proof_hash;
  job->status = job_status_t::submitted;
  context.state.put(job_key(operation.job_id), *job);
  context.events.push_back(escrow::execution::make_work_submitted_event(
      operation.job_id, context.caller, operation.proof_hash));
  return make_success("submit_work accepted");
}

transaction_result_t job_lifecycle::approve_work(
    operation_context& context,
    const approve_work_t& operation) {
  if (!has_role(context, role_id_t::client)) {
    return failure(transaction_error_code::unauthorized,
                   "client role required");
  }
  if (transfer_in_progress_) {
    return failure(transaction_error_code::reentrant_call);
  }
  auto scope = transfer_scope{transfer_in_progress_};

  auto job = load_job(context.state, operation.job_id);
  if (auto invalid = validate_submitted_owned(context, job)) {
    return *invalid;
  }
  if (!job->freelancer.has_value()) {
    escrow::common::critical("submitted job {} has no freelancer",
                             operation.job_id);
  }

  auto payee = *job->freelancer;
  auto payout = job->amount;
  job->status = job_status_t::completed;
  job->amount = 0;
  job->freelancer = std::nullopt;
  context.state.put(job_key(operation.job_id), *job);

  if (payout > 0 && !context.transfer(payee, payout)) {
    spdlog::warn("Payment of {} for job {} failed", payout.str(),
                 operation.job_id);
    return failure(transaction_error_code::transfer_failed,
                   "payment to freelancer failed");
  }
  context.events.push_back(escrow::execution::make_payment_released_event(
      operation.job_id, payout, payee));
  return make_success("approve_work accepted");
}

transaction_result_t job_lifecycle::reject_work(operation_context& context,
                                                const reject_work_t& operation) {
  if (!has_role(context, role_id_t::client)) {
    return failure(transaction_error_code::unauthorized,
                   "client role required");
  }
  auto job = load_job(context.state, operation.job_id);
  if (auto invalid = validate_submitted_owned(context, job)) {
    return *invalid;
  }

  job->freelancer = std::nullopt;
  job->proof_hash.clear();
  job->status = job_status_t::open;
  context.state.put(job_key(operation.job_id), *job);
  context.events.push_back(
      escrow::execution::make_work_rejected_event(operation.job_id));
  return make_success("reject_work accepted");
}

}  // namespace escrow::lifecycle
