#include <escrow/access/authorizer.hpp>
#include <escrow/lifecycle/job_lifecycle.hpp>
#include <escrow/schema/transaction_error_code.hpp>
#include <escrow/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace escrow::schema;

namespace {

constexpr auto kNow = timestamp_milliseconds_t{5'000};

const auto kClient = escrow::testing::make_account(0x11);
const auto kFreelancer = escrow::testing::make_account(0x21);

uint32_t code(const transaction_error_code value) {
  return static_cast<uint32_t>(value);
}

class job_lifecycle_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_ = escrow::testing::make_db_path("escrow_job_lifecycle");
    storage_ = escrow::storage::make_storage<
        escrow::storage::rocksdb_storage_tag>(db_);
    state_.emplace(storage_);
    auto roles = escrow::access::authorizer{*state_};
    ASSERT_TRUE(roles.grant_self(kClient, role_id_t::client));
    ASSERT_TRUE(roles.grant_self(kFreelancer, role_id_t::freelancer));
    transfer_ = [this](const account_id_t& recipient, const amount_t& amount) {
      transfers_.emplace_back(recipient, amount);
      return transfer_result_;
    };
  }

  void TearDown() override {
    state_.reset();
    storage_.database.reset();
    escrow::testing::remove_path(db_);
  }

  escrow::execution::operation_context context(const account_id_t& caller,
                                               const amount_t& value = 0) {
    caller_ = caller;
    value_ = value;
    return escrow::execution::operation_context{.state = *state_,
                                                .caller = caller_,
                                                .value = value_,
                                                .now = kNow,
                                                .transfer = transfer_,
                                                .events = events_};
  }

  job_id_t post_submitted_job() {
    auto post_ctx = context(kClient, 100);
    auto posted = jobs_.post_job(
        post_ctx, post_job_t{.title = "t", .description = {}, .deadline = kNow + 1});
    EXPECT_EQ(posted.code, 0u);
    auto job_id = job_id_t{1};
    auto submit_ctx = context(kFreelancer);
    EXPECT_EQ(jobs_.submit_work(submit_ctx,
                                submit_work_t{.job_id = job_id,
                                              .proof_hash = "ipfs://x"})
                  .code,
              0u);
    return job_id;
  }

  std::string db_;
  escrow::storage::storage<escrow::storage::rocksdb_storage_tag> storage_;
  std::optional<escrow::storage::pending_state> state_;
  escrow::lifecycle::job_lifecycle jobs_;
  account_id_t caller_{};
  amount_t value_{};
  bool transfer_result_{true};
  std::vector<std::pair<account_id_t, amount_t>> transfers_;
  escrow::execution::transfer_handler_t transfer_;
  std::vector<transaction_event_t> events_;
};

}  // namespace

TEST_F(job_lifecycle_test, missing_role_fails_before_state_is_read) {
  auto ctx = context(kFreelancer, 100);
  auto result = jobs_.post_job(
      ctx, post_job_t{.title = "", .description = {}, .deadline = 0});
  EXPECT_EQ(result.code, code(transaction_error_code::unauthorized));
  EXPECT_EQ(result.codespace, "escrow.jobs");

  auto cancel = jobs_.cancel_job(ctx, cancel_job_t{.job_id = 404});
  EXPECT_EQ(cancel.code, code(transaction_error_code::unauthorized));
  EXPECT_TRUE(events_.empty());
}

TEST_F(job_lifecycle_test, post_job_assigns_sequential_ids) {
  for (auto expected = job_id_t{1}; expected <= 3; ++expected) {
    auto ctx = context(kClient, 10);
    auto result = jobs_.post_job(
        ctx, post_job_t{.title = "t", .description = {}, .deadline = kNow + 1});
    ASSERT_EQ(result.code, 0u);
    auto job = escrow::lifecycle::job_lifecycle::load_job(*state_, expected);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->job_id, expected);
  }
  EXPECT_FALSE(
      escrow::lifecycle::job_lifecycle::load_job(*state_, 4).has_value());
}

TEST_F(job_lifecycle_test, approve_pays_recorded_freelancer) {
  auto job_id = post_submitted_job();
  auto ctx = context(kClient);
  auto result = jobs_.approve_work(ctx, approve_work_t{.job_id = job_id});
  ASSERT_EQ(result.code, 0u);
  ASSERT_EQ(transfers_.size(), 1u);
  EXPECT_EQ(transfers_[0].first, kFreelancer);
  EXPECT_EQ(transfers_[0].second, amount_t{100});
  EXPECT_FALSE(jobs_.transfer_in_progress());
}

TEST_F(job_lifecycle_test, failed_transfer_reports_without_event) {
  auto job_id = post_submitted_job();
  events_.clear();
  transfer_result_ = false;

  auto marker = state_->begin();
  auto ctx = context(kClient);
  auto result = jobs_.approve_work(ctx, approve_work_t{.job_id = job_id});
  EXPECT_EQ(result.code, code(transaction_error_code::transfer_failed));
  EXPECT_TRUE(events_.empty());
  EXPECT_FALSE(jobs_.transfer_in_progress());
  state_->rollback(marker);

  auto job = escrow::lifecycle::job_lifecycle::load_job(*state_, job_id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, job_status_t::submitted);
  EXPECT_EQ(job->amount, amount_t{100});
}

TEST_F(job_lifecycle_test, guard_blocks_nested_value_operations) {
  auto job_id = post_submitted_job();
  auto nested = std::optional<transaction_result_t>{};
  auto guarded = false;
  transfer_ = [&](const account_id_t&, const amount_t&) {
    guarded = jobs_.transfer_in_progress();
    auto nested_ctx = escrow::execution::operation_context{
        .state = *state_,
        .caller = kClient,
        .value = value_,
        .now = kNow,
        .transfer = transfer_,
        .events = events_};
    nested = jobs_.cancel_job(nested_ctx, cancel_job_t{.job_id = job_id});
    return true;
  };

  auto ctx = context(kClient);
  ASSERT_EQ(jobs_.approve_work(ctx, approve_work_t{.job_id = job_id}).code, 0u);
  EXPECT_TRUE(guarded);
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(nested->code, code(transaction_error_code::reentrant_call));
  EXPECT_FALSE(jobs_.transfer_in_progress());
}

TEST_F(job_lifecycle_test, cancel_refunds_client_and_is_terminal) {
  auto ctx = context(kClient, 1);
  ASSERT_EQ(jobs_
                .post_job(ctx, post_job_t{.title = "t",
                                          .description = {},
                                          .deadline = kNow + 1})
                .code,
            0u);
  auto cancel_ctx = context(kClient);
  ASSERT_EQ(jobs_.cancel_job(cancel_ctx, cancel_job_t{.job_id = 1}).code, 0u);
  ASSERT_EQ(transfers_.size(), 1u);
  EXPECT_EQ(transfers_[0].first, kClient);

  auto job = escrow::lifecycle::job_lifecycle::load_job(*state_, 1);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->status, job_status_t::cancelled);
  EXPECT_TRUE(is_terminal(job->status));
}
