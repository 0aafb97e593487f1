#include <escrow/execution/engine.hpp>
#include <escrow/execution/events.hpp>
#include <escrow/execution/result.hpp>
#include <gtest/gtest.h>

#include <string>

TEST(engine_types, defaults_are_stable) {
  auto tx = escrow::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_TRUE(tx.data.empty());
  EXPECT_TRUE(tx.events.empty());

  auto block = escrow::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());
  EXPECT_EQ(block.state_root, escrow::schema::hash32_t{});

  auto commit = escrow::schema::commit_result_t{};
  EXPECT_EQ(commit.committed_height, 0);
  EXPECT_EQ(commit.writes, 0u);

  auto info = escrow::schema::app_info_t{};
  EXPECT_EQ(info.data, "escrow-jobs");
  EXPECT_EQ(info.version, "0.1.0");
  EXPECT_FALSE(info.initialized);
}

TEST(engine_types, default_chain_id_is_stable) {
  EXPECT_EQ(escrow::execution::engine::default_chain_id(),
            escrow::execution::engine::default_chain_id());
  EXPECT_NE(escrow::execution::engine::default_chain_id(),
            escrow::schema::hash32_t{});
}

TEST(engine_types, failure_results_carry_code_and_codespace) {
  auto result = escrow::execution::make_failure(
      escrow::schema::transaction_error_code::job_not_open,
      escrow::execution::kJobsCodespace, "job is cancelled");
  EXPECT_EQ(result.code, 12u);
  EXPECT_EQ(result.log, "job not open");
  EXPECT_EQ(result.info, "job is cancelled");
  EXPECT_EQ(result.codespace, "escrow.jobs");
}

TEST(engine_types, event_attributes_render_amounts_and_ids) {
  auto account = escrow::schema::account_id_t{};
  account.fill(0xAB);
  auto amount = escrow::schema::amount_t{
      "115792089237316195423570985008687907853269984665640564039457584007913129"
      "639935"};
  auto event =
      escrow::execution::make_job_posted_event(18446744073709551615ull,
                                               account, amount);
  EXPECT_EQ(event.type, escrow::schema::event_type_t::job_posted);
  EXPECT_EQ(escrow::schema::find_attribute(event, "job_id"),
            "18446744073709551615");
  EXPECT_EQ(escrow::schema::find_attribute(event, "amount"), amount.str());
  auto expected_client = std::string{};
  for (auto i = 0; i < 32; ++i) {
    expected_client += "ab";
  }
  EXPECT_EQ(escrow::schema::find_attribute(event, "client"), expected_client);
  EXPECT_FALSE(
      escrow::schema::find_attribute(event, "freelancer").has_value());
}

TEST(engine_types, transfer_handler_type_accepts_lambdas) {
  auto handler = escrow::execution::transfer_handler_t{
      [](const escrow::schema::account_id_t&,
         const escrow::schema::amount_t& amount) { return amount > 0; }};
  EXPECT_TRUE(static_cast<bool>(handler));
  EXPECT_FALSE(handler(escrow::schema::account_id_t{}, 0));
}
