#pragma once

#include <gtest/gtest.h>

#include <escrow/execution/engine.hpp>
#include <escrow/schema/encoding/scale/encoder.hpp>
#include <escrow/schema/event_record.hpp>
#include <escrow/schema/job_state.hpp>
#include <escrow/schema/transaction.hpp>
#include <escrow/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <tuple>
#include <vector>

namespace escrow::testing {

using scale_encoder_t = escrow::schema::encoding::encoder<
    escrow::schema::encoding::scale_encoder_tag>;

inline escrow::schema::transaction_t make_transaction(
    const escrow::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const escrow::schema::account_id_t& signer,
    const escrow::schema::transaction_payload_t& payload,
    const escrow::schema::amount_t& value = 0) {
  return escrow::schema::transaction_t{.version = 1,
                                       .chain_id = chain_id,
                                       .nonce = nonce,
                                       .signer = signer,
                                       .value = value,
                                       .payload = payload};
}

inline escrow::schema::bytes_t encode_transaction(
    const escrow::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline escrow::schema::job_id_t decode_job_id(
    const escrow::schema::transaction_result_t& result) {
  auto encoder = scale_encoder_t{};
  return encoder.decode<escrow::schema::job_id_t>(
      escrow::schema::bytes_view_t{result.data.data(), result.data.size()});
}

inline std::optional<escrow::schema::job_state_t> query_job(
    escrow::execution::engine& engine,
    const escrow::schema::job_id_t job_id) {
  auto encoder = scale_encoder_t{};
  const auto key = encoder.encode(job_id);
  const auto result = engine.query(
      "/state/job", escrow::schema::bytes_view_t{key.data(), key.size()});
  if (result.code != 0) {
    return std::nullopt;
  }
  return encoder.decode<escrow::schema::job_state_t>(
      escrow::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline escrow::schema::amount_t query_balance(
    escrow::execution::engine& engine,
    const escrow::schema::account_id_t& account) {
  auto encoder = scale_encoder_t{};
  const auto key = encoder.encode(account);
  const auto result = engine.query(
      "/state/balance", escrow::schema::bytes_view_t{key.data(), key.size()});
  EXPECT_EQ(result.code, 0u);
  return encoder.decode<escrow::schema::amount_t>(
      escrow::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline uint64_t query_nonce(escrow::execution::engine& engine,
                            const escrow::schema::account_id_t& account) {
  auto encoder = scale_encoder_t{};
  const auto key = encoder.encode(account);
  const auto result = engine.query(
      "/state/nonce", escrow::schema::bytes_view_t{key.data(), key.size()});
  EXPECT_EQ(result.code, 0u);
  return encoder.decode<uint64_t>(
      escrow::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline std::vector<escrow::schema::event_record_t> query_events(
    escrow::execution::engine& engine,
    const uint64_t from_id,
    const uint64_t to_id) {
  auto encoder = scale_encoder_t{};
  const auto query_key = encoder.encode(std::tuple{from_id, to_id});
  const auto result = engine.query(
      "/events/range",
      escrow::schema::bytes_view_t{query_key.data(), query_key.size()});
  EXPECT_EQ(result.code, 0u);
  return encoder.decode<std::vector<escrow::schema::event_record_t>>(
      escrow::schema::bytes_view_t{result.value.data(), result.value.size()});
}

}  // namespace escrow::testing
