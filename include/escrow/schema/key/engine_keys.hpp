#pragma once

#include <escrow/schema/primitives.hpp>
#include <escrow/schema/role_id.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for job, role, balance, nonce and
// event-log state.
namespace escrow::schema::key {

inline constexpr std::string_view kGenesisKeyPrefix{"SYS|STATE|GENESIS|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kJobKeyPrefix{"SYS|STATE|JOB|"};
inline constexpr std::string_view kNextJobIdKeyPrefix{
    "SYS|STATE|NEXT_JOB_ID|"};
inline constexpr std::string_view kRoleKeyPrefix{"SYS|STATE|ROLE|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
escrow::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // Same bytes as encode(tuple{prefix, id}); keys of one prefix sort together.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
escrow::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
escrow::schema::bytes_t make_genesis_key(Encoder& encoder) {
  return make_prefix_key(encoder, kGenesisKeyPrefix);
}

template <typename Encoder>
escrow::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const escrow::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, account);
}

template <typename Encoder>
escrow::schema::bytes_t make_job_key(Encoder& encoder,
                                     const escrow::schema::job_id_t job_id) {
  return make_prefixed_key(encoder, kJobKeyPrefix, job_id);
}

template <typename Encoder>
escrow::schema::bytes_t make_next_job_id_key(Encoder& encoder) {
  return make_prefix_key(encoder, kNextJobIdKeyPrefix);
}

template <typename Encoder>
escrow::schema::bytes_t make_role_key(
    Encoder& encoder,
    const escrow::schema::role_id_t role,
    const escrow::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kRoleKeyPrefix,
                           std::tuple{static_cast<uint8_t>(role), account});
}

template <typename Encoder>
escrow::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const escrow::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, account);
}

template <typename Encoder>
escrow::schema::bytes_t make_event_seq_key(Encoder& encoder) {
  return make_prefix_key(encoder, kEventSeqKeyPrefix);
}

template <typename Encoder>
escrow::schema::bytes_t make_event_key(Encoder& encoder,
                                       const uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

}  // namespace escrow::schema::key
