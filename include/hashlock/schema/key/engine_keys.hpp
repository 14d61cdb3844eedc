#pragma once

#include <hashlock/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for escrow records, their counters,
// the commitment index and the reference ledger balances.
namespace hashlock::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kEscrowKeyPrefix{"SYS|STATE|ESCROW|"};
inline constexpr std::string_view kEscrowByHashKeyPrefix{
    "SYS|STATE|ESCROW_BY_HASH|"};
inline constexpr std::string_view kNextIdKey{"SYS|STATE|NEXT_ID"};
inline constexpr std::string_view kTotalEscrowsKey{"SYS|STATE|TOTAL_ESCROWS"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kHeightKey{"SYS|STATE|HEIGHT"};

inline constexpr std::array<std::string_view, 7> kEngineKeyspaces{
    kStatePrefix,     kEscrowKeyPrefix,  kEscrowByHashKeyPrefix, kNextIdKey,
    kTotalEscrowsKey, kBalanceKeyPrefix, kHeightKey};

template <typename Encoder, typename T>
hashlock::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
hashlock::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
hashlock::schema::bytes_t make_escrow_key(
    Encoder& encoder,
    const hashlock::schema::escrow_id_t id) {
  return make_prefixed_key(encoder, kEscrowKeyPrefix, id);
}

template <typename Encoder>
hashlock::schema::bytes_t make_escrow_by_hash_key(
    Encoder& encoder,
    const hashlock::schema::hash32_t& secret_hash,
    const hashlock::schema::escrow_id_t id) {
  return make_prefixed_key(encoder, kEscrowByHashKeyPrefix,
                           std::tuple{secret_hash, id});
}

template <typename Encoder>
hashlock::schema::bytes_t make_escrow_by_hash_prefix_key(
    Encoder& encoder,
    const hashlock::schema::hash32_t& secret_hash) {
  return make_prefixed_key(encoder, kEscrowByHashKeyPrefix, secret_hash);
}

template <typename Encoder>
hashlock::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const hashlock::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix, account);
}

}  // namespace hashlock::schema::key
