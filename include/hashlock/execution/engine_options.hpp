#pragma once

#include <hashlock/schema/hash_algorithm.hpp>
#include <hashlock/schema/primitives.hpp>

namespace hashlock::execution {

/// Ledger account that holds escrowed value between create and settlement.
///
/// Derived as BLAKE3("hashlock|escrow-holding").
hashlock::schema::account_id_t default_holding_account();

struct engine_options final {
  /// Only identity allowed to cancel an escrow before its unlock height.
  hashlock::schema::account_id_t privileged_owner{};
  hashlock::schema::account_id_t holding_account{default_holding_account()};
  hashlock::schema::hash_algorithm_t hash_algorithm{
      hashlock::schema::hash_algorithm_t::sha256};
};

}  // namespace hashlock::execution
