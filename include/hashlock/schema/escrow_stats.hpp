#pragma once
#include <hashlock/schema/primitives.hpp>

#include <cstdint>

namespace hashlock::schema {

template <uint16_t Version>
struct escrow_stats;

template <>
struct escrow_stats<1> final {
  uint16_t version{1};
  uint64_t total_escrows{};
  amount_t holding_balance{};
  height_t current_height{};
  account_id_t privileged_owner{};
};

using escrow_stats_t = escrow_stats<1>;

}  // namespace hashlock::schema
