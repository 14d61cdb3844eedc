#pragma once
#include <hashlock/schema/escrow_status.hpp>
#include <hashlock/schema/primitives.hpp>

#include <cstdint>

namespace hashlock::schema {

template <uint16_t Version>
struct escrow_state;

/// Persisted escrow record.
///
/// Everything except `status` is fixed when the record is created. `status`
/// leaves `open` at most once and never returns to it.
template <>
struct escrow_state<1> final {
  uint16_t version{1};
  escrow_id_t id{};
  account_id_t sender{};
  account_id_t recipient{};
  amount_t amount{};
  height_t unlock_height{};
  hash32_t secret_hash{};
  escrow_status_t status{escrow_status_t::open};
  height_t created_height{};

  bool claimed() const { return status == escrow_status_t::claimed; }
  bool refunded() const { return status == escrow_status_t::refunded; }
};

using escrow_state_t = escrow_state<1>;

}  // namespace hashlock::schema
