#pragma once

#include <hashlock/schema/enum_string.hpp>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/storage/storage.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace hashlock::ledger {

enum class transfer_status_t : uint8_t {
  ok = 0,
  insufficient_funds = 1,
  transfer_failed = 2,
};

inline constexpr auto kTransferStatusMappings =
    hashlock::schema::enum_mappings_t<transfer_status_t, 3>{
        std::pair<std::string_view, transfer_status_t>{"ok",
                                                       transfer_status_t::ok},
        std::pair<std::string_view, transfer_status_t>{
            "insufficient_funds", transfer_status_t::insufficient_funds},
        std::pair<std::string_view, transfer_status_t>{
            "transfer_failed", transfer_status_t::transfer_failed}};

inline constexpr std::string_view to_string(const transfer_status_t value) {
  return hashlock::schema::to_string(value, kTransferStatusMappings);
}

/// Fungible balance ledger the escrow engine moves value through.
///
/// `transfer` is all-or-nothing: on any status other than `ok` neither
/// balance has changed.
class ledger {
 public:
  virtual ~ledger() = default;

  virtual transfer_status_t transfer(const hashlock::schema::account_id_t& from,
                                     const hashlock::schema::account_id_t& to,
                                     hashlock::schema::amount_t amount) = 0;

  virtual hashlock::schema::amount_t balance_of(
      const hashlock::schema::account_id_t& account) const = 0;

  /// True when balance rows live in the escrow database and a transfer can
  /// be staged into the record's write batch.
  virtual bool supports_staging() const { return false; }

  /// Validate a transfer and append its balance rows to `entries` without
  /// writing them. Nothing is appended unless the status is `ok`.
  virtual transfer_status_t stage_transfer(
      const hashlock::schema::account_id_t& /*from*/,
      const hashlock::schema::account_id_t& /*to*/,
      hashlock::schema::amount_t /*amount*/,
      std::vector<hashlock::storage::key_value_entry_t>& /*entries*/) {
    return transfer_status_t::transfer_failed;
  }
};

}  // namespace hashlock::ledger
