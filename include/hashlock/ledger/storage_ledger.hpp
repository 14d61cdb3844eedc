#pragma once

#include <hashlock/ledger/ledger.hpp>
#include <hashlock/storage/rocksdb/storage.hpp>

namespace hashlock::ledger {

/// Ledger whose balances live next to the escrow records in RocksDB.
///
/// Both legs of a transfer are committed in one write batch. The storage must
/// be the one the escrow store writes to, so staged transfers land in the
/// same database as the records they settle.
class storage_ledger final : public ledger {
 public:
  explicit storage_ledger(
      hashlock::storage::storage<hashlock::storage::rocksdb_storage_tag>&
          storage);

  transfer_status_t transfer(const hashlock::schema::account_id_t& from,
                             const hashlock::schema::account_id_t& to,
                             hashlock::schema::amount_t amount) override;

  hashlock::schema::amount_t balance_of(
      const hashlock::schema::account_id_t& account) const override;

  bool supports_staging() const override { return true; }

  transfer_status_t stage_transfer(
      const hashlock::schema::account_id_t& from,
      const hashlock::schema::account_id_t& to,
      hashlock::schema::amount_t amount,
      std::vector<hashlock::storage::key_value_entry_t>& entries) override;

  /// Mint `amount` into `account`. Returns false on overflow.
  bool credit(const hashlock::schema::account_id_t& account,
              hashlock::schema::amount_t amount);

 private:
  hashlock::storage::storage<hashlock::storage::rocksdb_storage_tag>& storage_;
};

}  // namespace hashlock::ledger
