#pragma once
#include <hashlock/schema/escrow_state.hpp>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace hashlock::storage {

enum class store_status_t : uint8_t {
  ok = 0,
  duplicate_id = 1,
  not_found = 2,
};

/// Keyed escrow records plus the next-id and total-created counters.
///
/// Pure data access: the store never decides whether a transition is legal.
class escrow_store final {
 public:
  explicit escrow_store(storage<rocksdb_storage_tag>& storage);

  std::optional<hashlock::schema::escrow_state_t> get(
      hashlock::schema::escrow_id_t id) const;
  bool contains(hashlock::schema::escrow_id_t id) const;

  /// Persist a new record, its commitment index row and both counters in a
  /// single batch. Fails with `duplicate_id` when the id is taken.
  ///
  /// `staged` rows (e.g. ledger balances) are committed in the same batch.
  store_status_t insert(const hashlock::schema::escrow_state_t& record,
                        const std::vector<key_value_entry_t>& staged = {});

  /// Overwrite an existing record, together with any `staged` rows, in one
  /// batch. Fails with `not_found` when absent.
  store_status_t update(const hashlock::schema::escrow_state_t& record,
                        const std::vector<key_value_entry_t>& staged = {});

  uint64_t total_escrows() const;

  /// Persisted allocator position; 1 on an empty store.
  hashlock::schema::escrow_id_t next_id() const;

  /// Ids of every record locked under `secret_hash`, ascending.
  std::vector<hashlock::schema::escrow_id_t> ids_by_secret_hash(
      const hashlock::schema::hash32_t& secret_hash) const;

 private:
  storage<rocksdb_storage_tag>& storage_;
};

}  // namespace hashlock::storage
