#pragma once

#include <hashlock/execution/engine_options.hpp>
#include <hashlock/execution/height_source.hpp>
#include <hashlock/ledger/ledger.hpp>
#include <hashlock/schema/escrow_state.hpp>
#include <hashlock/schema/escrow_stats.hpp>
#include <hashlock/schema/escrow_summary.hpp>
#include <hashlock/storage/escrow_store.hpp>

#include <optional>
#include <vector>

namespace hashlock::execution {

/// Read-only projections over the escrow store.
///
/// None of these fail: a missing record is reported as a value (`nullopt`,
/// `false`, or a summary with `exists == false`).
class query final {
 public:
  query(const hashlock::storage::escrow_store& store,
        const hashlock::ledger::ledger& ledger,
        height_source_t height_source,
        const engine_options& options);

  std::optional<hashlock::schema::escrow_state_t> get(
      hashlock::schema::escrow_id_t id) const;

  bool can_claim(hashlock::schema::escrow_id_t id) const;
  bool can_refund(hashlock::schema::escrow_id_t id) const;

  hashlock::schema::escrow_summary_t status(
      hashlock::schema::escrow_id_t id) const;

  hashlock::schema::escrow_stats_t stats() const;

  /// Every record locked under `secret_hash`, ordered by id.
  std::vector<hashlock::schema::escrow_state_t> by_secret_hash(
      const hashlock::schema::hash32_t& secret_hash) const;

 private:
  const hashlock::storage::escrow_store& store_;
  const hashlock::ledger::ledger& ledger_;
  height_source_t height_source_;
  const engine_options& options_;
};

}  // namespace hashlock::execution
