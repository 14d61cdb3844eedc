#include <hashlock/execution/preconditions.hpp>
#include <hashlock/execution/query.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace hashlock::schema;

namespace hashlock::execution {

query::query(const hashlock::storage::escrow_store& store,
             const hashlock::ledger::ledger& ledger,
             height_source_t height_source,
             const engine_options& options)
    : store_{store},
      ledger_{ledger},
      height_source_{std::move(height_source)},
      options_{options} {}

std::optional<escrow_state_t> query::get(const escrow_id_t id) const {
  return store_.get(id);
}

bool query::can_claim(const escrow_id_t id) const {
  auto record = store_.get(id);
  return record.has_value() &&
         execution::can_claim(*record, height_source_());
}

bool query::can_refund(const escrow_id_t id) const {
  auto record = store_.get(id);
  return record.has_value() &&
         execution::can_refund(*record, height_source_());
}

escrow_summary_t query::status(const escrow_id_t id) const {
  auto record = store_.get(id);
  if (!record) {
    return escrow_summary_t{};
  }
  return escrow_summary_t{
      .exists = true,
      .claimed = record->claimed(),
      .refunded = record->refunded(),
      .height_reached = height_reached(*record, height_source_()),
      .sender = record->sender,
      .recipient = record->recipient,
      .amount = record->amount};
}

escrow_stats_t query::stats() const {
  return escrow_stats_t{
      .total_escrows = store_.total_escrows(),
      .holding_balance = ledger_.balance_of(options_.holding_account),
      .current_height = height_source_(),
      .privileged_owner = options_.privileged_owner};
}

std::vector<escrow_state_t> query::by_secret_hash(
    const hash32_t& secret_hash) const {
  auto records = std::vector<escrow_state_t>{};
  for (const auto id : store_.ids_by_secret_hash(secret_hash)) {
    auto record = store_.get(id);
    if (!record) {
      spdlog::warn("Commitment index references missing escrow {}", id);
      continue;
    }
    records.push_back(std::move(*record));
  }
  return records;
}

}  // namespace hashlock::execution
