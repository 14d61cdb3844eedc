#pragma once

#include <hashlock/execution/engine_options.hpp>
#include <hashlock/execution/height_source.hpp>
#include <hashlock/execution/query.hpp>
#include <hashlock/ledger/ledger.hpp>
#include <hashlock/schema/cancel_escrow.hpp>
#include <hashlock/schema/claim_escrow.hpp>
#include <hashlock/schema/create_escrow.hpp>
#include <hashlock/schema/escrow_state.hpp>
#include <hashlock/schema/escrow_stats.hpp>
#include <hashlock/schema/escrow_summary.hpp>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/schema/refund_escrow.hpp>
#include <hashlock/schema/transaction.hpp>
#include <hashlock/schema/transaction_error_code.hpp>
#include <hashlock/schema/transaction_result.hpp>
#include <hashlock/storage/escrow_store.hpp>
#include <hashlock/storage/id_allocator.hpp>

#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace hashlock::execution {

/// Hash-and-time-locked escrow state machine.
///
/// Every transition validates its full precondition set, then moves value
/// through the ledger, and only after the ledger reports success commits the
/// record. Ledgers that share the escrow database stage their balance rows
/// instead, and those rows commit in the record's write batch. A rejected transition never calls the ledger and never writes to
/// the store. Transitions and reads are serialized by one mutex.
class engine final {
 public:
  /// Bind the engine to its record store, ledger and height oracle.
  ///
  /// The identifier allocator resumes from the store's persisted counter.
  engine(hashlock::storage::escrow_store& store,
         hashlock::ledger::ledger& ledger,
         height_source_t height_source,
         engine_options options = {});

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Lock `amount` of the caller's balance for `recipient`.
  ///
  /// Unlocks at `current height + blocks_ahead`. On success the new id is in
  /// `escrow_id`.
  hashlock::schema::transaction_result_t create_escrow(
      const hashlock::schema::account_id_t& caller,
      const hashlock::schema::create_escrow_t& request);

  /// Release the escrow to its recipient against the commitment preimage.
  hashlock::schema::transaction_result_t claim_escrow(
      const hashlock::schema::account_id_t& caller,
      const hashlock::schema::claim_escrow_t& request);

  /// Return the escrow to its sender once the unlock height is reached.
  hashlock::schema::transaction_result_t refund_escrow(
      const hashlock::schema::account_id_t& caller,
      const hashlock::schema::refund_escrow_t& request);

  /// Privileged pre-deadline cancellation back to the sender.
  hashlock::schema::transaction_result_t cancel_escrow(
      const hashlock::schema::account_id_t& caller,
      const hashlock::schema::cancel_escrow_t& request);

  /// Dispatch a host envelope; `tx.signer` is the caller.
  hashlock::schema::transaction_result_t execute(
      const hashlock::schema::transaction_t& tx);

  /// Decode a SCALE encoded envelope and dispatch it.
  hashlock::schema::transaction_result_t execute(
      const hashlock::schema::bytes_view_t& raw_tx);

  std::optional<hashlock::schema::escrow_state_t> get(
      hashlock::schema::escrow_id_t id) const;
  bool can_claim(hashlock::schema::escrow_id_t id) const;
  bool can_refund(hashlock::schema::escrow_id_t id) const;
  hashlock::schema::escrow_summary_t status(
      hashlock::schema::escrow_id_t id) const;
  hashlock::schema::escrow_stats_t stats() const;
  std::vector<hashlock::schema::escrow_state_t> by_secret_hash(
      const hashlock::schema::hash32_t& secret_hash) const;

  const engine_options& options() const { return options_; }

 private:
  hashlock::schema::transaction_result_t create_escrow_locked(
      const hashlock::schema::account_id_t& caller,
      const hashlock::schema::create_escrow_t& request);
  hashlock::schema::transaction_result_t claim_escrow_locked(
      const hashlock::schema::account_id_t& caller,
      const hashlock::schema::claim_escrow_t& request);
  hashlock::schema::transaction_result_t refund_escrow_locked(
      const hashlock::schema::account_id_t& caller,
      const hashlock::schema::refund_escrow_t& request);
  hashlock::schema::transaction_result_t cancel_escrow_locked(
      const hashlock::schema::account_id_t& caller,
      const hashlock::schema::cancel_escrow_t& request);

  /// Transfer through the ledger, or stage the balance rows into `staged`
  /// when the ledger shares the escrow database so they commit with the
  /// record.
  hashlock::ledger::transfer_status_t move_value(
      const hashlock::schema::account_id_t& from,
      const hashlock::schema::account_id_t& to,
      hashlock::schema::amount_t amount,
      std::vector<hashlock::storage::key_value_entry_t>& staged);

  /// Move the escrowed amount out of the holding account and commit the
  /// terminal status. Shared tail of claim, refund and cancel.
  hashlock::schema::transaction_result_t settle(
      hashlock::schema::escrow_state_t record,
      const hashlock::schema::account_id_t& payee,
      hashlock::schema::escrow_status_t outcome,
      std::string_view event_type,
      hashlock::schema::height_t height);

  mutable std::mutex mutex_;
  hashlock::storage::escrow_store& store_;
  hashlock::ledger::ledger& ledger_;
  height_source_t height_source_;
  engine_options options_;
  hashlock::storage::id_allocator allocator_;
  query query_;
};

}  // namespace hashlock::execution
