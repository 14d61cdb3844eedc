#include <spdlog/spdlog.h>
#include <hashlock/blake3/hash.hpp>
#include <hashlock/common/critical.hpp>
#include <hashlock/crypto/commitment.hpp>
#include <hashlock/execution/engine.hpp>
#include <hashlock/execution/preconditions.hpp>
#include <hashlock/schema/encoding/scale/encoder.hpp>

#include <limits>
#include <string>
#include <utility>
#include <variant>

using namespace hashlock::schema;

namespace {

using encoder_t = hashlock::schema::encoding::scale_encoder_t;

inline constexpr auto kEscrowCodespace = std::string_view{"hashlock.escrow"};
inline constexpr auto kTransactionCodespace = std::string_view{"hashlock.tx"};

transaction_result_t make_error(const transaction_error_code code,
                                const std::string_view log,
                                std::string info = {},
                                const std::string_view codespace =
                                    kEscrowCodespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t make_transfer_error(
    const hashlock::ledger::transfer_status_t status) {
  auto code = status == hashlock::ledger::transfer_status_t::insufficient_funds
                  ? transaction_error_code::insufficient_balance
                  : transaction_error_code::transfer_failed;
  return make_error(code, "ledger transfer failed",
                    std::string{hashlock::ledger::to_string(status)});
}

transaction_event_t make_escrow_event(const std::string_view type,
                                      const escrow_state_t& record,
                                      const height_t height) {
  auto account_hex = [](const account_id_t& account) {
    return to_hex(bytes_view_t{account.data(), account.size()});
  };
  return transaction_event_t{
      .type = std::string{type},
      .attributes = {
          transaction_event_attribute_t{.key = "escrow_id",
                                        .value = std::to_string(record.id),
                                        .index = true},
          transaction_event_attribute_t{.key = "sender",
                                        .value = account_hex(record.sender),
                                        .index = true},
          transaction_event_attribute_t{.key = "recipient",
                                        .value = account_hex(record.recipient),
                                        .index = true},
          transaction_event_attribute_t{.key = "amount",
                                        .value = std::to_string(record.amount),
                                        .index = false},
          transaction_event_attribute_t{
              .key = "unlock_height",
              .value = std::to_string(record.unlock_height),
              .index = false},
          transaction_event_attribute_t{.key = "height",
                                        .value = std::to_string(height),
                                        .index = false}}};
}

}  // namespace

namespace hashlock::execution {

account_id_t default_holding_account() {
  return hashlock::blake3::hash(std::string_view{"hashlock|escrow-holding"});
}

engine::engine(hashlock::storage::escrow_store& store,
               hashlock::ledger::ledger& ledger,
               height_source_t height_source,
               engine_options options)
    : store_{store},
      ledger_{ledger},
      height_source_{std::move(height_source)},
      options_{std::move(options)},
      allocator_{store.next_id()},
      query_{store_, ledger_, height_source_, options_} {
  if (!height_source_) {
    hashlock::common::critical("escrow engine requires a height source");
  }
  if (options_.privileged_owner == make_zero_hash()) {
    spdlog::warn("Privileged owner is the zero account; emergency cancel is "
                 "effectively disabled");
  }
  spdlog::info("Escrow engine ready: next id {}, {} escrow(s), commitment {}",
               allocator_.peek(), store_.total_escrows(),
               to_string(options_.hash_algorithm));
}

transaction_result_t engine::create_escrow(const account_id_t& caller,
                                           const create_escrow_t& request) {
  auto lock = std::scoped_lock{mutex_};
  return create_escrow_locked(caller, request);
}

transaction_result_t engine::claim_escrow(const account_id_t& caller,
                                          const claim_escrow_t& request) {
  auto lock = std::scoped_lock{mutex_};
  return claim_escrow_locked(caller, request);
}

transaction_result_t engine::refund_escrow(const account_id_t& caller,
                                           const refund_escrow_t& request) {
  auto lock = std::scoped_lock{mutex_};
  return refund_escrow_locked(caller, request);
}

transaction_result_t engine::cancel_escrow(const account_id_t& caller,
                                           const cancel_escrow_t& request) {
  auto lock = std::scoped_lock{mutex_};
  return cancel_escrow_locked(caller, request);
}

transaction_result_t engine::execute(const transaction_t& tx) {
  if (tx.version != 1) {
    return make_error(transaction_error_code::unsupported_transaction_version,
                      "unsupported transaction version", "expected version 1",
                      kTransactionCodespace);
  }

  auto lock = std::scoped_lock{mutex_};
  return std::visit(
      overloaded{[&](const create_escrow_t& payload) {
                   return create_escrow_locked(tx.signer, payload);
                 },
                 [&](const claim_escrow_t& payload) {
                   return claim_escrow_locked(tx.signer, payload);
                 },
                 [&](const refund_escrow_t& payload) {
                   return refund_escrow_locked(tx.signer, payload);
                 },
                 [&](const cancel_escrow_t& payload) {
                   return cancel_escrow_locked(tx.signer, payload);
                 }},
      tx.payload);
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx) {
  if (raw_tx.empty()) {
    return make_error(transaction_error_code::invalid_transaction,
                      "invalid transaction", "empty transaction",
                      kTransactionCodespace);
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    return make_error(transaction_error_code::invalid_transaction,
                      "invalid transaction", "undecodable SCALE payload",
                      kTransactionCodespace);
  }
  return execute(*tx);
}

std::optional<escrow_state_t> engine::get(const escrow_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return query_.get(id);
}

bool engine::can_claim(const escrow_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return query_.can_claim(id);
}

bool engine::can_refund(const escrow_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return query_.can_refund(id);
}

escrow_summary_t engine::status(const escrow_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  return query_.status(id);
}

escrow_stats_t engine::stats() const {
  auto lock = std::scoped_lock{mutex_};
  return query_.stats();
}

std::vector<escrow_state_t> engine::by_secret_hash(
    const hash32_t& secret_hash) const {
  auto lock = std::scoped_lock{mutex_};
  return query_.by_secret_hash(secret_hash);
}

transaction_result_t engine::create_escrow_locked(
    const account_id_t& caller,
    const create_escrow_t& request) {
  auto height = height_source_();
  if (request.amount == 0) {
    return make_error(transaction_error_code::invalid_amount,
                      "amount must be positive");
  }
  if (request.blocks_ahead == 0) {
    return make_error(transaction_error_code::invalid_height,
                      "blocks ahead must be positive");
  }
  if (height > std::numeric_limits<height_t>::max() - request.blocks_ahead) {
    return make_error(transaction_error_code::invalid_height,
                      "unlock height overflows");
  }
  if (ledger_.balance_of(caller) < request.amount) {
    return make_error(transaction_error_code::insufficient_balance,
                      "insufficient balance",
                      "amount " + std::to_string(request.amount));
  }
  auto id = allocator_.peek();
  if (store_.contains(id)) {
    spdlog::error("Allocator produced existing escrow id {}", id);
    return make_error(transaction_error_code::duplicate_id,
                      "escrow id already exists", std::to_string(id));
  }

  auto staged = std::vector<hashlock::storage::key_value_entry_t>{};
  auto transfer =
      move_value(caller, options_.holding_account, request.amount, staged);
  if (transfer != hashlock::ledger::transfer_status_t::ok) {
    spdlog::warn("Escrow create aborted by ledger: {}",
                 hashlock::ledger::to_string(transfer));
    return make_transfer_error(transfer);
  }

  auto record = escrow_state_t{.id = id,
                               .sender = caller,
                               .recipient = request.recipient,
                               .amount = request.amount,
                               .unlock_height = height + request.blocks_ahead,
                               .secret_hash = request.secret_hash,
                               .status = escrow_status_t::open,
                               .created_height = height};
  if (store_.insert(record, staged) != hashlock::storage::store_status_t::ok) {
    hashlock::common::critical(
        "escrow {} funded but could not be recorded", id);
  }
  allocator_.next();

  spdlog::info("Created escrow {} for {} unlocking at height {}", id,
               record.amount, record.unlock_height);
  auto result = transaction_result_t{};
  result.info = "escrow created";
  result.escrow_id = id;
  result.events.push_back(make_escrow_event("escrow_created", record, height));
  return result;
}

transaction_result_t engine::claim_escrow_locked(
    const account_id_t& caller,
    const claim_escrow_t& request) {
  auto record = store_.get(request.escrow_id);
  if (!record) {
    return make_error(transaction_error_code::not_found, "escrow not found",
                      std::to_string(request.escrow_id));
  }
  if (caller != record->recipient) {
    return make_error(transaction_error_code::not_authorized,
                      "caller is not the escrow recipient");
  }
  if (is_finalized(*record)) {
    return make_error(transaction_error_code::already_finalized,
                      "escrow already finalized",
                      std::string{to_string(record->status)});
  }
  auto height = height_source_();
  if (!height_reached(*record, height)) {
    return make_error(transaction_error_code::height_not_reached,
                      "unlock height not reached",
                      "unlocks at " + std::to_string(record->unlock_height));
  }
  if (!hashlock::crypto::matches_commitment(
          options_.hash_algorithm,
          bytes_view_t{request.secret.data(), request.secret.size()},
          record->secret_hash)) {
    return make_error(transaction_error_code::invalid_secret,
                      "secret does not match commitment");
  }
  auto recipient = record->recipient;
  return settle(std::move(*record), recipient, escrow_status_t::claimed,
                "escrow_claimed", height);
}

transaction_result_t engine::refund_escrow_locked(
    const account_id_t& caller,
    const refund_escrow_t& request) {
  auto record = store_.get(request.escrow_id);
  if (!record) {
    return make_error(transaction_error_code::not_found, "escrow not found",
                      std::to_string(request.escrow_id));
  }
  if (caller != record->sender) {
    return make_error(transaction_error_code::not_authorized,
                      "caller is not the escrow sender");
  }
  if (is_finalized(*record)) {
    return make_error(transaction_error_code::already_finalized,
                      "escrow already finalized",
                      std::string{to_string(record->status)});
  }
  auto height = height_source_();
  if (!height_reached(*record, height)) {
    return make_error(transaction_error_code::height_not_reached,
                      "unlock height not reached",
                      "unlocks at " + std::to_string(record->unlock_height));
  }
  auto sender = record->sender;
  return settle(std::move(*record), sender, escrow_status_t::refunded,
                "escrow_refunded", height);
}

transaction_result_t engine::cancel_escrow_locked(
    const account_id_t& caller,
    const cancel_escrow_t& request) {
  if (caller != options_.privileged_owner) {
    return make_error(transaction_error_code::not_authorized,
                      "caller is not the privileged owner");
  }
  auto record = store_.get(request.escrow_id);
  if (!record) {
    return make_error(transaction_error_code::not_found, "escrow not found",
                      std::to_string(request.escrow_id));
  }
  if (is_finalized(*record)) {
    return make_error(transaction_error_code::already_finalized,
                      "escrow already finalized",
                      std::string{to_string(record->status)});
  }
  auto height = height_source_();
  if (!can_cancel(*record, height)) {
    return make_error(transaction_error_code::already_expired,
                      "unlock height reached; cancel window closed",
                      "unlocked at " + std::to_string(record->unlock_height));
  }
  auto sender = record->sender;
  return settle(std::move(*record), sender, escrow_status_t::refunded,
                "escrow_cancelled", height);
}

hashlock::ledger::transfer_status_t engine::move_value(
    const account_id_t& from,
    const account_id_t& to,
    const amount_t amount,
    std::vector<hashlock::storage::key_value_entry_t>& staged) {
  if (ledger_.supports_staging()) {
    return ledger_.stage_transfer(from, to, amount, staged);
  }
  return ledger_.transfer(from, to, amount);
}

transaction_result_t engine::settle(escrow_state_t record,
                                    const account_id_t& payee,
                                    const escrow_status_t outcome,
                                    const std::string_view event_type,
                                    const height_t height) {
  auto staged = std::vector<hashlock::storage::key_value_entry_t>{};
  auto transfer =
      move_value(options_.holding_account, payee, record.amount, staged);
  if (transfer != hashlock::ledger::transfer_status_t::ok) {
    spdlog::error("Settlement of escrow {} aborted by ledger: {}", record.id,
                  hashlock::ledger::to_string(transfer));
    return make_error(transaction_error_code::transfer_failed,
                      "ledger transfer failed",
                      std::string{hashlock::ledger::to_string(transfer)});
  }

  record.status = outcome;
  if (store_.update(record, staged) != hashlock::storage::store_status_t::ok) {
    hashlock::common::critical(
        "escrow {} paid out but terminal status could not be recorded",
        record.id);
  }

  spdlog::info("Escrow {} {} at height {}", record.id, to_string(outcome),
               height);
  auto result = transaction_result_t{};
  result.info = std::string{event_type};
  result.escrow_id = record.id;
  result.events.push_back(make_escrow_event(event_type, record, height));
  return result;
}

}  // namespace hashlock::execution
