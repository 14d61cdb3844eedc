#pragma once

#include <hashlock/execution/engine.hpp>
#include <hashlock/ledger/memory_ledger.hpp>
#include <hashlock/schema/primitives.hpp>
#include <hashlock/storage/escrow_store.hpp>
#include <hashlock/storage/rocksdb/storage.hpp>
#include <hashlock/testing/common.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace hashlock::testing {

/// Memory ledger that counts calls and can be told to refuse transfers.
class recording_ledger final : public hashlock::ledger::ledger {
 public:
  hashlock::ledger::transfer_status_t transfer(
      const hashlock::schema::account_id_t& from,
      const hashlock::schema::account_id_t& to,
      const hashlock::schema::amount_t amount) override {
    ++transfer_calls_;
    if (fail_transfers_) {
      return hashlock::ledger::transfer_status_t::transfer_failed;
    }
    return inner_.transfer(from, to, amount);
  }

  hashlock::schema::amount_t balance_of(
      const hashlock::schema::account_id_t& account) const override {
    return inner_.balance_of(account);
  }

  bool credit(const hashlock::schema::account_id_t& account,
              const hashlock::schema::amount_t amount) {
    return inner_.credit(account, amount);
  }

  void fail_transfers(const bool fail) { fail_transfers_ = fail; }
  std::size_t transfer_calls() const { return transfer_calls_; }
  void reset_calls() { transfer_calls_ = 0; }

 private:
  hashlock::ledger::memory_ledger inner_;
  std::size_t transfer_calls_{0};
  bool fail_transfers_{false};
};

inline constexpr uint8_t kOwnerSeed = 0xF0;

class escrow_fixture final {
 public:
  explicit escrow_fixture(
      const std::string_view db_prefix,
      const hashlock::schema::hash_algorithm_t algorithm =
          hashlock::schema::hash_algorithm_t::sha256)
      : db_path_{make_db_path(db_prefix)},
        storage_{hashlock::storage::make_storage<
            hashlock::storage::rocksdb_storage_tag>(db_path_)},
        store_{storage_} {
    options_.privileged_owner = make_account(kOwnerSeed);
    options_.hash_algorithm = algorithm;
    restart_engine();
  }

  escrow_fixture(const escrow_fixture&) = delete;
  escrow_fixture& operator=(const escrow_fixture&) = delete;
  escrow_fixture(escrow_fixture&&) = delete;
  escrow_fixture& operator=(escrow_fixture&&) = delete;

  ~escrow_fixture() {
    engine_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  /// Drop the engine and build a new one over the same store and ledger.
  void restart_engine() {
    engine_.reset();
    engine_ = std::make_unique<hashlock::execution::engine>(
        store_, ledger_, [this] { return height_; }, options_);
  }

  hashlock::execution::engine& engine() { return *engine_; }
  hashlock::storage::escrow_store& store() { return store_; }
  recording_ledger& ledger() { return ledger_; }
  const hashlock::execution::engine_options& options() const {
    return options_;
  }

  void set_height(const hashlock::schema::height_t height) { height_ = height; }
  hashlock::schema::height_t height() const { return height_; }

  hashlock::schema::account_id_t owner() const {
    return options_.privileged_owner;
  }

  hashlock::schema::amount_t holding_balance() const {
    return ledger_.balance_of(options_.holding_account);
  }

 private:
  std::string db_path_;
  hashlock::storage::storage<hashlock::storage::rocksdb_storage_tag> storage_;
  hashlock::storage::escrow_store store_;
  recording_ledger ledger_;
  hashlock::execution::engine_options options_;
  hashlock::schema::height_t height_{0};
  std::unique_ptr<hashlock::execution::engine> engine_;
};

}  // namespace hashlock::testing
