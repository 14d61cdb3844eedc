#include <hashlock/execution/engine.hpp>
#include <hashlock/ledger/storage_ledger.hpp>
#include <hashlock/storage/escrow_store.hpp>
#include <hashlock/testing/common.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace {

using hashlock::schema::transaction_error_code;

constexpr hashlock::schema::amount_t kAmount = 1'000'000;

const auto kSender = hashlock::testing::make_account(0x31);
const auto kRecipient = hashlock::testing::make_account(0x32);

// Engine, store and ledger sharing one RocksDB, as the CLI wires them.
class shared_database final {
 public:
  explicit shared_database(const std::string& path)
      : storage_{hashlock::storage::make_storage<
            hashlock::storage::rocksdb_storage_tag>(path)},
        store_{storage_},
        ledger_{storage_} {
    restart_engine();
  }

  shared_database(const shared_database&) = delete;
  shared_database& operator=(const shared_database&) = delete;
  shared_database(shared_database&&) = delete;
  shared_database& operator=(shared_database&&) = delete;

  void restart_engine() {
    engine_.reset();
    engine_ = std::make_unique<hashlock::execution::engine>(
        store_, ledger_, [this] { return height_; }, options_);
  }

  hashlock::execution::engine& engine() { return *engine_; }
  hashlock::storage::escrow_store& store() { return store_; }
  hashlock::ledger::storage_ledger& ledger() { return ledger_; }
  const hashlock::execution::engine_options& options() const {
    return options_;
  }
  void set_height(const hashlock::schema::height_t height) { height_ = height; }

 private:
  hashlock::storage::storage<hashlock::storage::rocksdb_storage_tag> storage_;
  hashlock::storage::escrow_store store_;
  hashlock::ledger::storage_ledger ledger_;
  hashlock::execution::engine_options options_;
  hashlock::schema::height_t height_{100};
  std::unique_ptr<hashlock::execution::engine> engine_;
};

hashlock::schema::escrow_id_t create_funded(
    shared_database& db,
    const hashlock::schema::hash32_t& secret_hash) {
  EXPECT_TRUE(db.ledger().credit(kSender, kAmount));
  auto result = db.engine().create_escrow(
      kSender, hashlock::schema::create_escrow_t{.recipient = kRecipient,
                                                 .amount = kAmount,
                                                 .blocks_ahead = 10,
                                                 .secret_hash = secret_hash});
  EXPECT_TRUE(hashlock::schema::succeeded(result)) << result.log;
  return result.escrow_id.value_or(0);
}

}  // namespace

TEST(engine_storage_ledger, staged_rows_wait_for_the_record_commit) {
  auto path = hashlock::testing::make_db_path("hashlock_staged_rows");
  {
    auto db = shared_database{path};
    auto id = create_funded(db, hashlock::testing::make_hash(1));
    auto holding = db.options().holding_account;
    ASSERT_EQ(db.ledger().balance_of(holding), kAmount);

    auto staged = std::vector<hashlock::storage::key_value_entry_t>{};
    ASSERT_EQ(db.ledger().stage_transfer(holding, kRecipient, kAmount, staged),
              hashlock::ledger::transfer_status_t::ok);
    EXPECT_EQ(staged.size(), 2u);
    EXPECT_EQ(db.ledger().balance_of(holding), kAmount);
    EXPECT_EQ(db.ledger().balance_of(kRecipient), 0u);

    auto record = *db.store().get(id);
    record.status = hashlock::schema::escrow_status_t::claimed;
    ASSERT_EQ(db.store().update(record, staged),
              hashlock::storage::store_status_t::ok);
    EXPECT_EQ(db.ledger().balance_of(holding), 0u);
    EXPECT_EQ(db.ledger().balance_of(kRecipient), kAmount);
    EXPECT_TRUE(db.store().get(id)->claimed());
  }
  hashlock::testing::remove_path(path);
}

TEST(engine_storage_ledger, refused_stage_appends_nothing) {
  auto path = hashlock::testing::make_db_path("hashlock_staged_refused");
  {
    auto db = shared_database{path};
    auto staged = std::vector<hashlock::storage::key_value_entry_t>{};
    EXPECT_EQ(db.ledger().stage_transfer(kSender, kRecipient, 1, staged),
              hashlock::ledger::transfer_status_t::insufficient_funds);
    EXPECT_TRUE(staged.empty());
  }
  hashlock::testing::remove_path(path);
}

TEST(engine_storage_ledger, interrupted_settlement_pays_exactly_once) {
  auto path = hashlock::testing::make_db_path("hashlock_interrupted_settle");
  auto secret = hashlock::testing::make_secret("interrupted");
  auto hash = hashlock::testing::make_commitment(secret);
  {
    auto db = shared_database{path};
    auto id = create_funded(db, hash);
    auto bystander = create_funded(db, hashlock::testing::make_hash(7));
    auto holding = db.options().holding_account;
    ASSERT_EQ(db.ledger().balance_of(holding), 2 * kAmount);

    // A settlement whose batch never reached the database.
    auto lost = std::vector<hashlock::storage::key_value_entry_t>{};
    ASSERT_EQ(db.ledger().stage_transfer(holding, kRecipient, kAmount, lost),
              hashlock::ledger::transfer_status_t::ok);
    lost.clear();
    db.restart_engine();

    EXPECT_FALSE(db.engine().get(id)->claimed());
    EXPECT_EQ(db.ledger().balance_of(kRecipient), 0u);

    db.set_height(110);
    auto claim = hashlock::schema::claim_escrow_t{.escrow_id = id,
                                                  .secret = secret};
    auto first = db.engine().claim_escrow(kRecipient, claim);
    ASSERT_TRUE(hashlock::schema::succeeded(first)) << first.log;

    db.restart_engine();
    auto retry = db.engine().claim_escrow(kRecipient, claim);
    EXPECT_TRUE(hashlock::schema::failed_with(
        retry, transaction_error_code::already_finalized));

    EXPECT_EQ(db.ledger().balance_of(kRecipient), kAmount);
    EXPECT_EQ(db.ledger().balance_of(holding), kAmount);
    EXPECT_FALSE(db.engine().get(bystander)->claimed());
  }
  hashlock::testing::remove_path(path);
}

TEST(engine_storage_ledger, record_and_balances_agree_after_reopen) {
  auto path = hashlock::testing::make_db_path("hashlock_reopen_agree");
  auto secret = hashlock::testing::make_secret("reopen");
  auto id = hashlock::schema::escrow_id_t{};
  {
    auto db = shared_database{path};
    id = create_funded(db, hashlock::testing::make_commitment(secret));
    db.set_height(110);
    auto result = db.engine().claim_escrow(
        kRecipient,
        hashlock::schema::claim_escrow_t{.escrow_id = id, .secret = secret});
    ASSERT_TRUE(hashlock::schema::succeeded(result)) << result.log;
  }
  {
    auto db = shared_database{path};
    EXPECT_TRUE(db.engine().get(id)->claimed());
    EXPECT_EQ(db.ledger().balance_of(kRecipient), kAmount);
    EXPECT_EQ(db.ledger().balance_of(db.options().holding_account), 0u);
    EXPECT_EQ(db.ledger().balance_of(kSender), 0u);
  }
  hashlock::testing::remove_path(path);
}
