#include <hashlock/storage/escrow_store.hpp>
#include <hashlock/storage/id_allocator.hpp>
#include <hashlock/testing/common.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace {

hashlock::schema::escrow_state_t make_record(
    const hashlock::schema::escrow_id_t id,
    const hashlock::schema::hash32_t& secret_hash) {
  return hashlock::schema::escrow_state_t{
      .id = id,
      .sender = hashlock::testing::make_account(1),
      .recipient = hashlock::testing::make_account(2),
      .amount = 500,
      .unlock_height = 20,
      .secret_hash = secret_hash,
      .status = hashlock::schema::escrow_status_t::open,
      .created_height = 10};
}

}  // namespace

TEST(escrow_store, empty_store_defaults) {
  auto db = hashlock::testing::make_db_path("hashlock_store_empty");
  {
    auto storage =
        hashlock::storage::make_storage<hashlock::storage::rocksdb_storage_tag>(db);
    auto store = hashlock::storage::escrow_store{storage};
    EXPECT_EQ(store.next_id(), 1u);
    EXPECT_EQ(store.total_escrows(), 0u);
    EXPECT_FALSE(store.contains(1));
    EXPECT_FALSE(store.get(1).has_value());
    EXPECT_TRUE(store.ids_by_secret_hash(hashlock::testing::make_hash(1)).empty());
  }
  hashlock::testing::remove_path(db);
}

TEST(escrow_store, insert_writes_record_and_counters) {
  auto db = hashlock::testing::make_db_path("hashlock_store_insert");
  {
    auto storage =
        hashlock::storage::make_storage<hashlock::storage::rocksdb_storage_tag>(db);
    auto store = hashlock::storage::escrow_store{storage};
    auto record = make_record(1, hashlock::testing::make_hash(3));

    EXPECT_EQ(store.insert(record), hashlock::storage::store_status_t::ok);
    EXPECT_TRUE(store.contains(1));
    EXPECT_EQ(store.next_id(), 2u);
    EXPECT_EQ(store.total_escrows(), 1u);

    auto loaded = store.get(1);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->amount, 500u);
    EXPECT_EQ(loaded->status, hashlock::schema::escrow_status_t::open);
  }
  hashlock::testing::remove_path(db);
}

TEST(escrow_store, duplicate_insert_is_rejected_without_side_effects) {
  auto db = hashlock::testing::make_db_path("hashlock_store_duplicate");
  {
    auto storage =
        hashlock::storage::make_storage<hashlock::storage::rocksdb_storage_tag>(db);
    auto store = hashlock::storage::escrow_store{storage};
    ASSERT_EQ(store.insert(make_record(1, hashlock::testing::make_hash(3))),
              hashlock::storage::store_status_t::ok);

    auto second = make_record(1, hashlock::testing::make_hash(4));
    second.amount = 9;
    EXPECT_EQ(store.insert(second),
              hashlock::storage::store_status_t::duplicate_id);
    EXPECT_EQ(store.total_escrows(), 1u);
    EXPECT_EQ(store.get(1)->amount, 500u);
    EXPECT_TRUE(store.ids_by_secret_hash(hashlock::testing::make_hash(4)).empty());
  }
  hashlock::testing::remove_path(db);
}

TEST(escrow_store, update_requires_existing_record) {
  auto db = hashlock::testing::make_db_path("hashlock_store_update");
  {
    auto storage =
        hashlock::storage::make_storage<hashlock::storage::rocksdb_storage_tag>(db);
    auto store = hashlock::storage::escrow_store{storage};
    auto record = make_record(4, hashlock::testing::make_hash(3));
    EXPECT_EQ(store.update(record), hashlock::storage::store_status_t::not_found);
    EXPECT_FALSE(store.contains(4));

    ASSERT_EQ(store.insert(record), hashlock::storage::store_status_t::ok);
    record.status = hashlock::schema::escrow_status_t::refunded;
    EXPECT_EQ(store.update(record), hashlock::storage::store_status_t::ok);
    EXPECT_TRUE(store.get(4)->refunded());
    EXPECT_EQ(store.total_escrows(), 1u);
    EXPECT_EQ(store.next_id(), 5u);
  }
  hashlock::testing::remove_path(db);
}

TEST(escrow_store, commitment_index_lists_ids_in_order) {
  auto db = hashlock::testing::make_db_path("hashlock_store_index");
  {
    auto storage =
        hashlock::storage::make_storage<hashlock::storage::rocksdb_storage_tag>(db);
    auto store = hashlock::storage::escrow_store{storage};
    auto shared = hashlock::testing::make_hash(7);
    ASSERT_EQ(store.insert(make_record(300, shared)),
              hashlock::storage::store_status_t::ok);
    ASSERT_EQ(store.insert(make_record(2, shared)),
              hashlock::storage::store_status_t::ok);
    ASSERT_EQ(store.insert(make_record(3, hashlock::testing::make_hash(8))),
              hashlock::storage::store_status_t::ok);

    EXPECT_EQ(store.ids_by_secret_hash(shared),
              (std::vector<hashlock::schema::escrow_id_t>{2, 300}));
    EXPECT_EQ(store.next_id(), 301u);
    EXPECT_EQ(store.total_escrows(), 3u);
  }
  hashlock::testing::remove_path(db);
}

TEST(escrow_store, counters_survive_reopen) {
  auto db = hashlock::testing::make_db_path("hashlock_store_reopen");
  {
    auto storage =
        hashlock::storage::make_storage<hashlock::storage::rocksdb_storage_tag>(db);
    auto store = hashlock::storage::escrow_store{storage};
    ASSERT_EQ(store.insert(make_record(1, hashlock::testing::make_hash(1))),
              hashlock::storage::store_status_t::ok);
    ASSERT_EQ(store.insert(make_record(2, hashlock::testing::make_hash(2))),
              hashlock::storage::store_status_t::ok);
  }
  {
    auto storage =
        hashlock::storage::make_storage<hashlock::storage::rocksdb_storage_tag>(db);
    auto store = hashlock::storage::escrow_store{storage};
    EXPECT_EQ(store.next_id(), 3u);
    EXPECT_EQ(store.total_escrows(), 2u);
    EXPECT_TRUE(store.get(2).has_value());
  }
  hashlock::testing::remove_path(db);
}

TEST(id_allocator, is_monotonic_from_its_seed) {
  auto fresh = hashlock::storage::id_allocator{};
  EXPECT_EQ(fresh.peek(), 1u);
  EXPECT_EQ(fresh.next(), 1u);
  EXPECT_EQ(fresh.next(), 2u);
  EXPECT_EQ(fresh.peek(), 3u);

  auto resumed = hashlock::storage::id_allocator{41};
  EXPECT_EQ(resumed.next(), 41u);

  auto zero = hashlock::storage::id_allocator{0};
  EXPECT_EQ(zero.peek(), 1u);
}
