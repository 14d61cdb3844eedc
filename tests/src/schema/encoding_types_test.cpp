#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <hashlock/schema/key/engine_keys.hpp>
#include <hashlock/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <variant>

namespace {

using encoder_t = hashlock::schema::encoding::scale_encoder_t;

bool starts_with(const hashlock::schema::bytes_t& value,
                 const hashlock::schema::bytes_t& prefix) {
  return value.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(value));
}

}  // namespace

TEST(encoding_types, escrow_state_round_trips) {
  auto encoder = encoder_t{};
  auto record = hashlock::schema::escrow_state_t{
      .id = 7,
      .sender = hashlock::testing::make_account(1),
      .recipient = hashlock::testing::make_account(2),
      .amount = 1'000'000,
      .unlock_height = 110,
      .secret_hash = hashlock::testing::make_hash(40),
      .status = hashlock::schema::escrow_status_t::claimed,
      .created_height = 100};

  auto bytes = encoder.encode(record);
  auto decoded = encoder.decode<hashlock::schema::escrow_state_t>(
      hashlock::schema::bytes_view_t{bytes.data(), bytes.size()});
  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.id, record.id);
  EXPECT_EQ(decoded.sender, record.sender);
  EXPECT_EQ(decoded.recipient, record.recipient);
  EXPECT_EQ(decoded.amount, record.amount);
  EXPECT_EQ(decoded.unlock_height, record.unlock_height);
  EXPECT_EQ(decoded.secret_hash, record.secret_hash);
  EXPECT_TRUE(decoded.claimed());
  EXPECT_FALSE(decoded.refunded());
  EXPECT_EQ(decoded.created_height, record.created_height);
}

TEST(encoding_types, transaction_keeps_payload_alternative) {
  auto encoder = encoder_t{};
  auto tx = hashlock::schema::transaction_t{
      .signer = hashlock::testing::make_account(9),
      .payload = hashlock::schema::claim_escrow_t{
          .escrow_id = 3, .secret = hashlock::testing::make_secret("s3")}};

  auto bytes = encoder.encode(tx);
  auto decoded = encoder.try_decode<hashlock::schema::transaction_t>(
      hashlock::schema::bytes_view_t{bytes.data(), bytes.size()});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->signer, tx.signer);
  ASSERT_TRUE(
      std::holds_alternative<hashlock::schema::claim_escrow_t>(decoded->payload));
  const auto& claim = std::get<hashlock::schema::claim_escrow_t>(decoded->payload);
  EXPECT_EQ(claim.escrow_id, 3u);
  EXPECT_EQ(claim.secret, hashlock::testing::make_secret("s3"));
}

TEST(encoding_types, truncated_bytes_do_not_decode) {
  auto encoder = encoder_t{};
  auto bytes = hashlock::schema::bytes_t{0x01};
  EXPECT_FALSE(encoder
                   .try_decode<hashlock::schema::transaction_t>(
                       hashlock::schema::bytes_view_t{bytes.data(), bytes.size()})
                   .has_value());
}

TEST(encoding_types, keyspaces_do_not_overlap) {
  auto encoder = encoder_t{};
  auto escrow_key = hashlock::schema::key::make_escrow_key(encoder, 1);
  auto by_hash_key = hashlock::schema::key::make_escrow_by_hash_key(
      encoder, hashlock::testing::make_hash(1), 1);
  auto escrow_prefix = hashlock::schema::key::make_prefix_key(
      encoder, hashlock::schema::key::kEscrowKeyPrefix);

  EXPECT_TRUE(starts_with(escrow_key, escrow_prefix));
  EXPECT_FALSE(starts_with(by_hash_key, escrow_prefix));
  EXPECT_NE(hashlock::schema::key::make_escrow_key(encoder, 1),
            hashlock::schema::key::make_escrow_key(encoder, 2));
}

TEST(encoding_types, commitment_index_prefix_selects_one_hash) {
  auto encoder = encoder_t{};
  auto prefix = hashlock::schema::key::make_escrow_by_hash_prefix_key(
      encoder, hashlock::testing::make_hash(5));
  EXPECT_TRUE(starts_with(hashlock::schema::key::make_escrow_by_hash_key(
                              encoder, hashlock::testing::make_hash(5), 42),
                          prefix));
  EXPECT_FALSE(starts_with(hashlock::schema::key::make_escrow_by_hash_key(
                               encoder, hashlock::testing::make_hash(6), 42),
                           prefix));
}
