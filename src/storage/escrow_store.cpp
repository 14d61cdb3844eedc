#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <hashlock/schema/key/engine_keys.hpp>
#include <hashlock/storage/escrow_store.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace hashlock::schema;

namespace {

using encoder_t = hashlock::schema::encoding::scale_encoder_t;

bytes_view_t view_of(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

namespace hashlock::storage {

escrow_store::escrow_store(storage<rocksdb_storage_tag>& storage)
    : storage_{storage} {}

std::optional<escrow_state_t> escrow_store::get(const escrow_id_t id) const {
  auto encoder = encoder_t{};
  auto key = key::make_escrow_key(encoder, id);
  return storage_.get<escrow_state_t>(encoder, view_of(key));
}

bool escrow_store::contains(const escrow_id_t id) const {
  auto encoder = encoder_t{};
  auto key = key::make_escrow_key(encoder, id);
  return storage_.contains(view_of(key));
}

store_status_t escrow_store::insert(
    const escrow_state_t& record,
    const std::vector<key_value_entry_t>& staged) {
  if (contains(record.id)) {
    return store_status_t::duplicate_id;
  }

  auto encoder = encoder_t{};
  auto next = std::max(next_id(), record.id + 1);
  auto total = total_escrows() + 1;

  auto entries = std::vector<key_value_entry_t>{};
  entries.reserve(4 + staged.size());
  entries.emplace_back(key::make_escrow_key(encoder, record.id),
                       encoder.encode(record));
  entries.emplace_back(
      key::make_escrow_by_hash_key(encoder, record.secret_hash, record.id),
      encoder.encode(record.id));
  entries.emplace_back(key::make_prefix_key(encoder, key::kNextIdKey),
                       encoder.encode(next));
  entries.emplace_back(key::make_prefix_key(encoder, key::kTotalEscrowsKey),
                       encoder.encode(total));
  entries.insert(std::end(entries), std::begin(staged), std::end(staged));
  storage_.write_batch(entries);
  return store_status_t::ok;
}

store_status_t escrow_store::update(
    const escrow_state_t& record,
    const std::vector<key_value_entry_t>& staged) {
  if (!contains(record.id)) {
    return store_status_t::not_found;
  }
  auto encoder = encoder_t{};
  auto entries = std::vector<key_value_entry_t>{};
  entries.reserve(1 + staged.size());
  entries.emplace_back(key::make_escrow_key(encoder, record.id),
                       encoder.encode(record));
  entries.insert(std::end(entries), std::begin(staged), std::end(staged));
  storage_.write_batch(entries);
  return store_status_t::ok;
}

uint64_t escrow_store::total_escrows() const {
  auto encoder = encoder_t{};
  auto key = key::make_prefix_key(encoder, key::kTotalEscrowsKey);
  return storage_.get<uint64_t>(encoder, view_of(key)).value_or(0);
}

escrow_id_t escrow_store::next_id() const {
  auto encoder = encoder_t{};
  auto key = key::make_prefix_key(encoder, key::kNextIdKey);
  return storage_.get<escrow_id_t>(encoder, view_of(key)).value_or(1);
}

std::vector<escrow_id_t> escrow_store::ids_by_secret_hash(
    const hash32_t& secret_hash) const {
  auto encoder = encoder_t{};
  auto prefix = key::make_escrow_by_hash_prefix_key(encoder, secret_hash);
  auto rows = storage_.list_by_prefix(view_of(prefix));

  auto ids = std::vector<escrow_id_t>{};
  ids.reserve(rows.size());
  for (const auto& [row_key, row_value] : rows) {
    auto id = encoder.try_decode<escrow_id_t>(view_of(row_value));
    if (!id) {
      spdlog::warn("Skipping undecodable commitment index row");
      continue;
    }
    ids.push_back(*id);
  }
  std::sort(std::begin(ids), std::end(ids));
  return ids;
}

}  // namespace hashlock::storage
