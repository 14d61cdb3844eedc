#include <hashlock/ledger/storage_ledger.hpp>
#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <hashlock/schema/key/engine_keys.hpp>

#include <limits>
#include <vector>

using namespace hashlock::schema;

namespace {

using encoder_t = hashlock::schema::encoding::scale_encoder_t;

}  // namespace

namespace hashlock::ledger {

storage_ledger::storage_ledger(
    hashlock::storage::storage<hashlock::storage::rocksdb_storage_tag>& storage)
    : storage_{storage} {}

transfer_status_t storage_ledger::transfer(const account_id_t& from,
                                           const account_id_t& to,
                                           const amount_t amount) {
  auto entries = std::vector<hashlock::storage::key_value_entry_t>{};
  auto status = stage_transfer(from, to, amount, entries);
  if (status == transfer_status_t::ok && !entries.empty()) {
    storage_.write_batch(entries);
  }
  return status;
}

transfer_status_t storage_ledger::stage_transfer(
    const account_id_t& from,
    const account_id_t& to,
    const amount_t amount,
    std::vector<hashlock::storage::key_value_entry_t>& entries) {
  auto from_balance = balance_of(from);
  if (from_balance < amount) {
    return transfer_status_t::insufficient_funds;
  }
  if (from == to || amount == 0) {
    return transfer_status_t::ok;
  }
  auto to_balance = balance_of(to);
  if (to_balance > std::numeric_limits<amount_t>::max() - amount) {
    return transfer_status_t::transfer_failed;
  }

  auto encoder = encoder_t{};
  entries.emplace_back(key::make_balance_key(encoder, from),
                       encoder.encode(amount_t{from_balance - amount}));
  entries.emplace_back(key::make_balance_key(encoder, to),
                       encoder.encode(amount_t{to_balance + amount}));
  return transfer_status_t::ok;
}

amount_t storage_ledger::balance_of(const account_id_t& account) const {
  auto encoder = encoder_t{};
  auto key = key::make_balance_key(encoder, account);
  return storage_
      .get<amount_t>(encoder, bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

bool storage_ledger::credit(const account_id_t& account, const amount_t amount) {
  auto balance = balance_of(account);
  if (balance > std::numeric_limits<amount_t>::max() - amount) {
    return false;
  }
  auto encoder = encoder_t{};
  auto key = key::make_balance_key(encoder, account);
  storage_.put(encoder, bytes_view_t{key.data(), key.size()},
               amount_t{balance + amount});
  return true;
}

}  // namespace hashlock::ledger
